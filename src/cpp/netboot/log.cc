//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <netboot/ip_core.h>
#include <netboot/log.h>
#include <netboot/utils.h>

namespace log = netboot::log;
using log::Log;
using log::LogBuffer;
using netboot::util::ListCore;

// Every registered EventHandler receives every message.
static log::EventHandler* g_handlers = 0;

bool log::pre_test_reset() {
    if (!g_handlers) return true;
    g_handlers = 0;
    return false;
}

const char* log::priority_label(s8 val) {
    static const struct {s8 min; const char* label;} LABELS[] = {
        {log::CRITICAL, "CRIT "},
        {log::ERROR,    "ERROR"},
        {log::WARNING,  "WARN "},
        {log::INFO,     "INFO "},
    };
    for (unsigned a = 0 ; a < sizeof(LABELS) / sizeof(LABELS[0]) ; ++a) {
        if (val >= LABELS[a].min) return LABELS[a].label;
    }
    return "DEBUG";
}

log::EventHandler::EventHandler()
    : m_next(0)
{
    ListCore::add(g_handlers, this);
}

#if NETBOOT_ALLOW_DELETION
log::EventHandler::~EventHandler() {
    ListCore::remove(g_handlers, this);
}
#endif

Log::Log(s8 priority)
    : m_priority(priority)
{
    // Nothing else to initialize.
}

Log::Log(s8 priority, const char* str)
    : m_priority(priority)
{
    m_buff.wr_str(str);
}

Log::Log(s8 priority, const char* str1, const char* str2)
    : m_priority(priority)
{
    m_buff.wr_str(str1);
    m_buff.wr_str(": ");
    m_buff.wr_str(str2);
}

Log::~Log() {
    const char* msg = m_buff.c_str();
    for (log::EventHandler* dst = g_handlers ; dst ; dst = ListCore::next(dst))
        dst->log_event(m_priority, m_buff.len(), msg);
}

Log& Log::write_hex(u32 val, unsigned nhex) {
    m_buff.wr_str(" = 0x");
    m_buff.wr_h32(val, nhex);
    return *this;
}

Log& Log::write(const char* str)    {m_buff.wr_str(str); return *this;}
Log& Log::write(bool val)           {m_buff.wr_str(val ? " = 1" : " = 0"); return *this;}
Log& Log::write(u8 val)             {return write_hex(val, 2);}
Log& Log::write(u16 val)            {return write_hex(val, 4);}
Log& Log::write(u32 val)            {return write_hex(val, 8);}

Log& Log::write(const u8* val, unsigned nbytes) {
    m_buff.wr_str(" = 0x");
    for (const u8* end = val + nbytes ; val != end ; ++val)
        m_buff.wr_h32(*val, 2);
    return *this;
}

Log& Log::write(const netboot::ip::Addr& ip) {
    m_buff.wr_str(" = ");
    ip.log_to(m_buff);
    return *this;
}

Log& Log::write10(s32 val) {m_buff.wr_str(" = "); m_buff.wr_s32(val); return *this;}
Log& Log::write10(u32 val) {m_buff.wr_str(" = "); m_buff.wr_d32(val); return *this;}
Log& Log::write10(u64 val) {m_buff.wr_str(" = "); m_buff.wr_d64(val); return *this;}

const char* LogBuffer::c_str() {
    terminate();
    return m_buff;
}

void LogBuffer::wr_fix(const char* str, unsigned len) {
    if (!str) return;
    unsigned room = NETBOOT_LOG_MAXLEN - m_wridx;
    if (len > room) len = room;
    for (unsigned a = 0 ; a < len ; ++a)
        m_buff[m_wridx++] = str[a];
}

void LogBuffer::wr_str(const char* str) {
    if (!str) return;
    while (*str && m_wridx < NETBOOT_LOG_MAXLEN)
        m_buff[m_wridx++] = *str++;
}

void LogBuffer::wr_h32(u32 val, unsigned nhex) {
    static const char HEX[] = "0123456789ABCDEF";
    while (nhex && m_wridx < NETBOOT_LOG_MAXLEN) {
        --nhex;     // Most significant nybble first
        m_buff[m_wridx++] = HEX[(val >> (4*nhex)) & 0xF];
    }
}

void LogBuffer::wr_d32(u32 val, unsigned zpad) {
    wr_d64(val, zpad);
}

void LogBuffer::wr_d64(u64 val, unsigned zpad) {
    // Digits are generated in reverse, least significant first.
    // Padding continues until "zpad" is exhausted, so 999 gives 3 digits.
    char rev[20];
    unsigned n = 0;
    do {
        rev[n++] = char('0' + val % 10);
        val  /= 10;
        zpad /= 10;
    } while (val || zpad);
    while (n && m_wridx < NETBOOT_LOG_MAXLEN)
        m_buff[m_wridx++] = rev[--n];
}

void LogBuffer::wr_s32(s32 val) {
    wr_str(val < 0 ? "-" : "+");
    wr_d32(netboot::util::abs_s32(val));
}
