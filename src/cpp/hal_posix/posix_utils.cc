//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <hal_posix/posix_utils.h>
#include <netboot/io_readable.h>
#include <netboot/ip_core.h>
#include <netboot/polling.h>
#include <cstdio>
#include <ctime>
#include <unistd.h>

using netboot::io::Readable;
using netboot::log::ToConsole;
using netboot::poll::timekeeper;
using netboot::util::PosixClock;
using netboot::util::PosixTimekeeper;

std::string netboot::io::read_str(Readable* src)
{
    std::string tmp;
    while (src->get_read_ready())
        tmp.push_back((char)src->read_u8());
    src->read_finalize();
    return tmp;
}

std::string netboot::ip::format(const netboot::ip::Addr& addr)
{
    char tmp[16];
    addr.to_str(tmp);
    return std::string(tmp);
}

ToConsole::ToConsole(s8 threshold)
    : m_threshold(threshold)
    , m_last_msg()
    , m_start(m_clock.now_msec())
{
    // Nothing else to initialize.
}

bool ToConsole::contains(const char* msg)
{
    return m_last_msg.find(msg) != std::string::npos;
}

void ToConsole::suppress(const char* msg)
{
    if (msg) m_suppress.push_back(msg);
    else m_suppress.clear();
}

bool ToConsole::filtered() const
{
    for (const std::string& filter : m_suppress) {
        if (m_last_msg.find(filter) != std::string::npos) return true;
    }
    return false;
}

void ToConsole::log_event(s8 priority, unsigned nbytes, const char* msg)
{
    // The most recent message is kept even if it is not printed.
    m_last_msg.assign(msg, nbytes);
    if (priority < m_threshold || filtered()) return;

    // Errors go to stderr; everything else goes to stdout.
    FILE* dst = (priority >= netboot::log::ERROR) ? stderr : stdout;
    unsigned stamp = (m_clock.now_msec() - m_start) % 10000;
    fprintf(dst, "Log (%s) @%04u: %s\n",
        netboot::log::priority_label(priority), stamp, msg);
    fflush(dst);
}

u32 PosixClock::now_msec()
{
    struct timespec tv;
    if (clock_gettime(CLOCK_MONOTONIC, &tv) == 0)
        return u32(tv.tv_sec * 1000) + u32(tv.tv_nsec / 1000000);
    // Coarse fallback if the monotonic clock is unavailable.
    return u32(clock() / (CLOCKS_PER_SEC / 1000));
}

PosixTimekeeper::PosixTimekeeper()
{
    timekeeper.set_clock(&m_clock);
}

PosixTimekeeper::~PosixTimekeeper()
{
    timekeeper.set_clock(0);
}

void netboot::util::sleep_msec(unsigned msec)
{
    usleep(msec * 1000);
}
