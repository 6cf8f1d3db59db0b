//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Test cases for the Netboot logging system

#include <catch2/catch.hpp>
#include <hal_test/sim_utils.h>
#include <netboot/ip_core.h>
#include <netboot/log.h>
#include <cstring>
#include <deque>
#include <string>

using netboot::log::Log;
static const s8 LOG_DEBUG       = netboot::log::DEBUG;
static const s8 LOG_INFO        = netboot::log::INFO;
static const s8 LOG_WARNING     = netboot::log::WARNING;
static const s8 LOG_ERROR       = netboot::log::ERROR;
static const s8 LOG_CRITICAL    = netboot::log::CRITICAL;

struct LogEvent {
    s8 priority;
    std::string msg;
};

// Store each Log message in a queue for later inspection.
class MockLog final : public netboot::log::EventHandler {
public:
    void check_next(const LogEvent& ref) {
        REQUIRE_FALSE(m_queue.empty());
        CHECK(ref.priority == m_queue.front().priority);
        CHECK(ref.msg == m_queue.front().msg);
        m_queue.pop_front();
    }

    bool empty() const {return m_queue.empty();}

protected:
    void log_event(s8 priority, unsigned nbytes, const char* msg) override {
        CHECK(nbytes == strlen(msg));
        LogEvent tmp = {priority, std::string(msg)};
        m_queue.push_back(tmp);
    }
    std::deque<LogEvent> m_queue;
};

// Example of an object with custom formatting.
struct Widget {
    u16 id;
    void log_to(netboot::log::LogBuffer& wr) const {
        wr.wr_str("Widget#");
        wr.wr_d32(id, 999);
    }
};

TEST_CASE("log") {
    CHECK(netboot::log::pre_test_reset());
    CHECK(netboot::poll::pre_test_reset());
    MockLog log;

    SECTION("formatting") {
        const u8 BYTES[] = {0xDE, 0xAD, 0xBE, 0xEF};
        Log(LOG_DEBUG, "MsgA").write((u8)0x12);
        Log(LOG_INFO, "MsgB").write((u16)0x1234);
        Log(LOG_WARNING, "MsgC").write((u32)0x12345678);
        Log(LOG_ERROR, "MsgD").write(BYTES, sizeof(BYTES));
        Log(LOG_CRITICAL, "MsgE", "Label").write(true).write(false);
        Log(LOG_INFO, "MsgF").write10((u32)80).write10((s32)-5).write10((s32)0);
        Log(LOG_INFO, "MsgG").write10((u64)12345678901234567890ull);
        Log(LOG_INFO, "MsgH").write(netboot::ip::Addr(192, 168, 1, 42));
        log.check_next({LOG_DEBUG,      "MsgA = 0x12"});
        log.check_next({LOG_INFO,       "MsgB = 0x1234"});
        log.check_next({LOG_WARNING,    "MsgC = 0x12345678"});
        log.check_next({LOG_ERROR,      "MsgD = 0xDEADBEEF"});
        log.check_next({LOG_CRITICAL,   "MsgE: Label = 1 = 0"});
        log.check_next({LOG_INFO,       "MsgF = 80 = -5 = +0"});
        log.check_next({LOG_INFO,       "MsgG = 12345678901234567890"});
        log.check_next({LOG_INFO,       "MsgH = 192.168.1.42"});
        CHECK(log.empty());
    }

    SECTION("write-obj") {
        Widget w = {42};
        Log(LOG_INFO, "Object: ").write_obj(w);
        log.check_next({LOG_INFO, "Object: Widget#042"});
    }

    SECTION("null-string") {
        Log(LOG_INFO, "Null").write((const char*)0).write(" ok");
        log.check_next({LOG_INFO, "Null ok"});
    }

    SECTION("truncation") {
        std::string big(2 * NETBOOT_LOG_MAXLEN, 'x');
        Log(LOG_INFO, big.c_str()).write10((u32)1234);
        log.check_next({LOG_INFO, std::string(NETBOOT_LOG_MAXLEN, 'x')});
    }

    SECTION("labels") {
        CHECK(std::string(netboot::log::priority_label(LOG_DEBUG))      == "DEBUG");
        CHECK(std::string(netboot::log::priority_label(LOG_INFO))       == "INFO ");
        CHECK(std::string(netboot::log::priority_label(LOG_WARNING))    == "WARN ");
        CHECK(std::string(netboot::log::priority_label(LOG_ERROR))      == "ERROR");
        CHECK(std::string(netboot::log::priority_label(LOG_CRITICAL))   == "CRIT ");
    }

    SECTION("multiple-handlers") {
        MockLog log2;
        Log(LOG_INFO, "Both");
        log.check_next({LOG_INFO, "Both"});
        log2.check_next({LOG_INFO, "Both"});
    }
}

TEST_CASE("log-to-console") {
    NETBOOT_TEST_START;

    SECTION("last-message") {
        CHECK(log.empty());
        Log(LOG_INFO, "TFTP server", "file sent").write(": ").write("a.bin");
        CHECK(log.contains("TFTP server: file sent: a.bin"));
        log.clear();
        CHECK(log.empty());
    }

    SECTION("below-threshold") {
        // Messages are still recorded, even if they are not printed.
        log.m_threshold = LOG_ERROR;
        Log(LOG_DEBUG, "Quiet");
        CHECK(log.contains("Quiet"));
    }

    SECTION("suppress") {
        log.suppress("Noisy");
        Log(LOG_WARNING, "Noisy message");
        CHECK(log.contains("Noisy"));
        log.suppress(0);
        log.disable();
        Log(LOG_CRITICAL, "Disabled");
        CHECK(log.contains("Disabled"));
    }
}
