//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <netboot/list.h>
#include <netboot/polling.h>

namespace poll = netboot::poll;
using netboot::util::ListCore;

// Registration lists are plain pointers so they are valid before any
// constructor runs, including those of other global objects.
static poll::Always*    g_always = 0;
static poll::Timer*     g_timers = 0;

poll::Timekeeper poll::timekeeper;

bool poll::pre_test_reset() {
    bool clean = timekeeper.pre_test_reset();
    if (g_timers) {
        g_timers = 0;
        clean = false;
    }
    return clean;
}

void poll::service() {
    // Callbacks may unregister themselves, so fetch "next" first.
    for (poll::Always* item = g_always ; item ; ) {
        poll::Always* next = item->m_next;
        item->poll_always();
        item = next;
    }
}

poll::Always::Always()
    : m_next(0)
{
    ListCore::add(g_always, this);
}

#if NETBOOT_ALLOW_DELETION
poll::Always::~Always() {
    ListCore::remove(g_always, this);
}
#endif

unsigned poll::Always::count_always() {
    return ListCore::len(g_always);
}

poll::Timekeeper::Timekeeper()
    : m_clock(0)
    , m_last(0)
{
    // Nothing else to initialize.
}

void poll::Timekeeper::set_clock(poll::Clock* clock) {
    m_clock = clock;
    m_last  = clock ? clock->now_msec() : 0;
}

bool poll::Timekeeper::pre_test_reset() {
    // Only the timekeeper itself should remain registered.
    bool clean = ListCore::pre_test_reset<poll::Always>(g_always, this);
    set_clock(0);
    return clean;
}

void poll::Timekeeper::poll_always() {
    if (!m_clock) {
        advance(1);
        return;
    }
    // Unsigned subtraction handles counter wraparound.
    u32 now = m_clock->now_msec();
    u32 delta = now - m_last;
    if (delta) {
        m_last = now;
        advance(delta);
    }
}

void poll::Timekeeper::advance(unsigned msec) {
    for (poll::Timer* item = g_timers ; item ; ) {
        poll::Timer* next = item->m_next;
        item->countdown(msec);
        item = next;
    }
}

poll::Timer::Timer()
    : m_next(0)
    , m_left(0)
    , m_period(0)
{
    ListCore::add(g_timers, this);
}

#if NETBOOT_ALLOW_DELETION
poll::Timer::~Timer() {
    ListCore::remove(g_timers, this);
}
#endif

unsigned poll::Timer::count_timer() {
    return ListCore::len(g_timers);
}

void poll::Timer::arm(unsigned first, unsigned period) {
    m_left   = first;
    m_period = period;
}

void poll::Timer::countdown(unsigned msec) {
    if (!m_left) return;            // Idle
    if (m_left > msec) {
        m_left -= msec;
        return;
    }
    // Reload before the callback, which may re-arm or stop this timer.
    // Recurring timers absorb any overshoot, but never less than 1 msec.
    unsigned late = msec - m_left;
    if (!m_period) {
        m_left = 0;
    } else if (m_period > late) {
        m_left = m_period - late;
    } else {
        m_left = 1;
    }
    timer_event();
}
