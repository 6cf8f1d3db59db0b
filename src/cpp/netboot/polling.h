//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Cooperative event loop shared by the DHCP proxy and the TFTP server.
//!
//!\details
//! Every Netboot object runs on one thread.  The owner of that thread
//! calls `netboot::poll::service()` in a loop; each call visits every
//! registered object once.  Objects register by inheriting from:
//!  * netboot::poll::Always
//!      Visited on every pass.  Sockets check for datagrams here.
//!      (Override "poll_always".)
//!  * netboot::poll::Timer
//!      Visited when a millisecond countdown expires.  TFTP transfers
//!      use this for retransmission and idle timeouts.
//!      (Override "timer_event".)
//!
//! Elapsed time comes from a `netboot::poll::Clock`, normally the
//! `PosixTimekeeper` (hal_posix/posix_utils.h) or, in unit tests, the
//! `TimerSimulation` (hal_test/sim_utils.h).  Without a clock, each
//! pass through `service()` counts as one millisecond.

#pragma once

#include <netboot/types.h>

namespace netboot {
    namespace poll {
        //! Visit each registered `Always` object once.  This includes
        //! the global `timekeeper`, which in turn updates every `Timer`.
        void service();

        //! Hard-reset of global variables at the start of each unit test.
        //! Returns true if globals were already in the expected state.
        bool pre_test_reset();

        //! Free-running millisecond counter.
        //! Wraparound is expected; only differences are meaningful.
        class Clock {
        public:
            virtual u32 now_msec() = 0;
        protected:
            ~Clock() {}
        };

        //! Parent class for objects that should be polled continuously.
        class Always {
        public:
            //! Callback for each call to `netboot::poll::service()`.
            virtual void poll_always() = 0;

            //! Count the number of registered objects.
            static unsigned count_always();

        protected:
            Always();
            ~Always() NETBOOT_OPTIONAL_DTOR;

        private:
            friend netboot::util::ListCore;
            friend void netboot::poll::service();
            netboot::poll::Always* m_next;
        };

        //! Converts clock readings into countdown steps for each Timer.
        //! There is a single global instance, `netboot::poll::timekeeper`.
        class Timekeeper final : public netboot::poll::Always {
        public:
            Timekeeper();

            //! Active reference clock, or null if none is set.
            inline netboot::poll::Clock* get_clock() const {return m_clock;}
            inline bool clock_ready() const {return m_clock != 0;}

            //! Set the reference clock, or null to count service() calls.
            void set_clock(netboot::poll::Clock* clock);

            //! Reset global state for unit tests.
            bool pre_test_reset();

        protected:
            void poll_always() override;
            void advance(unsigned msec);

            netboot::poll::Clock* m_clock;
            u32 m_last;                 // Clock reading at last update
        };

        //! Global instance of the Timekeeper class.
        extern netboot::poll::Timekeeper timekeeper;

        //! Parent class for objects that need one-shot or periodic events.
        class Timer {
        public:
            //! Count the number of registered objects.
            static unsigned count_timer();

            //! Fire once after N milliseconds.
            void timer_once(unsigned msec)  {arm(msec, 0);}
            //! Fire every N milliseconds.
            void timer_every(unsigned msec) {arm(msec, msec);}
            //! Cancel any pending event.
            void timer_stop()               {arm(0, 0);}

            //! Interval for recurring timers, or zero for one-shot.
            inline unsigned timer_interval() const {return m_period;}
            //! Milliseconds until the next event, or zero if idle.
            inline unsigned timer_remaining() const {return m_left;}

        protected:
            Timer();
            ~Timer() NETBOOT_OPTIONAL_DTOR;

            //! Callback when the countdown expires.
            virtual void timer_event() = 0;

        private:
            void arm(unsigned first, unsigned period);
            void countdown(unsigned msec);

            friend netboot::util::ListCore;
            friend netboot::poll::Timekeeper;
            netboot::poll::Timer* m_next;
            unsigned m_left;
            unsigned m_period;
        };
    }
}
