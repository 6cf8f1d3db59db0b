//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//! \file
//! Miscellaneous POSIX wrappers (e.g., log to console, system clock...)
//! \details
//! Classes in the main "netboot" folder use a restricted subset of the
//! C/C++ standard library and avoid allocating memory on the heap.  This
//! file defines wrappers and extensions for ease of use on platforms that
//! do not require such limitations.

#pragma once

#include <netboot/log.h>
#include <netboot/polling.h>
#include <string>
#include <vector>

namespace netboot {
    namespace io {
        //! Read remaining contents of a Readable object as a string.
        std::string read_str(netboot::io::Readable* src);
    }

    namespace ip {
        //! Human-readable formatting for an IPv4 address.
        std::string format(const netboot::ip::Addr& addr);
    }

    namespace util {
        //! Millisecond clock based on clock_gettime(CLOCK_MONOTONIC).
        class PosixClock final : public netboot::poll::Clock {
        public:
            u32 now_msec() override;
        };

        //! Drives the global polling timekeeper from the system clock.
        //! Most POSIX programs should have one global instance.
        class PosixTimekeeper {
        public:
            PosixTimekeeper();
            virtual ~PosixTimekeeper();

            inline u32 now_msec() {return m_clock.now_msec();}
            inline netboot::poll::Clock* clock() {return &m_clock;}

        protected:
            netboot::util::PosixClock m_clock;
        };

        //! Wrapper for usleep() in milliseconds.
        void sleep_msec(unsigned msec);
    }

    namespace log {
        //! Helper object that prints log::Log messages to console.
        //! Stores the most recent log message, to facilitate unit tests.
        class ToConsole final : public netboot::log::EventHandler {
        public:
            //! On creation, optionally specify the minimum priority to print.
            explicit ToConsole(s8 threshold=netboot::log::DEBUG);

            //! Disable all output messages until threshold is lowered.
            void disable() {m_threshold = INT8_MAX;}

            //! Suppress messages containing a specific string.
            //! Filters are added to an internal list; null pointer clears the list.
            void suppress(const char* msg);

            //! Does the last logged message contain the provided substring?
            bool contains(const char* msg);

            //! Clear the stored copy of the most recent log message.
            void clear() {m_last_msg.clear();}
            //! Is there a stored log message?
            bool empty() {return m_last_msg.empty();}

            // Publically accessible members:
            s8 m_threshold;             //!< Print only if priority >= threshold
            std::string m_last_msg;     //!< Most recent message (ignores threshold)

        protected:
            void log_event(s8 priority, unsigned nbytes, const char* msg) override;
            bool filtered() const;

            std::vector<std::string> m_suppress;
            netboot::util::PosixClock m_clock;
            const u32 m_start;          // Timestamps are relative to this
        };
    }
}
