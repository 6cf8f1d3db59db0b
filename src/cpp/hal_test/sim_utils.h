//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Miscellaneous simulation and test helper functions.
//!
//!\details
//! This file contains a variety of "small" utilities used in unit tests.
//! Anything that requires more than a few lines of code should generally
//! be moved into its own file.

#pragma once

#include <hal_posix/posix_utils.h>
#include <netboot/io_core.h>
#include <netboot/ip_core.h>
#include <netboot/log.h>
#include <netboot/polling.h>
#include <netboot/udp_core.h>
#include <deque>
#include <string>

//! Boilerplate for configuring each unit test.
//! Includes a hard-reset of Netboot global variables and enables log::ToConsole.
//! An error in this macro indicates the *previous* test didn't exit cleanly.
#define NETBOOT_TEST_START \
    CHECK(netboot::log::pre_test_reset()); \
    CHECK(netboot::poll::pre_test_reset()); \
    netboot::log::ToConsole log;

namespace netboot {
    namespace test {
        //! Write a string as a single frame and finalize.
        bool write(netboot::io::Writeable* dst, const std::string& dat);

        //! Pseudorandom string of the designated length.
        std::string random_string(unsigned nbytes);

        //! A datagram sent through a `MockSocket`.
        struct Datagram {
            netboot::ip::Addr dstaddr;
            netboot::ip::Port dstport;
            std::string data;
        };

        //! Datagram socket that records outgoing traffic in memory.
        //! Incoming traffic is injected directly with `rcvd(...)`.
        class MockSocket final
            : public netboot::udp::Socket
            , protected netboot::io::ArrayWrite
        {
        public:
            explicit MockSocket(u16 port = 0);

            //! Deliver a datagram to the attached protocol.
            void rcvd(
                const netboot::ip::Addr& srcaddr,
                const netboot::ip::Port& srcport,
                const std::string& data);

            //! Number of outgoing datagrams waiting to be checked.
            inline unsigned sent_count() const {return (unsigned)m_sent.size();}

            //! Remove and return the oldest outgoing datagram.
            //! Returns an empty datagram if none are waiting.
            netboot::test::Datagram pop();

            //! Discard all outgoing datagrams.
            inline void clear() {m_sent.clear();}

            //! Simulate a send failure on the next N datagrams.
            inline void fail_next(unsigned count) {m_fail = count;}

            // Required overrides from udp::Socket.
            netboot::io::Writeable* open_write(
                const netboot::ip::Addr& dstaddr,
                const netboot::ip::Port& dstport,
                unsigned len) override;
            netboot::ip::Port local_port() const override
                {return m_port;}

        protected:
            bool write_finalize() override;

            const netboot::ip::Port m_port;
            netboot::ip::Addr m_dstaddr;
            netboot::ip::Port m_dstport;
            unsigned m_fail;
            std::deque<netboot::test::Datagram> m_sent;
            u8 m_buff[netboot::udp::MAX_DATAGRAM];
        };

        //! Simulated clock.  Time advances only when instructed, and each
        //! step also runs one pass of `netboot::poll::service()`.
        class TimerSimulation final : public netboot::poll::Clock {
        public:
            TimerSimulation();
            ~TimerSimulation();
            u32 now_msec() override {return m_tnow;}

            //! Step forward one millisecond.
            void sim_step();
            //! Step forward N milliseconds.
            void sim_wait(unsigned dly_msec);

        protected:
            u32 m_tnow;
        };

        //! Temporary directory, deleted with its contents on destruction.
        class TempDir {
        public:
            TempDir();
            ~TempDir();

            //! Full path of the directory, or of a file inside it.
            //!@{
            inline const std::string& path() const {return m_path;}
            std::string file(const char* name) const;
            //!@}

            //! Create a file inside the directory, including parents.
            bool write(const char* name, const std::string& data) const;

            //! Read a file inside the directory.
            //! Returns an empty string if the file cannot be read.
            std::string read(const char* name) const;

            //! Does the named file exist?
            bool exists(const char* name) const;

        protected:
            std::string m_path;
        };
    }
}
