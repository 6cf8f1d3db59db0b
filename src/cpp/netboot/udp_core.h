//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Abstract UDP socket and protocol-handler interfaces.
//!
//!\details
//! Each boot service (DHCP proxy, TFTP server) is a `udp::Protocol`
//! attached to exactly one `udp::Socket`.  The socket calls frame_rcvd()
//! for each incoming datagram, and the protocol replies by calling
//! open_write() on the same socket.  The POSIX implementation is
//! defined in hal_posix/udp_socket_posix.h; unit tests use a mock
//! socket that records each outgoing datagram (hal_test/sim_utils.h).

#pragma once

#include <netboot/io_core.h>
#include <netboot/ip_core.h>

namespace netboot {
    namespace udp {
        //! Well-known UDP port numbers.
        //!@{
        constexpr netboot::ip::Port PORT_NONE          = {0};
        constexpr netboot::ip::Port PORT_DHCP_SERVER   = {67};
        constexpr netboot::ip::Port PORT_DHCP_CLIENT   = {68};
        constexpr netboot::ip::Port PORT_TFTP_SERVER   = {69};
        //!@}

        //! Largest datagram payload on a standard 1500-byte Ethernet MTU.
        constexpr unsigned MAX_DATAGRAM = 1472;

        //! Handler for incoming datagrams on a `udp::Socket`.
        class Protocol {
        public:
            //! The parent socket calls frame_rcvd(...) for each incoming
            //! datagram.  The "src" object is only valid until the function
            //! returns.  The sender address is available from the socket's
            //! reply_ip() and reply_port() methods.
            virtual void frame_rcvd(netboot::io::LimitedRead& src) = 0;

        protected:
            constexpr Protocol() {}
            ~Protocol() {}
        };

        //! Abstract datagram socket bound to a single local port.
        class Socket {
        public:
            //! Open a datagram to the designated address and port.
            //! Write exactly "len" bytes, then call write_finalize().
            //! \returns Writeable object, or null if unable to send.
            virtual netboot::io::Writeable* open_write(
                const netboot::ip::Addr& dstaddr,
                const netboot::ip::Port& dstport,
                unsigned len) = 0;

            //! Local port number, or zero if the socket is closed.
            virtual netboot::ip::Port local_port() const = 0;

            //! Sender of the most recent received datagram.
            //!@{
            inline netboot::ip::Addr reply_ip() const {return m_reply_ip;}
            inline netboot::ip::Port reply_port() const {return m_reply_port;}
            //!@}

            //! Attach a protocol handler, replacing any previous handler.
            inline void set_protocol(netboot::udp::Protocol* proto)
                {m_proto = proto;}

        protected:
            Socket() : m_proto(0), m_reply_ip(0), m_reply_port(0) {}
            ~Socket() {}

            //! Forward a received datagram to the attached protocol.
            void deliver(
                const netboot::ip::Addr& srcaddr,
                const netboot::ip::Port& srcport,
                netboot::io::LimitedRead& src);

        private:
            netboot::udp::Protocol* m_proto;
            netboot::ip::Addr m_reply_ip;
            netboot::ip::Port m_reply_port;
        };
    }
}
