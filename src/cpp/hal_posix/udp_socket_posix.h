//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Connect a netboot::udp::Socket to a Linux UDP socket.

#pragma once

#include <netboot/io_writeable.h>
#include <netboot/polling.h>
#include <netboot/udp_core.h>

// Receive buffer size, in bytes.
#ifndef NETBOOT_UDP_RXBYTES
#define NETBOOT_UDP_RXBYTES 2048
#endif

namespace netboot {
    namespace udp {
        //! Connect a netboot::udp::Socket to a Linux UDP socket.
        //! This is a thin-wrapper around the "sys/socket.h" API.  It
        //! operates in the main polling thread, using non-blocking I/O.
        //! Each call to poll_always() drains all queued datagrams and
        //! delivers them to the attached protocol.  Outgoing datagrams
        //! are staged in a local buffer and sent by `write_finalize()`.
        //!
        //! A receive error other than "would block" closes the socket
        //! and sets the `failed()` flag, so the owner can stop serving.
        class SocketPosix final
            : public netboot::udp::Socket
            , public netboot::poll::Always
            , protected netboot::io::ArrayWrite
        {
        public:
            SocketPosix();
            ~SocketPosix();

            //! Open a socket on the designated local address and port.
            //! Port zero selects an ephemeral port.  Broadcast transmit
            //! is enabled, as is address reuse for server restarts.
            bool bind(const netboot::ip::Addr& addr, const netboot::ip::Port& port);

            //! Close the socket and return to idle.
            void close();

            //! Is the socket open?
            inline bool ready() const {return m_sock >= 0;}

            //! Has the socket been closed by a receive error?
            inline bool failed() const {return m_failed;}

            // Required overrides from udp::Socket.
            netboot::io::Writeable* open_write(
                const netboot::ip::Addr& dstaddr,
                const netboot::ip::Port& dstport,
                unsigned len) override;
            netboot::ip::Port local_port() const override;

        private:
            // Internal event handlers:
            void poll_always() override;
            bool write_finalize() override;
            void write_abort() override;

            // Internal state:
            int m_sock;                         //!< Socket descriptor, if open.
            bool m_failed;                      //!< Closed due to error?
            netboot::ip::Port m_port;           //!< Bound local port.
            netboot::ip::Addr m_dstaddr;        //!< Destination for open_write.
            netboot::ip::Port m_dstport;        //!< Destination for open_write.
            u8 m_txbuff[netboot::udp::MAX_DATAGRAM];
            u8 m_rxbuff[NETBOOT_UDP_RXBYTES];
        };
    }
}
