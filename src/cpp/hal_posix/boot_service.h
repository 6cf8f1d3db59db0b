//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//! \file
//! Top-level lifecycle for the network boot services.
//!
//! \details
//! The `BootService` composes the boot pipeline under one lifecycle:
//!  1. Render the iPXE boot script for the configured HTTP endpoint.
//!  2. Create the TFTP root and patch every boot image into it.
//!  3. Bind the DHCP proxy and TFTP sockets, then serve requests.
//!  4. On stop, refuse new TFTP sessions, let transfers in progress
//!     finish for a bounded grace period, then close everything.
//!
//! Any failure in steps 1-3, or a receive error on either socket, is
//! fatal: `run()` returns false.  All work happens on the calling
//! thread, through `netboot::poll::service()`.

#pragma once

#include <csignal>
#include <hal_posix/codec_exec.h>
#include <hal_posix/file_patch.h>
#include <hal_posix/file_tftp.h>
#include <hal_posix/udp_socket_posix.h>
#include <netboot/dhcp_proxy.h>
#include <netboot/polling.h>
#include <string>

// Time allowed for TFTP transfers to finish after a stop request.
#ifndef NETBOOT_SHUTDOWN_GRACE_MSEC
#define NETBOOT_SHUTDOWN_GRACE_MSEC 2000
#endif

namespace netboot {
    //! Runtime configuration for `BootService`.
    //! The default constructor fills in the standard values.
    struct BootConfig {
        netboot::ip::Addr server;   //!< Advertised boot server address
        u16 api_port;               //!< HTTP port for script and images
        u16 dhcp_port;              //!< DHCP proxy listening port
        u16 tftp_port;              //!< TFTP listening port
        std::string ipxe_dir;       //!< Stock iPXE images
        std::string tftp_root;      //!< Patched images, served over TFTP
        std::string zbin;           //!< Compressor for the legacy image
        unsigned grace_msec;        //!< Shutdown grace period

        BootConfig();
    };

    //! Run the boot services from a single polling thread.
    class BootService final : protected netboot::poll::Timer {
    public:
        //! Create the service.  Nothing is opened until `start()`.
        BootService(
            const netboot::BootConfig& cfg,
            netboot::ipxe::Compressor* codec);
        ~BootService();

        //! Generate and patch the boot images, then open both sockets.
        //! \returns True if every step succeeded.
        bool start();

        //! Run one pass of the polling loop.
        //! \returns False if either socket has failed.
        bool service();

        //! Begin the graceful shutdown sequence.
        void shutdown();

        //! Has the shutdown sequence completed?
        inline bool finished() const {return m_finished;}

        //! Block until `stop()` is called or a fatal error occurs.
        //! Calls `start()` first, if it has not already been called.
        //! \returns True on a clean shutdown.
        bool run();

        //! Request a stop.  Safe to call from a signal handler.
        inline void stop() {m_stop_req = 1;}

        //! Accessors for unit tests and diagnostics.
        //!@{
        inline const netboot::BootConfig& config() const {return m_cfg;}
        inline const netboot::dhcp::ProxyServer& dhcp() const {return m_dhcp;}
        inline const netboot::udp::TftpServerPosix& tftp() const {return m_tftp;}
        inline netboot::ip::Port dhcp_port() const {return m_dhcp_sock.local_port();}
        inline netboot::ip::Port tftp_port() const {return m_tftp_sock.local_port();}
        //!@}

    protected:
        // Grace period has elapsed.
        void timer_event() override;

        // Close the remaining sessions and both sockets.
        void finish();

        const netboot::BootConfig m_cfg;
        netboot::ipxe::ImagePatcher m_patcher;
        netboot::udp::SocketPosix m_dhcp_sock;
        netboot::udp::SocketPosix m_tftp_sock;
        netboot::dhcp::ProxyServer m_dhcp;
        netboot::udp::TftpServerPosix m_tftp;
        bool m_started;
        bool m_stopping;
        bool m_finished;
        volatile std::sig_atomic_t m_stop_req;
    };
}
