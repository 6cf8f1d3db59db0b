//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Read-only server for the Trivial File Transfer Protocol (TFTP)
//!
//!\details
//! TFTP is a simple lockstep file transfer protocol over UDP.  PXE
//! firmware uses it to download the first-stage boot loader.
//!
//! The server conforms to IETF RFC 1350 with the following extensions
//! and exceptions:
//!  * Option negotiation (RFC 2347) for "blksize" (RFC 2348) and
//!    "tsize" (RFC 2349).  Other options are ignored.
//!  * Read requests only.  Write requests are refused.
//!  * "octet" and "netascii" modes are both served as raw binary.
//!  * Single-port mode: all sessions share the server port, and are
//!    identified by the client's address and port.
//!  * Up to NETBOOT_TFTP_SESSIONS concurrent transfers.
//!
//! The server depends on a child class to open each requested file,
//! \see hal_posix/file_tftp.h.

#pragma once

#include <netboot/polling.h>
#include <netboot/udp_core.h>

// Maximum number of concurrent transfers.
#ifndef NETBOOT_TFTP_SESSIONS
#define NETBOOT_TFTP_SESSIONS 16
#endif

// Idle timeout for each transfer, in milliseconds.
#ifndef NETBOOT_TFTP_TIMEOUT_MSEC
#define NETBOOT_TFTP_TIMEOUT_MSEC 5000
#endif

// Largest negotiated block size.  (1500-byte MTU, less IP/UDP/TFTP headers.)
#ifndef NETBOOT_TFTP_MAX_BLKSIZE
#define NETBOOT_TFTP_MAX_BLKSIZE 1428
#endif

// Maximum filename length, including the terminator.
#ifndef NETBOOT_TFTP_MAXNAME
#define NETBOOT_TFTP_MAXNAME 256
#endif

namespace netboot {
    namespace udp {
        //! TFTP opcodes (RFC 1350 Section 5, RFC 2347).
        //!@{
        constexpr u16 TFTP_OPCODE_RRQ    = 1;    // Read request
        constexpr u16 TFTP_OPCODE_WRQ    = 2;    // Write request
        constexpr u16 TFTP_OPCODE_DATA   = 3;    // Data
        constexpr u16 TFTP_OPCODE_ACK    = 4;    // Acknowledgement
        constexpr u16 TFTP_OPCODE_ERROR  = 5;    // Error
        constexpr u16 TFTP_OPCODE_OACK   = 6;    // Option acknowledgement
        //!@}

        //! TFTP error codes (RFC 1350 Appendix I).
        //!@{
        constexpr u16 TFTP_ERROR_UNDEF   = 0;    // See message
        constexpr u16 TFTP_ERROR_NOFILE  = 1;    // File not found
        constexpr u16 TFTP_ERROR_ACCESS  = 2;    // Access violation
        constexpr u16 TFTP_ERROR_PROTOCOL= 4;    // Illegal TFTP operation
        constexpr u16 TFTP_ERROR_TID     = 5;    // Unknown transfer ID
        //!@}

        //! Default and minimum block size.
        //!@{
        constexpr unsigned TFTP_BLKSIZE_DEFAULT = 512;
        constexpr unsigned TFTP_BLKSIZE_MIN     = 8;
        //!@}

        //! Human-readable message for each TFTP error code.
        const char* tftp_error_str(u16 errcode);

        //! Options accepted from a read request.
        struct TftpOptions {
            bool has_blksize;   //!< Acknowledge "blksize"?
            bool has_tsize;     //!< Acknowledge "tsize"?
            u16 blksize;        //!< Negotiated block size
            u32 tsize;          //!< Transfer size, in bytes

            TftpOptions();

            //! Any options to acknowledge?
            inline bool any() const {return has_blksize || has_tsize;}
        };

        //! State for a single server-to-client transfer.
        //! Users should not typically use this object directly.
        class TftpTransfer final : public netboot::poll::Timer {
        public:
            //! Create an idle transfer object.
            TftpTransfer();
            ~TftpTransfer() {}

            //! Is there a transfer in progress?
            inline bool active() const
                {return m_flags > 0;}

            //! Is this transfer connected to the designated client?
            inline bool matches(
                const netboot::ip::Addr& addr,
                const netboot::ip::Port& port) const
                {return active() && addr == m_peer_ip && port == m_peer_port;}

            //! Transfer progress, measured in blocks or in bytes.
            //!@{
            inline u32 progress_blocks() const {return m_block_id;}
            inline u32 progress_bytes() const {return m_xfer_bytes;}
            //!@}

            //! Negotiated block size.
            inline unsigned blksize() const {return m_blksize;}

            //! Begin sending a file to the designated client.
            //! Sends OACK if any options were accepted, else the first block.
            void start(
                netboot::udp::Socket* sock,
                const netboot::ip::Addr& addr,
                const netboot::ip::Port& port,
                netboot::io::Readable* src,
                const char* filename,
                const netboot::udp::TftpOptions& opts);

            //! Handle a packet from the connected client.
            //! The opcode has already been read from "src".
            void packet_rcvd(u16 opcode, netboot::io::LimitedRead& src);

            //! Send an error message to the client and end the transfer.
            void send_error(u16 errcode, const char* errstr = 0);

            //! Immediately revert to the idle state.
            void reset(const char* msg);

        protected:
            friend netboot::test::TftpServer;

            // Inherited event handlers:
            void timer_event() override;

            // Internal event handlers:
            void read_error(netboot::io::LimitedRead& src);
            void send_data(u16 block_id);
            void send_oack(const netboot::udp::TftpOptions& opts);
            void send_packet(unsigned len, u16 retry);

            // Interface objects.
            netboot::udp::Socket* m_sock;
            netboot::ip::Addr m_peer_ip;
            netboot::ip::Port m_peer_port;
            netboot::io::Readable* m_src;
            char m_filename[NETBOOT_TFTP_MAXNAME];

            // Transfer state uses soft-matching against an extended
            // 32-bit Block-ID, to allow block-number rollover.
            u32 m_xfer_bytes;
            u32 m_block_id;
            u16 m_flags;
            u16 m_blksize;

            // Elapsed time since the last progress, in milliseconds.
            unsigned m_waited;
            unsigned m_interval;

            // Internal buffer allows retransmission of lost packets.
            // (Max 4-byte header + data block.)
            u16 m_retry_count;
            u16 m_retry_len;
            u8 m_retry_buff[4 + NETBOOT_TFTP_MAX_BLKSIZE];
        };

        //! ServerCore is the base class that handles TFTP network functions.
        //! However, it depends on children to define the I/O functions.
        class TftpServerCore : public netboot::udp::Protocol {
        public:
            //! Stop accepting new transfers.  Transfers in progress continue.
            void shutdown();

            //! Is the server accepting new transfers?
            inline bool accepting() const {return !m_shutdown;}

            //! Number of transfers in progress.
            unsigned active_sessions() const;

            //! Abort all transfers in progress, with an error to each client.
            void close_all(const char* msg);

        protected:
            friend netboot::test::TftpServer;

            //! Users cannot instantiate this class directly.
            explicit TftpServerCore(netboot::udp::Socket* sock);
            ~TftpServerCore() NETBOOT_OPTIONAL_DTOR;

            //! Child class MUST override this method.
            //! Open the requested file for the designated session slot.
            //! The returned object must report the file size through
            //! get_read_ready(), and read_finalize() releases the file.
            //! \returns Readable object, or null if not found.
            virtual netboot::io::Readable* read(
                unsigned slot, const char* filename) = 0;

            // Inherited event handler for handling incoming packets.
            void frame_rcvd(netboot::io::LimitedRead& src) override;

            // Internal event handlers.
            void read_request(
                netboot::udp::TftpTransfer* xfer,
                netboot::io::LimitedRead& src);
            void send_error(u16 errcode, const char* errstr = 0);
            netboot::udp::TftpTransfer* find_session();
            netboot::udp::TftpTransfer* free_session();

            // Connection to each client.
            netboot::udp::Socket* const m_sock;
            bool m_shutdown;
            netboot::udp::TftpTransfer m_xfer[NETBOOT_TFTP_SESSIONS];
        };
    }
}
