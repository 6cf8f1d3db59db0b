//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <netboot/log.h>
#include <netboot/udp_tftp.h>
#include <netboot/utils.h>

namespace log = netboot::log;
using netboot::io::ArrayWrite;
using netboot::io::LimitedRead;
using netboot::io::Readable;
using netboot::ip::Addr;
using netboot::ip::Port;
using netboot::udp::TftpOptions;
using netboot::udp::TftpServerCore;
using netboot::udp::TftpTransfer;
using netboot::util::equal_nocase;
using netboot::util::min_unsigned;
using netboot::util::set_mask_u16;
using netboot::util::write_be_u16;
namespace udp = netboot::udp;

// Set verbosity level for debugging (0/1/2).
static constexpr unsigned DEBUG_VERBOSE = 0;

// Label for all log messages from this file.
static const char* const LBL_TFTP = "TFTP server";

// Internal options and status flags.
static constexpr u16 FLAG_BUSY      = 0x0001;   // Transfer in progress
static constexpr u16 FLAG_EOF       = 0x0002;   // Last block sent
static constexpr u16 FLAG_DONE      = 0x0004;   // Last block acknowledged

// TFTP should only be used on a LAN, so set an aggressive timeout
// for the first retry and double on every subsequent attempt, until
// the idle timeout is reached.
static constexpr unsigned RETRY_MSEC = 100;
static constexpr unsigned RETRY_SHIFT_MAX = 6;

// Working buffer for option names and values.
static constexpr unsigned OPTION_MAXLEN = 32;

const char* udp::tftp_error_str(u16 errcode) {
    switch (errcode) {
    case TFTP_ERROR_UNDEF:      return "Undefined error";
    case TFTP_ERROR_NOFILE:     return "File not found";
    case TFTP_ERROR_ACCESS:     return "Access violation";
    case TFTP_ERROR_PROTOCOL:   return "Illegal TFTP operation";
    case TFTP_ERROR_TID:        return "Unknown transfer ID";
    default:                    return "Unknown error";
    }
}

// Write an ERROR packet (RFC 1350 Section 5) to the designated buffer.
static unsigned write_error(u8* buff, unsigned len, u16 errcode, const char* errstr) {
    ArrayWrite pkt(buff, len);
    pkt.write_u16(udp::TFTP_OPCODE_ERROR);
    pkt.write_u16(errcode);
    pkt.write_str(errstr);
    pkt.write_u8(0);
    return pkt.write_finalize() ? pkt.written_len() : 0;
}

TftpOptions::TftpOptions()
    : has_blksize(false)
    , has_tsize(false)
    , blksize(udp::TFTP_BLKSIZE_DEFAULT)
    , tsize(0)
{
    // No other initialization required.
}

TftpTransfer::TftpTransfer()
    : m_sock(0)
    , m_peer_ip(0)
    , m_peer_port(0)
    , m_src(0)
    , m_filename{}
    , m_xfer_bytes(0)
    , m_block_id(0)
    , m_flags(0)
    , m_blksize(udp::TFTP_BLKSIZE_DEFAULT)
    , m_waited(0)
    , m_interval(0)
    , m_retry_count(0)
    , m_retry_len(0)
{
    // No other initialization required.
}

void TftpTransfer::reset(const char* msg)
{
    if (DEBUG_VERBOSE > 1) log::Log(log::DEBUG, "TftpTransfer::reset", msg);

    // Did we just complete a transfer?
    if ((m_flags & FLAG_BUSY) && (m_flags & FLAG_DONE)) {
        log::Log(log::INFO, LBL_TFTP, msg)
            .write(": ").write(m_filename)
            .write(", bytes").write10(m_xfer_bytes);
    } else if (m_flags & FLAG_BUSY) {
        log::Log(log::WARNING, LBL_TFTP, msg)
            .write(": ").write(m_filename)
            .write(", client").write(m_peer_ip)
            .write(", bytes").write10(m_xfer_bytes);
    }

    // Always release the source.
    if (m_src) m_src->read_finalize();

    // Force all internal state to idle.
    m_src = 0;
    m_peer_ip = netboot::ip::ADDR_NONE;
    m_peer_port = udp::PORT_NONE;
    m_filename[0] = 0;
    m_block_id = 0;
    m_flags = 0;
    m_blksize = udp::TFTP_BLKSIZE_DEFAULT;
    m_xfer_bytes = 0;
    m_waited = 0;
    m_interval = 0;
    m_retry_count = 0;
    m_retry_len = 0;
    timer_stop();
}

void TftpTransfer::start(
    udp::Socket* sock, const Addr& addr, const Port& port,
    Readable* src, const char* filename, const TftpOptions& opts)
{
    if (DEBUG_VERBOSE > 0)
        log::Log(log::DEBUG, LBL_TFTP, "start").write(addr).write(port.value);

    // Reset transfer state.
    m_sock = sock;
    m_peer_ip = addr;
    m_peer_port = port;
    m_src = src;
    snprintf(m_filename, sizeof(m_filename), "%s", filename);
    m_xfer_bytes = 0;
    m_block_id = 0;
    m_flags = FLAG_BUSY;
    m_blksize = opts.blksize;
    m_waited = 0;

    // Send the option acknowledgement or the first data block.
    if (opts.any()) {
        send_oack(opts);
    } else {
        send_data(1);
    }
}

void TftpTransfer::packet_rcvd(u16 opcode, LimitedRead& src)
{
    if (DEBUG_VERBOSE > 1)
        log::Log(log::DEBUG, "TftpTransfer::packet_rcvd").write(opcode);

    if (opcode == TFTP_OPCODE_ERROR) {
        // Received ERROR, abort transfer immediately.
        read_error(src);
        reset("Connection reset by peer");
    } else if (opcode == TFTP_OPCODE_ACK && src.get_read_ready() >= 2) {
        // Received ACK, send next DATA packet if applicable.
        u16 block_id = src.read_u16();
        send_data(u16(block_id + 1));
    } else {
        // Any other opcode is an error.
        send_error(TFTP_ERROR_PROTOCOL);
    }
}

void TftpTransfer::timer_event()
{
    if (DEBUG_VERBOSE > 1)
        log::Log(log::DEBUG, "TftpTransfer::timer_event").write10(u32(m_retry_count));

    // Timeout waiting for the client's response...
    m_waited += m_interval;
    if (m_waited >= NETBOOT_TFTP_TIMEOUT_MSEC) {
        send_error(TFTP_ERROR_UNDEF, "Timeout");
    } else {
        send_packet(m_retry_len, u16(m_retry_count + 1));
    }
}

void TftpTransfer::read_error(LimitedRead& src)
{
    // Unpack the error string into the internal buffer.
    // (We're about to close the connection, so it's OK to overwrite.)
    u16 errcode = src.read_u16();
    char* errstr = (char*)m_retry_buff;
    src.read_str(sizeof(m_retry_buff), errstr);

    log::Log(log::WARNING, LBL_TFTP, "Remote error")
        .write(errcode).write(": ").write(errstr);
}

void TftpTransfer::send_data(u16 block_id)
{
    if (DEBUG_VERBOSE > 1)
        log::Log(log::DEBUG, "TftpTransfer::send_data").write(block_id);

    // Compare 16 LSBs of the requested block to the last block sent.
    // (Careful arithmetic here allows for wraparound.)
    s16 diff = s16(block_id - u16(m_block_id & 0xFFFF));
    if (diff <= 0) {
        // Ignore stale and duplicate ACKs.  Lost packets are resent
        // by the retransmission timer.
    } else if (m_flags & FLAG_EOF) {
        // Client acknowledged the last block.
        set_mask_u16(m_flags, FLAG_DONE);
        reset("file sent");
    } else if (diff == 1) {
        // Write the packet header.
        write_be_u16(m_retry_buff + 0, TFTP_OPCODE_DATA);
        write_be_u16(m_retry_buff + 2, block_id);
        // Copy the next block of data.
        unsigned len = min_unsigned(m_blksize, m_src->get_read_ready());
        if (len > 0 && !m_src->read_bytes(len, m_retry_buff + 4)) {
            send_error(TFTP_ERROR_UNDEF, "Read error");
            return;
        }
        ++m_block_id;
        m_xfer_bytes += len;
        if (len < m_blksize) set_mask_u16(m_flags, FLAG_EOF);
        // Send the DATA packet.
        send_packet(len + 4, 0);
    } else {
        // Invalid block ID from incoming ACK packet.
        send_error(TFTP_ERROR_PROTOCOL);
    }
}

void TftpTransfer::send_oack(const TftpOptions& opts)
{
    if (DEBUG_VERBOSE > 1)
        log::Log(log::DEBUG, "TftpTransfer::send_oack").write(opts.blksize);

    // Option names and values are null-terminated strings (RFC 2347).
    char value[16];
    ArrayWrite pkt(m_retry_buff, sizeof(m_retry_buff));
    pkt.write_u16(TFTP_OPCODE_OACK);
    if (opts.has_blksize) {
        snprintf(value, sizeof(value), "%u", unsigned(opts.blksize));
        pkt.write_str("blksize");
        pkt.write_u8(0);
        pkt.write_str(value);
        pkt.write_u8(0);
    }
    if (opts.has_tsize) {
        snprintf(value, sizeof(value), "%u", unsigned(opts.tsize));
        pkt.write_str("tsize");
        pkt.write_u8(0);
        pkt.write_str(value);
        pkt.write_u8(0);
    }
    pkt.write_finalize();

    // OACK is retransmitted just like block zero.
    send_packet(pkt.written_len(), 0);
}

void TftpTransfer::send_error(u16 errcode, const char* errstr)
{
    if (DEBUG_VERBOSE > 1)
        log::Log(log::DEBUG, "TftpTransfer::send_error").write(errcode);

    // Lookup the human-readable error message.
    if (!errstr) errstr = udp::tftp_error_str(errcode);

    // Send the error packet once, without retransmission.
    unsigned len = write_error(m_retry_buff, sizeof(m_retry_buff), errcode, errstr);
    auto wr = m_sock->open_write(m_peer_ip, m_peer_port, len);
    if (wr) {
        wr->write_bytes(len, m_retry_buff);
        wr->write_finalize();
    }

    // Reset connection.
    reset(errstr);
}

void TftpTransfer::send_packet(unsigned len, u16 retry)
{
    if (DEBUG_VERBOSE > 1) {
        u16 opcode = netboot::util::extract_be_u16(m_retry_buff);
        log::Log(log::DEBUG, "TftpTransfer::send_packet").write(opcode);
    }

    // Sanity check on input length.
    if (len > sizeof(m_retry_buff)) return;

    // New packets restart the idle timer.  Retries double the interval,
    // but never wait past the idle timeout.
    if (retry == 0) m_waited = 0;
    m_retry_len   = (u16)len;
    m_retry_count = retry;
    m_interval = min_unsigned(
        RETRY_MSEC << min_unsigned(retry, RETRY_SHIFT_MAX),
        NETBOOT_TFTP_TIMEOUT_MSEC - m_waited);
    timer_once(m_interval);

    // Attempt to send the packet.
    auto wr = m_sock->open_write(m_peer_ip, m_peer_port, len);
    if (wr) {
        wr->write_bytes(len, m_retry_buff);
        wr->write_finalize();
    } else if (DEBUG_VERBOSE > 1) {
        log::Log(log::DEBUG, "TftpTransfer: Transmission delayed...");
    }
}

TftpServerCore::TftpServerCore(udp::Socket* sock)
    : m_sock(sock)
    , m_shutdown(false)
{
    m_sock->set_protocol(this);
}

#if NETBOOT_ALLOW_DELETION
TftpServerCore::~TftpServerCore()
{
    m_sock->set_protocol(0);
}
#endif

void TftpServerCore::shutdown()
{
    if (!m_shutdown) {
        log::Log(log::INFO, LBL_TFTP, "No longer accepting new transfers")
            .write(", active").write10(active_sessions());
    }
    m_shutdown = true;
}

unsigned TftpServerCore::active_sessions() const
{
    unsigned count = 0;
    for (unsigned a = 0 ; a < NETBOOT_TFTP_SESSIONS ; ++a)
        if (m_xfer[a].active()) ++count;
    return count;
}

void TftpServerCore::close_all(const char* msg)
{
    for (unsigned a = 0 ; a < NETBOOT_TFTP_SESSIONS ; ++a)
        if (m_xfer[a].active()) m_xfer[a].send_error(TFTP_ERROR_UNDEF, msg);
}

TftpTransfer* TftpServerCore::find_session()
{
    Addr addr = m_sock->reply_ip();
    Port port = m_sock->reply_port();
    for (unsigned a = 0 ; a < NETBOOT_TFTP_SESSIONS ; ++a)
        if (m_xfer[a].matches(addr, port)) return m_xfer + a;
    return 0;
}

TftpTransfer* TftpServerCore::free_session()
{
    for (unsigned a = 0 ; a < NETBOOT_TFTP_SESSIONS ; ++a)
        if (!m_xfer[a].active()) return m_xfer + a;
    return 0;
}

void TftpServerCore::send_error(u16 errcode, const char* errstr)
{
    // Reply to the sender of the current packet, outside any session.
    if (!errstr) errstr = udp::tftp_error_str(errcode);
    u8 buff[128];
    unsigned len = write_error(buff, sizeof(buff), errcode, errstr);
    auto wr = m_sock->open_write(m_sock->reply_ip(), m_sock->reply_port(), len);
    if (wr) {
        wr->write_bytes(len, buff);
        wr->write_finalize();
    }
}

void TftpServerCore::frame_rcvd(LimitedRead& src)
{
    if (DEBUG_VERBOSE > 1) log::Log(log::DEBUG, LBL_TFTP, "frame_rcvd");

    // All valid TFTP packets start with the opcode.
    if (src.get_read_ready() < 2) return;
    u16 opcode = src.read_u16();
    TftpTransfer* xfer = find_session();

    if (opcode == TFTP_OPCODE_RRQ) {
        read_request(xfer, src);
    } else if (opcode == TFTP_OPCODE_WRQ) {
        log::Log(log::WARNING, LBL_TFTP, "Write request refused")
            .write(", client").write(m_sock->reply_ip());
        send_error(TFTP_ERROR_ACCESS);
    } else if (xfer) {
        xfer->packet_rcvd(opcode, src);
    } else if (opcode != TFTP_OPCODE_ERROR) {
        // Never reply to an ERROR packet (RFC 1350 Section 7).
        if (DEBUG_VERBOSE > 0)
            log::Log(log::DEBUG, LBL_TFTP, "Unknown transfer ID")
                .write(m_sock->reply_ip()).write(m_sock->reply_port().value);
        send_error(TFTP_ERROR_TID);
    }
}

void TftpServerCore::read_request(TftpTransfer* xfer, LimitedRead& src)
{
    // Read the filename and transfer mode.
    char filename[NETBOOT_TFTP_MAXNAME], mode[OPTION_MAXLEN];
    unsigned name_len = src.read_str(sizeof(filename), filename);
    src.read_str(sizeof(mode), mode);

    // A name that fills the buffer may have been truncated.
    if (name_len + 1 >= sizeof(filename)) {
        log::Log(log::WARNING, LBL_TFTP, "Filename too long")
            .write(", client").write(m_sock->reply_ip());
        send_error(TFTP_ERROR_NOFILE);
        return;
    }

    if (!equal_nocase(mode, "octet") && !equal_nocase(mode, "netascii")) {
        log::Log(log::WARNING, LBL_TFTP, "Unsupported mode")
            .write(": ").write(mode);
        send_error(TFTP_ERROR_PROTOCOL);
        return;
    }

    // Read each option name and value (RFC 2347).
    TftpOptions opts;
    char name[OPTION_MAXLEN], value[OPTION_MAXLEN];
    while (src.get_read_ready()) {
        src.read_str(sizeof(name), name);
        src.read_str(sizeof(value), value);
        if (equal_nocase(name, "blksize")) {
            // Clamp oversize requests; ignore invalid ones (RFC 2348).
            unsigned long req = strtoul(value, 0, 10);
            if (req >= TFTP_BLKSIZE_MIN) {
                opts.has_blksize = true;
                opts.blksize = u16(req < NETBOOT_TFTP_MAX_BLKSIZE
                    ? req : NETBOOT_TFTP_MAX_BLKSIZE);
            }
        } else if (equal_nocase(name, "tsize")) {
            opts.has_tsize = true;
        }
    }

    // A repeated request from a connected client restarts the transfer.
    if (m_shutdown) {
        log::Log(log::INFO, LBL_TFTP, "Request refused, shutting down")
            .write(": ").write(filename);
        send_error(TFTP_ERROR_UNDEF, "Server shutting down");
        return;
    } else if (xfer) {
        xfer->reset("Transfer restarted");
    } else if (!(xfer = free_session())) {
        log::Log(log::WARNING, LBL_TFTP, "Too many transfers")
            .write(": ").write(filename).write(", client").write(m_sock->reply_ip());
        send_error(TFTP_ERROR_UNDEF, "Server busy");
        return;
    }

    // Attempt to open the requested file.
    unsigned slot = unsigned(xfer - m_xfer);
    Readable* file = read(slot, filename);
    if (!file) {
        send_error(TFTP_ERROR_NOFILE);
        return;
    }

    // Start the transfer.
    opts.tsize = file->get_read_ready();
    xfer->start(m_sock, m_sock->reply_ip(), m_sock->reply_port(),
        file, filename, opts);
}
