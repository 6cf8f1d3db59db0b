//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <hal_posix/udp_socket_posix.h>
#include <netboot/io_readable.h>
#include <netboot/log.h>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#define CLOSE_SOCKET(x) {::close(x); x = -1;}

namespace log = netboot::log;
using netboot::io::ArrayRead;
using netboot::io::LimitedRead;
using netboot::io::Writeable;
using netboot::ip::Addr;
using netboot::ip::Port;
using netboot::udp::SocketPosix;

// Is a given error code a "real" error?
// (i.e., Ignore special return codes for non-blocking sockets.)
static bool is_error(ssize_t result) {
    if (result >= 0) return false;
    return errno != EAGAIN
        && errno != EWOULDBLOCK
        && errno != EINTR;
}

// Shortcut for printing a network error message.
static void log_socket_error(const char* label) {
    int err_code = errno;
    const char* err_msg = strerror(err_code);
    log::Log(log::ERROR, "UdpSocket", label)
        .write10((u32)err_code).write(", ").write(err_msg);
}

// Convert to and from the BSD address structure.
static sockaddr_in make_sockaddr(const Addr& addr, const Port& port) {
    sockaddr_in tmp;
    memset(&tmp, 0, sizeof(tmp));
    tmp.sin_family      = AF_INET;
    tmp.sin_addr.s_addr = htonl(addr.value);
    tmp.sin_port        = htons(port.value);
    return tmp;
}

SocketPosix::SocketPosix()
    : netboot::io::ArrayWrite(m_txbuff, sizeof(m_txbuff))
    , m_sock(-1)
    , m_failed(false)
    , m_port(0)
    , m_dstaddr(0)
    , m_dstport(0)
{
    // Nothing else to initialize.
}

SocketPosix::~SocketPosix() {
    close();
}

bool SocketPosix::bind(const Addr& addr, const Port& port) {
    // Sanity checks before we start...
    close();
    m_failed = false;

    // Open the socket and mark it as non-blocking.
    m_sock = socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_UDP);
    if (m_sock < 0) {
        log_socket_error("socket");
        return false;
    }

    // Address reuse allows server restarts.  Broadcast is required
    // for replies to clients that have no address yet.
    const int enable = 1;
    if (setsockopt(m_sock, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable))
     || setsockopt(m_sock, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable))) {
        log_socket_error("setsockopt");
        CLOSE_SOCKET(m_sock);
        return false;
    }

    // Attempt to bind to the requested address and port.
    sockaddr_in request = make_sockaddr(addr, port);
    if (::bind(m_sock, (const sockaddr*)&request, sizeof(request))) {
        log_socket_error("bind");
        CLOSE_SOCKET(m_sock);
        return false;
    }

    // Read back the assigned port number.
    sockaddr_in actual;
    socklen_t actual_len = sizeof(actual);
    if (getsockname(m_sock, (sockaddr*)&actual, &actual_len)) {
        log_socket_error("getsockname");
        CLOSE_SOCKET(m_sock);
        return false;
    }
    m_port = Port(ntohs(actual.sin_port));

    log::Log(log::DEBUG, "UdpSocket", "Bound to")
        .write(addr).write(", port").write10(m_port.value);
    return true;
}

void SocketPosix::close() {
    if (m_sock >= 0) CLOSE_SOCKET(m_sock);
    m_port = Port(0);
    ArrayWrite::write_abort();
}

Writeable* SocketPosix::open_write(
    const Addr& dstaddr, const Port& dstport, unsigned len)
{
    if (m_sock < 0 || len > sizeof(m_txbuff)) return 0;
    ArrayWrite::write_abort();
    m_dstaddr = dstaddr;
    m_dstport = dstport;
    return this;
}

Port SocketPosix::local_port() const {
    return m_port;
}

bool SocketPosix::write_finalize() {
    // Finalize the staging buffer, then send its contents.
    if (!ArrayWrite::write_finalize()) return false;
    if (m_sock < 0) return false;
    sockaddr_in dst = make_sockaddr(m_dstaddr, m_dstport);
    ssize_t sent = sendto(m_sock, buffer(), written_len(), 0,
        (const sockaddr*)&dst, sizeof(dst));
    if (sent < 0) {
        log_socket_error("sendto");
        return false;
    }
    return (unsigned)sent == written_len();
}

void SocketPosix::write_abort() {
    ArrayWrite::write_abort();
}

void SocketPosix::poll_always() {
    // Drain all queued datagrams without blocking.
    while (m_sock >= 0) {
        sockaddr_in src;
        socklen_t src_len = sizeof(src);
        ssize_t rcvd = recvfrom(m_sock, m_rxbuff, sizeof(m_rxbuff),
            MSG_TRUNC, (sockaddr*)&src, &src_len);
        if (is_error(rcvd)) {
            log_socket_error("recv");
            m_failed = true;
            close();
            break;
        } else if (rcvd < 0) {
            break;  // Queue empty
        } else if ((size_t)rcvd > sizeof(m_rxbuff)) {
            log::Log(log::WARNING, "UdpSocket", "Dropped oversize datagram")
                .write10((u32)rcvd);
            continue;
        }

        // Deliver the datagram to the attached protocol.
        ArrayRead array(m_rxbuff, (unsigned)rcvd);
        LimitedRead limit(&array, (unsigned)rcvd);
        deliver(Addr(ntohl(src.sin_addr.s_addr)),
            Port(ntohs(src.sin_port)), limit);
    }
}
