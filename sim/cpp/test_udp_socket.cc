//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Test cases for the POSIX UDP socket, using the loopback interface

#include <catch2/catch.hpp>
#include <hal_posix/udp_socket_posix.h>
#include <hal_test/sim_utils.h>
#include <deque>

using netboot::ip::ADDR_LOOPBACK;
using netboot::ip::ADDR_NONE;
using netboot::test::Datagram;
using netboot::udp::SocketPosix;

// Record each incoming datagram and its sender.
class Recorder final : public netboot::udp::Protocol {
public:
    explicit Recorder(SocketPosix* sock) : m_sock(sock)
        {m_sock->set_protocol(this);}
    ~Recorder() {m_sock->set_protocol(0);}

    std::deque<Datagram> m_rcvd;

protected:
    void frame_rcvd(netboot::io::LimitedRead& src) override {
        Datagram pkt = {m_sock->reply_ip(), m_sock->reply_port(),
            netboot::io::read_str(&src)};
        m_rcvd.push_back(pkt);
    }

    SocketPosix* const m_sock;
};

// Send a datagram through the given socket.
static bool send_str(SocketPosix& sock, const netboot::ip::Port& port, const std::string& data) {
    netboot::io::Writeable* wr = sock.open_write(ADDR_LOOPBACK, port, (unsigned)data.size());
    return wr && netboot::test::write(wr, data);
}

// Poll until the recorder has N datagrams, or give up after a second.
static bool wait_for(const Recorder& rec, unsigned count) {
    for (unsigned n = 0 ; n < 1000 && rec.m_rcvd.size() < count ; ++n) {
        netboot::poll::service();
        netboot::util::sleep_msec(1);
    }
    return rec.m_rcvd.size() >= count;
}

TEST_CASE("udp-socket-posix") {
    NETBOOT_TEST_START;
    SocketPosix a, b;
    Recorder rec_a(&a), rec_b(&b);
    REQUIRE(a.bind(ADDR_LOOPBACK, 0));
    REQUIRE(b.bind(ADDR_LOOPBACK, 0));

    SECTION("bind") {
        CHECK(a.ready());
        CHECK_FALSE(a.failed());
        CHECK(a.local_port().value != 0);
        CHECK(a.local_port() != b.local_port());
    }

    SECTION("send-receive") {
        const std::string DATA = netboot::test::random_string(1000);
        CHECK(send_str(a, b.local_port(), DATA));
        REQUIRE(wait_for(rec_b, 1));
        CHECK(rec_b.m_rcvd[0].dstaddr == ADDR_LOOPBACK);
        CHECK(rec_b.m_rcvd[0].dstport == a.local_port());
        CHECK(rec_b.m_rcvd[0].data == DATA);
        CHECK(b.reply_port() == a.local_port());
        CHECK(rec_a.m_rcvd.empty());
    }

    SECTION("reply") {
        CHECK(send_str(a, b.local_port(), "ping"));
        REQUIRE(wait_for(rec_b, 1));
        CHECK(send_str(b, b.reply_port(), "pong"));
        REQUIRE(wait_for(rec_a, 1));
        CHECK(rec_a.m_rcvd[0].data == "pong");
    }

    SECTION("burst") {
        // Each poll drains every queued datagram.
        for (unsigned n = 0 ; n < 10 ; ++n)
            CHECK(send_str(a, b.local_port(), std::string(n + 1, 'x')));
        REQUIRE(wait_for(rec_b, 10));
        for (unsigned n = 0 ; n < 10 ; ++n)
            CHECK(rec_b.m_rcvd[n].data.size() == n + 1);
    }

    SECTION("oversize") {
        CHECK_FALSE(a.open_write(ADDR_LOOPBACK, b.local_port(),
            netboot::udp::MAX_DATAGRAM + 1));
    }

    SECTION("closed") {
        b.close();
        CHECK_FALSE(b.ready());
        CHECK(b.local_port().value == 0);
        CHECK_FALSE(b.open_write(ADDR_LOOPBACK, a.local_port(), 4));
        // Closing is not an error.
        netboot::poll::service();
        CHECK_FALSE(b.failed());
    }

    SECTION("rebind") {
        netboot::ip::Port old_port = b.local_port();
        b.close();
        REQUIRE(b.bind(ADDR_NONE, old_port));
        CHECK(b.local_port() == old_port);
        CHECK(send_str(a, old_port, "again"));
        REQUIRE(wait_for(rec_b, 1));
        CHECK(rec_b.m_rcvd[0].data == "again");
    }
}
