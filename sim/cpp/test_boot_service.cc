//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Test cases for the complete boot service, using the loopback interface

#include <catch2/catch.hpp>
#include <hal_posix/boot_service.h>
#include <hal_test/sim_utils.h>
#include <netboot/utils.h>
#include <arpa/inet.h>
#include <cstdio>
#include <cstring>
#include <deque>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using netboot::BootConfig;
using netboot::BootService;
using netboot::io::ArrayRead;
using netboot::io::ArrayWriteStatic;
using netboot::ip::ADDR_LOOPBACK;
using netboot::test::Datagram;
using netboot::udp::SocketPosix;
namespace udp = netboot::udp;

static const std::string MARK_START = "# *PLACEHOLDER START*";
static const std::string MARK_END   = "# *PLACEHOLDER END*";

// Synthetic image large enough to span several TFTP blocks.
static std::string make_image(const char* tag) {
    return std::string("BIN:") + tag + "\n" + MARK_START
         + std::string(2048, ' ') + MARK_END + "\n"
         + std::string(1000, (char)0xA5);
}

// Client socket that records each incoming datagram.
class Client final : public netboot::udp::Protocol {
public:
    Client() {
        m_sock.set_protocol(this);
        m_sock.bind(ADDR_LOOPBACK, 0);
    }
    ~Client() {m_sock.set_protocol(0);}

    bool send(u16 port, const std::string& data) {
        netboot::io::Writeable* wr = m_sock.open_write(
            ADDR_LOOPBACK, port, (unsigned)data.size());
        return wr && netboot::test::write(wr, data);
    }

    // Poll the service until a datagram arrives.
    bool wait(BootService& svc) {
        for (unsigned n = 0 ; n < 2000 && m_rcvd.empty() ; ++n) {
            svc.service();
            netboot::util::sleep_msec(1);
        }
        return !m_rcvd.empty();
    }

    Datagram pop() {
        Datagram tmp = m_rcvd.front();
        m_rcvd.pop_front();
        return tmp;
    }

    SocketPosix m_sock;
    std::deque<Datagram> m_rcvd;

protected:
    void frame_rcvd(netboot::io::LimitedRead& src) override {
        Datagram pkt = {m_sock.reply_ip(), m_sock.reply_port(),
            netboot::io::read_str(&src)};
        m_rcvd.push_back(pkt);
    }
};

static std::string be16(u16 val) {
    std::string tmp;
    tmp.push_back((char)(val >> 8));
    tmp.push_back((char)(val & 0xFF));
    return tmp;
}

static std::string rrq(const std::string& name) {
    return be16(udp::TFTP_OPCODE_RRQ) + name + std::string(1, '\0')
        + "octet" + std::string(1, '\0');
}

// Fetch a complete file over TFTP, skipping duplicate blocks.
static std::string fetch(BootService& svc, Client& client, const std::string& name) {
    std::string rcvd;
    u16 expect = 1;
    client.send(svc.tftp_port().value, rrq(name));
    while (client.wait(svc)) {
        Datagram pkt = client.pop();
        ArrayRead rd(pkt.data.data(), (unsigned)pkt.data.size());
        if (rd.read_u16() != udp::TFTP_OPCODE_DATA) break;
        u16 block = rd.read_u16();
        if (block == expect) {
            rcvd += pkt.data.substr(4);
            ++expect;
        }
        client.send(pkt.dstport.value, be16(udp::TFTP_OPCODE_ACK) + be16(block));
        if (pkt.data.size() < 4 + udp::TFTP_BLKSIZE_DEFAULT) break;
    }
    // Let the server process the final ACK.
    for (unsigned n = 0 ; n < 1000 && svc.tftp().active_sessions() ; ++n) {
        svc.service();
        netboot::util::sleep_msec(1);
    }
    return rcvd;
}

// PXE discover from a 64-bit EFI client.
static std::string discover() {
    ArrayWriteStatic<512> wr;
    wr.write_u8(1);                     // OP = BOOTREQUEST
    wr.write_u8(1);                     // HTYPE = Ethernet
    wr.write_u8(6);                     // HLEN
    wr.write_u8(0);                     // HOPS
    wr.write_u32(0xCAFE0001);           // XID
    wr.write_u16(0);                    // SECS
    wr.write_u16(0);                    // FLAGS = Unicast
    for (unsigned a = 0 ; a < 4 ; ++a) wr.write_u32(0);
    const u8 chaddr[16] = {0x02, 0x00, 0x00, 0x00, 0x00, 0x01};
    wr.write_bytes(sizeof(chaddr), chaddr);
    for (unsigned a = 0 ; a < 48 ; ++a) wr.write_u32(0);
    wr.write_u32(netboot::dhcp::DHCP_MAGIC);
    wr.write_u8(netboot::dhcp::OPTION_MSG_TYPE);
    wr.write_u8(1);
    wr.write_u8(netboot::dhcp::DHCP_DISCOVER);
    wr.write_u8(netboot::dhcp::OPTION_CLIENT_ARCH);
    wr.write_u8(2);
    wr.write_u16(netboot::pxe::ARCH_EFI_X86_64);
    wr.write_u8(netboot::dhcp::OPTION_END);
    wr.write_finalize();
    return std::string((const char*)wr.buffer(), wr.written_len());
}

// Bind a plain socket to an ephemeral port without address reuse.
static int block_port(u16& port) {
    int fd = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    if (fd < 0 || bind(fd, (const sockaddr*)&addr, sizeof(addr))
        || getsockname(fd, (sockaddr*)&addr, &len)) return -1;
    port = ntohs(addr.sin_port);
    return fd;
}

// Fixture with a complete set of stock images.
struct Images {
    netboot::test::TempDir tmp;
    BootConfig cfg;
    netboot::ipxe::ExecCompressor codec;

    // "cat RAW INFO" stands in for the real compressor.
    Images() : codec("/bin/cat") {
        tmp.write("ipxe/amd64/ipxe.efi", make_image("x86-ipxe"));
        tmp.write("ipxe/amd64/snp.efi", make_image("x86-snp"));
        tmp.write("ipxe/arm64/ipxe.efi", make_image("arm-ipxe"));
        tmp.write("ipxe/arm64/snp.efi", make_image("arm-snp"));
        tmp.write("ipxe/amd64/kpxe/undionly.kpxe.bin", make_image("kpxe"));
        tmp.write("ipxe/amd64/kpxe/undionly.kpxe.zinfo", "ZINF");
        cfg.server      = ADDR_LOOPBACK;
        cfg.dhcp_port   = 0;
        cfg.tftp_port   = 0;
        cfg.ipxe_dir    = tmp.file("ipxe");
        cfg.tftp_root   = tmp.file("tftp");
        cfg.grace_msec  = 50;
    }
};

TEST_CASE("boot-service-startup") {
    NETBOOT_TEST_START;
    log.suppress("patch iPXE binaries");
    log.suppress("start component");
    log.suppress("component stopped");
    log.suppress("successfully patched");
    Images img;

    SECTION("defaults") {
        BootConfig def;
        CHECK(def.api_port == 50042);
        CHECK(def.dhcp_port == 67);
        CHECK(def.tftp_port == 69);
        CHECK(def.grace_msec == NETBOOT_SHUTDOWN_GRACE_MSEC);
    }

    SECTION("normal") {
        BootService svc(img.cfg, &img.codec);
        REQUIRE(svc.start());
        CHECK(svc.dhcp_port().value != 0);
        CHECK(svc.tftp_port().value != 0);
        CHECK(svc.tftp().accepting());
        // Every image is patched before the listeners start.
        const char* FILES[] = {"ipxe.efi", "snp.efi", "ipxe-arm64.efi",
            "snp-arm64.efi", "undionly.kpxe", "undionly.kpxe.0"};
        for (const char* name : FILES) {
            INFO(name);
            std::string path = std::string("tftp/") + name;
            CHECK(img.tmp.read(path.c_str()).find("chain --replace http://127.0.0.1:50042/ipxe?") != std::string::npos);
        }
        CHECK(svc.service());
        svc.shutdown();
        CHECK(svc.finished());
        CHECK(svc.tftp_port().value == 0);
    }

    SECTION("missing-image") {
        log.suppress("failed to");
        REQUIRE(remove(img.tmp.file("ipxe/arm64/ipxe.efi").c_str()) == 0);
        BootService svc(img.cfg, &img.codec);
        CHECK_FALSE(svc.start());
        CHECK(log.contains("failed to patch iPXE binaries"));
        // Nothing is served.
        CHECK(svc.dhcp_port().value == 0);
        CHECK(svc.tftp_port().value == 0);
    }

    SECTION("missing-compressor") {
        log.suppress("failed");
        img.cfg.zbin = img.tmp.file("no-such-zbin");
        netboot::ipxe::ExecCompressor bad(img.cfg.zbin.c_str());
        BootService svc(img.cfg, &bad);
        CHECK_FALSE(svc.start());
        CHECK_FALSE(img.tmp.exists("tftp/undionly.kpxe"));
    }

    SECTION("port-conflict") {
        log.suppress("bind");
        log.suppress("failed to run component");
        u16 port = 0;
        int fd = block_port(port);
        REQUIRE(fd >= 0);
        img.cfg.tftp_port = port;
        BootService svc(img.cfg, &img.codec);
        CHECK_FALSE(svc.start());
        CHECK(log.contains("failed to run component: TFTP server"));
        // The DHCP socket is released as well.
        CHECK(svc.dhcp_port().value == 0);
        close(fd);
    }

    SECTION("run-start-failure") {
        log.suppress("failed to");
        img.cfg.ipxe_dir = img.tmp.file("nowhere");
        BootService svc(img.cfg, &img.codec);
        CHECK_FALSE(svc.run());
    }

    SECTION("run-stop") {
        // A stop requested before run() still yields a clean exit.
        BootService svc(img.cfg, &img.codec);
        svc.stop();
        CHECK(svc.run());
        CHECK(svc.finished());
    }
}

TEST_CASE("boot-service-serve") {
    NETBOOT_TEST_START;
    log.suppress("patch iPXE binaries");
    log.suppress("start component");
    log.suppress("component stopped");
    log.suppress("successfully patched");
    log.suppress("file sent");
    log.suppress("PXE");
    log.suppress("No longer accepting");
    Images img;
    BootService svc(img.cfg, &img.codec);
    REQUIRE(svc.start());
    Client client;
    REQUIRE(client.m_sock.ready());

    SECTION("tftp-fetch") {
        std::string file = fetch(svc, client, "snp.efi");
        CHECK(file.size() > 1024);
        CHECK(file == img.tmp.read("tftp/snp.efi"));
        CHECK(svc.tftp().active_sessions() == 0);
    }

    SECTION("tftp-escape") {
        // Path traversal stays inside the TFTP root.
        log.suppress("failed to open file");
        CHECK(fetch(svc, client, "../ipxe/amd64/snp.efi").empty());
        CHECK(fetch(svc, client, "/../ipxe-arm64.efi")
            == img.tmp.read("tftp/ipxe-arm64.efi"));
    }

    SECTION("dhcp-offer") {
        CHECK(client.send(svc.dhcp_port().value, discover()));
        REQUIRE(client.wait(svc));
        Datagram pkt = client.pop();
        CHECK(pkt.dstport == svc.dhcp_port());
        ArrayRead rd(pkt.data.data(), (unsigned)pkt.data.size());
        CHECK(rd.read_u8() == 2);       // BOOTREPLY
        CHECK(pkt.data.find("snp.efi") != std::string::npos);
        CHECK(svc.dhcp().offer_count() == 1);
    }

    SECTION("graceful-stop") {
        log.suppress("Server shutting down");
        // Start a transfer, then stall it.
        CHECK(client.send(svc.tftp_port().value, rrq("ipxe.efi")));
        REQUIRE(client.wait(svc));
        client.pop();
        svc.shutdown();
        CHECK_FALSE(svc.finished());
        CHECK_FALSE(svc.tftp().accepting());
        CHECK(svc.dhcp_port().value == 0);
        // Stalled transfers are closed at the end of the grace period.
        for (unsigned n = 0 ; n < 1000 && !svc.finished() ; ++n) {
            svc.service();
            netboot::util::sleep_msec(1);
        }
        CHECK(svc.finished());
        CHECK(svc.tftp().active_sessions() == 0);
        bool got_error = false;
        for (unsigned n = 0 ; n < 100 && !got_error ; ++n) {
            netboot::poll::service();
            while (!client.m_rcvd.empty())
                if (client.pop().data.find("Server shutting down") != std::string::npos)
                    got_error = true;
            netboot::util::sleep_msec(1);
        }
        CHECK(got_error);
    }
}
