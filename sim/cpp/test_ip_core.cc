//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Test cases for IPv4 address handling

#include <catch2/catch.hpp>
#include <hal_posix/ip_iface.h>
#include <hal_posix/posix_utils.h>
#include <hal_test/sim_utils.h>
#include <netboot/ip_core.h>

using netboot::ip::Addr;

TEST_CASE("ip-addr") {
    NETBOOT_TEST_START;

    SECTION("format") {
        char buff[16];
        Addr(192, 168, 1, 42).to_str(buff);
        CHECK(std::string(buff) == "192.168.1.42");
        netboot::ip::ADDR_BROADCAST.to_str(buff);
        CHECK(std::string(buff) == "255.255.255.255");
        CHECK(netboot::ip::format(Addr(10, 0, 0, 1)) == "10.0.0.1");
        CHECK(netboot::ip::format(netboot::ip::ADDR_NONE) == "0.0.0.0");
    }

    SECTION("log") {
        netboot::log::Log(netboot::log::INFO, "Addr").write(Addr(1, 2, 3, 4));
        CHECK(log.contains("Addr = 1.2.3.4"));
    }

    SECTION("categories") {
        CHECK(Addr(127, 0, 0, 1).is_loopback());
        CHECK(Addr(127, 9, 9, 9).is_loopback());
        CHECK(Addr(169, 254, 3, 4).is_linklocal());
        CHECK(Addr(224, 0, 0, 251).is_multicast());
        CHECK(netboot::ip::ADDR_BROADCAST.is_multicast());
        CHECK_FALSE(netboot::ip::ADDR_NONE.is_valid());
        CHECK(Addr(10, 1, 2, 3).is_valid());
    }

    SECTION("routable") {
        CHECK(Addr(192, 168, 1, 10).is_routable());
        CHECK(Addr(10, 0, 0, 1).is_routable());
        CHECK(Addr(8, 8, 8, 8).is_routable());
        CHECK(Addr(223, 255, 255, 254).is_routable());
        CHECK_FALSE(netboot::ip::ADDR_NONE.is_routable());
        CHECK_FALSE(netboot::ip::ADDR_LOOPBACK.is_routable());
        CHECK_FALSE(Addr(169, 254, 1, 1).is_routable());
        CHECK_FALSE(Addr(239, 1, 2, 3).is_routable());
        CHECK_FALSE(Addr(240, 0, 0, 1).is_routable());
        CHECK_FALSE(netboot::ip::ADDR_BROADCAST.is_routable());
    }

    SECTION("parse") {
        Addr tmp;
        CHECK(netboot::ip::parse_addr("192.168.1.42", tmp));
        CHECK(tmp == Addr(192, 168, 1, 42));
        CHECK_FALSE(netboot::ip::parse_addr("192.168.1", tmp));
        CHECK_FALSE(netboot::ip::parse_addr("192.168.1.256", tmp));
        CHECK_FALSE(netboot::ip::parse_addr("example.com", tmp));
        CHECK_FALSE(netboot::ip::parse_addr("", tmp));
        CHECK_FALSE(netboot::ip::parse_addr(0, tmp));
    }

    SECTION("interfaces") {
        // Contents depend on the host, but every entry must be routable.
        std::vector<Addr> addrs;
        CHECK(netboot::ip::routable_ips(addrs));
        for (const Addr& addr : addrs) {
            CHECK(addr.is_routable());
            CHECK_FALSE(addr.is_loopback());
        }
    }
}
