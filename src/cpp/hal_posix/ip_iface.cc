//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <hal_posix/ip_iface.h>
#include <netboot/log.h>
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace log = netboot::log;
using netboot::ip::Addr;

bool netboot::ip::routable_ips(std::vector<Addr>& out)
{
    out.clear();
    struct ifaddrs* list = 0;
    if (getifaddrs(&list)) {
        log::Log(log::ERROR, "Interfaces", "getifaddrs")
            .write(": ").write(strerror(errno));
        return false;
    }

    for (struct ifaddrs* ifa = list ; ifa ; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
        const sockaddr_in* sin = (const sockaddr_in*)ifa->ifa_addr;
        Addr addr(ntohl(sin->sin_addr.s_addr));
        // Skip duplicates from aliased interfaces.
        if (addr.is_routable() && std::find(out.begin(), out.end(), addr) == out.end())
            out.push_back(addr);
    }

    freeifaddrs(list);
    return true;
}

bool netboot::ip::parse_addr(const char* str, Addr& out)
{
    struct in_addr tmp;
    if (!str || inet_pton(AF_INET, str, &tmp) != 1) return false;
    out = Addr(ntohl(tmp.s_addr));
    return true;
}
