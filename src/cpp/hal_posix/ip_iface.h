//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Query the IPv4 addresses of local network interfaces.

#pragma once

#include <netboot/ip_core.h>
#include <vector>

namespace netboot {
    namespace ip {
        //! List the routable IPv4 address of each local interface.
        //! \see netboot::ip::Addr::is_routable
        //! \returns False if the interface list could not be read.
        bool routable_ips(std::vector<netboot::ip::Addr>& out);

        //! Parse a dotted-decimal IPv4 address (e.g., "192.168.1.42").
        //! \returns False if the string is not a valid address.
        bool parse_addr(const char* str, netboot::ip::Addr& out);
    }
}
