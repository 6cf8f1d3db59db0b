//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <cstdio>
#include <netboot/ip_core.h>
#include <netboot/log.h>

using netboot::ip::Addr;

void Addr::log_to(netboot::log::LogBuffer& wr) const {
    // Convention is 4 decimal numbers with "." delimiter, MSB-first.
    for (unsigned a = 0 ; a < 4 ; ++a) {
        if (a) wr.wr_str(".");
        wr.wr_d32((value >> (24 - 8*a)) & 0xFF);
    }
}

void Addr::to_str(char* dst) const {
    snprintf(dst, 16, "%u.%u.%u.%u",
        unsigned((value >> 24) & 0xFF), unsigned((value >> 16) & 0xFF),
        unsigned((value >>  8) & 0xFF), unsigned((value >>  0) & 0xFF));
}

bool Addr::is_linklocal() const {
    return (value & 0xFFFF0000u) == 0xA9FE0000u;
}

bool Addr::is_loopback() const {
    return (value & 0xFF000000u) == 0x7F000000u;
}

bool Addr::is_multicast() const {
    if (value == 0xFFFFFFFFu)
        return true;    // Limited broadcast (255.255.255.255 /32)
    else if (0xE0000000u <= value && value <= 0xEFFFFFFFu)
        return true;    // IP multicast (224.0.0.0 /4)
    else
        return false;   // All other addresses
}

bool Addr::is_valid() const {
    return value != 0;
}

bool Addr::is_routable() const {
    if (!is_valid() || is_loopback() || is_linklocal() || is_multicast())
        return false;
    return value < 0xF0000000u;     // Reserved 240.0.0.0 /4
}
