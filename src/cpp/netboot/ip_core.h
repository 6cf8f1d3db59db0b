//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Basic type definitions for IPv4 addresses and UDP ports.

#pragma once

#include <netboot/io_core.h>

namespace netboot {
    namespace ip {
        //! IPv4 address is a 32-bit unsigned integer, MSB-first.
        struct Addr {
            //! Raw access to the underlying representation.
            u32 value;

            //! Constructors.
            //!@{
            constexpr Addr()
                : value(0) {}
            constexpr Addr(u32 ip)  // NOLINT
                : value(ip) {}
            constexpr Addr(u8 a, u8 b, u8 c, u8 d)
                : value(16777216ul * a + 65536ul * b + 256ul * c + d) {}
            //!@}

            //! Commonly used operators.
            //!@{
            constexpr bool operator==(const netboot::ip::Addr& other) const
                {return value == other.value;}
            constexpr bool operator!=(const netboot::ip::Addr& other) const
                {return value != other.value;}
            //!@}

            //! Log formatting, e.g., "192.168.1.42".
            void log_to(netboot::log::LogBuffer& wr) const;

            //! Write the dotted-decimal form to a character buffer.
            //! Buffer must hold at least 16 bytes.
            void to_str(char* dst) const;

            //! Tests for various reserved address ranges.
            //!@{
            bool is_linklocal() const;  //!< Link-local (169.254.*.*)
            bool is_loopback() const;   //!< Local loopback (127.*.*.*)
            bool is_multicast() const;  //!< IP multicast (224.*.*.*)
            bool is_valid() const;      //!< Any nonzero address
            //!@}

            //! Is this address suitable to advertise to boot clients?
            //! Excludes unspecified, loopback, link-local, multicast,
            //! and the reserved block 240.0.0.0/4.
            bool is_routable() const;
        };

        //! UDP ports are 16-bit unsigned integers.
        struct Port {
            //! Raw access to the underlying representation.
            u16 value;

            //! Constructor.
            constexpr Port(u16 port) : value(port) {}   // NOLINT

            //! Commonly used operators.
            //!@{
            constexpr bool operator==(const netboot::ip::Port& other) const
                {return value == other.value;}
            constexpr bool operator!=(const netboot::ip::Port& other) const
                {return value != other.value;}
            //!@}
        };

        //! Commonly used IP-addresses and other constants.
        //!@{
        constexpr netboot::ip::Addr ADDR_NONE   = 0;
        constexpr netboot::ip::Port PORT_NONE   = 0;
        constexpr netboot::ip::Addr ADDR_BROADCAST
            = netboot::ip::Addr(255, 255, 255, 255);
        constexpr netboot::ip::Addr ADDR_LOOPBACK
            = netboot::ip::Addr(127, 0, 0, 1);
        //!@}
    }
}
