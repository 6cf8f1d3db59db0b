//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Basic type aliases and prototypes used throughout Netboot.

#pragma once

#include <cinttypes>

// Allow safe destruction of Netboot objects?
// The server tools never need to disable this, but some embedded builds
// of the protocol core may.  For GCC/G++: "-DNETBOOT_ALLOW_DELETION=0".
#ifndef NETBOOT_ALLOW_DELETION
#define NETBOOT_ALLOW_DELETION  1
#endif

#if NETBOOT_ALLOW_DELETION
#define NETBOOT_OPTIONAL_DTOR       // Full function defined elsewhere
#else
#define NETBOOT_OPTIONAL_DTOR {}    // Null inline placeholder
#endif

// Shortcuts for fixed-size integer types.
typedef uint8_t     u8;
typedef uint16_t    u16;
typedef uint32_t    u32;
typedef uint64_t    u64;
typedef int8_t      s8;
typedef int16_t     s16;
typedef int32_t     s32;
typedef int64_t     s64;

// Prototypes for widely-used interfaces and data-structures.
// (Comment indicates the file containing the full definition.)
namespace netboot {
    namespace dhcp {                // DHCP proxy for PXE clients
        struct Discover;            // netboot/dhcp_proxy.h
        class ProxyServer;          // netboot/dhcp_proxy.h
    }

    namespace io {                  // Input and output streams
        class ArrayRead;            // netboot/io_readable.h
        class ArrayWrite;           // netboot/io_writeable.h
        class LimitedRead;          // netboot/io_readable.h
        class Readable;             // netboot/io_readable.h
        class Writeable;            // netboot/io_writeable.h
    }

    namespace ip {                  // Internet Protocol v4
        struct Addr;                // netboot/ip_core.h
        struct Port;                // netboot/ip_core.h
    }

    namespace ipxe {                // iPXE boot images and scripts
        struct Window;              // netboot/image_patch.h
    }

    namespace log {                 // Logging
        class EventHandler;         // netboot/log.h
        class Log;                  // netboot/log.h
        class LogBuffer;            // netboot/log.h
    }

    namespace poll {                // Queued-task servicing
        class Always;               // netboot/polling.h
        class Clock;                // netboot/polling.h
        class Timekeeper;           // netboot/polling.h
        class Timer;                // netboot/polling.h
    }

    namespace pxe {                 // PXE client classification
        struct ArchList;            // netboot/pxe_firmware.h
    }

    namespace test {                // Unit-test helpers
        class TftpServer;           // sim/cpp/test_udp_tftp.cc
    }

    namespace udp {                 // UDP networking
        class Protocol;             // netboot/udp_core.h
        class Socket;               // netboot/udp_core.h
        class TftpServerCore;       // netboot/udp_tftp.h
        class TftpTransfer;         // netboot/udp_tftp.h
    }

    namespace util {                // Other utilities
        class ListCore;             // netboot/list.h
    }
}
