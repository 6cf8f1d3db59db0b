//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Generator for the embedded iPXE boot script.
//!
//!\details
//! The boot script is embedded in each iPXE image (\see image_patch.h).
//! It tries DHCP on each network interface in turn, then chain-loads
//! the provisioning endpoint over HTTP, passing the machine's identity
//! as query parameters.  After ten failed rounds, the node reboots.

#pragma once

#include <netboot/types.h>

// Buffer size that is sufficient for any generated script.
#ifndef NETBOOT_SCRIPT_MAXLEN
#define NETBOOT_SCRIPT_MAXLEN 4096
#endif

namespace netboot {
    namespace ipxe {
        //! Write the boot script for the designated HTTP endpoint.
        //! The endpoint is a hostname or IPv4 address, without the port.
        //! The script is never truncated: on overflow, the output is
        //! discarded and this function returns false.
        //! \returns The result of dst->write_finalize().
        bool write_boot_script(
            netboot::io::Writeable* dst,
            const char* endpoint, u16 port);
    }
}
