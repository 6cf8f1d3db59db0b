//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <cstdio>
#include <netboot/boot_script.h>
#include <netboot/io_writeable.h>

using netboot::io::Writeable;

// Script template is split at the endpoint and port, which are the
// only substituted parameters.  Each empty or tab-only line marks
// where a template comment used to be; clients see the same bytes.
static const char* const SCRIPT_HEAD =
    "#!ipxe\n"
    "prompt --key 0x02 --timeout 2000 Press Ctrl-B for the iPXE command line... && shell ||\n"
    "\n"
    "\n"
    "ifstat\n"
    "\n"
    "\n"
    "set attempts:int32 10\n"
    "set x:int32 0\n"
    "\n"
    ":retry_loop\n"
    "\n"
    "\tset idx:int32 0\n"
    "\n"
    "\t:loop\n"
    "\t\t\n"
    "\t\tisset ${net${idx}/mac} || goto exhausted\n"
    "\n"
    "\t\tifclose\n"
    "\t\tiflinkwait --timeout 5000 net${idx} || goto next_iface\n"
    "\t\tdhcp net${idx} || goto next_iface\n"
    "\t\tgoto boot\n"
    "\n"
    "\t:next_iface\n"
    "\t\tinc idx && goto loop\n"
    "\n"
    "\t:boot\n"
    "\t\t\n"
    "\t\troute\n"
    "\n"
    "\t\tchain --replace http://";

static const char* const SCRIPT_TAIL =
    "/ipxe?uuid=${uuid}&mac=${net${idx}/mac:hexhyp}&domain=${domain}&hostname=${hostname}&serial=${serial}&arch=${buildarch} || goto next_iface\n"
    "\n"
    ":exhausted\n"
    "\techo\n"
    "\techo Failed to iPXE boot successfully via all interfaces\n"
    "\n"
    "\tiseq ${x} ${attempts} && goto fail ||\n"
    "\n"
    "\techo Retrying...\n"
    "\techo\n"
    "\n"
    "\tinc x\n"
    "\tgoto retry_loop\n"
    "\n"
    ":fail\n"
    "\techo\n"
    "\techo Failed to get a valid response after ${attempts} attempts\n"
    "\techo\n"
    "\n"
    "\techo Rebooting in 5 seconds...\n"
    "\tsleep 5\n"
    "\treboot\n";

bool netboot::ipxe::write_boot_script(
    Writeable* dst, const char* endpoint, u16 port)
{
    char port_str[8];
    snprintf(port_str, sizeof(port_str), "%u", unsigned(port));

    // Each write is all-or-nothing; any overflow fails write_finalize().
    dst->write_str(SCRIPT_HEAD);
    dst->write_str(endpoint);
    dst->write_str(":");
    dst->write_str(port_str);
    dst->write_str(SCRIPT_TAIL);
    return dst->write_finalize();
}
