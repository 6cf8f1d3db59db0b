//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <cstring>
#include <netboot/log.h>
#include <netboot/pxe_firmware.h>

namespace pxe = netboot::pxe;
using pxe::ArchList;
using pxe::Classification;
using pxe::ClassifyError;
using pxe::Firmware;

// Architecture names, indexed by code.
static const char* const ARCH_NAMES[] = {
    "Intel x86PC",                  // 0
    "NEC/PC98",                     // 1
    "EFI Itanium",                  // 2
    "DEC Alpha",                    // 3
    "Arc x86",                      // 4
    "Intel Lean Client",            // 5
    "EFI IA32",                     // 6
    "EFI BC",                       // 7
    "EFI Xscale",                   // 8
    "EFI x86-64",                   // 9
    "EFI ARM32",                    // 10
    "EFI ARM64",                    // 11
    "PPC Open Firmware",            // 12
    "PPC ePAPR",                    // 13
    "PPC OPAL",                     // 14
    "EFI x86 boot from HTTP",       // 15
    "EFI x86-64 boot from HTTP",    // 16
    "EFI BC boot from HTTP",        // 17
    "EFI ARM32 boot from HTTP",     // 18
    "EFI ARM64 boot from HTTP",     // 19
};
static constexpr unsigned ARCH_NAME_COUNT
    = sizeof(ARCH_NAMES) / sizeof(ARCH_NAMES[0]);

// Mapping from architecture code to firmware variant.
// Codes that are not listed here are skipped.
struct ArchMap {
    u16 code;
    Firmware firmware;
};

static const ArchMap ARCH_TABLE[] = {
    {pxe::ARCH_INTEL_X86PC,         Firmware::X86PC},
    {pxe::ARCH_EFI_IA32,            Firmware::X86EFI},
    {pxe::ARCH_EFI_BC,              Firmware::X86EFI},
    {pxe::ARCH_EFI_X86_64,          Firmware::X86EFI},
    {pxe::ARCH_EFI_ARM64,           Firmware::ARMEFI},
    {pxe::ARCH_EFI_X86_HTTP,        Firmware::X86HTTP},
    {pxe::ARCH_EFI_X86_64_HTTP,     Firmware::X86HTTP},
    {pxe::ARCH_EFI_ARM64_HTTP,      Firmware::ARMHTTP},
};

// Expected length and leading byte of the client machine identifier.
static constexpr unsigned GUID_LEN = 17;

static Firmware lookup(u16 code) {
    for (const ArchMap& row : ARCH_TABLE) {
        if (row.code == code) return row.firmware;
    }
    return Firmware::UNSUPPORTED;
}

const char* pxe::firmware_name(Firmware fw) {
    switch (fw) {
    case Firmware::X86PC:       return "X86PC";
    case Firmware::X86EFI:      return "X86EFI";
    case Firmware::ARMEFI:      return "ARMEFI";
    case Firmware::X86IPXE:     return "X86Ipxe";
    case Firmware::X86HTTP:     return "X86HTTP";
    case Firmware::ARMHTTP:     return "ARMHTTP";
    default:                    return "Unsupported";
    }
}

const char* pxe::arch_name(u16 code) {
    if (code < ARCH_NAME_COUNT) return ARCH_NAMES[code];
    return "unknown architecture type";
}

bool ArchList::add(u16 val) {
    if (count >= NETBOOT_PXE_MAXARCH) return false;
    code[count++] = val;
    return true;
}

void ArchList::log_to(netboot::log::LogBuffer& wr) const {
    for (unsigned a = 0 ; a < count ; ++a) {
        if (a) wr.wr_str(", ");
        wr.wr_str(arch_name(code[a]));
    }
}

const char* pxe::classify_error_str(ClassifyError err) {
    switch (err) {
    case ClassifyError::NONE:
        return "OK";
    case ClassifyError::UNSUPPORTED_ARCH:
        return "unsupported client arch";
    case ClassifyError::GUID_SIZE:
        return "malformed client GUID (option 97), wrong size";
    case ClassifyError::GUID_LEADING:
        return "malformed client GUID (option 97), leading byte must be zero";
    default:
        return "unknown error";
    }
}

Classification pxe::classify(
    const ArchList& arch, const char* user_class,
    const u8* guid, unsigned guid_len)
{
    // Last recognized code determines the provisional variant.
    Firmware fw = Firmware::UNSUPPORTED;
    for (unsigned a = 0 ; a < arch.count ; ++a) {
        Firmware tmp = lookup(arch.code[a]);
        if (tmp != Firmware::UNSUPPORTED) fw = tmp;
    }
    if (fw == Firmware::UNSUPPORTED)
        return Classification {fw, ClassifyError::UNSUPPORTED_ARCH};

    // Legacy BIOS clients with iPXE in ROM use native drivers,
    // so they cannot chain-load the UNDI loader.
    if (fw == Firmware::X86PC && user_class && !strcmp(user_class, "iPXE"))
        fw = Firmware::X86IPXE;

    // Some PXE ROMs omit the identifier entirely; accept those.
    if (guid_len == GUID_LEN) {
        if (guid[0] != 0)
            return Classification {Firmware::UNSUPPORTED, ClassifyError::GUID_LEADING};
    } else if (guid_len != 0) {
        return Classification {Firmware::UNSUPPORTED, ClassifyError::GUID_SIZE};
    }

    return Classification {fw, ClassifyError::NONE};
}
