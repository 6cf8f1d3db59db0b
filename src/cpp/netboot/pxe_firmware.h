//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Classification of PXE client firmware from DHCP request attributes.
//!
//!\details
//! A PXE client announces its processor architecture and boot
//! environment through DHCP option 93 (client system architecture,
//! RFC 4578), option 77 (user class, RFC 3004) and option 97 (client
//! machine identifier).  The `classify` function reduces these to a
//! single `Firmware` variant, which selects the boot loader to offer.
//!
//! Architecture codes are mapped through a fixed table.  If the client
//! lists several recognized codes, the last one in the list wins.

#pragma once

#include <netboot/types.h>

// Maximum number of architecture codes retained from option 93.
// (A single option carries at most 127 two-byte codes.)
#ifndef NETBOOT_PXE_MAXARCH
#define NETBOOT_PXE_MAXARCH 127
#endif

namespace netboot {
    namespace pxe {
        //! Boot environment of the requesting client.
        enum class Firmware : u8 {
            UNSUPPORTED = 0,    //!< Not recognized, no reply
            X86PC,              //!< Classic x86 BIOS with PXE/UNDI
            X86EFI,             //!< UEFI on x86 or x86-64
            ARMEFI,             //!< UEFI on ARM64
            X86IPXE,            //!< Classic x86 BIOS running iPXE in ROM
            X86HTTP,            //!< UEFI HTTP boot on x86
            ARMHTTP,            //!< UEFI HTTP boot on ARM64
        };

        //! Human-readable name for each Firmware variant.
        const char* firmware_name(netboot::pxe::Firmware fw);

        //! Client system architecture codes (IANA registry, RFC 4578).
        //!@{
        constexpr u16 ARCH_INTEL_X86PC      = 0;
        constexpr u16 ARCH_NEC_PC98         = 1;
        constexpr u16 ARCH_EFI_ITANIUM      = 2;
        constexpr u16 ARCH_DEC_ALPHA        = 3;
        constexpr u16 ARCH_ARC_X86          = 4;
        constexpr u16 ARCH_INTEL_LEAN       = 5;
        constexpr u16 ARCH_EFI_IA32         = 6;
        constexpr u16 ARCH_EFI_BC           = 7;
        constexpr u16 ARCH_EFI_XSCALE       = 8;
        constexpr u16 ARCH_EFI_X86_64       = 9;
        constexpr u16 ARCH_EFI_ARM32        = 10;
        constexpr u16 ARCH_EFI_ARM64        = 11;
        constexpr u16 ARCH_PPC_OPEN_FW      = 12;
        constexpr u16 ARCH_PPC_EPAPR        = 13;
        constexpr u16 ARCH_PPC_OPAL         = 14;
        constexpr u16 ARCH_EFI_X86_HTTP     = 15;
        constexpr u16 ARCH_EFI_X86_64_HTTP  = 16;
        constexpr u16 ARCH_EFI_BC_HTTP      = 17;
        constexpr u16 ARCH_EFI_ARM32_HTTP   = 18;
        constexpr u16 ARCH_EFI_ARM64_HTTP   = 19;
        //!@}

        //! Human-readable name for an architecture code.
        const char* arch_name(u16 code);

        //! Ordered list of architecture codes from option 93.
        struct ArchList {
            u16 code[NETBOOT_PXE_MAXARCH];
            unsigned count;

            constexpr ArchList() : code{}, count(0) {}

            //! Append a code, if there is room.
            bool add(u16 val);

            //! Log formatting, e.g., "EFI x86-64, EFI BC".
            void log_to(netboot::log::LogBuffer& wr) const;
        };

        //! Reasons a request cannot be classified.
        enum class ClassifyError : u8 {
            NONE = 0,           //!< Success
            UNSUPPORTED_ARCH,   //!< No recognized architecture code
            GUID_SIZE,          //!< Option 97 is neither 0 nor 17 bytes
            GUID_LEADING,       //!< Option 97 leading byte is nonzero
        };

        //! Human-readable description of each error code.
        const char* classify_error_str(netboot::pxe::ClassifyError err);

        //! Result of a classification attempt.
        struct Classification {
            netboot::pxe::Firmware firmware;
            netboot::pxe::ClassifyError error;

            inline bool ok() const
                {return error == netboot::pxe::ClassifyError::NONE;}
        };

        //! Classify the requesting client.
        //!\param arch        Architecture codes from option 93, in order.
        //!\param user_class  First user-class string from option 77, or null.
        //!\param guid        Contents of option 97, or null if absent.
        //!\param guid_len    Length of option 97, or zero if absent.
        //! The architecture check is evaluated before the GUID check.
        netboot::pxe::Classification classify(
            const netboot::pxe::ArchList& arch,
            const char* user_class,
            const u8* guid, unsigned guid_len);
    }
}
