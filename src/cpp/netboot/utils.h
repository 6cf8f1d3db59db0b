//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Miscellaneous arithmetic and byte-order helper functions.

#pragma once

#include <netboot/types.h>

namespace netboot {
    namespace util {
        //! Set bits in a mask.
        inline void set_mask_u16(u16& val, u16 mask)        {val |= mask;}

        //! Minimum and maximum of two values.
        //!@{
        inline constexpr unsigned min_unsigned(unsigned a, unsigned b)
            {return (a < b) ? a : b;}
        inline constexpr unsigned max_unsigned(unsigned a, unsigned b)
            {return (a > b) ? a : b;}
        //!@}

        //! Absolute value of a signed integer.
        inline constexpr u32 abs_s32(s32 a)
            {return (u32)((a < 0) ? -a : +a);}

        //! Read or write a big-endian integer in a byte array.
        //!@{
        u16 extract_be_u16(const u8* src);
        void write_be_u16(u8* dst, u16 val);
        //!@}

        //! Case-insensitive comparison of two null-terminated ASCII strings.
        bool equal_nocase(const char* a, const char* b);

        //! Find the first occurrence of "needle" inside "haystack".
        //! \returns Byte offset of the first match, or "len" if not found.
        unsigned find_bytes(
            const u8* haystack, unsigned len,
            const u8* needle, unsigned nlen);
    }
}
