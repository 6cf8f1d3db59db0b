//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <cstring>
#include <netboot/utils.h>

namespace util = netboot::util;

u16 util::extract_be_u16(const u8* src) {
    return (u16(src[0]) << 8) | u16(src[1]);
}

void util::write_be_u16(u8* dst, u16 val) {
    dst[0] = (u8)(val >> 8);
    dst[1] = (u8)(val >> 0);
}

// Lowercase conversion for plain ASCII only, ignoring locale.
static inline char to_lower(char c) {
    return ('A' <= c && c <= 'Z') ? char(c - 'A' + 'a') : c;
}

bool util::equal_nocase(const char* a, const char* b) {
    if (!a || !b) return false;
    while (*a && *b) {
        if (to_lower(*a++) != to_lower(*b++)) return false;
    }
    return (*a == *b);
}

unsigned util::find_bytes(
    const u8* haystack, unsigned len,
    const u8* needle, unsigned nlen)
{
    // Empty or oversize needle never matches.
    if (nlen == 0 || nlen > len) return len;
    const unsigned last = len - nlen;
    for (unsigned a = 0 ; a <= last ; ++a) {
        if (haystack[a] == needle[0] && !memcmp(haystack + a, needle, nlen))
            return a;
    }
    return len;
}
