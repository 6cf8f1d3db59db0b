//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <cstring>
#include <netboot/io_readable.h>
#include <netboot/utils.h>

using netboot::io::ArrayRead;
using netboot::io::LimitedRead;
using netboot::io::Readable;
using netboot::util::min_unsigned;

bool Readable::read_check(unsigned nbytes) {
    if (get_read_ready() >= nbytes) return true;
    read_underflow();
    return false;
}

u32 Readable::read_be(unsigned nbytes) {
    if (!read_check(nbytes)) return 0;
    u32 val = 0;
    while (nbytes--) val = (val << 8) | read_next();
    return val;
}

u8  Readable::read_u8()     {return u8(read_be(1));}
u16 Readable::read_u16()    {return u16(read_be(2));}
u32 Readable::read_u32()    {return read_be(4);}

unsigned Readable::read_str(unsigned dst_size, char* dst) {
    // Input is consumed through the terminator even if dst is full.
    unsigned len = 0;
    while (get_read_ready()) {
        char next = char(read_next());
        if (!next) break;
        if (len + 1 < dst_size) dst[len++] = next;
    }
    dst[len] = 0;
    return len;
}

bool Readable::read_bytes(unsigned nbytes, void* dst) {
    if (!read_check(nbytes)) return false;
    u8* out = static_cast<u8*>(dst);
    for (unsigned a = 0 ; a < nbytes ; ++a) out[a] = read_next();
    return true;
}

bool Readable::read_consume(unsigned nbytes) {
    if (!read_check(nbytes)) return false;
    for (unsigned a = 0 ; a < nbytes ; ++a) read_next();
    return true;
}

void Readable::read_finalize()    {}
void Readable::read_underflow()   {}

unsigned ArrayRead::get_read_ready() const {
    return m_len - m_rdidx;
}

bool ArrayRead::read_bytes(unsigned nbytes, void* dst) {
    if (nbytes > get_read_ready()) return false;
    memcpy(dst, m_src + m_rdidx, nbytes);
    m_rdidx += nbytes;
    return true;
}

void ArrayRead::read_finalize() {
    m_rdidx = m_len;
}

u8 ArrayRead::read_next() {
    return m_src[m_rdidx++];
}

LimitedRead::LimitedRead(Readable* src)
    : m_src(src)
    , m_rem(src->get_read_ready())
{
    // Nothing else to initialize.
}

unsigned LimitedRead::get_read_ready() const {
    return min_unsigned(m_rem, m_src->get_read_ready());
}

bool LimitedRead::read_bytes(unsigned nbytes, void* dst) {
    // Overreading the limit forfeits whatever remains of it.
    bool ok = (nbytes <= m_rem);
    m_rem = ok ? (m_rem - nbytes) : 0;
    return ok && m_src->read_bytes(nbytes, dst);
}

bool LimitedRead::read_consume(unsigned nbytes) {
    bool ok = (nbytes <= m_rem);
    m_rem = ok ? (m_rem - nbytes) : 0;
    return ok && m_src->read_consume(nbytes);
}

void LimitedRead::read_finalize() {
    unsigned skip = get_read_ready();
    m_rem = 0;
    m_src->read_consume(skip);
}

u8 LimitedRead::read_next() {
    --m_rem;
    return m_src->read_next();
}
