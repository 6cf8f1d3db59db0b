//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <cstring>
#include <netboot/io_writeable.h>

using netboot::io::ArrayWrite;
using netboot::io::Writeable;

void Writeable::write_be(u32 data, unsigned nbytes) {
    if (get_write_space() < nbytes) {
        write_overflow();
        return;
    }
    while (nbytes--) write_next(u8(data >> (8*nbytes)));
}

void Writeable::write_u8(u8 data)      {write_be(data, 1);}
void Writeable::write_u16(u16 data)    {write_be(data, 2);}
void Writeable::write_u32(u32 data)    {write_be(data, 4);}

void Writeable::write_bytes(unsigned nbytes, const void* src) {
    if (get_write_space() < nbytes) {
        write_overflow();
        return;
    }
    const u8* in = static_cast<const u8*>(src);
    for (unsigned a = 0 ; a < nbytes ; ++a) write_next(in[a]);
}

void Writeable::write_str(const char* str) {
    write_bytes(unsigned(strlen(str)), str);
}

bool Writeable::write_finalize()   {return true;}
void Writeable::write_abort()      {}
void Writeable::write_overflow()   {}

unsigned ArrayWrite::get_write_space() const {
    return m_len - m_wridx;
}

// ArrayWrite state: "m_wridx" is the length of the frame in progress and
// "m_wrlen" is the length of the last finalized frame.  Starting a new
// frame clears m_wrlen; an overflow poisons the frame until finalized.

void ArrayWrite::write_abort() {
    m_ovr   = false;
    m_wridx = 0;
    m_wrlen = 0;
}

void ArrayWrite::write_bytes(unsigned nbytes, const void* src) {
    if (nbytes > get_write_space()) {
        write_overflow();
        return;
    }
    memcpy(m_dst + m_wridx, src, nbytes);
    m_wridx += nbytes;
    m_wrlen = 0;
}

bool ArrayWrite::write_finalize() {
    bool ok = !m_ovr;
    m_wrlen = ok ? m_wridx : 0;
    m_wridx = 0;
    m_ovr   = false;
    return ok;
}

void ArrayWrite::write_next(u8 data) {
    m_dst[m_wridx++] = data;
    m_wrlen = 0;
}

void ArrayWrite::write_overflow() {
    m_ovr = true;
}
