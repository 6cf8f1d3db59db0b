//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <netboot/udp_core.h>

void netboot::udp::Socket::deliver(
    const netboot::ip::Addr& srcaddr,
    const netboot::ip::Port& srcport,
    netboot::io::LimitedRead& src)
{
    m_reply_ip   = srcaddr;
    m_reply_port = srcport;
    if (m_proto) m_proto->frame_rcvd(src);
    src.read_finalize();
}
