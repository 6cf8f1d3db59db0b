//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <hal_posix/file_path.h>
#include <hal_posix/file_tftp.h>
#include <netboot/log.h>

namespace log = netboot::log;
using netboot::udp::TftpServerPosix;

TftpServerPosix::TftpServerPosix(
    netboot::udp::Socket* sock,
    const char* root_folder)
    : netboot::udp::TftpServerCore(sock)
    , m_root(root_folder)
{
    // Each FileReader closes itself when its transfer ends.
}

TftpServerPosix::~TftpServerPosix()
{
    for (unsigned a = 0 ; a < NETBOOT_TFTP_SESSIONS ; ++a)
        m_src[a].close();
}

std::string TftpServerPosix::resolve(const char* filename) const
{
    return netboot::util::join_path(m_root, netboot::util::clean_path(filename));
}

netboot::io::Readable* TftpServerPosix::read(unsigned slot, const char* filename)
{
    if (slot >= NETBOOT_TFTP_SESSIONS) return 0;

    std::string path = resolve(filename);
    if (m_src[slot].open(path.c_str())) {
        log::Log(log::DEBUG, "TFTP server", "Reading").write(" ").write(path.c_str())
            .write(", length").write10(m_src[slot].get_read_ready());
        return &m_src[slot];
    } else {
        log::Log(log::ERROR, "TFTP server", "failed to open file")
            .write(": ").write(path.c_str());
        return 0;
    }
}
