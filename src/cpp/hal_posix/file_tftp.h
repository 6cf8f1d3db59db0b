//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//
// Read-only TFTP server for files under a designated root directory.
//

#pragma once

#include <hal_posix/file_io.h>
#include <netboot/udp_tftp.h>
#include <string>

namespace netboot {
    namespace udp {
        // A server handles read requests from remote clients.
        // Requested names are normalized with util::clean_path, so file
        // operations never leave the designated root directory.
        class TftpServerPosix : public netboot::udp::TftpServerCore {
        public:
            TftpServerPosix(
                netboot::udp::Socket* sock,
                const char* root_folder);
            virtual ~TftpServerPosix();

            // Full path for a client-supplied filename.
            std::string resolve(const char* filename) const;

        protected:
            // Required override from TftpServerCore.
            netboot::io::Readable* read(
                unsigned slot, const char* filename) override;

            // Interface objects, one file per session.
            const std::string m_root;
            netboot::io::FileReader m_src[NETBOOT_TFTP_SESSIONS];
        };
    }
}
