//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//! \file
//! File-level patching of the iPXE boot images.
//!
//! \details
//! The `ImagePatcher` reads each stock iPXE image, injects the boot
//! script (\see netboot/image_patch.h), and writes the result where the
//! TFTP server can find it.  The image set is fixed:
//!  * <ipxe>/amd64/{ipxe,snp}.efi -> <tftp>/{ipxe,snp}.efi
//!  * <ipxe>/arm64/{ipxe,snp}.efi -> <tftp>/{ipxe,snp}-arm64.efi
//!  * <ipxe>/amd64/kpxe/undionly.kpxe.bin is patched in place (as
//!    "undionly.kpxe.bin.patched") then compressed with "undionly.kpxe.zinfo"
//!    into both <tftp>/undionly.kpxe and <tftp>/undionly.kpxe.0.
//!
//! No output file is written for an image that fails to patch.

#pragma once

#include <hal_posix/codec_exec.h>
#include <netboot/image_patch.h>
#include <string>

namespace netboot {
    namespace ipxe {
        //! Patch the iPXE images on disk.
        class ImagePatcher {
        public:
            //! Link this object to the compressor for the legacy image.
            explicit ImagePatcher(netboot::ipxe::Compressor* codec);

            //! Patch a single image from "src" into "dst".
            //! Parent directories of "dst" are created as needed.
            netboot::ipxe::PatchError patch_file(
                const char* src, const char* dst,
                const u8* script, unsigned script_len);

            //! Compress a raw image and write the result to "dst".
            netboot::ipxe::PatchError compress_file(
                const char* raw, const char* info, const char* dst);

            //! Patch the complete image set.
            //! \returns True if every image was written.
            bool patch_all(
                const char* ipxe_dir, const char* tftp_dir,
                const u8* script, unsigned script_len);

        protected:
            netboot::ipxe::Compressor* const m_codec;
        };
    }
}
