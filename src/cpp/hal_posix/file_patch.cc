//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <hal_posix/file_io.h>
#include <hal_posix/file_patch.h>
#include <hal_posix/file_path.h>
#include <netboot/log.h>
#include <vector>

namespace log = netboot::log;
using netboot::ipxe::ImagePatcher;
using netboot::ipxe::PatchError;
using netboot::ipxe::Window;
using netboot::util::join_path;

// Permissions for created directories and files.
static constexpr mode_t MODE_DIR    = 0755;
static constexpr mode_t MODE_FILE   = 0644;

// Names of the EFI images, patched for each architecture.
static const char* const EFI_IMAGES[] = {"ipxe", "snp"};

ImagePatcher::ImagePatcher(netboot::ipxe::Compressor* codec)
    : m_codec(codec)
{
    // Nothing else to initialize.
}

PatchError ImagePatcher::patch_file(
    const char* src, const char* dst,
    const u8* script, unsigned script_len)
{
    std::vector<u8> image;
    if (!netboot::io::read_file(src, image)) {
        log::Log(log::ERROR, "Patcher", "failed to read").write(" ").write(src);
        return PatchError::READ_FAILED;
    }

    // Locate the window first, so errors can report its size.
    const unsigned len = (unsigned)image.size();
    u8* data = image.empty() ? 0 : &image[0];
    Window win = {0, 0};
    PatchError err = netboot::ipxe::find_window(data, len, win);
    if (err == PatchError::NONE)
        err = netboot::ipxe::patch_image(data, len, script, script_len);

    if (err == PatchError::SCRIPT_TOO_LONG) {
        log::Log(log::ERROR, "Patcher", "failed to patch").write(" ").write(src)
            .write(": script size").write10(script_len)
            .write(" is larger than placeholder space").write10(win.len());
        return err;
    } else if (err != PatchError::NONE) {
        log::Log(log::ERROR, "Patcher", "failed to patch").write(" ").write(src)
            .write(": ").write(netboot::ipxe::patch_error_str(err));
        return err;
    }

    // Write the patched copy.
    std::string dst_dir = netboot::util::parent_dir(dst);
    if (!netboot::util::make_dirs(dst_dir, MODE_DIR)) {
        log::Log(log::ERROR, "Patcher", "failed to create").write(" ").write(dst_dir.c_str());
        return PatchError::WRITE_FAILED;
    }
    if (!netboot::io::write_file(dst, data, len, MODE_FILE)) {
        log::Log(log::ERROR, "Patcher", "failed to write").write(" ").write(dst);
        return PatchError::WRITE_FAILED;
    }

    log::Log(log::DEBUG, "Patcher", "patched").write(" ").write(dst)
        .write(", window").write10(win.len());
    return PatchError::NONE;
}

PatchError ImagePatcher::compress_file(
    const char* raw, const char* info, const char* dst)
{
    std::string out;
    if (!m_codec || !m_codec->compress(raw, info, out)) {
        log::Log(log::ERROR, "Patcher", "failed to compress").write(" ").write(dst);
        return PatchError::COMPRESS_FAILED;
    }

    std::string dst_dir = netboot::util::parent_dir(dst);
    if (!netboot::util::make_dirs(dst_dir, MODE_DIR)
     || !netboot::io::write_file(dst, out.data(), (unsigned)out.size(), MODE_FILE)) {
        log::Log(log::ERROR, "Patcher", "failed to write").write(" ").write(dst);
        return PatchError::WRITE_FAILED;
    }
    return PatchError::NONE;
}

bool ImagePatcher::patch_all(
    const char* ipxe_dir, const char* tftp_dir,
    const u8* script, unsigned script_len)
{
    const std::string ipxe(ipxe_dir);
    const std::string tftp(tftp_dir);

    for (unsigned a = 0 ; a < 2 ; ++a) {
        const std::string name(EFI_IMAGES[a]);
        std::string src_x86 = join_path(ipxe, "amd64/" + name + ".efi");
        std::string dst_x86 = join_path(tftp, name + ".efi");
        if (patch_file(src_x86.c_str(), dst_x86.c_str(), script, script_len)
            != PatchError::NONE) return false;

        std::string src_arm = join_path(ipxe, "arm64/" + name + ".efi");
        std::string dst_arm = join_path(tftp, name + "-arm64.efi");
        if (patch_file(src_arm.c_str(), dst_arm.c_str(), script, script_len)
            != PatchError::NONE) return false;
    }

    // The legacy loader is patched in raw form, then compressed.
    const std::string kpxe_raw = join_path(ipxe, "amd64/kpxe/undionly.kpxe.bin");
    const std::string kpxe_tmp = kpxe_raw + ".patched";
    const std::string kpxe_inf = join_path(ipxe, "amd64/kpxe/undionly.kpxe.zinfo");
    if (patch_file(kpxe_raw.c_str(), kpxe_tmp.c_str(), script, script_len)
        != PatchError::NONE) return false;

    const std::string kpxe_out = join_path(tftp, "undionly.kpxe");
    if (compress_file(kpxe_tmp.c_str(), kpxe_inf.c_str(), kpxe_out.c_str())
        != PatchError::NONE) return false;
    const std::string kpxe_alt = kpxe_out + ".0";
    if (compress_file(kpxe_tmp.c_str(), kpxe_inf.c_str(), kpxe_alt.c_str())
        != PatchError::NONE) return false;

    log::Log(log::INFO, "Patcher", "successfully patched iPXE binaries");
    return true;
}
