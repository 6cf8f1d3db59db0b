//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <cstring>
#include <netboot/image_patch.h>
#include <netboot/utils.h>

namespace ipxe = netboot::ipxe;
using ipxe::PatchError;
using ipxe::Window;
using netboot::util::find_bytes;

const char* const ipxe::PLACEHOLDER_START = "# *PLACEHOLDER START*";
const char* const ipxe::PLACEHOLDER_END   = "# *PLACEHOLDER END*";

const char* ipxe::patch_error_str(PatchError err) {
    switch (err) {
    case PatchError::NONE:              return "OK";
    case PatchError::NO_START:          return "placeholder start not found";
    case PatchError::NO_END:            return "placeholder end not found";
    case PatchError::END_BEFORE_START:  return "placeholder end before start";
    case PatchError::SCRIPT_TOO_LONG:   return "script is larger than placeholder space";
    case PatchError::READ_FAILED:       return "failed to read source image";
    case PatchError::WRITE_FAILED:      return "failed to write destination image";
    case PatchError::COMPRESS_FAILED:   return "failed to compress image";
    default:                            return "unknown error";
    }
}

PatchError ipxe::find_window(const u8* image, unsigned len, Window& out) {
    const unsigned start_len = strlen(PLACEHOLDER_START);
    const unsigned end_len   = strlen(PLACEHOLDER_END);

    unsigned start = find_bytes(image, len, (const u8*)PLACEHOLDER_START, start_len);
    if (start >= len) return PatchError::NO_START;

    unsigned end = find_bytes(image, len, (const u8*)PLACEHOLDER_END, end_len);
    if (end >= len) return PatchError::NO_END;
    if (end < start) return PatchError::END_BEFORE_START;

    // Window includes the entire end marker.
    out.start = start;
    out.end   = end + end_len;
    return PatchError::NONE;
}

PatchError ipxe::patch_image(
    u8* image, unsigned len, const u8* script, unsigned script_len)
{
    Window win;
    PatchError err = find_window(image, len, win);
    if (err != PatchError::NONE) return err;
    if (script_len > win.len()) return PatchError::SCRIPT_TOO_LONG;

    // Copy the script, then pad the remainder with newlines.
    memcpy(image + win.start, script, script_len);
    memset(image + win.start + script_len, '\n', win.len() - script_len);
    return PatchError::NONE;
}
