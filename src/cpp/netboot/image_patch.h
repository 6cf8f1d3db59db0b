//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! In-memory injection of a boot script into an iPXE image.
//!
//!\details
//! Each iPXE image is built with a placeholder script, delimited by two
//! literal markers.  The region from the first byte of the start marker
//! through the last byte of the end marker is the "window".  Patching
//! overwrites the window with the new script, padded with newlines, so
//! the image length and every byte outside the window are unchanged.
//!
//! File access and the compressed legacy image are handled separately,
//! \see hal_posix/file_patch.h.

#pragma once

#include <netboot/types.h>

namespace netboot {
    namespace ipxe {
        //! Literal markers for the placeholder window.
        //!@{
        extern const char* const PLACEHOLDER_START;
        extern const char* const PLACEHOLDER_END;
        //!@}

        //! Error codes for the patching process.
        enum class PatchError : u8 {
            NONE = 0,           //!< Success
            NO_START,           //!< Start marker not found
            NO_END,             //!< End marker not found
            END_BEFORE_START,   //!< End marker precedes start marker
            SCRIPT_TOO_LONG,    //!< Script does not fit in the window
            READ_FAILED,        //!< Unable to read the source image
            WRITE_FAILED,       //!< Unable to write the destination
            COMPRESS_FAILED,    //!< External compressor failed
        };

        //! Human-readable description of each error code.
        const char* patch_error_str(netboot::ipxe::PatchError err);

        //! Location of the placeholder window, as byte offsets [start, end).
        struct Window {
            unsigned start;
            unsigned end;

            inline unsigned len() const {return end - start;}
        };

        //! Locate the placeholder window in an image.
        //! Each marker is matched at its first occurrence.
        netboot::ipxe::PatchError find_window(
            const u8* image, unsigned len,
            netboot::ipxe::Window& out);

        //! Overwrite the placeholder window with the designated script.
        //! The image is modified in place only on success.
        netboot::ipxe::PatchError patch_image(
            u8* image, unsigned len,
            const u8* script, unsigned script_len);
    }
}
