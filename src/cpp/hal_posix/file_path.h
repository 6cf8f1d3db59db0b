//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//! \file
//! Lexical path handling for the file-serving root directory.
//!
//! \details
//! Client-supplied filenames are normalized as if they were absolute
//! paths under the serving root, so that "." and ".." components can
//! never escape it.  (e.g., "../../etc/passwd" becomes "etc/passwd".)
//! The normalization is purely lexical; symbolic links inside the root
//! are followed without further checks.

#pragma once

#include <string>
#include <sys/types.h>

namespace netboot {
    namespace util {
        //! Normalize a client-supplied path relative to an implied root.
        //! The result never starts with "/" and never contains "." or
        //! ".." components.  An empty result refers to the root itself.
        std::string clean_path(const char* path);

        //! Join a root directory and a path from `clean_path`.
        std::string join_path(const std::string& root, const std::string& rel);

        //! Directory portion of a path, or "." if there is none.
        std::string parent_dir(const std::string& path);

        //! Create a directory and any missing parents.
        //! Existing directories are left unchanged.
        //! \returns True if the directory exists on return.
        bool make_dirs(const std::string& path, mode_t mode);
    }
}
