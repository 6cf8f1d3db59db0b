//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//! \file
//! Compression codec for the legacy BIOS boot loader.
//!
//! \details
//! The legacy "undionly.kpxe" loader is stored uncompressed, with a
//! separate side-information file that describes how to compress it.
//! The `Compressor` interface turns that pair into the final image.
//! The default `ExecCompressor` runs the external `zbin` tool from the
//! iPXE build, capturing its standard output as the compressed image.

#pragma once

#include <netboot/types.h>
#include <string>

namespace netboot {
    namespace ipxe {
        //! Abstract interface for the image compressor.
        class Compressor {
        public:
            //! Compress the raw image using the given side-information.
            //! \param raw Path to the patched, uncompressed image.
            //! \param info Path to the side-information file.
            //! \param out Receives the compressed image on success.
            //! \returns True on success.
            virtual bool compress(
                const char* raw, const char* info, std::string& out) = 0;

        protected:
            Compressor() {}
            ~Compressor() {}
        };

        //! Run an external program as "EXE RAW INFO > OUT".
        //! A nonzero exit status is a failure, which is logged along
        //! with anything the program wrote to its standard error.
        class ExecCompressor : public netboot::ipxe::Compressor {
        public:
            explicit ExecCompressor(const char* exe = "/bin/zbin");
            virtual ~ExecCompressor() {}

            bool compress(
                const char* raw, const char* info, std::string& out) override;

            //! Exit status of the most recent run, or -1 if the program
            //! could not be started or did not exit normally.
            inline int exit_code() const {return m_exit_code;}

            //! Standard error from the most recent run.
            inline const std::string& diagnostic() const {return m_stderr;}

        protected:
            const std::string m_exe;
            int m_exit_code;
            std::string m_stderr;
        };
    }
}
