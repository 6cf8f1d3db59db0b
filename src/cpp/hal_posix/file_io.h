//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// File I/O wrappers

#pragma once

#include <cstdio>
#include <string>
#include <vector>
#include <sys/types.h>
#include <netboot/io_core.h>

namespace netboot {
    namespace io {
        //! Write bytes to a newly created file.
        class FileWriter : public netboot::io::Writeable {
        public:
            //! Create the FileWriter object.
            //! \param close_on_finalize If true, calling `write_finalize`
            //!     closes the current file. If false, keep writing.
            explicit FileWriter(bool close_on_finalize = true);
            virtual ~FileWriter();

            //! Create or truncate the specified file.
            //! The permission bits apply only if the file is created.
            //! \returns True if the file is open for writing.
            bool open(const char* filename, mode_t mode = 0644);
            void close();

            //! Is a file currently open?
            inline bool is_open() const {return m_file != 0;}

            // Required and optional function overrides.
            unsigned get_write_space() const override;
            void write_bytes(unsigned nbytes, const void* src) override;
            bool write_finalize() override;
            void write_abort() override;

        protected:
            void write_next(u8 data) override;
            void write_overflow() override;
            const bool m_close_on_finalize;
            FILE* m_file;           // Current file object
            bool m_error;           // Error since last commit?
            unsigned m_last_commit; // Position of last commit
        };

        //! Read bytes from a regular file.
        class FileReader : public netboot::io::Readable {
        public:
            //! Create the FileReader object.
            //! \param close_on_finalize If true, calling `read_finalize`
            //!     closes the current file. If false, keep reading.
            explicit FileReader(bool close_on_finalize = true);
            virtual ~FileReader();

            //! Open the specified file for reading.
            //! Directories and other special files are refused.
            //! \returns True if the file is open for reading.
            bool open(const char* filename);
            void close();

            //! Is a file currently open?
            inline bool is_open() const {return m_file != 0;}

            // Required and optional function overrides.
            unsigned get_read_ready() const override;
            bool read_bytes(unsigned nbytes, void* dst) override;
            bool read_consume(unsigned nbytes) override;
            void read_finalize() override;

        protected:
            u8 read_next() override;
            const bool m_close_on_finalize;
            FILE* m_file;       // Current file object
            unsigned m_rem;     // Remaining readable bytes
        };

        //! Read the entire contents of a regular file.
        bool read_file(const char* filename, std::vector<u8>& out);

        //! Create or truncate a file and write the given contents.
        bool write_file(const char* filename,
            const void* data, unsigned len, mode_t mode = 0644);
    }
}
