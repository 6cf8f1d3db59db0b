//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! "Readable" I/O interface core definitions
//!
//!\details
//! The core of all Netboot I/O are the "Writeable" interface
//! (io_writeable.h) and "Readable" interface (io_readable.h).  Packet
//! parsers, file readers and sockets all share these interfaces.

#pragma once

#include <netboot/types.h>

namespace netboot {
    namespace io {
        //! Abstract API for reading byte-streams and packets.
        //!
        //! Note: If frame boundaries are supported, `read_*` methods MUST NOT
        //!       read past the boundary until read_finalize() is called.
        class Readable {
        public:
            //! How many bytes can be read without blocking?
            virtual unsigned get_read_ready() const = 0;

            //! Read integers in big-endian (network) byte order.
            //! On underflow, these return zero and call read_underflow().
            //!@{
            u8 read_u8();
            u16 read_u16();
            u32 read_u32();
            //!@}

            //! Read 0 or more bytes into a buffer.
            //! \returns False on underflow, in which case nothing is read.
            virtual bool read_bytes(unsigned nbytes, void* dst);

            //! Read and discard 0 or more bytes.
            virtual bool read_consume(unsigned nbytes);

            //! Safely read a null-terminated input string.
            //! The input is always consumed up to the end-of-input or the
            //! first zero byte, whichever comes first.
            //! \returns The length of the output string, which may
            //! be truncated as needed to fit in the provided buffer.
            unsigned read_str(unsigned dst_size, char* dst);

            //! Consume any remaining bytes in this frame, if applicable.
            virtual void read_finalize();

        protected:
            friend netboot::io::LimitedRead;

            constexpr Readable() {}
            ~Readable() {}

            //! Read the next byte from the underlying buffer or device.
            //! Parent has already checked get_read_ready().
            virtual u8 read_next() = 0;

            //! Optional error handling for read underflow.
            virtual void read_underflow();

        private:
            // Check for N bytes, calling read_underflow() if absent.
            bool read_check(unsigned nbytes);
            // Read an N-byte big-endian integer.
            u32 read_be(unsigned nbytes);
        };

        //! Ephemeral `Readable` interface for a simple array.
        //! It does not take ownership of the backing array.
        class ArrayRead : public netboot::io::Readable {
        public:
            constexpr ArrayRead(const void* src, unsigned len)
                : m_src((const u8*)src), m_len(len), m_rdidx(0) {}

            unsigned get_read_ready() const override;
            bool read_bytes(unsigned nbytes, void* dst) override;
            void read_finalize() override;

        private:
            u8 read_next() override;
            const u8* const m_src;
            unsigned m_len;     // Length of the backing array
            unsigned m_rdidx;   // Current read position
        };

        //! Limited read of next N bytes.  Does not forward read_finalize().
        //!
        //! This class is used to read a controlled amount from a longer
        //! input, such as a single DHCP option or the body of a datagram.
        class LimitedRead : public netboot::io::Readable {
        public:
            constexpr LimitedRead(netboot::io::Readable* src, unsigned maxrd)
                : m_src(src), m_rem(maxrd) {}

            //! Automatically set read length based on src->get_read_ready()
            explicit LimitedRead(netboot::io::Readable* src);

            unsigned get_read_ready() const override;
            bool read_bytes(unsigned nbytes, void* dst) override;
            bool read_consume(unsigned nbytes) override;
            void read_finalize() override;

        protected:
            u8 read_next() override;

        private:
            netboot::io::Readable* const m_src;
            unsigned m_rem;
        };
    }
}
