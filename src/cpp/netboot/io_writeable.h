//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! "Writeable" I/O interface core definitions
//!
//!\details
//! The "Writeable" interface accepts byte-streams and packets.  It is
//! used to build DHCP replies, TFTP datagrams, boot scripts and image
//! files.  Writes are all-or-nothing: a write that does not fit sets
//! an overflow condition and the frame is rejected at write_finalize().

#pragma once

#include <netboot/types.h>

namespace netboot {
    namespace io {
        //! Abstract API for writing byte-streams and packets.
        class Writeable {
        public:
            //! How many bytes can be written without blocking?
            virtual unsigned get_write_space() const = 0;

            //! Write integers in big-endian (network) byte order.
            //!@{
            void write_u8(u8 data);
            void write_u16(u16 data);
            void write_u32(u32 data);
            //!@}

            //! Write an array of bytes, or nothing if space is insufficient.
            virtual void write_bytes(unsigned nbytes, const void* src);

            //! Write a null-terminated string, excluding the terminator.
            void write_str(const char* str);

            //! Mark the end of a frame or file.
            //! \returns True if the frame was sent successfully.
            virtual bool write_finalize();

            //! Discard any partially-written data.
            virtual void write_abort();

        protected:
            //! Only children should create or destroy the base class.
            constexpr Writeable() {}
            ~Writeable() {}

            //! Write the next byte to the underlying buffer or device.
            //! Parent has already checked get_write_space().
            virtual void write_next(u8 data) = 0;

            //! Optional error handling for write overflow.
            virtual void write_overflow();

        private:
            // Write an N-byte big-endian integer.
            void write_be(u32 data, unsigned nbytes);
        };

        //! Ephemeral `Writeable` interface for a simple array.
        //! It does not take ownership of the backing array.
        class ArrayWrite : public netboot::io::Writeable {
        public:
            constexpr ArrayWrite(void* dst, unsigned len)
                : m_dst((u8*)dst), m_len(len)
                , m_ovr(false), m_wridx(0), m_wrlen(0) {}

            unsigned get_write_space() const override;
            void write_abort() override;
            void write_bytes(unsigned nbytes, const void* src) override;
            bool write_finalize() override;

            //! Pointer to the start of the backing array.
            inline u8* buffer() const {return m_dst;}
            //! Length of the most recently finalized frame.
            inline unsigned written_len() const {return m_wrlen;}

        protected:
            void write_next(u8 data) override;
            void write_overflow() override;

        private:
            u8* const       m_dst;
            const unsigned  m_len;
            bool            m_ovr;
            unsigned        m_wridx;
            unsigned        m_wrlen;
        };

        //! Wrapper for ArrayWrite with a statically-allocated buffer.
        template <unsigned SIZE>
        class ArrayWriteStatic : public netboot::io::ArrayWrite {
        public:
            ArrayWriteStatic() : ArrayWrite(m_raw, SIZE) {}
        private:
            u8 m_raw[SIZE];
        };
    }
}
