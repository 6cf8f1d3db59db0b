//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Diagnostic logging for the boot services.
//!
//!\details
//! Each `Log` object builds one human-readable message in a fixed-size
//! buffer, then hands it to every registered `log::EventHandler` when it
//! goes out of scope.  Calls chain, so a message reads left to right:
//!\code
//!      using netboot::log::Log;
//!
//!      void report(const char* name, const netboot::ip::Addr& client) {
//!          Log(netboot::log::WARNING, "TFTP server", "Transfer reset")
//!              .write(": ").write(name).write(", client").write(client);
//!      }
//!\endcode
//!
//! Messages never allocate and are truncated at NETBOOT_LOG_MAXLEN.
//! For console output, \see hal_posix/posix_utils.h.

#pragma once

#include <netboot/list.h>
#include <netboot/types.h>

// Maximum string length per message.
#ifndef NETBOOT_LOG_MAXLEN
#define NETBOOT_LOG_MAXLEN  255
#endif

namespace netboot {
    namespace log {
        //! Defines the interface for accepting Log messages.
        //!
        //! To receive `Log` messages, derive a child class and override the
        //! `log_event` method.  The constructor automatically appends new
        //! `EventHandler` objects to a global list of Log recipients.
        class EventHandler {
        public:
            //! Callback for each formatted Log message.
            virtual void log_event(s8 priority, unsigned nbytes, const char* msg) = 0;
        protected:
            EventHandler();
            ~EventHandler() NETBOOT_OPTIONAL_DTOR;
        private:
            friend netboot::util::ListCore;
            netboot::log::EventHandler* m_next;
        };

        //! Define basic priority codes for log messages.
        //! Larger numeric codes indicate greater message priority.
        //!@{
        constexpr s8 DEBUG      = -20;
        constexpr s8 INFO       = -10;
        constexpr s8 WARNING    =   0;
        constexpr s8 ERROR      = +10;
        constexpr s8 CRITICAL   = +20;
        //!@}

        //! Convert priority code to a fixed-width human-readable label.
        const char* priority_label(s8 priority);

        //! Internal buffer used by the `Log` class.
        //!
        //! This buffer holds the contents of a `Log` message, provides
        //! low-level formatting, and truncates long messages safely.
        //! It is also the API for classes that provide custom formatting.
        //! \see netboot::log::Log::write_obj
        class LogBuffer final {
        public:
            LogBuffer() : m_wridx(0) {}

            //! Buffer contents, in the form of a null-terminated string.
            const char* c_str();

            //! Write a fixed-length UTF-8 string.
            void wr_fix(const char* str, unsigned len);
            //! Write a null-terminated UTF-8 string.
            void wr_str(const char* str);
            //! Write an integer in hexadecimal format, with "nhex" digits.
            void wr_h32(u32 val, unsigned nhex = 8);
            //! Write an unsigned integer in decimal format.
            //! For zero-padding to N digits, set "zpad" to 10^N-1.
            void wr_d32(u32 val, unsigned zpad = 0);
            void wr_d64(u64 val, unsigned zpad = 0);
            //! Write a signed integer in decimal format with a leading sign.
            void wr_s32(s32 val);

            //! Number of characters written to this buffer.
            unsigned len() const {return m_wridx;}

        private:
            friend netboot::log::Log;

            LogBuffer(const LogBuffer&) = delete;
            LogBuffer& operator=(const LogBuffer&) = delete;

            inline void terminate() {m_buff[m_wridx] = 0;}

            unsigned m_wridx;
            char m_buff[NETBOOT_LOG_MAXLEN+1];
        };

        //! The `Log` class creates and formats one log message.
        //!
        //! Each `Log` is an emphemeral object that creates, formats, and
        //! emits a human-readable message.  When the `Log` object falls
        //! out of scope, the message is sent to each `EventHandler`.
        class Log final {
        public:
            //! Constructor sets priority and optionally the first string.
            //! The two-string form is "label: message".
            //!@{
            explicit Log(s8 priority);
            Log(s8 priority, const char* str);
            Log(s8 priority, const char* str1, const char* str2);
            //!@}

            //! Destructor sends the message.
            ~Log();

            //! Formatting methods for various data types.
            //! By convention, integer types add prefix " = 0x" and print
            //! as a fixed-width hexadecimal value. Use "write10" for decimal.
            //! Strings are appended with no prefix.  IP addresses use the
            //! conventional dotted form (e.g., " = 192.168.1.42").
            //!@{
            Log& write(const char* str);
            Log& write(bool val);
            Log& write(u8 val);
            Log& write(u16 val);
            Log& write(u32 val);
            Log& write(const u8* val, unsigned nbytes);
            Log& write(const netboot::ip::Addr& ip);
            //!@}

            //! Print integer as a decimal value with no leading zeros,
            //! with the " = " prefix.
            //!@{
            Log& write10(s32 val);
            Log& write10(u32 val);
            Log& write10(u64 val);
            inline Log& write10(u8  val)    {return write10(u32(val));}
            inline Log& write10(u16 val)    {return write10(u32(val));}
            //!@}

            //! Templated wrapper for custom output formatting.
            //! The object must implement the following method:
            //!\code
            //!     void log_to(netboot::log::LogBuffer& wr) const;
            //!\endcode
            template <class T> inline Log& write_obj(const T& obj)
                {obj.log_to(m_buff); return *this;}

        private:
            Log(const Log&) = delete;
            Log& operator=(const Log&) = delete;

            // Append " = 0x" followed by a fixed-width hex value.
            Log& write_hex(u32 val, unsigned nhex);

            const s8 m_priority;
            netboot::log::LogBuffer m_buff;
        };

        //! Hard-reset of global variables at the start of each unit test.
        //! Returns true if globals were already in the expected state.
        bool pre_test_reset();
    }
}
