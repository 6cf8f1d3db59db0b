//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Proxy DHCP server for PXE boot clients.
//!
//!\details
//! The proxy server listens for DHCPDISCOVER messages from PXE clients
//! and replies with an offer that names the boot server and boot file,
//! as defined in the PXE specification and RFC 4578.  It is not an
//! address server: the offer carries no address (yiaddr = 0) and no
//! lease, so it coexists with the authoritative DHCP server on the
//! same network.  The client merges both offers.
//!
//! Each datagram is handled independently.  The proxy keeps no state
//! between packets.  Packets that are not PXE discover messages, or that
//! fail classification (\see netboot/pxe_firmware.h), are logged and
//! dropped without a reply.

#pragma once

#include <netboot/pxe_firmware.h>
#include <netboot/udp_core.h>

namespace netboot {
    namespace dhcp {
        //! DHCP message types for option 53 (RFC 2132 Section 9.6).
        //!@{
        constexpr u8 DHCP_DISCOVER      = 1;
        constexpr u8 DHCP_OFFER         = 2;
        constexpr u8 DHCP_REQUEST       = 3;
        constexpr u8 DHCP_DECLINE       = 4;
        constexpr u8 DHCP_ACK           = 5;
        constexpr u8 DHCP_NAK           = 6;
        constexpr u8 DHCP_RELEASE       = 7;
        constexpr u8 DHCP_INFORM        = 8;
        //!@}

        //! Human-readable name for each message type.
        const char* msg_type_name(u8 msg_type);

        //! DHCP option codes used by the proxy (RFC 2132, RFC 4578).
        //!@{
        constexpr u8 OPTION_PAD         = 0;    // No length
        constexpr u8 OPTION_MSG_TYPE    = 53;
        constexpr u8 OPTION_SERVER_IP   = 54;
        constexpr u8 OPTION_VENDOR_CLASS= 60;
        constexpr u8 OPTION_TFTP_SERVER = 66;
        constexpr u8 OPTION_BOOT_FILE   = 67;
        constexpr u8 OPTION_USER_CLASS  = 77;
        constexpr u8 OPTION_RELAY_INFO  = 82;
        constexpr u8 OPTION_CLIENT_ARCH = 93;
        constexpr u8 OPTION_CLIENT_ID   = 97;
        constexpr u8 OPTION_END         = 255;  // No length
        //!@}

        //! DHCP "magic cookie" identifier.
        constexpr u32 DHCP_MAGIC        = 0x63825363;

        //! Broadcast request bit in the FLAGS header.
        constexpr u16 FLAG_BROADCAST    = 0x8000;

        //! Fixed header length, including the magic cookie.
        constexpr unsigned HEADER_LEN   = 240;

        //! Maximum length of the CHADDR field.
        constexpr unsigned CHADDR_LEN   = 16;

        //! Contents of a single variable-length option, if present.
        struct OptionData {
            bool present;
            u8 len;
            u8 data[255];

            constexpr OptionData() : present(false), len(0), data{} {}

            //! Write this option (code, length, contents) if present.
            void write_to(u8 code, netboot::io::Writeable* wr) const;
        };

        //! Client hardware address from the CHADDR field.
        struct HwAddr {
            u8 len;
            u8 addr[CHADDR_LEN];

            //! Log formatting, e.g., "de:ad:be:ef:ca:fe".
            void log_to(netboot::log::LogBuffer& wr) const;
        };

        //! Parsed contents of a DHCP request from a client.
        //! Only the fields that are relevant to PXE are retained.
        struct Discover {
            // BOOTP header.
            u8  op;
            u8  htype;
            u8  hlen;
            u32 xid;
            u16 flags;
            u32 ciaddr;
            u32 giaddr;
            u8  chaddr[CHADDR_LEN];

            // Message type (option 53), or zero if absent.
            u8  msg_type;

            // Client architecture list (option 93).
            bool has_arch;
            netboot::pxe::ArchList arch;

            // User class (option 77).  Only the first entry is kept.
            unsigned user_class_count;
            char user_class[256];

            // Options that are copied verbatim to the reply.
            netboot::dhcp::OptionData client_id;    // Option 97
            netboot::dhcp::OptionData vendor_class; // Option 60
            netboot::dhcp::OptionData relay_info;   // Option 82

            Discover();

            //! Parse a DHCP message.
            //! \returns False if the BOOTP header or options are malformed.
            bool read_from(netboot::io::Readable* src);

            //! Client hardware address, for logging.
            netboot::dhcp::HwAddr hwaddr() const;

            //! First user-class string, or null if absent.
            inline const char* first_user_class() const
                {return user_class_count ? user_class : 0;}

            //! Classify this request.
            netboot::pxe::Classification classify() const;
        };

        //! Boot parameters for a given firmware variant.
        struct BootParams {
            //! Boot filename for option 67 (bare filename or URL).
            char filename[128];
            //! Include option 66 (TFTP server name)?
            bool tftp_server;
        };

        //! Look up the boot parameters for a given firmware variant.
        //! \returns False for `Firmware::UNSUPPORTED`.
        bool boot_params(
            netboot::pxe::Firmware fw,
            const netboot::ip::Addr& server,
            u16 http_port,
            netboot::dhcp::BootParams& out);

        //! Write a complete proxy offer for a classified request.
        //! The reply is written to "dst", followed by write_finalize().
        //! \returns False if the firmware is unsupported or on overflow.
        bool offer(
            const netboot::dhcp::Discover& req,
            netboot::pxe::Firmware fw,
            const netboot::ip::Addr& server,
            u16 http_port,
            netboot::io::Writeable* dst);

        //! Proxy DHCP server for PXE clients.
        class ProxyServer final : public netboot::udp::Protocol {
        public:
            //! Attach to the designated socket.
            //!\param sock      Socket bound to the DHCP server port.
            //!\param server    Address advertised as the boot server.
            //!\param http_port Port for HTTP boot URLs.
            ProxyServer(
                netboot::udp::Socket* sock,
                const netboot::ip::Addr& server,
                u16 http_port);
            ~ProxyServer() NETBOOT_OPTIONAL_DTOR;

            //! Number of offers sent since startup.
            inline unsigned offer_count() const {return m_offers;}

        protected:
            void frame_rcvd(netboot::io::LimitedRead& src) override;

            //! Choose the reply destination for a given request.
            void reply_dest(const netboot::dhcp::Discover& req,
                netboot::ip::Addr& addr, netboot::ip::Port& port) const;

            netboot::udp::Socket* const m_sock;
            const netboot::ip::Addr m_server;
            const u16 m_http_port;
            unsigned m_offers;
        };
    }
}
