//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <cstdio>
#include <cstring>
#include <netboot/dhcp_proxy.h>
#include <netboot/log.h>
#include <netboot/utils.h>

namespace dhcp = netboot::dhcp;
namespace log = netboot::log;
using dhcp::BootParams;
using dhcp::Discover;
using dhcp::HwAddr;
using dhcp::OptionData;
using dhcp::ProxyServer;
using netboot::io::ArrayWrite;
using netboot::io::ArrayWriteStatic;
using netboot::io::LimitedRead;
using netboot::io::Readable;
using netboot::io::Writeable;
using netboot::ip::Addr;
using netboot::ip::Port;
using netboot::pxe::Classification;
using netboot::pxe::ClassifyError;
using netboot::pxe::Firmware;
using netboot::udp::PORT_DHCP_CLIENT;
using netboot::udp::PORT_DHCP_SERVER;
using netboot::util::max_unsigned;

// Enable additional logs for debugging? (Verbosity = 0/1/2)
static constexpr unsigned DEBUG_VERBOSE = 0;

// Label for all log messages from this file.
static const char* const LBL_DHCP = "DHCP proxy";

// Opcodes for the legacy "OP" field from BOOTP.
static constexpr u8 OP_REQUEST          = 1;
static constexpr u8 OP_REPLY            = 2;

// Legacy SNAME and FILE fields are not used.
static constexpr unsigned LEGACY_BYTES  = 192;
static constexpr unsigned LEGACY_WORDS  = LEGACY_BYTES / 4;

// Minimum BOOTP message length (RFC 951), padded if needed.
static constexpr unsigned MIN_REPLY_LEN = 300;

// Working buffer for outgoing options.
static constexpr unsigned MAX_OPTIONS   = 1024;

// Default vendor class for the reply, if the client did not send one.
static const char* const VENDOR_DEFAULT = "PXEClient";

// Reply table: boot filename and options for each firmware variant.
// Bare filenames are fetched from the TFTP server named in option 66.
enum class Scheme : u8 {NONE, TFTP, HTTP};

struct BootRow {
    Firmware fw;
    Scheme scheme;
    const char* path;
    bool tftp_server;
};

static const BootRow BOOT_TABLE[] = {
    {Firmware::X86PC,   Scheme::NONE, "undionly.kpxe",  true},
    {Firmware::X86IPXE, Scheme::TFTP, "undionly.kpxe",  false},
    {Firmware::X86EFI,  Scheme::NONE, "snp.efi",        true},
    {Firmware::ARMEFI,  Scheme::NONE, "snp-arm64.efi",  true},
    {Firmware::X86HTTP, Scheme::HTTP, "snp.efi",        false},
    {Firmware::ARMHTTP, Scheme::HTTP, "snp-arm64.efi",  false},
};

const char* dhcp::msg_type_name(u8 msg_type) {
    switch (msg_type) {
    case 0:                 return "NONE";
    case DHCP_DISCOVER:     return "DISCOVER";
    case DHCP_OFFER:        return "OFFER";
    case DHCP_REQUEST:      return "REQUEST";
    case DHCP_DECLINE:      return "DECLINE";
    case DHCP_ACK:          return "ACK";
    case DHCP_NAK:          return "NAK";
    case DHCP_RELEASE:      return "RELEASE";
    case DHCP_INFORM:       return "INFORM";
    default:                return "UNKNOWN";
    }
}

void OptionData::write_to(u8 code, Writeable* wr) const {
    if (!present) return;
    wr->write_u8(code);
    wr->write_u8(len);
    wr->write_bytes(len, data);
}

void HwAddr::log_to(log::LogBuffer& wr) const {
    for (unsigned a = 0 ; a < len ; ++a) {
        if (a) wr.wr_str(":");
        wr.wr_h32(addr[a], 2);
    }
}

// Copy the contents of an option.
static void store(OptionData& dst, const u8* src, u8 len) {
    dst.present = true;
    dst.len = len;
    memcpy(dst.data, src, len);
}

// Parse option 77.  RFC 3004 defines a list of length-prefixed strings,
// but many clients (including iPXE) send a single bare string instead.
static void store_user_class(Discover& msg, const u8* src, unsigned len) {
    unsigned count = 0, pos = 0;
    while (pos < len) {
        unsigned n = src[pos];
        if (n == 0 || pos + 1 + n > len) {count = 0; break;}
        ++count; pos += 1 + n;
    }

    if (count) {
        memcpy(msg.user_class, src + 1, src[0]);
        msg.user_class[src[0]] = 0;
        msg.user_class_count = count;
    } else if (len) {
        memcpy(msg.user_class, src, len);
        msg.user_class[len] = 0;
        msg.user_class_count = 1;
    }
}

Discover::Discover()
    : op(0), htype(0), hlen(0), xid(0), flags(0), ciaddr(0), giaddr(0)
    , chaddr{}, msg_type(0), has_arch(false), arch()
    , user_class_count(0), user_class{}
    , client_id(), vendor_class(), relay_info()
{
    // No other initialization required.
}

bool Discover::read_from(Readable* src) {
    // Read the BOOTP/DHCP message header.
    if (src->get_read_ready() < HEADER_LEN) return false;
    op      = src->read_u8();
    htype   = src->read_u8();
    hlen    = src->read_u8();
    src->read_u8();     // hops
    xid     = src->read_u32();
    src->read_u16();    // secs
    flags   = src->read_u16();
    ciaddr  = src->read_u32();
    src->read_u32();    // yiaddr
    src->read_u32();    // siaddr
    giaddr  = src->read_u32();
    src->read_bytes(CHADDR_LEN, chaddr);
    src->read_consume(LEGACY_BYTES);
    u32 magic = src->read_u32();

    // Sanity check before proceeding.
    if (op != OP_REQUEST) return false;     // Not a client-to-server message
    if (hlen > CHADDR_LEN) return false;    // Invalid hardware address
    if (magic != DHCP_MAGIC) return false;  // Invalid "magic cookie" value

    // Scan through options for information of interest.
    // (Options in any order, so we need to parse the whole thing.)
    u8 buffer[255];
    while (src->get_read_ready()) {
        // Read option type and handle no-length options.
        u8 typ = src->read_u8();
        if (typ == OPTION_PAD) continue;
        if (typ == OPTION_END) break;
        // Read option length and contents.
        if (!src->get_read_ready()) return false;
        u8 len = src->read_u8();
        if (!src->read_bytes(len, buffer)) return false;
        if (typ == OPTION_MSG_TYPE && len == 1) {
            msg_type = buffer[0];
        } else if (typ == OPTION_CLIENT_ARCH) {
            // List of 16-bit codes.  A malformed list counts as present
            // but empty, which is then rejected as unsupported.
            has_arch = true;
            if (len % 2 == 0) {
                for (unsigned a = 0 ; a < len ; a += 2)
                    arch.add(netboot::util::extract_be_u16(buffer + a));
            }
        } else if (typ == OPTION_USER_CLASS) {
            store_user_class(*this, buffer, len);
        } else if (typ == OPTION_CLIENT_ID) {
            store(client_id, buffer, len);
        } else if (typ == OPTION_VENDOR_CLASS) {
            store(vendor_class, buffer, len);
        } else if (typ == OPTION_RELAY_INFO) {
            store(relay_info, buffer, len);
        }
    }

    return true;
}

HwAddr Discover::hwaddr() const {
    HwAddr tmp;
    tmp.len = hlen;
    memcpy(tmp.addr, chaddr, CHADDR_LEN);
    return tmp;
}

Classification Discover::classify() const {
    return netboot::pxe::classify(arch, first_user_class(),
        client_id.present ? client_id.data : 0,
        client_id.present ? client_id.len : 0);
}

bool dhcp::boot_params(
    Firmware fw, const Addr& server, u16 http_port, BootParams& out)
{
    char ipstr[16];
    server.to_str(ipstr);

    for (const BootRow& row : BOOT_TABLE) {
        if (row.fw != fw) continue;
        out.tftp_server = row.tftp_server;
        if (row.scheme == Scheme::TFTP) {
            snprintf(out.filename, sizeof(out.filename),
                "tftp://%s/%s", ipstr, row.path);
        } else if (row.scheme == Scheme::HTTP) {
            snprintf(out.filename, sizeof(out.filename),
                "http://%s:%u/tftp/%s", ipstr, unsigned(http_port), row.path);
        } else {
            snprintf(out.filename, sizeof(out.filename), "%s", row.path);
        }
        return true;
    }

    out.filename[0] = 0;
    out.tftp_server = false;
    return false;
}

bool dhcp::offer(
    const Discover& req, Firmware fw,
    const Addr& server, u16 http_port, Writeable* dst)
{
    BootParams params;
    if (!boot_params(fw, server, http_port, params)) {
        dst->write_abort();
        return false;
    }

    // Write outgoing options into the working buffer, in ascending order.
    // (Do this up front to ensure an accurate length estimate.)
    u8 buffer[MAX_OPTIONS];
    ArrayWrite opt(buffer, MAX_OPTIONS);
    // Message type is always required.
    opt.write_u8(OPTION_MSG_TYPE);
    opt.write_u8(1);
    opt.write_u8(DHCP_OFFER);
    // Server identifier.
    opt.write_u8(OPTION_SERVER_IP);
    opt.write_u8(4);
    opt.write_u32(server.value);
    // Vendor class, copied from the request or the default.
    if (req.vendor_class.present) {
        req.vendor_class.write_to(OPTION_VENDOR_CLASS, &opt);
    } else {
        opt.write_u8(OPTION_VENDOR_CLASS);
        opt.write_u8(u8(strlen(VENDOR_DEFAULT)));
        opt.write_str(VENDOR_DEFAULT);
    }
    // TFTP server name, for variants that fetch a bare filename.
    if (params.tftp_server) {
        char ipstr[16];
        server.to_str(ipstr);
        opt.write_u8(OPTION_TFTP_SERVER);
        opt.write_u8(u8(strlen(ipstr)));
        opt.write_str(ipstr);
    }
    // Boot filename or URL.
    opt.write_u8(OPTION_BOOT_FILE);
    opt.write_u8(u8(strlen(params.filename)));
    opt.write_str(params.filename);
    // Relay agent information and client identifier are echoed.
    req.relay_info.write_to(OPTION_RELAY_INFO, &opt);
    req.client_id.write_to(OPTION_CLIENT_ID, &opt);
    // End-of-options marker.
    opt.write_u8(OPTION_END);
    if (!opt.write_finalize()) {
        dst->write_abort();
        return false;
    }

    // Write the basic DHCP message header.
    dst->write_u8(OP_REPLY);            // OP
    dst->write_u8(req.htype);           // HTYPE = Echo
    dst->write_u8(req.hlen);            // HLEN = Echo
    dst->write_u8(0);                   // HOPS
    dst->write_u32(req.xid);            // xid = Echo
    dst->write_u16(0);                  // secs = 0
    dst->write_u16(req.flags);          // flags = Echo
    dst->write_u32(0);                  // ciaddr = 0
    dst->write_u32(0);                  // yiaddr = 0 (no lease)
    dst->write_u32(server.value);       // siaddr = Boot server
    dst->write_u32(req.giaddr);         // giaddr = Echo
    dst->write_bytes(CHADDR_LEN, req.chaddr);
    for (unsigned a = 0 ; a < LEGACY_WORDS ; ++a)
        dst->write_u32(0);              // 192 bytes of zeros
    dst->write_u32(DHCP_MAGIC);         // Magic cookie

    // Write options, then pad to the minimum length.
    dst->write_bytes(opt.written_len(), buffer);
    unsigned total = HEADER_LEN + opt.written_len();
    unsigned pad = max_unsigned(total, MIN_REPLY_LEN) - total;
    while (pad--) dst->write_u8(OPTION_PAD);
    return dst->write_finalize();
}

ProxyServer::ProxyServer(
        netboot::udp::Socket* sock, const Addr& server, u16 http_port)
    : m_sock(sock)
    , m_server(server)
    , m_http_port(http_port)
    , m_offers(0)
{
    m_sock->set_protocol(this);
}

#if NETBOOT_ALLOW_DELETION
ProxyServer::~ProxyServer() {
    m_sock->set_protocol(0);
}
#endif

void ProxyServer::reply_dest(const Discover& req, Addr& addr, Port& port) const {
    // Relayed requests go back through the relay agent.
    // Otherwise, unicast is only possible if the client has an address.
    // (RFC 2131 Section 4.1)
    if (req.giaddr) {
        addr = Addr(req.giaddr);
        port = PORT_DHCP_SERVER;
    } else if ((req.flags & FLAG_BROADCAST) || !m_sock->reply_ip().is_valid()) {
        addr = netboot::ip::ADDR_BROADCAST;
        port = PORT_DHCP_CLIENT;
    } else {
        addr = m_sock->reply_ip();
        port = m_sock->reply_port();
    }
}

void ProxyServer::frame_rcvd(LimitedRead& src) {
    if (DEBUG_VERBOSE > 1)
        log::Log(log::DEBUG, LBL_DHCP, "frame_rcvd")
            .write(m_sock->reply_ip()).write10(src.get_read_ready());

    // Parse the incoming message.
    Discover req;
    if (!req.read_from(&src)) {
        log::Log(log::INFO, LBL_DHCP, "ignoring packet")
            .write(": malformed BOOTP header, from").write(m_sock->reply_ip());
        return;
    }
    HwAddr source = req.hwaddr();

    // Is this a PXE boot request?
    if (req.msg_type != DHCP_DISCOVER) {
        log::Log(log::INFO, LBL_DHCP, "ignoring packet")
            .write(": source ").write_obj(source)
            .write(": packet is ").write(msg_type_name(req.msg_type))
            .write(", not DISCOVER");
        return;
    }
    if (!req.has_arch) {
        log::Log(log::INFO, LBL_DHCP, "ignoring packet")
            .write(": source ").write_obj(source)
            .write(": not a PXE boot request (missing option 93)");
        return;
    }

    // Identify the client firmware.
    Classification fw = req.classify();
    if (!fw.ok()) {
        log::Log msg(log::INFO, LBL_DHCP, "invalid packet");
        msg.write(": source ").write_obj(source)
           .write(": ").write(netboot::pxe::classify_error_str(fw.error));
        if (fw.error == ClassifyError::UNSUPPORTED_ARCH)
            msg.write(": [").write_obj(req.arch).write("]");
        return;
    }

    // Construct the reply.
    BootParams params;
    ArrayWriteStatic<netboot::udp::MAX_DATAGRAM> reply;
    if (!boot_params(fw.firmware, m_server, m_http_port, params)
        || !offer(req, fw.firmware, m_server, m_http_port, &reply)) {
        log::Log(log::ERROR, LBL_DHCP, "failed to construct ProxyDHCP offer")
            .write(": source ").write_obj(source)
            .write(", firmware ").write(netboot::pxe::firmware_name(fw.firmware));
        return;
    }

    char ipstr[16];
    m_server.to_str(ipstr);
    log::Log(log::INFO, LBL_DHCP, "offering boot response")
        .write(": source ").write_obj(source)
        .write(", server ").write(params.tftp_server ? ipstr : "")
        .write(", boot_filename ").write(params.filename);

    // Send the reply.  Failures are not retried; the client will retry.
    Addr dstaddr;
    Port dstport(0);
    reply_dest(req, dstaddr, dstport);
    Writeable* dst = m_sock->open_write(dstaddr, dstport, reply.written_len());
    bool ok = false;
    if (dst) {
        dst->write_bytes(reply.written_len(), reply.buffer());
        ok = dst->write_finalize();
    }
    if (ok) {
        ++m_offers;
    } else {
        log::Log(log::ERROR, LBL_DHCP, "failure sending response")
            .write(": source ").write_obj(source).write(", to").write(dstaddr);
    }
}
