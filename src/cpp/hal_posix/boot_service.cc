//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <hal_posix/boot_service.h>
#include <hal_posix/file_path.h>
#include <hal_posix/posix_utils.h>
#include <netboot/boot_script.h>
#include <netboot/io_writeable.h>
#include <netboot/log.h>

namespace log = netboot::log;
using netboot::BootConfig;
using netboot::BootService;

// Component names for log messages.
static const char* const LBL_SERVICE    = "BootService";
static const char* const NAME_DHCP      = "DHCP proxy";
static const char* const NAME_TFTP      = "TFTP server";

// Permissions for the TFTP root directory.
static constexpr mode_t MODE_ROOT = 0777;

// Polling interval for the blocking loop.
static constexpr unsigned POLL_MSEC = 1;

BootConfig::BootConfig()
    : server(netboot::ip::ADDR_NONE)
    , api_port(50042)
    , dhcp_port(netboot::udp::PORT_DHCP_SERVER.value)
    , tftp_port(netboot::udp::PORT_TFTP_SERVER.value)
    , ipxe_dir("/var/lib/ipxe")
    , tftp_root("/var/lib/tftp")
    , zbin("/bin/zbin")
    , grace_msec(NETBOOT_SHUTDOWN_GRACE_MSEC)
{
    // Nothing else to initialize.
}

BootService::BootService(const BootConfig& cfg, netboot::ipxe::Compressor* codec)
    : m_cfg(cfg)
    , m_patcher(codec)
    , m_dhcp_sock()
    , m_tftp_sock()
    , m_dhcp(&m_dhcp_sock, cfg.server, cfg.api_port)
    , m_tftp(&m_tftp_sock, cfg.tftp_root.c_str())
    , m_started(false)
    , m_stopping(false)
    , m_finished(false)
    , m_stop_req(0)
{
    // Nothing else to initialize.
}

BootService::~BootService()
{
    if (m_started && !m_finished) finish();
}

bool BootService::start()
{
    // Render the boot script for the advertised endpoint.
    std::string endpoint = netboot::ip::format(m_cfg.server);
    netboot::io::ArrayWriteStatic<NETBOOT_SCRIPT_MAXLEN> script;
    if (!netboot::ipxe::write_boot_script(&script, endpoint.c_str(), m_cfg.api_port)) {
        log::Log(log::ERROR, LBL_SERVICE, "failed to build boot script");
        return false;
    }

    // The TFTP root must exist before anything is written to it.
    if (!netboot::util::make_dirs(m_cfg.tftp_root, MODE_ROOT)) {
        log::Log(log::ERROR, LBL_SERVICE, "failed to create TFTP root")
            .write(": ").write(m_cfg.tftp_root.c_str());
        return false;
    }

    // Patch every image before any listener starts.
    log::Log(log::INFO, LBL_SERVICE, "patch iPXE binaries");
    if (!m_patcher.patch_all(m_cfg.ipxe_dir.c_str(), m_cfg.tftp_root.c_str(),
            script.buffer(), script.written_len())) {
        log::Log(log::ERROR, LBL_SERVICE, "failed to patch iPXE binaries");
        return false;
    }

    // Open both sockets on all local interfaces.
    log::Log(log::INFO, LBL_SERVICE, "start component").write(": ").write(NAME_DHCP);
    if (!m_dhcp_sock.bind(netboot::ip::ADDR_NONE, m_cfg.dhcp_port)) {
        log::Log(log::ERROR, LBL_SERVICE, "failed to run component").write(": ").write(NAME_DHCP);
        return false;
    }
    log::Log(log::INFO, LBL_SERVICE, "start component").write(": ").write(NAME_TFTP);
    if (!m_tftp_sock.bind(netboot::ip::ADDR_NONE, m_cfg.tftp_port)) {
        log::Log(log::ERROR, LBL_SERVICE, "failed to run component").write(": ").write(NAME_TFTP);
        m_dhcp_sock.close();
        return false;
    }

    m_started = true;
    return true;
}

bool BootService::service()
{
    netboot::poll::service();

    // A receive error is fatal, except while shutting down.
    if (m_stopping) return true;
    if (m_dhcp_sock.failed()) {
        log::Log(log::ERROR, LBL_SERVICE, "failed to run component").write(": ").write(NAME_DHCP);
        return false;
    }
    if (m_tftp_sock.failed()) {
        log::Log(log::ERROR, LBL_SERVICE, "failed to run component").write(": ").write(NAME_TFTP);
        return false;
    }
    return true;
}

void BootService::shutdown()
{
    if (m_stopping) return;
    m_stopping = true;

    // The DHCP proxy has no sessions, so it stops immediately.
    m_dhcp_sock.close();
    log::Log(log::INFO, LBL_SERVICE, "component stopped").write(": ").write(NAME_DHCP);

    // Transfers in progress get a bounded grace period.
    m_tftp.shutdown();
    if (m_tftp.active_sessions() && m_cfg.grace_msec) {
        timer_once(m_cfg.grace_msec);
    } else {
        finish();
    }
}

void BootService::timer_event()
{
    finish();
}

void BootService::finish()
{
    if (m_finished) return;
    timer_stop();
    m_tftp.close_all("Server shutting down");
    m_tftp_sock.close();
    m_dhcp_sock.close();
    if (m_stopping)
        log::Log(log::INFO, LBL_SERVICE, "component stopped").write(": ").write(NAME_TFTP);
    m_finished = true;
}

bool BootService::run()
{
    if (!m_started && !start()) return false;

    // Serve until a stop is requested or a socket fails.
    while (!m_stop_req) {
        if (!service()) {
            finish();
            return false;
        }
        netboot::util::sleep_msec(POLL_MSEC);
    }

    // Graceful shutdown, ending early once all transfers are done.
    shutdown();
    while (!m_finished) {
        netboot::poll::service();
        if (m_finished) break;
        if (!m_tftp.active_sessions()) finish();
        else netboot::util::sleep_msec(POLL_MSEC);
    }
    return true;
}
