//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <hal_posix/file_io.h>
#include <hal_posix/file_path.h>
#include <hal_test/sim_utils.h>
#include <cstdio>
#include <cstdlib>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace log = netboot::log;
using netboot::io::ArrayRead;
using netboot::io::LimitedRead;
using netboot::io::Writeable;
using netboot::ip::Addr;
using netboot::ip::Port;
using netboot::poll::timekeeper;
using netboot::test::Datagram;
using netboot::test::MockSocket;
using netboot::test::TempDir;
using netboot::test::TimerSimulation;

bool netboot::test::write(Writeable* dst, const std::string& dat) {
    dst->write_bytes(dat.length(), dat.c_str());
    return dst->write_finalize();
}

std::string netboot::test::random_string(unsigned nbytes) {
    // Reproducible linear congruential sequence.
    static u32 state = 12345;
    std::string tmp(nbytes, 0);
    for (unsigned a = 0 ; a < nbytes ; ++a) {
        state = 1103515245u * state + 12345u;
        tmp[a] = (char)(state >> 24);
    }
    return tmp;
}

MockSocket::MockSocket(u16 port)
    : netboot::io::ArrayWrite(m_buff, sizeof(m_buff))
    , m_port(port)
    , m_dstaddr(0)
    , m_dstport(0)
    , m_fail(0)
{
    // Nothing else to initialize.
}

void MockSocket::rcvd(const Addr& srcaddr, const Port& srcport, const std::string& data) {
    ArrayRead array(data.data(), (unsigned)data.size());
    LimitedRead limit(&array, (unsigned)data.size());
    deliver(srcaddr, srcport, limit);
}

Datagram MockSocket::pop() {
    if (m_sent.empty()) {
        Datagram none = {netboot::ip::ADDR_NONE, netboot::udp::PORT_NONE, std::string()};
        return none;
    }
    Datagram next = m_sent.front();
    m_sent.pop_front();
    return next;
}

Writeable* MockSocket::open_write(const Addr& dstaddr, const Port& dstport, unsigned len) {
    if (len > sizeof(m_buff)) return 0;
    ArrayWrite::write_abort();
    m_dstaddr = dstaddr;
    m_dstport = dstport;
    return this;
}

bool MockSocket::write_finalize() {
    if (!ArrayWrite::write_finalize()) return false;
    if (m_fail) {
        --m_fail;
        return false;
    }
    Datagram next = {m_dstaddr, m_dstport,
        std::string((const char*)buffer(), written_len())};
    m_sent.push_back(next);
    return true;
}

TimerSimulation::TimerSimulation()
    : m_tnow(0)
{
    // Always use this simulation clock as the reference.
    timekeeper.set_clock(this);
}

TimerSimulation::~TimerSimulation() {
    // Cleanup links established in the constructor.
    timekeeper.set_clock(0);
}

void TimerSimulation::sim_step() {
    // Confirm this clock is still the timekeeping reference.
    if (timekeeper.get_clock() != this)
        timekeeper.set_clock(this);
    ++m_tnow;
}

void TimerSimulation::sim_wait(unsigned dly_msec) {
    // Sanity check before we start...
    if (dly_msec > 10000000)
        log::Log(log::WARNING, "Excessive delay request").write10(dly_msec);
    for (unsigned a = 0 ; a < dly_msec ; ++a) {
        sim_step();
        netboot::poll::service();
    }
}

// Callback for nftw(), deleting each entry after its contents.
static int remove_entry(const char* path, const struct stat*, int, struct FTW*) {
    return ::remove(path);
}

TempDir::TempDir() {
    const char* base = getenv("TMPDIR");
    std::string tmpl = std::string(base ? base : "/tmp") + "/netboot_XXXXXX";
    std::vector<char> buff(tmpl.begin(), tmpl.end());
    buff.push_back(0);
    if (mkdtemp(&buff[0])) {
        m_path = std::string(&buff[0]);
    } else {
        log::Log(log::ERROR, "TempDir", "mkdtemp failed");
    }
}

TempDir::~TempDir() {
    if (m_path.empty()) return;
    if (nftw(m_path.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS))
        log::Log(log::WARNING, "TempDir", "cleanup failed").write(" ").write(m_path.c_str());
}

std::string TempDir::file(const char* name) const {
    return netboot::util::join_path(m_path, name);
}

bool TempDir::write(const char* name, const std::string& data) const {
    std::string path = file(name);
    if (!netboot::util::make_dirs(netboot::util::parent_dir(path), 0755)) return false;
    return netboot::io::write_file(path.c_str(), data.data(), (unsigned)data.size());
}

std::string TempDir::read(const char* name) const {
    std::vector<u8> tmp;
    if (!netboot::io::read_file(file(name).c_str(), tmp) || tmp.empty())
        return std::string();
    return std::string((const char*)&tmp[0], tmp.size());
}

bool TempDir::exists(const char* name) const {
    struct stat info;
    return stat(file(name).c_str(), &info) == 0;
}
