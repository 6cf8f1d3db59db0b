//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <hal_posix/codec_exec.h>
#include <netboot/log.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace log = netboot::log;
using netboot::ipxe::ExecCompressor;

// Message written by the child if exec() fails.
static const char EXEC_FAILED[] = "exec failed\n";

// Exit status for a child that could not exec().
static constexpr int EXIT_NOEXEC = 127;

// Read whatever is available from a pipe.
// Returns false once the pipe is closed or broken.
static bool drain_pipe(int fd, std::string& dst) {
    char tmp[4096];
    ssize_t rcvd = read(fd, tmp, sizeof(tmp));
    if (rcvd > 0) {
        dst.append(tmp, (size_t)rcvd);
        return true;
    }
    return (rcvd < 0) && (errno == EINTR || errno == EAGAIN);
}

// Short name for log messages (e.g., "/bin/zbin" -> "zbin").
static const char* base_name(const std::string& path) {
    std::size_t sep = path.find_last_of('/');
    return path.c_str() + (sep == std::string::npos ? 0 : sep + 1);
}

ExecCompressor::ExecCompressor(const char* exe)
    : m_exe(exe)
    , m_exit_code(-1)
    , m_stderr()
{
    // Nothing else to initialize.
}

bool ExecCompressor::compress(const char* raw, const char* info, std::string& out)
{
    out.clear();
    m_stderr.clear();
    m_exit_code = -1;

    // Create pipes for standard output and standard error.
    int pipe_out[2], pipe_err[2];
    if (pipe2(pipe_out, O_CLOEXEC)) {
        log::Log(log::ERROR, "Compressor", "pipe").write(": ").write(strerror(errno));
        return false;
    }
    if (pipe2(pipe_err, O_CLOEXEC)) {
        log::Log(log::ERROR, "Compressor", "pipe").write(": ").write(strerror(errno));
        ::close(pipe_out[0]); ::close(pipe_out[1]);
        return false;
    }

    pid_t pid = fork();
    if (pid == 0) {
        // Child process: redirect output and run the program.
        // Only async-signal-safe calls are allowed here.
        dup2(pipe_out[1], STDOUT_FILENO);
        dup2(pipe_err[1], STDERR_FILENO);
        char* const argv[] = {
            const_cast<char*>(m_exe.c_str()),
            const_cast<char*>(raw),
            const_cast<char*>(info),
            0};
        execv(m_exe.c_str(), argv);
        ssize_t unused = write(STDERR_FILENO, EXEC_FAILED, sizeof(EXEC_FAILED)-1);
        (void)unused;
        _exit(EXIT_NOEXEC);
    }

    // Parent process closes the write side of each pipe.
    ::close(pipe_out[1]);
    ::close(pipe_err[1]);
    if (pid < 0) {
        log::Log(log::ERROR, "Compressor", "fork").write(": ").write(strerror(errno));
        ::close(pipe_out[0]);
        ::close(pipe_err[0]);
        return false;
    }

    // Collect both output streams until the child closes them.
    struct pollfd fds[2];
    fds[0].fd = pipe_out[0]; fds[0].events = POLLIN;
    fds[1].fd = pipe_err[0]; fds[1].events = POLLIN;
    while (fds[0].fd >= 0 || fds[1].fd >= 0) {
        if (::poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            log::Log(log::ERROR, "Compressor", "poll").write(": ").write(strerror(errno));
            break;
        }
        for (unsigned a = 0 ; a < 2 ; ++a) {
            if (fds[a].fd < 0 || !fds[a].revents) continue;
            std::string& dst = a ? m_stderr : out;
            if (!drain_pipe(fds[a].fd, dst)) {
                ::close(fds[a].fd);
                fds[a].fd = -1;     // Negative descriptors are ignored
            }
        }
    }
    if (fds[0].fd >= 0) ::close(fds[0].fd);
    if (fds[1].fd >= 0) ::close(fds[1].fd);

    // Wait for the child to exit.
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        log::Log(log::ERROR, "Compressor", "waitpid").write(": ").write(strerror(errno));
        out.clear();
        return false;
    }
    if (WIFEXITED(status)) m_exit_code = WEXITSTATUS(status);

    if (m_exit_code != 0) {
        log::Log(log::ERROR, "Compressor", base_name(m_exe))
            .write(" failed with exit code").write10((s32)m_exit_code)
            .write(", stderr: ").write(m_stderr.c_str());
        out.clear();
        return false;
    }
    return true;
}
