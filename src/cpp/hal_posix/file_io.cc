//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <hal_posix/file_io.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using netboot::io::FileReader;
using netboot::io::FileWriter;

FileWriter::FileWriter(bool close_on_finalize)
    : m_close_on_finalize(close_on_finalize)
    , m_file(0)
    , m_error(false)
    , m_last_commit(0)
{
    // Nothing else to initialize.
}

FileWriter::~FileWriter()
{
    close();
}

bool FileWriter::open(const char* filename, mode_t mode)
{
    // Cleanup before attempting to open the new file.
    close();
    int fd = ::open(filename, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) return false;
    m_file = fdopen(fd, "wb");
    if (!m_file) ::close(fd);
    return is_open();
}

void FileWriter::close()
{
    // Close file object and revert to idle state.
    if (m_file) fclose(m_file);
    m_file = 0;
    m_error = false;
    m_last_commit = 0;
}

unsigned FileWriter::get_write_space() const
{
    // If a file is open, max write length is effectively unlimited.
    return m_file ? UINT32_MAX : 0;
}

void FileWriter::write_bytes(unsigned nbytes, const void* src)
{
    if (!m_file) {
        write_overflow();
    } else if (fwrite(src, 1, nbytes, m_file) != nbytes) {
        m_error = true;
    }
}

bool FileWriter::write_finalize()
{
    if (!m_file) return false;

    // Flush buffered data so that any write error is reported now.
    bool ok = !m_error && (fflush(m_file) == 0);
    if (ok) m_last_commit = (unsigned)ftell(m_file);
    if (m_close_on_finalize) {
        ok = (fclose(m_file) == 0) && ok;
        m_file = 0;
        m_last_commit = 0;
    }
    m_error = false;
    return ok;
}

void FileWriter::write_abort()
{
    if (!m_file) return;
    fflush(m_file);
    // A failed truncation is reported by the next write_finalize().
    m_error = (ftruncate(fileno(m_file), m_last_commit) != 0);
    fseek(m_file, m_last_commit, SEEK_SET);
}

void FileWriter::write_next(u8 data)
{
    if (fputc(data, m_file) == EOF) m_error = true;
}

void FileWriter::write_overflow()
{
    m_error = true;
}

FileReader::FileReader(bool close_on_finalize)
    : m_close_on_finalize(close_on_finalize)
    , m_file(0)
    , m_rem(0)
{
    // Nothing else to initialize.
}

FileReader::~FileReader()
{
    close();
}

bool FileReader::open(const char* filename)
{
    // Close current input file before attempting to open the new one.
    close();
    FILE* file = fopen(filename, "rbe");
    if (!file) return false;

    // Only regular files have a well-defined length.
    struct stat info;
    if (fstat(fileno(file), &info) || !S_ISREG(info.st_mode)) {
        fclose(file);
        return false;
    }

    m_file = file;
    m_rem  = (unsigned)info.st_size;
    return true;
}

void FileReader::close()
{
    // Close file object and revert to idle state.
    if (m_file) fclose(m_file);
    m_file = 0;
    m_rem  = 0;
}

unsigned FileReader::get_read_ready() const
{
    return m_file ? m_rem : 0;
}

bool FileReader::read_bytes(unsigned nbytes, void* dst)
{
    size_t result = 0;
    if (m_file && m_rem >= nbytes) {
        result = fread(dst, 1, nbytes, m_file);
        m_rem -= result;
    }
    // A short read means the file changed underneath us.
    if (result != nbytes) m_rem = 0;
    return (result == nbytes);
}

bool FileReader::read_consume(unsigned nbytes)
{
    if (m_file && m_rem >= nbytes) {
        fseek(m_file, (long)nbytes, SEEK_CUR);
        m_rem -= nbytes;
        return true;
    } else {
        return false;
    }
}

void FileReader::read_finalize()
{
    // Close current file or just keep reading?
    if (m_close_on_finalize) close();
}

u8 FileReader::read_next()
{
    if (m_file && m_rem) {
        --m_rem;
        return (u8)fgetc(m_file);
    } else {
        return 0;
    }
}

bool netboot::io::read_file(const char* filename, std::vector<u8>& out)
{
    FileReader file(false);
    if (!file.open(filename)) return false;
    out.resize(file.get_read_ready());
    if (out.empty()) return true;
    return file.read_bytes((unsigned)out.size(), &out[0]);
}

bool netboot::io::write_file(const char* filename,
    const void* data, unsigned len, mode_t mode)
{
    FileWriter file(true);
    if (!file.open(filename, mode)) return false;
    file.write_bytes(len, data);
    return file.write_finalize();
}
