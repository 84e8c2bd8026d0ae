/*
 * File: include/atomic_write.hpp
 * Project: AGMO Sim Bridge
 * Purpose: Crash-safe file replacement for checkpoints
 * Notes:
 *  - POSIX rename() is atomic within one filesystem
 * Last updated: 2026-10-19
 */

#pragma once
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>

// Atomic file writer: writes to <path>.tmp, fsyncs, then rename() to final.
// Readers see either the previous file or the complete new one.
inline void write_atomic(const std::filesystem::path &final_path, const std::string &data)
{
    std::filesystem::path tmp = final_path;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
            throw std::runtime_error("failed to open temp file: " + tmp.string());
        ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
        ofs.flush();
        if (!ofs)
            throw std::runtime_error("failed to write temp file: " + tmp.string());
    }
    int fd = ::open(tmp.c_str(), O_RDONLY);
    if (fd >= 0)
    {
        ::fsync(fd);
        ::close(fd);
    }
    if (::rename(tmp.c_str(), final_path.c_str()) != 0)
    {
        const std::string why = std::strerror(errno);
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error("failed to rename " + tmp.string() + ": " + why);
    }
}

inline bool read_file_all(const std::filesystem::path &p, std::string &out)
{
    std::ifstream f(p, std::ios::binary);
    if (!f)
        return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}
