/*
 * File: include/atomic_write.hpp
 * Project: Display Relay
 * Purpose: Write an uploaded file so viewers never see a partial one
 * Notes:
 *  - <path>.part is written and fsynced, then renamed over the final name
 * Last updated: 2026-10-18
 */

#pragma once
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

inline void write_atomic(const std::filesystem::path &final_path, const void *data, size_t n)
{
    std::filesystem::path tmp = final_path;
    tmp += ".part";

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
        throw std::runtime_error("open " + tmp.string() + " failed: " + std::strerror(errno));

    const char *p = static_cast<const char *>(data);
    size_t left = n;
    while (left > 0)
    {
        ssize_t w = ::write(fd, p, left);
        if (w < 0)
        {
            if (errno == EINTR)
                continue;
            int err = errno;
            ::close(fd);
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            throw std::runtime_error("write " + tmp.string() + " failed: " + std::strerror(err));
        }
        p += w;
        left -= static_cast<size_t>(w);
    }
    ::fsync(fd);
    ::close(fd);

    std::error_code ec;
    std::filesystem::rename(tmp, final_path, ec);
    if (ec)
    {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw std::runtime_error("rename " + tmp.string() + " failed: " + ec.message());
    }
}

inline void write_atomic(const std::filesystem::path &final_path, const std::string &data)
{
    write_atomic(final_path, data.data(), data.size());
}
