// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <rosewire/io/FileInputStream.h>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <rosewire/io/IOException.h>
#include <rosewire/util/log.h>

namespace rosewire {

FileInputStream::FileInputStream(const char* fileName)
{
    fd_ = ::open(fileName, O_RDONLY | O_CLOEXEC);
    if (fd_ < 0)
    {
        fd_ = INVALID;
        if (errno == ENOENT) throw FileNotFoundException(fileName);
        throw IOException(IOException::errorMessage(fileName));
    }
}

size_t FileInputStream::read(void* buf, size_t length)
{
    if (fd_ == INVALID) throw IOException("Stream is closed");
    for (;;)
    {
        ssize_t n = ::read(fd_, buf, length);
        if (n >= 0) return static_cast<size_t>(n);
        if (errno == EINTR) continue;
        throw IOException();
    }
}

void FileInputStream::close() noexcept
{
    if (fd_ != INVALID)
    {
        if (::close(fd_) != 0)
        {
            // Nothing left to recover for a read-only descriptor
            LOG("close(%d) failed: %s", fd_, IOException::errorMessage().c_str());
        }
        fd_ = INVALID;
    }
}

} // namespace rosewire
