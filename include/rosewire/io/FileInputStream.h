// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <rosewire/io/InputStream.h>

namespace rosewire {

/// @brief An InputStream that reads from a POSIX file descriptor.
///
/// The stream owns its descriptor and closes it on close() or
/// on destruction, whichever comes first.
///
class FileInputStream : public InputStream
{
public:
    static constexpr int INVALID = -1;

    /// Opens the given file for reading. Throws
    /// FileNotFoundException or IOException on failure.
    explicit FileInputStream(const char* fileName);

    /// Takes ownership of an open descriptor (e.g. a pipe).
    explicit FileInputStream(int fd) noexcept : fd_(fd) {}

    FileInputStream(FileInputStream&& other) noexcept :
        fd_(other.fd_)
    {
        other.fd_ = INVALID;
    }

    FileInputStream(const FileInputStream&) = delete;
    FileInputStream& operator=(const FileInputStream&) = delete;

    ~FileInputStream() override { close(); }

    bool isOpen() const noexcept { return fd_ != INVALID; }

    size_t read(void* buf, size_t length) override;
    void close() noexcept override;

private:
    int fd_;
};

} // namespace rosewire
