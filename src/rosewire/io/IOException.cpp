// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <rosewire/io/IOException.h>
#include <cerrno>
#include <system_error>

namespace rosewire {

IOException::IOException()
    : std::runtime_error(errorMessage())
{
}

std::string IOException::errorMessage()
{
    return std::generic_category().message(errno);
}

std::string IOException::errorMessage(const char* fileName)
{
    std::string msg(fileName);
    msg += ": ";
    msg += errorMessage();
    return msg;
}

} // namespace rosewire
