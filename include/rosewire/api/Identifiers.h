// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <cstdint>
#include <string>
#include <rosewire/api/MapObject.h>
#include <rosewire/api/Optional.h>
#include <rosewire/util/Buffer.h>

// Identifier records of the Rosetta Data API. Fields are declared
// in wire-key order, which is the order encodeJson() emits them in.
// An empty metadata MapObject means the field is absent.

namespace rosewire::api {

struct SubNetworkIdentifier
{
    MapObject metadata;
    std::string network;

    Buffer& encodeJson(Buffer& buf) const;
    void reset();
    bool operator==(const SubNetworkIdentifier&) const = default;
};

/// @brief Specifies which network a request is for.
///
/// Request entities normally don't encode this themselves: the
/// client encodes it once with encodeNetworkPrefix() and reuses
/// the bytes for every call.
///
struct NetworkIdentifier
{
    std::string blockchain;
    std::string network;
    Optional<SubNetworkIdentifier> subNetworkIdentifier;

    Buffer& encodeJson(Buffer& buf) const;
    void reset();
    bool operator==(const NetworkIdentifier&) const = default;
};

struct BlockIdentifier
{
    std::string hash;
    int64_t index = 0;

    Buffer& encodeJson(Buffer& buf) const;
    void reset();
    bool operator==(const BlockIdentifier&) const = default;
};

/// @brief Identifies a block by hash, index, both or neither
/// (the latter meaning the current block).
struct PartialBlockIdentifier
{
    Optional<std::string> hash;
    Optional<int64_t> index;

    Buffer& encodeJson(Buffer& buf) const;
    void reset();
    bool operator==(const PartialBlockIdentifier&) const = default;
};

struct SubAccountIdentifier
{
    std::string address;
    MapObject metadata;

    Buffer& encodeJson(Buffer& buf) const;
    void reset();
    bool operator==(const SubAccountIdentifier&) const = default;
};

struct AccountIdentifier
{
    std::string address;
    MapObject metadata;
    Optional<SubAccountIdentifier> subAccount;

    Buffer& encodeJson(Buffer& buf) const;
    void reset();
    bool operator==(const AccountIdentifier&) const = default;
};

struct TransactionIdentifier
{
    std::string hash;

    Buffer& encodeJson(Buffer& buf) const;
    void reset();
    bool operator==(const TransactionIdentifier&) const = default;
};

struct OperationIdentifier
{
    int64_t index = 0;
    Optional<int64_t> networkIndex;

    Buffer& encodeJson(Buffer& buf) const;
    void reset();
    bool operator==(const OperationIdentifier&) const = default;
};

} // namespace rosewire::api
