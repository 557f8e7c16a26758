// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <rosewire/api/Amount.h>
#include <rosewire/api/Identifiers.h>
#include <rosewire/api/MapObject.h>
#include <rosewire/api/Optional.h>
#include <rosewire/util/Buffer.h>

namespace rosewire::api {

/// @brief Encodes the opening of a request object for the given
/// network, i.e. {"network_identifier":{...},
///
/// A client talks to a single network, so it encodes this once and
/// passes it to the encodeJson(buf, prefix) method of every request
/// it sends.
///
std::string encodeNetworkPrefix(const NetworkIdentifier& network);

/// Checks whether the given network appears in the list.
bool inNetworkList(const std::vector<NetworkIdentifier>& list,
    const NetworkIdentifier& network);

// Request entities. Each has two ways to encode itself:
// - encodeJson(buf) writes the networkIdentifier field itself
// - encodeJson(buf, prefix) writes the given prefix (as produced by
//   encodeNetworkPrefix) in place of the opening brace and the
//   networkIdentifier field, which is then ignored; the prefix
//   must not be empty
// Both produce the same bytes for the same network.

struct AccountBalanceRequest
{
    NetworkIdentifier networkIdentifier;
    AccountIdentifier accountIdentifier;
    Optional<PartialBlockIdentifier> blockIdentifier;
    std::vector<Currency> currencies;

    Buffer& encodeJson(Buffer& buf) const;
    Buffer& encodeJson(Buffer& buf, std::string_view prefix) const;
    void reset();
    bool operator==(const AccountBalanceRequest&) const = default;

private:
    Buffer& encodeFields(Buffer& buf) const;
};

struct BlockRequest
{
    NetworkIdentifier networkIdentifier;
    PartialBlockIdentifier blockIdentifier;

    Buffer& encodeJson(Buffer& buf) const;
    Buffer& encodeJson(Buffer& buf, std::string_view prefix) const;
    void reset();
    bool operator==(const BlockRequest&) const = default;

private:
    Buffer& encodeFields(Buffer& buf) const;
};

/// @brief A request that carries nothing but the network and
/// optional metadata, used by /network/status and /network/options.
struct NetworkRequest
{
    NetworkIdentifier networkIdentifier;
    MapObject metadata;

    Buffer& encodeJson(Buffer& buf) const;
    Buffer& encodeJson(Buffer& buf, std::string_view prefix) const;
    void reset();
    bool operator==(const NetworkRequest&) const = default;

private:
    Buffer& encodeFields(Buffer& buf) const;
};

} // namespace rosewire::api
