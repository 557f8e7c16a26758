// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <rosewire/api/Requests.h>
#include <algorithm>
#include <cassert>
#include <rosewire/api/Encoding.h>

namespace rosewire::api {

// Writes the opening brace and the network_identifier field,
// including its trailing comma
static void appendNetwork(Buffer& buf, const NetworkIdentifier& network)
{
    buf.writeByte('{');
    appendEntityField(buf, "network_identifier", network);
}

std::string encodeNetworkPrefix(const NetworkIdentifier& network)
{
    Buffer buf(128);
    appendNetwork(buf, network);
    return buf.toString();
}

bool inNetworkList(const std::vector<NetworkIdentifier>& list,
    const NetworkIdentifier& network)
{
    return std::find(list.begin(), list.end(), network) != list.end();
}

Buffer& AccountBalanceRequest::encodeJson(Buffer& buf) const
{
    appendNetwork(buf, networkIdentifier);
    return encodeFields(buf);
}

Buffer& AccountBalanceRequest::encodeJson(Buffer& buf, std::string_view prefix) const
{
    assert(!prefix.empty());
    buf.write(prefix);
    return encodeFields(buf);
}

Buffer& AccountBalanceRequest::encodeFields(Buffer& buf) const
{
    appendEntityField(buf, "account_identifier", accountIdentifier);
    if (blockIdentifier)
    {
        appendEntityField(buf, "block_identifier", blockIdentifier.value());
    }
    if (!currencies.empty())
    {
        Json::appendKey(buf, "currencies");
        appendEntityArray(buf, currencies);
        buf.writeByte(',');
    }
    return Json::endObject(buf);
}

void AccountBalanceRequest::reset()
{
    networkIdentifier.reset();
    accountIdentifier.reset();
    blockIdentifier.value().reset();
    blockIdentifier.reset();
    currencies.clear();
}

Buffer& BlockRequest::encodeJson(Buffer& buf) const
{
    appendNetwork(buf, networkIdentifier);
    return encodeFields(buf);
}

Buffer& BlockRequest::encodeJson(Buffer& buf, std::string_view prefix) const
{
    assert(!prefix.empty());
    buf.write(prefix);
    return encodeFields(buf);
}

Buffer& BlockRequest::encodeFields(Buffer& buf) const
{
    appendEntityField(buf, "block_identifier", blockIdentifier);
    return Json::endObject(buf);
}

void BlockRequest::reset()
{
    networkIdentifier.reset();
    blockIdentifier.reset();
}

Buffer& NetworkRequest::encodeJson(Buffer& buf) const
{
    appendNetwork(buf, networkIdentifier);
    return encodeFields(buf);
}

Buffer& NetworkRequest::encodeJson(Buffer& buf, std::string_view prefix) const
{
    assert(!prefix.empty());
    buf.write(prefix);
    return encodeFields(buf);
}

Buffer& NetworkRequest::encodeFields(Buffer& buf) const
{
    appendMetadataField(buf, "metadata", metadata);
    return Json::endObject(buf);
}

void NetworkRequest::reset()
{
    networkIdentifier.reset();
    metadata.reset();
}

} // namespace rosewire::api
