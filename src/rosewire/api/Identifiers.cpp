// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <rosewire/api/Identifiers.h>
#include <rosewire/api/Encoding.h>

namespace rosewire::api {

Buffer& SubNetworkIdentifier::encodeJson(Buffer& buf) const
{
    buf.writeByte('{');
    appendMetadataField(buf, "metadata", metadata);
    appendStringField(buf, "network", network);
    return Json::endObject(buf);
}

void SubNetworkIdentifier::reset()
{
    metadata.reset();
    network.clear();
}

Buffer& NetworkIdentifier::encodeJson(Buffer& buf) const
{
    buf.writeByte('{');
    appendStringField(buf, "blockchain", blockchain);
    appendStringField(buf, "network", network);
    if (subNetworkIdentifier)
    {
        appendEntityField(buf, "sub_network_identifier",
            subNetworkIdentifier.value());
    }
    return Json::endObject(buf);
}

void NetworkIdentifier::reset()
{
    blockchain.clear();
    network.clear();
    subNetworkIdentifier.value().reset();
    subNetworkIdentifier.reset();
}

Buffer& BlockIdentifier::encodeJson(Buffer& buf) const
{
    buf.writeByte('{');
    appendStringField(buf, "hash", hash);
    appendIntField(buf, "index", index);
    return Json::endObject(buf);
}

void BlockIdentifier::reset()
{
    hash.clear();
    index = 0;
}

Buffer& PartialBlockIdentifier::encodeJson(Buffer& buf) const
{
    buf.writeByte('{');
    if (hash) appendStringField(buf, "hash", hash.value());
    if (index) appendIntField(buf, "index", index.value());
    return Json::endObject(buf);
}

void PartialBlockIdentifier::reset()
{
    hash.value().clear();
    hash.reset();
    index.reset();
}

Buffer& SubAccountIdentifier::encodeJson(Buffer& buf) const
{
    buf.writeByte('{');
    appendStringField(buf, "address", address);
    appendMetadataField(buf, "metadata", metadata);
    return Json::endObject(buf);
}

void SubAccountIdentifier::reset()
{
    address.clear();
    metadata.reset();
}

Buffer& AccountIdentifier::encodeJson(Buffer& buf) const
{
    buf.writeByte('{');
    appendStringField(buf, "address", address);
    appendMetadataField(buf, "metadata", metadata);
    if (subAccount)
    {
        appendEntityField(buf, "sub_account", subAccount.value());
    }
    return Json::endObject(buf);
}

void AccountIdentifier::reset()
{
    address.clear();
    metadata.reset();
    subAccount.value().reset();
    subAccount.reset();
}

Buffer& TransactionIdentifier::encodeJson(Buffer& buf) const
{
    buf.writeByte('{');
    appendStringField(buf, "hash", hash);
    return Json::endObject(buf);
}

void TransactionIdentifier::reset()
{
    hash.clear();
}

Buffer& OperationIdentifier::encodeJson(Buffer& buf) const
{
    buf.writeByte('{');
    appendIntField(buf, "index", index);
    if (networkIndex) appendIntField(buf, "network_index", networkIndex.value());
    return Json::endObject(buf);
}

void OperationIdentifier::reset()
{
    index = 0;
    networkIndex.reset();
}

} // namespace rosewire::api
