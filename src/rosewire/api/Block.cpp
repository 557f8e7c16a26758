// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <rosewire/api/Block.h>
#include <rosewire/api/Encoding.h>

namespace rosewire::api {

Buffer& Operation::encodeJson(Buffer& buf) const
{
    buf.writeByte('{');
    if (account) appendEntityField(buf, "account", account.value());
    if (amount) appendEntityField(buf, "amount", amount.value());
    appendMetadataField(buf, "metadata", metadata);
    appendEntityField(buf, "operation_identifier", operationIdentifier);
    if (!relatedOperations.empty())
    {
        Json::appendKey(buf, "related_operations");
        appendEntityArray(buf, relatedOperations);
        buf.writeByte(',');
    }
    if (status) appendStringField(buf, "status", status.value());
    appendStringField(buf, "type", type);
    return Json::endObject(buf);
}

void Operation::reset()
{
    account.value().reset();
    account.reset();
    amount.value().reset();
    amount.reset();
    metadata.reset();
    operationIdentifier.reset();
    relatedOperations.clear();
    status.value().clear();
    status.reset();
    type.clear();
}

Buffer& Transaction::encodeJson(Buffer& buf) const
{
    buf.writeByte('{');
    appendMetadataField(buf, "metadata", metadata);
    Json::appendKey(buf, "operations");
    appendEntityArray(buf, operations);
    buf.writeByte(',');
    appendEntityField(buf, "transaction_identifier", transactionIdentifier);
    return Json::endObject(buf);
}

void Transaction::reset()
{
    metadata.reset();
    operations.clear();
    transactionIdentifier.reset();
}

Buffer& Block::encodeJson(Buffer& buf) const
{
    buf.writeByte('{');
    appendEntityField(buf, "block_identifier", blockIdentifier);
    appendMetadataField(buf, "metadata", metadata);
    appendEntityField(buf, "parent_block_identifier", parentBlockIdentifier);
    appendIntField(buf, "timestamp", timestamp);
    Json::appendKey(buf, "transactions");
    appendEntityArray(buf, transactions);
    buf.writeByte(',');
    return Json::endObject(buf);
}

void Block::reset()
{
    blockIdentifier.reset();
    metadata.reset();
    parentBlockIdentifier.reset();
    timestamp = 0;
    transactions.clear();
}

} // namespace rosewire::api
