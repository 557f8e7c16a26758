// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <rosewire/api/Amount.h>
#include <rosewire/api/Identifiers.h>
#include <rosewire/api/MapObject.h>
#include <rosewire/api/Optional.h>
#include <rosewire/util/Buffer.h>

namespace rosewire::api {

/// @brief A single balance-changing action within a Transaction.
///
/// relatedOperations is optional on the wire; it is omitted when
/// empty.
///
struct Operation
{
    Optional<AccountIdentifier> account;
    Optional<Amount> amount;
    MapObject metadata;
    OperationIdentifier operationIdentifier;
    std::vector<OperationIdentifier> relatedOperations;
    Optional<std::string> status;
    std::string type;

    Buffer& encodeJson(Buffer& buf) const;
    void reset();
    bool operator==(const Operation&) const = default;
};

struct Transaction
{
    MapObject metadata;
    std::vector<Operation> operations;
    TransactionIdentifier transactionIdentifier;

    Buffer& encodeJson(Buffer& buf) const;
    void reset();
    bool operator==(const Transaction&) const = default;
};

struct Block
{
    BlockIdentifier blockIdentifier;
    MapObject metadata;
    BlockIdentifier parentBlockIdentifier;
    int64_t timestamp = 0;      // milliseconds since the Unix epoch
    std::vector<Transaction> transactions;

    Buffer& encodeJson(Buffer& buf) const;
    void reset();
    bool operator==(const Block&) const = default;
};

} // namespace rosewire::api
