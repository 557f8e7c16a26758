// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <rosewire/api/Identifiers.h>
#include <rosewire/api/Optional.h>
#include <rosewire/util/Buffer.h>

namespace rosewire::api {

enum class CurveType
{
    SECP256K1,
    SECP256K1_BIP340,
    SECP256R1,
    EDWARDS25519,
    TWEEDLE,
    PALLAS
};

enum class SignatureType
{
    ECDSA,
    ECDSA_RECOVERY,
    ED25519,
    SCHNORR_1,
    SCHNORR_BIP340,
    SCHNORR_POSEIDON
};

/// Returns the wire name of the curve type (e.g. "secp256k1").
std::string_view toString(CurveType type) noexcept;
std::string_view toString(SignatureType type) noexcept;

/// @throws ValidationException if s is not a known curve type
CurveType parseCurveType(std::string_view s);

/// @throws ValidationException if s is not a known signature type
SignatureType parseSignatureType(std::string_view s);

struct PublicKey
{
    CurveType curveType = CurveType::SECP256K1;
    std::vector<uint8_t> hexBytes;

    Buffer& encodeJson(Buffer& buf) const;
    void reset();
    bool operator==(const PublicKey&) const = default;
};

/// @brief A payload to be signed. Either accountIdentifier or
/// the deprecated address should be set.
struct SigningPayload
{
    Optional<AccountIdentifier> accountIdentifier;
    Optional<std::string> address;
    std::vector<uint8_t> hexBytes;
    Optional<SignatureType> signatureType;

    Buffer& encodeJson(Buffer& buf) const;
    void reset();
    bool operator==(const SigningPayload&) const = default;
};

} // namespace rosewire::api
