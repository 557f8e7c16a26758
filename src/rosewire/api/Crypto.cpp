// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <rosewire/api/Crypto.h>
#include <iterator>
#include <string>
#include <rosewire/api/Encoding.h>
#include <rosewire/api/ValidationException.h>

namespace rosewire::api {

namespace {

constexpr std::string_view CURVE_TYPES[] =
{
    "secp256k1",
    "secp256k1_bip340",
    "secp256r1",
    "edwards25519",
    "tweedle",
    "pallas"
};

constexpr std::string_view SIGNATURE_TYPES[] =
{
    "ecdsa",
    "ecdsa_recovery",
    "ed25519",
    "schnorr_1",
    "schnorr_bip340",
    "schnorr_poseidon"
};

} // namespace

std::string_view toString(CurveType type) noexcept
{
    return CURVE_TYPES[static_cast<int>(type)];
}

std::string_view toString(SignatureType type) noexcept
{
    return SIGNATURE_TYPES[static_cast<int>(type)];
}

CurveType parseCurveType(std::string_view s)
{
    for (size_t i = 0; i < std::size(CURVE_TYPES); i++)
    {
        if (CURVE_TYPES[i] == s) return static_cast<CurveType>(i);
    }
    throw ValidationException("api: invalid CurveType value: \"" +
        std::string(s) + "\"");
}

SignatureType parseSignatureType(std::string_view s)
{
    for (size_t i = 0; i < std::size(SIGNATURE_TYPES); i++)
    {
        if (SIGNATURE_TYPES[i] == s) return static_cast<SignatureType>(i);
    }
    throw ValidationException("api: invalid SignatureType value: \"" +
        std::string(s) + "\"");
}

Buffer& PublicKey::encodeJson(Buffer& buf) const
{
    buf.writeByte('{');
    appendStringField(buf, "curve_type", toString(curveType));
    Json::appendKey(buf, "hex_bytes");
    Json::appendHexBytes(buf, hexBytes);
    buf.writeByte(',');
    return Json::endObject(buf);
}

void PublicKey::reset()
{
    curveType = CurveType::SECP256K1;
    hexBytes.clear();
}

Buffer& SigningPayload::encodeJson(Buffer& buf) const
{
    buf.writeByte('{');
    if (accountIdentifier)
    {
        appendEntityField(buf, "account_identifier", accountIdentifier.value());
    }
    if (address) appendStringField(buf, "address", address.value());
    Json::appendKey(buf, "hex_bytes");
    Json::appendHexBytes(buf, hexBytes);
    buf.writeByte(',');
    if (signatureType)
    {
        appendStringField(buf, "signature_type", toString(signatureType.value()));
    }
    return Json::endObject(buf);
}

void SigningPayload::reset()
{
    accountIdentifier.value().reset();
    accountIdentifier.reset();
    address.value().clear();
    address.reset();
    hexBytes.clear();
    signatureType.reset();
}

} // namespace rosewire::api
