// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <rosewire/api/Amount.h>
#include <rosewire/api/Encoding.h>

namespace rosewire::api {

Buffer& Currency::encodeJson(Buffer& buf) const
{
    buf.writeByte('{');
    appendIntField(buf, "decimals", decimals);
    appendMetadataField(buf, "metadata", metadata);
    appendStringField(buf, "symbol", symbol);
    return Json::endObject(buf);
}

void Currency::reset()
{
    decimals = 0;
    metadata.reset();
    symbol.clear();
}

Buffer& Amount::encodeJson(Buffer& buf) const
{
    buf.writeByte('{');
    appendEntityField(buf, "currency", currency);
    appendMetadataField(buf, "metadata", metadata);
    appendStringField(buf, "value", value);
    return Json::endObject(buf);
}

void Amount::reset()
{
    currency.reset();
    metadata.reset();
    value.clear();
}

} // namespace rosewire::api
