// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <rosewire/api/Error.h>
#include <rosewire/api/Encoding.h>

namespace rosewire::api {

Buffer& Error::encodeJson(Buffer& buf) const
{
    buf.writeByte('{');
    appendIntField(buf, "code", code);
    if (description) appendStringField(buf, "description", description.value());
    appendMetadataField(buf, "details", details);
    appendStringField(buf, "message", message);
    Json::appendKey(buf, "retriable");
    Json::appendBool(buf, retriable);
    buf.writeByte(',');
    return Json::endObject(buf);
}

void Error::reset()
{
    code = 0;
    description.value().clear();
    description.reset();
    details.reset();
    message.clear();
    retriable = false;
}

} // namespace rosewire::api
