// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <rosewire/api/Amount.h>
#include <rosewire/api/Block.h>
#include <rosewire/api/Crypto.h>
#include <rosewire/api/Error.h>
#include <rosewire/api/Identifiers.h>
#include <rosewire/api/MapObject.h>
#include <rosewire/api/Optional.h>
#include <rosewire/api/Requests.h>
#include <rosewire/api/ValidationException.h>
#include <rosewire/io/FileInputStream.h>
#include <rosewire/io/IOException.h>
#include <rosewire/json/DecodeBuffer.h>
#include <rosewire/json/Json.h>
#include <rosewire/json/JsonException.h>
#include <rosewire/retry/RetryConfig.h>
#include <rosewire/retry/RetryHandler.h>
#include <rosewire/util/Buffer.h>
