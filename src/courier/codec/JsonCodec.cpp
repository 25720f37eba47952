//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonCodec.cpp
// Purpose: JSON codec and decode error plumbing
//==========================================================================================================

#include "courier/codec/Codec.h"
#include "logging/Logger.h"

namespace courier {
namespace codec {

const char* ToString(DecodeErrorKind kind) {
    switch (kind) {
        case DecodeErrorKind::KeyNotFound: return "keyNotFound";
        case DecodeErrorKind::TypeMismatch: return "typeMismatch";
        case DecodeErrorKind::ValueNotFound: return "valueNotFound";
        case DecodeErrorKind::DataCorrupted: return "dataCorrupted";
    }
    return "dataCorrupted";
}

std::string JoinCodingPath(const std::vector<std::string>& path) {
    std::string out;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) {
            out.push_back('.');
        }
        out += path[i];
    }
    return out;
}

DecodeError::DecodeError(DecodeErrorKind kind, std::vector<std::string> codingPath, std::string description,
                         std::string key)
    : std::runtime_error(std::string(ToString(kind)) + ": " + description),
      kind_(kind), codingPath_(std::move(codingPath)), key_(std::move(key)), description_(std::move(description)) {}

std::string JsonCodec::Encode(const JSONValue& value) const {
    try {
        return SerializeJSON(value);
    } catch (const JSONError& e) {
        throw EncodeError(e.what());
    }
}

JSONValue JsonCodec::Decode(const std::string& bytes) const {
    try {
        return ParseJSON(bytes);
    } catch (const JSONError& e) {
        LOG_DEBUG("JsonCodec: body of {} bytes is not valid JSON: {}", bytes.size(), e.what());
        throw DecodeError(DecodeErrorKind::DataCorrupted, {},
                          std::string("The given data was not valid JSON. ") + e.what());
    }
}

} // namespace codec
} // namespace courier
