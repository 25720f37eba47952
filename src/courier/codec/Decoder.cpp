//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Decoder.cpp
// Purpose: Non-template parts of typed decoding and UTF-8 validation
//==========================================================================================================

#include <fmt/format.h>
#include "courier/codec/Decoder.h"

namespace courier {
namespace codec {

namespace detail {

bool IsNull(const JSONValue& v) {
    return std::holds_alternative<std::nullptr_t>(v.value);
}

std::vector<std::string> ChildPath(const std::vector<std::string>& path, std::string component) {
    std::vector<std::string> out(path);
    out.push_back(std::move(component));
    return out;
}

void ThrowTypeMismatch(const std::vector<std::string>& path, const std::string& expected, const JSONValue& found) {
    throw DecodeError(DecodeErrorKind::TypeMismatch, path,
                      fmt::format("Expected to decode {} but found {} instead.", expected, JSONTypeName(found)));
}

void ThrowValueNotFound(const std::vector<std::string>& path, const std::string& expected) {
    throw DecodeError(DecodeErrorKind::ValueNotFound, path,
                      fmt::format("Expected {} value but found null instead.", expected));
}

void ThrowNumberDoesNotFit(const std::vector<std::string>& path, const JSONValue& number, const std::string& target) {
    std::string text;
    if (const auto* i = std::get_if<int64_t>(&number.value)) {
        text = std::to_string(*i);
    } else if (const auto* d = std::get_if<double>(&number.value)) {
        text = fmt::format("{}", *d);
    }
    throw DecodeError(DecodeErrorKind::DataCorrupted, path,
                      fmt::format("Parsed JSON number <{}> does not fit in {}.", text, target));
}

} // namespace detail

bool Decoder::Contains(const std::string& key) const {
    return findMember(key) != nullptr;
}

DecodeError Decoder::DataCorruptedError(const std::string& description) const {
    return DecodeError(DecodeErrorKind::DataCorrupted, path_, description);
}

DecodeError Decoder::DataCorruptedError(const std::string& key, const std::string& description) const {
    return DecodeError(DecodeErrorKind::DataCorrupted, detail::ChildPath(path_, key), description);
}

const JSONValue::Object& Decoder::requireObject() const {
    if (detail::IsNull(*value_)) {
        detail::ThrowValueNotFound(path_, "object");
    }
    const auto* obj = std::get_if<JSONValue::Object>(&value_->value);
    if (obj == nullptr) {
        detail::ThrowTypeMismatch(path_, "object", *value_);
    }
    return *obj;
}

const JSONValue& Decoder::requireMember(const std::string& key) const {
    const auto& obj = requireObject();
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        throw DecodeError(DecodeErrorKind::KeyNotFound, path_,
                          fmt::format("No value associated with key \"{}\".", key), key);
    }
    return *it->second;
}

const JSONValue* Decoder::findMember(const std::string& key) const {
    const auto& obj = requireObject();
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

bool IsValidUtf8(const std::string& bytes) {
    std::size_t i = 0;
    const std::size_t n = bytes.size();
    while (i < n) {
        const unsigned char c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }
        std::size_t len = 0;
        unsigned int cp = 0;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1Fu; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0Fu; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07u; }
        else { return false; }
        if (i + len > n) {
            return false;
        }
        for (std::size_t k = 1; k < len; ++k) {
            const unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3Fu);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
            return false; // overlong
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

} // namespace codec
} // namespace courier
