//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Codec.h
// Purpose: Body codec interface, JSON implementation and the classified encode/decode exceptions
//==========================================================================================================

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "courier/JSONValue.h"

namespace courier {
namespace codec {

//==========================================================================================================
// DecodeErrorKind
// Purpose: Shape of a decoding failure.
//   KeyNotFound: A required key is absent. codingPath is the container path; key names the absent key.
//   TypeMismatch: A value has the wrong JSON type. codingPath ends at the offending value.
//   ValueNotFound: A required value is null. codingPath ends at the null value.
//   DataCorrupted: Input is not valid JSON/UTF-8, or a value is present but unusable (overflow, rejected
//                  enumeration string). codingPath ends at the offending value ("" for the whole body).
//==========================================================================================================
enum class DecodeErrorKind {
    KeyNotFound,
    TypeMismatch,
    ValueNotFound,
    DataCorrupted
};

const char* ToString(DecodeErrorKind kind);

// Dotted rendering of a coding path ("a.b.0.c"); "" for an empty path.
std::string JoinCodingPath(const std::vector<std::string>& path);

class DecodeError : public std::runtime_error {
public:
    DecodeError(DecodeErrorKind kind, std::vector<std::string> codingPath, std::string description,
                std::string key = std::string());

    DecodeErrorKind kind() const noexcept { return kind_; }
    const std::vector<std::string>& codingPath() const noexcept { return codingPath_; }
    // Missing key for KeyNotFound; empty otherwise.
    const std::string& key() const noexcept { return key_; }
    const std::string& description() const noexcept { return description_; }

private:
    DecodeErrorKind kind_;
    std::vector<std::string> codingPath_;
    std::string key_;
    std::string description_;
};

class EncodeError : public std::runtime_error {
public:
    explicit EncodeError(const std::string& what) : std::runtime_error(what) {}
};

//==========================================================================================================
// ICodec
// Purpose: Converts between JSONValue trees and body bytes.
// Methods:
//   Encode(value): Serializes; throws EncodeError for values the format cannot carry.
//   Decode(bytes): Parses; throws DecodeError (DataCorrupted, empty path) for malformed input.
//   ContentType(): Media type of the produced bytes.
//==========================================================================================================
class ICodec {
public:
    virtual ~ICodec() = default;
    virtual std::string Encode(const JSONValue& value) const = 0;
    virtual JSONValue Decode(const std::string& bytes) const = 0;
    virtual std::string ContentType() const = 0;
};

//==========================================================================================================
// JsonCodec
// Purpose: Compact JSON with object keys written in sorted order (equal values encode to equal bytes).
//==========================================================================================================
class JsonCodec : public ICodec {
public:
    std::string Encode(const JSONValue& value) const override;
    JSONValue Decode(const std::string& bytes) const override;
    std::string ContentType() const override { return "application/json"; }
};

} // namespace codec
} // namespace courier
