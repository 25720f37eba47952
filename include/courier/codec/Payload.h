//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Payload.h
// Purpose: Request body encoding and response payload decoding modes
//==========================================================================================================

#pragma once

#include <concepts>
#include <string>
#include <type_traits>

#include "courier/JSONValue.h"
#include "courier/codec/Codec.h"
#include "courier/codec/Decoder.h"

namespace courier {

// Raw body bytes, passed through untouched in both directions.
struct Bytes {
    static constexpr const char* kTypeName = "Bytes";
    std::string data;
    bool operator==(const Bytes&) const = default;
};

// Response mode that ignores the body (204 No Content and friends).
struct Empty {
    static constexpr const char* kTypeName = "Empty";
    bool operator==(const Empty&) const = default;
};

namespace codec {

// A body type that renders itself as JSON.
template <typename T>
concept Encodable = requires(const T& t) {
    { t.ToJSON() } -> std::convertible_to<JSONValue>;
};

template <typename T>
concept EncodableBody = std::is_same_v<T, Bytes> || std::is_same_v<T, std::string> ||
                        std::is_same_v<T, JSONValue> || Encodable<T>;

//==========================================================================================================
// EncodePayload
// Purpose: Produces request body bytes.
//   Bytes: data as-is.  std::string: text as-is.  JSONValue / Encodable: codec.Encode.
// Throws: EncodeError (from the codec).
//==========================================================================================================
template <EncodableBody B>
std::string EncodePayload(const ICodec& codec, const B& body) {
    if constexpr (std::is_same_v<B, Bytes>) {
        return body.data;
    } else if constexpr (std::is_same_v<B, std::string>) {
        return body;
    } else if constexpr (std::is_same_v<B, JSONValue>) {
        return codec.Encode(body);
    } else {
        return codec.Encode(body.ToJSON());
    }
}

//==========================================================================================================
// DecodePayload
// Purpose: Converts a 2xx response body into the caller's payload type.
//   Bytes: pass-through.  Empty: body ignored.  std::string: UTF-8 text (DataCorrupted, empty coding path,
//   when the bytes are not valid UTF-8).  JSONValue: parsed tree.  Anything else: DecodeJSON<R>.
// Throws: DecodeError.
//==========================================================================================================
template <typename R>
R DecodePayload(const ICodec& codec, const std::string& body) {
    if constexpr (std::is_same_v<R, Bytes>) {
        return Bytes{body};
    } else if constexpr (std::is_same_v<R, Empty>) {
        return Empty{};
    } else if constexpr (std::is_same_v<R, std::string>) {
        if (!IsValidUtf8(body)) {
            throw DecodeError(DecodeErrorKind::DataCorrupted, {}, "The given data was not valid UTF-8 text.");
        }
        return body;
    } else if constexpr (std::is_same_v<R, JSONValue>) {
        return codec.Decode(body);
    } else {
        const JSONValue tree = codec.Decode(body);
        return DecodeJSON<R>(tree);
    }
}

} // namespace codec
} // namespace courier
