//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DecodeErrorMapper.cpp
// Purpose: Field path extraction for decoding failures
//==========================================================================================================

#include "courier/errors/DecodeErrorMapper.h"
#include "courier/codec/Codec.h"
#include "logging/Logger.h"

namespace courier {
namespace errors {

std::string mapKeyPath(const std::exception& error, const std::string& typeName) {
    const auto* decodeError = dynamic_cast<const codec::DecodeError*>(&error);
    if (decodeError == nullptr) {
        LOG_DEBUG("mapKeyPath: {} failed with unclassified error: {}", typeName, error.what());
        return "root";
    }
    switch (decodeError->kind()) {
        case codec::DecodeErrorKind::KeyNotFound: {
            auto path = decodeError->codingPath();
            path.push_back(decodeError->key());
            return codec::JoinCodingPath(path);
        }
        case codec::DecodeErrorKind::TypeMismatch:
        case codec::DecodeErrorKind::ValueNotFound:
        case codec::DecodeErrorKind::DataCorrupted:
            return codec::JoinCodingPath(decodeError->codingPath());
    }
    return "root";
}

RequestError mapDecodingError(std::exception_ptr error, const std::string& typeName) {
    std::string fieldPath = "root";
    std::optional<codec::DecodeErrorKind> decodeKind;
    try {
        std::rethrow_exception(error);
    } catch (const codec::DecodeError& e) {
        fieldPath = mapKeyPath(e, typeName);
        decodeKind = e.kind();
    } catch (const std::exception& e) {
        fieldPath = mapKeyPath(e, typeName);
    } catch (...) {
        LOG_DEBUG("mapDecodingError: {} failed with a non-standard exception", typeName);
    }
    return decoding(typeName, std::move(fieldPath), std::move(error), decodeKind);
}

} // namespace errors
} // namespace courier
