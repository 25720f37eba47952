//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DecodeErrorMapper.h
// Purpose: Turn payload decoding exceptions into a structured (type name, field path) failure
//==========================================================================================================

#pragma once

#include <exception>
#include <string>

#include "courier/errors/Errors.h"

namespace courier {
namespace errors {

//==========================================================================================================
// mapKeyPath
// Purpose: Dotted field path of a decoding failure.
// Args:
//   error: Exception raised while decoding.
//   typeName: Decoding target; accepted for symmetry with mapDecodingError and not part of the path.
// Returns:
//   KeyNotFound: container path plus the missing key ("address.zip").
//   TypeMismatch / ValueNotFound / DataCorrupted: path of the offending value ("id", "" for the body).
//   Any exception that is not a codec::DecodeError: "root".
//==========================================================================================================
std::string mapKeyPath(const std::exception& error, const std::string& typeName);

// Builds a Decoding RequestError from a captured decoding exception.
RequestError mapDecodingError(std::exception_ptr error, const std::string& typeName);

} // namespace errors
} // namespace courier
