//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Signature.h
// Purpose: Request signatures (SHA-256, lower-case hex)
//==========================================================================================================

#pragma once

#include <string>

namespace courier {

// Digest used for every signature. Changing it invalidates all stored signatures and cache keys.
inline constexpr const char* kSignatureAlgorithm = "sha256";

//==========================================================================================================
// Sign
// Purpose: Lower-case hex SHA-256 of the canonical string's bytes. Sign("") is "" (no request was built).
// Throws: std::runtime_error when the OpenSSL digest fails.
//==========================================================================================================
std::string Sign(const std::string& canonical);

// Lower-case hex SHA-256 of arbitrary bytes (64 characters, also for empty input).
std::string Sha256Hex(const std::string& bytes);

} // namespace courier
