//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Signature.cpp
// Purpose: SHA-256 hex digests through the OpenSSL EVP interface
//==========================================================================================================

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

#include "courier/Signature.h"

namespace courier {

std::string Sha256Hex(const std::string& bytes) {
    std::unique_ptr<EVP_MD_CTX, decltype(&::EVP_MD_CTX_free)> ctx(::EVP_MD_CTX_new(), &::EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (::EVP_DigestInit_ex(ctx.get(), ::EVP_sha256(), nullptr) != 1 ||
        ::EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
        ::EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(len) * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(hex[(digest[i] >> 4) & 0xF]);
        out.push_back(hex[digest[i] & 0xF]);
    }
    return out;
}

std::string Sign(const std::string& canonical) {
    if (canonical.empty()) {
        return std::string();
    }
    return Sha256Hex(canonical);
}

} // namespace courier
