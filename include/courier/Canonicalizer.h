//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Canonicalizer.h
// Purpose: Deterministic textual normal form of a request descriptor
//==========================================================================================================

#pragma once

#include <string>

#include "courier/Headers.h"
#include "courier/RequestDescriptor.h"

namespace courier {

//==========================================================================================================
// Canonicalize
// Purpose: Observable request string:
//            METHOD|scheme://host[:port]path[?k=v&...][#fragment][|headers:lk:v&...]
//          Query pairs are sorted by key, headers by lower-cased key (then value). Values are written raw.
//          Optional segments appear only when non-empty. The body is not part of this form.
//==========================================================================================================
std::string Canonicalize(const RequestDescriptor& descriptor);

//==========================================================================================================
// CanonicalizeForSigning
// Purpose: Signing form. Same as Canonicalize with "|body:<sha256 hex of body>" inserted after the URL
//          (before the headers segment) when the body is present and non-empty.
//==========================================================================================================
std::string CanonicalizeForSigning(const RequestDescriptor& descriptor);

// "k=v&k=v" sorted by key; "" for an empty map.
std::string CanonicalQuery(const QueryMap& query);

// "lk:v&lk:v" sorted by lower-cased key; "" for an empty map.
std::string CanonicalHeaders(const HeaderMap& headers);

} // namespace courier
