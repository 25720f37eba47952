//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Result.h
// Purpose: Tagged success/failure outcome of one executed request
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "courier/Headers.h"
#include "courier/errors/Errors.h"

namespace courier {

// HTTP status line data of a response.
struct StatusMetadata {
    int statusCode{0};
    HeaderMap headers;
};

//==========================================================================================================
// Success<T>
// Fields:
//   value: Decoded payload.
//   status: Status code and response headers.
//   canonicalString: Observable canonical form of the request.
//   signature: Signature of the request (body included).
//==========================================================================================================
template <typename T>
struct Success {
    T value;
    StatusMetadata status;
    std::string canonicalString;
    std::string signature;
};

//==========================================================================================================
// Failure
// Fields:
//   error: Failure kind and details.
//   status: Present when an HTTP response was received.
//   canonicalString/signature: Present when the request descriptor was built, "" otherwise.
//==========================================================================================================
struct Failure {
    errors::RequestError error;
    std::optional<StatusMetadata> status;
    std::string canonicalString;
    std::string signature;
};

//==========================================================================================================
// ExecutionResult<T>
// Purpose: Either a Success<T> or a Failure. Access the alternative matching IsSuccess(); the other
//          accessor throws std::bad_variant_access.
//==========================================================================================================
template <typename T>
class ExecutionResult {
public:
    ExecutionResult(Success<T> s) : outcome(std::move(s)) {}
    ExecutionResult(Failure f) : outcome(std::move(f)) {}

    bool IsSuccess() const noexcept { return std::holds_alternative<Success<T>>(outcome); }
    bool IsFailure() const noexcept { return !IsSuccess(); }

    const Success<T>& success() const { return std::get<Success<T>>(outcome); }
    Success<T>& success() { return std::get<Success<T>>(outcome); }
    const Failure& failure() const { return std::get<Failure>(outcome); }
    Failure& failure() { return std::get<Failure>(outcome); }

    const std::string& canonicalString() const {
        return IsSuccess() ? success().canonicalString : failure().canonicalString;
    }
    const std::string& signature() const {
        return IsSuccess() ? success().signature : failure().signature;
    }

    // Underlying variant for std::visit.
    const std::variant<Success<T>, Failure>& get() const { return outcome; }

private:
    std::variant<Success<T>, Failure> outcome;
};

} // namespace courier
