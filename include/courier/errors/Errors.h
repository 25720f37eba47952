//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Request error taxonomy carried by failed results, with descriptions and factory helpers
//==========================================================================================================

#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

#include "courier/codec/Codec.h"

namespace courier {
namespace errors {

// Kind of a failed call.
enum class ErrorKind {
    InvalidURL,
    Server,
    InvalidResponse,
    Transport,
    Encoding,
    Decoding,
    Cancelled
};

// Stable name for logs and assertions ("invalidURL", "server", ...).
inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidURL: return "invalidURL";
        case ErrorKind::Server: return "server";
        case ErrorKind::InvalidResponse: return "invalidResponse";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Encoding: return "encoding";
        case ErrorKind::Decoding: return "decoding";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

//==========================================================================================================
// RequestError
// Purpose: Why a call failed.
// Fields:
//   kind: Failure category.
//   statusCode: HTTP status (Server only).
//   body: Response body text (Server only, when non-empty).
//   message: Text of the underlying cause (Transport, Encoding, Decoding).
//   cause: The underlying exception when one was raised.
//   typeName/fieldPath: Target type and dotted failing location (Decoding only).
//   decodeKind: Shape of the decoding failure when the codec classified it.
//==========================================================================================================
struct RequestError {
    ErrorKind kind{ErrorKind::InvalidURL};
    std::optional<int> statusCode;
    std::optional<std::string> body;
    std::string message;
    std::exception_ptr cause;
    std::string typeName;
    std::string fieldPath;
    std::optional<codec::DecodeErrorKind> decodeKind;

    // Human-readable one-liner (multi-line for server errors with a body).
    std::string describe() const {
        switch (kind) {
            case ErrorKind::InvalidURL:
                return "Invalid URL";
            case ErrorKind::Server:
                if (body && !body->empty()) {
                    return "Server returned status code " + std::to_string(statusCode.value_or(0)) +
                           " with body:\n" + *body;
                }
                return "Server returned status code " + std::to_string(statusCode.value_or(0));
            case ErrorKind::InvalidResponse:
                return "Invalid or unexpected response from server";
            case ErrorKind::Transport:
                return "Transport error: " + message;
            case ErrorKind::Encoding:
                return "Encoding error: " + message;
            case ErrorKind::Decoding:
                return "Decoding failed in '" + typeName + "' for key '" + fieldPath + "': " + message;
            case ErrorKind::Cancelled:
                return "Request cancelled";
        }
        return "Unknown error";
    }
};

// Text of an exception_ptr's std::exception, or a fixed placeholder for non-standard exceptions.
inline std::string describeException(const std::exception_ptr& ep) {
    if (!ep) {
        return std::string();
    }
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

inline RequestError invalidURL() {
    return RequestError{};
}

inline RequestError server(int statusCode, std::optional<std::string> body) {
    RequestError e;
    e.kind = ErrorKind::Server;
    e.statusCode = statusCode;
    if (body && !body->empty()) {
        e.body = std::move(body);
    }
    return e;
}

inline RequestError invalidResponse() {
    RequestError e;
    e.kind = ErrorKind::InvalidResponse;
    return e;
}

inline RequestError transport(std::exception_ptr cause) {
    RequestError e;
    e.kind = ErrorKind::Transport;
    e.message = describeException(cause);
    e.cause = std::move(cause);
    return e;
}

inline RequestError encoding(std::exception_ptr cause) {
    RequestError e;
    e.kind = ErrorKind::Encoding;
    e.message = describeException(cause);
    e.cause = std::move(cause);
    return e;
}

inline RequestError decoding(std::string typeName, std::string fieldPath, std::exception_ptr cause,
                             std::optional<codec::DecodeErrorKind> decodeKind = std::nullopt) {
    RequestError e;
    e.kind = ErrorKind::Decoding;
    e.typeName = std::move(typeName);
    e.fieldPath = std::move(fieldPath);
    e.message = describeException(cause);
    e.cause = std::move(cause);
    e.decodeKind = decodeKind;
    return e;
}

inline RequestError cancelled() {
    RequestError e;
    e.kind = ErrorKind::Cancelled;
    return e;
}

//==========================================================================================================
// RequestException
// Purpose: Thrown by request building APIs that cannot return a result value (Client::BuildRequest).
//==========================================================================================================
class RequestException : public std::runtime_error {
public:
    explicit RequestException(RequestError error)
        : std::runtime_error(error.describe()), error_(std::move(error)) {}
    const RequestError& error() const noexcept { return error_; }

private:
    RequestError error_;
};

} // namespace errors
} // namespace courier
