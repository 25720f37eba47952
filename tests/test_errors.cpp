//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_errors.cpp
// Purpose: GoogleTests for request error descriptions and factories
//==========================================================================================================

#include <gtest/gtest.h>
#include <stdexcept>

#include "courier/Result.h"
#include "courier/errors/Errors.h"
#include "courier/Transport.h"

using namespace courier;
using namespace courier::errors;

TEST(Errors, KindNames) {
    EXPECT_STREQ(toString(ErrorKind::InvalidURL), "invalidURL");
    EXPECT_STREQ(toString(ErrorKind::Server), "server");
    EXPECT_STREQ(toString(ErrorKind::InvalidResponse), "invalidResponse");
    EXPECT_STREQ(toString(ErrorKind::Transport), "transport");
    EXPECT_STREQ(toString(ErrorKind::Encoding), "encoding");
    EXPECT_STREQ(toString(ErrorKind::Decoding), "decoding");
    EXPECT_STREQ(toString(ErrorKind::Cancelled), "cancelled");
}

TEST(Errors, Descriptions) {
    EXPECT_EQ(invalidURL().describe(), "Invalid URL");
    EXPECT_EQ(invalidResponse().describe(), "Invalid or unexpected response from server");
    EXPECT_EQ(cancelled().describe(), "Request cancelled");
    EXPECT_EQ(server(404, std::nullopt).describe(), "Server returned status code 404");
    EXPECT_EQ(server(500, std::string("oops")).describe(), "Server returned status code 500 with body:\noops");
    EXPECT_EQ(transport(std::make_exception_ptr(TransportError("connection refused"))).describe(),
              "Transport error: connection refused");
    EXPECT_EQ(encoding(std::make_exception_ptr(std::runtime_error("nan"))).describe(), "Encoding error: nan");
    EXPECT_EQ(decoding("User", "id", std::make_exception_ptr(std::runtime_error("bad"))).describe(),
              "Decoding failed in 'User' for key 'id': bad");
}

TEST(Errors, ServerBodyOnlyWhenNonEmpty) {
    const RequestError e = server(503, std::string());
    EXPECT_EQ(e.statusCode, 503);
    EXPECT_FALSE(e.body.has_value());
}

TEST(Errors, CauseIsKept) {
    const RequestError e = transport(std::make_exception_ptr(TransportError("dns")));
    ASSERT_TRUE(e.cause);
    EXPECT_THROW(std::rethrow_exception(e.cause), TransportError);
}

TEST(Errors, RequestExceptionCarriesError) {
    try {
        throw RequestException(encoding(std::make_exception_ptr(std::runtime_error("x"))));
    } catch (const RequestException& ex) {
        EXPECT_EQ(ex.error().kind, ErrorKind::Encoding);
        EXPECT_STREQ(ex.what(), "Encoding error: x");
    }
}

TEST(ExecutionResult, SuccessAndFailureAccessors) {
    ExecutionResult<int> ok(Success<int>{7, StatusMetadata{200, {}}, "GET|x", "sig"});
    EXPECT_TRUE(ok.IsSuccess());
    EXPECT_EQ(ok.success().value, 7);
    EXPECT_EQ(ok.canonicalString(), "GET|x");
    EXPECT_EQ(ok.signature(), "sig");
    EXPECT_THROW((void)ok.failure(), std::bad_variant_access);

    ExecutionResult<int> bad(Failure{invalidURL(), std::nullopt, "", ""});
    EXPECT_TRUE(bad.IsFailure());
    EXPECT_EQ(bad.failure().error.kind, ErrorKind::InvalidURL);
    EXPECT_EQ(bad.canonicalString(), "");
}
