//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include "mcpio/JSONRPCTypes.h"
#include "mcpio/errors/Errors.h"

using namespace mcpio;

TEST(Errors, CategoryMapping) {
    using mcpio::errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(-32800), ErrorCategory::RequestCancelled);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, FromErrorValue_Valid) {
    JSONValue::Object dataObj; dataObj["foo"] = std::make_shared<JSONValue>(std::string("bar"));
    JSONValue::Object errObj;
    errObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(JSONRPCErrorCodes::MethodNotFound));
    errObj["message"] = std::make_shared<JSONValue>(std::string("Method not found"));
    errObj["data"] = std::make_shared<JSONValue>(JSONValue{dataObj});

    auto parsed = errors::mcpErrorFromErrorValue(JSONValue{errObj});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(parsed->message, std::string("Method not found"));
    EXPECT_EQ(parsed->category, errors::ErrorCategory::JsonRpcMethodNotFound);
    ASSERT_TRUE(parsed->data.has_value());
    EXPECT_EQ(GetStringMember(*parsed->data, "foo").value_or(""), "bar");
}

TEST(Errors, FromErrorValue_InvalidShape) {
    JSONValue notObj{nullptr};
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(notObj).has_value());

    JSONValue::Object missCode; missCode["message"] = std::make_shared<JSONValue>(std::string("m"));
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(JSONValue{missCode}).has_value());

    JSONValue::Object missMsg; missMsg["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(-1));
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(JSONValue{missMsg}).has_value());

    JSONValue::Object wrongTypes;
    wrongTypes["code"] = std::make_shared<JSONValue>(std::string("-32601"));
    wrongTypes["message"] = std::make_shared<JSONValue>(static_cast<int64_t>(123));
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(JSONValue{wrongTypes}).has_value());
}

TEST(Errors, FromResponse) {
    auto resp = CreateErrorResponse(JSONRPCId(std::string("1")), JSONRPCErrorCodes::InvalidParams, "bad args", std::nullopt);
    ASSERT_TRUE(resp != nullptr);
    auto parsed = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(parsed->message, std::string("bad args"));
    EXPECT_FALSE(parsed->data.has_value());

    JSONRPCResponse ok;
    ok.result = JSONValue(JSONValue::Object{});
    EXPECT_FALSE(errors::mcpErrorFromResponse(ok).has_value());
}

TEST(Errors, CancellationErrorShape) {
    auto plain = errors::CreateCancellationError();
    EXPECT_EQ(GetIntMember(plain, "code").value_or(0), -32800);
    EXPECT_EQ(GetStringMember(plain, "message").value_or(""), "Request cancelled");

    auto withReason = errors::CreateCancellationError(std::string("user aborted"));
    EXPECT_EQ(GetStringMember(withReason, "message").value_or(""), "Request cancelled: user aborted");
    EXPECT_TRUE(errors::IsRequestCancelledError(withReason));
}

TEST(Errors, RecognizesCancellationByCodeMessageOrNesting) {
    EXPECT_TRUE(errors::IsRequestCancelledError(ParseJSON(R"({"code":-32800,"message":"x"})")));
    EXPECT_TRUE(errors::IsRequestCancelledError(ParseJSON(R"({"code":-1,"message":"Operation CANCELLED by host"})")));
    EXPECT_TRUE(errors::IsRequestCancelledError(ParseJSON(R"({"error":{"code":-32800,"message":"x"}})")));
    EXPECT_FALSE(errors::IsRequestCancelledError(ParseJSON(R"({"code":-32601,"message":"Method not found"})")));
    EXPECT_FALSE(errors::IsRequestCancelledError(ParseJSON(R"("cancelled")")));
}

TEST(Errors, TransportErrorCarriesCodeAndExitStatus) {
    errors::TransportError e(errors::TransportErrc::ProcessExitedEarly, "boom", 127);
    EXPECT_EQ(e.code(), errors::TransportErrc::ProcessExitedEarly);
    EXPECT_EQ(e.exitCode(), std::optional<int>(127));
    EXPECT_EQ(std::string(e.what()), "ProcessExitedEarly: boom");
    EXPECT_STREQ(errors::errorClassName(errors::ErrorClass::ResourceExhaustion), "resource-exhaustion");
}

TEST(Errors, OutcomeHelpers) {
    EXPECT_TRUE(errors::Outcome::Ok().success);
    auto fail = errors::Outcome::Fail(errors::OutcomeCode::UnsupportedByServer, "nope");
    EXPECT_FALSE(fail.success);
    EXPECT_STREQ(errors::outcomeCodeName(fail.code), "UnsupportedByServer");
    EXPECT_EQ(fail.message, "nope");
}
