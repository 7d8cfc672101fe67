#include <gtest/gtest.h>

#include "aigw/error.hpp"

#include <stdexcept>
#include <string>

TEST(ErrorTest, RethrowWithContextKeepsErrorKind) {
  try {
    try {
      throw aigw::TranslationError("audio content not supported yet");
    } catch (const aigw::GatewayError&) {
      aigw::rethrow_with_context("error converting user message");
    }
    FAIL() << "expected TranslationError";
  } catch (const aigw::TranslationError& ex) {
    EXPECT_EQ(std::string(ex.what()), "error converting user message: audio content not supported yet");
  }
}

TEST(ErrorTest, RethrowWithContextKeepsUpstreamStatus) {
  try {
    try {
      throw aigw::UpstreamError("connection reset", 503);
    } catch (const aigw::GatewayError&) {
      aigw::rethrow_with_context("relay");
    }
    FAIL() << "expected UpstreamError";
  } catch (const aigw::UpstreamError& ex) {
    EXPECT_EQ(ex.status_code(), 503);
    EXPECT_EQ(std::string(ex.what()), "relay: connection reset");
  }
}

TEST(ErrorTest, ForeignExceptionsPassThroughUnchanged) {
  try {
    try {
      throw std::out_of_range("index");
    } catch (const std::exception&) {
      aigw::rethrow_with_context("ignored");
    }
    FAIL() << "expected std::out_of_range";
  } catch (const std::out_of_range& ex) {
    EXPECT_EQ(std::string(ex.what()), "index");
  }
}

TEST(ErrorTest, HierarchyDerivesFromRuntimeError) {
  EXPECT_THROW(throw aigw::SchemaError("x"), aigw::GatewayError);
  EXPECT_THROW(throw aigw::ConfigError("x"), std::runtime_error);
}
