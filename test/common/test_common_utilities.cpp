#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "fpss_modbus/common/client_options.hpp"
#include "fpss_modbus/common/connection_state.hpp"
#include "fpss_modbus/common/error.hpp"
#include "fpss_modbus/common/exception_code.hpp"
#include "fpss_modbus/common/framing_mode.hpp"
#include "fpss_modbus/common/log.hpp"

using fpssmb::ClientOptions;
using fpssmb::ConnectionState;
using fpssmb::ErrorKind;
using fpssmb::ExceptionCode;
using fpssmb::FramingMode;
using fpssmb::ModbusError;
using fpssmb::ParseConnectionState;
using fpssmb::Result;

// ConnectionState Tests
TEST(ConnectionState, NamesRoundTrip) {
  for (ConnectionState state : {ConnectionState::kPreparing, ConnectionState::kReady, ConnectionState::kWaiting,
                                ConnectionState::kFailed, ConnectionState::kCancelled}) {
    EXPECT_EQ(ParseConnectionState(fpssmb::ToString(state)), state);
  }
}

TEST(ConnectionState, UnrecognizedNameIsUnknown) {
  EXPECT_EQ(ParseConnectionState("setup"), ConnectionState::kUnknown);
  EXPECT_EQ(ParseConnectionState(""), ConnectionState::kUnknown);
  EXPECT_EQ(ParseConnectionState("READY"), ConnectionState::kUnknown);
  EXPECT_STREQ(fpssmb::ToString(ConnectionState::kUnknown), "unknown");
}

// Result Tests
TEST(Result, HoldsValue) {
  Result<std::vector<uint16_t>> result(std::vector<uint16_t>{1, 2, 3});
  ASSERT_TRUE(result.HasValue());
  EXPECT_TRUE(static_cast<bool>(result));
  EXPECT_EQ(result->size(), 3);
  EXPECT_EQ((*result)[2], 3);
}

TEST(Result, HoldsError) {
  Result<std::vector<uint16_t>> result(ErrorKind::kCrcMismatch);
  ASSERT_FALSE(result.HasValue());
  EXPECT_EQ(result.Error().kind, ErrorKind::kCrcMismatch);
  EXPECT_EQ(result.Error().exception_code, ExceptionCode::kNone);
}

TEST(Result, VoidSuccessAndFailure) {
  Result<void> ok;
  EXPECT_TRUE(ok.HasValue());

  Result<void> failed(fpssmb::MakeExceptionError(0x02));
  ASSERT_FALSE(failed.HasValue());
  EXPECT_EQ(failed.Error(), (ModbusError{ErrorKind::kExceptionResponse, ExceptionCode::kIllegalDataAddress}));
}

TEST(ExceptionCodeNames, KnownAndUnknownCodes) {
  EXPECT_STREQ(fpssmb::ExceptionCodeToString(ExceptionCode::kIllegalDataAddress), "ILLEGAL_DATA_ADDRESS");
  EXPECT_STREQ(fpssmb::ExceptionCodeToString(ExceptionCode::kGatewayTargetFailed), "GATEWAY_TARGET_FAILED");
  EXPECT_STREQ(fpssmb::ExceptionCodeToString(ExceptionCode::kNone), "UNKNOWN");
  EXPECT_STREQ(fpssmb::ExceptionCodeToString(static_cast<ExceptionCode>(0x7F)), "UNKNOWN");
}

TEST(ErrorNames, Stable) {
  EXPECT_STREQ(fpssmb::ToString(ErrorKind::kTransport), "transport");
  EXPECT_STREQ(fpssmb::ToString(ErrorKind::kMalformed), "malformed");
  EXPECT_STREQ(fpssmb::ToString(ErrorKind::kCrcMismatch), "crc-mismatch");
  EXPECT_STREQ(fpssmb::ToString(ErrorKind::kExceptionResponse), "exception-response");
  EXPECT_STREQ(fpssmb::ToString(ErrorKind::kAckMismatch), "ack-mismatch");
  EXPECT_STREQ(fpssmb::ExceptionCodeToString(ExceptionCode::kIllegalDataAddress), "ILLEGAL_DATA_ADDRESS");
  EXPECT_STREQ(fpssmb::ExceptionCodeToString(static_cast<ExceptionCode>(0x42)), "UNKNOWN");
}

// ClientOptions Tests
TEST(ClientOptions, Defaults) {
  ClientOptions options;
  EXPECT_EQ(options.framing, FramingMode::kTcp);
  EXPECT_EQ(options.default_unit_id, 1);
  EXPECT_EQ(options.min_response_size, 1);
  EXPECT_EQ(options.max_response_size, 256);
}

// Logger Tests
TEST(Log, ParseLevel) {
  using fpssmb::log::Level;
  using fpssmb::log::ParseLevel;
  EXPECT_EQ(ParseLevel(nullptr), Level::kInfo);
  EXPECT_EQ(ParseLevel("debug"), Level::kDebug);
  EXPECT_EQ(ParseLevel("WARN"), Level::kWarn);
  EXPECT_EQ(ParseLevel("4"), Level::kError);
  EXPECT_EQ(ParseLevel("none"), Level::kNone);
  EXPECT_EQ(ParseLevel("verbose"), Level::kInfo);
}

TEST(Log, ParseBool) {
  using fpssmb::log::ParseBool;
  EXPECT_TRUE(ParseBool("1"));
  EXPECT_TRUE(ParseBool("True"));
  EXPECT_FALSE(ParseBool("0"));
  EXPECT_FALSE(ParseBool("false", true));
  EXPECT_TRUE(ParseBool("maybe", true));
  EXPECT_FALSE(ParseBool(nullptr));
}
