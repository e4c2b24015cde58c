#include "pqharness/framer/protocol_framer.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "pqharness/common/exceptions.hpp"

using namespace pqharness;
using namespace pqharness::framer;
using common::FramingError;

namespace {

Bytes bytes_of(std::initializer_list<int> values) {
  Bytes out;
  for (int v : values) {
    out.push_back(static_cast<uint8_t>(v));
  }
  return out;
}

void append(Bytes& out, const std::string& text) { out.insert(out.end(), text.begin(), text.end()); }

}  // namespace

// ============================================================================
// ENCODING
// ============================================================================

TEST(ProtocolFramerEncodeTest, StartupPacket) {
  StartupPacket packet;
  packet.parameters = {{"user", "postgres"}};

  Bytes expected = bytes_of({0, 0, 0, 23, 0, 3, 0, 0});
  append(expected, std::string("user\0postgres\0\0", 15));
  EXPECT_EQ(ProtocolFramer::encode(packet), expected);
}

TEST(ProtocolFramerEncodeTest, SslRequestAndResponse) {
  EXPECT_EQ(ProtocolFramer::encode(SslRequest{}), bytes_of({0, 0, 0, 8, 0x04, 0xD2, 0x16, 0x2F}));
  EXPECT_EQ(ProtocolFramer::encode(SslResponse{true}), bytes_of({'S'}));
  EXPECT_EQ(ProtocolFramer::encode(SslResponse{false}), bytes_of({'N'}));
}

TEST(ProtocolFramerEncodeTest, ServerGreeting) {
  EXPECT_EQ(ProtocolFramer::encode(AuthenticationOk{}), bytes_of({'R', 0, 0, 0, 8, 0, 0, 0, 0}));
  EXPECT_EQ(ProtocolFramer::encode(BackendKeyData{1234, 1234}),
            bytes_of({'K', 0, 0, 0, 12, 0, 0, 0x04, 0xD2, 0, 0, 0x04, 0xD2}));
  EXPECT_EQ(ProtocolFramer::encode(ReadyForQuery{kTransactionIdle}), bytes_of({'Z', 0, 0, 0, 5, 'I'}));

  Bytes expected = bytes_of({'S', 0, 0, 0, 26});
  append(expected, std::string("client_encoding\0UTF-8\0", 22));
  EXPECT_EQ(ProtocolFramer::encode(ParameterStatus{"client_encoding", "UTF-8"}), expected);
}

TEST(ProtocolFramerEncodeTest, QueryCycle) {
  EXPECT_EQ(ProtocolFramer::encode(SimpleQuery{""}), bytes_of({'Q', 0, 0, 0, 5, 0}));
  EXPECT_EQ(ProtocolFramer::encode(EmptyQueryResponse{}), bytes_of({'I', 0, 0, 0, 4}));
  EXPECT_EQ(ProtocolFramer::encode(Terminate{}), bytes_of({'X', 0, 0, 0, 4}));
}

TEST(ProtocolFramerEncodeTest, LegacyErrorHasNoLengthWord) {
  EXPECT_EQ(ProtocolFramer::encode(LegacyErrorResponse{"oops"}), bytes_of({'E', 'o', 'o', 'p', 's', 0}));
}

TEST(ProtocolFramerEncodeTest, EmbeddedNulIsRejected) {
  EXPECT_THROW(ProtocolFramer::encode(SimpleQuery{std::string("a\0b", 3)}), FramingError);
  EXPECT_THROW(ProtocolFramer::encode(ParameterStatus{std::string("k\0", 2), "v"}), FramingError);
}

// ============================================================================
// DECODING
// ============================================================================

TEST(ProtocolFramerDecodeTest, StartupPacketWithParameters) {
  StartupPacket packet;
  packet.parameters = {{"user", "postgres"}, {"database", "postgres"}, {"application_name", "pytest"}};

  auto decoded = ProtocolFramer::decode_startup(ProtocolFramer::encode(packet));
  ASSERT_TRUE(std::holds_alternative<StartupPacket>(decoded));
  EXPECT_EQ(std::get<StartupPacket>(decoded), packet);
}

TEST(ProtocolFramerDecodeTest, SslRequest) {
  auto decoded = ProtocolFramer::decode_startup(bytes_of({0, 0, 0, 8, 0x04, 0xD2, 0x16, 0x2F}));
  EXPECT_TRUE(std::holds_alternative<SslRequest>(decoded));
}

TEST(ProtocolFramerDecodeTest, UnknownRequestCode) {
  EXPECT_THROW(ProtocolFramer::decode_startup(bytes_of({0, 0, 0, 8, 0x04, 0xD2, 0x16, 0x30})), FramingError);
}

TEST(ProtocolFramerDecodeTest, StartupLengthMismatch) {
  Bytes frame = ProtocolFramer::encode(StartupPacket{});
  frame.push_back(0);
  EXPECT_THROW(ProtocolFramer::decode_startup(frame), FramingError);

  frame.resize(frame.size() - 2);
  EXPECT_THROW(ProtocolFramer::decode_startup(frame), FramingError);
}

TEST(ProtocolFramerDecodeTest, StartupParameterWithoutValue) {
  Bytes frame = bytes_of({0, 0, 0, 14, 0, 3, 0, 0});
  append(frame, std::string("user\0\0", 6));
  // "user" is followed by the empty value, then the list runs out without a terminator.
  EXPECT_THROW(ProtocolFramer::decode_startup(frame), FramingError);
}

TEST(ProtocolFramerDecodeTest, TaggedMessages) {
  EXPECT_EQ(std::get<AuthenticationOk>(ProtocolFramer::decode_tagged(bytes_of({'R', 0, 0, 0, 8, 0, 0, 0, 0}))),
            AuthenticationOk{});
  EXPECT_EQ(std::get<ReadyForQuery>(ProtocolFramer::decode_tagged(bytes_of({'Z', 0, 0, 0, 5, 'T'}))).status,
            kTransactionInBlock);
  EXPECT_EQ(std::get<SimpleQuery>(ProtocolFramer::decode_tagged(bytes_of({'Q', 0, 0, 0, 5, 0}))).text, "");
  EXPECT_TRUE(std::holds_alternative<Terminate>(ProtocolFramer::decode_tagged(bytes_of({'X', 0, 0, 0, 4}))));
  EXPECT_TRUE(
      std::holds_alternative<EmptyQueryResponse>(ProtocolFramer::decode_tagged(bytes_of({'I', 0, 0, 0, 4}))));

  auto key = std::get<BackendKeyData>(
      ProtocolFramer::decode_tagged(bytes_of({'K', 0, 0, 0, 12, 0, 0, 0x04, 0xD2, 0xFF, 0xFF, 0xFF, 0xFF})));
  EXPECT_EQ(key.pid, 1234u);
  EXPECT_EQ(key.secret, 0xFFFFFFFFu);

  auto status = std::get<ParameterStatus>(ProtocolFramer::decode_tagged(ProtocolFramer::encode(
      ParameterStatus{"DateStyle", "ISO, MDY"})));
  EXPECT_EQ(status.key, "DateStyle");
  EXPECT_EQ(status.value, "ISO, MDY");
}

TEST(ProtocolFramerDecodeTest, DeclaredLengthMustMatch) {
  // Terminate declares 5 but carries no payload byte.
  EXPECT_THROW(ProtocolFramer::decode_tagged(bytes_of({'X', 0, 0, 0, 5})), FramingError);
  // Terminate with one trailing byte counted in its length.
  EXPECT_THROW(ProtocolFramer::decode_tagged(bytes_of({'X', 0, 0, 0, 5, 0})), FramingError);
  // Header cut short.
  EXPECT_THROW(ProtocolFramer::decode_tagged(bytes_of({'X', 0, 0})), FramingError);
}

TEST(ProtocolFramerDecodeTest, MalformedPayloads) {
  // Authentication other than OK.
  EXPECT_THROW(ProtocolFramer::decode_tagged(bytes_of({'R', 0, 0, 0, 8, 0, 0, 0, 5})), FramingError);
  // Unknown transaction status.
  EXPECT_THROW(ProtocolFramer::decode_tagged(bytes_of({'Z', 0, 0, 0, 5, 'Q'})), FramingError);
  // Query text without its terminator.
  EXPECT_THROW(ProtocolFramer::decode_tagged(bytes_of({'Q', 0, 0, 0, 5, 'a'})), FramingError);
  // Unsupported message type.
  EXPECT_THROW(ProtocolFramer::decode_tagged(bytes_of({'D', 0, 0, 0, 4})), FramingError);
}

TEST(ProtocolFramerDecodeTest, FramingErrorCarriesOffset) {
  try {
    ProtocolFramer::decode_tagged(bytes_of({'Q', 0, 0, 0, 6, 'a', 'b'}));
    FAIL() << "expected FramingError";
  } catch (const FramingError& e) {
    EXPECT_EQ(e.get_offset(), 5u);
    EXPECT_EQ(e.get_code(), ErrorCode::FramingViolation);
  }
}

TEST(ProtocolFramerDecodeTest, NonPrintableTagIsShownInHex) {
  try {
    ProtocolFramer::decode_tagged(bytes_of({0x10, 0, 0, 0, 4}));
    FAIL() << "expected FramingError";
  } catch (const FramingError& e) {
    EXPECT_THAT(e.what(), ::testing::HasSubstr("0x10"));
  }
  try {
    ProtocolFramer::decode_ssl_response(bytes_of({0xAB}));
    FAIL() << "expected FramingError";
  } catch (const FramingError& e) {
    EXPECT_THAT(e.what(), ::testing::HasSubstr("0xab"));
  }
}

TEST(ProtocolFramerDecodeTest, SslResponse) {
  EXPECT_TRUE(ProtocolFramer::decode_ssl_response(bytes_of({'S'})).accept);
  EXPECT_FALSE(ProtocolFramer::decode_ssl_response(bytes_of({'N'})).accept);
  EXPECT_THROW(ProtocolFramer::decode_ssl_response(bytes_of({'E'})), FramingError);
  EXPECT_THROW(ProtocolFramer::decode_ssl_response(bytes_of({'S', 'S'})), FramingError);
}

TEST(ProtocolFramerDecodeTest, ReadLength) {
  EXPECT_EQ(ProtocolFramer::read_length(bytes_of({0, 0, 1, 0}).data(), 4), 256u);
  EXPECT_THROW(ProtocolFramer::read_length(bytes_of({0, 0, 0, 3}).data(), 4), FramingError);
  EXPECT_THROW(ProtocolFramer::read_length(bytes_of({0, 0}).data(), 2), FramingError);
}

TEST(MessageNameTest, NamesEveryMessage) {
  EXPECT_EQ(message_name(StartupPacket{}), "StartupPacket");
  EXPECT_EQ(message_name(SslRequest{}), "SSLRequest");
  EXPECT_EQ(message_name(SimpleQuery{}), "Query");
  EXPECT_EQ(message_name(LegacyErrorResponse{}), "ErrorResponse(v2)");
}
