#include <stdint.h>

#include <vector>

#include "protocol/checksum.h"
#include "protocol/frame_codec.h"
#include "protocol/hex_codec.h"
#include "protocol/rpc_errors.h"
#include "protocol/rpc_protocol.h"
#include "test_constants.h"
#include "test_support.h"

using namespace boilerlink;
using namespace boilerlink::rpc;

namespace {

static void test_endianness_helpers() {
  uint8_t buffer[2] = {0x12, 0x34};
  TEST_ASSERT_EQ_UINT(read_u16_be(buffer), 0x1234);
  write_u16_be(buffer, 0xCDEF);
  TEST_ASSERT(buffer[0] == 0xCD && buffer[1] == 0xEF);
}

static void test_checksum_known_vectors() {
  const Bytes state_request = test_bytes("02fd000151");
  TEST_ASSERT_EQ_UINT(frame_checksum(state_request.data(), state_request.size()), 0xF1);

  const Bytes state_reply = test_bytes("02fd0003510102");
  TEST_ASSERT_EQ_UINT(frame_checksum(state_reply.data(), state_reply.size()), 0xF2);

  TEST_ASSERT_EQ_UINT(frame_checksum(nullptr, 0), 0x00);
}

static void test_encode_state_request() {
  FrameCodec codec;
  TEST_ASSERT(!codec.validatesChecksum());
  TEST_ASSERT(FrameCodec(true).validatesChecksum());
  auto frame = codec.encode(TEST_CMD_STATE, etl::span<const uint8_t>());
  TEST_ASSERT(frame.has_value());
  TEST_ASSERT_EQ_STR(test_hex(frame.value()), "02fd000151f1");
}

static void test_encode_values_request() {
  FrameCodec codec;
  const Bytes payload = test_bytes("0004");
  auto frame = codec.encode(TEST_CMD_VALUES, test_span(payload));
  TEST_ASSERT(frame.has_value());
  TEST_ASSERT_EQ_UINT(frame.value().size(), FRAME_HEADER_SIZE + COMMAND_SIZE + 2 + CHECKSUM_SIZE);
  TEST_ASSERT_EQ_UINT(read_u16_be(frame.value().data() + BLOCK_START_SIZE), 3);
  TEST_ASSERT_EQ_STR(test_hex(frame.value()), "02fd000330000458");
}

static void test_roundtrip_payload_sizes() {
  FrameCodec codec(true);
  const size_t sizes[] = {0, 1, 2, 255, 256, 1024, MAX_PAYLOAD_SIZE};
  for (size_t size : sizes) {
    Bytes payload(size);
    for (size_t i = 0; i < size; ++i) {
      payload[i] = static_cast<uint8_t>(i * 7 + 3);
    }
    auto frame = codec.encode(TEST_CMD_VALUES, test_span(payload));
    TEST_ASSERT(frame.has_value());
    TEST_ASSERT_EQ_UINT(frame.value().size(), size + FRAME_HEADER_SIZE + COMMAND_SIZE + CHECKSUM_SIZE);

    auto decoded = codec.decode(test_span(frame.value()));
    TEST_ASSERT(decoded.has_value());
    TEST_ASSERT_EQ_UINT(decoded.value().command, TEST_CMD_VALUES);
    TEST_ASSERT(decoded.value().payload == payload);
  }
}

static void test_encode_rejects_oversized_payload() {
  FrameCodec codec;
  Bytes payload(MAX_PAYLOAD_SIZE + 1, TEST_PAYLOAD_BYTE);
  auto frame = codec.encode(TEST_CMD_VALUES, test_span(payload));
  TEST_ASSERT(!frame.has_value());
  TEST_ASSERT(frame.error().kind == ErrorKind::PAYLOAD_TOO_LARGE);
}

static void test_checksum_sensitivity() {
  FrameCodec checking(true);
  FrameCodec lenient(false);
  const Bytes payload = test_bytes("000400760078");
  auto encoded = checking.encode(TEST_CMD_VALUES, test_span(payload));
  TEST_ASSERT(encoded.has_value());

  // Every byte after the length field: command, payload and checksum. 0x80
  // is the bit the shifted term of the checksum drops.
  const uint8_t flips[] = {0x01, 0x80, 0xFF};
  for (size_t i = FRAME_HEADER_SIZE; i < encoded.value().size(); ++i) {
    for (uint8_t flip : flips) {
      Bytes corrupted = encoded.value();
      corrupted[i] ^= flip;

      auto strict = checking.decode(test_span(corrupted));
      TEST_ASSERT(!strict.has_value());
      TEST_ASSERT(strict.error().kind == ErrorKind::CHECKSUM);

      auto relaxed = lenient.decode(test_span(corrupted));
      TEST_ASSERT(relaxed.has_value());
    }
  }
}

static void test_decode_checksum_detail() {
  FrameCodec codec(true);
  auto decoded = codec.decode(test_span(test_bytes("02fd000351010203")));
  TEST_ASSERT(!decoded.has_value());
  TEST_ASSERT(decoded.error().kind == ErrorKind::CHECKSUM);
  TEST_ASSERT_EQ_STR(decoded.error().detail, "Expected CRC value F2, received 03");
}

static void test_decode_length_invariant() {
  FrameCodec codec(false);
  const Bytes good = test_bytes("02fd0003510102f2");

  Bytes longer = good;
  longer.push_back(0x00);
  auto too_long = codec.decode(test_span(longer));
  TEST_ASSERT(!too_long.has_value());
  TEST_ASSERT(too_long.error().kind == ErrorKind::FRAME_LENGTH);

  Bytes shorter(good.begin(), good.end() - 1);
  auto too_short = codec.decode(test_span(shorter));
  TEST_ASSERT(!too_short.has_value());
  TEST_ASSERT(too_short.error().kind == ErrorKind::FRAME_LENGTH);

  // Correct checksum for the wrong declared length is still rejected.
  FrameCodec checking(true);
  Bytes misdeclared = test_bytes("02fd000451010200");
  misdeclared.back() = frame_checksum(misdeclared.data(), misdeclared.size() - 1);
  auto rejected = checking.decode(test_span(misdeclared));
  TEST_ASSERT(!rejected.has_value());
  TEST_ASSERT(rejected.error().kind == ErrorKind::FRAME_LENGTH);

  auto zero = codec.decode(test_span(test_bytes("02fd000000")));
  TEST_ASSERT(!zero.has_value());
  TEST_ASSERT(zero.error().kind == ErrorKind::FRAME_LENGTH);
}

static void test_decode_wrong_header() {
  FrameCodec codec;

  auto short_header = codec.decode(test_span(test_bytes("02fd00")));
  TEST_ASSERT(!short_header.has_value());
  TEST_ASSERT(short_header.error().kind == ErrorKind::WRONG_RESPONSE_HEADER);
  TEST_ASSERT_EQ_STR(short_header.error().detail, "Received: 02fd00");

  auto wrong_marker = codec.decode(test_span(test_bytes("03fd000151f1")));
  TEST_ASSERT(!wrong_marker.has_value());
  TEST_ASSERT(wrong_marker.error().kind == ErrorKind::WRONG_RESPONSE_HEADER);
  TEST_ASSERT_EQ_STR(wrong_marker.error().detail, "Received: 03fd0001");

  auto empty = codec.decode(etl::span<const uint8_t>());
  TEST_ASSERT(!empty.has_value());
  TEST_ASSERT(empty.error().kind == ErrorKind::WRONG_RESPONSE_HEADER);
}

static void test_frame_header_helpers() {
  const Bytes header = test_bytes("02fd0003");
  TEST_ASSERT(FrameCodec::hasBlockStart(header.data()));
  TEST_ASSERT_EQ_UINT(FrameCodec::remainingAfterHeader(header.data()), 4);
  TEST_ASSERT(!FrameCodec::hasBlockStart(test_bytes("fd020003").data()));
}

static void test_hex_encode_lowercase() {
  TEST_ASSERT_EQ_STR(test_hex(Bytes{0x00, 0xAB, 0x0F, 0xF0}), "00ab0ff0");
  TEST_ASSERT_EQ_STR(test_hex(Bytes()), "");
}

static void test_hex_decode_accepts_both_cases() {
  auto decoded = hex::decode(etl::string_view("02FDab"));
  TEST_ASSERT(decoded.has_value());
  TEST_ASSERT(decoded.value() == (Bytes{0x02, 0xFD, 0xAB}));
}

static void test_hex_decode_errors() {
  auto bad_char = hex::decode(etl::string_view("xyz"));
  TEST_ASSERT(!bad_char.has_value());
  TEST_ASSERT(bad_char.error().kind == ErrorKind::HEX_DECODE);
  TEST_ASSERT_EQ_STR(bad_char.error().detail, "non-hexadecimal number found at position 0");

  auto late_bad_char = hex::decode(etl::string_view("51g0"));
  TEST_ASSERT(!late_bad_char.has_value());
  TEST_ASSERT_EQ_STR(late_bad_char.error().detail, "non-hexadecimal number found at position 2");

  auto odd = hex::decode(etl::string_view("515"));
  TEST_ASSERT(!odd.has_value());
  TEST_ASSERT(odd.error().kind == ErrorKind::HEX_DECODE);
  TEST_ASSERT_EQ_STR(odd.error().detail, "odd-length hex string");
}

static void test_error_descriptions() {
  const Error error{ErrorKind::TIMEOUT, "No response within 1000 ms"};
  TEST_ASSERT_EQ_STR(describe(error), "TimeoutError: No response within 1000 ms");
  TEST_ASSERT_EQ_STR(error_kind_name(ErrorKind::WRONG_COMMAND_IN_RESPONSE),
                     "WrongCommandInResponseError");
  TEST_ASSERT_EQ_STR(error_kind_name(ErrorKind::INCOMPLETE_FRAME), "IncompleteFrameError");
  TEST_ASSERT_EQ_STR(incomplete_detail(6, 2), "Expected 6 bytes after frame header, received 2");
  TEST_ASSERT_EQ_STR(wrong_command_detail(0x52, 0x51), "Expected command 52, received 51");
}

}  // namespace

int main() {
  test_endianness_helpers();
  test_checksum_known_vectors();
  test_encode_state_request();
  test_encode_values_request();
  test_roundtrip_payload_sizes();
  test_encode_rejects_oversized_payload();
  test_checksum_sensitivity();
  test_decode_checksum_detail();
  test_decode_length_invariant();
  test_decode_wrong_header();
  test_frame_header_helpers();
  test_hex_encode_lowercase();
  test_hex_decode_accepts_both_cases();
  test_hex_decode_errors();
  test_error_descriptions();
  return 0;
}
