#include "frame_codec.h"

#include <stdio.h>

#include <etl/algorithm.h>

#include "checksum.h"

namespace boilerlink {
namespace rpc {

FrameCodec::FrameCodec(bool validate_checksum) : _validate_checksum(validate_checksum) {}

bool FrameCodec::hasBlockStart(const uint8_t* header) {
  return header[0] == BLOCK_START_0 && header[1] == BLOCK_START_1;
}

size_t FrameCodec::remainingAfterHeader(const uint8_t* header) {
  return static_cast<size_t>(read_u16_be(header + BLOCK_START_SIZE)) + CHECKSUM_SIZE;
}

Result<Bytes> FrameCodec::encode(uint8_t command, etl::span<const uint8_t> payload) const {
  if (payload.size() > MAX_PAYLOAD_SIZE) {
    char buf[80];
    snprintf(buf, sizeof(buf), "Payload of %zu bytes exceeds the %zu-byte limit", payload.size(),
             MAX_PAYLOAD_SIZE);
    return make_error(ErrorKind::PAYLOAD_TOO_LARGE, buf);
  }

  const size_t message_len = COMMAND_SIZE + payload.size();
  Bytes frame(FRAME_HEADER_SIZE + message_len + CHECKSUM_SIZE);

  // --- Header ---
  uint8_t* p = frame.data();
  *p++ = BLOCK_START_0;
  *p++ = BLOCK_START_1;
  write_u16_be(p, static_cast<uint16_t>(message_len));
  p += LENGTH_FIELD_SIZE;

  // --- Message ---
  *p++ = command;
  if (!payload.empty()) {
    etl::copy_n(payload.data(), payload.size(), p);
    p += payload.size();
  }

  // --- Checksum ---
  *p = frame_checksum(frame.data(), frame.size() - CHECKSUM_SIZE);

  return frame;
}

Result<DecodedFrame> FrameCodec::decode(etl::span<const uint8_t> raw) const {
  // --- Validate Header ---
  if (raw.size() < FRAME_HEADER_SIZE || !hasBlockStart(raw.data())) {
    const size_t shown = etl::min(raw.size(), FRAME_HEADER_SIZE);
    return make_error(ErrorKind::WRONG_RESPONSE_HEADER, wrong_header_detail(raw.data(), shown));
  }

  // --- Validate Length ---
  const uint16_t declared = read_u16_be(raw.data() + BLOCK_START_SIZE);
  const size_t after_header = raw.size() - FRAME_HEADER_SIZE;
  if (declared < COMMAND_SIZE) {
    return make_error(ErrorKind::FRAME_LENGTH, "Length field declares 0 bytes, no command byte");
  }
  if (after_header != static_cast<size_t>(declared) + CHECKSUM_SIZE) {
    char buf[96];
    snprintf(buf, sizeof(buf),
             "Length field declares %u bytes plus checksum, frame carries %zu after header",
             static_cast<unsigned>(declared), after_header);
    return make_error(ErrorKind::FRAME_LENGTH, buf);
  }

  // --- Validate Checksum ---
  const size_t crc_pos = raw.size() - CHECKSUM_SIZE;
  if (_validate_checksum) {
    const uint8_t expected = frame_checksum(raw.data(), crc_pos);
    const uint8_t received = raw[crc_pos];
    if (expected != received) {
      return make_error(ErrorKind::CHECKSUM, checksum_detail(expected, received));
    }
  }

  // --- Extract Message ---
  DecodedFrame frame;
  frame.command = raw[FRAME_HEADER_SIZE];
  frame.payload.assign(raw.data() + FRAME_HEADER_SIZE + COMMAND_SIZE, raw.data() + crc_pos);
  return frame;
}

}  // namespace rpc
}  // namespace boilerlink
