#ifndef FRAME_CODEC_H
#define FRAME_CODEC_H

#include <stddef.h>
#include <stdint.h>

#include <etl/span.h>

#include "rpc_errors.h"
#include "rpc_protocol.h"

namespace boilerlink {
namespace rpc {

struct DecodedFrame {
  uint8_t command;
  Bytes payload;
};

/**
 * @brief Builds and validates controller frames.
 *
 * All frame layout knowledge lives here and in checksum.cpp. The serial
 * channel only asks how large the header is and how many bytes follow it.
 * Both directions are pure functions of their input.
 */
class FrameCodec {
 public:
  explicit FrameCodec(bool validate_checksum = false);

  // Wraps command + payload in marker, length and checksum.
  Result<Bytes> encode(uint8_t command, etl::span<const uint8_t> payload) const;

  // Checks marker, length and (optionally) checksum, then strips them.
  Result<DecodedFrame> decode(etl::span<const uint8_t> raw) const;

  bool validatesChecksum() const { return _validate_checksum; }

  static constexpr size_t headerSize() { return FRAME_HEADER_SIZE; }

  // True if the first bytes carry the block start marker. Needs headerSize() bytes.
  static bool hasBlockStart(const uint8_t* header);

  // Bytes still to be read after a header: command + payload + checksum.
  static size_t remainingAfterHeader(const uint8_t* header);

 private:
  bool _validate_checksum;
};

}  // namespace rpc
}  // namespace boilerlink

#endif  // FRAME_CODEC_H
