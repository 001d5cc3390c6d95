#include "checksum.h"

namespace boilerlink {
namespace rpc {

uint8_t frame_checksum(const uint8_t* data, size_t len) {
  uint8_t crc = 0;
  for (size_t i = 0; i < len; i++) {
    const uint8_t b = data[i];
    crc = static_cast<uint8_t>(crc ^ b ^ static_cast<uint8_t>(b << 1));
  }
  return crc;
}

}  // namespace rpc
}  // namespace boilerlink
