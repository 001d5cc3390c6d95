#ifndef CHECKSUM_H
#define CHECKSUM_H

#include <stddef.h>
#include <stdint.h>

namespace boilerlink {
namespace rpc {

// Running one-byte checksum used by the controller:
//   crc = crc ^ b ^ ((b << 1) & 0xFF), starting from 0.
uint8_t frame_checksum(const uint8_t* data, size_t len);

}  // namespace rpc
}  // namespace boilerlink

#endif  // CHECKSUM_H
