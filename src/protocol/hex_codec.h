#ifndef HEX_CODEC_H
#define HEX_CODEC_H

#include <stdint.h>

#include <string>

#include <etl/span.h>
#include <etl/string_view.h>

#include "rpc_errors.h"
#include "rpc_protocol.h"

namespace boilerlink {
namespace hex {

/**
 * @brief Lowercase hex, two characters per byte, no separators.
 */
std::string encode(etl::span<const uint8_t> bytes);

/**
 * @brief Strict hex decoding for the line protocol.
 *
 * Accepts upper and lower case digits. Fails with HEX_DECODE on an odd
 * number of characters or on the first non-hex character.
 */
rpc::Result<rpc::Bytes> decode(etl::string_view text);

}  // namespace hex
}  // namespace boilerlink

#endif  // HEX_CODEC_H
