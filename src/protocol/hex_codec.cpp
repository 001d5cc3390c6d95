#include "hex_codec.h"

#include <stdio.h>

namespace boilerlink {
namespace hex {

namespace {

constexpr char kDigits[] = "0123456789abcdef";

int nibble_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string encode(etl::span<const uint8_t> bytes) {
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0F]);
  }
  return out;
}

rpc::Result<rpc::Bytes> decode(etl::string_view text) {
  // Report the first bad character before the parity so "xyz" names position 0.
  for (size_t i = 0; i < text.size(); ++i) {
    if (nibble_value(text[i]) < 0) {
      char buf[64];
      snprintf(buf, sizeof(buf), "non-hexadecimal number found at position %zu", i);
      return rpc::make_error(rpc::ErrorKind::HEX_DECODE, buf);
    }
  }
  if (text.size() % 2 != 0) {
    return rpc::make_error(rpc::ErrorKind::HEX_DECODE, "odd-length hex string");
  }

  rpc::Bytes out;
  out.reserve(text.size() / 2);
  for (size_t i = 0; i < text.size(); i += 2) {
    out.push_back(static_cast<uint8_t>((nibble_value(text[i]) << 4) | nibble_value(text[i + 1])));
  }
  return out;
}

}  // namespace hex
}  // namespace boilerlink
