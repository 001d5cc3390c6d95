#ifndef BOILER_QUERIES_H
#define BOILER_QUERIES_H

#include <stdint.h>

#include <string>
#include <vector>

#include <etl/span.h>

#include "ProtocolClient.h"

namespace boilerlink {
namespace queries {

// Address of one measured value, sent as two big-endian bytes.
struct ValueAddress {
  const char* label;
  uint16_t address;
};

// The temperatures the front end prints with --values.
extern const ValueAddress kTemperatureCatalog[];
extern const size_t kTemperatureCatalogSize;

// Boiler state (command 0x51): two status bytes, then ';'-separated text.
rpc::Result<rpc::Bytes> readState(ProtocolClient& client);

// Current values (command 0x30) for the given addresses, two bytes each in the reply.
rpc::Result<rpc::Bytes> readValues(ProtocolClient& client, etl::span<const uint16_t> addresses);

// Signed big-endian integer as "%.1f°C", halved when the controller stores it doubled.
std::string formatTemperature(etl::span<const uint8_t> value, bool multiplied_by_2 = true);

// State text after the two status bytes, Latin-1 converted to UTF-8, split on ';'.
std::vector<std::string> splitStateText(etl::span<const uint8_t> state);

}  // namespace queries
}  // namespace boilerlink

#endif  // BOILER_QUERIES_H
