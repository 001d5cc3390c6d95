#include "BoilerQueries.h"

#include <stdio.h>

namespace boilerlink {
namespace queries {

const ValueAddress kTemperatureCatalog[] = {
    {"Boiler temperature (Kesseltemperatur)", 0x0000},
    {"Exhaust temperature (Abgastemperatur)", 0x0001},
    {"External temperature (Au\xC3\x9F" "entemperatur)", 0x0004},
    {"Buffer top temperature (Puffer 1 oben)", 0x0076},
    {"Buffer bottom temperature (Puffer 1 unten)", 0x0078},
    {"Hot water storage temperature (Boilertemperatur 1)", 0x005d},
};
const size_t kTemperatureCatalogSize = sizeof(kTemperatureCatalog) / sizeof(kTemperatureCatalog[0]);

namespace {

constexpr size_t kStateStatusBytes = 2;

void append_latin1(std::string& out, uint8_t c) {
  if (c < 0x80) {
    out.push_back(static_cast<char>(c));
  } else {
    out.push_back(static_cast<char>(0xC0 | (c >> 6)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  }
}

}  // namespace

rpc::Result<rpc::Bytes> readState(ProtocolClient& client) {
  return client.sendCommand(rpc::to_underlying(rpc::CommandId::CMD_READ_STATE));
}

rpc::Result<rpc::Bytes> readValues(ProtocolClient& client, etl::span<const uint16_t> addresses) {
  rpc::Bytes payload(addresses.size() * 2);
  for (size_t i = 0; i < addresses.size(); ++i) {
    rpc::write_u16_be(payload.data() + i * 2, addresses[i]);
  }
  return client.sendCommand(rpc::to_underlying(rpc::CommandId::CMD_READ_VALUES),
                            etl::span<const uint8_t>(payload.data(), payload.size()));
}

std::string formatTemperature(etl::span<const uint8_t> value, bool multiplied_by_2) {
  // Sign-extend from the first byte, then shift in the rest. Only the last
  // eight bytes survive a longer value.
  uint64_t bits = 0;
  if (!value.empty() && (value[0] & 0x80) != 0) {
    bits = ~static_cast<uint64_t>(0);
  }
  for (uint8_t b : value) {
    bits = (bits << 8) | b;
  }
  const int64_t raw = static_cast<int64_t>(bits);
  const double celsius = static_cast<double>(raw) / (multiplied_by_2 ? 2.0 : 1.0);

  char buf[32];
  snprintf(buf, sizeof(buf), "%.1f\xC2\xB0" "C", celsius);
  return buf;
}

std::vector<std::string> splitStateText(etl::span<const uint8_t> state) {
  std::vector<std::string> lines;
  std::string current;
  for (size_t i = kStateStatusBytes; i < state.size(); ++i) {
    if (state[i] == ';') {
      lines.push_back(current);
      current.clear();
    } else {
      append_latin1(current, state[i]);
    }
  }
  lines.push_back(current);
  return lines;
}

}  // namespace queries
}  // namespace boilerlink
