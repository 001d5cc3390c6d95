/*
 * This file is part of boilerlink.

 * Copyright (C) 2025 boilerlink contributors

 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.

 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.

 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef RPC_PROTOCOL_H
#define RPC_PROTOCOL_H

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "config/boilerlink_config.h"

namespace boilerlink {
namespace rpc {

// Owned byte sequence: frames, payloads, decoded hex lines.
using Bytes = std::vector<uint8_t>;

// --- Frame layout ---
//
//   02 FD | LEN_HI LEN_LO | CMD | PAYLOAD... | CRC
//
// LEN counts CMD + PAYLOAD. CRC covers every preceding byte.

constexpr uint8_t BLOCK_START_0 = 0x02;
constexpr uint8_t BLOCK_START_1 = 0xFD;
constexpr size_t BLOCK_START_SIZE = 2;
constexpr size_t LENGTH_FIELD_SIZE = 2;
constexpr size_t FRAME_HEADER_SIZE = BLOCK_START_SIZE + LENGTH_FIELD_SIZE;
constexpr size_t COMMAND_SIZE = 1;
constexpr size_t CHECKSUM_SIZE = 1;

// The length field is a big-endian uint16 and includes the command byte.
constexpr size_t MAX_MESSAGE_SIZE = 0xFFFF;
constexpr size_t MAX_PAYLOAD_SIZE = MAX_MESSAGE_SIZE - COMMAND_SIZE;

static_assert(FRAME_HEADER_SIZE == 4, "Frame header must be exactly 4 bytes");

// --- Link defaults ---
constexpr unsigned long RPC_DEFAULT_BAUDRATE = BOILERLINK_DEFAULT_BAUDRATE;
constexpr unsigned long RPC_DEFAULT_READ_TIMEOUT_MS = BOILERLINK_DEFAULT_READ_TIMEOUT_MS;

// --- Known commands ---
// Only the two the front end issues; everything else is passed through opaque.
enum class CommandId : uint8_t {
  CMD_READ_VALUES = 0x30,   // Aktuelle Werte des Kessels
  CMD_READ_STATE = 0x51,    // Kesselzustand abfragen
};

template <typename E>
constexpr uint8_t to_underlying(E e) {
  return static_cast<uint8_t>(e);
}

// --- Endianness-safe helpers for Big Endian (Network Byte Order) ---

inline uint16_t read_u16_be(const uint8_t* buffer) {
  return static_cast<uint16_t>((static_cast<uint16_t>(buffer[0]) << 8) | buffer[1]);
}

inline void write_u16_be(uint8_t* buffer, uint16_t value) {
  buffer[0] = static_cast<uint8_t>((value >> 8) & 0xFF);
  buffer[1] = static_cast<uint8_t>(value & 0xFF);
}

}  // namespace rpc
}  // namespace boilerlink

#endif  // RPC_PROTOCOL_H
