#ifndef SERIAL_PORT_H
#define SERIAL_PORT_H

#include <stddef.h>
#include <stdint.h>

#include <chrono>

#include <etl/span.h>

#include "protocol/rpc_errors.h"

namespace boilerlink {

/**
 * @brief Byte-level access to the controller link.
 *
 * Implementations are not required to be thread-safe; SerialChannel is the
 * only caller and serializes all access.
 */
class SerialPort {
 public:
  virtual ~SerialPort() {}

  // Writes all bytes or fails with SERIAL_PORT_IO.
  virtual rpc::Result<size_t> write(etl::span<const uint8_t> data) = 0;

  // Blocks until len bytes arrived or timeout elapsed and returns the count
  // received, possibly 0. A closed device gives a short count, not an error.
  virtual rpc::Result<size_t> read(uint8_t* buffer, size_t len,
                                   std::chrono::milliseconds timeout) = 0;

  // Drops anything received but not yet read.
  virtual void discardInput() = 0;
};

}  // namespace boilerlink

#endif  // SERIAL_PORT_H
