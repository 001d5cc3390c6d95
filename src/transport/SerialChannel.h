#ifndef SERIAL_CHANNEL_H
#define SERIAL_CHANNEL_H

#include <stdint.h>

#include <chrono>
#include <mutex>
#include <string>

#include <etl/span.h>

#include "SerialPort.h"
#include "protocol/rpc_errors.h"
#include "protocol/rpc_protocol.h"

namespace boilerlink {

struct SerialConfig {
  std::string device;
  unsigned long baudrate = rpc::RPC_DEFAULT_BAUDRATE;
  unsigned long read_timeout_ms = rpc::RPC_DEFAULT_READ_TIMEOUT_MS;
};

/**
 * @brief One request/response round trip at a time over a half-duplex link.
 *
 * transact() holds the channel mutex from the first written byte until the
 * reply is complete or has failed, so a reply always belongs to the request
 * that precedes it on the wire. Callers queue on the mutex; a timed-out
 * request releases it like any other.
 */
class SerialChannel {
 public:
  SerialChannel(SerialPort& port, std::chrono::milliseconds read_timeout);

  SerialChannel(const SerialChannel&) = delete;
  SerialChannel& operator=(const SerialChannel&) = delete;

  // Writes one encoded frame and returns the raw reply frame.
  //
  // TIMEOUT           nothing arrived within the read timeout
  // INCOMPLETE_FRAME  fewer bytes than the header declared
  // SERIAL_PORT_IO    the port failed
  //
  // A short or foreign header is returned unchanged for the codec to reject.
  rpc::Result<rpc::Bytes> transact(etl::span<const uint8_t> frame);

  std::chrono::milliseconds readTimeout() const { return _read_timeout; }

 private:
  SerialPort& _port;
  const std::chrono::milliseconds _read_timeout;
  std::mutex _mutex;
};

}  // namespace boilerlink

#endif  // SERIAL_CHANNEL_H
