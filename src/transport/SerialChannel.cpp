#include "SerialChannel.h"

#include <stdio.h>

#include "protocol/frame_codec.h"
#include "util/log.h"

namespace boilerlink {

SerialChannel::SerialChannel(SerialPort& port, std::chrono::milliseconds read_timeout)
    : _port(port), _read_timeout(read_timeout), _mutex() {}

rpc::Result<rpc::Bytes> SerialChannel::transact(etl::span<const uint8_t> frame) {
  std::lock_guard<std::mutex> lock(_mutex);

  // A late reply to an earlier, timed-out request must not be taken for ours.
  _port.discardInput();

  auto written = _port.write(frame);
  if (!written.has_value()) {
    return etl::unexpected<rpc::Error>(written.error());
  }
  if (written.value() != frame.size()) {
    char buf[64];
    snprintf(buf, sizeof(buf), "short write: %zu of %zu bytes", written.value(), frame.size());
    return rpc::make_error(rpc::ErrorKind::SERIAL_PORT_IO, buf);
  }

  // --- Header ---
  const size_t header_size = rpc::FrameCodec::headerSize();
  rpc::Bytes reply(header_size);
  auto header_read = _port.read(reply.data(), header_size, _read_timeout);
  if (!header_read.has_value()) {
    return etl::unexpected<rpc::Error>(header_read.error());
  }
  const size_t header_len = header_read.value();
  if (header_len == 0) {
    char buf[48];
    snprintf(buf, sizeof(buf), "No response within %lld ms",
             static_cast<long long>(_read_timeout.count()));
    log::warn(TAG_SERIAL, "%s", buf);
    return rpc::make_error(rpc::ErrorKind::TIMEOUT, buf);
  }
  if (header_len < header_size || !rpc::FrameCodec::hasBlockStart(reply.data())) {
    reply.resize(header_len);
    return reply;
  }

  // --- Command, payload, checksum ---
  const size_t remaining = rpc::FrameCodec::remainingAfterHeader(reply.data());
  reply.resize(header_size + remaining);
  auto body_read = _port.read(reply.data() + header_size, remaining, _read_timeout);
  if (!body_read.has_value()) {
    return etl::unexpected<rpc::Error>(body_read.error());
  }
  if (body_read.value() < remaining) {
    return rpc::make_error(rpc::ErrorKind::INCOMPLETE_FRAME,
                           rpc::incomplete_detail(remaining, body_read.value()));
  }

  log::debug(TAG_SERIAL, "Transaction complete: %zu bytes out, %zu bytes in", frame.size(),
             reply.size());
  return reply;
}

}  // namespace boilerlink
