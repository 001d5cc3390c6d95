/*
 * This file is part of boilerlink.
 * (C) 2025 boilerlink contributors
 */
#ifndef PROTOCOL_CLIENT_H
#define PROTOCOL_CLIENT_H

#include <stdint.h>

#include <etl/span.h>

#include "config/boilerlink_config.h"
#include "protocol/frame_codec.h"
#include "protocol/rpc_errors.h"
#include "protocol/rpc_protocol.h"
#include "transport/SerialChannel.h"

namespace boilerlink {

struct ClientConfig {
  // S4 Turbo answers some value requests with a wrong checksum, reproducibly,
  // so checking is opt-in.
  bool validate_checksum = (BOILERLINK_DEFAULT_VALIDATE_CHECKSUM != 0);
};

/**
 * @brief Request/response API shared by direct callers and the TCP proxy.
 *
 * Safe to call from several threads; the channel serializes the wire.
 */
class ProtocolClient {
 public:
  explicit ProtocolClient(SerialChannel& channel, const ClientConfig& config = ClientConfig());

  /**
   * @brief Sends one command and returns the reply payload.
   *
   * The reply is stripped of marker, length, command byte and checksum.
   * Codec and channel errors are returned unchanged; a reply for another
   * command fails with WRONG_COMMAND_IN_RESPONSE.
   */
  rpc::Result<rpc::Bytes> sendCommand(uint8_t command,
                                      etl::span<const uint8_t> payload = etl::span<const uint8_t>());

  const ClientConfig& config() const { return _config; }

 private:
  SerialChannel& _channel;
  const ClientConfig _config;
  const rpc::FrameCodec _codec;
};

}  // namespace boilerlink

#endif  // PROTOCOL_CLIENT_H
