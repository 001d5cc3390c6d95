/*
 * This file is part of boilerlink.
 * (C) 2025 boilerlink contributors
 */
#include "ProtocolClient.h"

#include <utility>

#include "util/log.h"

namespace boilerlink {

ProtocolClient::ProtocolClient(SerialChannel& channel, const ClientConfig& config)
    : _channel(channel), _config(config), _codec(config.validate_checksum) {}

rpc::Result<rpc::Bytes> ProtocolClient::sendCommand(uint8_t command,
                                                    etl::span<const uint8_t> payload) {
  auto frame = _codec.encode(command, payload);
  if (!frame.has_value()) {
    return etl::unexpected<rpc::Error>(frame.error());
  }

  auto reply = _channel.transact(etl::span<const uint8_t>(frame.value().data(), frame.value().size()));
  if (!reply.has_value()) {
    log::debug(TAG_CLIENT, "Command %02X failed: %s", command, rpc::describe(reply.error()).c_str());
    return etl::unexpected<rpc::Error>(reply.error());
  }

  auto decoded = _codec.decode(etl::span<const uint8_t>(reply.value().data(), reply.value().size()));
  if (!decoded.has_value()) {
    log::debug(TAG_CLIENT, "Command %02X reply rejected: %s", command,
               rpc::describe(decoded.error()).c_str());
    return etl::unexpected<rpc::Error>(decoded.error());
  }

  if (decoded.value().command != command) {
    return rpc::make_error(rpc::ErrorKind::WRONG_COMMAND_IN_RESPONSE,
                           rpc::wrong_command_detail(command, decoded.value().command));
  }

  log::debug(TAG_CLIENT, "Command %02X answered with %zu payload bytes", command,
             decoded.value().payload.size());
  return std::move(decoded.value().payload);
}

}  // namespace boilerlink
