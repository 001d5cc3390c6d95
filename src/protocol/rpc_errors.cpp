#include "rpc_errors.h"

#include <stdio.h>

#include "hex_codec.h"

namespace boilerlink {
namespace rpc {

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::WRONG_RESPONSE_HEADER:
      return "WrongResponseHeaderError";
    case ErrorKind::FRAME_LENGTH:
      return "FrameLengthError";
    case ErrorKind::CHECKSUM:
      return "ChecksumError";
    case ErrorKind::TIMEOUT:
      return "TimeoutError";
    case ErrorKind::INCOMPLETE_FRAME:
      return "IncompleteFrameError";
    case ErrorKind::PAYLOAD_TOO_LARGE:
      return "PayloadTooLargeError";
    case ErrorKind::HEX_DECODE:
      return "HexDecodeError";
    case ErrorKind::WRONG_COMMAND_IN_RESPONSE:
      return "WrongCommandInResponseError";
    case ErrorKind::SERIAL_PORT_IO:
      return "SerialPortIOError";
    case ErrorKind::CONNECTION_INITIALIZATION:
      return "ConnectionInitializationError";
  }
  return "UnknownError";
}

std::string describe(const Error& error) {
  std::string text(error_kind_name(error.kind));
  text += ": ";
  text += error.detail;
  return text;
}

std::string wrong_header_detail(const uint8_t* received, size_t len) {
  return "Received: " + hex::encode(etl::span<const uint8_t>(received, len));
}

std::string checksum_detail(uint8_t expected, uint8_t actual) {
  char buf[48];
  snprintf(buf, sizeof(buf), "Expected CRC value %02X, received %02X", expected, actual);
  return buf;
}

std::string incomplete_detail(size_t declared, size_t actual) {
  char buf[80];
  snprintf(buf, sizeof(buf), "Expected %zu bytes after frame header, received %zu", declared,
           actual);
  return buf;
}

std::string wrong_command_detail(uint8_t expected, uint8_t actual) {
  char buf[48];
  snprintf(buf, sizeof(buf), "Expected command %02X, received %02X", expected, actual);
  return buf;
}

}  // namespace rpc
}  // namespace boilerlink
