#ifndef RPC_ERRORS_H
#define RPC_ERRORS_H

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <utility>

#include <etl/expected.h>

namespace boilerlink {
namespace rpc {

// Every failure the library can report. The names returned by
// error_kind_name() are part of the TCP line protocol.
enum class ErrorKind : uint8_t {
  WRONG_RESPONSE_HEADER,
  FRAME_LENGTH,
  CHECKSUM,
  TIMEOUT,
  INCOMPLETE_FRAME,
  PAYLOAD_TOO_LARGE,
  HEX_DECODE,
  WRONG_COMMAND_IN_RESPONSE,
  SERIAL_PORT_IO,
  CONNECTION_INITIALIZATION
};

struct Error {
  ErrorKind kind;
  std::string detail;
};

template <typename T>
using Result = etl::expected<T, Error>;

inline etl::unexpected<Error> make_error(ErrorKind kind, std::string detail) {
  return etl::unexpected<Error>(Error{kind, std::move(detail)});
}

const char* error_kind_name(ErrorKind kind);

// "<ErrorKindName>: <detail>", no prefix, no terminator.
std::string describe(const Error& error);

// Detail builders shared by the codec, the channel and the client.
std::string wrong_header_detail(const uint8_t* received, size_t len);
std::string checksum_detail(uint8_t expected, uint8_t actual);
std::string incomplete_detail(size_t declared, size_t actual);
std::string wrong_command_detail(uint8_t expected, uint8_t actual);

}  // namespace rpc
}  // namespace boilerlink

#endif  // RPC_ERRORS_H
