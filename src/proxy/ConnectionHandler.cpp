#include "ConnectionHandler.h"

#include <cstddef>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>

#include "protocol/hex_codec.h"
#include "util/log.h"

namespace boilerlink {

namespace {

using InputIterator = boost::asio::buffers_iterator<boost::asio::streambuf::const_buffers_type>;

// Lines end at '\n' or '\r'; "\r\n" yields a blank line that is skipped.
std::pair<InputIterator, bool> match_line_end(InputIterator begin, InputIterator end) {
  for (InputIterator it = begin; it != end; ++it) {
    if (*it == '\n' || *it == '\r') {
      return std::make_pair(it + 1, true);
    }
  }
  return std::make_pair(end, false);
}

std::string describe_peer(const boost::asio::ip::tcp::socket& socket) {
  boost::system::error_code ec;
  const boost::asio::ip::tcp::endpoint remote = socket.remote_endpoint(ec);
  if (ec) {
    return "unknown peer";
  }
  return remote.address().to_string() + ":" + std::to_string(remote.port());
}

}  // namespace

ConnectionHandler::ConnectionHandler(boost::asio::ip::tcp::socket socket, ProtocolClient& client,
                                     size_t max_line_length)
    : _socket(std::move(socket)),
      _input(max_line_length + 1),
      _client(client),
      _fsm(),
      _peer(describe_peer(_socket)),
      _close_mutex(),
      _finished(false) {}

void ConnectionHandler::run() {
  _fsm.begin();
  log::info(TAG_CONN, "Connection from %s", _peer.c_str());

  while (!_fsm.isClosed()) {
    std::string line;
    const ReadStatus status = readLine(line);

    if (status == ReadStatus::CLOSED) {
      _fsm.disconnected();
      break;
    }
    if (status == ReadStatus::TOO_LONG) {
      // The rest of the oversized line is still in flight; no way to resync.
      log::warn(TAG_CONN, "%s sent an overlong line, closing", _peer.c_str());
      _fsm.lineReceived();
      if (writeLine(errorLine(rpc::Error{rpc::ErrorKind::HEX_DECODE, "line too long"}))) {
        _fsm.responseSent();
      }
      _fsm.disconnected();
      break;
    }
    if (line.empty()) {
      continue;
    }

    _fsm.lineReceived();
    const std::string reply = handleLine(_client, etl::string_view(line.data(), line.size()));
    if (!writeLine(reply)) {
      _fsm.disconnected();
      break;
    }
    _fsm.responseSent();
  }

  {
    std::lock_guard<std::mutex> lock(_close_mutex);
    boost::system::error_code ignored;
    _socket.close(ignored);
  }
  log::info(TAG_CONN, "Connection from %s closed", _peer.c_str());
  _finished.store(true);
}

void ConnectionHandler::shutdown() {
  std::lock_guard<std::mutex> lock(_close_mutex);
  if (!_socket.is_open()) {
    return;
  }
  boost::system::error_code ignored;
  _socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
}

std::string ConnectionHandler::handleLine(ProtocolClient& client, etl::string_view line) {
  if (line.empty()) {
    return std::string();
  }

  auto request = hex::decode(line);
  if (!request.has_value()) {
    return errorLine(request.error());
  }

  const rpc::Bytes& bytes = request.value();
  const uint8_t command = bytes[0];
  auto reply = client.sendCommand(command, etl::span<const uint8_t>(bytes.data() + 1, bytes.size() - 1));
  if (!reply.has_value()) {
    log::warn(TAG_CONN, "Command %02X failed: %s", command, rpc::describe(reply.error()).c_str());
    return errorLine(reply.error());
  }

  std::string out = hex::encode(etl::span<const uint8_t>(reply.value().data(), reply.value().size()));
  out.push_back('\n');
  return out;
}

std::string ConnectionHandler::errorLine(const rpc::Error& error) {
  std::string out("!");
  out += rpc::describe(error);
  out.push_back('\n');
  return out;
}

ConnectionHandler::ReadStatus ConnectionHandler::readLine(std::string& line) {
  boost::system::error_code ec;
  const size_t n = boost::asio::read_until(_socket, _input, match_line_end, ec);
  if (ec == boost::asio::error::not_found) {
    return ReadStatus::TOO_LONG;
  }
  if (ec) {
    if (ec != boost::asio::error::eof) {
      log::debug(TAG_CONN, "%s read failed: %s", _peer.c_str(), ec.message().c_str());
    }
    return ReadStatus::CLOSED;
  }

  const InputIterator begin = boost::asio::buffers_begin(_input.data());
  line.assign(begin, begin + static_cast<std::ptrdiff_t>(n - 1));
  _input.consume(n);
  return ReadStatus::LINE;
}

bool ConnectionHandler::writeLine(const std::string& line) {
  boost::system::error_code ec;
  boost::asio::write(_socket, boost::asio::buffer(line), ec);
  if (ec) {
    log::debug(TAG_CONN, "%s write failed: %s", _peer.c_str(), ec.message().c_str());
    return false;
  }
  return true;
}

}  // namespace boilerlink
