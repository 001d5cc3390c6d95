#ifndef CONNECTION_HANDLER_H
#define CONNECTION_HANDLER_H

#include <stddef.h>

#include <atomic>
#include <mutex>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/streambuf.hpp>
#include <etl/string_view.h>

#include "client/ProtocolClient.h"
#include "fsm/connection_fsm.h"
#include "protocol/rpc_errors.h"

namespace boilerlink {

/**
 * @brief Serves the hex line protocol on one accepted TCP connection.
 *
 * run() blocks on the socket and on the shared serial channel. It returns
 * only when the peer disconnects or the socket fails; malformed lines and
 * boiler errors are answered with "!<ErrorKind>: <detail>" lines instead.
 */
class ConnectionHandler {
 public:
  ConnectionHandler(boost::asio::ip::tcp::socket socket, ProtocolClient& client,
                    size_t max_line_length);

  ConnectionHandler(const ConnectionHandler&) = delete;
  ConnectionHandler& operator=(const ConnectionHandler&) = delete;

  void run();

  // Unblocks run() from another thread.
  void shutdown();

  bool isFinished() const { return _finished.load(); }

  /**
   * @brief Turns one received line (terminator stripped) into the reply line.
   *
   * Returns the text to send including its '\n', or an empty string for a
   * blank line, which gets no reply.
   */
  static std::string handleLine(ProtocolClient& client, etl::string_view line);

  // "!<ErrorKindName>: <detail>\n"
  static std::string errorLine(const rpc::Error& error);

 private:
  enum class ReadStatus { LINE, TOO_LONG, CLOSED };

  ReadStatus readLine(std::string& line);
  bool writeLine(const std::string& line);

  boost::asio::ip::tcp::socket _socket;
  boost::asio::streambuf _input;
  ProtocolClient& _client;
  fsm::ConnectionFsm _fsm;
  std::string _peer;
  std::mutex _close_mutex;  // guards close() against shutdown()
  std::atomic<bool> _finished;
};

}  // namespace boilerlink

#endif  // CONNECTION_HANDLER_H
