#ifndef PROXY_SERVER_H
#define PROXY_SERVER_H

#include <stddef.h>
#include <stdint.h>

#include <list>
#include <memory>
#include <mutex>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "ConnectionHandler.h"
#include "client/ProtocolClient.h"
#include "config/boilerlink_config.h"
#include "protocol/rpc_errors.h"

namespace boilerlink {

struct ProxyConfig {
  uint16_t port = 0;  // 0 binds an ephemeral port
  size_t max_line_length = BOILERLINK_MAX_LINE_LENGTH;
};

/**
 * @brief TCP front end for a ProtocolClient.
 *
 * The accept loop runs on run()'s thread and hands every connection to its
 * own thread, so a slow client or boiler never blocks accepting. All
 * connections share the one client and therefore the one serial channel.
 */
class ProxyServer {
 public:
  ProxyServer(ProtocolClient& client, const ProxyConfig& config);
  virtual ~ProxyServer();

  ProxyServer(const ProxyServer&) = delete;
  ProxyServer& operator=(const ProxyServer&) = delete;

  // Opens the listening socket. Fails with CONNECTION_INITIALIZATION.
  rpc::Result<void> listen();

  // Accepts until stop(); then shuts down open connections and joins them.
  void run();

  // Thread-safe; may be called before or during run().
  void stop();

  // Bound port, useful after listening on port 0.
  uint16_t port() const;

  size_t activeConnections() const;

  boost::asio::io_context& ioContext() { return _io; }

 protected:
  // Starts the thread serving one connection. Throws std::system_error when
  // no thread can be created; the connection is then dropped.
  virtual std::thread launch(std::shared_ptr<ConnectionHandler> handler);

 private:
  struct Connection {
    std::shared_ptr<ConnectionHandler> handler;
    std::thread thread;
  };

  void startAccept();
  void onAccept(const boost::system::error_code& ec, boost::asio::ip::tcp::socket socket);
  void reapFinished();
  void closeAll();

  ProtocolClient& _client;
  const ProxyConfig _config;
  boost::asio::io_context _io;
  boost::asio::ip::tcp::acceptor _acceptor;
  uint16_t _bound_port;

  mutable std::mutex _connections_mutex;
  std::list<Connection> _connections;
};

}  // namespace boilerlink

#endif  // PROXY_SERVER_H
