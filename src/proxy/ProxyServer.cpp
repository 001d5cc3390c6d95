#include "ProxyServer.h"

#include <new>
#include <system_error>
#include <utility>

#include <boost/asio/post.hpp>

#include "util/log.h"

namespace boilerlink {

using boost::asio::ip::tcp;

ProxyServer::ProxyServer(ProtocolClient& client, const ProxyConfig& config)
    : _client(client),
      _config(config),
      _io(),
      _acceptor(_io),
      _bound_port(0),
      _connections_mutex(),
      _connections() {}

ProxyServer::~ProxyServer() { closeAll(); }

rpc::Result<void> ProxyServer::listen() {
  boost::system::error_code ec;
  const tcp::endpoint endpoint(tcp::v4(), _config.port);

  _acceptor.open(endpoint.protocol(), ec);
  if (!ec) _acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
  if (!ec) _acceptor.bind(endpoint, ec);
  if (!ec) _acceptor.listen(BOILERLINK_LISTEN_BACKLOG, ec);
  if (ec) {
    boost::system::error_code ignored;
    _acceptor.close(ignored);
    return rpc::make_error(rpc::ErrorKind::CONNECTION_INITIALIZATION,
                           "could not listen on TCP port " + std::to_string(_config.port) + ": " +
                               ec.message());
  }

  _bound_port = _acceptor.local_endpoint(ec).port();
  log::info(TAG_PROXY, "Listening on TCP port %u", static_cast<unsigned>(_bound_port));
  return rpc::Result<void>();
}

void ProxyServer::run() {
  if (_acceptor.is_open()) {
    startAccept();
  }
  _io.run();
  closeAll();
  log::info(TAG_PROXY, "Proxy stopped");
}

void ProxyServer::stop() {
  boost::asio::post(_io, [this]() {
    boost::system::error_code ignored;
    _acceptor.close(ignored);
  });
}

uint16_t ProxyServer::port() const { return _bound_port; }

size_t ProxyServer::activeConnections() const {
  std::lock_guard<std::mutex> lock(_connections_mutex);
  size_t active = 0;
  for (const Connection& c : _connections) {
    if (!c.handler->isFinished()) {
      ++active;
    }
  }
  return active;
}

void ProxyServer::startAccept() {
  _acceptor.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
    onAccept(ec, std::move(socket));
  });
}

void ProxyServer::onAccept(const boost::system::error_code& ec, tcp::socket socket) {
  if (ec == boost::asio::error::operation_aborted || !_acceptor.is_open()) {
    return;  // stop()
  }

  reapFinished();

  if (ec) {
    // Transient (e.g. EMFILE, ECONNABORTED); keep listening.
    log::error(TAG_PROXY, "Error accepting TCP connection: %s", ec.message().c_str());
  } else {
    // A connection that cannot be set up is dropped; the listener carries on.
    try {
      std::shared_ptr<ConnectionHandler> handler =
          std::make_shared<ConnectionHandler>(std::move(socket), _client, _config.max_line_length);
      std::lock_guard<std::mutex> lock(_connections_mutex);
      _connections.push_back(Connection{handler, std::thread()});
      try {
        _connections.back().thread = launch(handler);
      } catch (const std::system_error&) {
        _connections.pop_back();
        throw;
      }
    } catch (const std::system_error& e) {
      log::error(TAG_PROXY, "Could not start connection task: %s", e.what());
    } catch (const std::bad_alloc&) {
      log::error(TAG_PROXY, "Out of memory while accepting connection");
    }
  }

  startAccept();
}

std::thread ProxyServer::launch(std::shared_ptr<ConnectionHandler> handler) {
  return std::thread([handler]() { handler->run(); });
}

void ProxyServer::reapFinished() {
  std::lock_guard<std::mutex> lock(_connections_mutex);
  for (auto it = _connections.begin(); it != _connections.end();) {
    if (it->handler->isFinished()) {
      it->thread.join();
      it = _connections.erase(it);
    } else {
      ++it;
    }
  }
}

void ProxyServer::closeAll() {
  std::list<Connection> connections;
  {
    std::lock_guard<std::mutex> lock(_connections_mutex);
    connections.swap(_connections);
  }
  for (Connection& c : connections) {
    c.handler->shutdown();
  }
  for (Connection& c : connections) {
    if (c.thread.joinable()) {
      c.thread.join();
    }
  }
}

}  // namespace boilerlink
