#include "AsioSerialPort.h"

#include <termios.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include "util/log.h"

namespace boilerlink {

namespace {

using boost::asio::serial_port_base;

rpc::Result<void> init_error(const std::string& device, const boost::system::error_code& ec) {
  return rpc::make_error(rpc::ErrorKind::CONNECTION_INITIALIZATION,
                         "could not open port " + device + ": " + ec.message());
}

}  // namespace

AsioSerialPort::AsioSerialPort() : _io(), _port(_io), _timer(_io), _device() {}

AsioSerialPort::~AsioSerialPort() { close(); }

rpc::Result<void> AsioSerialPort::open(const std::string& device, unsigned long baudrate) {
  boost::system::error_code ec;
  _port.open(device, ec);
  if (ec) {
    return init_error(device, ec);
  }

  _port.set_option(serial_port_base::baud_rate(static_cast<unsigned int>(baudrate)), ec);
  if (!ec) _port.set_option(serial_port_base::character_size(8), ec);
  if (!ec) _port.set_option(serial_port_base::parity(serial_port_base::parity::none), ec);
  if (!ec) _port.set_option(serial_port_base::stop_bits(serial_port_base::stop_bits::one), ec);
  if (!ec) {
    _port.set_option(serial_port_base::flow_control(serial_port_base::flow_control::none), ec);
  }
  if (ec) {
    close();
    return init_error(device, ec);
  }

  _device = device;
  log::info(TAG_SERIAL, "Opened %s at %lu baud", device.c_str(), baudrate);
  return rpc::Result<void>();
}

void AsioSerialPort::close() {
  if (_port.is_open()) {
    boost::system::error_code ignored;
    _port.close(ignored);
    log::debug(TAG_SERIAL, "Closed %s", _device.c_str());
  }
}

rpc::Result<size_t> AsioSerialPort::write(etl::span<const uint8_t> data) {
  boost::system::error_code ec;
  const size_t written = boost::asio::write(_port, boost::asio::buffer(data.data(), data.size()), ec);
  if (ec) {
    return rpc::make_error(rpc::ErrorKind::SERIAL_PORT_IO, "write to " + _device + " failed: " + ec.message());
  }
  return written;
}

rpc::Result<size_t> AsioSerialPort::read(uint8_t* buffer, size_t len,
                                         std::chrono::milliseconds timeout) {
  if (len == 0) {
    return static_cast<size_t>(0);
  }

  size_t received = 0;
  bool read_done = false;
  boost::system::error_code read_error;

  boost::asio::async_read(_port, boost::asio::buffer(buffer, len),
                          [&](const boost::system::error_code& ec, size_t n) {
                            read_error = ec;
                            received = n;
                            read_done = true;
                            _timer.cancel();
                          });

  _timer.expires_after(timeout);
  _timer.async_wait([&](const boost::system::error_code& ec) {
    if (!ec && !read_done) {
      // Deadline hit: abort the read, keeping whatever arrived so far.
      boost::system::error_code ignored;
      _port.cancel(ignored);
    }
  });

  _io.restart();
  _io.run();

  if (read_error && read_error != boost::asio::error::operation_aborted &&
      read_error != boost::asio::error::eof) {
    return rpc::make_error(rpc::ErrorKind::SERIAL_PORT_IO,
                           "read from " + _device + " failed: " + read_error.message());
  }
  return received;
}

void AsioSerialPort::discardInput() {
  if (_port.is_open() && ::tcflush(_port.native_handle(), TCIFLUSH) != 0) {
    log::warn(TAG_SERIAL, "Could not discard pending input on %s", _device.c_str());
  }
}

}  // namespace boilerlink
