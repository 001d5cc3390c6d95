#ifndef ASIO_SERIAL_PORT_H
#define ASIO_SERIAL_PORT_H

#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/serial_port.hpp>
#include <boost/asio/steady_timer.hpp>

#include "SerialPort.h"

namespace boilerlink {

/**
 * @brief SerialPort over a real TTY, 8N1 without flow control.
 *
 * Reads run on a private io_context so a deadline timer can cancel them.
 */
class AsioSerialPort : public SerialPort {
 public:
  AsioSerialPort();
  ~AsioSerialPort() override;

  AsioSerialPort(const AsioSerialPort&) = delete;
  AsioSerialPort& operator=(const AsioSerialPort&) = delete;

  // Fails with CONNECTION_INITIALIZATION if the device cannot be opened or configured.
  rpc::Result<void> open(const std::string& device, unsigned long baudrate);
  bool isOpen() const { return _port.is_open(); }
  void close();

  rpc::Result<size_t> write(etl::span<const uint8_t> data) override;
  rpc::Result<size_t> read(uint8_t* buffer, size_t len,
                           std::chrono::milliseconds timeout) override;
  void discardInput() override;

 private:
  boost::asio::io_context _io;
  boost::asio::serial_port _port;
  boost::asio::steady_timer _timer;
  std::string _device;
};

}  // namespace boilerlink

#endif  // ASIO_SERIAL_PORT_H
