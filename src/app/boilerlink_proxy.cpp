/*
 * boilerlink_proxy <tty> [--port|-p N] [--state|-s] [--values]
 *                        [--check-crc] [--timeout-ms N] [--baud N] [--verbose|-v]
 */
#include <getopt.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>

#include <string>
#include <vector>

#include <boost/asio/signal_set.hpp>

#include "client/BoilerQueries.h"
#include "client/ProtocolClient.h"
#include "protocol/hex_codec.h"
#include "proxy/ProxyServer.h"
#include "transport/AsioSerialPort.h"
#include "transport/SerialChannel.h"
#include "util/log.h"

using namespace boilerlink;

namespace {

struct Options {
  SerialConfig serial;
  ClientConfig client;
  ProxyConfig proxy;
  bool run_proxy = false;
  bool print_state = false;
  bool print_values = false;
  bool verbose = false;
};

enum LongOnly { OPT_VALUES = 1000, OPT_CHECK_CRC, OPT_TIMEOUT_MS, OPT_BAUD };

void usage(const char* argv0) {
  fprintf(stderr,
          "Usage: %s <tty> [--port|-p N] [--state|-s] [--values] [--check-crc]\n"
          "          [--timeout-ms N] [--baud N] [--verbose|-v]\n",
          argv0);
}

bool parse_number(const char* text, unsigned long max, unsigned long& out) {
  char* end = nullptr;
  const unsigned long value = strtoul(text, &end, 10);
  if (end == text || *end != '\0' || value > max) {
    return false;
  }
  out = value;
  return true;
}

bool parse_options(int argc, char** argv, Options& options) {
  static const struct option kLongOptions[] = {
      {"port", required_argument, nullptr, 'p'},
      {"state", no_argument, nullptr, 's'},
      {"values", no_argument, nullptr, OPT_VALUES},
      {"check-crc", no_argument, nullptr, OPT_CHECK_CRC},
      {"timeout-ms", required_argument, nullptr, OPT_TIMEOUT_MS},
      {"baud", required_argument, nullptr, OPT_BAUD},
      {"verbose", no_argument, nullptr, 'v'},
      {nullptr, 0, nullptr, 0},
  };

  unsigned long number = 0;
  int opt;
  while ((opt = getopt_long(argc, argv, "p:sv", kLongOptions, nullptr)) != -1) {
    switch (opt) {
      case 'p':
        if (!parse_number(optarg, 65535, number)) {
          fprintf(stderr, "Invalid port: %s\n", optarg);
          return false;
        }
        options.proxy.port = static_cast<uint16_t>(number);
        options.run_proxy = true;
        break;
      case 's':
        options.print_state = true;
        break;
      case OPT_VALUES:
        options.print_values = true;
        break;
      case OPT_CHECK_CRC:
        options.client.validate_checksum = true;
        break;
      case OPT_TIMEOUT_MS:
        if (!parse_number(optarg, 3600000UL, number) || number == 0) {
          fprintf(stderr, "Invalid timeout: %s\n", optarg);
          return false;
        }
        options.serial.read_timeout_ms = number;
        break;
      case OPT_BAUD:
        if (!parse_number(optarg, 4000000UL, number) || number == 0) {
          fprintf(stderr, "Invalid baud rate: %s\n", optarg);
          return false;
        }
        options.serial.baudrate = number;
        break;
      case 'v':
        options.verbose = true;
        break;
      default:
        return false;
    }
  }

  if (optind != argc - 1) {
    return false;
  }
  options.serial.device = argv[optind];
  return true;
}

std::string to_hex(const rpc::Bytes& bytes) {
  return hex::encode(etl::span<const uint8_t>(bytes.data(), bytes.size()));
}

int print_state(ProtocolClient& client) {
  auto state = queries::readState(client);
  if (!state.has_value()) {
    fprintf(stderr, "%s\n", rpc::describe(state.error()).c_str());
    return 1;
  }
  const rpc::Bytes& payload = state.value();
  printf("STATE: %s\n", to_hex(payload).c_str());
  for (const std::string& line :
       queries::splitStateText(etl::span<const uint8_t>(payload.data(), payload.size()))) {
    printf("%s\n", line.c_str());
  }
  return 0;
}

int print_values(ProtocolClient& client) {
  std::vector<uint16_t> addresses;
  for (size_t i = 0; i < queries::kTemperatureCatalogSize; ++i) {
    addresses.push_back(queries::kTemperatureCatalog[i].address);
  }

  auto values = queries::readValues(client, etl::span<const uint16_t>(addresses.data(), addresses.size()));
  if (!values.has_value()) {
    fprintf(stderr, "%s\n", rpc::describe(values.error()).c_str());
    return 1;
  }
  const rpc::Bytes& payload = values.value();
  printf("VALUES: %s\n", to_hex(payload).c_str());
  for (size_t i = 0; i < queries::kTemperatureCatalogSize && (i + 1) * 2 <= payload.size(); ++i) {
    const std::string temperature =
        queries::formatTemperature(etl::span<const uint8_t>(payload.data() + i * 2, 2));
    printf("%s: %s\n", queries::kTemperatureCatalog[i].label, temperature.c_str());
  }
  return 0;
}

int run_proxy(ProtocolClient& client, const ProxyConfig& config) {
  ProxyServer server(client, config);
  auto listening = server.listen();
  if (!listening.has_value()) {
    log::error(TAG_MAIN, "%s", rpc::describe(listening.error()).c_str());
    return 1;
  }

  boost::asio::signal_set signals(server.ioContext(), SIGINT, SIGTERM);
  signals.async_wait([&server](const boost::system::error_code& ec, int signal_number) {
    if (!ec) {
      log::info(TAG_MAIN, "Signal %d received, shutting down", signal_number);
      server.stop();
    }
  });

  server.run();
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  Options options;
  if (!parse_options(argc, argv, options)) {
    usage(argv[0]);
    return 2;
  }

  log::set_level(options.verbose ? log::Level::DEBUG : log::Level::INFO);
  log::install_etl_error_handler();

  // A peer closing mid-reply must not kill the proxy.
  signal(SIGPIPE, SIG_IGN);

  AsioSerialPort port;
  auto opened = port.open(options.serial.device, options.serial.baudrate);
  if (!opened.has_value()) {
    fprintf(stderr, "Error connecting to TTY device: %s\n", opened.error().detail.c_str());
    return 1;
  }

  SerialChannel channel(port, std::chrono::milliseconds(options.serial.read_timeout_ms));
  ProtocolClient client(channel, options.client);

  int rc = 0;
  if (options.print_state) {
    rc |= print_state(client);
  }
  if (options.print_values) {
    rc |= print_values(client);
  }
  if (options.run_proxy) {
    rc |= run_proxy(client, options.proxy);
  }
  if (!options.print_state && !options.print_values && !options.run_proxy) {
    log::warn(TAG_MAIN, "Nothing to do; pass --state, --values or --port");
  }
  return rc;
}
