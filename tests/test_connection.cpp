#include <stdint.h>

#include <string>

#include "client/ProtocolClient.h"
#include "fsm/connection_fsm.h"
#include "mocks/MockSerialPort.h"
#include "proxy/ConnectionHandler.h"
#include "test_constants.h"
#include "test_support.h"
#include "transport/SerialChannel.h"

using namespace boilerlink;
using rpc::Bytes;

namespace {

static std::string handle(ProtocolClient& client, const char* line) {
  return ConnectionHandler::handleLine(client, etl::string_view(line, strlen(line)));
}

static void test_fsm_line_cycle() {
  fsm::ConnectionFsm machine;
  machine.begin();
  TEST_ASSERT(machine.isAwaitingLine());

  machine.lineReceived();
  TEST_ASSERT(machine.isProcessing());

  // A second line before the reply does not re-enter processing.
  machine.lineReceived();
  TEST_ASSERT(machine.isProcessing());

  machine.responseSent();
  TEST_ASSERT(machine.isAwaitingLine());

  // A stray reply notification while idle changes nothing.
  machine.responseSent();
  TEST_ASSERT(machine.isAwaitingLine());
}

static void test_fsm_disconnect_from_any_state() {
  fsm::ConnectionFsm idle;
  idle.begin();
  idle.disconnected();
  TEST_ASSERT(idle.isClosed());

  fsm::ConnectionFsm busy;
  busy.begin();
  busy.lineReceived();
  busy.disconnected();
  TEST_ASSERT(busy.isClosed());

  // Closed is terminal.
  busy.lineReceived();
  busy.responseSent();
  TEST_ASSERT(busy.isClosed());
}

static void test_state_line_end_to_end() {
  MockSerialPort port;
  SerialChannel channel(port, TEST_READ_TIMEOUT);
  ProtocolClient client(channel);
  port.queueReply(test_bytes(TEST_STATE_REPLY_HEX));

  TEST_ASSERT_EQ_STR(handle(client, "51"), std::string(TEST_STATE_PAYLOAD_HEX) + "\n");
  TEST_ASSERT_EQ_STR(test_hex(port.writes().at(0)), "02fd000151f1");
}

static void test_values_line_end_to_end() {
  MockSerialPort port;
  SerialChannel channel(port, TEST_READ_TIMEOUT);
  ProtocolClient client(channel);
  port.queueReply(test_bytes("02fd000330000b49"));

  TEST_ASSERT_EQ_STR(handle(client, "300004"), "000b\n");
  TEST_ASSERT_EQ_STR(test_hex(port.writes().at(0)), "02fd000330000458");
}

static void test_uppercase_hex_line() {
  MockSerialPort port;
  SerialChannel channel(port, TEST_READ_TIMEOUT);
  ProtocolClient client(channel);
  port.queueReply(test_bytes("02fd000330000b49"));

  TEST_ASSERT_EQ_STR(handle(client, "300004"), "000b\n");
  port.queueReply(test_bytes("02fd000330000b49"));
  TEST_ASSERT_EQ_STR(handle(client, "30000A"), "000b\n");
  TEST_ASSERT_EQ_STR(test_hex(port.writes().at(1)), "02fd000330000a4a");
}

static void test_short_header_line() {
  MockSerialPort port;
  SerialChannel channel(port, TEST_READ_TIMEOUT);
  ProtocolClient client(channel);
  port.queueReply(test_bytes("02fd00"));

  TEST_ASSERT_EQ_STR(handle(client, "51"), "!WrongResponseHeaderError: Received: 02fd00\n");
}

static void test_invalid_hex_lines() {
  MockSerialPort port;
  SerialChannel channel(port, TEST_READ_TIMEOUT);
  ProtocolClient client(channel);

  TEST_ASSERT_EQ_STR(handle(client, "xyz"),
                     "!HexDecodeError: non-hexadecimal number found at position 0\n");
  TEST_ASSERT_EQ_STR(handle(client, "515"), "!HexDecodeError: odd-length hex string\n");
  TEST_ASSERT(port.writes().empty());
}

static void test_blank_line_gets_no_reply() {
  MockSerialPort port;
  SerialChannel channel(port, TEST_READ_TIMEOUT);
  ProtocolClient client(channel);

  TEST_ASSERT_EQ_STR(handle(client, ""), "");
  TEST_ASSERT(port.writes().empty());
}

static void test_timeout_line() {
  MockSerialPort port;
  SerialChannel channel(port, TEST_READ_TIMEOUT);
  ProtocolClient client(channel);
  port.setSilent(true);

  TEST_ASSERT_EQ_STR(handle(client, "51"), "!TimeoutError: No response within 100 ms\n");
}

static void test_error_line_format() {
  const rpc::Error error{rpc::ErrorKind::FRAME_LENGTH, "bad"};
  TEST_ASSERT_EQ_STR(ConnectionHandler::errorLine(error), "!FrameLengthError: bad\n");
}

}  // namespace

int main() {
  test_fsm_line_cycle();
  test_fsm_disconnect_from_any_state();
  test_state_line_end_to_end();
  test_values_line_end_to_end();
  test_uppercase_hex_line();
  test_short_header_line();
  test_invalid_hex_lines();
  test_blank_line_gets_no_reply();
  test_timeout_line();
  test_error_line_format();
  return 0;
}
