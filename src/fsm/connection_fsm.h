/**
 * @file connection_fsm.h
 * @brief ETL-based state machine for one proxied TCP connection
 *
 * States:
 *   - AwaitingLine (0): Initial state. Waiting for a complete command line.
 *   - Processing (1): A line is being decoded, sent to the boiler and answered.
 *   - Closed (2): Terminal. Peer went away or the socket failed.
 *
 * Events:
 *   - EvLineReceived: Non-blank line read → Processing
 *   - EvResponseSent: Reply or error line written → AwaitingLine
 *   - EvDisconnected: EOF, reset or write failure → Closed
 *
 * Processing errors never leave the AwaitingLine/Processing cycle; only
 * EvDisconnected reaches Closed.
 */
#ifndef CONNECTION_FSM_H
#define CONNECTION_FSM_H

#include "etl/fsm.h"
#include "etl/message.h"

namespace boilerlink {
namespace fsm {

class ConnectionFsm;

// ============================================================================
// State IDs - Must be sequential starting from 0
// ============================================================================
enum StateId : etl::fsm_state_id_t {
  STATE_AWAITING_LINE = 0,
  STATE_PROCESSING = 1,
  STATE_CLOSED = 2,
  NUMBER_OF_STATES = 3
};

// ============================================================================
// Event IDs
// ============================================================================
enum EventId : etl::message_id_t {
  EVENT_LINE_RECEIVED = 0,
  EVENT_RESPONSE_SENT = 1,
  EVENT_DISCONNECTED = 2
};

struct EvLineReceived : public etl::message<EVENT_LINE_RECEIVED> {};
struct EvResponseSent : public etl::message<EVENT_RESPONSE_SENT> {};
struct EvDisconnected : public etl::message<EVENT_DISCONNECTED> {};

// ============================================================================
// State: AwaitingLine (Initial State)
// ============================================================================
class StateAwaitingLine : public etl::fsm_state<ConnectionFsm, StateAwaitingLine, STATE_AWAITING_LINE,
                                                EvLineReceived, EvDisconnected>
{
public:
  etl::fsm_state_id_t on_event(const EvLineReceived&) {
    return STATE_PROCESSING;
  }

  etl::fsm_state_id_t on_event(const EvDisconnected&) {
    return STATE_CLOSED;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// State: Processing
// ============================================================================
class StateProcessing : public etl::fsm_state<ConnectionFsm, StateProcessing, STATE_PROCESSING,
                                              EvResponseSent, EvDisconnected>
{
public:
  etl::fsm_state_id_t on_event(const EvResponseSent&) {
    return STATE_AWAITING_LINE;
  }

  etl::fsm_state_id_t on_event(const EvDisconnected&) {
    return STATE_CLOSED;  // Write failed mid-reply
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;  // No pipelining: a second line waits for the reply
  }
};

// ============================================================================
// State: Closed (Terminal)
// ============================================================================
class StateClosed : public etl::fsm_state<ConnectionFsm, StateClosed, STATE_CLOSED, EvDisconnected>
{
public:
  etl::fsm_state_id_t on_event(const EvDisconnected&) {
    return No_State_Change;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// FSM Class
// ============================================================================
class ConnectionFsm : public etl::fsm
{
public:
  static const etl::message_router_id_t ROUTER_ID = 0;

  // One instance per connection, so the states are members, not statics.
  ConnectionFsm()
    : etl::fsm(ROUTER_ID)
    , state_awaiting_line_()
    , state_processing_()
    , state_closed_()
    , state_list_{}
  {
  }

  void begin() {
    state_list_[STATE_AWAITING_LINE] = &state_awaiting_line_;
    state_list_[STATE_PROCESSING] = &state_processing_;
    state_list_[STATE_CLOSED] = &state_closed_;

    set_states(state_list_, NUMBER_OF_STATES);
    start();
  }

  // State Accessors
  bool isAwaitingLine() const { return get_state_id() == STATE_AWAITING_LINE; }
  bool isProcessing() const { return get_state_id() == STATE_PROCESSING; }
  bool isClosed() const { return get_state_id() == STATE_CLOSED; }

  // Event Triggers
  void lineReceived() { receive(EvLineReceived()); }
  void responseSent() { receive(EvResponseSent()); }
  void disconnected() { receive(EvDisconnected()); }

private:
  StateAwaitingLine state_awaiting_line_;
  StateProcessing state_processing_;
  StateClosed state_closed_;
  etl::ifsm_state* state_list_[NUMBER_OF_STATES];
};

}  // namespace fsm
}  // namespace boilerlink

#endif  // CONNECTION_FSM_H
