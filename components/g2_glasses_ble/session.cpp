#include "session.h"

namespace esphome {
namespace g2_glasses_ble {

// The AI magic lives in a single-byte slot on the device side
static constexpr uint16_t AI_MAGIC_MASK = 0xFF;

Session::Session(Endpoint endpoint)
  : endpoint_(endpoint),
    sequence_(0),
    ai_magic_(AI_MAGIC_START),
    teleprompter_msg_id_(TELEPROMPTER_MSG_ID_START),
    authenticated_(false),
    ai_mode_active_(false) {
}

uint8_t Session::next_sequence() {
  sequence_ = static_cast<uint8_t>(sequence_ + 1);
  return sequence_;
}

uint16_t Session::peek_msg_id(Channel channel) const {
  return channel == Channel::AI ? ai_magic_ : teleprompter_msg_id_;
}

uint16_t Session::next_msg_id(Channel channel) {
  if (channel == Channel::AI) {
    uint16_t id = ai_magic_;
    ai_magic_ = (ai_magic_ + 1) & AI_MAGIC_MASK;
    return id;
  }
  // Teleprompter ids must keep increasing, the firmware drops out-of-order ones
  uint16_t id = teleprompter_msg_id_;
  teleprompter_msg_id_++;
  return id;
}

void Session::begin_authentication() {
  sequence_ = 0;
  ai_magic_ = AI_MAGIC_START;
  teleprompter_msg_id_ = TELEPROMPTER_MSG_ID_START;
  authenticated_ = false;
  ai_mode_active_ = false;
}

void Session::complete_authentication(uint16_t teleprompter_msg_id) {
  teleprompter_msg_id_ = teleprompter_msg_id;
  authenticated_ = true;
}

void Session::reset() { begin_authentication(); }

}  // namespace g2_glasses_ble
}  // namespace esphome
