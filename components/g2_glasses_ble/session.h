#pragma once

#include <cstdint>
#include <cstddef>
#include "transport.h"

namespace esphome {
namespace g2_glasses_ble {

// Channels with their own message id counter
enum class Channel : uint8_t {
  AI = 0,
  TELEPROMPTER = 1,
};

// First id used by each channel after a handshake
static constexpr uint16_t AI_MAGIC_START = 100;
static constexpr uint16_t TELEPROMPTER_MSG_ID_START = 0x14;

/**
 * Per-connection protocol state for one endpoint.
 *
 * Holds the packet sequence counter (shared by every channel on the
 * endpoint) and the per-channel message ids. Counters only move forward
 * and are rewound solely by begin_authentication(). The sequence and the
 * AI magic wrap at 256; teleprompter ids count up to 65535.
 */
class Session {
 public:
  explicit Session(Endpoint endpoint);

  Endpoint endpoint() const { return endpoint_; }
  bool is_authenticated() const { return authenticated_; }

  // Last sequence number handed out (0 before the first packet)
  uint8_t sequence() const { return sequence_; }
  // Sequence number the next packet will carry
  uint8_t peek_sequence() const { return static_cast<uint8_t>(sequence_ + 1); }
  // Consume the next sequence number
  uint8_t next_sequence();

  // Id the next message on a channel will carry
  uint16_t peek_msg_id(Channel channel) const;
  // Consume the next message id of a channel
  uint16_t next_msg_id(Channel channel);

  // AI mode toggled by the CTRL enter/exit messages
  bool ai_mode_active() const { return ai_mode_active_; }
  void set_ai_mode_active(bool active) { ai_mode_active_ = active; }

  // Rewind all counters ahead of a new handshake
  void begin_authentication();
  // Mark the handshake as built; channels accept commands from now on
  void complete_authentication(uint16_t teleprompter_msg_id);

  // Forget everything (called on disconnect)
  void reset();

 private:
  Endpoint endpoint_;
  uint8_t sequence_;
  uint16_t ai_magic_;
  uint16_t teleprompter_msg_id_;
  bool authenticated_;
  bool ai_mode_active_;
};

}  // namespace g2_glasses_ble
}  // namespace esphome
