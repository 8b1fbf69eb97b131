#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <deque>
#include <functional>
#include <string>
#include "notification.h"
#include "packet.h"
#include "protocol.h"
#include "session.h"
#include "text_layout.h"
#include "transport.h"

namespace esphome {
namespace g2_glasses_ble {

/**
 * Platform-independent glasses controller.
 *
 * This class manages:
 * - One Session per endpoint (handshake, sequence and message ids)
 * - The outgoing write queue, paced by each packet's settle delay
 * - Write acknowledgment tracking with a bounded retry policy
 * - Reassembly of device notifications into frames
 *
 * It does NOT contain any ESP32 or ESPHome specific code.
 * All BLE operations go through the Transport interface.
 */
class G2GlassesState {
 public:
  // ============================================================================
  // Configuration and Callbacks
  // ============================================================================

  struct Config {
    TextLayoutConfig text_layout;
    NotificationOptions notification;
    // Endpoint that receives AI, teleprompter and notification data
    Endpoint primary_endpoint;
    size_t question_max_bytes;
    size_t answer_max_bytes;
    uint8_t max_write_retries;
    // Hold the queue until on_write_ack() reports each write
    bool wait_for_write_ack;

    Config()
      : text_layout(),
        notification(),
        primary_endpoint(Endpoint::RIGHT),
        question_max_bytes(AI_QUESTION_MAX_BYTES),
        answer_max_bytes(AI_ANSWER_MAX_BYTES),
        max_write_retries(2),
        wait_for_write_ack(false) {}
  };

  // Called for every valid frame received on a notify characteristic
  using FrameCallback =
      std::function<void(Endpoint endpoint, Characteristic characteristic, const FrameBuffer::FrameInfo &frame)>;

  // ============================================================================
  // Constructor and Configuration
  // ============================================================================

  G2GlassesState();
  explicit G2GlassesState(const Config &config);

  // Subscribe to both notify characteristics of both endpoints
  void attach(Transport *transport);

  void set_frame_callback(FrameCallback callback);

  const Config &get_config() const { return config_; }

  // ============================================================================
  // Command Methods (false if nothing could be queued)
  // ============================================================================

  bool authenticate(Endpoint endpoint, uint64_t unix_time, AuthMode mode = AuthMode::FULL);
  bool show_ai(const std::string &question, const std::string &answer);
  bool exit_ai();
  bool show_teleprompter(const std::string &text, bool manual_mode);
  bool send_notification(const std::string &title, const std::string &subtitle, const std::string &message,
                         uint64_t unix_time);

  // ============================================================================
  // Update Loop and Events
  // ============================================================================

  // Call periodically; writes at most one queued packet once its predecessor has settled
  void update(uint32_t now_ms);

  // Result of the last write when wait_for_write_ack is set
  void on_write_ack(bool success);

  // Feed notification bytes from the transport
  void process_rx_data(Endpoint endpoint, Characteristic characteristic, const uint8_t *data, size_t len);

  // Forget the endpoint's session and drop its queued writes (and writes that depend on them)
  void on_disconnect(Endpoint endpoint);

  // ============================================================================
  // State Queries
  // ============================================================================

  const Session &get_session(Endpoint endpoint) const { return sessions_[endpoint_index(endpoint)]; }
  size_t pending_writes() const { return queue_.size(); }
  bool is_idle() const { return queue_.empty() && !waiting_for_write_ack_; }
  bool is_waiting_for_write_ack() const { return waiting_for_write_ack_; }
  uint32_t get_failed_writes() const { return failed_writes_; }
  uint32_t get_rx_crc_errors(Endpoint endpoint) const;

 private:
  struct QueuedWrite {
    Endpoint endpoint;
    Packet packet;
    uint8_t attempts;
    // Writes sharing a non-zero transfer id are dropped together
    uint32_t transfer_id;
  };

  static constexpr size_t NOTIFY_CHANNEL_COUNT = 2;

  Endpoint companion_endpoint() const;
  Session &session(Endpoint endpoint) { return sessions_[endpoint_index(endpoint)]; }
  void enqueue(Endpoint endpoint, const std::vector<Packet> &packets, uint32_t transfer_id = 0);
  void write_front(uint32_t now_ms);
  void finish_write(bool success, uint32_t now_ms);
  void drop_endpoint_writes(Endpoint endpoint);
  FrameBuffer *rx_buffer(Endpoint endpoint, Characteristic characteristic);
  void process_frame_buffer(Endpoint endpoint, Characteristic characteristic, FrameBuffer &buffer);

  Config config_;
  Transport *transport_;
  FrameCallback frame_callback_;

  std::array<Session, ENDPOINT_COUNT> sessions_;
  FrameBuffer rx_buffers_[ENDPOINT_COUNT][NOTIFY_CHANNEL_COUNT];

  std::deque<QueuedWrite> queue_;
  bool waiting_for_write_ack_;
  uint32_t last_write_ms_;
  uint32_t next_write_ms_;
  uint32_t failed_writes_;
  uint32_t last_transfer_id_;
};

}  // namespace g2_glasses_ble
}  // namespace esphome
