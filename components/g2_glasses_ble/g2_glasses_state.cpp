#include "g2_glasses_state.h"
#include "g2_glasses_log.h"

#include <algorithm>
#include <cstdio>

namespace esphome {
namespace g2_glasses_ble {

static const char *const TAG = "g2_glasses_ble";

// Timing constants (milliseconds)
static constexpr uint32_t RETRY_DELAY_MS = 100;
static constexpr uint32_t WRITE_ACK_TIMEOUT_MS = 2000;

// Hex dump of one frame for verbose logs
static std::string format_hex(const uint8_t *data, size_t len) {
  std::string hex;
  char byte[4];
  for (size_t i = 0; i < len; i++) {
    snprintf(byte, sizeof(byte), i == 0 ? "%02X" : " %02X", data[i]);
    hex += byte;
  }
  return hex;
}

// Wrap-safe "now has reached deadline"
static bool time_reached(uint32_t now_ms, uint32_t deadline_ms) {
  return static_cast<int32_t>(now_ms - deadline_ms) >= 0;
}

// ============================================================================
// Constructor and Configuration
// ============================================================================

G2GlassesState::G2GlassesState() : G2GlassesState(Config()) {}

G2GlassesState::G2GlassesState(const Config &config)
  : config_(config),
    transport_(nullptr),
    frame_callback_([](Endpoint, Characteristic, const FrameBuffer::FrameInfo &) {}),
    sessions_{{Session(Endpoint::LEFT), Session(Endpoint::RIGHT)}},
    queue_(),
    waiting_for_write_ack_(false),
    last_write_ms_(0),
    next_write_ms_(0),
    failed_writes_(0),
    last_transfer_id_(0) {
}

void G2GlassesState::attach(Transport *transport) {
  transport_ = transport;
  if (transport_ == nullptr) {
    return;
  }

  const Endpoint endpoints[] = {Endpoint::LEFT, Endpoint::RIGHT};
  const Characteristic notify[] = {Characteristic::CONTROL_NOTIFY, Characteristic::FILE_NOTIFY};
  for (Endpoint endpoint : endpoints) {
    for (Characteristic characteristic : notify) {
      transport_->subscribe(endpoint, characteristic, [this, endpoint, characteristic](const uint8_t *data, size_t len) {
        this->process_rx_data(endpoint, characteristic, data, len);
      });
    }
  }
}

void G2GlassesState::set_frame_callback(FrameCallback callback) {
  if (callback) {
    frame_callback_ = callback;
  } else {
    frame_callback_ = [](Endpoint, Characteristic, const FrameBuffer::FrameInfo &) {};
  }
}

// ============================================================================
// Command Methods
// ============================================================================

bool G2GlassesState::authenticate(Endpoint endpoint, uint64_t unix_time, AuthMode mode) {
  std::vector<Packet> packets;
  ErrorCode error = build_auth_packets(session(endpoint), mode, unix_time, packets);
  if (error != ErrorCode::NONE) {
    ESP_LOGE(TAG, "Failed to build handshake for %s: %s", endpoint_name(endpoint), error_to_string(error));
    return false;
  }

  drop_endpoint_writes(endpoint);
  ESP_LOGI(TAG, "Queued %s handshake for %s endpoint", mode == AuthMode::FULL ? "full" : "short",
           endpoint_name(endpoint));
  enqueue(endpoint, packets);
  return true;
}

bool G2GlassesState::show_ai(const std::string &question, const std::string &answer) {
  Endpoint endpoint = config_.primary_endpoint;
  Session &ai_session = session(endpoint);
  Session saved = ai_session;

  std::string display_question = truncate_for_display(question, config_.question_max_bytes);
  std::string display_answer = truncate_for_display(answer, config_.answer_max_bytes);

  std::vector<Packet> packets(3);
  ErrorCode error = build_ai_enter(ai_session, packets[0]);
  if (error == ErrorCode::NONE) {
    error = build_ai_ask(ai_session, display_question, packets[1]);
  }
  if (error == ErrorCode::NONE) {
    error = build_ai_reply(ai_session, display_answer, packets[2]);
  }
  if (error != ErrorCode::NONE) {
    ESP_LOGE(TAG, "Failed to build AI card: %s", error_to_string(error));
    ai_session = saved;
    return false;
  }

  ESP_LOGD(TAG, "Queued AI card (question %zu bytes, answer %zu bytes)", display_question.size(),
           display_answer.size());
  enqueue(endpoint, packets);
  return true;
}

bool G2GlassesState::exit_ai() {
  Endpoint endpoint = config_.primary_endpoint;
  Packet packet;
  ErrorCode error = build_ai_exit(session(endpoint), packet);
  if (error != ErrorCode::NONE) {
    ESP_LOGE(TAG, "Failed to build AI exit: %s", error_to_string(error));
    return false;
  }
  enqueue(endpoint, std::vector<Packet>(1, packet));
  return true;
}

bool G2GlassesState::show_teleprompter(const std::string &text, bool manual_mode) {
  Endpoint endpoint = config_.primary_endpoint;
  if (!session(endpoint).is_authenticated()) {
    ESP_LOGE(TAG, "Teleprompter needs an authenticated %s endpoint", endpoint_name(endpoint));
    return false;
  }

  // A page must always fit one content packet
  TextLayoutConfig layout = config_.text_layout;
  if (layout.max_page_text_bytes == 0 || layout.max_page_text_bytes > TP_MAX_PAGE_TEXT_BYTES) {
    layout.max_page_text_bytes = TP_MAX_PAGE_TEXT_BYTES;
  }

  std::vector<std::string> pages;
  ErrorCode error = layout_text(text, layout, pages);
  if (error != ErrorCode::NONE) {
    ESP_LOGE(TAG, "Failed to lay out teleprompter text: %s", error_to_string(error));
    return false;
  }

  std::vector<Packet> packets;
  uint32_t total_lines = static_cast<uint32_t>(count_source_lines(text));
  error = build_teleprompter_script(session(endpoint), pages, total_lines, manual_mode, packets);
  if (error != ErrorCode::NONE) {
    ESP_LOGE(TAG, "Failed to build teleprompter stream: %s", error_to_string(error));
    return false;
  }

  ESP_LOGD(TAG, "Queued teleprompter: %zu pages, %u source lines, %s", pages.size(), total_lines,
           manual_mode ? "manual" : "auto scroll");
  enqueue(endpoint, packets);
  return true;
}

bool G2GlassesState::send_notification(const std::string &title, const std::string &subtitle,
                                       const std::string &message, uint64_t unix_time) {
  Endpoint primary = config_.primary_endpoint;
  Endpoint companion = companion_endpoint();

  NotificationBatch batch;
  ErrorCode error = build_notification(session(primary), get_session(companion),
                                       NotificationContent(title, subtitle, message), config_.notification,
                                       unix_time, batch);
  if (error != ErrorCode::NONE) {
    ESP_LOGE(TAG, "Failed to build notification: %s", error_to_string(error));
    return false;
  }

  if (batch.truncated) {
    ESP_LOGW(TAG, "Notification content truncated to %zu bytes", batch.json.size());
  }
  // The heartbeat reports a finished transfer; it must not outlive the transfer packets
  uint32_t transfer_id = ++last_transfer_id_;
  if (transfer_id == 0) {
    transfer_id = ++last_transfer_id_;
  }
  enqueue(primary, batch.primary, transfer_id);
  enqueue(companion, std::vector<Packet>(1, batch.heartbeat), transfer_id);
  return true;
}

// ============================================================================
// Update Loop and Events
// ============================================================================

void G2GlassesState::update(uint32_t now_ms) {
  if (waiting_for_write_ack_) {
    if (time_reached(now_ms, last_write_ms_ + WRITE_ACK_TIMEOUT_MS)) {
      ESP_LOGW(TAG, "Write acknowledgment timeout");
      waiting_for_write_ack_ = false;
      finish_write(false, now_ms);
    }
    return;
  }

  if (queue_.empty() || transport_ == nullptr) {
    return;
  }

  if (!time_reached(now_ms, next_write_ms_)) {
    return;
  }

  write_front(now_ms);
}

void G2GlassesState::on_write_ack(bool success) {
  if (!waiting_for_write_ack_) {
    return;
  }
  waiting_for_write_ack_ = false;
  finish_write(success, last_write_ms_);
}

void G2GlassesState::process_rx_data(Endpoint endpoint, Characteristic characteristic, const uint8_t *data,
                                     size_t len) {
  FrameBuffer *buffer = rx_buffer(endpoint, characteristic);
  if (buffer == nullptr || data == nullptr) {
    ESP_LOGW(TAG, "Ignoring RX data on %s characteristic %s", endpoint_name(endpoint),
             characteristic_uuid(characteristic));
    return;
  }

  ESP_LOGV(TAG, "RX %s: %s", endpoint_name(endpoint), format_hex(data, len).c_str());

  // Check buffer size limit before appending
  if (buffer->size() + len > RX_BUFFER_SIZE) {
    ESP_LOGW(TAG, "RX buffer overflow on %s, clearing buffer", endpoint_name(endpoint));
    buffer->clear();
  }

  if (!buffer->append(data, len)) {
    ESP_LOGW(TAG, "Failed to append %zu bytes to RX buffer, dropping", len);
    buffer->clear();
    return;
  }

  process_frame_buffer(endpoint, characteristic, *buffer);
}

void G2GlassesState::on_disconnect(Endpoint endpoint) {
  ESP_LOGI(TAG, "%s endpoint disconnected, resetting session", endpoint_name(endpoint));
  session(endpoint).reset();
  drop_endpoint_writes(endpoint);
  for (size_t i = 0; i < NOTIFY_CHANNEL_COUNT; i++) {
    rx_buffers_[endpoint_index(endpoint)][i].clear();
  }
}

uint32_t G2GlassesState::get_rx_crc_errors(Endpoint endpoint) const {
  uint32_t errors = 0;
  for (size_t i = 0; i < NOTIFY_CHANNEL_COUNT; i++) {
    errors += rx_buffers_[endpoint_index(endpoint)][i].crc_errors();
  }
  return errors;
}

// ============================================================================
// Internal Methods - Write Queue
// ============================================================================

Endpoint G2GlassesState::companion_endpoint() const {
  return config_.primary_endpoint == Endpoint::LEFT ? Endpoint::RIGHT : Endpoint::LEFT;
}

void G2GlassesState::enqueue(Endpoint endpoint, const std::vector<Packet> &packets, uint32_t transfer_id) {
  for (const Packet &packet : packets) {
    queue_.push_back(QueuedWrite{endpoint, packet, 0, transfer_id});
  }
}

void G2GlassesState::write_front(uint32_t now_ms) {
  QueuedWrite &write = queue_.front();
  const Packet &packet = write.packet;

  ESP_LOGD(TAG, "TX %s seq=%02x svc=%02X-%02X len=%zu", endpoint_name(write.endpoint), packet.sequence(),
           packet.service().hi, packet.service().lo, packet.size());
  ESP_LOGV(TAG, "TX %s: %s", endpoint_name(write.endpoint), format_hex(packet.data(), packet.size()).c_str());

  last_write_ms_ = now_ms;
  bool accepted = transport_->write(write.endpoint, packet.characteristic(), packet.data(), packet.size());
  if (accepted && config_.wait_for_write_ack) {
    waiting_for_write_ack_ = true;
    return;
  }
  finish_write(accepted, now_ms);
}

void G2GlassesState::finish_write(bool success, uint32_t now_ms) {
  if (queue_.empty()) {
    return;
  }

  QueuedWrite &write = queue_.front();
  if (success) {
    next_write_ms_ = now_ms + write.packet.delay_after_ms();
    queue_.pop_front();
    return;
  }

  failed_writes_++;
  write.attempts++;
  if (write.attempts > config_.max_write_retries) {
    Endpoint endpoint = write.endpoint;
    ESP_LOGE(TAG, "Write to %s failed after %u attempts, dropping its queued writes", endpoint_name(endpoint),
             write.attempts);
    drop_endpoint_writes(endpoint);
    // Counters already ran past frames the device never received
    session(endpoint).reset();
    ESP_LOGW(TAG, "%s endpoint needs a new handshake", endpoint_name(endpoint));
  } else {
    ESP_LOGW(TAG, "Write to %s failed, retry %u of %u", endpoint_name(write.endpoint), write.attempts,
             config_.max_write_retries);
  }
  next_write_ms_ = now_ms + RETRY_DELAY_MS;
}

void G2GlassesState::drop_endpoint_writes(Endpoint endpoint) {
  std::vector<uint32_t> transfers;
  for (const QueuedWrite &write : queue_) {
    if (write.endpoint == endpoint && write.transfer_id != 0 &&
        std::find(transfers.begin(), transfers.end(), write.transfer_id) == transfers.end()) {
      transfers.push_back(write.transfer_id);
    }
  }

  bool front_dropped = false;
  size_t dropped = 0;
  for (auto it = queue_.begin(); it != queue_.end();) {
    bool dependent =
        it->transfer_id != 0 && std::find(transfers.begin(), transfers.end(), it->transfer_id) != transfers.end();
    if (it->endpoint == endpoint || dependent) {
      if (it == queue_.begin()) {
        front_dropped = true;
      }
      if (it->endpoint != endpoint) {
        dropped++;
      }
      it = queue_.erase(it);
    } else {
      ++it;
    }
  }

  if (front_dropped) {
    waiting_for_write_ack_ = false;
  }
  if (dropped > 0) {
    ESP_LOGW(TAG, "Dropped %zu dependent write(s) queued for the other endpoint", dropped);
  }
}

// ============================================================================
// Internal Methods - Frame Processing
// ============================================================================

FrameBuffer *G2GlassesState::rx_buffer(Endpoint endpoint, Characteristic characteristic) {
  size_t index = endpoint_index(endpoint);
  if (index >= ENDPOINT_COUNT) {
    return nullptr;
  }
  switch (characteristic) {
    case Characteristic::CONTROL_NOTIFY:
      return &rx_buffers_[index][0];
    case Characteristic::FILE_NOTIFY:
      return &rx_buffers_[index][1];
    default:
      return nullptr;
  }
}

void G2GlassesState::process_frame_buffer(Endpoint endpoint, Characteristic characteristic, FrameBuffer &buffer) {
  uint32_t crc_errors = buffer.crc_errors();
  while (true) {
    auto frame = buffer.process_next_frame();
    if (!frame.valid) {
      break;
    }
    ESP_LOGD(TAG, "RX %s seq=%02x svc=%02X-%02X len=%u", endpoint_name(endpoint), frame.seq, frame.service.hi,
             frame.service.lo, frame.payload_len);
    frame_callback_(endpoint, characteristic, frame);
  }
  if (buffer.crc_errors() != crc_errors) {
    ESP_LOGW(TAG, "Discarded %u RX frame(s) with bad CRC on %s", buffer.crc_errors() - crc_errors,
             endpoint_name(endpoint));
  }

  // Compact buffer to free up space at the beginning
  buffer.compact();
}

}  // namespace g2_glasses_ble
}  // namespace esphome
