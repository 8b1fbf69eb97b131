#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include "errors.h"
#include "transport.h"

namespace esphome {
namespace g2_glasses_ble {

class Session;

// Protocol constants
static constexpr uint8_t FRAME_MAGIC = 0xAA;         // Frame start byte
static constexpr uint8_t FRAME_TYPE_COMMAND = 0x21;  // Host-to-glasses frame type (AA21)

// Header: magic, type, seq, len, total_count, packet_index, service_hi, service_lo
static constexpr size_t HEADER_SIZE = 8;
// Little-endian CRC-16/CCITT over the payload only
static constexpr size_t CRC_SIZE = 2;
// The length byte counts payload + CRC
static constexpr size_t MAX_PAYLOAD_SIZE = 0xFF - CRC_SIZE;
static constexpr size_t PACKET_BUFFER_SIZE = HEADER_SIZE + MAX_PAYLOAD_SIZE + CRC_SIZE;
// Receive buffer for reassembling notifications
static constexpr size_t RX_BUFFER_SIZE = 512;

// Two-byte channel routing address carried in every header
struct ServiceId {
  uint8_t hi;
  uint8_t lo;
};

inline bool operator==(const ServiceId &a, const ServiceId &b) { return a.hi == b.hi && a.lo == b.lo; }

// Channel routing addresses
static constexpr ServiceId SERVICE_AUTH_CONTROL = {0x80, 0x00};
static constexpr ServiceId SERVICE_AUTH_DATA = {0x80, 0x20};
static constexpr ServiceId SERVICE_AI = {0x07, 0x20};
static constexpr ServiceId SERVICE_TELEPROMPTER = {0x06, 0x20};
static constexpr ServiceId SERVICE_DISPLAY_CONFIG = {0x0E, 0x20};
static constexpr ServiceId SERVICE_FILE_CONTROL = {0xC4, 0x00};
static constexpr ServiceId SERVICE_FILE_DATA = {0xC5, 0x00};

/**
 * One outgoing frame:
 *   AA 21 <seq> <len(payload)+2> <total_count> <packet_index> <svc_hi> <svc_lo> <payload...> <crc_lo> <crc_hi>
 *
 * Besides the wire bytes a packet carries the characteristic it must be
 * written to and the settle time the firmware needs before the next write.
 */
class Packet {
 public:
  Packet() : size_(0), delay_after_ms_(0), characteristic_(Characteristic::CONTROL_WRITE) {}

  // Build a complete frame into this packet
  ErrorCode build(uint8_t seq, ServiceId service, const uint8_t *payload, size_t payload_len,
                  uint8_t total_count = 1, uint8_t packet_index = 1);

  // Load a captured frame verbatim
  ErrorCode assign(const uint8_t *frame, size_t len);

  void clear() { size_ = 0; }

  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }
  const uint8_t *data() const { return buffer_; }
  std::vector<uint8_t> to_vector() const { return std::vector<uint8_t>(buffer_, buffer_ + size_); }

  // Header fields (only meaningful when !empty())
  uint8_t sequence() const { return buffer_[2]; }
  uint8_t length_field() const { return buffer_[3]; }
  uint8_t total_count() const { return buffer_[4]; }
  uint8_t packet_index() const { return buffer_[5]; }
  ServiceId service() const { return ServiceId{buffer_[6], buffer_[7]}; }

  const uint8_t *payload() const { return buffer_ + HEADER_SIZE; }
  size_t payload_len() const { return size_ >= HEADER_SIZE + CRC_SIZE ? size_ - HEADER_SIZE - CRC_SIZE : 0; }
  uint16_t crc() const {
    return size_ >= HEADER_SIZE + CRC_SIZE ? static_cast<uint16_t>(buffer_[size_ - 2] | (buffer_[size_ - 1] << 8)) : 0;
  }

  // Pacing and routing metadata
  uint32_t delay_after_ms() const { return delay_after_ms_; }
  void set_delay_after_ms(uint32_t delay_ms) { delay_after_ms_ = delay_ms; }
  Characteristic characteristic() const { return characteristic_; }
  void set_characteristic(Characteristic characteristic) { characteristic_ = characteristic; }

 private:
  uint8_t buffer_[PACKET_BUFFER_SIZE];
  size_t size_;
  uint32_t delay_after_ms_;
  Characteristic characteristic_;
};

/**
 * Build a single-fragment packet on the session's next sequence number.
 * The sequence is only consumed when the packet fits.
 */
ErrorCode build_packet(Session &session, ServiceId service, const uint8_t *payload, size_t payload_len,
                       Packet &out, uint8_t total_count = 1, uint8_t packet_index = 1);

/**
 * Split one logical message across as many frames as needed. All fragments
 * share one sequence number; total_count/packet_index (1-based) identify them.
 * Appends to out; nothing is appended on error.
 */
ErrorCode build_fragmented_packets(Session &session, ServiceId service, const uint8_t *data, size_t len,
                                   std::vector<Packet> &out);

/**
 * Reassembles notification bytes into validated frames (magic, length, CRC).
 */
class FrameBuffer {
 public:
  FrameBuffer() : size_(0), pos_(0), crc_errors_(0) {}

  // Frame processing structure
  struct FrameInfo {
    uint8_t frame_type;
    uint8_t seq;
    uint8_t total_count;
    uint8_t packet_index;
    ServiceId service;
    uint8_t payload_len;
    const uint8_t *payload;
    bool valid;
  };

  // Clear the buffer and reset position
  void clear() {
    size_ = 0;
    pos_ = 0;
  }

  size_t size() const { return size_; }
  size_t remaining() const { return (pos_ < size_) ? (size_ - pos_) : 0; }
  size_t position() const { return pos_; }
  uint32_t crc_errors() const { return crc_errors_; }

  // Append data to buffer, false on overflow
  bool append(const uint8_t *data, size_t len);

  // Process next frame: finds, validates, and advances position.
  // Returns FrameInfo with valid=false if no complete valid frame is buffered.
  FrameInfo process_next_frame();

  // Move unprocessed data to the front of the buffer
  void compact();

 private:
  size_t find_frame_start() const;
  bool validate_frame_header_at_pos(uint8_t &payload_len) const;

  uint8_t buffer_[RX_BUFFER_SIZE];
  size_t size_;  // Total data size
  size_t pos_;   // Read position
  uint32_t crc_errors_;
};

}  // namespace g2_glasses_ble
}  // namespace esphome
