#include "packet.h"
#include "checksum.h"
#include "session.h"

namespace esphome {
namespace g2_glasses_ble {

// ============================================================================
// Packet
// ============================================================================

ErrorCode Packet::build(uint8_t seq, ServiceId service, const uint8_t *payload, size_t payload_len,
                        uint8_t total_count, uint8_t packet_index) {
  if (payload == nullptr && payload_len > 0) {
    return ErrorCode::INVALID_ARGUMENT;
  }
  if (payload_len > MAX_PAYLOAD_SIZE) {
    return ErrorCode::PAYLOAD_TOO_LARGE;
  }

  size_ = 0;
  buffer_[size_++] = FRAME_MAGIC;
  buffer_[size_++] = FRAME_TYPE_COMMAND;
  buffer_[size_++] = seq;
  buffer_[size_++] = static_cast<uint8_t>(payload_len + CRC_SIZE);
  buffer_[size_++] = total_count;
  buffer_[size_++] = packet_index;
  buffer_[size_++] = service.hi;
  buffer_[size_++] = service.lo;

  for (size_t i = 0; i < payload_len; i++) {
    buffer_[size_++] = payload[i];
  }

  uint16_t crc = crc16_ccitt(payload, payload_len);
  buffer_[size_++] = crc & 0xFF;
  buffer_[size_++] = (crc >> 8) & 0xFF;
  return ErrorCode::NONE;
}

ErrorCode Packet::assign(const uint8_t *frame, size_t len) {
  if (frame == nullptr || len < HEADER_SIZE + CRC_SIZE) {
    return ErrorCode::INVALID_ARGUMENT;
  }
  if (len > PACKET_BUFFER_SIZE) {
    return ErrorCode::PAYLOAD_TOO_LARGE;
  }
  for (size_t i = 0; i < len; i++) {
    buffer_[i] = frame[i];
  }
  size_ = len;
  return ErrorCode::NONE;
}

ErrorCode build_packet(Session &session, ServiceId service, const uint8_t *payload, size_t payload_len,
                       Packet &out, uint8_t total_count, uint8_t packet_index) {
  if (payload == nullptr && payload_len > 0) {
    return ErrorCode::INVALID_ARGUMENT;
  }
  if (payload_len > MAX_PAYLOAD_SIZE) {
    return ErrorCode::PAYLOAD_TOO_LARGE;
  }
  return out.build(session.next_sequence(), service, payload, payload_len, total_count, packet_index);
}

ErrorCode build_fragmented_packets(Session &session, ServiceId service, const uint8_t *data, size_t len,
                                   std::vector<Packet> &out) {
  if (data == nullptr && len > 0) {
    return ErrorCode::INVALID_ARGUMENT;
  }

  size_t total = (len == 0) ? 1 : (len + MAX_PAYLOAD_SIZE - 1) / MAX_PAYLOAD_SIZE;
  if (total > 0xFF) {
    return ErrorCode::PAYLOAD_TOO_LARGE;
  }

  uint8_t seq = session.peek_sequence();
  std::vector<Packet> fragments(total);
  for (size_t i = 0; i < total; i++) {
    size_t offset = i * MAX_PAYLOAD_SIZE;
    size_t chunk_len = (offset + MAX_PAYLOAD_SIZE <= len) ? MAX_PAYLOAD_SIZE : (len - offset);
    ErrorCode error = fragments[i].build(seq, service, (data != nullptr) ? data + offset : nullptr, chunk_len,
                                         static_cast<uint8_t>(total), static_cast<uint8_t>(i + 1));
    if (error != ErrorCode::NONE) {
      return error;
    }
  }

  session.next_sequence();
  out.insert(out.end(), fragments.begin(), fragments.end());
  return ErrorCode::NONE;
}

// ============================================================================
// FrameBuffer
// ============================================================================

bool FrameBuffer::append(const uint8_t *data, size_t len) {
  if (size_ + len > RX_BUFFER_SIZE) {
    return false;  // Buffer overflow
  }
  for (size_t i = 0; i < len; i++) {
    buffer_[size_++] = data[i];
  }
  return true;
}

FrameBuffer::FrameInfo FrameBuffer::process_next_frame() {
  FrameInfo info = {0, 0, 0, 0, {0, 0}, 0, nullptr, false};

  while (true) {
    size_t frame_start = find_frame_start();
    if (frame_start >= size_) {
      pos_ = size_;
      return info;  // No more frames
    }
    pos_ = frame_start;

    uint8_t length_field;
    if (pos_ + HEADER_SIZE > size_) {
      return info;  // Header not complete yet
    }
    if (!validate_frame_header_at_pos(length_field)) {
      pos_++;
      continue;
    }

    size_t frame_len = HEADER_SIZE + length_field;
    if (pos_ + frame_len > size_) {
      return info;  // Frame not complete yet, keep position at frame start
    }

    const uint8_t *frame = buffer_ + pos_;
    uint8_t payload_len = static_cast<uint8_t>(length_field - CRC_SIZE);
    uint16_t received_crc = static_cast<uint16_t>(frame[frame_len - 2] | (frame[frame_len - 1] << 8));
    if (crc16_ccitt(frame + HEADER_SIZE, payload_len) != received_crc) {
      crc_errors_++;
      pos_++;
      continue;
    }

    info.frame_type = frame[1];
    info.seq = frame[2];
    info.total_count = frame[4];
    info.packet_index = frame[5];
    info.service = ServiceId{frame[6], frame[7]};
    info.payload_len = payload_len;
    info.payload = frame + HEADER_SIZE;
    info.valid = true;

    pos_ += frame_len;
    return info;
  }
}

void FrameBuffer::compact() {
  if (pos_ == 0) {
    return;
  }
  if (pos_ >= size_) {
    clear();
    return;
  }

  size_t remaining = size_ - pos_;
  for (size_t i = 0; i < remaining; i++) {
    buffer_[i] = buffer_[pos_ + i];
  }
  size_ = remaining;
  pos_ = 0;
}

size_t FrameBuffer::find_frame_start() const {
  for (size_t i = pos_; i < size_; i++) {
    if (buffer_[i] == FRAME_MAGIC) {
      return i;
    }
  }
  return size_;  // Not found
}

bool FrameBuffer::validate_frame_header_at_pos(uint8_t &length_field) const {
  if (buffer_[pos_] != FRAME_MAGIC) {
    return false;
  }
  length_field = buffer_[pos_ + 3];
  // Length covers at least the CRC
  return length_field >= CRC_SIZE;
}

}  // namespace g2_glasses_ble
}  // namespace esphome
