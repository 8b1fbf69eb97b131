#include "protocol.h"
#include "g2_glasses_log.h"
#include "varint.h"

namespace esphome {
namespace g2_glasses_ble {

static const char *const TAG = "g2_glasses_ble.protocol";

// ============================================================================
// FieldWriter
// ============================================================================

void FieldWriter::add_uint(uint32_t field, uint64_t value) {
  append_varint(buffer_, field_key(field, WIRE_VARINT));
  append_varint(buffer_, value);
}

void FieldWriter::add_fixed32(uint32_t field, uint32_t value) {
  append_varint(buffer_, field_key(field, WIRE_FIXED32));
  buffer_.push_back(value & 0xFF);
  buffer_.push_back((value >> 8) & 0xFF);
  buffer_.push_back((value >> 16) & 0xFF);
  buffer_.push_back((value >> 24) & 0xFF);
}

void FieldWriter::add_bytes(uint32_t field, const uint8_t *data, size_t len) {
  append_varint(buffer_, field_key(field, WIRE_LENGTH_DELIMITED));
  append_varint(buffer_, len);
  if (data != nullptr && len > 0) {
    buffer_.insert(buffer_.end(), data, data + len);
  }
}

void FieldWriter::add_string(uint32_t field, const std::string &text) {
  add_bytes(field, reinterpret_cast<const uint8_t *>(text.data()), text.size());
}

void FieldWriter::add_message(uint32_t field, const FieldWriter &message) {
  add_bytes(field, message.data(), message.size());
}

void FieldWriter::add_raw_value(uint32_t field, uint8_t wire_type, const uint8_t *data, size_t len) {
  append_varint(buffer_, field_key(field, wire_type));
  if (data != nullptr && len > 0) {
    buffer_.insert(buffer_.end(), data, data + len);
  }
}

// Field 1 = command, field 2 = message id
static FieldWriter command_header(uint32_t command, uint64_t msg_id) {
  FieldWriter writer;
  writer.add_uint(FIELD_COMMAND, command);
  writer.add_uint(FIELD_MSG_ID, msg_id);
  return writer;
}

// Frame a channel message and commit its message id once it fits
static ErrorCode finish_channel_packet(Session &session, Channel channel, ServiceId service,
                                       const FieldWriter &payload, uint32_t delay_ms, Packet &out) {
  ErrorCode error = build_packet(session, service, payload.data(), payload.size(), out);
  if (error != ErrorCode::NONE) {
    ESP_LOGE(TAG, "Cannot frame %zu byte payload for %02X-%02X: %s", payload.size(), service.hi, service.lo,
             error_to_string(error));
    return error;
  }
  session.next_msg_id(channel);
  out.set_characteristic(Characteristic::CONTROL_WRITE);
  out.set_delay_after_ms(delay_ms);
  ESP_LOGD(TAG, "Built %02X-%02X packet (seq=%02x, len=%zu)", service.hi, service.lo, out.sequence(),
           out.payload_len());
  return ErrorCode::NONE;
}

static ErrorCode require_authenticated(const Session &session) {
  if (!session.is_authenticated()) {
    ESP_LOGE(TAG, "%s endpoint is not authenticated", endpoint_name(session.endpoint()));
    return ErrorCode::NOT_AUTHENTICATED;
  }
  return ErrorCode::NONE;
}

// ============================================================================
// Authentication
// ============================================================================

enum class AuthStepType : uint8_t {
  CAPABILITY_QUERY,
  CAPABILITY_REQUEST,
  TIME_SYNC,
};

struct AuthStep {
  AuthStepType type;
  uint8_t msg_id;
  uint8_t request_value;  // CAPABILITY_REQUEST only
};

static const AuthStep AUTH_STEPS_FULL[] = {
    {AuthStepType::CAPABILITY_QUERY, 0x0C, 0},
    {AuthStepType::CAPABILITY_REQUEST, 0x0E, 2},
    {AuthStepType::TIME_SYNC, 0x0F, 0},
    {AuthStepType::CAPABILITY_QUERY, 0x10, 0},
    {AuthStepType::CAPABILITY_QUERY, 0x11, 0},
    {AuthStepType::CAPABILITY_REQUEST, 0x12, 1},
    {AuthStepType::TIME_SYNC, 0x13, 0},
};

static const AuthStep AUTH_STEPS_SHORT[] = {
    {AuthStepType::CAPABILITY_QUERY, 0x0D, 0},
    {AuthStepType::CAPABILITY_REQUEST, 0x0E, 2},
    {AuthStepType::TIME_SYNC, 0x0F, 0},
};

static FieldWriter build_auth_payload(const AuthStep &step, uint64_t unix_time, ServiceId &service) {
  FieldWriter body;
  switch (step.type) {
    case AuthStepType::CAPABILITY_QUERY: {
      FieldWriter payload = command_header(AUTH_CMD_CAPABILITY_QUERY, step.msg_id);
      body.add_uint(1, 1);
      body.add_uint(2, 4);
      payload.add_message(3, body);
      service = SERVICE_AUTH_CONTROL;
      return payload;
    }
    case AuthStepType::CAPABILITY_REQUEST: {
      FieldWriter payload = command_header(AUTH_CMD_CAPABILITY_REQUEST, step.msg_id);
      body.add_uint(1, step.request_value);
      payload.add_message(4, body);
      service = SERVICE_AUTH_DATA;
      return payload;
    }
    case AuthStepType::TIME_SYNC:
    default: {
      FieldWriter payload = command_header(AUTH_CMD_TIME_SYNC, step.msg_id);
      body.add_uint(1, unix_time);
      body.add_raw_value(2, WIRE_VARINT, AUTH_TRANSACTION_ID, AUTH_TRANSACTION_ID_SIZE);
      payload.add_message(AUTH_FIELD_TIME_SYNC, body);
      service = SERVICE_AUTH_DATA;
      return payload;
    }
  }
}

ErrorCode build_auth_packets(Session &session, AuthMode mode, uint64_t unix_time, std::vector<Packet> &out) {
  const AuthStep *steps = (mode == AuthMode::FULL) ? AUTH_STEPS_FULL : AUTH_STEPS_SHORT;
  size_t step_count = (mode == AuthMode::FULL) ? sizeof(AUTH_STEPS_FULL) / sizeof(AUTH_STEPS_FULL[0])
                                                : sizeof(AUTH_STEPS_SHORT) / sizeof(AUTH_STEPS_SHORT[0]);

  Session saved = session;
  session.begin_authentication();

  std::vector<Packet> packets(step_count);
  for (size_t i = 0; i < step_count; i++) {
    ServiceId service = SERVICE_AUTH_CONTROL;
    FieldWriter payload = build_auth_payload(steps[i], unix_time, service);
    ErrorCode error = build_packet(session, service, payload.data(), payload.size(), packets[i]);
    if (error != ErrorCode::NONE) {
      ESP_LOGE(TAG, "Failed to build auth packet %zu: %s", i + 1, error_to_string(error));
      session = saved;
      return error;
    }
    packets[i].set_characteristic(Characteristic::CONTROL_WRITE);
    packets[i].set_delay_after_ms(i + 1 == step_count ? AUTH_SETTLE_DELAY_MS : AUTH_PACKET_DELAY_MS);
  }

  session.complete_authentication(mode == AuthMode::FULL ? AUTH_FULL_NEXT_MSG_ID : AUTH_SHORT_NEXT_MSG_ID);
  out.insert(out.end(), packets.begin(), packets.end());
  ESP_LOGI(TAG, "Built %zu-packet handshake for %s endpoint", step_count, endpoint_name(session.endpoint()));
  return ErrorCode::NONE;
}

// ============================================================================
// AI channel
// ============================================================================

static ErrorCode build_ai_ctrl(Session &session, uint8_t status, Packet &out) {
  ErrorCode error = require_authenticated(session);
  if (error != ErrorCode::NONE) {
    return error;
  }

  FieldWriter payload = command_header(AI_CMD_CTRL, session.peek_msg_id(Channel::AI));
  FieldWriter ctrl;
  ctrl.add_uint(1, status);
  payload.add_message(3, ctrl);

  error = finish_channel_packet(session, Channel::AI, SERVICE_AI, payload, MODE_ENTER_DELAY_MS, out);
  if (error == ErrorCode::NONE) {
    session.set_ai_mode_active(status == AI_STATUS_ENTER);
  }
  return error;
}

// cmdCnt, streamEnable and textMode are always zero
static FieldWriter build_ai_text_info(const std::string &text) {
  FieldWriter info;
  info.add_uint(1, 0);
  info.add_uint(2, 0);
  info.add_uint(3, 0);
  info.add_string(4, text);
  return info;
}

static ErrorCode build_ai_text(Session &session, uint32_t command, uint32_t info_field, const std::string &text,
                               uint32_t delay_ms, Packet &out) {
  ErrorCode error = require_authenticated(session);
  if (error != ErrorCode::NONE) {
    return error;
  }
  if (!session.ai_mode_active()) {
    ESP_LOGW(TAG, "AI text sent without entering AI mode, the card will not render");
  }

  FieldWriter payload = command_header(command, session.peek_msg_id(Channel::AI));
  payload.add_message(info_field, build_ai_text_info(text));
  return finish_channel_packet(session, Channel::AI, SERVICE_AI, payload, delay_ms, out);
}

ErrorCode build_ai_enter(Session &session, Packet &out) { return build_ai_ctrl(session, AI_STATUS_ENTER, out); }

ErrorCode build_ai_exit(Session &session, Packet &out) { return build_ai_ctrl(session, AI_STATUS_EXIT, out); }

ErrorCode build_ai_ask(Session &session, const std::string &text, Packet &out) {
  return build_ai_text(session, AI_CMD_ASK, 5, text, AI_ASK_DELAY_MS, out);
}

ErrorCode build_ai_reply(Session &session, const std::string &text, Packet &out) {
  return build_ai_text(session, AI_CMD_REPLY, 7, text, 0, out);
}

// ============================================================================
// Teleprompter channel
// ============================================================================

/**
 * One on-device rendering region. The two 32-bit values are IEEE-754
 * floats; their meaning is inferred from captures only.
 */
struct DisplayRegion {
  uint8_t id;
  uint32_t param;
  bool stray_byte;  // captured stream carries 0x0F after field 2
  uint32_t offset_bits;
  uint32_t span_bits;
};

static const DisplayRegion DISPLAY_REGIONS[] = {
    {2, 10000, false, 0x4494E000, 0x00000000},  // 1191.0, 0.0
    {3, 13, true, 0x448D4000, 0x00000000},      // 1130.0, 0.0
    {4, 0, false, 0x42880000, 0x00000000},      // 68.0, 0.0
    {5, 0, false, 0x42920000, 0x42A20000},      // 73.0, 81.0
    {6, 0, false, 0x42C60000, 0x42C40000},      // 99.0, 98.0
};

static constexpr uint8_t DISPLAY_REGION_STRAY_BYTE = 0x0F;

static std::vector<uint8_t> encode_display_config() {
  FieldWriter config;
  config.add_uint(1, 1);
  for (const DisplayRegion &region : DISPLAY_REGIONS) {
    FieldWriter entry;
    entry.add_uint(1, region.id);
    entry.add_uint(2, region.param);
    std::vector<uint8_t> bytes = entry.bytes();
    if (region.stray_byte) {
      bytes.push_back(DISPLAY_REGION_STRAY_BYTE);
    }
    FieldWriter tail;
    tail.add_fixed32(3, region.offset_bits);
    tail.add_fixed32(4, region.span_bits);
    tail.add_uint(5, 0);
    tail.add_uint(6, 0);
    bytes.insert(bytes.end(), tail.bytes().begin(), tail.bytes().end());
    config.add_bytes(2, bytes.data(), bytes.size());
  }
  config.add_uint(3, 0);
  return config.bytes();
}

const std::vector<uint8_t> &display_config_blob() {
  static const std::vector<uint8_t> blob = encode_display_config();
  return blob;
}

uint32_t teleprompter_content_height(uint32_t total_lines) {
  uint64_t height = static_cast<uint64_t>(total_lines) * TP_REFERENCE_HEIGHT / TP_REFERENCE_LINES;
  if (height < 1) {
    return 1;
  }
  return static_cast<uint32_t>(height);
}

ErrorCode build_display_config(Session &session, Packet &out) {
  ErrorCode error = require_authenticated(session);
  if (error != ErrorCode::NONE) {
    return error;
  }

  FieldWriter payload = command_header(TP_CMD_DISPLAY_CONFIG, session.peek_msg_id(Channel::TELEPROMPTER));
  const std::vector<uint8_t> &blob = display_config_blob();
  payload.add_bytes(4, blob.data(), blob.size());
  return finish_channel_packet(session, Channel::TELEPROMPTER, SERVICE_DISPLAY_CONFIG, payload,
                               MODE_ENTER_DELAY_MS, out);
}

ErrorCode build_teleprompter_init(Session &session, uint32_t total_lines, bool manual_mode, Packet &out) {
  ErrorCode error = require_authenticated(session);
  if (error != ErrorCode::NONE) {
    return error;
  }

  FieldWriter display;
  display.add_uint(1, 1);
  display.add_uint(2, 0);
  display.add_uint(3, 0);
  display.add_uint(4, TP_DISPLAY_WIDTH);
  display.add_uint(5, teleprompter_content_height(total_lines));
  display.add_uint(6, TP_LINE_HEIGHT);
  display.add_uint(7, TP_VIEWPORT_HEIGHT);
  display.add_uint(8, TP_FONT_SIZE);
  display.add_uint(9, manual_mode ? 0 : 1);

  FieldWriter settings;
  settings.add_uint(1, 1);
  settings.add_message(2, display);

  FieldWriter payload = command_header(TP_CMD_INIT, session.peek_msg_id(Channel::TELEPROMPTER));
  payload.add_message(3, settings);
  return finish_channel_packet(session, Channel::TELEPROMPTER, SERVICE_TELEPROMPTER, payload,
                               TELEPROMPTER_INIT_DELAY_MS, out);
}

ErrorCode build_content_page(Session &session, uint32_t page_index, const std::string &page_text, Packet &out) {
  ErrorCode error = require_authenticated(session);
  if (error != ErrorCode::NONE) {
    return error;
  }

  FieldWriter content;
  content.add_uint(1, page_index);
  content.add_uint(2, TP_PAGE_LINE_COUNT);
  content.add_string(3, "\n" + page_text);

  FieldWriter payload = command_header(TP_CMD_CONTENT, session.peek_msg_id(Channel::TELEPROMPTER));
  payload.add_message(5, content);
  return finish_channel_packet(session, Channel::TELEPROMPTER, SERVICE_TELEPROMPTER, payload, CONTENT_DELAY_MS,
                               out);
}

ErrorCode build_teleprompter_marker(Session &session, Packet &out) {
  ErrorCode error = require_authenticated(session);
  if (error != ErrorCode::NONE) {
    return error;
  }

  FieldWriter marker;
  marker.add_uint(1, 0);
  marker.add_uint(2, 6);

  FieldWriter payload = command_header(TP_CMD_MARKER, session.peek_msg_id(Channel::TELEPROMPTER));
  payload.add_message(13, marker);
  return finish_channel_packet(session, Channel::TELEPROMPTER, SERVICE_TELEPROMPTER, payload, CONTENT_DELAY_MS,
                               out);
}

ErrorCode build_teleprompter_sync(Session &session, Packet &out) {
  ErrorCode error = require_authenticated(session);
  if (error != ErrorCode::NONE) {
    return error;
  }

  FieldWriter payload = command_header(TP_CMD_SYNC, session.peek_msg_id(Channel::TELEPROMPTER));
  payload.add_bytes(13, nullptr, 0);
  return finish_channel_packet(session, Channel::TELEPROMPTER, SERVICE_AUTH_CONTROL, payload, CONTENT_DELAY_MS,
                               out);
}

static ErrorCode append_pages(Session &session, const std::vector<std::string> &pages, size_t begin, size_t end,
                              std::vector<Packet> &out) {
  for (size_t i = begin; i < end && i < pages.size(); i++) {
    Packet packet;
    ErrorCode error = build_content_page(session, static_cast<uint32_t>(i), pages[i], packet);
    if (error != ErrorCode::NONE) {
      return error;
    }
    out.push_back(packet);
  }
  return ErrorCode::NONE;
}

ErrorCode build_teleprompter_script(Session &session, const std::vector<std::string> &pages, uint32_t total_lines,
                                    bool manual_mode, std::vector<Packet> &out) {
  Session saved = session;
  std::vector<Packet> packets;
  Packet packet;

  ErrorCode error = build_display_config(session, packet);
  if (error == ErrorCode::NONE) {
    packets.push_back(packet);
    error = build_teleprompter_init(session, total_lines, manual_mode, packet);
  }
  if (error == ErrorCode::NONE) {
    packets.push_back(packet);
    error = append_pages(session, pages, 0, TP_PAGES_BEFORE_MARKER, packets);
  }
  if (error == ErrorCode::NONE) {
    error = build_teleprompter_marker(session, packet);
  }
  if (error == ErrorCode::NONE) {
    packets.push_back(packet);
    error = append_pages(session, pages, TP_PAGES_BEFORE_MARKER, TP_PAGES_BEFORE_SYNC, packets);
  }
  if (error == ErrorCode::NONE) {
    error = build_teleprompter_sync(session, packet);
  }
  if (error == ErrorCode::NONE) {
    packets.push_back(packet);
    error = append_pages(session, pages, TP_PAGES_BEFORE_SYNC, pages.size(), packets);
  }

  if (error != ErrorCode::NONE) {
    session = saved;
    return error;
  }

  out.insert(out.end(), packets.begin(), packets.end());
  return ErrorCode::NONE;
}

}  // namespace g2_glasses_ble
}  // namespace esphome
