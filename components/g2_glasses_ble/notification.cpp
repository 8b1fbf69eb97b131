#include "notification.h"
#include "checksum.h"
#include "g2_glasses_log.h"
#include "text_layout.h"

#include <ArduinoJson.h>
#include <ctime>

namespace esphome {
namespace g2_glasses_ble {

static const char *const TAG = "g2_glasses_ble.notification";

static constexpr size_t ELLIPSIS_SIZE = 3;

uint32_t notification_msg_id(uint64_t unix_time) {
  return NOTIFICATION_MSG_ID_BASE + static_cast<uint32_t>(unix_time % NOTIFICATION_MSG_ID_RANGE);
}

std::string format_notification_date(uint64_t unix_time) {
  time_t t = static_cast<time_t>(unix_time);
  struct tm local;
  if (localtime_r(&t, &local) == nullptr) {
    return "";
  }
  char buffer[20];
  size_t len = strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%S", &local);
  return std::string(buffer, len);
}

std::string serialize_notification(const NotificationContent &content, const NotificationOptions &options,
                                   uint64_t unix_time) {
  JsonDocument doc;
  JsonObject notification = doc["android_notification"].to<JsonObject>();
  notification["msg_id"] = notification_msg_id(unix_time);
  notification["action"] = 0;
  notification["app_identifier"] = options.app_identifier;
  notification["title"] = content.title;
  notification["subtitle"] = content.subtitle;
  notification["message"] = content.message;
  notification["time_s"] = unix_time;
  notification["date"] = format_notification_date(unix_time);
  notification["display_name"] = options.display_name;

  std::string json;
  serializeJson(doc, json);
  return json;
}

// Escaping can still push the record over budget; trim message, subtitle, then title
static bool shrink_one(NotificationContent &content) {
  if (utf8_pop_back(content.message)) {
    return true;
  }
  if (utf8_pop_back(content.subtitle)) {
    return true;
  }
  return utf8_pop_back(content.title);
}

NotificationContent truncate_notification(const NotificationContent &content, const NotificationOptions &options,
                                          uint64_t unix_time, bool *truncated) {
  if (truncated != nullptr) {
    *truncated = false;
  }
  if (serialize_notification(content, options, unix_time).size() <= options.max_size) {
    return content;
  }

  size_t overhead = serialize_notification(NotificationContent(), options, unix_time).size();
  size_t available = options.max_size > overhead ? options.max_size - overhead : 0;
  size_t title_len = content.title.size();
  size_t subtitle_len = content.subtitle.size();

  NotificationContent result = content;
  if (title_len + subtitle_len > available) {
    result.message.clear();
    if (title_len + ELLIPSIS_SIZE > available) {
      result.subtitle.clear();
      result.title = truncate_with_ellipsis(content.title, available);
    } else {
      result.subtitle = truncate_with_ellipsis(content.subtitle, available - title_len);
    }
  } else {
    result.message = truncate_with_ellipsis(content.message, available - title_len - subtitle_len);
  }

  while (serialize_notification(result, options, unix_time).size() > options.max_size) {
    if (!shrink_one(result)) {
      ESP_LOGW(TAG, "Record overhead alone exceeds %zu bytes", options.max_size);
      break;
    }
  }

  if (truncated != nullptr) {
    *truncated = true;
  }
  ESP_LOGW(TAG, "Notification truncated to fit %zu bytes", options.max_size);
  return result;
}

// ============================================================================
// FileCheckHeader
// ============================================================================

FileCheckHeader FileCheckHeader::for_data(const uint8_t *data, size_t len, const std::string &filename) {
  uint32_t crc = crc32c(data, len);
  FileCheckHeader header;
  header.size = static_cast<uint32_t>(len * 256);
  header.crc32c_shifted = crc << 8;
  header.crc_extra_byte = static_cast<uint8_t>(crc >> 24);
  header.filename = filename;
  return header;
}

static void append_u32_le(std::vector<uint8_t> &out, uint32_t value) {
  out.push_back(value & 0xFF);
  out.push_back((value >> 8) & 0xFF);
  out.push_back((value >> 16) & 0xFF);
  out.push_back((value >> 24) & 0xFF);
}

ErrorCode FileCheckHeader::serialize(std::vector<uint8_t> &out) const {
  if (filename.size() > FILE_CHECK_FILENAME_SIZE) {
    ESP_LOGE(TAG, "Filename '%s' exceeds %zu bytes", filename.c_str(), FILE_CHECK_FILENAME_SIZE);
    return ErrorCode::INVALID_ARGUMENT;
  }
  std::vector<uint8_t> payload;
  payload.reserve(FILE_CHECK_PAYLOAD_SIZE);
  append_u32_le(payload, magic);
  append_u32_le(payload, size);
  append_u32_le(payload, crc32c_shifted);
  payload.push_back(crc_extra_byte);
  payload.insert(payload.end(), filename.begin(), filename.end());
  payload.resize(FILE_CHECK_PAYLOAD_SIZE, 0);
  out.insert(out.end(), payload.begin(), payload.end());
  return ErrorCode::NONE;
}

// ============================================================================
// Notification transfer
// ============================================================================

static ErrorCode append_file_packet(Session &session, ServiceId service, const uint8_t *payload, size_t len,
                                    uint32_t delay_ms, std::vector<Packet> &out) {
  Packet packet;
  ErrorCode error = build_packet(session, service, payload, len, packet);
  if (error != ErrorCode::NONE) {
    return error;
  }
  packet.set_characteristic(Characteristic::FILE_WRITE);
  packet.set_delay_after_ms(delay_ms);
  out.push_back(packet);
  return ErrorCode::NONE;
}

static ErrorCode append_file_data(Session &session, const std::string &json, std::vector<Packet> &out) {
  const uint8_t *data = reinterpret_cast<const uint8_t *>(json.data());
  if (json.size() <= MAX_PAYLOAD_SIZE) {
    return append_file_packet(session, SERVICE_FILE_DATA, data, json.size(), FILE_DATA_DELAY_MS, out);
  }

  std::vector<Packet> fragments;
  ErrorCode error = build_fragmented_packets(session, SERVICE_FILE_DATA, data, json.size(), fragments);
  if (error != ErrorCode::NONE) {
    return error;
  }
  for (size_t i = 0; i < fragments.size(); i++) {
    fragments[i].set_characteristic(Characteristic::FILE_WRITE);
    fragments[i].set_delay_after_ms(i + 1 == fragments.size() ? FILE_DATA_DELAY_MS : FILE_START_DELAY_MS);
  }
  ESP_LOGD(TAG, "DATA split into %zu fragments", fragments.size());
  out.insert(out.end(), fragments.begin(), fragments.end());
  return ErrorCode::NONE;
}

ErrorCode build_notification(Session &primary, const Session &companion, const NotificationContent &content,
                             const NotificationOptions &options, uint64_t unix_time, NotificationBatch &out) {
  if (!primary.is_authenticated() || !companion.is_authenticated()) {
    ESP_LOGE(TAG, "Both endpoints must be authenticated (%s=%d, %s=%d)", endpoint_name(primary.endpoint()),
             primary.is_authenticated(), endpoint_name(companion.endpoint()), companion.is_authenticated());
    return ErrorCode::NOT_AUTHENTICATED;
  }

  NotificationBatch batch;
  NotificationContent fitted = truncate_notification(content, options, unix_time, &batch.truncated);
  batch.json = serialize_notification(fitted, options, unix_time);

  const uint8_t *json_data = reinterpret_cast<const uint8_t *>(batch.json.data());
  FileCheckHeader header = FileCheckHeader::for_data(json_data, batch.json.size(), options.filename);
  std::vector<uint8_t> check_payload;
  ErrorCode error = header.serialize(check_payload);
  if (error != ErrorCode::NONE) {
    return error;
  }

  error = batch.heartbeat.assign(HEARTBEAT_FRAME, HEARTBEAT_FRAME_SIZE);
  if (error != ErrorCode::NONE) {
    return error;
  }
  batch.heartbeat.set_characteristic(Characteristic::CONTROL_WRITE);

  Session saved = primary;
  error = append_file_packet(primary, SERVICE_FILE_CONTROL, check_payload.data(), check_payload.size(),
                             FILE_CHECK_DELAY_MS, batch.primary);
  if (error == ErrorCode::NONE) {
    error = append_file_packet(primary, SERVICE_FILE_CONTROL, &FILE_TRANSFER_START, 1, FILE_START_DELAY_MS,
                               batch.primary);
  }
  if (error == ErrorCode::NONE) {
    error = append_file_data(primary, batch.json, batch.primary);
  }
  if (error == ErrorCode::NONE) {
    error = append_file_packet(primary, SERVICE_FILE_CONTROL, &FILE_TRANSFER_END, 1, FILE_END_DELAY_MS,
                               batch.primary);
  }
  if (error != ErrorCode::NONE) {
    ESP_LOGE(TAG, "Failed to build notification: %s", error_to_string(error));
    primary = saved;
    return error;
  }

  ESP_LOGD(TAG, "Notification record %zu bytes, crc field %08X", batch.json.size(), header.crc32c_shifted);
  out = batch;
  return ErrorCode::NONE;
}

}  // namespace g2_glasses_ble
}  // namespace esphome
