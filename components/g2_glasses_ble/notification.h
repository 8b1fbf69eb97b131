#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "errors.h"
#include "packet.h"
#include "session.h"

namespace esphome {
namespace g2_glasses_ble {

// Largest JSON record the firmware accepts as one DATA frame
static constexpr size_t NOTIFICATION_MAX_SIZE = 234;

static constexpr uint32_t NOTIFICATION_MSG_ID_BASE = 10000;
static constexpr uint32_t NOTIFICATION_MSG_ID_RANGE = 10000;

// FILE_CHECK: u32 magic, u32 size, u32 crc<<8, u8 crc>>24, 80-byte filename
static constexpr uint32_t FILE_CHECK_MAGIC = 0x100;
static constexpr size_t FILE_CHECK_FILENAME_SIZE = 80;
static constexpr size_t FILE_CHECK_PAYLOAD_SIZE = 4 + 4 + 4 + 1 + FILE_CHECK_FILENAME_SIZE;

static constexpr uint8_t FILE_TRANSFER_START = 0x01;
static constexpr uint8_t FILE_TRANSFER_END = 0x02;

static constexpr uint32_t FILE_CHECK_DELAY_MS = 300;
static constexpr uint32_t FILE_START_DELAY_MS = 100;
static constexpr uint32_t FILE_DATA_DELAY_MS = 300;
static constexpr uint32_t FILE_END_DELAY_MS = 200;

// Completion signal written to the companion endpoint, replayed as captured
static constexpr size_t HEARTBEAT_FRAME_SIZE = 16;
static constexpr uint8_t HEARTBEAT_FRAME[HEARTBEAT_FRAME_SIZE] = {0xAA, 0x21, 0x0E, 0x06, 0x01, 0x01, 0x80, 0x20,
                                                                  0x08, 0x0E, 0x10, 0x6B, 0x6A, 0x00, 0xE1, 0x74};

struct NotificationContent {
  std::string title;
  std::string subtitle;
  std::string message;

  NotificationContent() {}
  NotificationContent(const std::string &title, const std::string &subtitle, const std::string &message)
    : title(title), subtitle(subtitle), message(message) {}
};

struct NotificationOptions {
  std::string app_identifier;
  std::string display_name;
  size_t max_size;
  std::string filename;

  NotificationOptions()
    : app_identifier("com.google.android.gm"),
      display_name("Gmail"),
      max_size(NOTIFICATION_MAX_SIZE),
      filename("user/notify_whitelist.json") {}
};

// 10000 + unix_time % 10000
uint32_t notification_msg_id(uint64_t unix_time);

// Local time as YYYYMMDDTHHMMSS
std::string format_notification_date(uint64_t unix_time);

/**
 * Serialize the compact JSON record:
 * {"android_notification":{"msg_id","action","app_identifier","title",
 *  "subtitle","message","time_s","date","display_name"}}
 */
std::string serialize_notification(const NotificationContent &content, const NotificationOptions &options,
                                   uint64_t unix_time);

/**
 * Shrink the fields so the serialized record fits options.max_size bytes.
 *
 * The message goes first. If title and subtitle alone do not fit, the
 * message is dropped and the subtitle truncated; the title is only cut when
 * it does not fit by itself. Budgets are counted in UTF-8 bytes.
 * @param truncated Set to true if any field changed (may be nullptr)
 */
NotificationContent truncate_notification(const NotificationContent &content, const NotificationOptions &options,
                                          uint64_t unix_time, bool *truncated = nullptr);

/**
 * Header announcing a file transfer. size and checksum are packed the way
 * the firmware expects them, not as plain values.
 */
struct FileCheckHeader {
  uint32_t magic;
  uint32_t size;            // len(data) * 256
  uint32_t crc32c_shifted;  // crc32c(data) << 8
  uint8_t crc_extra_byte;   // crc32c(data) >> 24
  std::string filename;

  FileCheckHeader() : magic(FILE_CHECK_MAGIC), size(0), crc32c_shifted(0), crc_extra_byte(0) {}

  static FileCheckHeader for_data(const uint8_t *data, size_t len, const std::string &filename);

  /**
   * Encode the 93-byte FILE_CHECK payload
   * @return INVALID_ARGUMENT if the filename exceeds FILE_CHECK_FILENAME_SIZE
   */
  ErrorCode serialize(std::vector<uint8_t> &out) const;
};

// Everything one notification needs, in send order
struct NotificationBatch {
  std::string json;
  bool truncated;
  // FILE_CHECK, START, DATA fragment(s), END on the primary file characteristic
  std::vector<Packet> primary;
  // Heartbeat for the companion control characteristic
  Packet heartbeat;

  NotificationBatch() : truncated(false) {}
};

/**
 * Build a notification transfer.
 *
 * The record is truncated before the FILE_CHECK header is computed so the
 * announced size and checksum cover the bytes actually sent.
 * @param primary Session of the endpoint receiving the file (sequence numbers are consumed)
 * @param companion Session of the other endpoint, receives the heartbeat
 * @return NOT_AUTHENTICATED unless both sessions are authenticated; primary
 *         is untouched on error
 */
ErrorCode build_notification(Session &primary, const Session &companion, const NotificationContent &content,
                             const NotificationOptions &options, uint64_t unix_time, NotificationBatch &out);

}  // namespace g2_glasses_ble
}  // namespace esphome
