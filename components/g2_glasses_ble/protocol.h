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

// ============================================================================
// Field encoding
// ============================================================================

// Wire types of the nested (key, value) convention shared by all channels
static constexpr uint8_t WIRE_VARINT = 0;
static constexpr uint8_t WIRE_LENGTH_DELIMITED = 2;
static constexpr uint8_t WIRE_FIXED32 = 5;

inline constexpr uint32_t field_key(uint32_t field, uint8_t wire_type) { return (field << 3) | wire_type; }

/**
 * Writes a message of (key, value) fields. A numeric field is
 * <varint key><varint value>; a length-delimited field is
 * <varint key><varint length><raw bytes>.
 */
class FieldWriter {
 public:
  void add_uint(uint32_t field, uint64_t value);
  void add_fixed32(uint32_t field, uint32_t value);
  void add_bytes(uint32_t field, const uint8_t *data, size_t len);
  void add_string(uint32_t field, const std::string &text);
  void add_message(uint32_t field, const FieldWriter &message);
  // Key followed by pre-encoded value bytes
  void add_raw_value(uint32_t field, uint8_t wire_type, const uint8_t *data, size_t len);

  const uint8_t *data() const { return buffer_.data(); }
  size_t size() const { return buffer_.size(); }
  const std::vector<uint8_t> &bytes() const { return buffer_; }

 private:
  std::vector<uint8_t> buffer_;
};

// Common message prefix: field 1 = command id, field 2 = message id
static constexpr uint32_t FIELD_COMMAND = 1;
static constexpr uint32_t FIELD_MSG_ID = 2;

// ============================================================================
// Pacing (milliseconds the firmware needs after a write)
// ============================================================================

static constexpr uint32_t AUTH_PACKET_DELAY_MS = 100;
static constexpr uint32_t AUTH_SETTLE_DELAY_MS = 500;
static constexpr uint32_t MODE_ENTER_DELAY_MS = 300;
static constexpr uint32_t AI_ASK_DELAY_MS = 500;
static constexpr uint32_t TELEPROMPTER_INIT_DELAY_MS = 500;
static constexpr uint32_t CONTENT_DELAY_MS = 100;

// ============================================================================
// Authentication
// ============================================================================

enum class AuthMode : uint8_t {
  FULL = 0,   // 7 packets, single-endpoint channels
  SHORT = 1,  // 3 packets, each eye of the dual-endpoint notification channel
};

static constexpr uint32_t AUTH_CMD_CAPABILITY_QUERY = 0x04;
static constexpr uint32_t AUTH_CMD_CAPABILITY_REQUEST = 0x05;
static constexpr uint32_t AUTH_CMD_TIME_SYNC = 0x80;
static constexpr uint32_t AUTH_FIELD_TIME_SYNC = 128;

// Fixed transaction id of the time-sync messages (a pre-encoded varint)
static constexpr size_t AUTH_TRANSACTION_ID_SIZE = 10;
static constexpr uint8_t AUTH_TRANSACTION_ID[AUTH_TRANSACTION_ID_SIZE] = {0xE8, 0xFF, 0xFF, 0xFF, 0xFF,
                                                                          0xFF, 0xFF, 0xFF, 0xFF, 0x01};

// Teleprompter message id that follows each handshake variant
static constexpr uint16_t AUTH_FULL_NEXT_MSG_ID = 0x14;
static constexpr uint16_t AUTH_SHORT_NEXT_MSG_ID = 0x10;

/**
 * Build the handshake an endpoint needs before any channel accepts commands.
 * Rewinds the session counters, emits the packets on sequence 1..N and
 * marks the session authenticated.
 * @param session Session of the endpoint being authenticated
 * @param mode FULL (7 packets) or SHORT (3 packets)
 * @param unix_time Current Unix timestamp embedded in the time-sync packets
 * @param out Packets are appended in send order
 * @return NONE on success
 */
ErrorCode build_auth_packets(Session &session, AuthMode mode, uint64_t unix_time, std::vector<Packet> &out);

// ============================================================================
// AI channel (service 0x07-20)
// ============================================================================

static constexpr uint32_t AI_CMD_CTRL = 1;
static constexpr uint32_t AI_CMD_ASK = 3;
static constexpr uint32_t AI_CMD_REPLY = 5;

static constexpr uint8_t AI_STATUS_ENTER = 2;
static constexpr uint8_t AI_STATUS_EXIT = 3;

// Device-safe text budgets (bytes) callers should truncate to
static constexpr size_t AI_QUESTION_MAX_BYTES = 150;
static constexpr size_t AI_ANSWER_MAX_BYTES = 200;

/**
 * Build CTRL(ENTER). Must be sent before ASK/REPLY will render.
 */
ErrorCode build_ai_enter(Session &session, Packet &out);

/**
 * Build CTRL(EXIT)
 */
ErrorCode build_ai_exit(Session &session, Packet &out);

/**
 * Build ASK (question card). The text is sent as-is; truncate it first.
 */
ErrorCode build_ai_ask(Session &session, const std::string &text, Packet &out);

/**
 * Build REPLY (answer card). The text is sent as-is; truncate it first.
 */
ErrorCode build_ai_reply(Session &session, const std::string &text, Packet &out);

// ============================================================================
// Teleprompter channel (service 0x06-20, config on 0x0E-20)
// ============================================================================

static constexpr uint32_t TP_CMD_INIT = 1;
static constexpr uint32_t TP_CMD_DISPLAY_CONFIG = 2;
static constexpr uint32_t TP_CMD_CONTENT = 3;
static constexpr uint32_t TP_CMD_SYNC = 14;
static constexpr uint32_t TP_CMD_MARKER = 255;

// Content height scale: a 140-line reference document maps to 2665
static constexpr uint32_t TP_REFERENCE_LINES = 140;
static constexpr uint32_t TP_REFERENCE_HEIGHT = 2665;
static constexpr uint32_t TP_LINE_HEIGHT = 230;
static constexpr uint32_t TP_VIEWPORT_HEIGHT = 1294;
static constexpr uint32_t TP_FONT_SIZE = 5;
static constexpr uint32_t TP_DISPLAY_WIDTH = 267;
// Line count carried by every content page
static constexpr uint32_t TP_PAGE_LINE_COUNT = 10;

// Pages sent before the marker, and before the sync trigger
static constexpr size_t TP_PAGES_BEFORE_MARKER = 10;
static constexpr size_t TP_PAGES_BEFORE_SYNC = 12;

// Largest page text (including the leading newline) one content packet holds,
// with a 3-byte message id and a 2-byte page index
static constexpr size_t TP_CONTENT_OVERHEAD = 17;
static constexpr size_t TP_MAX_PAGE_TEXT_BYTES = MAX_PAYLOAD_SIZE - TP_CONTENT_OVERHEAD;

// Content height for a document of total_lines lines (at least 1)
uint32_t teleprompter_content_height(uint32_t total_lines);

// Fixed rendering-region table sent by build_display_config()
const std::vector<uint8_t> &display_config_blob();

/**
 * Build the display configuration (constant region table)
 */
ErrorCode build_display_config(Session &session, Packet &out);

/**
 * Build the teleprompter init message
 * @param total_lines Number of source lines, scales the content height
 * @param manual_mode true for manual scrolling, false for auto scroll
 */
ErrorCode build_teleprompter_init(Session &session, uint32_t total_lines, bool manual_mode, Packet &out);

/**
 * Build one content page. A newline is prepended to the page text.
 * @param page_index 0-based page number
 * @param page_text Rendered page (see TextPage::render())
 */
ErrorCode build_content_page(Session &session, uint32_t page_index, const std::string &page_text, Packet &out);

/**
 * Build the mid-stream marker
 */
ErrorCode build_teleprompter_marker(Session &session, Packet &out);

/**
 * Build the sync trigger (empty payload tail, routed on 0x80-00)
 */
ErrorCode build_teleprompter_sync(Session &session, Packet &out);

/**
 * Build the full teleprompter stream: display config, init, pages 0-9,
 * marker, pages 10-11, sync, remaining pages. The session is left untouched
 * on error.
 */
ErrorCode build_teleprompter_script(Session &session, const std::vector<std::string> &pages, uint32_t total_lines,
                                    bool manual_mode, std::vector<Packet> &out);

}  // namespace g2_glasses_ble
}  // namespace esphome
