#pragma once

#include <cstdint>

namespace esphome {
namespace g2_glasses_ble {

// Result of every builder that can fail. NONE means success.
enum class ErrorCode : uint8_t {
  NONE = 0,
  PAYLOAD_TOO_LARGE,     // payload + CRC does not fit the one-byte length field
  TEXT_BUDGET_EXCEEDED,  // page cannot be shrunk below its byte budget
  MALFORMED_VARINT,      // continuation bits never terminate
  NOT_AUTHENTICATED,     // channel used before the handshake was built
  INVALID_ARGUMENT,
};

inline const char *error_to_string(ErrorCode error) {
  switch (error) {
    case ErrorCode::NONE:
      return "none";
    case ErrorCode::PAYLOAD_TOO_LARGE:
      return "payload too large";
    case ErrorCode::TEXT_BUDGET_EXCEEDED:
      return "text budget exceeded";
    case ErrorCode::MALFORMED_VARINT:
      return "malformed varint";
    case ErrorCode::NOT_AUTHENTICATED:
      return "not authenticated";
    case ErrorCode::INVALID_ARGUMENT:
      return "invalid argument";
  }
  return "unknown";
}

}  // namespace g2_glasses_ble
}  // namespace esphome
