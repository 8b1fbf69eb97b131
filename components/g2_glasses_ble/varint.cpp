#include "varint.h"

namespace esphome {
namespace g2_glasses_ble {

size_t encode_varint(uint64_t value, uint8_t *out) {
  size_t len = 0;
  while (value > 0x7F) {
    out[len++] = static_cast<uint8_t>((value & 0x7F) | 0x80);
    value >>= 7;
  }
  out[len++] = static_cast<uint8_t>(value & 0x7F);
  return len;
}

void append_varint(std::vector<uint8_t> &out, uint64_t value) {
  uint8_t encoded[MAX_VARINT_SIZE];
  size_t len = encode_varint(value, encoded);
  out.insert(out.end(), encoded, encoded + len);
}

size_t varint_size(uint64_t value) {
  size_t len = 1;
  while (value > 0x7F) {
    value >>= 7;
    len++;
  }
  return len;
}

ErrorCode decode_varint(const uint8_t *data, size_t len, uint64_t &value, size_t &consumed) {
  if (data == nullptr) {
    return ErrorCode::INVALID_ARGUMENT;
  }

  uint64_t result = 0;
  for (size_t i = 0; i < len && i < MAX_VARINT_SIZE; i++) {
    uint8_t byte = data[i];
    // The tenth group only has room for the top bit of a 64-bit value
    if (i == MAX_VARINT_SIZE - 1 && (byte & 0x7E) != 0) {
      return ErrorCode::MALFORMED_VARINT;
    }
    result |= static_cast<uint64_t>(byte & 0x7F) << (7 * i);
    if ((byte & 0x80) == 0) {
      value = result;
      consumed = i + 1;
      return ErrorCode::NONE;
    }
  }
  return ErrorCode::MALFORMED_VARINT;
}

}  // namespace g2_glasses_ble
}  // namespace esphome
