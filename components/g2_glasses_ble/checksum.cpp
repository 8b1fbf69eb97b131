#include "checksum.h"

namespace esphome {
namespace g2_glasses_ble {

struct Crc32cTable {
  uint32_t entries[256];

  Crc32cTable() {
    for (uint32_t i = 0; i < 256; i++) {
      uint32_t crc = i << 24;
      for (int bit = 0; bit < 8; bit++) {
        crc = (crc & 0x80000000u) ? ((crc << 1) ^ CRC32C_POLY) : (crc << 1);
      }
      entries[i] = crc;
    }
  }
};

static const Crc32cTable &crc32c_table() {
  static const Crc32cTable table;
  return table;
}

uint16_t crc16_ccitt(const uint8_t *data, size_t len) {
  uint16_t crc = CRC16_INIT;
  if (data == nullptr) {
    return crc;
  }

  for (size_t i = 0; i < len; i++) {
    crc ^= static_cast<uint16_t>(data[i]) << 8;
    for (int bit = 0; bit < 8; bit++) {
      if (crc & 0x8000) {
        crc = static_cast<uint16_t>((crc << 1) ^ CRC16_POLY);
      } else {
        crc = static_cast<uint16_t>(crc << 1);
      }
    }
  }
  return crc;
}

uint32_t crc32c(const uint8_t *data, size_t len) {
  uint32_t crc = 0;
  if (data == nullptr) {
    return crc;
  }

  const Crc32cTable &table = crc32c_table();
  for (size_t i = 0; i < len; i++) {
    uint8_t index = data[i] ^ static_cast<uint8_t>(crc >> 24);
    crc = (crc << 8) ^ table.entries[index];
  }
  return crc;
}

uint32_t crc32c_table_entry(uint8_t index) { return crc32c_table().entries[index]; }

}  // namespace g2_glasses_ble
}  // namespace esphome
