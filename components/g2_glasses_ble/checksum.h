#pragma once

#include <cstdint>
#include <cstddef>

namespace esphome {
namespace g2_glasses_ble {

// CRC-16/CCITT parameters (packet trailer)
static constexpr uint16_t CRC16_INIT = 0xFFFF;
static constexpr uint16_t CRC16_POLY = 0x1021;

// CRC-32C parameters (notification file check), MSB-first, init 0, no final xor
static constexpr uint32_t CRC32C_POLY = 0x1EDC6F41;

/**
 * Bit-wise CRC-16/CCITT over a byte range, no reflection
 * @param data Input bytes (may be nullptr when len is 0)
 * @param len Number of bytes
 * @return 16-bit CRC, 0xFFFF for empty input
 */
uint16_t crc16_ccitt(const uint8_t *data, size_t len);

/**
 * Table-driven CRC-32C (Castagnoli) in the non-reflected variant used by the
 * glasses firmware. This is NOT the reflected CRC-32C used by iSCSI/SSE4.2.
 * @param data Input bytes (may be nullptr when len is 0)
 * @param len Number of bytes
 * @return 32-bit CRC
 */
uint32_t crc32c(const uint8_t *data, size_t len);

// Entry of the 256-entry lookup table derived from CRC32C_POLY
uint32_t crc32c_table_entry(uint8_t index);

}  // namespace g2_glasses_ble
}  // namespace esphome
