#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include "errors.h"

namespace esphome {
namespace g2_glasses_ble {

// A 64-bit value never needs more than 10 groups of 7 bits
static constexpr size_t MAX_VARINT_SIZE = 10;

/**
 * Encode an unsigned value as base-128 varint, least significant group first
 * @param value Value to encode
 * @param out Output buffer (must be at least MAX_VARINT_SIZE bytes)
 * @return Number of bytes written
 */
size_t encode_varint(uint64_t value, uint8_t *out);

// Append the varint encoding of value to out
void append_varint(std::vector<uint8_t> &out, uint64_t value);

// Number of bytes encode_varint() produces for value
size_t varint_size(uint64_t value);

/**
 * Decode a varint from the start of a buffer
 * @param data Input bytes
 * @param len Number of readable bytes
 * @param value Decoded value (unchanged on error)
 * @param consumed Number of bytes the varint occupied (unchanged on error)
 * @return MALFORMED_VARINT if the continuation bits do not terminate within
 *         MAX_VARINT_SIZE bytes or before the end of the input
 */
ErrorCode decode_varint(const uint8_t *data, size_t len, uint64_t &value, size_t &consumed);

}  // namespace g2_glasses_ble
}  // namespace esphome
