/**
 * @file quic_varint.h
 * @brief Variable-length integer decoding (RFC 9000 Section 16)
 */

#pragma once

#include <cstdint>
#include <cstddef>

namespace l4quic {
namespace quic {

/// 2^62 - 1
constexpr uint64_t kMaxVarint = 0x3FFFFFFFFFFFFFFFULL;

/**
 * @brief Encoded length announced by the two high bits: 1, 2, 4 or 8
 */
inline size_t VarintLengthFromFirstByte(uint8_t first_byte) {
    return static_cast<size_t>(1) << (first_byte >> 6);
}

/**
 * @brief Decode one varint
 *
 * Non-minimal encodings are accepted.
 *
 * @return Bytes consumed, or 0 if @p len is shorter than the encoding
 */
size_t DecodeVarint(const uint8_t* data, size_t len, uint64_t* out_value);

} // namespace quic
} // namespace l4quic
