/**
 * @file quic_varint.cc
 * @brief Variable-length integer decoding
 */

#include "quic/quic_varint.h"

namespace l4quic {
namespace quic {

size_t DecodeVarint(const uint8_t* data, size_t len, uint64_t* out_value) {
    if (len == 0) {
        return 0;
    }
    size_t n = VarintLengthFromFirstByte(data[0]);
    if (len < n) {
        return 0;
    }

    // Top two bits of the first byte are the length prefix
    uint64_t value = data[0] & 0x3F;
    for (size_t i = 1; i < n; ++i) {
        value = (value << 8) | data[i];
    }
    *out_value = value;
    return n;
}

} // namespace quic
} // namespace l4quic
