/**
 * @file quic_types.cc
 * @brief BufferReader varint support
 */

#include "quic/quic_types.h"
#include "quic/quic_varint.h"

namespace l4quic {
namespace quic {

bool BufferReader::ReadVarint(uint64_t* out) {
    size_t consumed = DecodeVarint(data_ + pos_, len_ - pos_, out);
    if (consumed == 0) {
        return false;
    }
    pos_ += consumed;
    return true;
}

} // namespace quic
} // namespace l4quic
