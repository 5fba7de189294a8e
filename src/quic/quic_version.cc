/**
 * @file quic_version.cc
 * @brief Per-version Initial protection parameters
 */

#include "quic/quic_version.h"

namespace l4quic {
namespace quic {

namespace {

// Wire type bits indexed by PacketType: Initial, 0-RTT, Handshake, Retry
const VersionParams kVersionTable[] = {
    {
        kQuicVersion1, "v1",
        kQuicV1InitialSalt.data(), kQuicV1InitialSalt.size(),
        "quic key", "quic iv", "quic hp",
        {0x00, 0x01, 0x02, 0x03},
    },
    {
        // RFC 9369 Section 3.2 rotates the long header types
        kQuicVersion2, "v2",
        kQuicV2InitialSalt.data(), kQuicV2InitialSalt.size(),
        "quicv2 key", "quicv2 iv", "quicv2 hp",
        {0x01, 0x02, 0x03, 0x00},
    },
    {
        kQuicDraft29, "draft-29",
        kQuicDraft29InitialSalt.data(), kQuicDraft29InitialSalt.size(),
        "quic key", "quic iv", "quic hp",
        {0x00, 0x01, 0x02, 0x03},
    },
};

} // namespace

const VersionParams* FindVersionParams(uint32_t version) {
    for (const VersionParams& params : kVersionTable) {
        if (params.version == version) {
            return &params;
        }
    }
    return nullptr;
}

PacketType DecodeLongHeaderType(const VersionParams& params, uint8_t first_byte) {
    uint8_t bits = (first_byte >> 4) & 0x03;
    for (uint8_t i = 0; i < 4; ++i) {
        if (params.type_bits[i] == bits) {
            return static_cast<PacketType>(i);
        }
    }
    // Unreachable: type_bits is a permutation of 0..3
    return PacketType::kRetry;
}

} // namespace quic
} // namespace l4quic
