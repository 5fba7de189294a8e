/**
 * @file quic_constants.h
 * @brief Wire constants for client Initial inspection (RFC 9000, RFC 9001, RFC 9369)
 */

#pragma once

#include <cstdint>
#include <array>
#include <cstddef>

namespace l4quic {
namespace quic {

//=============================================================================
// Versions and Initial Salts
//=============================================================================

constexpr uint32_t kVersionNegotiation = 0x00000000;
constexpr uint32_t kQuicVersion1 = 0x00000001;
constexpr uint32_t kQuicVersion2 = 0x6b3343cf;
constexpr uint32_t kQuicDraft29 = 0xff00001d;

// RFC 9001 Section 5.2
constexpr std::array<uint8_t, 20> kQuicV1InitialSalt = {
    0x38, 0x76, 0x2c, 0xf7, 0xf5, 0x59, 0x34, 0xb3, 0x4d, 0x17,
    0x9a, 0xe6, 0xa4, 0xc8, 0x0c, 0xad, 0xcc, 0xbb, 0x7f, 0x0a
};

// RFC 9369 Section 3.3.1
constexpr std::array<uint8_t, 20> kQuicV2InitialSalt = {
    0x0d, 0xed, 0xe3, 0xde, 0xf7, 0x00, 0xa6, 0xdb, 0x81, 0x93,
    0x81, 0xbe, 0x6e, 0x26, 0x9d, 0xcb, 0xf9, 0xbd, 0x2e, 0xd9
};

// draft-ietf-quic-tls-29 Section 5.2
constexpr std::array<uint8_t, 20> kQuicDraft29InitialSalt = {
    0xaf, 0xbf, 0xec, 0x28, 0x99, 0x93, 0xd2, 0x4c, 0x9e, 0x97,
    0x86, 0xf1, 0x9c, 0x61, 0x11, 0xe0, 0x43, 0x90, 0xa8, 0x99
};

//=============================================================================
// Long Header
//=============================================================================

constexpr uint8_t kHeaderFormBit = 0x80;
constexpr uint8_t kFixedBit = 0x40;
constexpr uint8_t kLongHeaderReservedBits = 0x0C;  // zero once unmasked

// Logical long header types; the wire bits differ per version
enum class PacketType : uint8_t {
    kInitial = 0,
    k0Rtt = 1,
    kHandshake = 2,
    kRetry = 3
};

//=============================================================================
// Frames allowed in a client Initial (RFC 9000 Section 12.4)
//=============================================================================

namespace frame {
    constexpr uint8_t kPadding = 0x00;
    constexpr uint8_t kPing = 0x01;
    constexpr uint8_t kAck = 0x02;
    constexpr uint8_t kAckEcn = 0x03;
    constexpr uint8_t kCrypto = 0x06;
    constexpr uint8_t kConnectionClose = 0x1c;  // transport variant only
}

//=============================================================================
// Initial Protection
//=============================================================================

constexpr size_t kAeadKeyLen = 16;
constexpr size_t kAeadIvLen = 12;
constexpr size_t kAeadTagLen = 16;
constexpr size_t kHpKeyLen = 16;
constexpr size_t kHpSampleLen = 16;
constexpr size_t kHpSampleOffset = 4;
constexpr size_t kHpMaskLen = 5;
constexpr size_t kTrafficSecretLen = 32;

//=============================================================================
// Datagram Limits
//=============================================================================

constexpr size_t kMinInitialDatagramSize = 1200;  // RFC 9000 Section 14.1
constexpr size_t kDefaultMaxPrefixSize = 1452;
constexpr size_t kMaxUdpPayloadSize = 65527;

} // namespace quic
} // namespace l4quic
