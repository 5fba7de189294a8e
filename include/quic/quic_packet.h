/**
 * @file quic_packet.h
 * @brief Client Initial long header parsing and unprotection (RFC 9000 Section 17.2)
 */

#pragma once

#include "quic/quic_types.h"
#include "quic/quic_constants.h"
#include "quic/quic_version.h"
#include <cstdint>
#include <cstddef>
#include <vector>

namespace l4quic {
namespace quic {

//=============================================================================
// Packet Header Structures
//=============================================================================

/**
 * @brief Outcome of parsing a (possibly incomplete) packet prefix
 */
enum class ParseResult {
    kOk,            ///< Packet fully present and structurally valid
    kNeedMoreData,  ///< Valid so far, but more bytes are required
    kInvalid,       ///< Definitely not a packet this library inspects
};

/**
 * @brief QUIC Long Header of a client Initial packet
 *
 * Offsets are relative to the first byte of the packet. Fields after the
 * SCID are only meaningful once ParseLongHeader() returned kOk.
 */
struct LongHeader {
    uint8_t header_byte = 0;           ///< Still header-protected
    uint32_t version = 0;
    const VersionParams* params = nullptr;
    PacketType type = PacketType::kInitial;
    ConnectionId dcid;
    ConnectionId scid;
    std::vector<uint8_t> token;

    uint64_t length = 0;               ///< Length field: packet number + payload
    size_t pn_offset = 0;              ///< Start of the protected packet number
    size_t packet_size = 0;            ///< pn_offset + length

    bool IsInitial() const { return type == PacketType::kInitial; }
};

/**
 * @brief Result of removing packet protection
 */
struct InitialPacket {
    uint64_t packet_number = 0;
    size_t pn_length = 0;
    std::vector<uint8_t> payload;      ///< Decrypted frames
};

//=============================================================================
// Packet Parsing
//=============================================================================

/**
 * @brief Parse the long header of a client Initial packet
 *
 * Rejects short headers, a cleared fixed bit, Version Negotiation
 * (version 0), versions without Initial parameters, non-Initial packet
 * types and connection IDs longer than 20 bytes. Returns kNeedMoreData
 * while any header field or the payload announced by the Length field
 * extends past @p len.
 *
 * @param data Datagram prefix
 * @param len Prefix length
 * @param out Output header
 * @return Parse outcome
 */
ParseResult ParseLongHeader(const uint8_t* data, size_t len, LongHeader* out);

/**
 * @brief Remove header and packet protection from an Initial packet
 *
 * Works on a private copy; @p data is not modified. The full packet number
 * is taken to be the truncated one (first packet of a connection).
 *
 * @param data Datagram prefix starting at the packet
 * @param len Prefix length (at least header.packet_size)
 * @param header Header returned by ParseLongHeader()
 * @param keys Client Initial keys
 * @param out Output packet number and plaintext frames
 * @return true on success; false on sample underflow, tag mismatch or
 *         non-zero reserved bits
 */
bool DecryptInitialPacket(const uint8_t* data, size_t len,
                          const LongHeader& header,
                          const InitialKeys& keys,
                          InitialPacket* out);

//=============================================================================
// Utility Functions
//=============================================================================

/**
 * @brief Check if packet is a long header packet
 */
inline bool IsLongHeader(uint8_t first_byte) {
    return (first_byte & kHeaderFormBit) != 0;
}

/**
 * @brief Check the fixed bit (RFC 9000 Section 17.2)
 */
inline bool HasFixedBit(uint8_t first_byte) {
    return (first_byte & kFixedBit) != 0;
}

} // namespace quic
} // namespace l4quic
