/**
 * @file quic_version.h
 * @brief Per-version Initial protection parameters
 *
 * Each supported QUIC version fixes its own Initial salt, HKDF labels and
 * long header type encoding. Versions absent from this table are not
 * inspected.
 */

#pragma once

#include "quic/quic_constants.h"
#include <cstdint>
#include <cstddef>

namespace l4quic {
namespace quic {

/**
 * @brief Initial protection parameters for one QUIC version
 */
struct VersionParams {
    uint32_t version;
    const char* name;

    const uint8_t* initial_salt;
    size_t initial_salt_len;

    // HKDF-Expand-Label labels (without the "tls13 " prefix)
    const char* key_label;
    const char* iv_label;
    const char* hp_label;

    // 2-bit wire value of each long header type, indexed by PacketType
    uint8_t type_bits[4];
};

/**
 * @brief Look up the parameters for a version
 *
 * @param version Version field from the long header
 * @return Parameters, or nullptr if the version is not supported
 */
const VersionParams* FindVersionParams(uint32_t version);

/**
 * @brief Decode the logical packet type from a long header first byte
 *
 * @param params Version parameters
 * @param first_byte First byte of the packet
 * @return Logical packet type
 */
PacketType DecodeLongHeaderType(const VersionParams& params, uint8_t first_byte);

} // namespace quic
} // namespace l4quic
