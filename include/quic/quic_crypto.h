/**
 * @file quic_crypto.h
 * @brief Client Initial key schedule (RFC 9001 Section 5.2, RFC 9369 Section 3.3)
 */

#pragma once

#include "quic/quic_types.h"
#include "quic/quic_version.h"
#include <cstdint>
#include <cstddef>

namespace l4quic {
namespace quic {

/**
 * @brief HKDF-Extract with SHA-256
 *
 * @param out 32-byte PRK
 */
bool HkdfExtract(const uint8_t* salt, size_t salt_len,
                 const uint8_t* ikm, size_t ikm_len,
                 uint8_t* out);

/**
 * @brief TLS 1.3 HKDF-Expand-Label with SHA-256
 *
 * @p label is given without the "tls13 " prefix. Fails if the prefixed
 * label or the context exceeds 255 bytes.
 */
bool HkdfExpandLabel(const uint8_t* secret, size_t secret_len,
                     const uint8_t* label, size_t label_len,
                     const uint8_t* context, size_t context_len,
                     uint8_t* out, size_t out_len);

/**
 * @brief Derive the keys protecting a client's Initial packets
 *
 *     initial = HKDF-Extract(params.initial_salt, dcid)
 *     client  = HKDF-Expand-Label(initial, "client in", "", 32)
 *     key/iv/hp from client with the version's labels
 *
 * @p out is cleared first and only marked valid on success.
 *
 * @param params Version of the packet
 * @param dcid Destination Connection ID of the client's first Initial
 * @param dcid_len 0 to 20
 * @param out Output keys
 */
bool DeriveClientInitialKeys(const VersionParams& params,
                             const uint8_t* dcid, size_t dcid_len,
                             InitialKeys* out);

} // namespace quic
} // namespace l4quic
