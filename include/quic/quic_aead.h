/**
 * @file quic_aead.h
 * @brief Initial packet unprotection (RFC 9001 Sections 5.3 and 5.4)
 *
 * Read side only: header protection masks are computed with AES-128-ECB
 * and payloads are opened with AES-128-GCM, both through mbedtls.
 */

#pragma once

#include "quic/quic_types.h"
#include <cstdint>
#include <cstddef>

namespace l4quic {
namespace quic {

/**
 * @brief Compute the 5-byte header protection mask
 *
 * @param hp_key AES-128 key (16 bytes)
 * @param sample 16 ciphertext bytes starting 4 bytes after the packet number offset
 * @param mask_out Output mask (5 bytes)
 * @return false if the cipher fails
 */
bool HeaderProtectionMask(const uint8_t* hp_key, const uint8_t* sample, uint8_t* mask_out);

/**
 * @brief Unmask the first byte and packet number of a long header packet
 *
 * @p packet is modified in place.
 *
 * @param hp_key Header protection key
 * @param packet Packet bytes (exactly one packet)
 * @param packet_len Packet length
 * @param pn_offset Offset of the protected packet number
 * @param pn_len_out Output: packet number length (1-4)
 * @return false if the sample does not fit inside the packet
 */
bool UnmaskLongHeader(const uint8_t* hp_key,
                      uint8_t* packet, size_t packet_len,
                      size_t pn_offset,
                      size_t* pn_len_out);

/// Per-packet nonce: the IV XOR the left-padded packet number
void MakeNonce(const uint8_t* iv, uint64_t packet_number, uint8_t* nonce_out);

/**
 * @brief Open an AES-128-GCM payload
 *
 * A tag mismatch is a plain failure.
 *
 * @param keys Initial keys (key and iv are used)
 * @param packet_number Full packet number
 * @param aad Unprotected header
 * @param aad_len Header length
 * @param ciphertext Ciphertext followed by the 16-byte tag
 * @param ciphertext_len Length including the tag
 * @param plaintext_out At least ciphertext_len - 16 bytes
 * @return Plaintext length, or 0 on failure or an empty payload
 */
size_t OpenPayload(const InitialKeys& keys, uint64_t packet_number,
                   const uint8_t* aad, size_t aad_len,
                   const uint8_t* ciphertext, size_t ciphertext_len,
                   uint8_t* plaintext_out);

} // namespace quic
} // namespace l4quic
