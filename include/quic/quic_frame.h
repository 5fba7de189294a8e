/**
 * @file quic_frame.h
 * @brief Frame walk of a decrypted client Initial and CRYPTO reassembly
 */

#pragma once

#include "quic/quic_types.h"
#include "quic/quic_constants.h"
#include <cstdint>
#include <cstddef>
#include <vector>

namespace l4quic {
namespace quic {

/**
 * @brief The frame types a client may put in an Initial packet
 *
 * kUnknown covers everything else, including the application
 * CONNECTION_CLOSE (0x1d), and stops the walk: without knowing a type its
 * length is unknown.
 */
enum class FrameKind {
    kPadding,
    kPing,
    kAck,
    kAckEcn,
    kCrypto,
    kConnectionClose,
    kUnknown,
};

FrameKind ClassifyFrame(uint64_t frame_type);

/**
 * @brief One CRYPTO frame; @c data points into the decrypted payload
 */
struct CryptoSegment {
    uint64_t offset = 0;
    const uint8_t* data = nullptr;
    size_t length = 0;
};

/**
 * @brief Read the body of a CRYPTO frame (type already consumed)
 *
 * Fails if the data runs past the payload or offset + length exceeds 2^62 - 1.
 */
bool ParseCryptoFrame(BufferReader* reader, CryptoSegment* out);

/**
 * @brief Step over the body of an ACK or ACK_ECN frame
 */
bool SkipAckFrame(BufferReader* reader, bool ecn);

/**
 * @brief Step over the body of a transport CONNECTION_CLOSE frame
 */
bool SkipConnectionCloseFrame(BufferReader* reader);

/**
 * @brief Rebuild the CRYPTO stream of one decrypted Initial payload
 *
 * Segments may arrive in any order; once the payload is walked they are
 * joined from offset 0 and must touch end to start. A gap, an overlap, a
 * truncated frame or an unknown frame type fails the whole payload, as
 * does a payload without CRYPTO data. CONNECTION_CLOSE ends the walk.
 *
 * @param frames Decrypted payload
 * @param len Payload length
 * @param out Output: stream bytes from offset 0 (empty on failure)
 */
bool ReassembleCryptoStream(const uint8_t* frames, size_t len,
                            std::vector<uint8_t>* out);

} // namespace quic
} // namespace l4quic
