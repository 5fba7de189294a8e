/**
 * @file prefix_reader.h
 * @brief Drives a QuicMatcher over an incrementally readable byte source
 */

#pragma once

#include "core/quic_matcher.h"
#include <cstdint>
#include <cstddef>
#include <functional>
#include <vector>

namespace l4quic {

/**
 * @brief Callback to read more datagram bytes
 *
 * User must implement this over the connection's byte source. Called
 * synchronously and may block until bytes are available.
 *
 * @param buf Destination buffer
 * @param len Maximum number of bytes to read
 * @return Number of bytes read, 0 at end of input, or a negative error code
 */
using ReadCallback = std::function<int(uint8_t* buf, size_t len)>;

/**
 * @brief Final outcome of PeekAndMatch()
 */
enum class PeekStatus {
    kMatched,
    kNotMatched,
    kReadError,     ///< The byte source failed; see error_out
};

/**
 * @brief Read until the matcher decides or the prefix cap is reached
 *
 * Bytes already in @p prefix are evaluated first. Every byte read is
 * appended to @p prefix so that the caller can replay it to the chosen
 * route. Never reads past GetConfig().max_prefix_size.
 *
 * @param read Byte source
 * @param matcher Matcher to evaluate
 * @param prefix In/out: buffered datagram bytes
 * @param error_out Output: the callback's negative return value on kReadError
 * @return Final status
 */
PeekStatus PeekAndMatch(const ReadCallback& read,
                        const QuicMatcher& matcher,
                        std::vector<uint8_t>* prefix,
                        int* error_out);

} // namespace l4quic
