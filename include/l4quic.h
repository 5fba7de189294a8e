/**
 * @file l4quic.h
 * @brief QUIC Initial Matcher - Main Public API
 *
 * This library recognizes the first datagram of a QUIC connection so that
 * a layer-4 multiplexer can route a UDP flow by server name (SNI) and
 * application protocol (ALPN) without terminating QUIC.
 *
 * Features:
 * - QUIC v1, QUIC v2 (RFC 9369) and draft-29 Initial packets
 * - Initial key derivation and packet protection removal (using mbedtls)
 * - CRYPTO frame reassembly within one packet
 * - ClientHello SNI / ALPN extraction with wildcard server names
 *
 * Design:
 * - Stateless matcher, safe for concurrent use after construction
 * - No threads, timers or sockets owned by the library
 * - User provides ReadCallback for incoming datagram bytes
 *
 * Usage:
 * @code
 * #include "l4quic.h"
 *
 * l4quic::MatcherConfig config;
 * config.server_names = {"example.com", "*.example.net"};
 * config.alpn = {"h3"};
 *
 * std::string error;
 * if (!l4quic::ValidateConfig(config, &error)) {
 *     printf("bad config: %s\n", error.c_str());
 *     return;
 * }
 * l4quic::QuicMatcher matcher(config);
 *
 * std::vector<uint8_t> prefix;
 * int read_error = 0;
 * auto status = l4quic::PeekAndMatch(
 *     [&conn](uint8_t* buf, size_t len) { return conn.Read(buf, len); },
 *     matcher, &prefix, &read_error);
 * if (status == l4quic::PeekStatus::kMatched) {
 *     route->Replay(prefix);
 * }
 * @endcode
 *
 * @note A ClientHello spanning more than one Initial packet is not matched,
 *       nor is a datagram shorter than 1200 bytes or one carrying non-zero
 *       bytes after the Initial packet
 */

#pragma once

#include "core/quic_matcher.h"
#include "core/prefix_reader.h"

namespace l4quic {

// Version information
constexpr const char* kVersionString = "1.0.0";

} // namespace l4quic
