/**
 * @file quic_matcher.cc
 * @brief QUIC Initial Packet Matcher Implementation
 */

#include "core/quic_matcher.h"
#include "quic/quic_packet.h"
#include "quic/quic_crypto.h"
#include "quic/quic_frame.h"
#include "tls/tls_handshake.h"

#include <esp_log.h>

namespace l4quic {

static const char* TAG = "QUIC_MATCHER";

//=============================================================================
// Configuration
//=============================================================================

static bool SetError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
    return false;
}

static bool IsValidServerNamePattern(const std::string& pattern) {
    if (pattern == "*") {
        return true;
    }
    size_t star = pattern.find('*');
    if (star == std::string::npos) {
        return true;
    }
    // Only a whole leading label may be a wildcard
    return star == 0 && pattern.size() > 2 && pattern[1] == '.' &&
           pattern.find('*', 1) == std::string::npos;
}

bool ValidateConfig(const MatcherConfig& config, std::string* error) {
    for (const auto& pattern : config.server_names) {
        if (pattern.empty()) {
            return SetError(error, "empty server name pattern");
        }
        if (pattern.size() > tls::kMaxHostNameLen) {
            return SetError(error, "server name pattern too long: " + pattern.substr(0, 32) + "...");
        }
        if (!IsValidServerNamePattern(pattern)) {
            return SetError(error, "malformed server name wildcard: " + pattern);
        }
    }
    for (const auto& proto : config.alpn) {
        if (proto.empty()) {
            return SetError(error, "empty ALPN protocol");
        }
        if (proto.size() > 255) {
            return SetError(error, "ALPN protocol too long: " + proto.substr(0, 32) + "...");
        }
    }
    if (config.max_prefix_size < kMinPrefixSize ||
        config.max_prefix_size > quic::kMaxUdpPayloadSize) {
        return SetError(error, "max_prefix_size out of range: " +
                               std::to_string(config.max_prefix_size));
    }
    return true;
}

//=============================================================================
// QuicMatcher
//=============================================================================

QuicMatcher::QuicMatcher(const MatcherConfig& config)
    : config_(config) {
    if (!config_.server_names.empty()) {
        matchers_.push_back(std::make_unique<matcher::ServerNameMatcher>(config_.server_names));
    }
    if (!config_.alpn.empty()) {
        matchers_.push_back(std::make_unique<matcher::AlpnMatcher>(config_.alpn));
    }
}

QuicMatcher::~QuicMatcher() = default;

// Only the first packet of the datagram is inspected; anything after it
// must be zero padding.
static bool IsZeroPadding(const uint8_t* data, size_t len) {
    for (size_t i = 0; i < len; i++) {
        if (data[i] != 0) {
            return false;
        }
    }
    return true;
}

MatchResult QuicMatcher::MatchOnce(const uint8_t* data, size_t len,
                                   const char** reason) const {
    quic::LongHeader header;
    quic::ParseResult parsed = quic::ParseLongHeader(data, len, &header);
    if (parsed == quic::ParseResult::kNeedMoreData) {
        *reason = "header incomplete";
        return MatchResult::kNeedMoreData;
    }
    if (parsed == quic::ParseResult::kInvalid) {
        *reason = "not a QUIC Initial";
        return MatchResult::kNotMatched;
    }

    if (!IsZeroPadding(data + header.packet_size, len - header.packet_size)) {
        *reason = "unexpected bytes after packet";
        return MatchResult::kNotMatched;
    }

    // RFC 9000 Section 14.1: a client Initial arrives in a full-size datagram
    if (len < quic::kMinInitialDatagramSize) {
        *reason = "datagram shorter than 1200 bytes";
        return MatchResult::kNeedMoreData;
    }

    quic::InitialKeys keys;
    if (!quic::DeriveClientInitialKeys(*header.params,
                                       header.dcid.Data(), header.dcid.Length(),
                                       &keys)) {
        *reason = "key derivation failed";
        return MatchResult::kNotMatched;
    }

    quic::InitialPacket packet;
    bool opened = quic::DecryptInitialPacket(data, len, header, keys, &packet);
    keys.Clear();
    if (!opened) {
        *reason = "packet protection";
        return MatchResult::kNotMatched;
    }

    // Structural match is enough without criteria
    if (matchers_.empty()) {
        *reason = "structural";
        return MatchResult::kMatched;
    }

    std::vector<uint8_t> crypto_stream;
    if (!quic::ReassembleCryptoStream(packet.payload.data(), packet.payload.size(),
                                      &crypto_stream)) {
        *reason = "CRYPTO frames";
        return MatchResult::kNotMatched;
    }

    tls::ClientHelloInfo hello;
    if (!tls::ParseClientHello(crypto_stream.data(), crypto_stream.size(), &hello)) {
        *reason = "ClientHello";
        return MatchResult::kNotMatched;
    }

    for (const auto& m : matchers_) {
        if (!m->Match(hello)) {
            *reason = m->Name();
            return MatchResult::kNotMatched;
        }
    }

    *reason = "criteria";
    return MatchResult::kMatched;
}

MatchResult QuicMatcher::Match(const uint8_t* data, size_t len, bool eof) const {
    const char* reason = "";
    MatchResult result = MatchOnce(data, len, &reason);

    // No more bytes can arrive: insufficient data is final
    if (result == MatchResult::kNeedMoreData &&
        (eof || len >= config_.max_prefix_size)) {
        result = MatchResult::kNotMatched;
    }

    if (config_.enable_debug) {
        ESP_LOGI(TAG, "Match: %zu bytes%s -> %s (%s)", len, eof ? " (eof)" : "",
                 MatchResultToString(result), reason);
    } else {
        ESP_LOGD(TAG, "Match: %zu bytes -> %s (%s)", len,
                 MatchResultToString(result), reason);
    }
    return result;
}

const char* MatchResultToString(MatchResult result) {
    switch (result) {
        case MatchResult::kMatched: return "matched";
        case MatchResult::kNotMatched: return "not matched";
        case MatchResult::kNeedMoreData: return "need more data";
        default: return "unknown";
    }
}

} // namespace l4quic
