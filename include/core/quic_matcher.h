/**
 * @file quic_matcher.h
 * @brief QUIC Initial Packet Matcher
 *
 * Recognizes a client QUIC Initial packet at the start of a UDP datagram,
 * removes its publicly derivable protection, extracts SNI and ALPN from the
 * ClientHello and checks them against the configured patterns.
 */

#pragma once

#include "quic/quic_constants.h"
#include "matcher/hello_matcher.h"
#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace l4quic {

//=============================================================================
// Configuration
//=============================================================================

/**
 * @brief Matcher configuration
 *
 * An empty list places no constraint on its dimension. A default
 * configuration matches any structurally valid Initial packet.
 */
struct MatcherConfig {
    std::vector<std::string> server_names;  ///< SNI patterns ("example.com", "*.example.com", "*")
    std::vector<std::string> alpn;          ///< ALPN protocol ids ("h3", "*")

    size_t max_prefix_size = quic::kDefaultMaxPrefixSize;  ///< Cap on buffered datagram bytes

    // Debug
    bool enable_debug = false;              ///< Log one line per match attempt
};

/// A cap below one full-size Initial datagram could never match
constexpr size_t kMinPrefixSize = quic::kMinInitialDatagramSize;

/**
 * @brief Check a configuration before constructing a QuicMatcher
 *
 * @param config Configuration to check
 * @param error Output: description of the first problem (may be null)
 * @return true if the configuration is usable
 */
bool ValidateConfig(const MatcherConfig& config, std::string* error);

//=============================================================================
// Matcher
//=============================================================================

/**
 * @brief Outcome of one match attempt
 */
enum class MatchResult {
    kMatched,
    kNotMatched,
    kNeedMoreData,   ///< Only returned while eof is false and the cap is not reached
};

/**
 * @brief Stateless QUIC Initial matcher
 *
 * Immutable after construction; Match() may be called concurrently from
 * several threads.
 */
class QuicMatcher {
public:
    explicit QuicMatcher(const MatcherConfig& config);
    ~QuicMatcher();

    QuicMatcher(const QuicMatcher&) = delete;
    QuicMatcher& operator=(const QuicMatcher&) = delete;

    /**
     * @brief Evaluate a datagram prefix
     *
     * @param data Bytes received so far, starting at the datagram start
     * @param len Number of bytes
     * @param eof True if no more bytes will arrive
     * @return Match outcome; never kNeedMoreData when eof is true
     */
    MatchResult Match(const uint8_t* data, size_t len, bool eof) const;

    const MatcherConfig& GetConfig() const { return config_; }

private:
    MatchResult MatchOnce(const uint8_t* data, size_t len, const char** reason) const;

    MatcherConfig config_;
    std::vector<std::unique_ptr<matcher::HelloMatcher>> matchers_;
};

/**
 * @brief Human-readable MatchResult
 */
const char* MatchResultToString(MatchResult result);

} // namespace l4quic
