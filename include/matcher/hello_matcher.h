/**
 * @file hello_matcher.h
 * @brief ClientHello Sub-matchers (server name, ALPN)
 *
 * Each sub-matcher checks one ClientHello dimension against a list of
 * patterns. A list matches if any of its patterns does.
 */

#pragma once

#include "tls/tls_handshake.h"
#include <string>
#include <vector>

namespace l4quic {
namespace matcher {

/**
 * @brief One ClientHello criterion
 *
 * Implementations are immutable after construction and safe for
 * concurrent Match() calls.
 */
class HelloMatcher {
public:
    virtual ~HelloMatcher() = default;

    /**
     * @brief Short name used in log lines ("sni", "alpn")
     */
    virtual const char* Name() const = 0;

    /**
     * @brief Check the extracted ClientHello metadata
     */
    virtual bool Match(const tls::ClientHelloInfo& hello) const = 0;
};

/**
 * @brief Server name (SNI) matcher
 *
 * Patterns are compared case-insensitively. "*.example.com" matches exactly
 * one extra leading label; a lone "*" matches any present server name. A
 * ClientHello without server_name never matches.
 */
class ServerNameMatcher : public HelloMatcher {
public:
    explicit ServerNameMatcher(const std::vector<std::string>& patterns);

    const char* Name() const override { return "sni"; }
    bool Match(const tls::ClientHelloInfo& hello) const override;

    /**
     * @brief Match one host name against one normalized pattern
     */
    static bool MatchPattern(const std::string& pattern, const std::string& host);

    /**
     * @brief Lower-case and strip one trailing dot
     */
    static std::string Normalize(const std::string& name);

private:
    std::vector<std::string> patterns_;
};

/**
 * @brief ALPN matcher
 *
 * Protocol ids are compared byte for byte; "*" matches any advertised
 * protocol. A ClientHello without ALPN never matches.
 */
class AlpnMatcher : public HelloMatcher {
public:
    explicit AlpnMatcher(const std::vector<std::string>& protocols);

    const char* Name() const override { return "alpn"; }
    bool Match(const tls::ClientHelloInfo& hello) const override;

private:
    std::vector<std::string> protocols_;
};

} // namespace matcher
} // namespace l4quic
