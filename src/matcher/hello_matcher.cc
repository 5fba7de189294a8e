/**
 * @file hello_matcher.cc
 * @brief ClientHello Sub-matchers Implementation
 */

#include "matcher/hello_matcher.h"

namespace l4quic {
namespace matcher {

//=============================================================================
// ServerNameMatcher
//=============================================================================

ServerNameMatcher::ServerNameMatcher(const std::vector<std::string>& patterns) {
    patterns_.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        patterns_.push_back(Normalize(pattern));
    }
}

std::string ServerNameMatcher::Normalize(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        out.push_back((c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c);
    }
    if (out.size() > 1 && out.back() == '.') {
        out.pop_back();
    }
    return out;
}

bool ServerNameMatcher::MatchPattern(const std::string& pattern, const std::string& host) {
    if (host.empty()) {
        return false;
    }
    if (pattern == "*") {
        return true;
    }
    if (pattern.size() > 2 && pattern[0] == '*' && pattern[1] == '.') {
        // "*." + suffix: host = label + "." + suffix, label without dots
        size_t suffix_len = pattern.size() - 1;  // includes the leading '.'
        if (host.size() <= suffix_len) {
            return false;
        }
        size_t label_len = host.size() - suffix_len;
        if (host.compare(label_len, suffix_len, pattern, 1, suffix_len) != 0) {
            return false;
        }
        return host.find('.') == label_len;
    }
    return pattern == host;
}

bool ServerNameMatcher::Match(const tls::ClientHelloInfo& hello) const {
    if (!hello.has_server_name) {
        return false;
    }
    std::string host = Normalize(hello.server_name);
    for (const auto& pattern : patterns_) {
        if (MatchPattern(pattern, host)) {
            return true;
        }
    }
    return false;
}

//=============================================================================
// AlpnMatcher
//=============================================================================

AlpnMatcher::AlpnMatcher(const std::vector<std::string>& protocols)
    : protocols_(protocols) {}

bool AlpnMatcher::Match(const tls::ClientHelloInfo& hello) const {
    for (const auto& offered : hello.alpn) {
        for (const auto& wanted : protocols_) {
            if (wanted == "*" || wanted == offered) {
                return true;
            }
        }
    }
    return false;
}

} // namespace matcher
} // namespace l4quic
