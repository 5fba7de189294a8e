/**
 * @file prefix_reader.cc
 * @brief Byte source driver for QuicMatcher
 */

#include "core/prefix_reader.h"

#include <esp_log.h>

namespace l4quic {

static const char* TAG = "PREFIX_READER";

PeekStatus PeekAndMatch(const ReadCallback& read,
                        const QuicMatcher& matcher,
                        std::vector<uint8_t>* prefix,
                        int* error_out) {
    size_t cap = matcher.GetConfig().max_prefix_size;

    while (true) {
        if (!prefix->empty()) {
            MatchResult result = matcher.Match(prefix->data(), prefix->size(), false);
            if (result == MatchResult::kMatched) {
                return PeekStatus::kMatched;
            }
            if (result == MatchResult::kNotMatched) {
                return PeekStatus::kNotMatched;
            }
        }

        if (prefix->size() >= cap) {
            ESP_LOGD(TAG, "PeekAndMatch: prefix cap %zu reached", cap);
            return PeekStatus::kNotMatched;
        }

        size_t have = prefix->size();
        size_t want = cap - have;
        prefix->resize(cap);
        int n = read(prefix->data() + have, want);
        if (n < 0) {
            prefix->resize(have);
            ESP_LOGD(TAG, "PeekAndMatch: read failed: %d", n);
            if (error_out) {
                *error_out = n;
            }
            return PeekStatus::kReadError;
        }
        if (n == 0) {
            prefix->resize(have);
            MatchResult result = matcher.Match(prefix->data(), prefix->size(), true);
            return result == MatchResult::kMatched ? PeekStatus::kMatched
                                                   : PeekStatus::kNotMatched;
        }

        size_t got = static_cast<size_t>(n);
        if (got > want) {
            ESP_LOGW(TAG, "PeekAndMatch: callback returned %d for a %zu byte buffer", n, want);
            got = want;
        }
        prefix->resize(have + got);
    }
}

} // namespace l4quic
