#include "core/quic_matcher.h"
#include "quic_test_packets.h"
#include "test_util.h"

#include <gtest/gtest.h>

namespace l4quic {
namespace {

using test::ToVector;

MatcherConfig Config(const std::vector<std::string>& server_names,
                     const std::vector<std::string>& alpn) {
    MatcherConfig config;
    config.server_names = server_names;
    config.alpn = alpn;
    return config;
}

MatchResult MatchAll(const QuicMatcher& matcher, const std::vector<uint8_t>& data) {
    return matcher.Match(data.data(), data.size(), true);
}

const std::vector<uint8_t> kPacket1 = ToVector(test::kPacket1);
const std::vector<uint8_t> kPacket2 = ToVector(test::kPacket2);
const std::vector<uint8_t> kPacket3 = ToVector(test::kPacket3);

struct MatchCase {
    const char* name;
    MatcherConfig config;
    const std::vector<uint8_t>* data;
    bool should_match;
};

class QuicMatcherCaseTest : public testing::TestWithParam<MatchCase> {};

TEST_P(QuicMatcherCaseTest, Match) {
    const MatchCase& c = GetParam();
    QuicMatcher matcher(c.config);
    EXPECT_EQ(c.should_match ? MatchResult::kMatched : MatchResult::kNotMatched,
              MatchAll(matcher, *c.data));
}

const MatchCase kCapturedCases[] = {
    {"Default1", Config({}, {}), &kPacket1, true},
    {"Default2", Config({}, {}), &kPacket2, true},
    {"Default3", Config({}, {}), &kPacket3, true},

    {"Sni1", Config({"example.com"}, {}), &kPacket1, true},
    {"Sni2", Config({"example.com"}, {}), &kPacket2, true},
    {"Sni3", Config({"example.com"}, {}), &kPacket3, true},

    {"SniCustom1", Config({"example.com"}, {"custom"}), &kPacket1, false},
    {"SniCustom2", Config({"example.com"}, {"custom"}), &kPacket2, true},
    {"SniCustom3", Config({"example.com"}, {"custom"}), &kPacket3, false},

    {"SniH3_1", Config({"example.com"}, {"h3"}), &kPacket1, true},
    {"SniH3_2", Config({"example.com"}, {"h3"}), &kPacket2, false},
    {"SniH3_3", Config({"example.com"}, {"h3"}), &kPacket3, true},

    {"OtherSni", Config({"example.org"}, {}), &kPacket1, false},
    {"WildcardSni", Config({"*"}, {"*"}), &kPacket3, true},
    {"SubdomainWildcard", Config({"*.example.com"}, {}), &kPacket1, false},
    {"Draft29Alpn", Config({}, {"h3-29"}), &kPacket3, true},

    // OR inside each list, AND across lists
    {"OrAnd1", Config({"example.org", "example.com"}, {"h2", "h3"}), &kPacket1, true},
    {"OrAnd2", Config({"example.org", "example.com"}, {"h2", "h3"}), &kPacket2, false},
    {"OrAnd3", Config({"example.org"}, {"h2", "h3"}), &kPacket1, false},
};

INSTANTIATE_TEST_SUITE_P(Captured, QuicMatcherCaseTest, testing::ValuesIn(kCapturedCases),
                         [](const testing::TestParamInfo<MatchCase>& info) {
                             return std::string(info.param.name);
                         });

TEST(QuicMatcherTest, ConcatenatedPacketsDoNotMatch) {
    QuicMatcher matcher(MatcherConfig{});
    std::vector<uint8_t> data = kPacket1;
    data.insert(data.end(), kPacket2.begin(), kPacket2.end());
    EXPECT_EQ(MatchResult::kNotMatched, MatchAll(matcher, data));
}

TEST(QuicMatcherTest, FirstByteMutationsDoNotMatch) {
    QuicMatcher matcher(MatcherConfig{});
    const uint8_t first_bytes[] = {0x40, 0x80, 0xc0, 0x00};
    for (uint8_t b : first_bytes) {
        std::vector<uint8_t> data = kPacket1;
        data[0] = b;
        EXPECT_EQ(MatchResult::kNotMatched, MatchAll(matcher, data))
            << "first byte 0x" << std::hex << static_cast<int>(b);
    }
}

TEST(QuicMatcherTest, TruncatedPacket) {
    QuicMatcher matcher(MatcherConfig{});
    std::vector<uint8_t> data(kPacket1.begin(), kPacket1.end() - 1);
    EXPECT_EQ(MatchResult::kNotMatched, matcher.Match(data.data(), data.size(), true));
    EXPECT_EQ(MatchResult::kNeedMoreData, matcher.Match(data.data(), data.size(), false));
    EXPECT_EQ(MatchResult::kNeedMoreData, matcher.Match(data.data(), 3, false));
    EXPECT_EQ(MatchResult::kNotMatched, matcher.Match(nullptr, 0, true));
}

TEST(QuicMatcherTest, PrefixCapMakesNeedMoreDataFinal) {
    MatcherConfig config;
    config.max_prefix_size = kMinPrefixSize;
    QuicMatcher matcher(config);
    EXPECT_EQ(MatchResult::kNotMatched, matcher.Match(kPacket1.data(), 1200, false));
    EXPECT_EQ(MatchResult::kNeedMoreData, matcher.Match(kPacket1.data(), 1199, false));
}

TEST(QuicMatcherTest, CorruptedPayloadDoesNotMatch) {
    QuicMatcher matcher(MatcherConfig{});
    std::vector<uint8_t> data = kPacket1;
    data[600] ^= 0x55;
    EXPECT_EQ(MatchResult::kNotMatched, MatchAll(matcher, data));
}

TEST(QuicMatcherTest, IsIdempotent) {
    QuicMatcher matcher(Config({"example.com"}, {"h3"}));
    for (int i = 0; i < 5; i++) {
        EXPECT_EQ(MatchResult::kMatched, MatchAll(matcher, kPacket1));
        EXPECT_EQ(MatchResult::kNotMatched, MatchAll(matcher, kPacket2));
    }
}

TEST(QuicMatcherTest, TrailingZeroPaddingMatches) {
    QuicMatcher matcher(Config({"example.com"}, {}));
    std::vector<uint8_t> data = kPacket1;
    data.resize(data.size() + 40, 0x00);
    EXPECT_EQ(MatchResult::kMatched, MatchAll(matcher, data));

    data.back() = 0x01;
    EXPECT_EQ(MatchResult::kNotMatched, MatchAll(matcher, data));
}

TEST(QuicMatcherTest, SecondPacketInDatagramDoesNotMatch) {
    QuicMatcher matcher(MatcherConfig{});

    // The same Initial twice
    std::vector<uint8_t> data = kPacket1;
    data.insert(data.end(), kPacket1.begin(), kPacket1.end());
    EXPECT_EQ(MatchResult::kNotMatched, MatchAll(matcher, data));
    EXPECT_EQ(MatchResult::kNotMatched, matcher.Match(data.data(), data.size(), false));

    // A Handshake packet header carrying the same DCID
    data = kPacket1;
    data.insert(data.end(), kPacket1.begin(), kPacket1.begin() + 14);
    data[kPacket1.size()] = 0xe0;
    EXPECT_EQ(MatchResult::kNotMatched, MatchAll(matcher, data));

    // Cut inside the trailing DCID: already decided without eof
    std::vector<uint8_t> cut(data.begin(), data.begin() + kPacket1.size() + 8);
    EXPECT_EQ(MatchResult::kNotMatched, matcher.Match(cut.data(), cut.size(), false));
}

TEST(QuicMatcherTest, ShortDatagramDoesNotMatch) {
    QuicMatcher matcher(Config({"example.com"}, {"h3"}));
    test::ClientHelloSpec hello;
    hello.server_name = "example.com";
    hello.alpn = {"h3"};
    std::vector<uint8_t> data = test::SealInitial(
        quic::kQuicVersion1, test::HexToBytes("8394c8f03e515708"),
        test::BuildCryptoPayload(test::BuildClientHello(hello)), 0, 300);
    ASSERT_EQ(300u, data.size());

    // Authentic packet, but the datagram is below 1200 bytes
    EXPECT_EQ(MatchResult::kNotMatched, MatchAll(matcher, data));
    EXPECT_EQ(MatchResult::kNeedMoreData, matcher.Match(data.data(), data.size(), false));

    // Zero padding after the packet brings the datagram to full size
    data.resize(quic::kMinInitialDatagramSize, 0x00);
    EXPECT_EQ(MatchResult::kMatched, MatchAll(matcher, data));
    data.resize(quic::kMinInitialDatagramSize - 1);
    EXPECT_EQ(MatchResult::kNotMatched, MatchAll(matcher, data));
}

TEST(QuicMatcherTest, SealedPacketsOfOtherVersionsMatch) {
    QuicMatcher matcher(Config({"*.example.net"}, {"h3"}));
    const uint32_t versions[] = {quic::kQuicVersion2, quic::kQuicDraft29};
    for (uint32_t version : versions) {
        std::vector<uint8_t> data = test::SealClientHello(version, "www.example.net", {"h3"});
        ASSERT_FALSE(data.empty());
        EXPECT_EQ(MatchResult::kMatched, MatchAll(matcher, data)) << std::hex << version;

        data = test::SealClientHello(version, "www.example.org", {"h3"});
        EXPECT_EQ(MatchResult::kNotMatched, MatchAll(matcher, data)) << std::hex << version;
    }
}

TEST(QuicMatcherTest, CryptoFramesInAnyOrderMatch) {
    QuicMatcher matcher(Config({"example.com"}, {"h3"}));
    std::vector<uint8_t> data =
        test::SealClientHello(quic::kQuicVersion1, "example.com", {"h3"}, 40);
    EXPECT_EQ(MatchResult::kMatched, MatchAll(matcher, data));
}

TEST(QuicMatcherTest, ClientHelloSpanningPacketsDoesNotMatch) {
    test::ClientHelloSpec params;
    params.server_name = "example.com";
    std::vector<uint8_t> hello = test::BuildClientHello(params);
    hello.resize(hello.size() / 2);

    std::vector<uint8_t> data = test::SealInitial(
        quic::kQuicVersion1, test::HexToBytes("8394c8f03e515708"),
        test::BuildCryptoPayload(hello));

    EXPECT_EQ(MatchResult::kMatched, MatchAll(QuicMatcher(MatcherConfig{}), data));
    EXPECT_EQ(MatchResult::kNotMatched, MatchAll(QuicMatcher(Config({"example.com"}, {})), data));
}

TEST(QuicMatcherTest, DebugLoggingDoesNotChangeResult) {
    MatcherConfig config = Config({"example.com"}, {"custom"});
    config.enable_debug = true;
    QuicMatcher matcher(config);
    EXPECT_EQ(MatchResult::kMatched, MatchAll(matcher, kPacket2));
    EXPECT_EQ(MatchResult::kNotMatched, MatchAll(matcher, kPacket1));
}

TEST(ValidateConfigTest, AcceptsDefaultsAndWildcards) {
    std::string error;
    EXPECT_TRUE(ValidateConfig(MatcherConfig{}, &error));
    EXPECT_TRUE(ValidateConfig(Config({"example.com", "*.example.com", "*"}, {"h3", "*"}),
                               &error));
}

TEST(ValidateConfigTest, RejectsBadPatterns) {
    std::string error;
    EXPECT_FALSE(ValidateConfig(Config({""}, {}), &error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(ValidateConfig(Config({std::string(256, 'a')}, {}), &error));
    EXPECT_FALSE(ValidateConfig(Config({"www.*.com"}, {}), &error));
    EXPECT_FALSE(ValidateConfig(Config({"*example.com"}, {}), &error));
    EXPECT_FALSE(ValidateConfig(Config({"*.*.com"}, {}), &error));
    EXPECT_FALSE(ValidateConfig(Config({"*."}, {}), &error));
    EXPECT_FALSE(ValidateConfig(Config({}, {""}), &error));
    EXPECT_FALSE(ValidateConfig(Config({}, {std::string(256, 'p')}), nullptr));
}

TEST(ValidateConfigTest, RejectsPrefixSizeOutOfRange) {
    MatcherConfig config;
    config.max_prefix_size = kMinPrefixSize - 1;
    EXPECT_FALSE(ValidateConfig(config, nullptr));
    config.max_prefix_size = quic::kMaxUdpPayloadSize + 1;
    EXPECT_FALSE(ValidateConfig(config, nullptr));
    config.max_prefix_size = quic::kMaxUdpPayloadSize;
    EXPECT_TRUE(ValidateConfig(config, nullptr));
}

}  // namespace
}  // namespace l4quic
