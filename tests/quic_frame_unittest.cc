#include "quic/quic_frame.h"
#include "initial_sealer.h"

#include <gtest/gtest.h>

namespace l4quic {
namespace quic {
namespace {

using test::CryptoFrame;

std::vector<uint8_t> Concat(std::initializer_list<std::vector<uint8_t>> parts) {
    std::vector<uint8_t> out;
    for (const auto& part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

const std::vector<uint8_t> kHello = {0x01, 0x00, 0x00, 0x04, 0xaa, 0xbb, 0xcc, 0xdd};

TEST(QuicFrameTest, ClassifiesInitialFrameTypes) {
    EXPECT_EQ(FrameKind::kPadding, ClassifyFrame(0x00));
    EXPECT_EQ(FrameKind::kPing, ClassifyFrame(0x01));
    EXPECT_EQ(FrameKind::kAck, ClassifyFrame(0x02));
    EXPECT_EQ(FrameKind::kAckEcn, ClassifyFrame(0x03));
    EXPECT_EQ(FrameKind::kCrypto, ClassifyFrame(0x06));
    EXPECT_EQ(FrameKind::kConnectionClose, ClassifyFrame(0x1c));
    EXPECT_EQ(FrameKind::kUnknown, ClassifyFrame(0x1d));   // application close
    EXPECT_EQ(FrameKind::kUnknown, ClassifyFrame(0x08));  // STREAM
    EXPECT_EQ(FrameKind::kUnknown, ClassifyFrame(0x1e));  // HANDSHAKE_DONE
    EXPECT_EQ(FrameKind::kUnknown, ClassifyFrame(0x4000));
}

TEST(QuicFrameTest, ReassemblesSingleFrameWithPadding) {
    std::vector<uint8_t> payload = Concat({CryptoFrame(0, kHello), std::vector<uint8_t>(100, 0)});
    std::vector<uint8_t> stream;
    ASSERT_TRUE(ReassembleCryptoStream(payload.data(), payload.size(), &stream));
    EXPECT_EQ(kHello, stream);
}

TEST(QuicFrameTest, ReassemblesOutOfOrderFrames) {
    std::vector<uint8_t> head(kHello.begin(), kHello.begin() + 3);
    std::vector<uint8_t> middle(kHello.begin() + 3, kHello.begin() + 6);
    std::vector<uint8_t> tail(kHello.begin() + 6, kHello.end());
    std::vector<uint8_t> payload = Concat({
        {frame::kPing},
        CryptoFrame(6, tail),
        {frame::kPadding, frame::kPadding},
        CryptoFrame(0, head),
        {frame::kPing},
        CryptoFrame(3, middle),
    });
    std::vector<uint8_t> stream;
    ASSERT_TRUE(ReassembleCryptoStream(payload.data(), payload.size(), &stream));
    EXPECT_EQ(kHello, stream);
}

TEST(QuicFrameTest, ParsesCryptoSegment) {
    std::vector<uint8_t> frame = CryptoFrame(300, kHello);
    BufferReader reader(frame.data() + 1, frame.size() - 1);
    CryptoSegment segment;
    ASSERT_TRUE(ParseCryptoFrame(&reader, &segment));
    EXPECT_EQ(300u, segment.offset);
    EXPECT_EQ(kHello, std::vector<uint8_t>(segment.data, segment.data + segment.length));
    EXPECT_EQ(0u, reader.Remaining());

    // offset + length past 2^62 - 1
    std::vector<uint8_t> overflow = {0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x01, 0xaa};
    BufferReader bad(overflow.data(), overflow.size());
    EXPECT_FALSE(ParseCryptoFrame(&bad, &segment));
}

TEST(QuicFrameTest, SkipsAckFrames) {
    // ACK: largest 5, delay 0, one extra range (gap 1, len 0), first range 1
    std::vector<uint8_t> ack = {frame::kAck, 0x05, 0x00, 0x01, 0x01, 0x01, 0x00};
    // ACK_ECN: largest 0, delay 0, no ranges, first range 0, ECN counts
    std::vector<uint8_t> ack_ecn = {frame::kAckEcn, 0x00, 0x00, 0x00, 0x00, 0x01, 0x02, 0x03};
    std::vector<uint8_t> payload = Concat({ack, ack_ecn, CryptoFrame(0, kHello)});
    std::vector<uint8_t> stream;
    ASSERT_TRUE(ReassembleCryptoStream(payload.data(), payload.size(), &stream));
    EXPECT_EQ(kHello, stream);
}

TEST(QuicFrameTest, ConnectionCloseEndsWalk) {
    std::vector<uint8_t> close = {frame::kConnectionClose, 0x0a, 0x06, 0x02, 'h', 'i'};
    std::vector<uint8_t> payload = Concat({CryptoFrame(0, kHello), close, {0x08, 0xff}});
    std::vector<uint8_t> stream;
    ASSERT_TRUE(ReassembleCryptoStream(payload.data(), payload.size(), &stream));
    EXPECT_EQ(kHello, stream);

    BufferReader reader(close.data() + 1, close.size() - 1);
    ASSERT_TRUE(SkipConnectionCloseFrame(&reader));
    EXPECT_EQ(0u, reader.Remaining());

    // Reason phrase longer than the frame
    std::vector<uint8_t> truncated = {0x0a, 0x06, 0x05, 'h', 'i'};
    BufferReader short_reader(truncated.data(), truncated.size());
    EXPECT_FALSE(SkipConnectionCloseFrame(&short_reader));
}

TEST(QuicFrameTest, ApplicationCloseFails) {
    // 0x1d carries no frame type field and is not allowed in Initial packets
    std::vector<uint8_t> close = {0x1d, 0x0a, 0x02, 'h', 'i'};
    std::vector<uint8_t> payload = Concat({CryptoFrame(0, kHello), close});
    std::vector<uint8_t> stream;
    EXPECT_FALSE(ReassembleCryptoStream(payload.data(), payload.size(), &stream));
    EXPECT_TRUE(stream.empty());

    payload = Concat({close, CryptoFrame(0, kHello)});
    EXPECT_FALSE(ReassembleCryptoStream(payload.data(), payload.size(), &stream));
}

TEST(QuicFrameTest, GapFails) {
    std::vector<uint8_t> head(kHello.begin(), kHello.begin() + 3);
    std::vector<uint8_t> tail(kHello.begin() + 4, kHello.end());
    std::vector<uint8_t> payload = Concat({CryptoFrame(0, head), CryptoFrame(4, tail)});
    std::vector<uint8_t> stream;
    EXPECT_FALSE(ReassembleCryptoStream(payload.data(), payload.size(), &stream));
    EXPECT_TRUE(stream.empty());
}

TEST(QuicFrameTest, StreamNotStartingAtZeroFails) {
    std::vector<uint8_t> payload = CryptoFrame(10, kHello);
    std::vector<uint8_t> stream;
    EXPECT_FALSE(ReassembleCryptoStream(payload.data(), payload.size(), &stream));
}

TEST(QuicFrameTest, OverlapFails) {
    std::vector<uint8_t> head(kHello.begin(), kHello.begin() + 5);
    std::vector<uint8_t> tail(kHello.begin() + 3, kHello.end());
    std::vector<uint8_t> payload = Concat({CryptoFrame(0, head), CryptoFrame(3, tail)});
    std::vector<uint8_t> stream;
    EXPECT_FALSE(ReassembleCryptoStream(payload.data(), payload.size(), &stream));

    payload = Concat({CryptoFrame(0, kHello), CryptoFrame(0, kHello)});
    EXPECT_FALSE(ReassembleCryptoStream(payload.data(), payload.size(), &stream));
}

TEST(QuicFrameTest, UnknownFrameFails) {
    std::vector<uint8_t> payload = Concat({CryptoFrame(0, kHello), {0x08, 0x00, 0x00}});
    std::vector<uint8_t> stream;
    EXPECT_FALSE(ReassembleCryptoStream(payload.data(), payload.size(), &stream));
}

TEST(QuicFrameTest, TruncatedFramesFail) {
    std::vector<uint8_t> crypto = CryptoFrame(0, kHello);
    crypto.pop_back();
    std::vector<uint8_t> stream;
    EXPECT_FALSE(ReassembleCryptoStream(crypto.data(), crypto.size(), &stream));

    std::vector<uint8_t> ack = {frame::kAck, 0x05, 0x00};
    EXPECT_FALSE(ReassembleCryptoStream(ack.data(), ack.size(), &stream));

    // ACK claiming more ranges than bytes left
    std::vector<uint8_t> ranges = {frame::kAck, 0x05, 0x00, 0x3f, 0x00, 0x00, 0x00};
    EXPECT_FALSE(ReassembleCryptoStream(ranges.data(), ranges.size(), &stream));

    // Two-byte frame type varint cut short
    std::vector<uint8_t> type = {0x40};
    EXPECT_FALSE(ReassembleCryptoStream(type.data(), type.size(), &stream));
}

TEST(QuicFrameTest, NoCryptoDataFails) {
    std::vector<uint8_t> payload = {frame::kPing, 0x00, 0x00, 0x00};
    std::vector<uint8_t> stream;
    EXPECT_FALSE(ReassembleCryptoStream(payload.data(), payload.size(), &stream));
    EXPECT_FALSE(ReassembleCryptoStream(nullptr, 0, &stream));
}

}  // namespace
}  // namespace quic
}  // namespace l4quic
