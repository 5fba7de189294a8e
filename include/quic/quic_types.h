/**
 * @file quic_types.h
 * @brief Connection IDs, Initial keys and the bounds-checked byte reader
 */

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstddef>

namespace l4quic {
namespace quic {

/// Longest connection ID a v1/v2 long header may carry (RFC 9000 Section 17.2)
constexpr size_t kMaxConnectionIdLen = 20;

/**
 * @brief Client Initial protection keys
 *
 * Everything here is derivable from the packet itself, so these are not
 * secrets in the usual sense; they are still wiped after each attempt.
 */
struct InitialKeys {
    std::array<uint8_t, 16> key{};   ///< AES-128-GCM key
    std::array<uint8_t, 12> iv{};    ///< Nonce base
    std::array<uint8_t, 16> hp{};    ///< AES-128 header protection key
    bool valid = false;

    void Clear() {
        key.fill(0);
        iv.fill(0);
        hp.fill(0);
        valid = false;
    }
};

/**
 * @brief Connection ID copied out of a long header
 */
class ConnectionId {
public:
    ConnectionId() = default;
    ConnectionId(const uint8_t* bytes, size_t len) { Assign(bytes, len); }

    /// Copies at most kMaxConnectionIdLen bytes
    void Assign(const uint8_t* bytes, size_t len) {
        len_ = static_cast<uint8_t>(std::min(len, kMaxConnectionIdLen));
        std::copy(bytes, bytes + len_, bytes_.begin());
    }

    const uint8_t* Data() const { return bytes_.data(); }
    size_t Length() const { return len_; }
    bool Empty() const { return len_ == 0; }

    bool operator==(const ConnectionId& other) const {
        return len_ == other.len_ &&
               std::equal(bytes_.begin(), bytes_.begin() + len_, other.bytes_.begin());
    }

private:
    std::array<uint8_t, kMaxConnectionIdLen> bytes_{};
    uint8_t len_ = 0;
};

/**
 * @brief Big-endian reader over borrowed bytes
 *
 * A read that does not fit returns false and leaves the position where it
 * was. All attacker-controlled lengths in the library go through here.
 */
class BufferReader {
public:
    BufferReader(const uint8_t* data, size_t len)
        : data_(data), len_(len), pos_(0) {}

    bool ReadUint8(uint8_t* out) {
        if (Remaining() < 1) return false;
        *out = data_[pos_++];
        return true;
    }

    bool ReadUint16(uint16_t* out) {
        uint64_t value;
        if (!ReadBigEndian(2, &value)) return false;
        *out = static_cast<uint16_t>(value);
        return true;
    }

    bool ReadUint32(uint32_t* out) {
        uint64_t value;
        if (!ReadBigEndian(4, &value)) return false;
        *out = static_cast<uint32_t>(value);
        return true;
    }

    bool ReadVarint(uint64_t* out);  // quic_types.cc

    bool Skip(uint64_t len) {
        if (Remaining() < len) return false;
        pos_ += static_cast<size_t>(len);
        return true;
    }

    size_t Offset() const { return pos_; }
    size_t Remaining() const { return len_ - pos_; }
    const uint8_t* Current() const { return data_ + pos_; }

private:
    bool ReadBigEndian(size_t n, uint64_t* out) {
        if (Remaining() < n) return false;
        uint64_t value = 0;
        for (size_t i = 0; i < n; ++i) {
            value = (value << 8) | data_[pos_ + i];
        }
        pos_ += n;
        *out = value;
        return true;
    }

    const uint8_t* data_;
    size_t len_;
    size_t pos_;
};

} // namespace quic
} // namespace l4quic
