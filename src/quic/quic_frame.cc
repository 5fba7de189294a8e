/**
 * @file quic_frame.cc
 * @brief Frame walk of a decrypted client Initial and CRYPTO reassembly
 */

#include "quic/quic_frame.h"
#include "quic/quic_varint.h"

#include <map>
#include <esp_log.h>

namespace l4quic {
namespace quic {

static const char* TAG = "QUIC_FRAME";

FrameKind ClassifyFrame(uint64_t frame_type) {
    switch (frame_type) {
        case frame::kPadding:          return FrameKind::kPadding;
        case frame::kPing:             return FrameKind::kPing;
        case frame::kAck:              return FrameKind::kAck;
        case frame::kAckEcn:           return FrameKind::kAckEcn;
        case frame::kCrypto:           return FrameKind::kCrypto;
        case frame::kConnectionClose:  return FrameKind::kConnectionClose;
        default:                       return FrameKind::kUnknown;
    }
}

//=============================================================================
// Frame Bodies
//=============================================================================

bool ParseCryptoFrame(BufferReader* reader, CryptoSegment* out) {
    uint64_t offset, length;
    if (!reader->ReadVarint(&offset) || !reader->ReadVarint(&length)) {
        return false;
    }
    if (reader->Remaining() < length || offset > kMaxVarint - length) {
        return false;
    }
    out->offset = offset;
    out->data = reader->Current();
    out->length = static_cast<size_t>(length);
    return reader->Skip(length);
}

bool SkipAckFrame(BufferReader* reader, bool ecn) {
    // Largest Acknowledged, ACK Delay, ACK Range Count, First ACK Range
    uint64_t fields[4];
    for (uint64_t& field : fields) {
        if (!reader->ReadVarint(&field)) {
            return false;
        }
    }

    // Gap and length per range, one byte each at least
    uint64_t range_count = fields[2];
    if (range_count > reader->Remaining() / 2) {
        return false;
    }
    uint64_t ignored;
    for (uint64_t i = 0; i < 2 * range_count; i++) {
        if (!reader->ReadVarint(&ignored)) {
            return false;
        }
    }

    if (ecn) {
        // ECT0, ECT1, ECN-CE
        for (int i = 0; i < 3; i++) {
            if (!reader->ReadVarint(&ignored)) {
                return false;
            }
        }
    }
    return true;
}

bool SkipConnectionCloseFrame(BufferReader* reader) {
    uint64_t error_code, frame_type, reason_len;
    return reader->ReadVarint(&error_code) &&
           reader->ReadVarint(&frame_type) &&
           reader->ReadVarint(&reason_len) &&
           reader->Skip(reason_len);
}

//=============================================================================
// CRYPTO Reassembly
//=============================================================================

bool ReassembleCryptoStream(const uint8_t* frames, size_t len,
                            std::vector<uint8_t>* out) {
    out->clear();

    std::map<uint64_t, CryptoSegment> segments;
    BufferReader reader(frames, len);

    bool done = false;
    while (!done && reader.Remaining() > 0) {
        uint64_t frame_type;
        if (!reader.ReadVarint(&frame_type)) {
            ESP_LOGD(TAG, "Reassemble: truncated frame type at %zu", reader.Offset());
            return false;
        }

        switch (ClassifyFrame(frame_type)) {
            case FrameKind::kPadding:
            case FrameKind::kPing:
                break;

            case FrameKind::kAck:
            case FrameKind::kAckEcn:
                if (!SkipAckFrame(&reader, frame_type == frame::kAckEcn)) {
                    ESP_LOGD(TAG, "Reassemble: malformed ACK frame");
                    return false;
                }
                break;

            case FrameKind::kCrypto: {
                CryptoSegment segment;
                if (!ParseCryptoFrame(&reader, &segment)) {
                    ESP_LOGD(TAG, "Reassemble: malformed CRYPTO frame");
                    return false;
                }
                if (segment.length > 0 && !segments.emplace(segment.offset, segment).second) {
                    ESP_LOGD(TAG, "Reassemble: CRYPTO offset %llu repeated",
                             static_cast<unsigned long long>(segment.offset));
                    return false;
                }
                break;
            }

            case FrameKind::kConnectionClose:
                if (!SkipConnectionCloseFrame(&reader)) {
                    ESP_LOGD(TAG, "Reassemble: malformed CONNECTION_CLOSE frame");
                    return false;
                }
                done = true;
                break;

            case FrameKind::kUnknown:
                ESP_LOGD(TAG, "Reassemble: frame type 0x%llx not allowed in Initial",
                         static_cast<unsigned long long>(frame_type));
                return false;
        }
    }

    if (segments.empty()) {
        ESP_LOGD(TAG, "Reassemble: no CRYPTO data");
        return false;
    }

    uint64_t next = 0;
    for (const auto& entry : segments) {
        const CryptoSegment& segment = entry.second;
        if (segment.offset != next) {
            ESP_LOGD(TAG, "Reassemble: %s at offset %llu",
                     segment.offset > next ? "gap" : "overlap",
                     static_cast<unsigned long long>(next));
            out->clear();
            return false;
        }
        out->insert(out->end(), segment.data, segment.data + segment.length);
        next += segment.length;
    }
    return true;
}

} // namespace quic
} // namespace l4quic
