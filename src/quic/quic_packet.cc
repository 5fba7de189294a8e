/**
 * @file quic_packet.cc
 * @brief Client Initial long header parsing and unprotection
 */

#include "quic/quic_packet.h"
#include "quic/quic_varint.h"
#include "quic/quic_aead.h"

#include <esp_log.h>

namespace l4quic {
namespace quic {

static const char* TAG = "QUIC_PKT";

//=============================================================================
// Packet Parsing
//=============================================================================

// Reads a length-prefixed connection ID at the reader's position.
static ParseResult ReadConnectionId(BufferReader* reader, ConnectionId* out) {
    uint8_t cid_len;
    if (!reader->ReadUint8(&cid_len)) {
        return ParseResult::kNeedMoreData;
    }
    if (cid_len > kMaxConnectionIdLen) {
        ESP_LOGD(TAG, "ParseLongHeader: connection ID too long (%u)", cid_len);
        return ParseResult::kInvalid;
    }
    if (reader->Remaining() < cid_len) {
        return ParseResult::kNeedMoreData;
    }
    out->Assign(reader->Current(), cid_len);
    reader->Skip(cid_len);
    return ParseResult::kOk;
}

// Reads a varint that announces the size of data bounded by one datagram.
static ParseResult ReadBoundedVarint(BufferReader* reader, uint64_t* out) {
    if (reader->Remaining() == 0 ||
        reader->Remaining() < VarintLengthFromFirstByte(*reader->Current())) {
        return ParseResult::kNeedMoreData;
    }
    reader->ReadVarint(out);
    if (*out > kMaxUdpPayloadSize) {
        ESP_LOGD(TAG, "ParseLongHeader: length %llu exceeds any datagram",
                 static_cast<unsigned long long>(*out));
        return ParseResult::kInvalid;
    }
    return ParseResult::kOk;
}

ParseResult ParseLongHeader(const uint8_t* data, size_t len, LongHeader* out) {
    BufferReader reader(data, len);

    uint8_t first_byte;
    if (!reader.ReadUint8(&first_byte)) {
        return ParseResult::kNeedMoreData;
    }
    if (!IsLongHeader(first_byte)) {
        ESP_LOGD(TAG, "ParseLongHeader: short header (0x%02x)", first_byte);
        return ParseResult::kInvalid;
    }
    if (!HasFixedBit(first_byte)) {
        ESP_LOGD(TAG, "ParseLongHeader: fixed bit not set (0x%02x)", first_byte);
        return ParseResult::kInvalid;
    }
    out->header_byte = first_byte;

    if (!reader.ReadUint32(&out->version)) {
        return ParseResult::kNeedMoreData;
    }
    if (out->version == kVersionNegotiation) {
        ESP_LOGD(TAG, "ParseLongHeader: version negotiation packet");
        return ParseResult::kInvalid;
    }
    out->params = FindVersionParams(out->version);
    if (out->params == nullptr) {
        ESP_LOGD(TAG, "ParseLongHeader: unsupported version 0x%08x",
                 static_cast<unsigned>(out->version));
        return ParseResult::kInvalid;
    }
    out->type = DecodeLongHeaderType(*out->params, first_byte);
    if (!out->IsInitial()) {
        ESP_LOGD(TAG, "ParseLongHeader: not an Initial packet (type=%u)",
                 static_cast<unsigned>(out->type));
        return ParseResult::kInvalid;
    }

    ParseResult result = ReadConnectionId(&reader, &out->dcid);
    if (result != ParseResult::kOk) {
        return result;
    }
    result = ReadConnectionId(&reader, &out->scid);
    if (result != ParseResult::kOk) {
        return result;
    }

    uint64_t token_len;
    result = ReadBoundedVarint(&reader, &token_len);
    if (result != ParseResult::kOk) {
        return result;
    }
    if (reader.Remaining() < token_len) {
        return ParseResult::kNeedMoreData;
    }
    out->token.assign(reader.Current(), reader.Current() + token_len);
    reader.Skip(token_len);

    result = ReadBoundedVarint(&reader, &out->length);
    if (result != ParseResult::kOk) {
        return result;
    }
    out->pn_offset = reader.Offset();

    // The header protection sample must lie inside this packet
    if (out->length < kHpSampleOffset + kHpSampleLen) {
        ESP_LOGD(TAG, "ParseLongHeader: length %llu too short for a protected payload",
                 static_cast<unsigned long long>(out->length));
        return ParseResult::kInvalid;
    }
    out->packet_size = out->pn_offset + static_cast<size_t>(out->length);
    if (out->packet_size > kMaxUdpPayloadSize) {
        return ParseResult::kInvalid;
    }
    if (len < out->packet_size) {
        return ParseResult::kNeedMoreData;
    }

    return ParseResult::kOk;
}

bool DecryptInitialPacket(const uint8_t* data, size_t len,
                          const LongHeader& header,
                          const InitialKeys& keys,
                          InitialPacket* out) {
    if (!keys.valid) {
        ESP_LOGW(TAG, "DecryptInitial: keys not valid");
        return false;
    }
    if (header.packet_size == 0 || len < header.packet_size) {
        ESP_LOGD(TAG, "DecryptInitial: packet incomplete (%zu < %zu)",
                 len, header.packet_size);
        return false;
    }

    // Header protection is removed in place, so work on a copy
    std::vector<uint8_t> packet(data, data + header.packet_size);

    size_t pn_len = 0;
    if (!UnmaskLongHeader(keys.hp.data(), packet.data(), packet.size(),
                          header.pn_offset, &pn_len)) {
        return false;
    }

    uint64_t packet_number = 0;
    for (size_t i = 0; i < pn_len; i++) {
        packet_number = (packet_number << 8) | packet[header.pn_offset + i];
    }

    size_t header_len = header.pn_offset + pn_len;
    size_t ciphertext_len = packet.size() - header_len;

    out->payload.resize(ciphertext_len);
    size_t decrypted_len = OpenPayload(keys, packet_number,
                                       packet.data(), header_len,
                                       packet.data() + header_len, ciphertext_len,
                                       out->payload.data());
    if (decrypted_len == 0) {
        out->payload.clear();
        return false;
    }
    out->payload.resize(decrypted_len);

    // RFC 9000 Section 17.2: reserved bits must be zero
    if ((packet[0] & kLongHeaderReservedBits) != 0) {
        ESP_LOGD(TAG, "DecryptInitial: reserved bits set (0x%02x)", packet[0]);
        out->payload.clear();
        return false;
    }

    out->packet_number = packet_number;
    out->pn_length = pn_len;
    return true;
}

} // namespace quic
} // namespace l4quic
