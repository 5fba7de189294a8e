/**
 * @file tls_handshake.cc
 * @brief TLS 1.3 ClientHello Inspection Implementation
 */

#include "tls/tls_handshake.h"
#include <esp_log.h>

#include <vector>

static const char* TAG = "TlsHandshake";

namespace l4quic {
namespace tls {

using quic::BufferReader;

//=============================================================================
// Helper Functions
//=============================================================================

static char ToLowerAscii(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

//=============================================================================
// Parsing Helpers
//=============================================================================

size_t ParseHandshakeHeader(const uint8_t* data, size_t len,
                            HandshakeType* msg_type, uint32_t* msg_len) {
    if (len < 4) {
        return 0;
    }

    *msg_type = static_cast<HandshakeType>(data[0]);
    *msg_len = (static_cast<uint32_t>(data[1]) << 16) |
               (static_cast<uint32_t>(data[2]) << 8) |
               static_cast<uint32_t>(data[3]);

    return 4;
}

bool ParseServerNameExtension(const uint8_t* data, size_t len, std::string* out) {
    BufferReader reader(data, len);

    uint16_t list_len;
    if (!reader.ReadUint16(&list_len)) return false;
    if (reader.Remaining() != list_len) return false;

    BufferReader list(reader.Current(), list_len);
    while (list.Remaining() > 0) {
        uint8_t name_type;
        uint16_t name_len;
        if (!list.ReadUint8(&name_type)) return false;
        if (!list.ReadUint16(&name_len)) return false;
        if (list.Remaining() < name_len) return false;

        if (name_type == kSniHostName) {
            if (name_len == 0 || name_len > kMaxHostNameLen) {
                return false;
            }
            const char* name = reinterpret_cast<const char*>(list.Current());
            out->clear();
            out->reserve(name_len);
            for (size_t i = 0; i < name_len; i++) {
                // RFC 6066: HostName contains no NUL bytes
                if (name[i] == '\0') {
                    out->clear();
                    return false;
                }
                out->push_back(ToLowerAscii(name[i]));
            }
            return true;
        }
        list.Skip(name_len);
    }

    return false;
}

bool ParseAlpnExtension(const uint8_t* data, size_t len, std::vector<std::string>* out) {
    BufferReader reader(data, len);

    uint16_t list_len;
    if (!reader.ReadUint16(&list_len)) return false;
    if (list_len == 0 || reader.Remaining() != list_len) return false;

    std::vector<std::string> protocols;
    BufferReader list(reader.Current(), list_len);
    while (list.Remaining() > 0) {
        uint8_t name_len;
        if (!list.ReadUint8(&name_len)) return false;
        // RFC 7301: empty protocol names are not allowed
        if (name_len == 0 || list.Remaining() < name_len) return false;
        protocols.emplace_back(reinterpret_cast<const char*>(list.Current()), name_len);
        list.Skip(name_len);
    }

    out->swap(protocols);
    return true;
}

//=============================================================================
// ClientHello Parsing
//=============================================================================

static bool ParseClientHelloExtensions(BufferReader* reader, ClientHelloInfo* out) {
    uint16_t extensions_len;
    if (!reader->ReadUint16(&extensions_len)) {
        // RFC 8446 requires extensions, but their absence is not malformed here
        return true;
    }

    size_t available = reader->Remaining();
    if (extensions_len > available) {
        ESP_LOGD(TAG, "ClientHello: extensions block truncated (%u > %zu)",
                 extensions_len, available);
    }
    BufferReader exts(reader->Current(), extensions_len < available ? extensions_len : available);

    bool seen_server_name = false;
    bool seen_alpn = false;
    while (exts.Remaining() > 0) {
        uint16_t ext_type, ext_len;
        if (!exts.ReadUint16(&ext_type) || !exts.ReadUint16(&ext_len)) {
            ESP_LOGD(TAG, "ClientHello: truncated extension header");
            break;
        }
        if (exts.Remaining() < ext_len) {
            ESP_LOGD(TAG, "ClientHello: extension 0x%04x runs past message (%u > %zu)",
                     ext_type, ext_len, exts.Remaining());
            break;
        }

        const uint8_t* ext_data = exts.Current();
        out->extension_types.push_back(ext_type);

        if (ext_type == static_cast<uint16_t>(ExtensionType::kServerName)) {
            // Only the first occurrence counts
            if (!seen_server_name) {
                seen_server_name = true;
                if (ParseServerNameExtension(ext_data, ext_len, &out->server_name)) {
                    out->has_server_name = true;
                } else {
                    ESP_LOGD(TAG, "ClientHello: malformed server_name extension");
                    out->server_name.clear();
                }
            }
        } else if (ext_type == static_cast<uint16_t>(ExtensionType::kALPN)) {
            if (!seen_alpn) {
                seen_alpn = true;
                if (!ParseAlpnExtension(ext_data, ext_len, &out->alpn)) {
                    ESP_LOGD(TAG, "ClientHello: malformed ALPN extension");
                    out->alpn.clear();
                }
            }
        } else if (ext_type == static_cast<uint16_t>(ExtensionType::kSupportedVersions)) {
            // ClientHello format: 1 byte length + versions (2 bytes each)
            if (ext_len >= 1 && ext_data[0] == ext_len - 1 && (ext_data[0] % 2) == 0) {
                for (size_t i = 1; i + 1 < ext_len; i += 2) {
                    out->supported_versions.push_back(
                        static_cast<uint16_t>((ext_data[i] << 8) | ext_data[i + 1]));
                }
            }
        }

        exts.Skip(ext_len);
    }

    return true;
}

bool ParseClientHello(const uint8_t* data, size_t len, ClientHelloInfo* out) {
    out->Clear();

    HandshakeType msg_type;
    uint32_t msg_len;
    size_t header_len = ParseHandshakeHeader(data, len, &msg_type, &msg_len);
    if (header_len == 0) {
        ESP_LOGD(TAG, "ClientHello: handshake header truncated (%zu bytes)", len);
        return false;
    }
    if (msg_type != HandshakeType::kClientHello) {
        ESP_LOGD(TAG, "ClientHello: unexpected handshake type %u",
                 static_cast<unsigned>(msg_type));
        return false;
    }
    if (msg_len > len - header_len) {
        ESP_LOGD(TAG, "ClientHello: declared length %u exceeds %zu available bytes",
                 static_cast<unsigned>(msg_len), len - header_len);
        return false;
    }

    BufferReader reader(data + header_len, msg_len);

    // Legacy version
    if (!reader.ReadUint16(&out->legacy_version)) return false;

    // Random
    if (!reader.Skip(32)) return false;

    // Session ID
    uint8_t session_id_len;
    if (!reader.ReadUint8(&session_id_len)) return false;
    if (session_id_len > 32 || !reader.Skip(session_id_len)) {
        ESP_LOGD(TAG, "ClientHello: bad session id (%u)", session_id_len);
        return false;
    }

    // Cipher Suites
    uint16_t suites_len;
    if (!reader.ReadUint16(&suites_len)) return false;
    if ((suites_len % 2) != 0 || reader.Remaining() < suites_len) {
        ESP_LOGD(TAG, "ClientHello: bad cipher suite list (%u)", suites_len);
        return false;
    }
    for (size_t i = 0; i < suites_len; i += 2) {
        uint16_t suite;
        reader.ReadUint16(&suite);
        out->cipher_suites.push_back(suite);
    }

    // Compression Methods
    uint8_t compression_len;
    if (!reader.ReadUint8(&compression_len)) return false;
    if (!reader.Skip(compression_len)) {
        ESP_LOGD(TAG, "ClientHello: bad compression methods (%u)", compression_len);
        return false;
    }

    return ParseClientHelloExtensions(&reader, out);
}

} // namespace tls
} // namespace l4quic
