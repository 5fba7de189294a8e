/**
 * @file tls_handshake.h
 * @brief TLS 1.3 ClientHello Inspection for QUIC (RFC 8446, RFC 9001)
 */

#pragma once

#include "quic/quic_types.h"
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace l4quic {
namespace tls {

//=============================================================================
// TLS Constants
//=============================================================================

// TLS 1.3 version
constexpr uint16_t kTls13Version = 0x0304;
constexpr uint16_t kTlsLegacyVersion = 0x0303;

// Handshake message types
enum class HandshakeType : uint8_t {
    kClientHello = 1,
    kServerHello = 2,
};

// Extensions read from a ClientHello
enum class ExtensionType : uint16_t {
    kServerName = 0,
    kALPN = 16,
    kSupportedVersions = 43,
};

// server_name NameType
constexpr uint8_t kSniHostName = 0;

// Upper bound on a DNS host name (RFC 1035)
constexpr size_t kMaxHostNameLen = 255;

//=============================================================================
// ClientHello Parsing
//=============================================================================

/**
 * @brief Metadata extracted from a ClientHello
 *
 * A field whose extension is absent or malformed stays empty, with
 * @c has_server_name distinguishing "no SNI" from an empty value.
 */
struct ClientHelloInfo {
    std::string server_name;                ///< Lower-cased host_name
    bool has_server_name = false;
    std::vector<std::string> alpn;          ///< Protocol ids, wire order

    uint16_t legacy_version = 0;
    std::vector<uint16_t> cipher_suites;
    std::vector<uint16_t> supported_versions;
    std::vector<uint16_t> extension_types;  ///< Wire order, for diagnostics

    void Clear() {
        server_name.clear();
        has_server_name = false;
        alpn.clear();
        legacy_version = 0;
        cipher_suites.clear();
        supported_versions.clear();
        extension_types.clear();
    }
};

/**
 * @brief Parse a ClientHello handshake message
 *
 * @p data starts with the 4-byte handshake header. The message type must be
 * ClientHello and the declared length must fit in @p len; the fixed fields
 * up to the compression methods must be intact. Beyond that a malformed
 * server_name or ALPN extension only leaves its own field empty, and an
 * extension whose length runs past the message ends the walk, keeping
 * whatever was recovered so far.
 *
 * @param data CRYPTO stream bytes
 * @param len Data length
 * @param out Output metadata
 * @return true if a ClientHello was recognized
 */
bool ParseClientHello(const uint8_t* data, size_t len, ClientHelloInfo* out);

/**
 * @brief Parse a server_name extension body (RFC 6066 Section 3)
 *
 * The ServerNameList must fill the body exactly. Takes the first
 * host_name entry and lower-cases it.
 *
 * @return true if a host name was found
 */
bool ParseServerNameExtension(const uint8_t* data, size_t len, std::string* out);

/**
 * @brief Parse an ALPN extension body (RFC 7301 Section 3.1)
 *
 * The ProtocolNameList must fill the body exactly and hold no empty name.
 *
 * @return true if the list was well-formed and non-empty
 */
bool ParseAlpnExtension(const uint8_t* data, size_t len, std::vector<std::string>* out);

//=============================================================================
// Utility Functions
//=============================================================================

/**
 * @brief Parse TLS handshake message header
 *
 * @param data Raw data
 * @param len Data length
 * @param msg_type Output message type
 * @param msg_len Output message length
 * @return Bytes consumed for header (4), or 0 on failure
 */
size_t ParseHandshakeHeader(const uint8_t* data, size_t len,
                            HandshakeType* msg_type, uint32_t* msg_len);

} // namespace tls
} // namespace l4quic
