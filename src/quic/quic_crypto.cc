/**
 * @file quic_crypto.cc
 * @brief Client Initial key schedule using mbedtls
 */

#include "quic/quic_crypto.h"
#include "quic/quic_constants.h"

#include <mbedtls/hkdf.h>
#include <mbedtls/md.h>
#include <mbedtls/platform_util.h>

#include <cstring>
#include <esp_log.h>

namespace l4quic {
namespace quic {

static const char* TAG = "QUIC_CRYPTO";

static const char kTls13LabelPrefix[] = "tls13 ";

//=============================================================================
// HKDF
//=============================================================================

static const mbedtls_md_info_t* Sha256() {
    return mbedtls_md_info_from_type(MBEDTLS_MD_SHA256);
}

bool HkdfExtract(const uint8_t* salt, size_t salt_len,
                 const uint8_t* ikm, size_t ikm_len,
                 uint8_t* out) {
    const mbedtls_md_info_t* md = Sha256();
    if (md == nullptr) {
        ESP_LOGW(TAG, "HkdfExtract: SHA-256 unavailable");
        return false;
    }
    int ret = mbedtls_hkdf_extract(md, salt, salt_len, ikm, ikm_len, out);
    if (ret != 0) {
        ESP_LOGW(TAG, "HkdfExtract: mbedtls_hkdf_extract failed: %d", ret);
        return false;
    }
    return true;
}

bool HkdfExpandLabel(const uint8_t* secret, size_t secret_len,
                     const uint8_t* label, size_t label_len,
                     const uint8_t* context, size_t context_len,
                     uint8_t* out, size_t out_len) {
    const size_t prefix_len = sizeof(kTls13LabelPrefix) - 1;
    if (prefix_len + label_len > 255 || context_len > 255 || out_len > 0xFFFF) {
        ESP_LOGW(TAG, "HkdfExpandLabel: oversized input (label=%zu, context=%zu)",
                 label_len, context_len);
        return false;
    }

    // HkdfLabel: uint16 length, opaque label<7..255>, opaque context<0..255>
    uint8_t info[2 + 1 + 255 + 1 + 255];
    size_t n = 0;
    info[n++] = static_cast<uint8_t>(out_len >> 8);
    info[n++] = static_cast<uint8_t>(out_len);
    info[n++] = static_cast<uint8_t>(prefix_len + label_len);
    std::memcpy(info + n, kTls13LabelPrefix, prefix_len);
    n += prefix_len;
    std::memcpy(info + n, label, label_len);
    n += label_len;
    info[n++] = static_cast<uint8_t>(context_len);
    if (context_len > 0) {
        std::memcpy(info + n, context, context_len);
        n += context_len;
    }

    const mbedtls_md_info_t* md = Sha256();
    if (md == nullptr) {
        ESP_LOGW(TAG, "HkdfExpandLabel: SHA-256 unavailable");
        return false;
    }
    int ret = mbedtls_hkdf_expand(md, secret, secret_len, info, n, out, out_len);
    if (ret != 0) {
        ESP_LOGW(TAG, "HkdfExpandLabel: mbedtls_hkdf_expand failed: %d", ret);
        return false;
    }
    return true;
}

//=============================================================================
// Client Initial Keys
//=============================================================================

static bool Expand(const uint8_t* secret, const char* label, uint8_t* out, size_t out_len) {
    return HkdfExpandLabel(secret, kTrafficSecretLen,
                           reinterpret_cast<const uint8_t*>(label), std::strlen(label),
                           nullptr, 0, out, out_len);
}

bool DeriveClientInitialKeys(const VersionParams& params,
                             const uint8_t* dcid, size_t dcid_len,
                             InitialKeys* out) {
    out->Clear();
    if (dcid_len > kMaxConnectionIdLen) {
        ESP_LOGD(TAG, "DeriveClientInitialKeys: DCID too long (%zu)", dcid_len);
        return false;
    }

    uint8_t initial_secret[kTrafficSecretLen];
    uint8_t client_secret[kTrafficSecretLen];
    bool ok = HkdfExtract(params.initial_salt, params.initial_salt_len,
                          dcid, dcid_len, initial_secret) &&
              Expand(initial_secret, "client in", client_secret, sizeof(client_secret)) &&
              Expand(client_secret, params.key_label, out->key.data(), out->key.size()) &&
              Expand(client_secret, params.iv_label, out->iv.data(), out->iv.size()) &&
              Expand(client_secret, params.hp_label, out->hp.data(), out->hp.size());

    mbedtls_platform_zeroize(initial_secret, sizeof(initial_secret));
    mbedtls_platform_zeroize(client_secret, sizeof(client_secret));

    if (!ok) {
        ESP_LOGW(TAG, "DeriveClientInitialKeys: key schedule failed for %s", params.name);
        out->Clear();
        return false;
    }
    out->valid = true;
    return true;
}

} // namespace quic
} // namespace l4quic
