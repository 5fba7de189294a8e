/**
 * @file quic_aead.cc
 * @brief Initial packet unprotection using mbedtls
 */

#include "quic/quic_aead.h"
#include "quic/quic_constants.h"

#include <mbedtls/aes.h>
#include <mbedtls/gcm.h>

#include <esp_log.h>

namespace l4quic {
namespace quic {

static const char* TAG = "QUIC_AEAD";

//=============================================================================
// Header Protection
//=============================================================================

bool HeaderProtectionMask(const uint8_t* hp_key, const uint8_t* sample, uint8_t* mask_out) {
    mbedtls_aes_context aes;
    mbedtls_aes_init(&aes);

    uint8_t block[kHpSampleLen];
    int ret = mbedtls_aes_setkey_enc(&aes, hp_key, 128);
    if (ret == 0) {
        ret = mbedtls_aes_crypt_ecb(&aes, MBEDTLS_AES_ENCRYPT, sample, block);
    }
    mbedtls_aes_free(&aes);

    if (ret != 0) {
        ESP_LOGW(TAG, "HeaderProtectionMask: AES-ECB failed: %d", ret);
        return false;
    }
    for (size_t i = 0; i < kHpMaskLen; i++) {
        mask_out[i] = block[i];
    }
    return true;
}

bool UnmaskLongHeader(const uint8_t* hp_key,
                      uint8_t* packet, size_t packet_len,
                      size_t pn_offset,
                      size_t* pn_len_out) {
    // The sample assumes a 4-byte packet number
    if (pn_offset > packet_len ||
        packet_len - pn_offset < kHpSampleOffset + kHpSampleLen) {
        ESP_LOGD(TAG, "UnmaskLongHeader: no room for sample (pn_offset=%zu, len=%zu)",
                 pn_offset, packet_len);
        return false;
    }

    uint8_t mask[kHpMaskLen];
    if (!HeaderProtectionMask(hp_key, packet + pn_offset + kHpSampleOffset, mask)) {
        return false;
    }

    packet[0] ^= mask[0] & 0x0F;
    size_t pn_len = (packet[0] & 0x03) + 1;
    for (size_t i = 0; i < pn_len; i++) {
        packet[pn_offset + i] ^= mask[1 + i];
    }
    *pn_len_out = pn_len;
    return true;
}

//=============================================================================
// Payload Protection
//=============================================================================

void MakeNonce(const uint8_t* iv, uint64_t packet_number, uint8_t* nonce_out) {
    for (size_t i = 0; i < kAeadIvLen; i++) {
        nonce_out[i] = iv[i];
    }
    for (size_t i = 0; i < 8; i++) {
        nonce_out[kAeadIvLen - 1 - i] ^= static_cast<uint8_t>(packet_number >> (8 * i));
    }
}

size_t OpenPayload(const InitialKeys& keys, uint64_t packet_number,
                   const uint8_t* aad, size_t aad_len,
                   const uint8_t* ciphertext, size_t ciphertext_len,
                   uint8_t* plaintext_out) {
    // At least one frame byte ahead of the tag
    if (ciphertext_len <= kAeadTagLen) {
        ESP_LOGD(TAG, "OpenPayload: %zu bytes cannot hold a payload", ciphertext_len);
        return 0;
    }
    size_t plaintext_len = ciphertext_len - kAeadTagLen;

    uint8_t nonce[kAeadIvLen];
    MakeNonce(keys.iv.data(), packet_number, nonce);

    mbedtls_gcm_context gcm;
    mbedtls_gcm_init(&gcm);
    int ret = mbedtls_gcm_setkey(&gcm, MBEDTLS_CIPHER_ID_AES, keys.key.data(), 128);
    if (ret != 0) {
        ESP_LOGW(TAG, "OpenPayload: mbedtls_gcm_setkey failed: %d", ret);
        mbedtls_gcm_free(&gcm);
        return 0;
    }
    ret = mbedtls_gcm_auth_decrypt(&gcm, plaintext_len,
                                   nonce, sizeof(nonce),
                                   aad, aad_len,
                                   ciphertext + plaintext_len, kAeadTagLen,
                                   ciphertext, plaintext_out);
    mbedtls_gcm_free(&gcm);

    if (ret != 0) {
        // Also the result for anything that merely looks like a QUIC header
        ESP_LOGD(TAG, "OpenPayload: authentication failed (pn=%llu)",
                 static_cast<unsigned long long>(packet_number));
        return 0;
    }
    return plaintext_len;
}

} // namespace quic
} // namespace l4quic
