#include "crypto_kdf.h"
#include "common.h"
#include <string.h>
#include <algorithm>
#include <mbedtls/md.h>

static const char EPOCH_KDF_SALT[] = "LFSR-ORACLE-SALT";
static const char EPOCH_INFO_LABEL[] = "LFSR-EPOCH";

// -----------------------------------------------------------------------------
// Helper: one-shot HMAC-SHA256 over up to three parts.
// Frees the mbedTLS context on every path.
// -----------------------------------------------------------------------------
static bool hmac_sha256_parts(const uint8_t* key, size_t keyLen,
                              const uint8_t* a, size_t aLen,
                              const uint8_t* b, size_t bLen,
                              const uint8_t* c, size_t cLen,
                              uint8_t out32[32])
{
    const mbedtls_md_info_t* info = mbedtls_md_info_from_type(MBEDTLS_MD_SHA256);
    if (!info) return false;
    mbedtls_md_context_t ctx;
    mbedtls_md_init(&ctx);
    if (mbedtls_md_setup(&ctx, info, 1) != 0) { mbedtls_md_free(&ctx); return false; }
    if (mbedtls_md_hmac_starts(&ctx, key, keyLen) != 0) { mbedtls_md_free(&ctx); return false; }
    const uint8_t* parts[3] = { a, b, c };
    const size_t lens[3] = { aLen, bLen, cLen };
    for (int i = 0; i < 3; ++i) {
        if (!parts[i] || !lens[i]) continue;
        if (mbedtls_md_hmac_update(&ctx, parts[i], lens[i]) != 0) { mbedtls_md_free(&ctx); return false; }
    }
    if (mbedtls_md_hmac_finish(&ctx, out32) != 0) { mbedtls_md_free(&ctx); return false; }
    mbedtls_md_free(&ctx);
    return true;
}

static void secure_zero(void* p, size_t n) {
    volatile uint8_t *q = (volatile uint8_t *)p;
    while (n--) *q++ = 0;
}

// -----------------------------------------------------------------------------
// HKDF Extract (PRK = HMAC(salt, IKM)); an absent salt is HashLen zero bytes
// -----------------------------------------------------------------------------
bool hkdf_extract(const uint8_t *salt, size_t saltLen,
                  const uint8_t *ikm, size_t ikmLen,
                  uint8_t prk[32]) {
    if (!ikm || !prk) return false;
    uint8_t zeros[32];
    memset(zeros, 0, sizeof(zeros));
    if (!salt || saltLen == 0) {
        salt = zeros;
        saltLen = sizeof(zeros);
    }
    return hmac_sha256_parts(salt, saltLen, ikm, ikmLen, NULL, 0, NULL, 0, prk);
}

// -----------------------------------------------------------------------------
// HKDF Expand: T(i) = HMAC(PRK, T(i-1) || info || i), outLen <= 255*32
// -----------------------------------------------------------------------------
bool hkdf_expand(const uint8_t prk[32],
                 const uint8_t *info, size_t infoLen,
                 uint8_t *out, size_t outLen)
{
    if (!prk || !out || outLen == 0) return false;
    const size_t hashLen = 32;
    size_t blocks = (outLen + hashLen - 1) / hashLen;
    if (blocks > 255) return false;

    uint8_t T[32];
    size_t produced = 0;
    for (size_t i = 1; i <= blocks; ++i) {
        uint8_t ctr = (uint8_t)i;
        // T(i-1) is still in T from the previous round
        if (!hmac_sha256_parts(prk, hashLen,
                               i > 1 ? T : NULL, i > 1 ? hashLen : 0,
                               info, infoLen,
                               &ctr, 1, T)) {
            secure_zero(T, sizeof(T));
            return false;
        }
        size_t copy = std::min(hashLen, outLen - produced);
        memcpy(out + produced, T, copy);
        produced += copy;
    }
    secure_zero(T, sizeof(T));
    return true;
}

// -----------------------------------------------------------------------------
// Per-epoch generator derivation
// -----------------------------------------------------------------------------
bool deriveEpochGenerator(const uint8_t* masterSecret, size_t masterLen,
                          const std::string& epoch, unsigned width, unsigned tapCount,
                          EpochGenerator& out)
{
    if (!masterSecret || masterLen == 0) return false;
    if (width < 2 || width > LFSR_MAX_WINDOW_BITS || tapCount == 0 || tapCount >= width) return false;

    uint8_t prk[32];
    if (!hkdf_extract((const uint8_t*)EPOCH_KDF_SALT, strlen(EPOCH_KDF_SALT), masterSecret, masterLen, prk)) {
        return false;
    }

    std::vector<uint8_t> info(EPOCH_INFO_LABEL, EPOCH_INFO_LABEL + strlen(EPOCH_INFO_LABEL));
    info.insert(info.end(), epoch.begin(), epoch.end());

    // 4 window bytes + 2 bytes per shuffle draw
    uint8_t okm[4 + 2 * LFSR_MAX_WINDOW_BITS];
    if (!hkdf_expand(prk, info.data(), info.size(), okm, sizeof(okm))) {
        secure_zero(prk, sizeof(prk));
        return false;
    }

    uint32_t w = ((uint32_t)okm[0] << 24) | ((uint32_t)okm[1] << 16) | ((uint32_t)okm[2] << 8) | (uint32_t)okm[3];
    w &= width >= 32 ? 0xFFFFFFFFu : ((1u << width) - 1u);
    out.window = w ? w : 1u; // an all-zero window never leaves zero
    out.width = width;

    const unsigned n = width - 1;
    std::vector<unsigned> pool(n);
    for (unsigned i = 0; i < n; ++i) pool[i] = i;
    for (unsigned i = 0; i < tapCount; ++i) {
        unsigned r = ((unsigned)okm[4 + 2 * i] << 8) | okm[5 + 2 * i];
        unsigned j = i + r % (n - i);
        std::swap(pool[i], pool[j]);
    }
    out.taps.assign(pool.begin(), pool.begin() + tapCount);
    std::sort(out.taps.begin(), out.taps.end());

    secure_zero(okm, sizeof(okm));
    secure_zero(prk, sizeof(prk));
    return true;
}
