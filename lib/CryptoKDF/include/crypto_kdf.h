#pragma once
#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>
#include <string>
#include <vector>

// Generator instance the oracle runs for one epoch.
struct EpochGenerator {
  uint32_t window;             // initial W-bit window, never zero
  std::vector<unsigned> taps;  // K sorted indices from [0, W-1)
  unsigned width;
};

/**
 * HKDF-SHA256 extract/expand helpers
 */
bool hkdf_extract(const uint8_t *salt, size_t saltLen,
                  const uint8_t *ikm, size_t ikmLen,
                  uint8_t prk[32]);

bool hkdf_expand(const uint8_t prk[32],
                 const uint8_t *info, size_t infoLen,
                 uint8_t *out, size_t outLen);

/**
 * deriveEpochGenerator: derive the generator for `epoch` from the service secret.
 * PRK = HKDF-Extract("LFSR-ORACLE-SALT", masterSecret), OKM = HKDF-Expand(PRK,
 * "LFSR-EPOCH" || epoch). OKM[0..4) gives the window, the following bytes
 * drive a partial Fisher-Yates shuffle of [0, W-1) whose first K entries are
 * the taps. Same secret and epoch always give the same generator.
 */
bool deriveEpochGenerator(const uint8_t* masterSecret, size_t masterLen,
                          const std::string& epoch, unsigned width, unsigned tapCount,
                          EpochGenerator& out);
