#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>
#include "common.h"
#include "keystream.h"

struct DecryptResult {
  size_t offset = 0;
  std::vector<uint8_t> plaintext;
};

/**
 * Phase search over [0, maxOffset): for each offset x, advance a fresh copy
 * of `recovered` by x bits, XOR the next ciphertext.size()*8 bits against the
 * ciphertext and accept the first plaintext containing `signature`.
 * Fails with NoMatchingOffset when no offset matches.
 */
bool decryptWithOffsetSearch(const WindowLFSR& recovered, size_t maxOffset,
                             const std::vector<uint8_t>& ciphertext,
                             const std::string& signature,
                             DecryptResult& out, RecoveryStatus& status);
