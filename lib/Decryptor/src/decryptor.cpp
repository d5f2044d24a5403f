#include "decryptor.h"

static const char* kPhase = "decrypt";

bool decryptWithOffsetSearch(const WindowLFSR& recovered, size_t maxOffset,
                             const std::vector<uint8_t>& ciphertext,
                             const std::string& signature,
                             DecryptResult& out, RecoveryStatus& status) {
  if (signature.empty()) {
    return setFailure(status, RecoveryError::NoMatchingOffset, kPhase, "empty plaintext signature");
  }
  if (ciphertext.size() < signature.size()) {
    return setFailure(status, RecoveryError::NoMatchingOffset, kPhase,
                      "ciphertext shorter than signature (" + std::to_string(ciphertext.size()) + " bytes)");
  }

  // Walk one register forward instead of re-advancing from the start for every offset
  WindowLFSR phase = recovered;
  for (size_t x = 0; x < maxOffset; ++x) {
    std::vector<uint8_t> candidate = xorWithKeystream(phase, 0, ciphertext);
    if (containsSignature(candidate, signature)) {
      out.offset = x;
      out.plaintext.swap(candidate);
      log_info("Decryptor", "signature found at offset " + std::to_string(x));
      return true;
    }
    phase.stepBit();
  }
  return setFailure(status, RecoveryError::NoMatchingOffset, kPhase,
                    "no offset in [0, " + std::to_string(maxOffset) + ") yields \"" + signature + "\"");
}
