#include "decryptor.h"
#include "tap_recovery.h"
#include "crypto_kdf.h"
#include "oracle_harness.h"
#include <cassert>
#include <iostream>
#include <random>

int main() {
    const unsigned W = LFSR_WINDOW_BITS;

    // Reference sizes end to end: 48 hidden bits, ciphertext keyed from bit 48 on.
    // The recovered window is bits [27, 48), so the keystream is 21 bits further on.
    {
        OracleServiceConfig cfg = harnessServiceConfig();
        EpochMaterial m;
        std::string err;
        assert(buildEpochMaterial(cfg, "1700000000", m, err));
        assert(m.hiddenBits.size() == LFSR_KNOWN_BITS);

        // 48 bits pin down exactly one tap set for this epoch
        TapRecoveryOptions opt;
        opt.shards = 4;
        opt.requireUnique = true;
        TapRecoveryResult taps;
        RecoveryStatus st;
        assert(recoverTaps(m.hiddenBits, opt, taps, st));
        assert(taps.matches == 1);
        EpochGenerator gen;
        assert(deriveEpochGenerator(cfg.masterSecret.data(), cfg.masterSecret.size(), "1700000000",
                                    W, LFSR_TAP_COUNT, gen));
        assert(taps.taps == gen.taps);

        std::vector<uint8_t> ct(m.tail.begin(), m.tail.end());
        WindowLFSR recovered(taps.window, taps.tapMask, W);
        DecryptResult res;
        assert(decryptWithOffsetSearch(recovered, m.hiddenBits.size(), ct, "FLAG{", res, st));
        assert(res.offset == W);
        assert(std::string(res.plaintext.begin(), res.plaintext.end()) == cfg.plaintext);

        // The right offset sits outside a shorter search range
        DecryptResult none;
        RecoveryStatus st2;
        assert(!decryptWithOffsetSearch(recovered, W, ct, "FLAG{", none, st2));
        assert(st2.error == RecoveryError::NoMatchingOffset);
    }

    // Epoch 1234 leaves five tap sets consistent with its 48 bits: strict fails,
    // the default takes the lowest rank, which is the generator's own set
    {
        OracleServiceConfig cfg = harnessServiceConfig();
        EpochMaterial m;
        std::string err;
        assert(buildEpochMaterial(cfg, "1234", m, err));

        TapRecoveryOptions opt;
        opt.shards = 4;
        opt.requireUnique = true;
        TapRecoveryResult taps;
        RecoveryStatus st;
        assert(!recoverTaps(m.hiddenBits, opt, taps, st));
        assert(st.error == RecoveryError::NoConsistentTaps);

        opt.requireUnique = false;
        RecoveryStatus st2;
        assert(recoverTaps(m.hiddenBits, opt, taps, st2));
        assert((taps.taps == std::vector<unsigned>{0, 1, 2, 3, 4, 6, 9, 12, 18, 19}));
    }

    // Synthetic phase: encrypt at offset 5 from a known register
    {
        std::mt19937_64 rng(0xDEC0DE);
        BitSequence seed = randomBits(rng, W);
        auto taps = randomTaps(rng, W - 1, LFSR_TAP_COUNT);
        WindowLFSR start = WindowLFSR::fromBits(seed, 0, W, taps);
        std::string msg = "xxFLAG{offset_five}";
        std::vector<uint8_t> ct = xorWithKeystream(start, 5, std::vector<uint8_t>(msg.begin(), msg.end()));

        DecryptResult res;
        RecoveryStatus st;
        assert(decryptWithOffsetSearch(start, 48, ct, "FLAG{", res, st));
        assert(res.offset == 5);
        assert(std::string(res.plaintext.begin(), res.plaintext.end()) == msg);
    }

    // Degenerate inputs
    {
        WindowLFSR start(0x12345, tapsToMask({0, 2, 4}), W);
        DecryptResult res;
        RecoveryStatus st;
        assert(!decryptWithOffsetSearch(start, 48, {1, 2, 3}, "", res, st));
        assert(st.error == RecoveryError::NoMatchingOffset);

        RecoveryStatus st2;
        assert(!decryptWithOffsetSearch(start, 48, {1, 2}, "FLAG{", res, st2));
        assert(st2.error == RecoveryError::NoMatchingOffset);

        RecoveryStatus st3;
        assert(!decryptWithOffsetSearch(start, 0, {1, 2, 3, 4, 5, 6}, "FLAG{", res, st3));
        assert(st3.error == RecoveryError::NoMatchingOffset);
    }

    std::cout << "test_decryptor: ok" << std::endl;
    return 0;
}
