#include "pipeline.h"
#include "oracle_harness.h"
#include <cassert>
#include <iostream>

static AttackConfig clientFor(const OracleServiceConfig& svc) {
    AttackConfig cfg;
    cfg.knownBits = svc.hiddenBits;
    cfg.poolSize = svc.hiddenBits + 1;
    cfg.windowBits = svc.windowBits;
    cfg.tapCount = svc.tapCount;
    cfg.ciphertextEncoding = svc.ciphertextEncoding;
    cfg.protocol = svc.protocol;
    cfg.searchShards = 4;
    return cfg;
}

int main() {
    // Raw tail, reference sizes
    {
        OracleServiceConfig svc = harnessServiceConfig();
        OracleService service(svc);
        AttackConfig cfg = clientFor(svc);
        SessionFactory factory = makeSimulatedSessionFactory(service, cfg.protocol, "1234");

        RecoveryOutcome out;
        RecoveryStatus st;
        assert(runRecovery(cfg, factory, out, st));
        assert(st.ok());
        assert(out.epoch == "1234");
        assert(out.knownBits.size() == LFSR_KNOWN_BITS);
        assert(std::string(out.decrypted.plaintext.begin(), out.decrypted.plaintext.end()) == svc.plaintext);
        assert(out.decrypted.offset == LFSR_WINDOW_BITS);

        size_t ones = 0;
        for (uint8_t b : out.knownBits) ones += b;
        assert(out.sessionsBurned == ones);
        assert(out.sessionsAcquired == ones + 1);

        std::shared_ptr<const EpochMaterial> m;
        std::string err;
        assert(service.material("1234", m, err));
        assert(out.knownBits == m->hiddenBits);
    }

    // Hex tail, custom prompt and a CRLF service
    {
        OracleServiceConfig svc = harnessServiceConfig();
        svc.ciphertextEncoding = "hex";
        svc.protocol.prompt = "guess> ";
        svc.protocol.epochDelimiter = "\r\n";
        svc.plaintext = "header FLAG{hex_tail} trailer";
        OracleService service(svc);
        AttackConfig cfg = clientFor(svc);
        SessionFactory factory = makeSimulatedSessionFactory(service, cfg.protocol, "99");

        RecoveryOutcome out;
        RecoveryStatus st;
        assert(runRecovery(cfg, factory, out, st));
        assert(std::string(out.decrypted.plaintext.begin(), out.decrypted.plaintext.end()) == svc.plaintext);
    }

    // Signature that never appears
    {
        OracleServiceConfig svc = harnessServiceConfig();
        OracleService service(svc);
        AttackConfig cfg = clientFor(svc);
        cfg.signature = "CTF{";
        SessionFactory factory = makeSimulatedSessionFactory(service, cfg.protocol, "1234");
        RecoveryOutcome out;
        RecoveryStatus st;
        assert(!runRecovery(cfg, factory, out, st));
        assert(st.error == RecoveryError::NoMatchingOffset);
        assert(out.knownBits.size() == LFSR_KNOWN_BITS);
    }

    // Nothing reachable
    {
        AttackConfig cfg;
        cfg.poolSize = 3;
        SessionFactory dead = [](size_t, std::string& err) -> std::unique_ptr<OracleSession> {
            err = "connection refused";
            return nullptr;
        };
        RecoveryOutcome out;
        RecoveryStatus st;
        assert(!runRecovery(cfg, dead, out, st));
        assert(st.error == RecoveryError::HandshakeFailed);
    }

    // Hex decoding of the tail
    {
        std::vector<uint8_t> ct;
        std::string err;
        assert(decodeCiphertext("0A 0b\n", "hex", ct, err));
        assert(ct.size() == 2 && ct[0] == 0x0A && ct[1] == 0x0B);
        assert(!decodeCiphertext("0G", "hex", ct, err));
        assert(!decodeCiphertext("x", "base32", ct, err));
    }

    std::cout << "test_end_to_end: ok" << std::endl;
    return 0;
}
