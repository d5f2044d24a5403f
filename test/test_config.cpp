#include "config.h"
#include <cassert>
#include <cstdlib>
#include <iostream>

int main() {
    unsetenv("ORACLE_HOST");
    unsetenv("ORACLE_PORT");
    unsetenv("ORACLE_POOL_SIZE");
    unsetenv("PG_CONN");
    unsetenv("ORACLE_SECRET");

    // Defaults are the reference sizes
    {
        AttackConfig cfg;
        std::string err;
        assert(validateAttackConfig(cfg, err));
        assert(cfg.poolSize == cfg.knownBits + 1);
    }

    // Pool size follows known_bits when absent
    {
        AttackConfig cfg;
        std::string err;
        assert(parseAttackConfig(R"({"host":"10.0.0.7","port":4000,"known_bits":64,
                                     "ciphertext_encoding":"hex","prompt":">>> ","verbose":true})",
                                 cfg, err));
        assert(cfg.host == "10.0.0.7");
        assert(cfg.port == 4000);
        assert(cfg.knownBits == 64);
        assert(cfg.poolSize == 65);
        assert(cfg.ciphertextEncoding == "hex");
        assert(cfg.protocol.prompt == ">>> ");
        assert(cfg.protocol.correctMarker == "Correct");
        assert(cfg.verbose);
        assert(validateAttackConfig(cfg, err));
    }

    // Bad input leaves the config untouched
    {
        AttackConfig cfg;
        std::string err;
        assert(!parseAttackConfig("{not json", cfg, err));
        assert(!parseAttackConfig(R"({"port":70000})", cfg, err));
        assert(!parseAttackConfig(R"({"known_bits":-3})", cfg, err));
        assert(!parseAttackConfig(R"({"host":12})", cfg, err));
        assert(!parseAttackConfig(R"({"window_bits":4294967317})", cfg, err));
        assert(cfg.windowBits == LFSR_WINDOW_BITS);
        assert(cfg.port == ORACLE_DEFAULT_PORT);
        assert(cfg.knownBits == LFSR_KNOWN_BITS);
    }

    // Validation
    {
        std::string err;
        AttackConfig cfg;
        cfg.knownBits = 2 * cfg.windowBits - 1;
        assert(!validateAttackConfig(cfg, err));

        cfg = AttackConfig();
        cfg.tapCount = cfg.windowBits;
        assert(!validateAttackConfig(cfg, err));

        cfg = AttackConfig();
        cfg.signature.clear();
        assert(!validateAttackConfig(cfg, err));

        cfg = AttackConfig();
        cfg.ciphertextEncoding = "base64";
        assert(!validateAttackConfig(cfg, err));

        cfg = AttackConfig();
        cfg.poolSize = 0;
        assert(!validateAttackConfig(cfg, err));

        cfg = AttackConfig();
        cfg.protocol.prompt.clear();
        assert(!validateAttackConfig(cfg, err));
    }

    // Environment overrides the file
    {
        AttackConfig cfg;
        setenv("ORACLE_HOST", "oracle.local", 1);
        setenv("ORACLE_PORT", "9001", 1);
        setenv("ORACLE_POOL_SIZE", "100", 1);
        setenv("PG_CONN", "dbname=lfsr", 1);
        applyAttackEnvironment(cfg);
        assert(cfg.host == "oracle.local");
        assert(cfg.port == 9001);
        assert(cfg.poolSize == 100);
        assert(cfg.pgConn == "dbname=lfsr");

        setenv("ORACLE_PORT", "not-a-port", 1);
        AttackConfig keep;
        applyAttackEnvironment(keep);
        assert(keep.port == ORACLE_DEFAULT_PORT);

        unsetenv("ORACLE_HOST");
        unsetenv("ORACLE_PORT");
        unsetenv("ORACLE_POOL_SIZE");
        unsetenv("PG_CONN");
    }

    // Service config
    {
        OracleServiceConfig svc;
        std::string err;
        assert(!validateServiceConfig(svc, err)); // no secret yet
        assert(parseServiceConfig(R"({"master_secret":"00112233445566778899aabbccddeeff",
                                      "epoch_seconds":5,"plaintext":"FLAG{cfg}"})",
                                  svc, err));
        assert(svc.masterSecret.size() == 16);
        assert(svc.masterSecret[15] == 0xFF);
        assert(svc.epochSeconds == 5);
        assert(validateServiceConfig(svc, err));

        OracleServiceConfig bad = svc;
        assert(!parseServiceConfig(R"({"master_secret":"xyz"})", bad, err));
        bad.wrongMessage = "Correct, not really";
        assert(!validateServiceConfig(bad, err));

        setenv("ORACLE_SECRET", "a1b2", 1);
        applyServiceEnvironment(svc);
        assert(svc.masterSecret.size() == 2 && svc.masterSecret[0] == 0xA1);
        unsetenv("ORACLE_SECRET");
    }

    // Missing file
    {
        AttackConfig cfg;
        std::string err;
        assert(!loadAttackConfig("/nonexistent/lfsr_oracle.json", cfg, err));
        assert(!err.empty());
    }

    std::cout << "test_config: ok" << std::endl;
    return 0;
}
