#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "common.h"
#include "config.h"
#include "pipeline.h"
#include "recovery_store.h"

static void usage(const char* argv0) {
  std::cout << "usage: " << argv0 << " [config.json] [--simulate]" << std::endl;
  std::cout << "  --simulate   run against an in-process oracle instead of host:port" << std::endl;
  std::cout << "  env: ORACLE_HOST, ORACLE_PORT, ORACLE_POOL_SIZE, PG_CONN" << std::endl;
}

// Service settings mirroring the client's sizes, with a fresh random secret.
static OracleServiceConfig simulatedService(const AttackConfig& cfg) {
  OracleServiceConfig svc;
  svc.hiddenBits = cfg.knownBits;
  svc.windowBits = cfg.windowBits;
  svc.tapCount = cfg.tapCount;
  svc.epochSeconds = 3600; // keep the whole pool inside one epoch
  svc.ciphertextEncoding = cfg.ciphertextEncoding;
  svc.protocol = cfg.protocol;
  svc.plaintext = cfg.signature + "simulated_0racle_run}";
  std::random_device rd;
  svc.masterSecret.resize(32);
  for (auto& b : svc.masterSecret) b = (uint8_t)(rd() & 0xFF);
  return svc;
}

static void storeOutcome(const AttackConfig& cfg, const RecoveryOutcome& outcome) {
  RecoveryStore store(cfg.pgConn);
  std::string err;
  if (!store.open(err)) {
    log_error("Result not stored: " + err);
    return;
  }
  RecoveryRecord rec;
  rec.epoch = outcome.epoch;
  rec.knownBits = outcome.knownBits;
  rec.taps = outcome.taps.taps;
  rec.window = windowToBits(outcome.taps.window, cfg.windowBits);
  rec.offset = outcome.decrypted.offset;
  rec.plaintext = outcome.decrypted.plaintext;
  rec.sessionsUsed = outcome.sessionsAcquired;
  if (!store.save(rec, err)) {
    log_error("Result not stored: " + err);
    return;
  }
  std::cout << "Result stored in recovery_runs" << std::endl;
}

int main(int argc, char** argv) {
  std::string configPath;
  bool simulate = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--simulate") {
      simulate = true;
    } else if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return 0;
    } else if (configPath.empty()) {
      configPath = arg;
    } else {
      usage(argv[0]);
      return 2;
    }
  }

  try {
    AttackConfig cfg;
    std::string err;
    if (!configPath.empty() && !loadAttackConfig(configPath, cfg, err)) {
      log_error("ConfigError: " + err);
      return 2;
    }
    applyAttackEnvironment(cfg);
    if (!validateAttackConfig(cfg, err)) {
      log_error("ConfigError: " + err);
      return 2;
    }

    std::unique_ptr<OracleService> service;
    SessionFactory factory;
    if (simulate) {
      OracleServiceConfig svc = simulatedService(cfg);
      service.reset(new OracleService(svc));
      factory = makeSimulatedSessionFactory(*service, cfg.protocol);
      std::cout << "Running against the in-process oracle" << std::endl;
    } else {
      factory = makeTcpSessionFactory(cfg);
      std::cout << "Oracle at " << cfg.host << ":" << cfg.port
                << ", pool of " << cfg.poolSize << ", " << cfg.knownBits << " bits" << std::endl;
    }

    RecoveryOutcome outcome;
    RecoveryStatus status;
    if (!runRecovery(cfg, factory, outcome, status)) {
      std::cerr << "Recovery failed: " << describeStatus(status) << std::endl;
      if (!outcome.knownBits.empty()) {
        std::cerr << "Bits known so far: " << bitsToString(outcome.knownBits) << std::endl;
      }
      return 1;
    }

    std::cout << "Epoch:        " << outcome.epoch << std::endl;
    std::cout << "Known bits:   " << bitsToString(outcome.knownBits) << std::endl;
    std::cout << "Sessions:     " << outcome.sessionsAcquired << " acquired, "
              << outcome.sessionsBurned << " burned" << std::endl;
    std::cout << "Taps:         {" << formatTaps(outcome.taps.taps) << "}" << std::endl;
    std::cout << "State window: " << bitsToString(windowToBits(outcome.taps.window, cfg.windowBits)) << std::endl;
    std::cout << "Offset:       " << outcome.decrypted.offset << std::endl;
    std::cout << "Plaintext:    "
              << std::string(outcome.decrypted.plaintext.begin(), outcome.decrypted.plaintext.end())
              << std::endl;

    if (!cfg.pgConn.empty()) storeOutcome(cfg, outcome);
  } catch (const std::exception& e) {
    log_error("Main application error: " + std::string(e.what()));
    return 1;
  }
  return 0;
}
