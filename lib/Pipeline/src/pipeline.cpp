#include "pipeline.h"
#include "bit_extractor.h"
#include "tcp_stream.h"
#include <cctype>
#include <chrono>
#include <ctime>

SessionFactory makeTcpSessionFactory(const AttackConfig& cfg) {
  return [cfg](size_t index, std::string& err) -> std::unique_ptr<OracleSession> {
    std::unique_ptr<TcpByteStream> stream =
        TcpByteStream::connect(cfg.host, cfg.port,
                               std::chrono::milliseconds(cfg.connectTimeoutMs),
                               std::chrono::milliseconds(cfg.readTimeoutMs), err);
    if (!stream) return nullptr;
    std::unique_ptr<OracleSession> s(new OracleSession(std::move(stream), cfg.protocol, index));
    if (!s->handshake(err)) return nullptr;
    return s;
  };
}

SessionFactory makeSimulatedSessionFactory(OracleService& service, const OracleProtocol& protocol,
                                           const std::string& fixedEpoch) {
  return [&service, protocol, fixedEpoch](size_t index, std::string& err) -> std::unique_ptr<OracleSession> {
    std::string epoch = fixedEpoch.empty() ? service.epochFor(time(nullptr)) : fixedEpoch;
    std::shared_ptr<const EpochMaterial> material;
    if (!service.material(epoch, material, err)) return nullptr;
    std::unique_ptr<ByteStream> stream(new SimulatedOracleStream(material, service.config()));
    std::unique_ptr<OracleSession> s(new OracleSession(std::move(stream), protocol, index));
    if (!s->handshake(err)) return nullptr;
    return s;
  };
}

bool decodeCiphertext(const std::string& tail, const std::string& encoding,
                      std::vector<uint8_t>& out, std::string& err) {
  if (encoding == "raw") {
    out.assign(tail.begin(), tail.end());
    return true;
  }
  if (encoding == "hex") {
    std::string hex;
    for (char c : tail) {
      if (!std::isspace((unsigned char)c)) hex.push_back(c);
    }
    if (!hexToBytes(hex, out)) {
      err = "ciphertext tail is not valid hex";
      return false;
    }
    return true;
  }
  err = "unknown ciphertext encoding '" + encoding + "'";
  return false;
}

bool runRecovery(const AttackConfig& cfg, const SessionFactory& factory,
                 RecoveryOutcome& out, RecoveryStatus& status) {
  // ---- sessions ----
  SessionPool pool;
  size_t opened = pool.populate(factory, cfg.poolSize);
  if (opened == 0) {
    return setFailure(status, RecoveryError::HandshakeFailed, "populate",
                      "no session completed the handshake");
  }
  if (opened < cfg.knownBits + 1) {
    log_info("Pipeline", "pool holds " + std::to_string(opened) + " sessions; fewer than the " +
                         std::to_string(cfg.knownBits + 1) + " an all-ones sequence would need");
  }
  out.epoch = pool.epoch();

  // ---- bits ----
  BitExtractor extractor(pool, cfg.verbose);
  bool extracted = extractor.extract(cfg.knownBits, out.knownBits, status);
  out.sessionsAcquired = extractor.sessionsAcquired();
  out.sessionsBurned = extractor.sessionsBurned();
  if (!extracted) return false;
  log_info("Pipeline", "known bits: " + bitsToString(out.knownBits));

  // ---- ciphertext tail ----
  std::unique_ptr<OracleSession> winner = extractor.releaseSession();
  std::string tail;
  if (!winner || !winner->readRemaining(tail)) {
    return setFailure(status, RecoveryError::TransportError, "ciphertext",
                      winner ? winner->lastError() : "no session left");
  }
  std::string err;
  if (!decodeCiphertext(tail, cfg.ciphertextEncoding, out.ciphertext, err)) {
    return setFailure(status, RecoveryError::TransportError, "ciphertext", err);
  }
  logHex("Pipeline", "ciphertext", out.ciphertext);

  // ---- taps ----
  TapRecoveryOptions opt;
  opt.windowBits = cfg.windowBits;
  opt.tapCount = cfg.tapCount;
  opt.shards = cfg.searchShards;
  opt.requireUnique = cfg.requireUniqueTaps;
  if (!recoverTaps(out.knownBits, opt, out.taps, status)) return false;

  // ---- plaintext ----
  WindowLFSR recovered(out.taps.window, out.taps.tapMask, cfg.windowBits);
  return decryptWithOffsetSearch(recovered, out.knownBits.size(), out.ciphertext,
                                 cfg.signature, out.decrypted, status);
}
