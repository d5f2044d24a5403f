#include "config.h"
#include "bitutils.h"
#include <crow/json.h>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

// -----------------------------------------------------------------------------
// JSON field helpers (crow throws std::runtime_error on a type mismatch)
// -----------------------------------------------------------------------------

template <typename T>
static void readUnsigned(const crow::json::rvalue& body, const char* key, T& dst) {
  if (!body.has(key)) return;
  int64_t v = body[key].i();
  if (v < 0) throw std::runtime_error(std::string(key) + " must not be negative");
  if ((uint64_t)v > (uint64_t)std::numeric_limits<T>::max()) {
    throw std::runtime_error(std::string(key) + " out of range");
  }
  dst = (T)v;
}

static void readString(const crow::json::rvalue& body, const char* key, std::string& dst) {
  if (body.has(key)) dst = std::string(body[key].s());
}

static void readBool(const crow::json::rvalue& body, const char* key, bool& dst) {
  if (body.has(key)) dst = body[key].b();
}

static void readProtocol(const crow::json::rvalue& body, OracleProtocol& p) {
  readString(body, "prompt", p.prompt);
  readString(body, "correct_marker", p.correctMarker);
  readString(body, "epoch_delimiter", p.epochDelimiter);
  readString(body, "line_end", p.lineEnd);
}

static bool readPort(const crow::json::rvalue& body, uint16_t& port, std::string& err) {
  if (!body.has("port")) return true;
  int64_t v = body["port"].i();
  if (v <= 0 || v > 65535) {
    err = "port out of range: " + std::to_string(v);
    return false;
  }
  port = (uint16_t)v;
  return true;
}

static bool envUnsigned(const char* name, unsigned long& out) {
  const char* v = std::getenv(name);
  if (!v || !*v) return false;
  try {
    out = std::stoul(v);
    return true;
  } catch (const std::exception& e) {
    log_error(std::string("Ignoring ") + name + "='" + v + "': " + e.what());
    return false;
  }
}

static bool validateProtocol(const OracleProtocol& p, std::string& err) {
  if (p.prompt.empty() || p.correctMarker.empty() || p.epochDelimiter.empty() || p.lineEnd.empty()) {
    err = "protocol delimiters and marker must be non-empty";
    return false;
  }
  return true;
}

static bool validateSizes(unsigned w, unsigned k, size_t bits, const char* bitsKey, std::string& err) {
  if (w < 2 || w > LFSR_MAX_WINDOW_BITS) {
    err = "window_bits must be in [2, " + std::to_string(LFSR_MAX_WINDOW_BITS) + "]";
    return false;
  }
  if (k == 0 || k >= w) {
    err = "tap_count must be in [1, window_bits - 1]";
    return false;
  }
  if (bits < 2 * (size_t)w) {
    err = std::string(bitsKey) + " must be at least 2 * window_bits";
    return false;
  }
  return true;
}

bool readTextFile(const std::string& path, std::string& out, std::string& err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    err = "cannot open " + path;
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

// -----------------------------------------------------------------------------
// Attack (client) config
// -----------------------------------------------------------------------------

bool parseAttackConfig(const std::string& text, AttackConfig& out, std::string& err) {
  auto body = crow::json::load(text);
  if (!body) {
    err = "config is not valid JSON";
    return false;
  }
  AttackConfig cfg = out;
  try {
    readString(body, "host", cfg.host);
    if (!readPort(body, cfg.port, err)) return false;
    readUnsigned(body, "known_bits", cfg.knownBits);
    if (body.has("pool_size")) {
      readUnsigned(body, "pool_size", cfg.poolSize);
    } else {
      cfg.poolSize = cfg.knownBits + 1;
    }
    readUnsigned(body, "window_bits", cfg.windowBits);
    readUnsigned(body, "tap_count", cfg.tapCount);
    readString(body, "signature", cfg.signature);
    readString(body, "ciphertext_encoding", cfg.ciphertextEncoding);
    readProtocol(body, cfg.protocol);
    readUnsigned(body, "connect_timeout_ms", cfg.connectTimeoutMs);
    readUnsigned(body, "read_timeout_ms", cfg.readTimeoutMs);
    readUnsigned(body, "search_shards", cfg.searchShards);
    readBool(body, "require_unique_taps", cfg.requireUniqueTaps);
    readBool(body, "verbose", cfg.verbose);
    readString(body, "pg_conn", cfg.pgConn);
  } catch (const std::exception& e) {
    err = std::string("bad config value: ") + e.what();
    return false;
  }
  out = cfg;
  return true;
}

bool loadAttackConfig(const std::string& path, AttackConfig& out, std::string& err) {
  std::string text;
  if (!readTextFile(path, text, err)) return false;
  if (!parseAttackConfig(text, out, err)) {
    err = path + ": " + err;
    return false;
  }
  return true;
}

void applyAttackEnvironment(AttackConfig& cfg) {
  const char* host = std::getenv("ORACLE_HOST");
  if (host && *host) cfg.host = host;
  unsigned long v = 0;
  if (envUnsigned("ORACLE_PORT", v) && v > 0 && v <= 65535) cfg.port = (uint16_t)v;
  if (envUnsigned("ORACLE_POOL_SIZE", v)) cfg.poolSize = v;
  const char* pg = std::getenv("PG_CONN");
  if (pg && *pg) cfg.pgConn = pg;
}

bool validateAttackConfig(const AttackConfig& cfg, std::string& err) {
  if (!validateSizes(cfg.windowBits, cfg.tapCount, cfg.knownBits, "known_bits", err)) return false;
  if (cfg.poolSize == 0) {
    err = "pool_size must be at least 1";
    return false;
  }
  if (cfg.signature.empty()) {
    err = "signature must be non-empty";
    return false;
  }
  if (cfg.ciphertextEncoding != "raw" && cfg.ciphertextEncoding != "hex") {
    err = "ciphertext_encoding must be \"raw\" or \"hex\"";
    return false;
  }
  if (cfg.readTimeoutMs == 0 || cfg.connectTimeoutMs == 0) {
    err = "timeouts must be positive";
    return false;
  }
  return validateProtocol(cfg.protocol, err);
}

// -----------------------------------------------------------------------------
// Oracle service config
// -----------------------------------------------------------------------------

bool parseServiceConfig(const std::string& text, OracleServiceConfig& out, std::string& err) {
  auto body = crow::json::load(text);
  if (!body) {
    err = "config is not valid JSON";
    return false;
  }
  OracleServiceConfig cfg = out;
  try {
    if (!readPort(body, cfg.port, err)) return false;
    readUnsigned(body, "hidden_bits", cfg.hiddenBits);
    readUnsigned(body, "window_bits", cfg.windowBits);
    readUnsigned(body, "tap_count", cfg.tapCount);
    readUnsigned(body, "epoch_seconds", cfg.epochSeconds);
    if (body.has("master_secret")) {
      std::string hex = std::string(body["master_secret"].s());
      if (!hexToBytes(hex, cfg.masterSecret)) {
        err = "master_secret is not a hex string";
        return false;
      }
    }
    readString(body, "plaintext", cfg.plaintext);
    readString(body, "ciphertext_encoding", cfg.ciphertextEncoding);
    readString(body, "correct_message", cfg.correctMessage);
    readString(body, "wrong_message", cfg.wrongMessage);
    readProtocol(body, cfg.protocol);
  } catch (const std::exception& e) {
    err = std::string("bad config value: ") + e.what();
    return false;
  }
  out = cfg;
  return true;
}

bool loadServiceConfig(const std::string& path, OracleServiceConfig& out, std::string& err) {
  std::string text;
  if (!readTextFile(path, text, err)) return false;
  if (!parseServiceConfig(text, out, err)) {
    err = path + ": " + err;
    return false;
  }
  return true;
}

void applyServiceEnvironment(OracleServiceConfig& cfg) {
  unsigned long v = 0;
  if (envUnsigned("ORACLE_PORT", v) && v > 0 && v <= 65535) cfg.port = (uint16_t)v;
  const char* secret = std::getenv("ORACLE_SECRET");
  if (secret && *secret) {
    std::vector<uint8_t> bytes;
    if (hexToBytes(secret, bytes) && !bytes.empty()) {
      cfg.masterSecret = bytes;
    } else {
      log_error("Ignoring ORACLE_SECRET: not a hex string");
    }
  }
}

bool validateServiceConfig(const OracleServiceConfig& cfg, std::string& err) {
  if (!validateSizes(cfg.windowBits, cfg.tapCount, cfg.hiddenBits, "hidden_bits", err)) return false;
  if (cfg.epochSeconds == 0) {
    err = "epoch_seconds must be at least 1";
    return false;
  }
  if (cfg.masterSecret.empty()) {
    err = "master_secret is required";
    return false;
  }
  if (cfg.plaintext.empty()) {
    err = "plaintext must be non-empty";
    return false;
  }
  if (cfg.ciphertextEncoding != "raw" && cfg.ciphertextEncoding != "hex") {
    err = "ciphertext_encoding must be \"raw\" or \"hex\"";
    return false;
  }
  if (cfg.protocol.correctMarker.empty() ||
      cfg.correctMessage.find(cfg.protocol.correctMarker) == std::string::npos ||
      cfg.wrongMessage.find(cfg.protocol.correctMarker) != std::string::npos) {
    err = "correct_message must contain the marker and wrong_message must not";
    return false;
  }
  return validateProtocol(cfg.protocol, err);
}
