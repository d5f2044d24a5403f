#pragma once
#include <stdint.h>
#include <stddef.h>
#include <time.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "common.h"
#include "bitutils.h"
#include "byte_stream.h"
#include "oracle_session.h"

struct OracleServiceConfig {
  uint16_t port = ORACLE_DEFAULT_PORT;
  size_t hiddenBits = LFSR_KNOWN_BITS;
  unsigned windowBits = LFSR_WINDOW_BITS;
  unsigned tapCount = LFSR_TAP_COUNT;
  unsigned epochSeconds = 1;
  std::vector<uint8_t> masterSecret;
  std::string plaintext = "FLAG{lfsr_0racle_r4ce}";
  std::string ciphertextEncoding = "raw";
  std::string correctMessage = "Correct!";
  std::string wrongMessage = "Wrong!";
  OracleProtocol protocol;
};

// Everything the service needs to serve one epoch.
struct EpochMaterial {
  std::string epoch;
  BitSequence hiddenBits;
  std::string tail; // ciphertext as sent on the wire
};

// Hidden bits = first hiddenBits outputs; ciphertext = plaintext XOR the following keystream.
bool buildEpochMaterial(const OracleServiceConfig& cfg, const std::string& epoch,
                        EpochMaterial& out, std::string& err);

/**
 * Service-side state shared by all connections: epoch clock plus a small
 * cache of derived epoch material.
 */
class OracleService {
public:
  explicit OracleService(const OracleServiceConfig& cfg);

  std::string epochFor(time_t now) const;
  bool material(const std::string& epoch, std::shared_ptr<const EpochMaterial>& out, std::string& err);
  const OracleServiceConfig& config() const { return cfg_; }

private:
  OracleServiceConfig cfg_;
  std::mutex mu_;
  std::map<std::string, std::shared_ptr<const EpochMaterial>> cache_;
};

/**
 * Per-connection protocol state machine.
 * greeting() is sent on connect; each complete input line goes to onLine()
 * and the returned text is sent back. Once finished() the service closes.
 */
class OracleConversation {
public:
  OracleConversation(std::shared_ptr<const EpochMaterial> material, const OracleServiceConfig& cfg);

  std::string greeting() const;
  std::string onLine(const std::string& line);

  bool finished() const { return finished_; }
  size_t position() const { return position_; }

private:
  std::shared_ptr<const EpochMaterial> material_;
  OracleProtocol protocol_;
  std::string correctMessage_;
  std::string wrongMessage_;
  size_t position_;
  bool finished_;
};

/**
 * In-process ByteStream talking to an OracleConversation. Reads never
 * block: when nothing is buffered the read fails, as an EOF if the service
 * side is finished or as a stall otherwise.
 */
class SimulatedOracleStream : public ByteStream {
public:
  SimulatedOracleStream(std::shared_ptr<const EpochMaterial> material, const OracleServiceConfig& cfg);

  bool readByte(char& c) override;
  bool write(const std::string& data) override;
  void close() override { closed_ = true; }
  bool atEof() const override { return eof_; }
  std::string lastError() const override { return error_; }

private:
  OracleConversation conv_;
  std::string lineEnd_;
  std::string pending_;
  std::string line_;
  size_t readPos_;
  bool closed_;
  bool eof_;
  std::string error_;
};
