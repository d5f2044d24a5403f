#include "oracle_service.h"
#include "crypto_kdf.h"
#include "lfsr.h"

// Epochs kept around for slow clients that connected just before a rollover
#define EPOCH_CACHE_SIZE 8

bool buildEpochMaterial(const OracleServiceConfig& cfg, const std::string& epoch,
                        EpochMaterial& out, std::string& err) {
  if (cfg.masterSecret.empty()) {
    err = "service master secret is empty";
    return false;
  }
  if (cfg.ciphertextEncoding != "raw" && cfg.ciphertextEncoding != "hex") {
    err = "unknown ciphertext encoding '" + cfg.ciphertextEncoding + "'";
    return false;
  }

  EpochGenerator gen;
  if (!deriveEpochGenerator(cfg.masterSecret.data(), cfg.masterSecret.size(), epoch,
                            cfg.windowBits, cfg.tapCount, gen)) {
    err = "generator derivation failed for epoch " + epoch;
    return false;
  }

  WindowLFSR lfsr(gen.window, tapsToMask(gen.taps), gen.width);
  out.epoch = epoch;
  out.hiddenBits.clear();
  lfsr.generate(out.hiddenBits, cfg.hiddenBits);

  BitSequence ks;
  lfsr.generate(ks, cfg.plaintext.size() * 8);
  std::vector<uint8_t> ct(cfg.plaintext.begin(), cfg.plaintext.end());
  xorInPlace(ct, packBitsMsbFirst(ks));

  if (cfg.ciphertextEncoding == "hex") {
    out.tail = bytesToHex(ct);
  } else {
    out.tail.assign(ct.begin(), ct.end());
  }
  return true;
}

// -----------------------------------------------------------------------------
// OracleService
// -----------------------------------------------------------------------------

OracleService::OracleService(const OracleServiceConfig& cfg)
  : cfg_(cfg)
{
}

std::string OracleService::epochFor(time_t now) const {
  long long period = cfg_.epochSeconds ? (long long)cfg_.epochSeconds : 1;
  return std::to_string((long long)now / period);
}

bool OracleService::material(const std::string& epoch, std::shared_ptr<const EpochMaterial>& out,
                             std::string& err) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = cache_.find(epoch);
  if (it != cache_.end()) {
    out = it->second;
    return true;
  }

  std::shared_ptr<EpochMaterial> m = std::make_shared<EpochMaterial>();
  if (!buildEpochMaterial(cfg_, epoch, *m, err)) return false;
  cache_[epoch] = m;
  while (cache_.size() > EPOCH_CACHE_SIZE) cache_.erase(cache_.begin()); // oldest epoch first
  out = m;
  return true;
}

// -----------------------------------------------------------------------------
// OracleConversation
// -----------------------------------------------------------------------------

OracleConversation::OracleConversation(std::shared_ptr<const EpochMaterial> material,
                                       const OracleServiceConfig& cfg)
  : material_(std::move(material)), protocol_(cfg.protocol),
    correctMessage_(cfg.correctMessage), wrongMessage_(cfg.wrongMessage),
    position_(0), finished_(false)
{
  if (material_->hiddenBits.empty()) finished_ = true;
}

std::string OracleConversation::greeting() const {
  std::string g = material_->epoch + protocol_.epochDelimiter;
  g += material_->hiddenBits.empty() ? material_->tail : protocol_.prompt;
  return g;
}

std::string OracleConversation::onLine(const std::string& line) {
  if (finished_) return "";

  std::string guess = line;
  while (!guess.empty() && (guess.back() == '\r' || guess.back() == ' ')) guess.pop_back();

  const BitSequence& hidden = material_->hiddenBits;
  if ((guess != "0" && guess != "1") || (uint8_t)(guess[0] - '0') != hidden[position_]) {
    finished_ = true;
    return wrongMessage_ + protocol_.lineEnd;
  }

  ++position_;
  if (position_ == hidden.size()) {
    finished_ = true;
    return correctMessage_ + protocol_.lineEnd + material_->tail;
  }
  return correctMessage_ + protocol_.lineEnd + protocol_.prompt;
}

// -----------------------------------------------------------------------------
// SimulatedOracleStream
// -----------------------------------------------------------------------------

SimulatedOracleStream::SimulatedOracleStream(std::shared_ptr<const EpochMaterial> material,
                                             const OracleServiceConfig& cfg)
  : conv_(std::move(material), cfg), lineEnd_(cfg.protocol.lineEnd),
    readPos_(0), closed_(false), eof_(false)
{
  pending_ = conv_.greeting();
}

bool SimulatedOracleStream::readByte(char& c) {
  if (closed_) {
    error_ = "stream closed";
    return false;
  }
  if (readPos_ < pending_.size()) {
    c = pending_[readPos_++];
    return true;
  }
  if (conv_.finished()) {
    eof_ = true;
    error_ = "closed by peer";
  } else {
    error_ = "no data, service is waiting for input";
  }
  return false;
}

bool SimulatedOracleStream::write(const std::string& data) {
  if (closed_ || conv_.finished()) {
    error_ = "broken pipe";
    return false;
  }
  if (readPos_ == pending_.size()) {
    pending_.clear();
    readPos_ = 0;
  }
  for (char c : data) {
    line_.push_back(c);
    if (line_.size() >= lineEnd_.size() &&
        line_.compare(line_.size() - lineEnd_.size(), lineEnd_.size(), lineEnd_) == 0) {
      line_.resize(line_.size() - lineEnd_.size());
      pending_ += conv_.onLine(line_);
      line_.clear();
    }
  }
  return true;
}
