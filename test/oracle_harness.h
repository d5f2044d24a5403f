#pragma once

#include "bitutils.h"
#include "lfsr.h"
#include "oracle_service.h"
#include "oracle_session.h"
#include "session_pool.h"

#include <algorithm>
#include <memory>
#include <random>
#include <string>
#include <vector>

// Fixed-secret service settings for the reference sizes.
inline OracleServiceConfig harnessServiceConfig() {
    OracleServiceConfig cfg;
    cfg.masterSecret.assign(32, 0x5A);
    cfg.plaintext = "FLAG{harness_known_plaintext}";
    return cfg;
}

inline std::shared_ptr<const EpochMaterial> makeMaterial(const std::string& epoch,
                                                         const BitSequence& hidden,
                                                         const std::string& tail = "") {
    std::shared_ptr<EpochMaterial> m = std::make_shared<EpochMaterial>();
    m->epoch = epoch;
    m->hiddenBits = hidden;
    m->tail = tail;
    return m;
}

// Handshaked session over an in-process oracle; nullptr if the handshake failed.
inline std::unique_ptr<OracleSession> openSimulated(std::shared_ptr<const EpochMaterial> material,
                                                    const OracleServiceConfig& cfg, size_t id) {
    std::unique_ptr<ByteStream> stream(new SimulatedOracleStream(material, cfg));
    std::unique_ptr<OracleSession> s(new OracleSession(std::move(stream), cfg.protocol, id));
    std::string err;
    if (!s->handshake(err)) return nullptr;
    return s;
}

// Canned service: sends `greeting`, answers the i-th written line with replies[i]
// and closes after the last reply. Running dry before that is a stall, not an EOF.
class ScriptedStream : public ByteStream {
public:
    ScriptedStream(const std::string& greeting, const std::vector<std::string>& replies)
        : pending_(greeting), replies_(replies), answered_(0), eof_(false) {}

    bool readByte(char& c) override {
        if (!pending_.empty()) {
            c = pending_[0];
            pending_.erase(0, 1);
            return true;
        }
        if (answered_ == replies_.size()) {
            eof_ = true;
            error_ = "closed by peer";
        } else {
            error_ = "stalled";
        }
        return false;
    }

    bool write(const std::string& data) override {
        if (answered_ == replies_.size()) {
            error_ = "broken pipe";
            return false;
        }
        if (data.find('\n') != std::string::npos) pending_ += replies_[answered_++];
        return true;
    }

    void close() override {}
    bool atEof() const override { return eof_; }
    std::string lastError() const override { return error_; }

private:
    std::string pending_;
    std::vector<std::string> replies_;
    size_t answered_;
    bool eof_;
    std::string error_;
};

inline std::unique_ptr<OracleSession> openScripted(const std::string& greeting,
                                                   const std::vector<std::string>& replies, size_t id) {
    std::unique_ptr<ByteStream> stream(new ScriptedStream(greeting, replies));
    std::unique_ptr<OracleSession> s(new OracleSession(std::move(stream), OracleProtocol(), id));
    std::string err;
    if (!s->handshake(err)) return nullptr;
    return s;
}

inline void fillPool(SessionPool& pool, std::shared_ptr<const EpochMaterial> material,
                     const OracleServiceConfig& cfg, size_t count) {
    for (size_t i = 0; i < count; ++i) pool.admit(openSimulated(material, cfg, i));
}

inline BitSequence randomBits(std::mt19937_64& rng, size_t n) {
    BitSequence bits(n);
    for (auto& b : bits) b = (uint8_t)(rng() & 1u);
    return bits;
}

// K distinct sorted indices from [0, n)
inline std::vector<unsigned> randomTaps(std::mt19937_64& rng, unsigned n, unsigned k) {
    std::vector<unsigned> all(n);
    for (unsigned i = 0; i < n; ++i) all[i] = i;
    std::shuffle(all.begin(), all.end(), rng);
    std::vector<unsigned> taps(all.begin(), all.begin() + k);
    std::sort(taps.begin(), taps.end());
    return taps;
}
