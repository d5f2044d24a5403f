#pragma once
#include <stdint.h>
#include <stddef.h>
#include <memory>
#include <string>
#include "byte_stream.h"

// Wire conventions of the bit-guessing service.
struct OracleProtocol {
  std::string epochDelimiter = "\n";
  std::string prompt = "> ";
  std::string correctMarker = "Correct";
  std::string lineEnd = "\n";
};

enum class SessionState { Open, Closed };

/**
 * One connection to the oracle.
 *
 * A session is Open after a successful handshake (epoch token read) and
 * becomes Closed the moment a guess is rejected or the stream fails. A
 * Closed session is never used again.
 */
class OracleSession {
public:
  OracleSession(std::unique_ptr<ByteStream> stream, const OracleProtocol& protocol, size_t id = 0);
  ~OracleSession();

  // Read the epoch token the service sends on connect.
  bool handshake(std::string& err);

  // Read up to and including `delimiter`; out receives the text before it.
  bool readUntil(const std::string& delimiter, std::string& out);

  /**
   * Wait for the prompt, send the guess and read the verdict line.
   * Returns false only when the transport failed (session is then Closed);
   * otherwise `correct` holds the verdict and a rejected guess closes the
   * session. A verdict without a line end, or none at all, followed by an
   * orderly close from the peer is judged on the text received.
   */
  bool guessBit(uint8_t bit, bool& correct);

  // Everything the service sends until it closes the stream.
  bool readRemaining(std::string& out);

  void close();

  SessionState state() const { return state_; }
  bool isOpen() const { return state_ == SessionState::Open; }
  const std::string& epoch() const { return epoch_; }
  size_t id() const { return id_; }
  size_t guesses() const { return guesses_; }
  std::string lastError() const { return error_; }

private:
  bool fail(const std::string& what);

  std::unique_ptr<ByteStream> stream_;
  OracleProtocol protocol_;
  SessionState state_;
  std::string epoch_;
  std::string error_;
  size_t id_;
  size_t guesses_;
};
