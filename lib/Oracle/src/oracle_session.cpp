#include "oracle_session.h"

OracleSession::OracleSession(std::unique_ptr<ByteStream> stream, const OracleProtocol& protocol, size_t id)
  : stream_(std::move(stream)), protocol_(protocol), state_(SessionState::Closed), id_(id), guesses_(0)
{
}

OracleSession::~OracleSession() {
  close();
}

bool OracleSession::fail(const std::string& what) {
  error_ = what;
  if (stream_) error_ += ": " + stream_->lastError();
  close();
  return false;
}

bool OracleSession::handshake(std::string& err) {
  if (!stream_) {
    err = "no stream";
    return false;
  }
  std::string token;
  if (!readUntil(protocol_.epochDelimiter, token)) {
    fail("epoch token");
    err = error_;
    return false;
  }
  // Tolerate CRLF services
  while (!token.empty() && (token.back() == '\r' || token.back() == ' ')) token.pop_back();
  if (token.empty()) {
    fail("empty epoch token");
    err = error_;
    return false;
  }
  epoch_ = token;
  state_ = SessionState::Open;
  return true;
}

bool OracleSession::readUntil(const std::string& delimiter, std::string& out) {
  out.clear();
  if (!stream_ || delimiter.empty()) return false;
  char c;
  while (stream_->readByte(c)) {
    out.push_back(c);
    if (out.size() >= delimiter.size() &&
        out.compare(out.size() - delimiter.size(), delimiter.size(), delimiter) == 0) {
      out.resize(out.size() - delimiter.size());
      return true;
    }
  }
  return false;
}

bool OracleSession::guessBit(uint8_t bit, bool& correct) {
  correct = false;
  if (!isOpen()) {
    error_ = "guess on closed session";
    return false;
  }
  std::string ignored;
  if (!readUntil(protocol_.prompt, ignored)) return fail("waiting for prompt");

  std::string guess(1, bit ? '1' : '0');
  guess += protocol_.lineEnd;
  if (!stream_->write(guess)) return fail("sending guess");
  ++guesses_;

  std::string verdict;
  if (!readUntil(protocol_.lineEnd, verdict) && !stream_->atEof()) return fail("reading verdict");

  // An orderly close may cut the verdict short; judge whatever arrived
  correct = verdict.find(protocol_.correctMarker) != std::string::npos;
  if (!correct) close();
  return true;
}

bool OracleSession::readRemaining(std::string& out) {
  out.clear();
  if (!stream_) return false;
  char c;
  while (stream_->readByte(c)) out.push_back(c);
  if (!stream_->atEof()) {
    error_ = "reading tail: " + stream_->lastError();
    return false;
  }
  return true;
}

void OracleSession::close() {
  state_ = SessionState::Closed;
  if (stream_) stream_->close();
}
