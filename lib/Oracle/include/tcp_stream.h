#pragma once
#include <stdint.h>
#include <array>
#include <chrono>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include "byte_stream.h"

/**
 * Blocking TCP stream with per-operation timeouts.
 *
 * Each stream owns its io_context; asynchronous operations are started and
 * the context is run for at most the timeout, cancelling the operation when
 * it expires. Meant to be used from one thread at a time.
 */
class TcpByteStream : public ByteStream {
public:
  TcpByteStream(std::chrono::milliseconds readTimeout);
  ~TcpByteStream() override;

  static std::unique_ptr<TcpByteStream> connect(const std::string& host, uint16_t port,
                                                std::chrono::milliseconds connectTimeout,
                                                std::chrono::milliseconds readTimeout,
                                                std::string& err);

  bool readByte(char& c) override;
  bool write(const std::string& data) override;
  void close() override;
  bool atEof() const override { return eof_; }
  std::string lastError() const override { return error_; }

private:
  bool open(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);
  bool fill();
  void runFor(std::chrono::milliseconds timeout);

  boost::asio::io_context io_;
  boost::asio::ip::tcp::socket socket_;
  std::chrono::milliseconds readTimeout_;
  std::array<char, 4096> buf_;
  size_t pos_;
  size_t len_;
  bool eof_;
  std::string error_;
};
