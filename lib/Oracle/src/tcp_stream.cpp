#include "tcp_stream.h"

using boost::asio::ip::tcp;

TcpByteStream::TcpByteStream(std::chrono::milliseconds readTimeout)
  : io_(), socket_(io_), readTimeout_(readTimeout), pos_(0), len_(0), eof_(false)
{
}

TcpByteStream::~TcpByteStream() {
  close();
}

std::unique_ptr<TcpByteStream> TcpByteStream::connect(const std::string& host, uint16_t port,
                                                      std::chrono::milliseconds connectTimeout,
                                                      std::chrono::milliseconds readTimeout,
                                                      std::string& err) {
  std::unique_ptr<TcpByteStream> s(new TcpByteStream(readTimeout));
  if (!s->open(host, port, connectTimeout)) {
    err = s->lastError();
    return nullptr;
  }
  return s;
}

// Run the context until the pending operation completes or the timeout expires.
void TcpByteStream::runFor(std::chrono::milliseconds timeout) {
  io_.restart();
  io_.run_for(timeout);
  if (!io_.stopped()) {
    // Timed out: cancel and let the aborted handler run before locals go away
    boost::system::error_code ignored;
    socket_.cancel(ignored);
    io_.restart();
    io_.run();
  }
}

bool TcpByteStream::open(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
  boost::system::error_code ec;
  tcp::resolver resolver(io_);
  auto endpoints = resolver.resolve(host, std::to_string(port), ec);
  if (ec) {
    error_ = "resolve " + host + ": " + ec.message();
    return false;
  }

  ec = boost::asio::error::would_block;
  boost::asio::async_connect(socket_, endpoints,
      [&ec](const boost::system::error_code& result, const tcp::endpoint&) { ec = result; });
  runFor(timeout);

  if (ec == boost::asio::error::would_block || ec == boost::asio::error::operation_aborted) {
    error_ = "connect " + host + ":" + std::to_string(port) + ": timed out";
    close();
    return false;
  }
  if (ec) {
    error_ = "connect " + host + ":" + std::to_string(port) + ": " + ec.message();
    close();
    return false;
  }
  socket_.set_option(tcp::no_delay(true), ec);
  return true;
}

bool TcpByteStream::fill() {
  if (!socket_.is_open()) {
    if (error_.empty()) error_ = "socket closed";
    return false;
  }
  boost::system::error_code ec = boost::asio::error::would_block;
  size_t n = 0;
  socket_.async_read_some(boost::asio::buffer(buf_),
      [&ec, &n](const boost::system::error_code& result, size_t got) { ec = result; n = got; });
  runFor(readTimeout_);

  if (ec == boost::asio::error::would_block || ec == boost::asio::error::operation_aborted) {
    error_ = "read timed out";
    return false;
  }
  if (ec == boost::asio::error::eof) {
    eof_ = true;
    error_ = "closed by peer";
    return false;
  }
  if (ec) {
    error_ = "read: " + ec.message();
    return false;
  }
  pos_ = 0;
  len_ = n;
  return n > 0;
}

bool TcpByteStream::readByte(char& c) {
  if (pos_ >= len_ && !fill()) return false;
  c = buf_[pos_++];
  return true;
}

bool TcpByteStream::write(const std::string& data) {
  boost::system::error_code ec;
  boost::asio::write(socket_, boost::asio::buffer(data), ec);
  if (ec) {
    error_ = "write: " + ec.message();
    return false;
  }
  return true;
}

void TcpByteStream::close() {
  if (!socket_.is_open()) return;
  boost::system::error_code ignored;
  socket_.shutdown(tcp::socket::shutdown_both, ignored);
  socket_.close(ignored);
}
