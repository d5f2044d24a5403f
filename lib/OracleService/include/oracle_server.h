#pragma once
#include <stdint.h>
#include <stddef.h>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "oracle_service.h"

// Greet one accepted client with the current epoch and answer its guess lines
// until the conversation ends or the client leaves. Closes the socket.
void serveOracleClient(boost::asio::ip::tcp::socket& sock, OracleService& service, size_t clientId);

/**
 * Blocking TCP front end for OracleService, one thread per client.
 * run() accepts until stop() is called from another thread, then waits for
 * the client threads to finish.
 */
class OracleTcpServer {
public:
  OracleTcpServer(OracleService& service, const boost::asio::ip::tcp::endpoint& endpoint);

  uint16_t port() const { return port_; }

  void run();
  void stop();

private:
  OracleService& service_;
  boost::asio::io_context io_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::ip::tcp::endpoint wakeEndpoint_;
  uint16_t port_;
  std::atomic<bool> stopping_;
  std::mutex mu_;
  std::vector<std::thread> clients_;
};
