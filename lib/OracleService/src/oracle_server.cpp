#include "oracle_server.h"
#include <ctime>
#include <iostream>

using boost::asio::ip::tcp;

void serveOracleClient(tcp::socket& sock, OracleService& service, size_t clientId) {
  const OracleServiceConfig& cfg = service.config();
  std::string epoch = service.epochFor(time(nullptr));
  std::shared_ptr<const EpochMaterial> material;
  std::string err;
  boost::system::error_code ignored;
  if (!service.material(epoch, material, err)) {
    log_error("Client #" + std::to_string(clientId) + ": " + err);
    sock.close(ignored);
    return;
  }

  try {
    OracleConversation conv(material, cfg);
    boost::asio::write(sock, boost::asio::buffer(conv.greeting()));

    boost::asio::streambuf in;
    const std::string& lineEnd = cfg.protocol.lineEnd;
    while (!conv.finished()) {
      boost::system::error_code ec;
      size_t n = boost::asio::read_until(sock, in, lineEnd, ec);
      if (ec) {
        if (ec != boost::asio::error::eof) {
          log_error("Client #" + std::to_string(clientId) + " read: " + ec.message());
        }
        break;
      }
      std::string line(boost::asio::buffers_begin(in.data()),
                       boost::asio::buffers_begin(in.data()) + (n - lineEnd.size()));
      in.consume(n);
      boost::asio::write(sock, boost::asio::buffer(conv.onLine(line)));
    }
    std::cout << "[Server] client #" << clientId << " epoch=" << epoch
              << " confirmed " << conv.position() << "/" << material->hiddenBits.size() << " bits" << std::endl;
  } catch (const std::exception& e) {
    log_error("Client #" + std::to_string(clientId) + ": " + e.what());
  }

  sock.shutdown(tcp::socket::shutdown_both, ignored);
  sock.close(ignored);
}

OracleTcpServer::OracleTcpServer(OracleService& service, const tcp::endpoint& endpoint)
  : service_(service), io_(), acceptor_(io_, endpoint), port_(0), stopping_(false)
{
  wakeEndpoint_ = acceptor_.local_endpoint();
  if (wakeEndpoint_.address().is_unspecified()) {
    wakeEndpoint_.address(boost::asio::ip::address_v4::loopback());
  }
  port_ = wakeEndpoint_.port();
}

void OracleTcpServer::run() {
  size_t nextId = 0;
  while (!stopping_) {
    tcp::socket sock(io_);
    boost::system::error_code ec;
    acceptor_.accept(sock, ec);
    if (stopping_) break;
    if (ec) {
      log_error("accept: " + ec.message());
      continue;
    }
    size_t id = nextId++;
    std::lock_guard<std::mutex> lock(mu_);
    clients_.emplace_back([this, id](tcp::socket s) { serveOracleClient(s, service_, id); }, std::move(sock));
  }

  std::vector<std::thread> clients;
  {
    std::lock_guard<std::mutex> lock(mu_);
    clients.swap(clients_);
  }
  for (std::thread& t : clients) t.join();
}

void OracleTcpServer::stop() {
  stopping_ = true;
  // Wake the blocking accept with a throwaway connection
  boost::asio::io_context io;
  tcp::socket wake(io);
  boost::system::error_code ignored;
  wake.connect(wakeEndpoint_, ignored);
  wake.close(ignored);
}
