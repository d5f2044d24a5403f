#include <iostream>
#include <string>

#include "common.h"
#include "config.h"
#include "oracle_server.h"
#include "oracle_service.h"

using boost::asio::ip::tcp;

int main(int argc, char** argv) {
  try {
    OracleServiceConfig cfg;
    std::string err;
    if (argc > 1 && !loadServiceConfig(argv[1], cfg, err)) {
      log_error("ConfigError: " + err);
      return 2;
    }
    applyServiceEnvironment(cfg);
    if (!validateServiceConfig(cfg, err)) {
      log_error("ConfigError: " + err);
      return 2;
    }

    OracleService service(cfg);
    OracleTcpServer server(service, tcp::endpoint(tcp::v4(), cfg.port));

    std::cout << "Starting LFSR oracle on 0.0.0.0:" << cfg.port << "..." << std::endl;
    std::cout << "  window=" << cfg.windowBits << " taps=" << cfg.tapCount
              << " hidden bits=" << cfg.hiddenBits << " epoch=" << cfg.epochSeconds << "s"
              << " encoding=" << cfg.ciphertextEncoding << std::endl;
    std::cout << "Press Ctrl+C to stop" << std::endl;

    server.run();
  } catch (const std::exception& e) {
    log_error("Main application error: " + std::string(e.what()));
    return 1;
  }
  return 0;
}
