#include "tcp_stream.h"
#include "bit_extractor.h"
#include "oracle_server.h"
#include "pipeline.h"
#include "oracle_harness.h"
#include <cassert>
#include <chrono>
#include <ctime>
#include <iostream>
#include <thread>

using boost::asio::ip::tcp;

int main() {
    const std::chrono::milliseconds connectTimeout(2000);
    const std::chrono::milliseconds shortRead(200);
    const tcp::endpoint loopback(boost::asio::ip::address_v4::loopback(), 0);

    // Silence is a timeout, an orderly close is an EOF
    {
        boost::asio::io_context io;
        tcp::acceptor acceptor(io, loopback);
        std::string err;
        auto client = TcpByteStream::connect("127.0.0.1", acceptor.local_endpoint().port(),
                                             connectTimeout, shortRead, err);
        assert(client);
        tcp::socket peer(io);
        acceptor.accept(peer);

        char c = 0;
        assert(!client->readByte(c));
        assert(!client->atEof());
        assert(client->lastError() == "read timed out");

        boost::asio::write(peer, boost::asio::buffer(std::string("hi")));
        peer.shutdown(tcp::socket::shutdown_both);
        peer.close();

        assert(client->readByte(c) && c == 'h');
        assert(client->readByte(c) && c == 'i');
        assert(!client->readByte(c));
        assert(client->atEof());
        assert(client->lastError() == "closed by peer");
    }

    // A service that stops answering mid-guess aborts extraction as a transport failure
    {
        boost::asio::io_context io;
        tcp::acceptor acceptor(io, loopback);
        std::string err;
        auto stream = TcpByteStream::connect("127.0.0.1", acceptor.local_endpoint().port(),
                                             connectTimeout, shortRead, err);
        assert(stream);
        tcp::socket peer(io);
        acceptor.accept(peer);
        boost::asio::write(peer, boost::asio::buffer(std::string("5\n> ")));

        std::unique_ptr<OracleSession> session(new OracleSession(std::move(stream), OracleProtocol(), 0));
        assert(session->handshake(err));
        assert(session->epoch() == "5");

        SessionPool pool;
        assert(pool.admit(std::move(session)));
        BitExtractor ex(pool);
        BitSequence out;
        RecoveryStatus st;
        assert(!ex.extract(1, out, st));
        assert(st.error == RecoveryError::TransportError);
        assert(st.message.find("timed out") != std::string::npos);
    }

    // Nothing listening
    {
        uint16_t port = 0;
        {
            boost::asio::io_context io;
            tcp::acceptor acceptor(io, loopback);
            port = acceptor.local_endpoint().port();
        }
        std::string err;
        auto client = TcpByteStream::connect("127.0.0.1", port, connectTimeout, shortRead, err);
        assert(!client);
        assert(!err.empty());
    }

    // Full recovery against the TCP service on an ephemeral port
    {
        OracleServiceConfig svc = harnessServiceConfig();
        svc.epochSeconds = 1000000000; // one epoch for the whole run
        OracleService service(svc);
        OracleTcpServer server(service, loopback);
        std::thread serverThread([&server]() { server.run(); });

        AttackConfig cfg;
        cfg.port = server.port();
        cfg.searchShards = 4;
        RecoveryOutcome outcome;
        RecoveryStatus st;
        bool ok = runRecovery(cfg, makeTcpSessionFactory(cfg), outcome, st);

        server.stop();
        serverThread.join();

        assert(ok);
        assert(outcome.epoch == service.epochFor(time(nullptr)));
        assert(std::string(outcome.decrypted.plaintext.begin(), outcome.decrypted.plaintext.end()) ==
               svc.plaintext);
        assert(outcome.decrypted.offset == LFSR_WINDOW_BITS);

        std::shared_ptr<const EpochMaterial> m;
        std::string err;
        assert(service.material(outcome.epoch, m, err));
        assert(outcome.knownBits == m->hiddenBits);
    }

    std::cout << "test_tcp_transport: ok" << std::endl;
    return 0;
}
