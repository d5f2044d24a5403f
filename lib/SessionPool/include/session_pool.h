#pragma once
#include <stddef.h>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "common.h"
#include "oracle_session.h"

// Opens and handshakes session number `index`; returns nullptr and sets err on failure.
typedef std::function<std::unique_ptr<OracleSession>(size_t index, std::string& err)> SessionFactory;

/**
 * Bookkeeping for sessions that share one generator epoch.
 *
 * The first admitted session fixes the epoch token; later sessions with a
 * different token are closed and dropped. Sessions are handed out FIFO and
 * every mutation goes through one mutex, so admit() may be called from the
 * population tasks while another thread acquires.
 */
class SessionPool {
public:
  SessionPool() : hasEpoch_(false), admitted_(0), rejected_(0) {}

  bool admit(std::unique_ptr<OracleSession> session);

  // Fails with PoolExhausted when no session is left.
  bool acquire(std::unique_ptr<OracleSession>& out, RecoveryStatus& status);

  size_t size() const;
  std::string epoch() const;
  size_t admitted() const;
  size_t rejected() const;

  /**
   * Open `target` sessions concurrently, join them all, admit the ones that
   * handshake. A failed handshake is logged (HandshakeFailed) and only
   * lowers the pool's capacity. Returns the number of sessions admitted.
   */
  size_t populate(const SessionFactory& factory, size_t target);

private:
  mutable std::mutex mu_;
  std::deque<std::unique_ptr<OracleSession>> sessions_;
  std::string epoch_;
  bool hasEpoch_;
  size_t admitted_;
  size_t rejected_;
};
