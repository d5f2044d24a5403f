#include "session_pool.h"
#include <pplx/pplxtasks.h>
#include <vector>

bool SessionPool::admit(std::unique_ptr<OracleSession> session) {
  if (!session || !session->isOpen()) return false;

  std::unique_lock<std::mutex> lock(mu_);
  if (!hasEpoch_) {
    epoch_ = session->epoch();
    hasEpoch_ = true;
  } else if (session->epoch() != epoch_) {
    ++rejected_;
    std::string ours = epoch_;
    lock.unlock();
    log_info("SessionPool", "rejecting session #" + std::to_string(session->id()) +
                            ": epoch " + session->epoch() + " != " + ours);
    session->close();
    return false;
  }
  sessions_.push_back(std::move(session));
  ++admitted_;
  return true;
}

bool SessionPool::acquire(std::unique_ptr<OracleSession>& out, RecoveryStatus& status) {
  std::unique_lock<std::mutex> lock(mu_);
  while (!sessions_.empty()) {
    std::unique_ptr<OracleSession> s = std::move(sessions_.front());
    sessions_.pop_front();
    if (s && s->isOpen()) {
      out = std::move(s);
      return true;
    }
  }
  lock.unlock();
  return setFailure(status, RecoveryError::PoolExhausted, "acquire",
                    "no open session left in the pool");
}

size_t SessionPool::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return sessions_.size();
}

std::string SessionPool::epoch() const {
  std::lock_guard<std::mutex> lock(mu_);
  return epoch_;
}

size_t SessionPool::admitted() const {
  std::lock_guard<std::mutex> lock(mu_);
  return admitted_;
}

size_t SessionPool::rejected() const {
  std::lock_guard<std::mutex> lock(mu_);
  return rejected_;
}

size_t SessionPool::populate(const SessionFactory& factory, size_t target) {
  log_info("SessionPool", "opening " + std::to_string(target) + " sessions...");

  std::vector<pplx::task<bool>> tasks;
  tasks.reserve(target);
  for (size_t i = 0; i < target; ++i) {
    tasks.push_back(pplx::create_task([this, &factory, i]() -> bool {
      std::string err;
      std::unique_ptr<OracleSession> s;
      try {
        s = factory(i, err);
      } catch (const std::exception& e) {
        err = e.what();
      }
      if (!s) {
        log_error("HandshakeFailed for session #" + std::to_string(i) + ": " + err);
        return false;
      }
      return admit(std::move(s));
    }));
  }

  size_t added = 0;
  pplx::when_all(tasks.begin(), tasks.end()).then([&added](std::vector<bool> results) {
    for (bool ok : results) {
      if (ok) ++added;
    }
  }).wait();

  log_info("SessionPool", "pool ready: " + std::to_string(added) + "/" + std::to_string(target) +
                          " sessions, epoch=" + epoch() + ", rejected=" + std::to_string(rejected()));
  return added;
}
