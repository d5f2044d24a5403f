#include "recovery_store.h"
#include "common.h"
#include <pqxx/pqxx>
#include <sstream>

std::string formatTaps(const std::vector<unsigned>& taps) {
  std::ostringstream ss;
  for (size_t i = 0; i < taps.size(); ++i) ss << (i ? "," : "") << taps[i];
  return ss.str();
}

RecoveryStore::RecoveryStore(const std::string& connStr)
  : connStr_(connStr)
{
}

RecoveryStore::~RecoveryStore() {}

bool RecoveryStore::open(std::string& err) {
  try {
    log_info("Store", "connecting to PostgreSQL...");
    conn_.reset(new pqxx::connection(connStr_));
    if (!conn_->is_open()) {
      err = "connection not open";
      conn_.reset();
      return false;
    }

    pqxx::work ddl(*conn_);
    ddl.exec("CREATE TABLE IF NOT EXISTS recovery_runs (\n"
             "    id serial PRIMARY KEY,\n"
             "    created_at timestamptz NOT NULL DEFAULT now(),\n"
             "    epoch text NOT NULL,\n"
             "    known_bits text NOT NULL,\n"
             "    taps text NOT NULL,\n"
             "    state_window text NOT NULL,\n"
             "    phase_offset integer NOT NULL,\n"
             "    plaintext_hex text NOT NULL,\n"
             "    sessions_used integer NOT NULL\n"
             ")");
    ddl.commit();

    conn_->prepare("insert_recovery_run",
                   "INSERT INTO recovery_runs (epoch, known_bits, taps, state_window, phase_offset, "
                   "plaintext_hex, sessions_used) VALUES ($1, $2, $3, $4, $5, $6, $7)");
    log_info("Store", "database ready");
    return true;
  } catch (const std::exception& e) {
    err = std::string("PostgreSQL error: ") + e.what();
    conn_.reset();
    return false;
  }
}

bool RecoveryStore::save(const RecoveryRecord& rec, std::string& err) {
  if (!conn_) {
    err = "store not open";
    return false;
  }
  try {
    pqxx::work txn(*conn_);
    txn.exec_prepared("insert_recovery_run",
                      rec.epoch,
                      bitsToString(rec.knownBits),
                      formatTaps(rec.taps),
                      bitsToString(rec.window),
                      (int)rec.offset,
                      bytesToHex(rec.plaintext),
                      (int)rec.sessionsUsed);
    txn.commit();
    return true;
  } catch (const std::exception& e) {
    err = std::string("PostgreSQL insert failed: ") + e.what();
    return false;
  }
}
