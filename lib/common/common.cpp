#include "common.h"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

// Population runs handshakes on several threads; keep lines whole.
static std::mutex gLogMutex;

const char* recoveryErrorName(RecoveryError e) {
  switch (e) {
    case RecoveryError::None: return "None";
    case RecoveryError::HandshakeFailed: return "HandshakeFailed";
    case RecoveryError::PoolExhausted: return "PoolExhausted";
    case RecoveryError::ReplayInconsistency: return "ReplayInconsistency";
    case RecoveryError::NoConsistentTaps: return "NoConsistentTaps";
    case RecoveryError::NoMatchingOffset: return "NoMatchingOffset";
    case RecoveryError::TransportError: return "TransportError";
    case RecoveryError::ConfigError: return "ConfigError";
  }
  return "Unknown";
}

bool setFailure(RecoveryStatus& status, RecoveryError e,
                const std::string& phase, const std::string& msg) {
  status.error = e;
  status.phase = phase;
  status.message = msg;
  log_error(describeStatus(status));
  return false;
}

std::string describeStatus(const RecoveryStatus& status) {
  std::ostringstream ss;
  ss << recoveryErrorName(status.error);
  if (!status.phase.empty()) ss << " in " << status.phase;
  if (!status.message.empty()) ss << ": " << status.message;
  ss << " (bitsKnown=" << status.bitsKnown << " sessionsUsed=" << status.sessionsUsed << ")";
  return ss.str();
}

void log_info(const std::string& component, const std::string& msg) {
  std::lock_guard<std::mutex> lock(gLogMutex);
  std::cout << "[" << component << "] " << msg << std::endl;
}

void log_error(const std::string& msg) {
  time_t now = time(nullptr);
  std::string dt = ctime(&now);
  dt.erase(dt.find_last_not_of("\n\r") + 1); // Trim trailing newline
  std::lock_guard<std::mutex> lock(gLogMutex);
  std::cerr << "[ERROR] [" << dt << "] " << msg << std::endl;
}

void logHex(const std::string& component, const char* label, const std::vector<uint8_t>& v) {
  std::ostringstream ss;
  ss << std::hex << std::uppercase << std::setfill('0');
  size_t show = std::min<size_t>(v.size(), 32);
  for (size_t i = 0; i < show; ++i) ss << std::setw(2) << (int)v[i];
  std::ostringstream line;
  line << label << "[0.." << (show ? show - 1 : 0) << "]: " << ss.str() << " (len=" << v.size() << ")";
  log_info(component, line.str());
}
