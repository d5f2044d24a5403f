#include "bitutils.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

std::vector<uint8_t> packBitsMsbFirst(const BitSequence& bits) {
  const size_t n = bits.size();
  const size_t nbytes = (n + 7) / 8;
  std::vector<uint8_t> out(nbytes, 0);
  // Left padding: the number occupies the low n bits of nbytes*8
  const size_t pad = nbytes * 8 - n;
  for (size_t i = 0; i < n; ++i) {
    if (!(bits[i] & 1u)) continue;
    size_t pos = pad + i;
    out[pos / 8] |= (uint8_t)(0x80u >> (pos % 8));
  }
  return out;
}

std::string bitsToString(const BitSequence& bits) {
  std::string s;
  s.reserve(bits.size());
  for (uint8_t b : bits) s.push_back(b ? '1' : '0');
  return s;
}

bool isBitSequence(const BitSequence& bits) {
  for (uint8_t b : bits) {
    if (b > 1) return false;
  }
  return true;
}

static int hexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool hexToBytes(const std::string& hex, std::vector<uint8_t>& out) {
  if (hex.size() % 2 != 0) return false;
  std::vector<uint8_t> bytes;
  bytes.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hexNibble(hex[i]);
    int lo = hexNibble(hex[i + 1]);
    if (hi < 0 || lo < 0) return false;
    bytes.push_back((uint8_t)((hi << 4) | lo));
  }
  out.swap(bytes);
  return true;
}

std::string bytesToHex(const std::vector<uint8_t>& bytes) {
  std::stringstream ss;
  ss << std::hex << std::uppercase << std::setfill('0');
  for (uint8_t b : bytes) {
    ss << std::setw(2) << (int)b;
  }
  return ss.str();
}

size_t xorInPlace(std::vector<uint8_t>& data, const std::vector<uint8_t>& key) {
  size_t n = std::min(data.size(), key.size());
  for (size_t i = 0; i < n; ++i) data[i] ^= key[i];
  return n;
}

bool containsSignature(const std::vector<uint8_t>& data, const std::string& signature) {
  if (signature.empty()) return false;
  return std::search(data.begin(), data.end(), signature.begin(), signature.end(),
                     [](uint8_t a, char b) { return a == (uint8_t)b; }) != data.end();
}
