#include "keystream.h"

Keystream::Keystream(const WindowLFSR& start, size_t count)
  : start_(start), cur_(start), count_(count), produced_(0)
{
}

bool Keystream::next(uint8_t& bit) {
  if (produced_ >= count_) return false;
  bit = cur_.stepBit();
  ++produced_;
  return true;
}

void Keystream::restart() {
  cur_ = start_;
  produced_ = 0;
}

Keystream generateKeystream(uint32_t window, const std::vector<unsigned>& taps,
                            unsigned width, size_t count) {
  return Keystream(WindowLFSR(window, tapsToMask(taps), width), count);
}

BitSequence collectBits(Keystream& ks) {
  BitSequence bits;
  bits.reserve(ks.remaining());
  uint8_t b;
  while (ks.next(b)) bits.push_back(b);
  return bits;
}

std::vector<uint8_t> keystreamBytes(const WindowLFSR& start, size_t offset, size_t byteCount) {
  WindowLFSR lfsr = start;
  lfsr.advance(offset);
  Keystream ks(lfsr, byteCount * 8);
  return packBitsMsbFirst(collectBits(ks));
}

std::vector<uint8_t> xorWithKeystream(const WindowLFSR& start, size_t offset,
                                      const std::vector<uint8_t>& data) {
  std::vector<uint8_t> out = data;
  xorInPlace(out, keystreamBytes(start, offset, data.size()));
  return out;
}
