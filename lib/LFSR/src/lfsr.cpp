#include "lfsr.h"

static inline uint32_t widthMask(unsigned width) {
  return width >= 32 ? 0xFFFFFFFFu : ((1u << width) - 1u);
}

WindowLFSR::WindowLFSR(uint32_t window, uint32_t tapMask, unsigned width)
  : state_(window & widthMask(width)), taps_(tapMask & widthMask(width)), width_(width)
{
}

WindowLFSR WindowLFSR::fromBits(const BitSequence& bits, size_t offset, unsigned width,
                                const std::vector<unsigned>& taps) {
  return WindowLFSR(bitsToWindow(bits, offset, width), tapsToMask(taps), width);
}

void WindowLFSR::generate(BitSequence& out, size_t count) {
  out.reserve(out.size() + count);
  for (size_t i = 0; i < count; ++i) out.push_back(stepBit());
}

BitSequence WindowLFSR::windowBits() const {
  return windowToBits(state_, width_);
}

uint32_t bitsToWindow(const BitSequence& bits, size_t offset, unsigned width) {
  uint32_t w = 0;
  for (unsigned i = 0; i < width && offset + i < bits.size(); ++i) {
    w |= (uint32_t)(bits[offset + i] & 1u) << i;
  }
  return w;
}

BitSequence windowToBits(uint32_t window, unsigned width) {
  BitSequence bits(width);
  for (unsigned i = 0; i < width; ++i) bits[i] = (uint8_t)((window >> i) & 1u);
  return bits;
}

uint32_t tapsToMask(const std::vector<unsigned>& taps) {
  uint32_t m = 0;
  for (unsigned t : taps) {
    if (t < 32) m |= 1u << t;
  }
  return m;
}

std::vector<unsigned> maskToTaps(uint32_t mask) {
  std::vector<unsigned> taps;
  for (unsigned i = 0; i < 32; ++i) {
    if (mask & (1u << i)) taps.push_back(i);
  }
  return taps;
}
