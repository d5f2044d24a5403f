#pragma once
#include <stdint.h>
#include <stddef.h>
#include <vector>
#include "bitutils.h"

// Parity of the set bits of x
static inline uint8_t parity32(uint32_t x) {
  x ^= x >> 16;
  x ^= x >> 8;
  x ^= x >> 4;
  x ^= x >> 2;
  x ^= x >> 1;
  return (uint8_t)(x & 1u);
}

/**
 * @brief Windowed Fibonacci LFSR (shift-left-and-append over window positions)
 *
 * The window holds `width` bits; window position i is stored in bit i of
 * state_. Each step emits position 0, computes the feedback bit as the parity
 * of the tapped positions, drops position 0 and appends the feedback bit at
 * position width-1. Because output is always read from position 0, the first
 * `width` output bits are exactly the initial window contents.
 */
class WindowLFSR {
public:
  WindowLFSR(uint32_t window, uint32_t tapMask, unsigned width);

  // Build from bits[offset .. offset+width) and a tap index list.
  static WindowLFSR fromBits(const BitSequence& bits, size_t offset, unsigned width,
                             const std::vector<unsigned>& taps);

  uint8_t feedback() const { return parity32(state_ & taps_); }

  uint8_t stepBit() {
    uint8_t out = (uint8_t)(state_ & 1u);
    uint8_t fb = feedback();
    state_ = (state_ >> 1) | ((uint32_t)fb << (width_ - 1));
    return out;
  }

  void advance(size_t steps) { for (size_t i = 0; i < steps; ++i) stepBit(); }
  void generate(BitSequence& out, size_t count);

  uint32_t window() const { return state_; }
  uint32_t tapMask() const { return taps_; }
  unsigned width() const { return width_; }
  BitSequence windowBits() const;

private:
  uint32_t state_;
  uint32_t taps_;
  unsigned width_;
};

// bits[offset .. offset+width) as a window word (position i -> bit i).
uint32_t bitsToWindow(const BitSequence& bits, size_t offset, unsigned width);
BitSequence windowToBits(uint32_t window, unsigned width);

uint32_t tapsToMask(const std::vector<unsigned>& taps);
std::vector<unsigned> maskToTaps(uint32_t mask);
