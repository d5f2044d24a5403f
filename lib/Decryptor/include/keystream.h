#pragma once
#include <stdint.h>
#include <stddef.h>
#include <vector>
#include "lfsr.h"

/**
 * Lazy, finite, restartable keystream of `count` bits.
 *
 * Bits are produced on demand from a private copy of the starting register;
 * restart() rewinds to that starting point.
 */
class Keystream {
public:
  Keystream(const WindowLFSR& start, size_t count);

  bool next(uint8_t& bit);
  void restart();

  size_t size() const { return count_; }
  size_t remaining() const { return count_ - produced_; }

private:
  WindowLFSR start_;
  WindowLFSR cur_;
  size_t count_;
  size_t produced_;
};

// generate(state, taps, count)
Keystream generateKeystream(uint32_t window, const std::vector<unsigned>& taps,
                            unsigned width, size_t count);

// Drain what is left of a keystream.
BitSequence collectBits(Keystream& ks);

// Skip `offset` bits of a copy of `start`, then pack byteCount*8 bits MSB-first.
std::vector<uint8_t> keystreamBytes(const WindowLFSR& start, size_t offset, size_t byteCount);

// XOR data against the keystream starting `offset` bits after `start` (encrypts and decrypts).
std::vector<uint8_t> xorWithKeystream(const WindowLFSR& start, size_t offset,
                                      const std::vector<uint8_t>& data);
