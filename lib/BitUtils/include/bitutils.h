#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

// One 0/1 value per element, index 0 is the earliest bit.
typedef std::vector<uint8_t> BitSequence;

/**
 * Pack bits into a big-endian byte string, first bit most significant.
 *
 * The bits are read as one binary number, so the result is always exactly
 * ceil(n/8) bytes: leading zero bits still produce leading zero bytes, and
 * when n is not a multiple of 8 the first byte carries the left padding.
 */
std::vector<uint8_t> packBitsMsbFirst(const BitSequence& bits);

// "0110..." rendering for logs and storage.
std::string bitsToString(const BitSequence& bits);

bool isBitSequence(const BitSequence& bits);

// Returns false on odd length or a non-hex digit; out is left untouched then.
bool hexToBytes(const std::string& hex, std::vector<uint8_t>& out);
std::string bytesToHex(const std::vector<uint8_t>& bytes);

// data[i] ^= key[i] for the common prefix; returns the number of bytes mixed.
size_t xorInPlace(std::vector<uint8_t>& data, const std::vector<uint8_t>& key);

bool containsSignature(const std::vector<uint8_t>& data, const std::string& signature);
