#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>

/**
 * Duplex byte stream to one oracle connection.
 *
 * readByte() returns false once the peer has closed the stream, a read
 * timed out or the transport failed; lastError() says which.
 */
class ByteStream {
public:
  virtual ~ByteStream() {}

  virtual bool readByte(char& c) = 0;
  virtual bool write(const std::string& data) = 0;
  virtual void close() = 0;

  // True when the last failed read was an orderly close by the peer.
  virtual bool atEof() const = 0;
  virtual std::string lastError() const = 0;
};
