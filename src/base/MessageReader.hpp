#ifndef __HL_MESSAGE_READER_H__
#define __HL_MESSAGE_READER_H__

#include "Headers.hpp"

namespace hl {
/**
 * @brief Cursor over a byte string holding big-endian (network order) data.
 *
 * Every read throws std::runtime_error when it would run past the end, so
 * callers can parse untrusted server payloads without bounds checks of
 * their own.
 */
class MessageReader {
 public:
  MessageReader() : pos(0) {}

  explicit MessageReader(const string& s) : buffer(s), pos(0) {}

  inline void load(const string& s) {
    buffer = s;
    pos = 0;
  }

  template <typename T>
  inline T readPrimitive() {
    static_assert(std::is_integral<T>::value && std::is_unsigned<T>::value,
                  "Only unsigned integers are stored on the wire");
    ensureRemaining(sizeof(T));
    T t = 0;
    for (size_t a = 0; a < sizeof(T); a++) {
      t = T(t << 8) | T((unsigned char)buffer[pos + a]);
    }
    pos += sizeof(T);
    return t;
  }

  inline string readBytes(size_t count) {
    ensureRemaining(count);
    string s = buffer.substr(pos, count);
    pos += count;
    return s;
  }

  /** @brief Reads a Pascal string: one length byte followed by the bytes. */
  inline string readPString() {
    uint8_t length = readPrimitive<uint8_t>();
    return readBytes(length);
  }

  inline void skip(size_t count) {
    ensureRemaining(count);
    pos += count;
  }

  inline void seek(size_t newPos) {
    if (newPos > buffer.length()) {
      throw std::runtime_error("Seek past end of message");
    }
    pos = newPos;
  }

  inline int64_t sizeRemaining() const { return buffer.length() - pos; }

  inline size_t position() const { return pos; }

 protected:
  inline void ensureRemaining(size_t count) const {
    if (count > buffer.length() - pos) {
      throw std::runtime_error("Message truncated: wanted " +
                               to_string(count) + " bytes, " +
                               to_string(buffer.length() - pos) + " left");
    }
  }

  string buffer;
  size_t pos;
};
}  // namespace hl

#endif  // __HL_MESSAGE_READER_H__
