#ifndef __HL_MESSAGE_WRITER_H__
#define __HL_MESSAGE_WRITER_H__

#include "Headers.hpp"

namespace hl {
/**
 * @brief Accumulates big-endian (network order) data into a byte string.
 */
class MessageWriter {
 public:
  MessageWriter() {}

  inline void start() { buffer.clear(); }

  template <typename T>
  inline void writePrimitive(const T& t) {
    static_assert(std::is_integral<T>::value && std::is_unsigned<T>::value,
                  "Only unsigned integers are stored on the wire");
    for (int a = int(sizeof(T)) - 1; a >= 0; a--) {
      buffer.push_back(char((t >> (a * 8)) & 0xFF));
    }
  }

  inline void writeBytes(const string& s) { buffer.append(s); }

  /**
   * @brief Writes exactly `size` bytes of s, truncating or padding with
   * `pad`.
   */
  inline void writeFixed(const string& s, size_t size, char pad = '\0') {
    string t = s.substr(0, size);
    t.resize(size, pad);
    buffer.append(t);
  }

  /** @brief Writes a Pascal string (one length byte, at most 255 bytes). */
  inline void writePString(const string& s) {
    string t = s.substr(0, 255);
    writePrimitive<uint8_t>(uint8_t(t.length()));
    buffer.append(t);
  }

  inline void writeZeros(size_t count) { buffer.append(count, '\0'); }

  inline string finish() {
    string s = buffer;
    start();
    return s;
  }

  inline int64_t size() const { return buffer.size(); }

 protected:
  string buffer;
};
}  // namespace hl

#endif  // __HL_MESSAGE_WRITER_H__
