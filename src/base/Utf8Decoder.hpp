#ifndef __AGT_UTF8_DECODER__
#define __AGT_UTF8_DECODER__

#include "Headers.hpp"

namespace agt {
/**
 * @brief Turns a byte stream into valid UTF-8, chunk by chunk.
 *
 * Invalid sequences become U+FFFD. A multi-byte sequence cut at the end of a
 * chunk is held back and completed by the next chunk.
 */
class Utf8Decoder {
 public:
  /** @brief Decodes `len` bytes, prefixed by any bytes held back earlier. */
  string decode(const char* data, size_t len);

  /** @brief Emits whatever is still held back (as U+FFFD). */
  string flush();

  /** @brief Bytes currently held back waiting for their continuation. */
  inline size_t pendingBytes() const { return pending.size(); }

 protected:
  string pending;
};
}  // namespace agt

#endif  // __AGT_UTF8_DECODER__
