#ifndef __PE_UTF8_DECODER__
#define __PE_UTF8_DECODER__

#include "ExpectErrors.hpp"
#include "Headers.hpp"

namespace pe {
/**
 * @brief Incremental UTF-8 validator for child output.
 *
 * Output arrives in arbitrary chunks, so a multi-byte sequence can be split
 * across two reads.  The decoder emits only complete sequences and keeps an
 * incomplete tail until the next chunk arrives.
 */
class Utf8Decoder {
 public:
  /**
   * @param errors "strict" throws DecodeError on invalid input, "replace"
   * substitutes U+FFFD.
   */
  explicit Utf8Decoder(const string& errors = "strict");

  /** @brief Feeds raw bytes and returns the complete, validated prefix. */
  string decode(const string& bytes);

  /**
   * @brief Drains the held-back tail at end of stream.  A dangling partial
   * sequence is an error (or a replacement character).
   */
  string flush();

  /** @brief Number of bytes currently held back. */
  size_t pending() const { return tail.size(); }

 protected:
  bool strict;
  string tail;

  string invalid(const string& context);
};
}  // namespace pe

#endif  // __PE_UTF8_DECODER__
