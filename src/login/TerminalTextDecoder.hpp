#ifndef __CPA_TERMINAL_TEXT_DECODER__
#define __CPA_TERMINAL_TEXT_DECODER__

#include "Headers.hpp"

namespace cpa {
/**
 * @brief Streaming conversion of raw pty bytes into plain text.
 *
 * Removes CSI, OSC (and the other string-terminated families), charset
 * designations and two-byte escapes, drops carriage returns and C0 controls
 * other than newline/tab, and replaces invalid UTF-8 with U+FFFD.
 *
 * An escape sequence or UTF-8 character cut off at the end of a chunk is held
 * back until the next `feed`, so the concatenated result does not depend on
 * how the bytes were split into reads.
 */
class TerminalTextDecoder {
 public:
  TerminalTextDecoder() {}

  /** @brief Consumes a chunk, returning the text that is now complete. */
  string feed(const string& chunk);

  /**
   * @brief Emits whatever is still held back: an unfinished UTF-8 sequence
   * becomes U+FFFD, an unfinished escape sequence is dropped.
   */
  string flush();

  /** @brief Number of raw bytes currently held back. */
  size_t pendingBytes() const { return pending.length(); }

  /** @brief One-shot decode of a complete byte string. */
  static string decodeAll(const string& bytes);

  /**
   * @brief An unterminated escape longer than this is discarded; the rest of
   * it, up to its terminator, is skipped as it arrives.
   */
  static constexpr size_t MAX_ESCAPE_LENGTH = 4096;

 protected:
  /**
   * @brief Length of the escape sequence starting at `data[start]`, or 0 if
   * the sequence is not complete yet.
   */
  static size_t escapeLength(const string& data, size_t start);

  /**
   * @brief Length of the UTF-8 sequence starting at `data[start]`: positive
   * if valid, -1 if invalid, 0 if more bytes are needed.
   */
  static int utf8Length(const string& data, size_t start);

  /**
   * @brief Consumes the remainder of an escape sequence that was dropped for
   * being too long, starting at `data[start]`.
   * @return Offset of the first byte not consumed; `skipping` is cleared once
   * the sequence's terminator was seen.
   */
  size_t skipDroppedEscape(const string& data, size_t start);

  enum SkipMode {
    SKIP_NONE,
    SKIP_CSI,
    SKIP_STRING,
  };

  string pending;
  SkipMode skipping = SKIP_NONE;
};
}  // namespace cpa

#endif  // __CPA_TERMINAL_TEXT_DECODER__
