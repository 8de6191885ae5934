#include "TerminalTextDecoder.hpp"

namespace cpa {
namespace {
const char ESC = 0x1B;
const char BEL = 0x07;
const char* const REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

inline bool inRange(unsigned char c, unsigned char low, unsigned char high) {
  return c >= low && c <= high;
}
}  // namespace

string TerminalTextDecoder::feed(const string& chunk) {
  string data;
  data.swap(pending);
  data.append(chunk);

  string out;
  out.reserve(data.length());
  size_t i = 0;
  const size_t n = data.length();
  if (skipping != SKIP_NONE) {
    i = skipDroppedEscape(data, 0);
    if (skipping != SKIP_NONE) {
      // A lone ESC at the end may still turn out to be ST.
      pending = data.substr(i);
      return out;
    }
  }
  while (i < n) {
    unsigned char c = (unsigned char)data[i];
    if (c == (unsigned char)ESC) {
      size_t len = escapeLength(data, i);
      if (len == 0) {
        if (n - i > MAX_ESCAPE_LENGTH) {
          VLOG(1) << "Dropping unterminated escape sequence of " << (n - i)
                  << " bytes";
          skipping = (data[i + 1] == '[') ? SKIP_CSI : SKIP_STRING;
          i = skipDroppedEscape(data, i + 2);
          if (skipping != SKIP_NONE) {
            pending = data.substr(i);
            break;
          }
          continue;
        }
        pending = data.substr(i);
        break;
      }
      i += len;
      continue;
    }
    if (c < 0x20 || c == 0x7F) {
      if (c == '\n' || c == '\t') {
        out.push_back((char)c);
      }
      i++;
      continue;
    }
    if (c < 0x80) {
      out.push_back((char)c);
      i++;
      continue;
    }
    int len = utf8Length(data, i);
    if (len == 0) {
      pending = data.substr(i);
      break;
    }
    if (len < 0) {
      out.append(REPLACEMENT_CHARACTER);
      i++;
      continue;
    }
    out.append(data, i, len);
    i += len;
  }
  return out;
}

string TerminalTextDecoder::flush() {
  if (skipping != SKIP_NONE) {
    skipping = SKIP_NONE;
    pending.clear();
  }
  if (pending.empty()) {
    return string();
  }
  string out;
  string rest;
  rest.swap(pending);
  // Anything left is either a truncated escape or a truncated character.
  if (rest[0] != ESC) {
    out.append(REPLACEMENT_CHARACTER);
    out.append(feed(rest.substr(1)));
    out.append(flush());
  }
  return out;
}

string TerminalTextDecoder::decodeAll(const string& bytes) {
  TerminalTextDecoder decoder;
  string out = decoder.feed(bytes);
  out.append(decoder.flush());
  return out;
}

size_t TerminalTextDecoder::skipDroppedEscape(const string& data,
                                              size_t start) {
  const size_t n = data.length();
  for (size_t j = start; j < n; j++) {
    unsigned char b = (unsigned char)data[j];
    if (skipping == SKIP_CSI) {
      if (inRange(b, 0x40, 0x7E)) {
        skipping = SKIP_NONE;
        return j + 1;
      }
      if (!inRange(b, 0x20, 0x3F)) {
        skipping = SKIP_NONE;
        return j;
      }
      continue;
    }
    if (data[j] == BEL) {
      skipping = SKIP_NONE;
      return j + 1;
    }
    if (data[j] == ESC) {
      if (j + 1 >= n) {
        return j;
      }
      skipping = SKIP_NONE;
      return data[j + 1] == '\\' ? j + 2 : j;
    }
  }
  return n;
}

size_t TerminalTextDecoder::escapeLength(const string& data, size_t start) {
  const size_t n = data.length();
  if (start + 1 >= n) {
    return 0;
  }
  char kind = data[start + 1];
  switch (kind) {
    case '[': {
      // CSI: parameter and intermediate bytes, then one final byte.
      for (size_t j = start + 2; j < n; j++) {
        unsigned char b = (unsigned char)data[j];
        if (inRange(b, 0x40, 0x7E)) {
          return j - start + 1;
        }
        if (!inRange(b, 0x20, 0x3F)) {
          // Malformed: drop the introducer, keep the offending byte.
          return j - start;
        }
      }
      return 0;
    }
    case ']':
    case 'P':
    case 'X':
    case '^':
    case '_': {
      // OSC/DCS/SOS/PM/APC: terminated by BEL or ST (ESC \).
      for (size_t j = start + 2; j < n; j++) {
        if (data[j] == BEL) {
          return j - start + 1;
        }
        if (data[j] == ESC) {
          if (j + 1 >= n) {
            return 0;
          }
          if (data[j + 1] == '\\') {
            return j - start + 2;
          }
          // A new escape starts, the string was never terminated.
          return j - start;
        }
      }
      return 0;
    }
    case '(':
    case ')':
    case '*':
    case '+':
    case '-':
    case '.':
    case '/':
    case '#':
    case '%':
      if (start + 2 >= n) {
        return 0;
      }
      return 3;
    default:
      return 2;
  }
}

int TerminalTextDecoder::utf8Length(const string& data, size_t start) {
  const size_t n = data.length();
  unsigned char lead = (unsigned char)data[start];
  int len;
  unsigned char secondLow = 0x80;
  unsigned char secondHigh = 0xBF;
  if (inRange(lead, 0xC2, 0xDF)) {
    len = 2;
  } else if (inRange(lead, 0xE0, 0xEF)) {
    len = 3;
    if (lead == 0xE0) {
      secondLow = 0xA0;  // overlong
    } else if (lead == 0xED) {
      secondHigh = 0x9F;  // surrogates
    }
  } else if (inRange(lead, 0xF0, 0xF4)) {
    len = 4;
    if (lead == 0xF0) {
      secondLow = 0x90;  // overlong
    } else if (lead == 0xF4) {
      secondHigh = 0x8F;  // above U+10FFFF
    }
  } else {
    return -1;
  }

  for (int k = 1; k < len; k++) {
    if (start + k >= n) {
      return 0;
    }
    unsigned char b = (unsigned char)data[start + k];
    unsigned char low = (k == 1) ? secondLow : 0x80;
    unsigned char high = (k == 1) ? secondHigh : 0xBF;
    if (!inRange(b, low, high)) {
      return -1;
    }
  }
  return len;
}
}  // namespace cpa
