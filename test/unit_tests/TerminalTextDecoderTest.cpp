#include "TerminalTextDecoder.hpp"

#include "TestHeaders.hpp"

using namespace cpa;

TEST_CASE("Plain text passes through", "[TerminalTextDecoder]") {
  REQUIRE(TerminalTextDecoder::decodeAll("hello world\n") == "hello world\n");
}

TEST_CASE("Color and cursor sequences are removed", "[TerminalTextDecoder]") {
  REQUIRE(TerminalTextDecoder::decodeAll("\x1b[1;31mError\x1b[0m: bad") ==
          "Error: bad");
  REQUIRE(TerminalTextDecoder::decodeAll("\x1b[2K\x1b[?25lSpin\x1b[?25h") ==
          "Spin");
}

TEST_CASE("OSC title and hyperlink sequences are removed",
          "[TerminalTextDecoder]") {
  REQUIRE(TerminalTextDecoder::decodeAll("\x1b]0;title\x07visible") ==
          "visible");
  REQUIRE(TerminalTextDecoder::decodeAll(
              "\x1b]8;;https://x.example\x1b\\link\x1b]8;;\x1b\\") == "link");
}

TEST_CASE("Charset and two byte escapes are removed", "[TerminalTextDecoder]") {
  REQUIRE(TerminalTextDecoder::decodeAll("\x1b(Babc\x1b=def\x1b>") ==
          "abcdef");
}

TEST_CASE("Carriage returns and control characters are dropped",
          "[TerminalTextDecoder]") {
  REQUIRE(TerminalTextDecoder::decodeAll("line one\r\nline\ttwo\x07\x08\x7f") ==
          "line one\nline\ttwo");
}

TEST_CASE("Valid UTF-8 is preserved", "[TerminalTextDecoder]") {
  const string text = "认证成功 \xF0\x9F\x94\x91 caf\xC3\xA9";
  REQUIRE(TerminalTextDecoder::decodeAll(text) == text);
}

TEST_CASE("Invalid UTF-8 becomes the replacement character",
          "[TerminalTextDecoder]") {
  REQUIRE(TerminalTextDecoder::decodeAll("a\xFF" "b") == "a\xEF\xBF\xBD" "b");
  // Overlong encoding of '/'
  REQUIRE(TerminalTextDecoder::decodeAll("\xC0\xAF") ==
          "\xEF\xBF\xBD\xEF\xBF\xBD");
  // UTF-16 surrogate
  REQUIRE(TerminalTextDecoder::decodeAll("\xED\xA0\x80") ==
          "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST_CASE("Escape sequence split across chunks is held back",
          "[TerminalTextDecoder]") {
  TerminalTextDecoder decoder;
  REQUIRE(decoder.feed("before\x1b[3") == "before");
  REQUIRE(decoder.pendingBytes() == 3);
  REQUIRE(decoder.feed("2mafter") == "after");
  REQUIRE(decoder.pendingBytes() == 0);
}

TEST_CASE("UTF-8 character split across chunks is held back",
          "[TerminalTextDecoder]") {
  TerminalTextDecoder decoder;
  REQUIRE(decoder.feed("\xE8\xAE") == "");
  REQUIRE(decoder.pendingBytes() == 2);
  REQUIRE(decoder.feed("\xA4ok") == "\xE8\xAE\xA4ok");
}

TEST_CASE("Output does not depend on where reads are split",
          "[TerminalTextDecoder]") {
  const string raw =
      "\x1b[32mOpen \x1b]8;;u\x07https://accounts.google.com/o/oauth2/"
      "auth?state=1\x1b]8;;\x07\x1b[0m\r\n请粘贴 callback\r\n";
  const string expected = TerminalTextDecoder::decodeAll(raw);
  for (size_t split = 0; split <= raw.length(); split++) {
    TerminalTextDecoder decoder;
    string out = decoder.feed(raw.substr(0, split));
    out.append(decoder.feed(raw.substr(split)));
    out.append(decoder.flush());
    INFO("split at " << split);
    REQUIRE(out == expected);
  }
}

TEST_CASE("Flush replaces a truncated character and drops a truncated escape",
          "[TerminalTextDecoder]") {
  TerminalTextDecoder decoder;
  REQUIRE(decoder.feed("x\xE8\xAE") == "x");
  REQUIRE(decoder.flush() == "\xEF\xBF\xBD\xEF\xBF\xBD");

  REQUIRE(decoder.feed("y\x1b[12") == "y");
  REQUIRE(decoder.flush() == "");
  REQUIRE(decoder.pendingBytes() == 0);
}

TEST_CASE("Unterminated escape is eventually discarded",
          "[TerminalTextDecoder]") {
  TerminalTextDecoder decoder;
  string junk = "\x1b]" + string(TerminalTextDecoder::MAX_ESCAPE_LENGTH, 'a');
  REQUIRE(decoder.feed(junk) == "");
  REQUIRE(decoder.pendingBytes() == 0);
  // The rest of the dropped sequence is skipped up to its terminator
  REQUIRE(decoder.feed("more payload\x07next") == "next");
  REQUIRE(decoder.feed(" text") == " text");
}

TEST_CASE("Long OSC sequence is removed however reads are split",
          "[TerminalTextDecoder]") {
  const string payload = string(10000, 'p');
  const vector<string> raws = {
      "before\x1b]8;;" + payload + "\x07after",
      "before\x1b]8;;" + payload + "\x1b\\after",
  };
  for (const auto& raw : raws) {
    REQUIRE(TerminalTextDecoder::decodeAll(raw) == "beforeafter");
    for (size_t chunkSize : {1000, 4097, 5000, 9999}) {
      TerminalTextDecoder decoder;
      string out;
      for (size_t pos = 0; pos < raw.length(); pos += chunkSize) {
        out += decoder.feed(raw.substr(pos, chunkSize));
      }
      out += decoder.flush();
      REQUIRE(out == "beforeafter");
    }
    // Terminator arriving alone, ST split between its two bytes
    TerminalTextDecoder decoder;
    size_t tail = raw.find("after");
    string out = decoder.feed(raw.substr(0, tail - 1));
    out += decoder.feed(raw.substr(tail - 1, 1));
    out += decoder.feed(raw.substr(tail));
    REQUIRE(out == "beforeafter");
  }
}

TEST_CASE("Long CSI sequence is removed however reads are split",
          "[TerminalTextDecoder]") {
  string params;
  for (int a = 0; a < 3000; a++) {
    params += "1;";
  }
  const string raw = "x\x1b[" + params + "my";
  REQUIRE(TerminalTextDecoder::decodeAll(raw) == "xy");
  TerminalTextDecoder decoder;
  string out;
  for (size_t pos = 0; pos < raw.length(); pos += 4500) {
    out += decoder.feed(raw.substr(pos, 4500));
  }
  out += decoder.flush();
  REQUIRE(out == "xy");
}

TEST_CASE("Flush ends skipping of a dropped sequence",
          "[TerminalTextDecoder]") {
  TerminalTextDecoder decoder;
  REQUIRE(decoder.feed("\x1b]" + string(5000, 'a')) == "");
  REQUIRE(decoder.flush() == "");
  REQUIRE(decoder.feed("next") == "next");
}
