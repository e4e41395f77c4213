#include "TestHeaders.hpp"
#include "Utf8Decoder.hpp"

using namespace pe;

TEST_CASE("ASCII and complete sequences pass through", "[Utf8Decoder]") {
  Utf8Decoder decoder;
  REQUIRE(decoder.decode("plain text") == "plain text");
  // U+00E9, U+20AC, U+1F600
  string mixed = "\xc3\xa9\xe2\x82\xac\xf0\x9f\x98\x80";
  REQUIRE(decoder.decode(mixed) == mixed);
  REQUIRE(decoder.pending() == 0);
}

TEST_CASE("Split sequences are held back", "[Utf8Decoder]") {
  Utf8Decoder decoder;
  REQUIRE(decoder.decode("ab\xe2") == "ab");
  REQUIRE(decoder.pending() == 1);
  REQUIRE(decoder.decode("\x82") == "");
  REQUIRE(decoder.pending() == 2);
  REQUIRE(decoder.decode("\xac!") == "\xe2\x82\xac!");
  REQUIRE(decoder.pending() == 0);
}

TEST_CASE("Strict mode rejects invalid input", "[Utf8Decoder]") {
  {
    Utf8Decoder decoder("strict");
    REQUIRE_THROWS_AS(decoder.decode("\xff"), DecodeError);
  }
  {
    // Overlong encoding of '/'
    Utf8Decoder decoder;
    REQUIRE_THROWS_AS(decoder.decode("\xc0\xaf"), DecodeError);
  }
  {
    // UTF-16 surrogate
    Utf8Decoder decoder;
    REQUIRE_THROWS_AS(decoder.decode("\xed\xa0\x80"), DecodeError);
  }
  {
    Utf8Decoder decoder;
    REQUIRE(decoder.decode("ok\xe2\x82") == "ok");
    REQUIRE_THROWS_AS(decoder.flush(), DecodeError);
  }
}

TEST_CASE("Replace mode substitutes U+FFFD", "[Utf8Decoder]") {
  const string replacement = "\xef\xbf\xbd";
  Utf8Decoder decoder("replace");
  REQUIRE(decoder.decode(string("a\xff") + "b") == "a" + replacement + "b");
  // A lead byte followed by ASCII is one bad byte
  REQUIRE(decoder.decode(string("\xc3") + "x") == replacement + "x");
  REQUIRE(decoder.decode("end\xf0\x9f") == "end");
  REQUIRE(decoder.flush() == replacement);
  REQUIRE(decoder.flush() == "");
}

TEST_CASE("A truncated sequence is replaced once", "[Utf8Decoder]") {
  const string replacement = "\xef\xbf\xbd";
  Utf8Decoder decoder("replace");
  REQUIRE(decoder.decode(string("\xe2\x82") + "X") == replacement + "X");
  REQUIRE(decoder.decode(string("\xf0\x9f\x98") + "!") == replacement + "!");
  // The surrogate's second byte cannot follow 0xED, so each byte is bad
  REQUIRE(decoder.decode("\xed\xa0\x80") ==
          replacement + replacement + replacement);
}
