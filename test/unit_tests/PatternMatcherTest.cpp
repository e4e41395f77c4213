#include "PatternMatcher.hpp"
#include "TestHeaders.hpp"

using namespace pe;

TEST_CASE("Earliest match position wins over list order", "[PatternMatcher]") {
  auto pm = PatternMatcher::fromLiterals({"bar", "foo"});
  auto result = pm.search("xxfoobar", 0);
  REQUIRE(result);
  REQUIRE(result->index == 1);
  REQUIRE(result->start == 2);
  REQUIRE(result->before == "xx");
  REQUIRE(result->after == "foo");
}

TEST_CASE("Ties at one position go to the lowest index", "[PatternMatcher]") {
  auto pm = PatternMatcher::fromLiterals({"bar", "foo", "foobar"});
  auto result = pm.search("foobar", 0);
  REQUIRE(result);
  REQUIRE(result->index == 1);
  REQUIRE(result->end == 3);

  // Same position, longer target listed first
  pm = PatternMatcher::fromLiterals({"foobar", "foo"});
  result = pm.search("foobar", 0);
  REQUIRE(result);
  REQUIRE(result->index == 0);
  REQUIRE(result->after == "foobar");
}

TEST_CASE("Regex and literal targets mix", "[PatternMatcher]") {
  auto pm = PatternMatcher::compile(
      {MatchTarget::literal("$ "), MatchTarget::regex("login: *"),
       MatchTarget::regex("v(\\d+)\\.(\\d+)")});
  auto result = pm.search("banner v2.17\r\nlogin: ", 0);
  REQUIRE(result);
  REQUIRE(result->index == 2);
  REQUIRE(result->groups == vector<string>({"2", "17"}));
  REQUIRE(result->before == "banner ");
  REQUIRE(result->after == "v2.17");
}

TEST_CASE("No match returns nothing", "[PatternMatcher]") {
  auto pm = PatternMatcher::fromRegexes({"abc", "[0-9]+"});
  REQUIRE_FALSE(pm.search("xyz", 0));
  REQUIRE_FALSE(pm.search("", 0));
}

TEST_CASE("Search window only sees the tail of the buffer",
          "[PatternMatcher]") {
  auto pm = PatternMatcher::fromLiterals({"foobar"});
  // "foobar" is in the buffer but starts before the last three bytes
  REQUIRE_FALSE(pm.search("foobar", 3));
  REQUIRE(pm.search("foobar", 6));
  REQUIRE(pm.search("foobar", 0));

  auto result = pm.search("xxxfoobar", 6);
  REQUIRE(result);
  REQUIRE(result->start == 3);
  REQUIRE(result->before == "xxx");
}

TEST_CASE("Sentinels are recorded but never match text", "[PatternMatcher]") {
  auto pm = PatternMatcher::compile({MatchTarget::literal("x"),
                                     MatchTarget::timeout(),
                                     MatchTarget::eof()});
  REQUIRE(pm.eofIndex() == 2);
  REQUIRE(pm.timeoutIndex() == 1);
  REQUIRE(pm.size() == 3);
  REQUIRE_FALSE(pm.search("yyy", 0));

  auto plain = PatternMatcher::fromLiterals({"x"});
  REQUIRE(plain.eofIndex() == -1);
  REQUIRE(plain.timeoutIndex() == -1);
}

TEST_CASE("Bad regular expressions raise PatternError", "[PatternMatcher]") {
  REQUIRE_THROWS_AS(PatternMatcher::fromRegexes({"ok", "(unclosed"}),
                    PatternError);
  REQUIRE_THROWS_AS(PatternMatcher::fromLiterals({""}), PatternError);
}

TEST_CASE("Regexes search buffers of chatty children", "[PatternMatcher]") {
  string noise(60000, 'a');

  auto greedy = PatternMatcher::fromRegexes({".*END"});
  REQUIRE_FALSE(greedy.search(noise, 0));
  auto found = greedy.search(noise + "END", 0);
  REQUIRE(found);
  REQUIRE(found->start == 0);
  REQUIRE(found->end == noise.size() + 3);

  auto lazy = PatternMatcher::fromRegexes({"[\\s\\S]*?PROMPT"});
  found = lazy.search(noise + "\nPROMPT> ", 0);
  REQUIRE(found);
  REQUIRE(found->after.size() == noise.size() + 7);
  REQUIRE(found->before.empty());
}

TEST_CASE("Regexes see the byte before the search window",
          "[PatternMatcher]") {
  auto pm = PatternMatcher::fromRegexes({"\\bbar"});
  // "bar" is inside the word "foobar", not at a word boundary
  REQUIRE_FALSE(pm.search("foobar", 3));
  auto result = pm.search("foo bar", 3);
  REQUIRE(result);
  REQUIRE(result->start == 4);
}

TEST_CASE("Dot stops at newlines and anchors stay at the ends",
          "[PatternMatcher]") {
  REQUIRE_FALSE(PatternMatcher::fromRegexes({"a.b"}).search("a\nb", 0));
  REQUIRE(PatternMatcher::fromRegexes({"a.b"}).search("axb", 0));
  REQUIRE_FALSE(
      PatternMatcher::fromRegexes({"^two"}).search("one\ntwo", 0));
  REQUIRE(PatternMatcher::fromRegexes({"two$"}).search("one\ntwo", 0));
}
