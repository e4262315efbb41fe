#include "pbrtscene.h"

#include <catch2/catch.hpp>

#include <cmath>
#include <cstring>
#include <string>
#include <vector>

using namespace pbrtscene;


static std::vector<std::string> tokenize(const char* text, bool skipComments = false)
{
  Tokenizer tokenizer(text, std::strlen(text));
  tokenizer.set_skip_comments(skipComments);

  std::vector<std::string> tokens;
  Token tok;
  while (tokenizer.next(&tok)) {
    tokens.push_back(tok.str());
  }
  return tokens;
}


TEST_CASE("Tokenizer splits on whitespace", "[tokenizer]")
{
  std::vector<std::string> tokens = tokenize("A B");
  REQUIRE(tokens.size() == 2);
  REQUIRE(tokens[0] == "A");
  REQUIRE(tokens[1] == "B");

  SECTION("empty input") {
    REQUIRE(tokenize("").empty());
    REQUIRE(tokenize("  \t\r\n ").empty());
  }

  SECTION("newlines and tabs are separators") {
    tokens = tokenize("Shape\n\t\"sphere\"\r\n");
    REQUIRE(tokens.size() == 2);
    REQUIRE(tokens[0] == "Shape");
    REQUIRE(tokens[1] == "\"sphere\"");
  }
}


TEST_CASE("Tokenizer brackets", "[tokenizer]")
{
  std::vector<std::string> tokens = tokenize("[1 2]\"a\"[\"b\"]");
  REQUIRE(tokens.size() == 8);
  REQUIRE(tokens[0] == "[");
  REQUIRE(tokens[1] == "1");
  REQUIRE(tokens[2] == "2");
  REQUIRE(tokens[3] == "]");
  REQUIRE(tokens[4] == "\"a\"");
  REQUIRE(tokens[5] == "[");
  REQUIRE(tokens[6] == "\"b\"");
  REQUIRE(tokens[7] == "]");
}


TEST_CASE("Tokenizer quoted strings", "[tokenizer]")
{
  SECTION("embedded space stays in one token") {
    std::vector<std::string> tokens = tokenize("\"foo bar\"");
    REQUIRE(tokens.size() == 1);
    REQUIRE(tokens[0] == "\"foo bar\"");
  }

  SECTION("unterminated string runs to the end of the input") {
    std::vector<std::string> tokens = tokenize("\"foo bar baz");
    REQUIRE(tokens.size() == 1);
    REQUIRE(tokens[0] == "\"foo bar baz");

    Token tok(tokens[0].c_str());
    REQUIRE_FALSE(tok.is_valid());
  }

  SECTION("a bare token ends at a quote") {
    std::vector<std::string> tokens = tokenize("abc\"def\"");
    REQUIRE(tokens.size() == 2);
    REQUIRE(tokens[0] == "abc");
    REQUIRE(tokens[1] == "\"def\"");
  }
}


TEST_CASE("Tokenizer comments", "[tokenizer]")
{
  const char* text = "# leading comment\nWorldBegin # trailing\r\n  #another\nAttributeEnd";

  SECTION("comments are tokens when not skipped") {
    std::vector<std::string> tokens = tokenize(text, false);
    REQUIRE(tokens.size() == 5);
    REQUIRE(tokens[0] == "# leading comment");
    REQUIRE(tokens[1] == "WorldBegin");
    REQUIRE(tokens[2] == "# trailing");
    REQUIRE(tokens[3] == "#another");
    REQUIRE(tokens[4] == "AttributeEnd");
  }

  SECTION("no token starts with # when skipping") {
    std::vector<std::string> tokens = tokenize(text, true);
    REQUIRE(tokens.size() == 2);
    for (const std::string& tok : tokens) {
      REQUIRE(tok[0] != '#');
    }
  }
}


TEST_CASE("Tokenizer peek doesn't consume", "[tokenizer]")
{
  const char* text = "Translate 1 2 3";
  Tokenizer tokenizer(text, std::strlen(text));

  Token peeked, next;
  REQUIRE(tokenizer.peek(&peeked));
  REQUIRE(tokenizer.next(&next));
  REQUIRE(peeked.str() == next.str());
  REQUIRE(next.offset == 0);

  REQUIRE(tokenizer.next(&next));
  REQUIRE(next.str() == "1");
  REQUIRE(next.offset == 10);
  REQUIRE(tokenizer.offset() == 11);
}


TEST_CASE("Token validity", "[token]")
{
  REQUIRE(Token("Shape").is_valid());
  REQUIRE(Token("\"a b\"").is_valid());
  REQUIRE(Token("\"\"").is_valid());
  REQUIRE(Token("[").is_valid());

  REQUIRE_FALSE(Token("").is_valid());
  REQUIRE_FALSE(Token("\"").is_valid());
  REQUIRE_FALSE(Token("\"abc").is_valid());
  REQUIRE_FALSE(Token("abc\"").is_valid());
  REQUIRE_FALSE(Token("a b").is_valid());
}


TEST_CASE("Token kinds", "[token]")
{
  REQUIRE(Token("[").kind() == TokenKind::OpenBracket);
  REQUIRE(Token("]").kind() == TokenKind::CloseBracket);
  REQUIRE(Token("\"x\"").kind() == TokenKind::String);
  REQUIRE(Token("#x").kind() == TokenKind::Comment);
  REQUIRE(Token("1.5").kind() == TokenKind::Bare);

  REQUIRE(Token("WorldBegin").is_directive());
  REQUIRE(Token("AttributeBegin").is_directive());
  REQUIRE_FALSE(Token("Worldbegin").is_directive());
  REQUIRE_FALSE(Token("\"Shape\"").is_directive());
}


TEST_CASE("Token coercion", "[token]")
{
  SECTION("floats") {
    float val = 0.0f;
    REQUIRE(Token("1.5").to_float(&val));
    REQUIRE(val == Approx(1.5f));
    REQUIRE(Token("-2").to_float(&val));
    REQUIRE(val == Approx(-2.0f));
    REQUIRE(Token("1e3").to_float(&val));
    REQUIRE(val == Approx(1000.0f));
    REQUIRE(Token(".25").to_float(&val));
    REQUIRE(val == Approx(0.25f));

    REQUIRE_FALSE(Token("abc").to_float(&val));
    REQUIRE_FALSE(Token("1.5x").to_float(&val));
    REQUIRE_FALSE(Token("\"1.5\"").to_float(&val));
  }

  SECTION("float overflow and overlong numbers") {
    float val = 0.0f;
    REQUIRE(Token("1e400").to_float(&val));
    REQUIRE(std::isinf(val));

    std::string longest(63, '1');
    REQUIRE(Token(longest.c_str()).to_float(&val));
    std::string tooLong(64, '1');
    REQUIRE_FALSE(Token(tooLong.c_str()).to_float(&val));
    int ival = 0;
    REQUIRE_FALSE(Token(tooLong.c_str()).to_int(&ival));
  }

  SECTION("ints") {
    int val = 0;
    REQUIRE(Token("42").to_int(&val));
    REQUIRE(val == 42);
    REQUIRE(Token("-7").to_int(&val));
    REQUIRE(val == -7);

    REQUIRE_FALSE(Token("4.5").to_int(&val));
    REQUIRE_FALSE(Token("99999999999").to_int(&val));
    REQUIRE_FALSE(Token("x").to_int(&val));
  }

  SECTION("bools") {
    bool val = false;
    REQUIRE(Token("true").to_bool(&val));
    REQUIRE(val);
    REQUIRE(Token("\"false\"").to_bool(&val));
    REQUIRE_FALSE(val);
    REQUIRE_FALSE(Token("yes").to_bool(&val));
    REQUIRE_FALSE(Token("1").to_bool(&val));
  }

  SECTION("strings") {
    std::string val;
    REQUIRE(Token("\"foo bar\"").unquote(&val));
    REQUIRE(val == "foo bar");
    REQUIRE(Token("\"\"").unquote(&val));
    REQUIRE(val.empty());
    REQUIRE_FALSE(Token("foo").unquote(&val));
    REQUIRE_FALSE(Token("\"").unquote(&val));
  }
}


TEST_CASE("Token matching stops at the token length", "[token]")
{
  const char text[] = "LookAt\0xx";
  Token tok(text, sizeof(text) - 1);
  REQUIRE(tok.len == 9);

  REQUIRE_FALSE(tok.equals("LookAt"));
  REQUIRE_FALSE(tok.is_directive());
  DirectiveID id;
  REQUIRE_FALSE(find_directive(text, sizeof(text) - 1, &id));

  REQUIRE(Token(text, 6).equals("LookAt"));
  REQUIRE(Token(text, 6).is_directive());
  REQUIRE(find_directive(text, 6, &id));
  REQUIRE(id == DirectiveID::LookAt);

  REQUIRE_FALSE(Token(text, 4).equals("LookAt"));

  const char typeText[] = "float\0x";
  ParamType type;
  REQUIRE_FALSE(param_type_from_name(typeText, sizeof(typeText) - 1, &type));
  REQUIRE(param_type_from_name(typeText, 5, &type));
  REQUIRE(type == ParamType::Float);
}
