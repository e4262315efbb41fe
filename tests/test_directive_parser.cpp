#include "pbrtscene.h"

#include <catch2/catch.hpp>

#include <cstring>
#include <string>
#include <vector>

using namespace pbrtscene;


struct ParseResult {
  std::vector<DirectiveID> ids;
  ErrorCode error = ErrorCode::None;
  int64_t line = 0;
  int64_t column = 0;
};


static ParseResult parse_all(const char* text)
{
  ParseResult result;
  DirectiveParser parser(text, std::strlen(text), "test.pbrt");
  Directive directive;
  while (parser.next_directive(&directive)) {
    result.ids.push_back(directive.id);
  }
  if (parser.has_error()) {
    result.error = parser.error()->code();
    result.line = parser.error()->line();
    result.column = parser.error()->column();
  }
  return result;
}


static bool parse_one(const char* text, Directive* directive)
{
  DirectiveParser parser(text, std::strlen(text), "test.pbrt");
  return parser.next_directive(directive);
}


TEST_CASE("Directive keywords", "[parser]")
{
  ParseResult result = parse_all("WorldBegin\nAttributeBegin\nAttributeEnd\nReverseOrientation # comment\n");
  REQUIRE(result.error == ErrorCode::None);
  REQUIRE(result.ids.size() == 4);
  REQUIRE(result.ids[0] == DirectiveID::WorldBegin);
  REQUIRE(result.ids[1] == DirectiveID::AttributeBegin);
  REQUIRE(result.ids[2] == DirectiveID::AttributeEnd);
  REQUIRE(result.ids[3] == DirectiveID::ReverseOrientation);

  DirectiveID id;
  REQUIRE(find_directive("MakeNamedMedium", 15, &id));
  REQUIRE(id == DirectiveID::MakeNamedMedium);
  REQUIRE(std::strcmp(directive_name(DirectiveID::CoordSysTransform), "CoordSysTransform") == 0);

  SECTION("empty input has no directives and no error") {
    result = parse_all("   # nothing here\n");
    REQUIRE(result.ids.empty());
    REQUIRE(result.error == ErrorCode::None);
  }
}


TEST_CASE("Directive float arguments", "[parser]")
{
  Directive d;

  REQUIRE(parse_one("Translate 1 2.5 -3", &d));
  REQUIRE(d.id == DirectiveID::Translate);
  REQUIRE(d.numFloats == 3);
  REQUIRE(d.floats[0] == Approx(1.0f));
  REQUIRE(d.floats[1] == Approx(2.5f));
  REQUIRE(d.floats[2] == Approx(-3.0f));

  SECTION("brackets are optional") {
    REQUIRE(parse_one("Rotate [ 90 0 0 1 ]", &d));
    REQUIRE(d.id == DirectiveID::Rotate);
    REQUIRE(d.numFloats == 4);
    REQUIRE(d.floats[0] == Approx(90.0f));
  }

  SECTION("sixteen values for a transform") {
    REQUIRE(parse_one("Transform [1 0 0 0  0 1 0 0  0 0 1 0  4 5 6 1]", &d));
    REQUIRE(d.numFloats == 16);
    REQUIRE(d.floats[12] == Approx(4.0f));
  }

  SECTION("errors") {
    REQUIRE(parse_all("Translate 1 2").error == ErrorCode::UnexpectedEOF);
    REQUIRE(parse_all("Translate 1 x 3").error == ErrorCode::InvalidNumber);
    REQUIRE(parse_all("Translate [1 2 3 4]").error == ErrorCode::UnexpectedToken);
    REQUIRE(parse_all("Translate [1 2]").error == ErrorCode::UnexpectedToken);
  }
}


TEST_CASE("Directive string arguments", "[parser]")
{
  Directive d;

  REQUIRE(parse_one("Texture \"checks\" \"spectrum\" \"checkerboard\" \"float uscale\" 4", &d));
  REQUIRE(d.id == DirectiveID::Texture);
  REQUIRE(d.numStrings == 3);
  REQUIRE(d.strings[0] == "checks");
  REQUIRE(d.strings[1] == "spectrum");
  REQUIRE(d.strings[2] == "checkerboard");
  REQUIRE(d.params.float_value("uscale", 0.0f) == Approx(4.0f));

  SECTION("an optional second string") {
    REQUIRE(parse_one("MediumInterface \"fog\"", &d));
    REQUIRE(d.numStrings == 1);
    REQUIRE(parse_one("MediumInterface \"fog\" \"\"", &d));
    REQUIRE(d.numStrings == 2);
    REQUIRE(d.strings[1].empty());
  }

  SECTION("a bare word where a string is required") {
    REQUIRE(parse_all("Shape sphere").error == ErrorCode::InvalidString);
  }
}


TEST_CASE("Directive parameter lists", "[parser]")
{
  Directive d;

  REQUIRE(parse_one("Shape \"trianglemesh\" \"integer indices\" [0 1 2] \"point3 P\" [0 0 0 1 0 0 0 1 0] "
                    "\"bool flag\" true \"string name\" \"tri\" \"rgb Kd\" [.5 .5 .5]", &d));
  REQUIRE(d.id == DirectiveID::Shape);
  REQUIRE(d.strings[0] == "trianglemesh");
  REQUIRE(d.params.size() == 5);
  REQUIRE(d.params.ints("indices")->size() == 3);
  REQUIRE(d.params.floats("P")->size() == 9);
  REQUIRE(d.params.bool_value("flag", false));
  REQUIRE(std::strcmp(d.params.string_value("name"), "tri") == 0);
  REQUIRE(d.params.find("Kd")->type() == ParamType::RGB);

  SECTION("a scalar value needs no brackets") {
    REQUIRE(parse_one("Shape \"sphere\" \"float radius\" 2", &d));
    REQUIRE(d.params.float_value("radius", 0.0f) == Approx(2.0f));
  }

  SECTION("blackbody accepts a decimal point") {
    REQUIRE(parse_one("LightSource \"point\" \"blackbody I\" [ 5500.0 ]", &d));
    REQUIRE(d.params.ints("I")->front() == 5500);
  }

  SECTION("parameters end at the next directive") {
    ParseResult result = parse_all("Shape \"sphere\" \"float radius\" 1 WorldBegin");
    REQUIRE(result.error == ErrorCode::None);
    REQUIRE(result.ids.size() == 2);
  }

  SECTION("an option takes exactly one param") {
    REQUIRE(parse_one("Option \"bool disablepixeljitter\" true", &d));
    REQUIRE(d.id == DirectiveID::Option);
    REQUIRE(d.option.name() == "disablepixeljitter");
    REQUIRE(d.option.bools()->front());
  }
}


TEST_CASE("Directive parse errors", "[parser]")
{
  SECTION("duplicate parameter names") {
    ParseResult result = parse_all("Shape \"sphere\" \"float radius\" 1 \"float radius\" 2");
    REQUIRE(result.error == ErrorCode::DuplicateParam);
  }

  SECTION("unknown directive") {
    ParseResult result = parse_all("WorldBegin\n  Frobnicate 1\n");
    REQUIRE(result.error == ErrorCode::UnknownDirective);
    REQUIRE(result.ids.size() == 1);
    REQUIRE(result.line == 2);
    REQUIRE(result.column == 3);
  }

  SECTION("a stray bracket") {
    REQUIRE(parse_all("]").error == ErrorCode::UnexpectedToken);
  }

  SECTION("an invalid token") {
    REQUIRE(parse_all("Shape \"sphere").error == ErrorCode::InvalidToken);
  }

  SECTION("parameter declarations") {
    REQUIRE(parse_all("Shape \"sphere\" \"double radius\" 1").error == ErrorCode::InvalidParamType);
    REQUIRE(parse_all("Shape \"sphere\" \"float\" 1").error == ErrorCode::InvalidParamName);
    REQUIRE(parse_all("Shape \"sphere\" \"\" 1").error == ErrorCode::InvalidParamName);
  }

  SECTION("parameter values") {
    REQUIRE(parse_all("Shape \"sphere\" \"float radius\" [ one ]").error == ErrorCode::InvalidNumber);
    REQUIRE(parse_all("Shape \"sphere\" \"integer n\" [ 1.5 ]").error == ErrorCode::InvalidNumber);
    REQUIRE(parse_all("Shape \"sphere\" \"bool b\" maybe").error == ErrorCode::InvalidBool);
    REQUIRE(parse_all("Shape \"sphere\" \"string s\" [ bare ]").error == ErrorCode::InvalidString);
    REQUIRE(parse_all("Shape \"sphere\" \"float radius\" ]").error == ErrorCode::UnexpectedToken);
  }

  SECTION("a missing close bracket runs into a directive") {
    REQUIRE(parse_all("Shape \"sphere\" \"float radius\" [ 1 WorldBegin").error == ErrorCode::UnexpectedToken);
  }

  SECTION("end of input inside a value list") {
    REQUIRE(parse_all("Shape \"sphere\" \"float radius\" [ 1").error == ErrorCode::UnexpectedEOF);
  }
}
