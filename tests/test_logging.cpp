#include <catch2/catch.hpp>

#include "intexpr.hpp"

#include <sstream>
#include <string>

namespace ie = intexpr;

using Catch::Matchers::Contains;
using Catch::Matchers::EndsWith;
using Catch::Matchers::StartsWith;

namespace {

const std::string start_banner = std::string(30, '>') + '\n';
const std::string end_banner = std::string(30, '<') + '\n';

} // namespace

TEST_CASE("a traced parse is framed by banners", "[logging]")
{
   std::ostringstream log;

   SECTION("valid expression")
   {
      const auto result = ie::parse("1 + 2", log);
      REQUIRE(result);
      REQUIRE(result->evaluate() == 3);

      const auto out = log.str();
      REQUIRE_THAT(out, StartsWith(start_banner + "Parsing expression: '1 + 2'\n"));
      REQUIRE_THAT(out, Contains("Found character(s) matching '\\d+': '1'\n"));
      REQUIRE_THAT(out, Contains("Found character(s) matching '[+\\-]': '+'\n"));
      REQUIRE_THAT(out, !Contains("No match found for '[(]'"));
      REQUIRE_THAT(out, EndsWith("Parsed expression '1 + 2' is valid and has value 3\n" + end_banner));
   }

   SECTION("invalid expression")
   {
      const auto result = ie::parse("3 +", log);
      REQUIRE_FALSE(result);
      REQUIRE_THAT(
         log.str(),
         EndsWith(
            "Parsed expression '3 +' is invalid: Operator must be followed by an expression (at offset 3)\n"
            + end_banner));
   }

   SECTION("input rejected before scanning logs no match attempts")
   {
      const auto result = ie::parse("", log);
      REQUIRE_FALSE(result);
      REQUIRE(
         log.str()
         == start_banner + "Parsing expression: ''\n" + "Parsed expression '' is invalid: No expression specified\n"
               + end_banner);
   }

   SECTION("expression that can't be evaluated")
   {
      const auto result = ie::parse("4 / 0", log);
      REQUIRE(result);
      REQUIRE_THAT(
         log.str(),
         EndsWith("Parsed expression '4 / 0' is valid but cannot be evaluated: Division by zero\n" + end_banner));
      REQUIRE_THROWS_AS(result->evaluate(), ie::division_by_zero);
   }
}

TEST_CASE("tracing doesn't change the result", "[logging]")
{
   std::ostringstream log;
   const auto traced = ie::parse("(50 - 11) * 2", log);
   const auto untraced = ie::parse("(50 - 11) * 2");
   REQUIRE(traced);
   REQUIRE(untraced);
   REQUIRE(traced->evaluate() == untraced->evaluate());
   REQUIRE_FALSE(log.str().empty());
}
