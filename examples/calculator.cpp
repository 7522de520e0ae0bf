// Parse once, evaluate as often as needed

#include "intexpr.hpp"

#include <cassert>
#include <iostream>

int main()
{
   const auto parsed = intexpr::parse("(50 - 11) * 2 + 41");
   assert(parsed);
   const auto& expr = parsed.value();
   assert(expr.evaluate() == 119);
   assert(expr.evaluate() == 119);
   std::cout << expr << " = " << expr.evaluate() << '\n';

   // Unbalanced parentheses at either end are accepted
   assert(intexpr::parse("((((50 - 11) * 2) + 41").value().evaluate() == 119);
   assert(intexpr::parse("((50 - 11) * 2) + 41) ) )").value().evaluate() == 119);

   const auto bad = intexpr::parse("3 +");
   assert(!bad);
   std::cout << "\"3 +\": " << bad.error() << '\n';

   const auto div_zero = intexpr::parse("1 / (2 - 2)");
   try {
      std::cout << div_zero.value().evaluate() << '\n';
   }
   catch (const intexpr::division_by_zero& e) {
      std::cout << "\"1 / (2 - 2)\": " << e.what() << '\n';
   }
}
