#ifndef INTEXPR_CLI_HPP
#define INTEXPR_CLI_HPP

#include "intexpr.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace intexpr::cli {

inline constexpr std::string_view usage = "Usage: intexpr [-v|--verbose] [-h|--help] [--] [expression...]\n"
                                          "Evaluates each expression given as an argument, or each line of\n"
                                          "standard input when no expression is given. Arguments such as -5\n"
                                          "that don't look like an option are taken as expressions.\n";

struct options {
   bool verbose = false;
   bool help = false;
   std::vector<std::string_view> expressions;
};

// Only a dash followed by a letter is an option, so "-5" or "- 3" get reported as parse errors
inline bool is_option(std::string_view arg) noexcept
{
   return arg == "--" || static_cast<bool>(ctre::match<"--?[a-zA-Z][a-zA-Z0-9]*(-[a-zA-Z0-9]+)*">(arg));
}

inline auto parse_args(int argc, const char* const* argv) -> nonstd::expected<options, std::string>
{
   options to_ret;
   bool flags_done = false;
   for (int i = 1; i < argc; ++i) {
      const std::string_view arg{argv[i]};
      if (flags_done || !is_option(arg)) {
         to_ret.expressions.push_back(arg);
      }
      else if (arg == "--") {
         flags_done = true;
      }
      else if (arg == "-v" || arg == "--verbose") {
         to_ret.verbose = true;
      }
      else if (arg == "-h" || arg == "--help") {
         to_ret.help = true;
      }
      else {
         return nonstd::make_unexpected("Unknown option \"" + std::string{arg} + '"');
      }
   }
   return to_ret;
}

// Prints the value or the reason there isn't one; traces go to log when it's given
inline bool run(std::string_view text, std::ostream& out, std::ostream* log)
{
   const auto result = log ? intexpr::parse(text, *log) : intexpr::parse(text);
   if (!result) {
      out << "Parse error: " << result.error() << '\n';
      return false;
   }
   try {
      out << "Value: " << result->evaluate() << '\n';
   }
   catch (const division_by_zero& e) {
      out << "Evaluation error: " << e.what() << '\n';
      return false;
   }
   return true;
}

// Exit status: 0 when everything evaluated, 1 when something didn't, 2 for bad arguments
inline int main(int argc, const char* const* argv, std::istream& in, std::ostream& out, std::ostream& err)
{
   const auto opts = parse_args(argc, argv);
   if (!opts) {
      err << opts.error() << '\n' << usage;
      return 2;
   }
   if (opts->help) {
      out << usage;
      return 0;
   }

   std::ostream* log = opts->verbose ? &err : nullptr;
   bool all_ok = true;
   if (!opts->expressions.empty()) {
      for (const auto expr : opts->expressions) {
         all_ok = run(expr, out, log) && all_ok;
      }
   }
   else {
      std::string to_parse;
      while (std::getline(in, to_parse)) {
         all_ok = run(to_parse, out, log) && all_ok;
      }
   }
   return all_ok ? 0 : 1;
}

} // namespace intexpr::cli

#endif // INTEXPR_CLI_HPP
