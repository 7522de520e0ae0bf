#ifndef INTEXPR_HPP
#define INTEXPR_HPP

// Always the nonstd implementation, even where std::expected is available
#define nsel_CONFIG_SELECT_EXPECTED nsel_EXPECTED_NONSTD
#include <nonstd/expected.hpp>

#include <ctre.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace intexpr {

template<std::size_t N>
struct const_str {
   constexpr const_str(const char (&other)[N]) : data{} { std::ranges::copy(other, std::begin(data)); }

   char data[N];
   constexpr auto operator<=>(const const_str&) const = default;
};

template<auto... Values>
   requires requires { typename std::common_type<decltype(Values)...>::type; }
struct one_of_struct {
   friend constexpr bool operator==(const std::common_type_t<decltype(Values)...>& val, one_of_struct) noexcept
   {
      return ((val == Values) || ...);
   }
};

template<auto... Values>
inline constexpr auto one_of = one_of_struct<Values...>{};

// Same set as \s in the grammar patterns
inline constexpr auto is_ws = [](const char c) { return c == one_of<' ', '\n', '\r', '\t', '\v', '\f'>; };

inline constexpr auto is_digit = [](const char c) { return c >= '0' && c <= '9'; };

enum class operation : std::uint8_t {
   add,
   subtract,
   multiply,
   divide,
};

// Indexed by operation
inline constexpr auto operation_symbols = std::to_array<std::pair<operation, char>>(
   {{operation::add, '+'}, {operation::subtract, '-'}, {operation::multiply, '*'}, {operation::divide, '/'}});

constexpr char symbol(operation op) noexcept { return operation_symbols[static_cast<std::size_t>(op)].second; }

constexpr std::optional<operation> operation_for(char c) noexcept
{
   const auto loc = std::ranges::find(operation_symbols, c, &std::pair<operation, char>::second);
   if (loc == operation_symbols.end()) {
      return std::nullopt;
   }
   return loc->first;
}

class division_by_zero : public std::domain_error {
public:
   division_by_zero() : std::domain_error{"Division by zero"} {}
};

// Arithmetic wraps around at 32 bits instead of overflowing, so every result is defined.
// Division truncates toward zero.
constexpr std::int32_t apply(operation op, std::int32_t lhs, std::int32_t rhs)
{
   const auto a = static_cast<std::uint32_t>(lhs);
   const auto b = static_cast<std::uint32_t>(rhs);
   switch (op) {
   case operation::add: return static_cast<std::int32_t>(a + b);
   case operation::subtract: return static_cast<std::int32_t>(a - b);
   case operation::multiply: return static_cast<std::int32_t>(a * b);
   case operation::divide:
      if (rhs == 0) {
         throw division_by_zero{};
      }
      // INT32_MIN / -1 is the one quotient that doesn't fit
      if (rhs == -1) {
         return static_cast<std::int32_t>(0u - a);
      }
      return lhs / rhs;
   }
   throw std::invalid_argument{"Invalid operation"};
}

struct node;

// Frees a tree without recursing, so left-deep chains of any length can be destroyed
struct node_deleter {
   void operator()(node* n) const noexcept;
};

using node_ptr = std::unique_ptr<node, node_deleter>;

struct literal {
   std::int32_t value;
};

struct binary_op {
   operation op;
   node_ptr left;
   node_ptr right;
};

struct node {
   std::variant<literal, binary_op> value;
};

inline void node_deleter::operator()(node* n) const noexcept
{
   std::vector<node*> pending{n};
   while (!pending.empty()) {
      node* cur = pending.back();
      pending.pop_back();
      if (!cur) {
         continue;
      }
      if (const auto bin = std::get_if<binary_op>(&cur->value)) {
         pending.push_back(bin->left.release());
         pending.push_back(bin->right.release());
      }
      delete cur;
   }
}

inline node_ptr make_literal(std::int32_t value) { return node_ptr{new node{literal{value}}}; }

inline node_ptr make_binary(operation op, node_ptr left, node_ptr right)
{
   return node_ptr{new node{binary_op{op, std::move(left), std::move(right)}}};
}

// Post-order walk with an explicit stack; the left operand is always evaluated before the right one
inline std::int32_t evaluate(const node& root)
{
   struct frame {
      const node* n;
      bool operands_done;
   };
   std::vector<frame> pending{{&root, false}};
   std::vector<std::int32_t> values;
   while (!pending.empty()) {
      const auto [n, operands_done] = pending.back();
      pending.pop_back();
      if (const auto lit = std::get_if<literal>(&n->value)) {
         values.push_back(lit->value);
         continue;
      }
      const auto& bin = std::get<binary_op>(n->value);
      if (operands_done) {
         const auto rhs = values.back();
         values.pop_back();
         const auto lhs = values.back();
         values.pop_back();
         values.push_back(apply(bin.op, lhs, rhs));
      }
      else {
         pending.push_back({n, true});
         pending.push_back({bin.right.get(), false});
         pending.push_back({bin.left.get(), false});
      }
   }
   return values.back();
}

// Fully parenthesized, so the output parses back to the same tree
inline std::ostream& operator<<(std::ostream& os, const node& root)
{
   struct frame {
      const node* n;
      int stage;
   };
   std::vector<frame> pending{{&root, 0}};
   while (!pending.empty()) {
      const auto [n, stage] = pending.back();
      pending.pop_back();
      if (const auto lit = std::get_if<literal>(&n->value)) {
         os << lit->value;
         continue;
      }
      const auto& bin = std::get<binary_op>(n->value);
      switch (stage) {
      case 0:
         os << '(';
         pending.push_back({n, 1});
         pending.push_back({bin.left.get(), 0});
         break;
      case 1:
         os << ' ' << symbol(bin.op) << ' ';
         pending.push_back({n, 2});
         pending.push_back({bin.right.get(), 0});
         break;
      default: os << ')'; break;
      }
   }
   return os;
}

class expression {
public:
   explicit expression(node_ptr root) noexcept : root_{std::move(root)} {}

   std::int32_t evaluate() const { return intexpr::evaluate(*root_); }

   const node& root() const noexcept { return *root_; }

   friend std::ostream& operator<<(std::ostream& os, const expression& expr) { return os << *expr.root_; }

private:
   node_ptr root_;
};

struct parse_error {
   std::string message;
   std::optional<std::size_t> offset;

   std::string describe() const
   {
      if (!offset) {
         return message;
      }
      return message + " (at offset " + std::to_string(*offset) + ')';
   }
};

inline std::ostream& operator<<(std::ostream& os, const parse_error& err) { return os << err.describe(); }

template<typename T>
using parse_result = nonstd::expected<T, parse_error>;

// A grammar rule either produces a value, matches nothing (and consumes nothing), or fails the whole parse
template<typename T>
using rule_result = parse_result<std::optional<T>>;

// Deepest parenthesis nesting a parse accepts
inline constexpr std::size_t max_nesting_depth = 1000;

class cursor {
public:
   explicit cursor(std::string_view text, std::ostream* log = nullptr) noexcept : text_{text}, log_{log} {}

   // Match Pattern anchored at the current offset, consuming it on success.
   // On failure nothing is consumed.
   template<const_str Pattern>
   auto match_next() -> std::optional<std::string_view>
   {
      const auto result = ctre::starts_with<Pattern.data>(rest());
      if (!result) {
         debug("No match found for '", Pattern.data, "'");
         return std::nullopt;
      }
      const auto matched = result.to_view();
      offset_ += matched.size();
      debug("Found character(s) matching '", Pattern.data, "': '", matched, "'");
      return matched;
   }

   std::string_view text() const noexcept { return text_; }
   std::string_view rest() const noexcept { return text_.substr(offset_); }
   std::size_t offset() const noexcept { return offset_; }
   bool at_end() const noexcept { return offset_ == text_.size(); }

   std::size_t depth() const noexcept { return depth_; }
   void descend() noexcept { ++depth_; }
   void ascend() noexcept { --depth_; }

   template<typename... Args>
   void debug(const Args&... args) const
   {
      if (log_) {
         ((*log_ << args), ...);
         *log_ << '\n';
      }
   }

private:
   std::string_view text_;
   std::size_t offset_ = 0;
   std::size_t depth_ = 0;
   std::ostream* log_;
};

namespace detail {

inline auto no_match() -> std::optional<node_ptr> { return std::nullopt; }

inline auto fail(std::string message, std::size_t offset) -> nonstd::unexpected_type<parse_error>
{
   return nonstd::make_unexpected(parse_error{std::move(message), offset});
}

inline auto parse_low_priority(cursor& c) -> rule_result<node_ptr>;

template<const_str Symbols>
auto match_operation(cursor& c) -> std::optional<operation>
{
   const auto matched = c.match_next<Symbols>();
   if (!matched) {
      return std::nullopt;
   }
   return operation_for(matched->front());
}

// operand (operator operand)*, folded to the left
template<typename OperandRule, typename OperatorRule>
auto parse_binary_chain(cursor& c, OperandRule&& parse_operand, OperatorRule&& parse_operator) -> rule_result<node_ptr>
{
   auto first = parse_operand(c);
   if (!first || !*first) {
      return first;
   }
   auto answer = std::move(**first);
   while (true) {
      const auto op = parse_operator(c);
      if (!op) {
         return std::optional{std::move(answer)};
      }
      auto operand = parse_operand(c);
      if (!operand) {
         return nonstd::make_unexpected(std::move(operand.error()));
      }
      if (!*operand) {
         return fail("Operator must be followed by an expression", c.offset());
      }
      answer = make_binary(*op, std::move(answer), std::move(**operand));
   }
}

inline auto parse_number(cursor& c) -> rule_result<node_ptr>
{
   const auto start = c.offset();
   const auto digits = c.match_next<"\\d+">();
   if (!digits) {
      return no_match();
   }
   std::int32_t value{};
   const auto result = std::from_chars(digits->data(), digits->data() + digits->size(), value);
   if (result.ec != std::errc{}) {
      return fail("Number is out of range", start);
   }
   return std::optional{make_literal(value)};
}

inline auto parse_parenthesized(cursor& c) -> rule_result<node_ptr>
{
   const auto start = c.offset();
   if (!c.match_next<"[(]">()) {
      return no_match();
   }
   if (c.depth() == max_nesting_depth) {
      return fail("Expression is nested too deeply", start);
   }
   c.descend();
   auto answer = parse_low_priority(c);
   c.ascend();
   if (!answer) {
      return answer;
   }
   if (!*answer) {
      return fail("Left parenthesis must be followed by an expression", c.offset());
   }
   // Missing ) is fine, it's either at the end of the input or the enclosing expression's ) is missing too
   c.match_next<"[)]">();
   return answer;
}

inline auto parse_atomic(cursor& c) -> rule_result<node_ptr>
{
   c.match_next<"\\s+">();
   auto answer = parse_number(c);
   if (answer && !*answer) {
      answer = parse_parenthesized(c);
   }
   if (answer && *answer) {
      c.match_next<"\\s+">();
   }
   return answer;
}

inline auto parse_high_priority(cursor& c) -> rule_result<node_ptr>
{
   return parse_binary_chain(c, parse_atomic, [](cursor& cur) { return match_operation<"[*/]">(cur); });
}

inline auto parse_low_priority(cursor& c) -> rule_result<node_ptr>
{
   return parse_binary_chain(c, parse_high_priority, [](cursor& cur) { return match_operation<"[+\\-]">(cur); });
}

inline auto validate(std::string_view text) -> parse_result<std::string_view>
{
   if (std::ranges::all_of(text, is_ws)) {
      return nonstd::make_unexpected(parse_error{"No expression specified", std::nullopt});
   }
   if (const auto invalid = ctre::search<"[^\\d\\s()+\\-*/]">(text)) {
      return fail(
         "Input expression contains invalid characters",
         static_cast<std::size_t>(invalid.to_view().data() - text.data()));
   }
   const auto first = std::ranges::find_if_not(text, [](const char c) { return is_ws(c) || c == '('; });
   if (first == text.end() || !is_digit(*first)) {
      return fail(
         "first non-whitespace/non-'(' character must be numeric",
         static_cast<std::size_t>(std::distance(text.begin(), first)));
   }
   return text;
}

inline auto parse_expression(std::string_view text, std::ostream* log) -> parse_result<expression>
{
   if (const auto valid = validate(text); !valid) {
      return nonstd::make_unexpected(valid.error());
   }
   cursor c{text, log};
   auto answer = parse_low_priority(c);
   if (!answer) {
      return nonstd::make_unexpected(std::move(answer.error()));
   }
   if (!*answer) {
      return fail("No expression specified", c.offset());
   }
   // Whitespace and unmatched ) can follow the expression, nothing else can
   c.match_next<"[\\s)]+">();
   if (!c.at_end()) {
      return fail("Expression contains extraneous characters: '" + std::string{c.rest()} + "'", c.offset());
   }
   return expression{std::move(**answer)};
}

} // namespace detail

inline auto parse(std::string_view text) -> parse_result<expression> { return detail::parse_expression(text, nullptr); }

// Same as above, tracing every match attempt and the outcome to log
inline auto parse(std::string_view text, std::ostream& log) -> parse_result<expression>
{
   log << std::string(30, '>') << '\n';
   log << "Parsing expression: '" << text << "'\n";
   auto answer = detail::parse_expression(text, &log);
   if (!answer) {
      log << "Parsed expression '" << text << "' is invalid: " << answer.error() << '\n';
   }
   else {
      try {
         const auto value = answer->evaluate();
         log << "Parsed expression '" << text << "' is valid and has value " << value << '\n';
      }
      catch (const division_by_zero& e) {
         log << "Parsed expression '" << text << "' is valid but cannot be evaluated: " << e.what() << '\n';
      }
   }
   log << std::string(30, '<') << '\n';
   return answer;
}

} // namespace intexpr

#endif // INTEXPR_HPP
