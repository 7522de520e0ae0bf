#include <benchmark/benchmark.h>

#include "intexpr.hpp"

#include <cstdint>
#include <string>

namespace {

// "1 + 2 * 3 - 4 / 5 + ..." with the given number of operands
std::string flat_expression(int operands)
{
   constexpr char ops[] = {'+', '*', '-', '/'};
   std::string to_ret = "1";
   for (int i = 1; i < operands; ++i) {
      to_ret += ' ';
      to_ret += ops[i % 4];
      to_ret += ' ';
      to_ret += std::to_string(i % 97 + 1);
   }
   return to_ret;
}

// "((((1 + 1) + 1) + 1) ..." nested to the given depth
std::string nested_expression(int depth)
{
   std::string to_ret(depth, '(');
   to_ret += '1';
   for (int i = 0; i < depth; ++i) {
      to_ret += " + 1)";
   }
   return to_ret;
}

void parse_flat_bench(benchmark::State& state)
{
   const auto input = flat_expression(static_cast<int>(state.range(0)));
   for (auto _ : state) {
      auto result = intexpr::parse(input);
      benchmark::DoNotOptimize(result);
   }
   state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(input.size()));
}

void parse_nested_bench(benchmark::State& state)
{
   const auto input = nested_expression(static_cast<int>(state.range(0)));
   for (auto _ : state) {
      auto result = intexpr::parse(input);
      benchmark::DoNotOptimize(result);
   }
   state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(input.size()));
}

void evaluate_bench(benchmark::State& state)
{
   const auto expr = intexpr::parse(flat_expression(static_cast<int>(state.range(0)))).value();
   for (auto _ : state) {
      benchmark::DoNotOptimize(expr.evaluate());
   }
}

} // namespace

BENCHMARK(parse_flat_bench)->Range(8, 4096);
BENCHMARK(parse_nested_bench)->Range(8, 512);
BENCHMARK(evaluate_bench)->Range(8, 4096);
