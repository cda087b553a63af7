#include <benchmark/benchmark.h>

#include <fstream>
#include <iostream>
#include <random>

#include <relalg/logic/evaluator/evaluator.hpp>

namespace relalg {

namespace {

Relation GenerateUsers(std::int64_t rows, std::int64_t distinct_names) {
  auto schema = Schema::Create({
      {"id", Type::kInt},
      {"name", Type::kString},
      {"age", Type::kInt},
  }).value();
  auto users = Relation::Create("users", std::move(schema), 0).value();

  std::mt19937_64 gen{42};
  std::uniform_int_distribution<std::int64_t> names{0, distinct_names - 1};
  std::uniform_int_distribution<std::int64_t> ages{0, 99};
  Tuples tuples;
  tuples.reserve(rows);
  for (std::int64_t id = 0; id < rows; ++id) {
    tuples.push_back({IntValue{id}, StringValue{"user_" + std::to_string(names(gen))},
                      IntValue{ages(gen)}});
  }
  users.InsertRows(std::move(tuples)).value();
  return users;
}

template <typename MakeOperator>
void RunEvaluation(benchmark::State& state, MakeOperator make_op) {
  std::ofstream nullstream("/dev/null");
  auto* old = std::clog.rdbuf(nullstream.rdbuf());

  auto users = GenerateUsers(state.range(0), state.range(1));
  Operator op = make_op(users);
  Evaluator evaluator;

  for (auto _ : state) {
    benchmark::DoNotOptimize(evaluator.Evaluate(op));
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));

  std::clog.rdbuf(old);
}

} // namespace

void BM_Projection(benchmark::State& state) {
  RunEvaluation(state, [](const Relation& users) -> Operator {
    return Projection{{"name", "age"}, std::make_shared<Operator>(Table{&users})};
  });
}

void BM_NestedProjection(benchmark::State& state) {
  RunEvaluation(state, [](const Relation& users) -> Operator {
    return Projection{
        {"name"},
        std::make_shared<Operator>(
            Projection{{"name", "age"}, std::make_shared<Operator>(Table{&users})})};
  });
}

void BM_Selection(benchmark::State& state) {
  RunEvaluation(state, [](const Relation& users) -> Operator {
    return Selection{Comparison{"age", CompareOp::kLt, IntValue{18}},
                     std::make_shared<Operator>(Table{&users})};
  });
}

BENCHMARK(BM_Projection)->Args({1000, 10})->Args({10000, 100})->Args({100000, 100000});
BENCHMARK(BM_NestedProjection)->Args({1000, 10})->Args({10000, 100})->Args({100000, 100000});
BENCHMARK(BM_Selection)->Args({1000, 10})->Args({10000, 100})->Args({100000, 100000});

}  // namespace relalg

BENCHMARK_MAIN();
