// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <absl/container/btree_map.h>
#include <benchmark/benchmark.h>

#include <cstdint>
#include <map>
#include <random>
#include <two_three/two_three_tree.hpp>
#include <unordered_set>
#include <vector>

using namespace kressler::two_three;

// Generate unique random keys for benchmarking
std::vector<std::int64_t> GenerateUniqueKeys(std::size_t count) {
  std::mt19937_64 rng(42);
  std::uniform_int_distribution<std::int64_t> dist(0, 10'000'000);
  std::unordered_set<std::int64_t> unique_keys;
  std::vector<std::int64_t> keys;
  keys.reserve(count);

  while (keys.size() < count) {
    const auto key = dist(rng);
    if (unique_keys.insert(key).second) {
      keys.push_back(key);
    }
  }
  return keys;
}

// Thin adapters so every container is driven the same way
template <typename Map>
struct MapOps {
  static void insert(Map& map, std::int64_t key) { map.insert({key, key}); }
  static bool find(const Map& map, std::int64_t key) {
    return map.find(key) != map.end();
  }
  static void erase(Map& map, std::int64_t key) { map.erase(key); }
};

template <>
struct MapOps<two_three_tree<std::int64_t, std::int64_t>> {
  using Tree = two_three_tree<std::int64_t, std::int64_t>;
  static void insert(Tree& tree, std::int64_t key) { tree.insert(key, key); }
  static bool find(const Tree& tree, std::int64_t key) {
    return tree.find(key).has_value();
  }
  static void erase(Tree& tree, std::int64_t key) { tree.erase(key); }
};

// Build a container of state.range(0) random keys
template <typename Map>
static void BM_Insert(benchmark::State& state) {
  const auto keys =
      GenerateUniqueKeys(static_cast<std::size_t>(state.range(0)));
  for (auto _ : state) {
    Map map;
    for (const auto key : keys) {
      MapOps<Map>::insert(map, key);
    }
    benchmark::DoNotOptimize(map);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

// Look up every key of a populated container
template <typename Map>
static void BM_Find(benchmark::State& state) {
  const auto keys =
      GenerateUniqueKeys(static_cast<std::size_t>(state.range(0)));
  Map map;
  for (const auto key : keys) {
    MapOps<Map>::insert(map, key);
  }

  for (auto _ : state) {
    std::size_t hits = 0;
    for (const auto key : keys) {
      hits += MapOps<Map>::find(map, key) ? 1 : 0;
    }
    benchmark::DoNotOptimize(hits);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

// Erase and re-insert one key of a populated container
template <typename Map>
static void BM_EraseInsert(benchmark::State& state) {
  const auto keys =
      GenerateUniqueKeys(static_cast<std::size_t>(state.range(0)));
  Map map;
  for (const auto key : keys) {
    MapOps<Map>::insert(map, key);
  }

  std::size_t i = 0;
  for (auto _ : state) {
    const auto key = keys[i];
    MapOps<Map>::erase(map, key);
    MapOps<Map>::insert(map, key);
    i = (i + 1) % keys.size();
    benchmark::ClobberMemory();
  }
  state.SetItemsProcessed(state.iterations());
}

using TwoThree = two_three_tree<std::int64_t, std::int64_t>;
using StdMap = std::map<std::int64_t, std::int64_t>;
using AbslMap = absl::btree_map<std::int64_t, std::int64_t>;

BENCHMARK(BM_Insert<TwoThree>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Insert<StdMap>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Insert<AbslMap>)->Range(1 << 10, 1 << 18);

BENCHMARK(BM_Find<TwoThree>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Find<StdMap>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Find<AbslMap>)->Range(1 << 10, 1 << 18);

BENCHMARK(BM_EraseInsert<TwoThree>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_EraseInsert<StdMap>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_EraseInsert<AbslMap>)->Range(1 << 10, 1 << 18);

BENCHMARK_MAIN();
