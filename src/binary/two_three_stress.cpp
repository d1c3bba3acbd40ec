#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <lyra/lyra.hpp>
#include <map>
#include <random>
#include <two_three/two_three_tree.hpp>
#include <unordered_set>
#include <vector>

using namespace kressler::two_three;

int main(int argc, char** argv) {
  bool show_help = false;
  bool print_tree = false;
  uint64_t seed = std::chrono::system_clock::now().time_since_epoch().count();
  size_t target_iterations = 1;
  size_t num_keys = 10000;
  uint64_t key_range = 10000000;
  size_t validate_every = 1;

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(seed, "seed")["-d"]["--seed"](
          "Random seed (defaults to time since epoch)") |
      lyra::opt(target_iterations,
                "iterations")["-i"]["--iterations"]("Iterations to run") |
      lyra::opt(num_keys, "num_keys")["-n"]["--num-keys"](
          "Number of distinct keys to insert per iteration") |
      lyra::opt(key_range, "key_range")["-r"]["--key-range"](
          "Keys are drawn from [0, key_range)") |
      lyra::opt(validate_every, "validate_every")["-v"]["--validate-every"](
          "Validate the tree after every N operations (0 disables)") |
      lyra::opt(print_tree)["-p"]["--print"](
          "Print the tree after the insert phase");

  // Parse command line
  auto result = cli.parse({argc, argv});
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    std::cerr << cli << std::endl;
    return 1;
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  if (num_keys > key_range) {
    std::cerr << "Cannot draw " << num_keys << " distinct keys from a range of "
              << key_range << std::endl;
    return 1;
  }

  for (size_t iter = 0; iter < target_iterations; ++iter) {
    std::mt19937_64 rng(iter + seed);
    std::uniform_int_distribution<uint64_t> dist(0, key_range - 1);

    std::cout << "Iteration " << iter << " using " << num_keys << " keys, seed "
              << iter + seed << std::endl;

    two_three_tree<uint64_t, uint64_t> tree;
    std::map<uint64_t, uint64_t> ordered_map;
    std::unordered_set<uint64_t> seen;
    std::vector<uint64_t> keys;
    size_t operations = 0;

    auto validate = [&]() -> void {
      ++operations;
      if (validate_every == 0 || operations % validate_every != 0) {
        return;
      }
      try {
        tree.validate();
      } catch (const invariant_violation& e) {
        std::cout << "Invariant violated after " << operations
                  << " operations: " << e.what() << std::endl;
        exit(1);
      }
      if (tree.size() != ordered_map.size()) {
        std::cout << "Size mismatch: tree " << tree.size() << " != map "
                  << ordered_map.size() << std::endl;
        exit(1);
      }
    };

    // Insert storm
    while (keys.size() < num_keys) {
      uint64_t key = dist(rng);
      uint64_t val = dist(rng);
      if (!seen.insert(key).second) {
        continue;
      }
      keys.push_back(key);
      ordered_map.insert({key, val});
      if (!tree.insert(key, val)) {
        std::cout << "Insert of new key " << key << " was rejected"
                  << std::endl;
        exit(1);
      }
      auto found = tree.find(key);
      if (!found || found->value != val) {
        std::cout << "Key " << key << " not found after insert" << std::endl;
        exit(1);
      }
      validate();
    }

    for (const auto& [key, val] : ordered_map) {
      auto found = tree.find(key);
      if (!found || found->value != val) {
        std::cout << "Mismatch at key " << key << std::endl;
        exit(1);
      }
    }

    if (print_tree) {
      tree.print(std::cout);
    }

    // Delete storm, picking from a shrinking candidate list
    for (size_t remaining = keys.size(); remaining > 0; --remaining) {
      std::uniform_int_distribution<size_t> index_dist(0, remaining - 1);
      size_t index = index_dist(rng);
      uint64_t key = keys[index];
      keys[index] = keys[remaining - 1];

      ordered_map.erase(key);
      if (!tree.erase(key)) {
        std::cout << "Erase of present key " << key << " failed" << std::endl;
        exit(1);
      }
      if (tree.contains(key)) {
        std::cout << "Key " << key << " still present after erase"
                  << std::endl;
        exit(1);
      }
      validate();
    }

    if (!tree.empty()) {
      std::cout << "Tree not empty after deleting every key!" << std::endl;
      exit(1);
    }
  }
  return 0;
}
