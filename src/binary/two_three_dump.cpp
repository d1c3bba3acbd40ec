#include <cstdint>
#include <iostream>
#include <lyra/lyra.hpp>
#include <print>
#include <two_three/two_three_tree.hpp>
#include <vector>

using namespace kressler::two_three;

int main(int argc, char** argv) {
  // Command line parameters
  bool show_help = false;
  bool trace = false;
  std::vector<int64_t> insert_keys;
  std::vector<int64_t> erase_keys;

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(erase_keys, "key")["-e"]["--erase"](
          "Key to erase after all inserts (may be repeated)") |
      lyra::opt(trace)["-t"]["--trace"]("Print the tree after every operation") |
      lyra::arg(insert_keys, "keys")("Keys to insert, in order").required();

  // Parse command line
  auto result = cli.parse({argc, argv});

  // Check for errors
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

  two_three_tree<int64_t, int64_t> tree;
  for (const auto key : insert_keys) {
    const bool inserted = tree.insert(key, key);
    if (trace) {
      std::println("== Insert {}{}", key, inserted ? "" : " (duplicate)");
      std::cout << tree;
    }
  }

  for (const auto key : erase_keys) {
    const bool erased = tree.erase(key);
    if (trace) {
      std::println("== Erase {}{}", key, erased ? "" : " (not found)");
      std::cout << tree;
    }
  }

  try {
    tree.validate();
  } catch (const invariant_violation& e) {
    std::cerr << "Invalid tree: " << e.what() << std::endl;
    return 1;
  }

  if (!trace) {
    std::cout << tree;
  }
  std::println("size: {}, height: {}", tree.size(), tree.height());
  return 0;
}
