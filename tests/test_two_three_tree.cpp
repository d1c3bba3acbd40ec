// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <two_three/two_three_tree.hpp>
#include <utility>
#include <vector>

using namespace kressler::two_three;

namespace {

template <typename Tree>
std::string dump(const Tree& tree) {
  std::ostringstream os;
  os << tree;
  return os.str();
}

// Inserts key -> key and checks the tree is still well formed
template <typename Tree>
void insert_checked(Tree& tree, typename Tree::key_type key) {
  const auto size_before = tree.size();
  REQUIRE(tree.insert(key, key));
  REQUIRE(tree.size() == size_before + 1);
  REQUIRE_NOTHROW(tree.validate());
  auto found = tree.find(key);
  REQUIRE(found.has_value());
  REQUIRE(found->key == key);
}

template <typename Tree>
void erase_checked(Tree& tree, typename Tree::key_type key) {
  const auto size_before = tree.size();
  REQUIRE(tree.erase(key));
  REQUIRE(tree.size() == size_before - 1);
  REQUIRE_NOTHROW(tree.validate());
  REQUIRE_FALSE(tree.find(key).has_value());
}

}  // namespace

TEMPLATE_TEST_CASE("two_three_tree default constructor creates empty tree",
                   "[two_three][constructor]", int, std::int64_t,
                   std::uint64_t) {
  two_three_tree<TestType, TestType> tree;
  REQUIRE(tree.empty());
  REQUIRE(tree.size() == 0);
  REQUIRE(tree.height() == 0);
  REQUIRE_FALSE(tree.find(TestType{1}).has_value());
  REQUIRE_FALSE(tree.erase(TestType{1}));
  REQUIRE_NOTHROW(tree.validate());
}

TEMPLATE_TEST_CASE("two_three_tree single element", "[two_three][insert]",
                   int, std::int64_t, std::uint64_t) {
  two_three_tree<TestType, TestType> tree;
  REQUIRE(tree.insert(TestType{7}, TestType{70}));
  REQUIRE_FALSE(tree.empty());
  REQUIRE(tree.size() == 1);
  REQUIRE(tree.height() == 1);
  REQUIRE(tree.find(TestType{7})->value == TestType{70});
  REQUIRE_NOTHROW(tree.validate());

  SECTION("Erasing it empties the tree") {
    REQUIRE(tree.erase(TestType{7}));
    REQUIRE(tree.empty());
    REQUIRE(tree.size() == 0);
    REQUIRE(tree.height() == 0);
    REQUIRE_NOTHROW(tree.validate());
  }

  SECTION("Erasing a missing key leaves it alone") {
    REQUIRE_FALSE(tree.erase(TestType{8}));
    REQUIRE(tree.size() == 1);
    REQUIRE(tree.contains(TestType{7}));
  }
}

TEST_CASE("two_three_tree small insert and erase scenario",
          "[two_three][insert][erase]") {
  two_three_tree<std::uint64_t, std::uint64_t> tree;
  for (std::uint64_t key : {2, 1, 3, 5, 4}) {
    insert_checked(tree, key);
  }
  REQUIRE(tree.size() == 5);
  REQUIRE(tree.find(3)->value == 3);
  REQUIRE(tree.height() == 2);

  erase_checked(tree, 3);
  REQUIRE_FALSE(tree.find(3).has_value());
  REQUIRE(tree.size() == 4);

  SECTION("Ascending removal") {
    for (std::uint64_t key : {1, 2, 4, 5}) {
      erase_checked(tree, key);
    }
  }

  SECTION("Descending removal") {
    for (std::uint64_t key : {5, 4, 2, 1}) {
      erase_checked(tree, key);
    }
  }

  SECTION("Mixed removal") {
    for (std::uint64_t key : {4, 1, 5, 2}) {
      erase_checked(tree, key);
    }
  }

  REQUIRE(tree.empty());
  REQUIRE(tree.size() == 0);
  REQUIRE_FALSE(tree.erase(1));
}

TEST_CASE("two_three_tree print", "[two_three][print]") {
  two_three_tree<int, int> tree;

  SECTION("Empty tree") { REQUIRE(dump(tree) == "Empty tree\n"); }

  SECTION("Leaf root") {
    tree.insert(2, 2);
    tree.insert(1, 1);
    REQUIRE(dump(tree) == "Tree(2):\nElement: 1 2\n");
  }

  SECTION("Root split promotes the middle key") {
    for (int key : {2, 1, 3}) {
      tree.insert(key, key);
    }
    REQUIRE(dump(tree) ==
            "Tree(3):\n"
            "Element: 2\n"
            "| Element: 1\n"
            "| Element: 3\n");
  }

  SECTION("Leaf split absorbed by a 2-node parent") {
    for (int key : {2, 1, 3, 5, 4}) {
      tree.insert(key, key);
    }
    REQUIRE(dump(tree) ==
            "Tree(5):\n"
            "Element: 2 4\n"
            "| Element: 1\n"
            "| Element: 3\n"
            "| Element: 5\n");
  }
}

TEST_CASE("two_three_tree erase restructuring", "[two_three][erase]") {
  two_three_tree<int, int> tree;
  for (int key : {2, 1, 3, 5, 4}) {
    tree.insert(key, key);
  }

  SECTION("Hole in the middle of a 3-node merges with the left sibling") {
    REQUIRE(tree.erase(3));
    REQUIRE(dump(tree) ==
            "Tree(4):\n"
            "Element: 4\n"
            "| Element: 1 2\n"
            "| Element: 5\n");

    SECTION("Hole on the right borrows from a 3-node sibling") {
      REQUIRE(tree.erase(5));
      REQUIRE(dump(tree) ==
              "Tree(3):\n"
              "Element: 2\n"
              "| Element: 1\n"
              "| Element: 4\n");
    }

    SECTION("Hole on the left merges and collapses the root") {
      REQUIRE(tree.erase(1));
      REQUIRE(tree.erase(2));
      REQUIRE(tree.height() == 1);
      REQUIRE(dump(tree) == "Tree(2):\nElement: 4 5\n");
    }

    SECTION("Internal key is replaced by its predecessor") {
      REQUIRE(tree.erase(4));
      REQUIRE(dump(tree) ==
              "Tree(3):\n"
              "Element: 2\n"
              "| Element: 1\n"
              "| Element: 5\n");
    }
  }

  SECTION("Hole on the left of a 3-node merges with the middle child") {
    REQUIRE(tree.erase(1));
    REQUIRE(dump(tree) ==
            "Tree(4):\n"
            "Element: 4\n"
            "| Element: 2 3\n"
            "| Element: 5\n");
  }

  SECTION("Hole on the right of a 3-node merges with the middle child") {
    REQUIRE(tree.erase(5));
    REQUIRE(dump(tree) ==
            "Tree(4):\n"
            "Element: 2\n"
            "| Element: 1\n"
            "| Element: 3 4\n");
  }

  SECTION("Erasing elem2 of an internal 3-node") {
    tree.insert(6, 6);
    REQUIRE(tree.erase(4));
    REQUIRE(dump(tree) ==
            "Tree(5):\n"
            "Element: 3\n"
            "| Element: 1 2\n"
            "| Element: 5 6\n");
  }

  REQUIRE_NOTHROW(tree.validate());
}

TEST_CASE("two_three_tree ordered insert and erase",
          "[two_three][insert][erase]") {
  constexpr std::uint64_t num_elements = 50;
  two_three_tree<std::uint64_t, std::uint64_t> tree;

  SECTION("Ascending insert, ascending erase") {
    for (std::uint64_t i = 0; i < num_elements; ++i) {
      insert_checked(tree, i);
    }
    for (std::uint64_t i = 0; i < num_elements; ++i) {
      erase_checked(tree, i);
    }
  }

  SECTION("Descending insert, ascending erase") {
    for (std::uint64_t i = num_elements; i-- > 0;) {
      insert_checked(tree, i);
    }
    for (std::uint64_t i = 0; i < num_elements; ++i) {
      erase_checked(tree, i);
    }
  }

  SECTION("Ascending insert, descending erase") {
    for (std::uint64_t i = 0; i < num_elements; ++i) {
      insert_checked(tree, i);
    }
    for (std::uint64_t i = num_elements; i-- > 0;) {
      erase_checked(tree, i);
    }
  }

  REQUIRE(tree.empty());
}

TEST_CASE("two_three_tree height stays logarithmic", "[two_three][balance]") {
  two_three_tree<int, int> tree;

  // A 2-3 tree of height h holds between 2^h - 1 and 3^h - 1 elements
  auto check_height = [&]() {
    const std::size_t h = tree.height();
    std::size_t min_elements = 1;
    std::size_t max_elements = 1;
    for (std::size_t i = 0; i < h; ++i) {
      min_elements *= 2;
      max_elements *= 3;
    }
    REQUIRE(tree.size() >= min_elements - 1);
    REQUIRE(tree.size() <= max_elements - 1);
  };

  SECTION("Ascending") {
    for (int i = 0; i < 500; ++i) {
      const auto height_before = tree.height();
      REQUIRE(tree.insert(i, i));
      REQUIRE_NOTHROW(tree.validate());
      REQUIRE(tree.height() - height_before <= 1);
      check_height();
    }
  }

  SECTION("Descending") {
    for (int i = 500; i > 0; --i) {
      const auto height_before = tree.height();
      REQUIRE(tree.insert(i, i));
      REQUIRE_NOTHROW(tree.validate());
      REQUIRE(tree.height() - height_before <= 1);
      check_height();
    }
  }

  // Erase from both ends towards the middle
  for (int lo = 0, hi = 500; lo <= hi; ++lo, --hi) {
    for (int key : {lo, hi}) {
      if (!tree.contains(key)) {
        continue;
      }
      const auto height_before = tree.height();
      REQUIRE(tree.erase(key));
      REQUIRE_NOTHROW(tree.validate());
      REQUIRE(tree.height() <= height_before);
      REQUIRE(height_before - tree.height() <= 1);
    }
  }
  REQUIRE(tree.empty());
}

TEST_CASE("two_three_tree duplicate keys are rejected",
          "[two_three][insert][duplicate]") {
  two_three_tree<int, std::string> tree;
  for (int key : {10, 20, 30, 40, 50, 60, 70}) {
    REQUIRE(tree.insert(key, std::to_string(key)));
  }
  const std::string before = dump(tree);

  SECTION("Duplicate in a leaf") {
    REQUIRE_FALSE(tree.insert(70, "other"));
    REQUIRE(tree.at(70) == "70");
  }

  SECTION("Duplicate of an internal key") {
    REQUIRE_FALSE(tree.insert(40, "other"));
    REQUIRE(tree.at(40) == "40");
  }

  SECTION("Duplicate via element overload") {
    REQUIRE_FALSE(tree.insert(element<int, std::string>{20, "other"}));
    REQUIRE(tree.at(20) == "20");
  }

  REQUIRE(tree.size() == 7);
  REQUIRE(dump(tree) == before);
  REQUIRE_NOTHROW(tree.validate());
}

TEST_CASE("two_three_tree insert_or_assign", "[two_three][insert]") {
  two_three_tree<int, std::string> tree;

  REQUIRE(tree.insert_or_assign(1, "one"));
  REQUIRE(tree.insert_or_assign(2, "two"));
  REQUIRE(tree.insert_or_assign(3, "three"));
  REQUIRE(tree.size() == 3);

  REQUIRE_FALSE(tree.insert_or_assign(2, "TWO"));
  REQUIRE(tree.size() == 3);
  REQUIRE(tree.at(2) == "TWO");
  REQUIRE(tree.find(2)->value == "TWO");
  REQUIRE_NOTHROW(tree.validate());
}

TEST_CASE("two_three_tree at", "[two_three][lookup]") {
  two_three_tree<int, int> tree;
  for (int i = 0; i < 20; ++i) {
    tree.insert(i, i * 10);
  }

  SECTION("Returns mutable reference") {
    tree.at(5) = 555;
    REQUIRE(tree.find(5)->value == 555);
  }

  SECTION("Const access") {
    const auto& const_tree = tree;
    REQUIRE(const_tree.at(19) == 190);
  }

  SECTION("Missing key throws") {
    REQUIRE_THROWS_AS(tree.at(20), std::out_of_range);
    const auto& const_tree = tree;
    REQUIRE_THROWS_AS(const_tree.at(-1), std::out_of_range);
  }
}

TEST_CASE("two_three_tree find", "[two_three][lookup]") {
  two_three_tree<int, int> tree;
  for (int i = 0; i < 100; i += 2) {
    tree.insert(i, i + 1000);
  }

  for (int i = 0; i < 100; ++i) {
    auto found = tree.find(i);
    if (i % 2 == 0) {
      REQUIRE(found.has_value());
      REQUIRE(found->key == i);
      REQUIRE(found->value == i + 1000);
      REQUIRE(tree.contains(i));
    } else {
      REQUIRE_FALSE(found.has_value());
      REQUIRE_FALSE(tree.contains(i));
    }
  }
  REQUIRE_FALSE(tree.find(-1).has_value());
  REQUIRE_FALSE(tree.find(1000).has_value());
}

TEST_CASE("two_three_tree failed erase leaves tree unchanged",
          "[two_three][erase]") {
  two_three_tree<int, int> tree;
  for (int i = 0; i < 64; i += 4) {
    tree.insert(i, i);
  }
  const std::string before = dump(tree);

  for (int i = -3; i < 70; ++i) {
    if (i % 4 != 0) {
      REQUIRE_FALSE(tree.erase(i));
    }
  }
  REQUIRE(tree.size() == 16);
  REQUIRE(dump(tree) == before);
}

TEST_CASE("two_three_tree copy and move", "[two_three][copy][move]") {
  two_three_tree<int, int> tree;
  for (int i = 0; i < 100; ++i) {
    tree.insert(i, i);
  }

  SECTION("Copy constructor makes an independent copy") {
    two_three_tree<int, int> copy(tree);
    REQUIRE(copy.size() == 100);
    REQUIRE(dump(copy) == dump(tree));
    REQUIRE_NOTHROW(copy.validate());

    REQUIRE(copy.erase(50));
    REQUIRE(tree.contains(50));
    REQUIRE(tree.size() == 100);
    REQUIRE(copy.size() == 99);
  }

  SECTION("Copy assignment replaces existing contents") {
    two_three_tree<int, int> other;
    other.insert(1000, 1000);
    other = tree;
    REQUIRE(other.size() == 100);
    REQUIRE_FALSE(other.contains(1000));
    REQUIRE_NOTHROW(other.validate());
  }

  SECTION("Move constructor leaves source empty") {
    two_three_tree<int, int> moved(std::move(tree));
    REQUIRE(moved.size() == 100);
    REQUIRE_NOTHROW(moved.validate());
    REQUIRE(tree.empty());  // NOLINT(bugprone-use-after-move)
    REQUIRE(tree.size() == 0);
    REQUIRE_NOTHROW(tree.validate());
  }

  SECTION("Move assignment leaves source empty") {
    two_three_tree<int, int> other;
    other.insert(-1, -1);
    other = std::move(tree);
    REQUIRE(other.size() == 100);
    REQUIRE_FALSE(other.contains(-1));
    REQUIRE(tree.empty());  // NOLINT(bugprone-use-after-move)
  }
}

TEST_CASE("two_three_tree clear and swap", "[two_three][clear][swap]") {
  two_three_tree<int, int> a;
  two_three_tree<int, int> b;
  for (int i = 0; i < 30; ++i) {
    a.insert(i, i);
  }
  b.insert(100, 100);

  SECTION("clear") {
    a.clear();
    REQUIRE(a.empty());
    REQUIRE(a.size() == 0);
    REQUIRE_NOTHROW(a.validate());
    REQUIRE(a.insert(3, 3));
    REQUIRE(a.size() == 1);
  }

  SECTION("swap") {
    a.swap(b);
    REQUIRE(a.size() == 1);
    REQUIRE(b.size() == 30);
    REQUIRE(a.contains(100));
    REQUIRE(b.contains(29));
    REQUIRE_NOTHROW(a.validate());
    REQUIRE_NOTHROW(b.validate());
  }
}

TEST_CASE("two_three_tree element compares by key", "[two_three][element]") {
  using elem = element<int, std::string>;
  REQUIRE(elem{1, "a"} == elem{1, "b"});
  REQUIRE(elem{1, "z"} < elem{2, "a"});
  REQUIRE_FALSE(elem{2, "a"} < elem{1, "z"});
}

TEST_CASE("two_three_tree with string keys", "[two_three][string]") {
  two_three_tree<std::string, int> tree;
  const std::vector<std::string> words = {"pear",  "apple", "fig",
                                          "kiwi",  "plum",  "date",
                                          "lemon", "grape", "mango"};
  for (std::size_t i = 0; i < words.size(); ++i) {
    REQUIRE(tree.insert(words[i], static_cast<int>(i)));
    REQUIRE_NOTHROW(tree.validate());
  }
  REQUIRE(tree.at("kiwi") == 3);
  REQUIRE_FALSE(tree.contains("banana"));

  for (const auto& word : words) {
    REQUIRE(tree.erase(word));
    REQUIRE_NOTHROW(tree.validate());
  }
  REQUIRE(tree.empty());
}
