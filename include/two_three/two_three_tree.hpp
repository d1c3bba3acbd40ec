// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace kressler::two_three {

/**
 * Keys must be totally ordered and cheap to copy: they are compared with the
 * built-in relational operators and copied between nodes during splits,
 * borrows and merges.
 */
template <typename Key>
concept OrderedKey = std::totally_ordered<Key> && std::copyable<Key>;

/**
 * Thrown when the tree detects that its own structure is corrupt, either from
 * validate() or from an internal state that should be unreachable.
 */
class invariant_violation : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

/**
 * A key/value entry stored in the tree.
 * Equality and ordering consider the key only.
 */
template <typename Key, typename Value>
struct element {
  Key key;
  Value value;

  friend bool operator==(const element& lhs, const element& rhs) {
    return lhs.key == rhs.key;
  }

  friend bool operator<(const element& lhs, const element& rhs) {
    return lhs.key < rhs.key;
  }
};

/**
 * A 2-3 tree mapping unique keys to values.
 *
 * Every node holds one or two elements. Internal nodes with one element have
 * two children, internal nodes with two elements have three, and all leaves
 * sit at the same depth. Insert and erase keep the tree balanced by splitting
 * and merging nodes rather than by rotations.
 *
 * Nodes carry no parent pointers. Each child is owned by exactly one
 * std::unique_ptr slot of its parent (the root by the tree itself), and
 * restructuring moves those slots around. Results that must reach an ancestor
 * (a split during insert, a hole during erase) travel back up the recursion:
 * splits as return values, holes through a delete_state passed by reference.
 *
 * @tparam Key The key type (totally ordered, copyable)
 * @tparam Value The mapped value type
 *
 * Example:
 * @code
 * two_three_tree<std::uint64_t, std::uint64_t> tree;
 * tree.insert(3, 30);
 * tree.insert(1, 10);
 * auto found = tree.find(3);   // element{3, 30}
 * tree.erase(1);               // true
 * tree.validate();             // throws invariant_violation if corrupt
 * @endcode
 */
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
class two_three_tree {
 public:
  // Type aliases
  using key_type = Key;
  using mapped_type = Value;
  using value_type = element<Key, Value>;
  using size_type = std::size_t;

  /**
   * Default constructor - creates an empty tree.
   */
  two_three_tree() = default;

  /**
   * Destructor - releases all nodes.
   */
  ~two_three_tree() = default;

  /**
   * Copy constructor - creates a deep copy of the tree.
   *
   * Implementation: Clones other node by node, so the copy has exactly the
   * same shape as the source.
   *
   * Complexity: O(m) where m = other.size()
   */
  two_three_tree(const two_three_tree& other);

  /**
   * Copy assignment operator - replaces contents with a deep copy.
   * Complexity: O(n + m) where n = this.size(), m = other.size()
   */
  two_three_tree& operator=(const two_three_tree& other);

  /**
   * Move constructor - takes ownership of another tree's nodes.
   * Leaves other in a valid but empty state.
   * Complexity: O(1)
   */
  two_three_tree(two_three_tree&& other) noexcept;

  /**
   * Move assignment operator - replaces contents by taking ownership.
   * Leaves other in a valid but empty state.
   * Complexity: O(n) where n is this tree's size (due to deallocation)
   */
  two_three_tree& operator=(two_three_tree&& other) noexcept;

  /**
   * Returns the number of elements in the tree.
   * Complexity: O(1)
   */
  [[nodiscard]] size_type size() const { return size_; }

  /**
   * Returns true if the tree holds no elements.
   * Complexity: O(1)
   */
  [[nodiscard]] bool empty() const { return root_ == nullptr; }

  /**
   * Returns the number of node levels, 0 for an empty tree and 1 for a tree
   * whose root is a leaf.
   * Complexity: O(log n)
   */
  [[nodiscard]] size_type height() const;

  /**
   * Finds the element with the given key.
   * Returns a copy of the element if found, std::nullopt otherwise.
   * Complexity: O(log n)
   */
  [[nodiscard]] std::optional<value_type> find(const Key& key) const;

  /**
   * Checks if there is an element with the specified key.
   * Complexity: O(log n)
   */
  [[nodiscard]] bool contains(const Key& key) const {
    return lookup(key) != nullptr;
  }

  /**
   * Returns a reference to the value associated with the specified key.
   * Throws std::out_of_range if the key does not exist.
   *
   * Complexity: O(log n)
   */
  Value& at(const Key& key);

  /**
   * Returns a const reference to the value associated with the specified key.
   * Throws std::out_of_range if the key does not exist.
   *
   * Complexity: O(log n)
   */
  const Value& at(const Key& key) const;

  /**
   * Inserts a key-value pair into the tree.
   * Returns true if the element was inserted, false if the key already
   * existed (the tree is left unchanged in that case).
   *
   * Splits full leaves and propagates the splits toward the root, growing
   * the tree by one level when the root itself splits.
   *
   * Complexity: O(log n)
   */
  bool insert(const Key& key, const Value& value);

  /**
   * Inserts an element into the tree.
   * Equivalent to insert(elem.key, elem.value).
   */
  bool insert(const value_type& elem) { return insert(elem.key, elem.value); }

  /**
   * Inserts a new element or assigns to an existing one.
   * If the key exists, assigns the new value to the existing element in place.
   *
   * @return true if a new element was inserted, false if an existing value
   * was overwritten
   *
   * Complexity: O(log n)
   */
  bool insert_or_assign(const Key& key, const Value& value);

  /**
   * Removes the element with the given key from the tree.
   * Returns true if the key was found and removed, false otherwise (the tree
   * is left unchanged in that case).
   *
   * Internal elements are replaced by their in-order predecessor. Holes left
   * behind in leaves are fixed on the way back up by borrowing from or
   * merging with a sibling; a hole that reaches the root removes one level.
   *
   * @throws invariant_violation if the recursion finishes in an impossible
   * state, which means the tree was already corrupt
   *
   * Complexity: O(log n)
   */
  bool erase(const Key& key);

  /**
   * Removes all elements from the tree, leaving it empty.
   * Complexity: O(n)
   */
  void clear() noexcept;

  /**
   * Swaps the contents of this tree with another tree.
   * Complexity: O(1)
   */
  void swap(two_three_tree& other) noexcept;

  /**
   * Checks every structural invariant by walking the whole tree:
   * - elements inside a node are ordered
   * - every subtree lies within the key range its parent elements allow
   * - leaves have no children, 2-nodes have two and 3-nodes three
   * - all leaves are at the same depth
   * - the number of elements matches size()
   *
   * Intended for tests and debugging, not for the hot path.
   *
   * @throws invariant_violation describing the first broken invariant
   *
   * Complexity: O(n)
   */
  void validate() const;

  /**
   * Writes a human readable dump of the tree, one node per line in
   * pre-order, indented by depth.
   */
  void print(std::ostream& os) const;

  friend std::ostream& operator<<(std::ostream& os,
                                  const two_three_tree& tree) {
    tree.print(os);
    return os;
  }

 private:
  /**
   * Node - one element (2-node) or two elements (3-node).
   * A node is a leaf iff child1 is null; otherwise a 2-node uses child1 and
   * child2 and a 3-node uses all three children.
   */
  struct node {
    value_type elem1;
    std::optional<value_type> elem2;
    std::unique_ptr<node> child1;
    std::unique_ptr<node> child2;
    std::unique_ptr<node> child3;

    explicit node(const value_type& elem) : elem1(elem) {}

    bool is_leaf() const { return child1 == nullptr; }
  };

  /**
   * Result of an insert that overflowed a node: the promoted element and the
   * two nodes that replace the overflowed one. The caller absorbs it or
   * splits in turn.
   */
  struct split_result {
    value_type parent_element;
    std::unique_ptr<node> child1;
    std::unique_ptr<node> child2;
  };

  // Phase of an erase, per recursive frame.
  enum class delete_phase : std::uint8_t {
    // Traversing downwards.
    downwards,
    // The child just visited has no elements left; the caller must fix it.
    fix_hole,
    // Nothing left to do; delete_state::found tells whether the key existed.
    done,
  };

  // Which child of its parent a hole was reported from.
  enum class child_position : std::uint8_t { first, second, third };

  /**
   * State threaded through the erase recursion by reference.
   */
  struct delete_state {
    Key key;
    delete_phase phase = delete_phase::downwards;
    bool found = false;
    // Set when an internal element is replaced by its in-order predecessor.
    std::optional<value_type> predecessor;

    explicit delete_state(const Key& k) : key(k) {}

    void finish(bool was_found) {
      phase = delete_phase::done;
      found = was_found;
    }
  };

  // Leaf depth and element count gathered by validate().
  struct validate_state {
    std::optional<size_type> leaf_level;
    size_type elements = 0;
  };

  static std::unique_ptr<node> make_node(const value_type& elem);

  static std::unique_ptr<node> make_node(const value_type& elem,
                                         std::unique_ptr<node> child1,
                                         std::unique_ptr<node> child2);

  static std::unique_ptr<node> clone_node(const node* source);

  /**
   * Returns a pointer to the element with the given key, or nullptr.
   */
  value_type* lookup(const Key& key) const;

  /**
   * Inserts into the subtree rooted at n.
   * Returns the split that the caller has to absorb, or std::nullopt if the
   * subtree absorbed the element itself.
   */
  static std::optional<split_result> insert_node(node* n,
                                                 const value_type& elem);

  /**
   * Downward phase of erase: finds the key under n and removes it, then fixes
   * any hole reported by the child that was visited.
   */
  static void erase_node(node* n, delete_state& state);

  /**
   * Removes the rightmost element of the subtree rooted at n into
   * state.predecessor, fixing holes on the way back up.
   */
  static void extract_predecessor(node* n, delete_state& state);

  /**
   * Upward phase of erase: if the child at pos reported a hole, borrow from
   * or merge with a sibling. Leaves state in fix_hole if n itself lost its
   * last element, otherwise marks it done.
   */
  static void fix_hole(node* n, child_position pos, delete_state& state);

  /**
   * Turns a 2-node into a 3-node by adding elem and child on the left.
   */
  static void add_left(node& n, const value_type& elem,
                       std::unique_ptr<node> child);

  /**
   * Turns a 2-node into a 3-node by adding elem and child on the right.
   */
  static void add_right(node& n, const value_type& elem,
                        std::unique_ptr<node> child);

  /**
   * Turns a 3-node into a 2-node by removing its left element and child.
   */
  static std::pair<value_type, std::unique_ptr<node>> trim_left(node& n);

  /**
   * Turns a 3-node into a 2-node by removing its right element and child.
   */
  static std::pair<value_type, std::unique_ptr<node>> trim_right(node& n);

  static void validate_node(const node* n, size_type level, const Key* lower,
                            const Key* upper, validate_state& state);

  static void print_node(std::ostream& os, const node* n, size_type indent);

  std::unique_ptr<node> root_;
  size_type size_ = 0;
};

}  // namespace kressler::two_three

// Include implementation
#include "two_three_tree.ipp"
