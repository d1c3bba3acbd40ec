// Implementation file for two_three_tree.hpp
// This file contains all method implementations for the two_three_tree class.

namespace kressler::two_three {

// Copy constructor
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
two_three_tree<Key, Value>::two_three_tree(const two_three_tree& other)
    : root_(clone_node(other.root_.get())), size_(other.size_) {}

// Copy assignment operator
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
two_three_tree<Key, Value>& two_three_tree<Key, Value>::operator=(
    const two_three_tree& other) {
  if (this != &other) {
    // Clone first so a failed allocation leaves this tree untouched
    auto copy = clone_node(other.root_.get());
    root_ = std::move(copy);
    size_ = other.size_;
  }
  return *this;
}

// Move constructor
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
two_three_tree<Key, Value>::two_three_tree(two_three_tree&& other) noexcept
    : root_(std::move(other.root_)), size_(other.size_) {
  other.size_ = 0;
}

// Move assignment operator
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
two_three_tree<Key, Value>& two_three_tree<Key, Value>::operator=(
    two_three_tree&& other) noexcept {
  if (this != &other) {
    root_ = std::move(other.root_);
    size_ = other.size_;
    other.size_ = 0;
  }
  return *this;
}

// height
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
typename two_three_tree<Key, Value>::size_type
two_three_tree<Key, Value>::height() const {
  size_type levels = 0;
  // All leaves are at the same depth, so the leftmost path is enough
  for (const node* n = root_.get(); n != nullptr; n = n->child1.get()) {
    ++levels;
  }
  return levels;
}

// find
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
std::optional<typename two_three_tree<Key, Value>::value_type>
two_three_tree<Key, Value>::find(const Key& key) const {
  const value_type* found = lookup(key);
  if (found == nullptr) {
    return std::nullopt;
  }
  return *found;
}

// at (non-const)
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
Value& two_three_tree<Key, Value>::at(const Key& key) {
  value_type* found = lookup(key);
  if (found == nullptr) {
    throw std::out_of_range("two_three_tree::at: key not found");
  }
  return found->value;
}

// at (const)
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
const Value& two_three_tree<Key, Value>::at(const Key& key) const {
  const value_type* found = lookup(key);
  if (found == nullptr) {
    throw std::out_of_range("two_three_tree::at: key not found");
  }
  return found->value;
}

// lookup
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
typename two_three_tree<Key, Value>::value_type*
two_three_tree<Key, Value>::lookup(const Key& key) const {
  node* n = root_.get();
  while (n != nullptr) {
    if (key < n->elem1.key) {
      n = n->child1.get();
    } else if (n->elem1.key < key) {
      if (!n->elem2.has_value()) {
        n = n->child2.get();
      } else if (key < n->elem2->key) {
        n = n->child2.get();
      } else if (n->elem2->key < key) {
        n = n->child3.get();
      } else {
        return &*n->elem2;
      }
    } else {
      return &n->elem1;
    }
  }
  return nullptr;
}

// insert
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
bool two_three_tree<Key, Value>::insert(const Key& key, const Value& value) {
  // The split logic has no notion of equal keys, so reject duplicates up front
  if (contains(key)) {
    return false;
  }

  const value_type elem{key, value};
  if (root_ == nullptr) {
    root_ = make_node(elem);
  } else if (auto split = insert_node(root_.get(), elem)) {
    // The root split - grow the tree by one level
    root_ = make_node(split->parent_element, std::move(split->child1),
                      std::move(split->child2));
  }
  ++size_;
  return true;
}

// insert_or_assign
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
bool two_three_tree<Key, Value>::insert_or_assign(const Key& key,
                                                  const Value& value) {
  if (value_type* existing = lookup(key)) {
    existing->value = value;
    return false;
  }
  return insert(key, value);
}

// insert_node
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
std::optional<typename two_three_tree<Key, Value>::split_result>
two_three_tree<Key, Value>::insert_node(node* n, const value_type& elem) {
  if (!n->is_leaf()) {
    if (elem.key <= n->elem1.key) {
      auto result = insert_node(n->child1.get(), elem);
      if (!result) {
        return std::nullopt;
      }
      if (!n->elem2.has_value()) {
        //    (a)           (result.parent_element, a)
        //  /    \      =>    /           |           \
        // result (b)     result.child1 result.child2 (b)
        n->elem2 = n->elem1;
        n->elem1 = result->parent_element;
        n->child3 = std::move(n->child2);
        n->child1 = std::move(result->child1);
        n->child2 = std::move(result->child2);
        return std::nullopt;
      }
      //      (a,b)                         (a)
      //    /    |  \     =>             /       \
      // result (c) (d)      result.parent         (b)
      //                        /      \            /  \
      //               result.child1 result.child2 (c) (d)
      auto left = make_node(result->parent_element, std::move(result->child1),
                            std::move(result->child2));
      auto right =
          make_node(*n->elem2, std::move(n->child2), std::move(n->child3));
      return split_result{n->elem1, std::move(left), std::move(right)};
    }

    if (!n->elem2.has_value() || elem.key <= n->elem2->key) {
      auto result = insert_node(n->child2.get(), elem);
      if (!result) {
        return std::nullopt;
      }
      if (!n->elem2.has_value()) {
        //   (a)           (a, result.parent_element)
        //  /   \      =>    /     |         \
        // (b) result      (b) result.child1 result.child2
        n->elem2 = result->parent_element;
        n->child2 = std::move(result->child1);
        n->child3 = std::move(result->child2);
        return std::nullopt;
      }
      //     (a, b)                 result.parent_element
      //   /   |    \      =>   (a)                       (b)
      //  (c) result (d)       /  \                     /   \
      //                      (c) result.child1  result.child2 (d)
      auto left = make_node(n->elem1, std::move(n->child1),
                            std::move(result->child1));
      auto right = make_node(*n->elem2, std::move(result->child2),
                             std::move(n->child3));
      return split_result{result->parent_element, std::move(left),
                          std::move(right)};
    }

    auto result = insert_node(n->child3.get(), elem);
    if (!result) {
      return std::nullopt;
    }
    //    (a,b)                     (b)
    //   /  |  \           =>     /     \
    //  (c) (d) result           (a)     (result.parent)
    //                          /  \      /             \
    //                         (c) (d) result.child1 result.child2
    auto left =
        make_node(n->elem1, std::move(n->child1), std::move(n->child2));
    auto right = make_node(result->parent_element, std::move(result->child1),
                           std::move(result->child2));
    return split_result{*n->elem2, std::move(left), std::move(right)};
  }

  // Leaf node
  if (n->elem2.has_value()) {
    // Three elements - split around the middle one
    const value_type elem2 = *n->elem2;
    if (elem.key < n->elem1.key) {
      return split_result{n->elem1, make_node(elem), make_node(elem2)};
    }
    if (elem.key < elem2.key) {
      return split_result{elem, make_node(n->elem1), make_node(elem2)};
    }
    return split_result{elem2, make_node(n->elem1), make_node(elem)};
  }
  if (n->elem1.key <= elem.key) {
    n->elem2 = elem;
  } else {
    n->elem2 = n->elem1;
    n->elem1 = elem;
  }
  return std::nullopt;
}

// erase
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
bool two_three_tree<Key, Value>::erase(const Key& key) {
  if (root_ == nullptr) {
    return false;
  }

  delete_state state(key);
  erase_node(root_.get(), state);
  switch (state.phase) {
    case delete_phase::done:
      if (state.found) {
        --size_;
      }
      return state.found;
    case delete_phase::fix_hole: {
      // The root lost its last element. Its only remaining child (if any)
      // becomes the new root and the tree shrinks by one level.
      auto new_root = std::move(root_->child1);
      root_ = std::move(new_root);
      --size_;
      return true;
    }
    case delete_phase::downwards:
      break;
  }
  throw invariant_violation(
      "two_three_tree::erase: recursion finished while still descending");
}

// erase_node
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
void two_three_tree<Key, Value>::erase_node(node* n, delete_state& state) {
  if (n->is_leaf()) {
    if (n->elem1.key == state.key) {
      if (n->elem2.has_value()) {
        n->elem1 = *n->elem2;
        n->elem2.reset();
        state.finish(true);
        return;
      }
      // The leaf is now empty
      state.phase = delete_phase::fix_hole;
      return;
    }
    if (n->elem2.has_value() && n->elem2->key == state.key) {
      n->elem2.reset();
      state.finish(true);
      return;
    }
    state.finish(false);
    return;
  }

  child_position pos;
  if (state.key < n->elem1.key) {
    erase_node(n->child1.get(), state);
    pos = child_position::first;
  } else if (n->elem1.key < state.key) {
    if (!n->elem2.has_value() || state.key < n->elem2->key) {
      erase_node(n->child2.get(), state);
      pos = child_position::second;
    } else if (n->elem2->key < state.key) {
      erase_node(n->child3.get(), state);
      pos = child_position::third;
    } else {
      // Matched elem2 - replace it with the largest key of child2
      extract_predecessor(n->child2.get(), state);
      n->elem2 = *state.predecessor;
      pos = child_position::second;
    }
  } else {
    // Matched elem1 - replace it with the largest key of child1
    extract_predecessor(n->child1.get(), state);
    n->elem1 = *state.predecessor;
    pos = child_position::first;
  }
  fix_hole(n, pos, state);
}

// extract_predecessor
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
void two_three_tree<Key, Value>::extract_predecessor(node* n,
                                                     delete_state& state) {
  if (n->child3 != nullptr) {
    extract_predecessor(n->child3.get(), state);
    fix_hole(n, child_position::third, state);
  } else if (n->child2 != nullptr) {
    extract_predecessor(n->child2.get(), state);
    fix_hole(n, child_position::second, state);
  } else if (n->elem2.has_value()) {
    state.predecessor = *n->elem2;
    n->elem2.reset();
    state.finish(true);
  } else {
    state.predecessor = n->elem1;
    state.phase = delete_phase::fix_hole;
  }
}

// fix_hole
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
void two_three_tree<Key, Value>::fix_hole(node* n, child_position pos,
                                          delete_state& state) {
  switch (state.phase) {
    case delete_phase::done:
      return;
    case delete_phase::downwards:
      throw invariant_violation(
          "two_three_tree::erase: child returned while still descending");
    case delete_phase::fix_hole:
      break;
  }

  node* child1 = n->child1.get();
  node* child2 = n->child2.get();

  if (!n->elem2.has_value()) {
    if (pos == child_position::first) {
      if (!child2->elem2.has_value()) {
        //   (a)              (o)
        //  /   \      =>      |
        // (o)  (b)           (a,b)
        //  |   / \          /  |  \
        // (c) (d) (e)      (c) (d) (e)
        add_left(*child2, n->elem1, std::move(child1->child1));
        n->child1 = std::move(n->child2);
        // n is now the hole; leave the phase for the caller
      } else {
        //   (a)                 (b)
        //  /   \      =>      /    \
        // (o)  (b,c)        (a)    (c)
        //  |   / | \        / \    / \
        // (d) (e)(f)(g)   (d) (e) (f)(g)
        child1->elem1 = n->elem1;
        auto [borrowed, subtree] = trim_left(*child2);
        n->elem1 = borrowed;
        child1->child2 = std::move(subtree);
        state.finish(true);
      }
    } else {
      if (!child1->elem2.has_value()) {
        //    (a)                (o)
        //   /   \       =>       |
        // (b)   (o)            (b,a)
        // /  \   |            /  |  \
        // ..    (c)           ..    (c)
        add_right(*child1, n->elem1, std::move(child2->child1));
        n->child2.reset();
      } else {
        //      (a)               (c)
        //    /     \      =>    /   \
        //  (b,c)   (o)        (b)   (a)
        //  / | \    |        / \    /  \
        // (d)(e)(f) (g)    (d) (e) (f) (g)
        child2->elem1 = n->elem1;
        child2->child2 = std::move(child2->child1);
        auto [borrowed, subtree] = trim_right(*child1);
        n->elem1 = borrowed;
        child2->child1 = std::move(subtree);
        state.finish(true);
      }
    }
    return;
  }

  // n is a 3-node, so it always has an element to spare
  node* child3 = n->child3.get();
  if (pos == child_position::first) {
    if (!child2->elem2.has_value()) {
      //       (a,b)                   (b)
      //     /   |   \                /   \
      //   (o)  (c)  ..   =>       (a,c)   ..
      //    |   / \                /  | \
      //  (d) (e) (f)             (d)(e)(f)
      add_left(*child2, n->elem1, std::move(child1->child1));
      trim_left(*n);
    } else {
      //       (a,b)                    (c,b)
      //     /   |   \                /   |   \
      //   (o)  (c,d)  ..   =>       (a)  (d)  ..
      //    |   / | \                / \   / \
      //   (e) (f)(g)(h)            (e)(f)(g)(h)
      child1->elem1 = n->elem1;
      auto [borrowed, subtree] = trim_left(*child2);
      n->elem1 = borrowed;
      child1->child2 = std::move(subtree);
    }
  } else if (pos == child_position::second) {
    if (!child1->elem2.has_value()) {
      //       (a,b)                   (b)
      //     /    |   \               /   \
      //   (c)   (o)  ..   =>      (c,a)  ..
      //   / \    |                / | \
      //  (d)(e) (f)            (d)(e)(f)
      add_right(*child1, n->elem1, std::move(child2->child1));
      n->elem1 = *n->elem2;
      n->elem2.reset();
      n->child2 = std::move(n->child3);
    } else {
      //      (a,b)                   (d,b)
      //     /  |   \               /   |   \
      // (c,d)  (o)  ..   =>      (c)  (a)   ..
      // / | \   |                / \  /  \
      // ..  (e) (f)              ..  (e) (f)
      child2->elem1 = n->elem1;
      child2->child2 = std::move(child2->child1);
      auto [borrowed, subtree] = trim_right(*child1);
      n->elem1 = borrowed;
      child2->child1 = std::move(subtree);
    }
  } else if (!child2->elem2.has_value()) {
    //    (a,b)                  (a)
    //   /  |   \               /   \
    //  ..  (c)  (o)   =>      ..  (c,b)
    //      / \   |                / | \
    //    .. (d) (e)              .. (d)(e)
    add_right(*child2, *n->elem2, std::move(child3->child1));
    n->elem2.reset();
    n->child3.reset();
  } else {
    //     (a,b)                  (a,d)
    //   /   |   \               /  |   \
    //  .. (c,d) (o)   =>      ..  (c)  (b)
    //     / | \   |               / \  / \
    //      .. (e) (f)            ..   (e)(f)
    child3->elem1 = *n->elem2;
    child3->child2 = std::move(child3->child1);
    auto [borrowed, subtree] = trim_right(*child2);
    n->elem2 = borrowed;
    child3->child1 = std::move(subtree);
  }
  state.finish(true);
}

// add_left
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
void two_three_tree<Key, Value>::add_left(node& n, const value_type& elem,
                                          std::unique_ptr<node> child) {
  assert(!n.elem2.has_value() && "add_left requires a 2-node");
  n.elem2 = n.elem1;
  n.elem1 = elem;
  n.child3 = std::move(n.child2);
  n.child2 = std::move(n.child1);
  n.child1 = std::move(child);
}

// add_right
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
void two_three_tree<Key, Value>::add_right(node& n, const value_type& elem,
                                           std::unique_ptr<node> child) {
  assert(!n.elem2.has_value() && "add_right requires a 2-node");
  n.elem2 = elem;
  n.child3 = std::move(child);
}

// trim_left
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
std::pair<typename two_three_tree<Key, Value>::value_type,
          std::unique_ptr<typename two_three_tree<Key, Value>::node>>
two_three_tree<Key, Value>::trim_left(node& n) {
  assert(n.elem2.has_value() && "trim_left requires a 3-node");
  std::pair<value_type, std::unique_ptr<node>> removed{n.elem1,
                                                       std::move(n.child1)};
  n.elem1 = *n.elem2;
  n.elem2.reset();
  n.child1 = std::move(n.child2);
  n.child2 = std::move(n.child3);
  return removed;
}

// trim_right
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
std::pair<typename two_three_tree<Key, Value>::value_type,
          std::unique_ptr<typename two_three_tree<Key, Value>::node>>
two_three_tree<Key, Value>::trim_right(node& n) {
  assert(n.elem2.has_value() && "trim_right requires a 3-node");
  std::pair<value_type, std::unique_ptr<node>> removed{*n.elem2,
                                                       std::move(n.child3)};
  n.elem2.reset();
  return removed;
}

// make_node (leaf)
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
std::unique_ptr<typename two_three_tree<Key, Value>::node>
two_three_tree<Key, Value>::make_node(const value_type& elem) {
  return std::make_unique<node>(elem);
}

// make_node (2-node with children)
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
std::unique_ptr<typename two_three_tree<Key, Value>::node>
two_three_tree<Key, Value>::make_node(const value_type& elem,
                                      std::unique_ptr<node> child1,
                                      std::unique_ptr<node> child2) {
  auto n = std::make_unique<node>(elem);
  n->child1 = std::move(child1);
  n->child2 = std::move(child2);
  return n;
}

// clone_node
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
std::unique_ptr<typename two_three_tree<Key, Value>::node>
two_three_tree<Key, Value>::clone_node(const node* source) {
  if (source == nullptr) {
    return nullptr;
  }
  auto n = std::make_unique<node>(source->elem1);
  n->elem2 = source->elem2;
  n->child1 = clone_node(source->child1.get());
  n->child2 = clone_node(source->child2.get());
  n->child3 = clone_node(source->child3.get());
  return n;
}

// clear
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
void two_three_tree<Key, Value>::clear() noexcept {
  root_.reset();
  size_ = 0;
}

// swap
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
void two_three_tree<Key, Value>::swap(two_three_tree& other) noexcept {
  std::swap(root_, other.root_);
  std::swap(size_, other.size_);
}

// validate
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
void two_three_tree<Key, Value>::validate() const {
  if (root_ == nullptr) {
    if (size_ != 0) {
      throw invariant_violation("two_three_tree::validate: empty tree with "
                                "non-zero size");
    }
    return;
  }

  validate_state state;
  validate_node(root_.get(), 0, nullptr, nullptr, state);
  if (state.elements != size_) {
    throw invariant_violation(
        "two_three_tree::validate: element count does not match size()");
  }
}

// validate_node
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
void two_three_tree<Key, Value>::validate_node(const node* n, size_type level,
                                               const Key* lower,
                                               const Key* upper,
                                               validate_state& state) {
  // Subtree bounds are inclusive
  auto in_range = [&](const Key& key) {
    return (lower == nullptr || *lower <= key) &&
           (upper == nullptr || key <= *upper);
  };

  state.elements++;
  if (!in_range(n->elem1.key)) {
    throw invariant_violation(
        "two_three_tree::validate: key outside the range of its parent");
  }
  if (n->elem2.has_value()) {
    state.elements++;
    if (n->elem2->key < n->elem1.key) {
      throw invariant_violation(
          "two_three_tree::validate: elements of a node are out of order");
    }
    if (!in_range(n->elem2->key)) {
      throw invariant_violation(
          "two_three_tree::validate: key outside the range of its parent");
    }
  }

  if (n->is_leaf()) {
    if (n->child2 != nullptr || n->child3 != nullptr) {
      throw invariant_violation(
          "two_three_tree::validate: leaf with a middle or right child");
    }
    // All leaves should be at the same level
    if (!state.leaf_level.has_value()) {
      state.leaf_level = level;
    } else if (*state.leaf_level != level) {
      throw invariant_violation(
          "two_three_tree::validate: leaves at different depths");
    }
    return;
  }

  if (n->child2 == nullptr) {
    throw invariant_violation(
        "two_three_tree::validate: internal node without a second child");
  }
  if (n->elem2.has_value() != (n->child3 != nullptr)) {
    throw invariant_violation(
        "two_three_tree::validate: child count does not match element count");
  }

  validate_node(n->child1.get(), level + 1, lower, &n->elem1.key, state);
  if (n->elem2.has_value()) {
    validate_node(n->child2.get(), level + 1, &n->elem1.key, &n->elem2->key,
                  state);
    validate_node(n->child3.get(), level + 1, &n->elem2->key, upper, state);
  } else {
    validate_node(n->child2.get(), level + 1, &n->elem1.key, upper, state);
  }
}

// print
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
void two_three_tree<Key, Value>::print(std::ostream& os) const {
  if (root_ == nullptr) {
    os << "Empty tree\n";
    return;
  }
  os << "Tree(" << size_ << "):\n";
  print_node(os, root_.get(), 0);
}

// print_node
template <typename Key, typename Value>
  requires OrderedKey<Key> && std::copyable<Value>
void two_three_tree<Key, Value>::print_node(std::ostream& os, const node* n,
                                            size_type indent) {
  for (size_type i = 0; i < indent; ++i) {
    os << "| ";
  }
  os << "Element: " << n->elem1.key;
  if (n->elem2.has_value()) {
    os << ' ' << n->elem2->key;
  }
  os << '\n';
  for (const node* child :
       {n->child1.get(), n->child2.get(), n->child3.get()}) {
    if (child != nullptr) {
      print_node(os, child, indent + 1);
    }
  }
}

}  // namespace kressler::two_three
