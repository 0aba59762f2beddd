#ifndef JSAST_TREE_EDIT_HPP
#define JSAST_TREE_EDIT_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "jsast/error_reporter.hpp"
#include "jsast/node.hpp"

namespace jsast {

// Editing helpers that keep parent links in sync with ownership. Node fields
// are plain data and may be assigned directly, but then the parent links are
// the caller's problem; relinkParents() repairs a subtree afterwards.
//
// `slot` and `list` must be fields of `owner`.

/// Installs `replacement` in `slot` and returns the previous child, detached.
template <typename T, typename U>
std::unique_ptr<T> replaceChild(Node& owner, std::unique_ptr<T>& slot,
                                std::unique_ptr<U> replacement) {
  if (replacement != nullptr) {
    replacement->parent = &owner;
  }
  std::unique_ptr<T> previous = std::move(slot);
  slot = std::move(replacement);
  if (previous != nullptr) {
    previous->parent = nullptr;
  }
  return previous;
}

/// Appends `child` to `list`. A null child is only meaningful for the holes
/// of an NArrayExpression.
template <typename T, typename U>
void appendChild(Node& owner, std::vector<std::unique_ptr<T>>& list,
                 std::unique_ptr<U> child) {
  if (child != nullptr) {
    child->parent = &owner;
  }
  list.push_back(std::move(child));
}

template <typename T, typename U>
void insertChild(Node& owner, std::vector<std::unique_ptr<T>>& list,
                 std::size_t index, std::unique_ptr<U> child) {
  if (index > list.size()) {
    reportMisuse("insertChild index " + std::to_string(index) +
                 " is past the end of a list of " +
                 std::to_string(list.size()) + " children of " +
                 owner.kindName());
  }
  if (child != nullptr) {
    child->parent = &owner;
  }
  list.insert(list.begin() + static_cast<std::ptrdiff_t>(index),
              std::unique_ptr<T>(std::move(child)));
}

/// Removes the child at `index` from `list` and returns it, detached.
template <typename T>
std::unique_ptr<T> removeChild(std::vector<std::unique_ptr<T>>& list,
                               std::size_t index) {
  if (index >= list.size()) {
    reportMisuse("removeChild index " + std::to_string(index) +
                 " is out of range for a list of " +
                 std::to_string(list.size()) + " children");
  }
  std::unique_ptr<T> removed = std::move(list[index]);
  list.erase(list.begin() + static_cast<std::ptrdiff_t>(index));
  if (removed != nullptr) {
    removed->parent = nullptr;
  }
  return removed;
}

/// Clears the parent link of `node`. Ownership is not affected.
inline void detach(Node& node) noexcept { node.parent = nullptr; }

/// Points the parent link of every node below `root` at the node that
/// enumerates it. The parent link of `root` itself is left alone.
void relinkParents(Node& root);

/// Checks that every node below `root` links back to the node enumerating it.
/// Each violation is reported to `reporter`; returns true if there are none.
bool verifyParentLinks(Node& root, ErrorReporter& reporter);

} // namespace jsast

#endif // JSAST_TREE_EDIT_HPP
