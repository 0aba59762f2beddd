#ifndef JSAST_TRAVERSAL_HPP
#define JSAST_TRAVERSAL_HPP

#include <cstddef>
#include <vector>

#include <llvm/ADT/STLFunctionalExtras.h>

#include "jsast/node.hpp"

namespace jsast {

/// Called for every node of a walk. Returning false skips the node's subtree.
using WalkCallback = llvm::function_ref<bool(Node&)>;

/// Depth-first pre-order walk of `root` and its descendants, children in
/// forEach() order. Uses an explicit work stack, so deeply nested trees do not
/// exhaust the call stack.
void walkPreOrder(Node& root, WalkCallback callback);

/// The immediate children of `node`, in forEach() order.
[[nodiscard]] std::vector<Node*> collectChildren(Node& node);

/// Number of nodes in the subtree rooted at `root`, `root` included.
[[nodiscard]] std::size_t countNodes(Node& root);

} // namespace jsast

#endif // JSAST_TRAVERSAL_HPP
