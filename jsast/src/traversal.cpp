#include "jsast/traversal.hpp"

namespace jsast {

std::vector<Node*> collectChildren(Node& node) {
  std::vector<Node*> children;
  node.forEach([&children](Node& child) { children.push_back(&child); });
  return children;
}

void walkPreOrder(Node& root, WalkCallback callback) {
  std::vector<Node*> stack{&root};
  while (!stack.empty()) {
    Node* node = stack.back();
    stack.pop_back();
    if (!callback(*node)) {
      continue;
    }
    // Push in reverse so the leftmost child is visited first.
    const auto children = collectChildren(*node);
    stack.insert(stack.end(), children.rbegin(), children.rend());
  }
}

std::size_t countNodes(Node& root) {
  std::size_t count = 0;
  walkPreOrder(root, [&count](Node&) {
    ++count;
    return true;
  });
  return count;
}

} // namespace jsast
