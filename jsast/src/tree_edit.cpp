#include "jsast/tree_edit.hpp"

#include "jsast/traversal.hpp"

namespace jsast {

void relinkParents(Node& root) {
  walkPreOrder(root, [](Node& node) {
    node.forEach([&node](Node& child) { child.parent = &node; });
    return true;
  });
}

bool verifyParentLinks(Node& root, ErrorReporter& reporter) {
  bool consistent = true;
  walkPreOrder(root, [&](Node& node) {
    node.forEach([&](Node& child) {
      if (child.parent != &node) {
        consistent = false;
        reporter.error(formatParentMismatch(child.kindName(), node.kindName(),
                                            child.parent != nullptr
                                                ? child.parent->kindName()
                                                : "null"),
                       child);
      }
    });
    return true;
  });
  return consistent;
}

} // namespace jsast
