#include "jsast/ast_printer.hpp"

#include "jsast/traversal.hpp"

namespace jsast {

static std::string quoted(const std::string& text) { return "'" + text + "'"; }

ASTPrinter::ASTPrinter(llvm::raw_ostream& out, PrinterOptions options) noexcept
    : out(out), options(options) {}

void ASTPrinter::print(Node& root) {
  depthHasMore.clear();
  root.accept(*this);
  out.flush();
}

void ASTPrinter::printPrefix() const {
  for (size_t i = 0; i + 1 < depthHasMore.size(); ++i) {
    out << (depthHasMore[i] ? "| " : "  ");
  }
  if (!depthHasMore.empty()) {
    out << (depthHasMore.back() ? "|-" : "`-");
  }
}

void ASTPrinter::printLine(const Node& node, const std::string& detail) {
  printPrefix();
  out << node.kindName();
  if (!detail.empty()) {
    out << " " << detail;
  }
  if (options.showLocations && node.line) {
    out << " @" << *node.line;
  }
  if (options.showScopes) {
    if (const NScope* scope = node.asScope()) {
      out << " [";
      bool first = true;
      for (const auto& name : scope->environment) {
        if (!first) {
          out << ", ";
        }
        out << name;
        first = false;
      }
      out << "]";
    }
  }
  out << "\n";
}

void ASTPrinter::printChildren(Node& node) {
  const auto children = collectChildren(node);
  for (size_t i = 0; i < children.size(); ++i) {
    const bool isLast = (i == children.size() - 1);
    DepthScope scope(*this, !isLast);
    children[i]->accept(*this);
  }
}

ASTPrinter::DepthScope::DepthScope(ASTPrinter& printer, bool hasMore) noexcept
    : printer(printer) {
  printer.depthHasMore.push_back(hasMore);
}

ASTPrinter::DepthScope::~DepthScope() noexcept {
  printer.depthHasMore.pop_back();
}

void ASTPrinter::visit(NPrograms& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NProgram& node) {
  printLine(node, node.filename.empty() ? "" : quoted(node.filename));
  printChildren(node);
}

void ASTPrinter::visit(NFunction& node) {
  printLine(node, node.name != nullptr ? quoted(node.name->value)
                                       : std::string("<anonymous>"));
  printChildren(node);
}

void ASTPrinter::visit(NName& node) { printLine(node, quoted(node.value)); }

void ASTPrinter::visit(NSwitchCase& node) {
  printLine(node, node.isDefault() ? "default" : "");
  printChildren(node);
}

void ASTPrinter::visit(NCatchClause& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NVariableDeclarator& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NProperty& node) {
  printLine(node, propertyKindName(node.kind));
  printChildren(node);
}

void ASTPrinter::visit(NEmptyStatement& node) { printLine(node); }

void ASTPrinter::visit(NBlockStatement& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NExpressionStatement& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NIfStatement& node) {
  printLine(node);

  {
    DepthScope scope(*this, true);
    printPrefix();
    out << "condition:\n";
    {
      DepthScope inner(*this, false);
      node.condition->accept(*this);
    }
  }
  {
    DepthScope scope(*this, node.otherwise != nullptr);
    printPrefix();
    out << "then:\n";
    {
      DepthScope inner(*this, false);
      node.then->accept(*this);
    }
  }
  if (node.otherwise != nullptr) {
    DepthScope scope(*this, false);
    printPrefix();
    out << "else:\n";
    {
      DepthScope inner(*this, false);
      node.otherwise->accept(*this);
    }
  }
}

void ASTPrinter::visit(NLabeledStatement& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NBreakStatement& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NContinueStatement& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NWithStatement& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NSwitchStatement& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NReturnStatement& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NThrowStatement& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NTryStatement& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NWhileStatement& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NDoWhileStatement& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NForStatement& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NForInStatement& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NFunctionDeclaration& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NVariableDeclaration& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NDebuggerStatement& node) { printLine(node); }

void ASTPrinter::visit(NThisExpression& node) { printLine(node); }

void ASTPrinter::visit(NArrayExpression& node) {
  printLine(node);

  // Holes are printed too so that [1,,3] and [1,3] look different.
  const auto& elements = node.expressions;
  for (size_t i = 0; i < elements.size(); ++i) {
    const bool isLast = (i == elements.size() - 1);
    DepthScope scope(*this, !isLast);
    if (elements[i] != nullptr) {
      elements[i]->accept(*this);
    } else {
      printPrefix();
      out << "<hole>\n";
    }
  }
}

void ASTPrinter::visit(NObjectExpression& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NFunctionExpression& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NArrowFunction& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NSequenceExpression& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NUnaryExpression& node) {
  printLine(node, quoted(node.op));
  printChildren(node);
}

void ASTPrinter::visit(NBinaryExpression& node) {
  printLine(node, quoted(node.op));
  printChildren(node);
}

void ASTPrinter::visit(NAssignmentExpression& node) {
  printLine(node, quoted(node.op));
  printChildren(node);
}

void ASTPrinter::visit(NUpdateExpression& node) {
  printLine(node, quoted(node.op) + (node.isPrefix ? " prefix" : " postfix"));
  printChildren(node);
}

void ASTPrinter::visit(NConditionalExpression& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NCallExpression& node) {
  printLine(node, node.isNew ? "new" : "");
  printChildren(node);
}

void ASTPrinter::visit(NMemberExpression& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NIndexExpression& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NNameExpression& node) {
  printLine(node);
  printChildren(node);
}

void ASTPrinter::visit(NLiteralExpression& node) {
  printLine(node, node.raw.empty() ? node.toName() : node.raw);
}

void ASTPrinter::visit(NRegexpExpression& node) {
  printLine(node, node.regexp);
}

std::string dumpTree(Node& root, PrinterOptions options) {
  std::string buffer;
  llvm::raw_string_ostream stream(buffer);
  ASTPrinter printer(stream, options);
  printer.print(root);
  return stream.str();
}

} // namespace jsast
