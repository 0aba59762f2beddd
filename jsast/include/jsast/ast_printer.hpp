#ifndef JSAST_AST_PRINTER_HPP
#define JSAST_AST_PRINTER_HPP

#include <string>
#include <vector>

#include <llvm/Support/raw_ostream.h>

#include "jsast/visitor.hpp"

namespace jsast {

struct PrinterOptions {
  /// Append "@<line>" to nodes that carry a line number.
  bool showLocations = false;
  /// Append the declared names of scope nodes, e.g. "[arguments, x]".
  bool showScopes = false;
};

/// Prints an AST as an indented tree, one node per line.
class ASTPrinter : public Visitor<void> {
public:
  explicit ASTPrinter(llvm::raw_ostream& out,
                      PrinterOptions options = PrinterOptions()) noexcept;

  void print(Node& root);

  void visit(NPrograms& node) override;
  void visit(NProgram& node) override;
  void visit(NFunction& node) override;
  void visit(NName& node) override;
  void visit(NSwitchCase& node) override;
  void visit(NCatchClause& node) override;
  void visit(NVariableDeclarator& node) override;
  void visit(NProperty& node) override;

  void visit(NEmptyStatement& node) override;
  void visit(NBlockStatement& node) override;
  void visit(NExpressionStatement& node) override;
  void visit(NIfStatement& node) override;
  void visit(NLabeledStatement& node) override;
  void visit(NBreakStatement& node) override;
  void visit(NContinueStatement& node) override;
  void visit(NWithStatement& node) override;
  void visit(NSwitchStatement& node) override;
  void visit(NReturnStatement& node) override;
  void visit(NThrowStatement& node) override;
  void visit(NTryStatement& node) override;
  void visit(NWhileStatement& node) override;
  void visit(NDoWhileStatement& node) override;
  void visit(NForStatement& node) override;
  void visit(NForInStatement& node) override;
  void visit(NFunctionDeclaration& node) override;
  void visit(NVariableDeclaration& node) override;
  void visit(NDebuggerStatement& node) override;

  void visit(NThisExpression& node) override;
  void visit(NArrayExpression& node) override;
  void visit(NObjectExpression& node) override;
  void visit(NFunctionExpression& node) override;
  void visit(NArrowFunction& node) override;
  void visit(NSequenceExpression& node) override;
  void visit(NUnaryExpression& node) override;
  void visit(NBinaryExpression& node) override;
  void visit(NAssignmentExpression& node) override;
  void visit(NUpdateExpression& node) override;
  void visit(NConditionalExpression& node) override;
  void visit(NCallExpression& node) override;
  void visit(NMemberExpression& node) override;
  void visit(NIndexExpression& node) override;
  void visit(NNameExpression& node) override;
  void visit(NLiteralExpression& node) override;
  void visit(NRegexpExpression& node) override;

private:
  llvm::raw_ostream& out;
  PrinterOptions options;
  std::vector<bool> depthHasMore;

  void printPrefix() const;
  void printLine(const Node& node, const std::string& detail = "");
  void printChildren(Node& node);

  class DepthScope {
  public:
    DepthScope(ASTPrinter& printer, bool hasMore) noexcept;
    ~DepthScope() noexcept;

  private:
    ASTPrinter& printer;
  };
};

/// Prints `root` into a string.
[[nodiscard]] std::string dumpTree(Node& root,
                                   PrinterOptions options = PrinterOptions());

} // namespace jsast

#endif // JSAST_AST_PRINTER_HPP
