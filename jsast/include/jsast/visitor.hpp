#ifndef JSAST_VISITOR_HPP
#define JSAST_VISITOR_HPP

#include <utility>

#include <llvm/Support/Casting.h>
#include <llvm/Support/ErrorHandling.h>

#include "jsast/node.hpp"

namespace jsast {

/// Base class for implementing the Visitor design pattern on the JavaScript AST.
///
/// The Visitor pattern allows operations to be defined on AST nodes without
/// modifying the node classes themselves. Every node kind has exactly one
/// pure virtual `visit()` overload, so a visitor that forgets a kind cannot be
/// instantiated.
///
/// ## How to Implement a Visitor
///
/// 1. Create a class that inherits from Visitor<R>, R being the result type
/// 2. Override all pure virtual visit() methods
/// 3. Use node.accept(*this) to dispatch to the correct visit method
///
/// ## Example
///
/// ```cpp
/// class CountCalls : public Visitor<int> {
/// public:
///   int visit(NCallExpression& node) override {
///     int count = 1;
///     node.forEach([&](Node& child) { count += child.accept(*this); });
///     return count;
///   }
///   // ... implement all other visit methods
/// };
///
/// CountCalls visitor;
/// int calls = program->accept(visitor);
/// ```
///
/// ## Traversal
///
/// Visitors do not traverse child nodes on their own. A visit method that
/// needs the children calls accept() on them, either field by field or
/// through Node::forEach().
template <typename R> class Visitor {
public:
  virtual ~Visitor() noexcept = default;

  /// @name Structure Visitors
  /// @{
  virtual R visit(NPrograms& node) = 0;
  virtual R visit(NProgram& node) = 0;
  virtual R visit(NFunction& node) = 0;
  virtual R visit(NName& node) = 0;
  virtual R visit(NSwitchCase& node) = 0;
  virtual R visit(NCatchClause& node) = 0;
  virtual R visit(NVariableDeclarator& node) = 0;
  virtual R visit(NProperty& node) = 0;
  /// @}

  /// @name Statement Visitors
  /// @{
  virtual R visit(NEmptyStatement& node) = 0;
  virtual R visit(NBlockStatement& node) = 0;
  virtual R visit(NExpressionStatement& node) = 0;
  virtual R visit(NIfStatement& node) = 0;
  virtual R visit(NLabeledStatement& node) = 0;
  virtual R visit(NBreakStatement& node) = 0;
  virtual R visit(NContinueStatement& node) = 0;
  virtual R visit(NWithStatement& node) = 0;
  virtual R visit(NSwitchStatement& node) = 0;
  virtual R visit(NReturnStatement& node) = 0;
  virtual R visit(NThrowStatement& node) = 0;
  virtual R visit(NTryStatement& node) = 0;
  virtual R visit(NWhileStatement& node) = 0;
  virtual R visit(NDoWhileStatement& node) = 0;
  virtual R visit(NForStatement& node) = 0;
  virtual R visit(NForInStatement& node) = 0;
  virtual R visit(NFunctionDeclaration& node) = 0;
  virtual R visit(NVariableDeclaration& node) = 0;
  virtual R visit(NDebuggerStatement& node) = 0;
  /// @}

  /// @name Expression Visitors
  /// @{
  virtual R visit(NThisExpression& node) = 0;
  virtual R visit(NArrayExpression& node) = 0;
  virtual R visit(NObjectExpression& node) = 0;
  virtual R visit(NFunctionExpression& node) = 0;
  virtual R visit(NArrowFunction& node) = 0;
  virtual R visit(NSequenceExpression& node) = 0;
  virtual R visit(NUnaryExpression& node) = 0;
  virtual R visit(NBinaryExpression& node) = 0;
  virtual R visit(NAssignmentExpression& node) = 0;
  virtual R visit(NUpdateExpression& node) = 0;
  virtual R visit(NConditionalExpression& node) = 0;
  virtual R visit(NCallExpression& node) = 0;
  virtual R visit(NMemberExpression& node) = 0;
  virtual R visit(NIndexExpression& node) = 0;
  virtual R visit(NNameExpression& node) = 0;
  virtual R visit(NLiteralExpression& node) = 0;
  virtual R visit(NRegexpExpression& node) = 0;
  /// @}
};

/// Visitor that threads one extra argument of type A through every call, for
/// passes that carry context down the tree (the enclosing function, an
/// accumulator, ...). The argument is forwarded to the handler, so a
/// move-only A such as std::unique_ptr is handed over rather than copied.
template <typename R, typename A> class Visitor1 {
public:
  using ArgType = A;

  virtual ~Visitor1() noexcept = default;

  /// @name Structure Visitors
  /// @{
  virtual R visit(NPrograms& node, A arg) = 0;
  virtual R visit(NProgram& node, A arg) = 0;
  virtual R visit(NFunction& node, A arg) = 0;
  virtual R visit(NName& node, A arg) = 0;
  virtual R visit(NSwitchCase& node, A arg) = 0;
  virtual R visit(NCatchClause& node, A arg) = 0;
  virtual R visit(NVariableDeclarator& node, A arg) = 0;
  virtual R visit(NProperty& node, A arg) = 0;
  /// @}

  /// @name Statement Visitors
  /// @{
  virtual R visit(NEmptyStatement& node, A arg) = 0;
  virtual R visit(NBlockStatement& node, A arg) = 0;
  virtual R visit(NExpressionStatement& node, A arg) = 0;
  virtual R visit(NIfStatement& node, A arg) = 0;
  virtual R visit(NLabeledStatement& node, A arg) = 0;
  virtual R visit(NBreakStatement& node, A arg) = 0;
  virtual R visit(NContinueStatement& node, A arg) = 0;
  virtual R visit(NWithStatement& node, A arg) = 0;
  virtual R visit(NSwitchStatement& node, A arg) = 0;
  virtual R visit(NReturnStatement& node, A arg) = 0;
  virtual R visit(NThrowStatement& node, A arg) = 0;
  virtual R visit(NTryStatement& node, A arg) = 0;
  virtual R visit(NWhileStatement& node, A arg) = 0;
  virtual R visit(NDoWhileStatement& node, A arg) = 0;
  virtual R visit(NForStatement& node, A arg) = 0;
  virtual R visit(NForInStatement& node, A arg) = 0;
  virtual R visit(NFunctionDeclaration& node, A arg) = 0;
  virtual R visit(NVariableDeclaration& node, A arg) = 0;
  virtual R visit(NDebuggerStatement& node, A arg) = 0;
  /// @}

  /// @name Expression Visitors
  /// @{
  virtual R visit(NThisExpression& node, A arg) = 0;
  virtual R visit(NArrayExpression& node, A arg) = 0;
  virtual R visit(NObjectExpression& node, A arg) = 0;
  virtual R visit(NFunctionExpression& node, A arg) = 0;
  virtual R visit(NArrowFunction& node, A arg) = 0;
  virtual R visit(NSequenceExpression& node, A arg) = 0;
  virtual R visit(NUnaryExpression& node, A arg) = 0;
  virtual R visit(NBinaryExpression& node, A arg) = 0;
  virtual R visit(NAssignmentExpression& node, A arg) = 0;
  virtual R visit(NUpdateExpression& node, A arg) = 0;
  virtual R visit(NConditionalExpression& node, A arg) = 0;
  virtual R visit(NCallExpression& node, A arg) = 0;
  virtual R visit(NMemberExpression& node, A arg) = 0;
  virtual R visit(NIndexExpression& node, A arg) = 0;
  virtual R visit(NNameExpression& node, A arg) = 0;
  virtual R visit(NLiteralExpression& node, A arg) = 0;
  virtual R visit(NRegexpExpression& node, A arg) = 0;
  /// @}
};

// The switches below have no default label so that -Wswitch reports a kind
// without a dispatch case.

template <typename R> R Node::accept(Visitor<R>& visitor) {
  using llvm::cast;
  switch (getKind()) {
  case NodeKind::Programs:
    return visitor.visit(cast<NPrograms>(*this));
  case NodeKind::Program:
    return visitor.visit(cast<NProgram>(*this));
  case NodeKind::Function:
    return visitor.visit(cast<NFunction>(*this));
  case NodeKind::Name:
    return visitor.visit(cast<NName>(*this));
  case NodeKind::SwitchCase:
    return visitor.visit(cast<NSwitchCase>(*this));
  case NodeKind::CatchClause:
    return visitor.visit(cast<NCatchClause>(*this));
  case NodeKind::VariableDeclarator:
    return visitor.visit(cast<NVariableDeclarator>(*this));
  case NodeKind::Property:
    return visitor.visit(cast<NProperty>(*this));
  case NodeKind::EmptyStatement:
    return visitor.visit(cast<NEmptyStatement>(*this));
  case NodeKind::BlockStatement:
    return visitor.visit(cast<NBlockStatement>(*this));
  case NodeKind::ExpressionStatement:
    return visitor.visit(cast<NExpressionStatement>(*this));
  case NodeKind::IfStatement:
    return visitor.visit(cast<NIfStatement>(*this));
  case NodeKind::LabeledStatement:
    return visitor.visit(cast<NLabeledStatement>(*this));
  case NodeKind::BreakStatement:
    return visitor.visit(cast<NBreakStatement>(*this));
  case NodeKind::ContinueStatement:
    return visitor.visit(cast<NContinueStatement>(*this));
  case NodeKind::WithStatement:
    return visitor.visit(cast<NWithStatement>(*this));
  case NodeKind::SwitchStatement:
    return visitor.visit(cast<NSwitchStatement>(*this));
  case NodeKind::ReturnStatement:
    return visitor.visit(cast<NReturnStatement>(*this));
  case NodeKind::ThrowStatement:
    return visitor.visit(cast<NThrowStatement>(*this));
  case NodeKind::TryStatement:
    return visitor.visit(cast<NTryStatement>(*this));
  case NodeKind::WhileStatement:
    return visitor.visit(cast<NWhileStatement>(*this));
  case NodeKind::DoWhileStatement:
    return visitor.visit(cast<NDoWhileStatement>(*this));
  case NodeKind::ForStatement:
    return visitor.visit(cast<NForStatement>(*this));
  case NodeKind::ForInStatement:
    return visitor.visit(cast<NForInStatement>(*this));
  case NodeKind::FunctionDeclaration:
    return visitor.visit(cast<NFunctionDeclaration>(*this));
  case NodeKind::VariableDeclaration:
    return visitor.visit(cast<NVariableDeclaration>(*this));
  case NodeKind::DebuggerStatement:
    return visitor.visit(cast<NDebuggerStatement>(*this));
  case NodeKind::ThisExpression:
    return visitor.visit(cast<NThisExpression>(*this));
  case NodeKind::ArrayExpression:
    return visitor.visit(cast<NArrayExpression>(*this));
  case NodeKind::ObjectExpression:
    return visitor.visit(cast<NObjectExpression>(*this));
  case NodeKind::FunctionExpression:
    return visitor.visit(cast<NFunctionExpression>(*this));
  case NodeKind::ArrowFunction:
    return visitor.visit(cast<NArrowFunction>(*this));
  case NodeKind::SequenceExpression:
    return visitor.visit(cast<NSequenceExpression>(*this));
  case NodeKind::UnaryExpression:
    return visitor.visit(cast<NUnaryExpression>(*this));
  case NodeKind::BinaryExpression:
    return visitor.visit(cast<NBinaryExpression>(*this));
  case NodeKind::AssignmentExpression:
    return visitor.visit(cast<NAssignmentExpression>(*this));
  case NodeKind::UpdateExpression:
    return visitor.visit(cast<NUpdateExpression>(*this));
  case NodeKind::ConditionalExpression:
    return visitor.visit(cast<NConditionalExpression>(*this));
  case NodeKind::CallExpression:
    return visitor.visit(cast<NCallExpression>(*this));
  case NodeKind::MemberExpression:
    return visitor.visit(cast<NMemberExpression>(*this));
  case NodeKind::IndexExpression:
    return visitor.visit(cast<NIndexExpression>(*this));
  case NodeKind::NameExpression:
    return visitor.visit(cast<NNameExpression>(*this));
  case NodeKind::LiteralExpression:
    return visitor.visit(cast<NLiteralExpression>(*this));
  case NodeKind::RegexpExpression:
    return visitor.visit(cast<NRegexpExpression>(*this));
  }
  llvm_unreachable("Unknown NodeKind");
}

template <typename R, typename A>
R Node::accept(Visitor1<R, A>& visitor,
               typename Visitor1<R, A>::ArgType arg) {
  using llvm::cast;
  switch (getKind()) {
  case NodeKind::Programs:
    return visitor.visit(cast<NPrograms>(*this), std::forward<A>(arg));
  case NodeKind::Program:
    return visitor.visit(cast<NProgram>(*this), std::forward<A>(arg));
  case NodeKind::Function:
    return visitor.visit(cast<NFunction>(*this), std::forward<A>(arg));
  case NodeKind::Name:
    return visitor.visit(cast<NName>(*this), std::forward<A>(arg));
  case NodeKind::SwitchCase:
    return visitor.visit(cast<NSwitchCase>(*this), std::forward<A>(arg));
  case NodeKind::CatchClause:
    return visitor.visit(cast<NCatchClause>(*this), std::forward<A>(arg));
  case NodeKind::VariableDeclarator:
    return visitor.visit(cast<NVariableDeclarator>(*this), std::forward<A>(arg));
  case NodeKind::Property:
    return visitor.visit(cast<NProperty>(*this), std::forward<A>(arg));
  case NodeKind::EmptyStatement:
    return visitor.visit(cast<NEmptyStatement>(*this), std::forward<A>(arg));
  case NodeKind::BlockStatement:
    return visitor.visit(cast<NBlockStatement>(*this), std::forward<A>(arg));
  case NodeKind::ExpressionStatement:
    return visitor.visit(cast<NExpressionStatement>(*this), std::forward<A>(arg));
  case NodeKind::IfStatement:
    return visitor.visit(cast<NIfStatement>(*this), std::forward<A>(arg));
  case NodeKind::LabeledStatement:
    return visitor.visit(cast<NLabeledStatement>(*this), std::forward<A>(arg));
  case NodeKind::BreakStatement:
    return visitor.visit(cast<NBreakStatement>(*this), std::forward<A>(arg));
  case NodeKind::ContinueStatement:
    return visitor.visit(cast<NContinueStatement>(*this), std::forward<A>(arg));
  case NodeKind::WithStatement:
    return visitor.visit(cast<NWithStatement>(*this), std::forward<A>(arg));
  case NodeKind::SwitchStatement:
    return visitor.visit(cast<NSwitchStatement>(*this), std::forward<A>(arg));
  case NodeKind::ReturnStatement:
    return visitor.visit(cast<NReturnStatement>(*this), std::forward<A>(arg));
  case NodeKind::ThrowStatement:
    return visitor.visit(cast<NThrowStatement>(*this), std::forward<A>(arg));
  case NodeKind::TryStatement:
    return visitor.visit(cast<NTryStatement>(*this), std::forward<A>(arg));
  case NodeKind::WhileStatement:
    return visitor.visit(cast<NWhileStatement>(*this), std::forward<A>(arg));
  case NodeKind::DoWhileStatement:
    return visitor.visit(cast<NDoWhileStatement>(*this), std::forward<A>(arg));
  case NodeKind::ForStatement:
    return visitor.visit(cast<NForStatement>(*this), std::forward<A>(arg));
  case NodeKind::ForInStatement:
    return visitor.visit(cast<NForInStatement>(*this), std::forward<A>(arg));
  case NodeKind::FunctionDeclaration:
    return visitor.visit(cast<NFunctionDeclaration>(*this), std::forward<A>(arg));
  case NodeKind::VariableDeclaration:
    return visitor.visit(cast<NVariableDeclaration>(*this), std::forward<A>(arg));
  case NodeKind::DebuggerStatement:
    return visitor.visit(cast<NDebuggerStatement>(*this), std::forward<A>(arg));
  case NodeKind::ThisExpression:
    return visitor.visit(cast<NThisExpression>(*this), std::forward<A>(arg));
  case NodeKind::ArrayExpression:
    return visitor.visit(cast<NArrayExpression>(*this), std::forward<A>(arg));
  case NodeKind::ObjectExpression:
    return visitor.visit(cast<NObjectExpression>(*this), std::forward<A>(arg));
  case NodeKind::FunctionExpression:
    return visitor.visit(cast<NFunctionExpression>(*this), std::forward<A>(arg));
  case NodeKind::ArrowFunction:
    return visitor.visit(cast<NArrowFunction>(*this), std::forward<A>(arg));
  case NodeKind::SequenceExpression:
    return visitor.visit(cast<NSequenceExpression>(*this), std::forward<A>(arg));
  case NodeKind::UnaryExpression:
    return visitor.visit(cast<NUnaryExpression>(*this), std::forward<A>(arg));
  case NodeKind::BinaryExpression:
    return visitor.visit(cast<NBinaryExpression>(*this), std::forward<A>(arg));
  case NodeKind::AssignmentExpression:
    return visitor.visit(cast<NAssignmentExpression>(*this), std::forward<A>(arg));
  case NodeKind::UpdateExpression:
    return visitor.visit(cast<NUpdateExpression>(*this), std::forward<A>(arg));
  case NodeKind::ConditionalExpression:
    return visitor.visit(cast<NConditionalExpression>(*this), std::forward<A>(arg));
  case NodeKind::CallExpression:
    return visitor.visit(cast<NCallExpression>(*this), std::forward<A>(arg));
  case NodeKind::MemberExpression:
    return visitor.visit(cast<NMemberExpression>(*this), std::forward<A>(arg));
  case NodeKind::IndexExpression:
    return visitor.visit(cast<NIndexExpression>(*this), std::forward<A>(arg));
  case NodeKind::NameExpression:
    return visitor.visit(cast<NNameExpression>(*this), std::forward<A>(arg));
  case NodeKind::LiteralExpression:
    return visitor.visit(cast<NLiteralExpression>(*this), std::forward<A>(arg));
  case NodeKind::RegexpExpression:
    return visitor.visit(cast<NRegexpExpression>(*this), std::forward<A>(arg));
  }
  llvm_unreachable("Unknown NodeKind");
}

} // namespace jsast

#endif // JSAST_VISITOR_HPP
