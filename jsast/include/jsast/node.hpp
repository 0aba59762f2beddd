#ifndef JSAST_NODE_HPP
#define JSAST_NODE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <llvm/ADT/STLFunctionalExtras.h>
#include <llvm/Support/Casting.h>

namespace jsast {

template <typename R> class Visitor;
template <typename R, typename A> class Visitor1;

class Node;
class NScope;
class NProgram;
class NFunction;
class NName;
class NStatement;
class NExpression;
class NBlockStatement;
class NCatchClause;
class NSwitchCase;
class NVariableDeclarator;
class NProperty;

/// Tag of every concrete node class. The tag is fixed at construction.
enum class NodeKind {
  Programs,
  Program,
  Function,
  Name,
  SwitchCase,
  CatchClause,
  VariableDeclarator,
  Property,

  // Statements
  EmptyStatement,
  BlockStatement,
  ExpressionStatement,
  IfStatement,
  LabeledStatement,
  BreakStatement,
  ContinueStatement,
  WithStatement,
  SwitchStatement,
  ReturnStatement,
  ThrowStatement,
  TryStatement,
  WhileStatement,
  DoWhileStatement,
  ForStatement,
  ForInStatement,
  FunctionDeclaration,
  VariableDeclaration,
  DebuggerStatement,

  // Expressions
  ThisExpression,
  ArrayExpression,
  ObjectExpression,
  FunctionExpression,
  ArrowFunction,
  SequenceExpression,
  UnaryExpression,
  BinaryExpression,
  AssignmentExpression,
  UpdateExpression,
  ConditionalExpression,
  CallExpression,
  MemberExpression,
  IndexExpression,
  NameExpression,
  LiteralExpression,
  RegexpExpression,

  FirstStatement = EmptyStatement,
  LastStatement = DebuggerStatement,
  FirstExpression = ThisExpression,
  LastExpression = RegexpExpression
};

/// Class name of the node kind, e.g. "NIfStatement".
[[nodiscard]] const char* kindName(NodeKind kind) noexcept;

using ChildCallback = llvm::function_ref<void(Node&)>;
using ConstChildCallback = llvm::function_ref<void(const Node&)>;

using StatementList = std::vector<std::unique_ptr<NStatement>>;
using ExpressionList = std::vector<std::unique_ptr<NExpression>>;
using NameList = std::vector<std::unique_ptr<NName>>;

/// Capability of the nodes that can host local variables: NProgram, NFunction,
/// NArrowFunction and NCatchClause.
///
/// The environment is filled by a resolution pass, never by the node model.
class NScope {
public:
  /// Implicitly declared in every function scope.
  static constexpr const char* ARGUMENTS = "arguments";

  std::set<std::string> environment;

  virtual ~NScope() noexcept = default;

  /// Returns true if the name was not declared here before.
  bool declare(const std::string& name) {
    return environment.insert(name).second;
  }
  [[nodiscard]] bool isDeclared(const std::string& name) const {
    return environment.count(name) != 0;
  }

  [[nodiscard]] virtual Node& scopeNode() noexcept = 0;
  [[nodiscard]] virtual const Node& scopeNode() const noexcept = 0;
};

// clang-format off
/// A node in the abstract syntax tree of a JavaScript program.
///
/// A node owns its children. `parent` is a plain back-pointer; when the tree is
/// transformed it is the caller's job to keep it in sync (see tree_edit.hpp).
class Node {
public:
  /// The parent of this node, or null for a root or an orphan.
  Node* parent = nullptr;
  /// Source offsets.
  std::optional<int> start;
  std::optional<int> end;
  /// 1-based line number.
  std::optional<int> line;

  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;
  virtual ~Node() noexcept = default;

  [[nodiscard]] NodeKind getKind() const noexcept { return kind; }
  [[nodiscard]] const char* kindName() const noexcept {
    return jsast::kindName(kind);
  }

  void setLocation(std::optional<int> startOffset, std::optional<int> endOffset,
                   std::optional<int> lineNumber) {
    start = startOffset;
    end = endOffset;
    line = lineNumber;
  }

  /// The scope capability of this node, or null if it cannot host variables.
  [[nodiscard]] NScope* asScope() noexcept;
  [[nodiscard]] const NScope* asScope() const noexcept;

  /// The NProgram enclosing this node, possibly the node itself.
  [[nodiscard]] NProgram* enclosingProgram() noexcept;
  [[nodiscard]] const NProgram* enclosingProgram() const noexcept;
  /// The NFunction enclosing this node, possibly the node itself.
  [[nodiscard]] NFunction* enclosingFunction() noexcept;
  [[nodiscard]] const NFunction* enclosingFunction() const noexcept;
  /// The nearest node hosting variables, possibly the node itself.
  [[nodiscard]] NScope* enclosingScope() noexcept;

  /// Filename of the enclosing program; absent for orphans.
  [[nodiscard]] std::optional<std::string> filename() const;
  /// "filename:line" for diagnostics.
  [[nodiscard]] std::string location() const;

  /// Calls `callback` once per immediate child, in source order. Absent
  /// optional children are skipped.
  void forEach(ChildCallback callback) { forEachChild(callback); }
  void forEach(ConstChildCallback callback) const;

  /// Calls the `visit` overload of `visitor` matching this node's kind.
  /// Defined in visitor.hpp.
  template <typename R> R accept(Visitor<R>& visitor);
  template <typename R, typename A>
  R accept(Visitor1<R, A>& visitor, typename Visitor1<R, A>::ArgType arg);

protected:
  explicit Node(NodeKind kind) noexcept : kind(kind) {}

  virtual void forEachChild(ChildCallback callback) = 0;

  using ReleasedChildren = std::vector<std::unique_ptr<Node>>;

  /// Moves the owned children into `released`, leaving the fields empty.
  virtual void releaseChildren(ReleasedChildren&) {}

  /// Frees every node below this one with an explicit work stack. Called from
  /// the destructor of each node class that owns children, so that destroying
  /// a deeply nested tree does not recurse once per level.
  void releaseTree() noexcept;

  template <typename T>
  static void release(std::unique_ptr<T>& child, ReleasedChildren& released) {
    if (child != nullptr) {
      released.push_back(std::move(child));
    }
  }

  template <typename T>
  static void releaseAll(std::vector<std::unique_ptr<T>>& children,
                         ReleasedChildren& released) {
    for (auto& child : children) {
      release(child, released);
    }
    children.clear();
  }

  template <typename T> std::unique_ptr<T> adopt(std::unique_ptr<T> child) noexcept {
    if (child != nullptr) {
      child->parent = this;
    }
    return child;
  }

  template <typename T>
  std::unique_ptr<T> adoptRequired(std::unique_ptr<T> child, const char* role) {
    requireChild(child.get(), role);
    return adopt(std::move(child));
  }

  template <typename T>
  std::vector<std::unique_ptr<T>> adoptAll(std::vector<std::unique_ptr<T>> children) noexcept {
    for (auto& child : children) {
      if (child != nullptr) {
        child->parent = this;
      }
    }
    return children;
  }

  void requireChild(const Node* child, const char* role) const;

private:
  const NodeKind kind;
};

class NStatement : public Node {
public:
  static bool classof(const Node* node) {
    return node->getKind() >= NodeKind::FirstStatement &&
           node->getKind() <= NodeKind::LastStatement;
  }

protected:
  using Node::Node;
};

class NExpression : public Node {
public:
  static bool classof(const Node* node) {
    return node->getKind() >= NodeKind::FirstExpression &&
           node->getKind() <= NodeKind::LastExpression;
  }

protected:
  using Node::Node;
};

/// Mention of a variable, property, or label.
class NName : public Node {
public:
  /// Identifier text, with unicode escapes resolved.
  std::string value;
  /// Scope declaring this variable; null until resolved and for non-variables.
  NScope* scope = nullptr;

  explicit NName(std::string value) : Node(NodeKind::Name), value(std::move(value)) {}

  [[nodiscard]] bool isVariable() const noexcept;
  [[nodiscard]] bool isProperty() const noexcept;
  [[nodiscard]] bool isLabel() const noexcept;

  /// `scope` if resolved, otherwise the enclosing program (undeclared names are
  /// implicit globals). Null for orphans, labels and property names.
  [[nodiscard]] NScope* declaringScope() noexcept;

  static bool classof(const Node* node) { return node->getKind() == NodeKind::Name; }

protected:
  void forEachChild(ChildCallback) override {}
};

class NBlockStatement : public NStatement {
public:
  StatementList body;
  explicit NBlockStatement(StatementList body = {})
      : NStatement(NodeKind::BlockStatement), body(adoptAll(std::move(body))) {}
  ~NBlockStatement() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::BlockStatement; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// Root of one compilation unit and its top-level scope.
class NProgram : public Node, public NScope {
public:
  /// Where the program was parsed from; only used for diagnostics.
  std::string filename;
  StatementList body;

  explicit NProgram(StatementList body, std::string filename = "")
      : Node(NodeKind::Program), filename(std::move(filename)),
        body(adoptAll(std::move(body))) {}

  Node& scopeNode() noexcept override { return *this; }
  const Node& scopeNode() const noexcept override { return *this; }
  ~NProgram() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::Program; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// A collection of programs. Never produced by a parser; it only groups several
/// compilation units into one tree.
class NPrograms : public Node {
public:
  std::vector<std::unique_ptr<NProgram>> programs;

  explicit NPrograms(std::vector<std::unique_ptr<NProgram>> programs = {})
      : Node(NodeKind::Programs), programs(adoptAll(std::move(programs))) {}
  ~NPrograms() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::Programs; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// A function, occurring as a function expression, a function declaration, or
/// a property accessor in an object literal.
class NFunction : public Node, public NScope {
public:
  std::unique_ptr<NName> name;  // null for anonymous functions
  NameList params;
  std::unique_ptr<NStatement> body;

  NFunction(std::unique_ptr<NName> name, NameList params,
            std::unique_ptr<NStatement> body)
      : Node(NodeKind::Function), name(adopt(std::move(name))),
        params(adoptAll(std::move(params))), body(adoptRequired(std::move(body), "body")) {}

  [[nodiscard]] bool isExpression() const noexcept;
  [[nodiscard]] bool isDeclaration() const noexcept;
  [[nodiscard]] bool isAccessor() const noexcept;

  Node& scopeNode() noexcept override { return *this; }
  const Node& scopeNode() const noexcept override { return *this; }
  ~NFunction() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::Function; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// Clause in a switch: `case [expression]: [body]`, or `default: [body]` when
/// there is no expression.
class NSwitchCase : public Node {
public:
  std::unique_ptr<NExpression> expression;
  StatementList body;

  NSwitchCase(std::unique_ptr<NExpression> expression, StatementList body)
      : Node(NodeKind::SwitchCase), expression(adopt(std::move(expression))),
        body(adoptAll(std::move(body))) {}
  static std::unique_ptr<NSwitchCase> defaultCase(StatementList body) {
    return std::make_unique<NSwitchCase>(nullptr, std::move(body));
  }

  [[nodiscard]] bool isDefault() const noexcept { return expression == nullptr; }
  ~NSwitchCase() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::SwitchCase; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `catch ([param]) [body]`
class NCatchClause : public Node, public NScope {
public:
  std::unique_ptr<NName> param;
  std::unique_ptr<NBlockStatement> body;

  NCatchClause(std::unique_ptr<NName> param, std::unique_ptr<NBlockStatement> body)
      : Node(NodeKind::CatchClause), param(adoptRequired(std::move(param), "param")),
        body(adoptRequired(std::move(body), "body")) {}

  Node& scopeNode() noexcept override { return *this; }
  const Node& scopeNode() const noexcept override { return *this; }
  ~NCatchClause() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::CatchClause; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `[name]` or `[name] = [init]` inside a var declaration.
class NVariableDeclarator : public Node {
public:
  std::unique_ptr<NName> name;
  std::unique_ptr<NExpression> init;

  NVariableDeclarator(std::unique_ptr<NName> name, std::unique_ptr<NExpression> init = nullptr)
      : Node(NodeKind::VariableDeclarator), name(adoptRequired(std::move(name), "name")),
        init(adopt(std::move(init))) {}
  ~NVariableDeclarator() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::VariableDeclarator; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

enum class PropertyKind { Init, Get, Set };

[[nodiscard]] const char* propertyKindName(PropertyKind kind) noexcept;

/// `[key]: [value]`, `get [key] [value]` or `set [key] [value]`.
///
/// The key is an NName or an NLiteralExpression. For getters and setters the
/// value is an NFunction, otherwise it is an expression.
class NProperty : public Node {
public:
  std::unique_ptr<Node> key;
  std::unique_ptr<Node> value;
  PropertyKind kind;

  NProperty(std::unique_ptr<Node> key, std::unique_ptr<Node> value,
            PropertyKind kind = PropertyKind::Init);

  [[nodiscard]] bool isInit() const noexcept { return kind == PropertyKind::Init; }
  [[nodiscard]] bool isGetter() const noexcept { return kind == PropertyKind::Get; }
  [[nodiscard]] bool isSetter() const noexcept { return kind == PropertyKind::Set; }
  [[nodiscard]] bool isAccessor() const noexcept { return isGetter() || isSetter(); }

  /// The property name as a string, whether the key is a name or a literal.
  [[nodiscard]] std::string nameString() const;
  /// The value of a getter or setter.
  [[nodiscard]] NFunction& function() const;
  /// The value of an ordinary property.
  [[nodiscard]] NExpression& expression() const;

  ~NProperty() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::Property; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

// ============== Statements ==============

/// `;`
class NEmptyStatement : public NStatement {
public:
  NEmptyStatement() : NStatement(NodeKind::EmptyStatement) {}
  static bool classof(const Node* node) { return node->getKind() == NodeKind::EmptyStatement; }

protected:
  void forEachChild(ChildCallback) override {}
};

/// `[expression];`
class NExpressionStatement : public NStatement {
public:
  std::unique_ptr<NExpression> expression;
  explicit NExpressionStatement(std::unique_ptr<NExpression> expression)
      : NStatement(NodeKind::ExpressionStatement),
        expression(adoptRequired(std::move(expression), "expression")) {}
  ~NExpressionStatement() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::ExpressionStatement; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `if ([condition]) [then] else [otherwise]`
class NIfStatement : public NStatement {
public:
  std::unique_ptr<NExpression> condition;
  std::unique_ptr<NStatement> then;
  std::unique_ptr<NStatement> otherwise;  // may be null

  NIfStatement(std::unique_ptr<NExpression> condition, std::unique_ptr<NStatement> then,
               std::unique_ptr<NStatement> otherwise = nullptr)
      : NStatement(NodeKind::IfStatement),
        condition(adoptRequired(std::move(condition), "condition")),
        then(adoptRequired(std::move(then), "then")), otherwise(adopt(std::move(otherwise))) {}
  ~NIfStatement() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::IfStatement; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `[label]: [body]`
class NLabeledStatement : public NStatement {
public:
  std::unique_ptr<NName> label;
  std::unique_ptr<NStatement> body;

  NLabeledStatement(std::unique_ptr<NName> label, std::unique_ptr<NStatement> body)
      : NStatement(NodeKind::LabeledStatement), label(adoptRequired(std::move(label), "label")),
        body(adoptRequired(std::move(body), "body")) {}
  ~NLabeledStatement() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::LabeledStatement; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `break;` or `break [label];`
class NBreakStatement : public NStatement {
public:
  std::unique_ptr<NName> label;  // may be null
  explicit NBreakStatement(std::unique_ptr<NName> label = nullptr)
      : NStatement(NodeKind::BreakStatement), label(adopt(std::move(label))) {}
  ~NBreakStatement() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::BreakStatement; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `continue;` or `continue [label];`
class NContinueStatement : public NStatement {
public:
  std::unique_ptr<NName> label;  // may be null
  explicit NContinueStatement(std::unique_ptr<NName> label = nullptr)
      : NStatement(NodeKind::ContinueStatement), label(adopt(std::move(label))) {}
  ~NContinueStatement() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::ContinueStatement; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `with ([object]) [body]`
class NWithStatement : public NStatement {
public:
  std::unique_ptr<NExpression> object;
  std::unique_ptr<NStatement> body;

  NWithStatement(std::unique_ptr<NExpression> object, std::unique_ptr<NStatement> body)
      : NStatement(NodeKind::WithStatement), object(adoptRequired(std::move(object), "object")),
        body(adoptRequired(std::move(body), "body")) {}
  ~NWithStatement() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::WithStatement; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `switch ([argument]) { [cases] }`
class NSwitchStatement : public NStatement {
public:
  std::unique_ptr<NExpression> argument;
  std::vector<std::unique_ptr<NSwitchCase>> cases;

  NSwitchStatement(std::unique_ptr<NExpression> argument,
                   std::vector<std::unique_ptr<NSwitchCase>> cases)
      : NStatement(NodeKind::SwitchStatement),
        argument(adoptRequired(std::move(argument), "argument")),
        cases(adoptAll(std::move(cases))) {}
  ~NSwitchStatement() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::SwitchStatement; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `return [argument];` or `return;`
class NReturnStatement : public NStatement {
public:
  std::unique_ptr<NExpression> argument;  // may be null
  explicit NReturnStatement(std::unique_ptr<NExpression> argument = nullptr)
      : NStatement(NodeKind::ReturnStatement), argument(adopt(std::move(argument))) {}
  ~NReturnStatement() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::ReturnStatement; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `throw [argument];`
class NThrowStatement : public NStatement {
public:
  std::unique_ptr<NExpression> argument;
  explicit NThrowStatement(std::unique_ptr<NExpression> argument)
      : NStatement(NodeKind::ThrowStatement),
        argument(adoptRequired(std::move(argument), "argument")) {}
  ~NThrowStatement() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::ThrowStatement; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `try [block] catch [handler] finally [finalizer]`. At least one of handler
/// and finalizer is present.
class NTryStatement : public NStatement {
public:
  std::unique_ptr<NBlockStatement> block;
  std::unique_ptr<NCatchClause> handler;       // may be null
  std::unique_ptr<NBlockStatement> finalizer;  // may be null, but not together with handler

  NTryStatement(std::unique_ptr<NBlockStatement> block, std::unique_ptr<NCatchClause> handler,
                std::unique_ptr<NBlockStatement> finalizer);
  ~NTryStatement() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::TryStatement; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `while ([condition]) [body]`
class NWhileStatement : public NStatement {
public:
  std::unique_ptr<NExpression> condition;
  std::unique_ptr<NStatement> body;

  NWhileStatement(std::unique_ptr<NExpression> condition, std::unique_ptr<NStatement> body)
      : NStatement(NodeKind::WhileStatement),
        condition(adoptRequired(std::move(condition), "condition")),
        body(adoptRequired(std::move(body), "body")) {}
  ~NWhileStatement() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::WhileStatement; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `do [body] while ([condition]);`
class NDoWhileStatement : public NStatement {
public:
  std::unique_ptr<NStatement> body;
  std::unique_ptr<NExpression> condition;

  NDoWhileStatement(std::unique_ptr<NStatement> body, std::unique_ptr<NExpression> condition)
      : NStatement(NodeKind::DoWhileStatement), body(adoptRequired(std::move(body), "body")),
        condition(adoptRequired(std::move(condition), "condition")) {}
  ~NDoWhileStatement() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::DoWhileStatement; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `for ([init]; [condition]; [update]) [body]`
class NForStatement : public NStatement {
public:
  /// NVariableDeclaration, an expression, or null.
  std::unique_ptr<Node> init;
  std::unique_ptr<NExpression> condition;  // may be null
  std::unique_ptr<NExpression> update;     // may be null
  std::unique_ptr<NStatement> body;

  NForStatement(std::unique_ptr<Node> init, std::unique_ptr<NExpression> condition,
                std::unique_ptr<NExpression> update, std::unique_ptr<NStatement> body);
  ~NForStatement() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::ForStatement; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `for ([left] in [right]) [body]`
class NForInStatement : public NStatement {
public:
  /// NVariableDeclaration or an expression.
  std::unique_ptr<Node> left;
  std::unique_ptr<NExpression> right;
  std::unique_ptr<NStatement> body;

  NForInStatement(std::unique_ptr<Node> left, std::unique_ptr<NExpression> right,
                  std::unique_ptr<NStatement> body);
  ~NForInStatement() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::ForInStatement; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `function [name]([params]) { [body] }` in statement position.
class NFunctionDeclaration : public NStatement {
public:
  std::unique_ptr<NFunction> function;
  explicit NFunctionDeclaration(std::unique_ptr<NFunction> function)
      : NStatement(NodeKind::FunctionDeclaration),
        function(adoptRequired(std::move(function), "function")) {}
  ~NFunctionDeclaration() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::FunctionDeclaration; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `var [declarations];`
class NVariableDeclaration : public NStatement {
public:
  std::vector<std::unique_ptr<NVariableDeclarator>> declarations;
  explicit NVariableDeclaration(std::vector<std::unique_ptr<NVariableDeclarator>> declarations)
      : NStatement(NodeKind::VariableDeclaration),
        declarations(adoptAll(std::move(declarations))) {}
  ~NVariableDeclaration() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::VariableDeclaration; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `debugger;`
class NDebuggerStatement : public NStatement {
public:
  NDebuggerStatement() : NStatement(NodeKind::DebuggerStatement) {}
  static bool classof(const Node* node) { return node->getKind() == NodeKind::DebuggerStatement; }

protected:
  void forEachChild(ChildCallback) override {}
};

// ============== Expressions ==============

/// `this`
class NThisExpression : public NExpression {
public:
  NThisExpression() : NExpression(NodeKind::ThisExpression) {}
  static bool classof(const Node* node) { return node->getKind() == NodeKind::ThisExpression; }

protected:
  void forEachChild(ChildCallback) override {}
};

/// `[ [expressions] ]`. A null element is an elided slot, as in `[1,,3]`.
class NArrayExpression : public NExpression {
public:
  ExpressionList expressions;
  explicit NArrayExpression(ExpressionList expressions)
      : NExpression(NodeKind::ArrayExpression), expressions(adoptAll(std::move(expressions))) {}
  ~NArrayExpression() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::ArrayExpression; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `{ [properties] }`
class NObjectExpression : public NExpression {
public:
  std::vector<std::unique_ptr<NProperty>> properties;
  explicit NObjectExpression(std::vector<std::unique_ptr<NProperty>> properties)
      : NExpression(NodeKind::ObjectExpression), properties(adoptAll(std::move(properties))) {}
  ~NObjectExpression() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::ObjectExpression; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `function [name]([params]) { [body] }` in expression position.
class NFunctionExpression : public NExpression {
public:
  std::unique_ptr<NFunction> function;
  explicit NFunctionExpression(std::unique_ptr<NFunction> function)
      : NExpression(NodeKind::FunctionExpression),
        function(adoptRequired(std::move(function), "function")) {}
  ~NFunctionExpression() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::FunctionExpression; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `([params]) => [body]`. Always an expression.
class NArrowFunction : public NExpression, public NScope {
public:
  NameList params;
  std::unique_ptr<NStatement> body;

  NArrowFunction(NameList params, std::unique_ptr<NStatement> body)
      : NExpression(NodeKind::ArrowFunction), params(adoptAll(std::move(params))),
        body(adoptRequired(std::move(body), "body")) {}

  [[nodiscard]] bool isExpression() const noexcept { return true; }
  [[nodiscard]] bool isDeclaration() const noexcept { return false; }
  [[nodiscard]] bool isAccessor() const noexcept { return false; }

  Node& scopeNode() noexcept override { return *this; }
  const Node& scopeNode() const noexcept override { return *this; }
  ~NArrowFunction() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::ArrowFunction; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// Comma-separated expressions; the value is the last one.
class NSequenceExpression : public NExpression {
public:
  ExpressionList expressions;
  explicit NSequenceExpression(ExpressionList expressions)
      : NExpression(NodeKind::SequenceExpression), expressions(adoptAll(std::move(expressions))) {}
  ~NSequenceExpression() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::SequenceExpression; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `[op][argument]` for +, -, !, ~, typeof, void, delete.
class NUnaryExpression : public NExpression {
public:
  std::string op;
  std::unique_ptr<NExpression> argument;

  NUnaryExpression(std::string op, std::unique_ptr<NExpression> argument)
      : NExpression(NodeKind::UnaryExpression), op(std::move(op)),
        argument(adoptRequired(std::move(argument), "argument")) {}
  ~NUnaryExpression() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::UnaryExpression; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `[left] [op] [right]`
class NBinaryExpression : public NExpression {
public:
  std::unique_ptr<NExpression> left;
  std::string op;
  std::unique_ptr<NExpression> right;

  NBinaryExpression(std::unique_ptr<NExpression> left, std::string op,
                    std::unique_ptr<NExpression> right)
      : NExpression(NodeKind::BinaryExpression), left(adoptRequired(std::move(left), "left")),
        op(std::move(op)), right(adoptRequired(std::move(right), "right")) {}
  ~NBinaryExpression() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::BinaryExpression; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `[left] = [right]`, `[left] += [right]`, ...
class NAssignmentExpression : public NExpression {
public:
  std::unique_ptr<NExpression> left;
  std::string op;
  std::unique_ptr<NExpression> right;

  NAssignmentExpression(std::unique_ptr<NExpression> left, std::string op,
                        std::unique_ptr<NExpression> right)
      : NExpression(NodeKind::AssignmentExpression), left(adoptRequired(std::move(left), "left")),
        op(std::move(op)), right(adoptRequired(std::move(right), "right")) {}

  /// True for every operator but plain `=`.
  [[nodiscard]] bool isCompound() const noexcept { return op.size() > 1; }
  ~NAssignmentExpression() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::AssignmentExpression; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `++[argument]`, `--[argument]`, `[argument]++`, `[argument]--`
class NUpdateExpression : public NExpression {
public:
  std::string op;
  std::unique_ptr<NExpression> argument;
  bool isPrefix;

  NUpdateExpression(std::string op, std::unique_ptr<NExpression> argument, bool isPrefix)
      : NExpression(NodeKind::UpdateExpression), op(std::move(op)),
        argument(adoptRequired(std::move(argument), "argument")), isPrefix(isPrefix) {}
  static std::unique_ptr<NUpdateExpression> prefix(std::string op,
                                                   std::unique_ptr<NExpression> argument) {
    return std::make_unique<NUpdateExpression>(std::move(op), std::move(argument), true);
  }
  static std::unique_ptr<NUpdateExpression> postfix(std::string op,
                                                    std::unique_ptr<NExpression> argument) {
    return std::make_unique<NUpdateExpression>(std::move(op), std::move(argument), false);
  }
  ~NUpdateExpression() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::UpdateExpression; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `[condition] ? [then] : [otherwise]`
class NConditionalExpression : public NExpression {
public:
  std::unique_ptr<NExpression> condition;
  std::unique_ptr<NExpression> then;
  std::unique_ptr<NExpression> otherwise;

  NConditionalExpression(std::unique_ptr<NExpression> condition,
                         std::unique_ptr<NExpression> then,
                         std::unique_ptr<NExpression> otherwise)
      : NExpression(NodeKind::ConditionalExpression),
        condition(adoptRequired(std::move(condition), "condition")),
        then(adoptRequired(std::move(then), "then")),
        otherwise(adoptRequired(std::move(otherwise), "otherwise")) {}
  ~NConditionalExpression() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::ConditionalExpression; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `[callee]([arguments])` or `new [callee]([arguments])`
class NCallExpression : public NExpression {
public:
  std::unique_ptr<NExpression> callee;
  ExpressionList arguments;
  bool isNew;

  NCallExpression(std::unique_ptr<NExpression> callee, ExpressionList arguments,
                  bool isNew = false)
      : NExpression(NodeKind::CallExpression), callee(adoptRequired(std::move(callee), "callee")),
        arguments(adoptAll(std::move(arguments))), isNew(isNew) {}
  static std::unique_ptr<NCallExpression> newCall(std::unique_ptr<NExpression> callee,
                                                  ExpressionList arguments) {
    return std::make_unique<NCallExpression>(std::move(callee), std::move(arguments), true);
  }
  ~NCallExpression() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::CallExpression; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `[object].[property]`
class NMemberExpression : public NExpression {
public:
  std::unique_ptr<NExpression> object;
  std::unique_ptr<NName> property;

  NMemberExpression(std::unique_ptr<NExpression> object, std::unique_ptr<NName> property)
      : NExpression(NodeKind::MemberExpression), object(adoptRequired(std::move(object), "object")),
        property(adoptRequired(std::move(property), "property")) {}
  ~NMemberExpression() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::MemberExpression; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// `[object][[property]]`
class NIndexExpression : public NExpression {
public:
  std::unique_ptr<NExpression> object;
  std::unique_ptr<NExpression> property;

  NIndexExpression(std::unique_ptr<NExpression> object, std::unique_ptr<NExpression> property)
      : NExpression(NodeKind::IndexExpression), object(adoptRequired(std::move(object), "object")),
        property(adoptRequired(std::move(property), "property")) {}
  ~NIndexExpression() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::IndexExpression; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

/// An NName used as an expression. `undefined`, `NaN` and `Infinity` are name
/// expressions, not literals.
class NNameExpression : public NExpression {
public:
  std::unique_ptr<NName> name;
  explicit NNameExpression(std::unique_ptr<NName> name)
      : NExpression(NodeKind::NameExpression), name(adoptRequired(std::move(name), "name")) {}
  ~NNameExpression() noexcept override { releaseTree(); }
  static bool classof(const Node* node) { return node->getKind() == NodeKind::NameExpression; }

protected:
  void forEachChild(ChildCallback callback) override;
  void releaseChildren(ReleasedChildren& released) override;
};

using LiteralValue = std::variant<std::nullptr_t, bool, double, std::string>;

/// A string, number, boolean or null literal.
class NLiteralExpression : public NExpression {
public:
  LiteralValue value;
  /// Verbatim source text of the literal.
  std::string raw;

  explicit NLiteralExpression(LiteralValue value, std::string raw = "")
      : NExpression(NodeKind::LiteralExpression), value(std::move(value)), raw(std::move(raw)) {}

  [[nodiscard]] bool isString() const noexcept { return std::holds_alternative<std::string>(value); }
  [[nodiscard]] bool isNumber() const noexcept { return std::holds_alternative<double>(value); }
  [[nodiscard]] bool isBool() const noexcept { return std::holds_alternative<bool>(value); }
  [[nodiscard]] bool isNull() const noexcept { return std::holds_alternative<std::nullptr_t>(value); }

  [[nodiscard]] const std::string& stringValue() const;
  [[nodiscard]] double numberValue() const;
  [[nodiscard]] bool boolValue() const;

  /// The value converted to a string the way JavaScript does it.
  [[nodiscard]] std::string toName() const;

  static bool classof(const Node* node) { return node->getKind() == NodeKind::LiteralExpression; }

protected:
  void forEachChild(ChildCallback) override {}
};

/// A regular expression literal.
class NRegexpExpression : public NExpression {
public:
  /// The entire literal, including slashes and flags.
  std::string regexp;
  explicit NRegexpExpression(std::string regexp)
      : NExpression(NodeKind::RegexpExpression), regexp(std::move(regexp)) {}
  static bool classof(const Node* node) { return node->getKind() == NodeKind::RegexpExpression; }

protected:
  void forEachChild(ChildCallback) override {}
};
// clang-format on

} // namespace jsast

#endif // JSAST_NODE_HPP
