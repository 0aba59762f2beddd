#include "jsast/node.hpp"
#include "jsast/error_reporter.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

using llvm::dyn_cast;
using llvm::isa;

namespace jsast {

const char* kindName(NodeKind kind) noexcept {
  switch (kind) {
  case NodeKind::Programs:
    return "NPrograms";
  case NodeKind::Program:
    return "NProgram";
  case NodeKind::Function:
    return "NFunction";
  case NodeKind::Name:
    return "NName";
  case NodeKind::SwitchCase:
    return "NSwitchCase";
  case NodeKind::CatchClause:
    return "NCatchClause";
  case NodeKind::VariableDeclarator:
    return "NVariableDeclarator";
  case NodeKind::Property:
    return "NProperty";
  case NodeKind::EmptyStatement:
    return "NEmptyStatement";
  case NodeKind::BlockStatement:
    return "NBlockStatement";
  case NodeKind::ExpressionStatement:
    return "NExpressionStatement";
  case NodeKind::IfStatement:
    return "NIfStatement";
  case NodeKind::LabeledStatement:
    return "NLabeledStatement";
  case NodeKind::BreakStatement:
    return "NBreakStatement";
  case NodeKind::ContinueStatement:
    return "NContinueStatement";
  case NodeKind::WithStatement:
    return "NWithStatement";
  case NodeKind::SwitchStatement:
    return "NSwitchStatement";
  case NodeKind::ReturnStatement:
    return "NReturnStatement";
  case NodeKind::ThrowStatement:
    return "NThrowStatement";
  case NodeKind::TryStatement:
    return "NTryStatement";
  case NodeKind::WhileStatement:
    return "NWhileStatement";
  case NodeKind::DoWhileStatement:
    return "NDoWhileStatement";
  case NodeKind::ForStatement:
    return "NForStatement";
  case NodeKind::ForInStatement:
    return "NForInStatement";
  case NodeKind::FunctionDeclaration:
    return "NFunctionDeclaration";
  case NodeKind::VariableDeclaration:
    return "NVariableDeclaration";
  case NodeKind::DebuggerStatement:
    return "NDebuggerStatement";
  case NodeKind::ThisExpression:
    return "NThisExpression";
  case NodeKind::ArrayExpression:
    return "NArrayExpression";
  case NodeKind::ObjectExpression:
    return "NObjectExpression";
  case NodeKind::FunctionExpression:
    return "NFunctionExpression";
  case NodeKind::ArrowFunction:
    return "NArrowFunction";
  case NodeKind::SequenceExpression:
    return "NSequenceExpression";
  case NodeKind::UnaryExpression:
    return "NUnaryExpression";
  case NodeKind::BinaryExpression:
    return "NBinaryExpression";
  case NodeKind::AssignmentExpression:
    return "NAssignmentExpression";
  case NodeKind::UpdateExpression:
    return "NUpdateExpression";
  case NodeKind::ConditionalExpression:
    return "NConditionalExpression";
  case NodeKind::CallExpression:
    return "NCallExpression";
  case NodeKind::MemberExpression:
    return "NMemberExpression";
  case NodeKind::IndexExpression:
    return "NIndexExpression";
  case NodeKind::NameExpression:
    return "NNameExpression";
  case NodeKind::LiteralExpression:
    return "NLiteralExpression";
  case NodeKind::RegexpExpression:
    return "NRegexpExpression";
  }
  return "?";
}

const char* propertyKindName(PropertyKind kind) noexcept {
  switch (kind) {
  case PropertyKind::Init:
    return "init";
  case PropertyKind::Get:
    return "get";
  case PropertyKind::Set:
    return "set";
  }
  return "?";
}

// ============== Node ==============

void Node::requireChild(const Node* child, const char* role) const {
  if (child == nullptr) {
    reportMisuse(formatMissingChild(kindName(), role));
  }
}

void Node::forEach(ConstChildCallback callback) const {
  // forEachChild does not modify the node; it only hands out references.
  const_cast<Node*>(this)->forEachChild(
      [&callback](Node& child) { callback(child); });
}

NScope* Node::asScope() noexcept {
  switch (kind) {
  case NodeKind::Program:
    return static_cast<NProgram*>(this);
  case NodeKind::Function:
    return static_cast<NFunction*>(this);
  case NodeKind::ArrowFunction:
    return static_cast<NArrowFunction*>(this);
  case NodeKind::CatchClause:
    return static_cast<NCatchClause*>(this);
  default:
    return nullptr;
  }
}

const NScope* Node::asScope() const noexcept {
  return const_cast<Node*>(this)->asScope();
}

NProgram* Node::enclosingProgram() noexcept {
  for (Node* node = this; node != nullptr; node = node->parent) {
    if (auto* program = dyn_cast<NProgram>(node)) {
      return program;
    }
  }
  return nullptr;
}

const NProgram* Node::enclosingProgram() const noexcept {
  return const_cast<Node*>(this)->enclosingProgram();
}

NFunction* Node::enclosingFunction() noexcept {
  for (Node* node = this; node != nullptr; node = node->parent) {
    if (auto* function = dyn_cast<NFunction>(node)) {
      return function;
    }
  }
  return nullptr;
}

const NFunction* Node::enclosingFunction() const noexcept {
  return const_cast<Node*>(this)->enclosingFunction();
}

NScope* Node::enclosingScope() noexcept {
  for (Node* node = this; node != nullptr; node = node->parent) {
    if (NScope* scope = node->asScope()) {
      return scope;
    }
  }
  return nullptr;
}

std::optional<std::string> Node::filename() const {
  const NProgram* program = enclosingProgram();
  if (program == nullptr) {
    return std::nullopt;
  }
  return program->filename;
}

std::string Node::location() const {
  const auto file = filename();
  return (file ? *file : std::string("<unknown>")) + ":" +
         (line ? std::to_string(*line) : std::string("?"));
}

// ============== Children ==============

void NPrograms::forEachChild(ChildCallback callback) {
  for (auto& program : programs) {
    callback(*program);
  }
}

void NProgram::forEachChild(ChildCallback callback) {
  for (auto& stmt : body) {
    callback(*stmt);
  }
}

void NFunction::forEachChild(ChildCallback callback) {
  if (name != nullptr) {
    callback(*name);
  }
  for (auto& param : params) {
    callback(*param);
  }
  callback(*body);
}

void NSwitchCase::forEachChild(ChildCallback callback) {
  if (expression != nullptr) {
    callback(*expression);
  }
  for (auto& stmt : body) {
    callback(*stmt);
  }
}

void NCatchClause::forEachChild(ChildCallback callback) {
  callback(*param);
  callback(*body);
}

void NVariableDeclarator::forEachChild(ChildCallback callback) {
  callback(*name);
  if (init != nullptr) {
    callback(*init);
  }
}

void NProperty::forEachChild(ChildCallback callback) {
  callback(*key);
  callback(*value);
}

void NBlockStatement::forEachChild(ChildCallback callback) {
  for (auto& stmt : body) {
    callback(*stmt);
  }
}

void NExpressionStatement::forEachChild(ChildCallback callback) {
  callback(*expression);
}

void NIfStatement::forEachChild(ChildCallback callback) {
  callback(*condition);
  callback(*then);
  if (otherwise != nullptr) {
    callback(*otherwise);
  }
}

void NLabeledStatement::forEachChild(ChildCallback callback) {
  callback(*label);
  callback(*body);
}

void NBreakStatement::forEachChild(ChildCallback callback) {
  if (label != nullptr) {
    callback(*label);
  }
}

void NContinueStatement::forEachChild(ChildCallback callback) {
  if (label != nullptr) {
    callback(*label);
  }
}

void NWithStatement::forEachChild(ChildCallback callback) {
  callback(*object);
  callback(*body);
}

void NSwitchStatement::forEachChild(ChildCallback callback) {
  callback(*argument);
  for (auto& switchCase : cases) {
    callback(*switchCase);
  }
}

void NReturnStatement::forEachChild(ChildCallback callback) {
  if (argument != nullptr) {
    callback(*argument);
  }
}

void NThrowStatement::forEachChild(ChildCallback callback) {
  callback(*argument);
}

void NTryStatement::forEachChild(ChildCallback callback) {
  callback(*block);
  if (handler != nullptr) {
    callback(*handler);
  }
  if (finalizer != nullptr) {
    callback(*finalizer);
  }
}

void NWhileStatement::forEachChild(ChildCallback callback) {
  callback(*condition);
  callback(*body);
}

void NDoWhileStatement::forEachChild(ChildCallback callback) {
  callback(*body);
  callback(*condition);
}

void NForStatement::forEachChild(ChildCallback callback) {
  if (init != nullptr) {
    callback(*init);
  }
  if (condition != nullptr) {
    callback(*condition);
  }
  if (update != nullptr) {
    callback(*update);
  }
  callback(*body);
}

void NForInStatement::forEachChild(ChildCallback callback) {
  callback(*left);
  callback(*right);
  callback(*body);
}

void NFunctionDeclaration::forEachChild(ChildCallback callback) {
  callback(*function);
}

void NVariableDeclaration::forEachChild(ChildCallback callback) {
  for (auto& declarator : declarations) {
    callback(*declarator);
  }
}

void NArrayExpression::forEachChild(ChildCallback callback) {
  for (auto& element : expressions) {
    if (element != nullptr) {
      callback(*element);
    }
  }
}

void NObjectExpression::forEachChild(ChildCallback callback) {
  for (auto& property : properties) {
    callback(*property);
  }
}

void NFunctionExpression::forEachChild(ChildCallback callback) {
  callback(*function);
}

void NArrowFunction::forEachChild(ChildCallback callback) {
  for (auto& param : params) {
    callback(*param);
  }
  callback(*body);
}

void NSequenceExpression::forEachChild(ChildCallback callback) {
  for (auto& expr : expressions) {
    callback(*expr);
  }
}

void NUnaryExpression::forEachChild(ChildCallback callback) {
  callback(*argument);
}

void NBinaryExpression::forEachChild(ChildCallback callback) {
  callback(*left);
  callback(*right);
}

void NAssignmentExpression::forEachChild(ChildCallback callback) {
  callback(*left);
  callback(*right);
}

void NUpdateExpression::forEachChild(ChildCallback callback) {
  callback(*argument);
}

void NConditionalExpression::forEachChild(ChildCallback callback) {
  callback(*condition);
  callback(*then);
  callback(*otherwise);
}

void NCallExpression::forEachChild(ChildCallback callback) {
  callback(*callee);
  for (auto& arg : arguments) {
    callback(*arg);
  }
}

void NMemberExpression::forEachChild(ChildCallback callback) {
  callback(*object);
  callback(*property);
}

void NIndexExpression::forEachChild(ChildCallback callback) {
  callback(*object);
  callback(*property);
}

void NNameExpression::forEachChild(ChildCallback callback) {
  callback(*name);
}

// ============== Teardown ==============

void Node::releaseTree() noexcept {
  ReleasedChildren pending;
  releaseChildren(pending);
  while (!pending.empty()) {
    std::unique_ptr<Node> node = std::move(pending.back());
    pending.pop_back();
    // Emptied before it is freed, so its own destructor has nothing to recurse into.
    node->releaseChildren(pending);
  }
}

void NPrograms::releaseChildren(ReleasedChildren& released) {
  releaseAll(programs, released);
}

void NProgram::releaseChildren(ReleasedChildren& released) {
  releaseAll(body, released);
}

void NFunction::releaseChildren(ReleasedChildren& released) {
  release(name, released);
  releaseAll(params, released);
  release(body, released);
}

void NSwitchCase::releaseChildren(ReleasedChildren& released) {
  release(expression, released);
  releaseAll(body, released);
}

void NCatchClause::releaseChildren(ReleasedChildren& released) {
  release(param, released);
  release(body, released);
}

void NVariableDeclarator::releaseChildren(ReleasedChildren& released) {
  release(name, released);
  release(init, released);
}

void NProperty::releaseChildren(ReleasedChildren& released) {
  release(key, released);
  release(value, released);
}

void NBlockStatement::releaseChildren(ReleasedChildren& released) {
  releaseAll(body, released);
}

void NExpressionStatement::releaseChildren(ReleasedChildren& released) {
  release(expression, released);
}

void NIfStatement::releaseChildren(ReleasedChildren& released) {
  release(condition, released);
  release(then, released);
  release(otherwise, released);
}

void NLabeledStatement::releaseChildren(ReleasedChildren& released) {
  release(label, released);
  release(body, released);
}

void NBreakStatement::releaseChildren(ReleasedChildren& released) {
  release(label, released);
}

void NContinueStatement::releaseChildren(ReleasedChildren& released) {
  release(label, released);
}

void NWithStatement::releaseChildren(ReleasedChildren& released) {
  release(object, released);
  release(body, released);
}

void NSwitchStatement::releaseChildren(ReleasedChildren& released) {
  release(argument, released);
  releaseAll(cases, released);
}

void NReturnStatement::releaseChildren(ReleasedChildren& released) {
  release(argument, released);
}

void NThrowStatement::releaseChildren(ReleasedChildren& released) {
  release(argument, released);
}

void NTryStatement::releaseChildren(ReleasedChildren& released) {
  release(block, released);
  release(handler, released);
  release(finalizer, released);
}

void NWhileStatement::releaseChildren(ReleasedChildren& released) {
  release(condition, released);
  release(body, released);
}

void NDoWhileStatement::releaseChildren(ReleasedChildren& released) {
  release(body, released);
  release(condition, released);
}

void NForStatement::releaseChildren(ReleasedChildren& released) {
  release(init, released);
  release(condition, released);
  release(update, released);
  release(body, released);
}

void NForInStatement::releaseChildren(ReleasedChildren& released) {
  release(left, released);
  release(right, released);
  release(body, released);
}

void NFunctionDeclaration::releaseChildren(ReleasedChildren& released) {
  release(function, released);
}

void NVariableDeclaration::releaseChildren(ReleasedChildren& released) {
  releaseAll(declarations, released);
}

void NArrayExpression::releaseChildren(ReleasedChildren& released) {
  releaseAll(expressions, released);
}

void NObjectExpression::releaseChildren(ReleasedChildren& released) {
  releaseAll(properties, released);
}

void NFunctionExpression::releaseChildren(ReleasedChildren& released) {
  release(function, released);
}

void NArrowFunction::releaseChildren(ReleasedChildren& released) {
  releaseAll(params, released);
  release(body, released);
}

void NSequenceExpression::releaseChildren(ReleasedChildren& released) {
  releaseAll(expressions, released);
}

void NUnaryExpression::releaseChildren(ReleasedChildren& released) {
  release(argument, released);
}

void NBinaryExpression::releaseChildren(ReleasedChildren& released) {
  release(left, released);
  release(right, released);
}

void NAssignmentExpression::releaseChildren(ReleasedChildren& released) {
  release(left, released);
  release(right, released);
}

void NUpdateExpression::releaseChildren(ReleasedChildren& released) {
  release(argument, released);
}

void NConditionalExpression::releaseChildren(ReleasedChildren& released) {
  release(condition, released);
  release(then, released);
  release(otherwise, released);
}

void NCallExpression::releaseChildren(ReleasedChildren& released) {
  release(callee, released);
  releaseAll(arguments, released);
}

void NMemberExpression::releaseChildren(ReleasedChildren& released) {
  release(object, released);
  release(property, released);
}

void NIndexExpression::releaseChildren(ReleasedChildren& released) {
  release(object, released);
  release(property, released);
}

void NNameExpression::releaseChildren(ReleasedChildren& released) {
  release(name, released);
}

// ============== Role queries ==============

bool NName::isVariable() const noexcept {
  return parent != nullptr &&
         (isa<NNameExpression>(parent) || isa<NFunction>(parent) ||
          isa<NArrowFunction>(parent) || isa<NVariableDeclarator>(parent) ||
          isa<NCatchClause>(parent));
}

bool NName::isProperty() const noexcept {
  if (parent == nullptr) {
    return false;
  }
  if (const auto* member = dyn_cast<NMemberExpression>(parent)) {
    return member->property.get() == this;
  }
  if (const auto* property = dyn_cast<NProperty>(parent)) {
    return property->key.get() == this;
  }
  return false;
}

bool NName::isLabel() const noexcept {
  return parent != nullptr &&
         (isa<NBreakStatement>(parent) || isa<NContinueStatement>(parent) ||
          isa<NLabeledStatement>(parent));
}

NScope* NName::declaringScope() noexcept {
  // Labels and property names do not live in any scope.
  if (!isVariable()) {
    return nullptr;
  }
  if (scope != nullptr) {
    return scope;
  }
  return enclosingProgram();
}

bool NFunction::isExpression() const noexcept {
  return parent != nullptr && isa<NFunctionExpression>(parent);
}

bool NFunction::isDeclaration() const noexcept {
  return parent != nullptr && isa<NFunctionDeclaration>(parent);
}

bool NFunction::isAccessor() const noexcept {
  if (parent == nullptr) {
    return false;
  }
  const auto* property = dyn_cast<NProperty>(parent);
  return property != nullptr && property->isAccessor();
}

// ============== Checked constructors ==============

NProperty::NProperty(std::unique_ptr<Node> key, std::unique_ptr<Node> value,
                     PropertyKind kind)
    : Node(NodeKind::Property), key(adoptRequired(std::move(key), "key")),
      value(adoptRequired(std::move(value), "value")), kind(kind) {
  if (!isa<NName>(this->key.get()) &&
      !isa<NLiteralExpression>(this->key.get())) {
    reportMisuse(formatRoleMismatch(kindName(), "key", "NName or NLiteralExpression",
                                    this->key->kindName()));
  }
  if (isAccessor() && !isa<NFunction>(this->value.get())) {
    reportMisuse(formatRoleMismatch(kindName(), "accessor value", "NFunction",
                                    this->value->kindName()));
  }
  if (!isAccessor() && !isa<NExpression>(this->value.get())) {
    reportMisuse(formatRoleMismatch(kindName(), "value", "an expression",
                                    this->value->kindName()));
  }
}

std::string NProperty::nameString() const {
  if (const auto* name = dyn_cast<NName>(key.get())) {
    return name->value;
  }
  return llvm::cast<NLiteralExpression>(key.get())->toName();
}

NFunction& NProperty::function() const {
  auto* function = dyn_cast<NFunction>(value.get());
  if (function == nullptr) {
    reportMisuse(formatRoleMismatch(kindName(), "value", "NFunction",
                                    value->kindName()));
  }
  return *function;
}

NExpression& NProperty::expression() const {
  auto* expr = dyn_cast<NExpression>(value.get());
  if (expr == nullptr) {
    reportMisuse(formatRoleMismatch(kindName(), "value", "an expression",
                                    value->kindName()));
  }
  return *expr;
}

NTryStatement::NTryStatement(std::unique_ptr<NBlockStatement> block,
                             std::unique_ptr<NCatchClause> handler,
                             std::unique_ptr<NBlockStatement> finalizer)
    : NStatement(NodeKind::TryStatement),
      block(adoptRequired(std::move(block), "block")),
      handler(adopt(std::move(handler))),
      finalizer(adopt(std::move(finalizer))) {
  if (this->handler == nullptr && this->finalizer == nullptr) {
    reportMisuse(formatMissingChild(kindName(), "handler or finalizer"));
  }
}

static bool isForHead(const Node* node) {
  return isa<NVariableDeclaration>(node) || isa<NExpression>(node);
}

NForStatement::NForStatement(std::unique_ptr<Node> init,
                             std::unique_ptr<NExpression> condition,
                             std::unique_ptr<NExpression> update,
                             std::unique_ptr<NStatement> body)
    : NStatement(NodeKind::ForStatement), init(adopt(std::move(init))),
      condition(adopt(std::move(condition))), update(adopt(std::move(update))),
      body(adoptRequired(std::move(body), "body")) {
  if (this->init != nullptr && !isForHead(this->init.get())) {
    reportMisuse(formatRoleMismatch(kindName(), "init",
                                    "NVariableDeclaration or an expression",
                                    this->init->kindName()));
  }
}

NForInStatement::NForInStatement(std::unique_ptr<Node> left,
                                 std::unique_ptr<NExpression> right,
                                 std::unique_ptr<NStatement> body)
    : NStatement(NodeKind::ForInStatement),
      left(adoptRequired(std::move(left), "left")),
      right(adoptRequired(std::move(right), "right")),
      body(adoptRequired(std::move(body), "body")) {
  if (!isForHead(this->left.get())) {
    reportMisuse(formatRoleMismatch(kindName(), "left",
                                    "NVariableDeclaration or an expression",
                                    this->left->kindName()));
  }
}

// ============== Literals ==============

const std::string& NLiteralExpression::stringValue() const {
  const auto* str = std::get_if<std::string>(&value);
  if (str == nullptr) {
    reportMisuse(formatRoleMismatch(kindName(), "value", "a string", toName()));
  }
  return *str;
}

double NLiteralExpression::numberValue() const {
  const auto* number = std::get_if<double>(&value);
  if (number == nullptr) {
    reportMisuse(formatRoleMismatch(kindName(), "value", "a number", toName()));
  }
  return *number;
}

bool NLiteralExpression::boolValue() const {
  const auto* boolean = std::get_if<bool>(&value);
  if (boolean == nullptr) {
    reportMisuse(formatRoleMismatch(kindName(), "value", "a boolean", toName()));
  }
  return *boolean;
}

static std::string numberToString(double number) {
  if (std::isnan(number)) {
    return "NaN";
  }
  if (std::isinf(number)) {
    return number > 0 ? "Infinity" : "-Infinity";
  }
  // -0 prints as "0"
  if (number == 0) {
    return "0";
  }
  if (number < 0) {
    return "-" + numberToString(-number);
  }

  // Shortest digit string that reads back as the same double, and its decimal
  // exponent: number == 0.<digits> * 10^pointPos.
  char buffer[64];
  for (int precision = 0; precision <= 16; ++precision) {
    std::snprintf(buffer, sizeof(buffer), "%.*e", precision, number);
    if (std::strtod(buffer, nullptr) == number) {
      break;
    }
  }
  const std::string scientific(buffer);
  const size_t expPos = scientific.find('e');
  std::string digits;
  for (size_t i = 0; i < expPos; ++i) {
    if (scientific[i] != '.') {
      digits += scientific[i];
    }
  }
  while (digits.size() > 1 && digits.back() == '0') {
    digits.pop_back();
  }
  const int exponent = std::atoi(scientific.c_str() + expPos + 1);
  const int digitCount = static_cast<int>(digits.size());
  const int pointPos = exponent + 1;

  if (digitCount <= pointPos && pointPos <= 21) {
    return digits + std::string(static_cast<size_t>(pointPos - digitCount), '0');
  }
  if (0 < pointPos && pointPos <= 21) {
    return digits.substr(0, static_cast<size_t>(pointPos)) + "." +
           digits.substr(static_cast<size_t>(pointPos));
  }
  if (-6 < pointPos && pointPos <= 0) {
    return "0." + std::string(static_cast<size_t>(-pointPos), '0') + digits;
  }
  std::string result = digits.substr(0, 1);
  if (digitCount > 1) {
    result += "." + digits.substr(1);
  }
  return result + "e" + (exponent < 0 ? "-" : "+") + std::to_string(std::abs(exponent));
}

std::string NLiteralExpression::toName() const {
  if (isNull()) {
    return "null";
  }
  if (const auto* boolean = std::get_if<bool>(&value)) {
    return *boolean ? "true" : "false";
  }
  if (const auto* number = std::get_if<double>(&value)) {
    return numberToString(*number);
  }
  return std::get<std::string>(value);
}

} // namespace jsast
