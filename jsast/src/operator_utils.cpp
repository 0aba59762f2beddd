#include "jsast/operator_utils.hpp"

#include <llvm/ADT/StringSwitch.h>

namespace jsast {

OperatorCategory getOperatorCategory(const std::string& op) noexcept {
  return llvm::StringSwitch<OperatorCategory>(op)
      .Cases("+", "-", "*", "/", "%", OperatorCategory::Arithmetic)
      .Cases("==", "!=", "===", "!==", OperatorCategory::Comparison)
      .Cases("<", "<=", ">", ">=", OperatorCategory::Comparison)
      .Cases("<<", ">>", ">>>", OperatorCategory::Bitwise)
      .Cases("|", "^", "&", OperatorCategory::Bitwise)
      .Cases("&&", "||", OperatorCategory::Logical)
      .Cases("in", "instanceof", OperatorCategory::Relational)
      .Default(OperatorCategory::Unknown);
}

bool isUnaryOperator(const std::string& op) noexcept {
  return llvm::StringSwitch<bool>(op)
      .Cases("+", "-", "!", "~", true)
      .Cases("typeof", "void", "delete", true)
      .Default(false);
}

bool isBinaryOperator(const std::string& op) noexcept {
  return getOperatorCategory(op) != OperatorCategory::Unknown;
}

bool isAssignmentOperator(const std::string& op) {
  if (op == "=") {
    return true;
  }
  const std::string binary = compoundToBinary(op);
  return !binary.empty();
}

bool isUpdateOperator(const std::string& op) noexcept {
  return op == "++" || op == "--";
}

std::string compoundToBinary(const std::string& op) {
  if (op.size() < 2 || op.back() != '=') {
    return "";
  }
  const std::string binary = op.substr(0, op.size() - 1);
  const OperatorCategory category = getOperatorCategory(binary);
  // Comparisons, logical and relational operators have no compound form.
  if (category == OperatorCategory::Arithmetic ||
      category == OperatorCategory::Bitwise) {
    return binary;
  }
  return "";
}

} // namespace jsast
