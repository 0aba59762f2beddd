#ifndef JSAST_OPERATOR_UTILS_HPP
#define JSAST_OPERATOR_UTILS_HPP

#include <string>

namespace jsast {

/// Categories of binary operators.
enum class OperatorCategory {
  Arithmetic, ///< +, -, *, /, %
  Comparison, ///< ==, !=, ===, !==, <, <=, >, >=
  Bitwise,    ///< <<, >>, >>>, |, ^, &
  Logical,    ///< &&, ||
  Relational, ///< in, instanceof
  Unknown     ///< Unrecognized operator
};

/// Get the category of a binary operator.
/// @param op The operator symbol as stored in NBinaryExpression::op
/// @return The category of the operator
[[nodiscard]] OperatorCategory getOperatorCategory(const std::string& op) noexcept;

/// Check for a unary operator: +, -, !, ~, typeof, void, delete
[[nodiscard]] bool isUnaryOperator(const std::string& op) noexcept;

/// Check for a binary operator of any category.
[[nodiscard]] bool isBinaryOperator(const std::string& op) noexcept;

/// Check for = or one of the compound assignment operators.
[[nodiscard]] bool isAssignmentOperator(const std::string& op);

/// Check for ++ or --.
[[nodiscard]] bool isUpdateOperator(const std::string& op) noexcept;

/// The binary operator a compound assignment applies, e.g. "+" for "+=".
/// @return An empty string for plain "=" and for unknown operators
[[nodiscard]] std::string compoundToBinary(const std::string& op);

} // namespace jsast

#endif // JSAST_OPERATOR_UTILS_HPP
