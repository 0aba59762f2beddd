#ifndef JSAST_ERROR_REPORTER_HPP
#define JSAST_ERROR_REPORTER_HPP

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace jsast {

class Node;

/// Severity level for AST diagnostics.
enum class ErrorSeverity { Warning, Error, Fatal };

/// Represents a single diagnostic with location information.
struct ASTError {
  ErrorSeverity severity;
  std::string message;
  std::string filename;
  int line;
  int column;

  ASTError(ErrorSeverity sev, std::string msg, int l = 0, int c = 0)
      : severity(sev), message(std::move(msg)), line(l), column(c) {}

  /// Format the error as a human-readable string.
  [[nodiscard]] std::string format() const;
};

/// Collects diagnostics produced by passes over the AST.
class ErrorReporter {
public:
  using ErrorCallback = std::function<void(const ASTError&)>;

  ErrorReporter() = default;

  /// Report an error with the given severity, message, and optional location.
  void report(ErrorSeverity severity, const std::string& message, int line = 0,
              int column = 0);
  /// Report an error located at `node`. The filename and line come from the
  /// node's enclosing program; an orphan falls back to the current filename.
  void report(ErrorSeverity severity, const std::string& message,
              const Node& node);

  void warning(const std::string& message, int line = 0, int column = 0);
  void error(const std::string& message, int line = 0, int column = 0);
  void fatal(const std::string& message, int line = 0, int column = 0);
  void warning(const std::string& message, const Node& node);
  void error(const std::string& message, const Node& node);

  /// Set a callback to be invoked for each error reported.
  void setCallback(ErrorCallback cb);

  /// Set the filename used for errors that carry no node.
  void setFilename(const std::string& filename);

  [[nodiscard]] const std::vector<ASTError>& errors() const {
    return errorList;
  }

  [[nodiscard]] bool hasErrors() const;
  [[nodiscard]] bool hasWarnings() const;

  void clear();

private:
  void record(ASTError err);

  std::vector<ASTError> errorList;
  ErrorCallback errorCallback;
  std::string currentFilename;
};

/// Aborts on a programming error: a node used in a role its variant does not
/// support, or a node constructed without a required child. Prints the message
/// through LLVM's fatal error handler and never returns.
[[noreturn]] void reportMisuse(const std::string& message);

/// @param kind The node class, e.g. "NProperty"
/// @param role The field or role that was accessed
/// @param expected What the role requires
/// @param actual What was found instead
[[nodiscard]] inline std::string formatRoleMismatch(const std::string& kind,
                                                    const std::string& role,
                                                    const std::string& expected,
                                                    const std::string& actual) {
  return kind + " " + role + " must be " + expected + ", got " + actual;
}

[[nodiscard]] inline std::string formatMissingChild(const std::string& kind,
                                                    const std::string& role) {
  return kind + " is missing its " + role;
}

/// @param child The node class of the misplaced child
/// @param owner The node class enumerating the child
/// @param linked The node class the child's parent link points to, or "null"
[[nodiscard]] inline std::string
formatParentMismatch(const std::string& child, const std::string& owner,
                     const std::string& linked) {
  return child + " is a child of " + owner + " but its parent link points to " +
         linked;
}

} // namespace jsast

#endif // JSAST_ERROR_REPORTER_HPP
