#include "jsast/error_reporter.hpp"
#include "jsast/node.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>

#include <llvm/ADT/Twine.h>
#include <llvm/Support/ErrorHandling.h>

namespace jsast {

std::string ASTError::format() const {
  std::ostringstream oss;

  switch (severity) {
  case ErrorSeverity::Warning:
    oss << "warning: ";
    break;
  case ErrorSeverity::Error:
    oss << "error: ";
    break;
  case ErrorSeverity::Fatal:
    oss << "fatal error: ";
    break;
  }

  if (!filename.empty()) {
    oss << filename << ": ";
  }

  oss << message;

  if (line > 0) {
    oss << " at line " << line;
    if (column > 0) {
      oss << ", column " << column;
    }
  }

  return oss.str();
}

void ErrorReporter::report(ErrorSeverity severity, const std::string& message,
                           int line, int column) {
  ASTError err(severity, message, line, column);
  err.filename = currentFilename;
  record(std::move(err));
}

void ErrorReporter::report(ErrorSeverity severity, const std::string& message,
                           const Node& node) {
  ASTError err(severity, message, node.line.value_or(0));
  err.filename = node.filename().value_or(currentFilename);
  record(std::move(err));
}

void ErrorReporter::record(ASTError err) {
  errorList.push_back(err);

  if (errorCallback) {
    errorCallback(err);
  }

  std::fprintf(stderr, "%s\n", err.format().c_str());
}

void ErrorReporter::warning(const std::string& message, int line, int column) {
  report(ErrorSeverity::Warning, message, line, column);
}

void ErrorReporter::error(const std::string& message, int line, int column) {
  report(ErrorSeverity::Error, message, line, column);
}

void ErrorReporter::fatal(const std::string& message, int line, int column) {
  report(ErrorSeverity::Fatal, message, line, column);
}

void ErrorReporter::warning(const std::string& message, const Node& node) {
  report(ErrorSeverity::Warning, message, node);
}

void ErrorReporter::error(const std::string& message, const Node& node) {
  report(ErrorSeverity::Error, message, node);
}

void ErrorReporter::setCallback(ErrorCallback cb) {
  errorCallback = std::move(cb);
}

void ErrorReporter::setFilename(const std::string& filename) {
  currentFilename = filename;
}

bool ErrorReporter::hasErrors() const {
  return std::any_of(errorList.begin(), errorList.end(), [](const auto& err) {
    return err.severity == ErrorSeverity::Error ||
           err.severity == ErrorSeverity::Fatal;
  });
}

bool ErrorReporter::hasWarnings() const {
  return std::any_of(errorList.begin(), errorList.end(), [](const auto& err) {
    return err.severity == ErrorSeverity::Warning;
  });
}

void ErrorReporter::clear() { errorList.clear(); }

void reportMisuse(const std::string& message) {
  llvm::report_fatal_error(llvm::Twine(message), /*gen_crash_diag=*/false);
}

} // namespace jsast
