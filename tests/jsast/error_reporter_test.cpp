#include "ast_test_helper.hpp"
#include "jsast/error_reporter.hpp"

#include <cstdio>
#include <string>
#include <vector>

// Helper class to capture stderr output
class StderrCapture {
public:
  StderrCapture() {
    original_stderr_ = stderr;
    captured_file_ = std::tmpfile();
    if (captured_file_) {
      stderr = captured_file_;
    }
  }

  ~StderrCapture() {
    stderr = original_stderr_;
    if (captured_file_) {
      std::fclose(captured_file_);
    }
  }

  std::string getCaptured() {
    if (!captured_file_) {
      return "";
    }
    std::fflush(captured_file_);
    std::rewind(captured_file_);
    std::string result;
    char buffer[256];
    while (std::fgets(buffer, sizeof(buffer), captured_file_)) {
      result += buffer;
    }
    return result;
  }

private:
  std::FILE* original_stderr_;
  std::FILE* captured_file_;
};

// ============== ASTError Tests ==============

TEST(ASTErrorTest, FormatWarning) {
  ASTError err(ErrorSeverity::Warning, "test warning");
  EXPECT_EQ(err.format(), "warning: test warning");
}

TEST(ASTErrorTest, FormatError) {
  ASTError err(ErrorSeverity::Error, "test error");
  EXPECT_EQ(err.format(), "error: test error");
}

TEST(ASTErrorTest, FormatFatal) {
  ASTError err(ErrorSeverity::Fatal, "test fatal");
  EXPECT_EQ(err.format(), "fatal error: test fatal");
}

TEST(ASTErrorTest, FormatWithLine) {
  ASTError err(ErrorSeverity::Error, "test", 5);
  EXPECT_EQ(err.format(), "error: test at line 5");
}

TEST(ASTErrorTest, FormatWithLineAndColumn) {
  ASTError err(ErrorSeverity::Error, "test", 5, 10);
  EXPECT_EQ(err.format(), "error: test at line 5, column 10");
}

TEST(ASTErrorTest, FormatWithFilename) {
  ASTError err(ErrorSeverity::Warning, "shadowed", 2);
  err.filename = "main.js";
  EXPECT_EQ(err.format(), "warning: main.js: shadowed at line 2");
}

TEST(ASTErrorTest, FormatNoLocation) {
  ASTError err(ErrorSeverity::Error, "test", 0, 0);
  // Line 0 should not appear in output
  EXPECT_TRUE(err.format().find("line") == std::string::npos);
}

// ============== ErrorReporter Report Methods Tests ==============

TEST(ErrorReporterTest, ReportWarning) {
  StderrCapture capture;
  ErrorReporter reporter;

  reporter.warning("test warning", 1, 2);

  EXPECT_TRUE(reporter.hasWarnings());
  EXPECT_FALSE(reporter.hasErrors());
  ASSERT_EQ(reporter.errors().size(), 1u);
  EXPECT_EQ(reporter.errors()[0].severity, ErrorSeverity::Warning);
  EXPECT_EQ(reporter.errors()[0].message, "test warning");
  EXPECT_EQ(reporter.errors()[0].line, 1);
  EXPECT_EQ(reporter.errors()[0].column, 2);
}

TEST(ErrorReporterTest, ReportError) {
  StderrCapture capture;
  ErrorReporter reporter;

  reporter.error("test error", 3, 4);

  EXPECT_FALSE(reporter.hasWarnings());
  EXPECT_TRUE(reporter.hasErrors());
  ASSERT_EQ(reporter.errors().size(), 1u);
  EXPECT_EQ(reporter.errors()[0].severity, ErrorSeverity::Error);
}

TEST(ErrorReporterTest, ReportFatal) {
  StderrCapture capture;
  ErrorReporter reporter;

  reporter.fatal("test fatal", 5, 6);

  EXPECT_TRUE(reporter.hasErrors()); // Fatal counts as error
  ASSERT_EQ(reporter.errors().size(), 1u);
  EXPECT_EQ(reporter.errors()[0].severity, ErrorSeverity::Fatal);
}

TEST(ErrorReporterTest, MultipleErrors) {
  StderrCapture capture;
  ErrorReporter reporter;

  reporter.warning("warn1");
  reporter.error("err1");
  reporter.warning("warn2");
  reporter.error("err2");

  EXPECT_TRUE(reporter.hasWarnings());
  EXPECT_TRUE(reporter.hasErrors());
  EXPECT_EQ(reporter.errors().size(), 4u);
}

// ============== ErrorReporter Node Location Tests ==============

TEST(ErrorReporterTest, ReportAtNodeUsesProgramFilename) {
  StderrCapture capture;
  ErrorReporter reporter;
  reporter.setFilename("ignored.js");

  auto stmt = std::make_unique<NWithStatement>(ref("obj"), block());
  stmt->line = 7;
  NStatement* stmtPtr = stmt.get();
  auto prog = program(listOf<NStatement>(std::move(stmt)), "main.js");

  reporter.warning("with statement", *stmtPtr);

  ASSERT_EQ(reporter.errors().size(), 1u);
  const ASTError& err = reporter.errors()[0];
  EXPECT_EQ(err.filename, "main.js");
  EXPECT_EQ(err.line, 7);
  EXPECT_EQ(err.column, 0);
  EXPECT_EQ(err.format(), "warning: main.js: with statement at line 7");
}

TEST(ErrorReporterTest, ReportAtNodeWithoutLine) {
  StderrCapture capture;
  ErrorReporter reporter;
  auto prog = program({}, "main.js");

  reporter.error("empty program", *prog);

  ASSERT_EQ(reporter.errors().size(), 1u);
  EXPECT_EQ(reporter.errors()[0].line, 0);
  EXPECT_EQ(reporter.errors()[0].format(), "error: main.js: empty program");
}

TEST(ErrorReporterTest, ReportAtOrphanUsesCurrentFilename) {
  StderrCapture capture;
  ErrorReporter reporter;
  reporter.setFilename("fallback.js");

  NDebuggerStatement orphan;
  orphan.line = 2;
  reporter.report(ErrorSeverity::Error, "debugger", orphan);

  ASSERT_EQ(reporter.errors().size(), 1u);
  EXPECT_EQ(reporter.errors()[0].filename, "fallback.js");
  EXPECT_EQ(reporter.errors()[0].line, 2);
}

// ============== ErrorReporter Clear Tests ==============

TEST(ErrorReporterTest, ClearErrors) {
  StderrCapture capture;
  ErrorReporter reporter;

  reporter.error("error1");
  reporter.warning("warning1");
  EXPECT_TRUE(reporter.hasErrors());
  EXPECT_TRUE(reporter.hasWarnings());

  reporter.clear();

  EXPECT_FALSE(reporter.hasErrors());
  EXPECT_FALSE(reporter.hasWarnings());
  EXPECT_TRUE(reporter.errors().empty());
}

// ============== ErrorReporter Callback Tests ==============

TEST(ErrorReporterTest, CallbackInvoked) {
  StderrCapture capture;
  ErrorReporter reporter;
  std::vector<ASTError> captured_errors;

  reporter.setCallback([&captured_errors](const ASTError& err) {
    captured_errors.push_back(err);
  });

  reporter.error("test error");
  reporter.warning("test warning");

  ASSERT_EQ(captured_errors.size(), 2u);
  EXPECT_EQ(captured_errors[0].message, "test error");
  EXPECT_EQ(captured_errors[1].message, "test warning");
}

// ============== ErrorReporter Filename Tests ==============

TEST(ErrorReporterTest, SetFilename) {
  StderrCapture capture;
  ErrorReporter reporter;

  reporter.setFilename("test.js");
  reporter.error("test error");

  EXPECT_EQ(reporter.errors()[0].filename, "test.js");
}

// ============== ErrorReporter Output to stderr Tests ==============

TEST(ErrorReporterTest, OutputToStderr) {
  StderrCapture capture;
  ErrorReporter reporter;

  reporter.error("stderr test", 10, 20);

  std::string output = capture.getCaptured();
  EXPECT_EQ(output, "error: stderr test at line 10, column 20\n");
}

// ============== Message Helper Tests ==============

TEST(ErrorMessageTest, RoleMismatch) {
  EXPECT_EQ(formatRoleMismatch("NProperty", "value", "NFunction",
                               "NLiteralExpression"),
            "NProperty value must be NFunction, got NLiteralExpression");
}

TEST(ErrorMessageTest, MissingChild) {
  EXPECT_EQ(formatMissingChild("NIfStatement", "condition"),
            "NIfStatement is missing its condition");
}

TEST(ErrorMessageTest, ParentMismatch) {
  EXPECT_EQ(formatParentMismatch("NName", "NMemberExpression", "null"),
            "NName is a child of NMemberExpression but its parent link "
            "points to null");
}

TEST(ErrorMessageDeathTest, ReportMisuseIsFatal) {
  EXPECT_DEATH(reportMisuse("node used in the wrong role"),
               "LLVM ERROR: node used in the wrong role");
}
