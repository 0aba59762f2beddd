#include "ast_test_helper.hpp"
#include "jsast/ast_printer.hpp"

#include <gmock/gmock.h>
#include <llvm/Support/raw_ostream.h>

using ::testing::HasSubstr;

// ============== Literal Tests ==============

TEST(ASTPrinterTest, PrintNumber) {
  auto lit = num(42.0, "42");
  std::string buffer;
  llvm::raw_string_ostream out(buffer);
  ASTPrinter printer(out);
  printer.print(*lit);

  EXPECT_EQ(out.str(), "NLiteralExpression 42\n");
}

TEST(ASTPrinterTest, PrintRawTextVerbatim) {
  auto lit = num(255.0, "0xff");
  EXPECT_EQ(dumpTree(*lit), "NLiteralExpression 0xff\n");
}

TEST(ASTPrinterTest, PrintLiteralWithoutRawText) {
  NLiteralExpression lit(LiteralValue(true));
  EXPECT_EQ(dumpTree(lit), "NLiteralExpression true\n");
}

TEST(ASTPrinterTest, PrintString) {
  auto lit = str("hi");
  EXPECT_EQ(dumpTree(*lit), "NLiteralExpression \"hi\"\n");
}

TEST(ASTPrinterTest, PrintRegexp) {
  NRegexpExpression regexp("/a+/gi");
  EXPECT_EQ(dumpTree(regexp), "NRegexpExpression /a+/gi\n");
}

TEST(ASTPrinterTest, PrintName) {
  auto expr = ref("myVar");
  EXPECT_EQ(dumpTree(*expr), "NNameExpression\n"
                             "`-NName 'myVar'\n");
}

// ============== Operator Tests ==============

TEST(ASTPrinterTest, PrintBinaryOperator) {
  NBinaryExpression expr(num(1.0, "1"), "+", num(2.0, "2"));
  EXPECT_EQ(dumpTree(expr), "NBinaryExpression '+'\n"
                            "|-NLiteralExpression 1\n"
                            "`-NLiteralExpression 2\n");
}

TEST(ASTPrinterTest, PrintUnaryOperator) {
  NUnaryExpression expr("typeof", ref("x"));
  EXPECT_THAT(dumpTree(expr), HasSubstr("NUnaryExpression 'typeof'"));
}

TEST(ASTPrinterTest, PrintAssignmentOperator) {
  NAssignmentExpression expr(ref("x"), "*=", num(2.0, "2"));
  EXPECT_THAT(dumpTree(expr), HasSubstr("NAssignmentExpression '*='"));
}

TEST(ASTPrinterTest, PrintUpdateFixity) {
  auto pre = NUpdateExpression::prefix("++", ref("i"));
  auto post = NUpdateExpression::postfix("--", ref("i"));
  EXPECT_THAT(dumpTree(*pre), HasSubstr("NUpdateExpression '++' prefix"));
  EXPECT_THAT(dumpTree(*post), HasSubstr("NUpdateExpression '--' postfix"));
}

TEST(ASTPrinterTest, PrintNewCall) {
  auto call = NCallExpression::newCall(ref("Date"), ExpressionList());
  EXPECT_EQ(dumpTree(*call), "NCallExpression new\n"
                             "`-NNameExpression\n"
                             "  `-NName 'Date'\n");
}

// ============== Structure Tests ==============

TEST(ASTPrinterTest, PrintVariableDeclaration) {
  // var x = 1;
  auto prog = program(listOf<NStatement>(std::make_unique<NVariableDeclaration>(
      listOf<NVariableDeclarator>(
          std::make_unique<NVariableDeclarator>(name("x"), num(1.0, "1"))))));
  EXPECT_EQ(dumpTree(*prog), "NProgram 'test.js'\n"
                             "`-NVariableDeclaration\n"
                             "  `-NVariableDeclarator\n"
                             "    |-NName 'x'\n"
                             "    `-NLiteralExpression 1\n");
}

TEST(ASTPrinterTest, PrintProgramWithoutFilename) {
  auto prog = program(listOf<NStatement>(std::make_unique<NEmptyStatement>()), "");
  EXPECT_EQ(dumpTree(*prog), "NProgram\n"
                             "`-NEmptyStatement\n");
}

TEST(ASTPrinterTest, PrintFunctionNames) {
  auto named = function("add", listOf<NName>(name("a")));
  auto anonymous = function("", listOf<NName>());
  EXPECT_THAT(dumpTree(*named), HasSubstr("NFunction 'add'"));
  EXPECT_EQ(dumpTree(*anonymous), "NFunction <anonymous>\n"
                                  "`-NBlockStatement\n");
}

TEST(ASTPrinterTest, PrintIfWithElse) {
  // if (a) ; else ;
  NIfStatement stmt(ref("a"), std::make_unique<NEmptyStatement>(),
                    std::make_unique<NEmptyStatement>());
  EXPECT_EQ(dumpTree(stmt), "NIfStatement\n"
                            "|-condition:\n"
                            "| `-NNameExpression\n"
                            "|   `-NName 'a'\n"
                            "|-then:\n"
                            "| `-NEmptyStatement\n"
                            "`-else:\n"
                            "  `-NEmptyStatement\n");
}

TEST(ASTPrinterTest, PrintIfWithoutElse) {
  NIfStatement stmt(ref("a"), std::make_unique<NEmptyStatement>());
  EXPECT_EQ(dumpTree(stmt), "NIfStatement\n"
                            "|-condition:\n"
                            "| `-NNameExpression\n"
                            "|   `-NName 'a'\n"
                            "`-then:\n"
                            "  `-NEmptyStatement\n");
}

TEST(ASTPrinterTest, PrintArrayHoles) {
  // [1,,3]
  NArrayExpression array(listOf<NExpression>(num(1.0, "1"), nullptr, num(3.0, "3")));
  EXPECT_EQ(dumpTree(array), "NArrayExpression\n"
                             "|-NLiteralExpression 1\n"
                             "|-<hole>\n"
                             "`-NLiteralExpression 3\n");
}

TEST(ASTPrinterTest, PrintPropertyKinds) {
  NObjectExpression object(listOf<NProperty>(
      std::make_unique<NProperty>(name("a"), num(1.0, "1")),
      std::make_unique<NProperty>(name("b"), function("", listOf<NName>()),
                                  PropertyKind::Get)));
  const std::string result = dumpTree(object);
  EXPECT_THAT(result, HasSubstr("|-NProperty init"));
  EXPECT_THAT(result, HasSubstr("`-NProperty get"));
}

TEST(ASTPrinterTest, PrintDefaultCase) {
  auto clause = NSwitchCase::defaultCase({});
  EXPECT_EQ(dumpTree(*clause), "NSwitchCase default\n");
}

TEST(ASTPrinterTest, PrintEveryKind) {
  auto root = makeTreeWithEveryKind();
  const std::string result = dumpTree(*root);
  for (Node* node : allNodes(*root)) {
    EXPECT_THAT(result, HasSubstr(node->kindName()));
  }
}

// ============== Option Tests ==============

TEST(ASTPrinterTest, ShowLocations) {
  auto stmt = std::make_unique<NDebuggerStatement>();
  stmt->setLocation(10, 19, 3);
  auto prog = program(listOf<NStatement>(std::move(stmt)));

  PrinterOptions options;
  options.showLocations = true;
  EXPECT_EQ(dumpTree(*prog, options), "NProgram 'test.js'\n"
                                      "`-NDebuggerStatement @3\n");
  EXPECT_EQ(dumpTree(*prog), "NProgram 'test.js'\n"
                             "`-NDebuggerStatement\n");
}

TEST(ASTPrinterTest, ShowScopes) {
  auto fn = function("f", listOf<NName>(name("x")));
  fn->declare("x");
  fn->declare(NScope::ARGUMENTS);

  PrinterOptions options;
  options.showScopes = true;
  const std::string result = dumpTree(*fn, options);
  EXPECT_THAT(result, HasSubstr("NFunction 'f' [arguments, x]"));
  // Only scope nodes carry an environment.
  EXPECT_THAT(result, HasSubstr("NName 'x'\n"));
}

TEST(ASTPrinterTest, ShowEmptyScope) {
  auto prog = program({}, "");
  PrinterOptions options;
  options.showScopes = true;
  EXPECT_EQ(dumpTree(*prog, options), "NProgram []\n");
}

TEST(ASTPrinterTest, PrinterIsReusable) {
  std::string buffer;
  llvm::raw_string_ostream out(buffer);
  ASTPrinter printer(out);
  NEmptyStatement first;
  NDebuggerStatement second;
  printer.print(first);
  printer.print(second);
  EXPECT_EQ(out.str(), "NEmptyStatement\nNDebuggerStatement\n");
}
