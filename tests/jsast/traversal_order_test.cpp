#include "ast_test_helper.hpp"

#include <set>

// Immediate children of `node` as reported by forEach().
static std::vector<Node*> childrenOf(Node& node) {
  std::vector<Node*> children;
  node.forEach([&children](Node& child) { children.push_back(&child); });
  return children;
}

static std::vector<NodeKind> childKinds(Node& node) {
  std::vector<NodeKind> kinds;
  node.forEach([&kinds](Node& child) { kinds.push_back(child.getKind()); });
  return kinds;
}

// ============== Statement Order Tests ==============

TEST(ForEachTest, IfWithElse) {
  NIfStatement stmt(ref("c"), block(), std::make_unique<NEmptyStatement>());
  const auto children = childrenOf(stmt);
  ASSERT_EQ(children.size(), 3u);
  EXPECT_EQ(children[0], stmt.condition.get());
  EXPECT_EQ(children[1], stmt.then.get());
  EXPECT_EQ(children[2], stmt.otherwise.get());
}

TEST(ForEachTest, IfWithoutElse) {
  NIfStatement stmt(ref("c"), block());
  const auto children = childrenOf(stmt);
  ASSERT_EQ(children.size(), 2u);
  EXPECT_EQ(children[0], stmt.condition.get());
  EXPECT_EQ(children[1], stmt.then.get());
}

TEST(ForEachTest, ForWithAllParts) {
  NForStatement stmt(
      std::make_unique<NAssignmentExpression>(ref("i"), "=", num(0.0)),
      std::make_unique<NBinaryExpression>(ref("i"), "<", num(10.0)),
      NUpdateExpression::postfix("++", ref("i")), block());
  const auto children = childrenOf(stmt);
  ASSERT_EQ(children.size(), 4u);
  EXPECT_EQ(children[0], stmt.init.get());
  EXPECT_EQ(children[1], stmt.condition.get());
  EXPECT_EQ(children[2], stmt.update.get());
  EXPECT_EQ(children[3], stmt.body.get());
}

TEST(ForEachTest, ForWithOnlyBody) {
  NForStatement stmt(nullptr, nullptr, nullptr, block());
  const auto children = childrenOf(stmt);
  ASSERT_EQ(children.size(), 1u);
  EXPECT_EQ(children[0], stmt.body.get());
}

TEST(ForEachTest, ForWithConditionOnly) {
  NForStatement stmt(nullptr, ref("running"), nullptr, block());
  const auto children = childrenOf(stmt);
  ASSERT_EQ(children.size(), 2u);
  EXPECT_EQ(children[0], stmt.condition.get());
  EXPECT_EQ(children[1], stmt.body.get());
}

TEST(ForEachTest, ForIn) {
  NForInStatement stmt(ref("k"), ref("obj"), block());
  const auto children = childrenOf(stmt);
  ASSERT_EQ(children.size(), 3u);
  EXPECT_EQ(children[0], stmt.left.get());
  EXPECT_EQ(children[1], stmt.right.get());
  EXPECT_EQ(children[2], stmt.body.get());
}

TEST(ForEachTest, DoWhileBodyBeforeCondition) {
  NDoWhileStatement stmt(block(), ref("c"));
  const auto children = childrenOf(stmt);
  ASSERT_EQ(children.size(), 2u);
  EXPECT_EQ(children[0], stmt.body.get());
  EXPECT_EQ(children[1], stmt.condition.get());
}

TEST(ForEachTest, ReturnWithoutArgument) {
  NReturnStatement stmt;
  EXPECT_TRUE(childrenOf(stmt).empty());
}

TEST(ForEachTest, ReturnWithArgument) {
  NReturnStatement stmt(ref("x"));
  const auto children = childrenOf(stmt);
  ASSERT_EQ(children.size(), 1u);
  EXPECT_EQ(children[0], stmt.argument.get());
}

TEST(ForEachTest, BreakWithAndWithoutLabel) {
  NBreakStatement plain;
  EXPECT_TRUE(childrenOf(plain).empty());

  NContinueStatement labeled(name("outer"));
  EXPECT_EQ(childKinds(labeled), std::vector<NodeKind>{NodeKind::Name});
}

TEST(ForEachTest, TryWithHandlerOnly) {
  NTryStatement stmt(block(), std::make_unique<NCatchClause>(name("e"), block()),
                     nullptr);
  const auto children = childrenOf(stmt);
  ASSERT_EQ(children.size(), 2u);
  EXPECT_EQ(children[0], stmt.block.get());
  EXPECT_EQ(children[1], stmt.handler.get());
}

TEST(ForEachTest, TryWithFinalizerOnly) {
  NTryStatement stmt(block(), nullptr, block());
  const auto children = childrenOf(stmt);
  ASSERT_EQ(children.size(), 2u);
  EXPECT_EQ(children[0], stmt.block.get());
  EXPECT_EQ(children[1], stmt.finalizer.get());
}

TEST(ForEachTest, SwitchArgumentThenCases) {
  NSwitchStatement stmt(
      ref("x"), listOf<NSwitchCase>(
                    std::make_unique<NSwitchCase>(num(1.0), StatementList()),
                    NSwitchCase::defaultCase({})));
  EXPECT_EQ(childKinds(stmt),
            (std::vector<NodeKind>{NodeKind::NameExpression, NodeKind::SwitchCase,
                                   NodeKind::SwitchCase}));
}

TEST(ForEachTest, DefaultCaseSkipsExpression) {
  auto clause = NSwitchCase::defaultCase(
      listOf<NStatement>(std::make_unique<NBreakStatement>()));
  EXPECT_EQ(childKinds(*clause),
            std::vector<NodeKind>{NodeKind::BreakStatement});
}

TEST(ForEachTest, LabeledStatement) {
  NLabeledStatement stmt(name("loop"), std::make_unique<NEmptyStatement>());
  EXPECT_EQ(childKinds(stmt),
            (std::vector<NodeKind>{NodeKind::Name, NodeKind::EmptyStatement}));
}

TEST(ForEachTest, LeafStatementsHaveNoChildren) {
  NEmptyStatement empty;
  NDebuggerStatement debugger;
  EXPECT_TRUE(childrenOf(empty).empty());
  EXPECT_TRUE(childrenOf(debugger).empty());
}

// ============== Structure Order Tests ==============

TEST(ForEachTest, FunctionNameParamsBody) {
  auto fn = function("add", listOf<NName>(name("a"), name("b")));
  const auto children = childrenOf(*fn);
  ASSERT_EQ(children.size(), 4u);
  EXPECT_EQ(children[0], fn->name.get());
  EXPECT_EQ(children[1], fn->params[0].get());
  EXPECT_EQ(children[2], fn->params[1].get());
  EXPECT_EQ(children[3], fn->body.get());
}

TEST(ForEachTest, AnonymousFunctionSkipsName) {
  auto fn = function("", listOf<NName>(name("a")));
  EXPECT_EQ(childKinds(*fn),
            (std::vector<NodeKind>{NodeKind::Name, NodeKind::BlockStatement}));
}

TEST(ForEachTest, VariableDeclaratorWithoutInit) {
  NVariableDeclarator decl(name("x"));
  EXPECT_EQ(childKinds(decl), std::vector<NodeKind>{NodeKind::Name});
}

TEST(ForEachTest, PropertyKeyThenValue) {
  NProperty prop(name("k"), num(1.0));
  const auto children = childrenOf(prop);
  ASSERT_EQ(children.size(), 2u);
  EXPECT_EQ(children[0], prop.key.get());
  EXPECT_EQ(children[1], prop.value.get());
}

TEST(ForEachTest, ProgramsInOrder) {
  NPrograms programs(listOf<NProgram>(program({}, "a.js"), program({}, "b.js")));
  const auto children = childrenOf(programs);
  ASSERT_EQ(children.size(), 2u);
  EXPECT_EQ(llvm::cast<NProgram>(children[0])->filename, "a.js");
  EXPECT_EQ(llvm::cast<NProgram>(children[1])->filename, "b.js");
}

// ============== Expression Order Tests ==============

TEST(ForEachTest, ArrayHolesAreSkipped) {
  // [1,,3]
  NArrayExpression array(listOf<NExpression>(num(1.0), nullptr, num(3.0)));
  const auto children = childrenOf(array);
  ASSERT_EQ(children.size(), 2u);
  EXPECT_EQ(children[0], array.expressions[0].get());
  EXPECT_EQ(children[1], array.expressions[2].get());
}

TEST(ForEachTest, CallCalleeThenArguments) {
  NCallExpression call(ref("f"), listOf<NExpression>(num(1.0), str("two")));
  const auto children = childrenOf(call);
  ASSERT_EQ(children.size(), 3u);
  EXPECT_EQ(children[0], call.callee.get());
  EXPECT_EQ(children[1], call.arguments[0].get());
  EXPECT_EQ(children[2], call.arguments[1].get());
}

TEST(ForEachTest, ConditionalExpression) {
  NConditionalExpression expr(ref("c"), num(1.0), num(2.0));
  const auto children = childrenOf(expr);
  ASSERT_EQ(children.size(), 3u);
  EXPECT_EQ(children[0], expr.condition.get());
  EXPECT_EQ(children[1], expr.then.get());
  EXPECT_EQ(children[2], expr.otherwise.get());
}

TEST(ForEachTest, MemberObjectThenProperty) {
  NMemberExpression expr(ref("obj"), name("field"));
  EXPECT_EQ(childKinds(expr),
            (std::vector<NodeKind>{NodeKind::NameExpression, NodeKind::Name}));
}

TEST(ForEachTest, ArrowParamsThenBody) {
  NArrowFunction arrow(listOf<NName>(name("x"), name("y")), block());
  EXPECT_EQ(childKinds(arrow),
            (std::vector<NodeKind>{NodeKind::Name, NodeKind::Name,
                                   NodeKind::BlockStatement}));
}

TEST(ForEachTest, LeafExpressionsHaveNoChildren) {
  NThisExpression thisExpr;
  NRegexpExpression regexp("/x/");
  auto lit = num(1.0);
  EXPECT_TRUE(childrenOf(thisExpr).empty());
  EXPECT_TRUE(childrenOf(regexp).empty());
  EXPECT_TRUE(childrenOf(*lit).empty());
  EXPECT_TRUE(childrenOf(*name("x")).empty());
}

// ============== Const Traversal Tests ==============

TEST(ForEachTest, ConstForEachVisitsSameChildren) {
  NBinaryExpression expr(ref("a"), "+", ref("b"));
  const Node& constExpr = expr;
  std::vector<const Node*> children;
  constExpr.forEach([&children](const Node& child) { children.push_back(&child); });
  ASSERT_EQ(children.size(), 2u);
  EXPECT_EQ(children[0], expr.left.get());
  EXPECT_EQ(children[1], expr.right.get());
}

// ============== Parent Link Tests ==============

TEST(ForEachTest, EveryChildLinksBackToItsParent) {
  auto root = makeTreeWithEveryKind();
  for (Node* node : allNodes(*root)) {
    node->forEach([node](Node& child) {
      EXPECT_EQ(child.parent, node)
          << child.kindName() << " under " << node->kindName();
    });
  }
}

TEST(ForEachTest, EveryNonRootNodeIsEnumeratedByItsParent) {
  auto root = makeTreeWithEveryKind();
  EXPECT_EQ(root->parent, nullptr);
  for (Node* node : allNodes(*root)) {
    if (node == root.get()) {
      continue;
    }
    ASSERT_NE(node->parent, nullptr) << node->kindName();
    int seen = 0;
    node->parent->forEach([&](Node& child) {
      if (&child == node) {
        ++seen;
      }
    });
    EXPECT_EQ(seen, 1) << node->kindName();
  }
}

TEST(ForEachTest, SampleTreeContainsEveryKind) {
  auto root = makeTreeWithEveryKind();
  std::set<NodeKind> kinds;
  for (Node* node : allNodes(*root)) {
    kinds.insert(node->getKind());
  }
  EXPECT_EQ(kinds.size(), 44u);
}
