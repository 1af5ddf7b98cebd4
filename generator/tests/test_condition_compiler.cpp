// test_condition_compiler.cpp - activation condition DSL to ClauseIR

#include "core/compiler/ConditionCompiler.h"

#include <gtest/gtest.h>

static ConditionLiteral lit(const QString& label, const QString& tag,
                            bool negated = false) {
  ConditionLiteral l;
  l.label = label;
  l.tag = tag;
  l.negated = negated;
  return l;
}

static ConditionSpec spec(const QString& expression,
                          const QList<ConditionLiteral>& literals) {
  ConditionSpec s;
  s.expression = expression;
  s.literals = literals;
  return s;
}

TEST(ConditionCompilerTest, MissingSpecGatesOnFallback) {
  const ClauseIR ir = ConditionCompiler::compile(nullptr, "StepFlag[4].Flag");
  EXPECT_TRUE(ir.isSingleLiteral());
  EXPECT_EQ(ir, ConditionCompiler::single("StepFlag[4].Flag"));
  EXPECT_FALSE(ir.disjuncts[0][0].negated);
}

TEST(ConditionCompilerTest, EmptyLiteralsGateOnFallback) {
  const ConditionSpec s = spec("X1 AND X2", {});
  const ClauseIR ir = ConditionCompiler::compile(&s, "StepFlag[2].Flag");
  EXPECT_EQ(ir, ConditionCompiler::single("StepFlag[2].Flag"));
}

TEST(ConditionCompilerTest, BareLabelShortCircuits) {
  const ConditionSpec s = spec("X1", {lit("X1", "A")});
  const ClauseIR ir = ConditionCompiler::compile(&s, "StepFlag[1].Flag");
  ASSERT_EQ(ir.disjuncts.size(), 1);
  ASSERT_EQ(ir.disjuncts[0].size(), 1);
  EXPECT_EQ(ir.disjuncts[0][0].tag, "A");
  EXPECT_FALSE(ir.disjuncts[0][0].negated);
}

TEST(ConditionCompilerTest, BareNegatedLabelKeepsPolarity) {
  const ConditionSpec s = spec(" X1 ", {lit("X1", "LS101", true)});
  const ClauseIR ir = ConditionCompiler::compile(&s, "StepFlag[1].Flag");
  EXPECT_EQ(ir, ConditionCompiler::single("LS101", true));
}

TEST(ConditionCompilerTest, OrProducesOneDisjunctPerTerm) {
  const ConditionSpec s = spec("X1 OR X2", {lit("X1", "A"), lit("X2", "B", true)});
  const ClauseIR ir = ConditionCompiler::compile(&s, "unused");

  ASSERT_EQ(ir.disjuncts.size(), 2);
  EXPECT_EQ(ir.disjuncts[0], (QList<ClauseLiteral>{ClauseLiteral{"A", false}}));
  EXPECT_EQ(ir.disjuncts[1], (QList<ClauseLiteral>{ClauseLiteral{"B", true}}));
}

TEST(ConditionCompilerTest, ParenthesisedConjunctionInsideOr) {
  const ConditionSpec s = spec("(X1 AND X2) OR X3",
                               {lit("X1", "t1"), lit("X2", "t2"), lit("X3", "t3")});
  const ClauseIR ir = ConditionCompiler::compile(&s, "unused");

  ASSERT_EQ(ir.disjuncts.size(), 2);
  ASSERT_EQ(ir.disjuncts[0].size(), 2);
  EXPECT_EQ(ir.disjuncts[0][0].tag, "t1");
  EXPECT_EQ(ir.disjuncts[0][1].tag, "t2");
  ASSERT_EQ(ir.disjuncts[1].size(), 1);
  EXPECT_EQ(ir.disjuncts[1][0].tag, "t3");
}

TEST(ConditionCompilerTest, PlainConjunctionIsSingleDisjunct) {
  const ConditionSpec s = spec("X1 AND X2 AND X3",
                               {lit("X1", "a"), lit("X2", "b", true), lit("X3", "c")});
  const ClauseIR ir = ConditionCompiler::compile(&s, "unused");

  ASSERT_EQ(ir.disjuncts.size(), 1);
  EXPECT_EQ(ir.disjuncts[0],
            (QList<ClauseLiteral>{{"a", false}, {"b", true}, {"c", false}}));
}

TEST(ConditionCompilerTest, LabelsOrderedByExpressionNotByLiteralList) {
  const ConditionSpec s = spec("X2 AND X1", {lit("X1", "first"), lit("X2", "second")});
  const ClauseIR ir = ConditionCompiler::compile(&s, "unused");

  ASSERT_EQ(ir.disjuncts.size(), 1);
  ASSERT_EQ(ir.disjuncts[0].size(), 2);
  EXPECT_EQ(ir.disjuncts[0][0].tag, "second");
  EXPECT_EQ(ir.disjuncts[0][1].tag, "first");
}

TEST(ConditionCompilerTest, UndefinedLabelsAreDroppedAndReported) {
  const ConditionSpec s = spec("X1 AND X5 OR X5 AND X2", {lit("X1", "a"), lit("X2", "b")});

  QStringList unresolved;
  const ClauseIR ir = ConditionCompiler::compile(&s, "unused", &unresolved);

  ASSERT_EQ(ir.disjuncts.size(), 2);
  EXPECT_EQ(ir.disjuncts[0], (QList<ClauseLiteral>{{"a", false}}));
  EXPECT_EQ(ir.disjuncts[1], (QList<ClauseLiteral>{{"b", false}}));
  EXPECT_EQ(unresolved, QStringList{"X5"});

  EXPECT_EQ(ConditionCompiler::unresolvedLabels(s), QStringList{"X5"});
}

TEST(ConditionCompilerTest, LiteralWithoutTagIsDroppedAndReported) {
  const ConditionSpec s = spec("X1 AND X2", {lit("X1", ""), lit("X2", "B")});

  QStringList unresolved;
  const ClauseIR ir = ConditionCompiler::compile(&s, "unused", &unresolved);

  ASSERT_EQ(ir.disjuncts.size(), 1);
  EXPECT_EQ(ir.disjuncts[0], (QList<ClauseLiteral>{{"B", false}}));
  EXPECT_EQ(unresolved, QStringList{"X1"});
}

TEST(ConditionCompilerTest, BareLabelWithoutTagFallsBackAndReports) {
  const ConditionSpec s = spec("X1", {lit("X1", "  ")});

  QStringList unresolved;
  const ClauseIR ir = ConditionCompiler::compile(&s, "StepFlag[3].Flag", &unresolved);
  EXPECT_EQ(ir, ConditionCompiler::single("StepFlag[3].Flag"));
  EXPECT_EQ(unresolved, QStringList{"X1"});
}

TEST(ConditionCompilerTest, BareLabelWithoutMatchingLiteralFallsBack) {
  const ConditionSpec s = spec("X1", {lit("X7", "other")});
  const ClauseIR ir = ConditionCompiler::compile(&s, "StepFlag[9].Flag");
  EXPECT_EQ(ir, ConditionCompiler::single("StepFlag[9].Flag"));
}

TEST(ConditionCompilerTest, LaterDuplicateLabelWins) {
  const ConditionSpec s = spec("X1 AND X2",
                               {lit("X1", "old"), lit("X2", "b"), lit("X1", "new", true)});
  const QMap<QString, ConditionLiteral> table = ConditionCompiler::literalTable(s);
  ASSERT_TRUE(table.contains("X1"));
  EXPECT_EQ(table.value("X1").tag, "new");
  EXPECT_TRUE(table.value("X1").negated);
}

TEST(ConditionCompilerTest, CompilationIsDeterministic) {
  const ConditionSpec s = spec("(X1 AND X2) OR (X3 AND X4)",
                               {lit("X1", "a"), lit("X2", "b"), lit("X3", "c"), lit("X4", "d")});
  EXPECT_EQ(ConditionCompiler::compile(&s, "f"), ConditionCompiler::compile(&s, "f"));
}
