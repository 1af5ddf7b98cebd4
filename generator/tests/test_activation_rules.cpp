// test_activation_rules.cpp - skip rules and suffix lookup

#include "core/models/ConfigTables.h"
#include "core/rules/ActivationRules.h"

#include <gtest/gtest.h>

static Activation makeActivation(int step, int deviceClass, int qualifier,
                                 const QString& tag) {
  Activation a;
  a.stepIndex = step;
  a.stepName = QString("Step%1").arg(step);
  a.deviceClassCode = deviceClass;
  a.qualifierCode = qualifier;
  a.tag = tag;
  return a;
}

TEST(ActivationRulesTest, QualifierThreeAlwaysSkips) {
  for (int dc : {0, 1, 2, 6, 7, 8, 10, 13, 14, 99}) {
    EXPECT_TRUE(ActivationRules::shouldSkip(dc, 3)) << "iType " << dc;
  }
  const ConfigTables tables;
  EXPECT_TRUE(ActivationRules::resolve(7, 3, tables).skip);
}

TEST(ActivationRulesTest, QualifierFourSkipsValvesButNotPid) {
  const ConfigTables tables;
  for (int dc : {0, 1, 2, 7, 10, 14}) {
    EXPECT_TRUE(ActivationRules::resolve(dc, 4, tables).skip) << "iType " << dc;
  }

  const SuffixRule pid = ActivationRules::resolve(8, 4, tables);
  EXPECT_FALSE(pid.skip);
  EXPECT_EQ(pid.suffix, ".fixedoutput");

  const SuffixRule ao = ActivationRules::resolve(6, 4, tables);
  EXPECT_FALSE(ao.skip);
  EXPECT_EQ(ao.suffix, ".activate");
}

TEST(ActivationRulesTest, QualifierTwoSkipsEverythingButTotalizer) {
  const ConfigTables tables;
  EXPECT_TRUE(ActivationRules::resolve(2, 2, tables).skip);
  EXPECT_TRUE(ActivationRules::resolve(8, 2, tables).skip);

  const SuffixRule reset = ActivationRules::resolve(14, 2, tables);
  EXPECT_FALSE(reset.skip);
  EXPECT_EQ(reset.suffix, ".ResetTotalizer");
}

TEST(ActivationRulesTest, TotalizerAndPidOtherVariants) {
  const ConfigTables tables;
  EXPECT_EQ(ActivationRules::resolve(14, 0, tables).suffix, ".EnableTotalizer");
  EXPECT_EQ(ActivationRules::resolve(14, 1, tables).suffix, ".EnableTotalizer");
  EXPECT_EQ(ActivationRules::resolve(8, 0, tables).suffix, ".closeloop");
  EXPECT_EQ(ActivationRules::resolve(8, 1, tables).suffix, ".closeloop");
}

TEST(ActivationRulesTest, PlainSuffixesFromDefaults) {
  const ConfigTables tables;
  EXPECT_EQ(ActivationRules::resolve(0, 0, tables).suffix, ".activate");
  EXPECT_EQ(ActivationRules::resolve(1, 0, tables).suffix, ".activateLL");
  EXPECT_EQ(ActivationRules::resolve(2, 1, tables).suffix, ".activateUL");
  EXPECT_EQ(ActivationRules::resolve(13, 0, tables).suffix, ".activate");

  const SuffixRule comm = ActivationRules::resolve(10, 0, tables);
  EXPECT_FALSE(comm.skip);
  EXPECT_TRUE(comm.suffix.isEmpty());
}

TEST(ActivationRulesTest, UnknownCodesDegradeToEmptySuffix) {
  const ConfigTables tables;
  const SuffixRule rule = ActivationRules::resolve(42, 0, tables);
  EXPECT_FALSE(rule.skip);
  EXPECT_EQ(rule.suffix, "");

  const SuffixRule oddQualifier = ActivationRules::resolve(0, 17, tables);
  EXPECT_FALSE(oddQualifier.skip);
  EXPECT_EQ(oddQualifier.suffix, ".activate");
}

TEST(ActivationRulesTest, QualifierEntryOnOtherDeviceUsesOtherVariant) {
  ConfigTables tables;
  tables.suffixRules[6] = SuffixEntry::byQualifier(4, ".matched", ".fallback");

  EXPECT_EQ(ActivationRules::resolve(6, 4, tables).suffix, ".fallback");
  EXPECT_EQ(ActivationRules::resolve(6, 0, tables).suffix, ".fallback");
}

TEST(ActivationRulesTest, EmittedActivationsDropSkippedAndKeepOrder) {
  const ConfigTables tables;
  StepGroup step;
  step.stepIndex = 3;
  step.stepName = "Heat";
  step.activations << makeActivation(3, 0, 0, "V101")
                   << makeActivation(3, 0, 3, "V102")
                   << makeActivation(3, 8, 4, "TIC201")
                   << makeActivation(3, 14, 2, "FQ301");

  const QList<ResolvedActivation> out = ActivationRules::emittedActivations(step, tables);
  ASSERT_EQ(out.size(), 3);
  EXPECT_EQ(out[0].tagWithSuffix, "V101.activate");
  EXPECT_EQ(out[1].tagWithSuffix, "TIC201.fixedoutput");
  EXPECT_EQ(out[1].suffix, ".fixedoutput");
  EXPECT_EQ(out[1].source.tag, "TIC201");
  EXPECT_EQ(out[2].tagWithSuffix, "FQ301.ResetTotalizer");
}

TEST(ActivationRulesTest, LineCountIsHeadingsPlusEmittedActivations) {
  const ConfigTables tables;

  StepGroup idle;
  idle.stepIndex = 0;
  idle.stepName = "Idle";

  StepGroup fill;
  fill.stepIndex = 1;
  fill.stepName = "Fill";
  fill.activations << makeActivation(1, 0, 0, "V101")
                   << makeActivation(1, 7, 4, "P101")   // skipped
                   << makeActivation(1, 6, 0, "FCV1");

  EXPECT_EQ(ActivationRules::emittedLineCount({idle, fill}, tables), 2 + 2);
  EXPECT_EQ(ActivationRules::emittedLineCount({}, tables), 0);
}
