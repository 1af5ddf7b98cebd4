// test_json_activation_source.cpp - activation rows and conditions from JSON

#include "source/JsonActivationSource.h"

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include <gtest/gtest.h>

namespace {

const char* kSample = R"({
  "activations": [
    { "phase_instance_id": 2, "step_no": 3, "step_name": "Heat", "i_type": 8, "pid_type": 4, "tag_name": "TIC201" },
    { "phase_instance_id": 1, "step_no": 1, "step_name": "Fill", "i_type": 0, "pid_type": null, "tag_name": "V101" },
    { "phase_instance_id": 1, "step_no": 0, "step_name": "Idle", "tag_name": null },
    { "phase_instance_id": 1, "step_no": 1, "step_name": "Fill", "i_type": 1, "tag_name": "V102" }
  ],
  "activation_conditions": {
    "1": {
      "V101.activate": {
        "expression": "X1 OR X2",
        "conditions": [
          { "label": "X1", "tag": "LS1" },
          { "label": "X2", "tag": "LS2", "negated": true }
        ]
      }
    },
    "not-a-step": { "ignored": {} }
  }
})";

} // namespace

TEST(JsonActivationSourceTest, RowsAreSortedByStepKeepingOrderWithinStep) {
  JsonActivationSource source("unused.json");
  ASSERT_TRUE(source.loadJson(kSample)) << source.lastError().toStdString();
  EXPECT_TRUE(source.isOpen());

  const QList<Activation> rows = source.fetchActivations();
  ASSERT_EQ(rows.size(), 4);
  EXPECT_EQ(rows[0].stepIndex, 0);
  EXPECT_EQ(rows[1].tag, "V101");
  EXPECT_EQ(rows[2].tag, "V102");
  EXPECT_EQ(rows[3].stepIndex, 3);
}

TEST(JsonActivationSourceTest, NullAndMissingFieldsDefault) {
  JsonActivationSource source("unused.json");
  ASSERT_TRUE(source.loadJson(kSample));

  const QList<Activation> rows = source.fetchActivations();
  const Activation& idle = rows[0];
  EXPECT_FALSE(idle.hasTag());
  EXPECT_EQ(idle.deviceClassCode, 0);
  EXPECT_EQ(idle.qualifierCode, 0);

  const Activation& v101 = rows[1];
  EXPECT_EQ(v101.qualifierCode, 0);
  EXPECT_EQ(v101.phaseInstanceId, 1);

  const Activation& tic = rows[3];
  EXPECT_EQ(tic.deviceClassCode, 8);
  EXPECT_EQ(tic.qualifierCode, 4);
  EXPECT_EQ(tic.stepName, "Heat");
}

TEST(JsonActivationSourceTest, PhaseFilter) {
  JsonActivationSource source("unused.json");
  ASSERT_TRUE(source.loadJson(kSample));

  EXPECT_EQ(source.phaseInstances(), (QList<int>{1, 2}));
  EXPECT_EQ(source.fetchActivations(1).size(), 3);
  ASSERT_EQ(source.fetchActivations(2).size(), 1);
  EXPECT_EQ(source.fetchActivations(2).first().tag, "TIC201");
  EXPECT_TRUE(source.fetchActivations(9).isEmpty());
}

TEST(JsonActivationSourceTest, ConditionsAreKeyedByStepAndSuffixedTag) {
  JsonActivationSource source("unused.json");
  ASSERT_TRUE(source.loadJson(kSample));

  const ConditionMap conditions = source.activationConditions();
  ASSERT_EQ(conditions.size(), 1);
  ASSERT_TRUE(conditions.value(1).contains("V101.activate"));

  const ConditionSpec spec = conditions.value(1).value("V101.activate");
  EXPECT_EQ(spec.expression, "X1 OR X2");
  ASSERT_EQ(spec.literals.size(), 2);
  EXPECT_EQ(spec.literals[0].tag, "LS1");
  EXPECT_FALSE(spec.literals[0].negated);
  EXPECT_EQ(spec.literals[1].label, "X2");
  EXPECT_TRUE(spec.literals[1].negated);
}

TEST(JsonActivationSourceTest, ConditionDefaults) {
  const ConditionMap map = JsonActivationSource::parseConditions(
      QJsonDocument::fromJson(R"({ "4": { "P1.activate": { "conditions": [ { "tag": "A" } ] } } })")
          .object());

  const ConditionSpec spec = map.value(4).value("P1.activate");
  EXPECT_EQ(spec.expression, "X1");
  ASSERT_EQ(spec.literals.size(), 1);
  EXPECT_EQ(spec.literals[0].label, "X1");
}

TEST(JsonActivationSourceTest, RejectsMalformedInput) {
  JsonActivationSource source("unused.json");
  QStringList errors;
  QObject::connect(&source, &IActivationSource::errorOccurred,
                   [&errors](const QString& msg) { errors << msg; });

  EXPECT_FALSE(source.loadJson("{ broken"));
  EXPECT_FALSE(source.loadJson(R"({ "rows": [] })"));
  EXPECT_FALSE(source.loadJson(R"({ "activations": [ { "step_name": "NoNumber" } ] })"));
  EXPECT_FALSE(source.isOpen());
  EXPECT_EQ(errors.size(), 3);
  EXPECT_TRUE(source.lastError().contains("step_no"));
}

TEST(JsonActivationSourceTest, FetchBeforeOpenFails) {
  JsonActivationSource source("unused.json");
  EXPECT_TRUE(source.fetchActivations().isEmpty());
  EXPECT_FALSE(source.lastError().isEmpty());
}

TEST(JsonActivationSourceTest, OpenReadsFile) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString path = QDir(dir.path()).filePath("activations.json");
  {
    QFile f(path);
    ASSERT_TRUE(f.open(QFile::WriteOnly));
    f.write(kSample);
  }

  JsonActivationSource source(path);
  EXPECT_EQ(source.displayName(), "JSON activations.json");
  ASSERT_TRUE(source.open()) << source.lastError().toStdString();
  EXPECT_EQ(source.fetchActivations().size(), 4);

  source.close();
  EXPECT_FALSE(source.isOpen());
}

TEST(JsonActivationSourceTest, OpenMissingFileFails) {
  JsonActivationSource source("/nonexistent/activations.json");
  EXPECT_FALSE(source.open());
  EXPECT_TRUE(source.lastError().contains("Cannot open"));
}
