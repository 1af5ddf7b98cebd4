#pragma once
#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>
#include "../models/Activation.h"
#include "../models/ConditionSpec.h"

class ConfigTables;

// ─────────────────────────────────────────────────────────────
// SiemensGenerator — 步骤激活 → TIA Portal SCL
//
//   REGION Step 01 - Fill
//       IF #MyStepFlag.Step001 THEN
//           "V101".activate := TRUE;
//           RETURN;
//       END_IF;
//   END_REGION ;
//
// 自定义条件直接在 DSL 文本上替换标签，AND / OR 原样保留。
// ─────────────────────────────────────────────────────────────
class SiemensGenerator {
public:
    explicit SiemensGenerator(const ConfigTables& tables);

    void setTimestamp(const QDateTime& ts) { m_timestamp = ts; }

    QString generateScl(const QList<Activation>& activations,
                        const ConditionMap& conditions = {});

    QStringList warnings() const { return m_warnings; }

    // StepFlag[N].Flag → #MyStepFlag.StepNNN；其他位号原样返回
    static QString convertStepFlag(const QString& tag);
    static QString stepFlagRef(int stepIndex);
    // DSL 表达式 → SCL 布尔表达式
    static QString renderCondition(const ConditionSpec& spec, int stepIndex);

private:
    QString   conditionFor(const StepGroup& step, const ResolvedActivation& act,
                           const ConditionMap& conditions);
    QDateTime stamp() const;

    const ConfigTables& m_tables;
    QDateTime           m_timestamp;
    QStringList         m_warnings;
};
