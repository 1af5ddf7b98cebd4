#pragma once
#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>
#include "../models/Activation.h"
#include "../models/ConditionSpec.h"

class ConfigTables;
class QXmlStreamWriter;

// ─────────────────────────────────────────────────────────────
// RockwellGenerator — 步骤激活 → Studio 5000 梯形图
//
// 两种输出共用同一套 IR → 助记符转换：
//   generateText() : 文本助记符  "XIC StepFlag[1].Flag OTL V101.activate"
//   generateL5x()  : 完整 .L5X（Rung 导出格式）
//
// 多分支条件使用 BST / NXB / BND，L5X 中对应 [ , ]。
// ─────────────────────────────────────────────────────────────
class RockwellGenerator {
public:
    static constexpr int kStepFlagCount   = 128;  // StepFlag 数组长度
    static constexpr int kFirstRungNumber = 2;    // 0、1 留给导出前导

    explicit RockwellGenerator(const ConfigTables& tables);

    // 导出时间（无效 → 当前时间），测试中固定以便比较输出
    void setTimestamp(const QDateTime& ts) { m_timestamp = ts; }
    void setRoutineName(const QString& name) { m_routineName = name; }
    void setProgramName(const QString& name) { m_programName = name; }

    QString generateText(const QList<Activation>& activations,
                         const ConditionMap& conditions = {});
    QString generateL5x(const QList<Activation>& activations,
                        const ConditionMap& conditions = {});

    // 最后一次生成过程中的告警（未定义的条件标签等）
    QStringList warnings() const { return m_warnings; }

    static QString stepFlagTag(int stepIndex);
    static QString renderMnemonic(const ClauseIR& ir);
    static QString toL5xText(const QString& mnemonic);

private:
    QString   conditionMnemonic(const StepGroup& step, const ResolvedActivation& act,
                                const ConditionMap& conditions);
    QDateTime stamp() const;

    void writeDataTypes(QXmlStreamWriter& xml) const;
    void writeStepFlagTag(QXmlStreamWriter& xml, const QList<StepGroup>& steps) const;
    void writeRoutine(QXmlStreamWriter& xml, const QList<StepGroup>& steps,
                      const ConditionMap& conditions);

    const ConfigTables& m_tables;
    QDateTime           m_timestamp;
    QString             m_routineName = "CM_Valve";
    QString             m_programName = "Phase01001_SEQ_DF_Master";
    QStringList         m_warnings;
};
