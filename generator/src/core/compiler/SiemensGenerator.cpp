#include "SiemensGenerator.h"
#include "ConditionCompiler.h"
#include "StepGrouper.h"
#include "../rules/ActivationRules.h"
#include "../models/ConfigTables.h"

#include <QMap>
#include <QRegularExpression>

namespace {

const QString kHeaderRule = QString(80, QLatin1Char('='));
const QString kIndent1    = QStringLiteral("    ");
const QString kIndent2    = QStringLiteral("        ");

} // namespace

SiemensGenerator::SiemensGenerator(const ConfigTables& tables)
    : m_tables(tables)
{}

QDateTime SiemensGenerator::stamp() const
{
    return m_timestamp.isValid() ? m_timestamp : QDateTime::currentDateTime();
}

QString SiemensGenerator::stepFlagRef(int stepIndex)
{
    return QString("#MyStepFlag.Step%1").arg(stepIndex, 3, 10, QLatin1Char('0'));
}

QString SiemensGenerator::convertStepFlag(const QString& tag)
{
    static const QRegularExpression kStepFlag(
        QStringLiteral("^StepFlag\\[(\\d+)\\]\\.Flag$"),
        QRegularExpression::CaseInsensitiveOption);

    const QRegularExpressionMatch m = kStepFlag.match(tag.trimmed());
    if (!m.hasMatch())
        return tag;
    return stepFlagRef(m.captured(1).toInt());
}

QString SiemensGenerator::renderCondition(const ConditionSpec& spec, int stepIndex)
{
    if (spec.literals.isEmpty())
        return stepFlagRef(stepIndex);

    QMap<QString, QString> rendered;
    for (const ConditionLiteral& lit : spec.literals) {
        if (lit.tag.trimmed().isEmpty()) continue;
        const QString tag = convertStepFlag(lit.tag);
        rendered[lit.label.trimmed()] = lit.negated ? QString("NOT %1").arg(tag) : tag;
    }

    // 按标签记号一次扫描：已替换的文本不再参与匹配，X10 也不会被当作 X1 + "0"
    static const QRegularExpression kLabel(QStringLiteral("\\bX\\d+\\b"));

    QString result;
    qsizetype pos = 0;
    QRegularExpressionMatchIterator it = kLabel.globalMatch(spec.expression);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        result += spec.expression.mid(pos, m.capturedStart() - pos);
        const QString label = m.captured();
        result += rendered.value(label, label);   // 未定义的标签原样保留
        pos = m.capturedEnd();
    }
    result += spec.expression.mid(pos);
    return result;
}

QString SiemensGenerator::conditionFor(const StepGroup& step, const ResolvedActivation& act,
                                       const ConditionMap& conditions)
{
    auto stepIt = conditions.constFind(step.stepIndex);
    if (stepIt == conditions.constEnd())
        return "TRUE";
    auto tagIt = stepIt->constFind(act.tagWithSuffix);
    if (tagIt == stepIt->constEnd())
        return "TRUE";

    const ConditionSpec& spec = tagIt.value();

    // SCL 直接替换表达式文本，编译器只用来检查标签
    const QStringList unresolved = ConditionCompiler::unresolvedLabels(spec);
    if (!unresolved.isEmpty()) {
        m_warnings << QString("Step %1, %2: undefined condition label(s) %3 left unreplaced")
                      .arg(step.stepIndex).arg(act.tagWithSuffix, unresolved.join(", "));
    }

    return renderCondition(spec, step.stepIndex);
}

QString SiemensGenerator::generateScl(const QList<Activation>& activations,
                                      const ConditionMap& conditions)
{
    m_warnings.clear();

    QStringList out;
    out << QString("(* %1 *)").arg(kHeaderRule);
    out << "(* SCL code generated automatically *)";
    out << QString("(* Date: %1 *)").arg(stamp().toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")));
    out << QString("(* %1 *)").arg(kHeaderRule);
    out << "";

    for (const StepGroup& step : StepGrouper::group(activations)) {
        out << QString("REGION Step %1 - %2")
               .arg(step.stepIndex, 2, 10, QLatin1Char('0'))
               .arg(step.stepName);

        // 无激活的步骤：IF 中只有 RETURN
        out << kIndent1 + QString("IF %1 THEN").arg(stepFlagRef(step.stepIndex));
        for (const ResolvedActivation& act : ActivationRules::emittedActivations(step, m_tables)) {
            out << kIndent2 + QString("\"%1\"%2 := %3;")
                   .arg(act.source.tag, act.suffix, conditionFor(step, act, conditions));
        }
        out << kIndent2 + "RETURN;";
        out << kIndent1 + "END_IF;";

        out << "END_REGION ;";
        out << "";
    }

    return out.join('\n');
}
