#include "RockwellGenerator.h"
#include "ConditionCompiler.h"
#include "StepGrouper.h"
#include "../rules/ActivationRules.h"
#include "../models/ConfigTables.h"

#include <QBuffer>
#include <QLocale>
#include <QRegularExpression>
#include <QXmlStreamWriter>

// ═══════════════════════════════════════════════════════════════════════════
// 模块内部实现
// ═══════════════════════════════════════════════════════════════════════════
namespace {

const QString kRule   = QString(80, QLatin1Char('-'));
const QString kHeader = QString(80, QLatin1Char('='));

const QString kLang          = QStringLiteral("en-US");
const QString kStepFlagType  = QStringLiteral("PhaseControl_StepFlags");
const QString kBackingMember = QStringLiteral("ZZZZZZZZZZPhaseContr0");

// "Step 01 -- Fill"
static QString stepTitle(const StepGroup& step)
{
    return QString("Step %1 -- %2")
           .arg(step.stepIndex, 2, 10, QLatin1Char('0'))
           .arg(step.stepName);
}

static QString literalMnemonic(const ClauseLiteral& lit)
{
    const QString instr = lit.negated ? QStringLiteral("XIO") : QStringLiteral("XIC");
    return instr + QLatin1Char(' ') + lit.tag;
}

// <Description><LocalizedDescription Lang="en-US"><![CDATA[...]]>...
static void writeDescription(QXmlStreamWriter& xml, const QString& text)
{
    xml.writeStartElement("Description");
    xml.writeStartElement("LocalizedDescription");
    xml.writeAttribute("Lang", kLang);
    xml.writeCDATA(text);
    xml.writeEndElement();
    xml.writeEndElement();
}

static void writeComment(QXmlStreamWriter& xml, const QString& text)
{
    xml.writeStartElement("Comment");
    xml.writeStartElement("LocalizedComment");
    xml.writeAttribute("Lang", kLang);
    xml.writeCDATA(text);
    xml.writeEndElement();
    xml.writeEndElement();
}

static void writeBitMember(QXmlStreamWriter& xml, const QString& name, int bit,
                           const QString& description)
{
    xml.writeStartElement("Member");
    xml.writeAttribute("Name", name);
    xml.writeAttribute("DataType", "BIT");
    xml.writeAttribute("Dimension", "0");
    xml.writeAttribute("Radix", "Decimal");
    xml.writeAttribute("Hidden", "false");
    xml.writeAttribute("Target", kBackingMember);
    xml.writeAttribute("BitNumber", QString::number(bit));
    xml.writeAttribute("ExternalAccess", "Read/Write");
    writeDescription(xml, description);
    xml.writeEndElement();
}

static void writeBoolMember(QXmlStreamWriter& xml, const QString& name, bool value)
{
    xml.writeEmptyElement("DataValueMember");
    xml.writeAttribute("Name", name);
    xml.writeAttribute("DataType", "BOOL");
    xml.writeAttribute("Value", value ? "1" : "0");
}

static void writeRung(QXmlStreamWriter& xml, int number, const QString& comment,
                      const QString& text)
{
    xml.writeStartElement("Rung");
    xml.writeAttribute("Use", "Target");
    xml.writeAttribute("Number", QString::number(number));
    xml.writeAttribute("Type", "N");
    if (!comment.isEmpty())
        writeComment(xml, comment);
    xml.writeStartElement("Text");
    xml.writeCDATA(text);
    xml.writeEndElement();
    xml.writeEndElement();
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// IR → 助记符
// ═══════════════════════════════════════════════════════════════════════════

QString RockwellGenerator::stepFlagTag(int stepIndex)
{
    return QString("StepFlag[%1].Flag").arg(stepIndex);
}

QString RockwellGenerator::renderMnemonic(const ClauseIR& ir)
{
    auto chain = [](const QList<ClauseLiteral>& lits) {
        QStringList parts;
        for (const ClauseLiteral& lit : lits)
            parts << literalMnemonic(lit);
        return parts;
    };

    // 单分支：纯串联
    if (ir.disjuncts.size() <= 1)
        return ir.disjuncts.isEmpty() ? QString() : chain(ir.disjuncts.first()).join(' ');

    QStringList tokens;
    tokens << "BST";
    for (int i = 0; i < ir.disjuncts.size(); ++i) {
        if (i > 0) tokens << "NXB";
        tokens << chain(ir.disjuncts[i]);
    }
    tokens << "BND";
    return tokens.join(' ');
}

// "BST XIC A NXB XIO B BND" → "[XIC(A),XIO(B)]"
QString RockwellGenerator::toL5xText(const QString& mnemonic)
{
    static const QRegularExpression kInstr(QStringLiteral("\\b(XIC|XIO)\\s+(\\S+)"));

    QString text = mnemonic;
    text.replace(kInstr, QStringLiteral("\\1(\\2)"));
    text.replace(QStringLiteral("BST "), QStringLiteral("["));
    text.replace(QStringLiteral(" NXB "), QStringLiteral(","));
    text.replace(QStringLiteral(" BND"), QStringLiteral("]"));
    return text;
}

QDateTime RockwellGenerator::stamp() const
{
    return m_timestamp.isValid() ? m_timestamp : QDateTime::currentDateTime();
}

RockwellGenerator::RockwellGenerator(const ConfigTables& tables)
    : m_tables(tables)
{}

// 查找自定义条件；没有则以步骤自身的 StepFlag 门控
QString RockwellGenerator::conditionMnemonic(const StepGroup& step,
                                             const ResolvedActivation& act,
                                             const ConditionMap& conditions)
{
    const QString fallback = stepFlagTag(step.stepIndex);

    const ConditionSpec* spec = nullptr;
    auto stepIt = conditions.constFind(step.stepIndex);
    if (stepIt != conditions.constEnd()) {
        auto tagIt = stepIt->constFind(act.tagWithSuffix);
        if (tagIt != stepIt->constEnd())
            spec = &tagIt.value();
    }

    QStringList unresolved;
    const ClauseIR ir = ConditionCompiler::compile(spec, fallback, &unresolved);
    if (!unresolved.isEmpty()) {
        m_warnings << QString("Step %1, %2: undefined condition label(s) %3 ignored")
                      .arg(step.stepIndex).arg(act.tagWithSuffix, unresolved.join(", "));
    }

    // 任一分支为空即恒为真：整条梯级不带条件
    for (const QList<ClauseLiteral>& branch : ir.disjuncts) {
        if (branch.isEmpty()) {
            m_warnings << QString("Step %1, %2: condition has an empty branch, latch is unconditional")
                          .arg(step.stepIndex).arg(act.tagWithSuffix);
            return QString();
        }
    }
    return renderMnemonic(ir);
}

// ═══════════════════════════════════════════════════════════════════════════
// 文本输出
// ═══════════════════════════════════════════════════════════════════════════
QString RockwellGenerator::generateText(const QList<Activation>& activations,
                                        const ConditionMap& conditions)
{
    m_warnings.clear();

    QStringList out;
    out << kHeader;
    out << "Ladder code generated automatically";
    out << QString("Date: %1").arg(stamp().toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")));
    out << kHeader;
    out << "";

    for (const StepGroup& step : StepGrouper::group(activations)) {
        out << kRule;
        out << stepTitle(step);
        out << kRule;

        for (const ResolvedActivation& act : ActivationRules::emittedActivations(step, m_tables)) {
            const QString cond = conditionMnemonic(step, act, conditions);
            out << (cond.isEmpty() ? QString() : cond + QLatin1Char(' '))
                   + QStringLiteral("OTL ") + act.tagWithSuffix;
        }
        out << "";
    }

    return out.join('\n');
}

// ═══════════════════════════════════════════════════════════════════════════
// L5X 输出
// ═══════════════════════════════════════════════════════════════════════════

// PhaseControl_StepFlags：SINT 底层 + Flag/FlagLE/FlagGE 三个位
// FlagLE、FlagGE 目前不参与条件编译
void RockwellGenerator::writeDataTypes(QXmlStreamWriter& xml) const
{
    xml.writeStartElement("DataTypes");
    xml.writeAttribute("Use", "Context");

    xml.writeStartElement("DataType");
    xml.writeAttribute("Name", kStepFlagType);
    xml.writeAttribute("Family", "NoFamily");
    xml.writeAttribute("Class", "User");
    writeDescription(xml, "Step Flags for Each Step -");

    xml.writeStartElement("Members");
    xml.writeEmptyElement("Member");
    xml.writeAttribute("Name", kBackingMember);
    xml.writeAttribute("DataType", "SINT");
    xml.writeAttribute("Dimension", "0");
    xml.writeAttribute("Radix", "Decimal");
    xml.writeAttribute("Hidden", "true");
    xml.writeAttribute("ExternalAccess", "Read/Write");

    writeBitMember(xml, "Flag",   0, "- Equal to");
    writeBitMember(xml, "FlagLE", 1, "- Less than or Equal to");
    writeBitMember(xml, "FlagGE", 2, "- Greater than or Equal to");
    xml.writeEndElement(); // Members

    xml.writeEndElement(); // DataType
    xml.writeEndElement(); // DataTypes
}

// StepFlag[128]：元素 0 为初始步（Flag=1），其余为 0
void RockwellGenerator::writeStepFlagTag(QXmlStreamWriter& xml,
                                         const QList<StepGroup>& steps) const
{
    xml.writeStartElement("Tag");
    xml.writeAttribute("Name", "StepFlag");
    xml.writeAttribute("TagType", "Base");
    xml.writeAttribute("DataType", kStepFlagType);
    xml.writeAttribute("Dimensions", QString::number(kStepFlagCount));
    xml.writeAttribute("Constant", "false");
    xml.writeAttribute("ExternalAccess", "Read/Write");
    xml.writeAttribute("OpcUaAccess", "None");

    xml.writeStartElement("Comments");
    for (const StepGroup& step : steps) {
        xml.writeStartElement("Comment");
        xml.writeAttribute("Operand", QString("[%1]").arg(step.stepIndex));
        xml.writeStartElement("LocalizedComment");
        xml.writeAttribute("Lang", kLang);
        xml.writeCDATA(step.stepName);
        xml.writeEndElement();
        xml.writeEndElement();
    }
    xml.writeEndElement(); // Comments

    // L5K：[7] = Flag|FlagLE|FlagGE，[2] = FlagLE
    QStringList l5k;
    for (int i = 0; i < kStepFlagCount; ++i)
        l5k << (i == 0 ? "[7]" : "[2]");
    xml.writeStartElement("Data");
    xml.writeAttribute("Format", "L5K");
    xml.writeCDATA("[" + l5k.join(',') + "]");
    xml.writeEndElement();

    xml.writeStartElement("Data");
    xml.writeAttribute("Format", "Decorated");
    xml.writeStartElement("Array");
    xml.writeAttribute("DataType", kStepFlagType);
    xml.writeAttribute("Dimensions", QString::number(kStepFlagCount));
    for (int i = 0; i < kStepFlagCount; ++i) {
        const bool initial = (i == 0);
        xml.writeStartElement("Element");
        xml.writeAttribute("Index", QString("[%1]").arg(i));
        xml.writeStartElement("Structure");
        xml.writeAttribute("DataType", kStepFlagType);
        writeBoolMember(xml, "Flag",   initial);
        writeBoolMember(xml, "FlagLE", true);
        writeBoolMember(xml, "FlagGE", initial);
        xml.writeEndElement(); // Structure
        xml.writeEndElement(); // Element
    }
    xml.writeEndElement(); // Array
    xml.writeEndElement(); // Data

    xml.writeEndElement(); // Tag
}

void RockwellGenerator::writeRoutine(QXmlStreamWriter& xml, const QList<StepGroup>& steps,
                                     const ConditionMap& conditions)
{
    xml.writeStartElement("Routines");
    xml.writeAttribute("Use", "Context");
    xml.writeStartElement("Routine");
    xml.writeAttribute("Use", "Context");
    xml.writeAttribute("Name", m_routineName);
    xml.writeStartElement("RLLContent");
    xml.writeAttribute("Use", "Context");

    int rung = kFirstRungNumber;
    for (const StepGroup& step : steps) {
        // 步骤标题梯级：NOP + 注释
        writeRung(xml, rung++,
                  QString("%1\n%2\n%1").arg(kRule, stepTitle(step)),
                  "NOP();");

        for (const ResolvedActivation& act : ActivationRules::emittedActivations(step, m_tables)) {
            const QString cond = toL5xText(conditionMnemonic(step, act, conditions));
            writeRung(xml, rung++, QString(),
                      QString("%1OTL(%2);").arg(cond, act.tagWithSuffix));
        }
    }

    xml.writeEndElement(); // RLLContent
    xml.writeEndElement(); // Routine
    xml.writeEndElement(); // Routines
}

QString RockwellGenerator::generateL5x(const QList<Activation>& activations,
                                       const ConditionMap& conditions)
{
    m_warnings.clear();

    const QList<StepGroup> steps = StepGrouper::group(activations);
    for (const StepGroup& step : steps) {
        if (step.stepIndex < 0 || step.stepIndex >= kStepFlagCount)
            m_warnings << QString("Step %1 is outside StepFlag[0..%2]")
                          .arg(step.stepIndex).arg(kStepFlagCount - 1);
    }

    // 头部需要总梯级数，先用同一套规则预先统计
    const int targetCount = ActivationRules::emittedLineCount(steps, m_tables);
    const QString exportDate = QLocale::c().toString(stamp(), QStringLiteral("ddd MMM dd HH:mm:ss yyyy"));

    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);

    QXmlStreamWriter xml(&buffer);
    xml.setAutoFormatting(true);
    xml.setAutoFormattingIndent(0);
    xml.writeStartDocument("1.0", true);

    xml.writeStartElement("RSLogix5000Content");
    xml.writeAttribute("SchemaRevision", "1.0");
    xml.writeAttribute("SoftwareRevision", "37.00");
    xml.writeAttribute("TargetType", "Rung");
    xml.writeAttribute("TargetCount", QString::number(targetCount));
    xml.writeAttribute("CurrentLanguage", kLang);
    xml.writeAttribute("ContainsContext", "true");
    xml.writeAttribute("ExportDate", exportDate);
    xml.writeAttribute("ExportOptions",
                       "References NoRawData L5KData DecoratedData Context RoutineLabels "
                       "AliasExtras IOTags NoStringData ForceProtectedEncoding AllProjDocTrans");

    xml.writeStartElement("Controller");
    xml.writeAttribute("Use", "Context");
    xml.writeAttribute("Name", "_GEA_Codex");

    writeDataTypes(xml);

    xml.writeStartElement("Programs");
    xml.writeAttribute("Use", "Context");
    xml.writeStartElement("Program");
    xml.writeAttribute("Use", "Context");
    xml.writeAttribute("Name", m_programName);

    xml.writeStartElement("Tags");
    xml.writeAttribute("Use", "Context");
    writeStepFlagTag(xml, steps);
    xml.writeEndElement(); // Tags

    writeRoutine(xml, steps, conditions);

    xml.writeEndElement(); // Program
    xml.writeEndElement(); // Programs
    xml.writeEndElement(); // Controller
    xml.writeEndElement(); // RSLogix5000Content
    xml.writeEndDocument();

    return QString::fromUtf8(bytes);
}
