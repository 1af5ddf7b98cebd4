#include "GenerationJob.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>

#include "../core/compiler/RockwellGenerator.h"
#include "../core/compiler/SiemensGenerator.h"
#include "../core/compiler/StepGrouper.h"
#include "../core/rules/ActivationRules.h"
#include "../source/IActivationSource.h"

const QString GenerationJob::kLadderTextFile = QStringLiteral("rockwell_ladder.txt");
const QString GenerationJob::kLadderL5xFile  = QStringLiteral("rockwell_ladder.L5X");
const QString GenerationJob::kSclFile        = QStringLiteral("siemens_scl.scl");

GenerationJob::GenerationJob(QObject* parent)
    : QObject(parent)
{}

bool GenerationJob::isValidController(const QString& controller)
{
    return controller == "rockwell" || controller == "siemens" || controller == "all";
}

bool GenerationJob::fail(const QString& reason)
{
    m_lastError = reason;
    emit logMessage("Error: " + reason);
    return false;
}

void GenerationJob::reportWarnings(const QStringList& warnings)
{
    for (const QString& w : warnings)
        emit logMessage("Warning: " + w);
}

// ============================================================
// 配置：文件不存在 → 写出默认值；读取失败 → 沿用默认值
// ============================================================
void GenerationJob::loadConfig(const QString& path)
{
    m_config = ConfigTables();

    if (!QFileInfo::exists(path)) {
        if (m_config.saveToFile(path))
            emit logMessage(QString("Default configuration written to %1").arg(path));
        else
            emit logMessage("Warning: " + m_config.lastError());
        return;
    }

    if (m_config.loadFromFile(path))
        emit logMessage(QString("Configuration loaded from %1").arg(path));
    else
        emit logMessage(QString("Warning: %1. Using defaults.").arg(m_config.lastError()));
}

QString GenerationJob::describeConfig() const
{
    QStringList out;
    out << "Type mapping (iType):";
    for (auto it = m_config.deviceTypeNames.cbegin(); it != m_config.deviceTypeNames.cend(); ++it)
        out << QString("  %1: %2").arg(it.key()).arg(it.value());

    out << "Suffix mapping:";
    for (auto it = m_config.suffixRules.cbegin(); it != m_config.suffixRules.cend(); ++it) {
        const SuffixEntry& e = it.value();
        if (e.kind == SuffixEntry::Plain) {
            out << QString("  %1: %2").arg(it.key()).arg(e.text);
            continue;
        }
        out << QString("  %1:").arg(it.key());
        for (auto vit = e.variants.cbegin(); vit != e.variants.cend(); ++vit)
            out << QString("    pid_type_%1: %2").arg(vit.key()).arg(vit.value());
        out << QString("    pid_type_other: %1").arg(e.other);
    }

    out << "PID type mapping (iPIDType):";
    for (auto it = m_config.qualifierNames.cbegin(); it != m_config.qualifierNames.cend(); ++it)
        out << QString("  %1: %2").arg(it.key()).arg(it.value());

    return out.join('\n');
}

// ============================================================
// 取数据
// ============================================================
bool GenerationJob::fetch(IActivationSource* source, int phaseInstanceId,
                          QList<Activation>& out)
{
    if (!source)
        return fail("No activation source");
    if (!source->isOpen() && !source->open())
        return fail(QString("Cannot open %1").arg(source->displayName()));

    out = source->fetchActivations(phaseInstanceId);
    if (out.isEmpty()) {
        return fail(phaseInstanceId >= 0
            ? QString("No activations found for phase instance %1").arg(phaseInstanceId)
            : QString("No activations found"));
    }

    int withTag = 0;
    for (const Activation& a : out)
        if (a.hasTag()) ++withTag;
    emit logMessage(QString("%1 activations found in %2 records%3")
                    .arg(withTag).arg(out.size())
                    .arg(phaseInstanceId >= 0
                         ? QString(" (phase instance %1)").arg(phaseInstanceId)
                         : QString()));
    return true;
}

// ============================================================
// 写文件：QFile 离开作用域即关闭
// ============================================================
bool GenerationJob::writeFile(const QString& dir, const QString& name, const QString& content)
{
    const QString path = QDir(dir).filePath(name);
    QFile f(path);
    if (!f.open(QFile::WriteOnly | QFile::Truncate))
        return fail(QString("Cannot write %1 (%2)").arg(path, f.errorString()));

    const QByteArray data = content.toUtf8();
    if (f.write(data) != data.size())
        return fail(QString("Short write to %1").arg(path));

    m_files << path;
    emit logMessage(QString("Saved: %1").arg(path));
    emit fileWritten(path);
    return true;
}

// ============================================================
// 生成
// ============================================================
bool GenerationJob::run(IActivationSource* source, const GenerationRequest& request)
{
    m_files.clear();
    m_lastError.clear();

    if (!isValidController(request.controller))
        return fail(QString("Unknown controller type \"%1\"").arg(request.controller));

    // 数据源的错误同样转发到日志
    QMetaObject::Connection conn;
    if (source) {
        conn = connect(source, &IActivationSource::errorOccurred, this,
                       [this](const QString& msg) { emit logMessage("Source: " + msg); });
    }

    const bool ok = generate(source, request);

    if (conn)
        disconnect(conn);

    if (ok) {
        emit logMessage(QString("Generation complete, files saved in %1")
                        .arg(QDir(request.outputDir).absolutePath()));
    }
    return ok;
}

bool GenerationJob::generate(IActivationSource* source, const GenerationRequest& request)
{
    QList<Activation> activations;
    if (!fetch(source, request.phaseInstanceId, activations))
        return false;
    const ConditionMap conditions = source->activationConditions();

    if (!QDir().mkpath(request.outputDir))
        return fail(QString("Cannot create output directory %1").arg(request.outputDir));

    if (request.controller == "rockwell" || request.controller == "all") {
        RockwellGenerator rockwell(m_config);
        rockwell.setTimestamp(request.timestamp);
        rockwell.setRoutineName(request.routineName);
        rockwell.setProgramName(request.programName);

        emit logMessage("Generating Rockwell ladder (text) ...");
        const QString text = rockwell.generateText(activations, conditions);
        reportWarnings(rockwell.warnings());
        if (!writeFile(request.outputDir, kLadderTextFile, text))
            return false;

        emit logMessage("Generating Rockwell ladder (L5X) ...");
        const QString l5x = rockwell.generateL5x(activations, conditions);
        reportWarnings(rockwell.warnings());
        if (!writeFile(request.outputDir, kLadderL5xFile, l5x))
            return false;
    }

    if (request.controller == "siemens" || request.controller == "all") {
        SiemensGenerator siemens(m_config);
        siemens.setTimestamp(request.timestamp);

        emit logMessage("Generating Siemens SCL ...");
        const QString scl = siemens.generateScl(activations, conditions);
        reportWarnings(siemens.warnings());
        if (!writeFile(request.outputDir, kSclFile, scl))
            return false;
    }

    return true;
}

// ============================================================
// 预览：只列出有实际输出的步骤
// ============================================================
QJsonObject GenerationJob::preview(IActivationSource* source, int phaseInstanceId)
{
    m_lastError.clear();

    QList<Activation> activations;
    if (!fetch(source, phaseInstanceId, activations))
        return {};

    QJsonArray steps;
    int total = 0;
    for (const StepGroup& step : StepGrouper::group(activations)) {
        const QList<ResolvedActivation> emitted = ActivationRules::emittedActivations(step, m_config);
        if (emitted.isEmpty()) continue;

        QJsonArray acts;
        for (const ResolvedActivation& r : emitted) {
            QJsonObject o;
            o.insert("tag_name",        r.source.tag);
            o.insert("tag_with_suffix", r.tagWithSuffix);
            o.insert("i_type",          r.source.deviceClassCode);
            o.insert("pid_type",        r.source.qualifierCode);
            o.insert("type_name",       m_config.deviceTypeName(r.source.deviceClassCode));
            o.insert("pid_type_name",   m_config.qualifierName(r.source.qualifierCode));
            acts.append(o);
        }
        total += static_cast<int>(emitted.size());

        QJsonObject s;
        s.insert("step_no",     step.stepIndex);
        s.insert("step_name",   step.stepName);
        s.insert("activations", acts);
        steps.append(s);
    }

    QJsonObject result;
    result.insert("steps",             steps);
    result.insert("total_steps",       static_cast<int>(steps.size()));
    result.insert("total_activations", total);
    return result;
}
