#include "JsonActivationSource.h"

#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSet>
#include <algorithm>

JsonActivationSource::JsonActivationSource(const QString& path, QObject* parent)
    : IActivationSource(parent), m_path(path)
{}

QString JsonActivationSource::displayName() const
{
    return QString("JSON %1").arg(QFileInfo(m_path).fileName());
}

void JsonActivationSource::fail(const QString& reason)
{
    m_lastError = reason;
    emit errorOccurred(reason);
}

bool JsonActivationSource::open()
{
    QFile f(m_path);
    if (!f.open(QFile::ReadOnly)) {
        fail(QString("Cannot open activation file: %1 (%2)").arg(m_path, f.errorString()));
        return false;
    }
    return loadJson(f.readAll());
}

void JsonActivationSource::close()
{
    m_rows.clear();
    m_conditions.clear();
    m_open = false;
}

// ─────────────────────────────────────────────────────────────────────────────
// 解析
// ─────────────────────────────────────────────────────────────────────────────
bool JsonActivationSource::loadJson(const QByteArray& json)
{
    close();

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError) {
        fail(QString("JSON parse error at offset %1: %2").arg(err.offset).arg(err.errorString()));
        return false;
    }
    const QJsonObject root = doc.object();
    if (!doc.isObject() || !root.value("activations").isArray()) {
        fail("Activation file has no \"activations\" array");
        return false;
    }

    QList<Activation> rows;
    const QJsonArray arr = root.value("activations").toArray();
    for (int i = 0; i < arr.size(); ++i) {
        const QJsonObject o = arr.at(i).toObject();
        if (!o.value("step_no").isDouble()) {
            fail(QString("Activation row %1 has no numeric \"step_no\"").arg(i));
            return false;
        }

        Activation a;
        a.phaseInstanceId = o.value("phase_instance_id").toInt(-1);
        a.stepIndex       = o.value("step_no").toInt();
        a.stepName        = o.value("step_name").toString();
        // iType / iPIDType 为 NULL 时按 0 处理
        a.deviceClassCode = o.value("i_type").toInt(0);
        a.qualifierCode   = o.value("pid_type").toInt(0);
        if (o.value("tag_name").isString())
            a.tag = o.value("tag_name").toString();
        rows << a;
    }

    // 按步骤号排序，同一步骤内保持文件中的顺序
    std::stable_sort(rows.begin(), rows.end(), [](const Activation& x, const Activation& y) {
        return x.stepIndex < y.stepIndex;
    });

    m_rows       = rows;
    m_conditions = parseConditions(root.value("activation_conditions").toObject());
    m_open       = true;
    m_lastError.clear();
    return true;
}

ConditionMap JsonActivationSource::parseConditions(const QJsonObject& obj)
{
    ConditionMap map;
    for (auto stepIt = obj.constBegin(); stepIt != obj.constEnd(); ++stepIt) {
        bool ok = false;
        const int stepNo = stepIt.key().toInt(&ok);
        if (!ok) continue;

        const QJsonObject perTag = stepIt.value().toObject();
        for (auto tagIt = perTag.constBegin(); tagIt != perTag.constEnd(); ++tagIt) {
            const QJsonObject c = tagIt.value().toObject();
            ConditionSpec spec;
            spec.expression = c.value("expression").toString("X1");
            for (const QJsonValue& v : c.value("conditions").toArray()) {
                const QJsonObject lo = v.toObject();
                ConditionLiteral lit;
                lit.label   = lo.value("label").toString("X1");
                lit.tag     = lo.value("tag").toString();
                lit.negated = lo.value("negated").toBool(false);
                spec.literals << lit;
            }
            map[stepNo][tagIt.key()] = spec;
        }
    }
    return map;
}

// ─────────────────────────────────────────────────────────────────────────────
// 查询
// ─────────────────────────────────────────────────────────────────────────────
QList<Activation> JsonActivationSource::fetchActivations(int phaseInstanceId)
{
    if (!m_open) {
        fail("Activation source is not open");
        return {};
    }
    if (phaseInstanceId < 0)
        return m_rows;

    QList<Activation> filtered;
    for (const Activation& a : m_rows)
        if (a.phaseInstanceId == phaseInstanceId) filtered << a;
    return filtered;
}

QList<int> JsonActivationSource::phaseInstances() const
{
    QSet<int> seen;
    for (const Activation& a : m_rows)
        if (a.phaseInstanceId >= 0) seen.insert(a.phaseInstanceId);
    QList<int> ids(seen.begin(), seen.end());
    std::sort(ids.begin(), ids.end());
    return ids;
}
