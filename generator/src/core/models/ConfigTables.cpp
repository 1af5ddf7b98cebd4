#include "ConfigTables.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace {

const QString kTypeKey   = QStringLiteral("type_mapping");
const QString kSuffixKey = QStringLiteral("suffix_mapping");
const QString kPidKey    = QStringLiteral("pid_type_mapping");

const QString kVariantPrefix = QStringLiteral("pid_type_");
const QString kVariantOther  = QStringLiteral("pid_type_other");

// "8" → 8；非数字键返回 false
static bool codeFromKey(const QString& key, int& code)
{
    bool ok = false;
    code = key.toInt(&ok);
    return ok;
}

static QMap<int, QString> parseNameTable(const QJsonObject& obj)
{
    QMap<int, QString> table;
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        int code = 0;
        if (!codeFromKey(it.key(), code) || !it.value().isString()) continue;
        table[code] = it.value().toString();
    }
    return table;
}

static QMap<int, SuffixEntry> parseSuffixTable(const QJsonObject& obj)
{
    QMap<int, SuffixEntry> table;
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        int code = 0;
        if (!codeFromKey(it.key(), code)) continue;

        const QJsonValue v = it.value();
        if (v.isString()) {
            table[code] = SuffixEntry::plain(v.toString());
        } else if (v.isObject()) {
            SuffixEntry e;
            e.kind = SuffixEntry::ByQualifier;
            const QJsonObject variants = v.toObject();
            for (auto vit = variants.constBegin(); vit != variants.constEnd(); ++vit) {
                if (vit.key() == kVariantOther) {
                    e.other = vit.value().toString();
                    continue;
                }
                int q = 0;
                if (vit.key().startsWith(kVariantPrefix)
                    && codeFromKey(vit.key().mid(kVariantPrefix.size()), q))
                    e.variants[q] = vit.value().toString();
            }
            table[code] = e;
        }
    }
    return table;
}

static QJsonObject nameTableToJson(const QMap<int, QString>& table)
{
    QJsonObject obj;
    for (auto it = table.cbegin(); it != table.cend(); ++it)
        obj.insert(QString::number(it.key()), it.value());
    return obj;
}

static QJsonObject suffixTableToJson(const QMap<int, SuffixEntry>& table)
{
    QJsonObject obj;
    for (auto it = table.cbegin(); it != table.cend(); ++it) {
        const SuffixEntry& e = it.value();
        if (e.kind == SuffixEntry::Plain) {
            obj.insert(QString::number(it.key()), e.text);
            continue;
        }
        QJsonObject variants;
        for (auto vit = e.variants.cbegin(); vit != e.variants.cend(); ++vit)
            variants.insert(kVariantPrefix + QString::number(vit.key()), vit.value());
        variants.insert(kVariantOther, e.other);
        obj.insert(QString::number(it.key()), variants);
    }
    return obj;
}

} // namespace

// ─────────────────────────────────────────────────────────────
// SuffixEntry
// ─────────────────────────────────────────────────────────────
SuffixEntry SuffixEntry::plain(const QString& text)
{
    SuffixEntry e;
    e.kind = Plain;
    e.text = text;
    return e;
}

SuffixEntry SuffixEntry::byQualifier(int qualifier, const QString& matched,
                                     const QString& other)
{
    SuffixEntry e;
    e.kind = ByQualifier;
    e.variants[qualifier] = matched;
    e.other = other;
    return e;
}

// ─────────────────────────────────────────────────────────────
// 默认映射
// ─────────────────────────────────────────────────────────────
QMap<int, QString> ConfigTables::defaultTypeMapping()
{
    return {
        {0,  "V"},
        {1,  "V"},
        {2,  "V"},
        {6,  "AO"},
        {7,  "DO"},
        {8,  "PID"},
        {10, "Comm"},
        {13, "VSD"},
        {14, "TOT"},
    };
}

QMap<int, SuffixEntry> ConfigTables::defaultSuffixMapping()
{
    return {
        {0,  SuffixEntry::plain(".activate")},
        {1,  SuffixEntry::plain(".activateLL")},
        {2,  SuffixEntry::plain(".activateUL")},
        {6,  SuffixEntry::plain(".activate")},
        {7,  SuffixEntry::plain(".activate")},
        {8,  SuffixEntry::byQualifier(4, ".fixedoutput", ".closeloop")},
        {10, SuffixEntry::plain("")},
        {13, SuffixEntry::plain(".activate")},
        {14, SuffixEntry::byQualifier(2, ".ResetTotalizer", ".EnableTotalizer")},
    };
}

QMap<int, QString> ConfigTables::defaultPidTypeMapping()
{
    return {
        {0, "N"},
        {1, "S"},
        {2, "R"},
        {3, "SP"},
        {4, "FO"},
    };
}

ConfigTables::ConfigTables()
    : deviceTypeNames(defaultTypeMapping())
    , suffixRules(defaultSuffixMapping())
    , qualifierNames(defaultPidTypeMapping())
{}

// ─────────────────────────────────────────────────────────────
// JSON 读写
// ─────────────────────────────────────────────────────────────
bool ConfigTables::fromJson(const QByteArray& json)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError) {
        m_lastError = QString("JSON parse error at offset %1: %2")
                      .arg(err.offset).arg(err.errorString());
        return false;
    }
    if (!doc.isObject()) {
        m_lastError = "Config root is not a JSON object";
        return false;
    }

    // 缺失的顶层键沿用默认表
    const QJsonObject root = doc.object();
    deviceTypeNames = root.contains(kTypeKey)
        ? parseNameTable(root.value(kTypeKey).toObject()) : defaultTypeMapping();
    suffixRules     = root.contains(kSuffixKey)
        ? parseSuffixTable(root.value(kSuffixKey).toObject()) : defaultSuffixMapping();
    qualifierNames  = root.contains(kPidKey)
        ? parseNameTable(root.value(kPidKey).toObject()) : defaultPidTypeMapping();

    m_lastError.clear();
    return true;
}

QByteArray ConfigTables::toJson() const
{
    QJsonObject root;
    root.insert(kTypeKey,   nameTableToJson(deviceTypeNames));
    root.insert(kSuffixKey, suffixTableToJson(suffixRules));
    root.insert(kPidKey,    nameTableToJson(qualifierNames));
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

bool ConfigTables::loadFromFile(const QString& path)
{
    QFile f(path);
    if (!f.open(QFile::ReadOnly)) {
        m_lastError = QString("Cannot open config file: %1 (%2)").arg(path, f.errorString());
        return false;
    }
    return fromJson(f.readAll());
}

bool ConfigTables::saveToFile(const QString& path)
{
    QFile f(path);
    if (!f.open(QFile::WriteOnly | QFile::Truncate)) {
        m_lastError = QString("Cannot write config file: %1 (%2)").arg(path, f.errorString());
        return false;
    }
    const QByteArray data = toJson();
    if (f.write(data) != data.size()) {
        m_lastError = QString("Short write to config file: %1").arg(path);
        return false;
    }
    m_lastError.clear();
    return true;
}
