#pragma once
#include <QString>
#include <QMap>
#include <QByteArray>

// ─────────────────────────────────────────────────────────────
// SuffixEntry — suffix_mapping 中的一项
//
//   Plain       : ".activate"
//   ByQualifier : { "pid_type_4": ".fixedoutput", "pid_type_other": ".closeloop" }
// ─────────────────────────────────────────────────────────────
struct SuffixEntry {
    enum Kind { Plain, ByQualifier };

    Kind               kind = Plain;
    QString            text;      // Plain
    QMap<int, QString> variants;  // ByQualifier：iPIDType → 后缀
    QString            other;     // ByQualifier：pid_type_other

    static SuffixEntry plain(const QString& text);
    static SuffixEntry byQualifier(int qualifier, const QString& matched,
                                   const QString& other);
};

// ─────────────────────────────────────────────────────────────
// ConfigTables — 三张映射表（type / suffix / pid_type）
//
// 每次运行加载一次，之后只以 const 引用传入规则解析与各生成器。
// 文件即 plc_config.json（type_mapping / suffix_mapping / pid_type_mapping）。
// ─────────────────────────────────────────────────────────────
class ConfigTables {
public:
    ConfigTables();   // 使用内置默认映射

    QMap<int, QString>     deviceTypeNames;  // type_mapping
    QMap<int, SuffixEntry> suffixRules;      // suffix_mapping
    QMap<int, QString>     qualifierNames;   // pid_type_mapping

    QString deviceTypeName(int code) const { return deviceTypeNames.value(code); }
    QString qualifierName(int code)  const { return qualifierNames.value(code); }

    // JSON 存档/读档。失败时保持原有内容不变，错误见 lastError()
    bool       loadFromFile(const QString& path);
    bool       saveToFile(const QString& path);
    bool       fromJson(const QByteArray& json);
    QByteArray toJson() const;

    QString lastError() const { return m_lastError; }

    static QMap<int, QString>     defaultTypeMapping();
    static QMap<int, SuffixEntry> defaultSuffixMapping();
    static QMap<int, QString>     defaultPidTypeMapping();

private:
    QString m_lastError;
};
