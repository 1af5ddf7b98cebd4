#pragma once
#include <QObject>
#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include "../core/models/Activation.h"
#include "../core/models/ConfigTables.h"

class IActivationSource;

// 一次生成任务的参数
struct GenerationRequest {
    QString   outputDir       = "output";
    QString   controller      = "all";   // rockwell / siemens / all
    int       phaseInstanceId = -1;      // < 0 → 全部
    QString   routineName     = "CM_Valve";
    QString   programName     = "Phase01001_SEQ_DF_Master";
    QDateTime timestamp;                  // 无效 → 当前时间
};

// ──────────────────────────────────────────────────────────────────
// GenerationJob — 一次完整的生成流程
//
//   loadConfig()  读取映射表（文件不存在时写出默认配置）
//   run()         取数据 → 生成 Rockwell / Siemens 代码 → 写文件
//   preview()     只做规则解析，返回每个步骤的激活清单
//
// 过程信息通过 logMessage 信号输出，不依赖任何界面。
// ──────────────────────────────────────────────────────────────────
class GenerationJob : public QObject {
    Q_OBJECT
public:
    static const QString kLadderTextFile;
    static const QString kLadderL5xFile;
    static const QString kSclFile;

    explicit GenerationJob(QObject* parent = nullptr);

    void                loadConfig(const QString& path);
    void                setConfig(const ConfigTables& tables) { m_config = tables; }
    const ConfigTables& config() const { return m_config; }

    bool        run(IActivationSource* source, const GenerationRequest& request);
    QJsonObject preview(IActivationSource* source, int phaseInstanceId = -1);

    // 映射表的可读文本（--show-config）
    QString describeConfig() const;

    QStringList filesWritten() const { return m_files; }
    QString     lastError()    const { return m_lastError; }

    static bool isValidController(const QString& controller);

signals:
    void logMessage(const QString& msg);
    void fileWritten(const QString& path);

private:
    bool fetch(IActivationSource* source, int phaseInstanceId, QList<Activation>& out);
    bool generate(IActivationSource* source, const GenerationRequest& request);
    bool writeFile(const QString& dir, const QString& name, const QString& content);
    void reportWarnings(const QStringList& warnings);
    bool fail(const QString& reason);

    ConfigTables m_config;
    QStringList  m_files;
    QString      m_lastError;
};
