#pragma once
#include "IActivationSource.h"
#include <QJsonObject>

// ─────────────────────────────────────────────────────────────────────────────
// JsonActivationSource — 从 JSON 文件读取激活记录与激活条件
//
// {
//   "activations": [
//     { "phase_instance_id": 1, "step_no": 1, "step_name": "Fill",
//       "i_type": 0, "pid_type": 0, "tag_name": "V101" },
//     { "step_no": 2, "step_name": "Hold", "tag_name": null }
//   ],
//   "activation_conditions": {
//     "1": { "V101.activate": { "expression": "X1 AND X2",
//                               "conditions": [ { "label": "X1", "tag": "LS1", "negated": false } ] } }
//   }
// }
// ─────────────────────────────────────────────────────────────────────────────
class JsonActivationSource : public IActivationSource {
    Q_OBJECT
public:
    explicit JsonActivationSource(const QString& path, QObject* parent = nullptr);

    bool    open()                override;
    void    close()               override;
    bool    isOpen()      const   override { return m_open; }
    QString displayName() const   override;

    QList<Activation> fetchActivations(int phaseInstanceId = -1) override;
    QList<int>        phaseInstances()       const override;
    ConditionMap      activationConditions() const override { return m_conditions; }

    QString lastError() const { return m_lastError; }

    // 供测试 / 内存数据直接解析
    bool loadJson(const QByteArray& json);

    static ConditionMap parseConditions(const QJsonObject& obj);

private:
    void fail(const QString& reason);

    QString           m_path;
    bool              m_open = false;
    QList<Activation> m_rows;
    ConditionMap      m_conditions;
    QString           m_lastError;
};
