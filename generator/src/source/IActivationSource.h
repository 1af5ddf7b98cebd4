#pragma once
#include <QObject>
#include <QList>
#include <QString>
#include "../core/models/Activation.h"
#include "../core/models/ConditionSpec.h"

// ─────────────────────────────────────────────────────────────────────────────
// IActivationSource — 激活数据源纯虚接口
//
// 所有数据来源（JSON 文件、数据库导出…）实现此接口。
// GenerationJob 只依赖此接口，无需关心数据从哪里来。
//
// fetchActivations() 返回按步骤号排序的记录，包括没有激活的步骤
// （tag 为空），生成器需要为这些步骤输出标题。
// ─────────────────────────────────────────────────────────────────────────────
class IActivationSource : public QObject {
    Q_OBJECT
public:
    explicit IActivationSource(QObject* parent = nullptr) : QObject(parent) {}
    ~IActivationSource() override = default;

    virtual bool    open()                                        = 0;
    virtual void    close()                                       = 0;
    virtual bool    isOpen()                              const   = 0;
    virtual QString displayName()                         const   = 0;

    // phaseInstanceId < 0 → 不过滤
    virtual QList<Activation> fetchActivations(int phaseInstanceId = -1) = 0;
    virtual QList<int>        phaseInstances()            const   = 0;
    virtual ConditionMap      activationConditions()      const   = 0;

signals:
    void errorOccurred(const QString& msg);
};
