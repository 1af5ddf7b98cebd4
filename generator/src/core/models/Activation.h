#pragma once
#include <QString>
#include <QList>

// 一条步骤激活记录（对应数据源中的一行）
//   tag 为空 → 该步骤没有激活，只输出步骤标题
struct Activation {
    int     phaseInstanceId = -1;  // Phase Instance（未知 = -1）
    int     stepIndex       = 0;   // 步骤号（同一步骤集合内唯一）
    QString stepName;              // 步骤显示名
    int     deviceClassCode = 0;   // iType：设备类别
    int     qualifierCode   = 0;   // iPIDType：细分类型（缺省 = 0）
    QString tag;                   // 输出位号（可空）

    bool hasTag() const { return !tag.isNull() && !tag.isEmpty(); }
};

// 按步骤分组后的结果，生成过程中只读
struct StepGroup {
    int               stepIndex = 0;
    QString           stepName;
    QList<Activation> activations;   // 仅包含带 tag 的记录，保持输入顺序
};

// 通过规则解析后的激活项
struct ResolvedActivation {
    Activation source;
    QString    suffix;         // 可为空字符串
    QString    tagWithSuffix;  // source.tag + suffix
};
