#pragma once
#include <QString>
#include <QList>
#include "../models/Activation.h"

class ConfigTables;

// 规则解析结果：要么跳过，要么给出后缀（可为空串）
struct SuffixRule {
    bool    skip = false;
    QString suffix;

    static SuffixRule skipped()                       { return {true, QString()}; }
    static SuffixRule withSuffix(const QString& text) { return {false, text}; }
};

// ─────────────────────────────────────────────────────────────
// ActivationRules — 根据 iType / iPIDType 决定激活是否输出及其后缀
//
// 跳过规则（按顺序，先命中者生效）：
//   1. iPIDType == 3                                → 跳过
//   2. iPIDType == 4 且 iType ∈ {0,1,2,7,10,14}     → 跳过
//   3. iPIDType == 2 且 iType != 14                  → 跳过
//
// 未配置的 iType 返回空后缀，不报错。
// ─────────────────────────────────────────────────────────────
class ActivationRules {
public:
    static bool       shouldSkip(int deviceClassCode, int qualifierCode);
    static SuffixRule resolve(int deviceClassCode, int qualifierCode,
                              const ConfigTables& tables);

    // 单个步骤中实际输出的激活项（已剔除被跳过的）
    static QList<ResolvedActivation> emittedActivations(const StepGroup& step,
                                                        const ConfigTables& tables);

    // 步骤标题行数 + 激活行数。L5X 头部 TargetCount 与正文共用同一套规则
    static int emittedLineCount(const QList<StepGroup>& steps,
                                const ConfigTables& tables);
};
