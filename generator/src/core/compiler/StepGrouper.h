#pragma once
#include <QList>
#include "../models/Activation.h"

// ─────────────────────────────────────────────────────────────
// StepGrouper — 扁平的激活记录 → 按步骤号升序的 StepGroup 列表
//
//   · 步骤名取该步骤第一条记录的 stepName
//   · 没有 tag 的占位记录只保留步骤本身，不进入 activations
//   · 同一步骤内保持输入顺序
// ─────────────────────────────────────────────────────────────
class StepGrouper {
public:
    static QList<StepGroup> group(const QList<Activation>& activations);
};
