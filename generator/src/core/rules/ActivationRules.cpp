#include "ActivationRules.h"
#include "../models/ConfigTables.h"

namespace {

// iPIDType == 4 时需要跳过的 iType
static bool isFixedOutputExcluded(int deviceClassCode)
{
    switch (deviceClassCode) {
    case 0: case 1: case 2: case 7: case 10: case 14:
        return true;
    default:
        return false;
    }
}

constexpr int kPidDevice       = 8;    // PID 回路
constexpr int kTotalizerDevice = 14;   // 累计器

} // namespace

bool ActivationRules::shouldSkip(int deviceClassCode, int qualifierCode)
{
    if (qualifierCode == 3)
        return true;
    if (qualifierCode == 4 && isFixedOutputExcluded(deviceClassCode))
        return true;
    if (qualifierCode == 2 && deviceClassCode != kTotalizerDevice)
        return true;
    return false;
}

SuffixRule ActivationRules::resolve(int deviceClassCode, int qualifierCode,
                                    const ConfigTables& tables)
{
    if (shouldSkip(deviceClassCode, qualifierCode))
        return SuffixRule::skipped();

    auto it = tables.suffixRules.constFind(deviceClassCode);
    if (it == tables.suffixRules.constEnd())
        return SuffixRule::withSuffix(QString(""));

    const SuffixEntry& entry = it.value();
    if (entry.kind == SuffixEntry::Plain)
        return SuffixRule::withSuffix(entry.text);

    // 与 iPIDType 相关的后缀只对 PID(8) 和 TOT(14) 有意义
    switch (deviceClassCode) {
    case kPidDevice:
        return SuffixRule::withSuffix(qualifierCode == 4
            ? entry.variants.value(4, QString("")) : entry.other);
    case kTotalizerDevice:
        return SuffixRule::withSuffix(qualifierCode == 2
            ? entry.variants.value(2, QString("")) : entry.other);
    default:
        return SuffixRule::withSuffix(entry.other);
    }
}

QList<ResolvedActivation> ActivationRules::emittedActivations(const StepGroup& step,
                                                              const ConfigTables& tables)
{
    QList<ResolvedActivation> out;
    for (const Activation& act : step.activations) {
        const SuffixRule rule = resolve(act.deviceClassCode, act.qualifierCode, tables);
        if (rule.skip) continue;
        out << ResolvedActivation{act, rule.suffix, act.tag + rule.suffix};
    }
    return out;
}

int ActivationRules::emittedLineCount(const QList<StepGroup>& steps,
                                      const ConfigTables& tables)
{
    int total = 0;
    for (const StepGroup& step : steps)
        total += 1 + static_cast<int>(emittedActivations(step, tables).size());
    return total;
}
