#include "StepGrouper.h"
#include <QMap>

QList<StepGroup> StepGrouper::group(const QList<Activation>& activations)
{
    // QMap 按键升序遍历，即步骤号升序
    QMap<int, StepGroup> steps;
    for (const Activation& act : activations) {
        auto it = steps.find(act.stepIndex);
        if (it == steps.end()) {
            StepGroup g;
            g.stepIndex = act.stepIndex;
            g.stepName  = act.stepName;
            it = steps.insert(act.stepIndex, g);
        }
        if (act.hasTag())
            it->activations << act;
    }
    return steps.values();
}
