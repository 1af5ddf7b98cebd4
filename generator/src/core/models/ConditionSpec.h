#pragma once
#include <QString>
#include <QList>
#include <QMap>

// ─────────────────────────────────────────────────────────────
// 激活条件 DSL
//
//   expression : "X1", "X1 AND X2", "(X1 AND X2) OR X3" …
//   literals   : X1/X2/… 各自对应的位号与取反标记
//
// 语法只支持一层 OR-of-AND。
// ─────────────────────────────────────────────────────────────
struct ConditionLiteral {
    QString label;            // "X1"
    QString tag;              // "StepFlag[3].Flag" / "LS101.Value" …
    bool    negated = false;
};

struct ConditionSpec {
    QString                 expression;
    QList<ConditionLiteral> literals;
};

// stepIndex → (带后缀的位号 → 条件)
using ConditionMap = QMap<int, QMap<QString, ConditionSpec>>;

// ─────────────────────────────────────────────────────────────
// ClauseIR — 条件编译后的规范形式
//   disjuncts 之间为 OR，disjunct 内部为 AND
// ─────────────────────────────────────────────────────────────
struct ClauseLiteral {
    QString tag;
    bool    negated = false;

    bool operator==(const ClauseLiteral& o) const {
        return tag == o.tag && negated == o.negated;
    }
};

struct ClauseIR {
    QList<QList<ClauseLiteral>> disjuncts;

    bool isSingleLiteral() const {
        return disjuncts.size() == 1 && disjuncts.first().size() == 1;
    }
    bool operator==(const ClauseIR& o) const { return disjuncts == o.disjuncts; }
};
