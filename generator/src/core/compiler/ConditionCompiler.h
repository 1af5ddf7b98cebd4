#pragma once
#include <QString>
#include <QStringList>
#include <QMap>
#include "../models/ConditionSpec.h"

// ─────────────────────────────────────────────────────────────
// ConditionCompiler — 激活条件 DSL → ClauseIR
//
// 语法（一层 OR-of-AND）：
//   expr     := conj { " OR " conj }
//   conj     := ["("] label { " AND " label } [")"]
//   label    := "X" digits
//
// 没有条件（或 literals 为空）时返回默认门控：单个 fallbackTag 触点。
// 未定义或位号为空的标签从结果中去掉，并记入 unresolved（供调用方告警）。
// 只有 X1 且其位号为空时退回默认门控。
// ─────────────────────────────────────────────────────────────
class ConditionCompiler {
public:
    static ClauseIR compile(const ConditionSpec* spec,
                            const QString& fallbackTag,
                            QStringList* unresolved = nullptr);

    // 单触点 IR
    static ClauseIR single(const QString& tag, bool negated = false);

    // 表达式中引用但 literals 里没有定义的标签
    static QStringList unresolvedLabels(const ConditionSpec& spec);

    // label → literal（后出现的同名标签覆盖先前的）
    static QMap<QString, ConditionLiteral> literalTable(const ConditionSpec& spec);

private:
    static QList<ClauseLiteral> compileConjunction(const QString& text,
                                                   const QMap<QString, ConditionLiteral>& table,
                                                   QStringList* unresolved);
};
