#include "ConditionCompiler.h"

namespace {

const QString kOr  = QStringLiteral(" OR ");
const QString kAnd = QStringLiteral(" AND ");

// 去掉所有括号与首尾空白
static QString stripParens(QString text)
{
    text.remove(QLatin1Char('('));
    text.remove(QLatin1Char(')'));
    return text.trimmed();
}

} // namespace

ClauseIR ConditionCompiler::single(const QString& tag, bool negated)
{
    ClauseIR ir;
    ir.disjuncts << QList<ClauseLiteral>{ ClauseLiteral{tag, negated} };
    return ir;
}

QMap<QString, ConditionLiteral> ConditionCompiler::literalTable(const ConditionSpec& spec)
{
    QMap<QString, ConditionLiteral> table;
    for (const ConditionLiteral& lit : spec.literals)
        table[lit.label.trimmed()] = lit;
    return table;
}

QList<ClauseLiteral>
ConditionCompiler::compileConjunction(const QString& text,
                                      const QMap<QString, ConditionLiteral>& table,
                                      QStringList* unresolved)
{
    QList<ClauseLiteral> chain;
    for (const QString& term : text.split(kAnd)) {
        const QString label = stripParens(term);
        if (label.isEmpty()) continue;

        // 没有位号的标签与未定义的标签同样处理
        auto it = table.constFind(label);
        if (it == table.constEnd() || it->tag.trimmed().isEmpty()) {
            if (unresolved && !unresolved->contains(label))
                *unresolved << label;
            continue;
        }
        chain << ClauseLiteral{it->tag, it->negated};
    }
    return chain;
}

ClauseIR ConditionCompiler::compile(const ConditionSpec* spec,
                                    const QString& fallbackTag,
                                    QStringList* unresolved)
{
    if (!spec || spec->literals.isEmpty())
        return single(fallbackTag);

    const QMap<QString, ConditionLiteral> table = literalTable(*spec);
    const QString expr = spec->expression.trimmed();

    // 最常见的情况：只有 X1
    if (expr == QLatin1String("X1") && spec->literals.size() == 1) {
        auto it = table.constFind(expr);
        if (it == table.constEnd())
            return single(fallbackTag);
        if (it->tag.trimmed().isEmpty()) {
            if (unresolved) *unresolved << expr;
            return single(fallbackTag);
        }
        return single(it->tag, it->negated);
    }

    ClauseIR ir;
    if (expr.contains(kOr)) {
        for (const QString& part : expr.split(kOr))
            ir.disjuncts << compileConjunction(part, table, unresolved);
    } else {
        ir.disjuncts << compileConjunction(expr, table, unresolved);
    }
    return ir;
}

QStringList ConditionCompiler::unresolvedLabels(const ConditionSpec& spec)
{
    QStringList unresolved;
    compile(&spec, QString(), &unresolved);
    return unresolved;
}
