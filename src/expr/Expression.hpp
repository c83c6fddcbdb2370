/** \file Expression.hpp
 *  Sandboxed interpolation language used by template strings.
 *
 *  A template is literal text with {{ expression }} holes. Expressions are limited to:
 *   - names and dotted / subscript lookups into the data context (a.b, a[0], a["k"])
 *   - string, number, boolean and null literals
 *   - comparisons (== != < <= > >= in, not in, is [not] defined/none), and / or / not
 *   - '~' string concatenation
 *   - a fixed filter set: default, upper, lower, title, trim, length, join
 *  There is no call syntax, no attribute access on host objects, and no statement blocks.
 */
#pragma once
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <memory>
#include <stdexcept>
#include <vector>

namespace QtPdfTemplate::expr {

/** Raised for malformed templates (at compile time) and strict evaluation failures (undefined names, type mismatches). */
class EvalError : public std::runtime_error {
public:
    explicit EvalError(const QString &message) : std::runtime_error(message.toStdString()) {}
};

/** Expression tree node. Evaluation yields QJsonValue; QJsonValue::Undefined marks an unresolved lookup. */
class Node {
public:
    virtual ~Node() = default;
    virtual QJsonValue eval(const QJsonObject &scope) const = 0;
};
using NodePtr = std::unique_ptr<const Node>;

/** Parses a single expression (no braces). Throws EvalError on syntax errors. */
NodePtr parseExpression(const QString &source);

/** Strict truthiness: Undefined throws, null/false/0/""/[]/{} are false. */
bool truthy(const QJsonValue &value);

/** A parsed template: alternating literal text and expression holes. Immutable once built, safe to share. */
class CompiledTemplate {
public:
    /** Throws EvalError for unbalanced delimiters, statement/comment blocks or bad expressions. */
    static std::shared_ptr<const CompiledTemplate> compile(const QString &source);

    /** Concatenated output. Throws EvalError when a hole cannot be printed. */
    QString render(const QJsonObject &scope) const;

    /** Value of the sole hole when the template is exactly "{{ expr }}" (surrounding blanks allowed). */
    bool isSingleExpression() const;
    QJsonValue evaluateSingle(const QJsonObject &scope) const;

private:
    struct Part {
        QString text;
        NodePtr expression; // null for literal text
    };
    std::vector<Part> m_parts;
};

} // namespace QtPdfTemplate::expr
