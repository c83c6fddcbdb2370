/** \file ExpressionResolver.hpp
 *  Resolves {{ ... }} interpolations in template strings against a data context.
 *  Resolution is best-effort: any compile or evaluation failure yields the original source text.
 */
#pragma once
#include "QtPdfTemplate/Export.hpp"
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <memory>
#include <optional>

namespace QtPdfTemplate {

/** Sandboxed resolver with a bounded LRU of compiled templates.
 *  Thread-safety: all methods may be called concurrently; one instance can be shared between engines.
 */
class QTPDFTEMPLATE_EXPORT ExpressionResolver {
public:
    /** maxCompiled bounds the compiled-template cache (0 disables caching). */
    explicit ExpressionResolver(int maxCompiled = 500);
    ~ExpressionResolver();
    ExpressionResolver(const ExpressionResolver &) = delete;
    ExpressionResolver & operator=(const ExpressionResolver &) = delete;

    /** Marker whose presence triggers compilation; strings without it are returned untouched. */
    static const QString & openMarker();

    /** Interpolated text, or source unchanged when it has no marker or cannot be resolved. */
    QString resolve(const QString &source, const QJsonObject &context) const;

    /** Value of a bare expression (no braces), e.g. "routine.dias | length". std::nullopt on any failure. */
    std::optional<QJsonValue> evaluate(const QString &expression, const QJsonObject &context) const;

    /** Truth value of a bare expression; std::nullopt when it cannot be evaluated. */
    std::optional<bool> evaluateCondition(const QString &expression, const QJsonObject &context) const;

    int cachedCount() const;
    int capacity() const;

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};

} // namespace QtPdfTemplate
