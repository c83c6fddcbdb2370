#include "QtPdfTemplate/ExpressionResolver.hpp"
#include "cache/LruCache.hpp"
#include "expr/Expression.hpp"
#include <QDebug>

namespace QtPdfTemplate {

using CompiledPtr = std::shared_ptr<const expr::CompiledTemplate>;

struct ExpressionResolver::Impl {
    explicit Impl(int capacity) : compiled(capacity) {}

    // Compile outside the cache lock; two threads racing on the same source both compile and the last insert wins.
    CompiledPtr compile(const QString &source) {
        if(auto hit = compiled.get(source)) return *hit;
        CompiledPtr tpl = expr::CompiledTemplate::compile(source);
        compiled.put(source, tpl);
        return tpl;
    }

    cache::LruCache<QString, CompiledPtr> compiled;
};

ExpressionResolver::ExpressionResolver(int maxCompiled)
    : d(std::make_unique<Impl>(maxCompiled)) {}

ExpressionResolver::~ExpressionResolver() = default;

const QString & ExpressionResolver::openMarker() {
    static const QString marker = QStringLiteral("{{");
    return marker;
}

QString ExpressionResolver::resolve(const QString &source, const QJsonObject &context) const {
    if(!source.contains(openMarker())) return source;
    try {
        return d->compile(source)->render(context);
    } catch(const expr::EvalError &e) {
        qDebug() << "ExpressionResolver: leaving template unresolved:" << source << "-" << e.what();
        return source;
    }
}

std::optional<QJsonValue> ExpressionResolver::evaluate(const QString &expression, const QJsonObject &context) const {
    const QString wrapped = openMarker() + QLatin1Char(' ') + expression + QStringLiteral(" }}");
    try {
        const CompiledPtr tpl = d->compile(wrapped);
        if(!tpl->isSingleExpression()) return std::nullopt;
        const QJsonValue v = tpl->evaluateSingle(context);
        if(v.isUndefined()) return std::nullopt;
        return v;
    } catch(const expr::EvalError &e) {
        qDebug() << "ExpressionResolver: cannot evaluate" << expression << "-" << e.what();
        return std::nullopt;
    }
}

std::optional<bool> ExpressionResolver::evaluateCondition(const QString &expression, const QJsonObject &context) const {
    const auto v = evaluate(expression, context);
    if(!v) return std::nullopt;
    return expr::truthy(*v);
}

int ExpressionResolver::cachedCount() const { return d->compiled.size(); }
int ExpressionResolver::capacity() const { return d->compiled.capacity(); }

} // namespace QtPdfTemplate
