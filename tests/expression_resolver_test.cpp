// Expression resolver: interpolation, filters, strict undefined handling, sandbox limits, compiled cache bound
#include "QtPdfTemplate/ExpressionResolver.hpp"
#include <QJsonArray>
#include <cassert>
#include <iostream>

using namespace QtPdfTemplate;

int main() {
    const QJsonObject ctx{
        { "name", "Ana" },
        { "n", 5 },
        { "empty", "" },
        { "routine", QJsonObject{ { "uuid", "abc" }, { "dias", QJsonArray{ 1, 2, 3 } } } },
    };

    // Plain interpolation; text without a marker is never compiled
    {
        ExpressionResolver r(8);
        assert(r.resolve("plain text", ctx) == "plain text");
        assert(r.cachedCount() == 0);
        assert(r.resolve("Hola {{ name }}!", ctx) == "Hola Ana!");
        assert(r.resolve("{{name}}", ctx) == "Ana");
        assert(r.cachedCount() == 2);
        assert(r.resolve("{{ n }} items", ctx) == "5 items");
    }
    // Undefined names leave the source untouched
    {
        ExpressionResolver r;
        assert(r.resolve("{{ missing }}", ctx) == "{{ missing }}");
        assert(r.resolve("Hi {{ missing.x }}", ctx) == "Hi {{ missing.x }}");
        assert(r.resolve("{{ name", ctx) == "{{ name");
    }
    // Lookups, filters, concatenation
    {
        ExpressionResolver r;
        assert(r.resolve("{{ routine.uuid }}", ctx) == "abc");
        assert(r.resolve("{{ routine['uuid'] }}", ctx) == "abc");
        assert(r.resolve("{{ routine.dias[0] }}/{{ routine.dias[-1] }}", ctx) == "1/3");
        assert(r.resolve("{{ name | upper }}", ctx) == "ANA");
        assert(r.resolve("{{ name | lower }}", ctx) == "ana");
        assert(r.resolve("{{ 'hello world' | title }}", ctx) == "Hello World");
        assert(r.resolve("{{ '  x ' | trim }}", ctx) == "x");
        assert(r.resolve("{{ routine.dias | length }}", ctx) == "3");
        assert(r.resolve("{{ routine.dias | join(', ') }}", ctx) == "1, 2, 3");
        assert(r.resolve("{{ missing | default('n/a') }}", ctx) == "n/a");
        assert(r.resolve("{{ empty | default('n/a', true) }}", ctx) == "n/a");
        assert(r.resolve("{{ empty | default('n/a') }}", ctx) == "");
        assert(r.resolve("{{ 'x' ~ n }}", ctx) == "x5");
    }
    // Sandbox: no statements, comments, calls or unknown filters
    {
        ExpressionResolver r;
        assert(r.resolve("{{ name }}{% if n %}x{% endif %}", ctx) == "{{ name }}{% if n %}x{% endif %}");
        assert(r.resolve("{{ name }}{# note #}", ctx) == "{{ name }}{# note #}");
        assert(r.resolve("{{ name.__class__() }}", ctx) == "{{ name.__class__() }}");
        assert(r.resolve("{{ name | attr('x') }}", ctx) == "{{ name | attr('x') }}");
        assert(r.resolve("{{ name; n }}", ctx) == "{{ name; n }}");
    }
    // Long operator chains and out-of-range subscripts fail softly
    {
        ExpressionResolver r(0);
        QString members = QStringLiteral("{{ routine");
        for(int i = 0; i < 100000; ++i) members += QStringLiteral(".uuid");
        members += QStringLiteral(" }}");
        assert(r.resolve(members, ctx) == members);

        QString concat = QStringLiteral("{{ name");
        for(int i = 0; i < 100000; ++i) concat += QStringLiteral(" ~ name");
        concat += QStringLiteral(" }}");
        assert(r.resolve(concat, ctx) == concat);

        QString filters = QStringLiteral("{{ name");
        for(int i = 0; i < 100000; ++i) filters += QStringLiteral(" | upper");
        filters += QStringLiteral(" }}");
        assert(r.resolve(filters, ctx) == filters);

        assert(r.resolve("{{ name ~ name ~ name | upper }}", ctx) == "AnaAnaANA");
        assert(r.resolve("{{ routine.dias[100000000000000000000] }}", ctx) == "{{ routine.dias[100000000000000000000] }}");
        assert(r.resolve("{{ routine.dias[-100000000000000000000] }}", ctx) == "{{ routine.dias[-100000000000000000000] }}");
        assert(r.resolve("{{ routine.dias[1.7] }}", ctx) == "2");
    }
    // Bare expressions and conditions
    {
        ExpressionResolver r;
        auto v = r.evaluate("n > 3 and name == 'Ana'", ctx);
        assert(v.has_value() && v->toBool());
        assert(!r.evaluate("missing", ctx).has_value());
        assert(r.evaluate("routine.dias | length", ctx)->toDouble() == 3.0);

        assert(r.evaluateCondition("routine.dias", ctx).value());
        assert(r.evaluateCondition("empty", ctx).has_value());
        assert(!r.evaluateCondition("empty", ctx).value());
        assert(!r.evaluateCondition("missing.x", ctx).has_value());
        assert(!r.evaluateCondition("missing is defined", ctx).value());
        assert(r.evaluateCondition("missing is not defined", ctx).value());
        assert(r.evaluateCondition("2 in routine.dias", ctx).value());
        assert(r.evaluateCondition("7 not in routine.dias", ctx).value());
        assert(r.evaluateCondition("'An' in name", ctx).value());
        assert(r.evaluateCondition("not empty or n < 1", ctx).value());
        assert(!r.evaluateCondition("n < 'a'", ctx).has_value());
    }
    // Compiled-template cache is bounded; capacity 0 compiles every time
    {
        ExpressionResolver small(2);
        small.resolve("{{ name }}", ctx);
        small.resolve("{{ n }}", ctx);
        small.resolve("{{ empty }}", ctx);
        assert(small.capacity() == 2);
        assert(small.cachedCount() == 2);

        ExpressionResolver none(0);
        assert(none.resolve("{{ name }}", ctx) == "Ana");
        assert(none.cachedCount() == 0);
    }
    std::cout << "expression_resolver_test passed" << std::endl;
    return 0;
}
