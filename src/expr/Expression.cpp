#include "expr/Expression.hpp"
#include "util/Strings.hpp"
#include <QJsonArray>
#include <QStringList>
#include <algorithm>
#include <cmath>

namespace QtPdfTemplate::expr {

namespace {

constexpr int kMaxNesting = 64;
constexpr int kMaxNodes = 512;

// ---------------------------------------------------------------- lexer

enum class Tok { Ident, Number, String, Op, End };

struct Token {
    Tok kind{Tok::End};
    QString text;
    double number{0.0};
    int pos{0};
};

class Lexer {
public:
    explicit Lexer(const QString &src) : m_src(src) {}

    std::vector<Token> tokenize() {
        std::vector<Token> out;
        while(true) {
            skipBlanks();
            if(m_pos >= m_src.size()) { out.push_back(Token{Tok::End, QString(), 0.0, m_pos}); break; }
            const QChar c = m_src[m_pos];
            if(c.isLetter() || c == QLatin1Char('_')) out.push_back(identifier());
            else if(c.isDigit()) out.push_back(number());
            else if(c == QLatin1Char('"') || c == QLatin1Char('\'')) out.push_back(string(c));
            else out.push_back(op());
        }
        return out;
    }

private:
    void skipBlanks() { while(m_pos < m_src.size() && m_src[m_pos].isSpace()) ++m_pos; }

    Token identifier() {
        const int start = m_pos;
        while(m_pos < m_src.size() && (m_src[m_pos].isLetterOrNumber() || m_src[m_pos] == QLatin1Char('_'))) ++m_pos;
        return Token{Tok::Ident, m_src.mid(start, m_pos - start), 0.0, start};
    }

    Token number() {
        const int start = m_pos;
        while(m_pos < m_src.size() && m_src[m_pos].isDigit()) ++m_pos;
        if(m_pos + 1 < m_src.size() && m_src[m_pos] == QLatin1Char('.') && m_src[m_pos + 1].isDigit()) {
            ++m_pos;
            while(m_pos < m_src.size() && m_src[m_pos].isDigit()) ++m_pos;
        }
        const QString text = m_src.mid(start, m_pos - start);
        return Token{Tok::Number, text, text.toDouble(), start};
    }

    Token string(QChar quote) {
        const int start = m_pos++;
        QString value;
        while(m_pos < m_src.size() && m_src[m_pos] != quote) {
            QChar c = m_src[m_pos++];
            if(c == QLatin1Char('\\') && m_pos < m_src.size()) {
                const QChar e = m_src[m_pos++];
                if(e == QLatin1Char('n')) c = QLatin1Char('\n');
                else if(e == QLatin1Char('t')) c = QLatin1Char('\t');
                else c = e;
            }
            value += c;
        }
        if(m_pos >= m_src.size()) throw EvalError(QStringLiteral("unterminated string literal at %1").arg(start));
        ++m_pos; // closing quote
        return Token{Tok::String, value, 0.0, start};
    }

    Token op() {
        static const QStringList twoChar = { QStringLiteral("=="), QStringLiteral("!="), QStringLiteral("<="), QStringLiteral(">=") };
        static const QString oneChar = QStringLiteral("<>~|()[].,-");
        const int start = m_pos;
        const QString two = m_src.mid(m_pos, 2);
        if(twoChar.contains(two)) { m_pos += 2; return Token{Tok::Op, two, 0.0, start}; }
        const QChar c = m_src[m_pos];
        if(oneChar.contains(c)) { ++m_pos; return Token{Tok::Op, QString(c), 0.0, start}; }
        throw EvalError(QStringLiteral("unexpected character '%1' at %2").arg(c).arg(start));
    }

    const QString &m_src;
    int m_pos{0};
};

// ---------------------------------------------------------------- evaluation helpers

QString printable(const QJsonValue &v) {
    if(v.isUndefined()) throw EvalError(QStringLiteral("undefined value cannot be printed"));
    return util::displayString(v);
}

void requireDefined(const QJsonValue &v, const char *what) {
    if(v.isUndefined()) throw EvalError(QStringLiteral("undefined operand for %1").arg(QLatin1String(what)));
}

bool valuesEqual(const QJsonValue &a, const QJsonValue &b) {
    requireDefined(a, "=="); requireDefined(b, "==");
    if(a.isDouble() && b.isDouble()) return a.toDouble() == b.toDouble();
    return a == b;
}

// ---------------------------------------------------------------- nodes

class LiteralNode : public Node {
public:
    explicit LiteralNode(QJsonValue v) : m_value(std::move(v)) {}
    QJsonValue eval(const QJsonObject &) const override { return m_value; }
private:
    QJsonValue m_value;
};

class NameNode : public Node {
public:
    explicit NameNode(QString name) : m_name(std::move(name)) {}
    QJsonValue eval(const QJsonObject &scope) const override { return scope.value(m_name); }
private:
    QString m_name;
};

// Lookup of a key or index on an evaluated value; shared by a.b and a[expr].
QJsonValue lookup(const QJsonValue &base, const QJsonValue &key) {
    if(base.isUndefined()) throw EvalError(QStringLiteral("lookup of '%1' on an undefined value").arg(util::displayString(key)));
    if(base.isObject()) return base.toObject().value(util::displayString(key));
    if(base.isArray()) {
        const auto index = util::numericValue(key);
        const QJsonArray arr = base.toArray();
        if(!index || !std::isfinite(*index)) return QJsonValue(QJsonValue::Undefined);
        double i = std::trunc(*index);
        if(i < 0) i += arr.size();
        if(i < 0 || i >= arr.size()) return QJsonValue(QJsonValue::Undefined);
        return arr.at(static_cast<int>(i));
    }
    return QJsonValue(QJsonValue::Undefined);
}

class MemberNode : public Node {
public:
    MemberNode(NodePtr base, QString key) : m_base(std::move(base)), m_key(std::move(key)) {}
    QJsonValue eval(const QJsonObject &scope) const override { return lookup(m_base->eval(scope), m_key); }
private:
    NodePtr m_base;
    QString m_key;
};

class IndexNode : public Node {
public:
    IndexNode(NodePtr base, NodePtr index) : m_base(std::move(base)), m_index(std::move(index)) {}
    QJsonValue eval(const QJsonObject &scope) const override {
        const QJsonValue key = m_index->eval(scope);
        requireDefined(key, "[]");
        return lookup(m_base->eval(scope), key);
    }
private:
    NodePtr m_base;
    NodePtr m_index;
};

class NotNode : public Node {
public:
    explicit NotNode(NodePtr operand) : m_operand(std::move(operand)) {}
    QJsonValue eval(const QJsonObject &scope) const override { return !truthy(m_operand->eval(scope)); }
private:
    NodePtr m_operand;
};

class LogicalNode : public Node {
public:
    LogicalNode(bool isAnd, NodePtr lhs, NodePtr rhs) : m_and(isAnd), m_lhs(std::move(lhs)), m_rhs(std::move(rhs)) {}
    QJsonValue eval(const QJsonObject &scope) const override {
        const QJsonValue left = m_lhs->eval(scope);
        const bool t = truthy(left);
        if(m_and) return t ? m_rhs->eval(scope) : left;
        return t ? left : m_rhs->eval(scope);
    }
private:
    bool m_and;
    NodePtr m_lhs, m_rhs;
};

class CompareNode : public Node {
public:
    CompareNode(QString op, NodePtr lhs, NodePtr rhs) : m_op(std::move(op)), m_lhs(std::move(lhs)), m_rhs(std::move(rhs)) {}
    QJsonValue eval(const QJsonObject &scope) const override {
        const QJsonValue a = m_lhs->eval(scope);
        const QJsonValue b = m_rhs->eval(scope);
        if(m_op == QLatin1String("==")) return valuesEqual(a, b);
        if(m_op == QLatin1String("!=")) return !valuesEqual(a, b);
        if(m_op == QLatin1String("in")) return contains(b, a);
        if(m_op == QLatin1String("not in")) return !contains(b, a);
        int order = 0;
        if(a.isDouble() && b.isDouble()) order = a.toDouble() < b.toDouble() ? -1 : (a.toDouble() > b.toDouble() ? 1 : 0);
        else if(a.isString() && b.isString()) order = QString::compare(a.toString(), b.toString());
        else throw EvalError(QStringLiteral("'%1' needs two numbers or two strings").arg(m_op));
        if(m_op == QLatin1String("<")) return order < 0;
        if(m_op == QLatin1String("<=")) return order <= 0;
        if(m_op == QLatin1String(">")) return order > 0;
        return order >= 0;
    }
private:
    static bool contains(const QJsonValue &haystack, const QJsonValue &needle) {
        requireDefined(needle, "in");
        if(haystack.isString()) return haystack.toString().contains(printable(needle));
        if(haystack.isArray()) {
            for(const auto &item : haystack.toArray()) if(valuesEqual(item, needle)) return true;
            return false;
        }
        if(haystack.isObject()) return haystack.toObject().contains(printable(needle));
        throw EvalError(QStringLiteral("'in' needs a string, list or mapping on the right"));
    }
    QString m_op;
    NodePtr m_lhs, m_rhs;
};

class ConcatNode : public Node {
public:
    ConcatNode(NodePtr lhs, NodePtr rhs) : m_lhs(std::move(lhs)), m_rhs(std::move(rhs)) {}
    QJsonValue eval(const QJsonObject &scope) const override {
        return printable(m_lhs->eval(scope)) + printable(m_rhs->eval(scope));
    }
private:
    NodePtr m_lhs, m_rhs;
};

class TestNode : public Node {
public:
    TestNode(NodePtr subject, QString test, bool negated) : m_subject(std::move(subject)), m_test(std::move(test)), m_negated(negated) {}
    QJsonValue eval(const QJsonObject &scope) const override {
        QJsonValue v;
        try { v = m_subject->eval(scope); }
        catch(const EvalError &) { v = QJsonValue(QJsonValue::Undefined); } // a.b on undefined a is simply "not defined"
        bool result = false;
        if(m_test == QLatin1String("defined")) result = !v.isUndefined();
        else if(m_test == QLatin1String("undefined")) result = v.isUndefined();
        else result = v.isNull();
        return m_negated ? !result : result;
    }
private:
    NodePtr m_subject;
    QString m_test;
    bool m_negated;
};

class FilterNode : public Node {
public:
    FilterNode(NodePtr base, QString name, std::vector<NodePtr> args) : m_base(std::move(base)), m_name(std::move(name)), m_args(std::move(args)) {}

    static bool known(const QString &name) {
        static const QStringList names = { QStringLiteral("default"), QStringLiteral("d"), QStringLiteral("upper"), QStringLiteral("lower"),
                                           QStringLiteral("title"), QStringLiteral("trim"), QStringLiteral("length"), QStringLiteral("join") };
        return names.contains(name);
    }

    QJsonValue eval(const QJsonObject &scope) const override {
        if(m_name == QLatin1String("default") || m_name == QLatin1String("d")) {
            const QJsonValue v = m_base->eval(scope);
            const bool boolean = m_args.size() > 1 && truthy(m_args[1]->eval(scope));
            const bool useFallback = v.isUndefined() || (boolean && (v.isNull() || !truthy(v)));
            if(!useFallback) return v;
            return m_args.empty() ? QJsonValue(QString()) : m_args[0]->eval(scope);
        }
        const QJsonValue v = m_base->eval(scope);
        if(m_name == QLatin1String("upper")) return printable(v).toUpper();
        if(m_name == QLatin1String("lower")) return printable(v).toLower();
        if(m_name == QLatin1String("trim")) return printable(v).trimmed();
        if(m_name == QLatin1String("title")) return titleCase(printable(v));
        if(m_name == QLatin1String("length")) {
            if(v.isString()) return static_cast<double>(v.toString().size());
            if(v.isArray()) return static_cast<double>(v.toArray().size());
            if(v.isObject()) return static_cast<double>(v.toObject().size());
            throw EvalError(QStringLiteral("length of a value without a size"));
        }
        // join
        if(!v.isArray()) throw EvalError(QStringLiteral("join needs a list"));
        const QString sep = m_args.empty() ? QString() : printable(m_args[0]->eval(scope));
        QStringList items;
        for(const auto &item : v.toArray()) items << printable(item);
        return items.join(sep);
    }

private:
    static QString titleCase(const QString &s) {
        QString out = s.toLower();
        bool start = true;
        for(auto &c : out) {
            if(c.isLetter()) { if(start) c = c.toUpper(); start = false; }
            else start = true;
        }
        return out;
    }
    NodePtr m_base;
    QString m_name;
    std::vector<NodePtr> m_args;
};

// ---------------------------------------------------------------- parser

class Parser {
public:
    explicit Parser(const QString &src) : m_tokens(Lexer(src).tokenize()) {}

    NodePtr parse() {
        NodePtr n = parseOr();
        if(peek().kind != Tok::End) fail(QStringLiteral("unexpected '%1'").arg(peek().text));
        return n;
    }

private:
    const Token &peek(int ahead = 0) const {
        const size_t i = std::min(m_index + static_cast<size_t>(ahead), m_tokens.size() - 1);
        return m_tokens[i];
    }
    Token next() { Token t = peek(); if(m_index < m_tokens.size() - 1) ++m_index; return t; }
    bool isOp(const char *op, int ahead = 0) const { return peek(ahead).kind == Tok::Op && peek(ahead).text == QLatin1String(op); }
    bool isKeyword(const char *kw, int ahead = 0) const { return peek(ahead).kind == Tok::Ident && peek(ahead).text == QLatin1String(kw); }
    void expectOp(const char *op) { if(!isOp(op)) fail(QStringLiteral("expected '%1'").arg(QLatin1String(op))); next(); }
    [[noreturn]] void fail(const QString &msg) const { throw EvalError(QStringLiteral("%1 at %2").arg(msg).arg(peek().pos)); }

    struct DepthGuard {
        explicit DepthGuard(Parser &p) : parser(p) { if(++parser.m_depth > kMaxNesting) parser.fail(QStringLiteral("expression nested too deeply")); }
        ~DepthGuard() { --parser.m_depth; }
        Parser &parser;
    };

    // Every operator node counts against one budget so left-deep chains (a.b.c..., x ~ y ~ z...) stay shallow.
    void grow() { if(++m_nodes > kMaxNodes) fail(QStringLiteral("expression too long")); }

    NodePtr parseOr() {
        DepthGuard guard(*this);
        NodePtr lhs = parseAnd();
        while(isKeyword("or")) { next(); grow(); lhs = std::make_unique<LogicalNode>(false, std::move(lhs), parseAnd()); }
        return lhs;
    }

    NodePtr parseAnd() {
        NodePtr lhs = parseNot();
        while(isKeyword("and")) { next(); grow(); lhs = std::make_unique<LogicalNode>(true, std::move(lhs), parseNot()); }
        return lhs;
    }

    NodePtr parseNot() {
        if(isKeyword("not")) {
            DepthGuard guard(*this);
            next();
            return std::make_unique<NotNode>(parseNot());
        }
        return parseComparison();
    }

    NodePtr parseComparison() {
        NodePtr lhs = parseConcat();
        if(peek().kind == Tok::Op && (isOp("==") || isOp("!=") || isOp("<") || isOp("<=") || isOp(">") || isOp(">="))) {
            const QString op = next().text;
            return std::make_unique<CompareNode>(op, std::move(lhs), parseConcat());
        }
        if(isKeyword("in")) { next(); return std::make_unique<CompareNode>(QStringLiteral("in"), std::move(lhs), parseConcat()); }
        if(isKeyword("not") && isKeyword("in", 1)) { next(); next(); return std::make_unique<CompareNode>(QStringLiteral("not in"), std::move(lhs), parseConcat()); }
        if(isKeyword("is")) {
            next();
            bool negated = false;
            if(isKeyword("not")) { next(); negated = true; }
            const Token t = next();
            if(t.kind != Tok::Ident || !(t.text == QLatin1String("defined") || t.text == QLatin1String("undefined") || t.text == QLatin1String("none")))
                fail(QStringLiteral("unknown test '%1'").arg(t.text));
            return std::make_unique<TestNode>(std::move(lhs), t.text, negated);
        }
        return lhs;
    }

    NodePtr parseConcat() {
        NodePtr lhs = parseFiltered();
        while(isOp("~")) { next(); grow(); lhs = std::make_unique<ConcatNode>(std::move(lhs), parseFiltered()); }
        return lhs;
    }

    NodePtr parseFiltered() {
        NodePtr base = parsePostfix();
        while(isOp("|")) {
            next();
            grow();
            const Token name = next();
            if(name.kind != Tok::Ident || !FilterNode::known(name.text)) fail(QStringLiteral("unknown filter '%1'").arg(name.text));
            std::vector<NodePtr> args;
            if(isOp("(")) {
                next();
                while(!isOp(")")) {
                    args.push_back(parseOr());
                    if(!isOp(",")) break;
                    next();
                }
                expectOp(")");
            }
            base = std::make_unique<FilterNode>(std::move(base), name.text, std::move(args));
        }
        return base;
    }

    NodePtr parsePostfix() {
        NodePtr base = parsePrimary();
        while(true) {
            if(isOp(".")) {
                next();
                grow();
                const Token key = next();
                if(key.kind != Tok::Ident && key.kind != Tok::Number) fail(QStringLiteral("expected a name after '.'"));
                base = std::make_unique<MemberNode>(std::move(base), key.text);
            } else if(isOp("[")) {
                next();
                grow();
                NodePtr index = parseOr();
                expectOp("]");
                base = std::make_unique<IndexNode>(std::move(base), std::move(index));
            } else {
                return base;
            }
        }
    }

    NodePtr parsePrimary() {
        const Token t = next();
        switch(t.kind) {
        case Tok::Number: return std::make_unique<LiteralNode>(t.number);
        case Tok::String: return std::make_unique<LiteralNode>(t.text);
        case Tok::Ident:
            if(t.text == QLatin1String("true") || t.text == QLatin1String("True")) return std::make_unique<LiteralNode>(true);
            if(t.text == QLatin1String("false") || t.text == QLatin1String("False")) return std::make_unique<LiteralNode>(false);
            if(t.text == QLatin1String("none") || t.text == QLatin1String("None") || t.text == QLatin1String("null"))
                return std::make_unique<LiteralNode>(QJsonValue(QJsonValue::Null));
            return std::make_unique<NameNode>(t.text);
        case Tok::Op:
            if(t.text == QLatin1String("(")) {
                NodePtr inner = parseOr();
                expectOp(")");
                return inner;
            }
            if(t.text == QLatin1String("-") && peek().kind == Tok::Number) return std::make_unique<LiteralNode>(-next().number);
            break;
        case Tok::End:
            break;
        }
        throw EvalError(QStringLiteral("unexpected '%1' at %2").arg(t.text).arg(t.pos));
    }

    std::vector<Token> m_tokens;
    size_t m_index{0};
    int m_depth{0};
    int m_nodes{0};
};

} // namespace

NodePtr parseExpression(const QString &source) {
    if(source.trimmed().isEmpty()) throw EvalError(QStringLiteral("empty expression"));
    return Parser(source).parse();
}

bool truthy(const QJsonValue &value) {
    switch(value.type()) {
    case QJsonValue::Undefined: throw EvalError(QStringLiteral("undefined value has no truth value"));
    case QJsonValue::Null: return false;
    case QJsonValue::Bool: return value.toBool();
    case QJsonValue::Double: return value.toDouble() != 0.0;
    case QJsonValue::String: return !value.toString().isEmpty();
    case QJsonValue::Array: return !value.toArray().isEmpty();
    case QJsonValue::Object: return !value.toObject().isEmpty();
    }
    return false;
}

std::shared_ptr<const CompiledTemplate> CompiledTemplate::compile(const QString &source) {
    auto tpl = std::make_shared<CompiledTemplate>();
    int pos = 0;
    while(pos < source.size()) {
        const int open = source.indexOf(QLatin1String("{"), pos);
        if(open < 0 || open + 1 >= source.size()) break;
        const QChar marker = source[open + 1];
        if(marker == QLatin1Char('%') || marker == QLatin1Char('#'))
            throw EvalError(QStringLiteral("statement and comment blocks are not allowed"));
        if(marker != QLatin1Char('{')) {
            tpl->m_parts.push_back(Part{ source.mid(pos, open + 1 - pos), nullptr });
            pos = open + 1;
            continue;
        }
        const int close = source.indexOf(QLatin1String("}}"), open + 2);
        if(close < 0) throw EvalError(QStringLiteral("unclosed '{{' at %1").arg(open));
        if(open > pos) tpl->m_parts.push_back(Part{ source.mid(pos, open - pos), nullptr });
        tpl->m_parts.push_back(Part{ QString(), parseExpression(source.mid(open + 2, close - open - 2)) });
        pos = close + 2;
    }
    if(pos < source.size()) tpl->m_parts.push_back(Part{ source.mid(pos), nullptr });
    return tpl;
}

QString CompiledTemplate::render(const QJsonObject &scope) const {
    QString out;
    for(const auto &part : m_parts) {
        if(part.expression) out += printable(part.expression->eval(scope));
        else out += part.text;
    }
    return out;
}

bool CompiledTemplate::isSingleExpression() const {
    int holes = 0;
    for(const auto &part : m_parts) {
        if(part.expression) ++holes;
        else if(!part.text.trimmed().isEmpty()) return false;
    }
    return holes == 1;
}

QJsonValue CompiledTemplate::evaluateSingle(const QJsonObject &scope) const {
    for(const auto &part : m_parts) if(part.expression) return part.expression->eval(scope);
    throw EvalError(QStringLiteral("template has no expression"));
}

} // namespace QtPdfTemplate::expr
