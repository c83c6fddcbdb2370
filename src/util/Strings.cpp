#include "util/Strings.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <algorithm>
#include <cmath>
#include <vector>

namespace QtPdfTemplate::util {

QString displayString(const QJsonValue &value) {
    switch(value.type()) {
    case QJsonValue::String: return value.toString();
    case QJsonValue::Bool: return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    case QJsonValue::Double: {
        const double d = value.toDouble();
        if(std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 1e15) return QString::number(static_cast<qint64>(d));
        return QString::number(d, 'g', 15);
    }
    case QJsonValue::Array: return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    case QJsonValue::Object: return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    case QJsonValue::Null:
    case QJsonValue::Undefined:
        break;
    }
    return QString();
}

std::optional<double> numericValue(const QJsonValue &value) {
    if(value.isDouble()) return value.toDouble();
    if(value.isString()) {
        bool ok = false;
        const double d = value.toString().trimmed().toDouble(&ok);
        if(ok) return d;
    }
    return std::nullopt;
}

int editDistance(const QString &a, const QString &b) {
    const QString s = a.toLower();
    const QString t = b.toLower();
    std::vector<int> prev(t.size() + 1), cur(t.size() + 1);
    for(int j = 0; j <= t.size(); ++j) prev[j] = j;
    for(int i = 1; i <= s.size(); ++i) {
        cur[0] = i;
        for(int j = 1; j <= t.size(); ++j) {
            const int cost = s[i - 1] == t[j - 1] ? 0 : 1;
            cur[j] = std::min({ prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost });
        }
        std::swap(prev, cur);
    }
    return prev[t.size()];
}

QString closestMatch(const QString &input, const QStringList &candidates) {
    QString best;
    int bestDistance = -1;
    for(const auto &c : candidates) {
        const int d = editDistance(input, c);
        if(bestDistance < 0 || d < bestDistance) { best = c; bestDistance = d; }
    }
    return best;
}

} // namespace QtPdfTemplate::util
