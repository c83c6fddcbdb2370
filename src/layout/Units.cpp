#include "layout/Units.hpp"
#include <algorithm>

namespace QtPdfTemplate::layout {

std::optional<double> toPoints(const QJsonValue &value) {
    if(value.isDouble()) return value.toDouble() * kPointsPerMm;
    if(!value.isString()) return std::nullopt;
    QString v = value.toString().trimmed().toLower();
    double factor = kPointsPerMm;
    if(v.endsWith(QLatin1String("mm"))) { v.chop(2); }
    else if(v.endsWith(QLatin1String("cm"))) { v.chop(2); factor = 10.0 * kPointsPerMm; }
    else if(v.endsWith(QLatin1String("in"))) { v.chop(2); factor = kPointsPerInch; }
    else if(v.endsWith(QLatin1String("pt"))) { v.chop(2); factor = 1.0; }
    bool ok = false;
    const double n = v.trimmed().toDouble(&ok);
    if(!ok) return std::nullopt;
    return n * factor;
}

double toPoints(const QJsonValue &value, double fallbackPoints) {
    if(value.isUndefined() || value.isNull()) return fallbackPoints;
    return toPoints(value).value_or(fallbackPoints);
}

QStringList pageSizeNames() {
    return { QStringLiteral("A4"), QStringLiteral("Letter"), QStringLiteral("Legal") };
}

std::optional<PageSizeId> pageSizeFromName(const QString &name) {
    const QString n = name.trimmed().toLower();
    if(n == QLatin1String("a4")) return PageSizeId::A4;
    if(n == QLatin1String("letter")) return PageSizeId::Letter;
    if(n == QLatin1String("legal")) return PageSizeId::Legal;
    return std::nullopt;
}

QSizeF pageSizePoints(PageSizeId id) {
    switch(id) {
    case PageSizeId::Letter: return QSizeF(612.0, 792.0);
    case PageSizeId::Legal: return QSizeF(612.0, 1008.0);
    case PageSizeId::A4: break;
    }
    return QSizeF(210.0 * kPointsPerMm, 297.0 * kPointsPerMm);
}

QString pageSizeName(PageSizeId id) {
    switch(id) {
    case PageSizeId::Letter: return QStringLiteral("Letter");
    case PageSizeId::Legal: return QStringLiteral("Legal");
    case PageSizeId::A4: break;
    }
    return QStringLiteral("A4");
}

QStringList orientationNames() {
    return { QStringLiteral("portrait"), QStringLiteral("landscape") };
}

bool isLandscape(const QString &orientation) {
    return orientation.trimmed().compare(QLatin1String("landscape"), Qt::CaseInsensitive) == 0;
}

PageGeometry resolveGeometry(const QString &pageSize, const QString &orientation,
                             const QJsonValue &top, const QJsonValue &bottom,
                             const QJsonValue &left, const QJsonValue &right) {
    PageGeometry g;
    const PageSizeId id = pageSizeFromName(pageSize).value_or(PageSizeId::A4);
    g.pageSizeName = pageSizeName(id);
    g.pageSize = pageSizePoints(id);
    g.landscape = isLandscape(orientation);
    if(g.landscape) g.pageSize.transpose();
    const double fallback = mm(20.0);
    auto margin = [fallback](const QJsonValue &v){ return std::max(0.0, toPoints(v, fallback)); };
    g.margins = QMarginsF(margin(left), margin(top), margin(right), margin(bottom));
    // A frame narrower than 1 inch in either direction cannot hold a table row; fall back to the defaults.
    if(g.frame().width() < kPointsPerInch || g.frame().height() < kPointsPerInch) {
        g.margins = QMarginsF(fallback, fallback, fallback, fallback);
    }
    return g;
}

} // namespace QtPdfTemplate::layout
