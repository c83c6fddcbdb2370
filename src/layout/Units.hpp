/** \file Units.hpp
 *  Length conversion into PDF points and the named page geometry of a template layout.
 */
#pragma once
#include <QJsonValue>
#include <QMarginsF>
#include <QRectF>
#include <QSizeF>
#include <QString>
#include <QStringList>
#include <optional>

namespace QtPdfTemplate::layout {

constexpr double kPointsPerInch = 72.0;
constexpr double kPointsPerMm = kPointsPerInch / 25.4;

/** Supported physical page sizes. Unknown names fall back to A4. */
enum class PageSizeId { A4, Letter, Legal };

/** Converts a layout length into points.
 *  Bare numbers and unsuffixed numeric strings are millimetres; "mm", "cm", "in" and "pt" suffixes are honoured.
 *  std::nullopt for anything that does not parse. */
std::optional<double> toPoints(const QJsonValue &value);
/** As above with a fallback (already in points) for absent or malformed input. */
double toPoints(const QJsonValue &value, double fallbackPoints);
inline double mm(double millimetres) { return millimetres * kPointsPerMm; }

QStringList pageSizeNames();
/** Case-insensitive lookup; std::nullopt for unknown names. */
std::optional<PageSizeId> pageSizeFromName(const QString &name);
/** Portrait size in points. */
QSizeF pageSizePoints(PageSizeId id);
QString pageSizeName(PageSizeId id);

QStringList orientationNames();
bool isLandscape(const QString &orientation);

/** Physical page plus content frame, all in points with the origin at the top-left corner. */
struct PageGeometry {
    QSizeF pageSize;
    QMarginsF margins;
    QString pageSizeName;
    bool landscape{false};

    QRectF frame() const {
        return QRectF(margins.left(), margins.top(),
                      pageSize.width() - margins.left() - margins.right(),
                      pageSize.height() - margins.top() - margins.bottom());
    }
};

/** Page size (A4 fallback), orientation swap and margins (default 20 mm each side). */
PageGeometry resolveGeometry(const QString &pageSize, const QString &orientation,
                             const QJsonValue &top, const QJsonValue &bottom,
                             const QJsonValue &left, const QJsonValue &right);

} // namespace QtPdfTemplate::layout
