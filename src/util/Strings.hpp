/** \file Strings.hpp
 *  Small text helpers shared by the expression layer, the renderer and the validator.
 */
#pragma once
#include <QJsonValue>
#include <QString>
#include <QStringList>
#include <optional>

namespace QtPdfTemplate::util {

/** Text form of a JSON value as it appears in a rendered document.
 *  Integral numbers print without a fraction, null prints empty, containers print as compact JSON. */
QString displayString(const QJsonValue &value);

/** Number, or a string holding a number (surrounding blanks allowed). */
std::optional<double> numericValue(const QJsonValue &value);
inline bool isNumericLike(const QJsonValue &value) { return numericValue(value).has_value(); }

/** Case-insensitive Levenshtein distance. */
int editDistance(const QString &a, const QString &b);

/** Candidate with the smallest edit distance to input (first wins on ties); empty if candidates is empty. */
QString closestMatch(const QString &input, const QStringList &candidates);

} // namespace QtPdfTemplate::util
