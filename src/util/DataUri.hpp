/** \file DataUri.hpp
 *  RFC 2397 helpers limited to the base64 form used for inline images and previews.
 */
#pragma once
#include <QByteArray>
#include <QString>
#include <optional>

namespace QtPdfTemplate::util {

struct DataUri {
    QString mimeType;   // e.g. image/png
    QByteArray payload; // decoded bytes
};

/** True for strings starting with "data:" (case-insensitive). */
bool isDataUri(const QString &text);

/** Upper bound of the decoded size of a base64 data URI without decoding it; -1 if text is not a base64 data URI. */
qint64 estimatedPayloadSize(const QString &text);

/** Strict decode of data:<mime>;base64,<payload>. std::nullopt for other encodings or malformed base64. */
std::optional<DataUri> decodeDataUri(const QString &text);

/** data:<mime>;base64,<payload>. */
QString buildDataUri(const QString &mimeType, const QByteArray &payload);

} // namespace QtPdfTemplate::util
