#include "util/DataUri.hpp"
#include <QStringList>

namespace QtPdfTemplate::util {

namespace {

// Splits "data:<meta>,<body>" and checks the ;base64 marker. Returns false for anything else.
bool splitBase64(const QString &text, QString &mime, QStringView &body) {
    if(!isDataUri(text)) return false;
    const int comma = text.indexOf(QLatin1Char(','));
    if(comma < 0) return false;
    const QString meta = text.mid(5, comma - 5).trimmed();
    const QStringList parts = meta.split(QLatin1Char(';'));
    if(parts.isEmpty() || parts.last().compare(QLatin1String("base64"), Qt::CaseInsensitive) != 0) return false;
    mime = parts.first().trimmed().toLower();
    body = QStringView(text).mid(comma + 1);
    return true;
}

} // namespace

bool isDataUri(const QString &text) {
    return text.startsWith(QLatin1String("data:"), Qt::CaseInsensitive);
}

qint64 estimatedPayloadSize(const QString &text) {
    QString mime; QStringView body;
    if(!splitBase64(text, mime, body)) return -1;
    return (static_cast<qint64>(body.size()) * 3) / 4;
}

std::optional<DataUri> decodeDataUri(const QString &text) {
    QString mime; QStringView body;
    if(!splitBase64(text, mime, body)) return std::nullopt;
    auto decoded = QByteArray::fromBase64Encoding(body.trimmed().toLatin1(), QByteArray::AbortOnBase64DecodingErrors);
    if(!decoded) return std::nullopt;
    return DataUri{ mime, *decoded };
}

QString buildDataUri(const QString &mimeType, const QByteArray &payload) {
    return QStringLiteral("data:%1;base64,%2").arg(mimeType, QString::fromLatin1(payload.toBase64()));
}

} // namespace QtPdfTemplate::util
