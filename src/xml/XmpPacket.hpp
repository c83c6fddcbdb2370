/** \file XmpPacket.hpp
 *  XMP metadata packet embedded in generated PDFs.
 */
#pragma once
#include <QByteArray>
#include <QString>
#include <QStringList>

namespace QtPdfTemplate::xml {

struct DocumentInfo {
    QString title;
    QString description;
    QString version;
    QStringList keywords;
    QString producer;
    QString createDate; // ISO 8601
    QString documentId; // uuid:... URN
};

/** Serialized <?xpacket?>-wrapped x:xmpmeta document (UTF-8, no XML declaration). */
QByteArray buildXmpPacket(const DocumentInfo &info);

} // namespace QtPdfTemplate::xml
