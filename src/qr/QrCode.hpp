/** \file QrCode.hpp
 *  QR payload lookup in the data context and symbol encoding through libqrencode.
 */
#pragma once
#include "QtPdfTemplate/TemplateConfig.hpp"
#include <QImage>
#include <QJsonObject>
#include <QString>
#include <optional>

namespace QtPdfTemplate::qr {

/** Payload for a data source:
 *   - CustomUrl: customData verbatim
 *   - UserData: user.id, then user.dni, then user.usuario
 *   - RoutineUuid: routine.uuid / rutina.uuid, then uuid_rutina on the same object
 *  std::nullopt when the source object is missing or yields an empty string. */
std::optional<QString> resolvePayload(const QJsonObject &data, QrDataSource source, const QString &customData);

/** Black-on-white symbol, error correction level M, moduleSize pixels per module and a quiet zone of
 *  border modules. Null image when the payload cannot be encoded. */
QImage encode(const QString &payload, int moduleSize = 4, int border = 1);

} // namespace QtPdfTemplate::qr
