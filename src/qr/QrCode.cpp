#include "qr/QrCode.hpp"
#include "util/Strings.hpp"
#include <QDebug>
#include <initializer_list>
#include <memory>
#include <qrencode.h>

namespace QtPdfTemplate::qr {

namespace {

QString firstNonEmpty(const QJsonObject &obj, std::initializer_list<const char *> keys) {
    for(const char *k : keys) {
        const QString v = util::displayString(obj.value(QLatin1String(k))).trimmed();
        if(!v.isEmpty()) return v;
    }
    return QString();
}

struct QrCodeDeleter {
    void operator()(QRcode *code) const { QRcode_free(code); }
};

} // namespace

std::optional<QString> resolvePayload(const QJsonObject &data, QrDataSource source, const QString &customData) {
    QString payload;
    switch(source) {
    case QrDataSource::CustomUrl:
        payload = customData.trimmed();
        break;
    case QrDataSource::UserData: {
        const QJsonValue user = data.value(QLatin1String("user"));
        if(!user.isObject()) return std::nullopt;
        payload = firstNonEmpty(user.toObject(), { "id", "dni", "usuario" });
        break;
    }
    case QrDataSource::RoutineUuid: {
        QJsonValue routine = data.value(QLatin1String("routine"));
        if(!routine.isObject()) routine = data.value(QLatin1String("rutina"));
        if(!routine.isObject()) return std::nullopt;
        payload = firstNonEmpty(routine.toObject(), { "uuid", "uuid_rutina" });
        break;
    }
    }
    if(payload.isEmpty()) return std::nullopt;
    return payload;
}

QImage encode(const QString &payload, int moduleSize, int border) {
    if(payload.isEmpty() || moduleSize <= 0 || border < 0) return QImage();
    const QByteArray utf8 = payload.toUtf8();
    std::unique_ptr<QRcode, QrCodeDeleter> code(QRcode_encodeString(utf8.constData(), 0, QR_ECLEVEL_M, QR_MODE_8, 1));
    if(!code) {
        qWarning() << "QrCode: cannot encode payload of" << utf8.size() << "bytes";
        return QImage();
    }
    const int modules = code->width;
    const int side = (modules + 2 * border) * moduleSize;
    QImage img(side, side, QImage::Format_Grayscale8);
    img.fill(Qt::white);
    const unsigned char *row = code->data;
    for(int y = 0; y < modules; ++y, row += modules) {
        for(int x = 0; x < modules; ++x) {
            if(!(row[x] & 1)) continue;
            const int px = (x + border) * moduleSize;
            const int py = (y + border) * moduleSize;
            for(int dy = 0; dy < moduleSize; ++dy) {
                uchar *line = img.scanLine(py + dy);
                for(int dx = 0; dx < moduleSize; ++dx) line[px + dx] = 0;
            }
        }
    }
    return img;
}

} // namespace QtPdfTemplate::qr
