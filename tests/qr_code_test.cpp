// QR payload lookup per data source and symbol rasterization
#include "qr/QrCode.hpp"
#include <QJsonDocument>
#include <cassert>
#include <iostream>

using namespace QtPdfTemplate;

static QJsonObject parse(const char *json) {
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

int main() {
    // Routine uuid: routine first, then rutina, then uuid_rutina
    {
        assert(qr::resolvePayload(parse(R"({"routine":{"uuid":"r-1"}})"), QrDataSource::RoutineUuid, {}) == QString("r-1"));
        assert(qr::resolvePayload(parse(R"({"rutina":{"uuid_rutina":"r-2"}})"), QrDataSource::RoutineUuid, {}) == QString("r-2"));
        assert(qr::resolvePayload(parse(R"({"routine":"flat","rutina":{"uuid":"r-3"}})"), QrDataSource::RoutineUuid, {}) == QString("r-3"));
        assert(!qr::resolvePayload(parse(R"({"routine":{"uuid":"  "}})"), QrDataSource::RoutineUuid, {}).has_value());
        assert(!qr::resolvePayload(QJsonObject(), QrDataSource::RoutineUuid, {}).has_value());
    }
    // User data: id, dni, usuario in that order; numbers print without a fraction
    {
        assert(qr::resolvePayload(parse(R"({"user":{"id":42,"dni":"X"}})"), QrDataSource::UserData, {}) == QString("42"));
        assert(qr::resolvePayload(parse(R"({"user":{"dni":"12345678A"}})"), QrDataSource::UserData, {}) == QString("12345678A"));
        assert(!qr::resolvePayload(parse(R"({"user":{}})"), QrDataSource::UserData, {}).has_value());
    }
    // Custom URL ignores the data context
    {
        assert(qr::resolvePayload(QJsonObject(), QrDataSource::CustomUrl, " https://gym.example/r/1 ") == QString("https://gym.example/r/1"));
        assert(!qr::resolvePayload(QJsonObject(), QrDataSource::CustomUrl, "").has_value());
    }
    // Encoding: version 1 symbol (21 modules) with a one-module quiet zone
    {
        const QImage img = qr::encode("hello", 4, 1);
        assert(!img.isNull());
        assert(img.width() == (21 + 2) * 4 && img.height() == img.width());
        assert(qGray(img.pixel(0, 0)) == 255);   // quiet zone
        assert(qGray(img.pixel(4, 4)) == 0);     // finder pattern corner
        assert(qGray(img.pixel(7, 7)) == 0);

        const QImage bigger = qr::encode("hello", 2, 4);
        assert(bigger.width() == (21 + 8) * 2);

        assert(qr::encode("").isNull());
        assert(qr::encode("x", 0).isNull());
    }
    std::cout << "qr_code_test passed" << std::endl;
    return 0;
}
