#include "raster/PdfRasterizer.hpp"
#include <QBuffer>
#include <QEventLoop>
#include <QImage>
#include <QPdfDocument>
#include <QTimer>
#include <algorithm>
#include <cmath>

namespace QtPdfTemplate::raster {

namespace {
constexpr int kLoadTimeoutMs = 10000;
}

double scaleForDpi(int dpi) {
    return std::clamp(dpi / 72.0, 0.5, 4.0);
}

std::optional<int> thumbnailEdge(const QString &quality) {
    const QString q = quality.trimmed().toLower();
    if(q == QLatin1String("low")) return 256;
    if(q == QLatin1String("medium")) return 512;
    if(q == QLatin1String("high")) return 1024;
    if(q == QLatin1String("ultra")) return 2048;
    return std::nullopt;
}

RasterResult rasterizePage(const QByteArray &pdf, int pageNumber, double scale, int maxEdge) {
    RasterResult result;
    QByteArray data = pdf;
    QBuffer buffer(&data);
    buffer.open(QIODevice::ReadOnly);

    QPdfDocument document;
    document.load(&buffer);
    if(document.status() == QPdfDocument::Status::Loading) {
        QEventLoop loop;
        QObject::connect(&document, &QPdfDocument::statusChanged, &loop, [&loop](QPdfDocument::Status s) {
            if(s != QPdfDocument::Status::Loading) loop.quit();
        });
        QTimer::singleShot(kLoadTimeoutMs, &loop, &QEventLoop::quit);
        loop.exec();
    }
    if(document.status() != QPdfDocument::Status::Ready || document.pageCount() <= 0) {
        result.error = QStringLiteral("PDF could not be loaded for rasterization");
        return result;
    }

    result.pageCount = document.pageCount();
    result.pageIndex = std::clamp(pageNumber - 1, 0, result.pageCount - 1);
    const QSizeF points = document.pagePointSize(result.pageIndex);
    QSize pixels(std::max(1, static_cast<int>(std::lround(points.width() * scale))),
                 std::max(1, static_cast<int>(std::lround(points.height() * scale))));
    if(maxEdge > 0 && std::max(pixels.width(), pixels.height()) > maxEdge) pixels.scale(maxEdge, maxEdge, Qt::KeepAspectRatio);

    QImage image = document.render(result.pageIndex, pixels);
    if(image.isNull()) {
        result.error = QStringLiteral("page %1 could not be rendered").arg(result.pageIndex + 1);
        return result;
    }
    QBuffer png(&result.png);
    png.open(QIODevice::WriteOnly);
    if(!image.save(&png, "PNG")) {
        result.png.clear();
        result.error = QStringLiteral("PNG encoding failed");
    }
    return result;
}

} // namespace QtPdfTemplate::raster
