/** \file PdfRasterizer.hpp
 *  Renders one page of an in-memory PDF to PNG through QPdfDocument.
 */
#pragma once
#include <QByteArray>
#include <QString>
#include <optional>

namespace QtPdfTemplate::raster {

/** Points -> pixels factor for a DPI request, clamped to [0.5, 4.0]. */
double scaleForDpi(int dpi);

/** Longest edge of a thumbnail for a quality name (low 256, medium 512, high 1024, ultra 2048); std::nullopt if unknown. */
std::optional<int> thumbnailEdge(const QString &quality);

struct RasterResult {
    QByteArray png;
    int pageIndex{0}; // 0-based page actually rendered
    int pageCount{0};
    QString error;    // empty on success
    bool ok() const { return error.isEmpty(); }
};

/** pageNumber is 1-based and clamped into the document. maxEdge > 0 bounds the output's longest side. */
RasterResult rasterizePage(const QByteArray &pdf, int pageNumber, double scale, int maxEdge = 0);

} // namespace QtPdfTemplate::raster
