/** \file DocumentBuilder.hpp
 *  TemplateConfig + data -> geometry, style sheet, primitive flow and QR overlay.
 *  Shared by the PDF encoder and the HTML preview so both show the same document.
 */
#pragma once
#include "QtPdfTemplate/ExpressionResolver.hpp"
#include "QtPdfTemplate/TemplateConfig.hpp"
#include "engine/SectionRenderer.hpp"
#include "layout/Primitives.hpp"
#include "layout/StyleSheet.hpp"
#include "layout/Units.hpp"
#include <QImage>
#include <QSizeF>

namespace QtPdfTemplate::engine {

/** QR symbol drawn in the margin of every physical page (header/footer placement). */
struct QrOverlay {
    QImage image;
    QSizeF size;
    QrPosition position{QrPosition::None};

    bool isActive() const { return !image.isNull() && size.width() > 0 && size.height() > 0; }
    /** Target rectangle in page coordinates: right-aligned to the frame, centred in the top or bottom margin. */
    QRectF placement(const layout::PageGeometry &geometry) const;
};

struct ComposedDocument {
    layout::PageGeometry geometry;
    layout::StyleSheet styles;
    layout::Flow flow;
    QrOverlay overlay;
    QJsonObject data;   // context after variable resolution
    SectionTally tally;
};

class DocumentBuilder {
public:
    DocumentBuilder(const ExpressionResolver &resolver, qint64 maxImageBytes);

    ComposedDocument build(const TemplateConfig &config, const QJsonObject &data) const;

    /** Copy of data with current_date (UTC, yyyy-MM-dd) and declared defaults added; caller values win. */
    static QJsonObject resolveVariables(const TemplateConfig &config, const QJsonObject &data);

private:
    void appendQr(const TemplateConfig &config, ComposedDocument &doc) const;

    const ExpressionResolver &m_resolver;
    qint64 m_maxImageBytes;
};

} // namespace QtPdfTemplate::engine
