#include "engine/DocumentBuilder.hpp"
#include "qr/QrCode.hpp"
#include <QDateTime>
#include <QDebug>
#include <algorithm>

namespace QtPdfTemplate::engine {

using namespace layout;

namespace {
constexpr double kOverlayQrMm = 40.0;
constexpr double kLargeQrMm = 60.0;
}

QRectF QrOverlay::placement(const PageGeometry &geometry) const {
    const QMarginsF &m = geometry.margins;
    const double x = geometry.pageSize.width() - m.right() - size.width();
    double y = 0;
    if(position == QrPosition::Footer) {
        y = geometry.pageSize.height() - std::max(0.0, (m.bottom() - size.height()) / 2.0) - size.height();
    } else {
        y = std::max(0.0, (m.top() - size.height()) / 2.0);
    }
    return QRectF(x, y, size.width(), size.height());
}

DocumentBuilder::DocumentBuilder(const ExpressionResolver &resolver, qint64 maxImageBytes)
    : m_resolver(resolver), m_maxImageBytes(maxImageBytes) {}

QJsonObject DocumentBuilder::resolveVariables(const TemplateConfig &config, const QJsonObject &data) {
    QJsonObject resolved = data;
    if(!resolved.contains(QLatin1String("current_date")))
        resolved.insert(QStringLiteral("current_date"), QDateTime::currentDateTimeUtc().toString(QStringLiteral("yyyy-MM-dd")));
    for(const auto &v : config.variables) {
        if(resolved.contains(v.name) || !v.hasDefault()) continue;
        resolved.insert(v.name, v.defaultValue);
    }
    return resolved;
}

ComposedDocument DocumentBuilder::build(const TemplateConfig &config, const QJsonObject &data) const {
    ComposedDocument doc;
    doc.data = resolveVariables(config, data);
    const PageLayout &pl = config.layout;
    doc.geometry = resolveGeometry(pl.pageSize, pl.orientation, pl.marginTop, pl.marginBottom, pl.marginLeft, pl.marginRight);
    doc.styles = StyleSheet::fromHints(config.styling);

    SectionRenderer renderer(m_resolver, config.qrCode, m_maxImageBytes);
    for(size_t i = 0; i < config.pages.size(); ++i) {
        for(const auto &section : config.pages[i].sections) renderer.render(section, doc.data, doc.flow);
        if(i + 1 < config.pages.size()) doc.flow.push_back(PageBreakBlock{});
    }
    doc.tally = renderer.tally();
    appendQr(config, doc);
    return doc;
}

void DocumentBuilder::appendQr(const TemplateConfig &config, ComposedDocument &doc) const {
    const QrCodeConfig &qr = config.qrCode;
    if(!qr.enabled || qr.position == QrPosition::None) return;
    const QString custom = m_resolver.resolve(qr.customData, doc.data);
    const auto payload = qr::resolvePayload(doc.data, qr.source, custom);
    if(!payload) {
        qWarning() << "DocumentBuilder: QR enabled but no payload could be resolved; QR omitted";
        return;
    }
    const QImage image = qr::encode(*payload);
    if(image.isNull()) return;

    const double fallback = mm(qr.position == QrPosition::Separate ? kLargeQrMm : kOverlayQrMm);
    double w = toPoints(qr.width, fallback);
    double h = toPoints(qr.height, fallback);
    if(w <= 0 || h <= 0) w = h = mm(kOverlayQrMm);

    switch(qr.position) {
    case QrPosition::Header:
    case QrPosition::Footer:
        doc.overlay = QrOverlay{ image, QSizeF(w, h), qr.position };
        break;
    case QrPosition::Inline:
        doc.flow.push_back(SpacerBlock{ 6.0 });
        doc.flow.push_back(ImageBlock{ image, w, h, true });
        ++doc.tally.qrImages;
        break;
    case QrPosition::Separate:
        doc.flow.push_back(PageBreakBlock{});
        doc.flow.push_back(Paragraph{ QStringLiteral("QR"), TextStyle::SectionHeader });
        doc.flow.push_back(SpacerBlock{ 12.0 });
        doc.flow.push_back(ImageBlock{ image, w, h, true });
        ++doc.tally.qrImages;
        break;
    case QrPosition::None:
        break;
    }
}

} // namespace QtPdfTemplate::engine
