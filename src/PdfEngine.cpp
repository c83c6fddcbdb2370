#include "QtPdfTemplate/PdfEngine.hpp"
#include "engine/DocumentBuilder.hpp"
#include "engine/PdfStamp.hpp"
#include "html/HtmlWriter.hpp"
#include "layout/PageComposer.hpp"
#include "xml/XmpPacket.hpp"
#include <QBuffer>
#include <QCryptographicHash>
#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QPageLayout>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <QUuid>

namespace QtPdfTemplate {

namespace {

const QString kProducer = QStringLiteral("QtPdfTemplate");

QByteArray xmpFor(const TemplateConfig &config, const QJsonObject &resolvedData) {
    xml::DocumentInfo info;
    info.title = config.metadata.value(QLatin1String("name")).toString();
    info.description = config.metadata.value(QLatin1String("description")).toString();
    info.version = config.metadata.value(QLatin1String("version")).toVariant().toString();
    for(const auto &t : config.metadata.value(QLatin1String("tags")).toArray()) {
        if(t.isString() && !t.toString().isEmpty()) info.keywords << t.toString();
    }
    info.producer = kProducer;
    info.createDate = QString::fromLatin1(engine::kFixedIsoDate);
    const QByteArray seed = QJsonDocument(QJsonObject{ { QStringLiteral("metadata"), config.metadata },
                                                       { QStringLiteral("data"), resolvedData } }).toJson(QJsonDocument::Compact);
    info.documentId = QStringLiteral("uuid:") + QUuid::createUuidV5(QUuid(), seed).toString(QUuid::WithoutBraces);
    return xml::buildXmpPacket(info);
}

QPageLayout pageLayoutFor(const layout::PageGeometry &g) {
    QSizeF portrait = g.pageSize;
    if(g.landscape) portrait.transpose();
    return QPageLayout(QPageSize(portrait, QPageSize::Point, QString(), QPageSize::ExactMatch),
                       g.landscape ? QPageLayout::Landscape : QPageLayout::Portrait,
                       QMarginsF(0, 0, 0, 0), QPageLayout::Point);
}

} // namespace

PdfEngine::PdfEngine(EngineSettings settings, std::shared_ptr<ExpressionResolver> resolver)
    : m_settings(settings), m_resolver(std::move(resolver)) {
    if(!m_resolver) m_resolver = std::make_shared<ExpressionResolver>(m_settings.maxCompiledExpressions);
}

PdfEngine::~PdfEngine() = default;

QJsonObject PdfEngine::resolveVariables(const TemplateConfig &config, const QJsonObject &data) const {
    return engine::DocumentBuilder::resolveVariables(config, data);
}

QByteArray PdfEngine::render(const QJsonObject &config, const QJsonObject &data) {
    return render(TemplateConfig::fromJson(config), data);
}

QByteArray PdfEngine::render(const TemplateConfig &config, const QJsonObject &data) {
    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);
    if(!render(config, data, buffer)) return QByteArray();
    buffer.close();
    return bytes;
}

bool PdfEngine::render(const TemplateConfig &config, const QJsonObject &data, QIODevice &out) {
    m_stats = RenderStats();
    if(config.pages.empty()) {
        qWarning() << "PdfEngine: template has no pages";
        setError(ErrorCode::EmptyTemplate);
        return false;
    }
    if(!out.isOpen() || !out.isWritable()) {
        qWarning() << "PdfEngine: output device is not writable";
        setError(ErrorCode::OutputOpenFailed);
        return false;
    }

    const engine::DocumentBuilder builder(*m_resolver, m_settings.maxImageBytes);
    const engine::ComposedDocument doc = builder.build(config, data);

    QByteArray pdf;
    int pageCount = 0;
    int overlayDraws = 0;
    {
        QBuffer buffer(&pdf);
        buffer.open(QIODevice::WriteOnly);
        QPdfWriter writer(&buffer);
        writer.setResolution(72); // one device unit per point
        writer.setPageLayout(pageLayoutFor(doc.geometry));
        writer.setCreator(kProducer);
        writer.setTitle(config.metadata.value(QLatin1String("name")).toString());
        writer.setDocumentXmpMetadata(xmpFor(config, doc.data));

        QPainter painter;
        if(!painter.begin(&writer)) {
            qWarning() << "PdfEngine: cannot begin painting on the PDF writer";
            setError(ErrorCode::PaintDeviceUnavailable);
            return false;
        }
        layout::PageComposer composer(doc.geometry, doc.styles);
        if(doc.overlay.isActive()) {
            const QRectF target = doc.overlay.placement(doc.geometry);
            composer.setPageCallback([&](QPainter &p, int) {
                p.setRenderHint(QPainter::SmoothPixmapTransform, false);
                p.drawImage(target, doc.overlay.image);
                ++overlayDraws;
            });
        }
        const bool composed = composer.compose(doc.flow, painter, [&writer]{ return writer.newPage(); });
        painter.end();
        if(!composed) {
            qWarning() << "PdfEngine: the PDF writer refused a new page";
            setError(ErrorCode::PaintFailed);
            return false;
        }
        pageCount = composer.pageCount();
    }

    // Dates first, then an id derived from the otherwise final bytes.
    engine::stampDeterministicFields(pdf, QByteArray("0"));
    engine::stampDeterministicFields(pdf, QCryptographicHash::hash(pdf, QCryptographicHash::Sha1).toHex());

    if(out.write(pdf) != pdf.size()) {
        qWarning() << "PdfEngine: short write to output device";
        setError(ErrorCode::OutputOpenFailed);
        return false;
    }

    m_stats.pageCount = pageCount;
    m_stats.overlayDraws = overlayDraws;
    m_stats.qrImages = doc.tally.qrImages;
    m_stats.droppedSections = doc.tally.droppedSections;
    m_stats.droppedImages = doc.tally.droppedImages;
    m_stats.skippedByCondition = doc.tally.skippedByCondition;
    m_stats.flowSize = static_cast<int>(doc.flow.size());
    return true;
}

bool PdfEngine::renderToFile(const QJsonObject &config, const QJsonObject &data, const QString &outputPath) {
    const QByteArray pdf = render(config, data);
    if(pdf.isEmpty()) return false;
    QFile f(outputPath);
    if(!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "PdfEngine: cannot open" << outputPath << "-" << f.errorString();
        setError(ErrorCode::OutputOpenFailed);
        return false;
    }
    if(f.write(pdf) != pdf.size()) {
        qWarning() << "PdfEngine: short write to" << outputPath;
        setError(ErrorCode::OutputOpenFailed);
        return false;
    }
    return true;
}

QString PdfEngine::renderHtml(const TemplateConfig &config, const QJsonObject &data) {
    m_stats = RenderStats();
    const engine::DocumentBuilder builder(*m_resolver, m_settings.maxImageBytes);
    const engine::ComposedDocument doc = builder.build(config, data);
    m_stats.qrImages = doc.tally.qrImages;
    m_stats.droppedSections = doc.tally.droppedSections;
    m_stats.droppedImages = doc.tally.droppedImages;
    m_stats.skippedByCondition = doc.tally.skippedByCondition;
    m_stats.flowSize = static_cast<int>(doc.flow.size());
    QString title = config.metadata.value(QLatin1String("name")).toString();
    if(title.isEmpty()) title = kProducer;
    return html::writeDocument(doc, title);
}

} // namespace QtPdfTemplate
