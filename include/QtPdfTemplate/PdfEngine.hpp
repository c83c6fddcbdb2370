/** \file PdfEngine.hpp
 *  Public façade: render a declarative template plus a data context into PDF bytes.
 *  Malformed pages and sections are skipped; a render either produces a complete document or fails with lastError().
 */
#pragma once
#include "QtPdfTemplate/EngineSettings.hpp"
#include "QtPdfTemplate/Export.hpp"
#include "QtPdfTemplate/ExpressionResolver.hpp"
#include "QtPdfTemplate/TemplateConfig.hpp"
#include <QByteArray>
#include <QIODevice>
#include <QJsonObject>
#include <QString>
#include <memory>
#include <optional>

namespace QtPdfTemplate {

/** Diagnostics of the last successful render. */
struct RenderStats {
    int pageCount{0};        // physical pages written
    int overlayDraws{0};     // header/footer QR draws (one per physical page when active)
    int qrImages{0};         // QR symbols placed in the flow (inline, separate sheet, qr_code sections)
    int droppedSections{0};  // unknown section types
    int droppedImages{0};    // inline images rejected (scheme, budget, decoding)
    int skippedByCondition{0};
    int flowSize{0};         // layout primitives composed
};

/** Main API entry.
 *  Thread-safety: instances are not thread-safe (per-call diagnostics). The ExpressionResolver may be shared.
 *  Painting requires a QGuiApplication (an offscreen platform is sufficient).
 */
class QTPDFTEMPLATE_EXPORT PdfEngine {
public:
    enum class ErrorCode {
        EmptyTemplate,          // no renderable page
        PaintDeviceUnavailable, // QPainter could not begin on the PDF writer
        PaintFailed,            // the writer refused a new page
        OutputOpenFailed        // destination file or device not writable
    };

    explicit PdfEngine(EngineSettings settings = EngineSettings(), std::shared_ptr<ExpressionResolver> resolver = nullptr);
    ~PdfEngine();

    /** PDF bytes; empty on failure. */
    QByteArray render(const QJsonObject &config, const QJsonObject &data);
    QByteArray render(const TemplateConfig &config, const QJsonObject &data);
    /** Writes the document to an open, writable device. */
    bool render(const TemplateConfig &config, const QJsonObject &data, QIODevice &out);
    /** Writes the document to outputPath (truncating). */
    bool renderToFile(const QJsonObject &config, const QJsonObject &data, const QString &outputPath);

    /** Standalone XHTML rendition of the same primitive flow (one section element per logical page). */
    QString renderHtml(const TemplateConfig &config, const QJsonObject &data);

    /** Data context the renderer would see: current_date and declared defaults added, caller values kept. */
    QJsonObject resolveVariables(const TemplateConfig &config, const QJsonObject &data) const;

    const RenderStats & lastStats() const { return m_stats; }
    const EngineSettings & settings() const { return m_settings; }
    const std::shared_ptr<ExpressionResolver> & resolver() const { return m_resolver; }

    std::optional<ErrorCode> lastError() const { return m_lastError; }
    void clearError() { m_lastError.reset(); }

private:
    void setError(ErrorCode ec) { m_lastError = ec; }

    EngineSettings m_settings;
    std::shared_ptr<ExpressionResolver> m_resolver;
    RenderStats m_stats;
    std::optional<ErrorCode> m_lastError;
};

} // namespace QtPdfTemplate
