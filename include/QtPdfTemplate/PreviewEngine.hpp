/** \file PreviewEngine.hpp
 *  Cached previews of a template: PDF bytes, a PNG of one page, a thumbnail, an HTML rendition or a JSON echo.
 */
#pragma once
#include "QtPdfTemplate/EngineSettings.hpp"
#include "QtPdfTemplate/Export.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <functional>
#include <memory>
#include <optional>
#include <variant>

namespace QtPdfTemplate {

class PdfEngine;

struct QTPDFTEMPLATE_EXPORT PreviewConfig {
    QString format{QStringLiteral("pdf")};      // pdf | image | thumbnail | html | json
    QString quality{QStringLiteral("medium")};  // low | medium | high | ultra
    int pageNumber{1};                          // 1-based, clamped into the document
    int dpi{150};
    bool useCache{true};
    std::optional<int> cacheTtlSeconds;         // unset = EngineSettings::defaultPreviewTtlSeconds
    bool generateSampleData{true};

    /** Canonical form; part of the cache key. */
    QJsonObject toJson() const;
};

struct QTPDFTEMPLATE_EXPORT PreviewResult {
    bool success{false};
    /** PDF/PNG bytes, HTML text or the JSON echo, depending on format. */
    std::variant<QByteArray, QString, QJsonObject> data;
    QString format;
    qint64 sizeBytes{0};
    double generationTime{0}; // seconds
    bool cacheHit{false};
    QString errorMessage;     // empty on success

    const QByteArray * bytes() const { return std::get_if<QByteArray>(&data); }
    const QString * text() const { return std::get_if<QString>(&data); }
    const QJsonObject * json() const { return std::get_if<QJsonObject>(&data); }
};

struct PreviewCacheStats {
    int size{0};
    quint64 hits{0};
    quint64 misses{0};
    quint64 evictions{0};
    quint64 expirations{0};
};

/** Thread-safety: the preview cache is internally locked; generatePreview itself is not re-entrant (it drives one PdfEngine). */
class QTPDFTEMPLATE_EXPORT PreviewEngine {
public:
    /** Milliseconds since an arbitrary epoch; drives cache expiry. Empty = wall clock. */
    using Clock = std::function<qint64()>;

    explicit PreviewEngine(EngineSettings settings = EngineSettings(), Clock clock = Clock());
    ~PreviewEngine();
    PreviewEngine(const PreviewEngine &) = delete;
    PreviewEngine & operator=(const PreviewEngine &) = delete;

    /** Never throws; every failure is reported through PreviewResult::errorMessage. */
    PreviewResult generatePreview(const QJsonObject &config, const PreviewConfig &previewConfig,
                                  const QJsonObject &data = QJsonObject());

    /** data:<mime>;base64,<payload>; empty for failed results. */
    static QString buildDataUri(const PreviewResult &result);

    /** Placeholder context: dias_semana days (template or metadata hint, default 3) of three exercises each. */
    static QJsonObject generateSampleData(const QJsonObject &config);

    /** SHA-256 (hex) of the canonical JSON of template, preview config and data. */
    static QString cacheKey(const QJsonObject &config, const PreviewConfig &previewConfig, const QJsonObject &data);

    int cacheSize() const;
    void clearCache();
    PreviewCacheStats cacheStats() const;

    PdfEngine & pdfEngine();

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};

} // namespace QtPdfTemplate
