#include "QtPdfTemplate/PreviewEngine.hpp"
#include "QtPdfTemplate/PdfEngine.hpp"
#include "QtPdfTemplate/TemplateValidator.hpp"
#include "cache/LruCache.hpp"
#include "raster/PdfRasterizer.hpp"
#include "util/DataUri.hpp"
#include "util/Strings.hpp"
#include <QCryptographicHash>
#include <QDebug>
#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <algorithm>
#include <exception>

namespace QtPdfTemplate {

namespace {

using PreviewData = std::variant<QByteArray, QString, QJsonObject>;

struct CachedPreview {
    PreviewData data;
    qint64 sizeBytes{0};
};

const QStringList & supportedFormats() {
    static const QStringList formats = { QStringLiteral("pdf"), QStringLiteral("image"), QStringLiteral("thumbnail"),
                                         QStringLiteral("html"), QStringLiteral("json") };
    return formats;
}

QByteArray compactJson(const QJsonObject &o) { return QJsonDocument(o).toJson(QJsonDocument::Compact); }

QJsonObject sampleExercise(const char *name, const char *reps, const char *rest) {
    return QJsonObject{ { QStringLiteral("nombre"), QString::fromUtf8(name) },
                        { QStringLiteral("series"), 3 },
                        { QStringLiteral("repeticiones"), QString::fromUtf8(reps) },
                        { QStringLiteral("descanso"), QString::fromUtf8(rest) } };
}

} // namespace

QJsonObject PreviewConfig::toJson() const {
    return QJsonObject{
        { QStringLiteral("format"), format },
        { QStringLiteral("quality"), quality },
        { QStringLiteral("page_number"), pageNumber },
        { QStringLiteral("dpi"), dpi },
        { QStringLiteral("use_cache"), useCache },
        { QStringLiteral("cache_ttl"), cacheTtlSeconds ? QJsonValue(*cacheTtlSeconds) : QJsonValue(QJsonValue::Null) },
        { QStringLiteral("generate_sample_data"), generateSampleData },
    };
}

struct PreviewEngine::Impl {
    Impl(EngineSettings s, Clock clock)
        : settings(s),
          pdf(s),
          cache(s.maxPreviewEntries, clock ? cache::LruCache<QString, CachedPreview>::Clock(std::move(clock))
                                           : cache::LruCache<QString, CachedPreview>::systemClock()) {}

    PreviewResult produce(const QJsonObject &config, const PreviewConfig &pc, const QJsonObject &data);

    EngineSettings settings;
    PdfEngine pdf;
    TemplateValidator validator;
    cache::LruCache<QString, CachedPreview> cache;
};

PreviewResult PreviewEngine::Impl::produce(const QJsonObject &config, const PreviewConfig &pc, const QJsonObject &data) {
    PreviewResult result;
    result.format = pc.format;
    const QString format = pc.format.trimmed().toLower();
    if(!supportedFormats().contains(format)) {
        result.errorMessage = QStringLiteral("unsupported format '%1'").arg(pc.format);
        return result;
    }
    const auto edge = raster::thumbnailEdge(pc.quality);
    if(!edge) {
        result.errorMessage = QStringLiteral("unsupported quality '%1'").arg(pc.quality);
        return result;
    }

    if(format == QLatin1String("json")) {
        const QJsonObject echo{ { QStringLiteral("template"), config }, { QStringLiteral("data"), data } };
        result.sizeBytes = compactJson(echo).size();
        result.data = echo;
        result.success = true;
        return result;
    }

    const TemplateConfig tpl = TemplateConfig::fromJson(config);
    if(format == QLatin1String("html")) {
        const QString html = pdf.renderHtml(tpl, data);
        result.sizeBytes = html.toUtf8().size();
        result.data = html;
        result.success = true;
        return result;
    }

    pdf.clearError();
    const QByteArray bytes = pdf.render(tpl, data);
    if(bytes.isEmpty()) {
        const int code = pdf.lastError() ? static_cast<int>(*pdf.lastError()) : -1;
        result.errorMessage = QStringLiteral("PDF rendering failed (error code %1)").arg(code);
        return result;
    }
    if(format == QLatin1String("pdf")) {
        result.sizeBytes = bytes.size();
        result.data = bytes;
        result.success = true;
        return result;
    }

    const int maxEdge = format == QLatin1String("thumbnail") ? *edge : 0;
    const raster::RasterResult png = raster::rasterizePage(bytes, std::max(1, pc.pageNumber), raster::scaleForDpi(pc.dpi), maxEdge);
    if(!png.ok()) {
        result.errorMessage = png.error;
        return result;
    }
    result.sizeBytes = png.png.size();
    result.data = png.png;
    result.success = true;
    return result;
}

PreviewEngine::PreviewEngine(EngineSettings settings, Clock clock)
    : d(std::make_unique<Impl>(settings, std::move(clock))) {}

PreviewEngine::~PreviewEngine() = default;

PreviewResult PreviewEngine::generatePreview(const QJsonObject &config, const PreviewConfig &previewConfig, const QJsonObject &data) {
    QElapsedTimer timer;
    timer.start();
    auto finish = [&timer](PreviewResult r) {
        r.generationTime = timer.nsecsElapsed() / 1e9;
        return r;
    };

    QJsonObject context = data;
    if(context.isEmpty() && previewConfig.generateSampleData) context = generateSampleData(config);

    QString key;
    if(previewConfig.useCache) {
        key = cacheKey(config, previewConfig, context);
        if(auto hit = d->cache.get(key)) {
            qDebug() << "PreviewEngine: cache hit" << key.left(12);
            PreviewResult r;
            r.success = true;
            r.data = hit->data;
            r.format = previewConfig.format;
            r.sizeBytes = hit->sizeBytes;
            r.cacheHit = true;
            return finish(r);
        }
    }

    const ValidationResult validation = d->validator.validate(config);
    if(!validation.isValid) {
        PreviewResult r;
        r.format = previewConfig.format;
        r.errorMessage = validation.errorMessages().join(QStringLiteral("; "));
        return finish(r);
    }

    PreviewResult result;
    try {
        result = d->produce(config, previewConfig, context);
    } catch(const std::exception &e) {
        qWarning() << "PreviewEngine: preview generation failed:" << e.what();
        result = PreviewResult();
        result.format = previewConfig.format;
        result.errorMessage = QString::fromUtf8(e.what());
    }

    if(result.success && previewConfig.useCache) {
        const int ttl = std::max(1, previewConfig.cacheTtlSeconds.value_or(d->settings.defaultPreviewTtlSeconds));
        d->cache.put(key, CachedPreview{ result.data, result.sizeBytes }, static_cast<qint64>(ttl) * 1000);
    }
    return finish(result);
}

QString PreviewEngine::buildDataUri(const PreviewResult &result) {
    if(!result.success) return QString();
    const QString format = result.format.trimmed().toLower();
    if(const QByteArray *bytes = result.bytes()) {
        if(format == QLatin1String("pdf")) return util::buildDataUri(QStringLiteral("application/pdf"), *bytes);
        if(format == QLatin1String("image") || format == QLatin1String("thumbnail")) return util::buildDataUri(QStringLiteral("image/png"), *bytes);
        return QString();
    }
    if(const QString *text = result.text()) {
        if(format == QLatin1String("html")) return util::buildDataUri(QStringLiteral("text/html"), text->toUtf8());
        return QString();
    }
    if(const QJsonObject *json = result.json()) {
        if(format == QLatin1String("json")) return util::buildDataUri(QStringLiteral("application/json"), compactJson(*json));
    }
    return QString();
}

QJsonObject PreviewEngine::generateSampleData(const QJsonObject &config) {
    auto hint = util::numericValue(config.value(QLatin1String("dias_semana")));
    if(!hint || *hint < 1) hint = util::numericValue(config.value(QLatin1String("metadata")).toObject().value(QLatin1String("dias_semana")));
    const int days = hint && *hint >= 1 ? static_cast<int>(std::min(7.0, *hint)) : 3;

    QJsonArray dias;
    for(int i = 1; i <= days; ++i) {
        dias.append(QJsonObject{
            { QStringLiteral("numero"), i },
            { QStringLiteral("nombre"), QString() },
            { QStringLiteral("ejercicios"), QJsonArray{ sampleExercise("Sentadilla", "8-10", "90s"),
                                                        sampleExercise("Press banca", "8-10", "90s"),
                                                        sampleExercise("Remo", "10-12", "60s") } },
        });
    }
    return QJsonObject{
        { QStringLiteral("gym_name"), QStringLiteral("Gimnasio") },
        { QStringLiteral("nombre_rutina"), QStringLiteral("Rutina de Ejemplo") },
        { QStringLiteral("usuario_nombre"), QString::fromUtf8("Juan Pérez") },
        { QStringLiteral("routine"), QJsonObject{ { QStringLiteral("uuid"), QStringLiteral("demo-uuid") } } },
        { QStringLiteral("dias"), dias },
    };
}

QString PreviewEngine::cacheKey(const QJsonObject &config, const PreviewConfig &previewConfig, const QJsonObject &data) {
    const QJsonObject canonical{ { QStringLiteral("template"), config },
                                 { QStringLiteral("cfg"), previewConfig.toJson() },
                                 { QStringLiteral("data"), data } };
    return QString::fromLatin1(QCryptographicHash::hash(compactJson(canonical), QCryptographicHash::Sha256).toHex());
}

int PreviewEngine::cacheSize() const { return d->cache.size(); }

void PreviewEngine::clearCache() { d->cache.clear(); }

PreviewCacheStats PreviewEngine::cacheStats() const {
    const cache::CacheStats s = d->cache.stats();
    return PreviewCacheStats{ d->cache.size(), s.hits, s.misses, s.evictions, s.expirations };
}

PdfEngine & PreviewEngine::pdfEngine() { return d->pdf; }

} // namespace QtPdfTemplate
