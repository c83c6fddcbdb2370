// Previews: formats, sample data, cache hits, TTL expiry, capacity bound, validation and option errors, data URIs
#include "QtPdfTemplate/PreviewEngine.hpp"
#include <QGuiApplication>
#include <QImage>
#include <QJsonArray>
#include <QJsonDocument>
#include <cassert>
#include <iostream>

using namespace QtPdfTemplate;

static QJsonObject parse(const char *json) {
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

static QJsonObject previewTemplate() {
    return parse(R"({
        "metadata":{"name":"Preview","version":"1","description":"d","dias_semana":2},
        "layout":{"page_size":"A4"},
        "pages":[{"sections":[
            {"type":"header","content":{"title":"{{ gym_name }}"}},
            {"type":"exercise_table","content":{}}
        ]}],
        "variables":{}
    })");
}

static PreviewConfig format(const char *f) {
    PreviewConfig pc;
    pc.format = QString::fromLatin1(f);
    return pc;
}

int main(int argc, char **argv) {
    if(qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) qputenv("QT_QPA_PLATFORM", "offscreen");
    QGuiApplication app(argc, argv);

    qint64 now = 0;
    auto clock = [&now]{ return now; };

    // Sample data: day hint from the template or its metadata, default 3, capped at 7
    {
        const QJsonObject sample = PreviewEngine::generateSampleData(previewTemplate());
        assert(sample.value("dias").toArray().size() == 2);
        assert(sample.value("gym_name").toString() == "Gimnasio");
        assert(sample.value("routine").toObject().value("uuid").toString() == "demo-uuid");
        const QJsonObject day = sample.value("dias").toArray().at(0).toObject();
        assert(day.value("ejercicios").toArray().size() == 3);
        assert(PreviewEngine::generateSampleData(QJsonObject()).value("dias").toArray().size() == 3);
        assert(PreviewEngine::generateSampleData(parse(R"({"dias_semana":9})")).value("dias").toArray().size() == 7);
        assert(PreviewEngine::generateSampleData(parse(R"({"dias_semana":1e10})")).value("dias").toArray().size() == 7);
        assert(PreviewEngine::generateSampleData(parse(R"({"dias_semana":-1e300})")).value("dias").toArray().size() == 3);
    }
    // JSON echo uses sample data when none is given; the second call is a cache hit
    {
        PreviewEngine engine(EngineSettings(), clock);
        const PreviewResult first = engine.generatePreview(previewTemplate(), format("json"));
        assert(first.success && !first.cacheHit);
        assert(first.json() != nullptr);
        assert(first.json()->value("template").toObject() == previewTemplate());
        assert(first.json()->value("data").toObject().value("nombre_rutina").toString() == "Rutina de Ejemplo");
        assert(first.sizeBytes > 0);
        assert(PreviewEngine::buildDataUri(first).startsWith("data:application/json;base64,"));

        const PreviewResult second = engine.generatePreview(previewTemplate(), format("json"));
        assert(second.success && second.cacheHit);
        assert(*second.json() == *first.json());
        assert(engine.cacheSize() == 1);
        assert(engine.cacheStats().hits == 1);
    }
    // Entries expire after their TTL
    {
        PreviewEngine engine(EngineSettings(), clock);
        PreviewConfig pc = format("json");
        pc.cacheTtlSeconds = 10;
        assert(!engine.generatePreview(previewTemplate(), pc).cacheHit);
        now += 9999;
        assert(engine.generatePreview(previewTemplate(), pc).cacheHit);
        now += 2;
        assert(!engine.generatePreview(previewTemplate(), pc).cacheHit);
        assert(engine.cacheStats().expirations == 1);

        pc.useCache = false;
        assert(!engine.generatePreview(previewTemplate(), pc).cacheHit);
        assert(engine.cacheSize() == 1);
        engine.clearCache();
        assert(engine.cacheSize() == 0);
    }
    // The cache is bounded by maxPreviewEntries
    {
        EngineSettings settings;
        settings.maxPreviewEntries = 2;
        PreviewEngine engine(settings, clock);
        for(int i = 0; i < 3; ++i) {
            const QJsonObject data{ { "gym_name", QStringLiteral("Gym %1").arg(i) } };
            assert(engine.generatePreview(previewTemplate(), format("json"), data).success);
        }
        assert(engine.cacheSize() == 2);
        assert(engine.cacheStats().evictions == 1);
    }
    // Cache keys cover template, options and data
    {
        const QJsonObject data{ { "a", 1 } };
        const QString k = PreviewEngine::cacheKey(previewTemplate(), format("pdf"), data);
        assert(k.size() == 64);
        assert(k == PreviewEngine::cacheKey(previewTemplate(), format("pdf"), data));
        assert(k != PreviewEngine::cacheKey(previewTemplate(), format("html"), data));
        assert(k != PreviewEngine::cacheKey(previewTemplate(), format("pdf"), QJsonObject{ { "a", 2 } }));
    }
    // Invalid templates and options fail without caching
    {
        PreviewEngine engine(EngineSettings(), clock);
        QJsonObject broken = previewTemplate();
        broken.remove("layout");
        const PreviewResult invalid = engine.generatePreview(broken, format("pdf"));
        assert(!invalid.success);
        assert(invalid.errorMessage.contains("Missing required key 'layout'"));
        assert(PreviewEngine::buildDataUri(invalid).isEmpty());

        const PreviewResult docx = engine.generatePreview(previewTemplate(), format("docx"));
        assert(!docx.success && docx.errorMessage == "unsupported format 'docx'");

        PreviewConfig pc = format("thumbnail");
        pc.quality = "extreme";
        const PreviewResult quality = engine.generatePreview(previewTemplate(), pc);
        assert(!quality.success && quality.errorMessage.contains("unsupported quality"));
        assert(engine.cacheSize() == 0);
    }
    // HTML and PDF renditions
    {
        PreviewEngine engine(EngineSettings(), clock);
        const QJsonObject data{ { "gym_name", "Iron" } };
        const PreviewResult html = engine.generatePreview(previewTemplate(), format("html"), data);
        assert(html.success && html.text() != nullptr);
        assert(html.text()->startsWith("<!DOCTYPE html>"));
        assert(html.text()->contains("Iron"));
        assert(html.sizeBytes == html.text()->toUtf8().size());
        assert(PreviewEngine::buildDataUri(html).startsWith("data:text/html;base64,"));

        const PreviewResult pdf = engine.generatePreview(previewTemplate(), format("pdf"), data);
        assert(pdf.success && pdf.bytes() != nullptr);
        assert(pdf.bytes()->startsWith("%PDF-"));
        assert(pdf.sizeBytes == pdf.bytes()->size());
        assert(pdf.generationTime >= 0);
        assert(PreviewEngine::buildDataUri(pdf).startsWith("data:application/pdf;base64,"));
    }
    // Page images and thumbnails
    {
        PreviewEngine engine(EngineSettings(), clock);
        PreviewConfig pc = format("image");
        pc.dpi = 72;
        pc.pageNumber = 5; // clamped to the last page
        const PreviewResult image = engine.generatePreview(previewTemplate(), pc);
        assert(image.success);
        const QImage page = QImage::fromData(*image.bytes(), "PNG");
        assert(page.width() == 595 && page.height() == 842);
        assert(PreviewEngine::buildDataUri(image).startsWith("data:image/png;base64,"));

        PreviewConfig thumb = format("thumbnail");
        thumb.quality = "low";
        const PreviewResult small = engine.generatePreview(previewTemplate(), thumb);
        assert(small.success);
        const QImage t = QImage::fromData(*small.bytes(), "PNG");
        assert(t.height() == 256 && t.width() < 256);
    }
    std::cout << "preview_engine_test passed" << std::endl;
    return 0;
}
