// PDF rendering: deterministic bytes, pagination, QR placements, diagnostics, variable defaults, failure codes
#include "QtPdfTemplate/PdfEngine.hpp"
#include <QBuffer>
#include <QGuiApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <cassert>
#include <iostream>

using namespace QtPdfTemplate;

static QJsonObject parse(const char *json) {
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

static QJsonObject routineTemplate() {
    return parse(R"({
        "metadata":{"name":"Rutina","version":"1.0","description":"Plan","tags":["gym"]},
        "layout":{"page_size":"A4","orientation":"portrait"},
        "pages":[{"sections":[
            {"type":"header","content":{"title":"{{ gym_name }}","subtitle":"{{ usuario_nombre | default('') }}"}},
            {"type":"text","content":"Generado el {{ current_date }}"},
            {"type":"exercise_table","content":{}}
        ]}],
        "variables":{"gym_name":{"type":"string","default":"Gym Default"}}
    })");
}

static QJsonObject routineData() {
    return parse(R"({
        "usuario_nombre":"Ana",
        "routine":{"uuid":"r-42"},
        "dias":[{"numero":1,"nombre":"Torso","ejercicios":[{"nombre":"Press banca","series":3,"repeticiones":"10","descanso":"60s"}]}]
    })");
}

static QJsonObject withPages(QJsonObject cfg, int count) {
    QJsonArray pages;
    for(int i = 0; i < count; ++i)
        pages.append(parse(R"({"sections":[{"type":"text","content":"page"}]})"));
    cfg["pages"] = pages;
    return cfg;
}

int main(int argc, char **argv) {
    if(qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) qputenv("QT_QPA_PLATFORM", "offscreen");
    QGuiApplication app(argc, argv);

    // Output is a PDF, and identical inputs give identical bytes
    {
        PdfEngine engine;
        const QByteArray a = engine.render(routineTemplate(), routineData());
        assert(a.startsWith("%PDF-"));
        assert(!engine.lastError().has_value());
        assert(engine.lastStats().pageCount == 1);
        assert(a.contains("(D:20000101000000"));
        assert(a.contains("2000-01-01T00:00:00Z"));
        const QByteArray b = engine.render(routineTemplate(), routineData());
        assert(a == b);

        PdfEngine other;
        assert(other.render(routineTemplate(), routineData()) == a);
    }
    // Template pages become physical pages; header QR is drawn on each
    {
        QJsonObject cfg = withPages(routineTemplate(), 3);
        cfg["qr_code"] = parse(R"({"enabled":true,"position":"header","data_source":"routine_uuid"})");
        PdfEngine engine;
        assert(!engine.render(cfg, routineData()).isEmpty());
        assert(engine.lastStats().pageCount == 3);
        assert(engine.lastStats().overlayDraws == 3);
        assert(engine.lastStats().qrImages == 0);

        cfg["qr_code"] = parse(R"({"enabled":true,"position":"footer","data_source":"custom_url","custom_data":"https://gym.example/{{ routine.uuid }}"})");
        assert(!engine.render(cfg, routineData()).isEmpty());
        assert(engine.lastStats().overlayDraws == 3);
    }
    // Inline and separate-sheet QR placements
    {
        QJsonObject cfg = routineTemplate();
        cfg["qr_code"] = parse(R"({"enabled":true,"position":"inline"})");
        PdfEngine engine;
        assert(!engine.render(cfg, routineData()).isEmpty());
        assert(engine.lastStats().qrImages == 1);
        assert(engine.lastStats().pageCount == 1);
        assert(engine.lastStats().overlayDraws == 0);

        cfg["qr_code"] = parse(R"({"enabled":true,"position":"separate_sheet"})");
        assert(!engine.render(cfg, routineData()).isEmpty());
        assert(engine.lastStats().pageCount == 2);

        // No payload: the QR is omitted, the document still renders
        assert(!engine.render(cfg, QJsonObject()).isEmpty());
        assert(engine.lastStats().qrImages == 0);
        assert(engine.lastStats().pageCount == 1);

        // Unrecognized position draws nothing
        cfg["qr_code"] = parse(R"({"enabled":true,"position":"sidebar"})");
        assert(!engine.render(cfg, routineData()).isEmpty());
        assert(engine.lastStats().qrImages == 0 && engine.lastStats().overlayDraws == 0);
    }
    // Malformed sections are dropped without failing the render
    {
        QJsonObject cfg = routineTemplate();
        cfg["pages"] = QJsonArray{ parse(R"({"sections":[
            {"type":"chart"},
            {"type":"image","content":{"src":"https://x/y.png"}},
            {"type":"text","content":"hidden","conditional":{"if":"usuario_nombre == 'Bob'"}},
            {"type":"text","content":"kept"}
        ]})") };
        PdfEngine engine;
        assert(!engine.render(cfg, routineData()).isEmpty());
        assert(engine.lastStats().droppedSections == 1);
        assert(engine.lastStats().droppedImages == 1);
        assert(engine.lastStats().skippedByCondition == 1);
    }
    // Long tables continue on following pages
    {
        QJsonArray rows;
        for(int i = 0; i < 150; ++i) rows.append(QJsonArray{ QString::number(i), QStringLiteral("row") });
        QJsonObject table{ { "type", "table" }, { "content", QJsonObject{ { "rows", rows } } } };
        QJsonObject cfg = routineTemplate();
        cfg["pages"] = QJsonArray{ QJsonObject{ { "sections", QJsonArray{ table } } } };
        PdfEngine engine;
        assert(!engine.render(cfg, QJsonObject()).isEmpty());
        assert(engine.lastStats().pageCount > 1);
    }
    // Declared defaults fill gaps; caller values win
    {
        PdfEngine engine;
        const TemplateConfig tpl = TemplateConfig::fromJson(routineTemplate());
        const QJsonObject resolved = engine.resolveVariables(tpl, QJsonObject());
        assert(resolved.value("gym_name").toString() == "Gym Default");
        assert(resolved.value("current_date").toString().size() == 10);

        QJsonObject data = routineData();
        data["gym_name"] = "Mine";
        data["current_date"] = "2024-05-01";
        const QJsonObject mine = engine.resolveVariables(tpl, data);
        assert(mine.value("gym_name").toString() == "Mine");
        assert(mine.value("current_date").toString() == "2024-05-01");

        const QString html = engine.renderHtml(tpl, data);
        assert(html.startsWith("<!DOCTYPE html>"));
        assert(html.contains("Mine"));
        assert(html.contains("Generado el 2024-05-01"));
        assert(!html.contains("Gym Default"));
    }
    // Failures are reported through lastError
    {
        PdfEngine engine;
        QJsonObject cfg = routineTemplate();
        cfg["pages"] = QJsonArray{};
        assert(engine.render(cfg, routineData()).isEmpty());
        assert(engine.lastError() == PdfEngine::ErrorCode::EmptyTemplate);
        engine.clearError();

        assert(!engine.renderToFile(routineTemplate(), routineData(), "/nonexistent-dir/out/rutina.pdf"));
        assert(engine.lastError() == PdfEngine::ErrorCode::OutputOpenFailed);
        engine.clearError();

        QBuffer closed;
        assert(!engine.render(TemplateConfig::fromJson(routineTemplate()), routineData(), closed));
        assert(engine.lastError() == PdfEngine::ErrorCode::OutputOpenFailed);
    }
    std::cout << "pdf_engine_test passed" << std::endl;
    return 0;
}
