// Template parsing: section payload placement, aliases, conditions, QR options, variables, lenient defaults
#include "QtPdfTemplate/TemplateConfig.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <cassert>
#include <iostream>

using namespace QtPdfTemplate;

static QJsonObject parse(const char *json) {
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

int main() {
    // Section payloads: content object, string content, payload beside "type"
    {
        Section h = Section::fromJson(parse(R"({"type":" Header ","content":{"title":"T","subtitle":"S"}})"));
        assert(h.type == "header");
        auto *hs = std::get_if<HeaderSection>(&h.content);
        assert(hs && hs->title == "T" && hs->subtitle == "S");

        Section t = Section::fromJson(parse(R"({"type":"text","content":"Hola {{ name }}","style":"Small"})"));
        auto *ts = std::get_if<TextSection>(&t.content);
        assert(ts && ts->text == "Hola {{ name }}" && ts->style == "small");

        Section t2 = Section::fromJson(parse(R"({"type":"text","text":"beside"})"));
        assert(std::get<TextSection>(t2.content).text == "beside");

        Section sp = Section::fromJson(parse(R"({"type":"spacer","height":"12mm","spacing_after":3})"));
        assert(std::get<SpacerSection>(sp.content).height.toString() == "12mm");
        assert(sp.spacingAfter.toDouble() == 3.0);

        Section tb = Section::fromJson(parse(R"({"type":"table","content":{"rows":[["a",1],"skip",["b",true]]}})"));
        const auto &rows = std::get<TableSection>(tb.content).rows;
        assert(rows.size() == 2);
        assert(rows[0] == QStringList({"a", "1"}));
        assert(rows[1] == QStringList({"b", "true"}));
    }
    // Exercise tables, images, QR sections, unknown types and non-objects
    {
        Section ex = Section::fromJson(parse(R"({"type":"exercise_table","content":{"format":"Excel_Weekly","weeks":6,"week_columns":["W1"],"label":"Plan"}})"));
        const auto &e = std::get<ExerciseTableSection>(ex.content);
        assert(e.format == "excel_weekly" && e.weeks.toInt() == 6 && e.weekColumns == QStringList({"W1"}) && e.label == "Plan");
        assert(e.columns.isEmpty());

        Section img = Section::fromJson(parse(R"({"type":"image","content":{"src":" data:image/png;base64,AAAA ","width":50}})"));
        const auto &i = std::get<ImageSection>(img.content);
        assert(i.src == "data:image/png;base64,AAAA");
        assert(i.width.toDouble() == 50.0 && i.height.isUndefined());

        assert(std::holds_alternative<QrCodeSection>(Section::fromJson(parse(R"({"type":"qr_code"})")).content));
        assert(std::holds_alternative<PageBreakSection>(Section::fromJson(parse(R"({"type":"page_break"})")).content));

        Section u = Section::fromJson(parse(R"({"type":"chart"})"));
        assert(std::get<UnknownSection>(u.content).type == "chart");
        assert(std::holds_alternative<UnknownSection>(Section::fromJson(QJsonValue(42)).content));

        assert(Section::isKnownType("Spacing"));
        assert(!Section::isKnownType("chart"));
    }
    // Conditions
    {
        Section c = Section::fromJson(parse(R"({"type":"text","content":"x","conditional":{"if":" n > 1 ","show":false}})"));
        assert(c.condition.has_value());
        assert(c.condition->expression == "n > 1" && !c.condition->show);
        assert(!Section::fromJson(parse(R"({"type":"text","content":"x"})")).condition.has_value());
    }
    // QR options
    {
        assert(QrCodeConfig::parsePosition("separate_sheet") == QrPosition::Separate);
        assert(QrCodeConfig::parsePosition("") == QrPosition::Inline);
        assert(!QrCodeConfig::parsePosition("sidebar").has_value());
        assert(QrCodeConfig::parseSource("USER_DATA") == QrDataSource::UserData);

        QrCodeConfig qr = QrCodeConfig::fromJson(parse(R"({"enabled":true,"position":"sidebar","data_source":"nope","size":{"width":30}})"));
        assert(qr.enabled);
        assert(qr.position == QrPosition::None);
        assert(qr.source == QrDataSource::RoutineUuid);
        assert(qr.width.toDouble() == 30.0 && qr.height.isUndefined());
    }
    // Whole template: layout defaults, pages, variables sorted by name, styling
    {
        TemplateConfig cfg = TemplateConfig::fromJson(parse(R"({
            "metadata":{"name":"R"},
            "layout":{"orientation":"landscape","margins":{"top":"10mm"}},
            "pages":[{"name":"p1","sections":[{"type":"text","content":"a"},{"type":"page_break"}]},"junk"],
            "variables":{"zeta":{"type":"number","default":3},"alpha":{"required":true}},
            "styling":{"colors":{"primary":"#ff0000"}}
        })"));
        assert(cfg.metadata.value("name").toString() == "R");
        assert(cfg.layout.pageSize == "A4");
        assert(cfg.layout.orientation == "landscape");
        assert(cfg.layout.marginTop.toString() == "10mm" && cfg.layout.marginLeft.isUndefined());
        assert(cfg.pages.size() == 1 && cfg.pages[0].name == "p1" && cfg.pages[0].sections.size() == 2);
        assert(cfg.variables.size() == 2);
        assert(cfg.variables[0].name == "alpha" && cfg.variables[0].required && !cfg.variables[0].hasDefault());
        assert(cfg.variables[0].type == "string");
        assert(cfg.variables[1].name == "zeta" && cfg.variables[1].type == "number" && cfg.variables[1].defaultValue.toInt() == 3);
        assert(!cfg.qrCode.enabled);
        assert(cfg.styling.colors.value("primary").toString() == "#ff0000");
    }
    std::cout << "template_config_test passed" << std::endl;
    return 0;
}
