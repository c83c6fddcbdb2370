// Template validation: required keys, structural errors, warnings with suggestions, scores, JSON report
#include "QtPdfTemplate/TemplateValidator.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <algorithm>
#include <cassert>
#include <iostream>

using namespace QtPdfTemplate;

static QJsonObject parse(const char *json) {
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

static const ValidationIssue * findIssue(const std::vector<ValidationIssue> &issues, const QString &path) {
    auto it = std::find_if(issues.begin(), issues.end(), [&](const ValidationIssue &i){ return i.path == path; });
    return it == issues.end() ? nullptr : &*it;
}

static QJsonObject minimal() {
    return parse(R"({
        "metadata":{"name":"Rutina","version":"1.0","description":"Plan semanal"},
        "layout":{"page_size":"A4","orientation":"portrait","margins":{"top":20,"bottom":"20mm"}},
        "pages":[{"sections":[{"type":"header","content":{"title":"{{ gym_name }}"}},
                              {"type":"exercise_table","content":{}}]}],
        "variables":{"gym_name":{"type":"string","default":"Gym"}}
    })");
}

int main() {
    TemplateValidator validator;

    // A well-formed template is valid with full scores and no warnings
    {
        const ValidationResult r = validator.validate(minimal());
        assert(r.isValid);
        assert(r.errors.empty());
        assert(r.warnings.empty());
        assert(r.performanceScore == 100.0 && r.securityScore == 100.0);
        assert(r.info.size() == 2); // the two score lines
    }
    // Missing required keys are errors, reported in order
    {
        const ValidationResult r = validator.validate(parse(R"({"pages":[]})"));
        assert(!r.isValid);
        const QStringList msgs = r.errorMessages();
        assert(msgs.size() == 3);
        assert(msgs[0] == "Missing required key 'metadata' (metadata)");
        assert(msgs[1] == "Missing required key 'layout' (layout)");
        assert(msgs[2] == "Missing required key 'variables' (variables)");
        assert(findIssue(r.warnings, "pages") != nullptr); // no pages
    }
    // Structural errors: pages not a list, page not an object, variables not an object
    {
        QJsonObject cfg = minimal();
        cfg["pages"] = QJsonValue("oops");
        assert(findIssue(validator.validate(cfg).errors, "pages") != nullptr);

        cfg = minimal();
        cfg["pages"] = QJsonArray{ 1 };
        assert(findIssue(validator.validate(cfg).errors, "pages[0]") != nullptr);

        cfg = minimal();
        cfg["variables"] = QJsonArray{};
        const ValidationResult r = validator.validate(cfg);
        assert(!r.isValid && findIssue(r.errors, "variables") != nullptr);
    }
    // Content problems are warnings with suggestions; they do not invalidate
    {
        QJsonObject cfg = minimal();
        cfg["pages"] = QJsonArray{ parse(R"({"sections":[
            {"type":"headr"},
            {"type":"image","content":{"src":"http://x/y.png"}},
            {"type":"exercise_table","content":{"format":"excel_weekly"}},
            {"type":"spacing","height":"tall"}
        ]})") };
        cfg["layout"] = parse(R"({"page_size":"A3","orientation":"portret"})");
        cfg["variables"] = parse(R"({"photo":{"type":"imagen"},"id":{"type":"string","required":true}})");
        const ValidationResult r = validator.validate(cfg);
        assert(r.isValid);

        const ValidationIssue *unknown = findIssue(r.warnings, "pages[0].sections[0].type");
        assert(unknown && unknown->suggestion == "Did you mean 'header'?");
        assert(findIssue(r.warnings, "pages[0].sections[1].src"));
        assert(findIssue(r.warnings, "pages[0].sections[2].content.weeks"));
        assert(findIssue(r.warnings, "pages[0].sections[3].height"));
        assert(findIssue(r.warnings, "layout.page_size"));
        const ValidationIssue *orientation = findIssue(r.warnings, "layout.orientation");
        assert(orientation && orientation->suggestion == "Use 'portrait'");
        const ValidationIssue *type = findIssue(r.warnings, "variables.photo.type");
        assert(type && type->suggestion == "Did you mean 'image'?");
        assert(findIssue(r.warnings, "variables.id"));
    }
    // QR configuration checks
    {
        QJsonObject cfg = minimal();
        cfg["qr_code"] = parse(R"({"enabled":true,"data_source":"custom_url","position":"sidebar"})");
        const ValidationResult r = validator.validate(cfg);
        assert(r.isValid);
        assert(findIssue(r.warnings, "qr_code.custom_data"));
        assert(findIssue(r.warnings, "qr_code.position"));

        cfg["qr_code"] = parse(R"({"enabled":false,"position":"sidebar"})");
        assert(validator.validate(cfg).warnings.empty());
    }
    // Scores: size heuristics and the javascript: scan
    {
        QJsonObject cfg = minimal();
        QJsonArray pages;
        for(int i = 0; i < 11; ++i) pages.append(parse(R"({"sections":[{"type":"text","content":"x"},{"type":"text","content":"y"},
            {"type":"text","content":"z"},{"type":"text","content":"w"},{"type":"text","content":"v"}]})"));
        cfg["pages"] = pages; // 11 pages, 55 sections
        cfg["metadata"] = parse(R"({"name":"<a href='JavaScript:alert(1)'>"})");
        const ValidationResult r = validator.validate(cfg);
        assert(r.isValid);
        assert(r.performanceScore == 75.0);
        assert(r.securityScore == 70.0);
        assert(findIssue(r.info, "metadata.version"));
        assert(findIssue(r.info, "pages")); // no exercise_table
    }
    // JSON report shape
    {
        const QJsonObject j = validator.validate(parse(R"({"metadata":{},"layout":{},"pages":[{"sections":[{"type":"chart"}]}]})")).toJson();
        assert(j.value("is_valid").toBool() == false);
        assert(j.value("errors").toArray().size() == 1);
        const QJsonObject w = j.value("warnings").toArray().at(0).toObject();
        assert(w.value("severity").toString() == "warning");
        assert(w.value("path").toString() == "pages[0].sections[0].type");
        assert(w.contains("suggestion"));
        assert(j.value("performance_score").toDouble() == 100.0);
        assert(j.contains("security_score") && j.contains("info"));
    }
    std::cout << "template_validator_test passed" << std::endl;
    return 0;
}
