#include "QtPdfTemplate/TemplateValidator.hpp"
#include "QtPdfTemplate/TemplateConfig.hpp"
#include "layout/Units.hpp"
#include "util/Strings.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <algorithm>

namespace QtPdfTemplate {

namespace {

constexpr int kMaxPages = 10;
constexpr int kMaxSections = 50;
constexpr int kMaxVariables = 100;

QString severityName(ValidationSeverity s) {
    switch(s) {
    case ValidationSeverity::Error: return QStringLiteral("error");
    case ValidationSeverity::Warning: return QStringLiteral("warning");
    case ValidationSeverity::Info: break;
    }
    return QStringLiteral("info");
}

QString indexed(const QString &base, int i) { return QStringLiteral("%1[%2]").arg(base).arg(i); }
QString member(const QString &base, const char *key) { return base.isEmpty() ? QString::fromLatin1(key) : base + QLatin1Char('.') + QLatin1String(key); }

bool nonEmptyText(const QJsonValue &v) {
    if(v.isString()) return !v.toString().trimmed().isEmpty();
    return v.isDouble();
}

class Collector {
public:
    explicit Collector(ValidationResult &r) : m_result(r) {}
    void error(const QString &message, const QString &path, const QString &suggestion = QString()) {
        m_result.errors.push_back({ ValidationSeverity::Error, message, path, suggestion });
    }
    void warning(const QString &message, const QString &path, const QString &suggestion = QString()) {
        m_result.warnings.push_back({ ValidationSeverity::Warning, message, path, suggestion });
    }
    void info(const QString &message, const QString &path = QString()) {
        m_result.info.push_back({ ValidationSeverity::Info, message, path, QString() });
    }
private:
    ValidationResult &m_result;
};

void checkLayout(const QJsonObject &config, Collector &out) {
    const QJsonValue layoutValue = config.value(QLatin1String("layout"));
    if(layoutValue.isUndefined()) return; // reported as a missing key
    if(!layoutValue.isObject()) { out.warning(QStringLiteral("layout should be an object"), QStringLiteral("layout")); return; }
    const QJsonObject layout = layoutValue.toObject();

    const QJsonValue size = layout.value(QLatin1String("page_size"));
    if(!size.isUndefined()) {
        const QString name = size.toString();
        if(!layout::pageSizeFromName(name)) {
            out.warning(QStringLiteral("Unknown page size '%1'; A4 will be used").arg(util::displayString(size)),
                        QStringLiteral("layout.page_size"),
                        QStringLiteral("Use '%1'").arg(util::closestMatch(name, layout::pageSizeNames())));
        }
    }
    const QJsonValue orientation = layout.value(QLatin1String("orientation"));
    if(!orientation.isUndefined()) {
        const QString o = orientation.toString().trimmed().toLower();
        if(!layout::orientationNames().contains(o)) {
            out.warning(QStringLiteral("Unknown orientation '%1'; portrait will be used").arg(util::displayString(orientation)),
                        QStringLiteral("layout.orientation"),
                        QStringLiteral("Use '%1'").arg(util::closestMatch(o, layout::orientationNames())));
        }
    }
    const QJsonValue margins = layout.value(QLatin1String("margins"));
    if(margins.isUndefined()) return;
    if(!margins.isObject()) { out.warning(QStringLiteral("margins should be an object"), QStringLiteral("layout.margins")); return; }
    const QJsonObject m = margins.toObject();
    for(const char *side : { "top", "bottom", "left", "right" }) {
        const QJsonValue v = m.value(QLatin1String(side));
        if(v.isUndefined()) continue;
        const auto pts = layout::toPoints(v);
        if(!pts || *pts < 0) {
            out.warning(QStringLiteral("Margin '%1' is not a non-negative length; 20mm will be used").arg(QLatin1String(side)),
                        member(QStringLiteral("layout.margins"), side),
                        QStringLiteral("Use a number of millimetres or a string such as \"20mm\" or \"1in\""));
        }
    }
}

void checkSection(const QJsonValue &value, const QString &path, Collector &out) {
    if(!value.isObject()) { out.warning(QStringLiteral("Section is not an object and will be skipped"), path); return; }
    const QJsonObject sec = value.toObject();
    const QString type = sec.value(QLatin1String("type")).toString().trimmed().toLower();
    if(type.isEmpty()) {
        out.warning(QStringLiteral("Section has no type and will be skipped"), member(path, "type"),
                    QStringLiteral("One of: %1").arg(Section::knownTypes().join(QStringLiteral(", "))));
        return;
    }
    if(!Section::isKnownType(type)) {
        out.warning(QStringLiteral("Unknown section type '%1' will be skipped").arg(type), member(path, "type"),
                    QStringLiteral("Did you mean '%1'?").arg(util::closestMatch(type, Section::knownTypes())));
        return;
    }

    const QJsonValue rawContent = sec.value(QLatin1String("content"));
    const QJsonObject content = rawContent.toObject();
    const QString contentPath = member(path, "content");
    auto field = [&](const char *key) {
        const QJsonValue inner = content.value(QLatin1String(key));
        return inner.isUndefined() ? sec.value(QLatin1String(key)) : inner;
    };

    if(type == QLatin1String("header") || type == QLatin1String("excel_header")) {
        if(!nonEmptyText(content.value(QLatin1String("title"))) && !nonEmptyText(content.value(QLatin1String("subtitle"))))
            out.warning(QStringLiteral("Header has neither title nor subtitle and renders nothing"), contentPath,
                        QStringLiteral("Set content.title or content.subtitle"));
    } else if(type == QLatin1String("text")) {
        const QJsonValue text = rawContent.isObject() ? content.value(QLatin1String("text")) : (rawContent.isUndefined() ? sec.value(QLatin1String("text")) : rawContent);
        if(!nonEmptyText(text)) out.warning(QStringLiteral("Text section is empty"), contentPath);
    } else if(type == QLatin1String("table")) {
        const QJsonArray rows = field("rows").toArray();
        const bool anyRow = std::any_of(rows.begin(), rows.end(), [](const QJsonValue &r){ return r.isArray(); });
        if(!anyRow) out.warning(QStringLiteral("Table has no rows and renders nothing"), member(path, "rows"),
                                QStringLiteral("Provide rows as an array of arrays of cells"));
    } else if(type == QLatin1String("image")) {
        const QString src = field("src").toString().trimmed();
        if(src.isEmpty()) out.warning(QStringLiteral("Image section has no src"), member(path, "src"));
        else if(!src.contains(QLatin1String("{{")) && !src.startsWith(QLatin1String("data:image/"), Qt::CaseInsensitive))
            out.warning(QStringLiteral("Only inline data:image URIs are rendered; this image will be dropped"), member(path, "src"),
                        QStringLiteral("Embed the image as data:image/png;base64,..."));
    } else if(type == QLatin1String("exercise_table")) {
        if(!rawContent.isUndefined() && !rawContent.isObject())
            out.warning(QStringLiteral("exercise_table content should be an object"), contentPath);
        const QJsonValue columns = content.value(QLatin1String("columns"));
        if(!columns.isUndefined() && !columns.isArray())
            out.warning(QStringLiteral("columns should be a list of header labels"), member(contentPath, "columns"));
        if(content.value(QLatin1String("format")).toString().trimmed().toLower() == QLatin1String("excel_weekly")
           && !util::isNumericLike(content.value(QLatin1String("weeks"))))
            out.warning(QStringLiteral("excel_weekly format needs a numeric 'weeks' value"), member(contentPath, "weeks"),
                        QStringLiteral("Set content.weeks to the number of weeks, e.g. 4"));
    } else if(type == QLatin1String("qr_code")) {
        const QJsonValue size = content.value(QLatin1String("size"));
        if(!size.isUndefined() && !layout::toPoints(size))
            out.warning(QStringLiteral("QR size is not a length; the default will be used"), member(contentPath, "size"));
    } else if(type == QLatin1String("spacing") || type == QLatin1String("spacer")) {
        const QJsonValue height = field("height");
        if(!height.isUndefined() && !layout::toPoints(height))
            out.warning(QStringLiteral("Spacing height is not a length; the default will be used"), member(path, "height"));
    }

    const QJsonValue cond = sec.value(QLatin1String("conditional"));
    if(!cond.isUndefined()) {
        if(!cond.isObject()) out.warning(QStringLiteral("conditional should be an object"), member(path, "conditional"));
        else {
            const QJsonValue ifValue = cond.toObject().value(QLatin1String("if"));
            if(!ifValue.isUndefined() && !ifValue.isString())
                out.warning(QStringLiteral("conditional.if should be an expression string"), member(path, "conditional.if"));
        }
    }
}

// Returns the total number of sections seen.
int checkPages(const QJsonArray &pages, Collector &out) {
    int sections = 0;
    for(int i = 0; i < pages.size(); ++i) {
        const QString path = indexed(QStringLiteral("pages"), i);
        if(!pages.at(i).isObject()) { out.error(QStringLiteral("Page is not an object"), path); continue; }
        const QJsonValue list = pages.at(i).toObject().value(QLatin1String("sections"));
        if(!list.isArray()) {
            out.warning(QStringLiteral("Page has no sections list"), member(path, "sections"), QStringLiteral("Add \"sections\": []"));
            continue;
        }
        const QJsonArray arr = list.toArray();
        if(arr.isEmpty()) out.warning(QStringLiteral("Page has no sections"), member(path, "sections"));
        sections += arr.size();
        for(int j = 0; j < arr.size(); ++j) checkSection(arr.at(j), indexed(member(path, "sections"), j), out);
    }
    return sections;
}

void checkVariables(const QJsonObject &config, Collector &out) {
    const QJsonValue vars = config.value(QLatin1String("variables"));
    if(vars.isUndefined()) return;
    if(!vars.isObject()) { out.error(QStringLiteral("variables must be an object"), QStringLiteral("variables")); return; }
    const QJsonObject obj = vars.toObject();
    for(auto it = obj.begin(); it != obj.end(); ++it) {
        const QString path = QStringLiteral("variables.%1").arg(it.key());
        if(!it.value().isObject()) { out.warning(QStringLiteral("Variable definition should be an object"), path); continue; }
        const QJsonObject def = it.value().toObject();
        const QString type = def.value(QLatin1String("type")).toString().trimmed().toLower();
        if(!TemplateValidator::variableTypes().contains(type)) {
            out.warning(type.isEmpty() ? QStringLiteral("Variable has no type") : QStringLiteral("Unsupported variable type '%1'").arg(type),
                        path + QStringLiteral(".type"),
                        QStringLiteral("Did you mean '%1'?").arg(util::closestMatch(type, TemplateValidator::variableTypes())));
        }
        const QJsonValue dflt = def.value(QLatin1String("default"));
        if(type == QLatin1String("image") && dflt.isString() && !dflt.toString().isEmpty()
           && !dflt.toString().startsWith(QLatin1String("data:"), Qt::CaseInsensitive)) {
            out.warning(QStringLiteral("Image variable default should be an inline data: URI"), path + QStringLiteral(".default"),
                        QStringLiteral("Embed the image as data:image/png;base64,..."));
        }
        if(def.value(QLatin1String("required")).toBool(false) && dflt.isUndefined())
            out.warning(QStringLiteral("Required variable has no default"), path, QStringLiteral("Add a default or make sure callers always supply it"));
    }
}

void checkQr(const QJsonObject &config, Collector &out) {
    const QJsonValue qrValue = config.value(QLatin1String("qr_code"));
    if(qrValue.isUndefined()) return;
    if(!qrValue.isObject()) { out.warning(QStringLiteral("qr_code should be an object"), QStringLiteral("qr_code")); return; }
    const QJsonObject qr = qrValue.toObject();
    if(!qr.value(QLatin1String("enabled")).toBool(false)) return;
    const QString source = qr.value(QLatin1String("data_source")).toString().trimmed();
    const QString custom = qr.value(QLatin1String("custom_data")).toString().trimmed();
    if(source.isEmpty() && custom.isEmpty())
        out.warning(QStringLiteral("QR code is enabled without a data source"), QStringLiteral("qr_code.data_source"),
                    QStringLiteral("Set data_source to routine_uuid, user_data or custom_url"));
    else if(!source.isEmpty() && !QrCodeConfig::parseSource(source))
        out.warning(QStringLiteral("Unknown QR data source '%1'; routine_uuid will be used").arg(source), QStringLiteral("qr_code.data_source"),
                    QStringLiteral("Did you mean '%1'?").arg(util::closestMatch(source, { QStringLiteral("routine_uuid"), QStringLiteral("user_data"), QStringLiteral("custom_url") })));
    if(source.compare(QLatin1String("custom_url"), Qt::CaseInsensitive) == 0 && custom.isEmpty())
        out.warning(QStringLiteral("custom_url QR source needs custom_data"), QStringLiteral("qr_code.custom_data"));
    const QString position = qr.value(QLatin1String("position")).toString();
    if(!QrCodeConfig::parsePosition(position))
        out.warning(QStringLiteral("Unknown QR position '%1'; the QR code will not be drawn").arg(position), QStringLiteral("qr_code.position"),
                    QStringLiteral("Did you mean '%1'?").arg(util::closestMatch(position, { QStringLiteral("header"), QStringLiteral("footer"), QStringLiteral("inline"), QStringLiteral("separate") })));
}

bool hasExerciseTable(const QJsonArray &pages) {
    for(const auto &p : pages) {
        for(const auto &s : p.toObject().value(QLatin1String("sections")).toArray()) {
            if(s.toObject().value(QLatin1String("type")).toString().trimmed().toLower() == QLatin1String("exercise_table")) return true;
        }
    }
    return false;
}

} // namespace

QStringList ValidationResult::errorMessages() const {
    QStringList out;
    for(const auto &e : errors) out << (e.path.isEmpty() ? e.message : QStringLiteral("%1 (%2)").arg(e.message, e.path));
    return out;
}

QJsonObject ValidationResult::toJson() const {
    auto list = [](const std::vector<ValidationIssue> &issues) {
        QJsonArray arr;
        for(const auto &i : issues) {
            QJsonObject o{ { QStringLiteral("severity"), severityName(i.severity) },
                           { QStringLiteral("message"), i.message },
                           { QStringLiteral("path"), i.path } };
            if(!i.suggestion.isEmpty()) o.insert(QStringLiteral("suggestion"), i.suggestion);
            arr.append(o);
        }
        return arr;
    };
    return QJsonObject{
        { QStringLiteral("is_valid"), isValid },
        { QStringLiteral("errors"), list(errors) },
        { QStringLiteral("warnings"), list(warnings) },
        { QStringLiteral("info"), list(info) },
        { QStringLiteral("performance_score"), performanceScore },
        { QStringLiteral("security_score"), securityScore },
    };
}

const QStringList & TemplateValidator::requiredKeys() {
    static const QStringList keys = { QStringLiteral("metadata"), QStringLiteral("layout"), QStringLiteral("pages"), QStringLiteral("variables") };
    return keys;
}

const QStringList & TemplateValidator::variableTypes() {
    static const QStringList types = { QStringLiteral("string"), QStringLiteral("number"), QStringLiteral("boolean"), QStringLiteral("date"), QStringLiteral("image") };
    return types;
}

ValidationResult TemplateValidator::validate(const QJsonObject &config) const {
    ValidationResult result;
    Collector out(result);

    for(const auto &key : requiredKeys()) {
        if(!config.contains(key)) out.error(QStringLiteral("Missing required key '%1'").arg(key), key);
    }

    const QJsonValue pagesValue = config.value(QLatin1String("pages"));
    const QJsonArray pages = pagesValue.toArray();
    int sectionCount = 0;
    if(!pagesValue.isUndefined() && !pagesValue.isArray()) {
        out.error(QStringLiteral("pages must be a list"), QStringLiteral("pages"));
    } else if(pagesValue.isArray()) {
        if(pages.isEmpty()) out.warning(QStringLiteral("Template has no pages"), QStringLiteral("pages"));
        sectionCount = checkPages(pages, out);
    }

    checkLayout(config, out);
    checkVariables(config, out);
    checkQr(config, out);

    // Performance heuristics
    double performance = 100.0;
    if(pages.size() > kMaxPages) {
        performance -= 10.0;
        out.warning(QStringLiteral("Template has %1 pages, which may slow down rendering").arg(pages.size()), QStringLiteral("pages"));
    }
    if(sectionCount > kMaxSections) {
        performance -= 15.0;
        out.warning(QStringLiteral("Template has %1 sections, which may slow down rendering").arg(sectionCount), QStringLiteral("pages[].sections"));
    }
    const QJsonObject variables = config.value(QLatin1String("variables")).toObject();
    if(variables.size() > kMaxVariables) {
        performance -= 10.0;
        out.warning(QStringLiteral("Template declares %1 variables, which may slow down rendering").arg(variables.size()), QStringLiteral("variables"));
    }
    result.performanceScore = std::clamp(performance, 0.0, 100.0);

    // Security heuristic: a substring scan, not a taint analysis.
    double security = 100.0;
    const QByteArray serialized = QJsonDocument(config).toJson(QJsonDocument::Compact).toLower();
    if(serialized.contains("javascript:")) {
        security -= 30.0;
        out.warning(QStringLiteral("Template contains potentially dangerous content (javascript:)"), QString(),
                    QStringLiteral("Remove javascript: URLs"));
    }
    result.securityScore = std::clamp(security, 0.0, 100.0);

    // Best practices
    const QJsonObject metadata = config.value(QLatin1String("metadata")).toObject();
    if(pagesValue.isArray() && !hasExerciseTable(pages)) out.info(QStringLiteral("Template has no exercise_table section"), QStringLiteral("pages"));
    if(config.contains(QLatin1String("metadata"))) {
        if(!nonEmptyText(metadata.value(QLatin1String("name")))) out.info(QStringLiteral("metadata.name is empty"), QStringLiteral("metadata.name"));
        if(!nonEmptyText(metadata.value(QLatin1String("version")))) out.info(QStringLiteral("metadata.version is empty"), QStringLiteral("metadata.version"));
        if(!nonEmptyText(metadata.value(QLatin1String("description")))) out.info(QStringLiteral("metadata.description is empty"), QStringLiteral("metadata.description"));
    }
    out.info(QStringLiteral("Performance score: %1").arg(result.performanceScore));
    out.info(QStringLiteral("Security score: %1").arg(result.securityScore));

    result.isValid = result.errors.empty();
    return result;
}

} // namespace QtPdfTemplate
