#include "QtPdfTemplate/TemplateConfig.hpp"
#include "util/Strings.hpp"
#include <QJsonArray>

namespace QtPdfTemplate {

namespace {

QString stringField(const QJsonObject &obj, const char *key) {
    const QJsonValue v = obj.value(QLatin1String(key));
    return v.isString() || v.isDouble() || v.isBool() ? util::displayString(v) : QString();
}

QStringList stringList(const QJsonValue &v) {
    QStringList out;
    for(const auto &item : v.toArray()) out << util::displayString(item);
    return out;
}

// Section payloads live either beside "type" or inside "content"; the content object wins.
QJsonValue payload(const QJsonObject &section, const QJsonObject &content, const char *key) {
    const QJsonValue inner = content.value(QLatin1String(key));
    if(!inner.isUndefined()) return inner;
    return section.value(QLatin1String(key));
}

SectionContent parseContent(const QString &type, const QJsonObject &sec) {
    const QJsonValue rawContent = sec.value(QLatin1String("content"));
    const QJsonObject content = rawContent.toObject();

    if(type == QLatin1String("header")) return HeaderSection{ stringField(content, "title"), stringField(content, "subtitle") };
    if(type == QLatin1String("excel_header")) return ExcelHeaderSection{ stringField(content, "title"), stringField(content, "subtitle") };
    if(type == QLatin1String("text")) {
        TextSection t;
        if(rawContent.isString()) t.text = rawContent.toString();
        else if(rawContent.isObject()) t.text = stringField(content, "text");
        else t.text = stringField(sec, "text");
        t.style = payload(sec, content, "style").toString().trimmed().toLower();
        return t;
    }
    if(type == QLatin1String("spacing") || type == QLatin1String("spacer")) return SpacerSection{ payload(sec, content, "height") };
    if(type == QLatin1String("table")) {
        TableSection t;
        for(const auto &row : payload(sec, content, "rows").toArray()) {
            if(!row.isArray()) continue;
            t.rows << stringList(row);
        }
        return t;
    }
    if(type == QLatin1String("exercise_table")) {
        ExerciseTableSection t;
        t.columns = stringList(content.value(QLatin1String("columns")));
        t.format = stringField(content, "format").trimmed().toLower();
        t.weeks = content.value(QLatin1String("weeks"));
        t.weekColumns = stringList(content.value(QLatin1String("week_columns")));
        t.label = stringField(content, "label");
        return t;
    }
    if(type == QLatin1String("image")) {
        const QJsonValue src = payload(sec, content, "src");
        return ImageSection{ src.isString() ? src.toString().trimmed() : QString(), payload(sec, content, "width"), payload(sec, content, "height") };
    }
    if(type == QLatin1String("qr_code")) return QrCodeSection{ content.value(QLatin1String("size")) };
    if(type == QLatin1String("page_break")) return PageBreakSection{};
    return UnknownSection{ type };
}

} // namespace

// ---------------------------------------------------------------- Section

const QStringList & Section::knownTypes() {
    static const QStringList types = {
        QStringLiteral("header"), QStringLiteral("text"), QStringLiteral("spacing"), QStringLiteral("spacer"),
        QStringLiteral("table"), QStringLiteral("exercise_table"), QStringLiteral("image"), QStringLiteral("qr_code"),
        QStringLiteral("page_break"), QStringLiteral("excel_header")
    };
    return types;
}

bool Section::isKnownType(const QString &type) {
    return knownTypes().contains(type.trimmed().toLower());
}

Section Section::fromJson(const QJsonValue &value) {
    Section s;
    if(!value.isObject()) return s;
    const QJsonObject obj = value.toObject();
    s.type = obj.value(QLatin1String("type")).toString().trimmed().toLower();
    s.content = parseContent(s.type, obj);
    s.spacingAfter = obj.value(QLatin1String("spacing_after"));
    if(s.spacingAfter.isUndefined()) s.spacingAfter = obj.value(QLatin1String("content")).toObject().value(QLatin1String("spacing_after"));
    const QJsonValue cond = obj.value(QLatin1String("conditional"));
    if(cond.isObject()) {
        const QJsonObject c = cond.toObject();
        SectionCondition sc;
        sc.expression = c.value(QLatin1String("if")).toString().trimmed();
        sc.show = c.value(QLatin1String("show")).toBool(true);
        s.condition = sc;
    }
    return s;
}

// ---------------------------------------------------------------- QR

std::optional<QrPosition> QrCodeConfig::parsePosition(const QString &text) {
    const QString p = text.trimmed().toLower();
    if(p.isEmpty() || p == QLatin1String("inline")) return QrPosition::Inline;
    if(p == QLatin1String("header")) return QrPosition::Header;
    if(p == QLatin1String("footer")) return QrPosition::Footer;
    if(p == QLatin1String("separate") || p == QLatin1String("separate_sheet") || p == QLatin1String("sheet")) return QrPosition::Separate;
    if(p == QLatin1String("none")) return QrPosition::None;
    return std::nullopt;
}

std::optional<QrDataSource> QrCodeConfig::parseSource(const QString &text) {
    const QString s = text.trimmed().toLower();
    if(s.isEmpty() || s == QLatin1String("routine_uuid")) return QrDataSource::RoutineUuid;
    if(s == QLatin1String("user_data")) return QrDataSource::UserData;
    if(s == QLatin1String("custom_url")) return QrDataSource::CustomUrl;
    return std::nullopt;
}

QrCodeConfig QrCodeConfig::fromJson(const QJsonObject &obj) {
    QrCodeConfig qr;
    qr.enabled = obj.value(QLatin1String("enabled")).toBool(false);
    // An unrecognized position draws nothing; an unrecognized source falls back to the routine id.
    qr.position = parsePosition(obj.value(QLatin1String("position")).toString()).value_or(QrPosition::None);
    qr.source = parseSource(obj.value(QLatin1String("data_source")).toString()).value_or(QrDataSource::RoutineUuid);
    qr.customData = stringField(obj, "custom_data");
    const QJsonObject size = obj.value(QLatin1String("size")).toObject();
    qr.width = size.value(QLatin1String("width"));
    qr.height = size.value(QLatin1String("height"));
    return qr;
}

// ---------------------------------------------------------------- TemplateConfig

TemplateConfig TemplateConfig::fromJson(const QJsonObject &root) {
    TemplateConfig cfg;
    cfg.metadata = root.value(QLatin1String("metadata")).toObject();

    const QJsonObject layout = root.value(QLatin1String("layout")).toObject();
    const QString pageSize = stringField(layout, "page_size");
    const QString orientation = stringField(layout, "orientation");
    if(!pageSize.trimmed().isEmpty()) cfg.layout.pageSize = pageSize;
    if(!orientation.trimmed().isEmpty()) cfg.layout.orientation = orientation;
    const QJsonObject margins = layout.value(QLatin1String("margins")).toObject();
    cfg.layout.marginTop = margins.value(QLatin1String("top"));
    cfg.layout.marginBottom = margins.value(QLatin1String("bottom"));
    cfg.layout.marginLeft = margins.value(QLatin1String("left"));
    cfg.layout.marginRight = margins.value(QLatin1String("right"));

    for(const auto &p : root.value(QLatin1String("pages")).toArray()) {
        if(!p.isObject()) continue;
        const QJsonObject po = p.toObject();
        Page page;
        page.name = stringField(po, "name");
        for(const auto &s : po.value(QLatin1String("sections")).toArray()) page.sections.push_back(Section::fromJson(s));
        cfg.pages.push_back(std::move(page));
    }

    const QJsonObject vars = root.value(QLatin1String("variables")).toObject();
    for(auto it = vars.begin(); it != vars.end(); ++it) {
        VariableSpec spec;
        spec.name = it.key();
        const QJsonObject def = it.value().toObject();
        if(def.contains(QLatin1String("type"))) spec.type = def.value(QLatin1String("type")).toString();
        spec.defaultValue = def.value(QLatin1String("default"));
        spec.required = def.value(QLatin1String("required")).toBool(false);
        cfg.variables.push_back(spec);
    }

    cfg.qrCode = QrCodeConfig::fromJson(root.value(QLatin1String("qr_code")).toObject());
    const QJsonObject styling = root.value(QLatin1String("styling")).toObject();
    cfg.styling.fonts = styling.value(QLatin1String("fonts")).toObject();
    cfg.styling.colors = styling.value(QLatin1String("colors")).toObject();
    return cfg;
}

} // namespace QtPdfTemplate
