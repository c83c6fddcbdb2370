/** \file TemplateConfig.hpp
 *  Typed view of a declarative template (JSON). Parsing is lenient: malformed parts become
 *  defaults or UnknownSection entries, never errors. Strict checking is TemplateValidator's job.
 */
#pragma once
#include "QtPdfTemplate/Export.hpp"
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QString>
#include <QStringList>
#include <optional>
#include <variant>
#include <vector>

namespace QtPdfTemplate {

// ---------------------------------------------------------------- sections

struct HeaderSection { QString title; QString subtitle; };
/** Spreadsheet-export banner; rendered like a header in documents. */
struct ExcelHeaderSection { QString title; QString subtitle; };
struct TextSection { QString text; QString style; };
struct SpacerSection { QJsonValue height; };
/** Literal grid; cells are kept as template strings and resolved one by one. */
struct TableSection { QList<QStringList> rows; };
struct ExerciseTableSection {
    QStringList columns;     // header labels; empty = defaults
    QString format;          // "" or "excel_weekly"
    QJsonValue weeks;        // week count for excel_weekly
    QStringList weekColumns; // optional week header labels
    QString label;           // optional caption above the days
};
struct ImageSection { QString src; QJsonValue width; QJsonValue height; };
struct QrCodeSection { QJsonValue size; };
struct PageBreakSection {};
/** Any type outside the known set, or a section that is not an object. */
struct UnknownSection { QString type; };

using SectionContent = std::variant<HeaderSection, ExcelHeaderSection, TextSection, SpacerSection, TableSection,
                                    ExerciseTableSection, ImageSection, QrCodeSection, PageBreakSection, UnknownSection>;

/** Optional render guard: "if" is an expression; "show" applies when it is absent or cannot be evaluated. */
struct SectionCondition {
    QString expression;
    bool show{true};
};

struct QTPDFTEMPLATE_EXPORT Section {
    QString type;             // normalized (trimmed, lower-case) type tag
    SectionContent content{UnknownSection{}};
    QJsonValue spacingAfter;  // layout length; Undefined = per-type default
    std::optional<SectionCondition> condition;

    static Section fromJson(const QJsonValue &value);
    /** Type tags with a dedicated renderer (including the "spacing"/"spacer" aliases). */
    static const QStringList & knownTypes();
    static bool isKnownType(const QString &type);
};

struct Page {
    QString name;
    std::vector<Section> sections;
};

// ---------------------------------------------------------------- layout, variables, QR

struct PageLayout {
    QString pageSize{QStringLiteral("A4")};
    QString orientation{QStringLiteral("portrait")};
    QJsonValue marginTop, marginBottom, marginLeft, marginRight; // Undefined = default
};

struct VariableSpec {
    QString name;
    QString type{QStringLiteral("string")};
    QJsonValue defaultValue{QJsonValue::Undefined};
    bool required{false};
    bool hasDefault() const { return !defaultValue.isUndefined(); }
};

enum class QrPosition { Header, Footer, Inline, Separate, None };
enum class QrDataSource { RoutineUuid, UserData, CustomUrl };

struct QTPDFTEMPLATE_EXPORT QrCodeConfig {
    bool enabled{false};
    QrPosition position{QrPosition::Inline};
    QrDataSource source{QrDataSource::RoutineUuid};
    QString customData;
    QJsonValue width, height; // layout lengths; Undefined = default

    static QrCodeConfig fromJson(const QJsonObject &obj);
    /** "separate_sheet" and "sheet" alias "separate"; empty means inline; unrecognized yields std::nullopt. */
    static std::optional<QrPosition> parsePosition(const QString &text);
    /** "custom_url", "user_data", "routine_uuid"; unrecognized yields std::nullopt. */
    static std::optional<QrDataSource> parseSource(const QString &text);
};

/** Free-form style hints (styling.fonts, styling.colors). */
struct StyleHints {
    QJsonObject fonts;
    QJsonObject colors;
};

// ---------------------------------------------------------------- template

struct QTPDFTEMPLATE_EXPORT TemplateConfig {
    QJsonObject metadata;
    PageLayout layout;
    std::vector<Page> pages;
    std::vector<VariableSpec> variables; // sorted by name, as QJsonObject iterates
    QrCodeConfig qrCode;
    StyleHints styling;

    static TemplateConfig fromJson(const QJsonObject &root);
};

} // namespace QtPdfTemplate
