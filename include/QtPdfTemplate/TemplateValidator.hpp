/** \file TemplateValidator.hpp
 *  Structural and heuristic checks of a template before rendering.
 */
#pragma once
#include "QtPdfTemplate/Export.hpp"
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <vector>

namespace QtPdfTemplate {

enum class ValidationSeverity { Error, Warning, Info };

/** One finding. path uses dotted/indexed notation, e.g. "pages[0].sections[2].content.title". */
struct ValidationIssue {
    ValidationSeverity severity{ValidationSeverity::Error};
    QString message;
    QString path;
    QString suggestion; // empty when there is nothing to suggest
};

/** Outcome of TemplateValidator::validate. Only errors affect isValid. */
struct QTPDFTEMPLATE_EXPORT ValidationResult {
    bool isValid{true};
    std::vector<ValidationIssue> errors;
    std::vector<ValidationIssue> warnings;
    std::vector<ValidationIssue> info;
    double performanceScore{100.0};
    double securityScore{100.0};

    /** Error messages in order, for one-line reporting. */
    QStringList errorMessages() const;
    QJsonObject toJson() const;
};

/** Stateless; validate() never throws and may be called concurrently. */
class QTPDFTEMPLATE_EXPORT TemplateValidator {
public:
    /** Top-level keys that must all be present for a template to be renderable. */
    static const QStringList & requiredKeys();
    /** Accepted variable types. */
    static const QStringList & variableTypes();

    ValidationResult validate(const QJsonObject &config) const;
};

} // namespace QtPdfTemplate
