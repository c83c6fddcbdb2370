/** \file SectionRenderer.hpp
 *  Section + data context -> layout primitives. One handler per section type; failures drop the section.
 */
#pragma once
#include "QtPdfTemplate/ExpressionResolver.hpp"
#include "QtPdfTemplate/TemplateConfig.hpp"
#include "layout/Primitives.hpp"
#include <QJsonArray>
#include <QJsonObject>

namespace QtPdfTemplate::engine {

/** Counters accumulated over every render() call of one renderer. */
struct SectionTally {
    int rendered{0};
    int skippedByCondition{0};
    int droppedSections{0}; // unknown types
    int droppedImages{0};   // unsupported scheme, malformed or over budget
    int qrImages{0};
};

class SectionRenderer {
public:
    /** qr supplies the data source used by qr_code sections; maxImageBytes bounds decoded inline images. */
    SectionRenderer(const ExpressionResolver &resolver, const QrCodeConfig &qr, qint64 maxImageBytes);

    /** Appends the primitives of section to flow; returns how many were appended. */
    int render(const Section &section, const QJsonObject &data, layout::Flow &flow);

    const SectionTally & tally() const { return m_tally; }

    /** Value for week (1-based) from a comma separated progression such as "12,10,8"; the last value repeats. */
    static QString weeklyValue(const QString &values, int week);
    /** Day objects from "dias", else rutina.dias / routine.dias. Non-object entries are skipped. */
    static QJsonArray dayList(const QJsonObject &data);
    static QStringList defaultExerciseColumns();

private:
    struct Visitor;
    bool passesCondition(const Section &section, const QJsonObject &data) const;
    QString text(const QString &source, const QJsonObject &data) const { return m_resolver.resolve(source, data); }

    const ExpressionResolver &m_resolver;
    const QrCodeConfig &m_qr;
    qint64 m_maxImageBytes;
    SectionTally m_tally;
};

} // namespace QtPdfTemplate::engine
