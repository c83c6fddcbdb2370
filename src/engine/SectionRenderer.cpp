#include "engine/SectionRenderer.hpp"
#include "layout/StyleSheet.hpp"
#include "layout/Units.hpp"
#include "qr/QrCode.hpp"
#include "util/DataUri.hpp"
#include "util/Strings.hpp"
#include <QDebug>
#include <algorithm>
#include <initializer_list>

namespace QtPdfTemplate::engine {

using namespace layout;

namespace {

constexpr int kMaxWeeks = 52;
const QString kNoExercises = QStringLiteral("Sin ejercicios");

QString firstText(const QJsonObject &obj, std::initializer_list<const char *> keys) {
    for(const char *k : keys) {
        const QString v = util::displayString(obj.value(QLatin1String(k)));
        if(!v.isEmpty()) return v;
    }
    return QString();
}

QString dayHeading(const QJsonObject &day) {
    const QString number = firstText(day, { "numero", "dayNumber", "dia_semana" });
    const QString name = firstText(day, { "nombre", "dayName" });
    if(number.isEmpty() || number == QLatin1String("0")) return name.isEmpty() ? QStringLiteral("Día") : name;
    QString head = QStringLiteral("Día %1").arg(number);
    if(!name.isEmpty()) head += QStringLiteral(" - ") + name;
    return head;
}

int currentWeek(const QJsonObject &data) {
    const auto w = util::numericValue(data.value(QLatin1String("current_week")));
    if(!w || !(*w >= 1)) return 1;
    return static_cast<int>(std::min(*w, static_cast<double>(kMaxWeeks)));
}

} // namespace

// ---------------------------------------------------------------- per-type handlers

struct SectionRenderer::Visitor {
    SectionRenderer &self;
    const Section &section;
    const QJsonObject &data;
    Flow &flow;

    void spaceAfter(double defaultMm) const {
        flow.push_back(SpacerBlock{ toPoints(section.spacingAfter, mm(defaultMm)) });
    }

    void banner(const QString &rawTitle, const QString &rawSubtitle) const {
        const QString title = self.text(rawTitle, data).trimmed();
        const QString subtitle = self.text(rawSubtitle, data).trimmed();
        bool emitted = false;
        if(!title.isEmpty()) { flow.push_back(Paragraph{ title, TextStyle::Header }); emitted = true; }
        if(!subtitle.isEmpty()) {
            flow.push_back(SpacerBlock{ mm(2) });
            flow.push_back(Paragraph{ subtitle, TextStyle::Small });
            emitted = true;
        }
        if(emitted) spaceAfter(6);
    }

    void operator()(const HeaderSection &s) const { banner(s.title, s.subtitle); }
    void operator()(const ExcelHeaderSection &s) const { banner(s.title, s.subtitle); }

    void operator()(const TextSection &s) const {
        const QString resolved = self.text(s.text, data);
        if(resolved.trimmed().isEmpty()) return;
        flow.push_back(Paragraph{ resolved, StyleSheet::parseStyle(s.style) });
        spaceAfter(4);
    }

    void operator()(const SpacerSection &s) const {
        flow.push_back(SpacerBlock{ std::max(0.0, toPoints(s.height, mm(8))) });
    }

    void operator()(const TableSection &s) const {
        if(s.rows.isEmpty()) return;
        TableBlock table;
        for(const auto &row : s.rows) {
            QStringList cells;
            for(const auto &cell : row) cells << self.text(cell, data);
            table.rows << cells;
        }
        flow.push_back(std::move(table));
        spaceAfter(6);
    }

    void operator()(const ExerciseTableSection &s) const {
        const QJsonArray days = dayList(data);
        if(!s.label.trimmed().isEmpty()) {
            const QString label = self.text(s.label, data).trimmed();
            if(!label.isEmpty()) flow.push_back(Paragraph{ label, TextStyle::SectionHeader });
        }
        if(days.isEmpty()) {
            flow.push_back(Paragraph{ kNoExercises, TextStyle::Small });
            flow.push_back(SpacerBlock{ mm(6) });
            return;
        }

        const QStringList columns = s.columns.isEmpty() ? defaultExerciseColumns() : s.columns;
        auto column = [&](int i) { return i < columns.size() ? columns.at(i) : defaultExerciseColumns().value(i); };
        const bool weekly = s.format == QLatin1String("excel_weekly");
        const bool withNotes = columns.size() >= 5;
        int weeks = 1;
        if(weekly) {
            const double requested = util::numericValue(s.weeks).value_or(4);
            weeks = requested >= 1 ? static_cast<int>(std::min(requested, static_cast<double>(kMaxWeeks))) : 1;
        }
        const int week = currentWeek(data);

        QStringList header{ column(0), column(1) };
        if(weekly) {
            for(int w = 1; w <= weeks; ++w)
                header << (w <= s.weekColumns.size() ? s.weekColumns.at(w - 1) : QStringLiteral("Sem %1").arg(w));
        } else {
            header << column(2);
        }
        header << column(3);
        if(withNotes) header << column(4);
        for(int i = 5; i < columns.size(); ++i) header << columns.at(i);

        for(const auto &dayValue : days) {
            const QJsonObject day = dayValue.toObject();
            flow.push_back(Paragraph{ dayHeading(day), TextStyle::SectionHeader });
            flow.push_back(SpacerBlock{ mm(3) });

            TableBlock table;
            table.headerRow = true;
            table.fontSize = 9;
            table.rows << header;
            for(const auto &exValue : day.value(QLatin1String("ejercicios")).toArray()) {
                if(!exValue.isObject()) continue;
                const QJsonObject ex = exValue.toObject();
                const QString reps = firstText(ex, { "repeticiones", "reps" });
                QStringList row{ firstText(ex, { "nombre", "ejercicio_nombre", "exercise_name" }),
                                 util::displayString(ex.value(QLatin1String("series"))) };
                if(weekly) {
                    for(int w = 1; w <= weeks; ++w) row << weeklyValue(reps, w);
                } else {
                    row << weeklyValue(reps, week);
                }
                row << firstText(ex, { "descanso", "rest" });
                if(withNotes) row << firstText(ex, { "notas", "notes" });
                while(row.size() < header.size()) row << QString();
                table.rows << row;
            }
            if(table.rows.size() == 1) {
                QStringList empty{ kNoExercises };
                while(empty.size() < header.size()) empty << QString();
                table.rows << empty;
            }
            flow.push_back(std::move(table));
            spaceAfter(8);
        }
    }

    void operator()(const ImageSection &s) const {
        const QString src = self.text(s.src, data).trimmed();
        if(src.isEmpty()) return;
        auto drop = [&](const char *reason) {
            ++self.m_tally.droppedImages;
            qDebug() << "SectionRenderer: dropping image:" << reason;
        };
        if(!src.startsWith(QLatin1String("data:image/"), Qt::CaseInsensitive)) { drop("only data:image URIs are rendered"); return; }
        if(util::estimatedPayloadSize(src) > self.m_maxImageBytes + 2) { drop("payload over budget"); return; }
        const auto uri = util::decodeDataUri(src);
        if(!uri) { drop("malformed data URI"); return; }
        if(uri->payload.size() > self.m_maxImageBytes) { drop("payload over budget"); return; }
        QImage img;
        if(!img.loadFromData(uri->payload)) { drop("undecodable image"); return; }
        flow.push_back(ImageBlock{ img, toPoints(s.width, mm(100)), toPoints(s.height, mm(60)), false });
        spaceAfter(6);
    }

    void operator()(const QrCodeSection &s) const {
        const QString custom = self.text(self.m_qr.customData, data);
        const auto payload = qr::resolvePayload(data, self.m_qr.source, custom);
        if(!payload) { qDebug() << "SectionRenderer: no QR payload, skipping qr_code section"; return; }
        const QImage img = qr::encode(*payload);
        if(img.isNull()) return;
        double size = toPoints(s.size, mm(60));
        if(size <= 0) size = mm(60);
        flow.push_back(ImageBlock{ img, size, size, true });
        ++self.m_tally.qrImages;
        spaceAfter(6);
    }

    void operator()(const PageBreakSection &) const { flow.push_back(PageBreakBlock{}); }

    void operator()(const UnknownSection &s) const {
        ++self.m_tally.droppedSections;
        qDebug() << "SectionRenderer: skipping unknown section type" << s.type;
    }
};

// ---------------------------------------------------------------- SectionRenderer

SectionRenderer::SectionRenderer(const ExpressionResolver &resolver, const QrCodeConfig &qr, qint64 maxImageBytes)
    : m_resolver(resolver), m_qr(qr), m_maxImageBytes(maxImageBytes) {}

bool SectionRenderer::passesCondition(const Section &section, const QJsonObject &data) const {
    if(!section.condition) return true;
    const SectionCondition &c = *section.condition;
    if(c.expression.isEmpty()) return c.show;
    return m_resolver.evaluateCondition(c.expression, data).value_or(c.show);
}

int SectionRenderer::render(const Section &section, const QJsonObject &data, Flow &flow) {
    if(!passesCondition(section, data)) { ++m_tally.skippedByCondition; return 0; }
    const size_t before = flow.size();
    std::visit(Visitor{ *this, section, data, flow }, section.content);
    const int added = static_cast<int>(flow.size() - before);
    if(added > 0) ++m_tally.rendered;
    return added;
}

QString SectionRenderer::weeklyValue(const QString &values, int week) {
    if(!values.contains(QLatin1Char(','))) return values.trimmed();
    const QStringList parts = values.split(QLatin1Char(','));
    const int index = std::clamp(week, 1, static_cast<int>(parts.size())) - 1;
    return parts.at(index).trimmed();
}

QJsonArray SectionRenderer::dayList(const QJsonObject &data) {
    QJsonValue raw = data.value(QLatin1String("dias"));
    if(!raw.isArray()) {
        QJsonValue routine = data.value(QLatin1String("rutina"));
        if(!routine.isObject()) routine = data.value(QLatin1String("routine"));
        raw = routine.toObject().value(QLatin1String("dias"));
    }
    QJsonArray out;
    for(const auto &d : raw.toArray()) {
        if(d.isObject()) out.append(d);
    }
    return out;
}

QStringList SectionRenderer::defaultExerciseColumns() {
    return { QStringLiteral("Ejercicio"), QStringLiteral("Series"), QStringLiteral("Repeticiones"), QStringLiteral("Descanso") };
}

} // namespace QtPdfTemplate::engine
