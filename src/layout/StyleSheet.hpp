/** \file StyleSheet.hpp
 *  Named paragraph styles with template overrides from styling.fonts / styling.colors.
 */
#pragma once
#include "QtPdfTemplate/TemplateConfig.hpp"
#include "layout/Primitives.hpp"
#include <QColor>
#include <QFont>
#include <array>

namespace QtPdfTemplate::layout {

struct TextFormat {
    QFont font;
    QColor color{Qt::black};
    Qt::Alignment alignment{Qt::AlignLeft};
};

class StyleSheet {
public:
    StyleSheet();
    /** Built-in styles with overrides applied. Unknown keys and malformed values are ignored. */
    static StyleSheet fromHints(const StyleHints &hints);

    /** "normal", "header", "section_header", "small", "justify"; anything else maps to Normal. */
    static TextStyle parseStyle(const QString &name);
    static QString styleName(TextStyle style);

    const TextFormat & format(TextStyle style) const { return m_formats[static_cast<size_t>(style)]; }
    /** Font for table cells at the given point size; header cells are bold. */
    QFont tableFont(double pointSize, bool header) const;
    QColor tableHeaderBackground() const { return m_tableHeaderBackground; }
    QColor gridColor() const { return m_gridColor; }

private:
    std::array<TextFormat, 5> m_formats;
    QString m_baseFamily;
    QColor m_tableHeaderBackground{QColor(0xd3, 0xd3, 0xd3)}; // lightgrey
    QColor m_gridColor{Qt::gray};
};

} // namespace QtPdfTemplate::layout
