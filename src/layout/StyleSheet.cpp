#include "layout/StyleSheet.hpp"
#include "util/Strings.hpp"
#include <QDebug>

namespace QtPdfTemplate::layout {

namespace {

const QString kDefaultFamily = QStringLiteral("Helvetica");

TextFormat makeFormat(const QString &family, double size, bool bold, const QColor &color, Qt::Alignment align) {
    TextFormat f;
    f.font = QFont(family);
    f.font.setPointSizeF(size);
    f.font.setBold(bold);
    f.color = color;
    f.alignment = align;
    return f;
}

void applyOverride(TextFormat &f, const QJsonObject &o) {
    const QString family = o.value(QLatin1String("family")).toString().trimmed();
    if(!family.isEmpty()) f.font.setFamily(family);
    if(auto size = util::numericValue(o.value(QLatin1String("size")))) {
        if(*size > 0) f.font.setPointSizeF(*size);
    }
    if(o.contains(QLatin1String("bold"))) f.font.setBold(o.value(QLatin1String("bold")).toBool());
    if(o.contains(QLatin1String("italic"))) f.font.setItalic(o.value(QLatin1String("italic")).toBool());
    const QString color = o.value(QLatin1String("color")).toString().trimmed();
    if(!color.isEmpty()) {
        const QColor c = QColor::fromString(color);
        if(c.isValid()) f.color = c;
        else qWarning() << "StyleSheet: ignoring invalid color" << color;
    }
}

} // namespace

StyleSheet::StyleSheet() : m_baseFamily(kDefaultFamily) {
    m_formats[static_cast<size_t>(TextStyle::Normal)] = makeFormat(kDefaultFamily, 10, false, Qt::black, Qt::AlignLeft);
    m_formats[static_cast<size_t>(TextStyle::Header)] = makeFormat(kDefaultFamily, 18, true, Qt::black, Qt::AlignHCenter);
    m_formats[static_cast<size_t>(TextStyle::SectionHeader)] = makeFormat(kDefaultFamily, 14, true, Qt::black, Qt::AlignLeft);
    m_formats[static_cast<size_t>(TextStyle::Small)] = makeFormat(kDefaultFamily, 8, false, QColor(0x55, 0x55, 0x55), Qt::AlignLeft);
    m_formats[static_cast<size_t>(TextStyle::Justify)] = makeFormat(kDefaultFamily, 10, false, Qt::black, Qt::AlignJustify);
}

StyleSheet StyleSheet::fromHints(const StyleHints &hints) {
    StyleSheet sheet;
    // "default" sets the family/size of every style before the per-style overrides.
    const QJsonObject base = hints.fonts.value(QLatin1String("default")).toObject();
    const QString family = base.value(QLatin1String("family")).toString().trimmed();
    if(!family.isEmpty()) {
        sheet.m_baseFamily = family;
        for(auto &f : sheet.m_formats) f.font.setFamily(family);
    }
    const QColor primary = QColor::fromString(hints.colors.value(QLatin1String("primary")).toString().trimmed());
    if(primary.isValid()) {
        sheet.m_formats[static_cast<size_t>(TextStyle::Header)].color = primary;
        sheet.m_formats[static_cast<size_t>(TextStyle::SectionHeader)].color = primary;
    }
    const QColor accent = QColor::fromString(hints.colors.value(QLatin1String("table_header")).toString().trimmed());
    if(accent.isValid()) sheet.m_tableHeaderBackground = accent;

    for(TextStyle s : { TextStyle::Normal, TextStyle::Header, TextStyle::SectionHeader, TextStyle::Small, TextStyle::Justify }) {
        const QJsonValue o = hints.fonts.value(styleName(s));
        if(o.isObject()) applyOverride(sheet.m_formats[static_cast<size_t>(s)], o.toObject());
    }
    return sheet;
}

TextStyle StyleSheet::parseStyle(const QString &name) {
    const QString n = name.trimmed().toLower();
    if(n == QLatin1String("header") || n == QLatin1String("title")) return TextStyle::Header;
    if(n == QLatin1String("section_header") || n == QLatin1String("subheader")) return TextStyle::SectionHeader;
    if(n == QLatin1String("small")) return TextStyle::Small;
    if(n == QLatin1String("justify")) return TextStyle::Justify;
    return TextStyle::Normal;
}

QString StyleSheet::styleName(TextStyle style) {
    switch(style) {
    case TextStyle::Header: return QStringLiteral("header");
    case TextStyle::SectionHeader: return QStringLiteral("section_header");
    case TextStyle::Small: return QStringLiteral("small");
    case TextStyle::Justify: return QStringLiteral("justify");
    case TextStyle::Normal: break;
    }
    return QStringLiteral("normal");
}

QFont StyleSheet::tableFont(double pointSize, bool header) const {
    QFont f(m_baseFamily);
    f.setPointSizeF(pointSize);
    f.setBold(header);
    return f;
}

} // namespace QtPdfTemplate::layout
