/** \file Primitives.hpp
 *  Layout primitives produced by the section renderer and consumed by the page composer and the HTML writer.
 *  All lengths are PDF points.
 */
#pragma once
#include <QImage>
#include <QList>
#include <QString>
#include <QStringList>
#include <variant>
#include <vector>

namespace QtPdfTemplate::layout {

enum class TextStyle { Normal, Header, SectionHeader, Small, Justify };

struct Paragraph {
    QString text;
    TextStyle style{TextStyle::Normal};
};

/** Grid with equal column widths. The first row is a styled header when headerRow is set and repeats after page breaks. */
struct TableBlock {
    QList<QStringList> rows;
    bool headerRow{false};
    double fontSize{10.0};
};

struct ImageBlock {
    QImage image;
    double width{0};  // requested box; scaled down to the frame when larger
    double height{0};
    bool isQr{false};
};

struct SpacerBlock { double height{0}; };
struct PageBreakBlock {};

using Primitive = std::variant<Paragraph, TableBlock, ImageBlock, SpacerBlock, PageBreakBlock>;
using Flow = std::vector<Primitive>;

} // namespace QtPdfTemplate::layout
