#include "layout/PageComposer.hpp"
#include <QFontMetricsF>
#include <QTextLayout>
#include <algorithm>

namespace QtPdfTemplate::layout {

namespace {
constexpr double kCellPadding = 3.0;
constexpr double kGridWidth = 0.5;
constexpr double kEpsilon = 0.01;
}

PageComposer::PageComposer(const PageGeometry &geometry, const StyleSheet &styles)
    : m_geometry(geometry), m_frame(geometry.frame()), m_styles(styles) {}

bool PageComposer::compose(const Flow &flow, QPainter &painter, const NewPage &newPage) {
    m_painter = &painter;
    m_newPage = &newPage;
    m_pageCount = 0;
    startPage();
    bool ok = true;
    for(const auto &prim : flow) {
        if(auto p = std::get_if<Paragraph>(&prim)) ok = drawParagraph(*p);
        else if(auto t = std::get_if<TableBlock>(&prim)) ok = drawTable(*t);
        else if(auto i = std::get_if<ImageBlock>(&prim)) ok = drawImage(*i);
        else if(auto s = std::get_if<SpacerBlock>(&prim)) drawSpacer(*s);
        else ok = breakPage();
        if(!ok) break;
    }
    m_painter = nullptr;
    m_newPage = nullptr;
    return ok;
}

void PageComposer::startPage() {
    m_cursorY = m_frame.top();
    ++m_pageCount;
    if(m_onPage) {
        m_painter->save();
        m_onPage(*m_painter, m_pageCount - 1);
        m_painter->restore();
    }
}

bool PageComposer::breakPage() {
    if(!(*m_newPage)()) return false;
    startPage();
    return true;
}

// Blocks taller than the remaining space move to the next page unless the page is still empty.
bool PageComposer::ensureRoom(double height) {
    if(m_cursorY + height <= m_frame.bottom() + kEpsilon) return true;
    if(m_cursorY <= m_frame.top() + kEpsilon) return true;
    return breakPage();
}

bool PageComposer::drawParagraph(const Paragraph &p) {
    const TextFormat &fmt = m_styles.format(p.style);
    QString text = p.text;
    text.replace(QLatin1Char('\n'), QChar::LineSeparator);

    QTextLayout textLayout(text, fmt.font, m_painter->device());
    QTextOption option(fmt.alignment);
    option.setWrapMode(QTextOption::WrapAtWordBoundaryOrAnywhere);
    textLayout.setTextOption(option);
    textLayout.beginLayout();
    double y = 0;
    for(;;) {
        QTextLine line = textLayout.createLine();
        if(!line.isValid()) break;
        line.setLeadingIncluded(true);
        line.setLineWidth(m_frame.width());
        line.setPosition(QPointF(0, y));
        y += line.height();
    }
    textLayout.endLayout();

    // Lines are placed one by one so a paragraph may continue on the next page.
    for(int i = 0; i < textLayout.lineCount(); ++i) {
        const QTextLine line = textLayout.lineAt(i);
        if(!ensureRoom(line.height())) return false;
        m_painter->setPen(fmt.color);
        line.draw(m_painter, QPointF(m_frame.left(), m_cursorY - line.y()));
        m_cursorY += line.height();
    }
    return true;
}

double PageComposer::rowHeight(const QStringList &row, int columns, const QFont &font) const {
    const QFontMetricsF fm(font, m_painter->device());
    const double textWidth = std::max(1.0, m_frame.width() / columns - 2 * kCellPadding);
    double h = fm.height();
    for(const auto &cell : row) {
        h = std::max(h, fm.boundingRect(QRectF(0, 0, textWidth, 1e6), Qt::TextWordWrap, cell).height());
    }
    return h + 2 * kCellPadding;
}

void PageComposer::paintRow(const QStringList &row, int columns, const QFont &font, bool header) {
    const double colWidth = m_frame.width() / columns;
    const double h = rowHeight(row, columns, font);
    m_painter->setFont(font);
    for(int c = 0; c < columns; ++c) {
        const QRectF cell(m_frame.left() + c * colWidth, m_cursorY, colWidth, h);
        if(header) m_painter->fillRect(cell, m_styles.tableHeaderBackground());
        m_painter->setPen(QPen(m_styles.gridColor(), kGridWidth));
        m_painter->drawRect(cell);
        m_painter->setPen(Qt::black);
        m_painter->drawText(cell.adjusted(kCellPadding, kCellPadding, -kCellPadding, -kCellPadding),
                            Qt::TextWordWrap | Qt::AlignLeft | Qt::AlignVCenter, row.value(c));
    }
    m_cursorY += h;
}

bool PageComposer::drawTable(const TableBlock &t) {
    int columns = 0;
    for(const auto &r : t.rows) columns = std::max(columns, static_cast<int>(r.size()));
    if(columns == 0) return true;
    const QFont bodyFont = m_styles.tableFont(t.fontSize, false);
    const QFont headFont = m_styles.tableFont(t.fontSize, true);

    for(int i = 0; i < t.rows.size(); ++i) {
        const bool isHeader = t.headerRow && i == 0;
        const QFont &font = isHeader ? headFont : bodyFont;
        const int pageBefore = m_pageCount;
        if(!ensureRoom(rowHeight(t.rows.at(i), columns, font))) return false;
        if(t.headerRow && i > 0 && m_pageCount != pageBefore) paintRow(t.rows.first(), columns, headFont, true);
        paintRow(t.rows.at(i), columns, font, isHeader);
    }
    return true;
}

bool PageComposer::drawImage(const ImageBlock &img) {
    if(img.image.isNull()) return true;
    double w = img.width > 0 ? img.width : img.image.width();
    double h = img.height > 0 ? img.height : img.image.height();
    const double scale = std::min({ 1.0, m_frame.width() / w, m_frame.height() / h });
    w *= scale;
    h *= scale;
    if(!ensureRoom(h)) return false;
    const QRectF target(m_frame.left() + (m_frame.width() - w) / 2.0, m_cursorY, w, h);
    m_painter->setRenderHint(QPainter::SmoothPixmapTransform, !img.isQr);
    m_painter->drawImage(target, img.image);
    m_cursorY += h;
    return true;
}

// Space never carries over to the next page.
void PageComposer::drawSpacer(const SpacerBlock &s) {
    m_cursorY = std::min(m_cursorY + s.height, m_frame.bottom());
}

} // namespace QtPdfTemplate::layout
