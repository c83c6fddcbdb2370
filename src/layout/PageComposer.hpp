/** \file PageComposer.hpp
 *  Paginates a Flow onto a paint device whose user space is points with the origin at the page's top-left corner.
 */
#pragma once
#include "layout/Primitives.hpp"
#include "layout/StyleSheet.hpp"
#include "layout/Units.hpp"
#include <QPainter>
#include <functional>

namespace QtPdfTemplate::layout {

class PageComposer {
public:
    /** Called once at the start of every physical page, before any content is drawn. pageIndex is 0-based. */
    using PageCallback = std::function<void(QPainter &painter, int pageIndex)>;
    /** Advances the device to a new page; false aborts composition. */
    using NewPage = std::function<bool()>;

    PageComposer(const PageGeometry &geometry, const StyleSheet &styles);

    void setPageCallback(PageCallback callback) { m_onPage = std::move(callback); }

    /** Draws the whole flow. Returns false if the device refused a new page. */
    bool compose(const Flow &flow, QPainter &painter, const NewPage &newPage);

    /** Physical pages produced by the last compose(). */
    int pageCount() const { return m_pageCount; }

private:
    bool breakPage();
    bool ensureRoom(double height);
    bool drawParagraph(const Paragraph &p);
    bool drawTable(const TableBlock &t);
    bool drawImage(const ImageBlock &img);
    void drawSpacer(const SpacerBlock &s);
    double rowHeight(const QStringList &row, int columns, const QFont &font) const;
    void paintRow(const QStringList &row, int columns, const QFont &font, bool header);
    void startPage();

    PageGeometry m_geometry;
    QRectF m_frame;
    const StyleSheet &m_styles;
    PageCallback m_onPage;
    QPainter *m_painter{nullptr};
    const NewPage *m_newPage{nullptr};
    double m_cursorY{0};
    int m_pageCount{0};
};

} // namespace QtPdfTemplate::layout
