#include "html/HtmlWriter.hpp"
#include "util/DataUri.hpp"
#include <QBuffer>
#include <pugixml.hpp>
#include <sstream>

namespace QtPdfTemplate::html {

using namespace layout;

namespace {

QByteArray utf8(const QString &s) { return s.toUtf8(); }

QString pt(double v) { return QString::number(v, 'f', 2) + QStringLiteral("pt"); }

QString cssColor(const QColor &c) { return c.name(QColor::HexRgb); }

QString cssAlign(Qt::Alignment a) {
    if(a & Qt::AlignHCenter) return QStringLiteral("center");
    if(a & Qt::AlignRight) return QStringLiteral("right");
    if(a & Qt::AlignJustify) return QStringLiteral("justify");
    return QStringLiteral("left");
}

QString pngDataUri(const QImage &img) {
    QByteArray bytes;
    QBuffer buf(&bytes);
    buf.open(QIODevice::WriteOnly);
    img.save(&buf, "PNG");
    return util::buildDataUri(QStringLiteral("image/png"), bytes);
}

QString styleRules(const StyleSheet &styles) {
    QString css = QStringLiteral("body{margin:0;background:#eee}"
                                 "section.page{box-sizing:border-box;background:#fff;margin:12pt auto;position:relative}"
                                 "table.grid{border-collapse:collapse;width:100%}"
                                 "table.grid td,table.grid th{border:0.5pt solid %1;padding:3pt;text-align:left;vertical-align:middle}"
                                 "table.grid th{background:%2;font-weight:bold}"
                                 "img.block{display:block;margin:0 auto}"
                                 "img.qr-overlay{position:absolute}"
                                 "h1,h2,p{margin:0}")
                      .arg(cssColor(styles.gridColor()), cssColor(styles.tableHeaderBackground()));
    for(TextStyle s : { TextStyle::Normal, TextStyle::Header, TextStyle::SectionHeader, TextStyle::Small, TextStyle::Justify }) {
        const TextFormat &f = styles.format(s);
        css += QStringLiteral(".%1{font-family:'%2';font-size:%3;font-weight:%4;font-style:%5;color:%6;text-align:%7}")
                   .arg(StyleSheet::styleName(s), f.font.family(), pt(f.font.pointSizeF()),
                        f.font.bold() ? QStringLiteral("bold") : QStringLiteral("normal"),
                        f.font.italic() ? QStringLiteral("italic") : QStringLiteral("normal"),
                        cssColor(f.color), cssAlign(f.alignment));
    }
    return css;
}

class PageWriter {
public:
    PageWriter(pugi::xml_node body, const engine::ComposedDocument &doc) : m_body(body), m_doc(doc) {
        if(m_doc.overlay.isActive()) m_overlayUri = pngDataUri(m_doc.overlay.image);
        openPage();
    }

    void operator()(const Paragraph &p) {
        const char *tag = p.style == TextStyle::Header ? "h1" : p.style == TextStyle::SectionHeader ? "h2" : "p";
        auto node = m_page.append_child(tag);
        node.append_attribute("class") = utf8(StyleSheet::styleName(p.style)).constData();
        const QStringList lines = p.text.split(QLatin1Char('\n'));
        for(int i = 0; i < lines.size(); ++i) {
            if(i > 0) node.append_child("br");
            node.append_child(pugi::node_pcdata).set_value(utf8(lines.at(i)).constData());
        }
    }

    void operator()(const TableBlock &t) {
        auto table = m_page.append_child("table");
        table.append_attribute("class") = "grid";
        table.append_attribute("style") = utf8(QStringLiteral("font-size:%1").arg(pt(t.fontSize))).constData();
        pugi::xml_node body;
        for(int i = 0; i < t.rows.size(); ++i) {
            const bool header = t.headerRow && i == 0;
            if(header) body = table.append_child("thead");
            else if(!body || (t.headerRow && i == 1)) body = table.append_child("tbody");
            auto tr = body.append_child("tr");
            for(const auto &cell : t.rows.at(i)) tr.append_child(header ? "th" : "td").text().set(utf8(cell).constData());
        }
    }

    void operator()(const ImageBlock &img) {
        auto node = m_page.append_child("img");
        node.append_attribute("class") = img.isQr ? "block qr" : "block";
        node.append_attribute("alt") = img.isQr ? "QR" : "";
        node.append_attribute("style") = utf8(QStringLiteral("width:%1;height:%2").arg(pt(img.width), pt(img.height))).constData();
        node.append_attribute("src") = utf8(pngDataUri(img.image)).constData();
    }

    void operator()(const SpacerBlock &s) {
        auto node = m_page.append_child("div");
        node.append_attribute("class") = "spacer";
        node.append_attribute("style") = utf8(QStringLiteral("height:%1").arg(pt(s.height))).constData();
    }

    void operator()(const PageBreakBlock &) { openPage(); }

private:
    void openPage() {
        const PageGeometry &g = m_doc.geometry;
        m_page = m_body.append_child("section");
        m_page.append_attribute("class") = "page";
        m_page.append_attribute("data-page") = ++m_pageNumber;
        const QString style = QStringLiteral("width:%1;min-height:%2;padding:%3 %4 %5 %6")
                                  .arg(pt(g.pageSize.width()), pt(g.pageSize.height()), pt(g.margins.top()),
                                       pt(g.margins.right()), pt(g.margins.bottom()), pt(g.margins.left()));
        m_page.append_attribute("style") = utf8(style).constData();
        if(m_overlayUri.isEmpty()) return;
        const QRectF r = m_doc.overlay.placement(g);
        auto img = m_page.append_child("img");
        img.append_attribute("class") = m_doc.overlay.position == QrPosition::Footer ? "qr-overlay qr-footer" : "qr-overlay qr-header";
        img.append_attribute("alt") = "QR";
        img.append_attribute("style") = utf8(QStringLiteral("left:%1;top:%2;width:%3;height:%4")
                                                 .arg(pt(r.left()), pt(r.top()), pt(r.width()), pt(r.height()))).constData();
        img.append_attribute("src") = utf8(m_overlayUri).constData();
    }

    pugi::xml_node m_body;
    pugi::xml_node m_page;
    const engine::ComposedDocument &m_doc;
    QString m_overlayUri;
    int m_pageNumber{0};
};

} // namespace

QString writeDocument(const engine::ComposedDocument &doc, const QString &title) {
    pugi::xml_document xml;
    auto html = xml.append_child("html");
    html.append_attribute("xmlns") = "http://www.w3.org/1999/xhtml";
    auto head = html.append_child("head");
    head.append_child("meta").append_attribute("charset") = "utf-8";
    head.append_child("title").text().set(utf8(title).constData());
    head.append_child("style").text().set(utf8(styleRules(doc.styles)).constData());
    auto body = html.append_child("body");

    PageWriter writer(body, doc);
    for(const auto &prim : doc.flow) std::visit(writer, prim);

    std::ostringstream os;
    xml.save(os, "", pugi::format_raw | pugi::format_no_declaration, pugi::encoding_utf8);
    return QStringLiteral("<!DOCTYPE html>\n") + QString::fromStdString(os.str());
}

} // namespace QtPdfTemplate::html
