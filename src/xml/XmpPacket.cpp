#include "xml/XmpPacket.hpp"
#include <pugixml.hpp>

namespace QtPdfTemplate::xml {

namespace {

struct ByteArrayWriter : pugi::xml_writer {
    QByteArray &out;
    explicit ByteArrayWriter(QByteArray &o) : out(o) {}
    void write(const void *data, size_t size) override { out.append(static_cast<const char *>(data), static_cast<qsizetype>(size)); }
};

void setText(pugi::xml_node node, const QString &text) {
    node.text().set(text.toUtf8().constData());
}

void appendAlt(pugi::xml_node parent, const char *name, const QString &text) {
    if(text.isEmpty()) return;
    auto li = parent.append_child(name).append_child("rdf:Alt").append_child("rdf:li");
    li.append_attribute("xml:lang") = "x-default";
    setText(li, text);
}

void appendSimple(pugi::xml_node parent, const char *name, const QString &text) {
    if(text.isEmpty()) return;
    setText(parent.append_child(name), text);
}

} // namespace

QByteArray buildXmpPacket(const DocumentInfo &info) {
    pugi::xml_document doc;
    auto begin = doc.append_child(pugi::node_pi);
    begin.set_name("xpacket");
    begin.set_value("begin=\"\xEF\xBB\xBF\" id=\"W5M0MpCehiHzreSzNTczkc9d\"");

    auto meta = doc.append_child("x:xmpmeta");
    meta.append_attribute("xmlns:x") = "adobe:ns:meta/";
    auto rdf = meta.append_child("rdf:RDF");
    rdf.append_attribute("xmlns:rdf") = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
    auto desc = rdf.append_child("rdf:Description");
    desc.append_attribute("rdf:about") = "";
    desc.append_attribute("xmlns:dc") = "http://purl.org/dc/elements/1.1/";
    desc.append_attribute("xmlns:xmp") = "http://ns.adobe.com/xap/1.0/";
    desc.append_attribute("xmlns:pdf") = "http://ns.adobe.com/pdf/1.3/";
    desc.append_attribute("xmlns:xmpMM") = "http://ns.adobe.com/xap/1.0/mm/";

    desc.append_child("dc:format").text().set("application/pdf");
    appendAlt(desc, "dc:title", info.title);
    appendAlt(desc, "dc:description", info.description);
    if(!info.keywords.isEmpty()) {
        auto bag = desc.append_child("dc:subject").append_child("rdf:Bag");
        for(const auto &k : info.keywords) setText(bag.append_child("rdf:li"), k);
        appendSimple(desc, "pdf:Keywords", info.keywords.join(QStringLiteral(", ")));
    }
    appendSimple(desc, "xmp:CreatorTool", info.producer);
    appendSimple(desc, "xmp:CreateDate", info.createDate);
    appendSimple(desc, "xmp:ModifyDate", info.createDate);
    appendSimple(desc, "xmp:MetadataDate", info.createDate);
    appendSimple(desc, "pdf:Producer", info.producer);
    appendSimple(desc, "xmpMM:DocumentID", info.documentId);
    appendSimple(desc, "xmpMM:VersionID", info.version);

    auto end = doc.append_child(pugi::node_pi);
    end.set_name("xpacket");
    end.set_value("end=\"w\"");

    QByteArray out;
    ByteArrayWriter writer(out);
    doc.save(writer, "", pugi::format_raw | pugi::format_no_declaration, pugi::encoding_utf8);
    return out;
}

} // namespace QtPdfTemplate::xml
