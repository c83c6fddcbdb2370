/** \file HtmlWriter.hpp
 *  XHTML rendition of a composed document, used by HTML previews.
 */
#pragma once
#include "engine/DocumentBuilder.hpp"
#include <QString>

namespace QtPdfTemplate::html {

/** Serializes the flow as one <section class="page"> per logical page (split at page breaks).
 *  Images are embedded as PNG data URIs; an active QR overlay is repeated on every page. */
QString writeDocument(const engine::ComposedDocument &doc, const QString &title);

} // namespace QtPdfTemplate::html
