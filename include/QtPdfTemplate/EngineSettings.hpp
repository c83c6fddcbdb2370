/** \file EngineSettings.hpp
 *  Tunables shared by PdfEngine and PreviewEngine.
 */
#pragma once
#include "QtPdfTemplate/Export.hpp"
#include <QtGlobal>

namespace QtPdfTemplate {

/** Resource limits of the rendering pipeline. Defaults match the documented knobs. */
struct QTPDFTEMPLATE_EXPORT EngineSettings {
    /** Largest decoded inline image accepted by image sections (PDF_MAX_IMAGE_BYTES). */
    qint64 maxImageBytes{600000};
    /** Capacity of the compiled-expression cache; 0 disables caching (PDF_MAX_COMPILED_TEMPLATES). */
    int maxCompiledExpressions{500};
    /** Capacity of the preview cache (PREVIEW_MAX_CACHE). */
    int maxPreviewEntries{200};
    /** TTL applied when a PreviewConfig does not carry one (PREVIEW_CACHE_TTL). */
    int defaultPreviewTtlSeconds{3600};

    /** Defaults overridden by any well-formed environment variable. Malformed values are ignored with a warning. */
    static EngineSettings fromEnvironment();
};

} // namespace QtPdfTemplate
