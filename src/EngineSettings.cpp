#include "QtPdfTemplate/EngineSettings.hpp"
#include <QDebug>
#include <limits>

namespace QtPdfTemplate {

namespace {

template <typename T>
void readKnob(const char *name, T &target) {
    if(!qEnvironmentVariableIsSet(name)) return;
    bool ok = false;
    const qlonglong value = qEnvironmentVariable(name).trimmed().toLongLong(&ok);
    if(!ok || value < 0 || value > static_cast<qlonglong>(std::numeric_limits<T>::max())) {
        qWarning("EngineSettings: ignoring malformed %s=%s", name, qPrintable(qEnvironmentVariable(name)));
        return;
    }
    target = static_cast<T>(value);
}

} // namespace

EngineSettings EngineSettings::fromEnvironment() {
    EngineSettings s;
    readKnob("PDF_MAX_IMAGE_BYTES", s.maxImageBytes);
    readKnob("PDF_MAX_COMPILED_TEMPLATES", s.maxCompiledExpressions);
    readKnob("PREVIEW_MAX_CACHE", s.maxPreviewEntries);
    readKnob("PREVIEW_CACHE_TTL", s.defaultPreviewTtlSeconds);
    return s;
}

} // namespace QtPdfTemplate
