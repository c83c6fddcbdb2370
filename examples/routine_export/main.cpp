#include <QtPdfTemplate/EngineSettings.hpp>
#include <QtPdfTemplate/PdfEngine.hpp>
#include <QtPdfTemplate/PreviewEngine.hpp>
#include <QtPdfTemplate/TemplateValidator.hpp>
#include <QFile>
#include <QGuiApplication>
#include <QJsonDocument>
#include <iostream>

// Renders a routine template to PDF.
// Usage: routine_export template.json [data.json] [output.pdf]
// Without a data file the preview sample data is used.

using namespace QtPdfTemplate;

static QJsonObject readObject(const QString &path) {
    QFile f(path);
    if(!f.open(QIODevice::ReadOnly)) {
        std::cerr << "cannot open " << path.toStdString() << std::endl;
        return QJsonObject();
    }
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &err);
    if(err.error != QJsonParseError::NoError || !doc.isObject()) {
        std::cerr << path.toStdString() << ": " << err.errorString().toStdString() << std::endl;
        return QJsonObject();
    }
    return doc.object();
}

int main(int argc, char **argv){
    QGuiApplication app(argc, argv);
    const QStringList args = app.arguments();
    if(args.size() < 2) {
        std::cerr << "usage: routine_export template.json [data.json] [output.pdf]" << std::endl;
        return 2;
    }
    const QJsonObject config = readObject(args.at(1));
    if(config.isEmpty()) return 1;
    QJsonObject data = args.size() > 2 ? readObject(args.at(2)) : QJsonObject();
    if(data.isEmpty()) data = PreviewEngine::generateSampleData(config);
    const QString output = args.size() > 3 ? args.at(3) : QStringLiteral("routine.pdf");

    const ValidationResult validation = TemplateValidator().validate(config);
    for(const auto &w : validation.warnings) std::cerr << "warning: " << w.message.toStdString() << " (" << w.path.toStdString() << ")" << std::endl;
    if(!validation.isValid) {
        for(const auto &e : validation.errorMessages()) std::cerr << "error: " << e.toStdString() << std::endl;
        return 1;
    }

    PdfEngine engine(EngineSettings::fromEnvironment());
    if(!engine.renderToFile(config, data, output)) {
        std::cerr << "rendering failed (error code " << static_cast<int>(engine.lastError().value_or(PdfEngine::ErrorCode::PaintFailed)) << ")" << std::endl;
        return 1;
    }
    const RenderStats &stats = engine.lastStats();
    std::cout << "routine_export wrote " << output.toStdString() << " (" << stats.pageCount << " pages)" << std::endl;
    return 0;
}
