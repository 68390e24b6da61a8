#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QTextStream>
#include <QDebug>

#include <gdal_priv.h>

#include "appsettings.h"
#include "convert/conversionservice.h"
#include "convert/progressobserver.h"
#include "dxf/dxfreader.h"
#include "gdal/gdalwriter.h"
#include "gdal/geosbridge.h"
#include "gdal/reprojector.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;

// Ensure GDAL/PROJ data paths are available when bundled next to the binary
void setupDataPaths()
{
    const QByteArray gdalEnv = qgetenv("GDAL_DATA");
    const QByteArray projEnv = qgetenv("PROJ_LIB");
    const QString appDir = QDir::cleanPath(QCoreApplication::applicationDirPath());
    const QStringList gdalCandidates = {
        appDir + "/gdal-data",
        appDir + "/gdal/share/gdal"
    };
    const QStringList projCandidates = {
        appDir + "/proj-data",
        appDir + "/gdal/share/proj"
    };
    if (gdalEnv.isEmpty()) {
        for (const QString& p : gdalCandidates) { if (QDir(p).exists()) { qputenv("GDAL_DATA", p.toUtf8()); break; } }
    }
    if (projEnv.isEmpty()) {
        for (const QString& p : projCandidates) { if (QDir(p).exists()) { qputenv("PROJ_LIB", p.toUtf8()); break; } }
    }
}

bool readDouble(const QCommandLineParser& parser, const QString& name, double& value)
{
    if (!parser.isSet(name)) return true;
    bool ok = false;
    const double parsed = parser.value(name).toDouble(&ok);
    if (!ok || !(parsed > 0.0)) {
        qCritical().noquote() << QString("Invalid --%1: %2").arg(name, parser.value(name));
        return false;
    }
    value = parsed;
    return true;
}

template <typename T>
bool readInt(const QCommandLineParser& parser, const QString& name, T& value)
{
    if (!parser.isSet(name)) return true;
    bool ok = false;
    const qlonglong parsed = parser.value(name).toLongLong(&ok);
    if (!ok || parsed < 0) {
        qCritical().noquote() << QString("Invalid --%1: %2").arg(name, parser.value(name));
        return false;
    }
    value = static_cast<T>(parsed);
    return true;
}

int run(const QCoreApplication& app)
{
    QCommandLineParser parser;
    parser.setApplicationDescription("Convert DXF/DWG drawings into GIS layers grouped by layer and geometry type.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("inputs", "Input .dxf or .dwg files.", "<input>...");
    parser.addOptions({
        {{"o", "output"}, "Output directory, or a .gpkg file.", "path"},
        {"src-epsg", "EPSG code of the drawing coordinates.", "code"},
        {"tgt-epsg", "Reproject the output to this EPSG code.", "code"},
        {"bbox", "Keep features intersecting minLon,minLat,maxLon,maxLat (WGS84).", "box"},
        {"driver", "Output driver: \"ESRI Shapefile\", GeoJSON or GPKG.", "name"},
        {"block-mode", "Block handling: explode or keep-merge.", "mode"},
        {"layers", "Comma separated layer selection (default: all).", "names"},
        {"flatten-tol", "Maximum chord deviation for curves.", "tol"},
        {"merge-tol", "End point snapping tolerance for block merges.", "tol"},
        {"small-limit", "Segment count handled by the robust merge.", "n"},
        {"medium-limit", "Segment count handled by the graph merge.", "n"},
        {"time-budget", "Per-block collection budget in milliseconds.", "ms"},
        {"include-3d", "Keep elevation on output coordinates."},
        {"overwrite", "Replace existing outputs."},
        {"ini", "Read defaults from this settings file.", "file"},
    });

    if (!parser.parse(app.arguments())) {
        qCritical().noquote() << parser.errorText();
        return kExitUsage;
    }
    if (parser.isSet("help")) {
        QTextStream(stdout) << parser.helpText();
        return kExitOk;
    }
    if (parser.isSet("version")) {
        QTextStream(stdout) << app.applicationName() << " " << app.applicationVersion() << "\n";
        return kExitOk;
    }

    const QStringList inputs = parser.positionalArguments();
    if (inputs.isEmpty() || !parser.isSet("output")) {
        qCritical().noquote() << "Usage: dxf2gis [options] <input.dxf|.dwg>... -o <out>";
        return kExitUsage;
    }
    if (parser.isSet("ini")) {
        AppSettings::setSettingsFile(parser.value("ini"));
    }

    ConversionOptions options = AppSettings::conversionOptions();
    int sourceEpsg = AppSettings::sourceEpsg();
    int targetEpsg = AppSettings::targetEpsg();
    QString driver = AppSettings::outputDriver();

    if (!readDouble(parser, "flatten-tol", options.flattenTolerance) ||
        !readDouble(parser, "merge-tol", options.mergeTolerance) ||
        !readInt(parser, "small-limit", options.smallLimit) ||
        !readInt(parser, "medium-limit", options.mediumLimit) ||
        !readInt(parser, "time-budget", options.timeBudgetMs) ||
        !readInt(parser, "src-epsg", sourceEpsg) ||
        !readInt(parser, "tgt-epsg", targetEpsg)) {
        return kExitUsage;
    }
    if (parser.isSet("block-mode") && !blockModeFromName(parser.value("block-mode"), options.blockMode)) {
        qCritical().noquote() << "Invalid --block-mode:" << parser.value("block-mode");
        return kExitUsage;
    }
    if (parser.isSet("layers")) {
        options.setSelectedLayers(parser.value("layers").split(',', Qt::SkipEmptyParts));
    }
    if (parser.isSet("include-3d")) options.includeElevation = true;
    if (parser.isSet("driver")) driver = parser.value("driver");

    Reprojector reprojector(sourceEpsg);
    reprojector.setTargetEpsg(targetEpsg);
    if (parser.isSet("bbox")) {
        BoundingBox box;
        if (!BoundingBox::parse(parser.value("bbox"), box)) {
            qCritical().noquote() << "Invalid --bbox:" << parser.value("bbox");
            return kExitUsage;
        }
        reprojector.setBoundingBox(box);
    }

    LogProgressObserver observer;
    notifyProgress(&observer, QString("[convert] srcEPSG=%1 tgtEPSG=%2 include_3d=%3 block_mode=%4")
                                  .arg(sourceEpsg).arg(targetEpsg)
                                  .arg(options.includeElevation ? QStringLiteral("true") : QStringLiteral("false"))
                                  .arg(blockModeName(options.blockMode)));

    DxfReader reader;
    ConversionService service(reader, options, &observer);
    if (!service.convert(inputs)) {
        QTextStream(stdout) << "No features converted.\n";
        return kExitOk;
    }

    QVector<Bucket> buckets;
    if (!reprojector.process(service.buckets(), buckets, &observer)) {
        qCritical().noquote() << "Reprojection failed:" << reprojector.lastError();
        return kExitFatal;
    }
    if (buckets.isEmpty()) {
        QTextStream(stdout) << "No features left after filtering.\n";
        return kExitOk;
    }

    GdalWriter writer;
    writer.setEpsg(reprojector.reprojects() ? reprojector.targetEpsg() : reprojector.sourceEpsg());
    writer.setOverwrite(parser.isSet("overwrite"));
    writer.setObserver(&observer);

    const QVector<WrittenOutput> written = writer.write(buckets, parser.value("output"), driver);
    if (written.isEmpty()) {
        qCritical().noquote() << "No output written:" << writer.lastError();
        return kExitFatal;
    }

    QTextStream out(stdout);
    for (const WrittenOutput& output : written) {
        out << output.path << "\t" << output.layer << "\t" << output.count << "\n";
    }
    return kExitOk;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("dxf2gis");
    app.setOrganizationName("Geomatics");
    app.setApplicationVersion("1.0.0");

    setupDataPaths();
    GDALAllRegister();
    GeosBridge::initialize();

    int code = kExitOk;
    try {
        code = run(app);
    } catch (const std::exception& e) {
        qCritical().noquote() << "Conversion aborted:" << e.what();
        code = kExitFatal;
    }

    GeosBridge::cleanup();
    return code;
}
