#include "gdal/gdalwriter.h"
#include "gdal/ogrconvert.h"
#include "convert/geometrynormalizer.h"
#include "convert/progressobserver.h"

#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <cpl_conv.h>
#include <cpl_string.h>

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>
#include <QSet>

namespace {

constexpr int kMaxNameLength = 100;

QJsonArray vertexJson(const Vertex& v, bool hasZ)
{
    QJsonArray coord{v.x, v.y};
    if (hasZ) coord.append(v.z);
    return coord;
}

QJsonArray ringJson(const VertexList& coords, bool hasZ)
{
    QJsonArray ring;
    for (const Vertex& v : coords) ring.append(vertexJson(v, hasZ));
    return ring;
}

QJsonArray partJson(const GeometryPart& part, bool hasZ)
{
    if (part.kind == GeometryKind::Point) return vertexJson(part.coords().first(), hasZ);
    if (part.kind == GeometryKind::LineString) return ringJson(part.coords(), hasZ);
    QJsonArray rings;
    for (const VertexList& ring : part.rings) rings.append(ringJson(ring, hasZ));
    return rings;
}

QJsonObject geometryJson(const Geometry& geometry)
{
    QJsonObject json;
    json["type"] = geometry.typeName();
    if (geometry.kind() == GeometryKind::GeometryCollection) {
        QJsonArray members;
        for (const GeometryPart& part : geometry.parts()) {
            QJsonObject member;
            member["type"] = part.kind == GeometryKind::Point ? "Point"
                           : part.kind == GeometryKind::LineString ? "LineString" : "Polygon";
            member["coordinates"] = partJson(part, geometry.hasZ());
            members.append(member);
        }
        json["geometries"] = members;
        return json;
    }

    switch (geometry.kind()) {
        case GeometryKind::Point:
        case GeometryKind::LineString:
        case GeometryKind::Polygon:
            json["coordinates"] = partJson(geometry.parts().first(), geometry.hasZ());
            break;
        default: {
            QJsonArray coords;
            for (const GeometryPart& part : geometry.parts()) coords.append(partJson(part, geometry.hasZ()));
            json["coordinates"] = coords;
            break;
        }
    }
    return json;
}

bool bucketHasZ(const QVector<Row>& rows)
{
    for (const Row& row : rows) {
        if (row.geometry.hasZ()) return true;
    }
    return false;
}

bool bucketHasBlocks(const QVector<Row>& rows)
{
    for (const Row& row : rows) {
        if (!row.blockName.isEmpty()) return true;
    }
    return false;
}

// Layers are declared multi; single parts are promoted
OGRGeometry* promote(std::unique_ptr<OGRGeometry> geometry, GeometryType type)
{
    switch (type) {
        case GeometryType::Line:
            return OGRGeometryFactory::forceToMultiLineString(geometry.release());
        case GeometryType::Polygon:
            return OGRGeometryFactory::forceToMultiPolygon(geometry.release());
        case GeometryType::Point:
            break;
    }
    return geometry.release();
}

} // namespace

GdalWriter::GdalWriter() {}
GdalWriter::~GdalWriter() {}

QString GdalWriter::sanitizeFileName(const QString& name)
{
    static const QRegularExpression invalid("[^A-Za-z0-9 _.\\-]+");
    static const QSet<QString> reserved{
        "CON", "PRN", "AUX", "NUL",
        "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
        "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"};

    QString s = name;
    s.replace(invalid, "_");

    int begin = 0;
    int end = s.size();
    while (begin < end && (s[begin] == ' ' || s[begin] == '.')) ++begin;
    while (end > begin && (s[end - 1] == ' ' || s[end - 1] == '.')) --end;
    s = s.mid(begin, end - begin);

    if (s.isEmpty()) s = "layer";
    if (reserved.contains(s.toUpper())) s = QString("_%1_").arg(s);
    return s.left(kMaxNameLength);
}

QString GdalWriter::tierName(Tier tier)
{
    switch (tier) {
        case Tier::Shapefile: return "SHP";
        case Tier::OgrGeoJson: return "GeoJSON";
        case Tier::PlainGeoJson: return "plain GeoJSON";
    }
    return QString();
}

void GdalWriter::notify(const QString& message) const
{
    notifyProgress(m_observer, message);
}

QString GdalWriter::bucketFileName(const BucketKey& key, const QString& extension) const
{
    return QString("%1_%2.%3").arg(sanitizeFileName(key.layer),
                                   sanitizeFileName(geometryTypeName(key.type)), extension);
}

OGRSpatialReference* GdalWriter::createSpatialReference() const
{
    if (m_epsg <= 0) return nullptr;
    auto* srs = new OGRSpatialReference();
    if (srs->importFromEPSG(m_epsg) != OGRERR_NONE) {
        qWarning() << "GdalWriter: unknown EPSG" << m_epsg << "- writing without CRS";
        srs->Release();
        return nullptr;
    }
    srs->SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return srs;
}

bool GdalWriter::removeExisting(const QString& path, const char* driverName)
{
    if (!QFileInfo::exists(path)) return true;
    if (!m_overwrite) {
        m_lastError = QString("Output exists: %1").arg(path);
        return false;
    }

    GDALDriver* driver = driverName ? GetGDALDriverManager()->GetDriverByName(driverName) : nullptr;
    if (driver) {
        CPLPushErrorHandler(CPLQuietErrorHandler);
        const CPLErr err = driver->Delete(path.toUtf8().constData());
        CPLPopErrorHandler();
        if (err == CE_None) return true;
    }
    if (!QFile::remove(path)) {
        m_lastError = QString("Cannot remove existing output: %1").arg(path);
        return false;
    }
    return true;
}

QVector<WrittenOutput> GdalWriter::write(const QVector<Bucket>& buckets, const QString& outPath,
                                         const QString& driver)
{
    m_lastError.clear();
    m_attempted.clear();

    if (buckets.isEmpty()) {
        notify("[write] empty buckets");
        return QVector<WrittenOutput>();
    }

    if (driver.compare("GPKG", Qt::CaseInsensitive) == 0 || outPath.endsWith(".gpkg", Qt::CaseInsensitive)) {
        return writeGpkg(buckets, outPath);
    }

    if (!QDir().mkpath(outPath)) {
        m_lastError = QString("Cannot create output directory: %1").arg(outPath);
        notify(QString("[write:error] %1").arg(m_lastError));
        return QVector<WrittenOutput>();
    }

    QVector<QPair<Tier, TierWriter>> tiers;
    tiers.append({Tier::Shapefile, [this](const QVector<Bucket>& b, const QString& dir) {
        return writeOgrFiles(b, dir, "ESRI Shapefile", "shp");
    }});
    tiers.append({Tier::OgrGeoJson, [this](const QVector<Bucket>& b, const QString& dir) {
        return writeOgrFiles(b, dir, "GeoJSON", "geojson");
    }});
    tiers.append({Tier::PlainGeoJson, [this](const QVector<Bucket>& b, const QString& dir) {
        return writePlainGeoJson(b, dir);
    }});

    // A GeoJSON request starts below the shapefile tier
    int start = 0;
    if (driver.compare("GeoJSON", Qt::CaseInsensitive) == 0) start = 1;

    for (int i = start; i < tiers.size(); ++i) {
        m_attempted.append(tiers[i].first);
        if (i > start) notify(QString("[write] using %1 fallback").arg(tierName(tiers[i].first)));

        const QVector<WrittenOutput> written = tiers[i].second(buckets, outPath);
        if (!written.isEmpty()) return written;
        qWarning() << "GdalWriter:" << tierName(tiers[i].first) << "wrote nothing -" << m_lastError;
    }
    return QVector<WrittenOutput>();
}

QVector<WrittenOutput> GdalWriter::writeGpkg(const QVector<Bucket>& buckets, const QString& outPath)
{
    QVector<WrittenOutput> written;
    const QString gpkg = outPath.endsWith(".gpkg", Qt::CaseInsensitive)
                             ? outPath
                             : QDir(outPath).filePath("bundle.gpkg");

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GPKG");
    if (!driver) {
        m_lastError = "GPKG driver not available";
        notify(QString("[write:error] %1").arg(m_lastError));
        return written;
    }

    const QString dir = QFileInfo(gpkg).absolutePath();
    if (!QDir().mkpath(dir) || !removeExisting(gpkg, "GPKG")) {
        if (m_lastError.isEmpty()) m_lastError = QString("Cannot create output directory: %1").arg(dir);
        notify(QString("[write:error] %1").arg(m_lastError));
        return written;
    }

    CPLPushErrorHandler(CPLQuietErrorHandler);
    GDALDataset* dataset = driver->Create(gpkg.toUtf8().constData(), 0, 0, 0, GDT_Unknown, nullptr);
    CPLPopErrorHandler();
    if (!dataset) {
        m_lastError = QString("Failed to create file: %1").arg(CPLGetLastErrorMsg());
        notify(QString("[write:error] %1").arg(m_lastError));
        return written;
    }

    // Keep the primary key clear of the FID attribute
    char** options = CSLSetNameValue(nullptr, "FID", "ogc_fid");

    QSet<QString> usedNames;
    for (const Bucket& bucket : buckets) {
        const QVector<Row> rows = GeometryNormalizer::normalizeRows(bucket.rows);
        if (rows.isEmpty()) {
            notify(QString("[write:skip] %1/%2 empty after normalize")
                       .arg(bucket.key.layer, geometryTypeName(bucket.key.type)));
            continue;
        }

        // One GPKG layer per bucket; the type suffix is added when a layer
        // name repeats
        QString layerName = bucket.key.layer;
        if (usedNames.contains(layerName.toLower())) {
            layerName = QString("%1_%2").arg(bucket.key.layer, geometryTypeName(bucket.key.type));
        }
        usedNames.insert(layerName.toLower());

        if (!writeLayer(dataset, layerName, bucket.key.type, rows, options)) {
            notify(QString("[write:error] GPKG layer %1 failed: %2").arg(layerName, m_lastError));
            continue;
        }
        written.append(WrittenOutput{gpkg, layerName, static_cast<int>(rows.size())});
        notify(QString("[write] GPKG: %1 (%2) -> %3").arg(layerName).arg(rows.size()).arg(gpkg));
    }

    CSLDestroy(options);
    GDALClose(dataset);
    return written;
}

QVector<WrittenOutput> GdalWriter::writeOgrFiles(const QVector<Bucket>& buckets, const QString& dir,
                                                 const char* driverName, const QString& extension)
{
    QVector<WrittenOutput> written;

    const QString driverLabel = QString::fromLatin1(driverName);
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driverName);
    if (!driver) {
        m_lastError = QString("%1 driver not available").arg(driverLabel);
        notify(QString("[write:warn] %1").arg(m_lastError));
        return written;
    }

    for (const Bucket& bucket : buckets) {
        const QString path = QDir(dir).filePath(bucketFileName(bucket.key, extension));

        const QVector<Row> rows = GeometryNormalizer::normalizeRows(bucket.rows);
        if (rows.isEmpty()) {
            notify(QString("[write:skip] %1/%2 empty after normalize")
                       .arg(bucket.key.layer, geometryTypeName(bucket.key.type)));
            continue;
        }

        if (!removeExisting(path, driverName)) {
            notify(QString("[write:warn] %1").arg(m_lastError));
            continue;
        }

        CPLPushErrorHandler(CPLQuietErrorHandler);
        GDALDataset* dataset = driver->Create(path.toUtf8().constData(), 0, 0, 0, GDT_Unknown, nullptr);
        CPLPopErrorHandler();
        if (!dataset) {
            m_lastError = QString("Failed to create file: %1").arg(CPLGetLastErrorMsg());
            notify(QString("[write:warn] %1 failed: %2 -> %3").arg(driverLabel, path, m_lastError));
            continue;
        }

        const QString layerName = QFileInfo(path).completeBaseName();
        const bool ok = writeLayer(dataset, layerName, bucket.key.type, rows, nullptr);
        GDALClose(dataset);

        if (!ok) {
            notify(QString("[write:warn] %1 failed: %2 -> %3").arg(driverLabel, path, m_lastError));
            continue;
        }
        written.append(WrittenOutput{path, bucket.key.layer, static_cast<int>(rows.size())});
        notify(QString("[write] %1: %2 (%3) -> %4")
                   .arg(tierName(extension == "shp" ? Tier::Shapefile : Tier::OgrGeoJson), bucket.key.layer)
                   .arg(rows.size()).arg(path));
    }
    return written;
}

bool GdalWriter::writeLayer(GDALDataset* dataset, const QString& layerName, GeometryType type,
                            const QVector<Row>& rows, char** layerOptions)
{
    OGRSpatialReference* srs = createSpatialReference();
    const bool hasZ = bucketHasZ(rows);

    CPLPushErrorHandler(CPLQuietErrorHandler);
    OGRLayer* layer = dataset->CreateLayer(layerName.toUtf8().constData(), srs,
                                           OgrConvert::layerType(type, hasZ), layerOptions);
    CPLPopErrorHandler();
    if (srs) srs->Release();
    if (!layer) {
        m_lastError = QString("Failed to create layer: %1").arg(CPLGetLastErrorMsg());
        return false;
    }

    OGRFieldDefn fidField("FID", OFTInteger);
    if (layer->CreateField(&fidField) != OGRERR_NONE) {
        m_lastError = "Failed to create FID field";
        return false;
    }

    OGRFieldDefn layerField("LAYER", OFTString);
    layerField.SetWidth(kMaxNameLength);
    if (layer->CreateField(&layerField) != OGRERR_NONE) {
        m_lastError = "Failed to create LAYER field";
        return false;
    }

    const bool hasBlocks = bucketHasBlocks(rows);
    if (hasBlocks) {
        OGRFieldDefn blockField("BLK_NAME", OFTString);
        blockField.SetWidth(kMaxNameLength);
        if (layer->CreateField(&blockField) != OGRERR_NONE) {
            m_lastError = "Failed to create BLK_NAME field";
            return false;
        }
    }

    int failures = 0;
    for (int i = 0; i < rows.size(); ++i) {
        const Row& row = rows[i];
        std::unique_ptr<OGRGeometry> geometry = OgrConvert::toOgr(row.geometry);
        if (!geometry) {
            ++failures;
            continue;
        }

        OGRFeature* feature = OGRFeature::CreateFeature(layer->GetLayerDefn());
        feature->SetField("FID", i);
        feature->SetField("LAYER", row.layer.toUtf8().constData());
        if (hasBlocks) {
            feature->SetField("BLK_NAME", row.blockName.left(kMaxNameLength).toUtf8().constData());
        }
        feature->SetGeometryDirectly(promote(std::move(geometry), type));

        CPLPushErrorHandler(CPLQuietErrorHandler);
        if (layer->CreateFeature(feature) != OGRERR_NONE) ++failures;
        CPLPopErrorHandler();
        OGRFeature::DestroyFeature(feature);
    }

    if (failures > 0) {
        qWarning() << "GdalWriter:" << failures << "features failed in layer" << layerName;
    }
    if (failures == rows.size()) {
        m_lastError = QString("No feature written: %1").arg(CPLGetLastErrorMsg());
        return false;
    }
    return true;
}

QVector<WrittenOutput> GdalWriter::writePlainGeoJson(const QVector<Bucket>& buckets, const QString& dir)
{
    QVector<WrittenOutput> written;

    for (const Bucket& bucket : buckets) {
        const QVector<Row> rows = GeometryNormalizer::normalizeRows(bucket.rows);
        if (rows.isEmpty()) {
            notify(QString("[write:skip] %1/%2 empty after normalize")
                       .arg(bucket.key.layer, geometryTypeName(bucket.key.type)));
            continue;
        }

        const QString path = QDir(dir).filePath(bucketFileName(bucket.key, "geojson"));
        if (QFileInfo::exists(path) && !m_overwrite) {
            m_lastError = QString("Output exists: %1").arg(path);
            notify(QString("[write:error] %1").arg(m_lastError));
            continue;
        }

        QJsonArray features;
        for (int i = 0; i < rows.size(); ++i) {
            const Row& row = rows[i];
            QJsonObject properties;
            properties["FID"] = i;
            properties["LAYER"] = row.layer;
            if (!row.blockName.isEmpty()) properties["BLK_NAME"] = row.blockName;

            QJsonObject feature;
            feature["type"] = "Feature";
            feature["properties"] = properties;
            feature["geometry"] = geometryJson(row.geometry);
            features.append(feature);
        }

        QJsonObject collection;
        collection["type"] = "FeatureCollection";
        collection["features"] = features;

        QFile file(path);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            m_lastError = QString("Cannot open %1: %2").arg(path, file.errorString());
            notify(QString("[write:error] GeoJSON failed: %1").arg(m_lastError));
            continue;
        }
        file.write(QJsonDocument(collection).toJson(QJsonDocument::Compact));
        file.close();

        written.append(WrittenOutput{path, bucket.key.layer, static_cast<int>(rows.size())});
        notify(QString("[write] GeoJSON: %1 (%2) -> %3").arg(bucket.key.layer).arg(rows.size()).arg(path));
    }
    return written;
}
