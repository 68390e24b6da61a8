#ifndef GDALWRITER_H
#define GDALWRITER_H

#include <QString>
#include <QVector>

#include <functional>

#include "convert/bucketassembler.h"

class GDALDataset;
class OGRSpatialReference;
class ProgressObserver;

/**
 * @brief WrittenOutput - One layer written to disk
 */
struct WrittenOutput {
    QString path;
    QString layer;
    int count{0};
};

/**
 * @brief GdalWriter - Writes buckets to GIS formats using GDAL/OGR
 *
 * GPKG output goes to one file with one layer per bucket. Any other driver
 * writes one file per bucket through a chain of tiers: OGR "ESRI Shapefile",
 * then OGR "GeoJSON", then plain GeoJSON text. A tier is only used when the
 * previous one wrote nothing.
 *
 * Every feature carries FID, LAYER and, for block rows, BLK_NAME.
 */
class GdalWriter {
public:
    enum class Tier {
        Shapefile,
        OgrGeoJson,
        PlainGeoJson
    };

    GdalWriter();
    ~GdalWriter();

    void setEpsg(int epsg) { m_epsg = epsg; }
    void setOverwrite(bool overwrite) { m_overwrite = overwrite; }
    void setObserver(ProgressObserver* observer) { m_observer = observer; }

    /**
     * @brief Write all buckets
     * @param outPath Output directory, or a .gpkg file
     * @param driver "GPKG", "ESRI Shapefile" or "GeoJSON"
     * @return Written layers; empty when nothing could be written
     */
    QVector<WrittenOutput> write(const QVector<Bucket>& buckets, const QString& outPath, const QString& driver);

    // Tiers actually tried by the last write(), in order
    const QVector<Tier>& attemptedTiers() const { return m_attempted; }

    QString lastError() const { return m_lastError; }

    /**
     * @brief File-system safe name
     *
     * Characters outside [A-Za-z0-9 _.-] become '_', leading and trailing
     * spaces and dots are removed, Windows device names are wrapped in
     * underscores, at most 100 characters; an empty result becomes "layer".
     */
    static QString sanitizeFileName(const QString& name);

    static QString tierName(Tier tier);

private:
    using TierWriter = std::function<QVector<WrittenOutput>(const QVector<Bucket>&, const QString&)>;

    QVector<WrittenOutput> writeGpkg(const QVector<Bucket>& buckets, const QString& outPath);
    QVector<WrittenOutput> writeOgrFiles(const QVector<Bucket>& buckets, const QString& dir,
                                         const char* driverName, const QString& extension);
    QVector<WrittenOutput> writePlainGeoJson(const QVector<Bucket>& buckets, const QString& dir);

    bool writeLayer(GDALDataset* dataset, const QString& layerName, GeometryType type,
                    const QVector<Row>& rows, char** layerOptions);
    bool removeExisting(const QString& path, const char* driverName);

    QString bucketFileName(const BucketKey& key, const QString& extension) const;
    OGRSpatialReference* createSpatialReference() const;
    void notify(const QString& message) const;

    int m_epsg{0};
    bool m_overwrite{false};
    ProgressObserver* m_observer{nullptr};
    QVector<Tier> m_attempted;
    QString m_lastError;
};

#endif // GDALWRITER_H
