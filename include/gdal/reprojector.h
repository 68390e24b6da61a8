#ifndef REPROJECTOR_H
#define REPROJECTOR_H

#include <QString>
#include <QVector>

#include "convert/bucketassembler.h"

class OGRCoordinateTransformation;
class ProgressObserver;

/**
 * @brief BoundingBox - WGS84 filter window (longitude/latitude degrees)
 */
struct BoundingBox {
    double minLon{0.0};
    double minLat{0.0};
    double maxLon{0.0};
    double maxLat{0.0};

    bool isValid() const { return minLon < maxLon && minLat < maxLat; }

    // "minLon,minLat,maxLon,maxLat"
    static bool parse(const QString& text, BoundingBox& box);
};

/**
 * @brief Reprojector - Post-processing of assembled buckets
 *
 * Applies the optional WGS84 bbox filter, then the optional reprojection to
 * the target EPSG. Rows keep their order; buckets left empty by the filter
 * are removed. Transformations use traditional GIS axis order (x = easting
 * or longitude).
 */
class Reprojector {
public:
    explicit Reprojector(int sourceEpsg);
    ~Reprojector();

    Reprojector(const Reprojector&) = delete;
    Reprojector& operator=(const Reprojector&) = delete;

    // 0 disables reprojection
    void setTargetEpsg(int epsg) { m_targetEpsg = epsg; }
    void setBoundingBox(const BoundingBox& box) { m_bbox = box; m_hasBBox = true; }

    int sourceEpsg() const { return m_sourceEpsg; }
    int targetEpsg() const { return m_targetEpsg; }
    bool reprojects() const { return m_targetEpsg > 0 && m_targetEpsg != m_sourceEpsg; }

    /**
     * @brief Filter and reproject buckets
     * @return false if a coordinate transformation could not be created
     */
    bool process(const QVector<Bucket>& input, QVector<Bucket>& output, ProgressObserver* observer = nullptr);

    QString lastError() const { return m_lastError; }

    /**
     * @brief Transform every coordinate of a geometry
     * @return false if any point failed to transform
     */
    static bool transform(OGRCoordinateTransformation* ct, const Geometry& input, Geometry& output);

private:
    OGRCoordinateTransformation* createTransform(int fromEpsg, int toEpsg);
    bool insideBBox(OGRCoordinateTransformation* toWgs84, const Geometry& geometry) const;

    int m_sourceEpsg;
    int m_targetEpsg{0};
    BoundingBox m_bbox;
    bool m_hasBBox{false};
    QString m_lastError;
};

#endif // REPROJECTOR_H
