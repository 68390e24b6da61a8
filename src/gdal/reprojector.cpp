#include "gdal/reprojector.h"
#include "gdal/ogrconvert.h"
#include "convert/progressobserver.h"

#include <ogr_spatialref.h>
#include <cpl_error.h>

#include <QDebug>
#include <QStringList>

#include <vector>

namespace {
constexpr int kWgs84 = 4326;

Geometry rebuild(const Geometry& like, const QVector<GeometryPart>& parts)
{
    const GeometryPart& first = parts.first();
    switch (like.kind()) {
        case GeometryKind::Point: return Geometry::point(first.coords().first(), like.hasZ());
        case GeometryKind::LineString: return Geometry::lineString(first.coords(), like.hasZ());
        case GeometryKind::Polygon: return Geometry::polygon(first.rings, like.hasZ());
        default: return Geometry::collection(like.kind(), parts, like.hasZ());
    }
}
} // namespace

bool BoundingBox::parse(const QString& text, BoundingBox& box)
{
    const QStringList parts = text.split(',', Qt::SkipEmptyParts);
    if (parts.size() != 4) return false;

    double values[4];
    for (int i = 0; i < 4; ++i) {
        bool ok = false;
        values[i] = parts[i].trimmed().toDouble(&ok);
        if (!ok) return false;
    }
    box.minLon = values[0];
    box.minLat = values[1];
    box.maxLon = values[2];
    box.maxLat = values[3];
    return box.isValid();
}

Reprojector::Reprojector(int sourceEpsg)
    : m_sourceEpsg(sourceEpsg > 0 ? sourceEpsg : kWgs84)
{
}

Reprojector::~Reprojector() = default;

OGRCoordinateTransformation* Reprojector::createTransform(int fromEpsg, int toEpsg)
{
    OGRSpatialReference srcSRS, dstSRS;
    if (srcSRS.importFromEPSG(fromEpsg) != OGRERR_NONE) {
        m_lastError = QString("Unknown source EPSG:%1").arg(fromEpsg);
        return nullptr;
    }
    if (dstSRS.importFromEPSG(toEpsg) != OGRERR_NONE) {
        m_lastError = QString("Unknown target EPSG:%1").arg(toEpsg);
        return nullptr;
    }
    srcSRS.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    dstSRS.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    OGRCoordinateTransformation* ct = OGRCreateCoordinateTransformation(&srcSRS, &dstSRS);
    if (!ct) {
        m_lastError = QString("Failed to create transformation EPSG:%1 -> EPSG:%2: %3")
                          .arg(fromEpsg).arg(toEpsg).arg(CPLGetLastErrorMsg());
    }
    return ct;
}

bool Reprojector::transform(OGRCoordinateTransformation* ct, const Geometry& input, Geometry& output)
{
    if (!ct || input.isEmpty()) {
        output = input;
        return true;
    }

    QVector<GeometryPart> parts = input.parts();
    for (GeometryPart& part : parts) {
        for (VertexList& ring : part.rings) {
            const int n = ring.size();
            if (n == 0) continue;
            std::vector<double> x(n), y(n), z(n);
            for (int i = 0; i < n; ++i) {
                x[i] = ring[i].x;
                y[i] = ring[i].y;
                z[i] = ring[i].z;
            }
            if (!ct->Transform(n, x.data(), y.data(), input.hasZ() ? z.data() : nullptr)) {
                return false;
            }
            for (int i = 0; i < n; ++i) {
                ring[i] = Vertex(x[i], y[i], input.hasZ() ? z[i] : ring[i].z);
            }
        }
    }
    output = rebuild(input, parts);
    return true;
}

bool Reprojector::insideBBox(OGRCoordinateTransformation* toWgs84, const Geometry& geometry) const
{
    Geometry lonLat;
    if (!transform(toWgs84, geometry, lonLat)) return false;

    std::unique_ptr<OGRGeometry> ogr = OgrConvert::toOgr(lonLat);
    if (!ogr) return false;

    OGRLinearRing ring;
    ring.addPoint(m_bbox.minLon, m_bbox.minLat);
    ring.addPoint(m_bbox.maxLon, m_bbox.minLat);
    ring.addPoint(m_bbox.maxLon, m_bbox.maxLat);
    ring.addPoint(m_bbox.minLon, m_bbox.maxLat);
    ring.closeRings();
    OGRPolygon box;
    box.addRing(&ring);

    return ogr->Intersects(&box);
}

bool Reprojector::process(const QVector<Bucket>& input, QVector<Bucket>& output, ProgressObserver* observer)
{
    m_lastError.clear();
    output.clear();

    OGRCoordinateTransformation* toWgs84 = nullptr;
    OGRCoordinateTransformation* toTarget = nullptr;

    const bool filter = m_hasBBox && m_bbox.isValid();
    if (filter && m_sourceEpsg != kWgs84) {
        toWgs84 = createTransform(m_sourceEpsg, kWgs84);
        if (!toWgs84) return false;
    }
    if (reprojects()) {
        toTarget = createTransform(m_sourceEpsg, m_targetEpsg);
        if (!toTarget) {
            if (toWgs84) OGRCoordinateTransformation::DestroyCT(toWgs84);
            return false;
        }
    }

    if (filter) {
        notifyProgress(observer, QString("[convert] bbox filter: (%1, %2, %3, %4)")
                                     .arg(m_bbox.minLon).arg(m_bbox.minLat)
                                     .arg(m_bbox.maxLon).arg(m_bbox.maxLat));
    }
    if (toTarget) {
        notifyProgress(observer, QString("[convert] reproject to EPSG:%1").arg(m_targetEpsg));
    }

    int inside = 0;
    int failed = 0;
    for (const Bucket& bucket : input) {
        Bucket result;
        result.key = bucket.key;
        for (const Row& row : bucket.rows) {
            if (filter && !insideBBox(toWgs84, row.geometry)) continue;
            ++inside;

            Row projected = row;
            if (toTarget && !transform(toTarget, row.geometry, projected.geometry)) {
                ++failed;
                continue;
            }
            result.rows.append(projected);
        }
        if (result.rows.isEmpty()) continue;
        notifyProgress(observer, QString("[group] %1 / %2: %3")
                                     .arg(result.key.layer, geometryTypeName(result.key.type))
                                     .arg(result.rows.size()));
        output.append(result);
    }

    if (filter) {
        notifyProgress(observer, QString("[convert] inside bbox: %1").arg(inside));
    }
    if (failed > 0) {
        qWarning() << "Reprojector:" << failed << "rows failed to transform and were dropped";
    }
    notifyProgress(observer, QString("[convert] grouped buckets: %1").arg(output.size()));

    if (toWgs84) OGRCoordinateTransformation::DestroyCT(toWgs84);
    if (toTarget) OGRCoordinateTransformation::DestroyCT(toTarget);
    return true;
}
