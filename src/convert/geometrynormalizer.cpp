#include "convert/geometrynormalizer.h"
#include "gdal/geosbridge.h"

#include <QDebug>

namespace GeometryNormalizer {

Geometry extractLineal(const Geometry& geometry)
{
    if (geometry.isEmpty()) return Geometry();
    if (geometry.isLineal()) return geometry;
    if (geometry.kind() != GeometryKind::GeometryCollection) return Geometry();

    QVector<VertexList> lines;
    for (const GeometryPart& part : geometry.parts()) {
        if (part.kind == GeometryKind::LineString && part.coords().size() >= 2) {
            lines.append(part.coords());
        }
    }
    if (lines.isEmpty()) return Geometry();

    const Geometry flat = Geometry::multiLineString(lines, geometry.hasZ());
    Geometry unioned;
    Geometry merged;
    if (GeosBridge::unaryUnion(QVector<Geometry>{flat}, unioned) &&
        GeosBridge::lineMerge(unioned, merged) && !merged.isEmpty()) {
        return merged;
    }
    qDebug() << "GeometryNormalizer: line merge failed, keeping parts -" << GeosBridge::lastError();
    return flat;
}

bool normalize(GeometryType type, const Geometry& geometry, Geometry& normalized)
{
    normalized = Geometry();
    if (geometry.isEmpty()) return false;

    switch (type) {
        case GeometryType::Line:
            normalized = extractLineal(geometry);
            break;
        case GeometryType::Polygon:
            if (geometry.isPolygonal()) normalized = geometry;
            break;
        case GeometryType::Point:
            if (geometry.isPuntal()) normalized = geometry;
            break;
    }
    return !normalized.isEmpty();
}

QVector<Row> normalizeRows(const QVector<Row>& rows, int* dropped)
{
    QVector<Row> out;
    out.reserve(rows.size());
    int lost = 0;
    for (const Row& row : rows) {
        Row fixed = row;
        if (normalize(row.type, row.geometry, fixed.geometry)) {
            out.append(fixed);
        } else {
            ++lost;
        }
    }
    if (dropped) *dropped = lost;
    return out;
}

} // namespace GeometryNormalizer
