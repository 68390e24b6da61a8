#include "gdal/ogrconvert.h"

#include <ogr_core.h>

namespace {

void fillCurve(OGRSimpleCurve& curve, const VertexList& coords, bool hasZ)
{
    for (const Vertex& v : coords) {
        if (hasZ) curve.addPoint(v.x, v.y, v.z);
        else curve.addPoint(v.x, v.y);
    }
}

OGRGeometry* createPart(const GeometryPart& part, bool hasZ)
{
    switch (part.kind) {
        case GeometryKind::Point: {
            const Vertex& v = part.coords().first();
            return hasZ ? new OGRPoint(v.x, v.y, v.z) : new OGRPoint(v.x, v.y);
        }
        case GeometryKind::LineString: {
            auto* line = new OGRLineString();
            fillCurve(*line, part.coords(), hasZ);
            return line;
        }
        case GeometryKind::Polygon: {
            auto* polygon = new OGRPolygon();
            for (const VertexList& ring : part.rings) {
                auto* ogrRing = new OGRLinearRing();
                fillCurve(*ogrRing, ring, hasZ);
                ogrRing->closeRings();
                polygon->addRingDirectly(ogrRing);
            }
            return polygon;
        }
        default:
            return nullptr;
    }
}

OGRGeometryCollection* createCollection(GeometryKind kind)
{
    switch (kind) {
        case GeometryKind::MultiPoint: return new OGRMultiPoint();
        case GeometryKind::MultiLineString: return new OGRMultiLineString();
        case GeometryKind::MultiPolygon: return new OGRMultiPolygon();
        default: return new OGRGeometryCollection();
    }
}

VertexList readCurve(const OGRSimpleCurve* curve, bool hasZ)
{
    VertexList coords;
    if (!curve) return coords;
    coords.reserve(curve->getNumPoints());
    for (int i = 0; i < curve->getNumPoints(); ++i) {
        coords.append(Vertex(curve->getX(i), curve->getY(i), hasZ ? curve->getZ(i) : 0.0));
    }
    return coords;
}

// Appends the simple parts of geom; false on curve or unknown types
bool collectParts(const OGRGeometry* geom, bool hasZ, QVector<GeometryPart>& parts)
{
    if (!geom || geom->IsEmpty()) return true;

    switch (wkbFlatten(geom->getGeometryType())) {
        case wkbPoint: {
            const auto* pt = static_cast<const OGRPoint*>(geom);
            GeometryPart part;
            part.kind = GeometryKind::Point;
            part.rings.append(VertexList{Vertex(pt->getX(), pt->getY(), hasZ ? pt->getZ() : 0.0)});
            parts.append(part);
            return true;
        }
        case wkbLineString: {
            GeometryPart part;
            part.kind = GeometryKind::LineString;
            part.rings.append(readCurve(static_cast<const OGRLineString*>(geom), hasZ));
            parts.append(part);
            return true;
        }
        case wkbPolygon: {
            const auto* polygon = static_cast<const OGRPolygon*>(geom);
            GeometryPart part;
            part.kind = GeometryKind::Polygon;
            part.rings.append(readCurve(polygon->getExteriorRing(), hasZ));
            for (int r = 0; r < polygon->getNumInteriorRings(); ++r) {
                part.rings.append(readCurve(polygon->getInteriorRing(r), hasZ));
            }
            parts.append(part);
            return true;
        }
        case wkbMultiPoint:
        case wkbMultiLineString:
        case wkbMultiPolygon:
        case wkbGeometryCollection: {
            const auto* gc = static_cast<const OGRGeometryCollection*>(geom);
            for (int i = 0; i < gc->getNumGeometries(); ++i) {
                if (!collectParts(gc->getGeometryRef(i), hasZ, parts)) return false;
            }
            return true;
        }
        default:
            return false;
    }
}

GeometryKind kindOf(OGRwkbGeometryType type)
{
    switch (type) {
        case wkbPoint: return GeometryKind::Point;
        case wkbLineString: return GeometryKind::LineString;
        case wkbPolygon: return GeometryKind::Polygon;
        case wkbMultiPoint: return GeometryKind::MultiPoint;
        case wkbMultiLineString: return GeometryKind::MultiLineString;
        case wkbMultiPolygon: return GeometryKind::MultiPolygon;
        default: return GeometryKind::GeometryCollection;
    }
}

} // namespace

namespace OgrConvert {

std::unique_ptr<OGRGeometry> toOgr(const Geometry& geometry)
{
    if (geometry.isEmpty()) return nullptr;

    const bool hasZ = geometry.hasZ();
    switch (geometry.kind()) {
        case GeometryKind::Point:
        case GeometryKind::LineString:
        case GeometryKind::Polygon:
            return std::unique_ptr<OGRGeometry>(createPart(geometry.parts().first(), hasZ));
        default:
            break;
    }

    std::unique_ptr<OGRGeometryCollection> collection(createCollection(geometry.kind()));
    for (const GeometryPart& part : geometry.parts()) {
        OGRGeometry* member = createPart(part, hasZ);
        if (member && collection->addGeometryDirectly(member) != OGRERR_NONE) {
            delete member;
        }
    }
    return std::unique_ptr<OGRGeometry>(collection.release());
}

Geometry fromOgr(const OGRGeometry* geometry)
{
    if (!geometry || geometry->IsEmpty()) return Geometry();

    const bool hasZ = geometry->Is3D();
    QVector<GeometryPart> parts;
    if (!collectParts(geometry, hasZ, parts) || parts.isEmpty()) return Geometry();

    const GeometryKind kind = kindOf(wkbFlatten(geometry->getGeometryType()));
    const GeometryPart& first = parts.first();
    switch (kind) {
        case GeometryKind::Point:
            return Geometry::point(first.coords().first(), hasZ);
        case GeometryKind::LineString:
            return Geometry::lineString(first.coords(), hasZ);
        case GeometryKind::Polygon:
            return Geometry::polygon(first.rings, hasZ);
        default:
            return Geometry::collection(kind, parts, hasZ);
    }
}

OGRwkbGeometryType layerType(GeometryType type, bool hasZ)
{
    switch (type) {
        case GeometryType::Point: return hasZ ? wkbPoint25D : wkbPoint;
        case GeometryType::Line: return hasZ ? wkbMultiLineString25D : wkbMultiLineString;
        case GeometryType::Polygon: return hasZ ? wkbMultiPolygon25D : wkbMultiPolygon;
    }
    return wkbUnknown;
}

} // namespace OgrConvert
