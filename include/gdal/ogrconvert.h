#ifndef OGRCONVERT_H
#define OGRCONVERT_H

#include <memory>

#include <ogr_geometry.h>
#include <QVector>

#include "geometry/geometry.h"

/**
 * @brief OgrConvert - Geometry <-> OGRGeometry at the GDAL boundary
 */
namespace OgrConvert {

// nullptr for an empty geometry
std::unique_ptr<OGRGeometry> toOgr(const Geometry& geometry);

// Empty geometry for unsupported or empty input
Geometry fromOgr(const OGRGeometry* geometry);

// Layer geometry type of a bucket
OGRwkbGeometryType layerType(GeometryType type, bool hasZ);

} // namespace OgrConvert

#endif // OGRCONVERT_H
