#ifndef GEOMETRYNORMALIZER_H
#define GEOMETRYNORMALIZER_H

#include <QVector>

#include "geometry/geometry.h"

/**
 * @brief GeometryNormalizer - Makes geometries fit their bucket type
 *
 * Geometries that do not match are dropped, never coerced.
 */
namespace GeometryNormalizer {

/**
 * @brief Lineal content of a geometry
 *
 * Lines pass through. A mixed collection yields its line members, merged
 * where they touch. Anything without lines yields an empty geometry.
 */
Geometry extractLineal(const Geometry& geometry);

/**
 * @brief Normalize one geometry for a bucket of the given type
 * @return false if the geometry must be dropped
 */
bool normalize(GeometryType type, const Geometry& geometry, Geometry& normalized);

/**
 * @brief Normalize every row; rows that fail are removed
 * @param dropped Optional: number of rows removed
 */
QVector<Row> normalizeRows(const QVector<Row>& rows, int* dropped = nullptr);

} // namespace GeometryNormalizer

#endif // GEOMETRYNORMALIZER_H
