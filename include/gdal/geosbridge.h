#ifndef GEOSBRIDGE_H
#define GEOSBRIDGE_H

#include <QString>
#include <QVector>

#include "geometry/geometry.h"

/**
 * @brief GeosBridge - GEOS operations used by the merge engine
 *
 * Wraps the reentrant GEOS C API behind plain Geometry values. Every
 * operation returns false when GEOS reports an error (the message is kept in
 * lastError()); a successful operation may still produce an empty geometry.
 */
namespace GeosBridge {

/**
 * @brief Initialize GEOS context (called lazily by every operation)
 */
void initialize();

/**
 * @brief Cleanup GEOS context (call at shutdown)
 */
void cleanup();

/**
 * @brief Get last error message
 */
QString lastError();

/**
 * @brief Union of all parts of all inputs (lines are noded, polygons dissolved)
 */
bool unaryUnion(const QVector<Geometry>& inputs, Geometry& result);

/**
 * @brief Sew lineal parts that share endpoints into the longest possible lines
 */
bool lineMerge(const Geometry& input, Geometry& result);

/**
 * @brief Snap the vertices of a geometry to itself within tolerance
 */
bool snapToSelf(const Geometry& input, double tolerance, Geometry& result);

/**
 * @brief Buffer with mitre joins and round caps
 */
bool bufferMitre(const Geometry& input, double distance, Geometry& result);

/**
 * @brief Topological boundary (polygon -> rings as lines)
 */
bool boundary(const Geometry& input, Geometry& result);

/**
 * @brief Repair an invalid geometry (self intersections, bow ties, ...)
 */
bool makeValid(const Geometry& input, Geometry& result);

} // namespace GeosBridge

#endif // GEOSBRIDGE_H
