#ifndef LINEMERGER_H
#define LINEMERGER_H

#include <QString>
#include <QVector>

#include "geometry/geometry.h"

class ProgressObserver;

/**
 * @brief LineMerger - Rebuilds continuous polylines from block segments
 *
 * All functions are self-contained: adjacency maps and snapped copies live
 * only for the duration of one call. A false return means the tier produced
 * nothing usable and the caller should move on to the next tier.
 */
namespace LineMerger {

/**
 * @brief Snap segment end points to the tolerance grid
 *
 * Interior points are kept as they are. Consecutive duplicates are removed
 * and segments left with fewer than two distinct points are dropped.
 * tol <= 0 returns the input unchanged.
 */
QVector<Segment> gridSnap(const QVector<Segment>& segments, double tol);

enum class RobustPass {
    Union,      // union, then line merge
    Snap,       // union snapped to itself at tol, then line merge
    Buffer      // union buffered by tol/2 (mitre joins), boundary, union, line merge
};

/**
 * @brief Run one pass of the robust merge on already snapped segments
 * @return true if the pass produced a non-empty geometry
 */
bool robustPass(RobustPass pass, const QVector<Segment>& segments, double tol, Geometry& result);

/**
 * @brief Union based merge with snap and buffer fallbacks
 *
 * Pass 1: union, then line merge.
 * Pass 2: union snapped to itself at tol, then line merge.
 * Pass 3: union buffered by tol/2 (mitre joins), boundary, union, line merge.
 * Each pass starts from the snapped segments; a failed pass does not affect
 * the next one.
 */
bool robustMerge(const QVector<Segment>& segments, double tol, Geometry& result,
                 ProgressObserver* observer = nullptr);

/**
 * @brief Edge-chaining merge over quantized end points
 *
 * Open chains are walked from every node whose degree is not 2, taking the
 * first unconsumed edge in collection order. Remaining edges form pure
 * cycles and are walked until they return to their start. One chain yields
 * a LineString, several a MultiLineString.
 */
bool graphMerge(const QVector<Segment>& segments, double tol, Geometry& result);

/**
 * @brief One LINE row per segment, tagged with the block name
 */
QVector<Row> explode(const QVector<Segment>& segments, const QString& layer, const QString& blockName);

/**
 * @brief Union of polygon rings collected from one block instance
 *
 * Retried once on repaired polygons when the first union fails.
 * @return true if the union is a non-empty polygonal geometry
 */
bool polygonUnion(const QVector<Geometry>& polygons, Geometry& result);

} // namespace LineMerger

#endif // LINEMERGER_H
