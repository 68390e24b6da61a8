#ifndef ENTITYFLATTENER_H
#define ENTITYFLATTENER_H

#include <QString>
#include <QVector>

#include <stdexcept>

#include "dxf/cadentity.h"
#include "geometry/geometry.h"

/**
 * @brief EntityExtractionError - One entity could not be turned into geometry
 *
 * Caught per entity by the conversion loop; the entity is skipped.
 */
class EntityExtractionError : public std::runtime_error {
public:
    explicit EntityExtractionError(const QString& message)
        : std::runtime_error(message.toStdString()) {}
};

/**
 * @brief EntityFlattener - Turns CAD entities into point sequences and rows
 *
 * Curved entities are approximated with a maximum chord deviation equal to
 * the tolerance. When that fails (bad data, tolerance not smaller than the
 * radius) LINE, POLYLINE, CIRCLE and ARC fall back to fixed samplers;
 * ELLIPSE and SPLINE have no fallback and raise EntityExtractionError.
 *
 * Points in an entity coordinate system (non-default extrusion) are mapped
 * to world coordinates first. Entities resolved out of a block then apply
 * their placement; the tolerance stays in world units.
 */
class EntityFlattener {
public:
    EntityFlattener(double tolerance, bool includeElevation);

    double tolerance() const { return m_tolerance; }
    bool includeElevation() const { return m_includeElevation; }

    /**
     * @brief Typed rows for one entity (any category except Insert)
     * @throws EntityExtractionError if the entity yields no usable geometry
     */
    QVector<Row> rows(const CadEntity& entity) const;

    /**
     * @brief Flattened points of a line or curve entity, in world coordinates
     * @throws EntityExtractionError if both primary and fallback paths fail
     */
    VertexList curvePoints(const CadEntity& entity) const;

    /**
     * @brief Closed boundary rings of a hatch or face entity (z = 0)
     *
     * Unclosed rings are closed by appending their first point; empty and
     * single-vertex rings are dropped.
     */
    QVector<VertexList> areaRings(const CadEntity& entity) const;

    static bool isCurve(EntityCategory category);
    static bool isArea(EntityCategory category);

private:
    // One handler per category
    QVector<Row> pointRows(const CadEntity& entity) const;
    QVector<Row> curveRows(const CadEntity& entity) const;
    QVector<Row> hatchRows(const CadEntity& entity) const;
    QVector<Row> faceRows(const CadEntity& entity) const;

    VertexList primaryPoints(const CadEntity& entity, double localTolerance) const;
    VertexList fallbackPoints(const CadEntity& entity) const;

    QVector<VertexList> hatchRings(const CadEntity& entity) const;
    VertexList faceRing(const CadEntity& entity) const;
    VertexList edgeLoopPoints(const CadHatchLoop& loop, double localTolerance) const;

    // Extrusion, placement and elevation handling
    VertexList toWorld(const CadEntity& entity, const VertexList& local, bool keepZ) const;
    double localTolerance(const CadEntity& entity) const;
    Row makeRow(const CadEntity& entity, const VertexList& coords, bool& ok) const;

    double m_tolerance;
    bool m_includeElevation;
};

#endif // ENTITYFLATTENER_H
