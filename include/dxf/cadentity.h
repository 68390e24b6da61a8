#ifndef CADENTITY_H
#define CADENTITY_H

#include <QString>
#include <QVector>

#include "geometry/geometry.h"

// ============================================================================
// CAD entity model
// Populated by DxfReader (libdxfrw) or built directly in memory. Angles are in
// radians, as libdxfrw stores them.
// ============================================================================

/**
 * @brief EntityCategory - Closed set of entity kinds the converter handles
 *
 * New kinds are added here and get their own handler in EntityFlattener.
 */
enum class EntityCategory {
    Point,
    Line,
    Polyline,   // LWPOLYLINE and POLYLINE
    Circle,
    Arc,
    Ellipse,
    Spline,
    Hatch,
    Face,       // 3DFACE, SOLID, TRACE
    Insert
};

QString entityCategoryName(EntityCategory category);

/**
 * @brief InsertTransform - 2D affine placement of a block instance
 *
 * Maps block coordinates to world coordinates:
 *   x' = m11*x + m21*y + dx
 *   y' = m12*x + m22*y + dy
 *   z' = z + dz
 */
struct InsertTransform {
    double m11{1.0};
    double m12{0.0};
    double m21{0.0};
    double m22{1.0};
    double dx{0.0};
    double dy{0.0};
    double dz{0.0};

    // Block base point removed, then scale, rotation (radians) and translation
    static InsertTransform fromInsert(const Vertex& basePoint, const Vertex& insertPoint,
                                      double xScale, double yScale, double rotation);

    Vertex map(const Vertex& v) const;

    // Apply this transform first, then outer
    InsertTransform then(const InsertTransform& outer) const;

    bool isIdentity() const;

    // Largest axis stretch, used to keep flattening deviation in world units
    double maxScale() const;
};

/**
 * @brief ObjectCoordinateSystem - Entity frame derived from its extrusion direction
 *
 * Built with the DXF arbitrary axis algorithm. ARC, CIRCLE, LWPOLYLINE,
 * 2D POLYLINE, HATCH, SOLID, TRACE and INSERT store their coordinates in this
 * frame; all other entities are in world coordinates.
 */
struct ObjectCoordinateSystem {
    Vertex xAxis{1.0, 0.0, 0.0};
    Vertex yAxis{0.0, 1.0, 0.0};
    Vertex normal{0.0, 0.0, 1.0};

    // A zero or missing extrusion gives the world frame
    static ObjectCoordinateSystem fromExtrusion(const Vertex& extrusion);

    bool isWorld() const;
    Vertex toWorld(const Vertex& v) const;

    // In-plane part as a placement; elevation is carried unchanged
    InsertTransform planar() const;
};

struct CadHatchEdge {
    enum Type { LineEdge = 1, ArcEdge = 2, EllipseEdge = 3, SplineEdge = 4 };

    Type type{LineEdge};
    // Line
    Vertex start;
    Vertex end;
    // Arc and ellipse
    Vertex center;
    double radius{0.0};
    double startAngle{0.0};
    double endAngle{0.0};
    bool ccw{true};
    Vertex majorAxis;
    double ratio{1.0};
    // Spline
    int degree{3};
    VertexList controlPoints;
    QVector<double> knots;
    QVector<double> weights;
};

struct CadHatchLoop {
    bool isPolyline{false};
    // Polyline loop
    VertexList vertices;
    QVector<double> bulges;
    bool closed{true};
    // Edge loop
    QVector<CadHatchEdge> edges;
};

/**
 * @brief CadEntity - Tagged entity record
 *
 * Which parameter fields are meaningful depends on category; the flattener
 * dispatches on category and only reads the matching fields.
 */
struct CadEntity {
    EntityCategory category{EntityCategory::Point};
    QString layer{QStringLiteral("0")};
    // Extrusion direction (group codes 210/220/230)
    Vertex extrusion{0.0, 0.0, 1.0};

    // Point (1), Line (2), Polyline, Face (3 or 4 corners), Spline control points
    VertexList vertices;
    // Polyline: one bulge per vertex (may be empty = all straight)
    QVector<double> bulges;
    // Polyline, Spline
    bool closed{false};

    // Circle, Arc, Ellipse
    Vertex center;
    double radius{0.0};
    // Arc: angles; Ellipse: parameters
    double startAngle{0.0};
    double endAngle{0.0};
    // Ellipse major axis endpoint relative to center
    Vertex majorAxis;
    double ratio{1.0};

    // Spline
    int degree{3};
    QVector<double> knots;
    QVector<double> weights;
    VertexList fitPoints;

    // Hatch
    QVector<CadHatchLoop> loops;

    // Face: SOLID and TRACE store corners 1,2,4,3
    bool zigZagCorners{false};

    // Insert
    QString blockName;
    Vertex insertPoint;
    double xScale{1.0};
    double yScale{1.0};
    double rotation{0.0};

    // World placement for entities resolved out of a block; identity otherwise
    InsertTransform placement;

    // Layer used for filtering and output; unnamed entities are on layer "0"
    QString layerName() const { return layer.isEmpty() ? QStringLiteral("0") : layer; }
};

#endif // CADENTITY_H
