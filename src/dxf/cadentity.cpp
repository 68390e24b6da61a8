#include "dxf/cadentity.h"

#include <QtMath>

QString entityCategoryName(EntityCategory category)
{
    switch (category) {
        case EntityCategory::Point: return QStringLiteral("POINT");
        case EntityCategory::Line: return QStringLiteral("LINE");
        case EntityCategory::Polyline: return QStringLiteral("POLYLINE");
        case EntityCategory::Circle: return QStringLiteral("CIRCLE");
        case EntityCategory::Arc: return QStringLiteral("ARC");
        case EntityCategory::Ellipse: return QStringLiteral("ELLIPSE");
        case EntityCategory::Spline: return QStringLiteral("SPLINE");
        case EntityCategory::Hatch: return QStringLiteral("HATCH");
        case EntityCategory::Face: return QStringLiteral("FACE");
        case EntityCategory::Insert: return QStringLiteral("INSERT");
    }
    return QString();
}

InsertTransform InsertTransform::fromInsert(const Vertex& basePoint, const Vertex& insertPoint,
                                            double xScale, double yScale, double rotation)
{
    const double c = qCos(rotation);
    const double s = qSin(rotation);

    InsertTransform t;
    t.m11 = xScale * c;
    t.m12 = xScale * s;
    t.m21 = -yScale * s;
    t.m22 = yScale * c;
    // Translation absorbs the block base point
    t.dx = insertPoint.x - (basePoint.x * t.m11 + basePoint.y * t.m21);
    t.dy = insertPoint.y - (basePoint.x * t.m12 + basePoint.y * t.m22);
    t.dz = insertPoint.z - basePoint.z;
    return t;
}

Vertex InsertTransform::map(const Vertex& v) const
{
    return Vertex(m11 * v.x + m21 * v.y + dx,
                  m12 * v.x + m22 * v.y + dy,
                  v.z + dz);
}

InsertTransform InsertTransform::then(const InsertTransform& outer) const
{
    InsertTransform r;
    r.m11 = m11 * outer.m11 + m12 * outer.m21;
    r.m12 = m11 * outer.m12 + m12 * outer.m22;
    r.m21 = m21 * outer.m11 + m22 * outer.m21;
    r.m22 = m21 * outer.m12 + m22 * outer.m22;
    r.dx = dx * outer.m11 + dy * outer.m21 + outer.dx;
    r.dy = dx * outer.m12 + dy * outer.m22 + outer.dy;
    r.dz = dz + outer.dz;
    return r;
}

bool InsertTransform::isIdentity() const
{
    return m11 == 1.0 && m12 == 0.0 && m21 == 0.0 && m22 == 1.0 &&
           dx == 0.0 && dy == 0.0 && dz == 0.0;
}

double InsertTransform::maxScale() const
{
    const double sx = qSqrt(m11 * m11 + m12 * m12);
    const double sy = qSqrt(m21 * m21 + m22 * m22);
    return qMax(sx, sy);
}

namespace {

Vertex cross(const Vertex& a, const Vertex& b)
{
    return Vertex(a.y * b.z - a.z * b.y,
                  a.z * b.x - a.x * b.z,
                  a.x * b.y - a.y * b.x);
}

double norm(const Vertex& v)
{
    return qSqrt(v.x * v.x + v.y * v.y + v.z * v.z);
}

Vertex scaled(const Vertex& v, double f)
{
    return Vertex(v.x * f, v.y * f, v.z * f);
}

} // namespace

ObjectCoordinateSystem ObjectCoordinateSystem::fromExtrusion(const Vertex& extrusion)
{
    ObjectCoordinateSystem ocs;
    const double len = norm(extrusion);
    if (!(len > 0.0)) return ocs;

    ocs.normal = scaled(extrusion, 1.0 / len);
    // Normals close to the world Z axis take their X axis from world Y
    const double threshold = 1.0 / 64.0;
    const Vertex pivot = (qAbs(ocs.normal.x) < threshold && qAbs(ocs.normal.y) < threshold)
                             ? Vertex(0.0, 1.0, 0.0)
                             : Vertex(0.0, 0.0, 1.0);
    const Vertex ax = cross(pivot, ocs.normal);
    ocs.xAxis = scaled(ax, 1.0 / norm(ax));
    ocs.yAxis = cross(ocs.normal, ocs.xAxis);
    return ocs;
}

bool ObjectCoordinateSystem::isWorld() const
{
    return normal.x == 0.0 && normal.y == 0.0 && normal.z == 1.0;
}

Vertex ObjectCoordinateSystem::toWorld(const Vertex& v) const
{
    return Vertex(v.x * xAxis.x + v.y * yAxis.x + v.z * normal.x,
                  v.x * xAxis.y + v.y * yAxis.y + v.z * normal.y,
                  v.x * xAxis.z + v.y * yAxis.z + v.z * normal.z);
}

InsertTransform ObjectCoordinateSystem::planar() const
{
    InsertTransform t;
    t.m11 = xAxis.x;
    t.m12 = xAxis.y;
    t.m21 = yAxis.x;
    t.m22 = yAxis.y;
    return t;
}
