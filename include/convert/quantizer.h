#ifndef QUANTIZER_H
#define QUANTIZER_H

#include <QHash>
#include <QHashFunctions>
#include <QPair>
#include <QVector>

#include "geometry/geometry.h"

/**
 * @brief QuantizedNode - Endpoint snapped to the tolerance grid
 *
 * Only ever used as a hash key for connectivity; never emitted as geometry.
 */
struct QuantizedNode {
    double x{0.0};
    double y{0.0};

    bool operator==(const QuantizedNode& other) const { return x == other.x && y == other.y; }
    bool operator!=(const QuantizedNode& other) const { return !(*this == other); }
};

inline size_t qHash(const QuantizedNode& node, size_t seed = 0) noexcept
{
    return qHashMulti(seed, node.x, node.y);
}

namespace Quantizer {

/**
 * @brief Round a coordinate to the nearest multiple of tol
 *
 * tol <= 0 means no snapping and returns the value unchanged.
 */
double quantize(double value, double tol);

QuantizedNode node(const Vertex& v, double tol);

} // namespace Quantizer

/**
 * @brief NodeIndex - Node keys for the end points of one merge call
 *
 * Grid rounding alone splits points that sit on either side of a cell
 * boundary. Here end points closer than tol/2 in both axes are joined into
 * one cluster (transitively), and every member of a cluster gets the grid
 * node of its first-added point. Keys are only meaningful once every end
 * point has been added.
 */
class NodeIndex {
public:
    explicit NodeIndex(double tol);

    // Returns the id used with key()
    int add(const Vertex& v);
    QuantizedNode key(int id) const;

    int size() const { return m_points.size(); }

private:
    using Cell = QPair<qint64, qint64>;

    Cell cellOf(const Vertex& v) const;
    bool close(const Vertex& a, const Vertex& b) const;
    int find(int id) const;
    void unite(int a, int b);

    double m_tol;
    VertexList m_points;
    mutable QVector<int> m_parent;
    QHash<Cell, QVector<int>> m_cells;
};

#endif // QUANTIZER_H
