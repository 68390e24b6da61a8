#include "convert/quantizer.h"

#include <cmath>

namespace Quantizer {

double quantize(double value, double tol)
{
    if (!(tol > 0.0)) return value;
    const double snapped = std::round(value / tol) * tol;
    // Keep -0.0 and 0.0 on the same key
    return snapped == 0.0 ? 0.0 : snapped;
}

QuantizedNode node(const Vertex& v, double tol)
{
    return QuantizedNode{quantize(v.x, tol), quantize(v.y, tol)};
}

} // namespace Quantizer

NodeIndex::NodeIndex(double tol) : m_tol(tol) {}

NodeIndex::Cell NodeIndex::cellOf(const Vertex& v) const
{
    return Cell(std::llround(v.x / m_tol), std::llround(v.y / m_tol));
}

bool NodeIndex::close(const Vertex& a, const Vertex& b) const
{
    const double half = 0.5 * m_tol;
    return std::fabs(a.x - b.x) < half && std::fabs(a.y - b.y) < half;
}

int NodeIndex::add(const Vertex& v)
{
    const int id = m_points.size();
    m_points.append(v);
    m_parent.append(id);
    if (!(m_tol > 0.0)) return id;

    // Points within tol/2 of each other are at most one cell apart
    const Cell cell = cellOf(v);
    for (qint64 dx = -1; dx <= 1; ++dx) {
        for (qint64 dy = -1; dy <= 1; ++dy) {
            const auto it = m_cells.constFind(Cell(cell.first + dx, cell.second + dy));
            if (it == m_cells.constEnd()) continue;
            for (int other : it.value()) {
                if (close(v, m_points[other])) unite(other, id);
            }
        }
    }
    m_cells[cell].append(id);
    return id;
}

QuantizedNode NodeIndex::key(int id) const
{
    return Quantizer::node(m_points[find(id)], m_tol);
}

int NodeIndex::find(int id) const
{
    int root = id;
    while (m_parent[root] != root) root = m_parent[root];
    while (m_parent[id] != root) {
        const int next = m_parent[id];
        m_parent[id] = root;
        id = next;
    }
    return root;
}

void NodeIndex::unite(int a, int b)
{
    const int ra = find(a);
    const int rb = find(b);
    if (ra == rb) return;
    // The earliest point names the cluster
    if (ra < rb) {
        m_parent[rb] = ra;
    } else {
        m_parent[ra] = rb;
    }
}
