#include "convert/linemerger.h"
#include "convert/progressobserver.h"
#include "convert/quantizer.h"
#include "gdal/geosbridge.h"

#include <QDebug>
#include <QHash>

#include <algorithm>

namespace {

Geometry segmentsToLines(const QVector<Segment>& segments)
{
    QVector<VertexList> lines;
    lines.reserve(segments.size());
    for (const Segment& s : segments) {
        if (s.isValid()) lines.append(s.coords);
    }
    return Geometry::multiLineString(lines);
}

bool usable(const Geometry& g)
{
    return !g.isEmpty();
}

bool mergePass1(const Geometry& lines, Geometry& result)
{
    Geometry unioned;
    if (!GeosBridge::unaryUnion(QVector<Geometry>{lines}, unioned)) return false;
    return GeosBridge::lineMerge(unioned, result) && usable(result);
}

bool mergePass2(const Geometry& lines, double tol, Geometry& result)
{
    Geometry unioned;
    Geometry snapped;
    if (!GeosBridge::unaryUnion(QVector<Geometry>{lines}, unioned)) return false;
    if (!GeosBridge::snapToSelf(unioned, tol, snapped)) return false;
    return GeosBridge::lineMerge(snapped, result) && usable(result);
}

bool mergePass3(const Geometry& lines, double tol, Geometry& result)
{
    Geometry unioned;
    Geometry buffered;
    Geometry outline;
    Geometry noded;
    if (!GeosBridge::unaryUnion(QVector<Geometry>{lines}, unioned)) return false;
    if (!GeosBridge::bufferMitre(unioned, tol * 0.5, buffered)) return false;
    if (!GeosBridge::boundary(buffered, outline)) return false;
    if (!GeosBridge::unaryUnion(QVector<Geometry>{outline}, noded)) return false;
    return GeosBridge::lineMerge(noded, result) && usable(result);
}

/**
 * @brief MergeGraph - Scratch state of one graph merge call
 *
 * Nodes are clustered end points (see NodeIndex); degree is the number of
 * edge ends at a node, counted once when the graph is built.
 */
class MergeGraph {
public:
    MergeGraph(const QVector<Segment>& segments, double tol) : m_tol(tol)
    {
        NodeIndex nodes(tol);
        QVector<const Segment*> valid;
        for (const Segment& s : segments) {
            if (!s.isValid()) continue;
            valid.append(&s);
            nodes.add(s.start());
            nodes.add(s.end());
        }

        for (int i = 0; i < valid.size(); ++i) {
            Edge e;
            e.a = nodes.key(2 * i);
            e.b = nodes.key(2 * i + 1);
            e.coords = &valid[i]->coords;
            const int index = m_edges.size();
            m_edges.append(e);
            attach(e.a, index);
            attach(e.b, index);
        }
        m_used.fill(false, m_edges.size());
    }

    bool isEmpty() const { return m_edges.isEmpty(); }

    QVector<VertexList> chains()
    {
        QVector<VertexList> out;

        // Open chains from branching and terminal nodes
        for (const QuantizedNode& node : m_nodeOrder) {
            if (m_degree.value(node) == 2) continue;
            while (firstUnused(node) >= 0) {
                const VertexList path = walkFrom(node);
                if (path.size() >= 2) out.append(path);
            }
        }

        // Whatever is left runs through degree-2 nodes only
        for (int i = 0; i < m_edges.size(); ++i) {
            if (m_used[i]) continue;
            const VertexList ring = walkCycle(i);
            if (ring.size() >= 2) out.append(ring);
        }
        return out;
    }

private:
    struct Edge {
        QuantizedNode a;
        QuantizedNode b;
        const VertexList* coords{nullptr};
    };

    void attach(const QuantizedNode& node, int edge)
    {
        auto it = m_adjacency.find(node);
        if (it == m_adjacency.end()) {
            m_nodeOrder.append(node);
            it = m_adjacency.insert(node, QVector<int>());
        }
        it.value().append(edge);
        m_degree[node] += 1;
    }

    int firstUnused(const QuantizedNode& node) const
    {
        const auto it = m_adjacency.constFind(node);
        if (it == m_adjacency.constEnd()) return -1;
        for (int edge : it.value()) {
            if (!m_used[edge]) return edge;
        }
        return -1;
    }

    // Takes edge, oriented away from `from`; returns the node at its far end
    QuantizedNode consume(int edge, const QuantizedNode& from, VertexList& path)
    {
        m_used[edge] = true;
        const Edge& e = m_edges[edge];
        VertexList seg = *e.coords;
        QuantizedNode other = e.b;
        if (!(e.a == from)) {
            std::reverse(seg.begin(), seg.end());
            other = e.a;
        }
        append(path, seg);
        return other;
    }

    // Joins seg to path, dropping its first point when it repeats the path end
    void append(VertexList& path, const VertexList& seg) const
    {
        if (path.isEmpty()) {
            path = seg;
            return;
        }
        const Vertex& last = path.last();
        const Vertex& first = seg.first();
        const bool same = last.sameXY(first) ||
                          (m_tol > 0.0 && (Quantizer::node(last, m_tol) == Quantizer::node(first, m_tol) ||
                                           (qAbs(last.x - first.x) < 0.5 * m_tol &&
                                            qAbs(last.y - first.y) < 0.5 * m_tol)));
        for (int i = same ? 1 : 0; i < seg.size(); ++i) path.append(seg[i]);
    }

    VertexList walkFrom(const QuantizedNode& start)
    {
        VertexList path;
        QuantizedNode cur = start;
        for (;;) {
            const int edge = firstUnused(cur);
            if (edge < 0) break;
            const QuantizedNode other = consume(edge, cur, path);
            if (m_degree.value(other) != 2) break;
            cur = other;
        }
        return path;
    }

    VertexList walkCycle(int firstEdge)
    {
        VertexList path;
        const QuantizedNode start = m_edges[firstEdge].a;
        QuantizedNode cur = consume(firstEdge, start, path);
        for (;;) {
            const int edge = firstUnused(cur);
            if (edge < 0) break;
            cur = consume(edge, cur, path);
            if (m_degree.value(cur) != 2) break;
        }
        // Close exactly when the walk came back to its start node
        if (cur == start && path.size() >= 3) path.last() = path.first();
        return path;
    }

    double m_tol;
    QVector<Edge> m_edges;
    QVector<bool> m_used;
    QVector<QuantizedNode> m_nodeOrder;
    QHash<QuantizedNode, QVector<int>> m_adjacency;
    QHash<QuantizedNode, int> m_degree;
};

Geometry polygonalParts(const Geometry& g)
{
    if (g.isPolygonal()) return g;
    QVector<GeometryPart> parts;
    for (const GeometryPart& part : g.parts()) {
        if (part.kind == GeometryKind::Polygon) parts.append(part);
    }
    if (parts.isEmpty()) return Geometry();
    if (parts.size() == 1) return Geometry::polygon(parts.first().rings, g.hasZ());
    return Geometry::collection(GeometryKind::MultiPolygon, parts, g.hasZ());
}

} // namespace

namespace LineMerger {

QVector<Segment> gridSnap(const QVector<Segment>& segments, double tol)
{
    if (!(tol > 0.0) || segments.isEmpty()) return segments;

    QVector<Segment> out;
    out.reserve(segments.size());
    for (const Segment& s : segments) {
        if (s.coords.size() < 2) continue;

        VertexList snapped = s.coords;
        const QuantizedNode head = Quantizer::node(snapped.first(), tol);
        const QuantizedNode tail = Quantizer::node(snapped.last(), tol);
        snapped.first() = Vertex(head.x, head.y, snapped.first().z);
        snapped.last() = Vertex(tail.x, tail.y, snapped.last().z);

        Segment clean;
        for (const Vertex& v : snapped) {
            if (clean.coords.isEmpty() || !clean.coords.last().sameXY(v)) clean.coords.append(v);
        }
        if (clean.isValid() && lineLength(clean.coords) > 0.0) out.append(clean);
    }
    return out;
}

bool robustPass(RobustPass pass, const QVector<Segment>& segments, double tol, Geometry& result)
{
    result = Geometry();
    const Geometry lines = segmentsToLines(segments);
    if (lines.isEmpty()) return false;

    bool ok = false;
    switch (pass) {
        case RobustPass::Union: ok = mergePass1(lines, result); break;
        case RobustPass::Snap: ok = mergePass2(lines, tol, result); break;
        case RobustPass::Buffer: ok = mergePass3(lines, tol, result); break;
    }
    if (!ok) result = Geometry();
    return ok;
}

bool robustMerge(const QVector<Segment>& segments, double tol, Geometry& result, ProgressObserver* observer)
{
    result = Geometry();
    if (segments.isEmpty()) return false;

    const QVector<Segment> snapped = gridSnap(segments, tol);
    if (snapped.isEmpty()) return false;

    if (robustPass(RobustPass::Union, snapped, tol, result)) return true;
    qDebug() << "LineMerger: union merge failed -" << GeosBridge::lastError();

    if (robustPass(RobustPass::Snap, snapped, tol, result)) return true;
    notifyProgress(observer, QString("[merge] snap failed: %1").arg(GeosBridge::lastError()));

    if (robustPass(RobustPass::Buffer, snapped, tol, result)) return true;
    notifyProgress(observer, QString("[merge] buffer/boundary failed: %1").arg(GeosBridge::lastError()));

    result = Geometry();
    return false;
}

bool graphMerge(const QVector<Segment>& segments, double tol, Geometry& result)
{
    result = Geometry();
    MergeGraph graph(segments, tol);
    if (graph.isEmpty()) return false;

    const QVector<VertexList> chains = graph.chains();
    if (chains.isEmpty()) return false;

    if (chains.size() == 1) {
        result = Geometry::lineString(chains.first());
    } else {
        QVector<VertexList> nonZero;
        for (const VertexList& chain : chains) {
            if (lineLength(chain) > 0.0) nonZero.append(chain);
        }
        result = Geometry::multiLineString(nonZero);
    }
    return !result.isEmpty();
}

QVector<Row> explode(const QVector<Segment>& segments, const QString& layer, const QString& blockName)
{
    QVector<Row> rows;
    rows.reserve(segments.size());
    for (const Segment& s : segments) {
        if (!s.isValid()) continue;
        Row row;
        row.layer = layer;
        row.type = GeometryType::Line;
        row.geometry = Geometry::lineString(s.coords);
        row.blockName = blockName;
        rows.append(row);
    }
    return rows;
}

bool polygonUnion(const QVector<Geometry>& polygons, Geometry& result)
{
    result = Geometry();
    if (polygons.isEmpty()) return false;

    Geometry unioned;
    if (!GeosBridge::unaryUnion(polygons, unioned)) {
        qDebug() << "LineMerger: polygon union failed, repairing rings -" << GeosBridge::lastError();
        QVector<Geometry> repaired;
        for (const Geometry& polygon : polygons) {
            Geometry fixed;
            if (GeosBridge::makeValid(polygon, fixed) && !fixed.isEmpty()) repaired.append(fixed);
        }
        if (repaired.isEmpty() || !GeosBridge::unaryUnion(repaired, unioned)) return false;
    }

    result = polygonalParts(unioned);
    return !result.isEmpty();
}

} // namespace LineMerger
