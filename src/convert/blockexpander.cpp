#include "convert/blockexpander.h"
#include "convert/geometrynormalizer.h"
#include "convert/linemerger.h"
#include "convert/progressobserver.h"
#include "dxf/caddocument.h"
#include "gdal/geosbridge.h"

#include <QDebug>
#include <QElapsedTimer>

namespace {
constexpr int kSegmentPingInterval = 5000;
}

BlockExpander::BlockExpander(const CadDocument& document, const ConversionOptions& options,
                             ProgressObserver* observer)
    : m_document(document)
    , m_options(options)
    , m_observer(observer)
    , m_flattener(options.flattenTolerance, options.includeElevation)
    , m_segmentFlattener(options.flattenTolerance, false)
{
}

QVector<Row> BlockExpander::expand(const CadEntity& insert) const
{
    if (m_options.blockMode == BlockMode::KeepMerge) {
        return keepMerge(insert);
    }
    return explode(insert);
}

QVector<Row> BlockExpander::explode(const CadEntity& insert) const
{
    QVector<CadEntity> children;
    QString error;
    if (!m_document.resolveInsert(insert, children, &error)) {
        notifyProgress(m_observer, QString("[warn] INSERT explode failed: %1").arg(error));
        return QVector<Row>{insertionPoint(insert, false)};
    }

    QVector<Row> rows;
    bool expanded = false;
    for (const CadEntity& child : children) {
        if (!m_options.acceptsLayer(child.layerName())) continue;
        try {
            rows += m_flattener.rows(child);
            expanded = true;
        } catch (const EntityExtractionError& e) {
            notifyProgress(m_observer, QString("[warn] entity failed in block %1: %2")
                                           .arg(insert.blockName, QString::fromUtf8(e.what())));
        }
    }

    if (!expanded) {
        rows.append(insertionPoint(insert, false));
    }
    return rows;
}

QVector<Row> BlockExpander::keepMerge(const CadEntity& insert) const
{
    const QString& blockName = insert.blockName;
    QElapsedTimer timer;
    timer.start();

    QVector<CadEntity> children;
    QString error;
    if (!m_document.resolveInsert(insert, children, &error)) {
        notifyProgress(m_observer, QString("[warn] block expansion failed: %1").arg(error));
        return QVector<Row>{insertionPoint(insert, true)};
    }

    QVector<Segment> segments;
    QVector<Geometry> polygons;

    for (const CadEntity& child : children) {
        if (!m_options.acceptsLayer(child.layerName())) continue;

        try {
            if (EntityFlattener::isCurve(child.category)) {
                Segment segment;
                segment.coords = m_segmentFlattener.curvePoints(child);
                // Closed curves still go down the line path
                if (segment.coords.size() >= 3 && segment.coords.first().sameXY(segment.coords.last())) {
                    segment.coords.removeLast();
                }
                if (!segment.isValid()) continue;
                segments.append(segment);
                if (segments.size() % kSegmentPingInterval == 0) {
                    notifyProgress(m_observer, QString("[keep] block=%1 collected %2 segments...")
                                                   .arg(blockName).arg(segments.size()));
                }
            } else if (EntityFlattener::isArea(child.category)) {
                for (const VertexList& ring : m_segmentFlattener.areaRings(child)) {
                    GeometryType type;
                    Geometry geometry;
                    if (classifyVertices(ring, false, type, geometry) && type == GeometryType::Polygon) {
                        polygons.append(geometry);
                    }
                }
            }
        } catch (const EntityExtractionError& e) {
            notifyProgress(m_observer, QString("[warn] entity failed in block %1: %2")
                                           .arg(blockName, QString::fromUtf8(e.what())));
        }
    }

    const StrategyLimits limits{m_options.smallLimit, m_options.mediumLimit, m_options.timeBudgetMs};
    const MergeStrategy strategy = selectStrategy(static_cast<int>(segments.size()), timer.elapsed(), limits);
    m_lastStrategy = strategy;

    Row row;
    row.layer = insert.layerName();
    row.blockName = blockName;

    // A polygon result represents the instance on its own
    if (!polygons.isEmpty()) {
        Geometry merged;
        if (LineMerger::polygonUnion(polygons, merged)) {
            row.type = GeometryType::Polygon;
            row.geometry = merged;
            return QVector<Row>{row};
        }
        notifyProgress(m_observer, QString("[warn] polygon union failed: %1").arg(GeosBridge::lastError()));
    }

    if (!segments.isEmpty()) {
        MergeOutcome outcome;
        if (lineTiers(segments, insert).run(strategy, outcome)) {
            m_lastStrategy = outcome.strategy;
            if (outcome.strategy == MergeStrategy::Explode) {
                notifyProgress(m_observer, QString("[keep] block=%1 explode lines: %2")
                                               .arg(blockName).arg(outcome.rows.size()));
                return outcome.rows;
            }
            row.type = GeometryType::Line;
            row.geometry = outcome.merged;
            return QVector<Row>{row};
        }
    }

    return QVector<Row>{insertionPoint(insert, true)};
}

MergeTierChain BlockExpander::lineTiers(const QVector<Segment>& segments, const CadEntity& insert) const
{
    const double tol = m_options.mergeTolerance;
    ProgressObserver* observer = m_observer;

    MergeTierChain chain;
    chain.addTier(MergeStrategy::Robust, [&segments, tol, observer](MergeOutcome& out) {
        return LineMerger::robustMerge(segments, tol, out.merged, observer);
    });
    chain.addTier(MergeStrategy::Graph, [&segments, tol](MergeOutcome& out) {
        Geometry merged;
        if (!LineMerger::graphMerge(segments, tol, merged)) return false;
        out.merged = GeometryNormalizer::extractLineal(merged);
        return !out.merged.isEmpty();
    });
    chain.addTier(MergeStrategy::Explode, [&segments, &insert](MergeOutcome& out) {
        out.rows = LineMerger::explode(segments, insert.layerName(), insert.blockName);
        return !out.rows.isEmpty();
    });
    return chain;
}

Row BlockExpander::insertionPoint(const CadEntity& insert, bool tagBlock) const
{
    const InsertTransform ocs = ObjectCoordinateSystem::fromExtrusion(insert.extrusion).planar();
    Vertex p = insert.placement.map(ocs.map(insert.insertPoint));
    if (!m_options.includeElevation) p.z = 0.0;

    Row row;
    row.layer = insert.layerName();
    row.type = GeometryType::Point;
    row.geometry = Geometry::point(p, m_options.includeElevation);
    if (tagBlock) row.blockName = insert.blockName;
    return row;
}
