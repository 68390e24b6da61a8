#ifndef BLOCKEXPANDER_H
#define BLOCKEXPANDER_H

#include <QVector>

#include "convert/conversionoptions.h"
#include "convert/entityflattener.h"
#include "convert/mergestrategy.h"
#include "geometry/geometry.h"

class CadDocument;
struct CadEntity;
class ProgressObserver;

/**
 * @brief BlockExpander - Turns one block instance into rows
 *
 * Children are resolved by the document with the instance placement
 * applied, then filtered by the layer selection before any flattening.
 *
 * explode:    every child becomes its own rows
 * keep-merge: curve children become segments, hatch/face children become
 *             polygon rings; one representative row per instance
 *
 * An instance never disappears: when nothing usable comes out of it, a
 * single POINT row is emitted at its insertion point.
 */
class BlockExpander {
public:
    BlockExpander(const CadDocument& document, const ConversionOptions& options,
                  ProgressObserver* observer = nullptr);

    QVector<Row> expand(const CadEntity& insert) const;

    // Strategy that produced the last keep-merge row set (for logging and tests)
    MergeStrategy lastStrategy() const { return m_lastStrategy; }

private:
    QVector<Row> explode(const CadEntity& insert) const;
    QVector<Row> keepMerge(const CadEntity& insert) const;
    Row insertionPoint(const CadEntity& insert, bool tagBlock) const;
    MergeTierChain lineTiers(const QVector<Segment>& segments, const CadEntity& insert) const;

    const CadDocument& m_document;
    ConversionOptions m_options;
    ProgressObserver* m_observer;
    EntityFlattener m_flattener;        // explode rows, honours include-elevation
    EntityFlattener m_segmentFlattener; // keep-merge segments, always 2D
    mutable MergeStrategy m_lastStrategy{MergeStrategy::Robust};
};

#endif // BLOCKEXPANDER_H
