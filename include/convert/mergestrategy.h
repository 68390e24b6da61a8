#ifndef MERGESTRATEGY_H
#define MERGESTRATEGY_H

#include <QString>
#include <QVector>

#include <functional>

#include "geometry/geometry.h"

/**
 * @brief MergeStrategy - Merge tiers in downgrade order
 */
enum class MergeStrategy {
    Robust = 0,
    Graph,
    Explode
};

QString mergeStrategyName(MergeStrategy strategy);   // "robust", "graph", "explode"

struct StrategyLimits {
    int smallLimit{2000};
    int mediumLimit{20000};
    qint64 timeBudgetMs{2000};
};

/**
 * @brief Pick the first tier to try for one block instance
 *
 * count > mediumLimit                           -> Explode
 * count > smallLimit or elapsedMs > budget      -> Graph
 * otherwise                                     -> Robust
 */
MergeStrategy selectStrategy(int segmentCount, qint64 elapsedMs, const StrategyLimits& limits);

/**
 * @brief MergeOutcome - What the successful tier produced
 *
 * Robust and Graph fill `merged`; Explode fills `rows`.
 */
struct MergeOutcome {
    MergeStrategy strategy{MergeStrategy::Robust};
    Geometry merged;
    QVector<Row> rows;
};

/**
 * @brief MergeTierChain - Ordered tiers with a first-success driver
 *
 * run() starts at the requested tier and only ever moves down the list;
 * every tier is tried at most once.
 */
class MergeTierChain {
public:
    using Tier = std::function<bool(MergeOutcome&)>;

    void addTier(MergeStrategy strategy, Tier tier);

    /**
     * @param start First tier to try (tiers before it are never run)
     * @param outcome Filled by the tier that succeeded
     * @param attempted Optional: tiers tried, in order
     * @return false if every tier from start on failed
     */
    bool run(MergeStrategy start, MergeOutcome& outcome, QVector<MergeStrategy>* attempted = nullptr) const;

private:
    struct Entry {
        MergeStrategy strategy;
        Tier tier;
    };
    QVector<Entry> m_tiers;
};

#endif // MERGESTRATEGY_H
