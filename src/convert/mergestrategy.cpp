#include "convert/mergestrategy.h"

#include <QDebug>

#include <exception>

QString mergeStrategyName(MergeStrategy strategy)
{
    switch (strategy) {
        case MergeStrategy::Robust: return QStringLiteral("robust");
        case MergeStrategy::Graph: return QStringLiteral("graph");
        case MergeStrategy::Explode: return QStringLiteral("explode");
    }
    return QString();
}

MergeStrategy selectStrategy(int segmentCount, qint64 elapsedMs, const StrategyLimits& limits)
{
    if (segmentCount > limits.mediumLimit) {
        return MergeStrategy::Explode;
    }
    if (segmentCount > limits.smallLimit || elapsedMs > limits.timeBudgetMs) {
        return MergeStrategy::Graph;
    }
    return MergeStrategy::Robust;
}

void MergeTierChain::addTier(MergeStrategy strategy, Tier tier)
{
    m_tiers.append(Entry{strategy, std::move(tier)});
}

bool MergeTierChain::run(MergeStrategy start, MergeOutcome& outcome, QVector<MergeStrategy>* attempted) const
{
    bool started = false;
    for (const Entry& entry : m_tiers) {
        if (!started) {
            if (entry.strategy != start) continue;
            started = true;
        }
        if (attempted) attempted->append(entry.strategy);

        MergeOutcome candidate;
        candidate.strategy = entry.strategy;
        bool ok = false;
        try {
            ok = entry.tier && entry.tier(candidate);
        } catch (const std::exception& e) {
            qDebug() << "MergeTierChain:" << mergeStrategyName(entry.strategy) << "tier threw -" << e.what();
            ok = false;
        }
        if (ok) {
            outcome = candidate;
            return true;
        }
    }
    return false;
}
