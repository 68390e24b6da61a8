#ifndef CONVERSIONOPTIONS_H
#define CONVERSIONOPTIONS_H

#include <QSet>
#include <QString>
#include <QStringList>

enum class BlockMode {
    Explode,     // every block child becomes its own row
    KeepMerge    // one merged row per block instance
};

QString blockModeName(BlockMode mode);      // "explode", "keep-merge"
bool blockModeFromName(const QString& name, BlockMode& mode);

/**
 * @brief ConversionOptions - Knobs consumed by the conversion core
 *
 * Defaults match AppSettings; the CLI fills this from settings plus overrides.
 */
struct ConversionOptions {
    double flattenTolerance{0.2};
    bool includeElevation{false};
    // Empty = all layers
    QSet<QString> selectedLayers;
    BlockMode blockMode{BlockMode::KeepMerge};
    double mergeTolerance{0.2};
    int smallLimit{2000};
    int mediumLimit{20000};
    qint64 timeBudgetMs{2000};

    bool acceptsLayer(const QString& layer) const {
        return selectedLayers.isEmpty() || selectedLayers.contains(layer);
    }

    void setSelectedLayers(const QStringList& layers);
};

#endif // CONVERSIONOPTIONS_H
