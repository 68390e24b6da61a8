#include "convert/conversionoptions.h"

QString blockModeName(BlockMode mode)
{
    switch (mode) {
        case BlockMode::Explode: return QStringLiteral("explode");
        case BlockMode::KeepMerge: return QStringLiteral("keep-merge");
    }
    return QString();
}

bool blockModeFromName(const QString& name, BlockMode& mode)
{
    const QString key = name.trimmed().toLower();
    if (key == "explode") {
        mode = BlockMode::Explode;
    } else if (key == "keep-merge" || key == "keep-merge-per") {
        mode = BlockMode::KeepMerge;
    } else {
        return false;
    }
    return true;
}

void ConversionOptions::setSelectedLayers(const QStringList& layers)
{
    selectedLayers.clear();
    for (const QString& layer : layers) {
        const QString name = layer.trimmed();
        if (!name.isEmpty()) selectedLayers.insert(name);
    }
}
