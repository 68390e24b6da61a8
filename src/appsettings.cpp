#include "appsettings.h"
#include <QSettings>
#include <QString>

#include <memory>

namespace {
QString s_iniPath;

std::unique_ptr<QSettings> openSettings()
{
    if (s_iniPath.isEmpty()) return std::make_unique<QSettings>();
    return std::make_unique<QSettings>(s_iniPath, QSettings::IniFormat);
}
} // namespace

void AppSettings::setSettingsFile(const QString& iniPath)
{
    s_iniPath = iniPath;
}

double AppSettings::flattenTolerance()
{
    return openSettings()->value("flatten/tolerance", 0.2).toDouble();
}

bool AppSettings::includeElevation()
{
    return openSettings()->value("flatten/includeElevation", false).toBool();
}

BlockMode AppSettings::blockMode()
{
    const QString name = openSettings()->value("blocks/mode", blockModeName(BlockMode::KeepMerge)).toString();
    BlockMode mode;
    if (!blockModeFromName(name, mode)) return BlockMode::KeepMerge;
    return mode;
}

double AppSettings::mergeTolerance()
{
    return openSettings()->value("blocks/mergeTolerance", 0.2).toDouble();
}

int AppSettings::smallLimit()
{
    return openSettings()->value("blocks/smallLimit", 2000).toInt();
}

int AppSettings::mediumLimit()
{
    return openSettings()->value("blocks/mediumLimit", 20000).toInt();
}

qint64 AppSettings::timeBudgetMs()
{
    return openSettings()->value("blocks/timeBudgetMs", 2000).toLongLong();
}

int AppSettings::sourceEpsg()
{
    return openSettings()->value("crs/sourceEpsg", 3826).toInt();
}

int AppSettings::targetEpsg()
{
    return openSettings()->value("crs/targetEpsg", 0).toInt();
}

QString AppSettings::outputDriver()
{
    return openSettings()->value("output/driver", QStringLiteral("ESRI Shapefile")).toString();
}

ConversionOptions AppSettings::conversionOptions()
{
    ConversionOptions options;
    options.flattenTolerance = flattenTolerance();
    options.includeElevation = includeElevation();
    options.blockMode = blockMode();
    options.mergeTolerance = mergeTolerance();
    options.smallLimit = smallLimit();
    options.mediumLimit = mediumLimit();
    options.timeBudgetMs = timeBudgetMs();
    return options;
}
