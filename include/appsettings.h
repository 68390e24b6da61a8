#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include <QString>

#include "convert/conversionoptions.h"

class AppSettings {
public:
    // Empty = platform settings of the application (organization/name)
    static void setSettingsFile(const QString& iniPath);

    // Curve flattening
    static double flattenTolerance();
    static bool includeElevation();

    // Block handling
    static BlockMode blockMode();
    static double mergeTolerance();
    static int smallLimit();
    static int mediumLimit();
    static qint64 timeBudgetMs();

    // Coordinate systems
    static int sourceEpsg();
    static int targetEpsg();                // 0 = keep source

    // Output
    static QString outputDriver();          // "ESRI Shapefile", "GeoJSON" or "GPKG"

    // Options for one run, before command line overrides
    static ConversionOptions conversionOptions();
};

#endif // APPSETTINGS_H
