#include "convert/conversionservice.h"
#include "convert/blockexpander.h"
#include "convert/entityflattener.h"
#include "convert/progressobserver.h"
#include "dxf/caddocument.h"
#include "dxf/documentloader.h"

#include <QDebug>
#include <QElapsedTimer>

#include <exception>

namespace {
constexpr int kEntityPingInterval = 1000;
constexpr int kInsertPingInterval = 50;
}

ConversionService::ConversionService(DocumentLoader& loader, const ConversionOptions& options,
                                     ProgressObserver* observer)
    : m_loader(loader), m_options(options), m_observer(observer)
{
}

bool ConversionService::convert(const QStringList& filePaths)
{
    QStringList layers = m_options.selectedLayers.values();
    layers.sort();
    notifyProgress(m_observer, QString("[convert] include_3d=%1 block_mode=%2 layers=%3")
                                   .arg(m_options.includeElevation ? "true" : "false",
                                        blockModeName(m_options.blockMode),
                                        layers.isEmpty() ? QStringLiteral("all") : layers.join(',')));

    QElapsedTimer timer;
    timer.start();

    for (const QString& path : filePaths) {
        notifyProgress(m_observer, QString("[convert] read: %1").arg(path));

        CadDocument document;
        if (!m_loader.load(path, document)) {
            ++m_stats.filesFailed;
            notifyProgress(m_observer, QString("[error] read failed: %1").arg(m_loader.lastError()));
            continue;
        }
        ++m_stats.filesRead;

        convertDocument(document);
        notifyProgress(m_observer, QString("[convert] done file: %1, total rows %2")
                                       .arg(path).arg(m_assembler.rowCount()));
    }

    if (m_assembler.isEmpty()) {
        notifyProgress(m_observer, QStringLiteral("[convert] no rows"));
        return false;
    }

    qInfo() << "Conversion finished in" << timer.elapsed() << "ms:"
            << m_assembler.rowCount() << "rows in" << m_assembler.buckets().size() << "buckets,"
            << m_assembler.droppedCount() << "dropped";
    return true;
}

void ConversionService::convertDocument(const CadDocument& document)
{
    const EntityFlattener flattener(m_options.flattenTolerance, m_options.includeElevation);
    const BlockExpander expander(document, m_options, m_observer);

    int count = 0;
    int inserts = 0;
    for (const CadEntity& entity : document.entities()) {
        ++count;
        ++m_stats.entities;
        if (count % kEntityPingInterval == 0) {
            notifyProgress(m_observer, QString("[convert] processing... %1 entities").arg(count));
        }

        // Skipping here keeps large blocks on other layers from being expanded
        if (!m_options.acceptsLayer(entity.layerName())) continue;

        try {
            if (entity.category == EntityCategory::Insert) {
                ++inserts;
                ++m_stats.inserts;
                if (inserts % kInsertPingInterval == 0) {
                    notifyProgress(m_observer, QString("[convert] INSERT expanded: %1").arg(inserts));
                }
                m_assembler.addRows(expander.expand(entity));
                continue;
            }
            m_assembler.addRows(flattener.rows(entity));
        } catch (const std::exception& e) {
            ++m_stats.entityFailures;
            notifyProgress(m_observer, QString("[warn] entity failed: %1").arg(QString::fromUtf8(e.what())));
        }
    }
}

void ConversionService::clear()
{
    m_assembler.clear();
    m_stats = Stats();
}
