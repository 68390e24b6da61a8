#ifndef CONVERSIONSERVICE_H
#define CONVERSIONSERVICE_H

#include <QString>
#include <QStringList>
#include <QVector>

#include "convert/bucketassembler.h"
#include "convert/conversionoptions.h"

class CadDocument;
class DocumentLoader;
class ProgressObserver;

/**
 * @brief ConversionService - Runs one conversion over one or more drawings
 *
 * Files are read one after another through the loader; a file that cannot
 * be read is reported and skipped. Entities outside the layer selection are
 * skipped before any work (block references included). Every other entity
 * is flattened or expanded into rows, which are collected into buckets.
 *
 * Zero rows is a valid result, not an error.
 */
class ConversionService {
public:
    struct Stats {
        int filesRead{0};
        int filesFailed{0};
        int entities{0};
        int inserts{0};
        int entityFailures{0};
    };

    ConversionService(DocumentLoader& loader, const ConversionOptions& options,
                      ProgressObserver* observer = nullptr);

    /**
     * @brief Convert files in order; results accumulate in buckets()
     * @return true if at least one row was produced
     */
    bool convert(const QStringList& filePaths);

    // Convert an already loaded document
    void convertDocument(const CadDocument& document);

    const BucketAssembler& assembler() const { return m_assembler; }
    const QVector<Bucket>& buckets() const { return m_assembler.buckets(); }
    const Stats& stats() const { return m_stats; }

    void clear();

private:
    DocumentLoader& m_loader;
    ConversionOptions m_options;
    ProgressObserver* m_observer;
    BucketAssembler m_assembler;
    Stats m_stats;
};

#endif // CONVERSIONSERVICE_H
