#ifndef DOCUMENTLOADER_H
#define DOCUMENTLOADER_H

#include <QString>

class CadDocument;

/**
 * @brief DocumentLoader - Source of CAD documents for a conversion run
 *
 * A failed load is a per-file error: the run skips the file and continues.
 */
class DocumentLoader {
public:
    virtual ~DocumentLoader() = default;

    virtual bool load(const QString& filePath, CadDocument& document) = 0;
    virtual QString lastError() const = 0;
};

#endif // DOCUMENTLOADER_H
