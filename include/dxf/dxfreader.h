#ifndef DXFREADER_H
#define DXFREADER_H

#include <QString>

#include "dxf/documentloader.h"

/**
 * @brief DxfReader - Loads DXF and DWG drawings through libdxfrw
 *
 * Model space entities and block definitions are copied into a CadDocument.
 * Blocks are kept as definitions (not inlined) so that the converter can
 * decide per instance whether to explode or merge them.
 * Text, dimensions, images and viewports are not read.
 */
class DxfReader : public DocumentLoader {
public:
    DxfReader();
    ~DxfReader() override;

    /**
     * @brief Read a .dxf or .dwg file (chosen by extension)
     * @param filePath Path to the drawing
     * @param document Output document (cleared first)
     * @return true on success, false on error (check lastError())
     */
    bool load(const QString& filePath, CadDocument& document) override;

    QString lastError() const override { return m_lastError; }

private:
    QString m_lastError;
};

#endif // DXFREADER_H
