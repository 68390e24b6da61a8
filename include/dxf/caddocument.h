#ifndef CADDOCUMENT_H
#define CADDOCUMENT_H

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include "dxf/cadentity.h"

struct CadBlock {
    QString name;
    Vertex basePoint;
    QVector<CadEntity> entities;
};

/**
 * @brief CadDocument - Model space entities plus block definitions
 *
 * resolveInsert() is the document-side block resolution: it returns the
 * leaf entities of a block instance with the instance placement (and that of
 * any nested instance) attached to each child.
 */
class CadDocument {
public:
    static constexpr int kMaxInsertDepth = 10;

    void addEntity(const CadEntity& entity) { m_entities.append(entity); }
    void addBlock(const CadBlock& block);
    void addLayer(const QString& name);

    const QVector<CadEntity>& entities() const { return m_entities; }
    const QStringList& layers() const { return m_layers; }
    bool hasBlock(const QString& name) const { return m_blockIndex.contains(name); }
    const CadBlock* block(const QString& name) const;

    /**
     * @brief Expand a block instance into transformed leaf entities
     * @param insert Entity of category Insert
     * @param children Output list (appended)
     * @param error Set when the block cannot be resolved
     * @return false if the block is missing or nesting is too deep
     */
    bool resolveInsert(const CadEntity& insert, QVector<CadEntity>& children, QString* error = nullptr) const;

    void clear();

private:
    bool resolveInto(const CadEntity& insert, const InsertTransform& outer, int depth,
                     QVector<CadEntity>& children, QString* error) const;

    QVector<CadEntity> m_entities;
    QVector<CadBlock> m_blocks;
    QHash<QString, int> m_blockIndex;
    QStringList m_layers;
};

#endif // CADDOCUMENT_H
