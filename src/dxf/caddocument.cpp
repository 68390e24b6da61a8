#include "dxf/caddocument.h"

#include <QDebug>

void CadDocument::addBlock(const CadBlock& block)
{
    auto it = m_blockIndex.constFind(block.name);
    if (it != m_blockIndex.constEnd()) {
        // Redefinition replaces the earlier block, as CAD applications do
        m_blocks[it.value()] = block;
        return;
    }
    m_blockIndex.insert(block.name, m_blocks.size());
    m_blocks.append(block);
}

void CadDocument::addLayer(const QString& name)
{
    if (!m_layers.contains(name)) {
        m_layers.append(name);
    }
}

const CadBlock* CadDocument::block(const QString& name) const
{
    auto it = m_blockIndex.constFind(name);
    if (it == m_blockIndex.constEnd()) return nullptr;
    return &m_blocks[it.value()];
}

bool CadDocument::resolveInsert(const CadEntity& insert, QVector<CadEntity>& children, QString* error) const
{
    if (insert.category != EntityCategory::Insert) {
        if (error) *error = QStringLiteral("entity is not a block reference");
        return false;
    }
    return resolveInto(insert, insert.placement, kMaxInsertDepth, children, error);
}

bool CadDocument::resolveInto(const CadEntity& insert, const InsertTransform& outer, int depth,
                              QVector<CadEntity>& children, QString* error) const
{
    if (depth <= 0) {
        if (error) *error = QString("block nesting too deep at '%1'").arg(insert.blockName);
        return false;
    }

    const CadBlock* def = block(insert.blockName);
    if (!def) {
        if (error) *error = QString("missing block definition '%1'").arg(insert.blockName);
        return false;
    }

    const InsertTransform placement =
        InsertTransform::fromInsert(def->basePoint, insert.insertPoint,
                                    insert.xScale, insert.yScale, insert.rotation)
            .then(ObjectCoordinateSystem::fromExtrusion(insert.extrusion).planar())
            .then(outer);

    for (const auto& child : def->entities) {
        if (child.category == EntityCategory::Insert) {
            QString nestedError;
            if (!resolveInto(child, child.placement.then(placement), depth - 1, children, &nestedError)) {
                qDebug() << "CadDocument: skipped nested block in" << insert.blockName << ":" << nestedError;
            }
            continue;
        }
        CadEntity resolved = child;
        resolved.placement = child.placement.then(placement);
        children.append(resolved);
    }
    return true;
}

void CadDocument::clear()
{
    m_entities.clear();
    m_blocks.clear();
    m_blockIndex.clear();
    m_layers.clear();
}
