#include "convert/bucketassembler.h"
#include "convert/geometrynormalizer.h"

bool BucketAssembler::add(const Row& row)
{
    Row normalized = row;
    if (!GeometryNormalizer::normalize(row.type, row.geometry, normalized.geometry)) {
        ++m_dropped;
        return false;
    }

    const BucketKey key{row.layer, row.type};
    auto it = m_index.constFind(key);
    int index = 0;
    if (it == m_index.constEnd()) {
        index = m_buckets.size();
        m_index.insert(key, index);
        m_buckets.append(Bucket{key, QVector<Row>()});
    } else {
        index = it.value();
    }
    m_buckets[index].rows.append(normalized);
    ++m_rowCount;
    return true;
}

void BucketAssembler::addRows(const QVector<Row>& rows)
{
    for (const Row& row : rows) {
        add(row);
    }
}

const Bucket* BucketAssembler::bucket(const QString& layer, GeometryType type) const
{
    auto it = m_index.constFind(BucketKey{layer, type});
    if (it == m_index.constEnd()) return nullptr;
    return &m_buckets[it.value()];
}

void BucketAssembler::clear()
{
    m_buckets.clear();
    m_index.clear();
    m_rowCount = 0;
    m_dropped = 0;
}
