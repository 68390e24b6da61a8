#ifndef BUCKETASSEMBLER_H
#define BUCKETASSEMBLER_H

#include <QHash>
#include <QString>
#include <QVector>

#include "geometry/geometry.h"

struct BucketKey {
    QString layer;
    GeometryType type{GeometryType::Point};

    bool operator==(const BucketKey& other) const { return layer == other.layer && type == other.type; }
};

inline size_t qHash(const BucketKey& key, size_t seed = 0) noexcept
{
    return qHashMulti(seed, key.layer, static_cast<int>(key.type));
}

/**
 * @brief Bucket - Rows sharing one (layer, geometry type)
 */
struct Bucket {
    BucketKey key;
    QVector<Row> rows;
};

/**
 * @brief BucketAssembler - Groups rows by (layer, geometry type)
 *
 * Buckets keep the order in which their key was first seen; rows keep the
 * order in which they were added. Each row is normalized to its type before
 * insertion and dropped if it does not fit.
 */
class BucketAssembler {
public:
    // Returns false if the row was dropped by normalization
    bool add(const Row& row);
    void addRows(const QVector<Row>& rows);

    const QVector<Bucket>& buckets() const { return m_buckets; }
    const Bucket* bucket(const QString& layer, GeometryType type) const;

    int rowCount() const { return m_rowCount; }
    int droppedCount() const { return m_dropped; }
    bool isEmpty() const { return m_rowCount == 0; }

    void clear();

private:
    QVector<Bucket> m_buckets;
    QHash<BucketKey, int> m_index;
    int m_rowCount{0};
    int m_dropped{0};
};

#endif // BUCKETASSEMBLER_H
