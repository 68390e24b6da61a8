#include "testhelpers.h"

#include "convert/blockexpander.h"
#include "convert/conversionservice.h"
#include "convert/progressobserver.h"
#include "dxf/caddocument.h"
#include "dxf/documentloader.h"

#include <QHash>
#include <QStringList>

namespace {

// Serves prepared documents by path; unknown paths fail to load
class MemoryLoader : public DocumentLoader {
public:
    void add(const QString& path, const CadDocument& document) { m_documents.insert(path, document); }

    bool load(const QString& filePath, CadDocument& document) override {
        if (!m_documents.contains(filePath)) {
            m_lastError = QString("cannot open %1").arg(filePath);
            return false;
        }
        document = m_documents.value(filePath);
        return true;
    }

    QString lastError() const override { return m_lastError; }

private:
    QHash<QString, CadDocument> m_documents;
    QString m_lastError;
};

class RecordingObserver : public ProgressObserver {
public:
    void notify(const QString& message) override { messages.append(message); }

    bool saw(const QString& prefix) const {
        for (const QString& m : messages) {
            if (m.startsWith(prefix)) return true;
        }
        return false;
    }

    QStringList messages;
};

CadDocument blockOfLines(const QString& name, int count)
{
    CadDocument doc;
    CadBlock block;
    block.name = name;
    block.entities.reserve(count);
    // Disjoint unit segments
    for (int i = 0; i < count; ++i) {
        block.entities.append(testing::line(i * 2.0, 0, i * 2.0 + 1.0, 0));
    }
    doc.addBlock(block);
    return doc;
}

} // namespace

TEST_CASE("ConversionService: oversized block explodes into tagged lines", "[convert][blocks]") {
    CadDocument doc = blockOfLines("HUGE", 25000);
    doc.addEntity(testing::insert("HUGE", Vertex(0, 0), "SITE"));

    MemoryLoader loader;
    loader.add("huge.dxf", doc);

    ConversionOptions options;
    options.blockMode = BlockMode::KeepMerge;
    options.smallLimit = 2000;
    options.mediumLimit = 20000;

    RecordingObserver observer;
    ConversionService service(loader, options, &observer);
    REQUIRE(service.convert(QStringList{"huge.dxf"}));

    const Bucket* lines = service.assembler().bucket("SITE", GeometryType::Line);
    REQUIRE(lines != nullptr);
    REQUIRE(lines->rows.size() == 25000);
    for (const Row& row : lines->rows) {
        REQUIRE(row.blockName == "HUGE");
    }
    REQUIRE(observer.saw("[keep] block=HUGE explode lines: 25000"));
}

TEST_CASE("BlockExpander: oversized block picks the explode tier", "[convert][blocks]") {
    CadDocument doc = blockOfLines("HUGE", 25000);
    ConversionOptions options;
    BlockExpander expander(doc, options, nullptr);

    const QVector<Row> rows = expander.expand(testing::insert("HUGE", Vertex(0, 0)));
    REQUIRE(expander.lastStrategy() == MergeStrategy::Explode);
    REQUIRE(rows.size() == 25000);
}

TEST_CASE("ConversionService: block of failing children degrades to its insertion point", "[convert][blocks]") {
    CadDocument doc;
    CadBlock block;
    block.name = "BAD";
    block.entities.append(testing::brokenEllipse());
    block.entities.append(testing::brokenEllipse());
    doc.addBlock(block);
    doc.addEntity(testing::insert("BAD", Vertex(12, 34), "MARKS"));

    MemoryLoader loader;
    loader.add("bad.dxf", doc);

    ConversionOptions options;
    SECTION("keep-merge") {
        options.blockMode = BlockMode::KeepMerge;
    }
    SECTION("explode") {
        options.blockMode = BlockMode::Explode;
    }

    ConversionService service(loader, options);
    REQUIRE(service.convert(QStringList{"bad.dxf"}));
    REQUIRE(service.buckets().size() == 1);

    const Bucket* points = service.assembler().bucket("MARKS", GeometryType::Point);
    REQUIRE(points != nullptr);
    REQUIRE(points->rows.size() == 1);

    const Vertex& at = points->rows.first().geometry.parts().first().coords().first();
    REQUIRE(at.x == Approx(12.0));
    REQUIRE(at.y == Approx(34.0));
}

TEST_CASE("ConversionService: small block merges into one line per instance", "[convert][blocks][geos]") {
    CadDocument doc;
    CadBlock block;
    block.name = "FENCE";
    block.entities.append(testing::line(0, 0, 1, 0));
    block.entities.append(testing::line(1, 0, 2, 0));
    block.entities.append(testing::line(2, 0, 3, 0));
    doc.addBlock(block);
    doc.addEntity(testing::insert("FENCE", Vertex(0, 0)));
    doc.addEntity(testing::insert("FENCE", Vertex(0, 10)));

    MemoryLoader loader;
    loader.add("fence.dxf", doc);

    ConversionService service(loader, ConversionOptions());
    REQUIRE(service.convert(QStringList{"fence.dxf"}));

    const Bucket* lines = service.assembler().bucket("0", GeometryType::Line);
    REQUIRE(lines != nullptr);
    REQUIRE(lines->rows.size() == 2);
    for (const Row& row : lines->rows) {
        REQUIRE(row.blockName == "FENCE");
        REQUIRE(row.geometry.length() == Approx(3.0));
    }
}

TEST_CASE("ConversionService: unreadable files are skipped", "[convert]") {
    CadDocument doc;
    doc.addEntity(testing::line(0, 0, 1, 1));

    MemoryLoader loader;
    loader.add("good.dxf", doc);

    RecordingObserver observer;
    ConversionService service(loader, ConversionOptions(), &observer);
    REQUIRE(service.convert(QStringList{"missing.dxf", "good.dxf"}));
    REQUIRE(service.stats().filesFailed == 1);
    REQUIRE(service.stats().filesRead == 1);
    REQUIRE(service.assembler().rowCount() == 1);
    REQUIRE(observer.saw("[error] read failed: cannot open missing.dxf"));
}

TEST_CASE("ConversionService: zero rows is not an error", "[convert]") {
    MemoryLoader loader;
    loader.add("empty.dxf", CadDocument());

    RecordingObserver observer;
    ConversionService service(loader, ConversionOptions(), &observer);
    REQUIRE_FALSE(service.convert(QStringList{"empty.dxf"}));
    REQUIRE(service.stats().filesFailed == 0);
    REQUIRE(observer.saw("[convert] no rows"));
}

TEST_CASE("ConversionService: layer selection skips entities before expansion", "[convert]") {
    CadDocument doc = blockOfLines("HIDDEN", 3);
    doc.addEntity(testing::insert("HIDDEN", Vertex(0, 0), "OTHER"));
    doc.addEntity(testing::line(0, 0, 1, 0, "KEEP"));
    doc.addEntity(testing::line(0, 0, 1, 0, "DROP"));

    MemoryLoader loader;
    loader.add("layers.dxf", doc);

    ConversionOptions options;
    options.setSelectedLayers(QStringList{"KEEP"});

    ConversionService service(loader, options);
    REQUIRE(service.convert(QStringList{"layers.dxf"}));
    REQUIRE(service.buckets().size() == 1);
    REQUIRE(service.buckets().first().key.layer == "KEEP");
    REQUIRE(service.stats().inserts == 0);
}

TEST_CASE("ConversionService: failing entities are reported and skipped", "[convert]") {
    CadDocument doc;
    doc.addEntity(testing::brokenEllipse());
    doc.addEntity(testing::line(0, 0, 1, 0));

    MemoryLoader loader;
    loader.add("mixed.dxf", doc);

    RecordingObserver observer;
    ConversionService service(loader, ConversionOptions(), &observer);
    REQUIRE(service.convert(QStringList{"mixed.dxf"}));
    REQUIRE(service.stats().entityFailures == 1);
    REQUIRE(service.assembler().rowCount() == 1);
    REQUIRE(observer.saw("[warn] entity failed"));
}

TEST_CASE("ConversionService: hatch in a merged block wins over its lines", "[convert][blocks][geos]") {
    CadHatchLoop loop;
    loop.isPolyline = true;
    loop.vertices = VertexList{Vertex(0, 0), Vertex(2, 0), Vertex(2, 2), Vertex(0, 2)};

    CadEntity hatch;
    hatch.category = EntityCategory::Hatch;
    hatch.loops.append(loop);

    CadDocument doc;
    CadBlock block;
    block.name = "LOT";
    block.entities.append(testing::line(0, 0, 2, 0));
    block.entities.append(testing::line(2, 0, 2, 2));
    block.entities.append(hatch);
    doc.addBlock(block);
    doc.addEntity(testing::insert("LOT", Vertex(100, 100), "PARCELS"));

    MemoryLoader loader;
    loader.add("lot.dxf", doc);

    ConversionOptions options;
    options.blockMode = BlockMode::KeepMerge;
    ConversionService service(loader, options);
    REQUIRE(service.convert(QStringList{"lot.dxf"}));
    REQUIRE(service.buckets().size() == 1);
    REQUIRE(service.assembler().bucket("PARCELS", GeometryType::Line) == nullptr);

    const Bucket* polygons = service.assembler().bucket("PARCELS", GeometryType::Polygon);
    REQUIRE(polygons != nullptr);
    REQUIRE(polygons->rows.size() == 1);
    REQUIRE(polygons->rows.first().blockName == "LOT");
    const Geometry& parcel = polygons->rows.first().geometry;
    REQUIRE(parcel.numParts() == 1);
    const VertexList& ring = parcel.parts().first().rings.first();
    REQUIRE(ring.size() >= 4);
    for (const Vertex& v : ring) {
        REQUIRE(v.x == Approx(100.0).margin(2.0 + 1e-9));
        REQUIRE(v.y == Approx(100.0).margin(2.0 + 1e-9));
        REQUIRE(v.x >= Approx(100.0));
        REQUIRE(v.y >= Approx(100.0));
    }
}

TEST_CASE("ConversionService: exploded blocks drop children on unselected layers", "[convert][blocks]") {
    CadDocument doc;
    CadBlock block;
    block.name = "MIXED";
    block.entities.append(testing::line(0, 0, 1, 0, "KEEP"));
    block.entities.append(testing::line(0, 1, 1, 1, "DROP"));
    doc.addBlock(block);
    doc.addEntity(testing::insert("MIXED", Vertex(0, 0), "KEEP"));

    MemoryLoader loader;
    loader.add("mixed.dxf", doc);

    ConversionOptions options;
    options.blockMode = BlockMode::Explode;
    options.setSelectedLayers(QStringList{"KEEP"});

    ConversionService service(loader, options);
    REQUIRE(service.convert(QStringList{"mixed.dxf"}));
    REQUIRE(service.buckets().size() == 1);

    const Bucket* lines = service.assembler().bucket("KEEP", GeometryType::Line);
    REQUIRE(lines != nullptr);
    REQUIRE(lines->rows.size() == 1);
    REQUIRE(service.assembler().bucket("DROP", GeometryType::Line) == nullptr);
}

TEST_CASE("ConversionService: unnamed layers are filtered and written as layer 0", "[convert]") {
    CadDocument doc;
    doc.addEntity(testing::line(0, 0, 1, 0, QString()));

    MemoryLoader loader;
    loader.add("unnamed.dxf", doc);

    ConversionOptions options;
    options.setSelectedLayers(QStringList{"0"});

    ConversionService service(loader, options);
    REQUIRE(service.convert(QStringList{"unnamed.dxf"}));
    REQUIRE(service.buckets().size() == 1);
    REQUIRE(service.buckets().first().key.layer == "0");
}
