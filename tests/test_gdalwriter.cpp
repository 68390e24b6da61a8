#include "testhelpers.h"

#include "gdal/gdalwriter.h"
#include "gdal/ogrconvert.h"
#include "gdal/reprojector.h"

#include <gdal_priv.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

namespace {

Bucket lineBucket(const QString& layer)
{
    Bucket bucket;
    bucket.key = BucketKey{layer, GeometryType::Line};

    Row plain;
    plain.layer = layer;
    plain.type = GeometryType::Line;
    plain.geometry = Geometry::lineString(VertexList{Vertex(0, 0), Vertex(1, 1)});
    bucket.rows.append(plain);

    Row fromBlock = plain;
    fromBlock.geometry = Geometry::lineString(VertexList{Vertex(2, 2), Vertex(3, 1)});
    fromBlock.blockName = "GATE";
    bucket.rows.append(fromBlock);
    return bucket;
}

} // namespace

TEST_CASE("GdalWriter: file names are sanitized", "[writer]") {
    REQUIRE(GdalWriter::sanitizeFileName("Roads/Main:01") == "Roads_Main_01");
    REQUIRE(GdalWriter::sanitizeFileName("  .hidden. ") == "hidden");
    REQUIRE(GdalWriter::sanitizeFileName("con") == "_con_");
    REQUIRE(GdalWriter::sanitizeFileName("LPT1") == "_LPT1_");
    REQUIRE(GdalWriter::sanitizeFileName("") == "layer");
    REQUIRE(GdalWriter::sanitizeFileName("***") == "_");
    REQUIRE(GdalWriter::sanitizeFileName(QString(150, 'a')).size() == 100);
}

TEST_CASE("GdalWriter: shapefile per bucket with block names", "[writer][gdal]") {
    GDALAllRegister();
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    GdalWriter writer;
    writer.setEpsg(3826);
    const QVector<WrittenOutput> written =
        writer.write(QVector<Bucket>{lineBucket("ROADS")}, dir.path(), "ESRI Shapefile");

    REQUIRE(written.size() == 1);
    REQUIRE(written.first().count == 2);
    REQUIRE(written.first().layer == "ROADS");
    REQUIRE(QFileInfo(written.first().path).fileName() == "ROADS_LINE.shp");
    REQUIRE(writer.attemptedTiers() == QVector<GdalWriter::Tier>{GdalWriter::Tier::Shapefile});

    GDALDataset* dataset = static_cast<GDALDataset*>(
        GDALOpenEx(written.first().path.toUtf8().constData(), GDAL_OF_VECTOR, nullptr, nullptr, nullptr));
    REQUIRE(dataset != nullptr);
    OGRLayer* layer = dataset->GetLayer(0);
    REQUIRE(layer->GetFeatureCount() == 2);
    REQUIRE(layer->GetLayerDefn()->GetFieldIndex("BLK_NAME") >= 0);
    REQUIRE(layer->GetLayerDefn()->GetFieldIndex("LAYER") >= 0);
    GDALClose(dataset);
}

TEST_CASE("GdalWriter: existing outputs need overwrite", "[writer][gdal]") {
    GDALAllRegister();
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    GdalWriter writer;
    REQUIRE(writer.write(QVector<Bucket>{lineBucket("A")}, dir.path(), "GeoJSON").size() == 1);

    writer.setOverwrite(true);
    const QVector<WrittenOutput> again = writer.write(QVector<Bucket>{lineBucket("A")}, dir.path(), "GeoJSON");
    REQUIRE(again.size() == 1);
    REQUIRE(QFileInfo(again.first().path).fileName() == "A_LINE.geojson");
}

TEST_CASE("GdalWriter: GPKG keeps every bucket in one file", "[writer][gdal]") {
    GDALAllRegister();
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    Bucket points;
    points.key = BucketKey{"TREES", GeometryType::Point};
    Row tree;
    tree.layer = "TREES";
    tree.type = GeometryType::Point;
    tree.geometry = Geometry::point(Vertex(5, 5));
    points.rows.append(tree);

    const QString path = QDir(dir.path()).filePath("out.gpkg");
    GdalWriter writer;
    const QVector<WrittenOutput> written =
        writer.write(QVector<Bucket>{lineBucket("ROADS"), points}, path, "GPKG");

    REQUIRE(written.size() == 2);
    REQUIRE(written[0].path == path);
    REQUIRE(written[1].path == path);
    REQUIRE(written[1].layer == "TREES");
}

TEST_CASE("GdalWriter: buckets emptied by normalization are skipped", "[writer]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    Bucket wrong;
    wrong.key = BucketKey{"X", GeometryType::Polygon};
    Row row;
    row.layer = "X";
    row.type = GeometryType::Polygon;
    row.geometry = Geometry::lineString(VertexList{Vertex(0, 0), Vertex(1, 0)});
    wrong.rows.append(row);

    GdalWriter writer;
    REQUIRE(writer.write(QVector<Bucket>{wrong}, dir.path(), "ESRI Shapefile").isEmpty());
    // Every tier was tried before giving up
    REQUIRE(writer.attemptedTiers().size() == 3);
}

TEST_CASE("OgrConvert: geometries survive the OGR boundary", "[writer][gdal]") {
    const Geometry lines = Geometry::multiLineString({
        VertexList{Vertex(0, 0, 1), Vertex(1, 0, 2)},
        VertexList{Vertex(5, 5, 3), Vertex(6, 6, 4)}}, true);

    std::unique_ptr<OGRGeometry> ogr = OgrConvert::toOgr(lines);
    REQUIRE(ogr != nullptr);
    REQUIRE(wkbFlatten(ogr->getGeometryType()) == wkbMultiLineString);

    const Geometry back = OgrConvert::fromOgr(ogr.get());
    REQUIRE(back.kind() == GeometryKind::MultiLineString);
    REQUIRE(back.hasZ());
    REQUIRE(back.parts()[1].coords()[1] == Vertex(6, 6, 4));
}

TEST_CASE("Reprojector: bbox text parsing", "[reproject]") {
    BoundingBox box;
    REQUIRE(BoundingBox::parse("120.1, 22.5, 121.0, 23.0", box));
    REQUIRE(box.minLon == Approx(120.1));
    REQUIRE(box.maxLat == Approx(23.0));
    REQUIRE_FALSE(BoundingBox::parse("1,2,3", box));
    REQUIRE_FALSE(BoundingBox::parse("3,2,1,4", box));
    REQUIRE_FALSE(BoundingBox::parse("a,b,c,d", box));
}

TEST_CASE("Reprojector: bbox filter drops rows outside the window", "[reproject][gdal]") {
    Bucket bucket;
    bucket.key = BucketKey{"P", GeometryType::Point};
    for (double lon : {10.0, 50.0}) {
        Row row;
        row.layer = "P";
        row.type = GeometryType::Point;
        row.geometry = Geometry::point(Vertex(lon, 5.0));
        bucket.rows.append(row);
    }

    Reprojector reprojector(4326);
    BoundingBox box;
    REQUIRE(BoundingBox::parse("0,0,20,20", box));
    reprojector.setBoundingBox(box);

    QVector<Bucket> out;
    REQUIRE(reprojector.process(QVector<Bucket>{bucket}, out));
    REQUIRE(out.size() == 1);
    REQUIRE(out.first().rows.size() == 1);
    REQUIRE(out.first().rows.first().geometry.parts().first().coords().first().x == Approx(10.0));
}

TEST_CASE("Reprojector: same source and target is a no-op", "[reproject]") {
    Reprojector reprojector(3826);
    reprojector.setTargetEpsg(3826);
    REQUIRE_FALSE(reprojector.reprojects());
    reprojector.setTargetEpsg(0);
    REQUIRE_FALSE(reprojector.reprojects());
    reprojector.setTargetEpsg(4326);
    REQUIRE(reprojector.reprojects());
}
