#include "dxf/dxfreader.h"
#include "dxf/caddocument.h"

#include <libdxfrw.h>
#include <libdwgr.h>

#include <QDebug>
#include <QFile>
#include <QFileInfo>

namespace {

Vertex toVertex(const DRW_Coord& c)
{
    return Vertex(c.x, c.y, c.z);
}

QString layerName(const DRW_Entity& e)
{
    const QString name = QString::fromStdString(e.layer);
    return name.isEmpty() ? QStringLiteral("0") : name;
}

// Weights only describe a rational spline when there is one per control point
QVector<double> splineWeights(const DRW_Spline& spline)
{
    QVector<double> weights;
    if (spline.weightlist.size() != spline.controllist.size()) return weights;
    for (double w : spline.weightlist) {
        weights.append(w);
    }
    return weights;
}

QString dwgErrorString(DRW::error err)
{
    switch (err) {
        case DRW::BAD_NONE: return "No error";
        case DRW::BAD_UNKNOWN: return "Unknown error";
        case DRW::BAD_OPEN: return "Cannot open file";
        case DRW::BAD_VERSION: return "Unsupported version";
        case DRW::BAD_READ_FILE_HEADER: return "Bad file header";
        case DRW::BAD_READ_HEADER: return "Bad header";
        case DRW::BAD_READ_HANDLES: return "Bad handles";
        case DRW::BAD_READ_CLASSES: return "Bad classes";
        case DRW::BAD_READ_TABLES: return "Bad tables";
        case DRW::BAD_READ_BLOCKS: return "Bad blocks";
        case DRW::BAD_READ_ENTITIES: return "Bad entities";
        case DRW::BAD_READ_OBJECTS: return "Bad objects";
        default: return "Unknown error code";
    }
}

// Receives libdxfrw callbacks and files entities into model space or into the
// block currently being defined.
class DocumentCollector : public DRW_Interface {
public:
    explicit DocumentCollector(CadDocument& document) : m_document(document) {}

    int entitiesRead() const { return m_entitiesRead; }
    int entitiesIgnored() const { return m_entitiesIgnored; }

    // Header and tables
    void addHeader(const DRW_Header*) override {}
    void addLType(const DRW_LType&) override {}
    void addLayer(const DRW_Layer& layer) override {
        m_document.addLayer(QString::fromStdString(layer.name));
    }
    void addDimStyle(const DRW_Dimstyle&) override {}
    void addVport(const DRW_Vport&) override {}
    void addTextStyle(const DRW_Textstyle&) override {}
    void addAppId(const DRW_AppId&) override {}

    // Blocks
    void addBlock(const DRW_Block& block) override {
        flushBlock();
        const QString name = QString::fromStdString(block.name);
        // DWG files deliver model space as a block record
        if (name.compare("*Model_Space", Qt::CaseInsensitive) == 0) return;
        m_inBlock = true;
        m_block = CadBlock();
        m_block.name = name;
        m_block.basePoint = toVertex(block.basePoint);
    }

    void setBlock(const int) override {}

    void endBlock() override {
        flushBlock();
    }

    // Entities
    void addPoint(const DRW_Point& point) override {
        CadEntity e = makeEntity(point, EntityCategory::Point);
        e.vertices.append(toVertex(point.basePoint));
        store(point, e);
    }

    void addLine(const DRW_Line& line) override {
        CadEntity e = makeEntity(line, EntityCategory::Line);
        e.vertices.append(toVertex(line.basePoint));
        e.vertices.append(toVertex(line.secPoint));
        store(line, e);
    }

    void addRay(const DRW_Ray&) override { ignore(); }
    void addXline(const DRW_Xline&) override { ignore(); }

    void addArc(const DRW_Arc& arc) override {
        CadEntity e = makeEntity(arc, EntityCategory::Arc);
        e.center = toVertex(arc.basePoint);
        e.radius = arc.radious;
        e.startAngle = arc.staangle;
        e.endAngle = arc.endangle;
        e.extrusion = toVertex(arc.extPoint);
        store(arc, e);
    }

    void addCircle(const DRW_Circle& circle) override {
        CadEntity e = makeEntity(circle, EntityCategory::Circle);
        e.center = toVertex(circle.basePoint);
        e.radius = circle.radious;
        e.extrusion = toVertex(circle.extPoint);
        store(circle, e);
    }

    void addEllipse(const DRW_Ellipse& ellipse) override {
        CadEntity e = makeEntity(ellipse, EntityCategory::Ellipse);
        e.center = toVertex(ellipse.basePoint);
        e.majorAxis = toVertex(ellipse.secPoint);
        e.ratio = ellipse.ratio;
        e.startAngle = ellipse.staparam;
        e.endAngle = ellipse.endparam;
        store(ellipse, e);
    }

    void addLWPolyline(const DRW_LWPolyline& lwpoly) override {
        CadEntity e = makeEntity(lwpoly, EntityCategory::Polyline);
        e.closed = (lwpoly.flags & 1) != 0;
        e.extrusion = toVertex(lwpoly.extPoint);
        for (const auto& v : lwpoly.vertlist) {
            e.vertices.append(Vertex(v->x, v->y, lwpoly.elevation));
            e.bulges.append(v->bulge);
        }
        store(lwpoly, e);
    }

    void addPolyline(const DRW_Polyline& polyline) override {
        // Polyface and polygon meshes are surfaces, not linework
        if (polyline.flags & (16 | 64)) {
            ignore();
            return;
        }
        CadEntity e = makeEntity(polyline, EntityCategory::Polyline);
        e.closed = (polyline.flags & 1) != 0;
        // 3D polylines are in world coordinates
        if (!(polyline.flags & 8)) e.extrusion = toVertex(polyline.extPoint);
        for (const auto& v : polyline.vertlist) {
            e.vertices.append(toVertex(v->basePoint));
            e.bulges.append(v->bulge);
        }
        store(polyline, e);
    }

    void addSpline(const DRW_Spline* spline) override {
        if (!spline) return;
        CadEntity e = makeEntity(*spline, EntityCategory::Spline);
        e.degree = spline->degree;
        e.closed = (spline->flags & 1) != 0;
        for (double k : spline->knotslist) {
            e.knots.append(k);
        }
        for (const auto& c : spline->controllist) {
            e.vertices.append(toVertex(*c));
        }
        e.weights = splineWeights(*spline);
        for (const auto& f : spline->fitlist) {
            e.fitPoints.append(toVertex(*f));
        }
        store(*spline, e);
    }

    void addKnot(const DRW_Entity&) override {}

    void addInsert(const DRW_Insert& insert) override {
        CadEntity e = makeEntity(insert, EntityCategory::Insert);
        e.blockName = QString::fromStdString(insert.name);
        e.insertPoint = toVertex(insert.basePoint);
        e.xScale = insert.xscale;
        e.yScale = insert.yscale;
        e.rotation = insert.angle;
        e.extrusion = toVertex(insert.extPoint);
        store(insert, e);
    }

    void addTrace(const DRW_Trace& trace) override {
        addFace(trace, true);
    }

    void add3dFace(const DRW_3Dface& face) override {
        addFace(face, false);
    }

    void addSolid(const DRW_Solid& solid) override {
        addFace(solid, true);
    }

    void addMText(const DRW_MText&) override { ignore(); }
    void addText(const DRW_Text&) override { ignore(); }
    void addDimAlign(const DRW_DimAligned*) override { ignore(); }
    void addDimLinear(const DRW_DimLinear*) override { ignore(); }
    void addDimRadial(const DRW_DimRadial*) override { ignore(); }
    void addDimDiametric(const DRW_DimDiametric*) override { ignore(); }
    void addDimAngular(const DRW_DimAngular*) override { ignore(); }
    void addDimAngular3P(const DRW_DimAngular3p*) override { ignore(); }
    void addDimOrdinate(const DRW_DimOrdinate*) override { ignore(); }
    void addLeader(const DRW_Leader*) override { ignore(); }

    void addHatch(const DRW_Hatch* hatch) override {
        if (!hatch) return;
        CadEntity e = makeEntity(*hatch, EntityCategory::Hatch);
        e.extrusion = toVertex(hatch->extPoint);
        for (const auto& loop : hatch->looplist) {
            if (!loop) continue;
            e.loops.append(readLoop(*loop));
        }
        store(*hatch, e);
    }

    void addViewport(const DRW_Viewport&) override { ignore(); }
    void addImage(const DRW_Image*) override { ignore(); }
    void linkImage(const DRW_ImageDef*) override {}
    void addComment(const char*) override {}

    // Write methods (not used for reading)
    void writeHeader(DRW_Header&) override {}
    void writeBlocks() override {}
    void writeBlockRecords() override {}
    void writeEntities() override {}
    void writeLTypes() override {}
    void writeLayers() override {}
    void writeTextstyles() override {}
    void writeVports() override {}
    void writeDimstyles() override {}
    void writeAppId() override {}

    void finish() {
        flushBlock();
    }

private:
    CadEntity makeEntity(const DRW_Entity& source, EntityCategory category) const {
        CadEntity e;
        e.category = category;
        e.layer = layerName(source);
        return e;
    }

    void store(const DRW_Entity& source, const CadEntity& e) {
        ++m_entitiesRead;
        if (m_inBlock) {
            m_block.entities.append(e);
            return;
        }
        // Paper space layouts are not part of the drawing geometry
        if (source.space == DRW::PaperSpace) return;
        m_document.addEntity(e);
    }

    void ignore() {
        ++m_entitiesIgnored;
    }

    void addFace(const DRW_Trace& face, bool zigZag) {
        CadEntity e = makeEntity(face, EntityCategory::Face);
        e.zigZagCorners = zigZag;
        // SOLID and TRACE are planar in their entity frame, 3DFACE is not
        if (zigZag) e.extrusion = toVertex(face.extPoint);
        e.vertices.append(toVertex(face.basePoint));
        e.vertices.append(toVertex(face.secPoint));
        e.vertices.append(toVertex(face.thirdPoint));
        e.vertices.append(toVertex(face.fourPoint));
        store(face, e);
    }

    CadHatchLoop readLoop(const DRW_HatchLoop& loop) const {
        CadHatchLoop out;
        // Bit 2 marks a polyline boundary
        out.isPolyline = (loop.type & 2) != 0;
        for (const auto& item : loop.objlist) {
            if (!item) continue;
            const DRW_Entity* entity = &*item;
            switch (entity->eType) {
                case DRW::LWPOLYLINE: {
                    const auto* pline = static_cast<const DRW_LWPolyline*>(entity);
                    for (const auto& v : pline->vertlist) {
                        out.vertices.append(Vertex(v->x, v->y, 0.0));
                        out.bulges.append(v->bulge);
                    }
                    out.closed = (pline->flags & 1) != 0;
                    out.isPolyline = true;
                    break;
                }
                case DRW::LINE: {
                    const auto* line = static_cast<const DRW_Line*>(entity);
                    CadHatchEdge edge;
                    edge.type = CadHatchEdge::LineEdge;
                    edge.start = toVertex(line->basePoint);
                    edge.end = toVertex(line->secPoint);
                    out.edges.append(edge);
                    break;
                }
                case DRW::ARC: {
                    const auto* arc = static_cast<const DRW_Arc*>(entity);
                    CadHatchEdge edge;
                    edge.type = CadHatchEdge::ArcEdge;
                    edge.center = toVertex(arc->basePoint);
                    edge.radius = arc->radious;
                    edge.startAngle = arc->staangle;
                    edge.endAngle = arc->endangle;
                    edge.ccw = arc->isccw != 0;
                    out.edges.append(edge);
                    break;
                }
                case DRW::ELLIPSE: {
                    const auto* ellipse = static_cast<const DRW_Ellipse*>(entity);
                    CadHatchEdge edge;
                    edge.type = CadHatchEdge::EllipseEdge;
                    edge.center = toVertex(ellipse->basePoint);
                    edge.majorAxis = toVertex(ellipse->secPoint);
                    edge.ratio = ellipse->ratio;
                    edge.startAngle = ellipse->staparam;
                    edge.endAngle = ellipse->endparam;
                    edge.ccw = ellipse->isccw != 0;
                    out.edges.append(edge);
                    break;
                }
                case DRW::SPLINE: {
                    const auto* spline = static_cast<const DRW_Spline*>(entity);
                    CadHatchEdge edge;
                    edge.type = CadHatchEdge::SplineEdge;
                    edge.degree = spline->degree;
                    for (double k : spline->knotslist) {
                        edge.knots.append(k);
                    }
                    for (const auto& c : spline->controllist) {
                        edge.controlPoints.append(toVertex(*c));
                    }
                    edge.weights = splineWeights(*spline);
                    out.edges.append(edge);
                    break;
                }
                default:
                    break;
            }
        }
        return out;
    }

    void flushBlock() {
        if (m_inBlock && !m_block.name.isEmpty()) {
            m_document.addBlock(m_block);
        }
        m_inBlock = false;
        m_block = CadBlock();
    }

    CadDocument& m_document;
    CadBlock m_block;
    bool m_inBlock{false};
    int m_entitiesRead{0};
    int m_entitiesIgnored{0};
};

} // namespace

DxfReader::DxfReader() {}

DxfReader::~DxfReader() {}

bool DxfReader::load(const QString& filePath, CadDocument& document)
{
    document.clear();
    m_lastError.clear();

    QFileInfo info(filePath);
    if (!info.exists() || !info.isFile()) {
        m_lastError = QString("File not found: %1").arg(filePath);
        return false;
    }

    // Extrusions are kept on the entities and applied by the flattener,
    // so libdxfrw is asked not to apply them
    DocumentCollector collector(document);
    const QByteArray path = QFile::encodeName(filePath);
    bool ok = false;

    if (info.suffix().compare("dwg", Qt::CaseInsensitive) == 0) {
        dwgR reader(path.constData());
        ok = reader.read(&collector, false);
        if (!ok) {
            m_lastError = QString("Failed to read DWG file: %1").arg(dwgErrorString(reader.getError()));
        }
    } else {
        dxfRW reader(path.constData());
        ok = reader.read(&collector, false);
        if (!ok) {
            m_lastError = QString("Failed to read DXF file: %1").arg(filePath);
        }
    }

    collector.finish();

    if (!ok) {
        document.clear();
        return false;
    }

    qDebug() << "DxfReader:" << filePath << "entities" << collector.entitiesRead()
             << "ignored" << collector.entitiesIgnored() << "layers" << document.layers().size();
    return true;
}
