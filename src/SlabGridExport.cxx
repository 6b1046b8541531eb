#include "SlabGridExport.hxx"
#include <gmsh.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <exception>
#include <initializer_list>
#include <map>

namespace {

using PointKey = std::array<long long, 3>;

struct GeoState {
    int nextPointTag = 1;
    int nextCurveTag = 1;
    std::map<PointKey, int> pointMap;
};

// Boundary curves share end points; identical coordinates map to one geo point
int getOrCreatePoint(const Point3& p, GeoState& st) {
    const double scale = 1e9; // tolerance bucket
    const PointKey key{std::llround(p[0] * scale), std::llround(p[1] * scale), std::llround(p[2] * scale)};
    auto it = st.pointMap.find(key);
    if (it != st.pointMap.end()) return it->second;
    const int tag = st.nextPointTag++;
    gmsh::model::geo::addPoint(p[0], p[1], p[2], 0.0, tag);
    st.pointMap.emplace(key, tag);
    return tag;
}

// Linear curves become one geo line per segment; curved ones a spline through
// samples of the curve
void addCurveEntities(const PlanarRegion& region, const Nurbs& c, bool reversed, GeoState& st,
                      std::vector<int>& curveTags) {
    std::vector<Nurbs::Point> uv = c.isLinear() ? c.controlPoints() : c.sample(16);
    if (reversed) std::reverse(uv.begin(), uv.end());
    std::vector<int> ptTags;
    ptTags.reserve(uv.size());
    for (const auto& q : uv) ptTags.push_back(getOrCreatePoint(region.pointAt(q[0], q[1]), st));

    if (c.isLinear()) {
        for (std::size_t k = 0; k + 1 < ptTags.size(); ++k) {
            if (ptTags[k] == ptTags[k + 1]) continue;
            const int tag = st.nextCurveTag++;
            gmsh::model::geo::addLine(ptTags[k], ptTags[k + 1], tag);
            curveTags.push_back(tag);
        }
    } else {
        const int tag = st.nextCurveTag++;
        gmsh::model::geo::addSpline(ptTags, tag);
        curveTags.push_back(tag);
    }
}

void addLoop(const PlanarRegion& region, const Loop& L, GeoState& st, std::vector<int>& curveTags) {
    for (const auto& oc : L) addCurveEntities(region, region.curves()[oc.index], oc.reversed, st, curveTags);
}

// One discrete curve holding every line as a 2-node element
int addLineEntity(const std::vector<TieLine>& lines, std::size_t& nextNode, std::size_t& nextElem) {
    const int tag = gmsh::model::addDiscreteEntity(1);
    std::vector<std::size_t> nodeTags, elemTags, elemNodes;
    std::vector<double> coords;
    for (const auto& l : lines) {
        for (const Point3* p : {&l.from, &l.to}) {
            nodeTags.push_back(nextNode);
            elemNodes.push_back(nextNode);
            ++nextNode;
            coords.insert(coords.end(), p->begin(), p->end());
        }
        elemTags.push_back(nextElem++);
    }
    gmsh::model::mesh::addNodes(1, tag, nodeTags, coords);
    gmsh::model::mesh::addElementsByType(tag, 1, elemTags, elemNodes); // 2-node line
    return tag;
}

} // anonymous namespace

bool SlabGridExport::writeMsh(const PlanarRegion& region,
                              const SlabGridResult& result,
                              const std::string& path,
                              std::string* errorMessage) {
    gmsh::initialize();
    bool ok = true;
    try {
        gmsh::model::add("strutgrid");

        // Outline as geometry
        GeoState st;
        std::vector<int> boundaryCurves;
        addLoop(region, region.topology().outer, st, boundaryCurves);
        for (const auto& H : region.topology().inners) addLoop(region, H, st, boundaryCurves);
        gmsh::model::geo::synchronize();
        gmsh::model::addPhysicalGroup(1, boundaryCurves, -1, "boundary");

        // Quad mesh on a discrete surface
        const QuadMesh& M = result.mesh;
        const int surf = gmsh::model::addDiscreteEntity(2);
        std::vector<std::size_t> nodeTags;
        std::vector<double> coords;
        nodeTags.reserve(M.verts.size());
        coords.reserve(3 * M.verts.size());
        for (std::size_t i = 0; i < M.verts.size(); ++i) {
            nodeTags.push_back(i + 1);
            coords.insert(coords.end(), M.verts[i].begin(), M.verts[i].end());
        }
        gmsh::model::mesh::addNodes(2, surf, nodeTags, coords);

        std::vector<std::size_t> quadTags, quadNodes;
        quadTags.reserve(M.faces.size());
        quadNodes.reserve(4 * M.faces.size());
        for (std::size_t f = 0; f < M.faces.size(); ++f) {
            quadTags.push_back(f + 1);
            for (int v : M.faces[f]) quadNodes.push_back(static_cast<std::size_t>(v) + 1);
        }
        gmsh::model::mesh::addElementsByType(surf, 3, quadTags, quadNodes); // 4-node quadrangle
        gmsh::model::addPhysicalGroup(2, {surf}, -1, "slab");

        std::size_t nextNode = M.verts.size() + 1;
        std::size_t nextElem = M.faces.size() + 1;
        const int ortho = addLineEntity(result.orthogonalLines, nextNode, nextElem);
        gmsh::model::addPhysicalGroup(1, {ortho}, -1, "orthogonal");
        if (!result.diagonalLines.empty()) {
            const int diag = addLineEntity(result.diagonalLines, nextNode, nextElem);
            gmsh::model::addPhysicalGroup(1, {diag}, -1, "diagonal");
        }

        gmsh::write(path);
        spdlog::debug("wrote {} ({} quads, {} + {} lines)", path, M.nfaces,
                      result.orthogonalLines.size(), result.diagonalLines.size());
    } catch (const std::exception& e) {
        if (errorMessage) *errorMessage = e.what();
        ok = false;
    }
    gmsh::finalize();
    return ok;
}
