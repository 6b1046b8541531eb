#include "GridMeshBuilder.hxx"

#include <spdlog/spdlog.h>

#include <limits>

bool GridMeshBuilder::cellInside(const PlanarRegion& region, const StationGrid& grid,
                                 std::size_t i, std::size_t j) const {
    const double uc = 0.5 * (grid.u[i] + grid.u[i + 1]);
    const double vc = 0.5 * (grid.v[j] + grid.v[j + 1]);
    return classifier_.isInsideOrOn(region, region.pointAt(uc, vc));
}

QuadMesh GridMeshBuilder::build(const PlanarRegion& region,
                                const StationGrid& grid,
                                const std::vector<ControlPointRecord>& controlPoints) const {
    QuadMesh mesh;

    std::vector<int> controlVerts;
    for (const auto& rec : controlPoints) {
        if (rec.accepted) controlVerts.push_back(mesh.addVertex(rec.point));
    }

    // grid node -> mesh vertex, -1 outside
    std::vector<int> nodeVert(grid.size(), -1);
    int merged = 0;
    for (std::size_t k = 0; k < grid.size(); ++k) {
        if (!grid.inside[k]) continue;
        const Point3& p = grid.points[k];

        int best = -1;
        double bestDist = std::numeric_limits<double>::infinity();
        for (int cv : controlVerts) {
            const double d = Vec3::distance(p, mesh.verts[static_cast<std::size_t>(cv)]);
            if (d <= mergeDistance_ && d < bestDist) {
                best = cv;
                bestDist = d;
            }
        }
        if (best >= 0) {
            nodeVert[k] = best;
            ++merged;
        } else {
            nodeVert[k] = mesh.addVertex(p);
        }
    }

    const std::size_t nu = grid.u.size(), nv = grid.v.size();
    for (std::size_t i = 0; i + 1 < nu; ++i) {
        for (std::size_t j = 0; j + 1 < nv; ++j) {
            const int a = nodeVert[grid.index(i, j)];
            const int b = nodeVert[grid.index(i + 1, j)];
            const int c = nodeVert[grid.index(i + 1, j + 1)];
            const int d = nodeVert[grid.index(i, j + 1)];
            if (a < 0 || b < 0 || c < 0 || d < 0) continue;
            // two corners collapsed onto one control point vertex
            if (a == b || a == c || a == d || b == c || b == d || c == d) continue;
            if (!cellInside(region, grid, i, j)) continue;
            mesh.addQuad(a, b, c, d);
        }
    }

    mesh.computeNormals();
    const int removed = mesh.compact();
    spdlog::debug("grid mesh: {} faces, {} vertices ({} nodes merged into control points, {} unused removed)",
                  mesh.nfaces, mesh.nv, merged, removed);
    return mesh;
}
