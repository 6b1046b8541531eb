#ifndef STRUTGRID_GRID_MESH_BUILDER_HXX
#define STRUTGRID_GRID_MESH_BUILDER_HXX

#include "ControlPointIntegrator.hxx"
#include "PlanarRegion.hxx"
#include "PointClassifier.hxx"
#include "QuadMesh.hxx"
#include "StationBuilder.hxx"

#include <vector>

// Assembles the quad mesh over a classified station grid.
// Accepted control points become the first vertices; a grid node within
// mergeDistance of one of them reuses that vertex.
class GridMeshBuilder {
public:
    GridMeshBuilder(const PointClassifier& classifier, double mergeDistance)
        : classifier_(classifier), mergeDistance_(mergeDistance) {}

    // Cell (i, j) becomes a face when its four corners are inside nodes and
    // its parametric center classifies Inside-or-On. Normals are computed and
    // unreferenced vertices removed before returning.
    QuadMesh build(const PlanarRegion& region,
                   const StationGrid& grid,
                   const std::vector<ControlPointRecord>& controlPoints) const;

    // Parametric center test shared with the diagonal lines
    bool cellInside(const PlanarRegion& region, const StationGrid& grid, std::size_t i, std::size_t j) const;

private:
    PointClassifier classifier_;
    double mergeDistance_;
};

#endif // STRUTGRID_GRID_MESH_BUILDER_HXX
