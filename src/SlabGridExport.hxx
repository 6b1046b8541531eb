#ifndef STRUTGRID_SLAB_GRID_EXPORT_HXX
#define STRUTGRID_SLAB_GRID_EXPORT_HXX

#include "PlanarRegion.hxx"
#include "SlabGridGenerator.hxx"
#include <string>

class SlabGridExport {
public:
    // Write the slab outline, quad mesh and tie lines to a Gmsh model and save it
    // (format from the extension, e.g. .msh). Physical groups: "boundary",
    // "slab", "orthogonal", "diagonal".
    // Returns false and fills errorMessage when Gmsh reports an error.
    static bool writeMsh(const PlanarRegion& region,
                         const SlabGridResult& result,
                         const std::string& path,
                         std::string* errorMessage = nullptr);
};

#endif // STRUTGRID_SLAB_GRID_EXPORT_HXX
