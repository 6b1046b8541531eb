#ifndef STRUTGRID_SLAB_GRID_ERROR_HXX
#define STRUTGRID_SLAB_GRID_ERROR_HXX

#include <stdexcept>
#include <string>

enum class SlabGridErrorKind {
    InvalidArgument,             // null/empty region, empty control points, bad numbers
    PreconditionViolation,       // region is not one bounded planar face, no domain
    GeometryConstructionFailure  // assembly produced no usable mesh
};

inline const char* toString(SlabGridErrorKind kind) {
    switch (kind) {
    case SlabGridErrorKind::InvalidArgument: return "InvalidArgument";
    case SlabGridErrorKind::PreconditionViolation: return "PreconditionViolation";
    case SlabGridErrorKind::GeometryConstructionFailure: return "GeometryConstructionFailure";
    }
    return "unknown";
}

// Fail-fast error raised at the generator boundary and by the region factories.
class SlabGridError : public std::runtime_error {
public:
    SlabGridError(SlabGridErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    SlabGridErrorKind kind() const { return kind_; }

private:
    SlabGridErrorKind kind_;
};

#endif // STRUTGRID_SLAB_GRID_ERROR_HXX
