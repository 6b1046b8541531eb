#ifndef STRUTGRID_SLAB_GRID_OPTIONS_HXX
#define STRUTGRID_SLAB_GRID_OPTIONS_HXX

// Length-unit family of the model; selects the default grid spacing
enum class UnitSystem { Metric, Imperial };

// Exact: line/boundary intersection (default).
// Sampled: classify samples along the line and keep inside runs. Holes narrower
// than the sampling pitch are bridged; this is a known approximation.
enum class ClipStrategy { Exact, Sampled };

// Tuning of the slab grid. Fractions are relative to the target spacing,
// factors are multiples of the model tolerance.
struct SlabGridOptions {
    // Default spacing in model units (millimetres / inches)
    double metricSpacing = 1000.0;
    double imperialSpacing = 48.0;

    // Stations
    int maxSpans = 200;          // per axis
    double snapFraction = 0.4;   // of the regular station spacing
    bool insertPivots = true;    // false: plain uniform grid
    bool snapPivots = true;      // false: every pivot not already a station is inserted

    // Control points
    double projectionFraction = 0.2;   // use the plane projection when closer than this
    double looseToleranceFactor = 5.0; // acceptance tolerance for control points
    bool connectControlPoints = true;
    double connectionRadiusFraction = 0.8;
    int maxConnectors = 4;
    double minCoverageFraction = 0.8;  // of a connector that must survive clipping
    double nodeSeparationFactor = 10.0; // nodes closer than this are the point itself

    // Mesh
    double vertexMergeFactor = 20.0;    // grid node snaps onto a control point vertex

    // Point classification
    double searchFactor = 5.0;
    double acceptFactor = 2.0;

    // Clipping
    ClipStrategy clipStrategy = ClipStrategy::Exact;
    int sampledMinSamples = 20;
    double sampledPitchFactor = 50.0;
    int sampledMaxSamples = 20000;
};

#endif // STRUTGRID_SLAB_GRID_OPTIONS_HXX
