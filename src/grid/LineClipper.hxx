#ifndef STRUTGRID_LINE_CLIPPER_HXX
#define STRUTGRID_LINE_CLIPPER_HXX

#include "PlanarRegion.hxx"
#include "PointClassifier.hxx"
#include "SlabGridOptions.hxx"
#include "Vec3.hxx"

#include <vector>

// Clips straight tie lines to a trimmed region. Kept pieces are ordered along
// the line, never span a hole and have midpoints that classify Inside-or-On.
class LineClipper {
public:
    explicit LineClipper(const PointClassifier& classifier,
                         ClipStrategy strategy = ClipStrategy::Exact,
                         int minSamples = 20,
                         double pitchFactor = 50.0,
                         int maxSamples = 20000)
        : classifier_(classifier), strategy_(strategy),
          minSamples_(minSamples), pitchFactor_(pitchFactor), maxSamples_(maxSamples) {}

    // Lines shorter than the classifier tolerance give an empty result
    std::vector<TieLine> clip(const TieLine& line, const PlanarRegion& region) const;

    ClipStrategy strategy() const { return strategy_; }

    // Number of samples the sampled strategy takes along a line of this length
    int sampleCount(double length) const;

private:
    std::vector<TieLine> clipExact(const TieLine& line, const PlanarRegion& region) const;
    std::vector<TieLine> clipSampled(const TieLine& line, const PlanarRegion& region) const;

    PointClassifier classifier_;
    ClipStrategy strategy_;
    int minSamples_;
    double pitchFactor_;
    int maxSamples_;
};

#endif // STRUTGRID_LINE_CLIPPER_HXX
