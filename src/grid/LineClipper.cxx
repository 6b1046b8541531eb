#include "LineClipper.hxx"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>

namespace {

// End parameters map to the exact input points
Point3 pointOn(const TieLine& line, double t) {
    if (t <= 0.0) return line.from;
    if (t >= 1.0) return line.to;
    return line.pointAt(t);
}

} // namespace

std::vector<TieLine> LineClipper::clip(const TieLine& line, const PlanarRegion& region) const {
    const double L = line.length();
    if (!std::isfinite(L) || L < classifier_.tolerance()) return {};
    if (strategy_ == ClipStrategy::Sampled) return clipSampled(line, region);
    return clipExact(line, region);
}

int LineClipper::sampleCount(double length) const {
    const double tol = classifier_.tolerance();
    double n = length / (tol * pitchFactor_);
    if (!std::isfinite(n)) n = static_cast<double>(maxSamples_);
    n = std::max(n, static_cast<double>(minSamples_));
    n = std::min(n, static_cast<double>(maxSamples_));
    return std::max(2, static_cast<int>(std::lround(n)));
}

std::vector<TieLine> LineClipper::clipExact(const TieLine& line, const PlanarRegion& region) const {
    const double tol = classifier_.tolerance();
    const double L = line.length();

    std::vector<double> ts;
    try {
        ts = region.intersectLine(line.from, line.to, tol);
    } catch (const std::exception& e) {
        // no hits: the midpoint test below decides for the whole line
        spdlog::debug("clip: boundary intersection failed, using end points only: {}", e.what());
        ts.clear();
    }
    ts.push_back(0.0);
    ts.push_back(1.0);
    std::sort(ts.begin(), ts.end());

    const double tTol = tol / L;
    std::vector<double> params;
    params.reserve(ts.size());
    for (double t : ts) {
        t = std::min(1.0, std::max(0.0, t));
        if (params.empty() || t - params.back() > tTol) params.push_back(t);
    }
    // the last cluster always contains 1
    params.back() = 1.0;

    std::vector<TieLine> pieces;
    for (std::size_t k = 0; k + 1 < params.size(); ++k) {
        const double t0 = params[k], t1 = params[k + 1];
        if ((t1 - t0) * L <= tol) continue;
        const Point3 mid = line.pointAt(0.5 * (t0 + t1));
        if (!classifier_.isInsideOrOn(region, mid)) continue;
        pieces.push_back({pointOn(line, t0), pointOn(line, t1)});
    }
    return pieces;
}

std::vector<TieLine> LineClipper::clipSampled(const TieLine& line, const PlanarRegion& region) const {
    const int n = sampleCount(line.length());

    std::vector<TieLine> pieces;
    int runStart = -1, runEnd = -1;
    auto flush = [&]() {
        if (runStart >= 0 && runEnd > runStart) {
            pieces.push_back({pointOn(line, static_cast<double>(runStart) / n),
                              pointOn(line, static_cast<double>(runEnd) / n)});
        }
        runStart = runEnd = -1;
    };

    for (int i = 0; i <= n; ++i) {
        const Point3 p = pointOn(line, static_cast<double>(i) / n);
        if (classifier_.isInsideOrOn(region, p)) {
            if (runStart < 0) runStart = i;
            runEnd = i;
        } else {
            flush();
        }
    }
    flush();
    return pieces;
}
