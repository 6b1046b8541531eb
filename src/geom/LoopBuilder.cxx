#include "LoopBuilder.hxx"

#include <limits>

namespace {
inline double dist2(const Nurbs::Point& a, const Nurbs::Point& b) {
    const double dx = a[0] - b[0];
    const double dy = a[1] - b[1];
    return dx * dx + dy * dy;
}

// Closest unused curve end to 'tail' within tol; choiceRev is set when the curve
// has to be traversed backwards to continue the chain.
bool findNextCurve(const std::vector<Nurbs>& curves,
                   const std::vector<char>& used,
                   double tol,
                   const Nurbs::Point& tail,
                   std::size_t& choiceIdx,
                   bool& choiceRev) {
    const std::size_t n = curves.size();
    double bestD2 = std::numeric_limits<double>::infinity();
    std::size_t bestIdx = n;
    bool bestRev = false;
    for (std::size_t i = 0; i < n; ++i) {
        if (used[i]) continue;
        const double d2s = dist2(tail, LoopBuilder::startPoint(curves[i], false));
        const double d2e = dist2(tail, LoopBuilder::endPoint(curves[i], false));
        if (d2s < bestD2 && d2s <= tol * tol) { bestD2 = d2s; bestIdx = i; bestRev = false; }
        if (d2e < bestD2 && d2e <= tol * tol) { bestD2 = d2e; bestIdx = i; bestRev = true; }
    }
    if (bestIdx == n) return false;
    choiceIdx = bestIdx;
    choiceRev = bestRev;
    return true;
}
} // anonymous namespace

Nurbs::Point LoopBuilder::startPoint(const Nurbs& c, bool reversed) {
    return reversed ? c.evaluate(c.uMax()) : c.evaluate(c.uMin());
}

Nurbs::Point LoopBuilder::endPoint(const Nurbs& c, bool reversed) {
    return reversed ? c.evaluate(c.uMin()) : c.evaluate(c.uMax());
}

bool LoopBuilder::near(const Nurbs::Point& a, const Nurbs::Point& b, double tol) {
    return dist2(a, b) <= tol * tol;
}

std::vector<Loop> LoopBuilder::buildClosedLoops(const std::vector<Nurbs>& curves,
                                                std::vector<std::size_t>* leftovers) const {
    const std::size_t n = curves.size();
    std::vector<char> used(n, 0);
    std::vector<Loop> loops;
    // Invalid curves cannot be evaluated; they never take part in a loop
    for (std::size_t i = 0; i < n; ++i) if (!curves[i].isValid()) used[i] = 1;

    for (std::size_t seed = 0; seed < n; ++seed) {
        if (used[seed]) continue;

        Loop current;
        current.push_back({seed, false});
        used[seed] = 1;

        const auto head = startPoint(curves[seed], false);
        auto tail = endPoint(curves[seed], false);

        // Greedily append until the chain closes or gets stuck. A single closed
        // curve (full circle) closes immediately.
        bool closed = false;
        while (true) {
            if (near(tail, head, tol_)) { closed = true; break; }
            std::size_t nextIdx = 0;
            bool nextRev = false;
            if (!findNextCurve(curves, used, tol_, tail, nextIdx, nextRev)) break;
            current.push_back({nextIdx, nextRev});
            used[nextIdx] = 1;
            tail = endPoint(curves[nextIdx], nextRev);
        }

        if (closed) {
            loops.push_back(std::move(current));
        } else {
            // Rollback: the curves of this attempt may still close from another seed
            for (const auto& oc : current) used[oc.index] = 0;
        }
    }

    if (leftovers) {
        leftovers->clear();
        std::vector<char> inLoop(n, 0);
        for (const auto& L : loops) for (const auto& oc : L) inLoop[oc.index] = 1;
        for (std::size_t i = 0; i < n; ++i) if (!inLoop[i]) leftovers->push_back(i);
    }
    return loops;
}
