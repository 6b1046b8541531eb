#ifndef STRUTGRID_VEC3_HXX
#define STRUTGRID_VEC3_HXX

#include <array>
#include <cmath>
#include <limits>

// World-space point / vector helpers. Points are plain arrays like Nurbs::Point,
// helpers are static inline functions (no operator overloading).
using Point3 = std::array<double, 3>;

namespace Vec3 {

static inline Point3 add(const Point3& a, const Point3& b) {
    return {a[0] + b[0], a[1] + b[1], a[2] + b[2]};
}

static inline Point3 sub(const Point3& a, const Point3& b) {
    return {a[0] - b[0], a[1] - b[1], a[2] - b[2]};
}

static inline Point3 scale(const Point3& a, double s) {
    return {a[0] * s, a[1] * s, a[2] * s};
}

static inline double dot(const Point3& a, const Point3& b) {
    return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
}

static inline Point3 cross(const Point3& a, const Point3& b) {
    return {a[1] * b[2] - a[2] * b[1],
            a[2] * b[0] - a[0] * b[2],
            a[0] * b[1] - a[1] * b[0]};
}

static inline double norm(const Point3& a) { return std::sqrt(dot(a, a)); }

static inline double distance(const Point3& a, const Point3& b) { return norm(sub(a, b)); }

// Point on segment a->b at parameter t (0 => a, 1 => b)
static inline Point3 lerp(const Point3& a, const Point3& b, double t) {
    return {a[0] + (b[0] - a[0]) * t, a[1] + (b[1] - a[1]) * t, a[2] + (b[2] - a[2]) * t};
}

// Unit vector; returns false (and leaves out untouched) for near-zero input
static inline bool normalized(const Point3& a, Point3& out) {
    const double n = norm(a);
    if (!(n > std::numeric_limits<double>::epsilon())) return false;
    out = scale(a, 1.0 / n);
    return true;
}

static inline bool isFinite(const Point3& a) {
    return std::isfinite(a[0]) && std::isfinite(a[1]) && std::isfinite(a[2]);
}

} // namespace Vec3

// Closed parameter interval [t0, t1]
struct Interval {
    double t0 = 0.0;
    double t1 = 0.0;

    double length() const { return t1 - t0; }
    double mid() const { return 0.5 * (t0 + t1); }
    bool isValid() const { return std::isfinite(t0) && std::isfinite(t1) && t1 > t0; }
    double clamp(double t) const { return t < t0 ? t0 : (t > t1 ? t1 : t); }
};

// Straight tie line between two world points
struct TieLine {
    Point3 from{};
    Point3 to{};

    double length() const { return Vec3::distance(from, to); }
    Point3 pointAt(double t) const { return Vec3::lerp(from, to, t); }
};

#endif // STRUTGRID_VEC3_HXX
