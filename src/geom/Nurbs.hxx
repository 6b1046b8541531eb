#ifndef STRUTGRID_NURBS_HXX
#define STRUTGRID_NURBS_HXX

#include <array>
#include <cstddef>
#include <string>
#include <vector>

// A lightweight 2D NURBS curve used for trimming boundaries in plane coordinates.
// Notes:
// - Control points are (u, v) pairs in the plane frame of the owning region.
// - If weights are omitted, unit weights are assumed.
// - Knot vector is non-decreasing with size n + p + 2.
// - A degree 1 curve is its control polygon; isLinear() lets callers use exact
//   segment geometry instead of sampling.
class Nurbs {
public:
	using Point = std::array<double, 2>;

	struct Box {
		Point lo{};
		Point hi{};
	};

	Nurbs();
	Nurbs(int degree,
		  const std::vector<Point>& controlPoints,
		  const std::vector<double>& knotVector,
		  const std::vector<double>& weights = {});

	// Straight edge a -> b (degree 1, knots {0,0,1,1})
	static Nurbs line(const Point& a, const Point& b);

	int degree() const;
	std::size_t numControlPoints() const;

	const std::vector<Point>& controlPoints() const;
	const std::vector<double>& weights() const;
	const std::vector<double>& knots() const;

	void setWeights(const std::vector<double>& weights);

	bool isValid(std::string* reason = nullptr) const;
	bool isClamped(double tol = 0.0) const;
	bool isLinear() const;

	double uMin() const;
	double uMax() const;

	// Throws std::runtime_error if the curve is invalid or u is out of range
	Point evaluate(double u) const;

	// count >= 2 points uniformly spaced in parameter, both ends included
	std::vector<Point> sample(int count) const;

	// Box of the control points; contains the curve (convex hull property)
	Box controlBox() const;

private:
	int findSpan(double u) const;
	void basisFuns(int span, double u, std::vector<double>& N) const;
	void ensureWeightsSized();

	int p_{0};
	std::vector<Point> ctrlPts_;
	std::vector<double> weights_;
	std::vector<double> knots_;
};

#endif // STRUTGRID_NURBS_HXX
