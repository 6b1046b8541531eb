#include "Nurbs.hxx"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {
template <class T>
bool is_non_decreasing(const std::vector<T>& v) {
	for (std::size_t i = 1; i < v.size(); ++i) {
		if (v[i] < v[i - 1]) return false;
	}
	return true;
}
}

Nurbs::Nurbs() = default;

Nurbs::Nurbs(int degree,
			 const std::vector<Point>& controlPoints,
			 const std::vector<double>& knotVector,
			 const std::vector<double>& weights)
	: p_(degree),
	  ctrlPts_(controlPoints),
	  weights_(weights),
	  knots_(knotVector) {
	ensureWeightsSized();
}

Nurbs Nurbs::line(const Point& a, const Point& b) {
	return Nurbs(1, std::vector<Point>{a, b}, std::vector<double>{0.0, 0.0, 1.0, 1.0});
}

int Nurbs::degree() const { return p_; }

std::size_t Nurbs::numControlPoints() const { return ctrlPts_.size(); }

const std::vector<Nurbs::Point>& Nurbs::controlPoints() const { return ctrlPts_; }

const std::vector<double>& Nurbs::weights() const { return weights_; }

const std::vector<double>& Nurbs::knots() const { return knots_; }

void Nurbs::setWeights(const std::vector<double>& weights) {
	weights_ = weights;
	ensureWeightsSized();
}

bool Nurbs::isValid(std::string* reason) const {
	if (p_ < 0) {
		if (reason) *reason = "Degree must be non-negative";
		return false;
	}
	if (ctrlPts_.empty()) {
		if (reason) *reason = "Control points are empty";
		return false;
	}
	for (const auto& P : ctrlPts_) {
		if (!std::isfinite(P[0]) || !std::isfinite(P[1])) {
			if (reason) *reason = "Control points must be finite";
			return false;
		}
	}
	if (weights_.size() != ctrlPts_.size()) {
		if (reason) *reason = "Weights size must match number of control points";
		return false;
	}
	for (double w : weights_) {
		if (!(w > 0.0)) {
			if (reason) *reason = "Weights must be strictly positive";
			return false;
		}
	}
	const int n = static_cast<int>(ctrlPts_.size()) - 1;
	if (static_cast<int>(knots_.size()) != n + p_ + 2) {
		if (reason) *reason = "Knot vector size must be n + p + 2";
		return false;
	}
	if (!is_non_decreasing(knots_)) {
		if (reason) *reason = "Knot vector must be non-decreasing";
		return false;
	}
	if (uMax() <= uMin()) {
		if (reason) *reason = "Invalid parameter domain";
		return false;
	}
	return true;
}

bool Nurbs::isClamped(double tol) const {
	if (ctrlPts_.empty()) return false;
	const int n = static_cast<int>(ctrlPts_.size()) - 1;
	const int m = n + p_ + 1;
	if (static_cast<int>(knots_.size()) != m + 1) return false;
	const double u0 = knots_.front();
	const double um = knots_.back();
	for (int i = 0; i <= p_; ++i) {
		if (std::fabs(knots_[static_cast<std::size_t>(i)] - u0) > tol) return false;
		if (std::fabs(knots_[static_cast<std::size_t>(m - i)] - um) > tol) return false;
	}
	return true;
}

bool Nurbs::isLinear() const {
	// Clamped degree 1: the curve runs exactly along its control polygon
	return p_ == 1 && isClamped();
}

double Nurbs::uMin() const {
	if (knots_.empty()) return 0.0;
	return knots_.front();
}

double Nurbs::uMax() const {
	if (knots_.empty()) return 0.0;
	return knots_.back();
}

Nurbs::Point Nurbs::evaluate(double u) const {
	std::string why;
	if (!isValid(&why)) {
		throw std::runtime_error(std::string("Invalid NURBS: ") + why);
	}
	if (!(u >= uMin() && u <= uMax())) {
		throw std::runtime_error("Parameter u out of range");
	}
	const int n = static_cast<int>(ctrlPts_.size()) - 1;
	const int span = (u == uMax()) ? n : findSpan(u);

	std::vector<double> N;
	basisFuns(span, u, N);

	Point C{};
	double wsum = 0.0;
	for (int j = 0; j <= p_; ++j) {
		const std::size_t idx = static_cast<std::size_t>(span - p_ + j);
		const double coeff = N[static_cast<std::size_t>(j)] * weights_[idx];
		C[0] += coeff * ctrlPts_[idx][0];
		C[1] += coeff * ctrlPts_[idx][1];
		wsum += coeff;
	}
	if (wsum == 0.0) {
		throw std::runtime_error("Zero weight sum during evaluation");
	}
	C[0] /= wsum; C[1] /= wsum;
	return C;
}

std::vector<Nurbs::Point> Nurbs::sample(int count) const {
	if (count < 2) throw std::runtime_error("Nurbs::sample: count must be >= 2");
	std::vector<Point> pts;
	pts.reserve(static_cast<std::size_t>(count));
	const double u0 = uMin();
	const double u1 = uMax();
	for (int s = 0; s < count; ++s) {
		// last sample hits uMax() exactly so closed loops stay closed
		const double u = (s == count - 1) ? u1 : u0 + (u1 - u0) * static_cast<double>(s) / (count - 1);
		pts.push_back(evaluate(u));
	}
	return pts;
}

Nurbs::Box Nurbs::controlBox() const {
	Box b;
	if (ctrlPts_.empty()) return b;
	b.lo = ctrlPts_.front();
	b.hi = ctrlPts_.front();
	for (const auto& P : ctrlPts_) {
		b.lo[0] = std::min(b.lo[0], P[0]); b.lo[1] = std::min(b.lo[1], P[1]);
		b.hi[0] = std::max(b.hi[0], P[0]); b.hi[1] = std::max(b.hi[1], P[1]);
	}
	return b;
}

int Nurbs::findSpan(double u) const {
	const int n = static_cast<int>(ctrlPts_.size()) - 1;
	if (u >= knots_[static_cast<std::size_t>(n + 1)]) return n;
	if (u <= knots_[static_cast<std::size_t>(p_)]) return p_;

	int low = p_;
	int high = n + 1;
	int mid = (low + high) / 2;
	while (u < knots_[static_cast<std::size_t>(mid)] || u >= knots_[static_cast<std::size_t>(mid + 1)]) {
		if (u < knots_[static_cast<std::size_t>(mid)]) {
			high = mid;
		} else {
			low = mid;
		}
		mid = (low + high) / 2;
	}
	return mid;
}

// Cox-de Boor basis functions N_{span-p..span, p}(u) (The NURBS Book, A2.2)
void Nurbs::basisFuns(int span, double u, std::vector<double>& N) const {
	const std::size_t p = static_cast<std::size_t>(p_);
	N.assign(p + 1, 0.0);
	std::vector<double> left(p + 1, 0.0), right(p + 1, 0.0);
	N[0] = 1.0;
	for (std::size_t j = 1; j <= p; ++j) {
		left[j] = u - knots_[static_cast<std::size_t>(span) + 1 - j];
		right[j] = knots_[static_cast<std::size_t>(span) + j] - u;
		double saved = 0.0;
		for (std::size_t r = 0; r < j; ++r) {
			const double denom = right[r + 1] + left[j - r];
			const double temp = (denom != 0.0) ? N[r] / denom : 0.0;
			N[r] = saved + right[r + 1] * temp;
			saved = left[j - r] * temp;
		}
		N[j] = saved;
	}
}

void Nurbs::ensureWeightsSized() {
	if (weights_.size() != ctrlPts_.size()) {
		weights_.assign(ctrlPts_.size(), 1.0);
	}
}
