#pragma once
#include <Eigen/Dense>

namespace peakquant {
	using Real   = double;
	using Vector = Eigen::VectorXd;
	using Matrix = Eigen::MatrixXd;
	using Index  = Eigen::Index;

	/* a position in plot units (x = profile axis, y = intensity)       */
	struct Point {
		Real x = 0.0;
		Real y = 0.0;
	};
} // namespace peakquant
