#pragma once
#include <Eigen/Dense>
#include <cstddef>
namespace linecraft {
	using Real    = double;
	using Vector  = Eigen::VectorXd;
	using CurveId = std::size_t;
} // namespace linecraft
