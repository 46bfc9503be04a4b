#pragma once

#include <Eigen/Dense>
#include <utility>

namespace neldermead::core {

using Position = Eigen::VectorXd;

/**
 * @brief A simplex vertex: a position and the objective score observed there.
 *
 * The score is only ever produced by evaluating the objective at the position.
 */
struct Vertex {
	Position position;
	double score = 0.0;

	Vertex() = default;
	Vertex(Position pos, double value) : position(std::move(pos)), score(value) {}
};

} // namespace neldermead::core
