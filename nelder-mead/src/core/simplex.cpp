#include "nelder-mead/core/simplex.hpp"
#include "nelder-mead/core/errors.hpp"
#include "nelder-mead/utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace neldermead::core {

Simplex::Simplex(std::vector<Vertex> vertices) : vertices_(std::move(vertices)) {}

Simplex Simplex::initialize(IObjective &objective, const Position &seed, double step) {
	if (seed.size() == 0) {
		throw InvalidConfigurationError("Initial position must have at least one coordinate");
	}

	const auto n = static_cast<std::size_t>(seed.size());
	std::vector<Vertex> vertices;
	vertices.reserve(n + 1);

	vertices.emplace_back(seed, objective.evaluate(seed));
	for (std::size_t i = 0; i < n; ++i) {
		Position point = seed;
		point[static_cast<Eigen::Index>(i)] += step;
		const double score = objective.evaluate(point);
		vertices.emplace_back(std::move(point), score);
	}

	NELDERMEAD_DEBUG("Initial simplex built: dimension={}, step={}", n, step);
	return Simplex(std::move(vertices));
}

Simplex Simplex::fromPositions(IObjective &objective, const std::vector<Position> &positions) {
	if (positions.empty() || positions.front().size() == 0) {
		throw InvalidConfigurationError("Simplex positions must have at least one coordinate");
	}
	const auto n = positions.front().size();
	if (positions.size() != static_cast<std::size_t>(n) + 1) {
		throw InvalidConfigurationError("A simplex of dimension " + std::to_string(n) + " needs " +
		                                std::to_string(n + 1) + " vertices, got " +
		                                std::to_string(positions.size()));
	}
	for (const auto &position : positions) {
		if (position.size() != n) {
			throw InvalidConfigurationError("All simplex vertices must share the same dimension");
		}
	}

	std::vector<Vertex> vertices;
	vertices.reserve(positions.size());
	for (const auto &position : positions) {
		vertices.emplace_back(position, objective.evaluate(position));
	}
	return Simplex(std::move(vertices));
}

void Simplex::sort() {
	for (std::size_t i = 0; i < vertices_.size(); ++i) {
		if (std::isnan(vertices_[i].score)) {
			throw NonComparableScoreError("Vertex " + std::to_string(i) +
			                                  " has a NaN score and cannot be ordered",
			                              i);
		}
	}
	std::stable_sort(vertices_.begin(), vertices_.end(),
	                 [](const Vertex &lhs, const Vertex &rhs) { return lhs.score < rhs.score; });
}

Position Simplex::centroid() const {
	const std::size_t count = vertices_.size() - 1;
	const double divisor = static_cast<double>(count);
	Position center = Position::Zero(vertices_.front().position.size());
	for (std::size_t i = 0; i < count; ++i) {
		center += vertices_[i].position / divisor;
	}
	return center;
}

Position Simplex::projectFromWorst(const Position &centroid, double coefficient) const {
	return centroid + coefficient * (centroid - vertices_.back().position);
}

void Simplex::replaceWorst(Vertex vertex) {
	vertices_.back() = std::move(vertex);
}

void Simplex::shrink(IObjective &objective, double sigma) {
	const Position anchor = vertices_.front().position;
	std::vector<Vertex> shrunk;
	shrunk.reserve(vertices_.size());
	for (const auto &vertex : vertices_) {
		Position point = anchor + sigma * (vertex.position - anchor);
		const double score = objective.evaluate(point);
		shrunk.emplace_back(std::move(point), score);
	}
	vertices_ = std::move(shrunk);
}

} // namespace neldermead::core
