#pragma once

#include "nelder-mead/core/vertex.hpp"
#include "nelder-mead/objective.hpp"
#include <cstddef>
#include <vector>

namespace neldermead::core {

/**
 * @class Simplex
 * @brief The n+1 vertices maintained by the Nelder-Mead driver.
 *
 * The vertex count is fixed at n+1 for the lifetime of the object. Every
 * vertex score comes from the objective; there is no way to insert a vertex
 * with an arbitrary score except through replaceWorst(), which the driver
 * only calls with freshly evaluated points.
 */
class Simplex {
public:
	/**
	 * @brief Builds the starting simplex around a seed point.
	 *
	 * Vertex 0 is the seed, vertex i+1 is the seed moved by @p step along
	 * axis i. All n+1 points are evaluated in that order. The result is not
	 * sorted.
	 *
	 * @throws InvalidConfigurationError if the seed is empty.
	 */
	static Simplex initialize(IObjective &objective, const Position &seed, double step);

	/**
	 * @brief Builds a simplex from explicit positions, evaluating each one.
	 * @throws InvalidConfigurationError unless there are n+1 positions of
	 *         equal, non-zero dimension n.
	 */
	static Simplex fromPositions(IObjective &objective, const std::vector<Position> &positions);

	/**
	 * @brief Stable ascending sort by score.
	 * @throws NonComparableScoreError if any score is NaN.
	 */
	void sort();

	// Mean of every vertex except the last (worst after sort()).
	Position centroid() const;

	// c + coefficient * (c - worst). Reflection, expansion and contraction all use it.
	Position projectFromWorst(const Position &centroid, double coefficient) const;

	void replaceWorst(Vertex vertex);

	// Moves every vertex, the best included, towards the best and re-evaluates it.
	void shrink(IObjective &objective, double sigma);

	std::size_t dimension() const {
		return static_cast<std::size_t>(vertices_.front().position.size());
	}

	std::size_t size() const {
		return vertices_.size();
	}

	const Vertex &best() const {
		return vertices_.front();
	}

	const Vertex &worst() const {
		return vertices_.back();
	}

	const Vertex &secondWorst() const {
		return vertices_[vertices_.size() - 2];
	}

	const Vertex &operator[](std::size_t index) const {
		return vertices_[index];
	}

	const std::vector<Vertex> &vertices() const {
		return vertices_;
	}

private:
	explicit Simplex(std::vector<Vertex> vertices);

	std::vector<Vertex> vertices_;
};

} // namespace neldermead::core
