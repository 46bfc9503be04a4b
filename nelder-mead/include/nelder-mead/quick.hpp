#pragma once

#include "nelder-mead/core/vertex.hpp"
#include "nelder-mead/objective.hpp"
#include "nelder-mead/optimization/nelder_mead.hpp"
#include <cstddef>
#include <utility>
#include <vector>

namespace neldermead::quick {

/**
 * @brief One-call Nelder-Mead minimization on plain vectors.
 *
 * Runs the optimizer silently with the given settings and returns the best
 * position found together with its score.
 *
 * @param objective Function to minimize, called with vectors of x_start's size.
 * @param x_start Initial position. Must not be empty.
 * @param step Offset applied along each axis to build the initial simplex.
 * @param no_improve_thr Minimum decrease of the best score that counts as progress.
 * @param no_improv_break Stop after this many consecutive iterations without progress.
 * @param max_iter Always stop after this many iterations.
 * @param alpha Reflection coefficient, usually 1.0.
 * @param gamma Expansion coefficient, usually 2.0.
 * @param rho Contraction coefficient, usually 0.5.
 * @param sigma Shrink coefficient, usually 0.5.
 */
inline std::pair<std::vector<double>, double> nelderMead(const VectorObjectiveFunction &objective,
                                                         const std::vector<double> &x_start, double step,
                                                         double no_improve_thr, std::size_t no_improv_break,
                                                         std::size_t max_iter, double alpha, double gamma,
                                                         double rho, double sigma) {
	optimization::NelderMeadOptimizer::Options options;
	options.step = step;
	options.no_improve_threshold = no_improve_thr;
	options.no_improve_break = no_improv_break;
	options.max_iterations = max_iter;
	options.coefficients = optimization::Coefficients{alpha, gamma, rho, sigma};

	VectorObjective adapter(objective);
	const core::Position initial =
	    Eigen::Map<const Eigen::VectorXd>(x_start.data(), static_cast<Eigen::Index>(x_start.size()));
	const auto result = optimization::NelderMeadOptimizer(options).minimize(adapter, initial);

	return {std::vector<double>(result.position.data(), result.position.data() + result.position.size()),
	        result.score};
}

} // namespace neldermead::quick
