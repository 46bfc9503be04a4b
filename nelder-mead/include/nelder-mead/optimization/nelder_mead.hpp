#pragma once

#include "nelder-mead/core/simplex.hpp"
#include "nelder-mead/core/vertex.hpp"
#include "nelder-mead/objective.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <utility>

namespace neldermead::optimization {

/**
 * @brief The four classical simplex coefficients.
 *
 * Values are applied literally; nothing is validated or clamped. A negative
 * rho, for instance, places the contracted point on the far side of the
 * centroid.
 */
struct Coefficients {
	double alpha = 1.0; // reflection
	double gamma = 2.0; // expansion
	double rho = 0.5;   // contraction
	double sigma = 0.5; // shrink
};

enum class Operation { Reflection, Expansion, Contraction, Shrink };

enum class TerminationReason { MaxIterations, NoImprovement, Cancelled };

std::string toString(Operation operation);
std::string toString(TerminationReason reason);

/**
 * @brief Snapshot handed to the progress observer once per counted iteration.
 *
 * The simplex reference is sorted and only valid during the callback.
 */
struct IterationProgress {
	std::size_t iteration;
	double best_score;
	std::size_t no_improvement_count;
	const core::Simplex &simplex;
};

using ProgressObserver = std::function<void(const IterationProgress &)>;

// Returns true to stop the run. Consulted once per iteration.
using CancellationCheck = std::function<bool()>;

/**
 * @brief Observer logging "Iter {n}, best so far: {score}" at info level.
 */
ProgressObserver loggingObserver();

/**
 * @brief Cancellation check that fires once @p budget has elapsed, measured
 *        on the steady clock from the moment this function is called.
 */
CancellationCheck deadlineAfter(std::chrono::steady_clock::duration budget);

/**
 * @class NelderMeadOptimizer
 * @brief Derivative-free local minimizer using the Nelder-Mead simplex method.
 *
 * Each iteration sorts the simplex, checks the termination rules and then
 * applies exactly one of reflection, expansion, contraction or shrink. The
 * run is sequential: the objective is called once per new vertex and never
 * concurrently.
 */
class NelderMeadOptimizer {
public:
	struct Options {
		double step = 0.1;                  // initial simplex offset along each axis
		double no_improve_threshold = 1e-5; // minimum gain that counts as progress
		std::size_t no_improve_break = 10;  // stop after this many iterations without progress
		std::size_t max_iterations = 100;
		Coefficients coefficients;
	};

	struct Result {
		core::Position position;
		double score = std::numeric_limits<double>::quiet_NaN();
		std::size_t iterations = 0;
		std::size_t evaluations = 0;
		TerminationReason reason = TerminationReason::MaxIterations;
	};

	NelderMeadOptimizer() = default;
	explicit NelderMeadOptimizer(Options options);

	/**
	 * @brief Minimizes @p objective starting from @p initial.
	 *
	 * @throws core::InvalidConfigurationError if @p initial is empty.
	 * @throws core::NonComparableScoreError if a NaN score reaches the simplex.
	 * @throws core::ObjectiveEvaluationError if the objective throws.
	 */
	Result minimize(IObjective &objective, const core::Position &initial) const;

	Result minimize(const ObjectiveFunction &objective, const core::Position &initial) const;

	/**
	 * @brief Applies one transformation to a simplex sorted by the caller.
	 *
	 * Computes the centroid of all but the worst vertex and tries reflection,
	 * expansion, contraction and shrink in that order. Exactly one of them
	 * mutates the simplex. The simplex is left unsorted.
	 *
	 * @return The operation whose point was kept. When expansion is tried but
	 *         the reflected point wins, Reflection is returned.
	 */
	static Operation iterate(core::Simplex &simplex, IObjective &objective, const Coefficients &coefficients);

	void setProgressObserver(ProgressObserver observer) {
		observer_ = std::move(observer);
	}

	void setCancellationCheck(CancellationCheck check) {
		cancellation_ = std::move(check);
	}

	const Options &options() const {
		return options_;
	}

private:
	Result finish(const core::Simplex &simplex, std::size_t iterations, std::size_t evaluations,
	              TerminationReason reason) const;

	Options options_;
	ProgressObserver observer_;
	CancellationCheck cancellation_;
};

/**
 * @class NelderMeadOptimizerBuilder
 * @brief A builder for fluently configuring NelderMeadOptimizer instances.
 */
class NelderMeadOptimizerBuilder {
public:
	NelderMeadOptimizerBuilder &withStep(double step);
	NelderMeadOptimizerBuilder &withNoImproveThreshold(double threshold);
	NelderMeadOptimizerBuilder &withNoImproveBreak(std::size_t iterations);
	NelderMeadOptimizerBuilder &withMaxIterations(std::size_t iterations);
	NelderMeadOptimizerBuilder &withAlpha(double alpha);
	NelderMeadOptimizerBuilder &withGamma(double gamma);
	NelderMeadOptimizerBuilder &withRho(double rho);
	NelderMeadOptimizerBuilder &withSigma(double sigma);
	NelderMeadOptimizerBuilder &withCoefficients(const Coefficients &coefficients);
	NelderMeadOptimizerBuilder &withProgressObserver(ProgressObserver observer);
	NelderMeadOptimizerBuilder &withCancellation(CancellationCheck check);

	/**
	 * @brief Creates a new optimizer with the accumulated settings.
	 * @return A unique pointer to the configured optimizer.
	 */
	std::unique_ptr<NelderMeadOptimizer> build();

private:
	NelderMeadOptimizer::Options options_;
	ProgressObserver observer_;
	CancellationCheck cancellation_;
};

} // namespace neldermead::optimization
