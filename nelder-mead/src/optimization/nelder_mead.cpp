#include "nelder-mead/optimization/nelder_mead.hpp"
#include "nelder-mead/core/errors.hpp"
#include "nelder-mead/utils/logging.hpp"
#include <exception>
#include <utility>

namespace neldermead::optimization {

std::string toString(Operation operation) {
	switch (operation) {
	case Operation::Reflection:
		return "reflection";
	case Operation::Expansion:
		return "expansion";
	case Operation::Contraction:
		return "contraction";
	case Operation::Shrink:
		return "shrink";
	default:
		return "unknown";
	}
}

std::string toString(TerminationReason reason) {
	switch (reason) {
	case TerminationReason::MaxIterations:
		return "max-iterations";
	case TerminationReason::NoImprovement:
		return "no-improvement";
	case TerminationReason::Cancelled:
		return "cancelled";
	default:
		return "unknown";
	}
}

ProgressObserver loggingObserver() {
	return [](const IterationProgress &progress) {
		NELDERMEAD_INFO("Iter {}, best so far: {}", progress.iteration, progress.best_score);
	};
}

CancellationCheck deadlineAfter(std::chrono::steady_clock::duration budget) {
	const auto deadline = std::chrono::steady_clock::now() + budget;
	return [deadline]() { return std::chrono::steady_clock::now() >= deadline; };
}

// --- Optimizer Implementation ---

NelderMeadOptimizer::NelderMeadOptimizer(Options options) : options_(std::move(options)) {}

NelderMeadOptimizer::Result NelderMeadOptimizer::minimize(const ObjectiveFunction &objective,
                                                          const core::Position &initial) const {
	FunctionObjective adapter(objective);
	return minimize(adapter, initial);
}

NelderMeadOptimizer::Result NelderMeadOptimizer::minimize(IObjective &objective,
                                                          const core::Position &initial) const {
	if (initial.size() == 0) {
		NELDERMEAD_ERROR("Nelder-Mead: refusing to start from an empty position");
		throw core::InvalidConfigurationError("Initial position must have at least one coordinate");
	}

	NELDERMEAD_DEBUG("Nelder-Mead: dimension={}, step={}, max_iterations={}, no_improve_break={}, "
	                 "alpha={}, gamma={}, rho={}, sigma={}",
	                 initial.size(), options_.step, options_.max_iterations, options_.no_improve_break,
	                 options_.coefficients.alpha, options_.coefficients.gamma, options_.coefficients.rho,
	                 options_.coefficients.sigma);

	CountingObjective counted(objective);
	std::size_t iterations = 0;

	try {
		auto simplex = core::Simplex::initialize(counted, initial, options_.step);

		// Vertex 0 is still the seed here.
		double previous_best = simplex.best().score;
		std::size_t no_improvement = 0;

		for (;;) {
			simplex.sort();
			const double best = simplex.best().score;

			if (iterations >= options_.max_iterations) {
				return finish(simplex, iterations, counted.evaluations(), TerminationReason::MaxIterations);
			}
			if (cancellation_ && cancellation_()) {
				return finish(simplex, iterations, counted.evaluations(), TerminationReason::Cancelled);
			}
			++iterations;

			if (best < previous_best - options_.no_improve_threshold) {
				no_improvement = 0;
				previous_best = best;
			} else {
				++no_improvement;
			}

			NELDERMEAD_TRACE("Iter {}, best so far: {}", iterations, best);
			if (observer_) {
				observer_(IterationProgress{iterations, best, no_improvement, simplex});
			}

			if (no_improvement >= options_.no_improve_break) {
				return finish(simplex, iterations, counted.evaluations(), TerminationReason::NoImprovement);
			}

			const Operation applied = iterate(simplex, counted, options_.coefficients);
			NELDERMEAD_TRACE("Iter {}: applied {}", iterations, toString(applied));
		}
	} catch (const std::exception &e) {
		NELDERMEAD_ERROR("Nelder-Mead aborted at iteration {} after {} evaluations: {}", iterations,
		                 counted.evaluations(), e.what());
		throw;
	}
}

Operation NelderMeadOptimizer::iterate(core::Simplex &simplex, IObjective &objective,
                                       const Coefficients &coefficients) {
	const core::Position center = simplex.centroid();
	const double best = simplex.best().score;

	core::Position reflected = simplex.projectFromWorst(center, coefficients.alpha);
	const double reflected_score = objective.evaluate(reflected);
	if (best <= reflected_score && reflected_score < simplex.secondWorst().score) {
		simplex.replaceWorst(core::Vertex(std::move(reflected), reflected_score));
		return Operation::Reflection;
	}

	if (reflected_score < best) {
		core::Position expanded = simplex.projectFromWorst(center, coefficients.gamma);
		const double expanded_score = objective.evaluate(expanded);
		if (expanded_score < reflected_score) {
			simplex.replaceWorst(core::Vertex(std::move(expanded), expanded_score));
			return Operation::Expansion;
		}
		simplex.replaceWorst(core::Vertex(std::move(reflected), reflected_score));
		return Operation::Reflection;
	}

	core::Position contracted = simplex.projectFromWorst(center, coefficients.rho);
	const double contracted_score = objective.evaluate(contracted);
	if (contracted_score < simplex.worst().score) {
		simplex.replaceWorst(core::Vertex(std::move(contracted), contracted_score));
		return Operation::Contraction;
	}

	simplex.shrink(objective, coefficients.sigma);
	return Operation::Shrink;
}

NelderMeadOptimizer::Result NelderMeadOptimizer::finish(const core::Simplex &simplex, std::size_t iterations,
                                                        std::size_t evaluations,
                                                        TerminationReason reason) const {
	Result result;
	result.position = simplex.best().position;
	result.score = simplex.best().score;
	result.iterations = iterations;
	result.evaluations = evaluations;
	result.reason = reason;

	NELDERMEAD_DEBUG("Nelder-Mead finished ({}) after {} iterations and {} evaluations, best score {}",
	                 toString(reason), iterations, evaluations, result.score);
	return result;
}

// --- Builder Implementation ---

NelderMeadOptimizerBuilder &NelderMeadOptimizerBuilder::withStep(double step) {
	options_.step = step;
	return *this;
}

NelderMeadOptimizerBuilder &NelderMeadOptimizerBuilder::withNoImproveThreshold(double threshold) {
	options_.no_improve_threshold = threshold;
	return *this;
}

NelderMeadOptimizerBuilder &NelderMeadOptimizerBuilder::withNoImproveBreak(std::size_t iterations) {
	options_.no_improve_break = iterations;
	return *this;
}

NelderMeadOptimizerBuilder &NelderMeadOptimizerBuilder::withMaxIterations(std::size_t iterations) {
	options_.max_iterations = iterations;
	return *this;
}

NelderMeadOptimizerBuilder &NelderMeadOptimizerBuilder::withAlpha(double alpha) {
	options_.coefficients.alpha = alpha;
	return *this;
}

NelderMeadOptimizerBuilder &NelderMeadOptimizerBuilder::withGamma(double gamma) {
	options_.coefficients.gamma = gamma;
	return *this;
}

NelderMeadOptimizerBuilder &NelderMeadOptimizerBuilder::withRho(double rho) {
	options_.coefficients.rho = rho;
	return *this;
}

NelderMeadOptimizerBuilder &NelderMeadOptimizerBuilder::withSigma(double sigma) {
	options_.coefficients.sigma = sigma;
	return *this;
}

NelderMeadOptimizerBuilder &NelderMeadOptimizerBuilder::withCoefficients(const Coefficients &coefficients) {
	options_.coefficients = coefficients;
	return *this;
}

NelderMeadOptimizerBuilder &NelderMeadOptimizerBuilder::withProgressObserver(ProgressObserver observer) {
	observer_ = std::move(observer);
	return *this;
}

NelderMeadOptimizerBuilder &NelderMeadOptimizerBuilder::withCancellation(CancellationCheck check) {
	cancellation_ = std::move(check);
	return *this;
}

std::unique_ptr<NelderMeadOptimizer> NelderMeadOptimizerBuilder::build() {
	auto optimizer = std::make_unique<NelderMeadOptimizer>(options_);
	optimizer->setProgressObserver(observer_);
	optimizer->setCancellationCheck(cancellation_);
	return optimizer;
}

} // namespace neldermead::optimization
