#pragma once

#include "nelder-mead/core/vertex.hpp"
#include <cstddef>
#include <functional>
#include <vector>

namespace neldermead {

using ObjectiveFunction = std::function<double(const core::Position &)>;
using VectorObjectiveFunction = std::function<double(const std::vector<double> &)>;

/**
 * @class IObjective
 * @brief Scalar objective minimized by the optimizer.
 *
 * Implementations are expected to be deterministic: evaluating the same
 * position twice yields the same score.
 */
class IObjective {
public:
	virtual ~IObjective() = default;

	/**
	 * @brief Evaluates the objective at a position.
	 * @param position Point of the search space, of the run's dimension.
	 * @return The score; lower is better.
	 */
	virtual double evaluate(const core::Position &position) = 0;
};

/**
 * @brief Adapts any callable taking an Eigen position.
 */
class FunctionObjective final : public IObjective {
public:
	explicit FunctionObjective(ObjectiveFunction function);

	double evaluate(const core::Position &position) override;

private:
	ObjectiveFunction function_;
};

/**
 * @brief Adapts a callable working on std::vector<double>. The position is
 *        copied into a fresh vector on every evaluation.
 */
class VectorObjective final : public IObjective {
public:
	explicit VectorObjective(VectorObjectiveFunction function);

	double evaluate(const core::Position &position) override;

private:
	VectorObjectiveFunction function_;
};

/**
 * @brief Decorator counting evaluations of the wrapped objective.
 *
 * A std::exception escaping the wrapped objective is rethrown as
 * core::ObjectiveEvaluationError tagged with the index of the failing call.
 */
class CountingObjective final : public IObjective {
public:
	explicit CountingObjective(IObjective &inner);

	double evaluate(const core::Position &position) override;

	std::size_t evaluations() const {
		return evaluations_;
	}

private:
	IObjective &inner_;
	std::size_t evaluations_ = 0;
};

} // namespace neldermead
