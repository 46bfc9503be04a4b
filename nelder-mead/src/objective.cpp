#include "nelder-mead/objective.hpp"
#include "nelder-mead/core/errors.hpp"
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace neldermead {

FunctionObjective::FunctionObjective(ObjectiveFunction function) : function_(std::move(function)) {
	if (!function_) {
		throw std::invalid_argument("FunctionObjective requires a callable");
	}
}

double FunctionObjective::evaluate(const core::Position &position) {
	return function_(position);
}

VectorObjective::VectorObjective(VectorObjectiveFunction function) : function_(std::move(function)) {
	if (!function_) {
		throw std::invalid_argument("VectorObjective requires a callable");
	}
}

double VectorObjective::evaluate(const core::Position &position) {
	const std::vector<double> values(position.data(), position.data() + position.size());
	return function_(values);
}

CountingObjective::CountingObjective(IObjective &inner) : inner_(inner) {}

double CountingObjective::evaluate(const core::Position &position) {
	const std::size_t index = evaluations_++;
	try {
		return inner_.evaluate(position);
	} catch (const core::ObjectiveEvaluationError &) {
		throw;
	} catch (const std::exception &e) {
		throw core::ObjectiveEvaluationError("Objective evaluation " + std::to_string(index) +
		                                         " failed: " + e.what(),
		                                     index);
	}
}

} // namespace neldermead
