#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace neldermead::core {

/**
 * @brief Raised before any evaluation when the problem cannot be set up,
 *        e.g. a zero-length starting position.
 */
class InvalidConfigurationError : public std::invalid_argument {
public:
	explicit InvalidConfigurationError(const std::string &message) : std::invalid_argument(message) {}
};

/**
 * @brief Raised when a vertex score cannot be ordered (NaN), which leaves the
 *        simplex without a best or worst vertex.
 */
class NonComparableScoreError : public std::runtime_error {
public:
	NonComparableScoreError(const std::string &message, std::size_t vertex_index)
	    : std::runtime_error(message), vertex_index_(vertex_index) {}

	std::size_t vertexIndex() const noexcept {
		return vertex_index_;
	}

private:
	std::size_t vertex_index_;
};

/**
 * @brief Raised when the objective itself fails. Carries the 0-based index of
 *        the failing evaluation within the run.
 */
class ObjectiveEvaluationError : public std::runtime_error {
public:
	ObjectiveEvaluationError(const std::string &message, std::size_t evaluation_index)
	    : std::runtime_error(message), evaluation_index_(evaluation_index) {}

	std::size_t evaluationIndex() const noexcept {
		return evaluation_index_;
	}

private:
	std::size_t evaluation_index_;
};

} // namespace neldermead::core
