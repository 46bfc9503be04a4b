#pragma once

#include "nelder-mead/core/vertex.hpp"
#include "nelder-mead/objective.hpp"

#include <cstddef>
#include <deque>
#include <initializer_list>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tests::helpers {

/**
 * Objective returning a fixed sequence of scores in call order, whatever the
 * position. Lets a test dictate the initial, reflection, expansion,
 * contraction and shrink scores one by one.
 */
class ScriptedObjective final : public neldermead::IObjective {
public:
	explicit ScriptedObjective(std::deque<double> script) : script_(std::move(script)) {}

	double evaluate(const neldermead::core::Position &position) override {
		++calls_;
		evaluated_.push_back(position);
		if (script_.empty()) {
			throw std::logic_error("ScriptedObjective ran out of scripted scores");
		}
		const double score = script_.front();
		script_.pop_front();
		return score;
	}

	std::size_t calls() const {
		return calls_;
	}

	const std::vector<neldermead::core::Position> &evaluated() const {
		return evaluated_;
	}

	std::size_t remaining() const {
		return script_.size();
	}

private:
	std::deque<double> script_;
	std::vector<neldermead::core::Position> evaluated_;
	std::size_t calls_ = 0;
};

inline neldermead::core::Position point(std::initializer_list<double> values) {
	neldermead::core::Position p(static_cast<Eigen::Index>(values.size()));
	Eigen::Index i = 0;
	for (double v : values) {
		p[i++] = v;
	}
	return p;
}

} // namespace tests::helpers
