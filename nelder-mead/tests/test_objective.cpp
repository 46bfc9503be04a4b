#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "common/objective_helpers.hpp"
#include "nelder-mead/core/errors.hpp"
#include "nelder-mead/objective.hpp"

#include <stdexcept>
#include <vector>

using namespace neldermead;
using tests::helpers::point;

TEST_CASE("VectorObjective passes the position as a std::vector", "[objective]") {
	std::vector<double> seen;
	VectorObjective objective([&seen](const std::vector<double> &x) {
		seen = x;
		return x[0] - x[1];
	});

	REQUIRE(objective.evaluate(point({5.0, 2.0})) == Catch::Approx(3.0));
	REQUIRE(seen == std::vector<double>{5.0, 2.0});
}

TEST_CASE("Objective adapters require a callable", "[objective][edge]") {
	REQUIRE_THROWS_AS(FunctionObjective(ObjectiveFunction{}), std::invalid_argument);
	REQUIRE_THROWS_AS(VectorObjective(VectorObjectiveFunction{}), std::invalid_argument);
}

TEST_CASE("CountingObjective counts calls and tags failures", "[objective]") {
	int calls = 0;
	FunctionObjective inner([&calls](const core::Position &x) {
		if (++calls == 3) {
			throw std::domain_error("outside the model domain");
		}
		return x.sum();
	});
	CountingObjective counted(inner);

	REQUIRE(counted.evaluate(point({1.0, 2.0})) == Catch::Approx(3.0));
	REQUIRE(counted.evaluate(point({1.0, 1.0})) == Catch::Approx(2.0));
	REQUIRE(counted.evaluations() == 2);

	try {
		counted.evaluate(point({0.0, 0.0}));
		FAIL("evaluate should have thrown");
	} catch (const core::ObjectiveEvaluationError &e) {
		REQUIRE(e.evaluationIndex() == 2);
	}
	REQUIRE(counted.evaluations() == 3);
}
