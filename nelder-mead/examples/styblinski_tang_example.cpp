#include "nelder-mead/optimization/nelder_mead.hpp"
#include "nelder-mead/quick.hpp"
#include "nelder-mead/utils/logging.hpp"
#include "nelder-mead/utils/test_functions.hpp"
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace neldermead;

namespace {

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

void printResult(const optimization::NelderMeadOptimizer::Result &result) {
	std::cout << std::setprecision(10);
	std::cout << "  position: [";
	for (Eigen::Index i = 0; i < result.position.size(); ++i) {
		std::cout << (i == 0 ? "" : ", ") << result.position[i];
	}
	std::cout << "]\n";
	std::cout << "  score:       " << result.score << "\n";
	std::cout << "  iterations:  " << result.iterations << "\n";
	std::cout << "  evaluations: " << result.evaluations << "\n";
	std::cout << "  stopped by:  " << optimization::toString(result.reason) << "\n";
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::info);

	printHeader("Styblinski-Tang (2-D) with progress logging");
	auto optimizer = optimization::NelderMeadOptimizerBuilder()
	                     .withStep(0.1)
	                     .withNoImproveThreshold(10e-6)
	                     .withNoImproveBreak(10)
	                     .withMaxIterations(100)
	                     .withCoefficients({1.0, 2.0, -0.5, 0.5})
	                     .withProgressObserver(optimization::loggingObserver())
	                     .build();
	const auto result = optimizer->minimize(utils::test_functions::styblinskiTang, Eigen::Vector2d(0.0, 0.0));
	printResult(result);

	printHeader("Same problem through the flat entry point");
	const auto styblinski_tang = [](const std::vector<double> &x) {
		double total = 0.0;
		for (double xi : x) {
			total += xi * xi * xi * xi - 16.0 * xi * xi + 5.0 * xi;
		}
		return 0.5 * total;
	};
	const auto [position, score] =
	    quick::nelderMead(styblinski_tang, {0.0, 0.0}, 0.1, 10e-6, 10, 100, 1.0, 2.0, -0.5, 0.5);
	std::cout << "  position: [" << position[0] << ", " << position[1] << "]\n";
	std::cout << "  score:    " << score << "\n";

	return 0;
}
