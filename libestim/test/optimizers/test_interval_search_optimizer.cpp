#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libestim/objectives/i_objective.hpp"
#include "libestim/objectives/least_squares_loss.hpp"
#include "libestim/optimizers/interval_search_optimizer.hpp"
#include "libestim/optimizers/least_squares_optimizer.hpp"

#include <cmath>
#include <limits>

using namespace libestim;
using namespace libestim::optimizers;

namespace {

core::IntervalSearchOptions WidthRule() {
	auto opts = core::IntervalSearchOptions::Defaults(1e-8, 2000);
	opts.stopping_rule = core::StoppingRule::BracketWidth;
	return opts;
}

} // namespace

TEST_CASE("IntervalSearchOptimizer - 1-D objective", "[optimizer][interval]") {
	IntervalSearchOptimizer optimizer(-2.0, 2.0, 11, WidthRule());
	objectives::FunctionObjective objective(1, [](const Eigen::VectorXd &x) { return (x(0) - 0.7) * (x(0) - 0.7); });

	auto result = optimizer.Minimize(objective, Eigen::VectorXd::Zero(1));

	REQUIRE(optimizer.GetName() == "interval_search");
	REQUIRE(result.converged);
	REQUIRE(result.message == "converged");
	REQUIRE_THAT(result.x(0), Catch::Matchers::WithinAbs(0.7, 1e-6));
	REQUIRE(result.function_evaluations >= result.iterations);
}

TEST_CASE("IntervalSearchOptimizer - Same seed, same answer", "[optimizer][interval]") {
	IntervalSearchOptimizer optimizer(-2.0, 2.0, 99);
	objectives::FunctionObjective objective(1, [](const Eigen::VectorXd &x) { return x(0) * x(0); });

	auto a = optimizer.Minimize(objective, Eigen::VectorXd::Zero(1));
	auto b = optimizer.Minimize(objective, Eigen::VectorXd::Zero(1));
	REQUIRE(a.x(0) == b.x(0));
	REQUIRE(a.iterations == b.iterations);
}

TEST_CASE("IntervalSearchOptimizer - Through-origin regression slope", "[optimizer][interval]") {
	Eigen::MatrixXd X(6, 1);
	X << 1.0, 2.0, 3.0, 4.0, 5.0, 6.0;
	Eigen::VectorXd y(6);
	y << 1.4, 3.1, 4.4, 6.2, 7.4, 9.1;

	objectives::LeastSquaresLoss loss(y, X);
	IntervalSearchOptimizer optimizer(-10.0, 10.0, 5, WidthRule());

	auto search = optimizer.Minimize(loss, Eigen::VectorXd::Zero(1));
	auto closed = LeastSquaresOptimizer::Solve(y, X);

	REQUIRE_THAT(search.x(0), Catch::Matchers::WithinAbs(closed.coefficients(0), 1e-6));
}

TEST_CASE("IntervalSearchOptimizer - Errors", "[optimizer][interval]") {
	REQUIRE_THROWS_AS(IntervalSearchOptimizer(1.0, -1.0, 1), core::DegenerateBracketError);

	IntervalSearchOptimizer optimizer(-1.0, 1.0, 1);
	objectives::FunctionObjective objective(2, [](const Eigen::VectorXd &x) { return x.squaredNorm(); });
	REQUIRE_THROWS_AS(optimizer.Minimize(objective, Eigen::VectorXd::Zero(2)), core::DimensionMismatchError);
}

TEST_CASE("IntervalSearchOptimizer - Non-finite objective is not converged", "[optimizer][interval]") {
	IntervalSearchOptimizer optimizer(-1.0, 1.0, 5);
	objectives::FunctionObjective objective(1, [](const Eigen::VectorXd &) {
		return std::numeric_limits<double>::quiet_NaN();
	});

	auto result = optimizer.Minimize(objective, Eigen::VectorXd::Zero(1));

	REQUIRE_FALSE(result.converged);
	REQUIRE(result.message == "non_finite_objective");
	REQUIRE(std::isnan(result.value));
	REQUIRE(result.iterations == 1);
}
