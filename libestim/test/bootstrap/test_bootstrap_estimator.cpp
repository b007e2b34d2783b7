#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libestim/bootstrap/bootstrap_inference.hpp"
#include "libestim/bootstrap/bootstrap_linear_estimator.hpp"
#include "libestim/optimizers/least_squares_optimizer.hpp"
#include "libestim/optimizers/nelder_mead_optimizer.hpp"

#include <Eigen/Eigenvalues>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

using namespace libestim;
using namespace libestim::core;
using bootstrap::BootstrapLinearEstimator;
using optimizers::LeastSquaresOptimizer;
using utils::RandomSource;

namespace {

struct Dataset {
	Eigen::VectorXd y;
	Eigen::MatrixXd X;
	Eigen::VectorXd beta;
};

// n = 120, p = 8, beta = (2, -1.5, 0, 0, 1, 0, 0, 0), standard normal design and noise
Dataset MakeScenario(uint64_t seed, Eigen::Index n = 120) {
	RandomSource rng(seed);
	std::normal_distribution<double> normal(0.0, 1.0);

	Dataset data;
	data.beta = Eigen::VectorXd::Zero(8);
	data.beta << 2.0, -1.5, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0;

	data.X.resize(n, 8);
	for (Eigen::Index i = 0; i < n; i++) {
		for (Eigen::Index j = 0; j < 8; j++) {
			data.X(i, j) = normal(rng.Engine());
		}
	}
	data.y = data.X * data.beta;
	for (Eigen::Index i = 0; i < n; i++) {
		data.y(i) += normal(rng.Engine());
	}
	return data;
}

std::shared_ptr<const optimizers::IOptimizer> ClosedForm() {
	return std::make_shared<LeastSquaresOptimizer>();
}

/// Closed-form answers, always reported as not converged
class UnconvergedOptimizer : public optimizers::IOptimizer {
public:
	std::string GetName() const override {
		return "unconverged";
	}

	core::OptimizerResult Minimize(const objectives::IObjective &objective,
	                               const Eigen::VectorXd &start) const override {
		core::OptimizerResult result = inner_.Minimize(objective, start);
		result.converged = false;
		result.message = "budget exhausted";
		return result;
	}

private:
	LeastSquaresOptimizer inner_;
};

/// NaN coefficients for every refit after the first call
class NonFiniteOptimizer : public optimizers::IOptimizer {
public:
	std::string GetName() const override {
		return "non_finite";
	}

	core::OptimizerResult Minimize(const objectives::IObjective &objective,
	                               const Eigen::VectorXd &start) const override {
		core::OptimizerResult result = inner_.Minimize(objective, start);
		if (calls_++ > 0) {
			result.x.setConstant(std::numeric_limits<double>::quiet_NaN());
		}
		return result;
	}

private:
	LeastSquaresOptimizer inner_;
	mutable std::atomic<size_t> calls_ {0};
};

/// Throws from every refit after the first call
class ThrowingOptimizer : public optimizers::IOptimizer {
public:
	std::string GetName() const override {
		return "throwing";
	}

	core::OptimizerResult Minimize(const objectives::IObjective &objective,
	                               const Eigen::VectorXd &start) const override {
		if (calls_++ > 0) {
			throw std::runtime_error("refit failed");
		}
		return inner_.Minimize(objective, start);
	}

private:
	LeastSquaresOptimizer inner_;
	mutable std::atomic<size_t> calls_ {0};
};

/// Returns one coefficient too many
class WrongLengthOptimizer : public optimizers::IOptimizer {
public:
	std::string GetName() const override {
		return "wrong_length";
	}

	core::OptimizerResult Minimize(const objectives::IObjective &objective,
	                               const Eigen::VectorXd &start) const override {
		core::OptimizerResult result = inner_.Minimize(objective, start);
		result.x.conservativeResize(result.x.size() + 1);
		result.x(result.x.size() - 1) = 0.0;
		return result;
	}

private:
	LeastSquaresOptimizer inner_;
};

} // namespace

TEST_CASE("Bootstrap - Recovers the scenario coefficients", "[bootstrap]") {
	Dataset data = MakeScenario(1);
	BootstrapLinearEstimator estimator(ClosedForm(), BootstrapOptions::WithReplicates(200));
	RandomSource rng(1);

	auto estimate = estimator.Fit(data.y, data.X, rng);

	REQUIRE(estimate.n_obs == 120);
	REQUIRE(estimate.n_params == 8);
	REQUIRE(estimate.n_replicates == 200);
	REQUIRE(estimate.est_beta.size() == 8);
	REQUIRE(estimate.cov_beta.rows() == 8);
	REQUIRE(estimate.cov_beta.cols() == 8);

	SECTION("Point estimate is close to the truth") {
		for (Eigen::Index j = 0; j < 8; j++) {
			REQUIRE_THAT(estimate.est_beta(j), Catch::Matchers::WithinAbs(data.beta(j), 0.4));
		}
	}

	SECTION("Point estimate equals the closed-form fit on the full data") {
		auto closed = LeastSquaresOptimizer::Solve(data.y, data.X);
		REQUIRE((estimate.est_beta - closed.coefficients).norm() < 1e-12);
	}

	SECTION("Covariance is symmetric positive semi-definite") {
		REQUIRE(estimate.cov_beta.cwiseEqual(estimate.cov_beta.transpose()).all());
		Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(estimate.cov_beta);
		REQUIRE(solver.eigenvalues().minCoeff() > -1e-12);
		REQUIRE(estimate.covariance_rank == 8);
		REQUIRE_FALSE(estimate.covariance_singular);
	}

	SECTION("Standard errors are in line with the classical OLS ones") {
		auto classical = bootstrap::ClassicalCovariance(data.y, data.X);
		Eigen::VectorXd se = estimate.StdErrors();
		for (Eigen::Index j = 0; j < 8; j++) {
			const double ratio = se(j) / std::sqrt(classical.covariance(j, j));
			REQUIRE(ratio > 0.6);
			REQUIRE(ratio < 1.6);
		}
	}

	SECTION("Quality flags") {
		REQUIRE(estimate.point_converged);
		REQUIRE(estimate.n_nonconverged_replicates == 0);
		REQUIRE_FALSE(estimate.underdetermined);
		REQUIRE_FALSE(estimate.IsLowConfidence());
		REQUIRE_FALSE(estimate.has_replicates());
	}
}

TEST_CASE("Bootstrap - Deterministic under a fixed seed", "[bootstrap]") {
	Dataset data = MakeScenario(2);
	BootstrapLinearEstimator estimator(ClosedForm(), BootstrapOptions::WithReplicates(50));

	RandomSource rng_a(123);
	RandomSource rng_b(123);
	auto a = estimator.Fit(data.y, data.X, rng_a);
	auto b = estimator.Fit(data.y, data.X, rng_b);

	REQUIRE(a.est_beta.cwiseEqual(b.est_beta).all());
	REQUIRE(a.cov_beta.cwiseEqual(b.cov_beta).all());

	SECTION("A different seed gives a different covariance") {
		RandomSource rng_c(124);
		auto c = estimator.Fit(data.y, data.X, rng_c);
		REQUIRE(c.est_beta.cwiseEqual(a.est_beta).all());
		REQUIRE_FALSE(c.cov_beta.cwiseEqual(a.cov_beta).all());
	}
}

TEST_CASE("Bootstrap - Same result for any thread count", "[bootstrap]") {
	Dataset data = MakeScenario(3);

	auto serial_opts = BootstrapOptions::WithReplicates(64, 1);
	serial_opts.keep_replicates = true;
	auto parallel_opts = BootstrapOptions::WithReplicates(64, 4);
	parallel_opts.keep_replicates = true;

	RandomSource rng_serial(9);
	RandomSource rng_parallel(9);
	auto serial = BootstrapLinearEstimator(ClosedForm(), serial_opts).Fit(data.y, data.X, rng_serial);
	auto parallel = BootstrapLinearEstimator(ClosedForm(), parallel_opts).Fit(data.y, data.X, rng_parallel);

	REQUIRE(serial.replicates.cwiseEqual(parallel.replicates).all());
	REQUIRE(serial.cov_beta.cwiseEqual(parallel.cov_beta).all());
}

TEST_CASE("Bootstrap - Kept replicates", "[bootstrap]") {
	Dataset data = MakeScenario(4);
	auto opts = BootstrapOptions::WithReplicates(30);
	opts.keep_replicates = true;

	RandomSource rng(4);
	auto estimate = BootstrapLinearEstimator(ClosedForm(), opts).Fit(data.y, data.X, rng);

	REQUIRE(estimate.has_replicates());
	REQUIRE(estimate.replicates.rows() == 30);
	REQUIRE(estimate.replicates.cols() == 8);
	REQUIRE(BootstrapLinearEstimator::SampleCovariance(estimate.replicates).cwiseEqual(estimate.cov_beta).all());
}

TEST_CASE("Bootstrap - Sample covariance", "[bootstrap]") {
	Eigen::MatrixXd reps(4, 2);
	reps << 1.0, 2.0,
	        2.0, 4.0,
	        3.0, 6.0,
	        4.0, 8.0;

	auto cov = BootstrapLinearEstimator::SampleCovariance(reps);
	// var(1..4) with n - 1 denominator is 5/3
	REQUIRE_THAT(cov(0, 0), Catch::Matchers::WithinAbs(5.0 / 3.0, 1e-12));
	REQUIRE_THAT(cov(0, 1), Catch::Matchers::WithinAbs(10.0 / 3.0, 1e-12));
	REQUIRE_THAT(cov(1, 1), Catch::Matchers::WithinAbs(20.0 / 3.0, 1e-12));
	REQUIRE(BootstrapLinearEstimator::NumericalRank(cov, 1e-10) == 1);

	REQUIRE_THROWS_AS(BootstrapLinearEstimator::SampleCovariance(reps.topRows(1)), SingularCovarianceError);
}

TEST_CASE("Bootstrap - Singular covariance", "[bootstrap]") {
	Dataset data = MakeScenario(5);

	SECTION("One replicate cannot give a covariance") {
		BootstrapLinearEstimator estimator(ClosedForm(), BootstrapOptions::WithReplicates(1));
		RandomSource rng(1);
		REQUIRE_THROWS_AS(estimator.Fit(data.y, data.X, rng), SingularCovarianceError);
	}

	SECTION("B <= p is flagged") {
		BootstrapLinearEstimator estimator(ClosedForm(), BootstrapOptions::WithReplicates(5));
		RandomSource rng(1);
		auto estimate = estimator.Fit(data.y, data.X, rng);
		REQUIRE(estimate.covariance_singular);
		REQUIRE(estimate.covariance_rank <= 4);
		REQUIRE(estimate.IsLowConfidence());
		REQUIRE(estimate.cov_beta.allFinite());
	}

	SECTION("B <= p throws in strict mode") {
		auto opts = BootstrapOptions::WithReplicates(5);
		opts.strict_covariance = true;
		BootstrapLinearEstimator estimator(ClosedForm(), opts);
		RandomSource rng(1);
		REQUIRE_THROWS_AS(estimator.Fit(data.y, data.X, rng), SingularCovarianceError);
	}

	SECTION("Non-finite replicates") {
		BootstrapLinearEstimator estimator(std::make_shared<NonFiniteOptimizer>(), BootstrapOptions::WithReplicates(10));
		RandomSource rng(1);
		REQUIRE_THROWS_AS(estimator.Fit(data.y, data.X, rng), SingularCovarianceError);
	}
}

TEST_CASE("Bootstrap - Non-convergence is recovered and flagged", "[bootstrap]") {
	Dataset data = MakeScenario(6);
	BootstrapLinearEstimator estimator(std::make_shared<UnconvergedOptimizer>(), BootstrapOptions::WithReplicates(20));
	RandomSource rng(6);

	auto estimate = estimator.Fit(data.y, data.X, rng);

	REQUIRE_FALSE(estimate.point_converged);
	REQUIRE(estimate.n_nonconverged_replicates == 20);
	REQUIRE(estimate.IsLowConfidence());
	// Best-effort values are still used
	REQUIRE(estimate.est_beta.allFinite());
	REQUIRE(estimate.cov_beta.allFinite());
}

TEST_CASE("Bootstrap - Underdetermined design", "[bootstrap]") {
	Eigen::MatrixXd X(3, 4);
	X << 1.0, 0.5, 2.0, -1.0,
	     1.0, 1.5, 0.0, 0.5,
	     1.0, 2.5, 1.0, 2.0;
	Eigen::VectorXd y(3);
	y << 1.0, 2.0, 4.0;

	BootstrapLinearEstimator estimator(ClosedForm(), BootstrapOptions::WithReplicates(10));
	RandomSource rng(8);
	auto estimate = estimator.Fit(y, X, rng);

	REQUIRE(estimate.underdetermined);
	REQUIRE_FALSE(estimate.point_converged);
	REQUIRE(estimate.n_nonconverged_replicates == 10);
	REQUIRE(estimate.IsLowConfidence());
	REQUIRE(estimate.cov_beta.allFinite());
}

TEST_CASE("Bootstrap - Errors inside refits reach the caller", "[bootstrap]") {
	Dataset data = MakeScenario(7, 40);

	for (size_t threads : {size_t(1), size_t(4)}) {
		BootstrapLinearEstimator estimator(std::make_shared<ThrowingOptimizer>(),
		                                   BootstrapOptions::WithReplicates(16, threads));
		RandomSource rng(7);
		REQUIRE_THROWS_WITH(estimator.Fit(data.y, data.X, rng), "refit failed");
	}
}

TEST_CASE("Bootstrap - Nelder-Mead as the optimizer", "[bootstrap]") {
	// Derivative-free minimization from the zero vector
	RandomSource gen(10);
	std::normal_distribution<double> normal(0.0, 1.0);
	Eigen::MatrixXd X(30, 2);
	Eigen::VectorXd y(30);
	for (Eigen::Index i = 0; i < 30; i++) {
		X(i, 0) = 1.0;
		X(i, 1) = normal(gen.Engine());
		y(i) = 0.5 + 1.5 * X(i, 1) + 0.3 * normal(gen.Engine());
	}

	BootstrapLinearEstimator estimator(std::make_shared<optimizers::NelderMeadOptimizer>(),
	                                   BootstrapOptions::WithReplicates(20, 2));
	RandomSource rng(10);
	auto estimate = estimator.Fit(y, X, rng);

	auto closed = LeastSquaresOptimizer::Solve(y, X);
	REQUIRE_THAT(estimate.est_beta(0), Catch::Matchers::WithinAbs(closed.coefficients(0), 1e-2));
	REQUIRE_THAT(estimate.est_beta(1), Catch::Matchers::WithinAbs(closed.coefficients(1), 1e-2));
	REQUIRE(estimate.cov_beta.allFinite());
	REQUIRE(estimate.cov_beta(1, 1) > 0.0);
	REQUIRE(estimator.Optimizer().GetName() == "nelder_mead");
}

TEST_CASE("Bootstrap - Optimizer output length is checked", "[bootstrap]") {
	Dataset data = MakeScenario(8, 40);
	BootstrapLinearEstimator estimator(std::make_shared<WrongLengthOptimizer>(), BootstrapOptions::WithReplicates(10));
	RandomSource rng(8);

	REQUIRE_THROWS_AS(estimator.Fit(data.y, data.X, rng), DimensionMismatchError);
}
