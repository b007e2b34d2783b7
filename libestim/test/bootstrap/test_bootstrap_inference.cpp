#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libestim/bootstrap/bootstrap_inference.hpp"
#include "libestim/bootstrap/bootstrap_linear_estimator.hpp"
#include "libestim/optimizers/least_squares_optimizer.hpp"

#include <cmath>
#include <memory>
#include <random>
#include <vector>

using namespace libestim;
using namespace libestim::core;
using bootstrap::BootstrapInference;
using bootstrap::BootstrapLinearEstimator;

const double TOLERANCE = 1e-10;

namespace {

CoefficientEstimate HandMadeEstimate() {
	CoefficientEstimate est;
	est.est_beta = Eigen::VectorXd(3);
	est.est_beta << 2.0, -0.5, 0.0;
	est.cov_beta = Eigen::MatrixXd::Zero(3, 3);
	est.cov_beta(0, 0) = 0.25;
	est.cov_beta(1, 1) = 1.0;
	est.cov_beta(0, 1) = 0.25;
	est.cov_beta(1, 0) = 0.25;
	// Third coefficient never moved across replicates
	est.cov_beta(2, 2) = 0.0;
	est.n_params = 3;
	return est;
}

} // namespace

TEST_CASE("Inference - Normal theory quantities", "[inference]") {
	CoefficientEstimate est = HandMadeEstimate();
	auto inf = BootstrapInference::Compute(est, 0.95);

	REQUIRE(inf.confidence_level == 0.95);
	REQUIRE_FALSE(inf.has_percentile_intervals);

	SECTION("Standard errors and z statistics") {
		REQUIRE_THAT(inf.std_errors(0), Catch::Matchers::WithinAbs(0.5, TOLERANCE));
		REQUIRE_THAT(inf.std_errors(1), Catch::Matchers::WithinAbs(1.0, TOLERANCE));
		REQUIRE_THAT(inf.z_statistics(0), Catch::Matchers::WithinAbs(4.0, TOLERANCE));
		REQUIRE_THAT(inf.z_statistics(1), Catch::Matchers::WithinAbs(-0.5, TOLERANCE));
	}

	SECTION("Two-sided p-values") {
		// 2 * (1 - Phi(0.5)) = 0.617075...
		REQUIRE_THAT(inf.p_values(1), Catch::Matchers::WithinAbs(0.6170750774519738, 1e-6));
		REQUIRE(inf.p_values(0) < 1e-4);
	}

	SECTION("Normal confidence intervals") {
		const double z = 1.959963984540054;
		REQUIRE_THAT(inf.ci_lower(0), Catch::Matchers::WithinAbs(2.0 - z * 0.5, 1e-6));
		REQUIRE_THAT(inf.ci_upper(0), Catch::Matchers::WithinAbs(2.0 + z * 0.5, 1e-6));
	}

	SECTION("Zero variance gives NaN statistics but a point interval") {
		REQUIRE(std::isnan(inf.z_statistics(2)));
		REQUIRE(std::isnan(inf.p_values(2)));
		REQUIRE(inf.ci_lower(2) == 0.0);
		REQUIRE(inf.ci_upper(2) == 0.0);
	}

	SECTION("Correlation") {
		REQUIRE_THAT(inf.correlation(0, 0), Catch::Matchers::WithinAbs(1.0, TOLERANCE));
		REQUIRE_THAT(inf.correlation(0, 1), Catch::Matchers::WithinAbs(0.5, TOLERANCE));
		REQUIRE_THAT(inf.correlation(1, 0), Catch::Matchers::WithinAbs(0.5, TOLERANCE));
		REQUIRE(std::isnan(inf.correlation(0, 2)));
	}
}

TEST_CASE("Inference - Confidence level", "[inference]") {
	CoefficientEstimate est = HandMadeEstimate();

	auto narrow = BootstrapInference::Compute(est, 0.5);
	auto wide = BootstrapInference::Compute(est, 0.99);
	REQUIRE(wide.ci_upper(0) - wide.ci_lower(0) > narrow.ci_upper(0) - narrow.ci_lower(0));

	REQUIRE_THROWS_AS(BootstrapInference::Compute(est, 0.0), std::invalid_argument);
	REQUIRE_THROWS_AS(BootstrapInference::Compute(est, 1.0), std::invalid_argument);
	REQUIRE_THROWS_AS(BootstrapInference::Compute(est, std::nan("")), std::invalid_argument);
}

TEST_CASE("Inference - Percentile intervals from kept replicates", "[inference]") {
	CoefficientEstimate est;
	est.est_beta = Eigen::VectorXd::Constant(1, 50.5);
	est.replicates.resize(100, 1);
	// Replicates 1..100 in scrambled order
	for (Eigen::Index b = 0; b < 100; b++) {
		est.replicates(b, 0) = static_cast<double>((b * 37) % 100 + 1);
	}
	est.cov_beta = BootstrapLinearEstimator::SampleCovariance(est.replicates);

	auto inf = BootstrapInference::Compute(est, 0.9);
	REQUIRE(inf.has_percentile_intervals);
	// Type-7 quantiles of 1..100 at 0.05 and 0.95
	REQUIRE_THAT(inf.percentile_lower(0), Catch::Matchers::WithinAbs(5.95, 1e-9));
	REQUIRE_THAT(inf.percentile_upper(0), Catch::Matchers::WithinAbs(95.05, 1e-9));
}

TEST_CASE("Inference - Quantile helper", "[inference]") {
	std::vector<double> sorted = {1.0, 2.0, 3.0, 4.0};
	REQUIRE(BootstrapInference::Quantile(sorted, 0.0) == 1.0);
	REQUIRE(BootstrapInference::Quantile(sorted, 1.0) == 4.0);
	REQUIRE_THAT(BootstrapInference::Quantile(sorted, 0.5), Catch::Matchers::WithinAbs(2.5, TOLERANCE));
	REQUIRE(std::isnan(BootstrapInference::Quantile({}, 0.5)));
}

TEST_CASE("Inference - Classical OLS covariance", "[inference]") {
	Eigen::MatrixXd X(6, 2);
	X << 1.0, 1.0,
	     1.0, 2.0,
	     1.0, 3.0,
	     1.0, 4.0,
	     1.0, 5.0,
	     1.0, 6.0;
	Eigen::VectorXd y(6);
	y << 2.1, 3.9, 6.2, 7.8, 10.1, 12.0;

	auto classical = bootstrap::ClassicalCovariance(y, X);

	REQUIRE(classical.rank == 2);
	REQUIRE(classical.df_residual == 4);

	Eigen::VectorXd beta = (X.transpose() * X).inverse() * X.transpose() * y;
	const double sigma2 = (y - X * beta).squaredNorm() / 4.0;
	Eigen::MatrixXd expected = sigma2 * (X.transpose() * X).inverse();

	REQUIRE_THAT(classical.sigma_squared, Catch::Matchers::WithinAbs(sigma2, 1e-10));
	for (Eigen::Index i = 0; i < 2; i++) {
		REQUIRE_THAT(classical.coefficients(i), Catch::Matchers::WithinAbs(beta(i), 1e-9));
		for (Eigen::Index j = 0; j < 2; j++) {
			REQUIRE_THAT(classical.covariance(i, j), Catch::Matchers::WithinAbs(expected(i, j), 1e-10));
		}
	}

	SECTION("Aliased columns get NaN rows and columns") {
		Eigen::MatrixXd X_dup(6, 3);
		X_dup << X, X.col(1);
		auto dup = bootstrap::ClassicalCovariance(y, X_dup);
		REQUIRE(dup.rank == 2);
		REQUIRE(dup.df_residual == 4);
		REQUIRE(std::isfinite(dup.covariance(0, 0)));
		// One of the two identical columns is dropped
		REQUIRE((std::isnan(dup.covariance(1, 1)) != std::isnan(dup.covariance(2, 2))));
	}

	SECTION("Saturated design") {
		auto saturated = bootstrap::ClassicalCovariance(y.head(2), X.topRows(2));
		REQUIRE(saturated.df_residual == 0);
		REQUIRE(std::isnan(saturated.sigma_squared));
		REQUIRE(std::isnan(saturated.covariance(0, 0)));
	}
}
