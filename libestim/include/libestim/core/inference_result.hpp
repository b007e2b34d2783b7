#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <limits>

namespace libestim {
namespace core {

/**
 * Inference for bootstrap-estimated coefficients
 *
 * Design notes:
 * - Normal-theory quantities use the bootstrap standard errors
 * - NaN marks unavailable results (zero standard error, no kept replicates)
 */
struct BootstrapInferenceResult {
	/// sqrt(diag(cov_beta)) (length = n_params)
	Eigen::VectorXd std_errors;

	/// est_beta / std_error (length = n_params)
	Eigen::VectorXd z_statistics;

	/// Two-sided normal p-values for H0: coef = 0 (length = n_params)
	Eigen::VectorXd p_values;

	/// Normal intervals: coef ± z_{1-α/2} * std_error
	Eigen::VectorXd ci_lower;
	Eigen::VectorXd ci_upper;

	/// Percentile intervals from the replicate distribution
	/// Only valid if has_percentile_intervals
	Eigen::VectorXd percentile_lower;
	Eigen::VectorXd percentile_upper;
	bool has_percentile_intervals = false;

	/// Correlation matrix derived from cov_beta (n_params × n_params)
	Eigen::MatrixXd correlation;

	double confidence_level = 0.95;

	BootstrapInferenceResult() = default;

	explicit BootstrapInferenceResult(size_t n_params, double conf_level = 0.95) : confidence_level(conf_level) {
		const auto p = static_cast<Eigen::Index>(n_params);
		const double nan = std::numeric_limits<double>::quiet_NaN();
		std_errors = Eigen::VectorXd::Constant(p, nan);
		z_statistics = Eigen::VectorXd::Constant(p, nan);
		p_values = Eigen::VectorXd::Constant(p, nan);
		ci_lower = Eigen::VectorXd::Constant(p, nan);
		ci_upper = Eigen::VectorXd::Constant(p, nan);
		percentile_lower = Eigen::VectorXd::Constant(p, nan);
		percentile_upper = Eigen::VectorXd::Constant(p, nan);
		correlation = Eigen::MatrixXd::Constant(p, p, nan);
	}
};

/**
 * Classical OLS covariance, σ² (XᵀX)⁻¹, for comparison with the bootstrap
 */
struct ClassicalCovarianceResult {
	/// Least-squares coefficients (aliased ones are 0)
	Eigen::VectorXd coefficients;

	/// σ² (XᵀX)⁻¹ over the non-aliased columns; NaN rows/cols for aliased ones
	Eigen::MatrixXd covariance;

	/// RSS / (n - rank)
	double sigma_squared = std::numeric_limits<double>::quiet_NaN();

	size_t rank = 0;
	size_t df_residual = 0;
};

} // namespace core
} // namespace libestim
