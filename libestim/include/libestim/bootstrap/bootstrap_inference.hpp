#pragma once

#include "libestim/core/errors.hpp"
#include "libestim/core/estimation_result.hpp"
#include "libestim/core/inference_result.hpp"
#include "libestim/optimizers/least_squares_optimizer.hpp"
#include "libestim/utils/distributions.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace libestim {
namespace bootstrap {

/**
 * BootstrapInference: inference for a CoefficientEstimate
 *
 * - SE(β_j) = sqrt(cov_beta_jj)
 * - z_j = β_j / SE(β_j)
 * - p_j = 2 * (1 - Φ(|z_j|))
 * - CI_j = β_j ± z_{1-α/2} * SE(β_j)
 * - Percentile CI_j = [q_{α/2}, q_{1-α/2}] of the replicates of β_j
 *   (needs keep_replicates)
 *
 * ClassicalCovariance() gives the textbook OLS covariance for the same data
 * so that the bootstrap estimate can be checked against it.
 */
class BootstrapInference {
public:
	/**
	 * @param estimate Output of BootstrapLinearEstimator::Fit
	 * @param confidence_level Confidence level in (0, 1)
	 * @throws std::invalid_argument if confidence_level is outside (0, 1)
	 */
	static core::BootstrapInferenceResult Compute(const core::CoefficientEstimate &estimate,
	                                              double confidence_level = 0.95);

	/**
	 * Type-7 (linear interpolation) sample quantile
	 *
	 * @param sorted Values in ascending order, non-empty
	 * @param prob Probability in [0, 1]
	 */
	static double Quantile(const std::vector<double> &sorted, double prob);

	/**
	 * Correlation matrix of a covariance matrix
	 *
	 * Entries involving a zero variance are NaN.
	 */
	static Eigen::MatrixXd Correlation(const Eigen::MatrixXd &cov);

	/**
	 * Classical OLS covariance σ² (XᵀX)⁻¹ with σ² = RSS / (n - rank)
	 *
	 * @throws DimensionMismatchError if y.size() != X.rows()
	 */
	static core::ClassicalCovarianceResult ClassicalCovariance(const Eigen::VectorXd &y, const Eigen::MatrixXd &X);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline double BootstrapInference::Quantile(const std::vector<double> &sorted, double prob) {
	if (sorted.empty()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const double h = (static_cast<double>(sorted.size()) - 1.0) * prob;
	const auto lo = static_cast<size_t>(std::floor(h));
	const size_t hi = std::min(lo + 1, sorted.size() - 1);
	return sorted[lo] + (h - static_cast<double>(lo)) * (sorted[hi] - sorted[lo]);
}

inline Eigen::MatrixXd BootstrapInference::Correlation(const Eigen::MatrixXd &cov) {
	Eigen::MatrixXd corr(cov.rows(), cov.cols());
	for (Eigen::Index i = 0; i < cov.rows(); i++) {
		for (Eigen::Index j = 0; j < cov.cols(); j++) {
			const double denom = std::sqrt(cov(i, i) * cov(j, j));
			corr(i, j) = denom > 0.0 ? cov(i, j) / denom : std::numeric_limits<double>::quiet_NaN();
		}
	}
	return corr;
}

inline core::BootstrapInferenceResult BootstrapInference::Compute(const core::CoefficientEstimate &estimate,
                                                                  double confidence_level) {
	if (!(confidence_level > 0.0 && confidence_level < 1.0)) {
		throw std::invalid_argument("confidence_level must be in (0, 1) (got " + std::to_string(confidence_level) +
		                            ")");
	}

	const size_t p = static_cast<size_t>(estimate.est_beta.size());
	core::BootstrapInferenceResult result(p, confidence_level);

	const double alpha = 1.0 - confidence_level;
	const double z_crit = utils::normal_quantile(1.0 - alpha / 2.0);

	result.std_errors = estimate.StdErrors();
	for (size_t j = 0; j < p; j++) {
		auto j_idx = static_cast<Eigen::Index>(j);
		const double se = result.std_errors(j_idx);
		const double coef = estimate.est_beta(j_idx);
		if (se > 0.0) {
			result.z_statistics(j_idx) = coef / se;
			result.p_values(j_idx) = utils::normal_two_sided_pvalue(coef / se);
		}
		result.ci_lower(j_idx) = coef - z_crit * se;
		result.ci_upper(j_idx) = coef + z_crit * se;
	}

	result.correlation = Correlation(estimate.cov_beta);

	if (estimate.has_replicates()) {
		std::vector<double> column(static_cast<size_t>(estimate.replicates.rows()));
		for (size_t j = 0; j < p; j++) {
			auto j_idx = static_cast<Eigen::Index>(j);
			for (Eigen::Index b = 0; b < estimate.replicates.rows(); b++) {
				column[static_cast<size_t>(b)] = estimate.replicates(b, j_idx);
			}
			std::sort(column.begin(), column.end());
			result.percentile_lower(j_idx) = Quantile(column, alpha / 2.0);
			result.percentile_upper(j_idx) = Quantile(column, 1.0 - alpha / 2.0);
		}
		result.has_percentile_intervals = true;
	}

	return result;
}

inline core::ClassicalCovarianceResult BootstrapInference::ClassicalCovariance(const Eigen::VectorXd &y,
                                                                               const Eigen::MatrixXd &X) {
	const optimizers::LeastSquaresSolution solution = optimizers::LeastSquaresOptimizer::Solve(y, X);

	const size_t n = static_cast<size_t>(X.rows());
	const size_t p = static_cast<size_t>(X.cols());

	core::ClassicalCovarianceResult result;
	result.coefficients = solution.coefficients;
	result.rank = solution.rank;
	result.df_residual = n > solution.rank ? n - solution.rank : 0;
	result.covariance = Eigen::MatrixXd::Constant(static_cast<Eigen::Index>(p), static_cast<Eigen::Index>(p),
	                                              std::numeric_limits<double>::quiet_NaN());

	if (result.df_residual == 0 || solution.rank == 0) {
		// Saturated model: no degrees of freedom for error
		return result;
	}

	const double rss = (y - X * solution.coefficients).squaredNorm();
	result.sigma_squared = rss / static_cast<double>(result.df_residual);

	// (XᵀX)⁻¹ over the non-aliased columns only
	std::vector<Eigen::Index> valid;
	for (size_t j = 0; j < p; j++) {
		if (!solution.is_aliased[j]) {
			valid.push_back(static_cast<Eigen::Index>(j));
		}
	}

	Eigen::MatrixXd X_valid(X.rows(), static_cast<Eigen::Index>(valid.size()));
	for (size_t k = 0; k < valid.size(); k++) {
		X_valid.col(static_cast<Eigen::Index>(k)) = X.col(valid[k]);
	}

	Eigen::MatrixXd XtX = X_valid.transpose() * X_valid;
	Eigen::MatrixXd XtX_inv = XtX.ldlt().solve(Eigen::MatrixXd::Identity(XtX.rows(), XtX.cols()));

	for (size_t a = 0; a < valid.size(); a++) {
		for (size_t b = 0; b < valid.size(); b++) {
			result.covariance(valid[a], valid[b]) =
			    result.sigma_squared * XtX_inv(static_cast<Eigen::Index>(a), static_cast<Eigen::Index>(b));
		}
	}

	return result;
}

/// Classical OLS covariance of y on X (see BootstrapInference::ClassicalCovariance)
inline core::ClassicalCovarianceResult ClassicalCovariance(const Eigen::VectorXd &y, const Eigen::MatrixXd &X) {
	return BootstrapInference::ClassicalCovariance(y, X);
}

} // namespace bootstrap
} // namespace libestim
