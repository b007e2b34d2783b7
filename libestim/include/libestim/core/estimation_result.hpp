#pragma once

#include <Eigen/Dense>
#include <vector>
#include <string>
#include <cstddef>
#include <cmath>
#include <limits>

namespace libestim {
namespace core {

/// How the random interval search ended
enum class SearchStatus {
	/// Improvement (or bracket width) fell to the tolerance
	Converged,
	/// max_iterations reached first
	IterationLimit,
	/// Zero-width initial bracket: the sole point was returned without iterating
	DegenerateBracket,
	/// Objective at the final x2 is NaN or infinite
	NonFiniteObjective
};

inline std::string SearchStatusName(SearchStatus status) {
	switch (status) {
	case SearchStatus::Converged:
		return "converged";
	case SearchStatus::IterationLimit:
		return "iteration_limit";
	case SearchStatus::DegenerateBracket:
		return "degenerate_bracket";
	case SearchStatus::NonFiniteObjective:
		return "non_finite_objective";
	default:
		return "unknown";
	}
}

/**
 * Result of a random interval search
 *
 * minimizer/value are the authoritative x2/f2 of the final bracket.
 * f_lower/f_upper are the objective at the initial endpoints and are
 * informational only.
 */
struct IntervalSearchResult {
	/// Best interior point found (x2)
	double minimizer = std::numeric_limits<double>::quiet_NaN();

	/// Objective at minimizer (f2)
	double value = std::numeric_limits<double>::quiet_NaN();

	/// Objective at the initial left and right endpoints
	double f_lower = std::numeric_limits<double>::quiet_NaN();
	double f_upper = std::numeric_limits<double>::quiet_NaN();

	/// Final bracket [x1, x3]
	double lower = std::numeric_limits<double>::quiet_NaN();
	double upper = std::numeric_limits<double>::quiet_NaN();

	/// Iterations performed (<= max_iterations)
	size_t iterations = 0;

	/// Last value of the continuation measure (improvement or bracket width)
	double last_improvement = std::numeric_limits<double>::quiet_NaN();

	SearchStatus status = SearchStatus::Converged;

	bool is_degenerate() const {
		return status == SearchStatus::DegenerateBracket;
	}
};

/**
 * Result of a single optimizer run
 *
 * A non-converged result still carries the best point found; callers decide
 * whether to accept it.
 */
struct OptimizerResult {
	Eigen::VectorXd x;
	double value = std::numeric_limits<double>::quiet_NaN();
	size_t iterations = 0;
	size_t function_evaluations = 0;
	bool converged = false;
	std::string message;
};

/**
 * Output of the bootstrap linear estimator
 *
 * est_beta is the fit on the original data; cov_beta is the sample covariance
 * (B - 1 denominator) of the B replicate coefficient vectors.
 */
struct CoefficientEstimate {
	/// Point estimate (length = n_params)
	Eigen::VectorXd est_beta;

	/// Bootstrap covariance (n_params × n_params), symmetric PSD
	Eigen::MatrixXd cov_beta;

	size_t n_obs = 0;
	size_t n_params = 0;
	size_t n_replicates = 0;

	// ========================================================================
	// Quality flags
	// ========================================================================

	/// Optimizer reported convergence on the original data
	bool point_converged = true;

	/// Replicate refits whose optimizer did not report convergence
	size_t n_nonconverged_replicates = 0;

	/// Numerical rank of cov_beta
	size_t covariance_rank = 0;

	/// cov_beta has rank < n_params
	bool covariance_singular = false;

	/// n < p + 1
	bool underdetermined = false;

	/// Replicate coefficients (n_replicates × n_params), only filled when kept
	Eigen::MatrixXd replicates;

	bool has_replicates() const {
		return replicates.rows() > 0;
	}

	/// Bootstrap standard errors: sqrt(diag(cov_beta))
	Eigen::VectorXd StdErrors() const {
		return cov_beta.diagonal().array().max(0.0).sqrt().matrix();
	}

	/// True when any part of the estimate rests on a best-effort optimizer result
	/// or a degenerate design
	bool IsLowConfidence() const {
		return !point_converged || n_nonconverged_replicates > 0 || covariance_singular || underdetermined;
	}
};

/**
 * Squared deviation loss evaluated at one candidate location
 */
struct LossEvaluation {
	std::vector<double> sample;
	double value = std::numeric_limits<double>::quiet_NaN();
	double loss = std::numeric_limits<double>::quiet_NaN();
};

} // namespace core
} // namespace libestim
