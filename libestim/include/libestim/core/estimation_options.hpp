#pragma once

#include <cstdint>
#include <cstddef>
#include <cmath>
#include <string>
#include <stdexcept>

namespace libestim {
namespace core {

/// Loop-continuation rule of the random interval search
enum class StoppingRule {
	/// Continue while the objective at x2 improved by more than tolerance
	ObjectiveImprovement,
	/// Continue while the bracket is wider than tolerance
	BracketWidth
};

/**
 * Configuration options for the random interval search
 *
 * Design notes:
 * - All defaults specified in-class
 * - Validation method to check for invalid values
 */
struct IntervalSearchOptions {
	/// Convergence tolerance on the per-iteration improvement (or bracket width)
	/// Default: 1e-6
	double tolerance = 1e-6;

	/// Safety cap on the number of iterations
	/// Default: 100
	size_t max_iterations = 100;

	/// Default: ObjectiveImprovement
	StoppingRule stopping_rule = StoppingRule::ObjectiveImprovement;

	IntervalSearchOptions() = default;

	static IntervalSearchOptions Defaults(double tolerance_ = 1e-6, size_t max_iterations_ = 100) {
		IntervalSearchOptions opts;
		opts.tolerance = tolerance_;
		opts.max_iterations = max_iterations_;
		return opts;
	}

	/**
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		if (!(tolerance > 0.0) || !std::isfinite(tolerance)) {
			throw std::invalid_argument("tolerance must be positive (got " + std::to_string(tolerance) + ")");
		}
		if (max_iterations == 0) {
			throw std::invalid_argument("max_iterations must be positive");
		}
	}
};

/**
 * Configuration options for the Nelder-Mead simplex optimizer
 *
 * Defaults follow R's optim(method = "Nelder-Mead"):
 * reflection 1, expansion 2, contraction 0.5, shrink 0.5, maxit 500,
 * reltol ~ sqrt(machine epsilon).
 */
struct NelderMeadOptions {
	double reflection = 1.0;
	double expansion = 2.0;
	double contraction = 0.5;
	double shrink = 0.5;

	/// Maximum number of simplex iterations
	/// Default: 500
	size_t max_iterations = 500;

	/// Relative tolerance on the spread of function values across the simplex
	/// Default: 1e-8
	double relative_tolerance = 1e-8;

	/// Initial simplex step as a fraction of the largest |start| coordinate
	/// (used as an absolute step when the start point is all zeros)
	/// Default: 0.1
	double initial_step = 0.1;

	/// Restarts from the best vertex after convergence (0 = plain Nelder-Mead as in optim())
	/// Default: 0
	size_t restarts = 0;

	NelderMeadOptions() = default;

	static NelderMeadOptions Thorough(size_t max_iterations_ = 20000) {
		NelderMeadOptions opts;
		opts.max_iterations = max_iterations_;
		opts.relative_tolerance = 1e-12;
		opts.restarts = 3;
		return opts;
	}

	/**
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		if (!(reflection > 0.0)) {
			throw std::invalid_argument("reflection must be positive (got " + std::to_string(reflection) + ")");
		}
		if (!(expansion > 1.0)) {
			throw std::invalid_argument("expansion must be greater than 1 (got " + std::to_string(expansion) + ")");
		}
		if (!(contraction > 0.0 && contraction < 1.0)) {
			throw std::invalid_argument("contraction must be in (0, 1) (got " + std::to_string(contraction) + ")");
		}
		if (!(shrink > 0.0 && shrink < 1.0)) {
			throw std::invalid_argument("shrink must be in (0, 1) (got " + std::to_string(shrink) + ")");
		}
		if (max_iterations == 0) {
			throw std::invalid_argument("max_iterations must be positive");
		}
		if (!(relative_tolerance > 0.0)) {
			throw std::invalid_argument("relative_tolerance must be positive (got " +
			                            std::to_string(relative_tolerance) + ")");
		}
		if (!(initial_step > 0.0)) {
			throw std::invalid_argument("initial_step must be positive (got " + std::to_string(initial_step) + ")");
		}
	}
};

/**
 * Configuration options for the pairs bootstrap estimator
 */
struct BootstrapOptions {
	/// Number of bootstrap replicates B
	/// Default: 100
	size_t n_replicates = 100;

	/// Worker threads for the replicate refits
	/// - 1: run inline on the calling thread
	/// - 0: use hardware concurrency
	/// Default: 1
	size_t n_threads = 1;

	/// Keep the B x p replicate matrix in the returned estimate
	/// Default: false (replicates are discarded after the covariance is computed)
	bool keep_replicates = false;

	/// Throw SingularCovarianceError for a rank-deficient covariance instead of flagging it
	/// Default: false
	bool strict_covariance = false;

	/// Eigenvalues below rank_tolerance * max eigenvalue count as zero
	/// Default: 1e-10
	double rank_tolerance = 1e-10;

	BootstrapOptions() = default;

	static BootstrapOptions WithReplicates(size_t n_replicates_, size_t n_threads_ = 1) {
		BootstrapOptions opts;
		opts.n_replicates = n_replicates_;
		opts.n_threads = n_threads_;
		return opts;
	}

	/**
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		if (n_replicates == 0) {
			throw std::invalid_argument("n_replicates must be positive");
		}
		if (!(rank_tolerance > 0.0) || rank_tolerance >= 1.0) {
			throw std::invalid_argument("rank_tolerance must be in (0, 1) (got " + std::to_string(rank_tolerance) +
			                            ")");
		}
	}
};

} // namespace core
} // namespace libestim
