#pragma once

/**
 * libestim: caller-facing entry points
 *
 * Includes every public header and provides two convenience functions:
 *
 * ```cpp
 * libestim::utils::RandomSource rng(1);
 *
 * // Minimizer of the squared deviations of a sample (about its mean)
 * auto mu = libestim::MinimizeInterval({1.0, 2.0, 3.0, 4.0, 5.0}, rng);
 *
 * // Coefficients and bootstrap covariance of y ~ X (no implicit intercept)
 * auto fit = libestim::FitLinearBootstrap(y, X, 200, rng);
 * ```
 */

#include "libestim/bootstrap/bootstrap_inference.hpp"
#include "libestim/bootstrap/bootstrap_linear_estimator.hpp"
#include "libestim/core/errors.hpp"
#include "libestim/core/estimation_options.hpp"
#include "libestim/core/estimation_result.hpp"
#include "libestim/core/options_parser.hpp"
#include "libestim/core/paired_sample.hpp"
#include "libestim/objectives/i_objective.hpp"
#include "libestim/objectives/least_squares_loss.hpp"
#include "libestim/objectives/squared_deviation_loss.hpp"
#include "libestim/optimizers/i_optimizer.hpp"
#include "libestim/optimizers/interval_search_optimizer.hpp"
#include "libestim/optimizers/least_squares_optimizer.hpp"
#include "libestim/optimizers/nelder_mead_optimizer.hpp"
#include "libestim/optimizers/optimizer_factory.hpp"
#include "libestim/search/interval_minimizer.hpp"
#include "libestim/utils/distributions.hpp"
#include "libestim/utils/parallel_executor.hpp"
#include "libestim/utils/random_source.hpp"
#include "libestim/utils/tracing.hpp"

#include <Eigen/Dense>
#include <memory>
#include <utility>
#include <vector>

namespace libestim {

/**
 * Random interval search for the minimizer of Σ (x_i - mu)² over [min, max]
 *
 * @param sample Non-empty sample
 * @param rng Random source for the interior draws
 * @param tol Stop once an iteration improves the objective by at most tol
 * @param maxit Iteration cap
 * @throws std::invalid_argument if sample is empty or tol/maxit are invalid
 */
inline core::IntervalSearchResult MinimizeInterval(const std::vector<double> &sample, utils::RandomSource &rng,
                                                   double tol = 1e-6, size_t maxit = 100) {
	return search::IntervalMinimizer::MinimizeSample(sample, rng, core::IntervalSearchOptions::Defaults(tol, maxit));
}

/// Same as above with a non-reproducible random source
inline core::IntervalSearchResult MinimizeInterval(const std::vector<double> &sample, double tol = 1e-6,
                                                   size_t maxit = 100) {
	utils::RandomSource rng;
	return MinimizeInterval(sample, rng, tol, maxit);
}

/**
 * Linear coefficients with pairs-bootstrap covariance, fitted by an injected optimizer
 *
 * @throws DimensionMismatchError if y.size() != X.rows()
 * @throws SingularCovarianceError if B < 2 or a replicate is not finite
 */
inline core::CoefficientEstimate FitLinearBootstrap(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                                    std::shared_ptr<const optimizers::IOptimizer> optimizer,
                                                    size_t B, utils::RandomSource &rng) {
	bootstrap::BootstrapLinearEstimator estimator(std::move(optimizer), core::BootstrapOptions::WithReplicates(B));
	return estimator.Fit(y, X, rng);
}

/**
 * Linear coefficients with pairs-bootstrap covariance, fitted by Nelder-Mead
 *
 * Derivative-free minimization of the sum of squared residuals from the
 * zero vector, then B row resamples.
 */
inline core::CoefficientEstimate FitLinearBootstrap(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                                    size_t B, utils::RandomSource &rng) {
	return FitLinearBootstrap(y, X, std::make_shared<optimizers::NelderMeadOptimizer>(), B, rng);
}

/// Same as above with the default B = 100 replicates
inline core::CoefficientEstimate FitLinearBootstrap(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                                    utils::RandomSource &rng) {
	return FitLinearBootstrap(y, X, core::BootstrapOptions().n_replicates, rng);
}

} // namespace libestim
