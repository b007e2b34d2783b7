#pragma once

#include "libestim/core/errors.hpp"
#include "libestim/core/estimation_options.hpp"
#include "libestim/core/estimation_result.hpp"
#include "libestim/core/paired_sample.hpp"
#include "libestim/objectives/least_squares_loss.hpp"
#include "libestim/optimizers/i_optimizer.hpp"
#include "libestim/utils/parallel_executor.hpp"
#include "libestim/utils/random_source.hpp"
#include "libestim/utils/tracing.hpp"
#include <Eigen/Dense>
#include <Eigen/Eigenvalues>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace libestim {
namespace bootstrap {

/**
 * Linear-model estimator with pairs-bootstrap covariance
 *
 * Fits β̂ = argmin Σᵢ (yᵢ - xᵢᵀβ)² with the injected optimizer (started at
 * the zero vector), then estimates Cov(β̂) from B refits on row resamples:
 *
 * 1. Draw n row indices uniformly with replacement
 * 2. Select those (yᵢ, xᵢ) pairs (rows may repeat, columns unchanged)
 * 3. Refit from the zero vector and store β̂ᵦ as row b
 * 4. cov_beta = sample covariance of the B rows (B - 1 denominator)
 *
 * No intercept is added; append a constant column to X to fit one.
 *
 * Reproducibility: one base seed is drawn from the caller's RandomSource and
 * replicate b uses RandomSource::Derive(base, b). Each refit only reads the
 * original sample and writes its own row, so replicates run as independent
 * tasks on the configured executor and the result is the same for any
 * thread count.
 *
 * Degenerate replicates are kept (the replicate set always has B rows).
 * Optimizer non-convergence is accepted as a best-effort value, counted and
 * logged; see CoefficientEstimate::IsLowConfidence().
 */
class BootstrapLinearEstimator {
public:
	/**
	 * @param optimizer Minimizer used for the point fit and every refit; must be
	 *                  safe to call concurrently when n_threads != 1
	 * @param options Bootstrap options
	 * @throws std::invalid_argument if optimizer is null or options are invalid
	 */
	explicit BootstrapLinearEstimator(std::shared_ptr<const optimizers::IOptimizer> optimizer,
	                                  core::BootstrapOptions options = core::BootstrapOptions())
	    : optimizer_(std::move(optimizer)), options_(options) {
		if (!optimizer_) {
			throw std::invalid_argument("BootstrapLinearEstimator requires an optimizer");
		}
		options_.Validate();
	}

	/**
	 * Fit coefficients and bootstrap covariance
	 *
	 * @param y Response vector (length n)
	 * @param X Design matrix (n × p)
	 * @param rng Random source for the resampling (one base seed is drawn)
	 * @return Point estimate, covariance and quality flags
	 *
	 * @throws DimensionMismatchError if y.size() != X.rows()
	 * @throws std::invalid_argument if n == 0 or p == 0
	 * @throws SingularCovarianceError if B < 2, a replicate is not finite, or
	 *         (with strict_covariance) the covariance is rank-deficient
	 */
	core::CoefficientEstimate Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X, utils::RandomSource &rng) const;

	core::CoefficientEstimate Fit(const core::PairedSample &data, utils::RandomSource &rng) const;

	/**
	 * Sample covariance of the rows of replicates (B - 1 denominator)
	 *
	 * @throws SingularCovarianceError if fewer than 2 rows
	 */
	static Eigen::MatrixXd SampleCovariance(const Eigen::MatrixXd &replicates);

	/**
	 * Numerical rank of a symmetric PSD matrix
	 *
	 * Eigenvalues <= rel_tol * max eigenvalue count as zero.
	 */
	static size_t NumericalRank(const Eigen::MatrixXd &cov, double rel_tol);

	const core::BootstrapOptions &Options() const {
		return options_;
	}

	const optimizers::IOptimizer &Optimizer() const {
		return *optimizer_;
	}

private:
	/// Minimize the least-squares loss of data from the zero vector
	core::OptimizerResult Refit(const core::PairedSample &data) const;

	std::shared_ptr<const optimizers::IOptimizer> optimizer_;
	core::BootstrapOptions options_;
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline core::CoefficientEstimate BootstrapLinearEstimator::Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                                               utils::RandomSource &rng) const {
	return Fit(core::PairedSample(y, X), rng);
}

inline core::OptimizerResult BootstrapLinearEstimator::Refit(const core::PairedSample &data) const {
	objectives::LeastSquaresLoss loss(data);
	const Eigen::VectorXd start = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(data.NumParams()));
	return optimizer_->Minimize(loss, start);
}

inline core::CoefficientEstimate BootstrapLinearEstimator::Fit(const core::PairedSample &data,
                                                               utils::RandomSource &rng) const {
	const size_t n = data.NumObservations();
	const size_t p = data.NumParams();
	const size_t B = options_.n_replicates;

	if (n == 0 || p == 0) {
		throw std::invalid_argument("bootstrap fit requires at least one observation and one column (got n=" +
		                            std::to_string(n) + ", p=" + std::to_string(p) + ")");
	}
	if (B < 2) {
		throw core::SingularCovarianceError("covariance needs at least 2 replicates (got " + std::to_string(B) + ")");
	}

	core::CoefficientEstimate estimate;
	estimate.n_obs = n;
	estimate.n_params = p;
	estimate.n_replicates = B;
	estimate.underdetermined = n < p + 1;

	if (estimate.underdetermined) {
		ESTIM_WARN("Design has n=" << n << " rows for p=" << p << " coefficients; fits are not identified");
	}

	ESTIM_TIMING_START();

	// Step 1: point estimate on the original data
	core::OptimizerResult point = Refit(data);
	if (static_cast<size_t>(point.x.size()) != p) {
		throw core::DimensionMismatchError("optimizer returned " + std::to_string(point.x.size()) +
		                                   " coefficients for " + std::to_string(p) + " columns");
	}
	estimate.est_beta = point.x;
	estimate.point_converged = point.converged;
	if (!point.converged) {
		ESTIM_WARN("Optimizer '" << optimizer_->GetName() << "' did not converge on the original data ("
		                         << point.message << "); using best-effort estimate");
	}

	// Step 2: B independent refits, combined only after all complete
	const uint64_t base_seed = rng.NextSeed();
	Eigen::MatrixXd replicates(static_cast<Eigen::Index>(B), static_cast<Eigen::Index>(p));
	std::vector<char> converged(B, 0);

	std::unique_ptr<utils::IParallelExecutor> executor = utils::MakeExecutor(options_.n_threads);
	utils::ParallelFor(B, *executor, [&](size_t b) {
		utils::RandomSource replicate_rng = utils::RandomSource::Derive(base_seed, b);
		std::vector<size_t> indices = replicate_rng.SampleWithReplacement(n, n);

		core::OptimizerResult fit = Refit(data.Resample(indices));
		if (static_cast<size_t>(fit.x.size()) != p) {
			throw core::DimensionMismatchError("optimizer returned " + std::to_string(fit.x.size()) +
			                                   " coefficients for " + std::to_string(p) + " columns");
		}
		replicates.row(static_cast<Eigen::Index>(b)) = fit.x.transpose();
		converged[b] = fit.converged ? 1 : 0;
	});

	for (size_t b = 0; b < B; b++) {
		if (!converged[b]) {
			estimate.n_nonconverged_replicates++;
		}
	}
	if (estimate.n_nonconverged_replicates > 0) {
		ESTIM_WARN(estimate.n_nonconverged_replicates << " of " << B << " bootstrap refits did not converge");
	}

	// Step 3: covariance of the replicate rows
	size_t n_nonfinite = 0;
	for (Eigen::Index b = 0; b < replicates.rows(); b++) {
		if (!replicates.row(b).allFinite()) {
			n_nonfinite++;
		}
	}
	if (n_nonfinite > 0) {
		throw core::SingularCovarianceError(std::to_string(n_nonfinite) + " of " + std::to_string(B) +
		                                    " bootstrap replicates have non-finite coefficients");
	}

	estimate.cov_beta = SampleCovariance(replicates);
	estimate.covariance_rank = NumericalRank(estimate.cov_beta, options_.rank_tolerance);
	estimate.covariance_singular = estimate.covariance_rank < p;

	if (estimate.covariance_singular) {
		const std::string message = "bootstrap covariance has rank " + std::to_string(estimate.covariance_rank) +
		                            " for " + std::to_string(p) + " coefficients (B=" + std::to_string(B) + ")";
		if (options_.strict_covariance) {
			throw core::SingularCovarianceError(message);
		}
		ESTIM_WARN(message);
	}

	if (options_.keep_replicates) {
		estimate.replicates = std::move(replicates);
	}

	ESTIM_TIMING_END("Bootstrap fit (B=" + std::to_string(B) + ", p=" + std::to_string(p) + ")");

	return estimate;
}

inline Eigen::MatrixXd BootstrapLinearEstimator::SampleCovariance(const Eigen::MatrixXd &replicates) {
	const Eigen::Index B = replicates.rows();
	if (B < 2) {
		throw core::SingularCovarianceError("covariance needs at least 2 replicates (got " + std::to_string(B) + ")");
	}

	const Eigen::RowVectorXd mean = replicates.colwise().mean();
	const Eigen::MatrixXd centered = replicates.rowwise() - mean;
	Eigen::MatrixXd cov = (centered.transpose() * centered) / static_cast<double>(B - 1);

	// Exact symmetry regardless of the product's rounding
	return 0.5 * (cov + cov.transpose());
}

inline size_t BootstrapLinearEstimator::NumericalRank(const Eigen::MatrixXd &cov, double rel_tol) {
	if (cov.size() == 0) {
		return 0;
	}

	Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(cov, Eigen::EigenvaluesOnly);
	if (solver.info() != Eigen::Success) {
		return 0;
	}

	const Eigen::VectorXd &eigenvalues = solver.eigenvalues();
	const double max_eigenvalue = eigenvalues.maxCoeff();
	if (!(max_eigenvalue > 0.0)) {
		return 0;
	}

	size_t rank = 0;
	for (Eigen::Index i = 0; i < eigenvalues.size(); i++) {
		if (eigenvalues(i) > rel_tol * max_eigenvalue) {
			rank++;
		}
	}
	return rank;
}

} // namespace bootstrap
} // namespace libestim
