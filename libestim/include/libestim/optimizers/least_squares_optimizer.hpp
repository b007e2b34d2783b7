#pragma once

#include "libestim/core/errors.hpp"
#include "libestim/core/estimation_result.hpp"
#include "libestim/objectives/least_squares_loss.hpp"
#include "libestim/optimizers/i_optimizer.hpp"
#include "libestim/optimizers/nelder_mead_optimizer.hpp"
#include "libestim/utils/tracing.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace libestim {
namespace optimizers {

/**
 * Solution of a least-squares problem by pivoted QR
 */
struct LeastSquaresSolution {
	/// Coefficients (length p); aliased coefficients are 0
	Eigen::VectorXd coefficients;

	/// True if the column was dropped as linearly dependent
	std::vector<bool> is_aliased;

	/// Numerical rank of the design matrix
	size_t rank = 0;

	/// Threshold used for rank determination
	double tolerance_used = -1.0;

	bool is_full_rank() const {
		return rank == static_cast<size_t>(coefficients.size());
	}
};

/**
 * Closed-form minimizer of the least-squares loss
 *
 * Uses Eigen's ColPivHouseholderQR decomposition:
 * 1. QR decomposition with column pivoting: X*P = Q*R
 * 2. Determine numerical rank from R diagonal
 * 3. Solve rank-r triangular system: R_r * beta_r = (Q^T * y)_r
 * 4. Map reduced coefficients back to original column order via permutation
 *
 * For a rank-deficient design (a bootstrap resample with too few distinct
 * rows, for instance) the minimizer is not unique. Aliased coefficients are
 * set to 0 so that the result stays finite, and the result is reported as not
 * converged.
 *
 * Any objective that is not a LeastSquaresLoss goes to the fallback optimizer
 * (Nelder-Mead unless another one is supplied). The start point is ignored
 * by the closed form.
 *
 * Design notes:
 * - Header-only
 * - Deterministic: a pure function of (objective, start)
 */
class LeastSquaresOptimizer : public IOptimizer {
public:
	/**
	 * @param qr_tolerance QR rank threshold (-1 = auto, use Eigen default)
	 * @param fallback Optimizer for objectives other than LeastSquaresLoss
	 */
	explicit LeastSquaresOptimizer(double qr_tolerance = -1.0, std::shared_ptr<const IOptimizer> fallback = nullptr)
	    : qr_tolerance_(qr_tolerance), fallback_(std::move(fallback)) {
		if (!fallback_) {
			fallback_ = std::make_shared<NelderMeadOptimizer>();
		}
	}

	std::string GetName() const override {
		return "least_squares";
	}

	core::OptimizerResult Minimize(const objectives::IObjective &objective,
	                               const Eigen::VectorXd &start) const override;

	/**
	 * Solve min ||y - X beta||² with rank-deficiency handling
	 *
	 * @param y Response vector (length n)
	 * @param X Design matrix (n × p)
	 * @param qr_tolerance Threshold for rank determination (-1 = auto)
	 * @throws DimensionMismatchError if y.size() != X.rows()
	 */
	static LeastSquaresSolution Solve(const Eigen::VectorXd &y, const Eigen::MatrixXd &X, double qr_tolerance = -1.0);

	/**
	 * Check if matrix is full column rank
	 *
	 * @param X Design matrix
	 * @param tolerance Threshold for rank determination (-1 = auto)
	 */
	static bool IsFullRank(const Eigen::MatrixXd &X, double tolerance = -1.0);

private:
	double qr_tolerance_;
	std::shared_ptr<const IOptimizer> fallback_;
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline LeastSquaresSolution LeastSquaresOptimizer::Solve(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                                         double qr_tolerance) {
	if (y.size() != X.rows()) {
		throw core::DimensionMismatchError("response has " + std::to_string(y.size()) +
		                                   " rows but design matrix has " + std::to_string(X.rows()));
	}

	const size_t p = static_cast<size_t>(X.cols());

	LeastSquaresSolution solution;
	solution.coefficients = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(p));
	solution.is_aliased.assign(p, true);

	if (p == 0 || X.rows() == 0) {
		return solution;
	}

	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
	if (qr_tolerance > 0.0) {
		qr.setThreshold(qr_tolerance);
	}
	solution.tolerance_used = qr.threshold();

	const size_t rank = static_cast<size_t>(qr.rank());
	solution.rank = rank;
	const Eigen::PermutationMatrix<Eigen::Dynamic, Eigen::Dynamic> &P = qr.colsPermutation();

	if (rank > 0) {
		Eigen::VectorXd QtY = qr.matrixQ().transpose() * y;
		Eigen::MatrixXd R_reduced =
		    qr.matrixQR().topLeftCorner(static_cast<Eigen::Index>(rank), static_cast<Eigen::Index>(rank));
		Eigen::VectorXd coef_reduced =
		    R_reduced.triangularView<Eigen::Upper>().solve(QtY.head(static_cast<Eigen::Index>(rank)));

		for (size_t i = 0; i < rank; i++) {
			auto i_idx = static_cast<Eigen::Index>(i);
			size_t original_idx = static_cast<size_t>(P.indices()[i_idx]);
			solution.coefficients[static_cast<Eigen::Index>(original_idx)] = coef_reduced[i_idx];
			solution.is_aliased[original_idx] = false;
		}
	}

	return solution;
}

inline bool LeastSquaresOptimizer::IsFullRank(const Eigen::MatrixXd &X, double tolerance) {
	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
	if (tolerance > 0.0) {
		qr.setThreshold(tolerance);
	}

	return qr.rank() == X.cols();
}

inline core::OptimizerResult LeastSquaresOptimizer::Minimize(const objectives::IObjective &objective,
                                                             const Eigen::VectorXd &start) const {
	if (static_cast<size_t>(start.size()) != objective.Dimension()) {
		throw core::DimensionMismatchError("start point has length " + std::to_string(start.size()) +
		                                   " but objective has dimension " + std::to_string(objective.Dimension()));
	}

	const auto *loss = dynamic_cast<const objectives::LeastSquaresLoss *>(&objective);
	if (loss == nullptr) {
		return fallback_->Minimize(objective, start);
	}

	const auto &data = loss->Data();
	LeastSquaresSolution solution = Solve(data.Response(), data.Design(), qr_tolerance_);

	core::OptimizerResult result;
	result.x = solution.coefficients;
	result.value = loss->Evaluate(result.x);
	result.iterations = 1;
	result.function_evaluations = 1;
	result.converged = solution.is_full_rank();

	if (result.converged) {
		result.message = "closed form";
	} else {
		result.message = "rank-deficient design (rank " + std::to_string(solution.rank) + " of " +
		                 std::to_string(data.NumParams()) + "), aliased coefficients set to 0";
		ESTIM_DEBUG("Least squares: " << result.message);
	}

	return result;
}

} // namespace optimizers
} // namespace libestim
