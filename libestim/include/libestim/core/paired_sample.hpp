#pragma once

#include "libestim/core/errors.hpp"
#include <Eigen/Dense>
#include <vector>
#include <string>
#include <cstddef>
#include <utility>

namespace libestim {
namespace core {

/**
 * Row-aligned response vector and design matrix
 *
 * Row i of X always belongs to y(i). Resampling selects whole rows, so the
 * pairing can never drift. No intercept column is added: callers append a
 * constant column themselves if they want one.
 */
class PairedSample {
public:
	/**
	 * @param y Response vector (length n)
	 * @param X Design matrix (n × p)
	 * @throws DimensionMismatchError if y.size() != X.rows()
	 */
	PairedSample(Eigen::VectorXd y, Eigen::MatrixXd X) : y_(std::move(y)), X_(std::move(X)) {
		if (y_.size() != X_.rows()) {
			throw DimensionMismatchError("response has " + std::to_string(y_.size()) +
			                             " rows but design matrix has " + std::to_string(X_.rows()));
		}
	}

	const Eigen::VectorXd &Response() const {
		return y_;
	}

	const Eigen::MatrixXd &Design() const {
		return X_;
	}

	size_t NumObservations() const {
		return static_cast<size_t>(X_.rows());
	}

	size_t NumParams() const {
		return static_cast<size_t>(X_.cols());
	}

	/**
	 * Build the sample made of the given rows (rows may repeat)
	 *
	 * @param indices Zero-based row indices, each < NumObservations()
	 * @throws DimensionMismatchError if an index is out of range
	 */
	PairedSample Resample(const std::vector<size_t> &indices) const {
		const size_t n = NumObservations();
		Eigen::VectorXd y_b(static_cast<Eigen::Index>(indices.size()));
		Eigen::MatrixXd X_b(static_cast<Eigen::Index>(indices.size()), X_.cols());

		for (size_t i = 0; i < indices.size(); i++) {
			if (indices[i] >= n) {
				throw DimensionMismatchError("resample index " + std::to_string(indices[i]) +
				                             " out of range for " + std::to_string(n) + " rows");
			}
			auto i_idx = static_cast<Eigen::Index>(i);
			auto src = static_cast<Eigen::Index>(indices[i]);
			y_b(i_idx) = y_(src);
			X_b.row(i_idx) = X_.row(src);
		}

		return PairedSample(std::move(y_b), std::move(X_b));
	}

private:
	Eigen::VectorXd y_;
	Eigen::MatrixXd X_;
};

} // namespace core
} // namespace libestim
