#pragma once

#include "libestim/core/paired_sample.hpp"
#include "libestim/objectives/i_objective.hpp"
#include <Eigen/Dense>
#include <utility>

namespace libestim {
namespace objectives {

/**
 * Least-squares loss of a linear model
 *
 *   L(β; X, y) = Σᵢ (yᵢ - xᵢᵀβ)²
 *
 * The plain sum (not the mean) is used; optimizer tolerances are calibrated
 * against this scale.
 *
 *   ∇L(β) = -2 Xᵀ (y - Xβ)
 */
class LeastSquaresLoss : public IObjective {
public:
	explicit LeastSquaresLoss(core::PairedSample data) : data_(std::move(data)) {
	}

	LeastSquaresLoss(const Eigen::VectorXd &y, const Eigen::MatrixXd &X) : data_(y, X) {
	}

	size_t Dimension() const override {
		return data_.NumParams();
	}

	double Evaluate(const Eigen::VectorXd &beta) const override {
		return (data_.Response() - data_.Design() * beta).squaredNorm();
	}

	bool HasGradient() const override {
		return true;
	}

	Eigen::VectorXd Gradient(const Eigen::VectorXd &beta) const override {
		return -2.0 * data_.Design().transpose() * (data_.Response() - data_.Design() * beta);
	}

	const core::PairedSample &Data() const {
		return data_;
	}

private:
	core::PairedSample data_;
};

} // namespace objectives
} // namespace libestim
