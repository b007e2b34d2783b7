#pragma once

#include "libestim/core/estimation_result.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace libestim {
namespace objectives {

/**
 * Squared deviation (L2) loss of a location estimate
 *
 *   f(μ) = Σᵢ (xᵢ - μ)²
 *
 * Minimized by the sample mean. Used as the objective of the random interval
 * search over a sample.
 */
class SquaredDeviationLoss {
public:
	/**
	 * @throws std::invalid_argument if sample is empty
	 */
	explicit SquaredDeviationLoss(std::vector<double> sample) : sample_(std::move(sample)) {
		if (sample_.empty()) {
			throw std::invalid_argument("SquaredDeviationLoss requires a non-empty sample");
		}
	}

	double Evaluate(double mu) const {
		double loss = 0.0;
		for (double x : sample_) {
			const double d = x - mu;
			loss += d * d;
		}
		return loss;
	}

	double operator()(double mu) const {
		return Evaluate(mu);
	}

	/// Evaluate and return the sample, the candidate and the loss together
	core::LossEvaluation EvaluateDetailed(double mu) const {
		core::LossEvaluation eval;
		eval.sample = sample_;
		eval.value = mu;
		eval.loss = Evaluate(mu);
		return eval;
	}

	double Min() const {
		return *std::min_element(sample_.begin(), sample_.end());
	}

	double Max() const {
		return *std::max_element(sample_.begin(), sample_.end());
	}

	double Mean() const {
		double sum = 0.0;
		for (double x : sample_) {
			sum += x;
		}
		return sum / static_cast<double>(sample_.size());
	}

	const std::vector<double> &Sample() const {
		return sample_;
	}

private:
	std::vector<double> sample_;
};

} // namespace objectives
} // namespace libestim
