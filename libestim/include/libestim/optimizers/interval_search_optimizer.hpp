#pragma once

#include "libestim/core/errors.hpp"
#include "libestim/core/estimation_options.hpp"
#include "libestim/optimizers/i_optimizer.hpp"
#include "libestim/search/interval_minimizer.hpp"
#include "libestim/utils/random_source.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <cstdint>
#include <string>

namespace libestim {
namespace optimizers {

/**
 * IOptimizer adapter over the random interval search
 *
 * Minimizes 1-D objectives over a fixed bracket. Every call seeds a fresh
 * RandomSource from the configured seed, so the optimizer is a pure function
 * of (objective, start) and may be shared between threads. The start point
 * only has to lie in the bracket; the search itself starts from a uniform draw.
 *
 * Example usage:
 * ```cpp
 * IntervalSearchOptimizer opt(-10.0, 10.0, 42);
 * BootstrapLinearEstimator est(std::make_shared<IntervalSearchOptimizer>(opt));
 * ```
 */
class IntervalSearchOptimizer : public IOptimizer {
public:
	/**
	 * @param lower Left end of the search bracket
	 * @param upper Right end of the search bracket
	 * @param seed Seed of the per-call random source
	 * @param options Interval search options
	 * @throws DegenerateBracketError if lower > upper or a bound is not finite
	 */
	IntervalSearchOptimizer(double lower, double upper, uint64_t seed,
	                        core::IntervalSearchOptions options = core::IntervalSearchOptions())
	    : lower_(lower), upper_(upper), seed_(seed), options_(options) {
		if (!std::isfinite(lower_) || !std::isfinite(upper_) || lower_ > upper_) {
			throw core::DegenerateBracketError("invalid bracket [" + std::to_string(lower_) + ", " +
			                                   std::to_string(upper_) + "]");
		}
		options_.Validate();
	}

	std::string GetName() const override {
		return "interval_search";
	}

	core::OptimizerResult Minimize(const objectives::IObjective &objective,
	                               const Eigen::VectorXd &start) const override {
		if (objective.Dimension() != 1 || start.size() != 1) {
			throw core::DimensionMismatchError("interval search minimizes 1-D objectives (got dimension " +
			                                   std::to_string(objective.Dimension()) + ")");
		}

		utils::RandomSource rng(seed_);
		Eigen::VectorXd point(1);
		size_t n_evals = 0;
		auto f = [&objective, &point, &n_evals](double x) {
			point(0) = x;
			n_evals++;
			return objective.Evaluate(point);
		};

		core::IntervalSearchResult search = search::IntervalMinimizer::Minimize(f, lower_, upper_, rng, options_);

		core::OptimizerResult result;
		result.x = Eigen::VectorXd::Constant(1, search.minimizer);
		result.value = search.value;
		result.iterations = search.iterations;
		result.function_evaluations = n_evals;
		result.converged = (search.status == core::SearchStatus::Converged ||
		                    search.status == core::SearchStatus::DegenerateBracket) &&
		                   std::isfinite(search.value);
		result.message = core::SearchStatusName(search.status);
		return result;
	}

	double Lower() const {
		return lower_;
	}

	double Upper() const {
		return upper_;
	}

private:
	double lower_;
	double upper_;
	uint64_t seed_;
	core::IntervalSearchOptions options_;
};

} // namespace optimizers
} // namespace libestim
