#pragma once

#include "libestim/core/errors.hpp"
#include "libestim/core/estimation_options.hpp"
#include "libestim/core/estimation_result.hpp"
#include "libestim/objectives/squared_deviation_loss.hpp"
#include "libestim/utils/random_source.hpp"
#include "libestim/utils/tracing.hpp"
#include <cmath>
#include <functional>
#include <string>
#include <vector>

namespace libestim {
namespace search {

/**
 * Random interval search for a 1-D minimum
 *
 * Derivative-free, stochastic bracket narrowing. The bracket (x1, x2, x3)
 * keeps x2 as the best point seen; every iteration draws a candidate x4
 * uniformly from the larger of [x1, x2] and [x2, x3]:
 *
 * - f(x4) > f(x2): the explored side's outer endpoint moves to x4
 * - otherwise: the bracket slides toward x4 (old x2 becomes the endpoint
 *   opposite the explored side) and x2 = x4
 *
 * The comparison of the two spans is strict (a > b explores left), so equal
 * spans explore the right side.
 *
 * Not an exact method: two runs with different seeds return different
 * points. For a convex objective the bracket always contains the minimizer.
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 * - The random source is passed explicitly and is the only state touched
 */
class IntervalMinimizer {
public:
	using Objective = std::function<double(double)>;

	/**
	 * Minimize f over [lower, upper]
	 *
	 * @param f Objective
	 * @param lower Left endpoint x1
	 * @param upper Right endpoint x3
	 * @param rng Random source for the interior draws
	 * @param options Tolerance, iteration cap and stopping rule
	 * @return Best interior point, its objective value and the final bracket
	 *
	 * @throws DegenerateBracketError if lower > upper or a bound is not finite
	 * @throws std::invalid_argument if options are invalid
	 */
	static core::IntervalSearchResult Minimize(const Objective &f, double lower, double upper, utils::RandomSource &rng,
	                                           const core::IntervalSearchOptions &options = core::IntervalSearchOptions());

	/**
	 * Minimize the squared deviation loss of a sample
	 *
	 * The initial bracket is [min(sample), max(sample)].
	 *
	 * @throws std::invalid_argument if sample is empty
	 */
	static core::IntervalSearchResult MinimizeSample(const std::vector<double> &sample, utils::RandomSource &rng,
	                                                 const core::IntervalSearchOptions &options =
	                                                     core::IntervalSearchOptions());

	/// Uniform draw from [lo, hi]
	using Draw = std::function<double(double, double)>;

	/**
	 * One iteration: draw a candidate from the larger span and update the
	 * bracket in place
	 *
	 * @param f2 Objective at x2
	 * @param draw Candidate generator, called once with the explored span
	 */
	static void Step(const Objective &f, double &x1, double &x2, double &x3, double f2, const Draw &draw);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline core::IntervalSearchResult IntervalMinimizer::Minimize(const Objective &f, double lower, double upper,
                                                              utils::RandomSource &rng,
                                                              const core::IntervalSearchOptions &options) {
	options.Validate();

	if (!std::isfinite(lower) || !std::isfinite(upper)) {
		throw core::DegenerateBracketError("bracket bounds must be finite");
	}
	if (lower > upper) {
		throw core::DegenerateBracketError("inverted bracket [" + std::to_string(lower) + ", " +
		                                   std::to_string(upper) + "]");
	}

	core::IntervalSearchResult result;
	result.f_lower = f(lower);
	result.f_upper = f(upper);

	// Zero-width bracket: the only candidate is the bound itself
	if (lower == upper) {
		ESTIM_DEBUG("Degenerate bracket at " << lower << ", returning it without iterating");
		result.minimizer = lower;
		result.value = result.f_lower;
		result.lower = lower;
		result.upper = upper;
		result.iterations = 0;
		result.last_improvement = 0.0;
		result.status = core::SearchStatus::DegenerateBracket;
		return result;
	}

	double x1 = lower;
	double x3 = upper;
	double x2 = rng.UniformReal(x1, x3);
	double f2 = f(x2);

	const double tol = options.tolerance;
	const bool width_rule = options.stopping_rule == core::StoppingRule::BracketWidth;

	double diff = tol + 1.0;
	size_t iter = 1;

	const Draw draw = [&rng](double lo, double hi) { return rng.UniformReal(lo, hi); };

	while (diff > tol && iter <= options.max_iterations) {
		Step(f, x1, x2, x3, f2, draw);

		const double f2_old = f2;
		f2 = f(x2);
		diff = width_rule ? (x3 - x1) : (f2_old - f2);

		ESTIM_TRACE("iter " << iter << ": bracket [" << x1 << ", " << x2 << ", " << x3 << "] f2=" << f2
		                    << " diff=" << diff);
		iter++;
	}

	result.minimizer = x2;
	result.value = f2;
	result.lower = x1;
	result.upper = x3;
	result.iterations = iter - 1;
	result.last_improvement = diff;
	if (!std::isfinite(f2)) {
		// NaN diff also ends the loop; that is not convergence
		result.status = core::SearchStatus::NonFiniteObjective;
	} else {
		result.status = diff > tol ? core::SearchStatus::IterationLimit : core::SearchStatus::Converged;
	}

	if (result.status == core::SearchStatus::NonFiniteObjective) {
		ESTIM_WARN("Interval search stopped at x2=" << x2 << " with non-finite objective " << f2);
	} else if (result.status == core::SearchStatus::IterationLimit) {
		ESTIM_DEBUG("Interval search hit max_iterations=" << options.max_iterations << " (last diff " << diff
		                                                  << ")");
	}

	return result;
}

inline void IntervalMinimizer::Step(const Objective &f, double &x1, double &x2, double &x3, double f2,
                                    const Draw &draw) {
	const double a = x2 - x1;
	const double b = x3 - x2;

	if (a > b) {
		// Left side [x1, x2] is larger
		const double x4 = draw(x1, x2);
		const double f4 = f(x4);
		if (f4 > f2) {
			x1 = x4;
		} else {
			x3 = x2;
			x2 = x4;
		}
	} else {
		// Right side [x2, x3] is larger, or the spans are equal
		const double x4 = draw(x2, x3);
		const double f4 = f(x4);
		if (f4 > f2) {
			x3 = x4;
		} else {
			x1 = x2;
			x2 = x4;
		}
	}
}

inline core::IntervalSearchResult IntervalMinimizer::MinimizeSample(const std::vector<double> &sample,
                                                                    utils::RandomSource &rng,
                                                                    const core::IntervalSearchOptions &options) {
	objectives::SquaredDeviationLoss loss(sample);
	return Minimize([&loss](double mu) { return loss.Evaluate(mu); }, loss.Min(), loss.Max(), rng, options);
}

} // namespace search
} // namespace libestim
