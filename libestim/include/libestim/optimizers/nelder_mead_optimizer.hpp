#pragma once

#include "libestim/core/errors.hpp"
#include "libestim/core/estimation_options.hpp"
#include "libestim/core/estimation_result.hpp"
#include "libestim/optimizers/i_optimizer.hpp"
#include "libestim/utils/tracing.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <string>
#include <vector>

namespace libestim {
namespace optimizers {

/**
 * Nelder-Mead simplex optimizer
 *
 * Derivative-free; only objective values are used. Defaults match R's
 * optim(method = "Nelder-Mead").
 *
 * Algorithm (per iteration, vertices sorted best to worst):
 * 1. Reflect the worst vertex through the centroid of the others
 * 2. Expand if the reflection beats the best vertex
 * 3. Contract (outside or inside) if the reflection beats only the worst
 * 4. Shrink every vertex toward the best if contraction fails
 *
 * Convergence: f_worst - f_best <= reltol * (|f_best| + reltol).
 *
 * The initial simplex offsets each coordinate of start by
 * initial_step * max|start| (initial_step itself when start is all zeros).
 * With restarts > 0, a converged run is restarted from its best vertex while
 * the restart keeps improving and the iteration budget lasts.
 */
class NelderMeadOptimizer : public IOptimizer {
public:
	explicit NelderMeadOptimizer(core::NelderMeadOptions options = core::NelderMeadOptions())
	    : options_(options) {
		options_.Validate();
	}

	std::string GetName() const override {
		return "nelder_mead";
	}

	core::OptimizerResult Minimize(const objectives::IObjective &objective,
	                               const Eigen::VectorXd &start) const override;

	const core::NelderMeadOptions &Options() const {
		return options_;
	}

private:
	/// Replace non-finite objective values with +inf so they always lose comparisons
	static double SafeEvaluate(const objectives::IObjective &objective, const Eigen::VectorXd &x, size_t &n_evals);

	/// One simplex run from start, at most max_iterations iterations
	core::OptimizerResult RunSimplex(const objectives::IObjective &objective, const Eigen::VectorXd &start,
	                                 size_t max_iterations, size_t &n_evals) const;

	core::NelderMeadOptions options_;
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline double NelderMeadOptimizer::SafeEvaluate(const objectives::IObjective &objective, const Eigen::VectorXd &x,
                                                size_t &n_evals) {
	n_evals++;
	const double value = objective.Evaluate(x);
	return std::isfinite(value) ? value : std::numeric_limits<double>::infinity();
}

inline core::OptimizerResult NelderMeadOptimizer::Minimize(const objectives::IObjective &objective,
                                                           const Eigen::VectorXd &start) const {
	const size_t dim = objective.Dimension();
	if (static_cast<size_t>(start.size()) != dim) {
		throw core::DimensionMismatchError("start point has length " + std::to_string(start.size()) +
		                                   " but objective has dimension " + std::to_string(dim));
	}

	core::OptimizerResult result;
	size_t n_evals = 0;

	if (dim == 0) {
		result.x = start;
		result.value = SafeEvaluate(objective, start, n_evals);
		result.function_evaluations = n_evals;
		result.converged = true;
		result.message = "empty parameter vector";
		return result;
	}

	result = RunSimplex(objective, start, options_.max_iterations, n_evals);
	size_t used = result.iterations;

	// Restart from the best vertex: a collapsed simplex can report convergence early
	const double reltol = options_.relative_tolerance;
	for (size_t attempt = 0; attempt < options_.restarts && result.converged; attempt++) {
		if (used >= options_.max_iterations) {
			break;
		}

		core::OptimizerResult restarted = RunSimplex(objective, result.x, options_.max_iterations - used, n_evals);
		used += restarted.iterations;
		restarted.iterations = used;

		const bool improved = result.value - restarted.value > reltol * (std::fabs(result.value) + reltol);
		result = restarted;
		if (!improved) {
			break;
		}
		ESTIM_TRACE("Nelder-Mead restart " << attempt + 1 << " improved f to " << result.value);
	}

	result.function_evaluations = n_evals;
	result.message = result.converged ? "converged" : "max_iterations reached";

	if (!result.converged) {
		ESTIM_DEBUG("Nelder-Mead stopped after " << result.iterations << " iterations without convergence (f="
		                                         << result.value << ")");
	}

	return result;
}

inline core::OptimizerResult NelderMeadOptimizer::RunSimplex(const objectives::IObjective &objective,
                                                             const Eigen::VectorXd &start, size_t max_iterations,
                                                             size_t &n_evals) const {
	const size_t dim = static_cast<size_t>(start.size());

	// Build the initial simplex: dim + 1 vertices
	const double scale = start.cwiseAbs().maxCoeff();
	const double step = scale > 0.0 ? options_.initial_step * scale : options_.initial_step;

	std::vector<Eigen::VectorXd> simplex(dim + 1, start);
	std::vector<double> values(dim + 1);
	for (size_t i = 0; i < dim; i++) {
		simplex[i + 1](static_cast<Eigen::Index>(i)) += step;
	}
	for (size_t i = 0; i <= dim; i++) {
		values[i] = SafeEvaluate(objective, simplex[i], n_evals);
	}

	std::vector<size_t> order(dim + 1);
	const double reltol = options_.relative_tolerance;
	size_t iter = 0;
	bool converged = false;

	while (iter < max_iterations) {
		std::iota(order.begin(), order.end(), 0);
		std::sort(order.begin(), order.end(), [&values](size_t a, size_t b) { return values[a] < values[b]; });

		const size_t best = order.front();
		const size_t worst = order.back();
		const size_t second_worst = order[dim - 1];

		const double spread = values[worst] - values[best];
		if (std::isfinite(spread) && spread <= reltol * (std::fabs(values[best]) + reltol)) {
			converged = true;
			break;
		}

		iter++;

		// Centroid of all vertices except the worst
		Eigen::VectorXd centroid = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(dim));
		for (size_t i = 0; i <= dim; i++) {
			if (i != worst) {
				centroid += simplex[i];
			}
		}
		centroid /= static_cast<double>(dim);

		Eigen::VectorXd reflected = centroid + options_.reflection * (centroid - simplex[worst]);
		const double f_reflected = SafeEvaluate(objective, reflected, n_evals);

		if (f_reflected < values[best]) {
			Eigen::VectorXd expanded = centroid + options_.expansion * (reflected - centroid);
			const double f_expanded = SafeEvaluate(objective, expanded, n_evals);
			if (f_expanded < f_reflected) {
				simplex[worst] = expanded;
				values[worst] = f_expanded;
			} else {
				simplex[worst] = reflected;
				values[worst] = f_reflected;
			}
			continue;
		}

		if (f_reflected < values[second_worst]) {
			simplex[worst] = reflected;
			values[worst] = f_reflected;
			continue;
		}

		// Contraction: outside if the reflection beat the worst vertex, inside otherwise
		const bool outside = f_reflected < values[worst];
		Eigen::VectorXd contracted = outside ? Eigen::VectorXd(centroid + options_.contraction * (reflected - centroid))
		                                     : Eigen::VectorXd(centroid + options_.contraction * (simplex[worst] - centroid));
		const double f_contracted = SafeEvaluate(objective, contracted, n_evals);

		if (f_contracted < (outside ? f_reflected : values[worst])) {
			simplex[worst] = contracted;
			values[worst] = f_contracted;
			continue;
		}

		// Shrink toward the best vertex
		for (size_t i = 0; i <= dim; i++) {
			if (i != best) {
				simplex[i] = simplex[best] + options_.shrink * (simplex[i] - simplex[best]);
				values[i] = SafeEvaluate(objective, simplex[i], n_evals);
			}
		}
	}

	const size_t best = static_cast<size_t>(std::min_element(values.begin(), values.end()) - values.begin());

	core::OptimizerResult result;
	result.x = simplex[best];
	result.value = values[best];
	result.iterations = iter;
	result.converged = converged;
	return result;
}

} // namespace optimizers
} // namespace libestim
