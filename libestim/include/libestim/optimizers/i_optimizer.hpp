#pragma once

#include "libestim/core/estimation_result.hpp"
#include "libestim/objectives/i_objective.hpp"
#include <Eigen/Dense>
#include <string>

namespace libestim {
namespace optimizers {

/**
 * IOptimizer: abstract interface for the minimizers used by the estimators
 *
 * The only contract the estimators rely on is "minimize a scalar-valued
 * objective given a starting point". Keeping it behind an interface allows:
 * - Testing against a deterministic closed-form optimizer
 * - Runtime optimizer selection (see MakeOptimizer)
 * - Plugging in an external library without touching the estimators
 *
 * Contract:
 * - Minimize() is a pure function of (objective, start): no hidden random
 *   state, same inputs give the same result
 * - Minimize() is const and may be called concurrently from several threads
 * - Running out of budget is not an error: the best point found is returned
 *   with converged = false
 */
class IOptimizer {
public:
	virtual ~IOptimizer() = default;

	/**
	 * Get the name of this optimizer
	 *
	 * @return Optimizer name (e.g., "nelder_mead", "least_squares")
	 */
	virtual std::string GetName() const = 0;

	/**
	 * Minimize objective starting from start
	 *
	 * @param objective Function to minimize
	 * @param start Starting point (length = objective.Dimension())
	 * @return Best point found with its value and convergence flag
	 *
	 * @throws DimensionMismatchError if start.size() != objective.Dimension()
	 */
	virtual core::OptimizerResult Minimize(const objectives::IObjective &objective,
	                                       const Eigen::VectorXd &start) const = 0;
};

} // namespace optimizers
} // namespace libestim
