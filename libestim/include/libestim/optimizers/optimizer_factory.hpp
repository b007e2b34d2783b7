#pragma once

#include "libestim/core/estimation_options.hpp"
#include "libestim/optimizers/i_optimizer.hpp"
#include "libestim/optimizers/least_squares_optimizer.hpp"
#include "libestim/optimizers/nelder_mead_optimizer.hpp"
#include <memory>
#include <stdexcept>
#include <string>

namespace libestim {
namespace optimizers {

/**
 * Runtime optimizer selection
 *
 * @param name "nelder_mead" or "least_squares"
 * @param nelder_mead Options for Nelder-Mead (also the least-squares fallback)
 * @throws std::invalid_argument for an unknown name
 */
inline std::shared_ptr<const IOptimizer> MakeOptimizer(const std::string &name,
                                                       const core::NelderMeadOptions &nelder_mead =
                                                           core::NelderMeadOptions()) {
	if (name == "nelder_mead") {
		return std::make_shared<NelderMeadOptimizer>(nelder_mead);
	}
	if (name == "least_squares") {
		return std::make_shared<LeastSquaresOptimizer>(-1.0, std::make_shared<NelderMeadOptimizer>(nelder_mead));
	}
	throw std::invalid_argument("optimizer must be 'nelder_mead' or 'least_squares' (got '" + name + "')");
}

} // namespace optimizers
} // namespace libestim
