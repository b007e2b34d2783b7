#pragma once

#include "libestim/core/estimation_options.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace libestim {
namespace core {

/**
 * All option groups of an estimation run
 */
struct EstimationConfig {
	IntervalSearchOptions interval_search;
	NelderMeadOptions nelder_mead;
	BootstrapOptions bootstrap;

	/// Optimizer name for MakeOptimizer ("nelder_mead" or "least_squares")
	std::string optimizer = "nelder_mead";
};

/**
 * Parse option structs from JSON documents
 *
 * Each Parse* function reads one JSON object. Keys that are absent keep their
 * in-class defaults. The parsed options are validated before they are
 * returned.
 *
 * Example document:
 * ```json
 * {
 *   "optimizer": "least_squares",
 *   "interval_search": {"tolerance": 1e-8, "max_iterations": 500, "stopping_rule": "bracket_width"},
 *   "nelder_mead": {"max_iterations": 2000},
 *   "bootstrap": {"n_replicates": 200, "n_threads": 4, "keep_replicates": true}
 * }
 * ```
 *
 * All functions throw std::invalid_argument for a non-object value, an
 * unknown key (the message lists the valid keys), a wrongly typed value, or
 * options that fail Validate().
 */
class OptionsParser {
public:
	static IntervalSearchOptions ParseIntervalSearch(const nlohmann::json &j);

	static NelderMeadOptions ParseNelderMead(const nlohmann::json &j);

	static BootstrapOptions ParseBootstrap(const nlohmann::json &j);

	/// Parse a document with optional "optimizer", "interval_search", "nelder_mead" and "bootstrap" members
	static EstimationConfig Parse(const nlohmann::json &j);

	/**
	 * Load and parse a JSON file
	 *
	 * @throws std::runtime_error if the file cannot be opened
	 * @throws std::invalid_argument if it is not valid JSON or has invalid options
	 */
	static EstimationConfig ParseFile(const std::string &path);

	/// "objective_improvement" or "bracket_width"
	static StoppingRule ParseStoppingRule(const std::string &name);

	static std::string StoppingRuleName(StoppingRule rule);
};

} // namespace core
} // namespace libestim
