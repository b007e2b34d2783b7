#include "libestim/core/options_parser.hpp"
#include "libestim/utils/tracing.hpp"

#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace libestim {
namespace core {

namespace {

void RequireObject(const nlohmann::json &j, const std::string &section) {
	if (!j.is_object()) {
		throw std::invalid_argument("Options for '" + section + "' must be a JSON object, got: " + j.type_name());
	}
}

double GetDouble(const nlohmann::json &value, const std::string &key) {
	if (!value.is_number()) {
		throw std::invalid_argument("Option '" + key + "' must be a number, got: " + value.type_name());
	}
	return value.get<double>();
}

size_t GetCount(const nlohmann::json &value, const std::string &key) {
	// Accept both signed and unsigned JSON integers, reject negative ones
	if (value.is_number_unsigned()) {
		return value.get<size_t>();
	}
	if (value.is_number_integer()) {
		const auto v = value.get<int64_t>();
		if (v < 0) {
			throw std::invalid_argument("Option '" + key + "' must be non-negative, got: " + std::to_string(v));
		}
		return static_cast<size_t>(v);
	}
	throw std::invalid_argument("Option '" + key + "' must be an integer, got: " + value.type_name());
}

bool GetBool(const nlohmann::json &value, const std::string &key) {
	if (!value.is_boolean()) {
		throw std::invalid_argument("Option '" + key + "' must be a boolean, got: " + value.type_name());
	}
	return value.get<bool>();
}

std::string GetString(const nlohmann::json &value, const std::string &key) {
	if (!value.is_string()) {
		throw std::invalid_argument("Option '" + key + "' must be a string, got: " + value.type_name());
	}
	return value.get<std::string>();
}

} // namespace

StoppingRule OptionsParser::ParseStoppingRule(const std::string &name) {
	if (name == "objective_improvement") {
		return StoppingRule::ObjectiveImprovement;
	}
	if (name == "bracket_width") {
		return StoppingRule::BracketWidth;
	}
	throw std::invalid_argument("Option 'stopping_rule' must be 'objective_improvement' or 'bracket_width', got: '" +
	                            name + "'");
}

std::string OptionsParser::StoppingRuleName(StoppingRule rule) {
	switch (rule) {
	case StoppingRule::ObjectiveImprovement:
		return "objective_improvement";
	case StoppingRule::BracketWidth:
		return "bracket_width";
	}
	return "unknown";
}

IntervalSearchOptions OptionsParser::ParseIntervalSearch(const nlohmann::json &j) {
	RequireObject(j, "interval_search");
	IntervalSearchOptions opts;

	for (auto it = j.begin(); it != j.end(); ++it) {
		const std::string &key = it.key();
		if (key == "tolerance") {
			opts.tolerance = GetDouble(it.value(), key);
		} else if (key == "max_iterations") {
			opts.max_iterations = GetCount(it.value(), key);
		} else if (key == "stopping_rule") {
			opts.stopping_rule = ParseStoppingRule(GetString(it.value(), key));
		} else {
			throw std::invalid_argument("Unknown interval_search option: '" + key +
			                            "'. Valid options are: tolerance, max_iterations, stopping_rule");
		}
	}

	opts.Validate();
	return opts;
}

NelderMeadOptions OptionsParser::ParseNelderMead(const nlohmann::json &j) {
	RequireObject(j, "nelder_mead");
	NelderMeadOptions opts;

	for (auto it = j.begin(); it != j.end(); ++it) {
		const std::string &key = it.key();
		if (key == "reflection") {
			opts.reflection = GetDouble(it.value(), key);
		} else if (key == "expansion") {
			opts.expansion = GetDouble(it.value(), key);
		} else if (key == "contraction") {
			opts.contraction = GetDouble(it.value(), key);
		} else if (key == "shrink") {
			opts.shrink = GetDouble(it.value(), key);
		} else if (key == "max_iterations") {
			opts.max_iterations = GetCount(it.value(), key);
		} else if (key == "relative_tolerance") {
			opts.relative_tolerance = GetDouble(it.value(), key);
		} else if (key == "initial_step") {
			opts.initial_step = GetDouble(it.value(), key);
		} else if (key == "restarts") {
			opts.restarts = GetCount(it.value(), key);
		} else {
			throw std::invalid_argument("Unknown nelder_mead option: '" + key +
			                            "'. Valid options are: reflection, expansion, contraction, shrink, "
			                            "max_iterations, relative_tolerance, initial_step, restarts");
		}
	}

	opts.Validate();
	return opts;
}

BootstrapOptions OptionsParser::ParseBootstrap(const nlohmann::json &j) {
	RequireObject(j, "bootstrap");
	BootstrapOptions opts;

	for (auto it = j.begin(); it != j.end(); ++it) {
		const std::string &key = it.key();
		if (key == "n_replicates") {
			opts.n_replicates = GetCount(it.value(), key);
		} else if (key == "n_threads") {
			opts.n_threads = GetCount(it.value(), key);
		} else if (key == "keep_replicates") {
			opts.keep_replicates = GetBool(it.value(), key);
		} else if (key == "strict_covariance") {
			opts.strict_covariance = GetBool(it.value(), key);
		} else if (key == "rank_tolerance") {
			opts.rank_tolerance = GetDouble(it.value(), key);
		} else {
			throw std::invalid_argument("Unknown bootstrap option: '" + key +
			                            "'. Valid options are: n_replicates, n_threads, keep_replicates, "
			                            "strict_covariance, rank_tolerance");
		}
	}

	opts.Validate();
	return opts;
}

EstimationConfig OptionsParser::Parse(const nlohmann::json &j) {
	RequireObject(j, "document");
	EstimationConfig config;

	for (auto it = j.begin(); it != j.end(); ++it) {
		const std::string &key = it.key();
		if (key == "optimizer") {
			config.optimizer = GetString(it.value(), key);
			if (config.optimizer != "nelder_mead" && config.optimizer != "least_squares") {
				throw std::invalid_argument("Option 'optimizer' must be 'nelder_mead' or 'least_squares', got: '" +
				                            config.optimizer + "'");
			}
		} else if (key == "interval_search") {
			config.interval_search = ParseIntervalSearch(it.value());
		} else if (key == "nelder_mead") {
			config.nelder_mead = ParseNelderMead(it.value());
		} else if (key == "bootstrap") {
			config.bootstrap = ParseBootstrap(it.value());
		} else {
			throw std::invalid_argument("Unknown section: '" + key +
			                            "'. Valid sections are: optimizer, interval_search, nelder_mead, bootstrap");
		}
	}

	return config;
}

EstimationConfig OptionsParser::ParseFile(const std::string &path) {
	std::ifstream in(path);
	if (!in) {
		throw std::runtime_error("Cannot open options file '" + path + "'");
	}

	nlohmann::json document;
	try {
		in >> document;
	} catch (const nlohmann::json::parse_error &e) {
		throw std::invalid_argument("Options file '" + path + "' is not valid JSON: " + e.what());
	}

	ESTIM_DEBUG("Loaded options from " << path);
	return Parse(document);
}

} // namespace core
} // namespace libestim
