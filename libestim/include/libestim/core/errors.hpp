#pragma once

#include <stdexcept>
#include <string>

namespace libestim {
namespace core {

/**
 * Error kinds reported by libestim
 *
 * - InvalidInput: malformed options or empty inputs
 * - DimensionMismatch: y length != X rows, or a resample index out of range
 * - DegenerateBracket: zero-width, inverted or non-finite search interval
 * - OptimizerNonConvergence: optimizer exhausted its budget (recovered, flagged)
 * - SingularCovariance: bootstrap replicates cannot produce a usable covariance
 */
enum class ErrorKind { InvalidInput, DimensionMismatch, DegenerateBracket, OptimizerNonConvergence, SingularCovariance };

inline std::string ErrorKindName(ErrorKind kind) {
	switch (kind) {
	case ErrorKind::InvalidInput:
		return "InvalidInput";
	case ErrorKind::DimensionMismatch:
		return "DimensionMismatch";
	case ErrorKind::DegenerateBracket:
		return "DegenerateBracket";
	case ErrorKind::OptimizerNonConvergence:
		return "OptimizerNonConvergence";
	case ErrorKind::SingularCovariance:
		return "SingularCovariance";
	default:
		return "Unknown";
	}
}

/**
 * Base class of all typed estimation errors
 *
 * Invalid options keep using std::invalid_argument (see *Options::Validate()),
 * everything that depends on the data being estimated derives from here.
 */
class EstimationError : public std::runtime_error {
public:
	EstimationError(ErrorKind kind, const std::string &message)
	    : std::runtime_error(ErrorKindName(kind) + ": " + message), kind_(kind) {
	}

	ErrorKind Kind() const {
		return kind_;
	}

private:
	ErrorKind kind_;
};

class DimensionMismatchError : public EstimationError {
public:
	explicit DimensionMismatchError(const std::string &message)
	    : EstimationError(ErrorKind::DimensionMismatch, message) {
	}
};

class DegenerateBracketError : public EstimationError {
public:
	explicit DegenerateBracketError(const std::string &message)
	    : EstimationError(ErrorKind::DegenerateBracket, message) {
	}
};

class SingularCovarianceError : public EstimationError {
public:
	explicit SingularCovarianceError(const std::string &message)
	    : EstimationError(ErrorKind::SingularCovariance, message) {
	}
};

} // namespace core
} // namespace libestim
