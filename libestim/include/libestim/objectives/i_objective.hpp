#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <utility>

namespace libestim {
namespace objectives {

/**
 * IObjective: scalar-valued function of a parameter vector
 *
 * This is everything an optimizer may assume about what it minimizes.
 * Evaluate() must be const and free of side effects so that one objective
 * can be shared by concurrent optimizer runs.
 */
class IObjective {
public:
	virtual ~IObjective() = default;

	/// Length of the parameter vector
	virtual size_t Dimension() const = 0;

	virtual double Evaluate(const Eigen::VectorXd &x) const = 0;

	/// True if Gradient() is implemented
	virtual bool HasGradient() const {
		return false;
	}

	/**
	 * Analytic gradient at x
	 *
	 * @throws std::logic_error if HasGradient() is false
	 */
	virtual Eigen::VectorXd Gradient(const Eigen::VectorXd &x) const {
		(void)x;
		throw std::logic_error("objective does not provide a gradient");
	}
};

/**
 * FunctionObjective: adapts a callable to IObjective
 *
 * Example usage:
 * ```cpp
 * FunctionObjective rosen(2, [](const Eigen::VectorXd &v) {
 *     return 100 * std::pow(v(1) - v(0) * v(0), 2) + std::pow(1 - v(0), 2);
 * });
 * ```
 */
class FunctionObjective : public IObjective {
public:
	using Function = std::function<double(const Eigen::VectorXd &)>;

	FunctionObjective(size_t dimension, Function fn) : dimension_(dimension), fn_(std::move(fn)) {
		if (!fn_) {
			throw std::invalid_argument("FunctionObjective requires a callable");
		}
	}

	size_t Dimension() const override {
		return dimension_;
	}

	double Evaluate(const Eigen::VectorXd &x) const override {
		return fn_(x);
	}

private:
	size_t dimension_;
	Function fn_;
};

} // namespace objectives
} // namespace libestim
