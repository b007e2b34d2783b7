#pragma once

#include <cmath>
#include <stdexcept>

namespace libestim {
namespace utils {

/**
 * Standard normal CDF: Φ(z) = 0.5 * erfc(-z / sqrt(2))
 */
inline double normal_cdf(double z) {
	return 0.5 * std::erfc(-z / std::sqrt(2.0));
}

/**
 * Standard normal quantile (inverse CDF), Acklam's rational approximation
 *
 * Relative error < 1.15e-9 over (0, 1).
 *
 * @param p Probability in (0, 1)
 * @throws std::domain_error if p <= 0 or p >= 1
 */
inline double normal_quantile(double p) {
	if (!(p > 0.0 && p < 1.0)) {
		throw std::domain_error("normal_quantile: probability p must be in (0, 1)");
	}
	if (p == 0.5) {
		return 0.0;
	}

	static constexpr double a1 = -3.969683028665376e+01;
	static constexpr double a2 = 2.209460984245205e+02;
	static constexpr double a3 = -2.759285104469687e+02;
	static constexpr double a4 = 1.383577518672690e+02;
	static constexpr double a5 = -3.066479806614716e+01;
	static constexpr double a6 = 2.506628277459239e+00;

	static constexpr double b1 = -5.447609879822406e+01;
	static constexpr double b2 = 1.615858368580409e+02;
	static constexpr double b3 = -1.556989798598866e+02;
	static constexpr double b4 = 6.680131188771972e+01;
	static constexpr double b5 = -1.328068155288572e+01;

	static constexpr double c1 = -7.784894002430226e-03;
	static constexpr double c2 = -3.223964580411365e-01;
	static constexpr double c3 = -2.400758277161838e+00;
	static constexpr double c4 = -2.549732539343734e+00;
	static constexpr double c5 = 4.374664141464968e+00;
	static constexpr double c6 = 2.938163982698783e+00;

	static constexpr double d1 = 7.784695709041462e-03;
	static constexpr double d2 = 3.224671290700398e-01;
	static constexpr double d3 = 2.445134137142996e+00;
	static constexpr double d4 = 3.754408661907416e+00;

	static constexpr double p_low = 0.02425;
	static constexpr double p_high = 1.0 - p_low;

	if (p < p_low) {
		double q = std::sqrt(-2.0 * std::log(p));
		return (((((c1 * q + c2) * q + c3) * q + c4) * q + c5) * q + c6) /
		       ((((d1 * q + d2) * q + d3) * q + d4) * q + 1.0);
	}
	if (p <= p_high) {
		double q = p - 0.5;
		double r = q * q;
		return (((((a1 * r + a2) * r + a3) * r + a4) * r + a5) * r + a6) * q /
		       (((((b1 * r + b2) * r + b3) * r + b4) * r + b5) * r + 1.0);
	}
	double q = std::sqrt(-2.0 * std::log(1.0 - p));
	return -(((((c1 * q + c2) * q + c3) * q + c4) * q + c5) * q + c6) /
	       ((((d1 * q + d2) * q + d3) * q + d4) * q + 1.0);
}

/**
 * Two-sided p-value of a standard normal statistic: 2 * (1 - Φ(|z|))
 */
inline double normal_two_sided_pvalue(double z) {
	if (std::isnan(z)) {
		return z;
	}
	return std::erfc(std::fabs(z) / std::sqrt(2.0));
}

} // namespace utils
} // namespace libestim
