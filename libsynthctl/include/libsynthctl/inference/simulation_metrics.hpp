#pragma once

#include "libsynthctl/core/errors.hpp"
#include <Eigen/Dense>
#include <string>

namespace libsynthctl {
namespace inference {

/**
 * Summary of estimator quality over repeated simulations
 */
struct SimulationSummary {
	/// Mean squared error of the effects around the true effect
	double mse = 0.0;

	/// Share of confidence intervals containing the estimated effect
	double coverage = 0.0;

	/// Mean interval length (upper - lower)
	double mean_length = 0.0;
};

/**
 * SimulationMetrics: evaluate estimated effects and intervals from simulations
 */
class SimulationMetrics {
public:
	/**
	 * @param effects Estimated effects, one per simulation
	 * @param ci_lowers Interval lower bounds (same length)
	 * @param ci_uppers Interval upper bounds (same length)
	 * @param true_effect Effect used to generate the data
	 * @throws InvalidArgumentError if inputs are empty or differ in length
	 */
	static SimulationSummary Evaluate(const Eigen::VectorXd &effects, const Eigen::VectorXd &ci_lowers,
	                                  const Eigen::VectorXd &ci_uppers, double true_effect = 0.0);
};

inline SimulationSummary SimulationMetrics::Evaluate(const Eigen::VectorXd &effects, const Eigen::VectorXd &ci_lowers,
                                                     const Eigen::VectorXd &ci_uppers, double true_effect) {
	if (effects.size() == 0) {
		throw InvalidArgumentError(InvalidArgumentCause::EMPTY_PERIODS, "no simulated effects to evaluate");
	}
	if (ci_lowers.size() != effects.size() || ci_uppers.size() != effects.size()) {
		throw InvalidArgumentError(InvalidArgumentCause::PERIOD_MISMATCH,
		                           "effects and interval bounds have different lengths (" +
		                               std::to_string(effects.size()) + ", " + std::to_string(ci_lowers.size()) +
		                               ", " + std::to_string(ci_uppers.size()) + ")");
	}

	SimulationSummary summary;
	summary.mse = (effects.array() - true_effect).square().mean();
	summary.coverage = ((effects.array() >= ci_lowers.array()) && (effects.array() <= ci_uppers.array()))
	                       .cast<double>()
	                       .mean();
	summary.mean_length = (ci_uppers - ci_lowers).mean();
	return summary;
}

} // namespace inference
} // namespace libsynthctl
