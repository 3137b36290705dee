#pragma once

#include "libsynthctl/core/errors.hpp"
#include <Eigen/Dense>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace libsynthctl {
namespace core {

/**
 * Confidence interval for a single effect or for a vector of effects
 *
 * Scalar intervals are stored as length-1 vectors. For the vector form,
 * lower/upper are aligned with the periods of the effect vector.
 */
struct ConfidenceInterval {
	/// Lower bounds (one per effect element)
	Eigen::VectorXd lower;

	/// Upper bounds (one per effect element)
	Eigen::VectorXd upper;

	/// Level (1 - alpha), strictly inside (0, 1)
	double level = 0.95;

	ConfidenceInterval() = default;

	/**
	 * @throws InvalidArgumentError if level is outside (0, 1) or the bounds differ in length
	 */
	ConfidenceInterval(Eigen::VectorXd lower_, Eigen::VectorXd upper_, double level_)
	    : lower(std::move(lower_)), upper(std::move(upper_)), level(level_) {
		if (!(level > 0.0 && level < 1.0)) {
			throw InvalidArgumentError(InvalidArgumentCause::LEVEL_OUT_OF_RANGE,
			                           "confidence level must be in (0, 1), got " + std::to_string(level));
		}
		if (lower.size() != upper.size()) {
			throw InvalidArgumentError(InvalidArgumentCause::PERIOD_MISMATCH,
			                           "interval bounds have different lengths (" + std::to_string(lower.size()) +
			                               " and " + std::to_string(upper.size()) + ")");
		}
	}

	/// Convenience constructor for a scalar interval
	static ConfidenceInterval Scalar(double lower_, double upper_, double level_) {
		return ConfidenceInterval(Eigen::VectorXd::Constant(1, lower_), Eigen::VectorXd::Constant(1, upper_), level_);
	}

	bool IsScalar() const {
		return lower.size() == 1;
	}

	Eigen::Index size() const {
		return lower.size();
	}

	/**
	 * Test if a value lies strictly inside the interval
	 *
	 * @throws std::logic_error for intervals over more than one effect
	 */
	bool Contains(double x) const {
		if (!IsScalar()) {
			throw std::logic_error("Contains() is not defined for more than one confidence interval");
		}
		return lower(0) < x && x < upper(0);
	}

	/// "[level ci: lower, upper]" for a scalar interval
	std::string ToString() const {
		if (IsScalar()) {
			return ToString(0);
		}
		std::ostringstream oss;
		oss << "[" << level << " ci: ";
		AppendVector(oss, lower);
		oss << ", ";
		AppendVector(oss, upper);
		oss << "]";
		return oss.str();
	}

	/// "[level ci: lower_i, upper_i]" for element i
	std::string ToString(Eigen::Index i) const {
		std::ostringstream oss;
		oss << "[" << level << " ci: " << lower(i) << ", " << upper(i) << "]";
		return oss.str();
	}

private:
	static void AppendVector(std::ostringstream &oss, const Eigen::VectorXd &v) {
		oss << "(";
		for (Eigen::Index i = 0; i < v.size(); i++) {
			if (i > 0) {
				oss << " ";
			}
			oss << v(i);
		}
		oss << ")";
	}
};

/**
 * Estimate of one effect view with its placebo-based inference
 *
 * Design notes:
 * - Scalar effects (average, RMS) use length-1 vectors
 * - Optional fields indicated by has_* flags
 * - placebos has one row per placebo draw and one column per effect element
 */
struct EstimationResult {
	/// Point estimate (per period, or a single aggregate)
	Eigen::VectorXd effect;

	/// Permutation p-values (same length as effect)
	Eigen::VectorXd p_value;

	/// Flag indicating if a confidence interval was computed
	bool has_confidence_interval = false;

	/// Confidence interval (valid only if has_confidence_interval)
	ConfidenceInterval confidence_interval;

	/// Flag indicating if the placebo distribution was retained
	bool has_placebos = false;

	/// Placebo distribution (n_placebo × effect.size())
	Eigen::MatrixXd placebos;

	EstimationResult() = default;

	bool IsScalar() const {
		return effect.size() == 1;
	}

	/**
	 * Test if a value lies inside the confidence interval
	 *
	 * @throws std::logic_error if no interval was computed, or the interval is a vector
	 */
	bool Contains(double x) const {
		if (!has_confidence_interval) {
			throw std::logic_error("EstimationResult does not contain a confidence interval");
		}
		return confidence_interval.Contains(x);
	}

	/// One line per effect element: "effect (p-value: p) [level ci: low, high]"
	std::string ToString() const {
		std::ostringstream oss;
		for (Eigen::Index i = 0; i < effect.size(); i++) {
			oss << effect(i) << " (p-value: " << p_value(i) << ")";
			if (has_confidence_interval) {
				oss << " " << confidence_interval.ToString(i);
			}
			if (!IsScalar()) {
				oss << "\n";
			}
		}
		return oss.str();
	}
};

/// Named warning categories raised (not thrown) by the inference engine
enum class WarningCategory {
	/// Confidence interval does not contain zero; too few placebo draws
	INSUFFICIENT_PLACEBOS,
	/// Retained draws cannot resolve the requested level; the interval is narrower than asked for
	LEVEL_NOT_ATTAINABLE
};

struct PlaceboWarning {
	WarningCategory category = WarningCategory::INSUFFICIENT_PLACEBOS;
	std::string message;
};

/**
 * Statistics for a vector of effects and its two joint aggregates
 */
struct PlaceboRunResult {
	/// Per-period effects
	EstimationResult effect_vec;

	/// Average joint effect
	EstimationResult avg_joint_effect;

	/// Root-mean-square joint effect
	EstimationResult rms_joint_effect;

	/// Number of placebo combinations actually evaluated
	size_t n_placebo = 0;

	/// True if combinations were randomly sampled instead of enumerated
	bool sampled = false;

	/// Non-fatal diagnostics produced during the run
	std::vector<PlaceboWarning> warnings;

	bool HasWarning(WarningCategory category) const {
		for (const auto &warning : warnings) {
			if (warning.category == category) {
				return true;
			}
		}
		return false;
	}
};

} // namespace core
} // namespace libsynthctl
