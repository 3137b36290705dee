#pragma once

#include "libsynthctl/core/errors.hpp"
#include <cstdint>
#include <string>

namespace libsynthctl {
namespace core {

/**
 * Whether the observed statistic counts as a member of its own reference set
 *
 * - INCLUDE_OBSERVED: p = (count + 1) / (n + 1)  (Abadie et al. 2010)
 * - EXCLUDE_OBSERVED: p = count / n              (Abadie et al. 2015 and others)
 */
enum class PValueConvention { INCLUDE_OBSERVED, EXCLUDE_OBSERVED };

/**
 * Configuration options for placebo (permutation) inference
 *
 * Design notes:
 * - All defaults specified in-class
 * - Confidence level is only checked when intervals are requested
 */
struct PlaceboOptions {
	// ========================================================================
	// Placebo sampling
	// ========================================================================

	/// Upper bound on the number of control-unit combinations evaluated
	/// - max_combinations <= 0: enumerate every combination
	/// - 0 < max_combinations < C(N0, N1): draw this many random combinations
	/// Default: 1000000
	int64_t max_combinations = 1000000;

	// ========================================================================
	// Outputs
	// ========================================================================

	/// Keep the full placebo distribution on the returned results
	/// Default: false
	bool keep_placebo_distribution = false;

	/// Build percentile confidence intervals (implies keeping placebos)
	/// Default: false
	bool build_confidence_interval = false;

	/// Confidence level for intervals, strictly inside (0, 1)
	/// Default: 0.95
	double confidence_level = 0.95;

	/// p-value convention
	/// Default: INCLUDE_OBSERVED
	PValueConvention p_value_convention = PValueConvention::INCLUDE_OBSERVED;

	// ========================================================================
	// Constructors
	// ========================================================================

	PlaceboOptions() = default;

	/// p-values only
	static PlaceboOptions PValuesOnly(int64_t max_combinations_ = 1000000) {
		PlaceboOptions opts;
		opts.max_combinations = max_combinations_;
		return opts;
	}

	/// p-values plus confidence intervals at the given level
	static PlaceboOptions WithConfidenceInterval(double level_ = 0.95, int64_t max_combinations_ = 1000000) {
		PlaceboOptions opts;
		opts.max_combinations = max_combinations_;
		opts.build_confidence_interval = true;
		opts.confidence_level = level_;
		return opts;
	}

	/// Whether placebo draws have to be retained during the run
	bool KeepsPlacebos() const {
		return keep_placebo_distribution || build_confidence_interval;
	}

	// ========================================================================
	// Validation
	// ========================================================================

	/**
	 * Validate option values
	 *
	 * @throws InvalidArgumentError if validation fails
	 */
	void Validate() const {
		if (build_confidence_interval && !(confidence_level > 0.0 && confidence_level < 1.0)) {
			throw InvalidArgumentError(InvalidArgumentCause::LEVEL_OUT_OF_RANGE,
			                           "confidence_level must be in (0, 1) (got " + std::to_string(confidence_level) +
			                               ")");
		}
	}
};

} // namespace core
} // namespace libsynthctl
