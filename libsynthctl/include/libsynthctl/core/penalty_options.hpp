#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace libsynthctl {
namespace core {

/// Penalty parameter: a single value or an ordered sequence of values
using PenaltyParameter = std::variant<double, std::vector<double>>;

/// Penalty boundary, same alternative as the penalty parameter it was solved for
using PenaltyBound = std::variant<double, std::vector<double>>;

/// Label reported by gradient strategies while searching for a boundary
inline const char *const kGradientProgressLabel = "Calculating maximum covariate penalty (i.e. the gradient at zero)";

/**
 * Configuration options for the penalty boundary search
 */
struct PenaltySearchOptions {
	/// Number of folds used to compute the gradient
	/// - grad_splits = 0: not set, use the leave-one-out strategy
	/// - grad_splits > 0: use the cross-fold strategy (lower peak memory)
	/// Default: 0
	size_t grad_splits = 0;

	/// Human-readable progress label forwarded to the strategy
	std::string progress_label = kGradientProgressLabel;

	PenaltySearchOptions() = default;

	/// Cross-fold gradient with the given number of splits
	static PenaltySearchOptions CrossFold(size_t grad_splits_) {
		PenaltySearchOptions opts;
		opts.grad_splits = grad_splits_;
		return opts;
	}

	bool HasGradSplits() const {
		return grad_splits > 0;
	}
};

} // namespace core
} // namespace libsynthctl
