#pragma once

#include <stdexcept>
#include <string>

namespace libsynthctl {

/**
 * Named causes for invalid-argument failures
 *
 * Every validation failure in libsynthctl carries one of these so callers can
 * react to a specific problem without parsing the message text.
 */
enum class InvalidArgumentCause {
	NOT_A_MATRIX,
	EMPTY_UNITS,
	EMPTY_COVARIATES,
	EMPTY_OUTCOMES,
	ROW_MISMATCH,
	PARTIAL_TREATED_DATA,
	EMPTY_TREATED_COVARIATES,
	EMPTY_TREATED_OUTCOMES,
	TREATED_ROW_MISMATCH,
	TREATED_COLUMN_MISMATCH,
	EMPTY_PERIODS,
	PERIOD_MISMATCH,
	NO_TREATED_UNITS,
	TOO_FEW_CONTROLS,
	LEVEL_OUT_OF_RANGE,
	TOO_MANY_COMBINATIONS,
	NON_POSITIVE_PENALTY,
	MISSING_STRATEGY
};

inline const char *CauseName(InvalidArgumentCause cause) {
	switch (cause) {
	case InvalidArgumentCause::NOT_A_MATRIX:
		return "not_a_matrix";
	case InvalidArgumentCause::EMPTY_UNITS:
		return "empty_units";
	case InvalidArgumentCause::EMPTY_COVARIATES:
		return "empty_covariates";
	case InvalidArgumentCause::EMPTY_OUTCOMES:
		return "empty_outcomes";
	case InvalidArgumentCause::ROW_MISMATCH:
		return "row_mismatch";
	case InvalidArgumentCause::PARTIAL_TREATED_DATA:
		return "partial_treated_data";
	case InvalidArgumentCause::EMPTY_TREATED_COVARIATES:
		return "empty_treated_covariates";
	case InvalidArgumentCause::EMPTY_TREATED_OUTCOMES:
		return "empty_treated_outcomes";
	case InvalidArgumentCause::TREATED_ROW_MISMATCH:
		return "treated_row_mismatch";
	case InvalidArgumentCause::TREATED_COLUMN_MISMATCH:
		return "treated_column_mismatch";
	case InvalidArgumentCause::EMPTY_PERIODS:
		return "empty_periods";
	case InvalidArgumentCause::PERIOD_MISMATCH:
		return "period_mismatch";
	case InvalidArgumentCause::NO_TREATED_UNITS:
		return "no_treated_units";
	case InvalidArgumentCause::TOO_FEW_CONTROLS:
		return "too_few_controls";
	case InvalidArgumentCause::LEVEL_OUT_OF_RANGE:
		return "level_out_of_range";
	case InvalidArgumentCause::TOO_MANY_COMBINATIONS:
		return "too_many_combinations";
	case InvalidArgumentCause::NON_POSITIVE_PENALTY:
		return "non_positive_penalty";
	case InvalidArgumentCause::MISSING_STRATEGY:
		return "missing_strategy";
	default:
		return "unknown";
	}
}

/**
 * Invalid argument with a named cause
 *
 * Derives from std::invalid_argument so existing handlers keep working.
 */
class InvalidArgumentError : public std::invalid_argument {
public:
	InvalidArgumentError(InvalidArgumentCause cause, const std::string &message)
	    : std::invalid_argument(message), cause_(cause) {
	}

	InvalidArgumentCause cause() const noexcept {
		return cause_;
	}

private:
	InvalidArgumentCause cause_;
};

/**
 * A gradient strategy ran out of memory
 *
 * Raised in place of std::bad_alloc by the penalty bounds solver. The message
 * tells the caller to set grad_splits.
 */
class InsufficientMemoryError : public std::runtime_error {
public:
	explicit InsufficientMemoryError(const std::string &message) : std::runtime_error(message) {
	}
};

} // namespace libsynthctl
