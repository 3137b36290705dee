#pragma once

#include "libsynthctl/core/errors.hpp"
#include "libsynthctl/core/penalty_options.hpp"
#include "libsynthctl/penalty/gradient_strategy.hpp"
#include "libsynthctl/utils/matrix_utils.hpp"
#include "libsynthctl/utils/tracing.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace libsynthctl {
namespace penalty {

/**
 * PenaltyBoundsSolver: maximum regularization penalties for the tensor fit
 *
 * The tensor-matrix penalty boundary is the largest penalty for which the
 * fitted tensor (V) is not all zero, i.e. the gradient of the objective at
 * zero. It bounds the hyperparameter search range of the weight-fitting
 * optimizer.
 *
 * The gradient itself is computed by one of three external strategies:
 * - HELD_OUT_TREATED when treated-unit data (X_treat, Y_treat) is supplied
 * - CROSS_FOLD when PenaltySearchOptions::grad_splits is set
 * - LEAVE_ONE_OUT otherwise
 *
 * Relies on the fact that, conditional on the data, v_pen * w_pen at the
 * boundary is constant, so the weight-penalty boundary for any v_pen is
 * obtained from a single solve at w_pen = 1.
 */
class PenaltyBoundsSolver {
public:
	using Rows = std::vector<std::vector<double>>;

	explicit PenaltyBoundsSolver(GradientStrategyRegistry strategies) : strategies_(std::move(strategies)) {
	}

	/**
	 * Default weight penalty: mean over covariates of their variance across units
	 *
	 * A rule of thumb based on intuition that happens to work well in practice.
	 *
	 * @param X Covariates (units × covariates)
	 */
	static double WeightPenaltyGuestimate(const Eigen::MatrixXd &X);

	/**
	 * Maximum tensor penalty conditional on w_pen
	 *
	 * @param X Control covariates (N0 × K)
	 * @param Y Control outcomes (N0 × T)
	 * @param w_pen Weight penalty, a value or a sequence (default: guestimate)
	 * @param X_treat Treated covariates (N1 × K), together with Y_treat
	 * @param Y_treat Treated outcomes (N1 × T), together with X_treat
	 * @param options Gradient options (grad_splits, progress label)
	 * @return One bound per w_pen value; a sequence if w_pen is a sequence
	 *
	 * @throws InvalidArgumentError on invalid shapes or a partial treated pair
	 * @throws InsufficientMemoryError if the leave-one-out or cross-fold
	 *         gradient runs out of memory
	 * @throws std::runtime_error on numeric failure in the strategy
	 */
	core::PenaltyBound MaxTensorPenalty(const Eigen::MatrixXd &X, const Eigen::MatrixXd &Y,
	                                    const std::optional<core::PenaltyParameter> &w_pen = std::nullopt,
	                                    const std::optional<Eigen::MatrixXd> &X_treat = std::nullopt,
	                                    const std::optional<Eigen::MatrixXd> &Y_treat = std::nullopt,
	                                    const core::PenaltySearchOptions &options = core::PenaltySearchOptions()) const;

	/// Row-list overload; rows are coerced to matrices first
	core::PenaltyBound MaxTensorPenalty(const Rows &X, const Rows &Y,
	                                    const std::optional<core::PenaltyParameter> &w_pen = std::nullopt,
	                                    const core::PenaltySearchOptions &options = core::PenaltySearchOptions()) const;

	/**
	 * Maximum weight penalty conditional on v_pen
	 *
	 * Computed as MaxTensorPenalty(X, Y, w_pen = 1) / v_pen.
	 *
	 * @param v_pen Tensor penalty, a positive value or a sequence of positive values
	 * @throws InvalidArgumentError (NON_POSITIVE_PENALTY) for v_pen <= 0
	 */
	core::PenaltyBound MaxWeightPenalty(const Eigen::MatrixXd &X, const Eigen::MatrixXd &Y,
	                                    const core::PenaltyParameter &v_pen,
	                                    const std::optional<Eigen::MatrixXd> &X_treat = std::nullopt,
	                                    const std::optional<Eigen::MatrixXd> &Y_treat = std::nullopt,
	                                    const core::PenaltySearchOptions &options = core::PenaltySearchOptions()) const;

	core::PenaltyBound MaxWeightPenalty(const Rows &X, const Rows &Y, const core::PenaltyParameter &v_pen,
	                                    const core::PenaltySearchOptions &options = core::PenaltySearchOptions()) const;

	/// Strategy selected for the given inputs
	static GradientStrategyType SelectStrategy(bool has_treated, const core::PenaltySearchOptions &options);

private:
	static void ValidateInputs(const Eigen::MatrixXd &X, const Eigen::MatrixXd &Y,
	                           const std::optional<Eigen::MatrixXd> &X_treat,
	                           const std::optional<Eigen::MatrixXd> &Y_treat);

	static void ValidatePositive(const core::PenaltyParameter &v_pen);

	double SolveOne(const IGradientStrategy &strategy, const Eigen::MatrixXd &X, const Eigen::MatrixXd &Y,
	                double w_pen, const GradientStrategyOptions &strategy_options) const;

	GradientStrategyRegistry strategies_;
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline double PenaltyBoundsSolver::WeightPenaltyGuestimate(const Eigen::MatrixXd &X) {
	return utils::ColumnVariances(X).mean();
}

inline GradientStrategyType PenaltyBoundsSolver::SelectStrategy(bool has_treated,
                                                                const core::PenaltySearchOptions &options) {
	if (has_treated) {
		return GradientStrategyType::HELD_OUT_TREATED;
	}
	if (options.HasGradSplits()) {
		return GradientStrategyType::CROSS_FOLD;
	}
	return GradientStrategyType::LEAVE_ONE_OUT;
}

inline void PenaltyBoundsSolver::ValidateInputs(const Eigen::MatrixXd &X, const Eigen::MatrixXd &Y,
                                                const std::optional<Eigen::MatrixXd> &X_treat,
                                                const std::optional<Eigen::MatrixXd> &Y_treat) {
	if (X_treat.has_value() != Y_treat.has_value()) {
		throw InvalidArgumentError(InvalidArgumentCause::PARTIAL_TREATED_DATA,
		                           "parameters `X_treat` and `Y_treat` must both be matrices or both be absent");
	}
	if (X.cols() == 0) {
		throw InvalidArgumentError(InvalidArgumentCause::EMPTY_COVARIATES, "X.shape[1] == 0");
	}
	if (Y.cols() == 0) {
		throw InvalidArgumentError(InvalidArgumentCause::EMPTY_OUTCOMES, "Y.shape[1] == 0");
	}
	if (X.rows() != Y.rows()) {
		throw InvalidArgumentError(InvalidArgumentCause::ROW_MISMATCH, "X and Y have different number of rows (" +
		                                                                   std::to_string(X.rows()) + " and " +
		                                                                   std::to_string(Y.rows()) + ")");
	}
	if (X.rows() == 0) {
		throw InvalidArgumentError(InvalidArgumentCause::EMPTY_UNITS, "X and Y have no rows");
	}

	if (!X_treat.has_value()) {
		return;
	}

	if (X_treat->cols() == 0) {
		throw InvalidArgumentError(InvalidArgumentCause::EMPTY_TREATED_COVARIATES, "X_treat.shape[1] == 0");
	}
	if (Y_treat->cols() == 0) {
		throw InvalidArgumentError(InvalidArgumentCause::EMPTY_TREATED_OUTCOMES, "Y_treat.shape[1] == 0");
	}
	if (X_treat->rows() != Y_treat->rows()) {
		throw InvalidArgumentError(InvalidArgumentCause::TREATED_ROW_MISMATCH,
		                           "X_treat and Y_treat have different number of rows (" +
		                               std::to_string(X_treat->rows()) + " and " + std::to_string(Y_treat->rows()) +
		                               ")");
	}
	if (X_treat->cols() != X.cols() || Y_treat->cols() != Y.cols()) {
		throw InvalidArgumentError(InvalidArgumentCause::TREATED_COLUMN_MISMATCH,
		                           "treated data must have the same columns as X and Y (X_treat has " +
		                               std::to_string(X_treat->cols()) + " of " + std::to_string(X.cols()) +
		                               ", Y_treat has " + std::to_string(Y_treat->cols()) + " of " +
		                               std::to_string(Y.cols()) + ")");
	}
}

inline void PenaltyBoundsSolver::ValidatePositive(const core::PenaltyParameter &v_pen) {
	auto check = [](double value) {
		if (!(value > 0.0) || !std::isfinite(value)) {
			throw InvalidArgumentError(InvalidArgumentCause::NON_POSITIVE_PENALTY,
			                           "v_pen must be positive and finite (got " + std::to_string(value) + ")");
		}
	};
	if (std::holds_alternative<double>(v_pen)) {
		check(std::get<double>(v_pen));
	} else {
		for (double value : std::get<std::vector<double>>(v_pen)) {
			check(value);
		}
	}
}

inline double PenaltyBoundsSolver::SolveOne(const IGradientStrategy &strategy, const Eigen::MatrixXd &X,
                                            const Eigen::MatrixXd &Y, double w_pen,
                                            const GradientStrategyOptions &strategy_options) const {
	GradientEvaluation evaluation;
	try {
		evaluation = strategy.Evaluate(X, Y, w_pen, EvaluationMode::MAX_PENALTY, strategy_options);
	} catch (const std::bad_alloc &) {
		if (strategy.GetType() == GradientStrategyType::HELD_OUT_TREATED) {
			throw;
		}
		SYNTHCTL_ERROR("Out of memory in " << strategy.GetName() << " gradient (w_pen=" << w_pen << ")");
		throw InsufficientMemoryError("MemoryError encountered.  Try setting `grad_splits` "
		                              "parameter to reduce memory requirements.");
	}

	if (evaluation.has_tensor) {
		throw std::runtime_error("gradient strategy " + strategy.GetName() +
		                         " returned a tensor matrix instead of a maximum penalty");
	}
	return evaluation.max_penalty;
}

inline core::PenaltyBound PenaltyBoundsSolver::MaxTensorPenalty(const Eigen::MatrixXd &X, const Eigen::MatrixXd &Y,
                                                                const std::optional<core::PenaltyParameter> &w_pen,
                                                                const std::optional<Eigen::MatrixXd> &X_treat,
                                                                const std::optional<Eigen::MatrixXd> &Y_treat,
                                                                const core::PenaltySearchOptions &options) const {
	ValidateInputs(X, Y, X_treat, Y_treat);

	const core::PenaltyParameter penalty =
	    w_pen.has_value() ? *w_pen : core::PenaltyParameter(WeightPenaltyGuestimate(X));

	const bool has_treated = X_treat.has_value();
	const GradientStrategyType type = SelectStrategy(has_treated, options);
	const IGradientStrategy &strategy = strategies_.Get(type);

	GradientStrategyOptions strategy_options;
	strategy_options.progress_label = options.progress_label;
	strategy_options.grad_splits = options.grad_splits;

	// Held-out-treated: stack treated rows after control rows
	Eigen::MatrixXd X_stacked;
	Eigen::MatrixXd Y_stacked;
	if (has_treated) {
		const Eigen::Index n_control = X.rows();
		const Eigen::Index n_treated = X_treat->rows();

		X_stacked.resize(n_control + n_treated, X.cols());
		X_stacked << X, *X_treat;
		Y_stacked.resize(n_control + n_treated, Y.cols());
		Y_stacked << Y, *Y_treat;

		strategy_options.control_units.reserve(static_cast<size_t>(n_control));
		for (Eigen::Index i = 0; i < n_control; i++) {
			strategy_options.control_units.push_back(i);
		}
		strategy_options.treated_units.reserve(static_cast<size_t>(n_treated));
		for (Eigen::Index i = n_control; i < n_control + n_treated; i++) {
			strategy_options.treated_units.push_back(i);
		}
	}
	const Eigen::MatrixXd &X_work = has_treated ? X_stacked : X;
	const Eigen::MatrixXd &Y_work = has_treated ? Y_stacked : Y;

	SYNTHCTL_DEBUG("Maximum tensor penalty via " << strategy.GetName() << " (" << X_work.rows() << " units, "
	                                             << X_work.cols() << " covariates, " << Y_work.cols()
	                                             << " outcomes)");

	if (std::holds_alternative<double>(penalty)) {
		return core::PenaltyBound(SolveOne(strategy, X_work, Y_work, std::get<double>(penalty), strategy_options));
	}

	const auto &values = std::get<std::vector<double>>(penalty);
	std::vector<double> bounds;
	bounds.reserve(values.size());
	for (double value : values) {
		bounds.push_back(SolveOne(strategy, X_work, Y_work, value, strategy_options));
	}
	return core::PenaltyBound(std::move(bounds));
}

inline core::PenaltyBound PenaltyBoundsSolver::MaxTensorPenalty(const Rows &X, const Rows &Y,
                                                                const std::optional<core::PenaltyParameter> &w_pen,
                                                                const core::PenaltySearchOptions &options) const {
	return MaxTensorPenalty(utils::ToMatrix(X, "X"), utils::ToMatrix(Y, "Y"), w_pen, std::nullopt, std::nullopt,
	                        options);
}

inline core::PenaltyBound PenaltyBoundsSolver::MaxWeightPenalty(const Eigen::MatrixXd &X, const Eigen::MatrixXd &Y,
                                                                const core::PenaltyParameter &v_pen,
                                                                const std::optional<Eigen::MatrixXd> &X_treat,
                                                                const std::optional<Eigen::MatrixXd> &Y_treat,
                                                                const core::PenaltySearchOptions &options) const {
	ValidatePositive(v_pen);

	const core::PenaltyBound unit_bound =
	    MaxTensorPenalty(X, Y, core::PenaltyParameter(1.0), X_treat, Y_treat, options);
	const double max_v_pen = std::get<double>(unit_bound);

	if (std::holds_alternative<double>(v_pen)) {
		return core::PenaltyBound(max_v_pen / std::get<double>(v_pen));
	}

	const auto &values = std::get<std::vector<double>>(v_pen);
	std::vector<double> bounds;
	bounds.reserve(values.size());
	for (double value : values) {
		bounds.push_back(max_v_pen / value);
	}
	return core::PenaltyBound(std::move(bounds));
}

inline core::PenaltyBound PenaltyBoundsSolver::MaxWeightPenalty(const Rows &X, const Rows &Y,
                                                                const core::PenaltyParameter &v_pen,
                                                                const core::PenaltySearchOptions &options) const {
	return MaxWeightPenalty(utils::ToMatrix(X, "X"), utils::ToMatrix(Y, "Y"), v_pen, std::nullopt, std::nullopt,
	                        options);
}

} // namespace penalty
} // namespace libsynthctl
