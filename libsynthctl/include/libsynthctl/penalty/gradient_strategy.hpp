#pragma once

#include "libsynthctl/core/errors.hpp"
#include <Eigen/Dense>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace libsynthctl {
namespace penalty {

/// Objective used to compute the tensor-matrix gradient
enum class GradientStrategyType {
	/// Leave-one-out over all units
	LEAVE_ONE_OUT,
	/// Cross-fold over `grad_splits` folds
	CROSS_FOLD,
	/// Controls fit, treated units held out
	HELD_OUT_TREATED
};

inline const char *StrategyName(GradientStrategyType type) {
	switch (type) {
	case GradientStrategyType::LEAVE_ONE_OUT:
		return "leave_one_out";
	case GradientStrategyType::CROSS_FOLD:
		return "cross_fold";
	case GradientStrategyType::HELD_OUT_TREATED:
		return "held_out_treated";
	default:
		return "unknown";
	}
}

/// What the strategy returns
enum class EvaluationMode {
	/// The fitted tensor matrix
	TENSOR,
	/// The largest penalty for which the tensor is not all zero (gradient at zero)
	MAX_PENALTY
};

/**
 * Strategy-specific inputs
 */
struct GradientStrategyOptions {
	/// Human-readable progress label
	std::string progress_label;

	/// Number of folds (cross-fold only, 0 = not set)
	size_t grad_splits = 0;

	/// Rows of X/Y holding control units (held-out-treated only)
	std::vector<Eigen::Index> control_units;

	/// Rows of X/Y holding treated units (held-out-treated only)
	std::vector<Eigen::Index> treated_units;
};

/**
 * Output of a strategy: a tensor matrix or a penalty boundary
 */
struct GradientEvaluation {
	/// Fitted tensor matrix (valid only if has_tensor)
	Eigen::MatrixXd tensor;

	/// Penalty boundary (valid only if !has_tensor)
	double max_penalty = 0.0;

	bool has_tensor = false;

	static GradientEvaluation Tensor(Eigen::MatrixXd tensor_) {
		GradientEvaluation evaluation;
		evaluation.tensor = std::move(tensor_);
		evaluation.has_tensor = true;
		return evaluation;
	}

	static GradientEvaluation MaxPenalty(double max_penalty_) {
		GradientEvaluation evaluation;
		evaluation.max_penalty = max_penalty_;
		return evaluation;
	}
};

/**
 * IGradientStrategy: capability interface for gradient-evaluation objectives
 *
 * Implementations live outside libsynthctl (the weight-fitting optimizer).
 * They report numeric failures as std::runtime_error and memory exhaustion as
 * std::bad_alloc.
 */
class IGradientStrategy {
public:
	virtual ~IGradientStrategy() = default;

	virtual GradientStrategyType GetType() const = 0;

	virtual std::string GetName() const = 0;

	/**
	 * Evaluate the objective
	 *
	 * @param X Covariates (units × covariates)
	 * @param Y Outcomes (units × periods)
	 * @param w_pen Weight penalty
	 * @param mode TENSOR or MAX_PENALTY
	 * @param options Strategy-specific inputs
	 */
	virtual GradientEvaluation Evaluate(const Eigen::MatrixXd &X, const Eigen::MatrixXd &Y, double w_pen,
	                                    EvaluationMode mode, const GradientStrategyOptions &options) const = 0;
};

/**
 * GradientStrategyAdapter: wrap a callable as an IGradientStrategy
 *
 * Example usage:
 * ```cpp
 * auto loo = std::make_shared<GradientStrategyAdapter<LooFn>>(
 *     GradientStrategyType::LEAVE_ONE_OUT, "loo", LooFn {});
 * ```
 *
 * TFunc must be callable as
 *   GradientEvaluation(const Eigen::MatrixXd &, const Eigen::MatrixXd &, double,
 *                      EvaluationMode, const GradientStrategyOptions &)
 */
template <typename TFunc>
class GradientStrategyAdapter : public IGradientStrategy {
public:
	GradientStrategyAdapter(GradientStrategyType type, std::string name, TFunc func)
	    : type_(type), name_(std::move(name)), func_(std::move(func)) {
	}

	GradientStrategyType GetType() const override {
		return type_;
	}

	std::string GetName() const override {
		return name_;
	}

	GradientEvaluation Evaluate(const Eigen::MatrixXd &X, const Eigen::MatrixXd &Y, double w_pen, EvaluationMode mode,
	                            const GradientStrategyOptions &options) const override {
		return func_(X, Y, w_pen, mode, options);
	}

private:
	GradientStrategyType type_;
	std::string name_;
	TFunc func_;
};

/// Build a shared adapter, deducing the callable type
template <typename TFunc>
std::shared_ptr<const IGradientStrategy> MakeGradientStrategy(GradientStrategyType type, std::string name, TFunc func) {
	return std::make_shared<GradientStrategyAdapter<TFunc>>(type, std::move(name), std::move(func));
}

/**
 * Strategies available to the penalty bounds solver, keyed by type
 */
class GradientStrategyRegistry {
public:
	GradientStrategyRegistry() = default;

	/// Add or replace the strategy for strategy->GetType()
	GradientStrategyRegistry &Register(std::shared_ptr<const IGradientStrategy> strategy) {
		if (!strategy) {
			throw InvalidArgumentError(InvalidArgumentCause::MISSING_STRATEGY, "cannot register a null gradient strategy");
		}
		const GradientStrategyType type = strategy->GetType();
		strategies_[type] = std::move(strategy);
		return *this;
	}

	bool Has(GradientStrategyType type) const {
		return strategies_.find(type) != strategies_.end();
	}

	/**
	 * @throws InvalidArgumentError (MISSING_STRATEGY) if none is registered
	 */
	const IGradientStrategy &Get(GradientStrategyType type) const {
		auto it = strategies_.find(type);
		if (it == strategies_.end()) {
			throw InvalidArgumentError(InvalidArgumentCause::MISSING_STRATEGY,
			                           std::string("no gradient strategy registered for ") + StrategyName(type));
		}
		return *it->second;
	}

	size_t size() const {
		return strategies_.size();
	}

private:
	std::map<GradientStrategyType, std::shared_ptr<const IGradientStrategy>> strategies_;
};

} // namespace penalty
} // namespace libsynthctl
