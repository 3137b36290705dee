#pragma once

#include "libsynthctl/core/errors.hpp"
#include "libsynthctl/core/placebo_options.hpp"
#include "libsynthctl/core/placebo_result.hpp"
#include "libsynthctl/inference/combinations.hpp"
#include "libsynthctl/utils/tracing.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace libsynthctl {
namespace inference {

/**
 * PlaceboInference: permutation inference for synthetic-control effects
 *
 * Treats sets of control units as if they were treated to build a null
 * distribution for three effect views:
 * - effect_vec: per-period mean effect across treated units
 * - avg_joint_effect: mean over units of each unit's average effect
 * - rms_joint_effect: mean over units of each unit's RMS effect
 *
 * For N1 treated units, every placebo draw is the same aggregate over a set of
 * N1 control units. All C(N0, N1) sets are enumerated unless the count exceeds
 * PlaceboOptions::max_combinations, in which case that many sets are sampled.
 *
 * p-values are two-sided (|placebo| >= |observed|) for effect_vec and
 * avg_joint_effect, and one-sided (placebo >= observed) for the non-negative
 * RMS aggregate.
 *
 * Confidence intervals collect all hypothetical true effects beta0 that would
 * not be rejected at the requested level: the percentile bounds of the placebo
 * distribution are flipped around the observed effect.
 *
 * Design notes:
 * - Header-only, stateless (all methods are static)
 * - Randomness only through the caller's generator
 */
class PlaceboInference {
public:
	/**
	 * Run the placebo test
	 *
	 * @param control_effects Control-unit effects (N0 × T1)
	 * @param treated_effects Treated-unit effects (N1 × T1), N1 <= N0
	 * @param options Sampling, output and p-value options
	 * @param rng Generator used when combinations are sampled
	 * @return PlaceboRunResult with the three effect views
	 *
	 * @throws InvalidArgumentError on empty or mismatched shapes, N0 < N1, or a
	 *         confidence level outside (0, 1) when intervals are requested
	 */
	static core::PlaceboRunResult Run(const Eigen::MatrixXd &control_effects, const Eigen::MatrixXd &treated_effects,
	                                  const core::PlaceboOptions &options, std::mt19937_64 &rng);

	/// Same as above with a generator seeded from std::random_device
	static core::PlaceboRunResult Run(const Eigen::MatrixXd &control_effects, const Eigen::MatrixXd &treated_effects,
	                                  const core::PlaceboOptions &options = core::PlaceboOptions());

	/**
	 * p-value from the number of placebos at least as extreme as the observed statistic
	 *
	 * @param n_at_least_as_extreme Count of extreme placebo draws
	 * @param n_placebo Number of placebo draws
	 * @param convention Whether the observed statistic joins its reference set
	 */
	static double PValue(double n_at_least_as_extreme, size_t n_placebo, core::PValueConvention convention);

	/**
	 * 1-indexed order statistic used for the interval bounds
	 *
	 * alpha_ind = max(1, round((1 - level) / (2 / n_exact))), limited to
	 * (n_draws + 1) / 2 so both bounds exist and low <= high.
	 *
	 * @param level Confidence level
	 * @param n_exact Exact number of combinations C(N0, N1)
	 * @param n_draws Number of retained placebo draws
	 */
	static size_t OrderStatisticIndex(double level, double n_exact, size_t n_draws);

	/**
	 * Low and high order statistics of a placebo distribution
	 *
	 * @return (alpha_ind-th smallest, (n + 1 - alpha_ind)-th smallest)
	 * @throws InvalidArgumentError (EMPTY_PERIODS) for an empty distribution
	 */
	static std::pair<double, double> PercentileBounds(const Eigen::VectorXd &placebos, size_t alpha_ind);

private:
	/// max(1, round((1 - level) / (2 / n_exact))) before the draw-count limit
	static double UnlimitedOrderStatisticIndex(double level, double n_exact);

	static void ValidateInputs(const Eigen::MatrixXd &control_effects, const Eigen::MatrixXd &treated_effects);

	/**
	 * Build a confidence interval for every column of `placebos`
	 *
	 * @param null_is_zero Warn when the placebo bounds do not straddle zero
	 */
	static core::ConfidenceInterval BuildInterval(const Eigen::MatrixXd &placebos, const Eigen::VectorXd &effect,
	                                              size_t alpha_ind, double level, bool null_is_zero,
	                                              const std::string &view_name,
	                                              std::vector<core::PlaceboWarning> &warnings);

	static core::EstimationResult MakeResult(Eigen::VectorXd effect, Eigen::VectorXd p_value, bool keep_placebos,
	                                         Eigen::MatrixXd placebos);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline void PlaceboInference::ValidateInputs(const Eigen::MatrixXd &control_effects,
                                             const Eigen::MatrixXd &treated_effects) {
	if (treated_effects.cols() == 0 || control_effects.cols() == 0) {
		throw InvalidArgumentError(InvalidArgumentCause::EMPTY_PERIODS, "effect matrices must have at least one period");
	}
	if (treated_effects.cols() != control_effects.cols()) {
		throw InvalidArgumentError(InvalidArgumentCause::PERIOD_MISMATCH,
		                           "treated and control effects have different number of periods (" +
		                               std::to_string(treated_effects.cols()) + " and " +
		                               std::to_string(control_effects.cols()) + ")");
	}
	if (treated_effects.rows() == 0) {
		throw InvalidArgumentError(InvalidArgumentCause::NO_TREATED_UNITS, "treated effects have no units");
	}
	if (control_effects.rows() < treated_effects.rows()) {
		throw InvalidArgumentError(InvalidArgumentCause::TOO_FEW_CONTROLS,
		                           "need at least as many control units as treated units (got " +
		                               std::to_string(control_effects.rows()) + " controls and " +
		                               std::to_string(treated_effects.rows()) + " treated)");
	}
}

inline double PlaceboInference::PValue(double n_at_least_as_extreme, size_t n_placebo,
                                       core::PValueConvention convention) {
	const double addition = (convention == core::PValueConvention::INCLUDE_OBSERVED) ? 1.0 : 0.0;
	return (n_at_least_as_extreme + addition) / (static_cast<double>(n_placebo) + addition);
}

inline double PlaceboInference::UnlimitedOrderStatisticIndex(double level, double n_exact) {
	const double alpha = 1.0 - level;
	const double p2min = 2.0 / n_exact;
	return std::max(1.0, std::round(alpha / p2min));
}

inline size_t PlaceboInference::OrderStatisticIndex(double level, double n_exact, size_t n_draws) {
	const double max_ind = static_cast<double>((n_draws + 1) / 2);
	return static_cast<size_t>(std::min(max_ind, UnlimitedOrderStatisticIndex(level, n_exact)));
}

inline std::pair<double, double> PlaceboInference::PercentileBounds(const Eigen::VectorXd &placebos,
                                                                    size_t alpha_ind) {
	std::vector<double> sorted(placebos.data(), placebos.data() + placebos.size());
	std::sort(sorted.begin(), sorted.end());

	const size_t npl = sorted.size();
	if (npl == 0) {
		throw InvalidArgumentError(InvalidArgumentCause::EMPTY_PERIODS, "placebo distribution is empty");
	}
	const size_t low_pos = std::min(std::max<size_t>(alpha_ind, 1), npl) - 1;
	const size_t high_pos = std::min(std::max<size_t>(npl + 1 - std::min(alpha_ind, npl), 1), npl) - 1;
	return std::make_pair(sorted[low_pos], sorted[high_pos]);
}

inline core::ConfidenceInterval PlaceboInference::BuildInterval(const Eigen::MatrixXd &placebos,
                                                                const Eigen::VectorXd &effect, size_t alpha_ind,
                                                                double level, bool null_is_zero,
                                                                const std::string &view_name,
                                                                std::vector<core::PlaceboWarning> &warnings) {
	const Eigen::Index n_cols = placebos.cols();
	Eigen::VectorXd lower(n_cols);
	Eigen::VectorXd upper(n_cols);

	for (Eigen::Index t = 0; t < n_cols; t++) {
		auto bounds = PercentileBounds(placebos.col(t), alpha_ind);
		const double low_effect = bounds.first;
		const double high_effect = bounds.second;

		if (null_is_zero && low_effect != 0.0 && high_effect != 0.0 &&
		    std::signbit(low_effect) == std::signbit(high_effect)) {
			std::string message = "CI doesn't contain 0. You might not have enough placebo effects.";
			if (n_cols > 1) {
				message += " (" + view_name + ", period " + std::to_string(t) + ")";
			} else {
				message += " (" + view_name + ")";
			}
			SYNTHCTL_WARN(message);
			warnings.push_back(core::PlaceboWarning {core::WarningCategory::INSUFFICIENT_PLACEBOS, message});
		}

		lower(t) = effect(t) - high_effect;
		upper(t) = effect(t) - low_effect;
	}

	return core::ConfidenceInterval(std::move(lower), std::move(upper), level);
}

inline core::EstimationResult PlaceboInference::MakeResult(Eigen::VectorXd effect, Eigen::VectorXd p_value,
                                                           bool keep_placebos, Eigen::MatrixXd placebos) {
	core::EstimationResult result;
	result.effect = std::move(effect);
	result.p_value = std::move(p_value);
	result.has_placebos = keep_placebos;
	if (keep_placebos) {
		result.placebos = std::move(placebos);
	}
	return result;
}

inline core::PlaceboRunResult PlaceboInference::Run(const Eigen::MatrixXd &control_effects,
                                                    const Eigen::MatrixXd &treated_effects,
                                                    const core::PlaceboOptions &options) {
	std::random_device seed_source;
	std::mt19937_64 rng(seed_source());
	return Run(control_effects, treated_effects, options, rng);
}

inline core::PlaceboRunResult PlaceboInference::Run(const Eigen::MatrixXd &control_effects,
                                                    const Eigen::MatrixXd &treated_effects,
                                                    const core::PlaceboOptions &options, std::mt19937_64 &rng) {
	ValidateInputs(control_effects, treated_effects);
	options.Validate();

	SYNTHCTL_TIMING_START();

	const size_t N0 = static_cast<size_t>(control_effects.rows());
	const size_t N1 = static_cast<size_t>(treated_effects.rows());
	const Eigen::Index T1 = treated_effects.cols();
	const bool keep_pl = options.KeepsPlacebos();

	// Per-unit joint effects (across periods)
	const Eigen::VectorXd rms_joint_effects = treated_effects.array().square().rowwise().mean().sqrt().matrix();
	const Eigen::VectorXd control_rms_joint_effects =
	    control_effects.array().square().rowwise().mean().sqrt().matrix();
	const Eigen::VectorXd avg_joint_effects = treated_effects.rowwise().mean();
	const Eigen::VectorXd control_avg_joint_effects = control_effects.rowwise().mean();

	// Observed statistics
	const Eigen::VectorXd effect_vec = treated_effects.colwise().mean().transpose();
	const double rms_joint_effect = rms_joint_effects.mean();
	const double avg_joint_effect = avg_joint_effects.mean();

	auto source = CombinationSource::Create(N0, N1, options.max_combinations, rng);
	const size_t comb_len = source->Size();

	SYNTHCTL_DEBUG("Placebo test: N0=" << N0 << " N1=" << N1 << " T1=" << T1 << " "
	                                   << (source->IsSampled() ? "sampling " : "enumerating ") << comb_len
	                                   << " combinations");

	Eigen::MatrixXd placebo_effect_vecs;
	Eigen::MatrixXd placebo_avg_joint_effects;
	Eigen::MatrixXd placebo_rms_joint_effects;
	if (keep_pl) {
		placebo_effect_vecs.resize(static_cast<Eigen::Index>(comb_len), T1);
		placebo_avg_joint_effects.resize(static_cast<Eigen::Index>(comb_len), 1);
		placebo_rms_joint_effects.resize(static_cast<Eigen::Index>(comb_len), 1);
	}

	Eigen::VectorXd vec_count = Eigen::VectorXd::Zero(T1);
	double rms_joint_count = 0.0;
	double avg_joint_count = 0.0;

	const Eigen::ArrayXd abs_effect_vec = effect_vec.array().abs();
	const double inv_n1 = 1.0 / static_cast<double>(N1);

	std::vector<size_t> comb;
	Eigen::VectorXd placebo_effect_vec(T1);
	size_t idx = 0;
	while (idx < comb_len && source->Next(comb)) {
		placebo_effect_vec.setZero();
		double placebo_rms_joint_effect = 0.0;
		double placebo_avg_joint_effect = 0.0;
		for (size_t unit : comb) {
			const auto row = static_cast<Eigen::Index>(unit);
			placebo_effect_vec += control_effects.row(row).transpose();
			placebo_rms_joint_effect += control_rms_joint_effects(row);
			placebo_avg_joint_effect += control_avg_joint_effects(row);
		}
		placebo_effect_vec *= inv_n1;
		placebo_rms_joint_effect *= inv_n1;
		placebo_avg_joint_effect *= inv_n1;

		vec_count.array() += (placebo_effect_vec.array().abs() >= abs_effect_vec).cast<double>();
		if (placebo_rms_joint_effect >= rms_joint_effect) {
			rms_joint_count += 1.0;
		}
		if (std::abs(placebo_avg_joint_effect) >= std::abs(avg_joint_effect)) {
			avg_joint_count += 1.0;
		}

		if (keep_pl) {
			const auto i = static_cast<Eigen::Index>(idx);
			placebo_effect_vecs.row(i) = placebo_effect_vec.transpose();
			placebo_avg_joint_effects(i, 0) = placebo_avg_joint_effect;
			placebo_rms_joint_effects(i, 0) = placebo_rms_joint_effect;
		}
		idx++;
	}

	const core::PValueConvention convention = options.p_value_convention;
	Eigen::VectorXd vec_p(T1);
	for (Eigen::Index t = 0; t < T1; t++) {
		vec_p(t) = PValue(vec_count(t), comb_len, convention);
	}
	const double rms_joint_p = PValue(rms_joint_count, comb_len, convention);
	const double avg_joint_p = PValue(avg_joint_count, comb_len, convention);

	core::PlaceboRunResult run;
	run.n_placebo = comb_len;
	run.sampled = source->IsSampled();

	run.effect_vec = MakeResult(effect_vec, vec_p, keep_pl, std::move(placebo_effect_vecs));
	run.avg_joint_effect = MakeResult(Eigen::VectorXd::Constant(1, avg_joint_effect),
	                                  Eigen::VectorXd::Constant(1, avg_joint_p), keep_pl,
	                                  std::move(placebo_avg_joint_effects));
	run.rms_joint_effect = MakeResult(Eigen::VectorXd::Constant(1, rms_joint_effect),
	                                  Eigen::VectorXd::Constant(1, rms_joint_p), keep_pl,
	                                  std::move(placebo_rms_joint_effects));

	if (options.build_confidence_interval) {
		const double n_exact = CombinationSource::BinomialCoefficientAsDouble(N0, N1);
		const size_t alpha_ind = OrderStatisticIndex(options.confidence_level, n_exact, comb_len);
		const double level = options.confidence_level;

		// Sampled runs may keep too few draws for the order statistic the level calls for
		const double wanted_ind = UnlimitedOrderStatisticIndex(level, n_exact);
		if (wanted_ind > static_cast<double>(alpha_ind)) {
			for (const char *view_name : {"effect_vec", "avg_joint_effect", "rms_joint_effect"}) {
				std::ostringstream message;
				message << "Only " << comb_len << " placebo draws retained; a " << level
				        << " interval needs order statistic " << wanted_ind << " but " << alpha_ind
				        << " was used, so the interval is narrower than requested. Increase max_combinations. ("
				        << view_name << ")";
				SYNTHCTL_WARN(message.str());
				run.warnings.push_back(
				    core::PlaceboWarning {core::WarningCategory::LEVEL_NOT_ATTAINABLE, message.str()});
			}
		}

		run.effect_vec.confidence_interval = BuildInterval(run.effect_vec.placebos, run.effect_vec.effect, alpha_ind,
		                                                   level, true, "effect_vec", run.warnings);
		run.effect_vec.has_confidence_interval = true;

		run.avg_joint_effect.confidence_interval =
		    BuildInterval(run.avg_joint_effect.placebos, run.avg_joint_effect.effect, alpha_ind, level, true,
		                  "avg_joint_effect", run.warnings);
		run.avg_joint_effect.has_confidence_interval = true;

		// RMS effects are non-negative, so their null is not zero
		run.rms_joint_effect.confidence_interval =
		    BuildInterval(run.rms_joint_effect.placebos, run.rms_joint_effect.effect, alpha_ind, level, false,
		                  "rms_joint_effect", run.warnings);
		run.rms_joint_effect.has_confidence_interval = true;
	}

	SYNTHCTL_TIMING_END("Placebo test");

	return run;
}

} // namespace inference
} // namespace libsynthctl
