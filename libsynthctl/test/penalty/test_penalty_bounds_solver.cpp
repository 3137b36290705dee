#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <libsynthctl/penalty/penalty_bounds_solver.hpp>
#include <Eigen/Dense>

#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace libsynthctl;
using namespace libsynthctl::core;
using namespace libsynthctl::penalty;

const double TOLERANCE = 1e-12;

namespace {

/// Arguments seen by a recording strategy
struct StrategyCall {
	Eigen::MatrixXd X;
	Eigen::MatrixXd Y;
	double w_pen = 0.0;
	EvaluationMode mode = EvaluationMode::TENSOR;
	GradientStrategyOptions options;
};

/// Records every call and returns scale / w_pen
struct RecordingStrategy {
	std::shared_ptr<std::vector<StrategyCall>> calls;
	double scale;

	GradientEvaluation operator()(const Eigen::MatrixXd &X, const Eigen::MatrixXd &Y, double w_pen, EvaluationMode mode,
	                              const GradientStrategyOptions &options) const {
		calls->push_back(StrategyCall {X, Y, w_pen, mode, options});
		return GradientEvaluation::MaxPenalty(scale / w_pen);
	}
};

struct Recorder {
	std::shared_ptr<std::vector<StrategyCall>> loo = std::make_shared<std::vector<StrategyCall>>();
	std::shared_ptr<std::vector<StrategyCall>> fold = std::make_shared<std::vector<StrategyCall>>();
	std::shared_ptr<std::vector<StrategyCall>> held_out = std::make_shared<std::vector<StrategyCall>>();

	PenaltyBoundsSolver MakeSolver() const {
		GradientStrategyRegistry registry;
		registry.Register(MakeGradientStrategy(GradientStrategyType::LEAVE_ONE_OUT, "loo", RecordingStrategy {loo, 12.0}))
		    .Register(MakeGradientStrategy(GradientStrategyType::CROSS_FOLD, "fold", RecordingStrategy {fold, 24.0}))
		    .Register(MakeGradientStrategy(GradientStrategyType::HELD_OUT_TREATED, "ct",
		                                   RecordingStrategy {held_out, 36.0}));
		return PenaltyBoundsSolver(registry);
	}
};

template <typename TFunc>
PenaltyBoundsSolver SolverWith(GradientStrategyType type, TFunc func) {
	GradientStrategyRegistry registry;
	registry.Register(MakeGradientStrategy(type, "only", func));
	return PenaltyBoundsSolver(registry);
}

Eigen::MatrixXd ControlX() {
	Eigen::MatrixXd X(4, 2);
	X << 1.0, 0.0,
	     2.0, 2.0,
	     3.0, 4.0,
	     4.0, 6.0;
	return X;
}

} // namespace

TEST_CASE("PenaltyBounds: Weight penalty guestimate", "[penalty]") {
	// Column variances 1.25 and 5
	REQUIRE_THAT(PenaltyBoundsSolver::WeightPenaltyGuestimate(ControlX()),
	             Catch::Matchers::WithinAbs(3.125, TOLERANCE));

	Eigen::MatrixXd constant = Eigen::MatrixXd::Constant(3, 2, 7.0);
	REQUIRE_THAT(PenaltyBoundsSolver::WeightPenaltyGuestimate(constant), Catch::Matchers::WithinAbs(0.0, TOLERANCE));
}

TEST_CASE("PenaltyBounds: Strategy selection", "[penalty]") {
	PenaltySearchOptions plain;
	REQUIRE(PenaltyBoundsSolver::SelectStrategy(false, plain) == GradientStrategyType::LEAVE_ONE_OUT);
	REQUIRE(PenaltyBoundsSolver::SelectStrategy(false, PenaltySearchOptions::CrossFold(3)) ==
	        GradientStrategyType::CROSS_FOLD);
	// Treated data wins over grad_splits
	REQUIRE(PenaltyBoundsSolver::SelectStrategy(true, PenaltySearchOptions::CrossFold(3)) ==
	        GradientStrategyType::HELD_OUT_TREATED);
}

TEST_CASE("PenaltyBounds: Leave-one-out dispatch", "[penalty]") {
	Recorder recorder;
	auto solver = recorder.MakeSolver();
	Eigen::MatrixXd X = ControlX();
	Eigen::MatrixXd Y = Eigen::MatrixXd::Ones(4, 3);

	auto bound = solver.MaxTensorPenalty(X, Y, PenaltyParameter(2.0));

	REQUIRE(std::holds_alternative<double>(bound));
	REQUIRE_THAT(std::get<double>(bound), Catch::Matchers::WithinAbs(6.0, TOLERANCE));
	REQUIRE(recorder.loo->size() == 1);
	REQUIRE(recorder.fold->empty());
	REQUIRE(recorder.held_out->empty());

	const auto &call = recorder.loo->front();
	REQUIRE(call.mode == EvaluationMode::MAX_PENALTY);
	REQUIRE(call.w_pen == 2.0);
	REQUIRE(call.X == X);
	REQUIRE(call.Y == Y);
	REQUIRE(call.options.progress_label == kGradientProgressLabel);
	REQUIRE(call.options.control_units.empty());
	REQUIRE(call.options.treated_units.empty());
}

TEST_CASE("PenaltyBounds: Cross-fold dispatch", "[penalty]") {
	Recorder recorder;
	auto solver = recorder.MakeSolver();
	Eigen::MatrixXd X = ControlX();
	Eigen::MatrixXd Y = Eigen::MatrixXd::Ones(4, 3);

	auto opts = PenaltySearchOptions::CrossFold(2);
	opts.progress_label = "folds";
	auto bound = solver.MaxTensorPenalty(X, Y, PenaltyParameter(4.0), std::nullopt, std::nullopt, opts);

	REQUIRE_THAT(std::get<double>(bound), Catch::Matchers::WithinAbs(6.0, TOLERANCE));
	REQUIRE(recorder.loo->empty());
	REQUIRE(recorder.fold->size() == 1);
	REQUIRE(recorder.fold->front().options.grad_splits == 2);
	REQUIRE(recorder.fold->front().options.progress_label == "folds");
}

TEST_CASE("PenaltyBounds: Held-out treated dispatch", "[penalty]") {
	Recorder recorder;
	auto solver = recorder.MakeSolver();
	Eigen::MatrixXd X = ControlX();
	Eigen::MatrixXd Y = Eigen::MatrixXd::Zero(4, 3);
	Eigen::MatrixXd X_treat = Eigen::MatrixXd::Constant(2, 2, 9.0);
	Eigen::MatrixXd Y_treat = Eigen::MatrixXd::Constant(2, 3, 8.0);

	auto bound = solver.MaxTensorPenalty(X, Y, PenaltyParameter(3.0), X_treat, Y_treat);

	REQUIRE_THAT(std::get<double>(bound), Catch::Matchers::WithinAbs(12.0, TOLERANCE));
	REQUIRE(recorder.held_out->size() == 1);
	REQUIRE(recorder.loo->empty());

	const auto &call = recorder.held_out->front();
	REQUIRE(call.X.rows() == 6);
	REQUIRE(call.Y.rows() == 6);
	REQUIRE(call.X.topRows(4) == X);
	REQUIRE(call.X.bottomRows(2) == X_treat);
	REQUIRE(call.Y.bottomRows(2) == Y_treat);
	REQUIRE(call.options.control_units == std::vector<Eigen::Index> {0, 1, 2, 3});
	REQUIRE(call.options.treated_units == std::vector<Eigen::Index> {4, 5});
}

TEST_CASE("PenaltyBounds: Default w_pen is the guestimate", "[penalty]") {
	Recorder recorder;
	auto solver = recorder.MakeSolver();

	auto bound = solver.MaxTensorPenalty(ControlX(), Eigen::MatrixXd::Ones(4, 1));

	REQUIRE(recorder.loo->size() == 1);
	REQUIRE_THAT(recorder.loo->front().w_pen, Catch::Matchers::WithinAbs(3.125, TOLERANCE));
	REQUIRE_THAT(std::get<double>(bound), Catch::Matchers::WithinAbs(12.0 / 3.125, TOLERANCE));
}

TEST_CASE("PenaltyBounds: Sequence of w_pen values", "[penalty]") {
	Recorder recorder;
	auto solver = recorder.MakeSolver();
	Eigen::MatrixXd X = ControlX();
	Eigen::MatrixXd Y = Eigen::MatrixXd::Ones(4, 2);

	auto bounds = solver.MaxTensorPenalty(X, Y, PenaltyParameter(std::vector<double> {1.0, 2.0, 8.0}));
	REQUIRE(std::holds_alternative<std::vector<double>>(bounds));
	const auto &values = std::get<std::vector<double>>(bounds);
	REQUIRE(values.size() == 3);

	// Element-wise equal to separate scalar calls
	const std::vector<double> w_pens = {1.0, 2.0, 8.0};
	for (size_t i = 0; i < w_pens.size(); i++) {
		auto single = solver.MaxTensorPenalty(X, Y, PenaltyParameter(w_pens[i]));
		REQUIRE_THAT(values[i], Catch::Matchers::WithinAbs(std::get<double>(single), TOLERANCE));
	}
	REQUIRE(recorder.loo->size() == 6);
}

TEST_CASE("PenaltyBounds: Row-list input", "[penalty]") {
	Recorder recorder;
	auto solver = recorder.MakeSolver();
	PenaltyBoundsSolver::Rows X = {{1.0, 0.0}, {2.0, 2.0}, {3.0, 4.0}, {4.0, 6.0}};
	PenaltyBoundsSolver::Rows Y = {{1.0}, {1.0}, {1.0}, {1.0}};

	auto bound = solver.MaxTensorPenalty(X, Y, PenaltyParameter(2.0));
	REQUIRE_THAT(std::get<double>(bound), Catch::Matchers::WithinAbs(6.0, TOLERANCE));
	REQUIRE(recorder.loo->front().X == ControlX());

	auto weight = solver.MaxWeightPenalty(X, Y, PenaltyParameter(4.0));
	REQUIRE_THAT(std::get<double>(weight), Catch::Matchers::WithinAbs(3.0, TOLERANCE));
}

TEST_CASE("PenaltyBounds: Maximum weight penalty", "[penalty]") {
	Recorder recorder;
	auto solver = recorder.MakeSolver();
	Eigen::MatrixXd X = ControlX();
	Eigen::MatrixXd Y = Eigen::MatrixXd::Ones(4, 2);

	SECTION("Scalar v_pen") {
		auto weight = solver.MaxWeightPenalty(X, Y, PenaltyParameter(3.0));
		auto tensor = solver.MaxTensorPenalty(X, Y, PenaltyParameter(1.0));
		REQUIRE_THAT(std::get<double>(weight) * 3.0, Catch::Matchers::WithinAbs(std::get<double>(tensor), TOLERANCE));
		REQUIRE(recorder.loo->front().w_pen == 1.0);
	}

	SECTION("Sequence of v_pen values needs a single solve") {
		auto weights = solver.MaxWeightPenalty(X, Y, PenaltyParameter(std::vector<double> {1.0, 4.0}));
		const auto &values = std::get<std::vector<double>>(weights);
		REQUIRE(values.size() == 2);
		REQUIRE_THAT(values[0], Catch::Matchers::WithinAbs(12.0, TOLERANCE));
		REQUIRE_THAT(values[1], Catch::Matchers::WithinAbs(3.0, TOLERANCE));
		REQUIRE(recorder.loo->size() == 1);
	}

	SECTION("Treated data uses the held-out strategy") {
		Eigen::MatrixXd X_treat = Eigen::MatrixXd::Ones(1, 2);
		Eigen::MatrixXd Y_treat = Eigen::MatrixXd::Ones(1, 2);
		auto weight = solver.MaxWeightPenalty(X, Y, PenaltyParameter(6.0), X_treat, Y_treat);
		REQUIRE_THAT(std::get<double>(weight), Catch::Matchers::WithinAbs(6.0, TOLERANCE));
		REQUIRE(recorder.held_out->size() == 1);
	}
}

TEST_CASE("PenaltyBounds: Memory exhaustion", "[penalty][errors]") {
	auto exhausted = [](const Eigen::MatrixXd &, const Eigen::MatrixXd &, double, EvaluationMode,
	                    const GradientStrategyOptions &) -> GradientEvaluation { throw std::bad_alloc(); };
	Eigen::MatrixXd X = ControlX();
	Eigen::MatrixXd Y = Eigen::MatrixXd::Ones(4, 2);

	SECTION("Leave-one-out reports insufficient memory") {
		auto solver = SolverWith(GradientStrategyType::LEAVE_ONE_OUT, exhausted);
		REQUIRE_THROWS_AS(solver.MaxTensorPenalty(X, Y, PenaltyParameter(1.0)), InsufficientMemoryError);
		try {
			solver.MaxTensorPenalty(X, Y, PenaltyParameter(1.0));
		} catch (const InsufficientMemoryError &e) {
			REQUIRE(std::string(e.what()).find("grad_splits") != std::string::npos);
		}
	}

	SECTION("Cross-fold reports insufficient memory") {
		auto solver = SolverWith(GradientStrategyType::CROSS_FOLD, exhausted);
		REQUIRE_THROWS_AS(solver.MaxTensorPenalty(X, Y, PenaltyParameter(1.0), std::nullopt, std::nullopt,
		                                          PenaltySearchOptions::CrossFold(2)),
		                  InsufficientMemoryError);
	}

	SECTION("Held-out treated propagates unchanged") {
		auto solver = SolverWith(GradientStrategyType::HELD_OUT_TREATED, exhausted);
		Eigen::MatrixXd X_treat = Eigen::MatrixXd::Ones(1, 2);
		Eigen::MatrixXd Y_treat = Eigen::MatrixXd::Ones(1, 2);
		REQUIRE_THROWS_AS(solver.MaxTensorPenalty(X, Y, PenaltyParameter(1.0), X_treat, Y_treat), std::bad_alloc);
	}
}

TEST_CASE("PenaltyBounds: Strategy failures", "[penalty][errors]") {
	Eigen::MatrixXd X = ControlX();
	Eigen::MatrixXd Y = Eigen::MatrixXd::Ones(4, 2);

	SECTION("Numeric failure propagates") {
		auto singular = [](const Eigen::MatrixXd &, const Eigen::MatrixXd &, double, EvaluationMode,
		                   const GradientStrategyOptions &) -> GradientEvaluation {
			throw std::runtime_error("singular matrix");
		};
		auto solver = SolverWith(GradientStrategyType::LEAVE_ONE_OUT, singular);
		REQUIRE_THROWS_AS(solver.MaxTensorPenalty(X, Y, PenaltyParameter(1.0)), std::runtime_error);
	}

	SECTION("Tensor instead of a bound") {
		auto tensor = [](const Eigen::MatrixXd &X_, const Eigen::MatrixXd &, double, EvaluationMode,
		                 const GradientStrategyOptions &) {
			return GradientEvaluation::Tensor(Eigen::MatrixXd::Identity(X_.cols(), X_.cols()));
		};
		auto solver = SolverWith(GradientStrategyType::LEAVE_ONE_OUT, tensor);
		REQUIRE_THROWS_AS(solver.MaxTensorPenalty(X, Y, PenaltyParameter(1.0)), std::runtime_error);
	}

	SECTION("Missing strategy") {
		auto calls = std::make_shared<std::vector<StrategyCall>>();
		auto solver = SolverWith(GradientStrategyType::LEAVE_ONE_OUT, RecordingStrategy {calls, 1.0});
		try {
			solver.MaxTensorPenalty(X, Y, PenaltyParameter(1.0), std::nullopt, std::nullopt,
			                        PenaltySearchOptions::CrossFold(3));
			FAIL("expected InvalidArgumentError");
		} catch (const InvalidArgumentError &e) {
			REQUIRE(e.cause() == InvalidArgumentCause::MISSING_STRATEGY);
		}
		REQUIRE(calls->empty());
	}
}
