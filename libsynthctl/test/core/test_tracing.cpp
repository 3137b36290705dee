#include <catch2/catch_test_macros.hpp>
#include "libsynthctl/utils/tracing.hpp"

using namespace libsynthctl::utils;

TEST_CASE("Tracer - Level parsing", "[core][tracing]") {
	REQUIRE(Tracer::ParseLevel("trace", LogLevel::WARN) == LogLevel::TRACE);
	REQUIRE(Tracer::ParseLevel("DEBUG", LogLevel::WARN) == LogLevel::DBG);
	REQUIRE(Tracer::ParseLevel("Info", LogLevel::WARN) == LogLevel::INFO);
	REQUIRE(Tracer::ParseLevel("warn", LogLevel::INFO) == LogLevel::WARN);
	REQUIRE(Tracer::ParseLevel("error", LogLevel::WARN) == LogLevel::ERR);
	REQUIRE(Tracer::ParseLevel("none", LogLevel::WARN) == LogLevel::NONE);
	REQUIRE(Tracer::ParseLevel("verbose", LogLevel::INFO) == LogLevel::INFO);
}

TEST_CASE("Tracer - Level filtering", "[core][tracing]") {
	const LogLevel saved = Tracer::GetLogLevel();

	Tracer::SetLogLevel(LogLevel::WARN);
	REQUIRE(Tracer::GetLogLevel() == LogLevel::WARN);
	REQUIRE(!Tracer::ShouldLog(LogLevel::DBG));
	REQUIRE(!Tracer::ShouldLog(LogLevel::INFO));
	REQUIRE(Tracer::ShouldLog(LogLevel::WARN));
	REQUIRE(Tracer::ShouldLog(LogLevel::ERR));

	Tracer::SetLogLevel(LogLevel::NONE);
	REQUIRE(!Tracer::ShouldLog(LogLevel::ERR));

	Tracer::SetLogLevel(saved);
}

TEST_CASE("Tracer - Level names and timing", "[core][tracing]") {
	REQUIRE(Tracer::GetLevelName(LogLevel::DBG) == "DEBUG");
	REQUIRE(Tracer::GetLevelName(LogLevel::ERR) == "ERROR");

	const LogLevel saved = Tracer::GetLogLevel();
	Tracer::SetLogLevel(LogLevel::NONE);
	SYNTHCTL_TIMING_START();
	REQUIRE(SYNTHCTL_TIMING_END("noop") >= 0.0);
	SYNTHCTL_WARN("suppressed " << 42);
	Tracer::SetLogLevel(saved);
}
