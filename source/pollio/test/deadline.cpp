#include <pollio/deadline.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace pollio;
using namespace std::chrono_literals;

TEST_CASE("Default deadline is never", "[deadline]")
{
	REQUIRE(deadline() == deadline::never());
	REQUIRE(!deadline::never().is_absolute());
}

TEST_CASE("Zero duration deadline is instant", "[deadline]")
{
	REQUIRE(deadline(0ms) == deadline::instant());
	REQUIRE(deadline::instant().is_relative());
}

TEST_CASE("Relative deadlines preserve their duration", "[deadline]")
{
	deadline const d = 10ms;
	REQUIRE(d.is_relative());
	REQUIRE(!d.is_absolute());
	REQUIRE(d.relative() == std::chrono::duration_cast<deadline::duration>(10ms));
}

TEST_CASE("Negative durations are clamped to instant", "[deadline]")
{
	REQUIRE(deadline(-5ms) == deadline::instant());
}

TEST_CASE("Absolute deadlines preserve their time point", "[deadline]")
{
	auto const now = std::chrono::time_point_cast<deadline::duration>(deadline::clock::now());
	deadline const d = now;
	REQUIRE(d.is_absolute());
	REQUIRE(!d.is_relative());
	REQUIRE(d.absolute() == now);
}

TEST_CASE("Starting a relative deadline makes it absolute", "[deadline]")
{
	auto const before = deadline::clock::now();
	deadline const d = deadline(100ms).start();
	auto const after = deadline::clock::now();

	REQUIRE(d.is_absolute());
	REQUIRE(d.absolute() >= before + 100ms - 1ms);
	REQUIRE(d.absolute() <= after + 100ms);
}

TEST_CASE("Starting a trivial or absolute deadline has no effect", "[deadline]")
{
	REQUIRE(deadline::never().start() == deadline::never());

	deadline const absolute = deadline(1s).start();
	REQUIRE(absolute.start() == absolute);
}

TEST_CASE("Starting the longest relative deadline saturates", "[deadline]")
{
	deadline const d = deadline(deadline::max_duration).start();

	REQUIRE(d != deadline::never());
	REQUIRE(d.is_absolute());
	REQUIRE(d.absolute() > deadline::clock::now() + 24h * 365 * 100);
}

TEST_CASE("Latest absolute time point remains absolute", "[deadline]")
{
	deadline const d = deadline::time_point::max();

	REQUIRE(d != deadline::never());
	REQUIRE(d.is_absolute());
	REQUIRE(d.start() == d);
}

TEST_CASE("Absolute deadlines cover long uptimes", "[deadline]")
{
	auto const time_point = std::chrono::time_point_cast<deadline::duration>(
		deadline::clock::time_point(24h * 365) + 1ms);

	deadline const d = time_point;
	REQUIRE(d.is_absolute());
	REQUIRE(d.absolute() == time_point);
}
