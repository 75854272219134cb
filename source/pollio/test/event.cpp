#include <pollio/event.hpp>

#include <pollio/test/spawn.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <chrono>
#include <thread>

#include <poll.h>

using namespace pollio;

static bool is_signaled(event const& event)
{
	return event.is_signaled().value();
}


TEST_CASE("Events are not signaled on creation by default", "[event]")
{
	auto const event = pollio::event::create().value();
	REQUIRE(!event.is_null());
	REQUIRE(!is_signaled(event));
}

TEST_CASE("Events can be signaled on creation if requested", "[event]")
{
	auto const event = pollio::event::create(/* initially_signaled: */ true).value();
	REQUIRE(is_signaled(event));
}

TEST_CASE("Events remain signaled after being observed", "[event]")
{
	auto const event = pollio::event::create(true).value();
	REQUIRE(is_signaled(event));
	REQUIRE(is_signaled(event));
}

TEST_CASE("Events can be signaled after creation", "[event]")
{
	auto const event = pollio::event::create().value();
	REQUIRE(event.signal());
	REQUIRE(is_signaled(event));
}

TEST_CASE("Events can be signaled repeatedly", "[event]")
{
	auto const event = pollio::event::create().value();
	REQUIRE(event.signal());
	REQUIRE(event.signal());
	REQUIRE(is_signaled(event));

	// A single reset clears any number of signals.
	REQUIRE(event.reset());
	REQUIRE(!is_signaled(event));
}

TEST_CASE("Events can be reset after being signaled", "[event]")
{
	auto const event = pollio::event::create(GENERATE(false, true)).value();
	REQUIRE(event.signal());
	REQUIRE(event.reset());
	REQUIRE(!is_signaled(event));
}

TEST_CASE("Resetting an unsignaled event has no effect", "[event]")
{
	auto const event = pollio::event::create().value();
	REQUIRE(event.reset());
	REQUIRE(!is_signaled(event));
}

TEST_CASE("Events can be signaled from another thread", "[event][threading]")
{
	auto const event = pollio::event::create().value();

	auto const signal = test::spawn([&]()
	{
		std::this_thread::sleep_for(std::chrono::milliseconds(50));
		return event.signal().has_value();
	});

	pollfd poll_fd =
	{
		.fd = event.native_handle(),
		.events = POLLIN,
	};
	REQUIRE(poll(&poll_fd, 1, /* timeout: */ -1) == 1);
	REQUIRE(is_signaled(event));
}
