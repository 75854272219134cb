#include <pollio/registry.hpp>

#include <pollio/error.hpp>
#include <pollio/wait_set.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <vsm/utility.hpp>

#include <memory>
#include <vector>

using namespace pollio;

namespace {

class tracked_provider final : public waitable_provider
{
	bool* m_destroyed;

public:
	explicit tracked_provider(bool& destroyed)
		: m_destroyed(&destroyed)
	{
	}

	~tracked_provider() override
	{
		*m_destroyed = true;
	}

	vsm::result<bool> is_ready() const override
	{
		return true;
	}

	vsm::result<void> contribute(wait_set&) const override
	{
		return {};
	}
};

} // namespace

static waitable make_timer()
{
	return waitable::timer(deadline::never());
}


TEST_CASE("Registered sources can be resolved", "[registry]")
{
	registry registry;

	auto const pollable = registry.add(make_timer()).value();
	REQUIRE(registry.contains(pollable));
	REQUIRE(registry.size() == 1);

	auto const r = registry.resolve(pollable);
	REQUIRE(r);
	REQUIRE(*r != nullptr);
	REQUIRE((*r)->get_kind() == waitable::kind::timer);
}

TEST_CASE("Live pollables have distinct identifiers", "[registry]")
{
	registry registry;

	std::vector<pollable> pollables;
	for (size_t i = 0; i < 16; ++i)
	{
		pollables.push_back(registry.add(make_timer()).value());
	}

	for (size_t i = 0; i < pollables.size(); ++i)
	{
		for (size_t j = i + 1; j < pollables.size(); ++j)
		{
			REQUIRE(pollables[i] != pollables[j]);
		}
	}
}

TEST_CASE("Disposed pollables can no longer be resolved", "[registry]")
{
	registry registry;

	auto const pollable = registry.add(make_timer()).value();
	REQUIRE(registry.dispose(pollable));

	REQUIRE(!registry.contains(pollable));
	REQUIRE(registry.empty());

	auto const r = registry.resolve(pollable);
	REQUIRE(!r);
	REQUIRE(r.error() == error::invalid_handle);
}

TEST_CASE("Disposing a pollable twice is an error", "[registry]")
{
	registry registry;

	auto const pollable = registry.add(make_timer()).value();
	REQUIRE(registry.dispose(pollable));

	auto const r = registry.dispose(pollable);
	REQUIRE(!r);
	REQUIRE(r.error() == error::invalid_handle);
}

TEST_CASE("Unknown pollables are rejected", "[registry]")
{
	registry registry;
	(void)registry.add(make_timer()).value();

	auto const unknown = GENERATE(pollable(), pollable(1), pollable(1000));

	REQUIRE(!registry.contains(unknown));

	auto const resolve = registry.resolve(unknown);
	REQUIRE(!resolve);
	REQUIRE(resolve.error() == error::invalid_handle);

	auto const dispose = registry.dispose(unknown);
	REQUIRE(!dispose);
	REQUIRE(dispose.error() == error::invalid_handle);

	REQUIRE(registry.size() == 1);
}

TEST_CASE("Disposing a pollable does not affect other pollables", "[registry]")
{
	registry registry;

	auto const a = registry.add(make_timer()).value();
	auto const b = registry.add(make_timer()).value();
	auto const c = registry.add(make_timer()).value();

	REQUIRE(registry.dispose(b));

	REQUIRE(registry.contains(a));
	REQUIRE(!registry.contains(b));
	REQUIRE(registry.contains(c));
	REQUIRE(registry.size() == 2);
}

TEST_CASE("Identifiers of disposed pollables are reassigned", "[registry]")
{
	registry registry;

	auto const a = registry.add(make_timer()).value();
	(void)registry.add(make_timer()).value();

	REQUIRE(registry.dispose(a));

	auto const c = registry.add(make_timer()).value();
	REQUIRE(c == a);
	REQUIRE(registry.contains(c));
}

TEST_CASE("Registration fails once the registry is full", "[registry]")
{
	registry registry(2);
	REQUIRE(registry.max_size() == 2);

	auto const a = registry.add(make_timer()).value();
	(void)registry.add(make_timer()).value();

	auto const r = registry.add(make_timer());
	REQUIRE(!r);
	REQUIRE(r.error() == error::resource_exhausted);
	REQUIRE(registry.size() == 2);

	// The registry remains usable after exhaustion.
	REQUIRE(registry.dispose(a));
	REQUIRE(registry.add(make_timer()));
}

TEST_CASE("Disposing a pollable destroys its source", "[registry]")
{
	registry registry;

	bool destroyed = false;
	auto source = waitable::custom(std::make_unique<tracked_provider>(destroyed)).value();
	auto const pollable = registry.add(vsm_move(source)).value();
	REQUIRE(!destroyed);

	REQUIRE(registry.dispose(pollable));
	REQUIRE(destroyed);
}

TEST_CASE("Destroying the registry destroys remaining sources", "[registry]")
{
	bool destroyed = false;
	{
		registry registry;
		auto source = waitable::custom(std::make_unique<tracked_provider>(destroyed)).value();
		(void)registry.add(vsm_move(source)).value();
	}
	REQUIRE(destroyed);
}
