#include <pollio/poll.hpp>

#include <pollio/error.hpp>
#include <pollio/wait_set.hpp>

#include <vsm/assert.h>

#include <algorithm>
#include <functional>
#include <new>
#include <vector>

using namespace pollio;

static std::error_code wait_failed(std::error_code const e, error_source const source)
{
	report_error(e, source);
	return error::wait_failed;
}

/// @brief Maps each position to the first position referring to the same source.
/// @param order Scratch space of the same size as @p sources.
static void find_duplicates(
	std::span<waitable const* const> const sources,
	std::span<size_t> const order,
	std::span<size_t> const first)
{
	for (size_t i = 0; i < order.size(); ++i)
	{
		order[i] = i;
	}

	// Equal sources become adjacent, each group ordered by position.
	std::sort(order.begin(), order.end(), [&](size_t const a, size_t const b)
	{
		std::less<waitable const*> const less;

		if (less(sources[a], sources[b]))
		{
			return true;
		}
		if (less(sources[b], sources[a]))
		{
			return false;
		}
		return a < b;
	});

	size_t group_first = 0;
	for (size_t i = 0; i < order.size(); ++i)
	{
		if (i == 0 || sources[order[i]] != sources[order[i - 1]])
		{
			group_first = order[i];
		}
		first[order[i]] = group_first;
	}
}

/// @return True if at least one source is ready.
static vsm::result<bool> check_readiness(
	std::span<waitable const* const> const sources,
	std::span<size_t const> const first,
	std::span<uint8_t> const readiness)
{
	bool any_ready = false;

	for (size_t i = 0; i < sources.size(); ++i)
	{
		// Each source is checked once per scan so that duplicates agree.
		if (first[i] != i)
		{
			readiness[i] = readiness[first[i]];
			continue;
		}

		auto const r = sources[i]->is_ready();

		if (!r)
		{
			return vsm::unexpected(wait_failed(r.error(), error_source::readiness_check));
		}

		readiness[i] = *r ? 1 : 0;
		any_ready |= *r;
	}

	return any_ready;
}

static vsm::result<void> wait_for_readiness(
	std::span<waitable const* const> const sources,
	std::span<size_t const> const first)
{
	wait_set set;

	for (size_t i = 0; i < sources.size(); ++i)
	{
		if (first[i] != i)
		{
			continue;
		}

		if (auto const r = sources[i]->contribute(set); !r)
		{
			return vsm::unexpected(wait_failed(r.error(), error_source::wait_set_contribute));
		}
	}

	if (auto const r = set.wait(); !r)
	{
		return vsm::unexpected(wait_failed(r.error(), error_source::wait_set_wait));
	}

	return {};
}

vsm::result<void> pollio::drop_pollable(registry& registry, pollable const pollable)
{
	return registry.dispose(pollable);
}

vsm::result<void> pollio::poll_oneoff(
	registry const& registry,
	std::span<pollable const> const pollables,
	std::span<uint8_t> const readiness)
{
	vsm_assert(readiness.size() == pollables.size()); //PRECONDITION

	if (pollables.empty())
	{
		return {};
	}

	std::vector<waitable const*> sources;
	std::vector<size_t> order;
	std::vector<size_t> first;
	try
	{
		sources.reserve(pollables.size());
		order.resize(pollables.size());
		first.resize(pollables.size());
	}
	catch (std::bad_alloc const&)
	{
		return vsm::unexpected(error::not_enough_memory);
	}

	// Every pollable is resolved before anything is checked or waited,
	// so that an invalid pollable fails the call without blocking.
	for (pollable const pollable : pollables)
	{
		vsm_try(source, registry.resolve(pollable));
		sources.push_back(source);
	}

	find_duplicates(sources, order, first);

	bool any_ready;
	vsm_try_assign(any_ready, check_readiness(sources, first, readiness));

	// A wakeup only indicates that some source may have become ready.
	// Spurious wakeups and interrupted waits are followed by another wait.
	while (!any_ready)
	{
		vsm_try_void(wait_for_readiness(sources, first));
		vsm_try_assign(any_ready, check_readiness(sources, first, readiness));
	}

	return {};
}

vsm::result<std::vector<uint8_t>> pollio::poll_oneoff(
	registry const& registry,
	std::span<pollable const> const pollables)
{
	vsm::result<std::vector<uint8_t>> r(vsm::result_value);

	try
	{
		r->resize(pollables.size());
	}
	catch (std::bad_alloc const&)
	{
		return vsm::unexpected(error::not_enough_memory);
	}

	vsm_try_void(poll_oneoff(registry, pollables, *r));

	return r;
}
