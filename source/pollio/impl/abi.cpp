#include <pollio/abi.h>

#include <pollio/deadline.hpp>
#include <pollio/error.hpp>
#include <pollio/impl/new.hpp>
#include <pollio/poll.hpp>
#include <pollio/registry.hpp>
#include <pollio/subscribe.hpp>

#include <vsm/assert.h>

#include <algorithm>
#include <chrono>
#include <new>
#include <span>
#include <vector>

using namespace pollio;

struct pollio_abi_registry
{
	pollio::registry registry;
};

static pollio_abi_result make_abi_result(std::error_code const e)
{
	if (e.category() == pollio::error_category())
	{
		switch (static_cast<error>(e.value()))
		{
		case error::none:
			return pollio_abi_result_success;

		case error::invalid_handle:
			return pollio_abi_result_invalid_handle;

		case error::resource_exhausted:
			return pollio_abi_result_resource_exhausted;

		case error::wait_failed:
			return pollio_abi_result_wait_failed;

		case error::invalid_argument:
			return pollio_abi_result_invalid_argument;

		default:
			break;
		}
	}
	return pollio_abi_result_unknown_failure;
}

static pollio_abi_result make_abi_result(vsm::result<void> const& r)
{
	return r ? pollio_abi_result_success : make_abi_result(r.error());
}

static pollio_abi_result make_abi_result(
	vsm::result<pollio::pollable> const& r,
	pollio_abi_pollable* const pollable)
{
	if (!r)
	{
		return make_abi_result(r.error());
	}

	*pollable = r->integer();
	return pollio_abi_result_success;
}

pollio_abi_result pollio_abi_registry_create(pollio_abi_registry** const registry)
{
	vsm_assert(registry != nullptr); //PRECONDITION

	auto r = make_unique<pollio_abi_registry>();

	if (!r)
	{
		return make_abi_result(r.error());
	}

	*registry = r->release();
	return pollio_abi_result_success;
}

void pollio_abi_registry_destroy(pollio_abi_registry* const registry)
{
	delete registry;
}

pollio_abi_result pollio_abi_subscribe_timer(
	pollio_abi_registry* const registry,
	uint64_t const nanoseconds,
	pollio_abi_pollable* const pollable)
{
	vsm_assert(registry != nullptr); //PRECONDITION
	vsm_assert(pollable != nullptr); //PRECONDITION

	deadline timeout = deadline::never();
	if (nanoseconds != pollio_abi_timeout_never)
	{
		auto const duration = std::chrono::nanoseconds(
			static_cast<std::chrono::nanoseconds::rep>(std::min<uint64_t>(
				nanoseconds, static_cast<uint64_t>(std::chrono::nanoseconds::max().count()))));

		timeout = deadline(std::chrono::duration_cast<deadline::duration>(
			std::min<std::chrono::nanoseconds>(duration, deadline::max_duration)));
	}

	return make_abi_result(subscribe_timer(registry->registry, timeout), pollable);
}

pollio_abi_result pollio_abi_subscribe_fd(
	pollio_abi_registry* const registry,
	int const fd,
	pollio_abi_direction const direction,
	pollio_abi_pollable* const pollable)
{
	vsm_assert(registry != nullptr); //PRECONDITION
	vsm_assert(pollable != nullptr); //PRECONDITION

	switch (direction)
	{
	case pollio_abi_direction_read:
		return make_abi_result(subscribe_read(registry->registry, fd), pollable);

	case pollio_abi_direction_write:
		return make_abi_result(subscribe_write(registry->registry, fd), pollable);
	}

	return pollio_abi_result_invalid_argument;
}

pollio_abi_result pollio_abi_drop_pollable(
	pollio_abi_registry* const registry,
	pollio_abi_pollable const pollable)
{
	vsm_assert(registry != nullptr); //PRECONDITION

	return make_abi_result(drop_pollable(
		registry->registry,
		pollio::pollable(pollable)));
}

pollio_abi_result pollio_abi_poll_oneoff(
	pollio_abi_registry const* const registry,
	pollio_abi_pollable const* const pollables,
	size_t const count,
	uint8_t* const readiness)
{
	vsm_assert(registry != nullptr); //PRECONDITION
	vsm_assert(count == 0 || (pollables != nullptr && readiness != nullptr)); //PRECONDITION

	std::vector<pollio::pollable> list;
	try
	{
		list.reserve(count);
	}
	catch (std::bad_alloc const&)
	{
		return pollio_abi_result_unknown_failure;
	}

	for (pollio_abi_pollable const pollable : std::span(pollables, count))
	{
		list.push_back(pollio::pollable(pollable));
	}

	return make_abi_result(poll_oneoff(
		registry->registry,
		list,
		std::span(readiness, count)));
}
