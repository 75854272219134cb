#include <pollio/waitable.hpp>

#include <pollio/error.hpp>
#include <pollio/event.hpp>
#include <pollio/wait_set.hpp>

#include <pollio/impl/linux/dup.hpp>
#include <pollio/impl/linux/error.hpp>
#include <pollio/impl/linux/pidfd.hpp>
#include <pollio/impl/linux/poll.hpp>

#include <vsm/lazy.hpp>
#include <vsm/utility.hpp>

#include <chrono>

#include <poll.h>

#include <pollio/linux/detail/undef.i>

using namespace pollio;
using namespace pollio::detail;
using namespace pollio::linux;

static short get_poll_events(io_direction const direction)
{
	return direction == io_direction::read ? POLLIN : POLLOUT;
}


/* Readiness */

static vsm::result<bool> is_ready(timer_source const& source)
{
	if (!source.expiry)
	{
		return false;
	}

	return deadline::clock::now() >= *source.expiry;
}

static vsm::result<bool> is_ready(io_source const& source)
{
	return poll_now(source.fd.get(), get_poll_events(source.direction));
}

static vsm::result<bool> is_ready(process_source const& source)
{
	// A pidfd becomes readable once the process terminates,
	// regardless of whether it has been reaped.
	return poll_now(source.pidfd.get(), POLLIN);
}

static vsm::result<bool> is_ready(event_source const& source)
{
	// The eventfd counter is observed without being read,
	// so a signaled event remains signaled.
	return poll_now(source.fd.get(), POLLIN);
}

static vsm::result<bool> is_ready(custom_source const& source)
{
	return source.provider->is_ready();
}


/* Wait contribution */

static vsm::result<void> contribute(timer_source const& source, wait_set& set)
{
	if (source.expiry)
	{
		set.add_deadline(*source.expiry);
	}
	return {};
}

static vsm::result<void> contribute(io_source const& source, wait_set& set)
{
	return set.add_descriptor(source.fd.get(), get_poll_events(source.direction));
}

static vsm::result<void> contribute(process_source const& source, wait_set& set)
{
	return set.add_descriptor(source.pidfd.get(), POLLIN);
}

static vsm::result<void> contribute(event_source const& source, wait_set& set)
{
	return set.add_descriptor(source.fd.get(), POLLIN);
}

static vsm::result<void> contribute(custom_source const& source, wait_set& set)
{
	return source.provider->contribute(set);
}


/* Construction */

waitable waitable::timer(deadline const deadline)
{
	if (deadline == deadline::never())
	{
		return waitable(timer_source{});
	}

	if (deadline == deadline::instant())
	{
		return waitable(timer_source
		{
			.expiry = std::chrono::time_point_cast<deadline::duration>(deadline::clock::now()),
		});
	}

	return waitable(timer_source
	{
		.expiry = deadline.start().absolute(),
	});
}

vsm::result<waitable> waitable::io(int const fd, io_direction const direction)
{
	if (fd < 0)
	{
		return vsm::unexpected(error::invalid_argument);
	}

	vsm_try(new_fd, linux::dup(fd));

	return vsm_lazy(waitable(io_source
	{
		.fd = vsm_move(new_fd),
		.direction = direction,
	}));
}

vsm::result<waitable> waitable::process(pid_t const pid)
{
	if (pid <= 0)
	{
		return vsm::unexpected(error::invalid_argument);
	}

	vsm_try(pidfd, linux::pidfd_open(pid, /* flags: */ 0));

	return vsm_lazy(waitable(process_source
	{
		.pidfd = vsm_move(pidfd),
	}));
}

vsm::result<waitable> waitable::event(pollio::event const& event)
{
	if (event.is_null())
	{
		return vsm::unexpected(error::invalid_argument);
	}

	// The duplicate refers to the same eventfd object,
	// so signals by the event owner are observed through it.
	vsm_try(fd, linux::dup(event.native_handle()));

	return vsm_lazy(waitable(event_source
	{
		.fd = vsm_move(fd),
	}));
}

vsm::result<waitable> waitable::custom(std::unique_ptr<waitable_provider> provider)
{
	if (provider == nullptr)
	{
		return vsm::unexpected(error::invalid_argument);
	}

	return vsm_lazy(waitable(custom_source
	{
		.provider = vsm_move(provider),
	}));
}


/* Operations */

vsm::result<bool> waitable::is_ready() const
{
	return std::visit([](auto const& source)
	{
		return ::is_ready(source);
	}, m_source);
}

vsm::result<void> waitable::contribute(wait_set& set) const
{
	return std::visit([&](auto const& source)
	{
		return ::contribute(source, set);
	}, m_source);
}
