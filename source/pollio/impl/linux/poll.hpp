#pragma once

#include <pollio/impl/linux/error.hpp>

#include <vsm/assert.h>
#include <vsm/result.hpp>

#include <poll.h>

#include <pollio/linux/detail/undef.i>

namespace pollio::linux {

/// @brief Tests without blocking whether @p fd reports any of @p events.
///        Error and hang-up conditions are reported as ready,
///        as the next operation on the descriptor will not block.
inline vsm::result<bool> poll_now(int const fd, short const events)
{
	vsm_assert(events != 0); //PRECONDITION

	pollfd poll_fd =
	{
		.fd = fd,
		.events = events,
	};

	int const r = ::poll(
		&poll_fd,
		/* count: */ 1,
		/* timeout: */ 0);

	if (r == -1)
	{
		int const e = errno;

		// An interrupted zero timeout poll carries no information.
		// Report not ready and let the caller re-check after waiting.
		if (e == EINTR)
		{
			return false;
		}

		return vsm::unexpected(static_cast<system_error>(e));
	}

	if (r == 0)
	{
		return false;
	}

	if (poll_fd.revents & POLLNVAL)
	{
		return vsm::unexpected(static_cast<system_error>(EBADF));
	}

	return (poll_fd.revents & (events | POLLERR | POLLHUP)) != 0;
}

} // namespace pollio::linux

#include <pollio/linux/detail/undef.i>
