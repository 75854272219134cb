#pragma once

#include <pollio/impl/linux/error.hpp>
#include <pollio/linux/detail/unique_fd.hpp>

#include <vsm/assert.h>
#include <vsm/lazy.hpp>
#include <vsm/result.hpp>

#include <sys/eventfd.h>

#include <pollio/linux/detail/undef.i>

namespace pollio::linux {

inline vsm::result<unique_fd> eventfd(int const flags, unsigned const initial_value = 0)
{
	vsm_assert((flags & ~(EFD_CLOEXEC | EFD_NONBLOCK | EFD_SEMAPHORE)) == 0); //PRECONDITION

	int const fd = ::eventfd(initial_value, flags);

	if (fd == -1)
	{
		return vsm::unexpected(get_last_error());
	}

	return vsm_lazy(unique_fd(fd));
}

/// @brief Reads and thereby zeroes the counter of a non-blocking eventfd.
/// @return True if the counter was non-zero.
inline vsm::result<bool> eventfd_reset(int const fd)
{
	eventfd_t value;

	if (::eventfd_read(fd, &value) == -1)
	{
		int const e = errno;

		// If the counter is already zero, EAGAIN is returned.
		if (e != EAGAIN)
		{
			return vsm::unexpected(static_cast<system_error>(e));
		}

		return false;
	}

	vsm_assert(value != 0);

	return true;
}

inline vsm::result<void> eventfd_signal(int const fd)
{
	if (::eventfd_write(fd, /* value: */ 1) == -1)
	{
		// If the counter is already full, EAGAIN is returned.
		// The counter remains non-zero, so the event remains signaled.
		if (int const e = errno; e != EAGAIN)
		{
			return vsm::unexpected(static_cast<system_error>(e));
		}
	}

	return {};
}

} // namespace pollio::linux

#include <pollio/linux/detail/undef.i>
