#pragma once

#include <pollio/impl/linux/error.hpp>
#include <pollio/linux/detail/unique_fd.hpp>

#include <vsm/lazy.hpp>

#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

#include <pollio/linux/detail/undef.i>

namespace pollio::linux {

/// @brief Opens a descriptor referring to the process @p pid.
///        The descriptor becomes readable when the process terminates.
inline vsm::result<unique_fd> pidfd_open(pid_t const pid, unsigned const flags)
{
	int const fd = static_cast<int>(syscall(SYS_pidfd_open, pid, flags));

	if (fd == -1)
	{
		return vsm::unexpected(get_last_error());
	}

	return vsm_lazy(unique_fd(fd));
}

} // namespace pollio::linux

#include <pollio/linux/detail/undef.i>
