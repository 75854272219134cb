#pragma once

#include <pollio/impl/linux/error.hpp>
#include <pollio/linux/detail/unique_fd.hpp>

#include <vsm/lazy.hpp>

#include <fcntl.h>

#include <pollio/linux/detail/undef.i>

namespace pollio::linux {

/// @brief Duplicates @p fd into the lowest available descriptor with close-on-exec set.
inline vsm::result<unique_fd> dup(int const fd)
{
	int const new_fd = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);

	if (new_fd == -1)
	{
		return vsm::unexpected(get_last_error());
	}

	return vsm_lazy(unique_fd(new_fd));
}

} // namespace pollio::linux

#include <pollio/linux/detail/undef.i>
