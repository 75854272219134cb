#include <pollio/linux/detail/unique_fd.hpp>

#include <pollio/impl/linux/error.hpp>

#include <unistd.h>

#include <pollio/linux/detail/undef.i>

using namespace pollio;
using namespace pollio::linux;

vsm::result<void> linux::close_fd(int const fd) noexcept
{
	if (::close(fd) == -1)
	{
		int const e = errno;

		// On Linux the descriptor is released even if close is interrupted,
		// so only EBADF indicates a real failure.
		if (e == EBADF)
		{
			return vsm::unexpected(static_cast<system_error>(e));
		}
	}
	return {};
}
