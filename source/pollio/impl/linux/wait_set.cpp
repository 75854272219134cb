#include <pollio/wait_set.hpp>

#include <pollio/error.hpp>
#include <pollio/impl/linux/error.hpp>
#include <pollio/impl/linux/timeout.hpp>

#include <vsm/assert.h>

#include <new>

#include <poll.h>

#include <pollio/linux/detail/undef.i>

using namespace pollio;
using namespace pollio::linux;

vsm::result<void> wait_set::add_descriptor(int const fd, short const events)
{
	vsm_assert(fd != -1); //PRECONDITION
	vsm_assert(events != 0); //PRECONDITION

	try
	{
		m_descriptors.push_back(pollfd
		{
			.fd = fd,
			.events = events,
		});
	}
	catch (std::bad_alloc const&)
	{
		return vsm::unexpected(error::not_enough_memory);
	}

	return {};
}

void wait_set::add_deadline(deadline::time_point const time_point)
{
	if (!m_deadline || time_point < *m_deadline)
	{
		m_deadline = time_point;
	}
}

vsm::result<void> wait_set::wait()
{
	kernel_timeout<timespec> timeout;

	if (m_deadline)
	{
		auto const now = deadline::clock::now();

		timeout.set(*m_deadline > now
			? deadline(std::chrono::duration_cast<deadline::duration>(*m_deadline - now))
			: deadline::instant());
	}

	int const r = ppoll(
		m_descriptors.data(),
		m_descriptors.size(),
		timeout,
		/* sigmask: */ nullptr);

	if (r == -1)
	{
		int const e = errno;

		// A signal interrupted the wait. Readiness is re-evaluated by the caller.
		if (e == EINTR)
		{
			return {};
		}

		return vsm::unexpected(static_cast<system_error>(e));
	}

	return {};
}
