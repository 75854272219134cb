#include <pollio/event.hpp>

#include <pollio/impl/linux/error.hpp>
#include <pollio/impl/linux/eventfd.hpp>
#include <pollio/impl/linux/poll.hpp>

#include <vsm/assert.h>
#include <vsm/lazy.hpp>
#include <vsm/utility.hpp>

#include <pollio/linux/detail/undef.i>

using namespace pollio;
using namespace pollio::linux;

vsm::result<event> event::create(bool const initially_signaled)
{
	// The eventfd is non-blocking so that reset never blocks on a zero counter.
	vsm_try(fd, linux::eventfd(
		EFD_CLOEXEC | EFD_NONBLOCK,
		initially_signaled ? 1 : 0));

	return vsm_lazy(event(vsm_move(fd)));
}

vsm::result<void> event::signal() const
{
	vsm_assert(!is_null()); //PRECONDITION
	return eventfd_signal(m_fd.get());
}

vsm::result<void> event::reset() const
{
	vsm_assert(!is_null()); //PRECONDITION

	// It doesn't matter whether the counter was already zero,
	// as long as it is now zero. Thus the value can be discarded.
	return vsm::discard_value(eventfd_reset(m_fd.get()));
}

vsm::result<bool> event::is_signaled() const
{
	vsm_assert(!is_null()); //PRECONDITION

	// Polling does not modify the counter.
	return poll_now(m_fd.get(), POLLIN);
}
