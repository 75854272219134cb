#pragma once

#include <pollio/detail/api.hpp>
#include <pollio/linux/detail/unique_fd.hpp>

#include <vsm/result.hpp>
#include <vsm/utility.hpp>

#include <pollio/linux/detail/undef.i>

namespace pollio {

/// @brief Manual reset event object.
///        Once signaled, the event remains signaled until reset by its owner.
///        Observing the signaled state, by polling or otherwise, does not reset it.
class event
{
	linux::unique_fd m_fd;

public:
	event() = default;

	[[nodiscard]] pollio_detail_api
	static vsm::result<event> create(bool initially_signaled = false);

	[[nodiscard]] bool is_null() const
	{
		return m_fd.get() == -1;
	}

	[[nodiscard]] int native_handle() const
	{
		return m_fd.get();
	}

	pollio_detail_api
	vsm::result<void> signal() const;

	pollio_detail_api
	vsm::result<void> reset() const;

	[[nodiscard]] pollio_detail_api
	vsm::result<bool> is_signaled() const;

private:
	explicit event(linux::unique_fd fd)
		: m_fd(vsm_move(fd))
	{
	}
};

} // namespace pollio

#include <pollio/linux/detail/undef.i>
