#pragma once

#include <pollio/deadline.hpp>
#include <pollio/detail/api.hpp>

#include <vsm/result.hpp>

#include <optional>
#include <vector>

#include <poll.h>

namespace pollio {

/// @brief Aggregates the wait primitives of every source taking part in a single blocking wait.
///        Descriptors are waited with ppoll, and the earliest contributed deadline bounds the wait.
class wait_set
{
	std::vector<pollfd> m_descriptors;
	std::optional<deadline::time_point> m_deadline;

public:
	wait_set() = default;

	wait_set(wait_set const&) = delete;
	wait_set& operator=(wait_set const&) = delete;

	/// @return @ref error::not_enough_memory if the descriptor could not be stored.
	pollio_detail_api
	vsm::result<void> add_descriptor(int fd, short events);

	pollio_detail_api
	void add_deadline(deadline::time_point time_point);

	[[nodiscard]] size_t descriptor_count() const
	{
		return m_descriptors.size();
	}

	[[nodiscard]] std::optional<deadline::time_point> earliest_deadline() const
	{
		return m_deadline;
	}

	/// @brief Suspends the calling thread until a contributed descriptor reports an event
	///        or the earliest deadline passes. Without descriptors or deadlines the wait is
	///        unbounded. An interrupted wait returns successfully; callers re-check readiness.
	pollio_detail_api
	vsm::result<void> wait();
};

} // namespace pollio
