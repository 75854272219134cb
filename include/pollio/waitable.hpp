#pragma once

#include <pollio/deadline.hpp>
#include <pollio/detail/api.hpp>
#include <pollio/linux/detail/unique_fd.hpp>

#include <vsm/result.hpp>
#include <vsm/utility.hpp>

#include <memory>
#include <optional>
#include <variant>

#include <cstdint>

#include <sys/types.h>

#include <pollio/linux/detail/undef.i>

namespace pollio {

class event;
class wait_set;

enum class io_direction : uint8_t
{
	read,
	write,
};

/// @brief Capability interface for waitable sources supplied by collaborators
///        for conditions not covered by the built in kinds.
class waitable_provider
{
public:
	virtual ~waitable_provider() = default;

	/// @brief Non-blocking readiness check. Must not alter the observed state.
	virtual vsm::result<bool> is_ready() const = 0;

	/// @brief Adds the wait primitives which wake a wait when this source may have become ready.
	virtual vsm::result<void> contribute(wait_set& set) const = 0;

protected:
	waitable_provider() = default;
	waitable_provider(waitable_provider const&) = default;
	waitable_provider& operator=(waitable_provider const&) = default;
};


namespace detail {

struct timer_source
{
	// Empty if the timer never expires.
	std::optional<deadline::time_point> expiry;
};

struct io_source
{
	linux::unique_fd fd;
	io_direction direction;
};

struct process_source
{
	linux::unique_fd pidfd;
};

struct event_source
{
	linux::unique_fd fd;
};

struct custom_source
{
	std::unique_ptr<waitable_provider> provider;
};

} // namespace detail


/// @brief A single wait condition stored in a @ref registry.
class waitable
{
public:
	enum class kind : uint8_t
	{
		timer,
		io,
		process,
		event,
		custom,
	};

private:
	// Alternatives are ordered as the enumerators of kind.
	using variant_type = std::variant<
		detail::timer_source,
		detail::io_source,
		detail::process_source,
		detail::event_source,
		detail::custom_source>;

	variant_type m_source;

public:
	/// @brief Creates a timer source.
	///        A relative deadline is measured from the time of this call.
	[[nodiscard]] pollio_detail_api
	static waitable timer(deadline deadline);

	/// @brief Creates a source which becomes ready when @p fd is readable or writable.
	///        The descriptor is duplicated; the caller retains ownership of @p fd.
	[[nodiscard]] pollio_detail_api
	static vsm::result<waitable> io(int fd, io_direction direction);

	/// @brief Creates a source which becomes ready when the process @p pid terminates.
	[[nodiscard]] pollio_detail_api
	static vsm::result<waitable> process(pid_t pid);

	/// @brief Creates a source which is ready while @p event is signaled.
	[[nodiscard]] pollio_detail_api
	static vsm::result<waitable> event(pollio::event const& event);

	[[nodiscard]] pollio_detail_api
	static vsm::result<waitable> custom(std::unique_ptr<waitable_provider> provider);


	[[nodiscard]] kind get_kind() const
	{
		return static_cast<kind>(m_source.index());
	}

	/// @brief Non-blocking, side effect free readiness check.
	[[nodiscard]] pollio_detail_api
	vsm::result<bool> is_ready() const;

	/// @brief Adds this source's wait primitive to @p set.
	pollio_detail_api
	vsm::result<void> contribute(wait_set& set) const;

private:
	explicit waitable(variant_type source)
		: m_source(vsm_move(source))
	{
	}
};

} // namespace pollio

#include <pollio/linux/detail/undef.i>
