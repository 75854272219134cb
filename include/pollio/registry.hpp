#pragma once

#include <pollio/detail/api.hpp>
#include <pollio/detail/integer_id.hpp>
#include <pollio/waitable.hpp>

#include <vsm/result.hpp>

#include <limits>
#include <memory>
#include <vector>

#include <cstddef>
#include <cstdint>

#ifndef pollio_config_max_pollables
#	define pollio_config_max_pollables 0xFFFFFFFF
#endif

namespace pollio {

struct pollable_tag;

/// @brief Opaque identifier of a waitable source stored in a @ref registry.
///        Identifiers of dropped pollables may be reassigned by later registrations.
using pollable = detail::integer_id<pollable_tag, uint32_t, std::numeric_limits<uint32_t>::max()>;

/// @brief Owns waitable sources and maps pollable identifiers to them.
///        A registry is not synchronized. Concurrent use requires external synchronization.
class registry
{
	static constexpr uint32_t null_index = pollable::null_integer;

	struct slot
	{
		std::unique_ptr<waitable> source;
		uint32_t next_free = null_index;
	};

	std::vector<slot> m_slots;
	uint32_t m_free_head = null_index;
	size_t m_size = 0;
	size_t m_max_size;

public:
	static constexpr size_t default_max_size = pollio_config_max_pollables;

	explicit registry(size_t const max_size = default_max_size)
		: m_max_size(max_size < null_index ? max_size : null_index)
	{
	}

	registry(registry const&) = delete;
	registry& operator=(registry const&) = delete;

	/// @brief Stores @p source and assigns it an identifier.
	/// @return The new identifier, or @ref error::resource_exhausted if
	///         the registry already holds @ref max_size sources.
	[[nodiscard]] pollio_detail_api
	vsm::result<pollable> add(waitable source);

	/// @brief Looks up the source named by @p pollable.
	/// @return Pointer to the source, valid until @p pollable is disposed,
	///         or @ref error::invalid_handle.
	[[nodiscard]] pollio_detail_api
	vsm::result<waitable const*> resolve(pollable pollable) const;

	/// @brief Destroys the source named by @p pollable, releasing its resources.
	///        The identifier is invalid from this point on.
	/// @pre @p pollable is not part of a wait in progress.
	pollio_detail_api
	vsm::result<void> dispose(pollable pollable);

	[[nodiscard]] pollio_detail_api
	bool contains(pollable pollable) const;

	[[nodiscard]] size_t size() const
	{
		return m_size;
	}

	[[nodiscard]] size_t max_size() const
	{
		return m_max_size;
	}

	[[nodiscard]] bool empty() const
	{
		return m_size == 0;
	}

private:
	slot const* find(pollable pollable) const;
};

} // namespace pollio
