#include <pollio/registry.hpp>

#include <pollio/error.hpp>
#include <pollio/impl/new.hpp>

#include <vsm/assert.h>
#include <vsm/utility.hpp>

#include <new>

using namespace pollio;

vsm::result<pollable> registry::add(waitable source)
{
	if (m_size >= m_max_size)
	{
		return vsm::unexpected(error::resource_exhausted);
	}

	vsm_try(object, make_unique<waitable>(vsm_move(source)));

	uint32_t index = m_free_head;

	if (index != null_index)
	{
		slot& s = m_slots[index];
		vsm_assert(s.source == nullptr);

		m_free_head = s.next_free;
		s.next_free = null_index;
		s.source = vsm_move(object);
	}
	else
	{
		// Every slot below m_slots.size() is occupied and m_size < m_max_size <= null_index.
		vsm_assert(m_slots.size() == m_size);
		index = static_cast<uint32_t>(m_slots.size());

		try
		{
			m_slots.push_back(slot{ .source = vsm_move(object) });
		}
		catch (std::bad_alloc const&)
		{
			return vsm::unexpected(error::not_enough_memory);
		}
	}

	++m_size;
	return pollable(index);
}

vsm::result<waitable const*> registry::resolve(pollable const pollable) const
{
	slot const* const s = find(pollable);

	if (s == nullptr)
	{
		return vsm::unexpected(error::invalid_handle);
	}

	return s->source.get();
}

vsm::result<void> registry::dispose(pollable const pollable)
{
	if (find(pollable) == nullptr)
	{
		return vsm::unexpected(error::invalid_handle);
	}

	uint32_t const index = pollable.integer();
	slot& s = m_slots[index];

	// The slot is released before the source is destroyed,
	// so the identifier is already invalid while its resources are closed.
	std::unique_ptr<waitable> const source = vsm_move(s.source);
	s.next_free = m_free_head;
	m_free_head = index;
	--m_size;

	return {};
}

bool registry::contains(pollable const pollable) const
{
	return find(pollable) != nullptr;
}

registry::slot const* registry::find(pollable const pollable) const
{
	uint32_t const index = pollable.integer();

	if (index >= m_slots.size())
	{
		return nullptr;
	}

	slot const& s = m_slots[index];

	if (s.source == nullptr)
	{
		return nullptr;
	}

	return &s;
}
