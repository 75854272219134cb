#pragma once

#include <vsm/assert.h>

#include <chrono>
#include <concepts>
#include <type_traits>

#include <cstdint>

namespace pollio {

class deadline
{
	using repr_type = uint64_t;
	using unit_type = std::nano;

public:
	using clock = std::chrono::steady_clock;

private:
	static constexpr repr_type max_units = static_cast<repr_type>(-1) >> 1;
	static constexpr repr_type absolute_flag = ~max_units;

	static constexpr repr_type never_bits = static_cast<repr_type>(-1);

	// High bit 0: relative.
	// High bit 1: absolute.
	// Low bits: units from
	//   * relative: operation start, or
	//   * absolute: clock epoch.
	// All bits set: never.
	repr_type m_bits;

public:
	using duration = std::chrono::duration<std::make_signed_t<repr_type>, unit_type>;
	using time_point = std::chrono::time_point<clock, duration>;

	static constexpr duration max_duration = duration(max_units);

	constexpr deadline()
		: m_bits(never_bits)
	{
	}

	constexpr deadline(duration const relative)
		: deadline(0, clamp_units(relative.count()))
	{
	}

	template<typename Repr, typename Unit>
	constexpr deadline(std::chrono::duration<Repr, Unit> const relative)
		requires std::convertible_to<std::chrono::duration<Repr, Unit>, duration>
		: deadline(static_cast<duration>(relative))
	{
	}

	constexpr deadline(time_point const absolute)
		: deadline(absolute_flag, clamp_absolute_units(absolute.time_since_epoch().count()))
	{
	}

	template<typename Duration>
	constexpr deadline(std::chrono::time_point<clock, Duration> const absolute)
		requires std::convertible_to<Duration, duration>
		: deadline(std::chrono::time_point_cast<duration>(absolute))
	{
	}


	/// @brief Relative deadlines, including @ref never, are measured from the start of an operation.
	constexpr bool is_relative() const
	{
		return static_cast<repr_type>(m_bits + 1) <= absolute_flag;
	}

	constexpr duration relative() const
	{
		vsm_assert(is_relative() && m_bits != never_bits);
		return duration(m_bits);
	}

	constexpr bool is_absolute() const
	{
		return (m_bits & absolute_flag) != 0 && m_bits != never_bits;
	}

	constexpr time_point absolute() const
	{
		vsm_assert(is_absolute());
		return time_point(duration(m_bits & max_units));
	}


	/// @brief Converts a relative deadline into an absolute one measured from now.
	///        Absolute and never deadlines are returned unchanged.
	///        A result beyond the representable range saturates to the latest absolute deadline.
	deadline start() const
	{
		if (m_bits == never_bits || (m_bits & absolute_flag))
		{
			return *this;
		}

		repr_type const max = max_units - m_bits;
		repr_type const now = units_since_epoch(clock::now());
		// absolute_flag | max_units is never_bits.
		return deadline(absolute_flag | (now >= max ? max_units - 1 : now + m_bits));
	}


	static constexpr deadline instant()
	{
		return deadline(static_cast<repr_type>(0));
	}

	static constexpr deadline never()
	{
		return deadline(never_bits);
	}


	bool operator==(deadline const&) const = default;

private:
	explicit constexpr deadline(repr_type const bits)
		: m_bits(bits)
	{
	}

	explicit constexpr deadline(repr_type const flag, repr_type const units)
		: m_bits(units <= max_units ? flag | units : never_bits)
	{
	}


	static constexpr repr_type clamp_units(typename duration::rep const count)
	{
		return count < 0 ? 0 : static_cast<repr_type>(count);
	}

	static constexpr repr_type clamp_absolute_units(typename duration::rep const count)
	{
		// The largest count would produce never_bits.
		repr_type const units = clamp_units(count);
		return units < max_units ? units : max_units - 1;
	}

	static repr_type units_since_epoch(clock::time_point const& time_point)
	{
		return clamp_units(std::chrono::duration_cast<duration>(time_point.time_since_epoch()).count());
	}
};

} // namespace pollio
