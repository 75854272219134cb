#pragma once

#include <concepts>

namespace pollio::detail {

template<typename Tag, std::integral Integer, Integer DefaultValue = 0>
class integer_id
{
	Integer m_integer = DefaultValue;

public:
	using integer_type = Integer;

	static constexpr Integer null_integer = DefaultValue;

	integer_id() = default;

	explicit constexpr integer_id(Integer const integer)
		: m_integer(integer)
	{
	}

	[[nodiscard]] constexpr Integer integer() const
	{
		return m_integer;
	}

	[[nodiscard]] constexpr bool is_null() const
	{
		return m_integer == DefaultValue;
	}

	bool operator==(integer_id const&) const = default;
};

} // namespace pollio::detail
