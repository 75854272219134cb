#pragma once

#include <pollio/error.hpp>

#include <vsm/lazy.hpp>
#include <vsm/result.hpp>
#include <vsm/utility.hpp>

#include <memory>
#include <new>
#include <type_traits>

namespace pollio {

template<typename T>
	requires (!std::is_array_v<T>)
vsm::result<std::unique_ptr<T>> make_unique(auto&&... args)
{
	T* const ptr = new (std::nothrow) T(vsm_forward(args)...);

	if (ptr == nullptr)
	{
		return vsm::unexpected(error::not_enough_memory);
	}

	return vsm_lazy(std::unique_ptr<T>(ptr));
}

} // namespace pollio
