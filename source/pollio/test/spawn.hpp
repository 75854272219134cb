#pragma once

#include <vsm/utility.hpp>

#include <future>
#include <type_traits>

namespace pollio::test {

/// @brief Joins the asynchronous operation on destruction.
template<typename T>
class future
{
	std::future<T> m_future;

public:
	explicit future(std::future<T> future)
		: m_future(vsm_move(future))
	{
	}

	future(future&&) = default;
	future& operator=(future&&) = default;

	~future()
	{
		if (m_future.valid())
		{
			m_future.wait();
		}
	}

	[[nodiscard]] T get()
	{
		return m_future.get();
	}
};

template<typename Callable>
future<std::decay_t<std::invoke_result_t<Callable>>> spawn(Callable&& callable)
{
	return future<std::decay_t<std::invoke_result_t<Callable>>>(
		std::async(std::launch::async, vsm_forward(callable)));
}

} // namespace pollio::test
