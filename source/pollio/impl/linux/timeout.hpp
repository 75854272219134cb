#pragma once

#include <pollio/linux/timespec.hpp>

namespace pollio {

template<typename Timespec>
class kernel_timeout
{
	Timespec m_timespec;
	Timespec* m_p_timespec;

public:
	kernel_timeout()
		: m_p_timespec(nullptr)
	{
	}

	kernel_timeout(kernel_timeout const&) = delete;
	kernel_timeout& operator=(kernel_timeout const&) = delete;

	void set(deadline const deadline)
	{
		vsm_assert(deadline.is_relative());
		if (deadline == pollio::deadline::never())
		{
			m_p_timespec = nullptr;
		}
		else
		{
			if (deadline == pollio::deadline::instant())
			{
				m_timespec = {};
			}
			else
			{
				m_timespec = make_timespec<Timespec>(deadline);
			}
			m_p_timespec = &m_timespec;
		}
	}

	operator Timespec*()
	{
		return m_p_timespec;
	}
};

} // namespace pollio
