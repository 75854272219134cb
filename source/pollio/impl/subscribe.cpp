#include <pollio/subscribe.hpp>

#include <pollio/event.hpp>
#include <pollio/waitable.hpp>

#include <vsm/utility.hpp>

using namespace pollio;

vsm::result<pollable> pollio::subscribe_timer(registry& registry, deadline const deadline)
{
	return registry.add(waitable::timer(deadline));
}

vsm::result<pollable> pollio::subscribe_read(registry& registry, int const fd)
{
	vsm_try(source, waitable::io(fd, io_direction::read));
	return registry.add(vsm_move(source));
}

vsm::result<pollable> pollio::subscribe_write(registry& registry, int const fd)
{
	vsm_try(source, waitable::io(fd, io_direction::write));
	return registry.add(vsm_move(source));
}

vsm::result<pollable> pollio::subscribe_process(registry& registry, pid_t const pid)
{
	vsm_try(source, waitable::process(pid));
	return registry.add(vsm_move(source));
}

vsm::result<pollable> pollio::subscribe_event(registry& registry, event const& event)
{
	vsm_try(source, waitable::event(event));
	return registry.add(vsm_move(source));
}
