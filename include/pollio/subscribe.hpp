#pragma once

#include <pollio/deadline.hpp>
#include <pollio/detail/api.hpp>
#include <pollio/registry.hpp>

#include <vsm/result.hpp>

#include <sys/types.h>

namespace pollio {

class event;

/// @brief Registers a timer source which becomes ready once @p deadline passes.
[[nodiscard]] pollio_detail_api
vsm::result<pollable> subscribe_timer(registry& registry, deadline deadline);

/// @brief Registers a source which is ready while @p fd is readable.
[[nodiscard]] pollio_detail_api
vsm::result<pollable> subscribe_read(registry& registry, int fd);

/// @brief Registers a source which is ready while @p fd is writable.
[[nodiscard]] pollio_detail_api
vsm::result<pollable> subscribe_write(registry& registry, int fd);

/// @brief Registers a source which becomes ready when the process @p pid terminates.
[[nodiscard]] pollio_detail_api
vsm::result<pollable> subscribe_process(registry& registry, pid_t pid);

/// @brief Registers a source which is ready while @p event is signaled.
[[nodiscard]] pollio_detail_api
vsm::result<pollable> subscribe_event(registry& registry, event const& event);

} // namespace pollio
