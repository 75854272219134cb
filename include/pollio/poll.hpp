#pragma once

#include <pollio/detail/api.hpp>
#include <pollio/registry.hpp>

#include <vsm/result.hpp>

#include <span>
#include <vector>

#include <cstdint>

namespace pollio {

/// @brief Disposes @p pollable, releasing the resources of its source.
/// @return @ref error::invalid_handle if @p pollable is unknown or was already dropped.
/// @pre @p pollable is not part of a @ref poll_oneoff call in progress.
pollio_detail_api
vsm::result<void> drop_pollable(registry& registry, pollable pollable);

/// @brief Blocks until at least one of @p pollables is ready.
///
/// All pollables are resolved before any waiting takes place. If any of them is
/// unknown, the call fails with @ref error::invalid_handle and @p readiness is left
/// unspecified. If any source is already ready, the call does not block. Otherwise
/// the calling thread is suspended until a source becomes ready; a timer source is
/// the only way to bound the wait. An empty list returns immediately.
///
/// Duplicate pollables are allowed. Each distinct source is checked once per scan,
/// so duplicates always report identical readiness.
///
/// @param readiness Receives one flag per pollable, in the same order:
///        1 if the corresponding source is ready and 0 otherwise.
///        Must be the same size as @p pollables.
/// @return @ref error::wait_failed if any source failed while checking or waiting.
///         The original error is passed to the error handler.
pollio_detail_api
vsm::result<void> poll_oneoff(
	registry const& registry,
	std::span<pollable const> pollables,
	std::span<uint8_t> readiness);

/// @brief Blocks until at least one of @p pollables is ready.
/// @return One readiness flag for each pollable.
/// @see poll_oneoff(registry const&, std::span<pollable const>, std::span<uint8_t>)
[[nodiscard]] pollio_detail_api
vsm::result<std::vector<uint8_t>> poll_oneoff(
	registry const& registry,
	std::span<pollable const> pollables);

} // namespace pollio
