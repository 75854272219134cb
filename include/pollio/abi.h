#pragma once

#include <pollio/detail/api.hpp>

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

enum
{
	pollio_abi_version = 1,
};

enum pollio_abi_result
{
	/// @brief The operation completed successfully.
	pollio_abi_result_success = 0,

	/// @brief A pollable was unknown or had already been dropped.
	pollio_abi_result_invalid_handle,

	/// @brief No pollable identifiers are available.
	pollio_abi_result_resource_exhausted,

	/// @brief The platform wait mechanism reported an error.
	pollio_abi_result_wait_failed,

	/// @brief An argument was rejected by the source factory.
	pollio_abi_result_invalid_argument,

	/// @brief The operation failed for another reason.
	pollio_abi_result_unknown_failure,
};
typedef enum pollio_abi_result pollio_abi_result;

/// @brief Identifier of a pollable within a registry.
typedef uint32_t pollio_abi_pollable;

/// @brief Opaque registry of pollables.
typedef struct pollio_abi_registry pollio_abi_registry;

/// @brief Relative timeout value which never expires.
#define pollio_abi_timeout_never UINT64_MAX

enum pollio_abi_direction
{
	pollio_abi_direction_read,
	pollio_abi_direction_write,
};
typedef enum pollio_abi_direction pollio_abi_direction;

pollio_detail_api
pollio_abi_result pollio_abi_registry_create(pollio_abi_registry** registry);

/// @brief Destroys the registry and every pollable it still holds.
pollio_detail_api
void pollio_abi_registry_destroy(pollio_abi_registry* registry);

/// @brief Registers a timer which expires @p nanoseconds after this call.
///        @ref pollio_abi_timeout_never registers a timer which never expires.
pollio_detail_api
pollio_abi_result pollio_abi_subscribe_timer(
	pollio_abi_registry* registry,
	uint64_t nanoseconds,
	pollio_abi_pollable* pollable);

/// @brief Registers a source which is ready while @p fd is ready for @p direction.
///        The descriptor is duplicated and may be closed by the caller afterwards.
pollio_detail_api
pollio_abi_result pollio_abi_subscribe_fd(
	pollio_abi_registry* registry,
	int fd,
	pollio_abi_direction direction,
	pollio_abi_pollable* pollable);

pollio_detail_api
pollio_abi_result pollio_abi_drop_pollable(
	pollio_abi_registry* registry,
	pollio_abi_pollable pollable);

/// @brief Blocks until at least one of the pollables is ready.
/// @param readiness Receives one byte per pollable: 1 if ready, 0 otherwise.
///        On failure the contents are unspecified.
pollio_detail_api
pollio_abi_result pollio_abi_poll_oneoff(
	pollio_abi_registry const* registry,
	pollio_abi_pollable const* pollables,
	size_t count,
	uint8_t* readiness);

#ifdef __cplusplus
} // extern "C"
#endif
