#pragma once

#include <pollio/detail/api.hpp>

#include <vsm/result.hpp>

#include <string>
#include <system_error>

#include <cstdint>

namespace pollio {
namespace detail {

inline constexpr char error_category_name[] = "pollio";

struct error_category final : std::error_category
{
	char const* name() const noexcept override;
	std::string message(int const code) const override;
	std::error_condition default_error_condition(int code) const noexcept override;
};

pollio_detail_api
extern const error_category error_category_instance;

} // namespace detail

inline std::error_category const& error_category()
{
	return detail::error_category_instance;
}


enum class error
{
	none,

	unknown_failure,
	invalid_argument,
	not_enough_memory,

	/// @brief The pollable is unknown to the registry or has already been dropped.
	invalid_handle,

	/// @brief The registry has no identifiers left to assign.
	resource_exhausted,

	/// @brief The platform wait mechanism or a readiness check failed.
	///        The original system error is passed to the installed @ref error_handler.
	wait_failed,
};

inline std::error_code make_error_code(error const error)
{
	return std::error_code(static_cast<int>(error), detail::error_category_instance);
}


enum class error_source : uintptr_t
{
	unknown,
	readiness_check,
	wait_set_contribute,
	wait_set_wait,
};

struct error_information
{
	std::error_code error;
	error_source source;
};

class error_handler
{
public:
	virtual void handle_error(error_information const& information) = 0;

protected:
	error_handler() = default;
	error_handler(error_handler const&) = default;
	error_handler& operator=(error_handler const&) = default;
	~error_handler() = default;
};


/// @brief Installs a process wide error handler.
/// @param handler Pointer to the new handler, or null to restore the default handler.
///        The default handler ignores all reports.
pollio_detail_api
void set_error_handler(error_handler* const handler) noexcept;

pollio_detail_api
error_handler& get_error_handler() noexcept;

inline void report_error(std::error_code const error, error_source const source) noexcept
{
	get_error_handler().handle_error(error_information
	{
		.error = error,
		.source = source,
	});
}

} // namespace pollio

template<>
struct std::is_error_code_enum<pollio::error>
{
	static constexpr bool value = true;
};
