#include <pollio/error.hpp>

#include <atomic>

#include <cinttypes>
#include <cstdio>

using namespace pollio;

char const* detail::error_category::name() const noexcept
{
	return error_category_name;
}

std::string detail::error_category::message(int const code) const
{
	switch (static_cast<error>(code))
	{
	case error::none:
		return "No error.";

	case error::unknown_failure:
		return "Unknown failure.";

	case error::invalid_argument:
		return "Invalid argument.";

	case error::not_enough_memory:
		return "Not enough memory.";

	case error::invalid_handle:
		return "The pollable is unknown or has already been dropped.";

	case error::resource_exhausted:
		return "No pollable identifiers are available.";

	case error::wait_failed:
		return "Waiting for pollable readiness failed.";
	}

	char string[64];
	int const string_size = snprintf(string, sizeof(string),
		"Unrecognized error code: %08" PRIX32, static_cast<uint32_t>(code));

	return std::string(string, string_size);
}

std::error_condition detail::error_category::default_error_condition(int const code) const noexcept
{
	switch (static_cast<error>(code))
	{
	case error::invalid_argument:
		return std::error_condition(std::errc::invalid_argument);

	case error::not_enough_memory:
		return std::error_condition(std::errc::not_enough_memory);

	case error::invalid_handle:
		return std::error_condition(std::errc::bad_file_descriptor);

	case error::resource_exhausted:
		return std::error_condition(std::errc::too_many_files_open);

	case error::wait_failed:
		return std::error_condition(std::errc::io_error);

	default:
		break;
	}

	return std::error_condition(code, *this);
}

detail::error_category const detail::error_category_instance;


namespace {

class default_error_handler final : public error_handler
{
public:
	void handle_error(error_information const&) override
	{
	}
};

} // namespace

static default_error_handler g_default_error_handler;
static std::atomic<error_handler*> g_error_handler = nullptr;

void pollio::set_error_handler(error_handler* const handler) noexcept
{
	g_error_handler.store(handler, std::memory_order_release);
}

error_handler& pollio::get_error_handler() noexcept
{
	error_handler* const handler = g_error_handler.load(std::memory_order_acquire);
	return handler != nullptr ? *handler : g_default_error_handler;
}
