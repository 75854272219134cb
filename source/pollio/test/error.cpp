#include <pollio/error.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <string_view>

using namespace pollio;

TEST_CASE("Error category is named after the library", "[error]")
{
	REQUIRE(std::string_view(error_category().name()) == "pollio");
	REQUIRE(make_error_code(error::invalid_handle).category() == error_category());
}

TEST_CASE("Every error has a message", "[error]")
{
	auto const e = GENERATE(
		error::unknown_failure,
		error::invalid_argument,
		error::not_enough_memory,
		error::invalid_handle,
		error::resource_exhausted,
		error::wait_failed);

	REQUIRE(!make_error_code(e).message().empty());
}

TEST_CASE("Errors map to generic conditions", "[error]")
{
	REQUIRE(make_error_code(error::invalid_argument) == std::errc::invalid_argument);
	REQUIRE(make_error_code(error::not_enough_memory) == std::errc::not_enough_memory);
	REQUIRE(make_error_code(error::invalid_handle) == std::errc::bad_file_descriptor);
	REQUIRE(make_error_code(error::resource_exhausted) == std::errc::too_many_files_open);
	REQUIRE(make_error_code(error::wait_failed) == std::errc::io_error);
}

TEST_CASE("Errors convert implicitly to error codes", "[error]")
{
	std::error_code const e = error::wait_failed;
	REQUIRE(e == error::wait_failed);
	REQUIRE(e != error::invalid_handle);
}

TEST_CASE("Error handler can be replaced and restored", "[error]")
{
	struct handler_type final : error_handler
	{
		size_t count = 0;

		void handle_error(error_information const&) override
		{
			++count;
		}
	};

	error_handler* const initial = &get_error_handler();

	handler_type handler;
	set_error_handler(&handler);
	REQUIRE(&get_error_handler() == &handler);

	report_error(std::error_code(EIO, std::system_category()), error_source::wait_set_wait);
	REQUIRE(handler.count == 1);

	set_error_handler(nullptr);
	REQUIRE(&get_error_handler() == initial);

	report_error(std::error_code(EIO, std::system_category()), error_source::wait_set_wait);
	REQUIRE(handler.count == 1);
}
