#include <clinpatch/core/exception.hpp>

#include <clinpatch/core/testing.hpp>
#include <clinpatch/core/utilities.hpp>

using namespace clinpatch;

TEST_CASE("error info", "[core][exception]")
{
    parsing_error error;
    error << parsed_text_info("asdf");

    REQUIRE(get_required_error_info<parsed_text_info>(error) == "asdf");

    try
    {
        get_required_error_info<expected_format_info>(error);
        FAIL("no exception thrown");
    }
    catch (missing_error_info& e)
    {
        get_required_error_info<error_info_id_info>(e);
        get_required_error_info<wrapped_exception_diagnostics_info>(e);
    }
}

CLINPATCH_DEFINE_EXCEPTION(base_test_error)
CLINPATCH_DEFINE_DERIVED_EXCEPTION(derived_test_error, base_test_error)

TEST_CASE("exception families", "[core][exception]")
{
    try
    {
        CLINPATCH_THROW(derived_test_error() << parsed_text_info("x"));
    }
    catch (base_test_error& e)
    {
        REQUIRE(get_required_error_info<parsed_text_info>(e) == "x");
        // Every throw records where it came from.
        REQUIRE(get_error_info<stacktrace_info>(e) != nullptr);
        // The description includes the error info.
        REQUIRE(string(e.what()).find("x") != string::npos);
    }
}
