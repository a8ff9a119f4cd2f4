#ifndef CLINPATCH_CORE_TESTING_HPP
#define CLINPATCH_CORE_TESTING_HPP

#define CATCH_CONFIG_CPP11_NO_NULLPTR
#include <catch.hpp>

#include <clinpatch/core/dynamic.hpp>

namespace Catch {

// Stringify boost::optional through Catch (rather than boost's optional_io,
// which requires the contained type to be streamable).
template<class T>
struct StringMaker<boost::optional<T>>
{
    static std::string
    convert(boost::optional<T> const& v)
    {
        return v ? Catch::Detail::stringify(*v) : std::string("none");
    }
};

} // namespace Catch

namespace clinpatch {

// Test that a value behaves as a regular value type: copies compare equal,
// and swapping with a default-initialized value exchanges the two.
template<class T>
void
test_regular_value(T const& x)
{
    {
        INFO("Copy construction should produce an equal value.")
        T y = x;
        REQUIRE(y == x);
    }

    {
        INFO("Assignment should produce an equal value.")
        T y;
        y = x;
        REQUIRE(y == x);
    }

    {
        INFO("swap should swap values.")

        T default_initialized = T();

        T y = x;
        T z = default_initialized;

        using std::swap;
        swap(y, z);
        REQUIRE(z == x);
        REQUIRE(y == default_initialized);

        INFO("A second swap should restore the original values.")
        swap(y, z);
        REQUIRE(y == x);
        REQUIRE(z == default_initialized);
    }
}

// Test a pair of regular values, where :x < :y.
template<class T>
void
test_regular_value_pair(T const& x, T const& y)
{
    test_regular_value(x);
    test_regular_value(y);

    auto test_pair = [&](T const& a, T const& b) {
        REQUIRE(a != b);
        REQUIRE(a < b);
        REQUIRE(!(b < a));
        REQUIRE(a == x);
        REQUIRE(b == y);
    };

    test_pair(x, y);

    {
        using std::swap;
        T a = x;
        T b = y;
        test_pair(a, b);
        b = x;
        a = y;
        test_pair(b, a);
        swap(a, b);
        test_pair(a, b);
    }
}

} // namespace clinpatch

#endif
