#ifndef CLINPATCH_CORE_EXCEPTION_HPP
#define CLINPATCH_CORE_EXCEPTION_HPP

#include <clinpatch/core/type_definitions.hpp>

#include <boost/exception/all.hpp>
#include <boost/stacktrace.hpp>

namespace clinpatch {

// The following macros are simple wrappers around Boost.Exception to codify
// how that library should be used within CLINPATCH.

#define CLINPATCH_DEFINE_EXCEPTION(id)                                        \
    struct id : virtual boost::exception, virtual std::exception              \
    {                                                                         \
        char const*                                                           \
        what() const noexcept                                                 \
        {                                                                     \
            return boost::diagnostic_information_what(*this);                 \
        }                                                                     \
    };

// Same as above, but the exception also derives from :base so that a family
// of related errors can be caught together.
#define CLINPATCH_DEFINE_DERIVED_EXCEPTION(id, base)                          \
    struct id : base                                                          \
    {                                                                         \
        char const*                                                           \
        what() const noexcept                                                 \
        {                                                                     \
            return boost::diagnostic_information_what(*this);                 \
        }                                                                     \
    };

#define CLINPATCH_DEFINE_ERROR_INFO(T, id)                                    \
    typedef boost::error_info<struct id##_info_tag, T> id##_info;

CLINPATCH_DEFINE_ERROR_INFO(boost::stacktrace::stacktrace, stacktrace)

#define CLINPATCH_THROW(x)                                                    \
    BOOST_THROW_EXCEPTION(                                                    \
        (x) << ::clinpatch::stacktrace_info(boost::stacktrace::stacktrace()))

using boost::get_error_info;

// get_required_error_info is just like get_error_info except that it requires
// the info to be present and returns a const reference to it. If the info is
// missing, it throws its own exception.
CLINPATCH_DEFINE_EXCEPTION(missing_error_info)
CLINPATCH_DEFINE_ERROR_INFO(string, error_info_id)
CLINPATCH_DEFINE_ERROR_INFO(string, wrapped_exception_diagnostics)
template<class ErrorInfo, class Exception>
typename ErrorInfo::error_info::value_type const&
get_required_error_info(Exception const& e)
{
    typename ErrorInfo::error_info::value_type const* info
        = get_error_info<ErrorInfo>(e);
    if (!info)
    {
        CLINPATCH_THROW(
            missing_error_info()
            << error_info_id_info(typeid(ErrorInfo).name())
            << wrapped_exception_diagnostics_info(
                   boost::diagnostic_information(e)));
    }
    return *info;
}

} // namespace clinpatch

#endif
