#ifndef CLINPATCH_CORE_LOGGING_HPP
#define CLINPATCH_CORE_LOGGING_HPP

#include <memory>
#include <sstream>
#include <type_traits>

#include <spdlog/spdlog.h>

#include <clinpatch/core/dynamic.hpp>

namespace clinpatch {

struct logging_config
{
    // spdlog level name (trace, debug, info, warn, err, critical, off)
    optional<string> level;
    // if set, log records are also written to this (rotating) file
    optional<string> file;
};

// Create and register the "clinpatch" logger.
// Calling this again replaces the previously registered logger.
void
initialize_logging(logging_config const& config);

// Get the "clinpatch" logger. If initialize_logging() hasn't been called,
// a console logger at 'warn' level is registered on first use.
std::shared_ptr<spdlog::logger>
get_logger();

namespace detail {

template<class Value>
struct arg_logger
{
    arg_logger(char const* name, Value const& value) : name(name), value(value)
    {
    }

    char const* name;
    Value const& value;
};

template<class Value>
std::ostream&
operator<<(std::ostream& stream, arg_logger<Value> arg)
{
    stream << " " << arg.name << "=" << arg.value;
    return stream;
}

} // namespace detail

// Create a logger for a function call.
#define CLINPATCH_LOG_CALL(args)                                              \
    {                                                                         \
        auto logger = ::clinpatch::get_logger();                              \
        if (logger->should_log(spdlog::level::debug))                         \
        {                                                                     \
            std::ostringstream stream;                                        \
            stream << __func__ args;                                          \
            logger->debug(stream.str());                                      \
        }                                                                     \
    }

// Log an argument to a function call.
#define CLINPATCH_LOG_ARG(arg)                                                \
    ::clinpatch::detail::arg_logger<                                          \
        std::remove_reference<std::remove_const<decltype(arg)>::type>::type>( \
        #arg, arg)

} // namespace clinpatch

#endif
