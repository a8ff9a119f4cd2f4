#include <clinpatch/core/logging.hpp>

#include <mutex>
#include <vector>

#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace clinpatch {

static char const* const logger_name = "clinpatch";

static std::mutex logger_mutex;

void
initialize_logging(logging_config const& config)
{
    std::lock_guard<std::mutex> lock(logger_mutex);

    // Log records go to stderr so that they never mix with documents written
    // to stdout.
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>());
    if (config.file)
    {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            *config.file, 262144, 2));
    }
    auto combined_logger = std::make_shared<spdlog::logger>(
        logger_name, begin(sinks), end(sinks));
    combined_logger->set_level(
        config.level ? spdlog::level::from_str(*config.level)
                     : spdlog::level::info);

    spdlog::drop(logger_name);
    spdlog::register_logger(combined_logger);
}

std::shared_ptr<spdlog::logger>
get_logger()
{
    auto logger = spdlog::get(logger_name);
    if (logger)
        return logger;

    std::lock_guard<std::mutex> lock(logger_mutex);
    logger = spdlog::get(logger_name);
    if (!logger)
    {
        logger = std::make_shared<spdlog::logger>(
            logger_name,
            std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>());
        logger->set_level(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
    return logger;
}

} // namespace clinpatch
