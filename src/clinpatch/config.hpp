#ifndef CLINPATCH_CONFIG_HPP
#define CLINPATCH_CONFIG_HPP

#include <clinpatch/core/dynamic.hpp>
#include <clinpatch/core/logging.hpp>

namespace clinpatch {

struct tool_config
{
    // the YAML file that describes the document schema
    optional<string> schema_file;
    // the spdlog level name for the log (defaults to 'info')
    optional<string> log_level;
    // a file to which log records are also written
    optional<string> log_file;
};

CLINPATCH_DEFINE_EXCEPTION(unexpected_field)

// Read a tool_config from its JSON form. All fields are optional; unknown
// fields are rejected.
void
from_dynamic(tool_config* config, dynamic const& v);

logging_config
get_logging_config(tool_config const& config);

} // namespace clinpatch

#endif
