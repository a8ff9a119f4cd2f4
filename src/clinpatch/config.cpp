#include <clinpatch/config.hpp>

namespace clinpatch {

static void
read_optional_string(
    optional<string>* field, dynamic_map const& map, string const& name)
{
    dynamic const* value;
    if (get_field(&value, map, name))
    {
        try
        {
            *field = cast<string>(*value);
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, dynamic(name));
            throw;
        }
    }
}

void
from_dynamic(tool_config* config, dynamic const& v)
{
    auto const& map = cast<dynamic_map>(v);
    for (auto const& field : map)
    {
        auto const& name = cast<string>(field.first);
        if (name != "schema_file" && name != "log_level" && name != "log_file")
        {
            unexpected_field e;
            e << field_name_info(name);
            add_dynamic_path_element(e, field.first);
            CLINPATCH_THROW(e);
        }
    }
    read_optional_string(&config->schema_file, map, "schema_file");
    read_optional_string(&config->log_level, map, "log_level");
    read_optional_string(&config->log_file, map, "log_file");
}

logging_config
get_logging_config(tool_config const& config)
{
    logging_config logging;
    logging.level = config.log_level;
    logging.file = config.log_file;
    return logging;
}

} // namespace clinpatch
