#include <iostream>

#include <boost/program_options.hpp>

#include <clinpatch/config.hpp>
#include <clinpatch/core/logging.hpp>
#include <clinpatch/encodings/json.hpp>
#include <clinpatch/fs/file_io.hpp>
#include <clinpatch/model/codec.hpp>
#include <clinpatch/patch/builder.hpp>
#include <clinpatch/patch/normalizer.hpp>
#include <clinpatch/schema/registry.hpp>

using namespace clinpatch;

void static
show_version_info()
{
    std::cout << "clinpatch " << CLINPATCH_VERSION << "\n";
}

static int
run_patch(
    tool_config const& config,
    string const& document_path,
    string const& patch_path,
    optional<string> const& output_path)
{
    auto logger = get_logger();

    auto schema = load_schema_from_yaml(read_file_contents(*config.schema_file));
    logger->debug("loaded schema with {} types", schema.type_count());

    auto document = read_document(
        schema, parse_json_value(read_file_contents(document_path)));
    auto operations = parse_patch_parameters(
        parse_json_value(read_file_contents(patch_path)));

    normalize_and_apply(document, schema, operations);

    auto json = value_to_json(write_document(schema, document));
    if (output_path)
        dump_string_to_file(*output_path, json);
    else
        std::cout << json << "\n";
    return 0;
}

int
main(int argc, char const* const* argv)
{
    namespace po = boost::program_options;

    po::options_description desc("Supported options");
    desc.add_options()
        ("help", "show help message")
        ("version", "show version information")
        ("config-file", po::value<string>(), "specify the configuration file to use")
        ("schema", po::value<string>(), "the YAML schema of the document")
        ("document", po::value<string>(), "the JSON document to patch")
        ("patch", po::value<string>(), "the JSON Parameters resource holding the patch")
        ("output", po::value<string>(), "where to write the patched document (default: stdout)")
        ("log-level", po::value<string>(), "the log level (trace, debug, info, warn, err)")
    ;

    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);
    }
    catch (po::error& e)
    {
        std::cerr << e.what() << "\n" << desc;
        return 2;
    }

    if (vm.count("help"))
    {
        show_version_info();
        std::cout << desc;
        return 0;
    }

    if (vm.count("version"))
    {
        show_version_info();
        return 0;
    }

    try
    {
        tool_config config;
        if (vm.count("config-file"))
        {
            from_dynamic(
                &config,
                parse_json_value(
                    read_file_contents(vm["config-file"].as<string>())));
        }
        if (vm.count("schema"))
            config.schema_file = vm["schema"].as<string>();
        if (vm.count("log-level"))
            config.log_level = vm["log-level"].as<string>();

        initialize_logging(get_logging_config(config));

        if (!config.schema_file || !vm.count("document") || !vm.count("patch"))
        {
            std::cerr << "--schema, --document and --patch are required\n"
                      << desc;
            return 2;
        }

        optional<string> output_path;
        if (vm.count("output"))
            output_path = vm["output"].as<string>();

        return run_patch(
            config,
            vm["document"].as<string>(),
            vm["patch"].as<string>(),
            output_path);
    }
    catch (boost::exception& e)
    {
        get_logger()->error("{}", boost::diagnostic_information(e));
        return 1;
    }
    catch (std::exception& e)
    {
        get_logger()->error("{}", e.what());
        return 1;
    }
}
