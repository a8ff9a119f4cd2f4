#include <clinpatch/service/patch_service.hpp>

#include <clinpatch/core/logging.hpp>
#include <clinpatch/patch/builder.hpp>

namespace clinpatch {

string
parse_entity_tag(string const& tag)
{
    string version = tag;
    if (version.compare(0, 2, "W/") == 0)
        version = version.substr(2);
    if (version.length() >= 2 && version.front() == '"'
        && version.back() == '"')
    {
        version = version.substr(1, version.length() - 2);
    }
    return version;
}

patch_service::patch_service(
    document_store_interface& store, schema_provider_interface const& schema)
    : store_(store), schema_(schema)
{
}

element
patch_service::patch(
    resource_key const& key,
    std::vector<raw_operation> const& operations,
    optional<string> const& if_match)
{
    CLINPATCH_LOG_CALL(<< CLINPATCH_LOG_ARG(key))

    if (key.version)
    {
        CLINPATCH_THROW(
            version_specific_patch() << resource_type_info(key.type)
                                     << resource_id_info(key.id));
    }

    auto document = store_.load_document(key);
    auto version = get_document_version(schema_, document);

    if (if_match)
    {
        auto expected = parse_entity_tag(*if_match);
        if (!version || expected != *version)
        {
            CLINPATCH_THROW(
                precondition_failed()
                << resource_type_info(key.type) << resource_id_info(key.id)
                << expected_version_info(expected)
                << current_version_info(version ? *version : "none"));
        }
    }

    normalize_and_apply(document, schema_, operations);

    return store_.save_document(std::move(document), version);
}

} // namespace clinpatch
