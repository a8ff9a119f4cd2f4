#include <clinpatch/service/store.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <clinpatch/core/logging.hpp>
#include <clinpatch/core/utilities.hpp>
#include <clinpatch/patch/path.hpp>

namespace clinpatch {

std::ostream&
operator<<(std::ostream& s, resource_key const& key)
{
    s << key.type << "/" << key.id;
    if (key.version)
        s << "/_history/" << *key.version;
    return s;
}

optional<string>
get_document_version(
    schema_provider_interface const& schema, element const& document)
{
    auto version = evaluate_scalar_path(document, schema, "meta.versionId");
    return version ? some(to_value_string(*version)) : none;
}

string
get_current_instant()
{
    return boost::posix_time::to_iso_extended_string(
               boost::posix_time::microsec_clock::universal_time())
           + "Z";
}

static string
get_document_id(
    schema_provider_interface const& schema, element const& document)
{
    auto id = evaluate_scalar_path(document, schema, "id");
    if (!id)
    {
        CLINPATCH_THROW(
            missing_resource_id() << resource_type_info(document.type));
    }
    return to_value_string(*id);
}

static string
get_next_version(optional<string> const& current)
{
    integer n = 0;
    if (current)
        boost::conversion::try_lexical_convert(*current, n);
    return lexical_cast<string>(n + 1);
}

// Set a primitive field of :parent, using the schema to find its name and
// declared type.
static void
set_primitive_field(
    schema_provider_interface const& schema,
    element& parent,
    string const& name,
    dynamic value)
{
    auto info = find_path_field(schema, parent.type, name);
    if (!info)
    {
        CLINPATCH_THROW(
            invalid_schema() << schema_type_name_info(parent.type)
                             << schema_problem_info("no field: " + name));
    }
    set_field_items(
        parent,
        info->name,
        {make_primitive_element(info->declared_type, std::move(value))});
}

// Stamp a document with new version metadata.
static void
stamp_document(
    schema_provider_interface const& schema,
    element& document,
    string const& version,
    string const& last_updated)
{
    auto info = find_path_field(schema, document.type, "meta");
    if (!info)
    {
        CLINPATCH_THROW(
            invalid_schema() << schema_type_name_info(document.type)
                             << schema_problem_info("no field: meta"));
    }
    auto& items = touch_field_items(document, info->name);
    if (items.empty())
        items.push_back(make_composite_element(info->declared_type));
    auto& meta = items.front();
    set_primitive_field(schema, meta, "versionId", dynamic(version));
    set_primitive_field(schema, meta, "lastUpdated", dynamic(last_updated));
}

memory_document_store::memory_document_store(
    schema_provider_interface const& schema)
    : schema_(schema)
{
}

element
memory_document_store::load_document(resource_key const& key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto document = documents_.find(std::make_pair(key.type, key.id));
    if (document == documents_.end())
    {
        CLINPATCH_THROW(
            resource_not_found() << resource_type_info(key.type)
                                 << resource_id_info(key.id));
    }
    return document->second;
}

element
memory_document_store::save_document(
    element document, optional<string> const& concurrency_token)
{
    auto id = get_document_id(schema_, document);

    std::lock_guard<std::mutex> lock(mutex_);
    auto key = std::make_pair(document.type, id);
    auto existing = documents_.find(key);
    optional<string> current;
    if (existing != documents_.end())
        current = get_document_version(schema_, existing->second);

    if (concurrency_token && concurrency_token != current)
    {
        CLINPATCH_THROW(
            concurrency_conflict()
            << resource_type_info(document.type) << resource_id_info(id)
            << expected_version_info(*concurrency_token)
            << current_version_info(current ? *current : "none"));
    }

    auto version = get_next_version(current);
    stamp_document(schema_, document, version, get_current_instant());
    documents_[key] = document;

    get_logger()->info("saved {}/{} as version {}", document.type, id, version);
    return document;
}

} // namespace clinpatch
