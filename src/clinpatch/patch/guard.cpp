#include <clinpatch/patch/guard.hpp>

#include <clinpatch/core/logging.hpp>
#include <clinpatch/patch/errors.hpp>
#include <clinpatch/patch/path.hpp>

namespace clinpatch {

std::vector<string> const&
get_protected_paths()
{
    static std::vector<string> const paths
        = {"Resource.id",
           "Resource.meta.lastUpdated",
           "Resource.meta.versionId",
           "Resource.text.div",
           "Resource.text.status"};
    return paths;
}

protected_snapshot
take_protected_snapshot(
    element const& document, schema_provider_interface const& schema)
{
    protected_snapshot snapshot;
    for (auto const& path : get_protected_paths())
    {
        auto value = evaluate_scalar_path(document, schema, path);
        snapshot.emplace_back(
            path, value ? some(to_value_string(*value)) : none);
    }
    return snapshot;
}

static string
describe_snapshot_value(optional<string> const& value)
{
    return value ? *value : "absent";
}

void
check_protected_fields_unchanged(
    element const& document,
    schema_provider_interface const& schema,
    protected_snapshot const& original)
{
    auto patched = take_protected_snapshot(document, schema);
    for (size_t i = 0; i != original.size() && i != patched.size(); ++i)
    {
        auto const& before = original[i];
        auto const& after = patched[i];
        if (before.second != after.second)
        {
            get_logger()->warn(
                "patch rejected: protected field {} changed", before.first);
            CLINPATCH_THROW(
                protected_field_violation()
                << protected_path_info(before.first)
                << original_value_info(describe_snapshot_value(before.second))
                << patched_value_info(describe_snapshot_value(after.second)));
        }
    }
}

} // namespace clinpatch
