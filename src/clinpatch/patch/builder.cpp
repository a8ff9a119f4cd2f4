#include <clinpatch/patch/builder.hpp>

#include <iterator>

#include <clinpatch/core/logging.hpp>
#include <clinpatch/core/utilities.hpp>
#include <clinpatch/patch/errors.hpp>
#include <clinpatch/patch/executors.hpp>
#include <clinpatch/patch/guard.hpp>
#include <clinpatch/patch/normalizer.hpp>

namespace clinpatch {

patch_builder::patch_builder(
    element& document, schema_provider_interface const& schema)
    : document_(document), schema_(schema)
{
}

patch_builder&
patch_builder::add(pending_operation op)
{
    check_pending_operation(op);
    operations_.push_back(std::move(op));
    return *this;
}

patch_builder&
patch_builder::add(string path, string name, value_payload value)
{
    return add(
        make_add_operation(std::move(path), std::move(name), std::move(value)));
}

patch_builder&
patch_builder::insert(string path, value_payload value, integer index)
{
    return add(
        make_insert_operation(std::move(path), std::move(value), index));
}

patch_builder&
patch_builder::replace(string path, value_payload value)
{
    return add(make_replace_operation(std::move(path), std::move(value)));
}

patch_builder&
patch_builder::remove(string path)
{
    return add(make_delete_operation(std::move(path)));
}

patch_builder&
patch_builder::move(string path, integer source, integer destination)
{
    return add(make_move_operation(std::move(path), source, destination));
}

patch_builder&
patch_builder::build(std::vector<raw_operation> const& raw)
{
    auto normalized = normalize_operations(raw);
    operations_.insert(
        operations_.end(),
        std::make_move_iterator(normalized.begin()),
        std::make_move_iterator(normalized.end()));
    return *this;
}

element&
patch_builder::apply()
{
    auto logger = get_logger();
    auto snapshot = take_protected_snapshot(document_, schema_);

    for (size_t i = 0; i != operations_.size(); ++i)
    {
        auto const& op = operations_[i];
        if (logger->should_log(spdlog::level::debug))
        {
            logger->debug(
                "applying operation {}: {}", i, lexical_cast<string>(op));
        }
        try
        {
            apply_operation(document_, schema_, op);
        }
        catch (boost::exception& e)
        {
            e << operation_index_info(i) << operation_kind_info(op.kind)
              << patch_path_info(op.path);
            throw;
        }
    }

    check_protected_fields_unchanged(document_, schema_, snapshot);

    logger->info(
        "applied {} operation(s) to {}", operations_.size(), document_.type);
    return document_;
}

element&
normalize_and_apply(
    element& document,
    schema_provider_interface const& schema,
    std::vector<raw_operation> const& raw)
{
    return patch_builder(document, schema).build(raw).apply();
}

element&
apply_built(
    element& document,
    schema_provider_interface const& schema,
    std::vector<pending_operation> const& operations)
{
    patch_builder builder(document, schema);
    for (auto const& op : operations)
        builder.add(op);
    return builder.apply();
}

} // namespace clinpatch
