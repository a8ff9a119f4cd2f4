#ifndef CLINPATCH_SERVICE_PATCH_SERVICE_HPP
#define CLINPATCH_SERVICE_PATCH_SERVICE_HPP

#include <vector>

#include <clinpatch/patch/types.hpp>
#include <clinpatch/service/store.hpp>

namespace clinpatch {

// Patches can only be applied to the current version of a resource.
CLINPATCH_DEFINE_EXCEPTION(version_specific_patch)

// The caller's If-Match version doesn't match the stored one.
CLINPATCH_DEFINE_EXCEPTION(precondition_failed)

// Extract the version from an entity tag, which may be weak (W/"3"), quoted
// ("3") or bare (3).
string
parse_entity_tag(string const& tag);

// patch_service applies patches to documents in a store.
struct patch_service
{
    patch_service(
        document_store_interface& store,
        schema_provider_interface const& schema);

    // Load the document named by :key, apply :operations to it and save the
    // result. If :if_match is given, it must name the stored version.
    //
    // The result is the saved document. If anything fails, nothing is saved.
    element
    patch(
        resource_key const& key,
        std::vector<raw_operation> const& operations,
        optional<string> const& if_match = none);

 private:
    document_store_interface& store_;
    schema_provider_interface const& schema_;
};

} // namespace clinpatch

#endif
