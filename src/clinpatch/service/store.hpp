#ifndef CLINPATCH_SERVICE_STORE_HPP
#define CLINPATCH_SERVICE_STORE_HPP

#include <map>
#include <mutex>
#include <utility>

#include <clinpatch/core/exception.hpp>
#include <clinpatch/model/element.hpp>
#include <clinpatch/schema/types.hpp>

namespace clinpatch {

// the identity of a stored resource
struct resource_key
{
    string type;
    string id;
    // a specific version of the resource, if one was requested
    optional<string> version;
};

std::ostream&
operator<<(std::ostream& s, resource_key const& key);

CLINPATCH_DEFINE_EXCEPTION(resource_not_found)
CLINPATCH_DEFINE_ERROR_INFO(string, resource_type)
CLINPATCH_DEFINE_ERROR_INFO(string, resource_id)

// thrown when a document is saved against a version that's no longer current
CLINPATCH_DEFINE_EXCEPTION(concurrency_conflict)
CLINPATCH_DEFINE_ERROR_INFO(string, expected_version)
CLINPATCH_DEFINE_ERROR_INFO(string, current_version)

// thrown when a document without an id is saved
CLINPATCH_DEFINE_EXCEPTION(missing_resource_id)

struct document_store_interface
{
    virtual ~document_store_interface() {}

    // Load the current version of a document.
    // Throws resource_not_found if there's no such document.
    virtual element
    load_document(resource_key const& key) = 0;

    // Save a document, assigning it a new version.
    // If :concurrency_token is given, it must match the version that's
    // currently stored, or concurrency_conflict is thrown.
    // The result is the document as stored.
    virtual element
    save_document(
        element document, optional<string> const& concurrency_token)
        = 0;
};

// memory_document_store keeps the current version of each document in memory.
//
// Versions are assigned as increasing integers ('1', '2', ...) and every save
// stamps meta.lastUpdated with the current UTC time.
struct memory_document_store : document_store_interface
{
    memory_document_store(schema_provider_interface const& schema);

    element
    load_document(resource_key const& key) override;

    element
    save_document(
        element document, optional<string> const& concurrency_token) override;

 private:
    schema_provider_interface const& schema_;
    std::mutex mutex_;
    std::map<std::pair<string, string>, element> documents_;
};

// Get the version id of a document (meta.versionId), if it has one.
optional<string>
get_document_version(
    schema_provider_interface const& schema, element const& document);

// Get the current UTC time in the format used for meta.lastUpdated.
string
get_current_instant();

} // namespace clinpatch

#endif
