#pragma once

#include "objstore/errors.hpp"
#include "objstore/policy.hpp"
#include "objstore/storage/object_client.hpp"
#include "objstore/storage_config.hpp"

#include <string>
#include <vector>

namespace objstore {

// Operator-facing failure, message is meant to be shown as-is
class AdminError : public StorageError {
public:
    using StorageError::StorageError;
};

struct ListFilter {
    std::string prefix;        // raw, not normalized
    bool recursive = false;
    bool dirs = false;         // neither dirs nor files: both, plus a summary
    bool files = false;
    std::string format = "$name";
};

struct ListReport {
    std::vector<std::string> lines;
    size_t n_files = 0;
    size_t n_dirs = 0;
    bool summary = false;

    // "3 files and 1 directories"
    std::string summary_line() const;
};

/// Expand $name, $size, $modified, $url and $etag (or ${name}, ...) in
/// `format`. "$$" is a literal '$'. Throws AdminError on any other
/// placeholder.
std::string render_list_entry(const std::string& format, const ListEntry& entry,
                              const std::string& url);

// Bucket management for operators: check, create, delete, ls and policy.
class BucketAdmin {
public:
    /// `storage` (optional) supplies URL settings for $url, with the bucket
    /// name replaced by the one being listed.
    explicit BucketAdmin(ObjectStoreClient& client, const StorageConfig* storage = nullptr);

    void check(const std::string& bucket) const;
    void create(const std::string& bucket);
    void remove_empty(const std::string& bucket);

    std::vector<BucketInfo> list_buckets() const;
    ListReport list(const std::string& bucket, const ListFilter& filter) const;

    // Pretty-printed policy document
    std::string get_policy(const std::string& bucket) const;
    void set_policy(const std::string& bucket, PolicyKind kind);

private:
    [[noreturn]] void fail(const std::string& bucket, const StoreStatus& status) const;

    ObjectStoreClient& client_;
    const StorageConfig* storage_;
};

} // namespace objstore
