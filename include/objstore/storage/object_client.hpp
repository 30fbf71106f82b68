#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace objstore {

// Error classes a store reports. Everything the client can't classify
// more precisely is Other.
enum class StoreErrorCode {
    None,
    NoSuchKey,
    NoSuchBucket,
    BucketAlreadyOwned,
    BucketNotEmpty,
    NoSuchBucketPolicy,
    AccessDenied,
    Transport,
    Other
};

const char* store_error_code_name(StoreErrorCode code);

// Common outcome fields. Client calls never throw; callers inspect these.
struct StoreStatus {
    bool success = false;
    StoreErrorCode error_code = StoreErrorCode::None;
    int http_status = 0;
    std::string error_message;

    bool is(StoreErrorCode code) const { return !success && error_code == code; }
};

// Metadata about a stored object
struct ObjectMetadata {
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    std::string content_type;
    std::string etag;
    // x-amz-meta-* values (prefix stripped) plus standard caching headers
    // (Cache-Control, Content-Disposition, ...) under their canonical names
    std::map<std::string, std::string> user_metadata;
};

struct ExistsResult : StoreStatus {
    bool exists = false;
};

struct PutResult : StoreStatus {
    std::string etag;
};

struct GetResult : StoreStatus {
    std::vector<uint8_t> data;
    ObjectMetadata metadata;
};

struct StatResult : StoreStatus {
    ObjectMetadata metadata;
};

// Entry in a listing operation
struct ListEntry {
    std::string key;
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    std::string etag;
    bool is_directory = false;  // common prefix, key ends with '/'
};

struct ListResult : StoreStatus {
    std::vector<ListEntry> entries;
};

struct BucketInfo {
    std::string name;
    std::chrono::system_clock::time_point created;
};

struct BucketListResult : StoreStatus {
    std::vector<BucketInfo> buckets;
};

struct PolicyResult : StoreStatus {
    std::string policy;
};

struct PresignResult : StoreStatus {
    std::string url;
};

// Options for put operations
struct PutOptions {
    std::string content_type = "application/octet-stream";
    // Standard headers (Cache-Control, Content-Disposition, Content-Encoding,
    // Content-Language, Expires) are sent as-is, anything else as x-amz-meta-*
    std::map<std::string, std::string> metadata;
};

// Options for list operations
struct ListOptions {
    std::string prefix;
    bool recursive = false;   // no delimiter, every key under prefix
    uint32_t max_keys = 1000; // page size, all pages are fetched
};

struct PresignOptions {
    std::chrono::seconds expires{7 * 24 * 3600};
    // Response header overrides, e.g. {"Content-Disposition", "attachment"}.
    // Names are mapped to response-* query parameters.
    std::map<std::string, std::string> response_headers;
    // When set, the URL is signed for this address instead of the endpoint.
    // Must already include the bucket component.
    std::string public_base_url;
};

// Remote object-store capability. Implementations must be safe to call
// from multiple threads.
class ObjectStoreClient {
public:
    virtual ~ObjectStoreClient() = default;

    virtual std::string type_name() const = 0;

    // Buckets
    virtual ExistsResult bucket_exists(const std::string& bucket) const = 0;
    virtual StoreStatus make_bucket(const std::string& bucket) = 0;
    virtual StoreStatus remove_bucket(const std::string& bucket) = 0;
    virtual BucketListResult list_buckets() const = 0;
    virtual StoreStatus set_bucket_policy(const std::string& bucket,
                                          const std::string& policy_json) = 0;
    virtual PolicyResult get_bucket_policy(const std::string& bucket) const = 0;

    // Objects
    virtual PutResult put_object(const std::string& bucket, const std::string& key,
                                 std::span<const uint8_t> data,
                                 const PutOptions& options) = 0;
    virtual GetResult get_object(const std::string& bucket, const std::string& key) const = 0;
    virtual StatResult stat_object(const std::string& bucket, const std::string& key) const = 0;
    virtual StoreStatus remove_object(const std::string& bucket, const std::string& key) = 0;
    virtual StoreStatus copy_object(const std::string& src_bucket, const std::string& src_key,
                                    const std::string& dst_bucket, const std::string& dst_key) = 0;
    virtual ListResult list_objects(const std::string& bucket,
                                    const ListOptions& options) const = 0;

    // Time-limited GET URL for an object
    virtual PresignResult presigned_get_object(const std::string& bucket,
                                               const std::string& key,
                                               const PresignOptions& options) const = 0;
};

} // namespace objstore
