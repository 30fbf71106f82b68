#pragma once

#include "objstore/storage/object_client.hpp"
#include "objstore/storage_config.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace objstore {

// Per-call overrides for presigned URLs, ignored in direct mode
struct UrlOptions {
    std::optional<std::chrono::seconds> max_age;
    std::map<std::string, std::string> response_headers;
};

class UrlBuilder {
public:
    UrlBuilder(const StorageConfig& config, const ObjectStoreClient& client);

    // base_url, or scheme://endpoint/bucket. No trailing '/'.
    static std::string public_base(const StorageConfig& config);

    // Pure: public_base + "/" + encoded key, no client calls
    static std::string direct_url(const StorageConfig& config, const std::string& key);

    // Direct or presigned depending on use_presigned_urls. In presigned mode
    // the signature covers public_base(), so it validates at that host.
    // Throws TransportError if the client cannot presign.
    std::string build(const std::string& key, const UrlOptions& options = {}) const;

private:
    const StorageConfig& config_;
    const ObjectStoreClient& client_;
};

} // namespace objstore
