#include "objstore/url_builder.hpp"
#include "objstore/errors.hpp"
#include "objstore/net/http.hpp"
#include "objstore/paths.hpp"

namespace objstore {

UrlBuilder::UrlBuilder(const StorageConfig& config, const ObjectStoreClient& client)
    : config_(config)
    , client_(client) {}

std::string UrlBuilder::public_base(const StorageConfig& config) {
    if (config.base_url) {
        return paths::strip_trailing_slashes(*config.base_url);
    }
    return std::string(config.use_https ? "https://" : "http://") + config.endpoint + "/" +
           net::url_encode(config.bucket_name);
}

std::string UrlBuilder::direct_url(const StorageConfig& config, const std::string& key) {
    return paths::join_url(public_base(config), key);
}

std::string UrlBuilder::build(const std::string& key, const UrlOptions& options) const {
    if (!config_.use_presigned_urls) {
        return direct_url(config_, key);
    }

    PresignOptions presign;
    presign.expires = options.max_age.value_or(config_.presign_max_age);
    presign.response_headers = options.response_headers;
    // Only an explicit base_url differs from the address the client would sign
    if (config_.base_url) {
        presign.public_base_url = public_base(config_);
    }

    auto result = client_.presigned_get_object(config_.bucket_name, key, presign);
    if (!result.success) {
        throw TransportError("presign " + config_.bucket_name + "/" + key + ": " +
                             result.error_message, result.error_code, result.error_message);
    }
    return result.url;
}

} // namespace objstore
