#pragma once

#include "objstore/core/secure_string.hpp"
#include "objstore/policy.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace objstore {

// Connection settings for the object store
struct ClientConfig {
    std::string endpoint;          // host[:port], no scheme
    SecureString access_key;
    SecureString secret_key;
    std::string session_token;     // STS credentials only
    bool use_https = true;
    std::string region = "us-east-1";
    bool verify_ssl = true;
    uint32_t connect_timeout_secs = 10;
    uint32_t request_timeout_secs = 60;

    // Fill empty credentials from OBJSTORE_ACCESS_KEY / OBJSTORE_SECRET_KEY,
    // then AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY
    void load_env_credentials();

    // Returns empty string if valid, error message otherwise
    std::string validate() const;
};

// One configured storage. Media and static files are two instances of this,
// not two different engines.
struct StorageConfig {
    std::string bucket_name;

    // Used for direct URLs when base_url is unset. Copied from the client
    // settings when loaded through ServiceConfig.
    std::string endpoint;
    bool use_https = true;

    // Externally reachable scheme://host[/path] for generated URLs
    std::optional<std::string> base_url;
    bool use_presigned_urls = false;
    std::chrono::seconds presign_max_age{7 * 24 * 3600};

    bool auto_create_bucket = false;
    bool assume_bucket_exists = false;
    PolicyKind auto_create_policy = PolicyKind::None;

    // Applied to every write, per-call overrides win
    std::map<std::string, std::string> object_metadata;

    // Soft delete, both or neither
    std::optional<std::string> backup_bucket_name;
    std::optional<std::string> backup_format;

    // false: saving onto an existing key stores under an alternative key
    bool file_overwrite = false;

    // Returns empty string if valid, error message otherwise
    std::string validate() const;
};

// Client settings plus named storages, e.g. "media" and "static"
struct ServiceConfig {
    ClientConfig client;
    std::map<std::string, StorageConfig> storages;

    bool load_json(const std::filesystem::path& path);
    bool parse_json(const std::string& text);

    const StorageConfig* storage(const std::string& name) const;

    std::string validate() const;
};

} // namespace objstore
