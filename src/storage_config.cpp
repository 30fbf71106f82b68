#include "objstore/storage_config.hpp"
#include "objstore/log.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace objstore {

// --- ClientConfig ---

namespace {

const char* first_env(const char* primary, const char* fallback) {
    if (const char* v = std::getenv(primary); v && *v) return v;
    if (const char* v = std::getenv(fallback); v && *v) return v;
    return nullptr;
}

bool is_http_url(const std::string& url) {
    return url.starts_with("http://") || url.starts_with("https://");
}

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<std::string>();
}

// `true` means GET_ONLY and `false` NONE, otherwise one of the upper-case names
PolicyKind parse_policy_value(const nlohmann::json& value) {
    if (value.is_boolean()) {
        return value.get<bool>() ? PolicyKind::GetOnly : PolicyKind::None;
    }
    auto name = value.get<std::string>();
    auto kind = parse_policy_kind(name);
    if (!kind) {
        throw std::invalid_argument("unknown auto_create_policy: " + name);
    }
    return *kind;
}

StorageConfig parse_storage(const nlohmann::json& js, const ClientConfig& client) {
    StorageConfig sc;
    sc.endpoint = client.endpoint;
    sc.use_https = client.use_https;

    if (js.contains("bucket_name")) sc.bucket_name = js["bucket_name"].get<std::string>();
    if (js.contains("endpoint")) sc.endpoint = js["endpoint"].get<std::string>();
    if (js.contains("use_https")) sc.use_https = js["use_https"].get<bool>();
    sc.base_url = optional_string(js, "base_url");
    if (js.contains("use_presigned_urls")) sc.use_presigned_urls = js["use_presigned_urls"].get<bool>();
    if (js.contains("presign_max_age"))
        sc.presign_max_age = std::chrono::seconds(js["presign_max_age"].get<int64_t>());
    if (js.contains("auto_create_bucket")) sc.auto_create_bucket = js["auto_create_bucket"].get<bool>();
    if (js.contains("assume_bucket_exists")) sc.assume_bucket_exists = js["assume_bucket_exists"].get<bool>();
    if (js.contains("auto_create_policy")) sc.auto_create_policy = parse_policy_value(js["auto_create_policy"]);
    if (js.contains("object_metadata") && js["object_metadata"].is_object()) {
        for (auto& [key, val] : js["object_metadata"].items()) {
            sc.object_metadata[key] = val.get<std::string>();
        }
    }
    sc.backup_bucket_name = optional_string(js, "backup_bucket_name");
    sc.backup_format = optional_string(js, "backup_format");
    if (js.contains("file_overwrite")) sc.file_overwrite = js["file_overwrite"].get<bool>();
    return sc;
}

} // namespace

void ClientConfig::load_env_credentials() {
    if (access_key.empty()) {
        if (const char* v = first_env("OBJSTORE_ACCESS_KEY", "AWS_ACCESS_KEY_ID")) {
            access_key = std::string(v);
        }
    }
    if (secret_key.empty()) {
        if (const char* v = first_env("OBJSTORE_SECRET_KEY", "AWS_SECRET_ACCESS_KEY")) {
            secret_key = std::string(v);
        }
    }
    if (session_token.empty()) {
        if (const char* v = first_env("OBJSTORE_SESSION_TOKEN", "AWS_SESSION_TOKEN")) {
            session_token = v;
        }
    }
}

std::string ClientConfig::validate() const {
    if (endpoint.empty()) return "endpoint is required";
    if (endpoint.find("://") != std::string::npos) return "endpoint must not include a scheme: " + endpoint;
    if (endpoint.back() == '/') return "endpoint must be host[:port]: " + endpoint;
    if (access_key.empty()) return "access_key is required (or OBJSTORE_ACCESS_KEY env)";
    if (secret_key.empty()) return "secret_key is required (or OBJSTORE_SECRET_KEY env)";
    if (region.empty()) return "region must not be empty";
    if (connect_timeout_secs == 0) return "connect_timeout_secs must be > 0";
    if (request_timeout_secs == 0) return "request_timeout_secs must be > 0";
    return {};
}

// --- StorageConfig ---

std::string StorageConfig::validate() const {
    if (bucket_name.empty()) return "bucket_name is required";
    if (backup_bucket_name.has_value() != backup_format.has_value()) {
        return "backup_bucket_name and backup_format must be set together";
    }
    if (backup_bucket_name && backup_bucket_name->empty()) return "backup_bucket_name must not be empty";
    if (backup_format && backup_format->empty()) return "backup_format must not be empty";
    if (base_url) {
        if (!is_http_url(*base_url)) return "base_url must start with http:// or https://: " + *base_url;
    } else if (endpoint.empty()) {
        return "endpoint is required when base_url is not set";
    }
    if (presign_max_age.count() < 1 || presign_max_age > std::chrono::hours(24 * 7)) {
        return "presign_max_age must be between 1 second and 7 days";
    }
    return {};
}

// --- ServiceConfig ---

bool ServiceConfig::load_json(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        log_error("cannot open config file: %s", path.c_str());
        return false;
    }
    std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return parse_json(text);
}

bool ServiceConfig::parse_json(const std::string& text) {
    try {
        auto j = nlohmann::json::parse(text);

        if (j.contains("endpoint")) client.endpoint = j["endpoint"].get<std::string>();
        if (j.contains("access_key")) client.access_key = j["access_key"].get<std::string>();
        if (j.contains("secret_key")) client.secret_key = j["secret_key"].get<std::string>();
        if (j.contains("session_token")) client.session_token = j["session_token"].get<std::string>();
        if (j.contains("use_https")) client.use_https = j["use_https"].get<bool>();
        if (j.contains("region")) client.region = j["region"].get<std::string>();
        if (j.contains("verify_ssl")) client.verify_ssl = j["verify_ssl"].get<bool>();
        if (j.contains("connect_timeout")) client.connect_timeout_secs = j["connect_timeout"].get<uint32_t>();
        if (j.contains("request_timeout")) client.request_timeout_secs = j["request_timeout"].get<uint32_t>();

        // Storages inherit endpoint and scheme, so parse them after the client
        if (j.contains("storages") && j["storages"].is_object()) {
            for (auto& [name, js] : j["storages"].items()) {
                storages[name] = parse_storage(js, client);
            }
        }
        return true;
    } catch (const std::exception& e) {
        log_error("parsing config: %s", e.what());
        return false;
    }
}

const StorageConfig* ServiceConfig::storage(const std::string& name) const {
    auto it = storages.find(name);
    return it != storages.end() ? &it->second : nullptr;
}

std::string ServiceConfig::validate() const {
    auto err = client.validate();
    if (!err.empty()) return err;
    for (const auto& [name, sc] : storages) {
        err = sc.validate();
        if (!err.empty()) return "storage '" + name + "': " + err;
    }
    return {};
}

} // namespace objstore
