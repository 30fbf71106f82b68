#include "objstore/admin.hpp"
#include "objstore/url_builder.hpp"

#include <cctype>
#include <ctime>
#include <optional>

#include <nlohmann/json.hpp>

namespace objstore {

namespace {

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    time_t t = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_val;
    gmtime_r(&t, &tm_val);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_val);
    return buf;
}

bool is_ident(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

std::string ListReport::summary_line() const {
    return std::to_string(n_files) + " files and " + std::to_string(n_dirs) + " directories";
}

std::string render_list_entry(const std::string& format, const ListEntry& entry,
                              const std::string& url) {
    auto value = [&](const std::string& name) -> std::string {
        if (name == "name") return entry.key;
        if (name == "size") return std::to_string(entry.size);
        if (name == "modified") return entry.is_directory ? "" : format_timestamp(entry.last_modified);
        if (name == "url") return url;
        if (name == "etag") return entry.etag;
        throw AdminError("unknown placeholder $" + name + " in format '" + format + "'");
    };

    std::string out;
    size_t i = 0;
    while (i < format.size()) {
        char c = format[i];
        if (c != '$') {
            out += c;
            ++i;
            continue;
        }
        if (i + 1 < format.size() && format[i + 1] == '$') {
            out += '$';
            i += 2;
            continue;
        }
        if (i + 1 < format.size() && format[i + 1] == '{') {
            size_t close = format.find('}', i + 2);
            if (close == std::string::npos) {
                throw AdminError("unterminated ${ in format '" + format + "'");
            }
            out += value(format.substr(i + 2, close - i - 2));
            i = close + 1;
            continue;
        }
        size_t end = i + 1;
        while (end < format.size() && is_ident(format[end])) ++end;
        if (end == i + 1) {
            throw AdminError("invalid placeholder at position " + std::to_string(i) +
                             " in format '" + format + "'");
        }
        out += value(format.substr(i + 1, end - i - 1));
        i = end;
    }
    return out;
}

BucketAdmin::BucketAdmin(ObjectStoreClient& client, const StorageConfig* storage)
    : client_(client)
    , storage_(storage) {}

void BucketAdmin::fail(const std::string& bucket, const StoreStatus& status) const {
    switch (status.error_code) {
        case StoreErrorCode::NoSuchBucket:
            throw AdminError("bucket " + bucket + " does not exist", status.error_code,
                             status.error_message);
        case StoreErrorCode::BucketAlreadyOwned:
            throw AdminError("you have already created " + bucket, status.error_code,
                             status.error_message);
        case StoreErrorCode::BucketNotEmpty:
            throw AdminError("bucket " + bucket + " is not empty", status.error_code,
                             status.error_message);
        case StoreErrorCode::NoSuchBucketPolicy:
            throw AdminError("bucket " + bucket + " has no policy", status.error_code,
                             status.error_message);
        default:
            throw AdminError(bucket + ": " + status.error_message, status.error_code,
                             status.error_message);
    }
}

void BucketAdmin::check(const std::string& bucket) const {
    auto result = client_.bucket_exists(bucket);
    if (!result.success) fail(bucket, result);
    if (!result.exists) {
        throw AdminError("bucket " + bucket + " does not exist", StoreErrorCode::NoSuchBucket);
    }
}

void BucketAdmin::create(const std::string& bucket) {
    auto result = client_.make_bucket(bucket);
    if (!result.success) fail(bucket, result);
}

void BucketAdmin::remove_empty(const std::string& bucket) {
    auto result = client_.remove_bucket(bucket);
    if (!result.success) fail(bucket, result);
}

std::vector<BucketInfo> BucketAdmin::list_buckets() const {
    auto result = client_.list_buckets();
    if (!result.success) {
        throw AdminError("listing buckets: " + result.error_message, result.error_code,
                         result.error_message);
    }
    return result.buckets;
}

ListReport BucketAdmin::list(const std::string& bucket, const ListFilter& filter) const {
    ListOptions options;
    options.prefix = filter.prefix;
    options.recursive = filter.recursive;
    auto result = client_.list_objects(bucket, options);
    if (!result.success) fail(bucket, result);

    ListReport report;
    bool list_dirs = true;
    bool list_files = true;
    report.summary = true;
    if (filter.dirs || filter.files) {
        list_dirs = filter.dirs;
        list_files = filter.files;
        report.summary = false;
    }

    bool plain = filter.format.empty() || filter.format == "$name";
    bool wants_url = filter.format.find("$url") != std::string::npos ||
                     filter.format.find("${url}") != std::string::npos;

    // URLs for the listed bucket, not necessarily the configured one
    std::optional<StorageConfig> url_config;
    if (wants_url && storage_) {
        url_config = *storage_;
        url_config->bucket_name = bucket;
    }

    auto render = [&](const ListEntry& entry) {
        if (plain) return entry.key;
        std::string url;
        if (url_config && !entry.is_directory) {
            url = UrlBuilder(*url_config, client_).build(entry.key);
        }
        return render_list_entry(filter.format, entry, url);
    };

    for (const auto& entry : result.entries) {
        if (entry.is_directory) {
            ++report.n_dirs;
            if (list_dirs) report.lines.push_back(render(entry));
        } else {
            ++report.n_files;
            if (list_files) report.lines.push_back(render(entry));
        }
    }
    return report;
}

std::string BucketAdmin::get_policy(const std::string& bucket) const {
    auto result = client_.get_bucket_policy(bucket);
    if (!result.success) fail(bucket, result);

    auto doc = nlohmann::json::parse(result.policy, nullptr, false);
    if (doc.is_discarded()) {
        return result.policy;
    }
    return doc.dump(2);
}

void BucketAdmin::set_policy(const std::string& bucket, PolicyKind kind) {
    auto document = to_native_policy(bucket, kind);
    if (!document) {
        throw AdminError(std::string("policy ") + policy_kind_name(kind) +
                         " has no document to apply to " + bucket);
    }
    auto result = client_.set_bucket_policy(bucket, *document);
    if (!result.success) fail(bucket, result);
}

} // namespace objstore
