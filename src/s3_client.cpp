#include "objstore/storage/s3_client.hpp"
#include "objstore/log.hpp"
#include "objstore/paths.hpp"
#include "objstore/storage_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <sstream>

namespace objstore {

// ============================================================================
// XML parsing helpers for S3 responses
// ============================================================================

namespace xml {

// Value between <tag>value</tag>, empty if not found
std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos = 0) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag, start_pos);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";

    return xml.substr(start, end - start);
}

// Content of every <tag>...</tag>, in document order
std::vector<std::string> find_elements(const std::string& xml, const std::string& tag) {
    std::vector<std::string> results;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t pos = 0;
    while (pos < xml.size()) {
        size_t start = xml.find(open_tag, pos);
        if (start == std::string::npos) break;

        size_t content_start = start + open_tag.length();
        size_t end = xml.find(close_tag, content_start);
        if (end == std::string::npos) break;

        results.push_back(xml.substr(content_start, end - content_start));
        pos = end + close_tag.length();
    }

    return results;
}

// Basic entity set used by S3
std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) { result += '<'; i += 4; }
            else if (s.compare(i, 4, "&gt;") == 0) { result += '>'; i += 4; }
            else if (s.compare(i, 5, "&amp;") == 0) { result += '&'; i += 5; }
            else if (s.compare(i, 6, "&quot;") == 0) { result += '"'; i += 6; }
            else if (s.compare(i, 6, "&apos;") == 0) { result += '\''; i += 6; }
            else { result += s[i++]; }
        } else {
            result += s[i++];
        }
    }

    return result;
}

} // namespace xml

// ============================================================================
// Error mapping
// ============================================================================

const char* store_error_code_name(StoreErrorCode code) {
    switch (code) {
        case StoreErrorCode::None: return "None";
        case StoreErrorCode::NoSuchKey: return "NoSuchKey";
        case StoreErrorCode::NoSuchBucket: return "NoSuchBucket";
        case StoreErrorCode::BucketAlreadyOwned: return "BucketAlreadyOwned";
        case StoreErrorCode::BucketNotEmpty: return "BucketNotEmpty";
        case StoreErrorCode::NoSuchBucketPolicy: return "NoSuchBucketPolicy";
        case StoreErrorCode::AccessDenied: return "AccessDenied";
        case StoreErrorCode::Transport: return "Transport";
        case StoreErrorCode::Other: return "Other";
    }
    return "Other";
}

namespace {

StoreErrorCode map_error_code(const std::string& code, int status, StoreErrorCode not_found) {
    if (code == "NoSuchKey") return StoreErrorCode::NoSuchKey;
    if (code == "NoSuchBucket") return StoreErrorCode::NoSuchBucket;
    if (code == "BucketAlreadyOwnedByYou" || code == "BucketAlreadyExists")
        return StoreErrorCode::BucketAlreadyOwned;
    if (code == "BucketNotEmpty") return StoreErrorCode::BucketNotEmpty;
    if (code == "NoSuchBucketPolicy") return StoreErrorCode::NoSuchBucketPolicy;
    if (code == "AccessDenied" || code == "InvalidAccessKeyId" || code == "SignatureDoesNotMatch")
        return StoreErrorCode::AccessDenied;
    if (!code.empty()) return StoreErrorCode::Other;

    // HEAD responses carry no error document
    if (status == 404) return not_found;
    if (status == 401 || status == 403) return StoreErrorCode::AccessDenied;
    return StoreErrorCode::Other;
}

// Translate a response into a status. `not_found` is the code to assume for a
// bodiless 404, which depends on whether a bucket or a key was addressed.
StoreStatus status_from(const net::HttpResponse& response, StoreErrorCode not_found) {
    StoreStatus status;
    status.http_status = response.status_code;

    if (response.is_network_error) {
        status.error_code = StoreErrorCode::Transport;
        status.error_message = response.error;
        return status;
    }

    if (response.ok()) {
        status.success = true;
        return status;
    }

    std::string body = response.body_string();
    std::string code = xml::get_element(body, "Code");
    std::string message = xml::decode_entities(xml::get_element(body, "Message"));
    status.error_code = map_error_code(code, response.status_code, not_found);

    if (!response.error.empty()) {
        status.error_message = response.error;
    } else if (!code.empty()) {
        status.error_message = message.empty() ? code : code + ": " + message;
    } else {
        status.error_message = "HTTP " + std::to_string(response.status_code);
    }
    return status;
}

// CopyObject can fail with a 200 and an error document. Only its response
// body is inspected; object bodies are user data.
StoreStatus copy_status_from(const net::HttpResponse& response) {
    auto status = status_from(response, StoreErrorCode::NoSuchKey);
    if (!status.success || response.body_string().find("<Error>") == std::string::npos) {
        return status;
    }

    std::string body = response.body_string();
    std::string code = xml::get_element(body, "Code");
    std::string message = xml::decode_entities(xml::get_element(body, "Message"));
    status.success = false;
    status.error_code = map_error_code(code, response.status_code, StoreErrorCode::NoSuchKey);
    status.error_message = code.empty() ? "HTTP " + std::to_string(response.status_code)
                                        : (message.empty() ? code : code + ": " + message);
    return status;
}

// An empty key would address the bucket itself
StoreStatus empty_key_status() {
    StoreStatus status;
    status.error_code = StoreErrorCode::Other;
    status.error_message = "object key must not be empty";
    return status;
}

template <typename Result>
Result failed(const StoreStatus& status) {
    Result result;
    static_cast<StoreStatus&>(result) = status;
    return result;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

// Metadata keys that travel as plain HTTP headers rather than x-amz-meta-*
const std::pair<const char*, const char*> kStandardHeaders[] = {
    {"cache-control", "Cache-Control"},
    {"content-disposition", "Content-Disposition"},
    {"content-encoding", "Content-Encoding"},
    {"content-language", "Content-Language"},
    {"expires", "Expires"},
};

const char* standard_header_name(const std::string& lower) {
    for (const auto& [key, canonical] : kStandardHeaders) {
        if (lower == key) return canonical;
    }
    return nullptr;
}

std::string strip_quotes(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// ISO 8601 as used in listings: 2023-12-15T14:30:00.000Z
std::chrono::system_clock::time_point parse_iso8601(const std::string& date_str) {
    std::tm tm = {};
    int year, month, day, hour, min, sec;
    int millis = 0;
    if (sscanf(date_str.c_str(), "%d-%d-%dT%d:%d:%d.%dZ",
               &year, &month, &day, &hour, &min, &sec, &millis) >= 6 ||
        sscanf(date_str.c_str(), "%d-%d-%dT%d:%d:%dZ",
               &year, &month, &day, &hour, &min, &sec) == 6) {
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_min = min;
        tm.tm_sec = sec;
        time_t tt = timegm(&tm);
        if (tt != -1) {
            return std::chrono::system_clock::from_time_t(tt) + std::chrono::milliseconds(millis);
        }
    }
    return {};
}

// RFC 1123 as used in Last-Modified: Wed, 12 Oct 2009 17:50:00 GMT
std::chrono::system_clock::time_point parse_http_date(const std::string& date_str) {
    std::tm tm = {};
    if (strptime(date_str.c_str(), "%a, %d %b %Y %H:%M:%S", &tm) == nullptr) {
        return {};
    }
    time_t tt = timegm(&tm);
    return tt != -1 ? std::chrono::system_clock::from_time_t(tt)
                    : std::chrono::system_clock::time_point{};
}

ObjectMetadata metadata_from_headers(const net::HttpHeaders& headers) {
    ObjectMetadata meta;
    meta.size = headers.content_length().value_or(0);
    meta.etag = strip_quotes(headers.get("ETag").value_or(""));
    meta.content_type = headers.content_type().value_or("application/octet-stream");
    if (auto lm = headers.get("Last-Modified")) {
        meta.last_modified = parse_http_date(*lm);
    }

    for (const auto& [name, value] : headers.all()) {
        if (name.starts_with("x-amz-meta-")) {
            meta.user_metadata[name.substr(11)] = value;
        } else if (const char* canonical = standard_header_name(name)) {
            meta.user_metadata[canonical] = value;
        }
    }
    return meta;
}

std::string join_query(const std::vector<std::string>& params) {
    std::string query;
    for (const auto& p : params) {
        if (!query.empty()) query += "&";
        query += p;
    }
    return query;
}

} // namespace

// ============================================================================
// S3ObjectClient
// ============================================================================

S3ObjectClient::S3ObjectClient(const Config& config,
                               std::shared_ptr<net::HttpTransport> transport,
                               Clock clock)
    : config_(config)
    , signer_(config.access_key.str(), config.secret_key.str(), config.region, "s3")
    , transport_(std::move(transport))
    , clock_(std::move(clock)) {
    if (!transport_) {
        net::HttpClientConfig http_config;
        http_config.verify_ssl_by_default = config_.verify_ssl;
        http_config.default_connect_timeout = std::chrono::seconds(config_.connect_timeout_secs);
        http_config.default_total_timeout = std::chrono::seconds(config_.request_timeout_secs);
        transport_ = std::make_shared<net::HttpClient>(http_config);
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

std::string S3ObjectClient::endpoint_url() const {
    return (config_.use_https ? "https://" : "http://") + config_.endpoint;
}

std::string S3ObjectClient::bucket_url(const std::string& bucket) const {
    return endpoint_url() + "/" + net::url_encode(bucket);
}

std::string S3ObjectClient::object_url(const std::string& bucket, const std::string& key) const {
    return paths::join_url(bucket_url(bucket), key);
}

net::HttpResponse S3ObjectClient::send(net::HttpRequest request) const {
    request.verify_ssl = config_.verify_ssl;
    if (!config_.session_token.empty()) {
        signer_.sign_with_token(request, config_.session_token, clock_());
    } else {
        signer_.sign(request, clock_());
    }

    auto response = transport_->execute(request);
    log_debug("s3 %s %s -> %d", net::http_method_to_string(request.method),
              request.url.c_str(), response.status_code);
    return response;
}

// --- Buckets ---

ExistsResult S3ObjectClient::bucket_exists(const std::string& bucket) const {
    auto response = send(net::HttpRequest::head(bucket_url(bucket)));

    ExistsResult result;
    if (response.status_code == 404 && !response.is_network_error) {
        result.success = true;
        result.http_status = 404;
        result.exists = false;
        return result;
    }

    auto status = status_from(response, StoreErrorCode::NoSuchBucket);
    if (!status.success) {
        return failed<ExistsResult>(status);
    }
    static_cast<StoreStatus&>(result) = status;
    result.exists = true;
    return result;
}

StoreStatus S3ObjectClient::make_bucket(const std::string& bucket) {
    std::string body;
    if (config_.region != "us-east-1") {
        body = "<CreateBucketConfiguration xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
               "<LocationConstraint>" + config_.region + "</LocationConstraint>"
               "</CreateBucketConfiguration>";
    }
    auto request = net::HttpRequest::put(bucket_url(bucket),
                                         std::vector<uint8_t>(body.begin(), body.end()));
    if (!body.empty()) {
        request.headers.set_content_type("application/xml");
    }
    return status_from(send(std::move(request)), StoreErrorCode::NoSuchBucket);
}

StoreStatus S3ObjectClient::remove_bucket(const std::string& bucket) {
    return status_from(send(net::HttpRequest::del(bucket_url(bucket))),
                       StoreErrorCode::NoSuchBucket);
}

BucketListResult S3ObjectClient::list_buckets() const {
    auto response = send(net::HttpRequest::get(endpoint_url() + "/"));
    auto status = status_from(response, StoreErrorCode::Other);
    if (!status.success) {
        return failed<BucketListResult>(status);
    }

    BucketListResult result;
    static_cast<StoreStatus&>(result) = status;
    std::string body = response.body_string();
    for (const auto& content : xml::find_elements(body, "Bucket")) {
        BucketInfo info;
        info.name = xml::decode_entities(xml::get_element(content, "Name"));
        info.created = parse_iso8601(xml::get_element(content, "CreationDate"));
        result.buckets.push_back(std::move(info));
    }
    return result;
}

StoreStatus S3ObjectClient::set_bucket_policy(const std::string& bucket,
                                              const std::string& policy_json) {
    auto request = net::HttpRequest::put(bucket_url(bucket) + "?policy",
                                         std::vector<uint8_t>(policy_json.begin(), policy_json.end()));
    request.headers.set_content_type("application/json");
    return status_from(send(std::move(request)), StoreErrorCode::NoSuchBucket);
}

PolicyResult S3ObjectClient::get_bucket_policy(const std::string& bucket) const {
    auto response = send(net::HttpRequest::get(bucket_url(bucket) + "?policy"));
    auto status = status_from(response, StoreErrorCode::NoSuchBucketPolicy);
    if (!status.success) {
        return failed<PolicyResult>(status);
    }

    PolicyResult result;
    static_cast<StoreStatus&>(result) = status;
    result.policy = response.body_string();
    return result;
}

// --- Objects ---

PutResult S3ObjectClient::put_object(const std::string& bucket, const std::string& key,
                                     std::span<const uint8_t> data,
                                     const PutOptions& options) {
    if (key.empty()) return failed<PutResult>(empty_key_status());

    auto request = net::HttpRequest::put(object_url(bucket, key),
                                         std::vector<uint8_t>(data.begin(), data.end()));

    request.headers.set_content_type(options.content_type.empty()
                                         ? "application/octet-stream" : options.content_type);

    for (const auto& [k, v] : options.metadata) {
        std::string lower = to_lower(k);
        if (lower == "content-type") {
            request.headers.set_content_type(v);
        } else if (const char* canonical = standard_header_name(lower)) {
            request.headers.set(canonical, v);
        } else if (lower.starts_with("x-amz-meta-")) {
            request.headers.set(k, v);
        } else {
            request.headers.set("x-amz-meta-" + k, v);
        }
    }

    auto response = send(std::move(request));
    auto status = status_from(response, StoreErrorCode::NoSuchBucket);
    if (!status.success) {
        return failed<PutResult>(status);
    }

    PutResult result;
    static_cast<StoreStatus&>(result) = status;
    result.etag = strip_quotes(response.headers.get("ETag").value_or(""));
    return result;
}

GetResult S3ObjectClient::get_object(const std::string& bucket, const std::string& key) const {
    if (key.empty()) return failed<GetResult>(empty_key_status());

    auto response = send(net::HttpRequest::get(object_url(bucket, key)));
    auto status = status_from(response, StoreErrorCode::NoSuchKey);
    if (!status.success) {
        return failed<GetResult>(status);
    }

    GetResult result;
    static_cast<StoreStatus&>(result) = status;
    result.metadata = metadata_from_headers(response.headers);
    result.data = std::move(response.body);
    result.metadata.size = result.data.size();
    return result;
}

StatResult S3ObjectClient::stat_object(const std::string& bucket, const std::string& key) const {
    if (key.empty()) return failed<StatResult>(empty_key_status());

    auto response = send(net::HttpRequest::head(object_url(bucket, key)));
    auto status = status_from(response, StoreErrorCode::NoSuchKey);
    if (!status.success) {
        return failed<StatResult>(status);
    }

    StatResult result;
    static_cast<StoreStatus&>(result) = status;
    result.metadata = metadata_from_headers(response.headers);
    return result;
}

StoreStatus S3ObjectClient::remove_object(const std::string& bucket, const std::string& key) {
    if (key.empty()) return empty_key_status();

    return status_from(send(net::HttpRequest::del(object_url(bucket, key))),
                       StoreErrorCode::NoSuchKey);
}

StoreStatus S3ObjectClient::copy_object(const std::string& src_bucket, const std::string& src_key,
                                        const std::string& dst_bucket, const std::string& dst_key) {
    if (src_key.empty() || dst_key.empty()) return empty_key_status();

    auto request = net::HttpRequest::put(object_url(dst_bucket, dst_key), std::vector<uint8_t>{});
    request.headers.set("x-amz-copy-source",
                        "/" + net::url_encode(src_bucket) + "/" + net::url_encode_path(src_key));
    request.headers.set("x-amz-metadata-directive", "COPY");
    return copy_status_from(send(std::move(request)));
}

ListResult S3ObjectClient::list_objects(const std::string& bucket,
                                        const ListOptions& options) const {
    ListResult result;
    result.success = true;
    std::string continuation_token;

    while (true) {
        std::vector<std::string> params;
        params.push_back("list-type=2");
        if (!options.prefix.empty()) {
            params.push_back("prefix=" + net::url_encode(options.prefix));
        }
        if (!options.recursive) {
            params.push_back("delimiter=%2F");
        }
        params.push_back("max-keys=" + std::to_string(options.max_keys));
        if (!continuation_token.empty()) {
            params.push_back("continuation-token=" + net::url_encode(continuation_token));
        }

        auto response = send(net::HttpRequest::get(bucket_url(bucket) + "?" + join_query(params)));
        auto status = status_from(response, StoreErrorCode::NoSuchBucket);
        if (!status.success) {
            return failed<ListResult>(status);
        }
        result.http_status = status.http_status;

        std::string body = response.body_string();
        for (const auto& content : xml::find_elements(body, "Contents")) {
            ListEntry entry;
            entry.key = xml::decode_entities(xml::get_element(content, "Key"));
            std::string size_str = xml::get_element(content, "Size");
            if (!size_str.empty()) {
                try {
                    entry.size = std::stoull(size_str);
                } catch (const std::exception&) {
                    log_warn("s3 list: bad <Size> '%s' for %s", size_str.c_str(), entry.key.c_str());
                }
            }
            entry.last_modified = parse_iso8601(xml::get_element(content, "LastModified"));
            entry.etag = strip_quotes(xml::decode_entities(xml::get_element(content, "ETag")));
            result.entries.push_back(std::move(entry));
        }

        for (const auto& content : xml::find_elements(body, "CommonPrefixes")) {
            ListEntry entry;
            entry.key = xml::decode_entities(xml::get_element(content, "Prefix"));
            entry.is_directory = true;
            result.entries.push_back(std::move(entry));
        }

        bool truncated = xml::get_element(body, "IsTruncated") == "true";
        continuation_token = xml::decode_entities(xml::get_element(body, "NextContinuationToken"));
        if (!truncated || continuation_token.empty()) {
            break;
        }
    }

    return result;
}

PresignResult S3ObjectClient::presigned_get_object(const std::string& bucket,
                                                   const std::string& key,
                                                   const PresignOptions& options) const {
    PresignResult result;
    if (options.expires.count() < 1 || options.expires > std::chrono::hours(24 * 7)) {
        result.error_code = StoreErrorCode::Other;
        result.error_message = "presign expiry must be between 1 second and 7 days";
        return result;
    }

    // Sign exactly the address that will be handed out
    std::string base = options.public_base_url.empty() ? bucket_url(bucket) : options.public_base_url;
    std::string url = paths::join_url(base, key);

    std::vector<std::string> params;
    for (const auto& [name, value] : options.response_headers) {
        std::string param = to_lower(name);
        if (!param.starts_with("response-")) {
            param = "response-" + param;
        }
        params.push_back(param + "=" + net::url_encode(value));
    }
    if (!params.empty()) {
        url += "?" + join_query(params);
    }

    result.url = signer_.presign_url(net::HttpMethod::GET, url, options.expires, clock_(),
                                     config_.session_token);
    if (result.url.empty()) {
        result.error_code = StoreErrorCode::Other;
        result.error_message = "cannot presign malformed URL: " + url;
        return result;
    }
    result.success = true;
    return result;
}

std::unique_ptr<ObjectStoreClient> create_s3_client(const ClientConfig& config) {
    S3ObjectClient::Config s3;
    s3.endpoint = config.endpoint;
    s3.use_https = config.use_https;
    s3.region = config.region;
    s3.access_key = config.access_key;
    s3.secret_key = config.secret_key;
    s3.session_token = config.session_token;
    s3.verify_ssl = config.verify_ssl;
    s3.connect_timeout_secs = config.connect_timeout_secs;
    s3.request_timeout_secs = config.request_timeout_secs;
    return std::make_unique<S3ObjectClient>(s3);
}

} // namespace objstore
