#include "objstore/net/http.hpp"
#include "objstore/log.hpp"

#include <curl/curl.h>
#include <openssl/crypto.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace objstore::net {

// ============================================================================
// Environment-based configuration helpers
// ============================================================================

static size_t get_connection_pool_size(size_t fallback) {
    if (const char* env = std::getenv("OBJSTORE_CONNECTION_POOL_SIZE")) {
        try {
            size_t size = std::stoul(env);
            if (size >= 1 && size <= 1000) {
                return size;
            }
            log_warn("OBJSTORE_CONNECTION_POOL_SIZE=%s out of range [1,1000], using default", env);
        } catch (const std::exception&) {
            log_warn("invalid OBJSTORE_CONNECTION_POOL_SIZE=%s, using default", env);
        }
    }
    return fallback;
}

static std::chrono::milliseconds get_request_timeout(std::chrono::milliseconds fallback) {
    if (const char* env = std::getenv("OBJSTORE_REQUEST_TIMEOUT")) {
        try {
            unsigned long secs = std::stoul(env);
            if (secs >= 5 && secs <= 3600) {
                return std::chrono::seconds(secs);
            }
            log_warn("OBJSTORE_REQUEST_TIMEOUT=%s out of range [5,3600], using default", env);
        } catch (const std::exception&) {
            log_warn("invalid OBJSTORE_REQUEST_TIMEOUT=%s, using default", env);
        }
    }
    return fallback;
}

// ============================================================================
// Utility functions
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

static bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

std::string url_encode(const std::string& str) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (is_unreserved(c)) {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

std::string url_encode_path(const std::string& str) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (is_unreserved(c) || c == '/') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string url_decode(const std::string& str) {
    std::string decoded;
    decoded.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int h1 = hex_digit(str[i + 1]);
            int h2 = hex_digit(str[i + 2]);
            if (h1 >= 0 && h2 >= 0) {
                int value = (h1 << 4) | h2;
                // %00 would truncate C strings downstream
                if (value == 0) {
                    i += 2;
                    continue;
                }
                decoded += static_cast<char>(value);
                i += 2;
                continue;
            }
        } else if (str[i] == '+') {
            decoded += ' ';
            continue;
        }
        decoded += str[i];
    }

    return decoded;
}

using QueryParam = std::pair<std::string, std::string>;

// Encoded name/value pairs in URL order. "a" and "a=" both give {"a", ""}.
static std::vector<QueryParam> split_query(const std::string& query) {
    std::vector<QueryParam> params;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();

        std::string_view param(query.data() + pos, amp - pos);
        if (!param.empty()) {
            size_t eq = param.find('=');
            if (eq == std::string_view::npos) {
                params.emplace_back(std::string(param), std::string());
            } else {
                params.emplace_back(std::string(param.substr(0, eq)), std::string(param.substr(eq + 1)));
            }
        }
        pos = amp + 1;
    }
    return params;
}

static std::string join_query(const std::vector<QueryParam>& params) {
    std::string out;
    for (const auto& [name, value] : params) {
        if (!out.empty()) out += '&';
        out += name + "=" + value;
    }
    return out;
}

std::multimap<std::string, std::string> parse_query(const std::string& query) {
    std::multimap<std::string, std::string> params;
    for (const auto& [name, value] : split_query(query)) {
        params.emplace(url_decode(name), url_decode(value));
    }
    return params;
}

std::string format_amz_datetime(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

std::string format_amz_date(std::chrono::system_clock::time_point tp) {
    return format_amz_datetime(tp).substr(0, 8);
}

std::optional<std::chrono::system_clock::time_point> parse_amz_datetime(const std::string& s) {
    if (s.size() != 16 || s[8] != 'T' || s[15] != 'Z') {
        return std::nullopt;
    }
    std::tm tm{};
    int year, month, day, hour, min, sec;
    if (sscanf(s.c_str(), "%4d%2d%2dT%2d%2d%2dZ",
               &year, &month, &day, &hour, &min, &sec) != 6) {
        return std::nullopt;
    }
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("Content-Type");
}

std::optional<size_t> HttpHeaders::content_length() const {
    auto val = get("Content-Length");
    if (val) {
        try {
            return std::stoull(*val);
        } catch (const std::invalid_argument&) {
            // malformed header
        } catch (const std::out_of_range&) {
            // absurdly large value
        }
    }
    return std::nullopt;
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::GET;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::head(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::HEAD;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::put(const std::string& url, const std::vector<uint8_t>& body) {
    HttpRequest req;
    req.method = HttpMethod::PUT;
    req.url = url;
    req.body = body;
    return req;
}

HttpRequest HttpRequest::del(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::DELETE;
    req.url = url;
    return req;
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    ParsedUrl result;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }
    result.scheme = url.substr(0, scheme_end);
    size_t pos = scheme_end + 3;

    size_t host_end = url.find_first_of("/?#", pos);
    if (host_end == std::string::npos) {
        host_end = url.size();
    }

    std::string host_port = url.substr(pos, host_end - pos);
    if (host_port.empty()) {
        return std::nullopt;
    }
    size_t colon_pos = host_port.rfind(':');

    if (host_port.front() == '[') {
        // IPv6 literal
        size_t bracket_end = host_port.find(']');
        if (bracket_end == std::string::npos) {
            return std::nullopt;
        }
        result.host = host_port.substr(1, bracket_end - 1);
        if (bracket_end + 1 < host_port.size() && host_port[bracket_end + 1] == ':') {
            try {
                result.port = std::stoi(host_port.substr(bracket_end + 2));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    } else if (colon_pos != std::string::npos) {
        result.host = host_port.substr(0, colon_pos);
        try {
            result.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    } else {
        result.host = host_port;
    }

    pos = host_end;

    if (pos < url.size() && url[pos] == '/') {
        size_t path_end = url.find_first_of("?#", pos);
        if (path_end == std::string::npos) {
            path_end = url.size();
        }
        result.path = url.substr(pos, path_end - pos);
        pos = path_end;
    }

    if (pos < url.size() && url[pos] == '?') {
        size_t query_end = url.find('#', pos);
        if (query_end == std::string::npos) {
            query_end = url.size();
        }
        result.query = url.substr(pos + 1, query_end - pos - 1);
        pos = query_end;
    }

    if (pos < url.size() && url[pos] == '#') {
        result.fragment = url.substr(pos + 1);
    }

    return result;
}

std::string ParsedUrl::to_string() const {
    std::ostringstream oss;
    oss << scheme << "://";

    if (host.find(':') != std::string::npos) {
        oss << "[" << host << "]";
    } else {
        oss << host;
    }

    if (port != 0) {
        oss << ":" << port;
    }

    oss << path;

    if (!query.empty()) {
        oss << "?" << query;
    }

    if (!fragment.empty()) {
        oss << "#" << fragment;
    }

    return oss.str();
}

std::string ParsedUrl::host_header() const {
    std::string result = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    bool default_port = port == 0 ||
                        (scheme == "http" && port == 80) ||
                        (scheme == "https" && port == 443);
    if (!default_port) {
        result += ":" + std::to_string(port);
    }
    return result;
}

// ============================================================================
// CURL callback functions
// ============================================================================

namespace {

// Bounded response accumulation
struct WriteCallbackContext {
    std::vector<uint8_t>* response;
    size_t max_size;
    size_t current_size;
    bool size_exceeded;
};

struct ReadCallbackContext {
    const uint8_t* data;
    size_t size;
    size_t pos;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    if (ctx->max_size > 0 && ctx->current_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // aborts the transfer
    }

    ctx->response->insert(ctx->response->end(), ptr, ptr + bytes);
    ctx->current_size += bytes;
    return bytes;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    if (line.empty() || line.starts_with("HTTP/")) {
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        size_t start = value.find_first_not_of(" \t");
        value = start != std::string::npos ? value.substr(start) : "";

        headers->add(name, value);
    }

    return bytes;
}

size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* rd = static_cast<ReadCallbackContext*>(userdata);
    size_t max_bytes = size * nitems;
    size_t remaining = rd->size - rd->pos;
    size_t to_copy = std::min(max_bytes, remaining);

    if (to_copy > 0) {
        std::memcpy(buffer, rd->data + rd->pos, to_copy);
        rd->pos += to_copy;
    }

    return to_copy;
}

// Frees a curl header list on scope exit
struct SlistGuard {
    curl_slist* list = nullptr;
    ~SlistGuard() {
        if (list) curl_slist_free_all(list);
    }
};

} // namespace

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });

        config_.max_idle_handles = get_connection_pool_size(config_.max_idle_handles);
        config_.default_total_timeout = get_request_timeout(config_.default_total_timeout);
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }

    // Checks a handle out of the pool for the duration of one request
    class Lease {
    public:
        explicit Lease(Impl& owner) : owner_(owner), handle_(owner.acquire_handle()) {}
        ~Lease() { owner_.release_handle(handle_); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        CURL* get() const { return handle_; }

    private:
        Impl& owner_;
        CURL* handle_;
    };

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        Lease lease(*this);
        CURL* curl = lease.get();
        if (!curl) {
            response.error = "Failed to create CURL handle";
            response.is_network_error = true;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
        }

        SlistGuard headers_list;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list.list = curl_slist_append(headers_list.list, header.c_str());
        }
        // S3 answers 100-continue itself; skip the extra round trip
        headers_list.list = curl_slist_append(headers_list.list, "Expect:");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list.list);

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        ReadCallbackContext read_data{request.body.data(), request.body.size(), 0};
        if (request.method == HttpMethod::PUT) {
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &read_data);
            // Always send Content-Length, MinIO rejects chunked empty PUTs with 411
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        }

        std::vector<uint8_t> response_body;
        WriteCallbackContext write_ctx{&response_body, config_.max_response_size, 0, false};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        auto connect_timeout = request.connect_timeout.count() > 0
                                   ? request.connect_timeout : config_.default_connect_timeout;
        auto total_timeout = request.total_timeout.count() > 0
                                 ? request.total_timeout : config_.default_total_timeout;
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(total_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        bool ssl_verify_enabled = request.verify_ssl && config_.verify_ssl_by_default;
        if (!ssl_verify_enabled) {
            static std::once_flag ssl_warning_flag;
            std::call_once(ssl_warning_flag, []() {
                log_warn("SSL verification disabled via configuration. "
                         "This exposes connections to man-in-the-middle attacks.");
            });
        }
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, ssl_verify_enabled ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, ssl_verify_enabled ? 2L : 0L);

        if (!config_.default_ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.default_ca_bundle.c_str());
        }

        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }

        auto start_time = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl);
        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (write_ctx.size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.status_code = 413;
        } else if (res == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
            response.body = std::move(response_body);
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
            log_debug("%s %s failed: %s", http_method_to_string(request.method),
                      request.url.c_str(), response.error.c_str());
        }

        return response;
    }

private:
    CURL* acquire_handle() {
        std::lock_guard<std::mutex> lock(pool_mutex_);

        CURL* handle = nullptr;
        if (!idle_handles_.empty()) {
            handle = idle_handles_.back();
            idle_handles_.pop_back();
        } else {
            handle = curl_easy_init();
        }
        return handle;
    }

    void release_handle(CURL* handle) {
        if (!handle) return;

        // Reset outside the lock, it touches nothing shared
        curl_easy_reset(handle);
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (idle_handles_.size() < config_.max_idle_handles) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientConfig config_;
    std::mutex pool_mutex_;
    std::vector<CURL*> idle_handles_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

// ============================================================================
// AwsSigV4Signer
// ============================================================================

AwsSigV4Signer::AwsSigV4Signer(const std::string& access_key_id,
                               const std::string& secret_access_key,
                               const std::string& region,
                               const std::string& service)
    : access_key_id_(access_key_id)
    , secret_access_key_(secret_access_key)
    , region_(region)
    , service_(service) {}

static std::string to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

static std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

static std::string sha256_hex(const std::vector<uint8_t>& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

static std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key,
                                        const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         hash, &hash_len);

    return std::vector<uint8_t>(hash, hash + hash_len);
}

static std::vector<uint8_t> hmac_sha256(const std::string& key, const std::string& data) {
    return hmac_sha256(std::vector<uint8_t>(key.begin(), key.end()), data);
}

// Query params are already URI-encoded in the URL, so they only need
// sorting by name, then value
static std::string build_canonical_query_string(const std::string& query) {
    auto params = split_query(query);
    std::sort(params.begin(), params.end());
    return join_query(params);
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

std::string AwsSigV4Signer::credential_scope(const std::string& date) const {
    return date + "/" + region_ + "/" + service_ + "/aws4_request";
}

std::string AwsSigV4Signer::get_canonical_request(const HttpRequest& request,
                                                   const std::string& signed_headers,
                                                   const std::string& payload_hash) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) return "";

    std::ostringstream oss;
    oss << http_method_to_string(request.method) << "\n";
    oss << (url->path.empty() ? "/" : url->path) << "\n";
    oss << build_canonical_query_string(url->query) << "\n";

    // HttpHeaders already keeps names lowercase and sorted
    for (const auto& [name, value] : request.headers.all()) {
        oss << name << ":" << trim(value) << "\n";
    }
    oss << "\n";

    oss << signed_headers << "\n";
    oss << payload_hash;

    return oss.str();
}

std::string AwsSigV4Signer::get_string_to_sign(const std::string& datetime,
                                                const std::string& date,
                                                const std::string& canonical_request) const {
    std::ostringstream oss;
    oss << "AWS4-HMAC-SHA256\n";
    oss << datetime << "\n";
    oss << credential_scope(date) << "\n";
    oss << sha256_hex(canonical_request);
    return oss.str();
}

std::string AwsSigV4Signer::calculate_signature(const std::string& date,
                                                 const std::string& string_to_sign) const {
    auto k_date = hmac_sha256("AWS4" + secret_access_key_, date);
    auto k_region = hmac_sha256(k_date, region_);
    auto k_service = hmac_sha256(k_region, service_);
    auto k_signing = hmac_sha256(k_service, "aws4_request");

    auto signature = hmac_sha256(k_signing, string_to_sign);
    return to_hex(signature.data(), signature.size());
}

void AwsSigV4Signer::sign(HttpRequest& request, std::chrono::system_clock::time_point now) const {
    std::string datetime = format_amz_datetime(now);
    std::string date = datetime.substr(0, 8);

    auto url = ParsedUrl::parse(request.url);
    if (!url) return;

    request.headers.set("Host", url->host_header());
    request.headers.set("X-Amz-Date", datetime);

    // Reuse a pre-set payload hash (e.g. UNSIGNED-PAYLOAD) or compute it
    std::string payload_hash;
    if (auto existing = request.headers.get("X-Amz-Content-Sha256"); existing && !existing->empty()) {
        payload_hash = *existing;
    } else {
        payload_hash = request.body.empty() ? sha256_hex(std::string()) : sha256_hex(request.body);
    }
    request.headers.set("X-Amz-Content-Sha256", payload_hash);

    std::unordered_set<std::string> header_set;
    for (const auto& [name, value] : request.headers.all()) {
        header_set.insert(name);
    }
    std::vector<std::string> header_names(header_set.begin(), header_set.end());
    std::sort(header_names.begin(), header_names.end());

    std::string signed_headers;
    for (size_t i = 0; i < header_names.size(); ++i) {
        if (i > 0) signed_headers += ";";
        signed_headers += header_names[i];
    }

    std::string canonical_request = get_canonical_request(request, signed_headers, payload_hash);
    std::string string_to_sign = get_string_to_sign(datetime, date, canonical_request);
    std::string signature = calculate_signature(date, string_to_sign);

    std::ostringstream auth;
    auth << "AWS4-HMAC-SHA256 ";
    auth << "Credential=" << access_key_id_ << "/" << credential_scope(date) << ", ";
    auth << "SignedHeaders=" << signed_headers << ", ";
    auth << "Signature=" << signature;

    request.headers.set("Authorization", auth.str());
}

void AwsSigV4Signer::sign_with_token(HttpRequest& request,
                                      const std::string& session_token,
                                      std::chrono::system_clock::time_point now) const {
    request.headers.set("X-Amz-Security-Token", session_token);
    sign(request, now);
}

std::string AwsSigV4Signer::presigned_signature(HttpMethod method,
                                                const std::string& url_without_signature,
                                                const std::string& datetime) const {
    auto url = ParsedUrl::parse(url_without_signature);
    if (!url) return "";

    // Only the host header is signed, the payload is never hashed
    std::ostringstream canonical;
    canonical << http_method_to_string(method) << "\n";
    canonical << (url->path.empty() ? "/" : url->path) << "\n";
    canonical << build_canonical_query_string(url->query) << "\n";
    canonical << "host:" << url->host_header() << "\n";
    canonical << "\n";
    canonical << "host\n";
    canonical << "UNSIGNED-PAYLOAD";

    std::string date = datetime.substr(0, 8);
    return calculate_signature(date, get_string_to_sign(datetime, date, canonical.str()));
}

std::string AwsSigV4Signer::presign_url(HttpMethod method,
                                        const std::string& url,
                                        std::chrono::seconds expires,
                                        std::chrono::system_clock::time_point now,
                                        const std::string& session_token) const {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) return "";
    parsed->fragment.clear();

    std::string datetime = format_amz_datetime(now);
    std::string date = datetime.substr(0, 8);

    std::string query = parsed->query;
    auto append = [&query](const std::string& key, const std::string& value) {
        if (!query.empty()) query += "&";
        query += key + "=" + url_encode(value);
    };
    append("X-Amz-Algorithm", "AWS4-HMAC-SHA256");
    append("X-Amz-Credential", access_key_id_ + "/" + credential_scope(date));
    append("X-Amz-Date", datetime);
    append("X-Amz-Expires", std::to_string(expires.count()));
    if (!session_token.empty()) {
        append("X-Amz-Security-Token", session_token);
    }
    append("X-Amz-SignedHeaders", "host");
    parsed->query = query;

    std::string unsigned_url = parsed->to_string();
    return unsigned_url + "&X-Amz-Signature=" + presigned_signature(method, unsigned_url, datetime);
}

bool AwsSigV4Signer::verify_presigned_url(HttpMethod method,
                                          const std::string& url,
                                          std::chrono::system_clock::time_point now) const {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) return false;

    // Split the signature off, keeping the remaining params in encoded form
    std::string signature;
    std::vector<QueryParam> unsigned_params;
    for (auto& param : split_query(parsed->query)) {
        if (param.first == "X-Amz-Signature") {
            signature = std::move(param.second);
        } else {
            unsigned_params.push_back(std::move(param));
        }
    }
    if (signature.empty()) return false;
    std::string remaining = join_query(unsigned_params);

    auto params = parse_query(remaining);
    auto value_of = [&params](const std::string& key) -> std::string {
        auto it = params.find(key);
        return it != params.end() ? it->second : std::string();
    };

    if (value_of("X-Amz-Algorithm") != "AWS4-HMAC-SHA256") return false;
    if (value_of("X-Amz-SignedHeaders") != "host") return false;

    std::string datetime = value_of("X-Amz-Date");
    auto signed_at = parse_amz_datetime(datetime);
    if (!signed_at) return false;

    if (value_of("X-Amz-Credential") != access_key_id_ + "/" + credential_scope(datetime.substr(0, 8))) {
        return false;
    }

    long expires = 0;
    try {
        expires = std::stol(value_of("X-Amz-Expires"));
    } catch (const std::exception&) {
        return false;
    }
    if (expires < 1 || expires > 604800) return false;
    if (now > *signed_at + std::chrono::seconds(expires)) return false;

    parsed->query = remaining;
    parsed->fragment.clear();
    std::string expected = presigned_signature(method, parsed->to_string(), datetime);
    return expected.size() == signature.size() &&
           CRYPTO_memcmp(expected.data(), signature.data(), expected.size()) == 0;
}

} // namespace objstore::net
