#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace objstore::net {

// HTTP methods
enum class HttpMethod {
    GET,
    PUT,
    DELETE,
    HEAD
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    // Iteration (names are lowercase)
    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);

    std::optional<std::string> content_type() const;
    std::optional<size_t> content_length() const;

private:
    // Headers stored as lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

// HTTP request
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Zero means "use the client default"
    std::chrono::milliseconds connect_timeout{0};
    std::chrono::milliseconds total_timeout{0};

    bool verify_ssl = true;

    static HttpRequest get(const std::string& url);
    static HttpRequest head(const std::string& url);
    static HttpRequest put(const std::string& url, const std::vector<uint8_t>& body);
    static HttpRequest del(const std::string& url);
};

// HTTP response
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds total_time{0};

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if error was network-level, not HTTP status
};

// Anything that can execute a request. The S3 client only depends on this,
// so tests can substitute a recording transport for libcurl.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse execute(const HttpRequest& request) = 0;
};

// HTTP client configuration
// OBJSTORE_CONNECTION_POOL_SIZE and OBJSTORE_REQUEST_TIMEOUT override the
// pool size and total timeout when those are left at their defaults.
struct HttpClientConfig {
    size_t max_idle_handles = 16;

    std::chrono::milliseconds default_connect_timeout{10000};
    std::chrono::milliseconds default_total_timeout{60000};

    // Response size limit (0 = unlimited)
    size_t max_response_size = 512 * 1024 * 1024;

    bool verify_ssl_by_default = true;
    std::string default_ca_bundle;

    std::string user_agent = "objstore/1.0";

    bool verbose = false;
};

// libcurl-backed client with a pool of reusable easy handles
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// AWS SigV4 signing helper (used for S3)
class AwsSigV4Signer {
public:
    AwsSigV4Signer(const std::string& access_key_id,
                   const std::string& secret_access_key,
                   const std::string& region,
                   const std::string& service);

    // Sign a request with an Authorization header
    void sign(HttpRequest& request,
              std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    // Sign with session token (for STS credentials)
    void sign_with_token(HttpRequest& request, const std::string& session_token,
                         std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    // Produce a query-string signed URL. Host and path of `url` are exactly
    // what gets signed, so `url` must be the address the client will fetch.
    // Existing query parameters of `url` must already be URI-encoded.
    std::string presign_url(HttpMethod method,
                            const std::string& url,
                            std::chrono::seconds expires,
                            std::chrono::system_clock::time_point now = std::chrono::system_clock::now(),
                            const std::string& session_token = "") const;

    // Recompute the signature of a presigned URL as the store would when it
    // receives `url`. False if malformed, expired, foreign or tampered.
    bool verify_presigned_url(HttpMethod method,
                              const std::string& url,
                              std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

private:
    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;

    std::string credential_scope(const std::string& date) const;
    std::string get_canonical_request(const HttpRequest& request,
                                      const std::string& signed_headers,
                                      const std::string& payload_hash) const;
    std::string get_string_to_sign(const std::string& datetime,
                                   const std::string& date,
                                   const std::string& canonical_request) const;
    std::string calculate_signature(const std::string& date,
                                    const std::string& string_to_sign) const;
    std::string presigned_signature(HttpMethod method,
                                    const std::string& url_without_signature,
                                    const std::string& datetime) const;
};

// URL parsing helper
struct ParsedUrl {
    std::string scheme;   // http, https
    std::string host;
    int port = 0;         // 0 = default for scheme
    std::string path;
    std::string query;
    std::string fragment;

    std::string to_string() const;

    // Value for the Host header: host, plus ":port" when not the scheme default
    std::string host_header() const;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

// Percent-encode every byte except RFC 3986 unreserved characters
std::string url_encode(const std::string& str);
// Same, but '/' is kept as a path separator
std::string url_encode_path(const std::string& str);
std::string url_decode(const std::string& str);

// Split an encoded query string into decoded key/value pairs
std::multimap<std::string, std::string> parse_query(const std::string& query);

// SigV4 timestamp helpers ("20130524T000000Z" / "20130524")
std::string format_amz_datetime(std::chrono::system_clock::time_point tp);
std::string format_amz_date(std::chrono::system_clock::time_point tp);
std::optional<std::chrono::system_clock::time_point> parse_amz_datetime(const std::string& s);

} // namespace objstore::net
