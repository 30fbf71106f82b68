#pragma once

#include "objstore/core/secure_string.hpp"
#include "objstore/net/http.hpp"
#include "objstore/storage/object_client.hpp"

#include <functional>
#include <memory>

namespace objstore {

struct ClientConfig;

// ObjectStoreClient over the S3 REST API (MinIO, AWS, any SigV4 store).
// Always uses path-style addressing: scheme://endpoint/bucket/key.
class S3ObjectClient : public ObjectStoreClient {
public:
    struct Config {
        std::string endpoint;           // host[:port]
        bool use_https = true;
        std::string region = "us-east-1";
        SecureString access_key;
        SecureString secret_key;
        std::string session_token;
        bool verify_ssl = true;
        uint32_t connect_timeout_secs = 10;
        uint32_t request_timeout_secs = 60;
    };

    using Clock = std::function<std::chrono::system_clock::time_point()>;

    // A null transport means a libcurl HttpClient built from `config`
    explicit S3ObjectClient(const Config& config,
                            std::shared_ptr<net::HttpTransport> transport = nullptr,
                            Clock clock = nullptr);

    std::string type_name() const override { return "s3"; }

    ExistsResult bucket_exists(const std::string& bucket) const override;
    StoreStatus make_bucket(const std::string& bucket) override;
    StoreStatus remove_bucket(const std::string& bucket) override;
    BucketListResult list_buckets() const override;
    StoreStatus set_bucket_policy(const std::string& bucket,
                                  const std::string& policy_json) override;
    PolicyResult get_bucket_policy(const std::string& bucket) const override;

    PutResult put_object(const std::string& bucket, const std::string& key,
                         std::span<const uint8_t> data,
                         const PutOptions& options) override;
    GetResult get_object(const std::string& bucket, const std::string& key) const override;
    StatResult stat_object(const std::string& bucket, const std::string& key) const override;
    StoreStatus remove_object(const std::string& bucket, const std::string& key) override;
    StoreStatus copy_object(const std::string& src_bucket, const std::string& src_key,
                            const std::string& dst_bucket, const std::string& dst_key) override;
    ListResult list_objects(const std::string& bucket,
                            const ListOptions& options) const override;

    PresignResult presigned_get_object(const std::string& bucket,
                                       const std::string& key,
                                       const PresignOptions& options) const override;

    // scheme://endpoint
    std::string endpoint_url() const;

private:
    net::HttpResponse send(net::HttpRequest request) const;
    std::string bucket_url(const std::string& bucket) const;
    std::string object_url(const std::string& bucket, const std::string& key) const;

    Config config_;
    net::AwsSigV4Signer signer_;
    std::shared_ptr<net::HttpTransport> transport_;
    Clock clock_;
};

// Builds an S3ObjectClient from loaded client settings
std::unique_ptr<ObjectStoreClient> create_s3_client(const ClientConfig& config);

} // namespace objstore
