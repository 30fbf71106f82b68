#pragma once

#include "objstore/backup.hpp"
#include "objstore/bucket_provisioner.hpp"
#include "objstore/events.hpp"
#include "objstore/storage/object_client.hpp"
#include "objstore/storage_config.hpp"
#include "objstore/url_builder.hpp"

#include <chrono>
#include <cstdint>
#include <istream>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace objstore {

struct DirectoryListing {
    std::vector<std::string> directories;
    std::vector<std::string> files;
};

// Read-only, seekable view of a downloaded object
class ObjectFile {
public:
    ObjectFile(std::string name, std::vector<uint8_t> data, ObjectMetadata metadata);

    const std::string& name() const { return name_; }
    const ObjectMetadata& metadata() const { return metadata_; }
    uint64_t size() const { return data_.size(); }

    // Copies up to `n` bytes from the current position, returns bytes copied
    size_t read(uint8_t* out, size_t n);
    // Up to `n` bytes from the current position, everything left by default
    std::vector<uint8_t> read(size_t n = SIZE_MAX);

    // Positions past the end clamp to size()
    void seek(uint64_t pos);
    uint64_t tell() const { return pos_; }
    bool eof() const { return pos_ >= data_.size(); }

    // Whole content regardless of position
    std::string str() const { return std::string(data_.begin(), data_.end()); }
    const std::vector<uint8_t>& data() const { return data_; }

private:
    std::string name_;
    std::vector<uint8_t> data_;
    ObjectMetadata metadata_;
    uint64_t pos_ = 0;
};

// Generic file storage over one bucket. Thread-safe: the bucket is
// provisioned once on first use, object operations then run lock-free.
class Storage {
public:
    using Metadata = std::map<std::string, std::string>;

    /// Throws ConfigError if `config` does not validate or `client` is null.
    /// `events` defaults to a NullEventSink and `clock` (used for backup key
    /// timestamps) to the system clock. Nothing is sent to the store here.
    Storage(StorageConfig config,
            std::shared_ptr<ObjectStoreClient> client,
            std::shared_ptr<EventSink> events = nullptr,
            Clock clock = nullptr);

    Storage(const Storage&) = delete;
    Storage& operator=(const Storage&) = delete;

    /// Store `content` under normalize(name) and return the key actually
    /// used. Unless file_overwrite is set, an existing key makes the object
    /// land under an alternative key instead. `metadata` is merged over the
    /// configured object_metadata.
    std::string save(const std::string& name, std::span<const uint8_t> content,
                     const Metadata& metadata = {});
    std::string save(const std::string& name, const std::string& content,
                     const Metadata& metadata = {});
    // Rewinds `content` first when the stream is seekable
    std::string save(const std::string& name, std::istream& content,
                     const Metadata& metadata = {});

    // Only read modes ("r", "rb") are supported, others throw std::invalid_argument
    ObjectFile open(const std::string& name, const std::string& mode = "rb");

    bool exists(const std::string& name);

    // Delete, archiving to the backup bucket when one is configured
    void remove(const std::string& name);

    // Immediate children of `path`, names relative to it
    DirectoryListing listdir(const std::string& path);

    std::string url(const std::string& name, const UrlOptions& options = {});

    uint64_t size(const std::string& name);
    std::chrono::system_clock::time_point last_modified(const std::string& name);
    // The store keeps a single timestamp, both are last_modified()
    std::chrono::system_clock::time_point accessed_time(const std::string& name);
    std::chrono::system_clock::time_point created_time(const std::string& name);

    // normalize(name), or an alternative if that key is already taken
    std::string get_available_name(const std::string& name);

    const StorageConfig& config() const { return config_; }
    BucketState bucket_state() const { return provisioner_.state(); }

private:
    void ready();
    StatResult stat(const std::string& key, const char* op);

    template <typename Fn>
    auto instrumented(const char* op, const std::string& key, uint64_t bytes, Fn&& fn);

    StorageConfig config_;
    std::shared_ptr<ObjectStoreClient> client_;
    std::shared_ptr<EventSink> events_;
    BucketProvisioner provisioner_;
    BackupResolver backup_;
    UrlBuilder urls_;
};

} // namespace objstore
