#include "objstore/storage.hpp"
#include "objstore/errors.hpp"
#include "objstore/paths.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iterator>
#include <stdexcept>
#include <type_traits>

namespace objstore {

// ============================================================================
// ObjectFile
// ============================================================================

ObjectFile::ObjectFile(std::string name, std::vector<uint8_t> data, ObjectMetadata metadata)
    : name_(std::move(name))
    , data_(std::move(data))
    , metadata_(std::move(metadata)) {}

size_t ObjectFile::read(uint8_t* out, size_t n) {
    size_t available = data_.size() - static_cast<size_t>(pos_);
    size_t count = std::min(n, available);
    if (count > 0) {
        std::memcpy(out, data_.data() + pos_, count);
        pos_ += count;
    }
    return count;
}

std::vector<uint8_t> ObjectFile::read(size_t n) {
    size_t available = data_.size() - static_cast<size_t>(pos_);
    size_t count = std::min(n, available);
    std::vector<uint8_t> result(data_.begin() + pos_, data_.begin() + pos_ + count);
    pos_ += count;
    return result;
}

void ObjectFile::seek(uint64_t pos) {
    pos_ = std::min<uint64_t>(pos, data_.size());
}

// ============================================================================
// Storage
// ============================================================================

namespace {

StorageConfig validated(StorageConfig config) {
    auto err = config.validate();
    if (!err.empty()) {
        throw ConfigError("invalid storage config: " + err);
    }
    return config;
}

std::shared_ptr<ObjectStoreClient> required(std::shared_ptr<ObjectStoreClient> client) {
    if (!client) {
        throw ConfigError("storage requires an object store client");
    }
    return client;
}

// Names that normalize to nothing would address the bucket itself
std::string object_key(const std::string& name, const char* action) {
    std::string key = paths::normalize(name);
    if (key.empty()) {
        throw std::invalid_argument(std::string("cannot ") + action +
                                    " an object with an empty name: '" + name + "'");
    }
    return key;
}

bool is_read_mode(const std::string& mode) {
    if (mode.empty()) return false;
    return std::all_of(mode.begin(), mode.end(), [](char c) {
        return c == 'r' || c == 'b' || c == 't';
    }) && mode.find('r') != std::string::npos;
}

bool iequals(const std::string& a, const char* b) {
    size_t n = std::strlen(b);
    if (a.size() != n) return false;
    for (size_t i = 0; i < n; ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

constexpr int kMaxNameAttempts = 100;

} // namespace

Storage::Storage(StorageConfig config,
                 std::shared_ptr<ObjectStoreClient> client,
                 std::shared_ptr<EventSink> events,
                 Clock clock)
    : config_(validated(std::move(config)))
    , client_(required(std::move(client)))
    , events_(events ? std::move(events) : std::make_shared<NullEventSink>())
    , provisioner_(*client_,
                   {config_.bucket_name, config_.auto_create_bucket,
                    config_.assume_bucket_exists, config_.auto_create_policy},
                   *events_)
    , backup_(*client_, config_.bucket_name, config_.backup_bucket_name,
              config_.backup_format, std::move(clock), *events_)
    , urls_(config_, *client_) {}

void Storage::ready() {
    provisioner_.ensure();
}

template <typename Fn>
auto Storage::instrumented(const char* op, const std::string& key, uint64_t bytes, Fn&& fn) {
    Event event;
    event.level = EventLevel::Debug;
    event.name = op;
    event.bytes = bytes;
    event.fields["bucket"] = config_.bucket_name;
    event.fields["key"] = key;
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    try {
        if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
            fn();
            event.duration_secs = elapsed();
            events_->emit(event);
        } else {
            auto result = fn();
            event.duration_secs = elapsed();
            events_->emit(event);
            return result;
        }
    } catch (const StorageError& e) {
        event.level = EventLevel::Error;
        event.success = false;
        event.duration_secs = elapsed();
        event.fields["error"] = e.what();
        events_->emit(event);
        throw;
    }
}

StatResult Storage::stat(const std::string& key, const char* op) {
    auto result = client_->stat_object(config_.bucket_name, key);
    if (!result.success) {
        throw_store_error(std::string(op) + " " + config_.bucket_name + "/" + key, result);
    }
    return result;
}

std::string Storage::get_available_name(const std::string& name) {
    std::string key = object_key(name, "name");
    ready();
    std::string candidate = key;
    for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
        auto result = client_->stat_object(config_.bucket_name, candidate);
        if (result.is(StoreErrorCode::NoSuchKey)) {
            return candidate;
        }
        if (!result.success) {
            throw_store_error("stat " + config_.bucket_name + "/" + candidate, result);
        }
        candidate = paths::alternative_name(key, paths::random_suffix());
    }
    throw StorageError("no free name for " + config_.bucket_name + "/" + key + " after " +
                       std::to_string(kMaxNameAttempts) + " attempts");
}

std::string Storage::save(const std::string& name, std::span<const uint8_t> content,
                          const Metadata& metadata) {
    std::string key = object_key(name, "save");

    return instrumented("save", key, content.size(), [&] {
        ready();
        std::string target = config_.file_overwrite ? key : get_available_name(key);

        PutOptions options;
        options.content_type = paths::guess_content_type(target);
        options.metadata = config_.object_metadata;
        for (const auto& [k, v] : metadata) {
            options.metadata[k] = v;
        }
        for (auto it = options.metadata.begin(); it != options.metadata.end();) {
            if (iequals(it->first, "Content-Type")) {
                options.content_type = it->second;
                it = options.metadata.erase(it);
            } else {
                ++it;
            }
        }

        auto result = client_->put_object(config_.bucket_name, target, content, options);
        if (!result.success) {
            throw_store_error("save " + config_.bucket_name + "/" + target, result);
        }
        return target;
    });
}

std::string Storage::save(const std::string& name, const std::string& content,
                          const Metadata& metadata) {
    return save(name, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(content.data()),
                                               content.size()),
                metadata);
}

std::string Storage::save(const std::string& name, std::istream& content,
                          const Metadata& metadata) {
    content.clear();
    content.seekg(0, std::ios::beg);
    if (content.fail()) {
        // not seekable, upload whatever is left
        content.clear();
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(content)),
                              std::istreambuf_iterator<char>());
    if (content.bad()) {
        throw StorageError("reading content for " + name + " failed");
    }
    return save(name, std::span<const uint8_t>(data), metadata);
}

ObjectFile Storage::open(const std::string& name, const std::string& mode) {
    if (!is_read_mode(mode)) {
        throw std::invalid_argument("objects can only be opened for reading, got mode '" +
                                    mode + "'");
    }
    std::string key = object_key(name, "open");

    return instrumented("open", key, 0, [&] {
        ready();
        auto result = client_->get_object(config_.bucket_name, key);
        if (!result.success) {
            throw_store_error("open " + config_.bucket_name + "/" + key, result);
        }
        return ObjectFile(key, std::move(result.data), std::move(result.metadata));
    });
}

bool Storage::exists(const std::string& name) {
    std::string key = object_key(name, "check");

    return instrumented("exists", key, 0, [&] {
        ready();
        auto result = client_->stat_object(config_.bucket_name, key);
        if (result.success) return true;
        if (result.is(StoreErrorCode::NoSuchKey)) return false;
        throw_store_error("exists " + config_.bucket_name + "/" + key, result);
    });
}

void Storage::remove(const std::string& name) {
    std::string key = object_key(name, "delete");

    instrumented("delete", key, 0, [&] {
        ready();
        backup_.remove(key);
    });
}

DirectoryListing Storage::listdir(const std::string& path) {
    std::string prefix = paths::listing_prefix(path);

    return instrumented("listdir", prefix, 0, [&] {
        ready();
        ListOptions options;
        options.prefix = prefix;
        auto result = client_->list_objects(config_.bucket_name, options);
        if (!result.success) {
            throw_store_error("listdir " + config_.bucket_name + "/" + prefix, result);
        }

        DirectoryListing listing;
        for (const auto& entry : result.entries) {
            if (!entry.key.starts_with(prefix)) continue;
            std::string rel = entry.key.substr(prefix.size());
            if (entry.is_directory) {
                rel = paths::strip_trailing_slashes(rel);
                if (!rel.empty()) listing.directories.push_back(std::move(rel));
            } else if (!rel.empty()) {
                // an entry equal to the prefix is a folder placeholder
                listing.files.push_back(std::move(rel));
            }
        }
        return listing;
    });
}

std::string Storage::url(const std::string& name, const UrlOptions& options) {
    std::string key = object_key(name, "link");

    return instrumented("url", key, 0, [&] {
        ready();
        return urls_.build(key, options);
    });
}

uint64_t Storage::size(const std::string& name) {
    std::string key = object_key(name, "stat");

    return instrumented("size", key, 0, [&] {
        ready();
        return stat(key, "size").metadata.size;
    });
}

std::chrono::system_clock::time_point Storage::last_modified(const std::string& name) {
    std::string key = object_key(name, "stat");

    return instrumented("last_modified", key, 0, [&] {
        ready();
        return stat(key, "last_modified").metadata.last_modified;
    });
}

std::chrono::system_clock::time_point Storage::accessed_time(const std::string& name) {
    return last_modified(name);
}

std::chrono::system_clock::time_point Storage::created_time(const std::string& name) {
    return last_modified(name);
}

} // namespace objstore
