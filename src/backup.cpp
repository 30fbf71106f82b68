#include "objstore/backup.hpp"
#include "objstore/errors.hpp"

#include <ctime>
#include <vector>

namespace objstore {

std::string render_backup_key(const std::string& format, const std::string& key,
                              std::chrono::system_clock::time_point now) {
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time, &tm);

    // strftime returns 0 both for "buffer too small" and for an empty
    // expansion, so grow a few times before accepting an empty prefix
    std::vector<char> buf(format.size() * 4 + 64);
    for (int attempt = 0; attempt < 4; ++attempt) {
        size_t n = std::strftime(buf.data(), buf.size(), format.c_str(), &tm);
        if (n > 0) {
            return std::string(buf.data(), n) + key;
        }
        buf.resize(buf.size() * 4);
    }
    return key;
}

BackupResolver::BackupResolver(ObjectStoreClient& client,
                               std::string bucket,
                               std::optional<std::string> backup_bucket,
                               std::optional<std::string> backup_format,
                               Clock clock,
                               EventSink& events)
    : client_(client)
    , bucket_(std::move(bucket))
    , backup_bucket_(std::move(backup_bucket))
    , backup_format_(std::move(backup_format))
    , clock_(std::move(clock))
    , events_(events) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

std::optional<std::string> BackupResolver::remove(const std::string& key) {
    const std::string what = "delete " + bucket_ + "/" + key;

    if (!enabled()) {
        // S3 deletes of missing keys succeed silently, so look first
        auto stat = client_.stat_object(bucket_, key);
        if (!stat.success) {
            throw_store_error(what, stat);
        }
        auto removed = client_.remove_object(bucket_, key);
        if (!removed.success) {
            throw_store_error(what, removed);
        }
        return std::nullopt;
    }

    auto exists = client_.bucket_exists(*backup_bucket_);
    if (!exists.success) {
        throw_store_error(what + ": checking backup bucket " + *backup_bucket_, exists);
    }
    if (!exists.exists) {
        Event event;
        event.level = EventLevel::Error;
        event.name = "backup";
        event.success = false;
        event.fields["key"] = key;
        event.fields["backup_bucket"] = *backup_bucket_;
        event.fields["error"] = "backup bucket missing";
        events_.emit(event);
        throw BackupBucketMissing("backup bucket " + *backup_bucket_ + " does not exist; " +
                                  key + " was not deleted",
                                  StoreErrorCode::NoSuchBucket);
    }

    std::string backup_key = render_backup_key(*backup_format_, key, clock_());

    auto copied = client_.copy_object(bucket_, key, *backup_bucket_, backup_key);
    if (!copied.success) {
        throw_store_error(what + ": copy to " + *backup_bucket_ + "/" + backup_key, copied);
    }

    // A failure here leaves the object in both places, never in neither
    auto removed = client_.remove_object(bucket_, key);
    if (!removed.success) {
        throw_store_error(what + " (backup already at " + *backup_bucket_ + "/" + backup_key + ")",
                          removed);
    }

    Event event;
    event.name = "backup";
    event.fields["key"] = key;
    event.fields["backup_bucket"] = *backup_bucket_;
    event.fields["backup_key"] = backup_key;
    events_.emit(event);
    return backup_key;
}

} // namespace objstore
