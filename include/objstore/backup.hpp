#pragma once

#include "objstore/events.hpp"
#include "objstore/storage/object_client.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace objstore {

using Clock = std::function<std::chrono::system_clock::time_point()>;

// strftime(format, now in UTC) + key, no separator added
std::string render_backup_key(const std::string& format, const std::string& key,
                              std::chrono::system_clock::time_point now);

// Deletes objects from `bucket`, archiving them first when a backup bucket
// and format are configured.
class BackupResolver {
public:
    BackupResolver(ObjectStoreClient& client,
                   std::string bucket,
                   std::optional<std::string> backup_bucket,
                   std::optional<std::string> backup_format,
                   Clock clock,
                   EventSink& events);

    bool enabled() const { return backup_bucket_.has_value(); }

    /// Remove `key` from the primary bucket.
    /// With backup enabled the object is copied to the backup bucket under
    /// render_backup_key() first; removal is only issued once that copy
    /// succeeded. Throws BackupBucketMissing (backup bucket absent),
    /// ObjectNotFound or TransportError, leaving the source in place.
    /// Returns the backup key, or nullopt when no backup was made.
    std::optional<std::string> remove(const std::string& key);

private:
    ObjectStoreClient& client_;
    std::string bucket_;
    std::optional<std::string> backup_bucket_;
    std::optional<std::string> backup_format_;
    Clock clock_;
    EventSink& events_;
};

} // namespace objstore
