#pragma once

#include "objstore/events.hpp"
#include "objstore/policy.hpp"
#include "objstore/storage/object_client.hpp"

#include <atomic>
#include <exception>
#include <mutex>
#include <string>

namespace objstore {

enum class BucketState { Uninitialized, Ready, Failed };

const char* bucket_state_name(BucketState state);

enum class ProvisionOutcome {
    Assumed,  // no network call made
    Existed,  // found, policy left untouched
    Created   // created, policy applied unless None
};

/// Make sure `bucket` is usable, once, without locking.
///   assume_exists: nothing is checked.
///   absent, !auto_create: throws BucketMissing.
///   absent, auto_create: creates it and applies `policy` (skipped for None).
///   present: returns; an existing policy is never reapplied or reconciled.
/// Store failures throw BucketError carrying the store's error.
ProvisionOutcome provision_bucket(ObjectStoreClient& client,
                                  const std::string& bucket,
                                  bool auto_create,
                                  bool assume_exists,
                                  PolicyKind policy);

// Runs provision_bucket exactly once per instance, however many threads call
// ensure() concurrently. Later callers see the cached result: ensure()
// returns once Ready and rethrows the original error once Failed.
class BucketProvisioner {
public:
    struct Options {
        std::string bucket;
        bool auto_create = false;
        bool assume_exists = false;
        PolicyKind policy = PolicyKind::None;
    };

    BucketProvisioner(ObjectStoreClient& client, Options options, EventSink& events);

    BucketProvisioner(const BucketProvisioner&) = delete;
    BucketProvisioner& operator=(const BucketProvisioner&) = delete;

    void ensure();

    BucketState state() const { return state_.load(std::memory_order_acquire); }

private:
    ObjectStoreClient& client_;
    Options options_;
    EventSink& events_;

    std::mutex mutex_;
    std::atomic<BucketState> state_{BucketState::Uninitialized};
    std::exception_ptr error_;  // set once, before state_ becomes Failed
};

} // namespace objstore
