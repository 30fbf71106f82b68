#include "objstore/bucket_provisioner.hpp"
#include "objstore/errors.hpp"

#include <chrono>
#include <exception>

namespace objstore {

const char* bucket_state_name(BucketState state) {
    switch (state) {
        case BucketState::Uninitialized: return "uninitialized";
        case BucketState::Ready: return "ready";
        case BucketState::Failed: return "failed";
    }
    return "unknown";
}

ProvisionOutcome provision_bucket(ObjectStoreClient& client,
                                  const std::string& bucket,
                                  bool auto_create,
                                  bool assume_exists,
                                  PolicyKind policy) {
    if (assume_exists) {
        return ProvisionOutcome::Assumed;
    }

    auto exists = client.bucket_exists(bucket);
    if (!exists.success) {
        throw BucketError("checking bucket " + bucket + ": " + exists.error_message,
                          exists.error_code, exists.error_message);
    }
    if (exists.exists) {
        return ProvisionOutcome::Existed;
    }

    if (!auto_create) {
        throw BucketMissing("bucket " + bucket + " does not exist",
                            StoreErrorCode::NoSuchBucket);
    }

    auto created = client.make_bucket(bucket);
    if (!created.success) {
        throw BucketError("creating bucket " + bucket + ": " + created.error_message,
                          created.error_code, created.error_message);
    }

    if (auto document = to_native_policy(bucket, policy)) {
        auto applied = client.set_bucket_policy(bucket, *document);
        if (!applied.success) {
            throw BucketError("setting " + std::string(policy_kind_name(policy)) +
                              " policy on " + bucket + ": " + applied.error_message,
                              applied.error_code, applied.error_message);
        }
    }
    return ProvisionOutcome::Created;
}

BucketProvisioner::BucketProvisioner(ObjectStoreClient& client, Options options, EventSink& events)
    : client_(client)
    , options_(std::move(options))
    , events_(events) {}

void BucketProvisioner::ensure() {
    // Fast path: no lock once the latch has settled
    auto current = state_.load(std::memory_order_acquire);
    if (current == BucketState::Ready) return;
    if (current == BucketState::Failed) std::rethrow_exception(error_);

    std::lock_guard<std::mutex> lock(mutex_);
    current = state_.load(std::memory_order_acquire);
    if (current == BucketState::Ready) return;
    if (current == BucketState::Failed) std::rethrow_exception(error_);

    Event event;
    event.name = "provision";
    event.fields["bucket"] = options_.bucket;
    auto start = std::chrono::steady_clock::now();

    try {
        auto outcome = provision_bucket(client_, options_.bucket, options_.auto_create,
                                        options_.assume_exists, options_.policy);
        switch (outcome) {
            case ProvisionOutcome::Assumed: event.fields["outcome"] = "assumed"; break;
            case ProvisionOutcome::Existed: event.fields["outcome"] = "existed"; break;
            case ProvisionOutcome::Created:
                event.fields["outcome"] = "created";
                event.fields["policy"] = policy_kind_name(options_.policy);
                break;
        }
        state_.store(BucketState::Ready, std::memory_order_release);
    } catch (const std::exception& e) {
        // any failure is latched, not only store errors
        error_ = std::current_exception();
        state_.store(BucketState::Failed, std::memory_order_release);

        event.level = EventLevel::Error;
        event.success = false;
        event.fields["error"] = e.what();
        event.duration_secs = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();
        events_.emit(event);
        throw;
    }

    event.duration_secs = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    events_.emit(event);
}

} // namespace objstore
