#pragma once

#include "objstore/storage/object_client.hpp"

#include <stdexcept>
#include <string>

namespace objstore {

// Root of everything the storage layer throws. Carries the store's error
// (code and message) when one caused the failure.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message,
                          StoreErrorCode code = StoreErrorCode::None,
                          std::string cause = {})
        : std::runtime_error(message), code_(code), cause_(std::move(cause)) {}

    StoreErrorCode code() const { return code_; }
    const std::string& cause() const { return cause_; }

private:
    StoreErrorCode code_;
    std::string cause_;
};

// Invalid or half-configured settings, raised at construction
class ConfigError : public StorageError {
public:
    using StorageError::StorageError;
};

// Bucket absent and neither auto-create nor assume-exists
class BucketMissing : public StorageError {
public:
    using StorageError::StorageError;
};

// Existence check, create or policy call failed
class BucketError : public StorageError {
public:
    using StorageError::StorageError;
};

// Soft delete requested but the backup bucket is absent
class BackupBucketMissing : public StorageError {
public:
    using StorageError::StorageError;
};

class ObjectNotFound : public StorageError {
public:
    using StorageError::StorageError;
};

// Store call failed for network, auth or unclassified reasons
class TransportError : public StorageError {
public:
    using StorageError::StorageError;
};

// Throws ObjectNotFound for NoSuchKey, TransportError otherwise.
// `what` names the operation, e.g. "stat media/a.txt".
[[noreturn]] void throw_store_error(const std::string& what, const StoreStatus& status);

} // namespace objstore
