#include "objstore/errors.hpp"

namespace objstore {

void throw_store_error(const std::string& what, const StoreStatus& status) {
    std::string message = what + ": " + status.error_message;
    if (status.error_code == StoreErrorCode::NoSuchKey) {
        throw ObjectNotFound(message, status.error_code, status.error_message);
    }
    throw TransportError(message, status.error_code, status.error_message);
}

} // namespace objstore
