#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace objstore {

// Anonymous-access intent for a bucket
enum class PolicyKind {
    None,
    GetOnly,
    ReadOnly,
    WriteOnly,
    ReadWrite
};

// "NONE", "GET_ONLY", ...
const char* policy_kind_name(PolicyKind kind);

// Accepts the upper-case names above; nullopt for anything else
std::optional<PolicyKind> parse_policy_kind(std::string_view name);

/// Bucket policy document granting anonymous principals `kind` on `bucket`.
/// Returns nullopt for PolicyKind::None: no document is issued and the bucket
/// keeps the store default. Output is byte-identical for identical inputs.
/// Throws std::logic_error for a value outside the enum.
std::optional<std::string> to_native_policy(const std::string& bucket, PolicyKind kind);

} // namespace objstore
