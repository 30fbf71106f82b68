#include "objstore/policy.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <vector>

namespace objstore {

namespace {

using json = nlohmann::json;

json statement(const std::vector<std::string>& actions, const std::string& resource) {
    return json{
        {"Sid", ""},
        {"Effect", "Allow"},
        {"Principal", {{"AWS", "*"}}},
        {"Action", actions},
        {"Resource", resource},
    };
}

json read_statements(const std::string& bucket) {
    return json::array({
        statement({"s3:GetBucketLocation", "s3:ListBucket"}, "arn:aws:s3:::" + bucket),
        statement({"s3:GetObject"}, "arn:aws:s3:::" + bucket + "/*"),
    });
}

json write_statements(const std::string& bucket) {
    return json::array({
        statement({"s3:GetBucketLocation", "s3:ListBucketMultipartUploads"},
                  "arn:aws:s3:::" + bucket),
        statement({"s3:ListMultipartUploadParts", "s3:AbortMultipartUpload",
                   "s3:DeleteObject", "s3:PutObject"},
                  "arn:aws:s3:::" + bucket + "/*"),
    });
}

} // namespace

const char* policy_kind_name(PolicyKind kind) {
    switch (kind) {
        case PolicyKind::None: return "NONE";
        case PolicyKind::GetOnly: return "GET_ONLY";
        case PolicyKind::ReadOnly: return "READ_ONLY";
        case PolicyKind::WriteOnly: return "WRITE_ONLY";
        case PolicyKind::ReadWrite: return "READ_WRITE";
    }
    return "UNKNOWN";
}

std::optional<PolicyKind> parse_policy_kind(std::string_view name) {
    if (name == "NONE") return PolicyKind::None;
    if (name == "GET_ONLY") return PolicyKind::GetOnly;
    if (name == "READ_ONLY") return PolicyKind::ReadOnly;
    if (name == "WRITE_ONLY") return PolicyKind::WriteOnly;
    if (name == "READ_WRITE") return PolicyKind::ReadWrite;
    return std::nullopt;
}

std::optional<std::string> to_native_policy(const std::string& bucket, PolicyKind kind) {
    json statements;
    switch (kind) {
        case PolicyKind::None:
            return std::nullopt;
        case PolicyKind::GetOnly:
            statements = json::array({statement({"s3:GetObject"}, "arn:aws:s3:::" + bucket + "/*")});
            break;
        case PolicyKind::ReadOnly:
            statements = read_statements(bucket);
            break;
        case PolicyKind::WriteOnly:
            statements = write_statements(bucket);
            break;
        case PolicyKind::ReadWrite:
            statements = read_statements(bucket);
            for (auto& s : write_statements(bucket)) {
                statements.push_back(std::move(s));
            }
            break;
        default:
            throw std::logic_error("unmapped policy kind " +
                                   std::to_string(static_cast<int>(kind)));
    }

    json document{
        {"Version", "2012-10-17"},
        {"Statement", std::move(statements)},
    };
    // object keys are emitted sorted, so the text is stable
    return document.dump();
}

} // namespace objstore
