// objstore-admin: verify, list, create and delete buckets of a configured
// object store.
//
// Usage: objstore-admin [options] <subcommand> [args]
//
// Subcommands:
//   check                        Fail unless the bucket exists
//   create                       Make the bucket
//   delete                       Remove the bucket, which must be empty
//   ls [--dirs] [--files] [-r] [-p prefix] [-f format] [--buckets]
//                                List objects, or buckets with --buckets
//   policy [--set KIND]          Show or set the bucket policy

#include "objstore/admin.hpp"
#include "objstore/log.hpp"
#include "objstore/storage/s3_client.hpp"
#include "objstore/storage_config.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace {

void print_usage() {
    fprintf(stderr,
        "Usage: objstore-admin [options] <subcommand> [args]\n"
        "\n"
        "Subcommands:\n"
        "  check                         Fail unless the bucket exists\n"
        "  create                        Make the bucket\n"
        "  delete                        Remove the bucket, which must be empty\n"
        "  ls                            List bucket objects or buckets\n"
        "  policy                        Get or set the bucket policy\n"
        "\n"
        "Options:\n"
        "  --config <file>               JSON config (default: $OBJSTORE_CONFIG)\n"
        "  --storage <name>              Configured storage to use (default: media)\n"
        "  --bucket <name>               Bucket name (default: the storage's bucket)\n"
        "  -v, --verbose                 Debug logging\n"
        "\n"
        "ls options:\n"
        "  --dirs                        Include directories\n"
        "  --files                       Include files\n"
        "  -r, --recursive               Find files recursively\n"
        "  -p, --prefix <prefix>         Path prefix\n"
        "  -f, --format <format>         Line format ($name $size $modified $url $etag)\n"
        "  --buckets                     List buckets instead of files\n"
        "\n"
        "policy options:\n"
        "  --set <KIND>                  GET_ONLY, READ_ONLY, WRITE_ONLY or READ_WRITE\n");
}

struct Args {
    std::string config_path;
    std::string storage = "media";
    std::string bucket;
    std::string command;

    objstore::ListFilter filter;
    bool list_buckets = false;
    std::string set_policy;
};

// Returns false after printing the problem
bool parse_args(int argc, char* argv[], Args& args) {
    if (const char* env = std::getenv("OBJSTORE_CONFIG")) {
        args.config_path = env;
    }

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                fprintf(stderr, "Error: %s requires a value\n", name);
                return nullptr;
            }
            return argv[++i];
        };

        if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
            print_usage();
            exit(0);
        } else if (strcmp(arg, "--config") == 0) {
            const char* v = value(arg);
            if (!v) return false;
            args.config_path = v;
        } else if (strcmp(arg, "--storage") == 0) {
            const char* v = value(arg);
            if (!v) return false;
            args.storage = v;
        } else if (strcmp(arg, "--bucket") == 0) {
            const char* v = value(arg);
            if (!v) return false;
            args.bucket = v;
        } else if (strcmp(arg, "-v") == 0 || strcmp(arg, "--verbose") == 0) {
            objstore::set_log_level(objstore::LogLevel::Debug);
        } else if (strcmp(arg, "--dirs") == 0) {
            args.filter.dirs = true;
        } else if (strcmp(arg, "--files") == 0) {
            args.filter.files = true;
        } else if (strcmp(arg, "-r") == 0 || strcmp(arg, "--recursive") == 0) {
            args.filter.recursive = true;
        } else if (strcmp(arg, "-p") == 0 || strcmp(arg, "--prefix") == 0) {
            const char* v = value(arg);
            if (!v) return false;
            args.filter.prefix = v;
        } else if (strcmp(arg, "-f") == 0 || strcmp(arg, "--format") == 0) {
            const char* v = value(arg);
            if (!v) return false;
            args.filter.format = v;
        } else if (strcmp(arg, "--buckets") == 0) {
            args.list_buckets = true;
        } else if (strcmp(arg, "--set") == 0) {
            const char* v = value(arg);
            if (!v) return false;
            args.set_policy = v;
        } else if (arg[0] == '-') {
            fprintf(stderr, "Error: unknown option: %s\n", arg);
            return false;
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            fprintf(stderr, "Error: unexpected argument: %s\n", arg);
            return false;
        }
    }

    if (args.command.empty()) {
        print_usage();
        fprintf(stderr, "Error: command name required\n");
        return false;
    }
    return true;
}

int run(const Args& args) {
    objstore::ServiceConfig config;
    if (args.config_path.empty()) {
        fprintf(stderr, "Error: no config file (use --config or set OBJSTORE_CONFIG)\n");
        return 1;
    }
    if (!config.load_json(args.config_path)) {
        return 1;
    }
    config.client.load_env_credentials();

    auto err = config.client.validate();
    if (!err.empty()) {
        fprintf(stderr, "Configuration error: %s\n", err.c_str());
        return 1;
    }

    const objstore::StorageConfig* storage = config.storage(args.storage);
    if (!storage && args.bucket.empty()) {
        fprintf(stderr, "Error: no storage named '%s' in %s and no --bucket given\n",
                args.storage.c_str(), args.config_path.c_str());
        return 1;
    }
    std::string bucket = !args.bucket.empty() ? args.bucket : storage->bucket_name;

    auto client = objstore::create_s3_client(config.client);
    objstore::BucketAdmin admin(*client, storage);
    objstore::log_debug("%s on bucket %s at %s", args.command.c_str(), bucket.c_str(),
                        config.client.endpoint.c_str());

    if (args.command == "check") {
        admin.check(bucket);
    } else if (args.command == "create") {
        admin.create(bucket);
        fprintf(stderr, "created bucket: %s\n", bucket.c_str());
    } else if (args.command == "delete") {
        admin.remove_empty(bucket);
    } else if (args.command == "ls") {
        if (args.list_buckets) {
            for (const auto& info : admin.list_buckets()) {
                printf("%s\n", info.name.c_str());
            }
            return 0;
        }
        auto report = admin.list(bucket, args.filter);
        for (const auto& line : report.lines) {
            printf("%s\n", line.c_str());
        }
        if (report.summary) {
            fprintf(stderr, "%s\n", report.summary_line().c_str());
        }
    } else if (args.command == "policy") {
        if (args.set_policy.empty()) {
            printf("%s\n", admin.get_policy(bucket).c_str());
        } else {
            auto kind = objstore::parse_policy_kind(args.set_policy);
            if (!kind) {
                fprintf(stderr, "Error: unknown policy: %s\n", args.set_policy.c_str());
                return 1;
            }
            admin.set_policy(bucket, *kind);
        }
    } else {
        print_usage();
        fprintf(stderr, "Error: don't know how to handle command: %s\n", args.command.c_str());
        return 1;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        return 1;
    }

    try {
        return run(args);
    } catch (const objstore::StorageError& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
}
