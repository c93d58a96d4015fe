// cppcheck-suppress-file missingIncludeSystem
/*
 * capkern - operator command implementations
 */

#include "commands.hpp"

#include <iostream>
#include <vector>

#include "audit.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "sha256.hpp"
#include "topology.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace capkern {

namespace {

void print_usage()
{
    std::cerr << "Usage: capkernctl <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  topology validate <path> [--verbose]   Parse and check a topology file\n"
              << "  audit verify <path>                    Recompute the hash chain of an audit log\n"
              << "  audit tail <path> [--count N]          Print the last N audit records (default 10)\n"
              << "  version                                Print the version\n";
}

} // namespace

int cmd_topology_validate(const std::string& path, bool verbose)
{
    TopologyIssues issues;
    auto result = parse_topology_file(path, issues);
    report_topology_issues(issues);
    if (!result) {
        logger().log(SLOG_ERROR("Topology validation failed").field("error", result.error().to_string()));
        return 1;
    }
    const Topology& topology = *result;

    std::string digest;
    if (!sha256_file_hex(path, digest)) {
        logger().log(SLOG_WARN("Failed to hash topology file").field("path", path));
    }

    std::cout << "Topology validation successful.\n\n";
    std::cout << "Summary:\n";
    std::cout << "  Version: " << topology.version << "\n";
    std::cout << "  Endpoints: " << topology.endpoints.size() << "\n";
    std::cout << "  Routes: " << topology.routes.size() << "\n";
    std::cout << "  Notify bindings: " << topology.notify.size() << "\n";
    if (!digest.empty()) {
        std::cout << "  SHA-256: " << digest << "\n";
    }

    if (verbose) {
        if (!topology.endpoints.empty()) {
            std::cout << "\nEndpoints:\n";
            for (const auto& ep : topology.endpoints) {
                std::cout << "  - " << ep.name << " owner=" << ep.owner << " capacity=" << ep.capacity
                          << " ordering=" << ordering_mode_name(ep.ordering)
                          << " blocking=" << (ep.blocking ? "true" : "false");
                if (ep.blocking) {
                    std::cout << " block_timeout_ms=" << ep.block_timeout_ms;
                }
                std::cout << " max_message=" << ep.max_message_bytes << " drop=" << drop_policy_name(ep.drop)
                          << "\n";
            }
        }
        if (!topology.routes.empty()) {
            std::cout << "\nRoutes:\n";
            for (const auto& route : topology.routes) {
                std::cout << "  - " << route.from << " -> " << route.endpoint << "\n";
            }
        }
        if (!topology.notify.empty()) {
            std::cout << "\nNotify:\n";
            for (const auto& [capsule, endpoint] : topology.notify) {
                std::cout << "  - " << capsule << " = " << endpoint << "\n";
            }
        }
    }

    if (issues.has_warnings()) {
        std::cout << "\nWarnings: " << issues.warnings.size() << "\n";
    }
    return 0;
}

int cmd_audit_verify(const std::string& path)
{
    auto result = verify_audit_log_file(path);
    if (!result) {
        logger().log(SLOG_ERROR("Audit chain verification failed")
                         .field("path", path)
                         .field("error", result.error().to_string()));
        std::cout << "Audit chain INVALID: " << result.error().to_string() << "\n";
        return 1;
    }
    std::cout << "Audit chain OK: " << *result << " records verified.\n";
    return 0;
}

int cmd_audit_tail(const std::string& path, size_t count)
{
    auto records = read_audit_log_file(path);
    if (!records) {
        logger().log(SLOG_ERROR("Failed to read audit log").field("path", path).field("error", records.error().to_string()));
        return 1;
    }
    const std::vector<AuditRecord>& all = *records;
    const size_t start = all.size() > count ? all.size() - count : 0;
    for (size_t i = start; i < all.size(); ++i) {
        const AuditRecord& rec = all[i];
        std::cout << rec.seq << " " << rec.event.timestamp_ms << "ms " << audit_kind_name(rec.event.kind) << " "
                  << audit_outcome_name(rec.event.outcome) << " capsule=" << rec.event.subject
                  << " object=" << object_id_to_string(rec.event.object);
        if (!rec.event.reason.empty()) {
            std::cout << " reason=\"" << rec.event.reason << "\"";
        }
        std::cout << "\n";
    }
    return 0;
}

int cmd_version()
{
    std::cout << "capkernctl " << kVersion << "\n";
    return 0;
}

int run_cli(int argc, char** argv)
{
    apply_logging_config(kernel_config_from_env());

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        print_usage();
        return 1;
    }

    const std::string& cmd = args[0];
    if (cmd == "version" || cmd == "--version") {
        return cmd_version();
    }
    if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage();
        return 0;
    }

    if (cmd == "topology") {
        if (args.size() < 3 || args[1] != "validate") {
            print_usage();
            return 1;
        }
        bool verbose = false;
        for (size_t i = 3; i < args.size(); ++i) {
            if (args[i] == "--verbose" || args[i] == "-v") {
                verbose = true;
            } else {
                logger().log(SLOG_ERROR("Unknown option").field("option", args[i]));
                return 1;
            }
        }
        return cmd_topology_validate(args[2], verbose);
    }

    if (cmd == "audit") {
        if (args.size() < 3) {
            print_usage();
            return 1;
        }
        if (args[1] == "verify" && args.size() == 3) {
            return cmd_audit_verify(args[2]);
        }
        if (args[1] == "tail") {
            uint64_t count = 10;
            for (size_t i = 3; i < args.size(); ++i) {
                if (args[i] == "--count" && i + 1 < args.size()) {
                    if (!parse_uint64(args[i + 1], count) || count == 0) {
                        logger().log(SLOG_ERROR("Invalid --count value").field("value", args[i + 1]));
                        return 1;
                    }
                    ++i;
                } else {
                    logger().log(SLOG_ERROR("Unknown option").field("option", args[i]));
                    return 1;
                }
            }
            return cmd_audit_tail(args[2], static_cast<size_t>(count));
        }
        print_usage();
        return 1;
    }

    logger().log(SLOG_ERROR("Unknown command").field("command", cmd));
    print_usage();
    return 1;
}

} // namespace capkern
