// cppcheck-suppress-file missingIncludeSystem
#include "topology.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <unordered_set>

#include "logging.hpp"
#include "utils.hpp"

namespace capkern {

namespace {

std::string at_line(size_t line_no)
{
    return "line " + std::to_string(line_no) + ": ";
}

bool parse_capsule_id(const std::string& value, CapsuleId& out)
{
    uint64_t v = 0;
    if (!parse_uint64(value, v) || v == kKernelCapsule || v > UINT32_MAX) {
        return false;
    }
    out = static_cast<CapsuleId>(v);
    return true;
}

bool parse_u32_value(const std::string& value, uint32_t& out)
{
    uint64_t v = 0;
    if (!parse_uint64(value, v) || v > UINT32_MAX) {
        return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

bool valid_endpoint_name(const std::string& name)
{
    if (name.empty() || name.size() > 64) {
        return false;
    }
    for (char c : name) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
                        c == '-' || c == '.';
        if (!ok) {
            return false;
        }
    }
    return true;
}

// `<name> key=value ...`
void parse_endpoint_line(const std::string& trimmed, size_t line_no, Topology& topology,
                         std::unordered_set<std::string>& seen, TopologyIssues& issues)
{
    const std::vector<std::string> parts = split_whitespace(trimmed);
    EndpointConfig cfg;
    cfg.name = parts[0];
    if (!valid_endpoint_name(cfg.name)) {
        issues.errors.push_back(at_line(line_no) + "invalid endpoint name '" + cfg.name + "'");
        return;
    }

    bool have_owner = false;
    bool have_capacity = false;
    bool ok = true;
    for (size_t i = 1; i < parts.size(); ++i) {
        std::string key;
        std::string value;
        if (!parse_key_value(parts[i], key, value)) {
            issues.errors.push_back(at_line(line_no) + "expected key=value, got '" + parts[i] + "'");
            ok = false;
            continue;
        }
        if (key == "owner") {
            if (!parse_capsule_id(value, cfg.owner)) {
                issues.errors.push_back(at_line(line_no) + "invalid owner capsule '" + value + "'");
                ok = false;
            }
            have_owner = true;
        } else if (key == "capacity") {
            if (!parse_u32_value(value, cfg.capacity) || cfg.capacity == 0) {
                issues.errors.push_back(at_line(line_no) + "capacity must be a positive integer");
                ok = false;
            }
            have_capacity = true;
        } else if (key == "ordering") {
            if (value == "fifo") {
                cfg.ordering = OrderingMode::Fifo;
            } else if (value == "round_robin") {
                cfg.ordering = OrderingMode::RoundRobin;
            } else {
                issues.errors.push_back(at_line(line_no) + "unknown ordering '" + value + "'");
                ok = false;
            }
        } else if (key == "blocking") {
            if (!parse_bool(value, cfg.blocking)) {
                issues.errors.push_back(at_line(line_no) + "invalid blocking flag '" + value + "'");
                ok = false;
            }
        } else if (key == "block_timeout_ms") {
            if (!parse_u32_value(value, cfg.block_timeout_ms)) {
                issues.errors.push_back(at_line(line_no) + "invalid block_timeout_ms '" + value + "'");
                ok = false;
            }
        } else if (key == "max_message") {
            if (!parse_u32_value(value, cfg.max_message_bytes) || cfg.max_message_bytes == 0) {
                issues.errors.push_back(at_line(line_no) + "max_message must be a positive integer");
                ok = false;
            }
        } else if (key == "drop") {
            if (value == "reject") {
                cfg.drop = DropPolicy::Reject;
            } else if (value == "lower_priority") {
                cfg.drop = DropPolicy::DropLowerPriority;
            } else {
                issues.errors.push_back(at_line(line_no) + "unknown drop policy '" + value + "'");
                ok = false;
            }
        } else {
            issues.errors.push_back(at_line(line_no) + "unknown endpoint key '" + key + "'");
            ok = false;
        }
    }

    if (!have_owner) {
        issues.errors.push_back(at_line(line_no) + "endpoint '" + cfg.name + "' is missing owner=");
        ok = false;
    }
    if (!have_capacity) {
        issues.warnings.push_back(at_line(line_no) + "endpoint '" + cfg.name + "' has no capacity; using " +
                                  std::to_string(cfg.capacity));
    }
    if (cfg.block_timeout_ms != 0 && !cfg.blocking) {
        issues.warnings.push_back(at_line(line_no) + "block_timeout_ms has no effect unless blocking=true");
    }
    if (!seen.insert(cfg.name).second) {
        issues.errors.push_back(at_line(line_no) + "duplicate endpoint '" + cfg.name + "'");
        return;
    }
    if (ok) {
        topology.endpoints.push_back(std::move(cfg));
    }
}

} // namespace

const EndpointConfig* Topology::find_endpoint(const std::string& name) const
{
    for (const auto& cfg : endpoints) {
        if (cfg.name == name) {
            return &cfg;
        }
    }
    return nullptr;
}

bool Topology::can_send(CapsuleId from, const std::string& endpoint) const
{
    return edges_.count(std::make_pair(from, endpoint)) != 0;
}

const std::string* Topology::notify_endpoint(CapsuleId capsule) const
{
    auto it = notify.find(capsule);
    return it == notify.end() ? nullptr : &it->second;
}

void Topology::add_route(CapsuleId from, const std::string& endpoint)
{
    if (edges_.emplace(from, endpoint).second) {
        routes.push_back(Route{from, endpoint});
    }
}

void report_topology_issues(const TopologyIssues& issues)
{
    for (const auto& err : issues.errors) {
        logger().log(SLOG_ERROR("Topology error").field("detail", err));
    }
    for (const auto& warn : issues.warnings) {
        logger().log(SLOG_WARN("Topology warning").field("detail", warn));
    }
}

Result<Topology> parse_topology_file(const std::string& path, TopologyIssues& issues)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        issues.errors.push_back("Failed to open '" + path + "': " + std::strerror(errno));
        return Error(ErrorCode::ConfigParseFailed, "Failed to open topology file", path);
    }
    return parse_topology_stream(in, issues);
}

Result<Topology> parse_topology_string(const std::string& text, TopologyIssues& issues)
{
    std::istringstream in(text);
    return parse_topology_stream(in, issues);
}

Result<Topology> parse_topology_stream(std::istream& in, TopologyIssues& issues)
{
    Topology topology;
    std::string section;
    std::unordered_set<std::string> endpoint_seen;
    // Routes and notify targets may name endpoints declared later in the file.
    std::vector<std::pair<size_t, Route>> pending_routes;
    std::vector<std::pair<size_t, std::pair<CapsuleId, std::string>>> pending_notify;

    static const std::unordered_set<std::string> valid_sections = {"endpoint", "route", "notify"};

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            section = trim(trimmed.substr(1, trimmed.size() - 2));
            if (valid_sections.find(section) == valid_sections.end()) {
                issues.errors.push_back(at_line(line_no) + "unknown section '" + section + "'");
                section = "?";
            }
            continue;
        }

        if (section.empty()) {
            std::string key;
            std::string value;
            if (!parse_key_value(trimmed, key, value)) {
                issues.errors.push_back(at_line(line_no) + "expected key=value in header");
                continue;
            }
            if (key == "version") {
                uint64_t version = 0;
                if (!parse_uint64(value, version) || version == 0 || version > 1000) {
                    issues.errors.push_back(at_line(line_no) + "invalid version");
                    continue;
                }
                topology.version = static_cast<int>(version);
            } else {
                issues.errors.push_back(at_line(line_no) + "unknown header key '" + key + "'");
            }
            continue;
        }

        if (section == "endpoint") {
            parse_endpoint_line(trimmed, line_no, topology, endpoint_seen, issues);
            continue;
        }

        if (section == "route") {
            const size_t arrow = trimmed.find("->");
            if (arrow == std::string::npos) {
                issues.errors.push_back(at_line(line_no) + "expected '<capsule> -> <endpoint>'");
                continue;
            }
            Route route;
            const std::string from = trim(trimmed.substr(0, arrow));
            route.endpoint = trim(trimmed.substr(arrow + 2));
            if (!parse_capsule_id(from, route.from)) {
                issues.errors.push_back(at_line(line_no) + "invalid capsule id '" + from + "'");
                continue;
            }
            if (!valid_endpoint_name(route.endpoint)) {
                issues.errors.push_back(at_line(line_no) + "invalid endpoint name '" + route.endpoint + "'");
                continue;
            }
            pending_routes.emplace_back(line_no, std::move(route));
            continue;
        }

        if (section == "notify") {
            std::string key;
            std::string value;
            CapsuleId capsule = 0;
            if (!parse_key_value(trimmed, key, value)) {
                issues.errors.push_back(at_line(line_no) + "expected '<capsule> = <endpoint>'");
                continue;
            }
            if (!parse_capsule_id(key, capsule)) {
                issues.errors.push_back(at_line(line_no) + "invalid capsule id '" + key + "'");
                continue;
            }
            pending_notify.emplace_back(line_no, std::make_pair(capsule, value));
            continue;
        }
        // Lines under an unknown section were already reported with the header.
    }

    for (auto& [ln, route] : pending_routes) {
        if (!topology.find_endpoint(route.endpoint)) {
            issues.errors.push_back(at_line(ln) + "route to unknown endpoint '" + route.endpoint + "'");
            continue;
        }
        if (topology.can_send(route.from, route.endpoint)) {
            issues.warnings.push_back(at_line(ln) + "duplicate route " + std::to_string(route.from) + " -> " +
                                      route.endpoint);
            continue;
        }
        topology.add_route(route.from, route.endpoint);
    }

    for (auto& [ln, entry] : pending_notify) {
        const EndpointConfig* target = topology.find_endpoint(entry.second);
        if (!target) {
            issues.errors.push_back(at_line(ln) + "notify endpoint '" + entry.second + "' is not declared");
            continue;
        }
        if (target->owner != entry.first) {
            issues.warnings.push_back(at_line(ln) + "notify endpoint '" + entry.second + "' is owned by capsule " +
                                      std::to_string(target->owner) + ", not " + std::to_string(entry.first));
        }
        if (!topology.notify.emplace(entry.first, entry.second).second) {
            issues.errors.push_back(at_line(ln) + "capsule " + std::to_string(entry.first) +
                                    " already has a notify endpoint");
        }
    }

    for (const auto& cfg : topology.endpoints) {
        bool reachable = false;
        for (const auto& [capsule, name] : topology.notify) {
            if (name == cfg.name) {
                reachable = true;
                break;
            }
        }
        for (const auto& route : topology.routes) {
            if (route.endpoint == cfg.name) {
                reachable = true;
                break;
            }
        }
        if (!reachable) {
            issues.warnings.push_back("endpoint '" + cfg.name + "' has no inbound route");
        }
    }

    if (topology.version == 0) {
        issues.errors.push_back("missing header key: version");
    } else if (topology.version != kTopologyVersion) {
        issues.errors.push_back("unsupported topology version: " + std::to_string(topology.version));
    }

    if (issues.has_errors()) {
        return Error(ErrorCode::ConfigParseFailed, "Topology parsing failed with errors");
    }
    return topology;
}

} // namespace capkern
