// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <iosfwd>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "result.hpp"
#include "types.hpp"

namespace capkern {

inline constexpr int kTopologyVersion = 1;

struct TopologyIssues {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    [[nodiscard]] bool has_errors() const { return !errors.empty(); }
    [[nodiscard]] bool has_warnings() const { return !warnings.empty(); }
};

struct Route {
    CapsuleId from = 0;
    std::string endpoint;
};

/**
 * The static capsule/endpoint graph fixed at boot. Immutable after
 * parsing, so lookups need no locking.
 */
class Topology {
  public:
    int version = 0;
    std::vector<EndpointConfig> endpoints;
    std::vector<Route> routes;
    std::map<CapsuleId, std::string> notify;

    [[nodiscard]] const EndpointConfig* find_endpoint(const std::string& name) const;
    [[nodiscard]] bool can_send(CapsuleId from, const std::string& endpoint) const;
    [[nodiscard]] const std::string* notify_endpoint(CapsuleId capsule) const;

    void add_route(CapsuleId from, const std::string& endpoint);

  private:
    std::set<std::pair<CapsuleId, std::string>> edges_;
};

Result<Topology> parse_topology_file(const std::string& path, TopologyIssues& issues);
Result<Topology> parse_topology_string(const std::string& text, TopologyIssues& issues);
Result<Topology> parse_topology_stream(std::istream& in, TopologyIssues& issues);

void report_topology_issues(const TopologyIssues& issues);

} // namespace capkern
