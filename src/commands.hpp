// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <string>

namespace capkern {

// capkernctl subcommands. Each returns the process exit code.
int cmd_topology_validate(const std::string& path, bool verbose);
int cmd_audit_verify(const std::string& path);
int cmd_audit_tail(const std::string& path, size_t count);
int cmd_version();

int run_cli(int argc, char** argv);

} // namespace capkern
