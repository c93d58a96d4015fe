// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <gtest/gtest.h>
#include <stdlib.h>

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "kernel.hpp"
#include "policy_hooks.hpp"
#include "topology.hpp"

namespace capkern {
namespace testing_support {

// Manually advanced monotonic clock.
class FakeClock {
  public:
    explicit FakeClock(uint64_t start = 0) : now_(start) {}

    void set(uint64_t ms) { now_.store(ms); }
    void advance(uint64_t ms) { now_.fetch_add(ms); }
    [[nodiscard]] uint64_t now() const { return now_.load(); }

    PlatformDeps deps()
    {
        PlatformDeps d;
        d.now_ms = &FakeClock::read;
        d.user_ctx = this;
        return d;
    }

  private:
    static uint64_t read(void* ctx) { return static_cast<FakeClock*>(ctx)->now(); }

    std::atomic<uint64_t> now_;
};

class FnPolicy : public PolicyHandler {
  public:
    explicit FnPolicy(std::function<PolicyDecision(const PolicyQuery&)> fn) : fn_(std::move(fn)) {}

    PolicyDecision decide(const PolicyQuery& query) override { return fn_(query); }

  private:
    std::function<PolicyDecision(const PolicyQuery&)> fn_;
};

inline std::shared_ptr<PolicyHandler> policy_fn(std::function<PolicyDecision(const PolicyQuery&)> fn)
{
    return std::make_shared<FnPolicy>(std::move(fn));
}

class ScopedEnvVar {
  public:
    ScopedEnvVar(const char* key, const std::string& value) : key_(key)
    {
        const char* existing = std::getenv(key_);
        if (existing) {
            had_previous_ = true;
            previous_ = existing;
        }
        ::setenv(key_, value.c_str(), 1);
    }

    ~ScopedEnvVar()
    {
        if (had_previous_) {
            ::setenv(key_, previous_.c_str(), 1);
        } else {
            ::unsetenv(key_);
        }
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

  private:
    const char* key_;
    bool had_previous_ = false;
    std::string previous_;
};

inline Topology parse_or_die(const std::string& text)
{
    TopologyIssues issues;
    auto topo = parse_topology_string(text, issues);
    EXPECT_TRUE(topo) << (issues.has_errors() ? issues.errors[0] : std::string("unknown"));
    return topo ? *topo : Topology{};
}

inline std::unique_ptr<Kernel> make_kernel(FakeClock& clock, const std::string& topology_text = "version=1\n",
                                           KernelConfig config = {})
{
    auto kernel = Kernel::create(std::move(config), parse_or_die(topology_text), clock.deps());
    EXPECT_TRUE(kernel) << (kernel ? "" : kernel.error().to_string());
    return kernel ? std::move(*kernel) : nullptr;
}

inline bool history_has(AuditSink& sink, AuditKind kind)
{
    sink.flush();
    for (const auto& record : sink.history()) {
        if (record.event.kind == kind) {
            return true;
        }
    }
    return false;
}

inline size_t history_count(AuditSink& sink, AuditKind kind)
{
    sink.flush();
    size_t n = 0;
    for (const auto& record : sink.history()) {
        if (record.event.kind == kind) {
            ++n;
        }
    }
    return n;
}

} // namespace testing_support
} // namespace capkern
