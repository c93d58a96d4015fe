// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
// cppcheck-suppress-file unknownMacro
//
// Mediation hot-path benchmarks: capability validation, a send/recv round
// trip through the router, audit emission and the chain hash.
//
// Everything runs in-process against the real clock and randomness source.

#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "audit.hpp"
#include "config.hpp"
#include "kernel.hpp"
#include "message.hpp"
#include "sha256.hpp"
#include "topology.hpp"

namespace capkern {
namespace {

constexpr CapsuleId kServer = 1;
constexpr CapsuleId kClient = 2;

const char* kBenchTopology = R"(version=1

[endpoint]
inbox owner=1 capacity=64 ordering=fifo

[route]
2 -> inbox
)";

std::unique_ptr<Kernel> make_bench_kernel()
{
    TopologyIssues issues;
    auto topology = parse_topology_string(kBenchTopology, issues);
    if (!topology) {
        return nullptr;
    }
    KernelConfig config;
    config.log_level = LogLevel::Error;
    apply_logging_config(config);
    auto kernel = Kernel::create(config, *topology, PlatformDeps{});
    if (!kernel) {
        return nullptr;
    }
    return std::move(*kernel);
}

// ---------------------------------------------------------------------------
// validate(): the lookup every mediated operation starts with.
// ---------------------------------------------------------------------------
static void BM_ValidateHotPath(benchmark::State& state)
{
    auto kernel = make_bench_kernel();
    if (!kernel) {
        state.SkipWithError("kernel setup failed");
        return;
    }
    auto endpoint = kernel->create_endpoint(kServer, "inbox");
    if (!endpoint) {
        state.SkipWithError("endpoint setup failed");
        return;
    }
    for (auto _ : state) {
        auto resolved = kernel->validate(endpoint->holder, endpoint->token, Op::Recv);
        benchmark::DoNotOptimize(resolved);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ValidateHotPath)->Unit(benchmark::kNanosecond);

// ---------------------------------------------------------------------------
// send() followed by recv() on a delegated capability.
// ---------------------------------------------------------------------------
static void BM_SendRecvRoundTrip(benchmark::State& state)
{
    auto kernel = make_bench_kernel();
    if (!kernel) {
        state.SkipWithError("kernel setup failed");
        return;
    }
    auto endpoint = kernel->create_endpoint(kServer, "inbox");
    if (!endpoint) {
        state.SkipWithError("endpoint setup failed");
        return;
    }
    DelegateRequest request;
    request.ops = OpSet{Op::Send};
    request.target = kClient;
    auto sender = kernel->delegate(endpoint->holder, endpoint->token, request);
    if (!sender) {
        state.SkipWithError("delegation failed");
        return;
    }

    const std::vector<uint8_t> payload(static_cast<size_t>(state.range(0)), 0x5a);
    for (auto _ : state) {
        auto sent = kernel->send(sender->holder, sender->object, sender->token, make_message(1, payload));
        if (!sent) {
            state.SkipWithError(sent.error().to_string().c_str());
            return;
        }
        auto got = kernel->recv(endpoint->holder, endpoint->object, endpoint->token);
        benchmark::DoNotOptimize(got);
    }
    state.SetItemsProcessed(state.iterations());
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SendRecvRoundTrip)->Arg(16)->Arg(256)->Arg(4096)->Unit(benchmark::kMicrosecond);

// ---------------------------------------------------------------------------
// Audit emission including the asynchronous chain append.
// ---------------------------------------------------------------------------
static void BM_AuditEmit(benchmark::State& state)
{
    AuditSinkConfig config;
    config.history_limit = 1024;
    AuditSink sink(config);
    for (auto _ : state) {
        AuditEvent event;
        event.kind = AuditKind::AccessDenied;
        event.subject = kClient;
        event.reason = "bench";
        sink.emit(std::move(event));
    }
    sink.flush();
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_AuditEmit)->Unit(benchmark::kNanosecond);

static void BM_Sha256(benchmark::State& state)
{
    const std::string data(static_cast<size_t>(state.range(0)), 'a');
    for (auto _ : state) {
        benchmark::DoNotOptimize(Sha256::hash(data));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Sha256)->Arg(64)->Arg(1024)->Arg(65536);

} // namespace
} // namespace capkern

BENCHMARK_MAIN();
