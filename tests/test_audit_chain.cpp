// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
// cppcheck-suppress-file syntaxError
#include <gtest/gtest.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "audit.hpp"
#include "events.hpp"
#include "test_support.hpp"

namespace capkern {
namespace {

using testing_support::FakeClock;
using testing_support::make_kernel;

AuditEvent make_event(AuditKind kind, CapsuleId subject, std::string reason)
{
    AuditEvent event;
    event.kind = kind;
    event.subject = subject;
    event.object = ObjectId{0x1122334455667788ULL, 0x99aabbccddeeff00ULL};
    event.timestamp_ms = 1000 + subject;
    event.outcome = AuditOutcome::Failure;
    event.reason = std::move(reason);
    return event;
}

std::filesystem::path temp_log_path(const std::string& tag)
{
    return std::filesystem::temp_directory_path() /
           ("capkern_audit_" + tag + "_" + std::to_string(::getpid()) + ".jsonl");
}

std::vector<std::string> read_lines(const std::filesystem::path& path)
{
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

void write_lines(const std::filesystem::path& path, const std::vector<std::string>& lines)
{
    std::ofstream out(path, std::ios::trunc);
    for (const auto& line : lines) {
        out << line << "\n";
    }
}

TEST(AuditChainTest, ChainLinksFromGenesis)
{
    AuditSink sink(AuditSinkConfig{});
    for (CapsuleId i = 1; i <= 5; ++i) {
        sink.emit(make_event(AuditKind::AccessDenied, i, "denied " + std::to_string(i)));
    }
    sink.flush();

    const auto records = sink.history();
    ASSERT_EQ(records.size(), 5u);
    EXPECT_EQ(records.front().seq, 1u);
    EXPECT_EQ(records.front().prev_hash, kAuditGenesisHash);
    for (size_t i = 1; i < records.size(); ++i) {
        EXPECT_EQ(records[i].seq, records[i - 1].seq + 1);
        EXPECT_EQ(records[i].prev_hash, records[i - 1].hash);
    }
    EXPECT_EQ(sink.head_hash(), records.back().hash);
    EXPECT_EQ(sink.appended(), 5u);
    EXPECT_TRUE(verify_audit_chain(records));
}

TEST(AuditChainTest, CanonicalBytesAreStable)
{
    AuditEvent event = make_event(AuditKind::PolicyDenied, 7, "quote \" and\nnewline");
    EXPECT_EQ(audit_canonical_bytes(3, event),
              "seq=3;kind=policy_denied;subject=7;object=112233445566778899aabbccddeeff00;ts=1007;"
              "outcome=failure;reason=quote \\\" and\\nnewline");
    EXPECT_EQ(audit_chain_hash(kAuditGenesisHash, 3, event).size(), 64u);
    EXPECT_NE(audit_chain_hash(kAuditGenesisHash, 3, event), audit_chain_hash(kAuditGenesisHash, 4, event));
}

TEST(AuditChainTest, TamperingIsDetected)
{
    AuditSink sink(AuditSinkConfig{});
    for (CapsuleId i = 1; i <= 4; ++i) {
        sink.emit(make_event(AuditKind::CapabilityRevoked, i, "revoked"));
    }
    sink.flush();
    const auto records = sink.history();
    ASSERT_EQ(records.size(), 4u);

    auto edited = records;
    edited[1].event.reason = "nothing to see";
    auto r1 = verify_audit_chain(edited);
    ASSERT_FALSE(r1);
    EXPECT_EQ(r1.error().code(), ErrorCode::AuditChainBroken);

    auto relinked = records;
    relinked[2].prev_hash = relinked[0].hash;
    EXPECT_FALSE(verify_audit_chain(relinked));

    auto gap = records;
    gap.erase(gap.begin() + 1);
    auto r3 = verify_audit_chain(gap);
    ASSERT_FALSE(r3);
    EXPECT_EQ(r3.error().code(), ErrorCode::AuditChainBroken);

    auto rehashed = records;
    rehashed[3].event.subject = 99;
    rehashed[3].hash = audit_chain_hash(rehashed[3].prev_hash, rehashed[3].seq, rehashed[3].event);
    EXPECT_TRUE(verify_audit_chain(rehashed)) << "rewriting the tail is only detectable against a stored head";
    EXPECT_NE(rehashed.back().hash, sink.head_hash());
}

TEST(AuditChainTest, HistoryLimitKeepsVerifiableSuffix)
{
    AuditSinkConfig config;
    config.history_limit = 3;
    AuditSink sink(config);
    for (CapsuleId i = 1; i <= 5; ++i) {
        sink.emit(make_event(AuditKind::MessageDropped, i, "drop"));
    }
    sink.flush();
    const auto records = sink.history();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records.front().seq, 3u);
    EXPECT_TRUE(verify_audit_chain(records, records.front().prev_hash));
    EXPECT_FALSE(verify_audit_chain(records));

    const auto tail = sink.history(5);
    ASSERT_EQ(tail.size(), 1u);
    EXPECT_EQ(tail.front().seq, 5u);
}

TEST(AuditChainTest, SubscriptionSeesRecordsAfterSubscribing)
{
    AuditSink sink(AuditSinkConfig{});
    sink.emit(make_event(AuditKind::AccessDenied, 1, "before"));
    sink.flush();

    auto sub = sink.subscribe();
    sink.emit(make_event(AuditKind::AccessDenied, 2, "after"));

    auto record = sub->next(std::chrono::seconds(5));
    ASSERT_TRUE(record) << record.error().to_string();
    EXPECT_EQ(record->seq, 2u);
    EXPECT_EQ(record->event.reason, "after");

    auto idle = sub->next(std::chrono::milliseconds(10));
    ASSERT_FALSE(idle);
    EXPECT_EQ(idle.error().code(), ErrorCode::WouldBlock);

    sub->cancel();
    auto closed = sub->next(std::chrono::milliseconds(10));
    ASSERT_FALSE(closed);
    EXPECT_EQ(closed.error().code(), ErrorCode::EndpointClosed);

    sink.emit(make_event(AuditKind::AccessDenied, 3, "ignored"));
    sink.flush();
    EXPECT_EQ(sub->pending(), 0u);
}

TEST(AuditChainTest, JsonRoundTripPreservesEscapes)
{
    AuditSink sink(AuditSinkConfig{});
    sink.emit(make_event(AuditKind::GraphViolation, 4, "2 -> \"queue\"\tblocked\\"));
    sink.flush();
    const auto records = sink.history();
    ASSERT_EQ(records.size(), 1u);

    const std::string line = audit_record_to_json(records[0]);
    auto parsed = parse_audit_record_json(line);
    ASSERT_TRUE(parsed) << parsed.error().to_string();
    EXPECT_EQ(parsed->event.reason, records[0].event.reason);
    EXPECT_EQ(parsed->event.object, records[0].event.object);
    EXPECT_EQ(parsed->hash, records[0].hash);
    EXPECT_TRUE(verify_audit_chain({*parsed}));

    EXPECT_FALSE(parse_audit_record_json("{\"seq\":1}"));
}

TEST(AuditChainTest, PersistedLogVerifiesAndDetectsEdits)
{
    const auto path = temp_log_path("persist");
    std::filesystem::remove(path);
    {
        AuditSinkConfig config;
        config.log_path = path.string();
        AuditSink sink(config);
        for (CapsuleId i = 1; i <= 6; ++i) {
            sink.emit(make_event(AuditKind::CapabilityIssued, i, "issued"));
        }
        sink.flush();
        EXPECT_EQ(sink.write_failures(), 0u);
    }

    auto verified = verify_audit_log_file(path.string());
    ASSERT_TRUE(verified) << verified.error().to_string();
    EXPECT_EQ(*verified, 6u);

    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 6u);
    const std::string original = lines[2];
    const std::string needle = "\"reason\":\"issued\"";
    const size_t at = lines[2].find(needle);
    ASSERT_NE(at, std::string::npos);
    lines[2].replace(at, needle.size(), "\"reason\":\"forged\"");
    write_lines(path, lines);
    auto tampered = verify_audit_log_file(path.string());
    ASSERT_FALSE(tampered);
    EXPECT_EQ(tampered.error().code(), ErrorCode::AuditChainBroken);

    lines[2] = original;
    lines.erase(lines.begin());
    write_lines(path, lines);
    EXPECT_FALSE(verify_audit_log_file(path.string()));

    std::filesystem::remove(path);
    auto missing = verify_audit_log_file(path.string());
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code(), ErrorCode::IoError);
}

TEST(AuditChainTest, StdoutMirrorWritesJsonLines)
{
    std::ostringstream captured;
    set_audit_mirror_stream(&captured);
    {
        AuditSinkConfig config;
        config.mirror = EventLogSink::Stdout;
        AuditSink sink(config);
        sink.emit(make_event(AuditKind::CapsuleTeardown, 8, "capabilities=2"));
        sink.flush();
    }
    set_audit_mirror_stream(nullptr);

    const std::string out = captured.str();
    EXPECT_NE(out.find("\"kind\":\"capsule_teardown\""), std::string::npos);
    auto parsed = parse_audit_record_json(out.substr(0, out.find('\n')));
    ASSERT_TRUE(parsed) << parsed.error().to_string();
    EXPECT_EQ(parsed->seq, 1u);
}

TEST(EventLogSinkTest, ParseNames)
{
    for (const char* name : {"none", "stdout", "journald", "both"}) {
        EventLogSink sink = EventLogSink::None;
        ASSERT_TRUE(parse_event_log_sink(name, sink)) << name;
        EXPECT_STREQ(event_log_sink_name(sink), name);
    }
    EventLogSink sink = EventLogSink::None;
    EXPECT_FALSE(parse_event_log_sink("syslog", sink));
    EXPECT_TRUE(sink_wants_stdout(EventLogSink::StdoutAndJournald));
    EXPECT_FALSE(sink_wants_journald(EventLogSink::Stdout));
}

TEST(AuditChainTest, KernelSubscriptionAndReplayRequireCapabilities)
{
    FakeClock clock;
    auto kernel = make_kernel(clock);
    ASSERT_NE(kernel, nullptr);
    auto root = kernel->bootstrap_root_capability();
    ASSERT_TRUE(root);
    const CapsuleId root_id = kernel->config().root_capsule;
    constexpr CapsuleId kAuditor = 40;

    auto storage = kernel->create_object(kAuditor, ObjectKind::Storage);
    ASSERT_TRUE(storage);
    auto wrong = kernel->subscribe_audit(kAuditor, storage->token);
    ASSERT_FALSE(wrong);
    EXPECT_EQ(wrong.error().code(), ErrorCode::Unauthorized);

    IssueRequest request;
    request.object = kernel->audit_log_object();
    request.ops = OpSet{Op::AuditRead, Op::AuditReplay};
    request.recipient = kAuditor;
    RequestContext context;
    context.caller = root_id;
    context.authority = root->token;
    auto reader = kernel->issue(request, context);
    ASSERT_TRUE(reader) << reader.error().to_string();

    auto sub = kernel->subscribe_audit(kAuditor, reader->token);
    ASSERT_TRUE(sub) << sub.error().to_string();
    auto denial = kernel->validate(kAuditor, root->token, Op::Control);
    ASSERT_FALSE(denial);

    bool saw_denial = false;
    for (int i = 0; i < 4 && !saw_denial; ++i) {
        auto record = (*sub)->next(std::chrono::seconds(5));
        ASSERT_TRUE(record);
        saw_denial = record->event.kind == AuditKind::AccessDenied && record->event.subject == kAuditor;
    }
    EXPECT_TRUE(saw_denial);

    kernel->flush_audit();
    auto replay = kernel->replay_audit(kAuditor, reader->token, 1);
    ASSERT_TRUE(replay);
    ASSERT_FALSE(replay->empty());
    EXPECT_EQ(replay->front().event.kind, AuditKind::RootBootstrap);
    EXPECT_TRUE(verify_audit_chain(*replay));
}

} // namespace
} // namespace capkern
