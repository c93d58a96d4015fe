// cppcheck-suppress-file missingIncludeSystem
#include "events.hpp"

#include <iostream>
#include <mutex>

#ifdef HAVE_SYSTEMD
#include <systemd/sd-journal.h>
#endif

#include "audit.hpp"
#include "logging.hpp"
#include "result.hpp"

namespace capkern {

namespace {

std::mutex g_mirror_mu;
std::ostream* g_mirror_out = nullptr;

} // namespace

bool sink_wants_stdout(EventLogSink sink)
{
    return sink == EventLogSink::Stdout || sink == EventLogSink::StdoutAndJournald;
}

bool sink_wants_journald(EventLogSink sink)
{
    return sink == EventLogSink::Journald || sink == EventLogSink::StdoutAndJournald;
}

bool parse_event_log_sink(const std::string& value, EventLogSink& sink)
{
    if (value == "none") {
        sink = EventLogSink::None;
        return true;
    }
    if (value == "stdout") {
        sink = EventLogSink::Stdout;
        return true;
    }
    if (value == "journald") {
        sink = EventLogSink::Journald;
        return true;
    }
    if (value == "both") {
        sink = EventLogSink::StdoutAndJournald;
        return true;
    }
    return false;
}

const char* event_log_sink_name(EventLogSink sink)
{
    switch (sink) {
        case EventLogSink::None:
            return "none";
        case EventLogSink::Stdout:
            return "stdout";
        case EventLogSink::Journald:
            return "journald";
        case EventLogSink::StdoutAndJournald:
            return "both";
    }
    return "none";
}

void set_audit_mirror_stream(std::ostream* out)
{
    std::lock_guard<std::mutex> lock(g_mirror_mu);
    g_mirror_out = out;
}

void mirror_audit_record(EventLogSink sink, const AuditRecord& record, const std::string& json)
{
    if (sink_wants_stdout(sink)) {
        std::lock_guard<std::mutex> lock(g_mirror_mu);
        std::ostream& out = g_mirror_out ? *g_mirror_out : std::cout;
        out << json << "\n";
        out.flush();
    }
#ifdef HAVE_SYSTEMD
    if (sink_wants_journald(sink)) {
        journal_send_audit(record, json);
    }
#else
    (void)record;
#endif
}

#ifdef HAVE_SYSTEMD
void journal_send_audit(const AuditRecord& record, const std::string& json)
{
    const int priority = record.event.outcome == AuditOutcome::Failure ? LOG_WARNING : LOG_INFO;
    const int rc = sd_journal_send("MESSAGE=%s", json.c_str(), "PRIORITY=%i", priority, "SYSLOG_IDENTIFIER=capkern",
                                   "CAPKERN_AUDIT_KIND=%s", audit_kind_name(record.event.kind),
                                   "CAPKERN_AUDIT_SEQ=%llu", static_cast<unsigned long long>(record.seq),
                                   "CAPKERN_SUBJECT=%u", static_cast<unsigned>(record.event.subject),
                                   "CAPKERN_HASH=%s", record.hash.c_str(), nullptr);
    if (rc < 0) {
        logger().log(SLOG_WARN("journald audit mirror failed").field("error", Error::system(-rc, "sd_journal_send").to_string()));
    }
}
#endif

} // namespace capkern
