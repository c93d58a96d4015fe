// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <iosfwd>
#include <string>

#include "types.hpp"

namespace capkern {

struct AuditRecord;

// Audit mirror sink selection
bool sink_wants_stdout(EventLogSink sink);
bool sink_wants_journald(EventLogSink sink);
bool parse_event_log_sink(const std::string& value, EventLogSink& sink);
const char* event_log_sink_name(EventLogSink sink);

// Redirect the stdout mirror (tests). nullptr restores std::cout.
void set_audit_mirror_stream(std::ostream* out);

// Copy one chained record to the configured mirror(s). `json` is the record's
// canonical jsonl rendering.
void mirror_audit_record(EventLogSink sink, const AuditRecord& record, const std::string& json);

// Journald integration (only available when HAVE_SYSTEMD is defined)
#ifdef HAVE_SYSTEMD
void journal_send_audit(const AuditRecord& record, const std::string& json);
#endif

} // namespace capkern
