// cppcheck-suppress-file missingIncludeSystem
#include "types.hpp"

#include "utils.hpp"

namespace capkern {

namespace {

struct OpName {
    Op op;
    const char* name;
};

constexpr OpName kOpNames[] = {
    {Op::Send, "send"},
    {Op::Recv, "recv"},
    {Op::Control, "control"},
    {Op::AuditRead, "audit_read"},
    {Op::AuditReplay, "audit_replay"},
    {Op::TimerArm, "timer_arm"},
    {Op::StorageRead, "storage_read"},
    {Op::StorageWrite, "storage_write"},
};

void put_u64_be(uint8_t* out, uint64_t v)
{
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>(v >> (56 - i * 8));
    }
}

} // namespace

const char* object_kind_name(ObjectKind kind)
{
    switch (kind) {
        case ObjectKind::Endpoint:
            return "endpoint";
        case ObjectKind::Timer:
            return "timer";
        case ObjectKind::Control:
            return "control";
        case ObjectKind::Storage:
            return "storage";
        case ObjectKind::AuditLog:
            return "audit_log";
    }
    return "unknown";
}

std::string object_id_to_string(const ObjectId& id)
{
    uint8_t raw[16];
    put_u64_be(raw, id.hi);
    put_u64_be(raw + 8, id.lo);
    return hex_encode(raw, sizeof(raw));
}

bool parse_object_id(const std::string& hex, ObjectId& id)
{
    if (hex.size() != 32) {
        return false;
    }
    uint64_t halves[2] = {0, 0};
    for (size_t i = 0; i < hex.size(); ++i) {
        const char c = hex[i];
        uint64_t nibble = 0;
        if (c >= '0' && c <= '9') {
            nibble = static_cast<uint64_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            nibble = static_cast<uint64_t>(10 + (c - 'a'));
        } else {
            return false;
        }
        halves[i / 16] = (halves[i / 16] << 4) | nibble;
    }
    id.hi = halves[0];
    id.lo = halves[1];
    return true;
}

std::string token_fingerprint(const CapToken& token)
{
    return hex_encode(token.bytes.data(), 8);
}

const char* op_name(Op op)
{
    for (const auto& entry : kOpNames) {
        if (entry.op == op) {
            return entry.name;
        }
    }
    return "unknown";
}

bool parse_op(const std::string& value, Op& op)
{
    for (const auto& entry : kOpNames) {
        if (value == entry.name) {
            op = entry.op;
            return true;
        }
    }
    return false;
}

std::string OpSet::to_string() const
{
    std::string out;
    for (const auto& entry : kOpNames) {
        if (contains(entry.op)) {
            if (!out.empty()) {
                out += ",";
            }
            out += entry.name;
        }
    }
    return out;
}

const char* ordering_mode_name(OrderingMode mode)
{
    return mode == OrderingMode::Fifo ? "fifo" : "round_robin";
}

const char* drop_policy_name(DropPolicy policy)
{
    return policy == DropPolicy::DropLowerPriority ? "lower_priority" : "reject";
}

} // namespace capkern
