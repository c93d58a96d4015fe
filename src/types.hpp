// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <map>
#include <string>
#include <vector>

namespace capkern {

inline constexpr const char* kVersion = "0.3.0";

using CapsuleId = uint32_t;
using Labels = std::map<std::string, std::string>;

// Producer id stamped on messages injected by the kernel itself (timers, drop notifications).
inline constexpr CapsuleId kKernelCapsule = 0;

inline constexpr size_t kTokenBytes = 32;
inline constexpr size_t kMessageHeaderBytes = 16;
inline constexpr uint32_t kDefaultMaxMessageBytes = 64 * 1024;
inline constexpr uint32_t kMessagePriorityMask = 0xffu;
inline constexpr uint64_t kDropNotificationLabel = 0xffffffff00000001ULL;
inline constexpr uint8_t kMaxDelegationDepth = 16;

// Capability label selecting blocking send/recv for the holder.
inline constexpr const char* kBlockingLabel = "ipc.blocking";

enum class ObjectKind : uint8_t {
    Endpoint = 1,
    Timer = 2,
    Control = 3,
    Storage = 4,
    AuditLog = 5,
};

const char* object_kind_name(ObjectKind kind);

/**
 * Opaque kernel object identifier.
 *
 * Both halves come from the platform randomness source; an id carries no
 * ordering, owner or type information.
 */
struct ObjectId {
    uint64_t hi = 0;
    uint64_t lo = 0;

    [[nodiscard]] bool valid() const { return hi != 0 || lo != 0; }

    bool operator==(const ObjectId& other) const noexcept { return hi == other.hi && lo == other.lo; }
    bool operator!=(const ObjectId& other) const noexcept { return !(*this == other); }
};

struct ObjectIdHash {
    std::size_t operator()(const ObjectId& id) const noexcept { return static_cast<std::size_t>(id.hi ^ id.lo); }
};

std::string object_id_to_string(const ObjectId& id);
bool parse_object_id(const std::string& hex, ObjectId& id);

struct CapToken {
    std::array<uint8_t, kTokenBytes> bytes{};

    bool operator==(const CapToken& other) const noexcept { return bytes == other.bytes; }
    bool operator!=(const CapToken& other) const noexcept { return !(*this == other); }
};

struct CapTokenHash {
    std::size_t operator()(const CapToken& token) const noexcept
    {
        // Tokens are uniformly random; any 8 bytes are a good hash.
        std::size_t h = 0;
        std::memcpy(&h, token.bytes.data(), sizeof(h));
        return h;
    }
};

// Short, non-reversible prefix for logs and audit reasons. Full tokens are never logged.
std::string token_fingerprint(const CapToken& token);

/**
 * Slot reference inside one capsule's capability table.
 *
 * The generation is bumped whenever the slot is revoked, so a stale handle
 * never resolves to a newer record.
 */
struct CapHandle {
    uint32_t index = 0;
    uint32_t generation = 0;

    bool operator==(const CapHandle& other) const noexcept
    {
        return index == other.index && generation == other.generation;
    }
};

enum class Op : uint8_t {
    Send = 0,
    Recv = 1,
    Control = 2,
    AuditRead = 3,
    AuditReplay = 4,
    TimerArm = 5,
    StorageRead = 6,
    StorageWrite = 7,
};

const char* op_name(Op op);
bool parse_op(const std::string& value, Op& op);

class OpSet {
  public:
    OpSet() = default;
    OpSet(std::initializer_list<Op> ops)
    {
        for (Op op : ops) {
            add(op);
        }
    }

    static OpSet from_bits(uint32_t bits)
    {
        OpSet s;
        s.bits_ = bits;
        return s;
    }

    void add(Op op) { bits_ |= bit(op); }
    [[nodiscard]] bool contains(Op op) const { return (bits_ & bit(op)) != 0; }
    [[nodiscard]] bool empty() const { return bits_ == 0; }
    [[nodiscard]] bool is_subset_of(const OpSet& other) const { return (bits_ & ~other.bits_) == 0; }
    [[nodiscard]] uint32_t bits() const { return bits_; }
    [[nodiscard]] std::string to_string() const;

    bool operator==(const OpSet& other) const noexcept { return bits_ == other.bits_; }

  private:
    static uint32_t bit(Op op) { return 1u << static_cast<uint32_t>(op); }
    uint32_t bits_ = 0;
};

/**
 * Usage limits attached to a capability. Zero means "unlimited" for every
 * field except quota_window_ms.
 */
struct CapLimits {
    uint64_t ttl_ms = 0;
    uint32_t quota = 0;               // successful operations per quota window
    uint32_t quota_window_ms = 1000;  // fixed window length
    uint32_t rate_per_sec = 0;        // token bucket refill rate
    uint32_t rate_burst = 0;          // bucket capacity, 0 means rate_per_sec
    uint32_t max_uses = 0;            // lifetime use count

    [[nodiscard]] uint32_t effective_burst() const { return rate_burst != 0 ? rate_burst : rate_per_sec; }
};

/**
 * The capsule-visible view of a capability.
 *
 * The canonical record stays in the owning capsule's table; this is a copy
 * of its public fields plus the opaque reference (token, handle).
 */
struct Capability {
    CapToken token;
    CapHandle handle;
    CapsuleId holder = 0;
    ObjectId object;
    ObjectKind kind = ObjectKind::Control;
    OpSet ops;
    CapLimits limits;
    uint8_t delegation_depth = 0;
    Labels labels;
};

struct ResolvedObject {
    ObjectId id;
    ObjectKind kind = ObjectKind::Control;
    CapsuleId owner = 0;
    Labels labels; // of the capability that authorized the access
};

struct MessageHeader {
    uint64_t label = 0;
    uint32_t len = 0;
    uint32_t flags = 0;
};

struct Message {
    MessageHeader header;
    std::vector<uint8_t> payload;

    [[nodiscard]] uint8_t priority() const { return static_cast<uint8_t>(header.flags & kMessagePriorityMask); }
};

enum class OrderingMode { Fifo, RoundRobin };
enum class DropPolicy { Reject, DropLowerPriority };

const char* ordering_mode_name(OrderingMode mode);
const char* drop_policy_name(DropPolicy policy);

struct EndpointConfig {
    std::string name;
    CapsuleId owner = 0;
    uint32_t capacity = 16;
    OrderingMode ordering = OrderingMode::RoundRobin;
    bool blocking = false;
    uint32_t block_timeout_ms = 0; // 0 waits until woken by data, space, or an interrupt
    uint32_t max_message_bytes = kDefaultMaxMessageBytes;
    DropPolicy drop = DropPolicy::Reject;
};

enum class EventLogSink { None, Stdout, Journald, StdoutAndJournald };

} // namespace capkern
