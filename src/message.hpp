// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <vector>

#include "result.hpp"
#include "types.hpp"

namespace capkern {

Message make_message(uint64_t label, std::vector<uint8_t> payload, uint32_t flags = 0);

// Header (16 bytes, little-endian) followed by exactly header.len payload bytes.
std::vector<uint8_t> encode_message(const Message& message);
Result<Message> decode_message(const uint8_t* data, size_t size);
Result<Message> decode_message(const std::vector<uint8_t>& wire);

// MessageMalformed when header.len disagrees with the payload, MessageTooLarge
// when the payload exceeds `max_bytes`.
Result<void> validate_message(const Message& message, uint32_t max_bytes);

// Kernel-originated notice that a producer's queued message was dropped.
// Payload: dropped label (u64) | endpoint id hi (u64) | endpoint id lo (u64) | priority (u8).
inline constexpr size_t kDropNotificationPayloadBytes = 25;

Message make_drop_notification(const ObjectId& endpoint, uint64_t dropped_label, uint8_t priority);

struct DropNotice {
    uint64_t dropped_label = 0;
    ObjectId endpoint;
    uint8_t priority = 0;
};

Result<DropNotice> parse_drop_notification(const Message& message);

} // namespace capkern
