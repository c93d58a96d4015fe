// cppcheck-suppress-file missingIncludeSystem
#include "message.hpp"

#include <string>

namespace capkern {

namespace {

void put_le(std::vector<uint8_t>& out, uint64_t v, size_t bytes)
{
    for (size_t i = 0; i < bytes; ++i) {
        out.push_back(static_cast<uint8_t>(v >> (i * 8)));
    }
}

uint64_t get_le(const uint8_t* in, size_t bytes)
{
    uint64_t v = 0;
    for (size_t i = 0; i < bytes; ++i) {
        v |= static_cast<uint64_t>(in[i]) << (i * 8);
    }
    return v;
}

} // namespace

Message make_message(uint64_t label, std::vector<uint8_t> payload, uint32_t flags)
{
    Message msg;
    msg.header.label = label;
    msg.header.len = static_cast<uint32_t>(payload.size());
    msg.header.flags = flags;
    msg.payload = std::move(payload);
    return msg;
}

std::vector<uint8_t> encode_message(const Message& message)
{
    std::vector<uint8_t> out;
    out.reserve(kMessageHeaderBytes + message.payload.size());
    put_le(out, message.header.label, 8);
    put_le(out, message.header.len, 4);
    put_le(out, message.header.flags, 4);
    out.insert(out.end(), message.payload.begin(), message.payload.end());
    return out;
}

Result<Message> decode_message(const uint8_t* data, size_t size)
{
    if (size < kMessageHeaderBytes) {
        return Error(ErrorCode::MessageMalformed, "Message shorter than header", std::to_string(size) + " bytes");
    }
    Message msg;
    msg.header.label = get_le(data, 8);
    msg.header.len = static_cast<uint32_t>(get_le(data + 8, 4));
    msg.header.flags = static_cast<uint32_t>(get_le(data + 12, 4));
    const size_t body = size - kMessageHeaderBytes;
    if (body != msg.header.len) {
        return Error(ErrorCode::MessageMalformed, "Declared length does not match payload",
                     "len=" + std::to_string(msg.header.len) + " payload=" + std::to_string(body));
    }
    msg.payload.assign(data + kMessageHeaderBytes, data + size);
    return msg;
}

Result<Message> decode_message(const std::vector<uint8_t>& wire)
{
    return decode_message(wire.data(), wire.size());
}

Result<void> validate_message(const Message& message, uint32_t max_bytes)
{
    if (message.header.len != message.payload.size()) {
        return Error(ErrorCode::MessageMalformed, "Declared length does not match payload",
                     "len=" + std::to_string(message.header.len) +
                         " payload=" + std::to_string(message.payload.size()));
    }
    if (message.payload.size() > max_bytes) {
        return Error(ErrorCode::MessageTooLarge, "Message exceeds maximum size",
                     std::to_string(message.payload.size()) + " > " + std::to_string(max_bytes));
    }
    return {};
}

Message make_drop_notification(const ObjectId& endpoint, uint64_t dropped_label, uint8_t priority)
{
    std::vector<uint8_t> payload;
    payload.reserve(kDropNotificationPayloadBytes);
    put_le(payload, dropped_label, 8);
    put_le(payload, endpoint.hi, 8);
    put_le(payload, endpoint.lo, 8);
    payload.push_back(priority);
    return make_message(kDropNotificationLabel, std::move(payload));
}

Result<DropNotice> parse_drop_notification(const Message& message)
{
    if (message.header.label != kDropNotificationLabel) {
        return Error::invalid_argument("not a drop notification");
    }
    if (message.payload.size() != kDropNotificationPayloadBytes) {
        return Error(ErrorCode::MessageMalformed, "Drop notification has wrong size");
    }
    const uint8_t* p = message.payload.data();
    DropNotice notice;
    notice.dropped_label = get_le(p, 8);
    notice.endpoint.hi = get_le(p + 8, 8);
    notice.endpoint.lo = get_le(p + 16, 8);
    notice.priority = p[24];
    return notice;
}

} // namespace capkern
