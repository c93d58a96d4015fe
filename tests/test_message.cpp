// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
// cppcheck-suppress-file syntaxError
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "message.hpp"

namespace capkern {
namespace {

TEST(MessageTest, HeaderIsLittleEndian)
{
    Message msg = make_message(7, {'h', 'e', 'l', 'l', 'o'}, 0x0203);
    EXPECT_EQ(msg.header.len, 5u);
    EXPECT_EQ(msg.priority(), 0x03);

    const std::vector<uint8_t> wire = encode_message(msg);
    ASSERT_EQ(wire.size(), kMessageHeaderBytes + 5);
    const std::vector<uint8_t> header(wire.begin(), wire.begin() + kMessageHeaderBytes);
    const std::vector<uint8_t> expected = {7, 0, 0, 0, 0, 0, 0, 0, 5, 0, 0, 0, 0x03, 0x02, 0, 0};
    EXPECT_EQ(header, expected);
    EXPECT_EQ(std::string(wire.begin() + kMessageHeaderBytes, wire.end()), "hello");

    auto decoded = decode_message(wire);
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded->header.label, 7u);
    EXPECT_EQ(decoded->header.flags, 0x0203u);
    EXPECT_EQ(decoded->payload, msg.payload);
}

TEST(MessageTest, EmptyPayloadIsValid)
{
    Message msg = make_message(1, {});
    EXPECT_TRUE(validate_message(msg, 0));
    auto decoded = decode_message(encode_message(msg));
    ASSERT_TRUE(decoded);
    EXPECT_TRUE(decoded->payload.empty());
}

TEST(MessageTest, ShortBufferIsMalformed)
{
    const std::vector<uint8_t> wire(kMessageHeaderBytes - 1, 0);
    auto decoded = decode_message(wire);
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code(), ErrorCode::MessageMalformed);
}

TEST(MessageTest, LengthMismatchIsMalformed)
{
    std::vector<uint8_t> wire = encode_message(make_message(9, {1, 2, 3}));
    wire.push_back(4);
    auto extra = decode_message(wire);
    ASSERT_FALSE(extra);
    EXPECT_EQ(extra.error().code(), ErrorCode::MessageMalformed);

    wire.resize(kMessageHeaderBytes + 1);
    auto truncated = decode_message(wire);
    ASSERT_FALSE(truncated);
    EXPECT_EQ(truncated.error().code(), ErrorCode::MessageMalformed);
}

TEST(MessageTest, ValidateChecksLengthThenSize)
{
    Message msg = make_message(1, std::vector<uint8_t>(10, 0xaa));
    EXPECT_TRUE(validate_message(msg, 10));

    auto too_large = validate_message(msg, 9);
    ASSERT_FALSE(too_large);
    EXPECT_EQ(too_large.error().code(), ErrorCode::MessageTooLarge);

    msg.header.len = 11;
    auto malformed = validate_message(msg, 9);
    ASSERT_FALSE(malformed);
    EXPECT_EQ(malformed.error().code(), ErrorCode::MessageMalformed);
}

TEST(MessageTest, DropNotificationCarriesOrigin)
{
    const ObjectId endpoint{0x0102030405060708ULL, 0x1112131415161718ULL};
    Message note = make_drop_notification(endpoint, 0xdeadbeefULL, 4);
    EXPECT_EQ(note.header.label, kDropNotificationLabel);
    EXPECT_EQ(note.payload.size(), kDropNotificationPayloadBytes);
    EXPECT_TRUE(validate_message(note, kDefaultMaxMessageBytes));

    auto notice = parse_drop_notification(note);
    ASSERT_TRUE(notice);
    EXPECT_EQ(notice->dropped_label, 0xdeadbeefULL);
    EXPECT_EQ(notice->endpoint, endpoint);
    EXPECT_EQ(notice->priority, 4);

    auto not_a_notice = parse_drop_notification(make_message(3, {}));
    ASSERT_FALSE(not_a_notice);
    EXPECT_EQ(not_a_notice.error().code(), ErrorCode::InvalidArgument);

    Message truncated = note;
    truncated.payload.pop_back();
    truncated.header.len = static_cast<uint32_t>(truncated.payload.size());
    EXPECT_EQ(parse_drop_notification(truncated).error().code(), ErrorCode::MessageMalformed);
}

} // namespace
} // namespace capkern
