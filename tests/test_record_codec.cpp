#include <gtest/gtest.h>
#include "codec/evtx_resp.hpp"
#include "codec/evtx_record_fields.hpp"
#include "evtx_errors.hpp"
#include "test_common.h"

using namespace evtx;

TEST(RESPCodecTest, SerializeArray) {
    EXPECT_EQ(RESPCodec::serializeArray({"type", "deposit"}),
              "*2\r\n$4\r\ntype\r\n$7\r\ndeposit\r\n");
    EXPECT_EQ(RESPCodec::serializeArray({}), "*0\r\n");
}

// 批量字符串可以包含CRLF等任意字节
TEST(RESPCodecTest, BinarySafeBulkStrings) {
    std::string value("line1\r\nline2\0tail", 17);
    std::string encoded = RESPCodec::serializeArray({value, ""});

    std::vector<std::string> parsed = RESPCodec::parseArray(encoded);
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[0], value);
    EXPECT_EQ(parsed[1], "");
}

TEST(RESPCodecTest, ParseAdvancesPosition) {
    std::string data = RESPCodec::serializeArray({"a"}) + RESPCodec::serializeArray({"b", "c"});
    size_t pos = 0;

    EXPECT_EQ(RESPCodec::parseArray(data, pos), std::vector<std::string>({"a"}));
    EXPECT_EQ(RESPCodec::parseArray(data, pos), std::vector<std::string>({"b", "c"}));
    EXPECT_EQ(pos, data.size());
}

TEST(RESPCodecTest, AcceptsIntegerElements) {
    std::string data = "*2\r\n" + RESPCodec::serializeInteger(42) + RESPCodec::serializeBulkString("ok");
    std::vector<std::string> parsed = RESPCodec::parseArray(data);
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[0], "42");
    EXPECT_EQ(parsed[1], "ok");
}

TEST(RESPCodecTest, RejectsMalformedInput) {
    EXPECT_THROW(RESPCodec::parseArray(""), CodecException);
    EXPECT_THROW(RESPCodec::parseArray("$3\r\nabc\r\n"), CodecException);
    EXPECT_THROW(RESPCodec::parseArray("*x\r\n"), CodecException);
    EXPECT_THROW(RESPCodec::parseArray("*1\r\n$10\r\nabc\r\n"), CodecException);
    EXPECT_THROW(RESPCodec::parseArray("*1\r\n$3\r\nabcXY"), CodecException);
    EXPECT_THROW(RESPCodec::parseArray("*1\r\n-ERR\r\n"), CodecException);
}

// 用于判断文件尾部是否是被截断的记录
TEST(RESPCodecTest, DetectsTruncatedArray) {
    std::string full = RESPCodec::serializeArray({"revision", "1", "data", "payload"});
    EXPECT_TRUE(RESPCodec::hasCompleteArray(full, 0));

    for (size_t cut = 1; cut < full.size(); cut += 3) {
        EXPECT_FALSE(RESPCodec::hasCompleteArray(full.substr(0, cut), 0)) << "cut at " << cut;
    }
}

// 超出int64范围的长度同样是格式错误
TEST(RESPCodecTest, OverflowingLengthIsMalformed) {
    EXPECT_THROW(RESPCodec::parseArray("*99999999999999999999\r\n"), CodecException);
    EXPECT_THROW(RESPCodec::parseArray("*1\r\n$99999999999999999999\r\nabc\r\n"), CodecException);
    EXPECT_FALSE(RESPCodec::hasCompleteArray("*99999999999999999999\r\n", 0));
    EXPECT_FALSE(RESPCodec::hasCompleteArray("*1\r\n$99999999999999999999\r\n", 0));
}

TEST(RecordFieldsTest, TypedAccessors) {
    Timestamp ts = test::millisNow();
    RecordFields fields;
    fields.set("name", "alice").setInt("amount", -250).setTimestamp("at", ts);

    RecordFields decoded = RecordFields::decode(fields.encode());
    EXPECT_EQ(decoded.size(), 3u);
    EXPECT_EQ(decoded.get("name"), "alice");
    EXPECT_EQ(decoded.getInt("amount"), -250);
    EXPECT_EQ(decoded.getTimestamp("at"), ts);
    EXPECT_EQ(decoded.getOr("missing", "fallback"), "fallback");
    EXPECT_TRUE(decoded.has("name"));
    EXPECT_FALSE(decoded.has("missing"));
}

TEST(RecordFieldsTest, MissingOrInvalidFieldsThrow) {
    RecordFields fields;
    fields.set("amount", "12a");

    EXPECT_THROW(fields.get("other"), CodecException);
    EXPECT_THROW(fields.getInt("amount"), CodecException);
    EXPECT_THROW(fields.getTimestamp("amount"), CodecException);

    fields.set("sequence_id", "99999999999999999999").set("timestamp", "-99999999999999999999");
    EXPECT_THROW(fields.getInt("sequence_id"), CodecException);
    EXPECT_THROW(fields.getTimestamp("timestamp"), CodecException);
}

TEST(RecordFieldsTest, DecodeRejectsBadShapes) {
    // 奇数个元素无法组成键值对
    EXPECT_THROW(RecordFields::decode(RESPCodec::serializeArray({"a", "b", "c"})), CodecException);

    // 记录之后还有多余字节
    std::string data = RecordFields().set("a", "b").encode() + "junk";
    EXPECT_THROW(RecordFields::decode(data), CodecException);

    size_t pos = 0;
    RecordFields first = RecordFields::decode(data, pos);
    EXPECT_EQ(first.get("a"), "b");
    EXPECT_EQ(data.substr(pos), "junk");
}

TEST(RecordFieldsTest, NestedRecordsSurviveEncoding) {
    RecordFields inner;
    inner.set("tx", "t1").setInt("seq", 7);

    RecordFields outer;
    outer.set("inner", inner.encode()).set("empty", "");

    RecordFields decoded = RecordFields::decode(outer.encode());
    RecordFields nested = RecordFields::decode(decoded.get("inner"));
    EXPECT_EQ(nested.get("tx"), "t1");
    EXPECT_EQ(nested.getInt("seq"), 7);
    EXPECT_EQ(decoded.get("empty"), "");
}
