/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * RESP codec tests
 */

#include "store/resp.hpp"

#include <gtest/gtest.h>

using namespace waypoint::store;

TEST(RespEncodeTest, EncodesCommandAsBulkArray) {
    EXPECT_EQ(resp::encode_command({"GET", "routes:api"}),
              "*2\r\n$3\r\nGET\r\n$10\r\nroutes:api\r\n");
}

TEST(RespEncodeTest, EncodesEmptyArgument) {
    EXPECT_EQ(resp::encode_command({"AUTH", ""}), "*2\r\n$4\r\nAUTH\r\n$0\r\n\r\n");
}

TEST(RespEncodeTest, BinarySafe) {
    std::string_view arg("a\r\nb", 4);
    EXPECT_EQ(resp::encode_command({arg}), std::string("*1\r\n$4\r\na\r\nb\r\n"));
}

TEST(RespParseTest, SimpleString) {
    std::size_t consumed = 0;
    auto value = resp::parse("+PONG\r\n", consumed);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->type, resp::Type::simple_string);
    EXPECT_EQ(value->str, "PONG");
    EXPECT_EQ(consumed, 7u);
}

TEST(RespParseTest, Error) {
    std::size_t consumed = 0;
    auto value = resp::parse("-WRONGTYPE Operation against a key\r\n", consumed);
    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(value->is_error());
    EXPECT_EQ(value->str, "WRONGTYPE Operation against a key");
}

TEST(RespParseTest, Integer) {
    std::size_t consumed = 0;
    auto value = resp::parse(":-42\r\n", consumed);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->type, resp::Type::integer);
    EXPECT_EQ(value->integer, -42);
}

TEST(RespParseTest, BulkStringWithEmbeddedCrlf) {
    std::string_view input("$4\r\na\r\nb\r\n", 10);
    std::size_t consumed = 0;
    auto value = resp::parse(input, consumed);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->type, resp::Type::bulk_string);
    EXPECT_EQ(value->str, std::string("a\r\nb"));
    EXPECT_EQ(consumed, input.size());
}

TEST(RespParseTest, NullBulkAndNullArray) {
    std::size_t consumed = 0;
    auto bulk = resp::parse("$-1\r\n", consumed);
    ASSERT_TRUE(bulk.has_value());
    EXPECT_TRUE(bulk->is_null());
    EXPECT_EQ(consumed, 5u);

    auto array = resp::parse("*-1\r\n", consumed);
    ASSERT_TRUE(array.has_value());
    EXPECT_TRUE(array->is_null());
}

TEST(RespParseTest, NestedArray) {
    std::size_t consumed = 0;
    auto value = resp::parse("*2\r\n$1\r\na\r\n*1\r\n:7\r\n", consumed);
    ASSERT_TRUE(value.has_value());
    ASSERT_EQ(value->type, resp::Type::array);
    ASSERT_EQ(value->elements.size(), 2u);
    EXPECT_EQ(value->elements[0].str, "a");
    ASSERT_EQ(value->elements[1].elements.size(), 1u);
    EXPECT_EQ(value->elements[1].elements[0].integer, 7);
}

TEST(RespParseTest, EmptyArray) {
    std::size_t consumed = 0;
    auto value = resp::parse("*0\r\n", consumed);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->type, resp::Type::array);
    EXPECT_TRUE(value->elements.empty());
}

TEST(RespParseTest, IncompleteInputNeedsMore) {
    std::size_t consumed = 99;
    EXPECT_FALSE(resp::parse("", consumed).has_value());
    EXPECT_FALSE(resp::parse("+PON", consumed).has_value());
    EXPECT_FALSE(resp::parse("$5\r\nhel", consumed).has_value());
    EXPECT_FALSE(resp::parse("*2\r\n$1\r\na\r\n", consumed).has_value());
    EXPECT_EQ(consumed, 0u);
}

TEST(RespParseTest, ConsumesOnlyFirstReply) {
    std::size_t consumed = 0;
    auto value = resp::parse("+OK\r\n+QUEUED\r\n", consumed);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->str, "OK");
    EXPECT_EQ(consumed, 5u);
}

TEST(RespParseTest, MalformedInputThrows) {
    std::size_t consumed = 0;
    EXPECT_THROW(resp::parse("?what\r\n", consumed), resp::ProtocolError);
    EXPECT_THROW(resp::parse(":abc\r\n", consumed), resp::ProtocolError);
    EXPECT_THROW(resp::parse("$-5\r\n", consumed), resp::ProtocolError);
    EXPECT_THROW(resp::parse("$3\r\nabcXY", consumed), resp::ProtocolError);
}

TEST(RespParseTest, ProtocolErrorIsStoreError) {
    std::size_t consumed = 0;
    EXPECT_THROW(resp::parse("!\r\n", consumed), StoreError);
}
