#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "util/RESP.hpp"
#include <string>

using MiniKV::ProtocolError;
using MiniKV::RESP;

TEST(RespEncode, SimpleStringAndError) {
  EXPECT_EQ(MiniKV::serialize_RESP(MiniKV::make_simple("OK")), "+OK\r\n");
  EXPECT_EQ(MiniKV::serialize_RESP(MiniKV::make_error("ERR unknown command")),
            "-ERR unknown command\r\n");
}

TEST(RespEncode, Integers) {
  EXPECT_EQ(MiniKV::serialize_RESP(MiniKV::make_integer(1000)), ":1000\r\n");
  EXPECT_EQ(MiniKV::serialize_RESP(MiniKV::make_integer(-2)), ":-2\r\n");
}

TEST(RespEncode, BulkStringCountsBytes) {
  EXPECT_EQ(MiniKV::serialize_RESP(MiniKV::make_bulk("hello")),
            "$5\r\nhello\r\n");
  std::string binary("a\0b\r\n", 5);
  EXPECT_EQ(MiniKV::serialize_RESP(MiniKV::make_bulk(binary)),
            "$5\r\n" + binary + "\r\n");
}

// an empty value and a missing one must never look alike on the wire
TEST(RespEncode, NullBulkIsNotEmptyBulk) {
  EXPECT_EQ(MiniKV::serialize_RESP(MiniKV::make_bulk("")), "$0\r\n\r\n");
  EXPECT_EQ(MiniKV::serialize_RESP(MiniKV::make_null_bulk()), "$-1\r\n");
}

TEST(RespEncode, Arrays) {
  EXPECT_EQ(MiniKV::serialize_RESP(MiniKV::make_array({"foo", "bar"})),
            "*2\r\n$3\r\nfoo\r\n$3\r\nbar\r\n");
  EXPECT_EQ(MiniKV::serialize_RESP(MiniKV::make_array({})), "*0\r\n");
}

TEST(RespDecode, InlineCommandIsUpperCased) {
  MiniKV::Request req = MiniKV::decode_request("set Key value\r\n");
  EXPECT_EQ(req.name, "SET");
  ASSERT_EQ(req.args.size(), 2u);
  EXPECT_EQ(req.args[0], "Key");
  EXPECT_EQ(req.args[1], "value");
}

TEST(RespDecode, InlineAcceptsBareNewlineAndExtraSpaces) {
  MiniKV::Request req = MiniKV::decode_request("  GET    k  \n");
  EXPECT_EQ(req.name, "GET");
  ASSERT_EQ(req.args.size(), 1u);
  EXPECT_EQ(req.args[0], "k");
}

TEST(RespDecode, MultiBulkRequest) {
  MiniKV::Request req = MiniKV::decode_request(
      "*3\r\n$3\r\nset\r\n$3\r\nkey\r\n$11\r\nhello world\r\n");
  EXPECT_EQ(req.name, "SET");
  ASSERT_EQ(req.args.size(), 2u);
  EXPECT_EQ(req.args[1], "hello world");
}

TEST(RespDecode, QuotedTokens) {
  MiniKV::Request req =
      MiniKV::decode_request("SET k \"hello \\\"big\\\" world\"\r\n");
  ASSERT_EQ(req.args.size(), 2u);
  EXPECT_EQ(req.args[1], "hello \"big\" world");

  req = MiniKV::decode_request("SET k \"\"\r\n");
  ASSERT_EQ(req.args.size(), 2u);
  EXPECT_EQ(req.args[1], "");

  req = MiniKV::decode_request("SET k 'it\\'s'\r\n");
  ASSERT_EQ(req.args.size(), 2u);
  EXPECT_EQ(req.args[1], "it's");
}

TEST(RespDecode, EmptyOrUnterminatedInputFails) {
  EXPECT_THROW(MiniKV::decode_request(""), ProtocolError);
  EXPECT_THROW(MiniKV::decode_request("\r\n"), ProtocolError);
  EXPECT_THROW(MiniKV::decode_request("   \r\n"), ProtocolError);
  EXPECT_THROW(MiniKV::decode_request("GET k"), ProtocolError);
  EXPECT_THROW(MiniKV::decode_request("*2\r\n$3\r\nGET\r\n"), ProtocolError);
}

TEST(RespDecode, MalformedInputFails) {
  EXPECT_THROW(MiniKV::decode_request("SET k \"abc\r\n"), ProtocolError);
  EXPECT_THROW(MiniKV::decode_request("SET k \"a\"b\r\n"), ProtocolError);
  EXPECT_THROW(MiniKV::decode_request("*x\r\n"), ProtocolError);
  EXPECT_THROW(MiniKV::decode_request("*1\r\n$3\r\nabcXY"), ProtocolError);
  EXPECT_THROW(MiniKV::decode_request("*1\r\n:5\r\n"), ProtocolError);
  EXPECT_THROW(MiniKV::decode_request("*0\r\n"), ProtocolError);
}

TEST(RespFraming, WaitsForTheRestOfAFrame) {
  std::string buffer = "*2\r\n$3\r\nGET\r\n$1";
  EXPECT_FALSE(MiniKV::next_request(buffer).has_value());
  EXPECT_EQ(buffer, "*2\r\n$3\r\nGET\r\n$1");

  buffer += "\r\nk\r\n";
  auto req = MiniKV::next_request(buffer);
  ASSERT_TRUE(req.has_value());
  EXPECT_EQ(req->name, "GET");
  EXPECT_EQ(req->args, std::vector<std::string>{"k"});
  EXPECT_TRUE(buffer.empty());
}

TEST(RespFraming, PipelinedRequestsComeOutInOrder) {
  std::string buffer = "PING\r\n*2\r\n$4\r\nINCR\r\n$1\r\nn\r\nGET n\r\nDEL";

  auto first = MiniKV::next_request(buffer);
  auto second = MiniKV::next_request(buffer);
  auto third = MiniKV::next_request(buffer);
  ASSERT_TRUE(first && second && third);
  EXPECT_EQ(first->name, "PING");
  EXPECT_EQ(second->name, "INCR");
  EXPECT_EQ(third->name, "GET");

  EXPECT_FALSE(MiniKV::next_request(buffer).has_value());
  EXPECT_EQ(buffer, "DEL");
}

TEST(RespFraming, MalformedFrameIsDiscarded) {
  std::string buffer = "*abc\r\n$4\r\nPING\r\n";
  EXPECT_THROW(MiniKV::next_request(buffer), ProtocolError);
  EXPECT_TRUE(buffer.empty());

  buffer = "SET k \"open\r\nPING\r\n";
  EXPECT_THROW(MiniKV::next_request(buffer), ProtocolError);
  auto next = MiniKV::next_request(buffer);
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->name, "PING");
}

TEST(RespFraming, NonBulkElementIsRejectedOnItsTypeByte) {
  std::string buffer = "*1\r\n+" + std::string(1024 * 1024, 'A');
  EXPECT_THROW(MiniKV::next_request(buffer), ProtocolError);
  EXPECT_TRUE(buffer.empty());

  buffer = "*2\r\n$3\r\nGET\r\n-";
  EXPECT_THROW(MiniKV::next_request(buffer), ProtocolError);

  buffer = "*1\r\n*1\r\n$4\r\nPING\r\n";
  EXPECT_THROW(MiniKV::next_request(buffer), ProtocolError);

  buffer = "*2\r\n$3\r\nGET\r\n$-1\r\n";
  EXPECT_THROW(MiniKV::next_request(buffer), ProtocolError);
}

TEST(RespFraming, OversizedInlineRequestIsRejected) {
  std::string buffer(MiniKV::MAX_INLINE_LEN + 1, 'a');
  EXPECT_THROW(MiniKV::next_request(buffer), ProtocolError);
  EXPECT_TRUE(buffer.empty());
}

TEST(RespParse, ReplyShapes) {
  std::string data = "+OK\r\n-ERR bad\r\n:42\r\n$-1\r\n*2\r\n$1\r\na\r\n*1\r\n:1\r\n";
  size_t pos = 0;

  RESP ok = MiniKV::parse_RESP(data, pos);
  EXPECT_EQ(ok.resp_type, RESP::type::SIMPLE_STRING);
  EXPECT_EQ(ok.str, "OK");

  RESP err = MiniKV::parse_RESP(data, pos);
  EXPECT_EQ(err.resp_type, RESP::type::ERROR);
  EXPECT_EQ(err.str, "ERR bad");

  RESP num = MiniKV::parse_RESP(data, pos);
  EXPECT_EQ(num.integer, 42);

  RESP nil = MiniKV::parse_RESP(data, pos);
  EXPECT_TRUE(nil.is_null);

  RESP nested = MiniKV::parse_RESP(data, pos);
  ASSERT_EQ(nested.elements.size(), 2u);
  EXPECT_EQ(nested.elements[0].str, "a");
  ASSERT_EQ(nested.elements[1].elements.size(), 1u);
  EXPECT_EQ(nested.elements[1].elements[0].integer, 1);
  EXPECT_EQ(pos, data.size());
}

TEST(RespParse, TruncatedValue) {
  std::string data = "$5\r\nhel";
  size_t pos = 0;
  EXPECT_FALSE(MiniKV::try_parse_RESP(data, pos).has_value());
  EXPECT_EQ(pos, 0u);
  EXPECT_THROW(MiniKV::parse_RESP(data, pos), ProtocolError);
}

TEST(RespParse, TokensRequireBulkArray) {
  EXPECT_THROW(MiniKV::RESP_to_tokens(MiniKV::make_simple("OK")),
               ProtocolError);
  EXPECT_EQ(MiniKV::RESP_to_tokens(MiniKV::make_array({"GET", "k"})),
            (std::vector<std::string>{"GET", "k"}));
}

TEST(RespParse, InlineToMultiBulk) {
  RESP r = MiniKV::convert_inline_to_RESP("SET greeting \"hi there\"");
  EXPECT_EQ(MiniKV::serialize_RESP(r),
            "*3\r\n$3\r\nSET\r\n$8\r\ngreeting\r\n$8\r\nhi there\r\n");
}
