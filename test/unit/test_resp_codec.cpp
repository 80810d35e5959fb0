#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "../../intelgate/store/resp_codec.h"

TEST_CASE("RESP encoding")
{
    SUBCASE("encode_command")
    {
        CHECK(resp::encode_command({"GET", "k"}) == "*2\r\n$3\r\nGET\r\n$1\r\nk\r\n");
    }

    SUBCASE("empty argument")
    {
        CHECK(resp::encode_command({"SET", "k", ""}) == "*3\r\n$3\r\nSET\r\n$1\r\nk\r\n$0\r\n\r\n");
    }

    SUBCASE("encode_list of nothing")
    {
        CHECK(resp::encode_list({}) == "*0\r\n");
    }
}

TEST_CASE("RESP list values")
{
    SUBCASE("documents with separators survive")
    {
        std::vector<std::string> docs = {"{\"a\":\"x\\r\\ny\"}", "line\r\nbreak", ""};
        std::string encoded = resp::encode_list(docs);
        std::vector<std::string> decoded;
        REQUIRE(resp::decode_list(encoded, decoded));
        CHECK(decoded == docs);
    }

    SUBCASE("trailing bytes are rejected")
    {
        std::vector<std::string> out;
        CHECK_FALSE(resp::decode_list("*1\r\n$1\r\na\r\nextra", out));
    }

    SUBCASE("truncated input is rejected")
    {
        std::vector<std::string> out;
        CHECK_FALSE(resp::decode_list("*2\r\n$1\r\na\r\n", out));
    }

    SUBCASE("parse_message reports incomplete input")
    {
        std::vector<std::string> args;
        size_t consumed = 0;
        CHECK(resp::parse_message("*1\r\n$5\r\nab", args, consumed) == resp::parse_result::incomplete);
        CHECK(consumed == 0);
    }

    SUBCASE("parse_message rejects non-arrays")
    {
        std::vector<std::string> args;
        size_t consumed = 0;
        CHECK(resp::parse_message("+OK\r\n", args, consumed) == resp::parse_result::error);
    }
}

TEST_CASE("RESP replies")
{
    resp::reply r;
    size_t consumed = 0;

    SUBCASE("simple string")
    {
        REQUIRE(resp::parse_reply("+OK\r\n", r, consumed) == resp::parse_result::ok);
        CHECK(r.type == resp::reply_type::simple);
        CHECK(r.str == "OK");
        CHECK(consumed == 5);
    }

    SUBCASE("error")
    {
        REQUIRE(resp::parse_reply("-ERR wrong type\r\n", r, consumed) == resp::parse_result::ok);
        CHECK(r.is_error());
        CHECK(r.str == "ERR wrong type");
    }

    SUBCASE("integer")
    {
        REQUIRE(resp::parse_reply(":-42\r\n", r, consumed) == resp::parse_result::ok);
        CHECK(r.type == resp::reply_type::integer);
        CHECK(r.integer == -42);
    }

    SUBCASE("nil bulk")
    {
        REQUIRE(resp::parse_reply("$-1\r\n", r, consumed) == resp::parse_result::ok);
        CHECK(r.is_nil());
    }

    SUBCASE("SCAN reply shape")
    {
        std::string buf = "*2\r\n$2\r\n17\r\n*2\r\n$3\r\nk:1\r\n$3\r\nk:2\r\n";
        REQUIRE(resp::parse_reply(buf, r, consumed) == resp::parse_result::ok);
        CHECK(consumed == buf.size());
        REQUIRE(r.elements.size() == 2);
        CHECK(r.elements[0].str == "17");
        REQUIRE(r.elements[1].elements.size() == 2);
        CHECK(r.elements[1].elements[1].str == "k:2");
    }

    SUBCASE("pipelined replies parse one at a time")
    {
        std::string buf = "+OK\r\n:3\r\n";
        REQUIRE(resp::parse_reply(buf, r, consumed) == resp::parse_result::ok);
        CHECK(consumed == 5);
        resp::reply second;
        REQUIRE(resp::parse_reply(std::string_view(buf).substr(consumed), second, consumed) == resp::parse_result::ok);
        CHECK(second.integer == 3);
    }

    SUBCASE("partial bulk is incomplete")
    {
        CHECK(resp::parse_reply("$5\r\nab", r, consumed) == resp::parse_result::incomplete);
    }

    SUBCASE("nesting beyond the limit is an error")
    {
        std::string buf;
        for (int i = 0; i <= resp::RESP_MAX_DEPTH + 1; ++i)
            buf += "*1\r\n";
        buf += ":1\r\n";
        CHECK(resp::parse_reply(buf, r, consumed) == resp::parse_result::error);
    }
}
