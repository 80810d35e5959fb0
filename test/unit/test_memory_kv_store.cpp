#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "../../intelgate/store/memory_kv_store.h"

#include <algorithm>

TEST_CASE("memory_kv_store strings")
{
    manual_clock clock;
    memory_kv_store store(clock);

    SUBCASE("set and get")
    {
        CHECK(store.set("k", "v", 0));
        std::string out;
        CHECK(store.get("k", out) == kv_ok);
        CHECK(out == "v");
        CHECK(store.get("missing", out) == kv_miss);
    }

    SUBCASE("mget keeps positions")
    {
        store.set("a", "1", 0);
        store.set("c", "3", 0);
        std::vector<std::optional<std::string>> out;
        CHECK(store.mget({"a", "b", "c"}, out));
        REQUIRE(out.size() == 3);
        CHECK(out[0] == std::optional<std::string>("1"));
        CHECK_FALSE(out[1].has_value());
        CHECK(out[2] == std::optional<std::string>("3"));
    }

    SUBCASE("mset writes every item")
    {
        CHECK(store.mset({{"x", "1"}, {"y", "2"}}, 1000));
        std::string out;
        CHECK(store.get("y", out) == kv_ok);
        CHECK(out == "2");
        int64_t ttl = 0;
        store.pttl("x", ttl);
        CHECK(ttl == 1000);
    }

    SUBCASE("del counts removed keys")
    {
        store.set("a", "1", 0);
        store.sadd("s", "m");
        int64_t removed = 0;
        CHECK(store.del({"a", "s", "nope"}, removed));
        CHECK(removed == 2);
        CHECK(store.size() == 0);
    }
}

TEST_CASE("memory_kv_store expiry")
{
    manual_clock clock;
    memory_kv_store store(clock);

    SUBCASE("keys expire lazily")
    {
        store.set("k", "v", 100);
        clock.advance(std::chrono::milliseconds(99));
        std::string out;
        CHECK(store.get("k", out) == kv_ok);
        clock.advance(std::chrono::milliseconds(1));
        CHECK(store.get("k", out) == kv_miss);
    }

    SUBCASE("pttl reports missing and persistent keys")
    {
        int64_t ttl = 0;
        store.pttl("none", ttl);
        CHECK(ttl == -2);
        store.set("p", "v", 0);
        store.pttl("p", ttl);
        CHECK(ttl == -1);
    }

    SUBCASE("expire with a non-positive ttl deletes")
    {
        store.set("k", "v", 0);
        store.expire("k", 0);
        std::string out;
        CHECK(store.get("k", out) == kv_miss);
    }

    SUBCASE("incr keeps the existing expiry")
    {
        int64_t v = 0;
        CHECK(store.incr("n", 1, v));
        store.expire("n", 500);
        CHECK(store.incr("n", 4, v));
        CHECK(v == 5);
        int64_t ttl = 0;
        store.pttl("n", ttl);
        CHECK(ttl == 500);
    }

    SUBCASE("incr rejects non-integers")
    {
        store.set("s", "abc", 0);
        int64_t v = 0;
        CHECK_FALSE(store.incr("s", 1, v));
    }

    SUBCASE("sweep removes expired keys eagerly")
    {
        store.set("a", "1", 10);
        store.set("b", "2", 0);
        clock.advance(std::chrono::milliseconds(20));
        auto swept = store.sweep_expired();
        REQUIRE(swept.size() == 1);
        CHECK(swept[0] == "a");
        CHECK(store.size() == 1);
    }

    SUBCASE("keys skips expired entries")
    {
        store.set("t:1", "x", 10);
        store.set("t:2", "y", 0);
        clock.advance(std::chrono::milliseconds(20));
        std::vector<std::string> out;
        store.keys("t:*", out);
        CHECK(out == std::vector<std::string>{"t:2"});
    }
}

TEST_CASE("memory_kv_store patterns and sets")
{
    memory_kv_store store;
    store.set("threat:search:abc", "1", 0);
    store.set("threat:search:def", "2", 0);
    store.set("threat:threat:t1", "3", 0);

    std::vector<std::string> out;
    store.keys("threat:search:*", out);
    std::sort(out.begin(), out.end());
    CHECK(out == std::vector<std::string>{"threat:search:abc", "threat:search:def"});

    store.sadd("tag:x", "a");
    store.sadd("tag:x", "b");
    store.sadd("tag:x", "a");
    std::vector<std::string> members;
    store.smembers("tag:x", members);
    std::sort(members.begin(), members.end());
    CHECK(members == std::vector<std::string>{"a", "b"});

    // string and set share one key space
    CHECK_FALSE(store.sadd("threat:threat:t1", "m"));
}

TEST_CASE("memory_kv_store pipeline")
{
    memory_kv_store store;
    kv_pipeline p;
    p.set("a", "1", 0);
    p.incr("n", 3);
    p.sadd("s", "m");
    p.del("a");
    CHECK(p.size() == 4);
    CHECK(store.exec(p));

    std::string out;
    CHECK(store.get("a", out) == kv_miss);
    CHECK(store.get("n", out) == kv_ok);
    CHECK(out == "3");
}
