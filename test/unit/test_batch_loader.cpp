#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "../../intelgate/loader/batch_loader.h"

#include <stdexcept>

using string_loader = batch_loader<std::string, std::string>;

namespace {

struct recording_fetch
{
    std::vector<std::vector<std::string>> calls;

    string_loader::fetch_fn fn()
    {
        return [this](const std::vector<std::string>& keys) {
            calls.push_back(keys);
            std::vector<std::string> out;
            for (const auto& k : keys)
                out.push_back("v:" + k);
            return out;
        };
    }
};

} // namespace

TEST_CASE("batch_loader coalescing")
{
    recording_fetch rec;

    SUBCASE("duplicate keys are fetched once in one batch")
    {
        string_loader loader("test", rec.fn());
        auto a1 = loader.load("a");
        auto b = loader.load("b");
        auto a2 = loader.load("a");

        CHECK_FALSE(a1.ready());
        loader.flush();

        REQUIRE(rec.calls.size() == 1);
        CHECK(rec.calls[0] == std::vector<std::string>{"a", "b"});
        CHECK(a1.get() == "v:a");
        CHECK(a2.get() == "v:a");
        CHECK(b.get() == "v:b");
        CHECK(loader.stats().batches == 1);
        CHECK(loader.stats().keys_fetched == 2);
    }

    SUBCASE("batches are split at max_batch_size")
    {
        batch_loader_options opts;
        opts.max_batch_size = 2;
        string_loader loader("test", rec.fn(), opts);
        auto futures = loader.load_many({"a", "b", "c", "d", "e"});
        loader.flush();

        REQUIRE(rec.calls.size() == 3);
        CHECK(rec.calls[0].size() == 2);
        CHECK(rec.calls[1].size() == 2);
        CHECK(rec.calls[2].size() == 1);
        for (size_t i = 0; i < futures.size(); ++i)
            CHECK(futures[i].ready());
        CHECK(futures[4].get() == "v:e");
    }

    SUBCASE("results follow key order")
    {
        string_loader loader("test", rec.fn());
        auto futures = loader.load_many({"z", "y", "x"});
        loader.flush();
        CHECK(futures[0].get() == "v:z");
        CHECK(futures[1].get() == "v:y");
        CHECK(futures[2].get() == "v:x");
    }
}

TEST_CASE("batch_loader memoization")
{
    recording_fetch rec;

    SUBCASE("a resolved key is served from the scope memo")
    {
        string_loader loader("test", rec.fn());
        loader.load("a");
        loader.flush();

        auto again = loader.load("a");
        CHECK(again.ready());
        CHECK(again.get() == "v:a");
        CHECK_FALSE(loader.has_pending());
        CHECK(rec.calls.size() == 1);
        CHECK(loader.stats().cache_hits == 1);
    }

    SUBCASE("cache disabled refetches across rounds")
    {
        batch_loader_options opts;
        opts.cache = false;
        string_loader loader("test", rec.fn(), opts);
        loader.load("a");
        loader.load("a");
        loader.flush();
        CHECK(rec.calls.size() == 1);

        loader.load("a");
        loader.flush();
        CHECK(rec.calls.size() == 2);
    }

    SUBCASE("clear forces a refetch")
    {
        string_loader loader("test", rec.fn());
        loader.load("a");
        loader.flush();
        loader.clear("a");
        auto f = loader.load("a");
        CHECK_FALSE(f.ready());
        loader.flush();
        CHECK(rec.calls.size() == 2);
    }

    SUBCASE("prime never overwrites")
    {
        string_loader loader("test", rec.fn());
        CHECK(loader.prime("p", "primed"));
        CHECK_FALSE(loader.prime("p", "other"));

        auto f = loader.load("p");
        CHECK(f.ready());
        CHECK(f.get() == "primed");
        CHECK_FALSE(loader.has_pending());
        CHECK(rec.calls.empty());
    }

    SUBCASE("prime is refused when caching is off")
    {
        batch_loader_options opts;
        opts.cache = false;
        string_loader loader("test", rec.fn(), opts);
        CHECK_FALSE(loader.prime("p", "primed"));
    }
}

TEST_CASE("batch_loader failures")
{
    SUBCASE("a failing key does not fail its batch mates")
    {
        int calls = 0;
        string_loader loader("test", [&](const std::vector<std::string>& keys) {
            ++calls;
            std::vector<std::string> out;
            for (const auto& k : keys)
            {
                if (k == "bad")
                    throw std::runtime_error("row decode failed");
                out.push_back("v:" + k);
            }
            return out;
        });

        auto a = loader.load("a");
        auto bad = loader.load("bad");
        auto c = loader.load("c");
        loader.flush();

        // one batch, then one retry per key
        CHECK(calls == 4);
        CHECK(a.get() == "v:a");
        CHECK(c.get() == "v:c");
        CHECK(bad.ready());
        CHECK(bad.get().empty());
        CHECK(loader.stats().failures == 1);

        // failed keys are not memoized
        auto retry = loader.load("bad");
        CHECK_FALSE(retry.ready());
        CHECK(loader.has_pending());
    }

    SUBCASE("short result lists resolve the tail to the fallback")
    {
        batch_loader<std::string, std::optional<std::string>> loader("test",
            [](const std::vector<std::string>& keys) {
                std::vector<std::optional<std::string>> out;
                out.emplace_back("first:" + keys[0]);
                return out;
            });

        auto a = loader.load("a");
        auto b = loader.load("b");
        loader.flush();

        REQUIRE(a.get().has_value());
        CHECK(*a.get() == "first:a");
        CHECK(b.ready());
        CHECK_FALSE(b.get().has_value());
    }

    SUBCASE("extra results are ignored")
    {
        string_loader loader("test", [](const std::vector<std::string>&) {
            return std::vector<std::string>{"one", "two", "three"};
        });
        auto a = loader.load("a");
        loader.flush();
        CHECK(a.get() == "one");
    }
}

TEST_CASE("batch_loader deadline")
{
    manual_clock clock;
    batch_loader_options opts;
    opts.fetch_timeout = std::chrono::milliseconds(10);
    opts.clock = &clock;

    std::vector<std::string> sunk;
    string_loader loader("slow", [&](const std::vector<std::string>& keys) {
        clock.advance(std::chrono::milliseconds(50));
        std::vector<std::string> out;
        for (const auto& k : keys)
            out.push_back("v:" + k);
        return out;
    }, opts);
    loader.set_result_sink([&](const std::vector<std::string>& keys, const std::vector<std::string>& values) {
        CHECK(keys.size() == values.size());
        sunk = values;
    });

    auto a = loader.load("a");
    auto b = loader.load("b");
    loader.flush();

    CHECK(a.ready());
    CHECK(a.timed_out());
    CHECK(a.get().empty());
    CHECK(b.timed_out());
    CHECK(loader.stats().timeouts == 2);

    // late values still reach the sink
    CHECK(sunk == std::vector<std::string>{"v:a", "v:b"});

    // and are not memoized in the scope
    CHECK_FALSE(loader.load("a").ready());
}

TEST_CASE("batch_loader lookup hook")
{
    recording_fetch rec;
    string_loader loader("test", rec.fn());
    loader.set_lookup([](const std::vector<std::string>& keys, std::vector<std::optional<std::string>>& out) {
        out.assign(keys.size(), std::nullopt);
        for (size_t i = 0; i < keys.size(); ++i)
        {
            if (keys[i] == "hot")
                out[i] = "cached:hot";
        }
    });

    auto hot = loader.load("hot");
    auto cold = loader.load("cold");
    loader.flush();

    CHECK(hot.get() == "cached:hot");
    CHECK(cold.get() == "v:cold");
    REQUIRE(rec.calls.size() == 1);
    CHECK(rec.calls[0] == std::vector<std::string>{"cold"});
    CHECK(loader.stats().shared_hits == 1);
}

TEST_CASE("batch_loader continuations")
{
    recording_fetch rec;
    string_loader loader("test", rec.fn());

    std::string chained;
    loader.load("a").then([&](const std::string& v) {
        loader.load(v + "-child").then([&](const std::string& child) { chained = child; });
    });

    loader.dispatch();
    CHECK(loader.has_pending());
    CHECK(chained.empty());

    loader.flush();
    CHECK(chained == "v:v:a-child");
    CHECK(rec.calls.size() == 2);

    SUBCASE("then on a resolved future runs immediately")
    {
        bool ran = false;
        loader.load("a").then([&](const std::string&) { ran = true; });
        CHECK(ran);
    }
}
