#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "../../intelgate/admission/query_cost.h"

namespace {

cost_estimate score(std::string_view text, const cost_schema& schema = cost_schema::defaults())
{
    query_parser parser;
    query_shape shape;
    REQUIRE_MESSAGE(parser.parse(text, shape), parser.error());
    return estimate_cost(shape, schema);
}

} // namespace

TEST_CASE("query parsing")
{
    query_parser parser;
    query_shape shape;

    SUBCASE("keyword, aliases and arguments")
    {
        REQUIRE(parser.parse("query Recent { latest: threats(first: 5, sort: \"date\") { id } }", shape));
        CHECK(shape.operation == "query");
        REQUIRE(shape.roots.size() == 1);
        const field_node& f = shape.roots[0];
        CHECK(f.name == "threats");
        CHECK(f.alias == "latest");
        int64_t first = 0;
        CHECK(f.int_arg("first", first));
        CHECK(first == 5);
        REQUIRE(f.arg("sort") != nullptr);
        CHECK(*f.arg("sort") == "date");
        CHECK(f.children.size() == 1);
    }

    SUBCASE("bare selection without braces")
    {
        REQUIRE(parser.parse("threat(id: \"t1\") { name }", shape));
        CHECK(shape.roots[0].name == "threat");
    }

    SUBCASE("mutation keyword")
    {
        REQUIRE(parser.parse("mutation { importIOCs(source: \"feed\") { id } }", shape));
        CHECK(shape.operation == "mutation");
    }

    SUBCASE("unsupported constructs")
    {
        CHECK_FALSE(parser.parse("{ threats { ...ThreatFields } }", shape));
        CHECK_FALSE(parser.parse("{ threats @include(if: true) { id } }", shape));
        CHECK_FALSE(parser.parse("query Q($id: ID) { threat(id: $id) { id } }", shape));
        CHECK_FALSE(parser.error().empty());
    }

    SUBCASE("malformed input")
    {
        CHECK_FALSE(parser.parse("", shape));
        CHECK_FALSE(parser.parse("{ threats { id }", shape));
        CHECK_FALSE(parser.parse("{ threats { } }", shape));
        CHECK_FALSE(parser.parse("{ threats } }", shape));
    }
}

TEST_CASE("cost estimation")
{
    SUBCASE("list sizes multiply into their children")
    {
        cost_estimate est = score("{ threats(first: 5) { id iocs(first: 20) { value } } }");
        // 25 + 5*1 + 5*20 + 5*20*1
        CHECK(est.score == 230);
        CHECK(est.depth == 3);
        CHECK(est.field_count == 4);
        CHECK(est.suggested_timeout_ms == 30000 + 230 * 100);
    }

    SUBCASE("default list sizes apply without first or limit")
    {
        cost_estimate est = score("{ threats { iocs { value } } }");
        // 25 + 10*20 + 10*10*1
        CHECK(est.score == 325);
    }

    SUBCASE("limit is honoured like first")
    {
        CHECK(score("{ threats(limit: 2) { name } }").score == 25 + 2);
    }

    SUBCASE("single-object fields do not multiply")
    {
        cost_estimate est = score("{ ioc(id: \"i1\") { enrichment { reputation } } }");
        CHECK(est.score == 10 + 100 + 50);
    }

    SUBCASE("unknown fields cost scalar or object weight")
    {
        CHECK(score("{ widget }").score == 1);
        CHECK(score("{ widget { a b } }").score == 2 + 1 + 1);
    }

    SUBCASE("introspection is expensive")
    {
        CHECK(score("{ __schema { types { name } } }").score >= 100);
        CHECK(score("{ __typename }").score == 0);
    }

    SUBCASE("deep nesting saturates instead of overflowing")
    {
        std::string text = "{ threats(first: 1000000)";
        for (int i = 0; i < 6; ++i)
            text += " { iocs(first: 1000000) { threats(first: 1000000)";
        text += " { id }";
        for (int i = 0; i < 6; ++i)
            text += " } }";
        text += " }";
        cost_estimate est = score(text);
        CHECK(est.score > 0);
        CHECK(est.suggested_timeout_ms == 300000);
    }

    SUBCASE("overrides")
    {
        cost_schema schema = cost_schema::defaults();
        CHECK(schema.set_weight("Threat.iocs", 1));
        CHECK(schema.set_default_size("Query.threats", 2));
        CHECK_FALSE(schema.set_default_size("Query.threat", 2));
        CHECK_FALSE(schema.set_weight("Threat.iocs", -1));
        // 25 + 2*1 + 2*10*1
        CHECK(score("{ threats { iocs { value } } }", schema).score == 25 + 2 + 20);
    }
}

TEST_CASE("ceilings")
{
    cost_limits limits;
    CHECK(effective_ceiling(limits, role_viewer) == 2000);

    limits.role_scaling = true;
    CHECK(effective_ceiling(limits, role_viewer) == 1000);
    CHECK(effective_ceiling(limits, role_analyst) == 2000);
    CHECK(effective_ceiling(limits, role_super_admin) == 6000);

    CHECK(suggested_timeout_ms(0) == 30000);
    CHECK(suggested_timeout_ms(1000000) == 300000);
}
