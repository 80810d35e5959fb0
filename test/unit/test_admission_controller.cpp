#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "../../intelgate/admission/admission_controller.h"
#include "../../intelgate/store/memory_kv_store.h"

TEST_CASE("admission_controller")
{
    manual_clock clock;
    memory_kv_store store(clock);
    rate_limiter limiter(store, clock);
    limiter.set_limit(rate_standard_query, {2, 60000});

    cost_limits limits;
    limits.ceiling = 300;
    limits.max_depth = 3;
    admission_controller ac(limiter, cost_schema::defaults(), limits);

    auth_context alice{"alice", "org-1", role_analyst};

    SUBCASE("cheap queries are admitted")
    {
        query_shape shape;
        admission_decision d = ac.admit_query(rate_standard_query, alice,
                                              "{ threats(first: 5) { id iocs(first: 20) { value } } }", shape);
        CHECK(d.admitted());
        CHECK(d.cost.score == 230);
        CHECK(d.ceiling == 300);
        REQUIRE(shape.roots.size() == 1);
        CHECK(shape.roots[0].name == "threats");
        CHECK(ac.stats().admitted == 1);
    }

    SUBCASE("expensive queries are rejected without taking a token")
    {
        query_shape shape;
        admission_decision d = ac.admit_query(rate_standard_query, alice, "{ threats { iocs { value } } }", shape);
        CHECK(d.status == admit_too_complex);
        CHECK(d.cost.score == 325);
        CHECK_FALSE(d.reason.empty());
        CHECK(ac.stats().too_complex == 1);

        // both tokens still available
        CHECK(ac.admit(rate_standard_query, alice).admitted());
        CHECK(ac.admit(rate_standard_query, alice).admitted());
        CHECK(ac.admit(rate_standard_query, alice).status == admit_rate_limited);
    }

    SUBCASE("depth is checked before score")
    {
        query_shape shape;
        admission_decision d = ac.admit_query(rate_standard_query, alice, "{ a { b { c { d } } } }", shape);
        CHECK(d.status == admit_too_complex);
        CHECK(d.cost.depth == 4);
        CHECK(d.reason.find("depth") != std::string::npos);
    }

    SUBCASE("unparseable queries")
    {
        query_shape shape;
        admission_decision d = ac.admit_query(rate_standard_query, alice, "{ threats { ...F } }", shape);
        CHECK(d.status == admit_bad_query);
        CHECK(ac.stats().bad_query == 1);
        CHECK(ac.stats().admitted == 0);
    }

    SUBCASE("rate limit carries retry_after")
    {
        ac.admit(rate_standard_query, alice);
        ac.admit(rate_standard_query, alice);
        admission_decision d = ac.admit(rate_standard_query, alice);
        CHECK(d.status == admit_rate_limited);
        CHECK(d.retry_after_ms > 0);
        CHECK(ac.stats().rate_limited == 1);
    }

    SUBCASE("anonymous callers share a bucket")
    {
        auth_context anon;
        ac.admit(rate_standard_query, anon);
        ac.admit(rate_standard_query, anon);
        CHECK_FALSE(ac.admit(rate_standard_query, auth_context{}).admitted());
        CHECK(ac.admit(rate_standard_query, alice).admitted());
    }

    SUBCASE("role scaling")
    {
        limits.role_scaling = true;
        ac.set_limits(limits);
        query_shape shape;
        query_parser parser;
        REQUIRE(parser.parse("{ threats(first: 5) { id iocs(first: 20) { value } } }", shape));

        auth_context viewer{"v", "org-1", role_viewer};
        auth_context admin{"a", "org-1", role_admin};
        CHECK(ac.score(viewer, shape).status == admit_too_complex);
        CHECK(ac.score(admin, shape).status == admit_ok);
        CHECK(ac.score(admin, shape).ceiling == 600);
    }
}
