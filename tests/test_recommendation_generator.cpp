#include <catch2/catch_test_macros.hpp>
#include "analyzer/recommendation_generator.hpp"

using namespace plansight;

namespace {

Issue seq_scan_issue(const std::string& table) {
    return Issue{IssueType::SEQUENTIAL_SCAN,
                 "Sequential scan on table " + table + " with 5000 rows",
                 Severity::MEDIUM,
                 "Seq Scan on " + table,
                 std::nullopt};
}

Issue plain_issue(IssueType type) {
    return Issue{type, "x", Severity::MEDIUM, std::nullopt, std::nullopt};
}

} // anonymous namespace

TEST_CASE("RecommendationGenerator: no issues, fast plan", "[recommendations]") {
    const RecommendationGenerator gen;
    CHECK(gen.generate(QueryPlan{}, {}).empty());
}

TEST_CASE("RecommendationGenerator: sequential scans collapse into one line", "[recommendations]") {
    const RecommendationGenerator gen;

    SECTION("Two tables named once each") {
        auto recs = gen.generate(QueryPlan{}, {seq_scan_issue("a"), seq_scan_issue("b")});
        REQUIRE(recs.size() == 1);
        CHECK(recs[0] == "Consider adding indexes for tables: a, b");
    }

    SECTION("Repeated table appears once, first-seen order kept") {
        auto recs = gen.generate(QueryPlan{},
                                 {seq_scan_issue("b"), seq_scan_issue("a"), seq_scan_issue("b")});
        REQUIRE(recs.size() == 1);
        CHECK(recs[0] == "Consider adding indexes for tables: b, a");
    }
}

TEST_CASE("RecommendationGenerator: one line per issue type in fixed order", "[recommendations]") {
    const RecommendationGenerator gen;

    const std::vector<Issue> issues = {
        plain_issue(IssueType::MISSING_PARALLELISM),
        plain_issue(IssueType::INEFFICIENT_INDEX),
        plain_issue(IssueType::TEMPORARY_FILES),
        plain_issue(IssueType::EXPENSIVE_JOIN),
        plain_issue(IssueType::ESTIMATION_ERROR),
        plain_issue(IssueType::ESTIMATION_ERROR),
        seq_scan_issue("orders"),
        plain_issue(IssueType::HIGH_PLANNING_TIME),
    };

    auto recs = gen.generate(QueryPlan{}, issues);
    REQUIRE(recs.size() == 6);
    CHECK(recs[0] == "Consider adding indexes for tables: orders");
    CHECK(recs[1] == "Run ANALYZE on tables with statistics errors to improve query planning");
    CHECK(recs[2] == "Review join conditions and add appropriate indexes for join columns");
    CHECK(recs[3] == "Increase work_mem setting or break down the query into smaller operations");
    CHECK(recs[4] == "Consider creating more specific indexes that better match query patterns");
    CHECK(recs[5] ==
          "Enable parallel query execution for this operation (increase max_parallel_workers)");
}

TEST_CASE("RecommendationGenerator: caching hint for slow plans", "[recommendations]") {
    const RecommendationGenerator gen;

    QueryPlan plan;
    plan.execution_time = 1500;
    auto recs = gen.generate(plan, {});
    REQUIRE(recs.size() == 1);
    CHECK(recs[0] == "Consider caching frequently accessed query results");

    SECTION("Cutoff is strict") {
        plan.execution_time = 1000;
        CHECK(gen.generate(plan, {}).empty());
    }

    SECTION("Caching hint comes last") {
        recs = gen.generate(plan, {seq_scan_issue("t")});
        REQUIRE(recs.size() == 2);
        CHECK(recs.back() == "Consider caching frequently accessed query results");
    }

    SECTION("Configurable cutoff") {
        AnalyzerThresholds t;
        t.caching_min_execution_ms = 5000;
        const RecommendationGenerator lenient(t);
        CHECK(lenient.generate(plan, {}).empty());
    }
}
