#include <catch2/catch_test_macros.hpp>
#include "analyzer/health_scorer.hpp"

using namespace plansight;

namespace {

std::vector<Issue> issues_of(std::initializer_list<Severity> severities) {
    std::vector<Issue> out;
    for (auto s : severities) {
        out.push_back(Issue{IssueType::ESTIMATION_ERROR, "x", s, std::nullopt, std::nullopt});
    }
    return out;
}

} // anonymous namespace

TEST_CASE("HealthScorer: default weights", "[health_scorer]") {
    const HealthScorer scorer;

    CHECK(scorer.score({}) == 100);
    CHECK(scorer.score(issues_of({Severity::LOW})) == 95);
    CHECK(scorer.score(issues_of({Severity::MEDIUM})) == 90);
    CHECK(scorer.score(issues_of({Severity::HIGH})) == 80);
    CHECK(scorer.score(issues_of({Severity::CRITICAL})) == 60);
    CHECK(scorer.score(issues_of({Severity::HIGH, Severity::HIGH})) == 60);
}

TEST_CASE("HealthScorer: clamps at zero", "[health_scorer]") {
    const HealthScorer scorer;

    std::vector<Issue> many;
    for (int i = 0; i < 12; ++i) {
        many.push_back(Issue{IssueType::SEQUENTIAL_SCAN, "x", Severity::CRITICAL,
                             std::nullopt, std::nullopt});
    }
    CHECK(scorer.score(many) == 0);
    CHECK(scorer.score(issues_of({Severity::CRITICAL, Severity::CRITICAL, Severity::HIGH})) == 0);
}

TEST_CASE("HealthScorer: more issues never raise the score", "[health_scorer]") {
    const HealthScorer scorer;

    std::vector<Issue> issues;
    int previous = scorer.score(issues);
    for (auto s : {Severity::LOW, Severity::HIGH, Severity::MEDIUM, Severity::CRITICAL,
                   Severity::LOW, Severity::HIGH}) {
        issues.push_back(Issue{IssueType::EXPENSIVE_JOIN, "x", s, std::nullopt, std::nullopt});
        const int current = scorer.score(issues);
        CHECK(current <= previous);
        CHECK(current >= HealthScorer::kMinScore);
        previous = current;
    }
}

TEST_CASE("HealthScorer: custom weights", "[health_scorer]") {
    SeverityWeights w;
    w.low = 1;
    w.medium = 2;
    w.high = 3;
    w.critical = 200;
    const HealthScorer scorer(w);

    CHECK(scorer.score(issues_of({Severity::LOW, Severity::MEDIUM, Severity::HIGH})) == 94);
    CHECK(scorer.score(issues_of({Severity::CRITICAL})) == 0);

    SECTION("Zero weight ignores that severity") {
        w.medium = 0;
        const HealthScorer lenient(w);
        CHECK(lenient.score(issues_of({Severity::MEDIUM, Severity::MEDIUM})) == 100);
    }
}
