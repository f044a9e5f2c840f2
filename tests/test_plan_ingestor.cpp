#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "parser/plan_ingestor.hpp"

using namespace plansight;

namespace {

constexpr const char* kExplainOutput = R"([
  {
    "Plan": {
      "Node Type": "Hash Join",
      "Join Type": "Inner",
      "Startup Cost": 12.5,
      "Total Cost": 340.75,
      "Plan Rows": 1200,
      "Plan Width": 48,
      "Actual Startup Time": 0.412,
      "Actual Total Time": 18.9,
      "Actual Rows": 1180,
      "Actual Loops": 1,
      "Hash Cond": "(o.customer_id = c.id)",
      "Plans": [
        {
          "Node Type": "Seq Scan",
          "Relation Name": "orders",
          "Alias": "o",
          "Plan Rows": 5000,
          "Actual Rows": 5000
        },
        {
          "Node Type": "Hash",
          "Plans": [
            {
              "Node Type": "Index Scan",
              "Relation Name": "customers",
              "Index Name": "customers_pkey"
            }
          ]
        }
      ]
    },
    "Planning Time": 0.35,
    "Triggers": [],
    "Execution Time": 19.4
  }
])";

} // anonymous namespace

TEST_CASE("PlanIngestor: maps recognized node keys", "[ingestor]") {
    const auto plan = PlanIngestor::ingest_text(kExplainOutput);

    REQUIRE(plan.execution_time == Catch::Approx(19.4));
    REQUIRE(plan.planning_time == Catch::Approx(0.35));

    const auto& root = plan.plan;
    REQUIRE(root.node_type == "Hash Join");
    REQUIRE_FALSE(root.relation.has_value());
    REQUIRE(root.startup_cost.value() == Catch::Approx(12.5));
    REQUIRE(root.total_cost.value() == Catch::Approx(340.75));
    REQUIRE(root.plan_rows.value() == Catch::Approx(1200));
    REQUIRE(root.plan_width.value() == Catch::Approx(48));
    REQUIRE(root.actual_startup_time.value() == Catch::Approx(0.412));
    REQUIRE(root.actual_total_time.value() == Catch::Approx(18.9));
    REQUIRE(root.actual_rows.value() == Catch::Approx(1180));
    REQUIRE(root.actual_loops.value() == Catch::Approx(1));
}

TEST_CASE("PlanIngestor: children keep execution order", "[ingestor]") {
    const auto plan = PlanIngestor::ingest_text(kExplainOutput);

    REQUIRE(plan.plan.children.size() == 2);
    REQUIRE(plan.plan.children[0].node_type == "Seq Scan");
    REQUIRE(plan.plan.children[0].relation == "orders");
    REQUIRE(plan.plan.children[1].node_type == "Hash");
    REQUIRE(plan.plan.children[1].children.size() == 1);
    REQUIRE(plan.plan.children[1].children[0].relation == "customers");
}

TEST_CASE("PlanIngestor: unrecognized keys become camelCase attributes", "[ingestor]") {
    const auto plan = PlanIngestor::ingest_text(kExplainOutput);

    const auto* join_type = plan.plan.attribute("joinType");
    REQUIRE(join_type != nullptr);
    REQUIRE(join_type->as_string() == "Inner");

    const auto* hash_cond = plan.plan.attribute("hashCond");
    REQUIRE(hash_cond != nullptr);

    const auto& index_scan = plan.plan.children[1].children[0];
    const auto* index_name = index_scan.attribute("indexName");
    REQUIRE(index_name != nullptr);
    REQUIRE(index_name->as_string() == "customers_pkey");

    // Mapped keys and the child list are not duplicated as attributes
    REQUIRE(plan.plan.attribute("nodeType") == nullptr);
    REQUIRE(plan.plan.attribute("plans") == nullptr);
    REQUIRE(plan.plan.attributes.size() == 2);
}

TEST_CASE("PlanIngestor: key normalization", "[ingestor]") {
    REQUIRE(PlanIngestor::normalize_key("Sort Method") == "sortMethod");
    REQUIRE(PlanIngestor::normalize_key("Sort Space Used") == "sortSpaceUsed");
    REQUIRE(PlanIngestor::normalize_key("Index Name") == "indexName");
    REQUIRE(PlanIngestor::normalize_key("Alias") == "alias");
    REQUIRE(PlanIngestor::normalize_key("Shared  Hit Blocks") == "sharedHitBlocks");
    REQUIRE(PlanIngestor::normalize_key("sortMethod") == "sortMethod");
    REQUIRE(PlanIngestor::normalize_key("") == "");
}

TEST_CASE("PlanIngestor: accepts a bare object and nested timing sections", "[ingestor]") {
    const auto plan = PlanIngestor::ingest_text(R"({
        "Plan": {"Node Type": "Result"},
        "Execution": {"Execution Time": 1500},
        "Planning": {"Planning Time": 12},
        "Query": "SELECT 1",
        "Warnings": ["stale statistics"]
    })");

    REQUIRE(plan.plan.node_type == "Result");
    REQUIRE(plan.execution_time == Catch::Approx(1500));
    REQUIRE(plan.planning_time == Catch::Approx(12));
    REQUIRE(plan.query == "SELECT 1");
    REQUIRE(plan.warnings.size() == 1);
    REQUIRE(plan.warnings[0] == "stale statistics");
    REQUIRE_FALSE(plan.triggers.has_value());
}

TEST_CASE("PlanIngestor: triggers are carried through", "[ingestor]") {
    const auto plan = PlanIngestor::ingest_text(kExplainOutput);
    REQUIRE(plan.triggers.has_value());
    REQUIRE(plan.triggers->is_array());
}

TEST_CASE("PlanIngestor: uninterpretable input degrades to Unknown plan", "[ingestor]") {
    auto check_degenerate = [](const QueryPlan& plan) {
        REQUIRE(plan.execution_time == 0.0);
        REQUIRE(plan.planning_time == 0.0);
        REQUIRE(plan.plan.node_type == "Unknown");
        REQUIRE(plan.plan.children.empty());
        REQUIRE(plan.plan.attributes.empty());
    };

    SECTION("null") {
        check_degenerate(PlanIngestor::ingest(JsonValue(nullptr)));
        check_degenerate(PlanIngestor::ingest_text("null"));
    }
    SECTION("empty text") {
        check_degenerate(PlanIngestor::ingest_text(""));
        check_degenerate(PlanIngestor::ingest_text("   \n"));
    }
    SECTION("empty array") {
        check_degenerate(PlanIngestor::ingest_text("[]"));
    }
    SECTION("scalar") {
        check_degenerate(PlanIngestor::ingest_text("42"));
        check_degenerate(PlanIngestor::ingest_text("\"plan\""));
    }
    SECTION("malformed JSON") {
        check_degenerate(PlanIngestor::ingest_text("[{\"Plan\": "));
    }
    SECTION("object without Plan") {
        check_degenerate(PlanIngestor::ingest_text("{}"));
    }
}

TEST_CASE("PlanIngestor: missing statistics stay absent", "[ingestor]") {
    const auto plan = PlanIngestor::ingest_text(R"([{"Plan": {
        "Node Type": "Seq Scan",
        "Relation Name": "t",
        "Plan Rows": "many"
    }}])");

    REQUIRE(plan.plan.node_type == "Seq Scan");
    REQUIRE_FALSE(plan.plan.plan_rows.has_value());
    REQUIRE_FALSE(plan.plan.actual_rows.has_value());
    REQUIRE_FALSE(plan.plan.actual_total_time.has_value());
}

TEST_CASE("PlanIngestor: node without a type is Unknown", "[ingestor]") {
    const auto plan = PlanIngestor::ingest_text(R"({"Plan": {"Plans": [{"Node Type": ""}, 7]}})");
    REQUIRE(plan.plan.node_type == "Unknown");
    REQUIRE(plan.plan.children.size() == 2);
    REQUIRE(plan.plan.children[0].node_type == "Unknown");
    REQUIRE(plan.plan.children[1].node_type == "Unknown");
}
