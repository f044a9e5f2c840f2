#include <catch2/catch_test_macros.hpp>
#include "parser/fingerprinter.hpp"

using namespace plansight;

TEST_CASE("QueryFingerprinter integer literals", "[fingerprinter]") {

    SECTION("Standalone integers replaced with N") {
        REQUIRE(QueryFingerprinter::normalize("SELECT * FROM users WHERE id = 42") ==
                "SELECT * FROM users WHERE id = N");
    }

    SECTION("Digits inside identifiers are kept") {
        REQUIRE(QueryFingerprinter::normalize("SELECT col1 FROM t2 WHERE x = 7") ==
                "SELECT col1 FROM t2 WHERE x = N");
    }

    SECTION("Each side of a decimal point is its own integer") {
        REQUIRE(QueryFingerprinter::normalize("WHERE price > 3.14") == "WHERE price > N.N");
    }

    SECTION("LIMIT and OFFSET values") {
        REQUIRE(QueryFingerprinter::normalize("SELECT * FROM t LIMIT 10 OFFSET 20") ==
                "SELECT * FROM t LIMIT N OFFSET N");
    }
}

TEST_CASE("QueryFingerprinter string literals", "[fingerprinter]") {

    SECTION("Single-quoted string replaced with S") {
        REQUIRE(QueryFingerprinter::normalize("SELECT * FROM users WHERE name = 'John'") ==
                "SELECT * FROM users WHERE name = S");
    }

    SECTION("Empty string literal") {
        REQUIRE(QueryFingerprinter::normalize("WHERE name = ''") == "WHERE name = S");
    }

    SECTION("Numbers inside strings do not survive") {
        REQUIRE(QueryFingerprinter::normalize("WHERE code = 'A-100'") == "WHERE code = S");
    }

    SECTION("Doubled quote splits into two literals") {
        REQUIRE(QueryFingerprinter::normalize("WHERE name = 'O''Brien'") == "WHERE name = SS");
    }

    SECTION("Unterminated quote is left alone") {
        REQUIRE(QueryFingerprinter::normalize("WHERE name = 'abc") == "WHERE name = 'abc");
    }
}

TEST_CASE("QueryFingerprinter array and JSON literals", "[fingerprinter]") {

    SECTION("Bracket array replaced with A") {
        REQUIRE(QueryFingerprinter::normalize("WHERE tags && ARRAY[1, 2, 3]") ==
                "WHERE tags && ARRAYA");
    }

    SECTION("Brace literal replaced with J") {
        REQUIRE(QueryFingerprinter::normalize("WHERE data @> {\"k\": true}") ==
                "WHERE data @> J");
    }

    SECTION("Quoted JSON is a string first") {
        REQUIRE(QueryFingerprinter::normalize("WHERE data @> '{\"k\": 1}'::jsonb") ==
                "WHERE data @> S::jsonb");
    }
}

TEST_CASE("QueryFingerprinter whitespace", "[fingerprinter]") {

    SECTION("Runs collapse to one space") {
        REQUIRE(QueryFingerprinter::normalize("SELECT  *\n\tFROM   users") == "SELECT * FROM users");
    }

    SECTION("Leading and trailing whitespace removed") {
        REQUIRE(QueryFingerprinter::normalize("   SELECT 1   ") == "SELECT N");
    }

    SECTION("Empty input") {
        REQUIRE(QueryFingerprinter::normalize("") == "");
        REQUIRE(QueryFingerprinter::normalize(" \n ") == "");
    }

    SECTION("Case is preserved") {
        REQUIRE(QueryFingerprinter::normalize("Select * From Users") == "Select * From Users");
    }
}

TEST_CASE("QueryFingerprinter idempotence", "[fingerprinter]") {
    const char* queries[] = {
        "SELECT * FROM orders WHERE id = 5 AND status = 'open'",
        "UPDATE t SET tags = ARRAY['a', 'b'], meta = '{\"x\": 1}' WHERE id IN (1, 2, 3)",
        "INSERT INTO log VALUES (1, 'it''s', {a: 1}, [4,5])",
        "SELECT a1, 2b, _3 FROM t WHERE x = 'unterminated",
        "  SELECT\t1\n",
        "SELECT ']' , '[' FROM t WHERE j = {} AND k = []",
    };

    for (const auto* sql : queries) {
        const auto once = QueryFingerprinter::normalize(sql);
        const auto twice = QueryFingerprinter::normalize(once);
        INFO(sql);
        REQUIRE(once == twice);
    }
}

TEST_CASE("QueryFingerprinter hash", "[fingerprinter]") {

    SECTION("Same shape, same fingerprint and hash") {
        auto fp1 = QueryFingerprinter::fingerprint("SELECT * FROM users WHERE id = 1");
        auto fp2 = QueryFingerprinter::fingerprint("SELECT *  FROM users WHERE id = 999");
        REQUIRE(fp1.normalized == fp2.normalized);
        REQUIRE(fp1.hash == fp2.hash);
    }

    SECTION("Different shape, different hash") {
        auto fp1 = QueryFingerprinter::fingerprint("SELECT * FROM users WHERE id = 1");
        auto fp2 = QueryFingerprinter::fingerprint("SELECT * FROM orders WHERE id = 1");
        REQUIRE(fp1.hash != fp2.hash);
    }

    SECTION("Hash is non-zero for non-empty text") {
        auto fp = QueryFingerprinter::fingerprint("SELECT 1");
        REQUIRE(fp.hash != 0);
    }
}
