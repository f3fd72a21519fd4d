/**
 * test_refresh_policy.cpp - Refresh windows and calendar arithmetic
 */

#include "tmdbsync/CivilDate.h"
#include "tmdbsync/RefreshPolicy.h"
#include <iostream>
#include <string>

namespace {
    void log_info(const std::string& msg) {
        std::cout << "ℹ️  " << msg << std::endl;
    }

    void log_success(const std::string& msg) {
        std::cout << "✅ " << msg << std::endl;
    }

    void log_error(const std::string& msg) {
        std::cerr << "❌ " << msg << std::endl;
    }

    int fail(const std::string& msg) {
        log_error(msg);
        return 1;
    }

    CivilDate date(const std::string& iso) {
        return *CivilDate::parse(iso);
    }
}

int main() {
    log_info("=== RefreshPolicy Tests ===\n");
    const CivilDate today = date("2026-03-01");

    // Test 1: CivilDate parsing and arithmetic
    {
        log_info("Test 1: CivilDate");
        if (CivilDate::parse("2026-02-29") || CivilDate::parse("2026-13-01") ||
            CivilDate::parse("2026-1-01") || CivilDate::parse("") || CivilDate::parse("2026-01-01T00:00")) {
            return fail("Test 1 failed: invalid dates accepted");
        }
        if (!CivilDate::parse("2024-02-29")) return fail("Test 1 failed: leap day rejected");
        if (today.minus_days(1).to_string() != "2026-02-28") return fail("Test 1 failed: month rollover");
        if (date("2025-01-01").minus_days(1).to_string() != "2024-12-31") return fail("Test 1 failed: year rollover");
        if (date("1970-01-01").to_days() != 0 || CivilDate::from_days(20000).to_string() != "2024-10-04") {
            return fail("Test 1 failed: epoch days");
        }
        if (date("2026-10-18").to_log_string() != "18/10/2026") return fail("Test 1 failed: log format");
        log_success("Test 1 passed");
    }

    // Test 2: Window boundaries are inclusive on both ends
    {
        log_info("\nTest 2: 30-day window boundaries");
        TimeWindowPolicy policy(30, "release_date");
        auto rec = [](const std::string& d) { return json{{"id", 1}, {"release_date", d}}; };

        const std::string edge = today.minus_days(30).to_string();
        const std::string outside = today.minus_days(31).to_string();
        if (!policy.is_due(rec(edge), today)) return fail("Test 2 failed: today-30 not due");
        if (policy.is_due(rec(outside), today)) return fail("Test 2 failed: today-31 due");
        if (!policy.is_due(rec(today.to_string()), today)) return fail("Test 2 failed: today not due");
        if (policy.is_due(rec("2026-03-02"), today)) return fail("Test 2 failed: future date due");
        log_success("Test 2 passed: " + edge + " due, " + outside + " not due");
    }

    // Test 3: Missing and unparseable dates are never due
    {
        log_info("\nTest 3: Missing dates");
        TimeWindowPolicy policy(60, "air_date");
        if (policy.is_due(json{{"id", 1}}, today) ||
            policy.is_due(json{{"air_date", nullptr}}, today) ||
            policy.is_due(json{{"air_date", ""}}, today) ||
            policy.is_due(json{{"air_date", "soon"}}, today) ||
            policy.is_due(json{{"air_date", 20260301}}, today) ||
            policy.is_due(json(nullptr), today)) {
            return fail("Test 3 failed");
        }
        log_success("Test 3 passed");
    }

    // Test 4: Status-keyed windows
    {
        log_info("\nTest 4: Status table");
        using Rule = StatusWindowPolicy::Rule;
        StatusWindowPolicy policy("status", "last_air_date",
                                  {{"Returning Series", Rule::Always()},
                                   {"In Production", Rule::Window(30)},
                                   {"Ended", Rule::Window(180)}},
                                  60);
        auto rec = [](const std::string& status, const json& d) {
            return json{{"id", 1}, {"status", status}, {"last_air_date", d}};
        };

        const std::string d45 = today.minus_days(45).to_string();
        const std::string d100 = today.minus_days(100).to_string();

        if (!policy.is_due(rec("Returning Series", nullptr), today)) return fail("Test 4 failed: always");
        if (!policy.is_due(rec("Returning Series", "1999-01-01"), today)) return fail("Test 4 failed: always, old date");
        if (policy.is_due(rec("In Production", d45), today)) return fail("Test 4 failed: 30d window");
        if (!policy.is_due(rec("Ended", d100), today)) return fail("Test 4 failed: 180d window");
        if (!policy.is_due(rec("Rumored", d45), today)) return fail("Test 4 failed: default window");
        if (policy.is_due(rec("Rumored", d100), today)) return fail("Test 4 failed: default window edge");
        if (!policy.is_due(json{{"id", 1}, {"last_air_date", d45}}, today)) return fail("Test 4 failed: missing status");
        if (policy.is_due(rec("Ended", nullptr), today)) return fail("Test 4 failed: no date");
        log_success("Test 4 passed");
    }

    // Test 5: Parent-derived and never
    {
        log_info("\nTest 5: Parent-derived window and never");
        ParentDerivedPolicy parent(60, "air_date");
        NeverRefreshPolicy never;

        if (!parent.uses_parent_context() || never.uses_parent_context()) {
            return fail("Test 5 failed: parent-context flags");
        }
        if (!parent.is_due(json{{"air_date", today.minus_days(60).to_string()}}, today) ||
            parent.is_due(json{{"air_date", today.minus_days(61).to_string()}}, today) ||
            parent.is_due(json(nullptr), today)) {
            return fail("Test 5 failed: parent window");
        }
        if (never.is_due(json{{"release_date", today.to_string()}}, today)) return fail("Test 5 failed: never");
        log_success("Test 5 passed: " + parent.describe());
    }

    log_info("\n=== All RefreshPolicy tests completed successfully ===");
    return 0;
}
