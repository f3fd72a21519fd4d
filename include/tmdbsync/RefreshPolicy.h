/**
 * RefreshPolicy.h - Decides whether a stored record must be fetched again
 *
 * A policy sees a JSON object of fields and today's UTC date. Scan-time
 * policies look at the stored record itself; parent-derived policies look
 * at the context inherited from the parent record when the candidate was
 * derived (e.g. a season's air_date for its episodes), because the child's
 * own freshness is unknown until it is fetched.
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "tmdbsync/CivilDate.h"

using json = nlohmann::json;

class RefreshPolicy {
public:
    virtual ~RefreshPolicy() = default;

    virtual bool is_due(const json& fields, const CivilDate& today) const = 0;

    // True when is_due() must be fed the candidate's parent context
    // instead of the stored record
    virtual bool uses_parent_context() const { return false; }

    virtual std::string describe() const = 0;
};

// today - window_days <= date <= today, inclusive
bool date_in_window(const CivilDate& date, int window_days, const CivilDate& today);

/**
 * NeverRefreshPolicy - existing records are kept; only new keys are fetched
 */
class NeverRefreshPolicy : public RefreshPolicy {
public:
    bool is_due(const json&, const CivilDate&) const override { return false; }
    std::string describe() const override { return "never"; }
};

/**
 * AlwaysRefreshPolicy - every stored record is fetched again on each run,
 * for small per-key reference tables rebuilt from scratch upstream
 */
class AlwaysRefreshPolicy : public RefreshPolicy {
public:
    bool is_due(const json&, const CivilDate&) const override { return true; }
    std::string describe() const override { return "always"; }
};

/**
 * TimeWindowPolicy - due when `date_field` falls inside the last `window_days`
 */
class TimeWindowPolicy : public RefreshPolicy {
public:
    TimeWindowPolicy(int window_days, std::string date_field);

    bool is_due(const json& fields, const CivilDate& today) const override;
    std::string describe() const override;

    int window_days() const { return window_days_; }
    const std::string& date_field() const { return date_field_; }

private:
    int window_days_;
    std::string date_field_;
};

/**
 * StatusWindowPolicy - window chosen by the record's status value.
 * A status mapped to "always" is due regardless of date; an unmapped or
 * missing status uses the default window.
 */
class StatusWindowPolicy : public RefreshPolicy {
public:
    struct Rule {
        bool always = false;
        int window_days = 0;

        static Rule Always() { return Rule{true, 0}; }
        static Rule Window(int days) { return Rule{false, days}; }
    };

    StatusWindowPolicy(std::string status_field,
                       std::string date_field,
                       std::map<std::string, Rule> rules,
                       int default_window_days);

    bool is_due(const json& fields, const CivilDate& today) const override;
    std::string describe() const override;

    Rule rule_for(const std::string& status) const;

private:
    std::string status_field_;
    std::string date_field_;
    std::map<std::string, Rule> rules_;
    int default_window_days_;
};

/**
 * ParentDerivedPolicy - evaluates a time window on the parent's date field
 */
class ParentDerivedPolicy : public RefreshPolicy {
public:
    ParentDerivedPolicy(int window_days, std::string parent_date_field);

    bool is_due(const json& parent_context, const CivilDate& today) const override;
    bool uses_parent_context() const override { return true; }
    std::string describe() const override;

private:
    TimeWindowPolicy window_;
};

std::optional<CivilDate> date_field_value(const json& fields, const std::string& field);
