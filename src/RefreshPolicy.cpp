/**
 * RefreshPolicy.cpp - Implementation
 */

#include "tmdbsync/RefreshPolicy.h"
#include <stdexcept>

bool date_in_window(const CivilDate& date, int window_days, const CivilDate& today) {
    const CivilDate cutoff = today.minus_days(window_days);
    return cutoff <= date && date <= today;
}

std::optional<CivilDate> date_field_value(const json& fields, const std::string& field) {
    if (!fields.is_object()) return std::nullopt;
    auto it = fields.find(field);
    if (it == fields.end() || !it->is_string()) return std::nullopt;
    return CivilDate::parse(it->get_ref<const std::string&>());
}

// ============================================================================
// TimeWindowPolicy
// ============================================================================

TimeWindowPolicy::TimeWindowPolicy(int window_days, std::string date_field)
    : window_days_(window_days), date_field_(std::move(date_field)) {
    if (window_days_ < 0) {
        throw std::invalid_argument("refresh window must not be negative");
    }
}

bool TimeWindowPolicy::is_due(const json& fields, const CivilDate& today) const {
    auto date = date_field_value(fields, date_field_);
    if (!date) return false;
    return date_in_window(*date, window_days_, today);
}

std::string TimeWindowPolicy::describe() const {
    return std::to_string(window_days_) + "d on " + date_field_;
}

// ============================================================================
// StatusWindowPolicy
// ============================================================================

StatusWindowPolicy::StatusWindowPolicy(std::string status_field,
                                       std::string date_field,
                                       std::map<std::string, Rule> rules,
                                       int default_window_days)
    : status_field_(std::move(status_field)),
      date_field_(std::move(date_field)),
      rules_(std::move(rules)),
      default_window_days_(default_window_days) {
    if (default_window_days_ < 0) {
        throw std::invalid_argument("default refresh window must not be negative");
    }
}

StatusWindowPolicy::Rule StatusWindowPolicy::rule_for(const std::string& status) const {
    auto it = rules_.find(status);
    if (it == rules_.end()) return Rule::Window(default_window_days_);
    return it->second;
}

bool StatusWindowPolicy::is_due(const json& fields, const CivilDate& today) const {
    std::string status;
    if (fields.is_object()) {
        auto it = fields.find(status_field_);
        if (it != fields.end() && it->is_string()) status = it->get<std::string>();
    }

    Rule rule = rule_for(status);
    if (rule.always) return true;

    auto date = date_field_value(fields, date_field_);
    if (!date) return false;
    return date_in_window(*date, rule.window_days, today);
}

std::string StatusWindowPolicy::describe() const {
    std::string out = "by " + status_field_ + " on " + date_field_ + " {";
    for (const auto& [status, rule] : rules_) {
        out += status + ":" + (rule.always ? std::string("always") : std::to_string(rule.window_days) + "d") + ", ";
    }
    out += "default:" + std::to_string(default_window_days_) + "d}";
    return out;
}

// ============================================================================
// ParentDerivedPolicy
// ============================================================================

ParentDerivedPolicy::ParentDerivedPolicy(int window_days, std::string parent_date_field)
    : window_(window_days, std::move(parent_date_field)) {}

bool ParentDerivedPolicy::is_due(const json& parent_context, const CivilDate& today) const {
    return window_.is_due(parent_context, today);
}

std::string ParentDerivedPolicy::describe() const {
    return "parent " + window_.describe();
}
