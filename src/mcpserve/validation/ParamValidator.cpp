//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ParamValidator.cpp
// Purpose: Rule engine behind BaseHandler::validateRequest
//==========================================================================================================

#include <charconv>
#include <cmath>
#include <optional>
#include <sstream>

#include "logging/Logger.h"
#include "mcpserve/validation/ParamValidator.h"

namespace mcpserve {
namespace validation {

namespace {

struct Rule {
    std::string name;
    std::string argument;
};

std::vector<Rule> splitRules(const std::string& text) {
    std::vector<Rule> out;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, '|')) {
        if (part.empty()) continue;
        auto colon = part.find(':');
        if (colon == std::string::npos) {
            out.push_back(Rule{part, std::string()});
        } else {
            out.push_back(Rule{part.substr(0, colon), part.substr(colon + 1)});
        }
    }
    return out;
}

bool hasRule(const std::vector<Rule>& rules, const char* name) {
    for (const auto& r : rules) {
        if (r.name == name) return true;
    }
    return false;
}

std::optional<double> parseNumber(const std::string& s) {
    if (s.empty()) return std::nullopt;
    double v = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

bool isIntegerText(const std::string& s) {
    if (s.empty()) return false;
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    return ec == std::errc() && ptr == s.data() + s.size();
}

bool isNumeric(const JSONValue& v) {
    if (v.IsNumber()) return true;
    if (v.IsString()) return parseNumber(std::get<std::string>(v.value)).has_value();
    return false;
}

bool isInteger(const JSONValue& v) {
    if (v.IsInteger()) return true;
    if (std::holds_alternative<double>(v.value)) {
        double d = std::get<double>(v.value);
        return std::isfinite(d) && std::floor(d) == d;
    }
    if (v.IsString()) return isIntegerText(std::get<std::string>(v.value));
    return false;
}

bool isBooleanLike(const JSONValue& v) {
    if (v.IsBool()) return true;
    if (v.IsInteger()) {
        auto i = std::get<int64_t>(v.value);
        return i == 0 || i == 1;
    }
    if (v.IsString()) {
        const auto& s = std::get<std::string>(v.value);
        return s == "0" || s == "1" || s == "true" || s == "false";
    }
    return false;
}

// Laravel-style "filled" check used by required
bool isEmptyValue(const JSONValue& v) {
    if (v.IsNull()) return true;
    if (v.IsString()) {
        const auto& s = std::get<std::string>(v.value);
        return s.find_first_not_of(" \t\r\n") == std::string::npos;
    }
    if (v.IsArray()) return std::get<JSONValue::Array>(v.value).empty();
    if (v.IsObject()) return std::get<JSONValue::Object>(v.value).empty();
    return false;
}

std::size_t utf8Length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

enum class SizeKind { Characters, Items, Value };

struct Size {
    SizeKind kind;
    double amount;
};

Size sizeOf(const JSONValue& v, bool numericRules) {
    if (v.IsNumber()) {
        double d = v.IsInteger() ? static_cast<double>(std::get<int64_t>(v.value)) : std::get<double>(v.value);
        return Size{SizeKind::Value, d};
    }
    if (v.IsString()) {
        const auto& s = std::get<std::string>(v.value);
        if (numericRules) {
            if (auto num = parseNumber(s)) return Size{SizeKind::Value, *num};
        }
        return Size{SizeKind::Characters, static_cast<double>(utf8Length(s))};
    }
    if (v.IsArray()) return Size{SizeKind::Items, static_cast<double>(std::get<JSONValue::Array>(v.value).size())};
    if (v.IsObject()) return Size{SizeKind::Items, static_cast<double>(std::get<JSONValue::Object>(v.value).size())};
    return Size{SizeKind::Value, 0.0};
}

// Text form used by in: comparisons
std::string scalarText(const JSONValue& v) {
    if (v.IsString()) return std::get<std::string>(v.value);
    if (v.IsBool()) return std::get<bool>(v.value) ? "1" : "0";
    return SerializeJSON(v);
}

std::string defaultMessage(const std::string& field, const Rule& rule, const JSONValue* value, bool numericRules) {
    if (rule.name == "required") return "The " + field + " field is required.";
    if (rule.name == "string") return "The " + field + " field must be a string.";
    if (rule.name == "integer") return "The " + field + " field must be an integer.";
    if (rule.name == "numeric") return "The " + field + " field must be a number.";
    if (rule.name == "boolean") return "The " + field + " field must be true or false.";
    if (rule.name == "array") return "The " + field + " field must be an array.";
    if (rule.name == "object") return "The " + field + " field must be an object.";
    if (rule.name == "in") return "The selected " + field + " is invalid.";
    if (rule.name == "min" || rule.name == "max") {
        const bool isMin = rule.name == "min";
        SizeKind kind = value ? sizeOf(*value, numericRules).kind : SizeKind::Value;
        switch (kind) {
            case SizeKind::Characters:
                return "The " + field + " field must " + (isMin ? "be at least " : "not be greater than ") +
                       rule.argument + " characters.";
            case SizeKind::Items:
                return "The " + field + " field must " + (isMin ? "have at least " : "not have more than ") +
                       rule.argument + " items.";
            case SizeKind::Value:
                break;
        }
        return "The " + field + " field must " + (isMin ? "be at least " : "not be greater than ") +
               rule.argument + ".";
    }
    return "The " + field + " field is invalid.";
}

std::string messageFor(const std::string& field, const Rule& rule, const JSONValue* value, bool numericRules,
                       const MessageMap& messages) {
    auto it = messages.find(field + "." + rule.name);
    if (it != messages.end()) return it->second;
    it = messages.find(field);
    if (it != messages.end()) return it->second;
    return defaultMessage(field, rule, value, numericRules);
}

// Returns true when the rule passes for a present, non-null value
bool check(const Rule& rule, const JSONValue& v, bool numericRules) {
    if (rule.name == "string") return v.IsString();
    if (rule.name == "integer") return isInteger(v);
    if (rule.name == "numeric") return isNumeric(v);
    if (rule.name == "boolean") return isBooleanLike(v);
    if (rule.name == "array") return v.IsArray() || v.IsObject();
    if (rule.name == "object") return v.IsObject();
    if (rule.name == "in") {
        const std::string text = scalarText(v);
        std::stringstream ss(rule.argument);
        std::string option;
        while (std::getline(ss, option, ',')) {
            if (option == text) return true;
        }
        return false;
    }
    if (rule.name == "min" || rule.name == "max") {
        auto bound = parseNumber(rule.argument);
        if (!bound.has_value()) {
            LOG_WARN("Rule '{}:{}' has a non-numeric bound", rule.name, rule.argument);
            return true;
        }
        const double size = sizeOf(v, numericRules).amount;
        return rule.name == "min" ? size >= *bound : size <= *bound;
    }
    return true;
}

bool isKnownRule(const std::string& name) {
    return name == "required" || name == "nullable" || name == "string" || name == "integer" ||
           name == "numeric" || name == "boolean" || name == "array" || name == "object" || name == "in" ||
           name == "min" || name == "max";
}

} // namespace

std::vector<std::string> ValidateParams(const JSONValue::Object& params, const RuleSet& rules,
                                        const MessageMap& messages) {
    std::vector<std::string> failures;
    for (const auto& [field, ruleText] : rules) {
        const auto parsed = splitRules(ruleText);
        if (parsed.empty()) continue;

        const JSONValue* value = nullptr;
        auto it = params.find(field);
        if (it != params.end() && it->second) {
            value = it->second.get();
        }
        const bool numericRules = hasRule(parsed, "numeric") || hasRule(parsed, "integer");

        if (hasRule(parsed, "required") && (value == nullptr || isEmptyValue(*value))) {
            failures.push_back(messageFor(field, Rule{"required", ""}, value, numericRules, messages));
            continue;
        }
        if (value == nullptr) continue;
        if (value->IsNull() && hasRule(parsed, "nullable")) continue;

        for (const auto& rule : parsed) {
            if (rule.name == "required" || rule.name == "nullable") continue;
            if (!isKnownRule(rule.name)) {
                LOG_WARN("Ignoring unknown validation rule '{}' for field '{}'", rule.name, field);
                continue;
            }
            if (!check(rule, *value, numericRules)) {
                failures.push_back(messageFor(field, rule, value, numericRules, messages));
            }
        }
    }
    return failures;
}

} // namespace validation
} // namespace mcpserve
