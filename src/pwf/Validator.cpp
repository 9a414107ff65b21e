#include "pwf/Validator.hpp"

#include "pwf/Schema.hpp"

#include <re2/re2.h>

#include <cctype>
#include <cmath>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace pwf {

namespace {

bool type_matches(const std::string& type, const nlohmann::json& inst) {
    if (type == "object") return inst.is_object();
    if (type == "array") return inst.is_array();
    if (type == "string") return inst.is_string();
    if (type == "boolean") return inst.is_boolean();
    if (type == "null") return inst.is_null();
    if (type == "number") return inst.is_number();
    if (type == "integer") {
        if (inst.is_number_integer()) return true;
        if (!inst.is_number_float()) return false;
        const double d = inst.get<double>();
        return std::isfinite(d) && std::floor(d) == d;
    }
    return false;
}

// Counts code points, not bytes.
std::size_t utf8_length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

// Compiled once per process; shared by concurrent validations.
const RE2& compiled_pattern(const std::string& pattern) {
    static std::mutex mu;
    static std::map<std::string, std::unique_ptr<RE2>> cache;

    std::lock_guard<std::mutex> lock(mu);
    auto it = cache.find(pattern);
    if (it != cache.end()) return *it->second;

    RE2::Options options;
    options.set_log_errors(false);
    auto re = std::make_unique<RE2>(pattern, options);
    if (!re->ok()) {
        throw std::logic_error("invalid schema pattern '" + pattern + "': " + re->error());
    }
    return *cache.emplace(pattern, std::move(re)).first->second;
}

std::string limit_str(const nlohmann::json& limit) {
    return limit.dump();
}

class SchemaWalker {
    const nlohmann::json& root_;
    std::vector<PathSegment> location_;
    std::vector<RawViolation> out_;

public:
    explicit SchemaWalker(const nlohmann::json& root) : root_(root) {}

    std::vector<RawViolation> run(const nlohmann::json& inst) {
        check(root_, inst);
        return std::move(out_);
    }

private:
    void report(const std::string& keyword, nlohmann::json params, std::string message) {
        RawViolation v;
        v.location = location_;
        v.keyword = keyword;
        v.params = std::move(params);
        v.message = std::move(message);
        out_.push_back(std::move(v));
    }

    const nlohmann::json& resolve(const std::string& ref) const {
        if (ref.empty() || ref[0] != '#') {
            throw std::logic_error("only local schema references are supported: " + ref);
        }
        try {
            return root_.at(nlohmann::json::json_pointer(ref.substr(1)));
        } catch (const std::exception&) {
            throw std::logic_error("unresolved schema reference: " + ref);
        }
    }

    void check(const nlohmann::json& schema, const nlohmann::json& inst) {
        if (schema.is_boolean()) {
            if (!schema.get<bool>()) report("false schema", nlohmann::json::object(), "boolean schema is false");
            return;
        }
        if (!schema.is_object()) return;

        if (schema.contains("$ref")) {
            check(resolve(schema["$ref"].get<std::string>()), inst);
        }

        if (schema.contains("allOf")) {
            for (const auto& sub : schema["allOf"]) check(sub, inst);
        }

        if (!check_type(schema, inst)) return;

        if (schema.contains("const") && inst != schema["const"]) {
            report("const", {{"allowedValue", schema["const"]}}, "must be equal to constant");
        }

        if (schema.contains("enum")) {
            bool found = false;
            for (const auto& allowed : schema["enum"]) {
                if (inst == allowed) { found = true; break; }
            }
            if (!found) {
                report("enum", {{"allowedValues", schema["enum"]}}, "must be equal to one of the allowed values");
            }
        }

        if (inst.is_number()) check_number(schema, inst);
        if (inst.is_string()) check_string(schema, inst.get<std::string>());
        if (inst.is_array()) check_array(schema, inst);
        if (inst.is_object()) check_object(schema, inst);
    }

    bool check_type(const nlohmann::json& schema, const nlohmann::json& inst) {
        if (!schema.contains("type")) return true;

        const nlohmann::json& t = schema["type"];
        std::vector<std::string> types;
        if (t.is_string()) {
            types.push_back(t.get<std::string>());
        } else if (t.is_array()) {
            for (const auto& e : t) {
                if (e.is_string()) types.push_back(e.get<std::string>());
            }
        }

        for (const auto& type : types) {
            if (type_matches(type, inst)) return true;
        }

        std::string joined;
        for (size_t i = 0; i < types.size(); ++i) {
            if (i) joined += ",";
            joined += types[i];
        }
        report("type", {{"type", joined}}, "must be " + joined);
        return false;
    }

    void check_number(const nlohmann::json& schema, const nlohmann::json& inst) {
        const double v = inst.get<double>();

        struct Bound {
            const char* keyword;
            const char* comparison;
        };
        static const Bound bounds[] = {
            {"minimum", ">="},
            {"maximum", "<="},
            {"exclusiveMinimum", ">"},
            {"exclusiveMaximum", "<"},
        };

        for (const auto& b : bounds) {
            if (!schema.contains(b.keyword) || !schema[b.keyword].is_number()) continue;
            const nlohmann::json& limit = schema[b.keyword];
            const double lim = limit.get<double>();
            const std::string cmp = b.comparison;

            bool ok = true;
            if (cmp == ">=") ok = v >= lim;
            else if (cmp == "<=") ok = v <= lim;
            else if (cmp == ">") ok = v > lim;
            else if (cmp == "<") ok = v < lim;

            if (!ok) {
                report(b.keyword, {{"comparison", cmp}, {"limit", limit}},
                       "must be " + cmp + " " + limit_str(limit));
            }
        }
    }

    void check_string(const nlohmann::json& schema, const std::string& s) {
        const std::size_t len = utf8_length(s);

        if (schema.contains("minLength") && schema["minLength"].is_number_integer()) {
            const auto n = schema["minLength"].get<std::size_t>();
            if (len < n) {
                report("minLength", {{"limit", n}},
                       "must NOT have fewer than " + std::to_string(n) + " characters");
            }
        }

        if (schema.contains("maxLength") && schema["maxLength"].is_number_integer()) {
            const auto n = schema["maxLength"].get<std::size_t>();
            if (len > n) {
                report("maxLength", {{"limit", n}},
                       "must NOT have more than " + std::to_string(n) + " characters");
            }
        }

        if (schema.contains("pattern") && schema["pattern"].is_string()) {
            const std::string pattern = schema["pattern"].get<std::string>();
            if (!RE2::PartialMatch(s, compiled_pattern(pattern))) {
                report("pattern", {{"pattern", pattern}}, "must match pattern \"" + pattern + "\"");
            }
        }

        if (schema.contains("format") && schema["format"].is_string()) {
            const std::string format = schema["format"].get<std::string>();
            bool ok = true;
            if (format == "date") ok = is_valid_date(s);
            else if (format == "date-time") ok = is_valid_date_time(s);
            if (!ok) {
                report("format", {{"format", format}}, "must match format \"" + format + "\"");
            }
        }
    }

    void check_array(const nlohmann::json& schema, const nlohmann::json& inst) {
        if (schema.contains("minItems") && schema["minItems"].is_number_integer()) {
            const auto n = schema["minItems"].get<std::size_t>();
            if (inst.size() < n) {
                report("minItems", {{"limit", n}}, "must NOT have fewer than " + std::to_string(n) + " items");
            }
        }

        if (schema.contains("maxItems") && schema["maxItems"].is_number_integer()) {
            const auto n = schema["maxItems"].get<std::size_t>();
            if (inst.size() > n) {
                report("maxItems", {{"limit", n}}, "must NOT have more than " + std::to_string(n) + " items");
            }
        }

        if (schema.contains("items")) {
            const nlohmann::json& items = schema["items"];
            for (std::size_t i = 0; i < inst.size(); ++i) {
                location_.emplace_back(i);
                check(items, inst[i]);
                location_.pop_back();
            }
        }
    }

    void check_object(const nlohmann::json& schema, const nlohmann::json& inst) {
        if (schema.contains("required") && schema["required"].is_array()) {
            for (const auto& r : schema["required"]) {
                const std::string key = r.get<std::string>();
                if (!inst.contains(key)) {
                    report("required", {{"missingProperty", key}}, "must have required property '" + key + "'");
                }
            }
        }

        if (schema.contains("maxProperties") && schema["maxProperties"].is_number_integer()) {
            const auto n = schema["maxProperties"].get<std::size_t>();
            if (inst.size() > n) {
                report("maxProperties", {{"limit", n}},
                       "must NOT have more than " + std::to_string(n) + " properties");
            }
        }

        if (schema.contains("dependentRequired") && schema["dependentRequired"].is_object()) {
            for (auto it = schema["dependentRequired"].begin(); it != schema["dependentRequired"].end(); ++it) {
                if (!inst.contains(it.key())) continue;
                const nlohmann::json& deps = it.value();
                for (const auto& d : deps) {
                    const std::string dep = d.get<std::string>();
                    if (inst.contains(dep)) continue;
                    report("dependentRequired",
                           {{"property", it.key()}, {"missingProperty", dep}, {"deps", deps}, {"depsCount", deps.size()}},
                           "must have property " + dep + " when property " + it.key() + " is present");
                }
            }
        }

        const nlohmann::json empty = nlohmann::json::object();
        const nlohmann::json& props =
            (schema.contains("properties") && schema["properties"].is_object()) ? schema["properties"] : empty;

        for (auto it = inst.begin(); it != inst.end(); ++it) {
            const std::string& key = it.key();

            if (props.contains(key)) {
                location_.emplace_back(key);
                check(props[key], it.value());
                location_.pop_back();
                continue;
            }

            if (!schema.contains("additionalProperties")) continue;
            const nlohmann::json& extra = schema["additionalProperties"];

            if (extra.is_boolean() && !extra.get<bool>()) {
                report("additionalProperties", {{"additionalProperty", key}}, "must NOT have additional properties");
            } else if (extra.is_object()) {
                location_.emplace_back(key);
                check(extra, it.value());
                location_.pop_back();
            }
        }
    }
};

bool all_digits(const std::string& s, size_t pos, size_t n) {
    if (pos + n > s.size()) return false;
    for (size_t i = pos; i < pos + n; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

int to_int(const std::string& s, size_t pos, size_t n) {
    return std::stoi(s.substr(pos, n));
}

bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

bool valid_time(const std::string& s) {
    // HH:MM:SS[.frac](Z|+HH:MM|-HH:MM)
    if (s.size() < 9) return false;
    if (!all_digits(s, 0, 2) || s[2] != ':' || !all_digits(s, 3, 2) || s[5] != ':' || !all_digits(s, 6, 2)) {
        return false;
    }
    const int hh = to_int(s, 0, 2);
    const int mm = to_int(s, 3, 2);
    const int ss = to_int(s, 6, 2);
    if (hh > 23 || mm > 59 || ss > 60) return false;

    size_t pos = 8;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        const size_t start = pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
        if (pos == start) return false;
    }

    if (pos >= s.size()) return false;
    const char z = s[pos];
    if (z == 'Z' || z == 'z') return pos + 1 == s.size();
    if (z != '+' && z != '-') return false;
    if (s.size() != pos + 6) return false;
    if (!all_digits(s, pos + 1, 2) || s[pos + 3] != ':' || !all_digits(s, pos + 4, 2)) return false;
    return to_int(s, pos + 1, 2) <= 23 && to_int(s, pos + 4, 2) <= 59;
}

}  // namespace

bool is_valid_date(const std::string& s) {
    if (s.size() != 10) return false;
    if (!all_digits(s, 0, 4) || s[4] != '-' || !all_digits(s, 5, 2) || s[7] != '-' || !all_digits(s, 8, 2)) {
        return false;
    }

    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

    const int y = to_int(s, 0, 4);
    const int m = to_int(s, 5, 2);
    const int d = to_int(s, 8, 2);
    if (m < 1 || m > 12 || d < 1) return false;

    int max_day = days_in_month[m - 1];
    if (m == 2 && is_leap(y)) max_day = 29;
    return d <= max_day;
}

bool is_valid_date_time(const std::string& s) {
    if (s.size() < 11) return false;
    const char sep = s[10];
    if (sep != 'T' && sep != 't' && sep != ' ') return false;
    return is_valid_date(s.substr(0, 10)) && valid_time(s.substr(11));
}

std::vector<RawViolation> validate_against(const nlohmann::json& document, const nlohmann::json& schema) {
    SchemaWalker walker(schema);
    return walker.run(document);
}

std::vector<RawViolation> validate_raw(const nlohmann::json& document, DocumentKind kind) {
    return validate_against(document, schema_for(kind));
}

}  // namespace pwf
