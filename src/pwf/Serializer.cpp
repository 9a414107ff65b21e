#include "pwf/Serializer.hpp"

#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <vector>

namespace pwf {

namespace {

// tag yaml-cpp assigns to unquoted scalars without an explicit tag
const char* const kPlainTag = "?";
const char* const kStrTag = "tag:yaml.org,2002:str";

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_oct(char c) { return c >= '0' && c <= '7'; }
bool is_hex(char c) { return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'); }

// Advances `pos` over a run of characters accepted by `pred`; returns the run length.
std::size_t scan(const std::string& s, std::size_t& pos, bool (*pred)(char)) {
    const std::size_t start = pos;
    while (pos < s.size() && pred(s[pos])) ++pos;
    return pos - start;
}

std::size_t skip_sign(const std::string& s) {
    return (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
}

// [-+]?[0-9]+
bool is_decimal_int(const std::string& s) {
    std::size_t pos = skip_sign(s);
    return scan(s, pos, is_digit) > 0 && pos == s.size();
}

// 0o[0-7]+ and 0x[0-9a-fA-F]+
bool is_prefixed_int(const std::string& s, char marker, bool (*pred)(char)) {
    if (s.size() < 3 || s[0] != '0' || s[1] != marker) return false;
    std::size_t pos = 2;
    return scan(s, pos, pred) > 0 && pos == s.size();
}

// [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?
bool is_float(const std::string& s) {
    std::size_t pos = skip_sign(s);
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        if (scan(s, pos, is_digit) == 0) return false;
    } else {
        if (scan(s, pos, is_digit) == 0) return false;
        if (pos < s.size() && s[pos] == '.') {
            ++pos;
            scan(s, pos, is_digit);
        }
    }

    if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
        ++pos;
        if (pos < s.size() && (s[pos] == '-' || s[pos] == '+')) ++pos;
        if (scan(s, pos, is_digit) == 0) return false;
    }
    return pos == s.size();
}

// [-+]?\.(inf|Inf|INF) and the unsigned \.(nan|NaN|NAN) forms.
bool is_special_float(const std::string& s, const std::string& word) {
    const std::size_t pos = skip_sign(s);
    if (s.size() != pos + 1 + word.size() || s[pos] != '.') return false;
    const std::string tail = s.substr(pos + 1);

    std::string title = word;
    title[0] = static_cast<char>(title[0] - 'a' + 'A');
    std::string upper = word;
    for (char& c : upper) c = static_cast<char>(c - 'a' + 'A');
    if (word == "nan") title = "NaN";

    return tail == word || tail == title || tail == upper;
}

bool parse_int(const std::string& s, int base, nlohmann::json& out) {
    const bool negative = !s.empty() && s[0] == '-';
    std::string digits = s;
    if (!digits.empty() && (digits[0] == '-' || digits[0] == '+')) digits.erase(0, 1);
    if (base != 10) digits.erase(0, 2);  // 0x / 0o

    errno = 0;
    char* end = nullptr;
    const unsigned long long u = std::strtoull(digits.c_str(), &end, base);
    if (errno == ERANGE || end == digits.c_str() || *end != '\0') return false;

    if (negative) {
        const auto limit = static_cast<unsigned long long>(std::numeric_limits<std::int64_t>::max()) + 1ULL;
        if (u > limit) return false;
        out = (u == limit) ? std::numeric_limits<std::int64_t>::min() : -static_cast<std::int64_t>(u);
        return true;
    }

    if (u <= static_cast<unsigned long long>(std::numeric_limits<std::int64_t>::max())) {
        out = static_cast<std::int64_t>(u);
    } else {
        out = static_cast<std::uint64_t>(u);
    }
    return true;
}

std::string where(const YAML::Mark& mark) {
    if (mark.is_null()) return "";
    return " (line " + std::to_string(mark.line + 1) + ", column " + std::to_string(mark.column + 1) + ")";
}

nlohmann::json node_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;

        case YAML::NodeType::Scalar: {
            const std::string& tag = node.Tag();
            if (tag == kPlainTag) return resolve_plain_scalar(node.Scalar());
            if (tag == "!" || tag == kStrTag) return node.Scalar();
            // other explicit tags fall back to plain resolution
            return resolve_plain_scalar(node.Scalar());
        }

        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) arr.push_back(node_to_json(item));
            return arr;
        }

        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                // a null key (~, null or an empty key) reads as ""
                std::string key;
                if (kv.first.IsScalar()) {
                    key = kv.first.Scalar();
                } else if (!kv.first.IsNull()) {
                    throw std::runtime_error("mapping keys must be scalars" + where(kv.first.Mark()));
                }
                if (obj.contains(key)) {
                    throw std::runtime_error("duplicate mapping key '" + key + "'" + where(kv.first.Mark()));
                }
                obj[key] = node_to_json(kv.second);
            }
            return obj;
        }
    }
    return nullptr;
}

void emit_string(YAML::Emitter& out, const std::string& s) {
    if (!resolve_plain_scalar(s).is_string()) {
        out << YAML::DoubleQuoted << s;
    } else {
        out << s;
    }
}

void emit_value(YAML::Emitter& out, const nlohmann::json& v) {
    switch (v.type()) {
        case nlohmann::json::value_t::object:
            out << YAML::BeginMap;
            for (auto it = v.begin(); it != v.end(); ++it) {
                out << YAML::Key;
                emit_string(out, it.key());
                out << YAML::Value;
                emit_value(out, it.value());
            }
            out << YAML::EndMap;
            break;

        case nlohmann::json::value_t::array:
            out << YAML::BeginSeq;
            for (const auto& item : v) emit_value(out, item);
            out << YAML::EndSeq;
            break;

        case nlohmann::json::value_t::string:
            emit_string(out, v.get<std::string>());
            break;

        case nlohmann::json::value_t::boolean:
            out << v.get<bool>();
            break;

        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
            out << v.dump();
            break;

        case nlohmann::json::value_t::number_float: {
            const double d = v.get<double>();
            if (std::isnan(d)) out << ".nan";
            else if (std::isinf(d)) out << (d > 0 ? ".inf" : "-.inf");
            else out << v.dump();  // shortest round-trip form
            break;
        }

        default:
            out << YAML::Null;
            break;
    }
}

}  // namespace

nlohmann::json resolve_plain_scalar(const std::string& s) {
    if (s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL") return nullptr;
    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;

    nlohmann::json out;
    if (is_decimal_int(s) && parse_int(s, 10, out)) return out;
    if (is_prefixed_int(s, 'o', is_oct) && parse_int(s, 8, out)) return out;
    if (is_prefixed_int(s, 'x', is_hex) && parse_int(s, 16, out)) return out;

    if (is_float(s)) {
        errno = 0;
        const double d = std::strtod(s.c_str(), nullptr);
        if (errno != ERANGE) return d;
        return s;
    }
    if (is_special_float(s, "inf")) {
        return s[0] == '-' ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
    }
    if (s[0] == '.' && is_special_float(s, "nan")) return std::numeric_limits<double>::quiet_NaN();

    return s;
}

std::string encode(const nlohmann::json& value) {
    YAML::Emitter out;
    out.SetIndent(2);
    out.SetMapFormat(YAML::Block);
    out.SetSeqFormat(YAML::Block);
    emit_value(out, value);

    std::string text = out.c_str();
    if (text.empty() || text.back() != '\n') text.push_back('\n');
    return text;
}

std::string encode(const Document& doc) {
    return encode(doc.value);
}

DecodeResult decode(const std::string& text) {
    DecodeResult res;
    try {
        const std::vector<YAML::Node> docs = YAML::LoadAll(text);
        if (docs.size() > 1) {
            res.error = "source contains " + std::to_string(docs.size()) + " documents; expected one";
            return res;
        }
        res.value = docs.empty() ? nlohmann::json(nullptr) : node_to_json(docs.front());
    } catch (const YAML::Exception& e) {
        res.value = nullptr;
        res.error = e.what();
        if (res.error.empty()) res.error = "invalid YAML";
    } catch (const std::runtime_error& e) {
        res.value = nullptr;
        res.error = e.what();
    }
    return res;
}

}  // namespace pwf
