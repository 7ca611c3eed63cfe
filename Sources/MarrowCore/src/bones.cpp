#include "marrow/bones.hpp"
#include "marrow/entity_store.hpp"
#include "marrow/hashing.hpp"
#include "marrow/skeleton.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace marrow {

namespace {

bone_options readonly_options() {
    bone_options options;
    options.readonly = true;
    options.descr = "Key";
    return options;
}

std::string trimmed(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // namespace

// ============================================================================
// key_bone
// ============================================================================

key_bone::key_bone() : bone(readonly_options()) {}

std::optional<std::vector<read_from_client_error>> key_bone::from_client(
    skeleton_instance&, const std::string&, const client_data&) const {
    return std::nullopt;
}

bool key_bone::serialize(skeleton_instance&, const std::string&) const {
    return false;
}

bool key_bone::unserialize(skeleton_instance& skel, const std::string& name) const {
    const auto& e = skel.db_entity();
    if (!e || !e->key.is_complete()) return false;
    skel.set(name, e->key.to_string());
    return true;
}

void key_bone::build_db_filter(const std::string& name, const skeleton_definition&, query& q,
                               const client_params& params, const std::string& prefix) const {
    auto it = params.find(name);
    if (it == params.end()) return;
    if (!it->second.is_string() || !db_key::try_parse(it->second.get<std::string>())) {
        throw invalid_query("Invalid key filter: " + it->second.dump());
    }
    if (prefix.empty()) {
        q.filter(std::string(key_property) + " =", it->second);
    } else {
        q.filter(prefix + name + " =", it->second);
    }
}

void key_bone::build_db_sort(const std::string& name, const skeleton_definition&, query& q,
                             const client_params& params, const std::string& prefix) const {
    auto it = params.find("orderby");
    if (it == params.end() || it->second != name) return;
    auto dir_it = params.find("orderdir");
    sort_direction dir = dir_it != params.end() && (dir_it->second == "1" || dir_it->second == 1)
        ? sort_direction::descending : sort_direction::ascending;
    q.order(prefix.empty() ? std::string(key_property) : prefix + name, dir);
}

// ============================================================================
// string_bone
// ============================================================================

string_bone::string_bone(bone_options options, size_t max_length, bool case_sensitive)
    : bone(std::move(options)), max_length_(max_length), case_sensitive_(case_sensitive) {}

std::pair<json, std::vector<read_from_client_error>> string_bone::single_value_from_client(
    const json& value, skeleton_instance&, const std::string&, const client_data&) const {
    if (value.is_null()) return {get_empty_value(), {}};
    if (!value.is_string()) {
        return {get_empty_value(), {make_error(error_severity::invalid, "Invalid value: expected text")}};
    }
    std::string s = value.get<std::string>();
    if (s.size() > max_length_) {
        return {get_empty_value(), {make_error(error_severity::invalid, "Maximum length exceeded")}};
    }
    return {s, {}};
}

std::string string_bone::hash_single_value(const json& value) const {
    if (!case_sensitive_ && value.is_string()) {
        return unique_value_hash(lowercase(value.get<std::string>()));
    }
    return unique_value_hash(value);
}

// ============================================================================
// numeric_bone
// ============================================================================

numeric_bone::numeric_bone(bone_options options, int precision, double min, double max)
    : bone(std::move(options)), precision_(precision), min_(min), max_(max) {}

std::optional<json> numeric_bone::parse(const json& value) const {
    double number = 0;
    if (value.is_number()) {
        number = value.get<double>();
    } else if (value.is_string()) {
        std::string s = trimmed(value.get<std::string>());
        std::replace(s.begin(), s.end(), ',', '.');
        if (s.empty()) return json(nullptr);
        try {
            size_t used = 0;
            number = std::stod(s, &used);
            if (used != s.size()) return std::nullopt;
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    } else if (value.is_null()) {
        return json(nullptr);
    } else {
        return std::nullopt;
    }

    if (!std::isfinite(number)) return std::nullopt;
    if (precision_ <= 0) return json(static_cast<int64_t>(std::llround(number)));
    double scale = std::pow(10.0, precision_);
    return json(std::round(number * scale) / scale);
}

std::pair<json, std::vector<read_from_client_error>> numeric_bone::single_value_from_client(
    const json& value, skeleton_instance&, const std::string&, const client_data&) const {
    auto parsed = parse(value);
    if (!parsed) {
        return {get_empty_value(), {make_error(error_severity::invalid, "Invalid value entered")}};
    }
    if (!parsed->is_null()) {
        double number = parsed->get<double>();
        if (number < min_ || number > max_) {
            return {get_empty_value(), {make_error(error_severity::invalid, "Value out of range")}};
        }
    }
    return {*parsed, {}};
}

json numeric_bone::filter_value_from_client(const json& value) const {
    auto parsed = parse(value);
    if (!parsed) throw invalid_query("Invalid numeric filter value: " + value.dump());
    return *parsed;
}

// ============================================================================
// boolean_bone
// ============================================================================

boolean_bone::boolean_bone(bone_options options) : bone(std::move(options)) {
    if (options_.default_value.is_null() && !options_.multiple) {
        options_.default_value = false;
    }
}

bool boolean_bone::parse(const json& value) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) return value.get<double>() != 0;
    if (value.is_string()) {
        std::string s = lowercase(trimmed(value.get<std::string>()));
        return s == "1" || s == "true" || s == "yes" || s == "on";
    }
    return false;
}

std::pair<json, std::vector<read_from_client_error>> boolean_bone::single_value_from_client(
    const json& value, skeleton_instance&, const std::string&, const client_data&) const {
    return {parse(value), {}};
}

json boolean_bone::filter_value_from_client(const json& value) const {
    return parse(value);
}

} // namespace marrow
