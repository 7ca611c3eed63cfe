#include "marrow/bone.hpp"
#include "marrow/entity_store.hpp"
#include "marrow/hashing.hpp"
#include "marrow/skeleton.hpp"

#include <algorithm>
#include <cctype>

namespace marrow {

namespace {

json client_value_to_json(const client_value& v) {
    if (auto s = std::get_if<std::string>(&v)) return *s;
    return json(std::get<std::vector<std::string>>(v));
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool has_invalid(const std::vector<read_from_client_error>& errors) {
    return std::any_of(errors.begin(), errors.end(), [](const read_from_client_error& e) {
        return e.severity == error_severity::invalid;
    });
}

const client_data& no_client_data() {
    static const client_data empty;
    return empty;
}

} // namespace

read_from_client_error make_error(error_severity severity, std::string message,
                                  std::vector<std::string> field_path) {
    read_from_client_error e;
    e.severity = severity;
    e.message = std::move(message);
    e.field_path = std::move(field_path);
    return e;
}

bone::bone(bone_options options) : options_(std::move(options)) {}

json bone::get_default_value(const skeleton_instance&) const {
    auto single_default = [&]() -> json {
        if (options_.multiple) {
            return options_.default_value.is_array() ? options_.default_value : json::array();
        }
        return options_.default_value.is_null() ? get_empty_value() : options_.default_value;
    };
    if (!options_.languages.empty()) {
        json res = json::object();
        for (const auto& lang : options_.languages) {
            res[lang] = single_default();
        }
        return res;
    }
    return single_default();
}

bool bone::is_empty_single(const json& value) const {
    if (value.is_null()) return true;
    if (value.is_string()) return value.get<std::string>().empty();
    if (value.is_array() || value.is_object()) return value.empty();
    return false;
}

bool bone::is_empty(const json& value) const {
    if (value.is_null()) return true;

    auto level_empty = [&](const json& level) {
        if (options_.multiple && level.is_array()) {
            return std::all_of(level.begin(), level.end(), [&](const json& v) { return is_empty_single(v); });
        }
        return is_empty_single(level);
    };

    if (!options_.languages.empty() && value.is_object()) {
        for (const auto& lang : options_.languages) {
            if (value.contains(lang) && !level_empty(value.at(lang))) return false;
        }
        return true;
    }
    return level_empty(value);
}

void bone::iter_bone_value(json& value, const value_visitor& visit) const {
    auto visit_level = [&](json& level, const std::optional<std::string>& lang) {
        if (options_.multiple) {
            if (!level.is_array()) return;
            for (size_t i = 0; i < level.size(); ++i) {
                visit(i, lang, level[i]);
            }
        } else {
            visit(std::nullopt, lang, level);
        }
    };

    if (!options_.languages.empty()) {
        if (!value.is_object()) return;
        for (const auto& lang : options_.languages) {
            if (value.contains(lang)) visit_level(value[lang], lang);
        }
        return;
    }
    visit_level(value, std::nullopt);
}

// ============================================================================
// Client input
// ============================================================================

std::pair<json, bool> bone::collect_raw_client_data(const std::string& name, const client_data& data) const {
    bool found = false;

    auto collect = [&](const std::string& field) -> std::optional<json> {
        if (!parse_subfields_from_client()) {
            auto it = data.find(field);
            if (it == data.end()) return std::nullopt;
            found = true;
            json v = client_value_to_json(it->second);
            if (options_.multiple && !v.is_array()) v = json::array({v});
            return v;
        }

        std::string prefix = field + ".";
        std::map<size_t, json> items;
        json sub = json::object();
        bool any = false;
        for (auto it = data.lower_bound(prefix); it != data.end() && starts_with(it->first, prefix); ++it) {
            found = true;
            any = true;
            std::string rest = it->first.substr(prefix.size());
            if (!options_.multiple) {
                sub[rest] = client_value_to_json(it->second);
                continue;
            }
            size_t dot = rest.find('.');
            if (dot == std::string::npos || dot == 0) continue;
            std::string idx = rest.substr(0, dot);
            if (!std::all_of(idx.begin(), idx.end(), [](unsigned char c) { return std::isdigit(c); })) continue;
            json& item = items[std::stoul(idx)];
            if (item.is_null()) item = json::object();
            item[rest.substr(dot + 1)] = client_value_to_json(it->second);
        }
        if (!any) return std::nullopt;
        if (!options_.multiple) return sub;

        json list = json::array();
        for (auto& [_, item] : items) {
            list.push_back(std::move(item));
        }
        return list;
    };

    if (!options_.languages.empty()) {
        json res = json::object();
        for (const auto& lang : options_.languages) {
            if (auto v = collect(name + "." + lang)) res[lang] = std::move(*v);
        }
        return {res, found};
    }
    auto v = collect(name);
    return {v ? std::move(*v) : json(nullptr), found};
}

std::pair<json, std::vector<read_from_client_error>> bone::single_value_from_client(
    const json& value, skeleton_instance&, const std::string&, const client_data&) const {
    return {value, {}};
}

std::optional<std::vector<read_from_client_error>> bone::from_client(
    skeleton_instance& skel, const std::string& name, const client_data& data) const {
    auto [raw, found] = collect_raw_client_data(name, data);
    if (!found) {
        return std::vector<read_from_client_error>{make_error(error_severity::not_set, "Field not submitted", {name})};
    }

    std::vector<read_from_client_error> errors;

    auto add_errors = [&](std::vector<read_from_client_error>& errs, const std::optional<std::string>& lang,
                          std::optional<size_t> idx) {
        for (auto& e : errs) {
            std::vector<std::string> path{name};
            if (lang) path.push_back(*lang);
            if (idx) path.push_back(std::to_string(*idx));
            path.insert(path.end(), e.field_path.begin(), e.field_path.end());
            e.field_path = std::move(path);
            errors.push_back(std::move(e));
        }
    };

    auto parse_level = [&](const json& level, const std::optional<std::string>& lang) -> json {
        // A rejected value comes back as the bone's empty value, or as a
        // fallback the bone chose to keep.
        if (!options_.multiple) {
            auto [parsed, errs] = single_value_from_client(level, skel, name, data);
            add_errors(errs, lang, std::nullopt);
            return parsed;
        }
        json out = json::array();
        json items = level.is_array() ? level : json::array({level});
        for (size_t i = 0; i < items.size(); ++i) {
            auto [parsed, errs] = single_value_from_client(items[i], skel, name, data);
            add_errors(errs, lang, i);
            if (!is_empty_single(parsed)) out.push_back(std::move(parsed));
        }
        return out;
    };

    json value;
    if (!options_.languages.empty()) {
        value = json::object();
        for (const auto& lang : options_.languages) {
            if (raw.contains(lang)) {
                value[lang] = parse_level(raw.at(lang), lang);
            } else {
                value[lang] = options_.multiple ? json::array() : get_empty_value();
            }
        }
    } else {
        value = parse_level(raw, std::nullopt);
    }

    if (options_.required && is_empty(value) && !has_invalid(errors)) {
        errors.push_back(make_error(error_severity::empty, "Field not set", {name}));
    }

    skel.set(name, std::move(value));
    if (errors.empty()) return std::nullopt;
    return errors;
}

bool bone::set_bone_value(skeleton_instance& skel, const std::string& name, const json& value,
                          bool append, const std::optional<std::string>& language) const {
    if (append && !options_.multiple) return false;
    if (language && std::find(options_.languages.begin(), options_.languages.end(), *language) ==
                        options_.languages.end()) {
        return false;
    }

    auto convert = [&](const json& v) -> std::optional<json> {
        auto [parsed, errs] = single_value_from_client(v, skel, name, no_client_data());
        if (has_invalid(errs)) return std::nullopt;
        return parsed;
    };
    auto convert_level = [&](const json& v) -> std::optional<json> {
        if (!options_.multiple || append) return convert(v);
        if (!v.is_array()) return std::nullopt;
        json out = json::array();
        for (const auto& item : v) {
            auto c = convert(item);
            if (!c) return std::nullopt;
            out.push_back(std::move(*c));
        }
        return out;
    };

    if (!options_.languages.empty() && !language) {
        if (!value.is_object()) return false;
        json res = json::object();
        for (const auto& lang : options_.languages) {
            if (!value.contains(lang)) {
                res[lang] = options_.multiple ? json::array() : get_empty_value();
                continue;
            }
            auto c = convert_level(value.at(lang));
            if (!c) return false;
            res[lang] = std::move(*c);
        }
        skel.set(name, std::move(res));
        return true;
    }

    auto converted = convert_level(value);
    if (!converted) return false;

    if (language) {
        json& current = skel.get(name);
        if (!current.is_object()) current = json::object();
        if (append) {
            json& list = current[*language];
            if (!list.is_array()) list = json::array();
            list.push_back(std::move(*converted));
        } else {
            current[*language] = std::move(*converted);
        }
        return true;
    }

    if (append) {
        json& current = skel.get(name);
        if (!current.is_array()) current = json::array();
        current.push_back(std::move(*converted));
    } else {
        skel.set(name, std::move(*converted));
    }
    return true;
}

// ============================================================================
// Storage
// ============================================================================

bool bone::serialize(skeleton_instance& skel, const std::string& name) const {
    if (!skel.is_accessed(name) || !skel.db_entity()) return false;

    const json& value = skel.get(name);
    auto serialize_level = [&](const json& level) -> json {
        if (!options_.multiple) return single_value_serialize(level, skel, name);
        json out = json::array();
        if (level.is_array()) {
            for (const auto& v : level) {
                out.push_back(single_value_serialize(v, skel, name));
            }
        }
        return out;
    };

    json res;
    if (!options_.languages.empty()) {
        res = json::object();
        res[language_wrapper_marker] = true;
        for (const auto& lang : options_.languages) {
            res[lang] = serialize_level(value.is_object() && value.contains(lang) ? value.at(lang) : json(nullptr));
        }
    } else {
        res = serialize_level(value);
    }
    (*skel.db_entity())[name] = std::move(res);
    return true;
}

bool bone::unserialize(skeleton_instance& skel, const std::string& name) const {
    const auto& e = skel.db_entity();
    if (!e || !e->contains(name)) return false;

    json loaded = e->get(name);
    bool wrapped = loaded.is_object() && loaded.contains(language_wrapper_marker);

    auto unserialize_level = [&](const json& level) -> json {
        if (options_.multiple) {
            json out = json::array();
            if (level.is_array()) {
                for (const auto& v : level) out.push_back(single_value_unserialize(v));
            } else if (!level.is_null()) {
                out.push_back(single_value_unserialize(level));
            }
            return out;
        }
        if (level.is_array()) {
            return level.empty() ? get_empty_value() : single_value_unserialize(level.front());
        }
        return single_value_unserialize(level);
    };

    json res;
    if (!options_.languages.empty()) {
        res = json::object();
        for (const auto& lang : options_.languages) {
            if (wrapped) {
                res[lang] = unserialize_level(loaded.contains(lang) ? loaded.at(lang) : json(nullptr));
            } else if (lang == options_.languages.front()) {
                // stored before the bone became localized
                res[lang] = unserialize_level(loaded);
            } else {
                res[lang] = unserialize_level(nullptr);
            }
        }
    } else if (wrapped) {
        // stored while the bone was localized: keep the first language present
        json picked = nullptr;
        for (auto it = loaded.begin(); it != loaded.end(); ++it) {
            if (it.key() != language_wrapper_marker && !it.value().is_null()) {
                picked = it.value();
                break;
            }
        }
        res = unserialize_level(picked);
    } else {
        res = unserialize_level(loaded);
    }

    skel.set(name, std::move(res));
    return true;
}

// ============================================================================
// Pipeline hooks
// ============================================================================

std::string bone::hash_single_value(const json& value) const {
    return unique_value_hash(value);
}

std::vector<std::string> bone::get_unique_index_values(skeleton_instance& skel, const std::string& name) const {
    if (!options_.unique) return {};
    json value = skel.get(name);
    if (is_empty(value) && !options_.unique->lock_empty) return {};

    std::vector<std::string> hashes;
    iter_bone_value(value, [&](std::optional<size_t>, const std::optional<std::string>&, json& v) {
        if (options_.multiple && is_empty_single(v)) return;
        hashes.push_back(hash_single_value(v));
    });

    if (!options_.multiple || options_.unique->method == unique_lock_method::same_value) {
        return hashes;
    }
    if (options_.unique->method == unique_lock_method::same_set) {
        std::sort(hashes.begin(), hashes.end());
    }
    std::string joined;
    for (size_t i = 0; i < hashes.size(); ++i) {
        if (i) joined += ", ";
        joined += hashes[i];
    }
    return {unique_value_hash(joined)};
}

std::set<std::string> bone::get_referenced_blob_keys(skeleton_instance&, const std::string&) const {
    return {};
}

std::set<std::string> bone::get_search_tags(skeleton_instance& skel, const std::string& name) const {
    std::set<std::string> tags;
    json value = skel.get(name);
    iter_bone_value(value, [&](std::optional<size_t>, const std::optional<std::string>&, json& v) {
        std::string text;
        if (v.is_string()) {
            text = v.get<std::string>();
        } else if (v.is_number()) {
            text = v.dump();
        } else {
            return;
        }
        std::string word;
        for (char c : text + " ") {
            if (std::isalnum(static_cast<unsigned char>(c))) {
                word += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            } else if (!word.empty()) {
                tags.insert(word);
                word.clear();
            }
        }
    });
    return tags;
}

// ============================================================================
// Queries
// ============================================================================

std::string bone::query_property(const std::string& name) const {
    if (!options_.languages.empty()) return name + "." + options_.languages.front();
    return name;
}

void bone::build_db_filter(const std::string& name, const skeleton_definition&, query& q,
                           const client_params& params, const std::string& prefix) const {
    static const std::map<std::string, std::string> suffixes = {
        {"lt", "<"}, {"le", "<="}, {"gt", ">"}, {"ge", ">="}, {"ne", "!="}};

    std::string property = prefix + query_property(name);
    for (const auto& [param, value] : params) {
        std::string op;
        if (param == name) {
            op = "=";
        } else if (starts_with(param, name + "$")) {
            auto it = suffixes.find(param.substr(name.size() + 1));
            if (it == suffixes.end()) {
                throw invalid_query("Unknown filter suffix in '" + param + "'");
            }
            op = it->second;
        } else {
            continue;
        }
        q.filter(property + " " + op, filter_value_from_client(value));
    }
}

void bone::build_db_sort(const std::string& name, const skeleton_definition&, query& q,
                         const client_params& params, const std::string& prefix) const {
    auto it = params.find("orderby");
    if (it == params.end() || !it->second.is_string() || it->second.get<std::string>() != name) return;

    sort_direction dir = sort_direction::ascending;
    auto dir_it = params.find("orderdir");
    if (dir_it != params.end()) {
        const json& d = dir_it->second;
        if ((d.is_string() && (d == "1" || d == "desc")) || (d.is_number() && d.get<int>() == 1)) {
            dir = sort_direction::descending;
        }
    }
    q.order(prefix + query_property(name), dir);
}

} // namespace marrow
