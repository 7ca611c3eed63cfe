#include "marrow/relational_bone.hpp"
#include "marrow/entity_store.hpp"
#include "marrow/hashing.hpp"
#include "marrow/layout.hpp"
#include "marrow/log.hpp"
#include "marrow/marrow.hpp"
#include "marrow/skeleton.hpp"

#include <algorithm>

namespace marrow {

namespace {

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const std::vector<std::string>& list, const std::string& v) {
    return std::find(list.begin(), list.end(), v) != list.end();
}

std::optional<db_key> dest_key_of(const json& value) {
    if (!value.is_object() || !value.contains("dest")) return std::nullopt;
    const json& dest = value.at("dest");
    if (!dest.is_object() || !dest.contains("key") || !dest.at("key").is_string()) return std::nullopt;
    return db_key::try_parse(dest.at("key").get<std::string>());
}

std::vector<std::string> string_list(const json& value) {
    std::vector<std::string> out;
    if (!value.is_array()) return out;
    for (const auto& v : value) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

client_data to_client_data(const json& fields) {
    client_data data;
    for (auto it = fields.begin(); it != fields.end(); ++it) {
        const json& v = it.value();
        if (v.is_array()) {
            std::vector<std::string> items;
            for (const auto& item : v) {
                items.push_back(item.is_string() ? item.get<std::string>() : item.dump());
            }
            data[it.key()] = items;
        } else if (!v.is_null()) {
            data[it.key()] = v.is_string() ? v.get<std::string>() : v.dump();
        }
    }
    return data;
}

/// Remove one occurrence of `owner` from a lock list. False if it was absent.
bool remove_one(json& list, const std::string& owner) {
    if (!list.is_array()) return false;
    for (auto it = list.begin(); it != list.end(); ++it) {
        if (it->is_string() && it->get<std::string>() == owner) {
            list.erase(it);
            return true;
        }
    }
    return false;
}

/// Drop list entries left empty by a reference being stripped.
void compact(json& value, const bone& b) {
    auto compact_level = [&](json& level) {
        if (!level.is_array()) return;
        json kept = json::array();
        for (auto& v : level) {
            if (!b.is_empty_single(v)) kept.push_back(std::move(v));
        }
        level = std::move(kept);
    };
    if (!b.multiple()) return;
    if (!b.languages().empty()) {
        if (!value.is_object()) return;
        for (const auto& lang : b.languages()) {
            if (value.contains(lang)) compact_level(value[lang]);
        }
        return;
    }
    compact_level(value);
}

} // namespace

relational_bone::relational_bone(relational_options relation, bone_options options)
    : bone(std::move(options)), relation_(std::move(relation)) {
    ref_keys_.push_back("key");
    for (const auto& k : relation_.ref_keys) {
        if (!contains(ref_keys_, k)) ref_keys_.push_back(k);
    }
}

bool relational_bone::is_empty_single(const json& value) const {
    return !dest_key_of(value);
}

json relational_bone::make_dest(const entity& target) const {
    json dest = json::object();
    dest["key"] = target.key.to_string();
    for (const auto& k : ref_keys_) {
        if (k == "key") continue;
        dest[k] = target.get(k);
    }
    return dest;
}

std::optional<json> relational_bone::make_value(marrow_db& db, const db_key& key, json rel) const {
    auto target = db.store().get(key);
    if (!target) return std::nullopt;
    return json{{"dest", make_dest(*target)}, {"rel", std::move(rel)}};
}

std::vector<db_key> relational_bone::referenced_keys(const json& value) const {
    std::vector<db_key> keys;
    json copy = value;
    iter_bone_value(copy, [&](std::optional<size_t>, const std::optional<std::string>&, json& v) {
        if (auto k = dest_key_of(v)) keys.push_back(*k);
    });
    return keys;
}

// ============================================================================
// Client input
// ============================================================================

std::pair<json, std::vector<read_from_client_error>> relational_bone::single_value_from_client(
    const json& value, skeleton_instance& skel, const std::string& name, const client_data&) const {
    std::string key_text;
    json sub_fields = json::object();
    if (value.is_string()) {
        key_text = value.get<std::string>();
    } else if (value.is_object()) {
        const json& k = value.contains("key") ? value.at("key") : json(nullptr);
        if (k.is_string()) {
            key_text = k.get<std::string>();
        } else if (k.is_array() && !k.empty() && k.front().is_string()) {
            key_text = k.front().get<std::string>();
        }
        if (value.contains("rel") && value.at("rel").is_object()) {
            sub_fields = value.at("rel");
        } else {
            for (auto it = value.begin(); it != value.end(); ++it) {
                if (it.key() != "key") sub_fields[it.key()] = it.value();
            }
        }
    } else if (!value.is_null()) {
        return {nullptr, {make_error(error_severity::invalid, "Invalid value submitted")}};
    }

    if (key_text.empty()) return {nullptr, {}};

    auto key = db_key::try_parse(key_text);
    if (!key || key->kind() != relation_.kind) {
        return {nullptr, {make_error(error_severity::invalid, "Invalid value submitted")}};
    }

    std::vector<read_from_client_error> errors;
    json rel = nullptr;
    if (relation_.using_skel) {
        skeleton_instance using_instance(skel.db(), relation_.using_skel);
        if (!using_instance.from_client(to_client_data(sub_fields))) {
            errors.push_back(make_error(error_severity::invalid, "Incomplete data"));
            for (const auto& e : using_instance.errors()) {
                if (e.severity == error_severity::not_set) continue;
                errors.push_back(e);
            }
        }
        rel = json::object();
        for (const auto& [bone_name, b] : relation_.using_skel->bones()) {
            if (bone_name == "key") continue;
            rel[bone_name] = using_instance.get(bone_name);
        }
    }

    if (auto v = make_value(skel.db(), *key, rel)) {
        return {std::move(*v), std::move(errors)};
    }

    // Keep the cached copy we already hold for this key, if any.
    json fallback = nullptr;
    json current = skel.get(name);
    iter_bone_value(current, [&](std::optional<size_t>, const std::optional<std::string>&, json& existing) {
        auto existing_key = dest_key_of(existing);
        if (fallback.is_null() && existing_key && *existing_key == *key) fallback = existing;
    });
    if (!fallback.is_null() && relation_.using_skel) fallback["rel"] = rel;

    errors.push_back(make_error(error_severity::invalid, "Invalid value referenced"));
    return {fallback, std::move(errors)};
}

json relational_bone::single_value_unserialize(const json& stored) const {
    if (!dest_key_of(stored)) return nullptr;
    return json{{"dest", stored.at("dest")}, {"rel", stored.value("rel", json(nullptr))}};
}

std::string relational_bone::hash_single_value(const json& value) const {
    if (auto k = dest_key_of(value)) return unique_key_hash(*k);
    return unique_value_hash(value);
}

// ============================================================================
// Storage and locks
// ============================================================================

bool relational_bone::serialize(skeleton_instance& skel, const std::string& name) const {
    auto& e = skel.db_entity();
    if (!e) return false;

    const std::string locks_property = layout::outgoing_locks_property(name);
    std::vector<std::string> old_locks = string_list(e->get(locks_property));

    // Flattened keys of an older storage format
    std::string flat_prefix = name + ".";
    for (auto it = e->properties.begin(); it != e->properties.end();) {
        if (starts_with(it.key(), flat_prefix)) {
            it = e->properties.erase(it);
        } else {
            ++it;
        }
    }

    if (!skel.is_accessed(name)) return false;

    const json& value = skel.get(name);
    auto serialize_level = [&](const json& level) -> json {
        auto one = [](const json& v) { return json{{"dest", v.at("dest")}, {"rel", v.value("rel", json(nullptr))}}; };
        if (!multiple()) return dest_key_of(level) ? one(level) : json(nullptr);
        json out = json::array();
        if (level.is_array()) {
            for (const auto& v : level) {
                if (dest_key_of(v)) out.push_back(one(v));
            }
        }
        return out;
    };

    json res;
    if (!languages().empty()) {
        res = json::object();
        res[language_wrapper_marker] = true;
        for (const auto& lang : languages()) {
            res[lang] = serialize_level(value.is_object() && value.contains(lang) ? value.at(lang) : json(nullptr));
        }
    } else {
        res = serialize_level(value);
    }
    (*e)[name] = std::move(res);

    const std::string owner = e->key.to_string();
    std::vector<std::string> new_locks;
    if (relation_.consistency == relational_consistency::prevent_deletion) {
        for (const auto& k : referenced_keys(value)) {
            std::string encoded = k.to_string();
            if (encoded != owner && !contains(new_locks, encoded)) new_locks.push_back(encoded);
        }
    }
    (*e)[locks_property] = new_locks;

    auto& store = skel.db().store();
    auto& integrity = skel.db().integrity();

    for (const auto& added : new_locks) {
        if (contains(old_locks, added)) continue;
        auto target = store.get(db_key::from_string(added));
        if (!target) {
            integrity.report(integrity_issue::lock_target_missing,
                             "Cannot lock missing entity " + added + " from " + name, e->key);
            continue;
        }
        json& incoming = (*target)[layout::incoming_locks_property];
        if (!incoming.is_array()) incoming = json::array();
        incoming.push_back(owner);
        store.put(*target);
    }

    for (const auto& removed : old_locks) {
        if (contains(new_locks, removed)) continue;
        auto removed_key = db_key::try_parse(removed);
        auto target = removed_key ? store.get(*removed_key) : std::nullopt;
        if (!target) {
            integrity.report(integrity_issue::lock_target_missing,
                             "Cannot release lock on missing entity " + removed + " from " + name, e->key);
            continue;
        }
        if (!remove_one((*target)[layout::incoming_locks_property], owner)) {
            integrity.report(integrity_issue::lock_asymmetry,
                             "Entity " + removed + " did not list " + owner + " as locking it", target->key);
            continue;
        }
        store.put(*target);
    }
    return true;
}

void relational_bone::delete_hook(skeleton_instance& skel, const std::string& name) const {
    const auto& e = skel.db_entity();
    if (!e) return;

    auto& store = skel.db().store();
    auto& integrity = skel.db().integrity();
    const std::string owner = e->key.to_string();

    for (const auto& locked : string_list(e->get(layout::outgoing_locks_property(name)))) {
        auto locked_key = db_key::try_parse(locked);
        auto target = locked_key ? store.get(*locked_key) : std::nullopt;
        if (!target) {
            integrity.report(integrity_issue::lock_target_missing,
                             "Locked entity " + locked + " vanished before " + owner + " was deleted", e->key);
            continue;
        }
        if (!remove_one((*target)[layout::incoming_locks_property], owner)) {
            integrity.report(integrity_issue::lock_asymmetry,
                             "Entity " + locked + " did not list " + owner + " as locking it", target->key);
            continue;
        }
        store.put(*target);
    }
}

// ============================================================================
// Relation edges
// ============================================================================

void relational_bone::post_saved(skeleton_instance& skel, const std::string& name, const db_key& key) const {
    const auto& owner = skel.db_entity();
    if (!owner) return;

    std::vector<json> values;
    json value = skel.get(name);
    iter_bone_value(value, [&](std::optional<size_t>, const std::optional<std::string>&, json& v) {
        if (dest_key_of(v)) values.push_back(v);
    });

    json src = json::object();
    src["key"] = key.to_string();
    for (const auto& pk : relation_.parent_keys) {
        src[pk] = owner->get(pk);
    }

    auto& store = skel.db().store();
    const timestamp_t now = now_seconds();

    auto fill = [&](entity& edge, const json& v) {
        edge["dest"] = v.at("dest");
        edge["rel"] = v.value("rel", json(nullptr));
        edge["src"] = src;
        edge["src_kind"] = key.kind();
        edge["src_property"] = name;
        edge["dest_kind"] = relation_.kind;
        edge["delayed_update_tag"] = now;
        edge["update_level"] = static_cast<int>(relation_.update_level);
        edge["consistency"] = static_cast<int>(relation_.consistency);
        edge["foreign_keys"] = ref_keys_;
    };

    store.run_in_transaction([&] {
        auto q = store.make_query(layout::relations_kind);
        q.filter("src_kind =", key.kind())
         .filter("dest_kind =", relation_.kind)
         .filter("src_property =", name)
         .ancestor(key);

        std::vector<json> remaining = values;
        for (auto& edge : q.run(SIZE_MAX)) {
            auto edge_dest = dest_key_of(edge.properties);
            auto match = std::find_if(remaining.begin(), remaining.end(), [&](const json& v) {
                return edge_dest && dest_key_of(v) == edge_dest;
            });
            if (match == remaining.end()) {
                store.remove(edge.key);
                continue;
            }
            fill(edge, *match);
            store.put(edge);
            remaining.erase(match);
        }

        for (const auto& v : remaining) {
            entity edge(store.allocate_key(layout::relations_kind, key));
            fill(edge, v);
            store.put(edge);
        }
    });
}

void relational_bone::post_deleted(skeleton_instance& skel, const std::string& name, const db_key& key) const {
    auto& store = skel.db().store();
    store.run_in_transaction([&] {
        auto q = store.make_query(layout::relations_kind);
        q.filter("src_kind =", key.kind()).filter("src_property =", name).ancestor(key);
        for (const auto& edge : q.run(SIZE_MAX)) {
            store.remove(edge.key);
        }
    });
}

// ============================================================================
// Refresh and reference removal
// ============================================================================

void relational_bone::refresh(skeleton_instance& skel, const std::string& name) const {
    if (relation_.update_level == relational_update_level::never) return;

    json& value = skel.get(name);
    if (is_empty(value)) return;

    auto& store = skel.db().store();
    bool stripped = false;
    iter_bone_value(value, [&](std::optional<size_t>, const std::optional<std::string>&, json& v) {
        auto k = dest_key_of(v);
        if (!k) return;
        auto target = store.get(*k);
        if (target) {
            v["dest"] = make_dest(*target);
            return;
        }
        switch (relation_.consistency) {
            case relational_consistency::cascade_deletion:
                skel.mark_for_cascade_deletion();
                break;
            case relational_consistency::set_null:
                v = nullptr;
                stripped = true;
                break;
            default:
                LOG_INFO("relational", "Cached copy of %s in %s.%s is dangling",
                         k->to_string().c_str(), skel.kind_name().c_str(), name.c_str());
                break;
        }
    });
    if (stripped) compact(value, *this);
}

bool relational_bone::remove_reference(skeleton_instance& skel, const std::string& name, const db_key& key) const {
    json& value = skel.get(name);
    bool changed = false;
    iter_bone_value(value, [&](std::optional<size_t>, const std::optional<std::string>&, json& v) {
        auto k = dest_key_of(v);
        if (k && *k == key) {
            v = nullptr;
            changed = true;
        }
    });
    if (changed) compact(value, *this);
    return changed;
}

std::set<std::string> relational_bone::get_referenced_blob_keys(skeleton_instance& skel,
                                                                const std::string& name) const {
    std::set<std::string> keys;
    json value = skel.get(name);
    iter_bone_value(value, [&](std::optional<size_t>, const std::optional<std::string>&, json& v) {
        auto k = dest_key_of(v);
        if (!k) return;
        if (ref_skel_) {
            skeleton_instance ref(skel.db(), ref_skel_);
            ref.set_entity(entity(*k, v.at("dest")));
            for (const auto& [bone_name, b] : ref_skel_->bones()) {
                auto sub = b->get_referenced_blob_keys(ref, bone_name);
                keys.insert(sub.begin(), sub.end());
            }
        }
        if (relation_.using_skel && v.contains("rel") && v.at("rel").is_object()) {
            skeleton_instance rel(skel.db(), relation_.using_skel);
            rel.set_entity(entity(*k, v.at("rel")));
            for (const auto& [bone_name, b] : relation_.using_skel->bones()) {
                auto sub = b->get_referenced_blob_keys(rel, bone_name);
                keys.insert(sub.begin(), sub.end());
            }
        }
    });
    return keys;
}

std::set<std::string> relational_bone::get_search_tags(skeleton_instance& skel, const std::string& name) const {
    std::set<std::string> tags;
    json value = skel.get(name);
    iter_bone_value(value, [&](std::optional<size_t>, const std::optional<std::string>&, json& v) {
        auto k = dest_key_of(v);
        if (!k || !ref_skel_) return;
        skeleton_instance ref(skel.db(), ref_skel_);
        ref.set_entity(entity(*k, v.at("dest")));
        for (const auto& [bone_name, b] : ref_skel_->bones()) {
            if (!b->searchable()) continue;
            auto sub = b->get_search_tags(ref, bone_name);
            tags.insert(sub.begin(), sub.end());
        }
    });
    return tags;
}

// ============================================================================
// Query rewriting
// ============================================================================

void relational_bone::rewrite_query(const std::string& name, const skeleton_definition& def, query& q) const {
    if (q.kind() == layout::relations_kind) {
        bool same_bone = std::any_of(q.filters().begin(), q.filters().end(), [&](const filter_clause& f) {
            return f.property == "src_property" && f.value == name;
        });
        if (!same_bone) {
            throw invalid_query("Cannot filter by more than one multiple relational bone of " + def.kind_name());
        }
        return;
    }

    auto parent_property = [&](const std::string& property) {
        if (property == key_property) return std::string("src.key");
        std::string field = property.substr(0, property.find('.'));
        if (!contains(relation_.parent_keys, field)) {
            throw invalid_query("Cannot combine " + property + " with a filter on " + name +
                                "; it is not one of its parent keys");
        }
        return "src." + property;
    };

    std::vector<filter_clause> old_filters = q.filters();
    std::vector<order_clause> old_orders = q.orders();
    std::optional<db_key> old_ancestor = q.ancestor_key();
    std::string src_kind = q.kind();

    q.reset(layout::relations_kind);
    q.filter("src_kind =", src_kind).filter("dest_kind =", relation_.kind).filter("src_property =", name);
    if (old_ancestor) q.ancestor(*old_ancestor);

    for (auto f : old_filters) {
        if (f.property == key_property) {
            if (f.op != "=" || !f.value.is_string()) {
                throw invalid_query("Only key equality can be combined with a filter on " + name);
            }
            q.ancestor(db_key::from_string(f.value.get<std::string>()));
            continue;
        }
        f.property = parent_property(f.property);
        q.filter(std::move(f));
    }

    std::vector<order_clause> orders;
    for (auto o : old_orders) {
        o.property = parent_property(o.property);
        orders.push_back(std::move(o));
    }
    if (!orders.empty()) q.order(std::move(orders));

    // Later clauses address the owner through "src." and the target through "dest.".
    auto map_property = [name, parent_keys = relation_.parent_keys](const std::string& property) -> std::string {
        static const std::vector<std::string> edge_fields = {"src_kind", "dest_kind", "src_property",
                                                             "delayed_update_tag", "update_level",
                                                             "consistency", "foreign_keys"};
        if (starts_with(property, "src.") || starts_with(property, "dest.") || starts_with(property, "rel.") ||
            property == key_property || contains(edge_fields, property)) {
            return property;
        }
        if (starts_with(property, name + ".")) {
            std::string rest = property.substr(name.size() + 1);
            if (starts_with(rest, "dest.") || starts_with(rest, "rel.")) return rest;
            return "dest." + rest;
        }
        std::string field = property.substr(0, property.find('.'));
        if (contains(parent_keys, field)) return "src." + property;
        throw invalid_query("Cannot use " + property + " on a query over " + name + "; it is not one of its parent keys");
    };

    q.set_filter_hook([map_property](query&, filter_clause clause) -> std::optional<filter_clause> {
        clause.property = map_property(clause.property);
        return clause;
    });
    q.set_order_hook([map_property](query&, std::vector<order_clause> orders) {
        for (auto& o : orders) {
            o.property = o.property == key_property ? "src.key" : map_property(o.property);
        }
        return orders;
    });
}

void relational_bone::build_db_filter(const std::string& name, const skeleton_definition& def, query& q,
                                      const client_params& params, const std::string& prefix) const {
    const std::string own_prefix = name + ".";
    std::vector<std::pair<std::string, json>> relevant;
    for (const auto& [param, value] : params) {
        if (starts_with(param, own_prefix)) relevant.emplace_back(param.substr(own_prefix.size()), value);
    }
    if (relevant.empty()) return;

    if (multiple()) rewrite_query(name, def, q);

    for (const auto& [rest, value] : relevant) {
        std::string part = "dest";
        std::string field_spec = rest;
        if (starts_with(rest, "dest.")) {
            field_spec = rest.substr(5);
        } else if (starts_with(rest, "rel.")) {
            part = "rel";
            field_spec = rest.substr(4);
        }
        std::string field = field_spec.substr(0, field_spec.find('$'));

        const skeleton_definition* sub_def = nullptr;
        if (part == "dest") {
            if (!contains(ref_keys_, field) || !ref_skel_) {
                throw invalid_query("Cannot filter " + name + " by " + field + "; it is not a cached field");
            }
            sub_def = ref_skel_.get();
        } else {
            if (!relation_.using_skel) {
                throw invalid_query("Cannot filter " + name + " by rel." + field + "; it has no edge data");
            }
            sub_def = relation_.using_skel.get();
        }

        const bone* target = sub_def->find_bone(field);
        if (!target) {
            throw invalid_query("Unknown field " + field + " in filter on " + name);
        }
        std::string sub_prefix = multiple() ? part + "." : prefix + name + "." + part + ".";
        target->build_db_filter(field, *sub_def, q, client_params{{field_spec, value}}, sub_prefix);
    }
}

void relational_bone::build_db_sort(const std::string& name, const skeleton_definition& def, query& q,
                                    const client_params& params, const std::string& prefix) const {
    auto it = params.find("orderby");
    if (it == params.end() || !it->second.is_string()) return;
    std::string orderby = it->second.get<std::string>();
    if (!starts_with(orderby, name + ".")) return;

    std::string rest = orderby.substr(name.size() + 1);
    std::string part = "dest";
    if (starts_with(rest, "dest.")) {
        rest = rest.substr(5);
    } else if (starts_with(rest, "rel.")) {
        part = "rel";
        rest = rest.substr(4);
    }

    const skeleton_definition* sub_def = part == "dest" ? ref_skel_.get() : relation_.using_skel.get();
    if (!sub_def || (part == "dest" && !contains(ref_keys_, rest)) || !sub_def->has_bone(rest)) {
        throw invalid_query("Cannot order by " + orderby);
    }

    if (multiple()) rewrite_query(name, def, q);

    sort_direction dir = sort_direction::ascending;
    auto dir_it = params.find("orderdir");
    if (dir_it != params.end() && (dir_it->second == "1" || dir_it->second == 1 || dir_it->second == "desc")) {
        dir = sort_direction::descending;
    }
    q.order(multiple() ? part + "." + rest : prefix + name + "." + part + "." + rest, dir);
}

void relational_bone::seal(const std::string& name, const skeleton_definition& owner,
                           const schema_registry& registry) {
    auto target = registry.find(relation_.kind);
    if (!target) {
        throw schema_error(owner.kind_name() + "." + name + " references unknown kind " + relation_.kind);
    }
    for (const auto& k : ref_keys_) {
        if (!target->has_bone(k)) {
            throw schema_error(owner.kind_name() + "." + name + " caches unknown field " + relation_.kind + "." + k);
        }
    }
    for (const auto& pk : relation_.parent_keys) {
        if (!owner.has_bone(pk)) {
            throw schema_error(owner.kind_name() + "." + name + " exposes unknown parent key " + pk);
        }
    }

    std::vector<std::string> cached(ref_keys_.begin() + 1, ref_keys_.end());
    ref_skel_ = target->subset(cached);

    if (relation_.using_skel && !relation_.using_skel->is_sealed()) {
        relation_.using_skel->seal(registry);
    }
}

} // namespace marrow
