#include "marrow/skeleton.hpp"
#include "marrow/bones.hpp"
#include "marrow/entity_store.hpp"
#include "marrow/layout.hpp"
#include "marrow/log.hpp"
#include "marrow/marrow.hpp"

#include <algorithm>
#include <cctype>
#include <random>
#include <set>

namespace marrow {

namespace {

constexpr size_t max_active_seo_keys = 200;
constexpr int seo_key_attempts = 3;

std::vector<std::string> string_list(const json& value) {
    std::vector<std::string> out;
    if (!value.is_array()) return out;
    for (const auto& v : value) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

json& meta_of(entity& e) {
    json& meta = e[layout::meta_property];
    if (!meta.is_object()) meta = json::object();
    return meta;
}

std::string normalize_seo_key(const std::string& text) {
    std::string out;
    bool dash = false;
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            out += static_cast<char>(std::tolower(c));
            dash = false;
        } else if ((std::isspace(c) || c == '-' || c == '_') && !out.empty() && !dash) {
            out += '-';
            dash = true;
        }
    }
    while (!out.empty() && out.back() == '-') out.pop_back();
    return out;
}

std::string random_suffix() {
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);
    std::string s;
    for (int i = 0; i < 5; ++i) s += alphabet[pick(rng)];
    return s;
}

/// Run one after-commit step of `owner`. The commit already happened, so a
/// failing step is logged and the remaining steps still run.
template <typename F>
void after_commit_step(const char* step, const std::string& owner, F&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        LOG_ERROR("skeleton", "%s of %s failed after commit: %s", step, owner.c_str(), e.what());
    }
}

} // namespace

/// What a committed write leaves for the after-commit phase.
struct skeleton_instance::write_outcome {
    std::shared_ptr<skeleton_instance> work;
    bool is_add = false;
    std::vector<std::string> change_list;
    /// (lock kind, hash) pairs this record no longer claims
    std::vector<std::pair<std::string, std::string>> stale_unique;
};

// ============================================================================
// skeleton_definition
// ============================================================================

skeleton_definition::skeleton_definition(std::string kind_name) : kind_name_(std::move(kind_name)) {
    if (kind_name_.empty()) {
        throw schema_error("Kind name must not be empty");
    }
    bones_.emplace_back("key", std::make_shared<key_bone>());
}

void skeleton_definition::check_mutable() const {
    if (sealed_) {
        throw schema_error("Definition of " + kind_name_ + " is sealed");
    }
}

skeleton_definition& skeleton_definition::add_bone(const std::string& name, std::shared_ptr<bone> b) {
    check_mutable();
    if (!b) throw schema_error("Bone " + kind_name_ + "." + name + " is null");
    if (name.empty() || name.find_first_of(".$") != std::string::npos || name.front() == '_') {
        throw schema_error("Invalid bone name '" + name + "' in " + kind_name_);
    }
    if (has_bone(name)) {
        throw schema_error("Duplicate bone " + kind_name_ + "." + name);
    }
    bones_.emplace_back(name, std::move(b));
    return *this;
}

const bone* skeleton_definition::find_bone(const std::string& name) const {
    for (const auto& [bone_name, b] : bones_) {
        if (bone_name == name) return b.get();
    }
    return nullptr;
}

skeleton_definition& skeleton_definition::add_adapter(std::shared_ptr<database_adapter> adapter) {
    check_mutable();
    adapters_.push_back(std::move(adapter));
    return *this;
}

skeleton_definition& skeleton_definition::add_validation(validation_t validation) {
    check_mutable();
    validations_.push_back(std::move(validation));
    return *this;
}

skeleton_definition& skeleton_definition::set_seo_keys(seo_keys_t provider) {
    check_mutable();
    seo_keys_ = std::move(provider);
    return *this;
}

skeleton_definition& skeleton_definition::set_post_saved_hook(hook_t hook) {
    check_mutable();
    post_saved_hook_ = std::move(hook);
    return *this;
}

skeleton_definition& skeleton_definition::set_post_deleted_hook(hook_t hook) {
    check_mutable();
    post_deleted_hook_ = std::move(hook);
    return *this;
}

std::shared_ptr<skeleton_definition> skeleton_definition::subset(const std::vector<std::string>& names) const {
    auto out = std::make_shared<skeleton_definition>(kind_name_);
    for (const auto& name : names) {
        if (name == "key") continue;
        auto it = std::find_if(bones_.begin(), bones_.end(), [&](const auto& p) { return p.first == name; });
        if (it == bones_.end()) {
            throw schema_error("Unknown bone " + kind_name_ + "." + name);
        }
        out->bones_.push_back(*it);
    }
    // Bones are shared with this definition and sealed along with it.
    out->sealed_ = true;
    return out;
}

void skeleton_definition::seal(const schema_registry& registry) {
    if (sealed_) return;
    for (auto& [name, b] : bones_) {
        b->seal(name, *this, registry);
    }
    sealed_ = true;
}

// ============================================================================
// schema_registry
// ============================================================================

std::shared_ptr<skeleton_definition> schema_registry::register_skeleton(const std::string& kind_name) {
    auto definition = std::make_shared<skeleton_definition>(kind_name);
    register_skeleton(definition);
    return definition;
}

void schema_registry::register_skeleton(std::shared_ptr<skeleton_definition> definition) {
    if (sealed_) {
        throw schema_error("Cannot register " + definition->kind_name() + ": the registry is sealed");
    }
    const std::string& kind = definition->kind_name();
    if (kind.front() == '_') {
        throw schema_error("Kind names starting with '_' are reserved: " + kind);
    }
    if (definitions_.count(kind)) {
        throw schema_error("Kind " + kind + " is already registered");
    }
    definitions_.emplace(kind, std::move(definition));
}

void schema_registry::seal() {
    if (sealed_) return;
    for (auto& [kind, definition] : definitions_) {
        definition->seal(*this);
    }
    sealed_ = true;
    LOG_DEBUG("schema", "Registry sealed with %zu kinds", definitions_.size());
}

std::shared_ptr<const skeleton_definition> schema_registry::get(const std::string& kind_name) const {
    auto definition = find(kind_name);
    if (!definition) {
        throw schema_error("Unknown kind " + kind_name);
    }
    return definition;
}

std::shared_ptr<const skeleton_definition> schema_registry::find(const std::string& kind_name) const {
    auto it = definitions_.find(kind_name);
    return it == definitions_.end() ? nullptr : it->second;
}

std::vector<std::string> schema_registry::kinds() const {
    std::vector<std::string> out;
    out.reserve(definitions_.size());
    for (const auto& [kind, _] : definitions_) {
        out.push_back(kind);
    }
    return out;
}

// ============================================================================
// skeleton_instance - values
// ============================================================================

skeleton_instance::skeleton_instance(marrow_db& db, std::shared_ptr<const skeleton_definition> definition)
    : db_(&db), definition_(std::move(definition)) {
    if (!definition_) throw schema_error("skeleton_instance needs a definition");
}

json& skeleton_instance::get(const std::string& name) {
    auto it = values_.find(name);
    if (it != values_.end()) return it->second;

    const bone* b = definition_->find_bone(name);
    if (!b) {
        throw schema_error("Unknown bone " + kind_name() + "." + name);
    }
    if (!b->unserialize(*this, name)) {
        values_[name] = b->get_default_value(*this);
    }
    return values_[name];
}

void skeleton_instance::set(const std::string& name, json value) {
    if (!definition_->has_bone(name)) {
        throw schema_error("Unknown bone " + kind_name() + "." + name);
    }
    values_[name] = std::move(value);
}

void skeleton_instance::set_entity(entity e) {
    entity_ = std::move(e);
    values_.clear();
    cascade_deletion_ = false;
}

std::optional<db_key> skeleton_instance::key() const {
    if (!entity_ || !entity_->key.is_complete()) return std::nullopt;
    return entity_->key;
}

bool skeleton_instance::set_bone_value(const std::string& name, const json& value, bool append,
                                       const std::optional<std::string>& language) {
    const bone* b = definition_->find_bone(name);
    if (!b) {
        throw schema_error("Unknown bone " + kind_name() + "." + name);
    }
    return b->set_bone_value(*this, name, value, append, language);
}

skeleton_instance skeleton_instance::subset(const std::vector<std::string>& names) const {
    skeleton_instance out(*db_, definition_->subset(names));
    out.entity_ = entity_;
    for (const auto& [name, value] : values_) {
        if (out.definition_->has_bone(name)) out.values_[name] = value;
    }
    return out;
}

// ============================================================================
// skeleton_instance - client input
// ============================================================================

bool skeleton_instance::from_client(const client_data& data, bool amend) {
    errors_.clear();
    bool complete = true;

    for (const auto& [name, b] : definition_->bones()) {
        if (b->readonly()) continue;
        auto errs = b->from_client(*this, name, data);
        if (!errs) continue;
        for (auto& e : *errs) {
            if (e.severity == error_severity::invalid) {
                complete = false;
            } else if (!amend && b->required() &&
                       (e.severity == error_severity::not_set || e.severity == error_severity::empty)) {
                complete = false;
            }
            errors_.push_back(std::move(e));
        }
    }

    for (const auto& validation : definition_->validations()) {
        auto errs = validation(*this);
        if (!errs.empty()) complete = false;
        errors_.insert(errors_.end(), errs.begin(), errs.end());
    }

    // Report values another record already holds before a write is attempted.
    auto own_key = key();
    auto& store = db_->store();
    for (const auto& [name, b] : definition_->bones()) {
        if (!b->unique()) continue;
        for (const auto& hash : b->get_unique_index_values(*this, name)) {
            auto lock = store.get(db_key(layout::unique_lock_kind(kind_name(), name), hash));
            if (!lock) continue;
            json owner = lock->get("references");
            if (own_key && owner == own_key->to_string()) continue;
            errors_.push_back(make_error(error_severity::invalid, b->unique()->message, {name}));
            complete = false;
            break;
        }
    }
    return complete;
}

bool skeleton_instance::read(const db_key& key) {
    if (key.kind() != kind_name()) {
        throw schema_error("Cannot read a " + key.kind() + " key into a " + kind_name() + " record");
    }
    auto e = db_->store().get(key);
    if (!e) return false;
    set_entity(std::move(*e));
    return true;
}

void skeleton_instance::refresh() {
    for (const auto& [name, b] : definition_->bones()) {
        get(name);
        b->refresh(*this, name);
    }
}

// ============================================================================
// skeleton_instance - write pipeline
// ============================================================================

std::optional<db_key> skeleton_instance::write(bool clear_update_tag) {
    auto& store = db_->store();
    const auto& bones = definition_->bones();

    for (const auto& [name, b] : bones) {
        b->pre_save(*this, name, !key());
    }

    auto outcome = std::make_shared<write_outcome>();
    std::vector<read_from_client_error> unique_errors;

    auto written = store.run_in_transaction([&]() -> std::optional<db_key> {
        *outcome = write_outcome{};
        unique_errors.clear();

        std::optional<entity> current;
        if (key()) current = store.get(*key());
        outcome->is_add = !current;

        db_key key = current ? current->key : (this->key() ? *this->key() : store.allocate_key(kind_name()));
        const std::string owner = key.to_string();
        json old_props = current ? current->properties : json::object();

        auto work = std::make_shared<skeleton_instance>(*db_, definition_);
        work->set_entity(current ? std::move(*current) : entity(key));
        for (const auto& [name, value] : values_) {
            work->values_[name] = value;
        }
        for (const auto& [name, b] : bones) {
            if (name != "key" && !work->entity_->contains(name)) work->get(name);
        }
        outcome->work = work;

        // Unique values: refuse the whole write if one is taken.
        std::map<std::string, std::vector<std::string>> unique_hashes;
        for (const auto& [name, b] : bones) {
            if (!b->unique()) continue;
            auto hashes = b->get_unique_index_values(*work, name);
            for (const auto& hash : hashes) {
                auto lock = store.get(db_key(layout::unique_lock_kind(kind_name(), name), hash));
                if (lock && lock->get("references") != owner) {
                    unique_errors.push_back(make_error(error_severity::invalid, b->unique()->message, {name}));
                    break;
                }
            }
            unique_hashes[name] = std::move(hashes);
        }
        if (!unique_errors.empty()) return std::nullopt;

        entity& e = *work->entity_;
        for (const auto& [name, b] : bones) {
            if (!b->serialize(*work, name)) continue;
            json before = old_props.contains(name) ? old_props.at(name) : json(nullptr);
            if (outcome->is_add || before != e.get(name)) outcome->change_list.push_back(name);
        }

        json& meta = meta_of(e);
        for (const auto& [name, hashes] : unique_hashes) {
            const std::string lock_kind = layout::unique_lock_kind(kind_name(), name);
            for (const auto& hash : hashes) {
                db_key lock_key(lock_kind, hash);
                auto lock = store.get(lock_key);
                if (lock) continue;
                entity fresh(lock_key);
                fresh["references"] = owner;
                store.put(fresh);
            }
            const std::string property = layout::unique_values_property(name);
            for (const auto& old_hash : string_list(meta.value(property, json::array()))) {
                if (std::find(hashes.begin(), hashes.end(), old_hash) == hashes.end()) {
                    outcome->stale_unique.emplace_back(lock_kind, old_hash);
                }
            }
            meta[property] = hashes;
        }

        std::set<std::string> blob_keys;
        std::set<std::string> tags;
        for (const auto& [name, b] : bones) {
            auto referenced = b->get_referenced_blob_keys(*work, name);
            blob_keys.insert(referenced.begin(), referenced.end());
            if (b->searchable()) {
                auto bone_tags = b->get_search_tags(*work, name);
                tags.insert(bone_tags.begin(), bone_tags.end());
            }
        }
        meta[layout::search_tags] = tags;

        if (definition_->seo_keys()) {
            update_seo_keys(*work, key);
        }

        meta[layout::delayed_update_tag] = clear_update_tag ? 0.0 : now_seconds();

        for (const auto& adapter : definition_->adapters()) {
            adapter->preprocess_entry(e, *work, outcome->is_add, outcome->change_list);
        }
        store.put(e);

        db_key blob_lock_key(layout::blob_locks_kind, owner);
        auto blob_lock = store.get(blob_lock_key);
        entity lock_entity = blob_lock ? std::move(*blob_lock) : entity(blob_lock_key);
        std::set<std::string> old_refs;
        for (const auto& k : string_list(lock_entity.get("old_blob_references"))) old_refs.insert(k);
        for (const auto& k : string_list(lock_entity.get("active_blob_references"))) {
            if (!blob_keys.count(k)) old_refs.insert(k);
        }
        for (const auto& k : blob_keys) old_refs.erase(k);
        lock_entity["active_blob_references"] = blob_keys;
        lock_entity["old_blob_references"] = old_refs;
        lock_entity["has_old_blob_references"] = !old_refs.empty();
        lock_entity["is_stale"] = false;
        store.put(lock_entity);

        marrow_db* db = db_;
        store.after_commit([db, outcome, clear_update_tag, key] {
            finish_write(*db, *outcome, key, clear_update_tag);
        });
        return key;
    });

    if (!written) {
        errors_.insert(errors_.end(), unique_errors.begin(), unique_errors.end());
        LOG_INFO("skeleton", "Write of %s refused: unique value taken", kind_name().c_str());
        return std::nullopt;
    }

    // finish_write never throws, so a committed write always binds here.
    entity_ = outcome->work->entity_;
    values_ = outcome->work->values_;
    return written;
}

void skeleton_instance::update_seo_keys(skeleton_instance& work, const db_key& key) {
    auto& store = db_->store();
    entity& e = *work.entity_;
    json& meta = meta_of(e);

    json seo = meta.value(layout::seo_keys, json::object());
    if (!seo.is_object()) seo = json::object();
    std::vector<std::string> active = string_list(meta.value(layout::active_seo_keys, json::array()));

    for (const auto& [lang, text] : definition_->seo_keys()(work)) {
        std::string base = normalize_seo_key(text);
        if (base.empty()) continue;
        if (seo.contains(lang) && seo.at(lang) == base) continue;

        std::string candidate = base;
        for (int attempt = 0; attempt < seo_key_attempts; ++attempt) {
            if (attempt > 0) candidate = base + "-" + random_suffix();
            auto q = store.make_query(kind_name());
            q.filter(std::string(layout::meta_property) + "." + layout::active_seo_keys + " =", candidate);
            auto holder = q.get_entry();
            if (!holder || holder->key == key) break;
            if (attempt + 1 == seo_key_attempts) {
                LOG_WARN("skeleton", "SEO key %s of %s is still taken after %d attempts",
                         candidate.c_str(), key.to_string().c_str(), seo_key_attempts);
            }
        }
        seo[lang] = candidate;
        active.erase(std::remove(active.begin(), active.end(), candidate), active.end());
        active.insert(active.begin(), candidate);
    }
    if (active.size() > max_active_seo_keys) active.resize(max_active_seo_keys);

    meta[layout::seo_keys] = seo;
    meta[layout::active_seo_keys] = active;
}

void skeleton_instance::finish_write(marrow_db& db, const write_outcome& outcome, const db_key& key,
                                     bool clear_update_tag) {
    auto& store = db.store();
    auto& work = *outcome.work;
    const std::string owner = key.to_string();

    for (const auto& [lock_kind, hash] : outcome.stale_unique) {
        after_commit_step("Releasing a stale unique lock", owner, [&] {
            store.run_in_transaction([&] {
                db_key lock_key(lock_kind, hash);
                auto lock = store.get(lock_key);
                if (!lock) return;
                if (lock->get("references") != owner) {
                    db.integrity().report(integrity_issue::unique_lock_foreign,
                                          "Stale unique lock " + lock_key.to_string() + " is held by " +
                                          lock->get("references").dump(), key);
                    return;
                }
                store.remove(lock_key);
            });
        });
    }

    const auto& definition = work.definition();
    for (const auto& [name, b] : definition.bones()) {
        after_commit_step("post_saved", owner, [&] { b->post_saved(work, name, key); });
    }
    if (definition.post_saved_hook()) {
        after_commit_step("The post-save hook", owner, [&] { definition.post_saved_hook()(work, key); });
    }

    if (!outcome.is_add && !clear_update_tag && !outcome.change_list.empty()) {
        after_commit_step("Queueing relation updates", owner, [&] {
            const auto& changed = outcome.change_list;
            timestamp_t changed_at = now_seconds() + 1;
            if (changed.size() < db.config().changed_bone_fanout_limit) {
                for (size_t idx = 0; idx < changed.size(); ++idx) {
                    db.tasks().enqueue(update_relations_task{key, changed_at, changed[idx], std::nullopt},
                                       10.0 * idx);
                }
            } else {
                db.tasks().enqueue(update_relations_task{key, changed_at, std::nullopt, std::nullopt});
            }
        });
    }

    for (const auto& adapter : definition.adapters()) {
        after_commit_step("update_entry", owner, [&] {
            adapter->update_entry(*work.entity_, work, outcome.is_add, outcome.change_list);
        });
    }
}

// ============================================================================
// skeleton_instance - delete pipeline
// ============================================================================

void skeleton_instance::remove() {
    auto own_key = key();
    if (!own_key) {
        throw not_found_error("Cannot delete a " + kind_name() + " record that was never stored");
    }
    const db_key key = *own_key;
    const std::string owner = key.to_string();
    auto& store = db_->store();
    auto& integrity = db_->integrity();

    auto removed = std::make_shared<skeleton_instance>(*db_, definition_);

    store.run_in_transaction([&] {
        auto current = store.get(key);
        if (!current) {
            throw not_found_error("No " + kind_name() + " record stored under " + owner);
        }
        auto incoming = string_list(current->get(layout::incoming_locks_property));
        if (!incoming.empty()) {
            throw locked_error(owner + " is referenced by " + std::to_string(incoming.size()) +
                               " record(s) and cannot be deleted");
        }

        removed->set_entity(std::move(*current));
        json meta = removed->entity_->get(layout::meta_property);

        for (const auto& [name, b] : definition_->bones()) {
            b->delete_hook(*removed, name);

            if (!b->unique()) continue;
            const std::string property = layout::unique_values_property(name);
            std::vector<std::string> hashes = meta.is_object() && meta.contains(property)
                ? string_list(meta.at(property))
                : b->get_unique_index_values(*removed, name);
            for (const auto& hash : hashes) {
                db_key lock_key(layout::unique_lock_kind(kind_name(), name), hash);
                auto lock = store.get(lock_key);
                if (!lock) {
                    integrity.report(integrity_issue::unique_lock_missing,
                                     "Unique lock " + lock_key.to_string() + " of " + owner + " is missing", key);
                    continue;
                }
                if (lock->get("references") != owner) {
                    integrity.report(integrity_issue::unique_lock_foreign,
                                     "Unique lock " + lock_key.to_string() + " is held by " +
                                     lock->get("references").dump() + ", not " + owner, key);
                    continue;
                }
                store.remove(lock_key);
            }
        }

        db_key blob_lock_key(layout::blob_locks_kind, owner);
        if (auto blob_lock = store.get(blob_lock_key)) {
            (*blob_lock)["is_stale"] = true;
            store.put(*blob_lock);
        }

        store.remove(key);
        db_->tasks().enqueue(process_removed_relations_task{key, std::nullopt});

        store.after_commit([removed, key, owner] {
            const auto& definition = removed->definition();
            for (const auto& [name, b] : definition.bones()) {
                after_commit_step("post_deleted", owner, [&] { b->post_deleted(*removed, name, key); });
            }
            if (definition.post_deleted_hook()) {
                after_commit_step("The post-delete hook", owner, [&] { definition.post_deleted_hook()(*removed, key); });
            }
            for (const auto& adapter : definition.adapters()) {
                after_commit_step("delete_entry", owner, [&] { adapter->delete_entry(*removed->entity_, *removed); });
            }
        });
    });

    entity_.reset();
    values_.clear();
    LOG_DEBUG("skeleton", "Deleted %s", owner.c_str());
}

} // namespace marrow
