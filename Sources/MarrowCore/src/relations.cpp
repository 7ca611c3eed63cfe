#include "marrow/relations.hpp"
#include "marrow/entity_store.hpp"
#include "marrow/layout.hpp"
#include "marrow/log.hpp"
#include "marrow/marrow.hpp"
#include "marrow/relational_bone.hpp"

namespace marrow {

namespace {

/// Edges are stored below the record that owns them.
std::optional<db_key> owner_of(const entity& edge) {
    if (edge.key.parent()) return *edge.key.parent();
    json src = edge.get("src");
    if (src.is_object() && src.contains("key") && src.at("key").is_string()) {
        return db_key::try_parse(src.at("key").get<std::string>());
    }
    return std::nullopt;
}

std::string text_of(const json& v) {
    return v.is_string() ? v.get<std::string>() : std::string();
}

} // namespace

relation_propagation::relation_propagation(marrow_db& db) : db_(db) {}

void relation_propagation::refresh_owner(const std::shared_ptr<const skeleton_definition>& definition,
                                         const db_key& key) {
    auto& store = db_.store();
    const int attempts = db_.config().transaction_retries + 1;

    for (int attempt = 0; attempt < attempts; ++attempt) {
        // Targets are read outside the transaction, so it touches only the
        // owner's entity group.
        skeleton_instance skel(db_, definition);
        if (!skel.read(key)) {
            LOG_INFO("relations", "Record %s vanished before it could be refreshed", key.to_string().c_str());
            return;
        }
        const json seen = skel.db_entity()->properties;
        skel.refresh();

        if (skel.pending_cascade_deletion()) {
            try {
                store.run_in_transaction([&] {
                    skeleton_instance current(db_, definition);
                    if (current.read(key)) current.remove();
                });
            } catch (const locked_error& e) {
                LOG_WARN("relations", "Cascade deletion of %s skipped: %s", key.to_string().c_str(), e.what());
            }
            return;
        }

        bool stored = store.run_in_transaction([&] {
            auto current = store.get(key);
            if (!current || current->properties != seen) return false;
            skel.write(true);
            return true;
        });
        if (stored) return;
        LOG_DEBUG("relations", "%s changed while it was refreshed (attempt %d)", key.to_string().c_str(), attempt + 1);
    }
    throw transaction_conflict("Record " + key.to_string() + " kept changing while it was refreshed");
}

void relation_propagation::try_refresh_owner(const std::shared_ptr<const skeleton_definition>& definition,
                                             const db_key& key) {
    try {
        refresh_owner(definition, key);
    } catch (const std::exception& e) {
        LOG_ERROR("relations", "Refreshing %s failed, continuing with the batch: %s", key.to_string().c_str(),
                  e.what());
    }
}

// ============================================================================
// update_relations
// ============================================================================

void relation_propagation::update_relations(const update_relations_task& t) {
    auto& store = db_.store();
    const size_t batch = db_.config().effective_relation_batch_size();

    auto q = store.make_query(layout::relations_kind);
    q.filter("dest.key =", t.dest_key.to_string())
     .filter("delayed_update_tag <", t.min_change_time)
     .filter("update_level =", static_cast<int>(relational_update_level::always));
    if (t.changed_bone) {
        q.filter("foreign_keys =", *t.changed_bone);
    }
    q.cursor(t.cursor);

    auto edges = q.run(batch);
    for (const auto& edge : edges) {
        auto owner = owner_of(edge);
        if (!owner) {
            LOG_WARN("relations", "Edge %s has no owner", edge.key.to_string().c_str());
            continue;
        }
        auto definition = db_.registry().find(owner->kind());
        if (!definition) {
            LOG_WARN("relations", "Edge %s belongs to unknown kind %s",
                     edge.key.to_string().c_str(), owner->kind().c_str());
            continue;
        }
        try_refresh_owner(definition, *owner);
    }

    LOG_DEBUG("relations", "update_relations(%s) refreshed %zu records",
              t.dest_key.to_string().c_str(), edges.size());

    if (edges.size() == batch) {
        update_relations_task next = t;
        next.cursor = q.get_cursor();
        db_.tasks().enqueue(std::move(next));
    }
}

// ============================================================================
// process_removed_relations
// ============================================================================

void relation_propagation::process_removed_relations(const process_removed_relations_task& t) {
    auto& store = db_.store();
    const size_t batch = db_.config().effective_relation_batch_size();

    auto q = store.make_query(layout::relations_kind);
    q.filter("dest.key =", t.removed_key.to_string())
     .filter("consistency >", static_cast<int>(relational_consistency::prevent_deletion))
     .cursor(t.cursor);

    auto edges = q.run(batch);
    for (const auto& edge : edges) {
        auto owner = owner_of(edge);
        auto definition = owner ? db_.registry().find(owner->kind()) : nullptr;
        if (!definition) {
            LOG_WARN("relations", "Skipping edge %s without a known owner", edge.key.to_string().c_str());
            continue;
        }

        auto consistency = static_cast<relational_consistency>(edge.get("consistency").get<int>());
        if (consistency == relational_consistency::cascade_deletion) {
            try {
                store.run_in_transaction([&] {
                    skeleton_instance skel(db_, definition);
                    if (!skel.read(*owner)) {
                        LOG_INFO("relations", "Record %s is already gone", owner->to_string().c_str());
                        return;
                    }
                    skel.remove();
                });
            } catch (const locked_error& e) {
                LOG_WARN("relations", "Cascade deletion of %s skipped: %s", owner->to_string().c_str(), e.what());
            }
            continue;
        }

        const std::string property = text_of(edge.get("src_property"));
        const bone* b = definition->find_bone(property);
        if (!b) {
            LOG_WARN("relations", "Edge %s names unknown bone %s.%s", edge.key.to_string().c_str(),
                     owner->kind().c_str(), property.c_str());
            continue;
        }
        store.run_in_transaction([&] {
            skeleton_instance skel(db_, definition);
            if (!skel.read(*owner)) {
                LOG_INFO("relations", "Record %s is already gone", owner->to_string().c_str());
                return;
            }
            if (b->remove_reference(skel, property, t.removed_key)) {
                skel.write(true);
            }
        });
    }

    if (edges.size() == batch) {
        process_removed_relations_task next = t;
        next.cursor = q.get_cursor();
        db_.tasks().enqueue(std::move(next));
    }
}

// ============================================================================
// Maintenance
// ============================================================================

void relation_propagation::vacuum_relations(const vacuum_relations_task& t) {
    auto& store = db_.store();

    auto q = store.make_query(layout::relations_kind);
    if (!t.kind.empty() && t.kind != "*") {
        q.filter("src_kind =", t.kind);
    }
    q.cursor(t.cursor);

    auto edges = q.run(db_.config().vacuum_batch_size);
    vacuum_relations_task next = t;
    for (const auto& edge : edges) {
        ++next.visited;
        auto definition = db_.registry().find(text_of(edge.get("src_kind")));
        if (definition && definition->has_bone(text_of(edge.get("src_property")))) continue;
        store.remove(edge.key);
        ++next.removed;
    }

    if (edges.size() == db_.config().vacuum_batch_size) {
        next.cursor = q.get_cursor();
        db_.tasks().enqueue(std::move(next));
        return;
    }
    LOG_INFO("relations", "Vacuum of %s done: %lld edges visited, %lld removed",
             t.kind.empty() ? "*" : t.kind.c_str(),
             static_cast<long long>(next.visited), static_cast<long long>(next.removed));
}

void relation_propagation::rebuild_search_index(const rebuild_search_index_task& t) {
    auto definition = db_.registry().find(t.kind);
    if (!definition) {
        throw permanent_task_error("Cannot rebuild unknown kind " + t.kind);
    }
    const size_t batch = db_.config().effective_relation_batch_size();

    auto q = db_.store().make_query(t.kind);
    q.cursor(t.cursor);
    auto records = q.run(batch);
    for (const auto& e : records) {
        try_refresh_owner(definition, e.key);
    }

    rebuild_search_index_task next = t;
    next.visited += static_cast<int64_t>(records.size());
    if (records.size() == batch) {
        next.cursor = q.get_cursor();
        db_.tasks().enqueue(std::move(next));
        return;
    }
    LOG_INFO("relations", "Rebuilt %lld %s records", static_cast<long long>(next.visited), t.kind.c_str());
}

// ============================================================================
// Dispatch
// ============================================================================

namespace {

struct dispatch_visitor {
    relation_propagation& relations;

    void operator()(const update_relations_task& t) const { relations.update_relations(t); }
    void operator()(const process_removed_relations_task& t) const { relations.process_removed_relations(t); }
    void operator()(const vacuum_relations_task& t) const { relations.vacuum_relations(t); }
    void operator()(const rebuild_search_index_task& t) const { relations.rebuild_search_index(t); }
};

} // namespace

void relation_propagation::dispatch(const task& t) {
    std::visit(dispatch_visitor{*this}, t);
}

} // namespace marrow
