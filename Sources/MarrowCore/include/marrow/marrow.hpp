#pragma once

#include "config.hpp"
#include "entity_store.hpp"
#include "integrity.hpp"
#include "skeleton.hpp"
#include "tasks.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace marrow {

class relation_propagation;
class skeleton_query;

// ============================================================================
// marrow_db - one store, its schemas and its background machinery
// ============================================================================

class marrow_db {
public:
    /// `registry` must be sealed and must outlive the marrow_db.
    explicit marrow_db(const schema_registry& registry, configuration config = {});
    ~marrow_db();

    marrow_db(const marrow_db&) = delete;
    marrow_db& operator=(const marrow_db&) = delete;

    const configuration& config() const { return config_; }
    const schema_registry& registry() const { return registry_; }
    entity_store& store() { return *store_; }
    integrity_monitor& integrity() { return integrity_; }
    relation_propagation& relations() { return *relations_; }

    /// Queue that background work is enqueued on.
    task_queue& tasks() { return external_queue_ ? *external_queue_ : *queue_; }

    /// The built-in queue persisted in the database.
    store_task_queue& queue() { return *queue_; }

    /// Route enqueued tasks elsewhere; nullptr restores the built-in queue.
    void set_task_queue(std::shared_ptr<task_queue> queue) { external_queue_ = std::move(queue); }

    /// Fresh instance of `kind`. Throws schema_error for an unknown kind.
    skeleton_instance create(const std::string& kind);

    /// Instance of the record stored under `key`, if any.
    std::optional<skeleton_instance> load(const db_key& key);

    skeleton_query select(const std::string& kind);

    size_t run_pending_tasks(size_t limit = SIZE_MAX) { return queue_->run_pending(limit); }
    size_t drain_tasks(size_t max_tasks = 10000) { return queue_->drain(max_tasks); }

private:
    configuration config_;
    const schema_registry& registry_;
    std::unique_ptr<entity_store> store_;
    integrity_monitor integrity_;
    std::unique_ptr<store_task_queue> queue_;
    std::shared_ptr<task_queue> external_queue_;
    std::unique_ptr<relation_propagation> relations_;
};

} // namespace marrow
