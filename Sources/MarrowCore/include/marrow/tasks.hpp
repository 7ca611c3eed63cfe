#pragma once

#include "entity_store.hpp"
#include "types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace marrow {

// ============================================================================
// Task payloads
// ============================================================================

/// Refresh the cached copies of `dest_key` held by other records.
struct update_relations_task {
    db_key dest_key;
    timestamp_t min_change_time = 0;
    std::optional<std::string> changed_bone;
    std::optional<std::string> cursor;
};

/// Null out or cascade-delete the records that referenced a deleted entity.
struct process_removed_relations_task {
    db_key removed_key;
    std::optional<std::string> cursor;
};

/// Drop relation edges whose source kind or bone no longer exists.
/// An empty kind (or "*") visits every edge.
struct vacuum_relations_task {
    std::string kind;
    std::optional<std::string> cursor;
    int64_t visited = 0;
    int64_t removed = 0;
};

/// Refresh and rewrite every record of a kind.
struct rebuild_search_index_task {
    std::string kind;
    std::optional<std::string> cursor;
    int64_t visited = 0;
};

using task = std::variant<
    update_relations_task,
    process_removed_relations_task,
    vacuum_relations_task,
    rebuild_search_index_task
>;

const char* task_name(const task& t);
json task_to_json(const task& t);

/// Throws permanent_task_error for unknown names or malformed payloads.
task task_from_json(const std::string& name, const json& payload);

/// Raised by a task handler to stop the task's retry chain.
class permanent_task_error : public std::runtime_error {
public:
    explicit permanent_task_error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// task_queue - at-least-once dispatch of deferred work
// ============================================================================

struct task_queue {
    virtual ~task_queue() = default;

    /// Queue `t` to run no earlier than `countdown` seconds from now.
    virtual void enqueue(task t, double countdown = 0) = 0;
};

/// Task queue persisted in the store's SQLite database. Enqueueing inside a
/// store transaction takes effect only if the transaction commits.
class store_task_queue : public task_queue {
public:
    using handler_t = std::function<void(const task&)>;

    store_task_queue(entity_store& store, int max_attempts);

    void set_handler(handler_t handler) { handler_ = std::move(handler); }

    void enqueue(task t, double countdown = 0) override;

    /// Run up to `limit` tasks that are due. Returns the number that ran
    /// successfully.
    size_t run_pending(size_t limit = SIZE_MAX);

    /// Run queued tasks regardless of their eta until the queue is empty,
    /// or until `max_tasks` runs were attempted. Tasks failing during the
    /// drain stay queued.
    size_t drain(size_t max_tasks = 10000);

    size_t pending_count();

private:
    struct queued_task {
        int64_t id;
        std::string name;
        std::string payload;
        int64_t attempts;
    };

    std::optional<queued_task> next_task(bool ignore_eta, const std::vector<int64_t>& skip);
    bool execute(const queued_task& row);

    entity_store& store_;
    int max_attempts_;
    handler_t handler_;
};

} // namespace marrow
