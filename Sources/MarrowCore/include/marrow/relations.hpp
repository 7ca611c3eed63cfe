#pragma once

#include "skeleton.hpp"
#include "tasks.hpp"
#include "types.hpp"

#include <memory>

namespace marrow {

class marrow_db;

// ============================================================================
// relation_propagation - background repair of denormalized copies
// ============================================================================

/// Handlers for the background tasks. Every handler works in batches,
/// re-enqueues itself with a cursor while there is more to do, and is safe
/// to run more than once for the same payload.
class relation_propagation {
public:
    explicit relation_propagation(marrow_db& db);

    /// Refresh every record caching a copy of `t.dest_key` whose relation
    /// edge is older than `t.min_change_time`.
    void update_relations(const update_relations_task& t);

    /// Strip (SetNull) or delete (CascadeDeletion) the records that
    /// referenced the deleted `t.removed_key`.
    void process_removed_relations(const process_removed_relations_task& t);

    /// Drop edges whose source kind or source bone no longer exists.
    void vacuum_relations(const vacuum_relations_task& t);

    /// Refresh and rewrite every record of `t.kind`.
    void rebuild_search_index(const rebuild_search_index_task& t);

    /// Route `t` to its handler.
    void dispatch(const task& t);

private:
    /// Re-derive one owner's cached data and store it as fresh. Throws
    /// transaction_conflict if the owner keeps changing underneath.
    void refresh_owner(const std::shared_ptr<const skeleton_definition>& definition, const db_key& key);

    /// refresh_owner, logging a failure so the rest of a batch still runs.
    void try_refresh_owner(const std::shared_ptr<const skeleton_definition>& definition, const db_key& key);

    marrow_db& db_;
};

} // namespace marrow
