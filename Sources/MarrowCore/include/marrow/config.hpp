#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace marrow {

struct configuration {
    /// Database file path. Use ":memory:" for an in-memory database.
    std::string path = ":memory:";

    /// Entity groups a single transaction may touch before it fails fast.
    size_t max_entity_groups_per_transaction = 25;

    /// How often run_in_transaction re-runs a callback after a conflict.
    int transaction_retries = 3;

    /// Batch size of the relation propagation tasks (clamped to 5..100).
    size_t relation_batch_size = 5;

    /// Batch size of vacuum_relations.
    size_t vacuum_batch_size = 25;

    /// Edits touching fewer bones than this queue one update task per bone.
    size_t changed_bone_fanout_limit = 5;

    std::string default_language = "en";
    std::vector<std::string> available_languages = {"en"};

    /// A task failing this often is dropped.
    int task_max_attempts = 10;

    configuration() = default;

    explicit configuration(const std::string& p) : path(p) {}

    size_t effective_relation_batch_size() const {
        return std::clamp<size_t>(relation_batch_size, 5, 100);
    }
};

} // namespace marrow
