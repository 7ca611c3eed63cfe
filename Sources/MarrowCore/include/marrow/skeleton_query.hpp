#pragma once

#include "bone.hpp"
#include "entity_store.hpp"
#include "skeleton.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace marrow {

class marrow_db;

// ============================================================================
// skeleton_query - client-facing query over the records of one kind
// ============================================================================

/// Wraps a store query for a definition. Client filters go through the
/// bones, so a filter on a multiple relational bone moves the query onto the
/// relation edges; fetch() maps edge hits back to their owners.
class skeleton_query {
public:
    skeleton_query(marrow_db& db, std::shared_ptr<const skeleton_definition> definition);

    const skeleton_definition& definition() const { return *definition_; }

    /// Apply "name", "name$lt|le|gt|ge|ne", "rel.dest.x", "orderby",
    /// "orderdir" and "cursor" parameters. Throws invalid_query.
    skeleton_query& merge_client_params(const client_params& params);

    skeleton_query& filter(const std::string& property_and_op, json value);
    skeleton_query& order(const std::string& property, sort_direction direction = sort_direction::ascending);
    skeleton_query& ancestor(const db_key& key);

    skeleton_query& set_cursor(std::optional<std::string> cursor);
    std::optional<std::string> cursor() const { return query_.get_cursor(); }

    /// True once the query was rewritten onto the relation edges.
    bool is_relational() const;

    query& raw() { return query_; }
    const query& raw() const { return query_; }

    std::vector<skeleton_instance> fetch(size_t limit = 30);
    std::optional<skeleton_instance> get_skel();

private:
    marrow_db* db_;
    std::shared_ptr<const skeleton_definition> definition_;
    query query_;
};

} // namespace marrow
