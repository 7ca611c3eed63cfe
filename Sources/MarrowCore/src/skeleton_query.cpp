#include "marrow/skeleton_query.hpp"
#include "marrow/layout.hpp"
#include "marrow/log.hpp"
#include "marrow/marrow.hpp"

#include <set>

namespace marrow {

skeleton_query::skeleton_query(marrow_db& db, std::shared_ptr<const skeleton_definition> definition)
    : db_(&db), definition_(std::move(definition)), query_(db.store(), definition_->kind_name()) {}

skeleton_query& skeleton_query::merge_client_params(const client_params& params) {
    for (const auto& [name, b] : definition_->bones()) {
        b->build_db_filter(name, *definition_, query_, params);
    }
    for (const auto& [name, b] : definition_->bones()) {
        b->build_db_sort(name, *definition_, query_, params);
    }
    auto it = params.find("cursor");
    if (it != params.end() && it->second.is_string()) {
        query_.cursor(it->second.get<std::string>());
    }
    return *this;
}

skeleton_query& skeleton_query::filter(const std::string& property_and_op, json value) {
    query_.filter(property_and_op, std::move(value));
    return *this;
}

skeleton_query& skeleton_query::order(const std::string& property, sort_direction direction) {
    query_.order(property, direction);
    return *this;
}

skeleton_query& skeleton_query::ancestor(const db_key& key) {
    query_.ancestor(key);
    return *this;
}

skeleton_query& skeleton_query::set_cursor(std::optional<std::string> cursor) {
    query_.cursor(std::move(cursor));
    return *this;
}

bool skeleton_query::is_relational() const {
    return query_.kind() == layout::relations_kind;
}

std::vector<skeleton_instance> skeleton_query::fetch(size_t limit) {
    std::vector<skeleton_instance> out;
    auto results = query_.run(limit);

    if (!is_relational()) {
        for (auto& e : results) {
            skeleton_instance skel(*db_, definition_);
            skel.set_entity(std::move(e));
            out.push_back(std::move(skel));
        }
        return out;
    }

    // One point read per edge; several edges may name the same owner.
    std::set<std::string> seen;
    for (const auto& edge : results) {
        const db_key* owner = edge.key.parent();
        if (!owner) {
            LOG_WARN("query", "Relation edge %s has no owner", edge.key.to_string().c_str());
            continue;
        }
        if (!seen.insert(owner->to_string()).second) continue;
        auto e = db_->store().get(*owner);
        if (!e) {
            LOG_INFO("query", "Skipping edge %s: owner %s is gone",
                     edge.key.to_string().c_str(), owner->to_string().c_str());
            continue;
        }
        skeleton_instance skel(*db_, definition_);
        skel.set_entity(std::move(*e));
        out.push_back(std::move(skel));
    }
    return out;
}

std::optional<skeleton_instance> skeleton_query::get_skel() {
    auto res = fetch(1);
    if (res.empty()) return std::nullopt;
    return std::move(res.front());
}

} // namespace marrow
