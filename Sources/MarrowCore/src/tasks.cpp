#include "marrow/tasks.hpp"
#include "marrow/log.hpp"

#include <algorithm>
#include <cmath>

namespace marrow {

namespace {

constexpr double lease_seconds = 300.0;

json optional_string(const std::optional<std::string>& s) {
    return s ? json(*s) : json(nullptr);
}

std::optional<std::string> read_optional_string(const json& payload, const char* field) {
    if (!payload.contains(field) || payload.at(field).is_null()) return std::nullopt;
    return payload.at(field).get<std::string>();
}

struct task_to_json_visitor {
    json operator()(const update_relations_task& t) const {
        return {{"dest_key", t.dest_key.to_string()},
                {"min_change_time", t.min_change_time},
                {"changed_bone", optional_string(t.changed_bone)},
                {"cursor", optional_string(t.cursor)}};
    }
    json operator()(const process_removed_relations_task& t) const {
        return {{"removed_key", t.removed_key.to_string()}, {"cursor", optional_string(t.cursor)}};
    }
    json operator()(const vacuum_relations_task& t) const {
        return {{"kind", t.kind}, {"cursor", optional_string(t.cursor)},
                {"visited", t.visited}, {"removed", t.removed}};
    }
    json operator()(const rebuild_search_index_task& t) const {
        return {{"kind", t.kind}, {"cursor", optional_string(t.cursor)}, {"visited", t.visited}};
    }
};

} // namespace

const char* task_name(const task& t) {
    switch (t.index()) {
        case 0: return "update_relations";
        case 1: return "process_removed_relations";
        case 2: return "vacuum_relations";
        case 3: return "rebuild_search_index";
    }
    return "unknown";
}

json task_to_json(const task& t) {
    return std::visit(task_to_json_visitor{}, t);
}

task task_from_json(const std::string& name, const json& payload) {
    try {
        if (name == "update_relations") {
            update_relations_task t;
            t.dest_key = db_key::from_string(payload.at("dest_key").get<std::string>());
            t.min_change_time = payload.at("min_change_time").get<double>();
            t.changed_bone = read_optional_string(payload, "changed_bone");
            t.cursor = read_optional_string(payload, "cursor");
            return t;
        }
        if (name == "process_removed_relations") {
            process_removed_relations_task t;
            t.removed_key = db_key::from_string(payload.at("removed_key").get<std::string>());
            t.cursor = read_optional_string(payload, "cursor");
            return t;
        }
        if (name == "vacuum_relations") {
            vacuum_relations_task t;
            t.kind = payload.at("kind").get<std::string>();
            t.cursor = read_optional_string(payload, "cursor");
            t.visited = payload.value("visited", int64_t{0});
            t.removed = payload.value("removed", int64_t{0});
            return t;
        }
        if (name == "rebuild_search_index") {
            rebuild_search_index_task t;
            t.kind = payload.at("kind").get<std::string>();
            t.cursor = read_optional_string(payload, "cursor");
            t.visited = payload.value("visited", int64_t{0});
            return t;
        }
    } catch (const json::exception& e) {
        throw permanent_task_error("Malformed " + name + " payload: " + e.what());
    } catch (const std::invalid_argument& e) {
        throw permanent_task_error("Malformed " + name + " payload: " + e.what());
    }
    throw permanent_task_error("Unknown task " + name);
}

// ============================================================================
// store_task_queue
// ============================================================================

store_task_queue::store_task_queue(entity_store& store, int max_attempts)
    : store_(store), max_attempts_(max_attempts) {
    store_.with_database([](database& db) {
        db.execute("CREATE TABLE IF NOT EXISTS _task_queue ("
                   "id INTEGER PRIMARY KEY AUTOINCREMENT, "
                   "name TEXT NOT NULL, "
                   "payload TEXT NOT NULL, "
                   "attempts INTEGER NOT NULL DEFAULT 0, "
                   "eta REAL NOT NULL, "
                   "lease_until REAL NOT NULL DEFAULT 0)");
        db.execute("CREATE INDEX IF NOT EXISTS _task_queue_eta ON _task_queue(eta, id)");
    });
}

void store_task_queue::enqueue(task t, double countdown) {
    std::string name = task_name(t);
    std::string payload = task_to_json(t).dump();
    double eta = now_seconds() + std::max(0.0, countdown);

    LOG_DEBUG("tasks", "Queueing %s %s", name.c_str(), payload.c_str());
    store_.on_commit_write([name, payload, eta](database& db) {
        db.insert("_task_queue", {{"name", name}, {"payload", payload}, {"eta", eta}});
    });
}

std::optional<store_task_queue::queued_task> store_task_queue::next_task(bool ignore_eta,
                                                                        const std::vector<int64_t>& skip) {
    return store_.with_database([&](database& db) -> std::optional<queued_task> {
        double now = now_seconds();
        std::string sql = "SELECT id, name, payload, attempts FROM _task_queue WHERE lease_until < ?";
        std::vector<column_value_t> params{now};
        if (!ignore_eta) {
            sql += " AND eta <= ?";
            params.emplace_back(now);
        }
        for (int64_t id : skip) {
            sql += " AND id != ?";
            params.emplace_back(id);
        }
        sql += " ORDER BY eta, id LIMIT 1";

        auto rows = db.query(sql, params);
        if (rows.empty()) return std::nullopt;

        queued_task row{column_int(rows.front().at("id")),
                        column_text(rows.front().at("name")),
                        column_text(rows.front().at("payload")),
                        column_int(rows.front().at("attempts"))};

        db.execute("UPDATE _task_queue SET lease_until = ? WHERE id = ? AND lease_until < ?",
                   {now + lease_seconds, row.id, now});
        if (db.changes() != 1) return std::nullopt;
        return row;
    });
}

bool store_task_queue::execute(const queued_task& row) {
    auto drop = [&]() {
        store_.with_database([&](database& db) {
            db.execute("DELETE FROM _task_queue WHERE id = ?", {row.id});
        });
    };

    try {
        task t = task_from_json(row.name, json::parse(row.payload));
        if (!handler_) {
            throw std::logic_error("store_task_queue has no handler");
        }
        handler_(t);
        drop();
        return true;
    } catch (const permanent_task_error& e) {
        LOG_ERROR("tasks", "Dropping %s after permanent failure: %s", row.name.c_str(), e.what());
        drop();
    } catch (const json::parse_error& e) {
        LOG_ERROR("tasks", "Dropping %s with unreadable payload: %s", row.name.c_str(), e.what());
        drop();
    } catch (const std::exception& e) {
        int64_t attempts = row.attempts + 1;
        if (attempts >= max_attempts_) {
            LOG_ERROR("tasks", "Dropping %s after %lld attempts: %s", row.name.c_str(),
                      static_cast<long long>(attempts), e.what());
            drop();
        } else {
            double backoff = std::min(3600.0, std::pow(2.0, static_cast<double>(attempts)));
            LOG_WARN("tasks", "%s failed (attempt %lld), retrying in %.0fs: %s", row.name.c_str(),
                     static_cast<long long>(attempts), backoff, e.what());
            store_.with_database([&](database& db) {
                db.execute("UPDATE _task_queue SET attempts = ?, eta = ?, lease_until = 0 WHERE id = ?",
                           {attempts, now_seconds() + backoff, row.id});
            });
        }
    }
    return false;
}

size_t store_task_queue::run_pending(size_t limit) {
    size_t succeeded = 0;
    std::vector<int64_t> attempted;
    for (size_t i = 0; i < limit; ++i) {
        auto row = next_task(false, attempted);
        if (!row) break;
        attempted.push_back(row->id);
        if (execute(*row)) ++succeeded;
    }
    return succeeded;
}

size_t store_task_queue::drain(size_t max_tasks) {
    size_t succeeded = 0;
    std::vector<int64_t> failed;
    for (size_t i = 0; i < max_tasks; ++i) {
        auto row = next_task(true, failed);
        if (!row) break;
        if (execute(*row)) {
            ++succeeded;
        } else {
            failed.push_back(row->id);
        }
    }
    return succeeded;
}

size_t store_task_queue::pending_count() {
    return store_.with_database([](database& db) {
        auto rows = db.query("SELECT COUNT(*) AS n FROM _task_queue");
        return static_cast<size_t>(column_int(rows.front().at("n")));
    });
}

} // namespace marrow
