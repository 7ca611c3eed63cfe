#include "marrow/entity_store.hpp"
#include "marrow/log.hpp"

#include <exception>
#include <sstream>

namespace marrow {

namespace {

const std::set<std::string>& known_operators() {
    static const std::set<std::string> ops = {"=", "!=", "<", "<=", ">", ">=", "IN"};
    return ops;
}

std::string sql_literal(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += '\'';
        out += c;
    }
    return out + "'";
}

// "dest.name" -> '$."dest"."name"'
std::string json_path_literal(const std::string& property) {
    if (property.empty() || property.find('"') != std::string::npos) {
        throw invalid_query("Invalid property name: '" + property + "'");
    }
    std::string path = "$";
    size_t start = 0;
    while (true) {
        size_t dot = property.find('.', start);
        std::string part = property.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (part.empty()) throw invalid_query("Invalid property name: '" + property + "'");
        path += ".\"" + part + "\"";
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return sql_literal(path);
}

std::string value_expr(const std::string& property) {
    if (property == key_property) return "path";
    return "json_extract(props, " + json_path_literal(property) + ")";
}

column_value_t to_column(const json& value) {
    switch (value.type()) {
        case json::value_t::null: return nullptr;
        case json::value_t::boolean: return static_cast<int64_t>(value.get<bool>() ? 1 : 0);
        case json::value_t::number_integer: return value.get<int64_t>();
        case json::value_t::number_unsigned: return static_cast<int64_t>(value.get<uint64_t>());
        case json::value_t::number_float: return value.get<double>();
        case json::value_t::string: return value.get<std::string>();
        default:
            throw invalid_query("Cannot filter on a structured value: " + value.dump());
    }
}

json to_json(const column_value_t& value) {
    return std::visit([](auto&& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else {
            return v;
        }
    }, value);
}

struct sql_fragment {
    std::string sql;
    std::vector<column_value_t> params;
};

sql_fragment filter_sql(const filter_clause& f) {
    std::string expr = value_expr(f.property);
    if (f.value.is_null()) {
        if (f.op == "=") return {expr + " IS NULL", {}};
        if (f.op == "!=") return {expr + " IS NOT NULL", {}};
        throw invalid_query("Operator " + f.op + " cannot compare against null");
    }

    sql_fragment cond;
    if (f.op == "IN") {
        if (!f.value.is_array()) throw invalid_query("IN expects a list of values");
        if (f.value.empty()) return {"0", {}};
        cond.sql = "IN (";
        for (size_t i = 0; i < f.value.size(); ++i) {
            cond.sql += i ? ", ?" : "?";
            cond.params.push_back(f.property == key_property && f.value[i].is_string()
                                  ? column_value_t(f.value[i].get<std::string>())
                                  : to_column(f.value[i]));
        }
        cond.sql += ")";
    } else {
        cond.sql = f.op + " ?";
        cond.params.push_back(to_column(f.value));
    }

    if (f.property == key_property || f.op == "!=") {
        return {expr + " " + cond.sql, cond.params};
    }

    // List-valued properties match if any element matches.
    std::string path = json_path_literal(f.property);
    sql_fragment out;
    out.sql = "(CASE json_type(props, " + path + ") WHEN 'array' THEN EXISTS (SELECT 1 FROM json_each(props, " +
              path + ") WHERE json_each.value " + cond.sql + ") ELSE " + expr + " " + cond.sql + " END)";
    out.params = cond.params;
    out.params.insert(out.params.end(), cond.params.begin(), cond.params.end());
    return out;
}

// Strictly-after predicate for one sort column, NULLs ordering first.
sql_fragment after_sql(const std::string& expr, sort_direction dir, const column_value_t& v) {
    if (dir == sort_direction::ascending) {
        return {"(" + expr + " > ? OR (? IS NULL AND " + expr + " IS NOT NULL))", {v, v}};
    }
    return {"(" + expr + " < ? OR (" + expr + " IS NULL AND ? IS NOT NULL))", {v, v}};
}

entity row_to_entity(const database::row_t& row) {
    entity e;
    e.key = db_key::from_string(column_text(row.at("path")));
    e.properties = json::parse(column_text(row.at("props")));
    return e;
}

} // namespace

// ============================================================================
// query
// ============================================================================

query::query(entity_store& store, std::string kind) : store_(&store), kind_(std::move(kind)) {}

query& query::filter(const std::string& property_and_op, json value) {
    std::string spec = property_and_op;
    while (!spec.empty() && spec.back() == ' ') spec.pop_back();

    filter_clause clause;
    clause.op = "=";
    clause.property = spec;
    size_t space = spec.rfind(' ');
    if (space != std::string::npos) {
        std::string op = spec.substr(space + 1);
        if (known_operators().count(op) == 0) {
            throw invalid_query("Unknown filter operator '" + op + "'");
        }
        clause.op = op;
        clause.property = spec.substr(0, spec.find_last_not_of(' ', space) + 1);
    }
    clause.value = std::move(value);
    return filter(std::move(clause));
}

query& query::filter(filter_clause clause) {
    if (known_operators().count(clause.op) == 0) {
        throw invalid_query("Unknown filter operator '" + clause.op + "'");
    }
    if (filter_hook_) {
        auto rewritten = filter_hook_(*this, std::move(clause));
        if (!rewritten) return *this;
        clause = std::move(*rewritten);
    }
    filters_.push_back(std::move(clause));
    return *this;
}

query& query::order(const std::string& property, sort_direction direction) {
    return order(std::vector<order_clause>{{property, direction}});
}

query& query::order(std::vector<order_clause> orders) {
    if (order_hook_) {
        orders = order_hook_(*this, std::move(orders));
    }
    orders_ = std::move(orders);
    return *this;
}

query& query::ancestor(const db_key& key) {
    ancestor_ = key;
    return *this;
}

query& query::cursor(std::optional<std::string> cursor) {
    cursor_ = std::move(cursor);
    return *this;
}

void query::reset(std::string kind) {
    kind_ = std::move(kind);
    filters_.clear();
    orders_.clear();
    ancestor_.reset();
    filter_hook_ = nullptr;
    order_hook_ = nullptr;
    unsatisfiable_ = false;
}

std::vector<entity> query::run(size_t limit) {
    if (unsatisfiable_) {
        end_cursor_.reset();
        return {};
    }
    return store_->run_query(*this, limit, end_cursor_);
}

std::optional<entity> query::get_entry() {
    auto res = run(1);
    if (res.empty()) return std::nullopt;
    return std::move(res.front());
}

// ============================================================================
// entity_store
// ============================================================================

entity_store::entity_store(const configuration& config)
    : config_(config), db_(std::make_unique<database>(config.path)) {
    db_->execute("CREATE TABLE IF NOT EXISTS _entities ("
                 "path TEXT PRIMARY KEY, kind TEXT NOT NULL, props TEXT NOT NULL, version INTEGER NOT NULL)");
    db_->execute("CREATE INDEX IF NOT EXISTS _entities_kind ON _entities(kind, path)");
    db_->execute("CREATE TABLE IF NOT EXISTS _counters (name TEXT PRIMARY KEY, value INTEGER NOT NULL)");
}

entity_store::~entity_store() = default;

entity_store::transaction_state* entity_store::current_state() const {
    std::lock_guard<std::mutex> lock(states_mutex_);
    auto it = states_.find(std::this_thread::get_id());
    return it == states_.end() ? nullptr : it->second.get();
}

bool entity_store::is_in_transaction() const {
    return current_state() != nullptr;
}

void entity_store::begin_state() {
    std::lock_guard<std::mutex> lock(states_mutex_);
    states_[std::this_thread::get_id()] = std::make_unique<transaction_state>();
}

void entity_store::discard_state() {
    std::lock_guard<std::mutex> lock(states_mutex_);
    states_.erase(std::this_thread::get_id());
}

void entity_store::touch_group(transaction_state& state, const db_key& key) {
    state.groups.insert(key.root().to_string());
    if (state.groups.size() > config_.max_entity_groups_per_transaction) {
        throw transaction_too_large("Transaction touches more than " +
                                    std::to_string(config_.max_entity_groups_per_transaction) +
                                    " entity groups");
    }
}

std::optional<std::pair<entity, int64_t>> entity_store::load(const db_key& key) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto rows = db_->query("SELECT props, version FROM _entities WHERE path = ?", {key.to_string()});
    if (rows.empty()) return std::nullopt;
    entity e(key, json::parse(column_text(rows.front().at("props"))));
    return std::make_pair(std::move(e), column_int(rows.front().at("version")));
}

int64_t entity_store::next_version() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto rows = db_->query("INSERT INTO _counters (name, value) VALUES ('version', 1) "
                           "ON CONFLICT (name) DO UPDATE SET value = value + 1 RETURNING value");
    return column_int(rows.front().at("value"));
}

void entity_store::write_row(const entity& e, int64_t version) {
    db_->insert("_entities",
                {{"path", e.key.to_string()},
                 {"kind", e.key.kind()},
                 {"props", e.properties.dump()},
                 {"version", version}},
                {"path"});
}

void entity_store::delete_row(const std::string& path) {
    db_->execute("DELETE FROM _entities WHERE path = ?", {path});
}

std::optional<entity> entity_store::get(const db_key& key) {
    if (!key.is_complete()) {
        throw db_error("Cannot get an incomplete key of kind " + key.kind());
    }
    std::string path = key.to_string();

    transaction_state* state = current_state();
    if (state) {
        auto written = state->writes.find(path);
        if (written != state->writes.end()) {
            return written->second;
        }
        touch_group(*state, key);
    }

    auto loaded = load(key);
    if (state) {
        state->read_versions.emplace(path, loaded ? loaded->second : 0);
    }
    if (!loaded) return std::nullopt;
    return std::move(loaded->first);
}

std::vector<std::optional<entity>> entity_store::get_multi(const std::vector<db_key>& keys) {
    std::vector<std::optional<entity>> out;
    out.reserve(keys.size());
    for (const auto& key : keys) {
        out.push_back(get(key));
    }
    return out;
}

void entity_store::put(const entity& e) {
    if (!e.key.is_complete()) {
        throw db_error("Cannot put an entity with an incomplete key of kind " + e.key.kind());
    }
    if (!e.properties.is_object()) {
        throw db_error("Entity properties must be an object: " + e.key.to_string());
    }

    if (transaction_state* state = current_state()) {
        touch_group(*state, e.key);
        state->writes[e.key.to_string()] = e;
        return;
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_row(e, next_version());
}

void entity_store::put_multi(const std::vector<entity>& entities) {
    for (const auto& e : entities) {
        put(e);
    }
}

void entity_store::remove(const db_key& key) {
    if (transaction_state* state = current_state()) {
        touch_group(*state, key);
        state->writes[key.to_string()] = std::nullopt;
        return;
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    delete_row(key.to_string());
}

void entity_store::remove_multi(const std::vector<db_key>& keys) {
    for (const auto& key : keys) {
        remove(key);
    }
}

db_key entity_store::allocate_key(const std::string& kind, std::optional<db_key> parent) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto rows = db_->query("INSERT INTO _counters (name, value) VALUES (?, 1) "
                           "ON CONFLICT (name) DO UPDATE SET value = value + 1 RETURNING value",
                           {"kind:" + kind});
    return db_key(kind, column_int(rows.front().at("value")), std::move(parent));
}

void entity_store::after_commit(std::function<void()> fn) {
    if (transaction_state* state = current_state()) {
        state->after_commit.push_back(std::move(fn));
        return;
    }
    fn();
}

void entity_store::on_commit_write(std::function<void(database&)> fn) {
    if (transaction_state* state = current_state()) {
        state->commit_writes.push_back(std::move(fn));
        return;
    }
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    fn(*db_);
}

std::vector<std::function<void()>> entity_store::commit_state() {
    std::unique_ptr<transaction_state> state;
    {
        std::lock_guard<std::mutex> lock(states_mutex_);
        auto it = states_.find(std::this_thread::get_id());
        if (it == states_.end()) return {};
        state = std::move(it->second);
        states_.erase(it);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    transaction txn(*db_);

    for (const auto& [path, seen] : state->read_versions) {
        auto rows = db_->query("SELECT version FROM _entities WHERE path = ?", {path});
        int64_t current = rows.empty() ? 0 : column_int(rows.front().at("version"));
        if (current != seen) {
            throw transaction_conflict("Entity " + path + " was modified concurrently");
        }
    }

    if (!state->writes.empty()) {
        int64_t version = next_version();
        for (const auto& [path, written] : state->writes) {
            if (written) {
                write_row(*written, version);
            } else {
                delete_row(path);
            }
        }
    }

    for (const auto& fn : state->commit_writes) {
        fn(*db_);
    }

    txn.commit();
    LOG_DEBUG("store", "Committed %zu writes across %zu groups", state->writes.size(), state->groups.size());
    return std::move(state->after_commit);
}

bool entity_store::attempt_transaction(int attempt, const std::function<void()>& body,
                                       std::vector<std::function<void()>>& callbacks) {
    begin_state();
    try {
        body();
        callbacks = commit_state();
        return true;
    } catch (const transaction_too_large&) {
        discard_state();
        throw;
    } catch (const transaction_conflict& e) {
        discard_state();
        if (attempt >= config_.transaction_retries) {
            LOG_WARN("store", "Transaction failed after %d attempts: %s", attempt + 1, e.what());
            throw;
        }
        LOG_INFO("store", "Retrying transaction (attempt %d): %s", attempt + 2, e.what());
        return false;
    } catch (...) {
        discard_state();
        throw;
    }
}

void entity_store::run_after_commit(const std::vector<std::function<void()>>& callbacks) {
    std::exception_ptr first_failure;
    for (const auto& fn : callbacks) {
        try {
            fn();
        } catch (const std::exception& e) {
            LOG_ERROR("store", "After-commit callback failed: %s", e.what());
            if (!first_failure) first_failure = std::current_exception();
        }
    }
    if (first_failure) {
        std::rethrow_exception(first_failure);
    }
}

std::vector<entity> entity_store::run_query(const query& q, size_t limit, std::optional<std::string>& end_cursor) {
    std::ostringstream sql;
    std::vector<column_value_t> params;

    std::vector<std::string> order_exprs;
    for (const auto& o : q.orders()) {
        order_exprs.push_back(value_expr(o.property));
    }

    sql << "SELECT path, props";
    for (size_t i = 0; i < order_exprs.size(); ++i) {
        sql << ", " << order_exprs[i] << " AS o" << i;
    }
    sql << " FROM _entities WHERE kind = ?";
    params.emplace_back(q.kind());

    if (q.ancestor_key()) {
        std::string anc = q.ancestor_key()->to_string();
        sql << " AND (path = ? OR (path > ? AND path < ?))";
        params.emplace_back(anc);
        params.emplace_back(anc + "/");
        params.emplace_back(anc + "0");  // '0' sorts right after '/'
    }

    for (const auto& f : q.filters()) {
        auto frag = filter_sql(f);
        sql << " AND " << frag.sql;
        params.insert(params.end(), frag.params.begin(), frag.params.end());
    }

    if (q.start_cursor()) {
        json position;
        try {
            position = json::parse(*q.start_cursor());
        } catch (const json::parse_error&) {
            throw invalid_query("Malformed cursor");
        }
        if (!position.is_array() || position.size() != order_exprs.size() + 1 || !position.back().is_string()) {
            throw invalid_query("Cursor does not match the query's ordering");
        }

        std::vector<std::string> terms;
        for (size_t i = 0; i <= order_exprs.size(); ++i) {
            std::string term = "(";
            for (size_t j = 0; j < i; ++j) {
                term += order_exprs[j] + " IS ? AND ";
                params.push_back(to_column(position[j]));
            }
            if (i < order_exprs.size()) {
                auto frag = after_sql(order_exprs[i], q.orders()[i].direction, to_column(position[i]));
                term += frag.sql;
                params.insert(params.end(), frag.params.begin(), frag.params.end());
            } else {
                term += "path > ?";
                params.push_back(position.back().get<std::string>());
            }
            terms.push_back(term + ")");
        }
        sql << " AND (";
        for (size_t i = 0; i < terms.size(); ++i) {
            sql << (i ? " OR " : "") << terms[i];
        }
        sql << ")";
    }

    sql << " ORDER BY ";
    for (size_t i = 0; i < order_exprs.size(); ++i) {
        sql << order_exprs[i] << (q.orders()[i].direction == sort_direction::ascending ? " ASC, " : " DESC, ");
    }
    sql << "path ASC LIMIT ?";
    params.emplace_back(static_cast<int64_t>(limit));

    std::vector<database::row_t> rows;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        rows = db_->query(sql.str(), params);
    }

    std::vector<entity> out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        out.push_back(row_to_entity(row));
    }

    if (rows.empty()) {
        end_cursor.reset();
    } else {
        json position = json::array();
        for (size_t i = 0; i < order_exprs.size(); ++i) {
            position.push_back(to_json(rows.back().at("o" + std::to_string(i))));
        }
        position.push_back(column_text(rows.back().at("path")));
        end_cursor = position.dump();
    }
    return out;
}

} // namespace marrow
