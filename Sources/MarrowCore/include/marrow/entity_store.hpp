#pragma once

#include "config.hpp"
#include "db.hpp"
#include "errors.hpp"
#include "types.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace marrow {

class entity_store;

enum class sort_direction {
    ascending,
    descending
};

struct filter_clause {
    std::string property;
    std::string op;     ///< one of = != < <= > >= IN
    json value;
};

struct order_clause {
    std::string property;
    sort_direction direction = sort_direction::ascending;
};

/// Special property name addressing the entity key itself.
inline constexpr const char* key_property = "__key__";

// ============================================================================
// query - filter/order/ancestor/cursor builder over one kind
// ============================================================================

/// Reads committed state only. Equality (and IN) against a list-valued
/// property matches if any element matches.
class query {
public:
    /// May rewrite a clause as it is added; returning nullopt drops it.
    using filter_hook_t = std::function<std::optional<filter_clause>(query&, filter_clause)>;
    using order_hook_t = std::function<std::vector<order_clause>(query&, std::vector<order_clause>)>;

    query(entity_store& store, std::string kind);

    const std::string& kind() const { return kind_; }

    /// `property_and_op` is "prop" (equality) or "prop <op>", e.g. "age >=".
    query& filter(const std::string& property_and_op, json value);
    query& filter(filter_clause clause);

    query& order(const std::string& property, sort_direction direction = sort_direction::ascending);
    query& order(std::vector<order_clause> orders);

    query& ancestor(const db_key& key);
    query& cursor(std::optional<std::string> cursor);

    query& set_filter_hook(filter_hook_t hook) { filter_hook_ = std::move(hook); return *this; }
    query& set_order_hook(order_hook_t hook) { order_hook_ = std::move(hook); return *this; }

    /// Drop every clause and hook and target another kind.
    void reset(std::string kind);

    /// A query that can never match (e.g. a filter on a value that cannot exist).
    void mark_unsatisfiable() { unsatisfiable_ = true; }
    bool is_unsatisfiable() const { return unsatisfiable_; }

    const std::vector<filter_clause>& filters() const { return filters_; }
    const std::vector<order_clause>& orders() const { return orders_; }
    const std::optional<db_key>& ancestor_key() const { return ancestor_; }
    const std::optional<std::string>& start_cursor() const { return cursor_; }

    std::vector<entity> run(size_t limit);
    std::optional<entity> get_entry();

    /// Cursor positioned after the last entity returned by run(), or nullopt
    /// if the last run returned nothing.
    std::optional<std::string> get_cursor() const { return end_cursor_; }

    entity_store& store() const { return *store_; }

private:
    entity_store* store_;
    std::string kind_;
    std::vector<filter_clause> filters_;
    std::vector<order_clause> orders_;
    std::optional<db_key> ancestor_;
    std::optional<std::string> cursor_;
    std::optional<std::string> end_cursor_;
    filter_hook_t filter_hook_;
    order_hook_t order_hook_;
    bool unsatisfiable_ = false;
};

// ============================================================================
// entity_store - SQLite backed keyed document store
// ============================================================================

/// Point reads inside run_in_transaction() record the version they saw;
/// writes are buffered and applied at commit, which re-validates every read
/// under BEGIN IMMEDIATE and throws transaction_conflict on a mismatch.
class entity_store {
public:
    explicit entity_store(const configuration& config);
    ~entity_store();

    entity_store(const entity_store&) = delete;
    entity_store& operator=(const entity_store&) = delete;

    std::optional<entity> get(const db_key& key);
    std::vector<std::optional<entity>> get_multi(const std::vector<db_key>& keys);

    void put(const entity& e);
    void put_multi(const std::vector<entity>& entities);

    void remove(const db_key& key);
    void remove_multi(const std::vector<db_key>& keys);

    /// Allocate a complete key with a fresh id. Ids are never reused, even
    /// if the transaction that asked for one rolls back.
    db_key allocate_key(const std::string& kind, std::optional<db_key> parent = std::nullopt);

    query make_query(const std::string& kind) { return query(*this, kind); }

    /// Run `fn` in a transaction, retrying on transaction_conflict. A call
    /// made while a transaction is running on this thread joins it.
    template <typename F>
    auto run_in_transaction(F&& fn) -> std::invoke_result_t<F&> {
        using result_t = std::invoke_result_t<F&>;
        if (is_in_transaction()) {
            return fn();
        }
        for (int attempt = 0;; ++attempt) {
            std::vector<std::function<void()>> callbacks;
            if constexpr (std::is_void_v<result_t>) {
                if (!attempt_transaction(attempt, [&] { fn(); }, callbacks)) continue;
                run_after_commit(callbacks);
                return;
            } else {
                std::optional<result_t> result;
                if (!attempt_transaction(attempt, [&] { result.emplace(fn()); }, callbacks)) continue;
                run_after_commit(callbacks);
                return std::move(*result);
            }
        }
    }

    bool is_in_transaction() const;

    /// Run `fn` once the current transaction commits, or right away if
    /// there is none. Dropped if the transaction rolls back.
    void after_commit(std::function<void()> fn);

    /// Run `fn` against the database inside the commit of the current
    /// transaction, or right away if there is none.
    void on_commit_write(std::function<void(database&)> fn);

    /// Exclusive access to the underlying database.
    template <typename F>
    auto with_database(F&& fn) -> std::invoke_result_t<F&, database&> {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return fn(*db_);
    }

    const configuration& config() const { return config_; }

    // Used by query::run.
    std::vector<entity> run_query(const query& q, size_t limit, std::optional<std::string>& end_cursor);

private:
    struct transaction_state {
        std::map<std::string, int64_t> read_versions;            // path -> version seen (0 = missing)
        std::map<std::string, std::optional<entity>> writes;     // path -> entity, nullopt = delete
        std::set<std::string> groups;
        std::vector<std::function<void(database&)>> commit_writes;
        std::vector<std::function<void()>> after_commit;
    };

    transaction_state* current_state() const;
    void begin_state();
    std::vector<std::function<void()>> commit_state();
    void discard_state();

    /// One attempt: true on commit, false if the caller should retry.
    bool attempt_transaction(int attempt, const std::function<void()>& body,
                             std::vector<std::function<void()>>& callbacks);
    static void run_after_commit(const std::vector<std::function<void()>>& callbacks);
    void touch_group(transaction_state& state, const db_key& key);

    std::optional<std::pair<entity, int64_t>> load(const db_key& key);
    void write_row(const entity& e, int64_t version);
    void delete_row(const std::string& path);
    int64_t next_version();

    configuration config_;
    std::unique_ptr<database> db_;
    mutable std::recursive_mutex mutex_;

    mutable std::mutex states_mutex_;
    std::unordered_map<std::thread::id, std::unique_ptr<transaction_state>> states_;
};

} // namespace marrow
