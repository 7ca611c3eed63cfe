#pragma once

#include "types.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace marrow {

enum class integrity_issue {
    lock_target_missing,      ///< an entity named by a relational lock does not exist
    lock_asymmetry,           ///< incoming/outgoing relational lock lists disagree
    unique_lock_missing,      ///< an owned unique-value lock record is gone
    unique_lock_foreign,      ///< a unique-value lock is held by another record
};

const char* to_string(integrity_issue issue);

/// A detected corruption that was logged and tolerated.
struct integrity_warning {
    integrity_issue issue;
    std::string message;
    std::optional<db_key> key;
};

/// Channel for integrity violations. The operation reporting one always
/// continues; observers see every report, and the last few are retained.
class integrity_monitor {
public:
    using observer_t = std::function<void(const integrity_warning&)>;

    void report(integrity_warning warning);
    void report(integrity_issue issue, std::string message, std::optional<db_key> key = std::nullopt) {
        report(integrity_warning{issue, std::move(message), std::move(key)});
    }

    uint64_t add_observer(observer_t observer);
    void remove_observer(uint64_t id);

    std::vector<integrity_warning> recent() const;
    size_t count() const;
    size_t count(integrity_issue issue) const;

private:
    static constexpr size_t max_retained = 100;

    mutable std::mutex mutex_;
    std::vector<integrity_warning> recent_;
    std::unordered_map<int, size_t> counts_;
    size_t total_ = 0;
    std::unordered_map<uint64_t, observer_t> observers_;
    uint64_t next_observer_id_ = 1;
};

} // namespace marrow
