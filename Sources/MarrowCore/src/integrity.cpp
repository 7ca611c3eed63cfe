#include "marrow/integrity.hpp"
#include "marrow/log.hpp"

namespace marrow {

const char* to_string(integrity_issue issue) {
    switch (issue) {
        case integrity_issue::lock_target_missing: return "lock_target_missing";
        case integrity_issue::lock_asymmetry: return "lock_asymmetry";
        case integrity_issue::unique_lock_missing: return "unique_lock_missing";
        case integrity_issue::unique_lock_foreign: return "unique_lock_foreign";
    }
    return "unknown";
}

void integrity_monitor::report(integrity_warning warning) {
    LOG_CRITICAL("integrity", "%s: %s%s%s", to_string(warning.issue), warning.message.c_str(),
                 warning.key ? " key=" : "", warning.key ? warning.key->to_string().c_str() : "");

    std::vector<observer_t> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++total_;
        ++counts_[static_cast<int>(warning.issue)];
        recent_.push_back(warning);
        if (recent_.size() > max_retained) {
            recent_.erase(recent_.begin());
        }
        observers.reserve(observers_.size());
        for (const auto& [_, observer] : observers_) {
            observers.push_back(observer);
        }
    }

    // Observers run outside the lock so they may report or query themselves.
    for (const auto& observer : observers) {
        observer(warning);
    }
}

uint64_t integrity_monitor::add_observer(observer_t observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_observer_id_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

void integrity_monitor::remove_observer(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.erase(id);
}

std::vector<integrity_warning> integrity_monitor::recent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recent_;
}

size_t integrity_monitor::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

size_t integrity_monitor::count(integrity_issue issue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(static_cast<int>(issue));
    return it == counts_.end() ? 0 : it->second;
}

} // namespace marrow
