#pragma once

#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <variant>
#include <nlohmann/json.hpp>

namespace marrow {

using json = nlohmann::json;

// Seconds since the Unix epoch, with sub-second precision.
using timestamp_t = double;

timestamp_t now_seconds();

// Value stored in or bound to a SQLite column.
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string
>;

// ============================================================================
// db_key - hierarchical entity key
// ============================================================================

/// Identifies an entity by kind and id-or-name, optionally below a parent key.
/// The root of the chain names the entity group.
class db_key {
public:
    db_key() = default;
    db_key(std::string kind, int64_t id, std::optional<db_key> parent = std::nullopt);
    db_key(std::string kind, std::string name, std::optional<db_key> parent = std::nullopt);

    const std::string& kind() const { return kind_; }
    int64_t id() const { return id_; }
    const std::string& name() const { return name_; }
    bool has_name() const { return !name_.empty(); }

    /// A key is complete once it carries an id or a name.
    bool is_complete() const { return id_ != 0 || !name_.empty(); }

    const db_key* parent() const { return parent_.get(); }
    db_key root() const;

    /// Either the numeric id or the name, rendered as text.
    std::string id_or_name() const;

    /// Stable text encoding, e.g. "tag:i12/_relations:i40". Round-trips through from_string().
    std::string to_string() const;
    static db_key from_string(const std::string& encoded);
    static std::optional<db_key> try_parse(const std::string& encoded);

    /// True if this key lies strictly below `ancestor`.
    bool is_descendant_of(const db_key& ancestor) const;

    bool operator==(const db_key& other) const { return to_string() == other.to_string(); }
    bool operator!=(const db_key& other) const { return !(*this == other); }
    bool operator<(const db_key& other) const { return to_string() < other.to_string(); }

private:
    std::string kind_;
    int64_t id_ = 0;
    std::string name_;
    std::shared_ptr<const db_key> parent_;
};

// ============================================================================
// entity - a stored record: key plus a JSON property map
// ============================================================================

struct entity {
    db_key key;
    json properties = json::object();

    entity() = default;
    explicit entity(db_key k, json props = json::object())
        : key(std::move(k)), properties(std::move(props)) {}

    bool contains(const std::string& name) const {
        return properties.is_object() && properties.contains(name);
    }

    json& operator[](const std::string& name) { return properties[name]; }

    /// Property value, or null if absent.
    json get(const std::string& name) const {
        if (!contains(name)) return nullptr;
        return properties.at(name);
    }

    void erase(const std::string& name) { properties.erase(name); }
};

} // namespace marrow
