#pragma once

#include "types.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace marrow {

class skeleton_instance;
class skeleton_definition;
class schema_registry;
class query;

// ============================================================================
// Client input and validation errors
// ============================================================================

enum class error_severity : int {
    not_set = 0,            ///< the field was not submitted
    invalidates_other = 1,  ///< valid, but causes other fields to be invalid
    empty = 2,              ///< submitted, but empty
    invalid = 3             ///< submitted and rejected
};

struct read_from_client_error {
    error_severity severity = error_severity::invalid;
    std::string message;
    std::vector<std::string> field_path;
    std::vector<std::string> invalidated_fields;
};

using client_value = std::variant<std::string, std::vector<std::string>>;

/// Raw form input: "name", "name.<lang>", "name.<idx>.<sub>" and
/// "name.<lang>.<idx>.<sub>" keys mapping to one or more strings.
using client_data = std::map<std::string, client_value>;

/// Query parameters as sent by a client ("name", "name$lt", "orderby", ...).
using client_params = std::map<std::string, json>;

// ============================================================================
// Bone options
// ============================================================================

enum class unique_lock_method : int {
    same_value = 1,  ///< each element of a multiple bone is locked on its own
    same_set = 2,    ///< the set of elements is locked, order does not matter
    same_list = 3    ///< the exact list is locked
};

struct unique_value {
    unique_lock_method method = unique_lock_method::same_value;
    bool lock_empty = false;
    std::string message = "Value not available";
};

struct bone_options {
    std::string descr;
    bool required = false;
    bool multiple = false;
    std::vector<std::string> languages;
    bool readonly = false;
    bool indexed = true;
    bool searchable = false;
    std::optional<unique_value> unique;
    json default_value = nullptr;
};

// ============================================================================
// bone - typed field descriptor
// ============================================================================

/// A bone is immutable once its schema is sealed; all per-record state
/// lives in the skeleton_instance passed to each call.
class bone {
public:
    explicit bone(bone_options options = {});
    virtual ~bone() = default;

    virtual std::string type() const = 0;

    const bone_options& options() const { return options_; }
    bool required() const { return options_.required; }
    bool multiple() const { return options_.multiple; }
    bool readonly() const { return options_.readonly; }
    bool searchable() const { return options_.searchable; }
    const std::vector<std::string>& languages() const { return options_.languages; }
    const std::optional<unique_value>& unique() const { return options_.unique; }

    // -- value shape ---------------------------------------------------------

    virtual json get_empty_value() const { return nullptr; }
    virtual json get_default_value(const skeleton_instance& skel) const;

    /// True if the whole value (single, list or language map) is empty.
    bool is_empty(const json& value) const;
    virtual bool is_empty_single(const json& value) const;

    using value_visitor = std::function<void(std::optional<size_t> index,
                                             const std::optional<std::string>& language,
                                             json& value)>;
    /// Visit every single value inside a (multiple and/or localized) value.
    void iter_bone_value(json& value, const value_visitor& visit) const;

    // -- client input --------------------------------------------------------

    /// Parse this bone's part of `data` into `skel`. nullopt means no errors.
    virtual std::optional<std::vector<read_from_client_error>> from_client(
        skeleton_instance& skel, const std::string& name, const client_data& data) const;

    /// Set the value programmatically, validating it like client input.
    virtual bool set_bone_value(skeleton_instance& skel, const std::string& name, const json& value,
                                bool append, const std::optional<std::string>& language) const;

    // -- storage -------------------------------------------------------------

    /// Write the accessed value into the instance's entity. Returns false if
    /// the bone was not accessed and nothing was written.
    virtual bool serialize(skeleton_instance& skel, const std::string& name) const;

    /// Load the value from the instance's entity.
    virtual bool unserialize(skeleton_instance& skel, const std::string& name) const;

    // -- pipeline hooks ------------------------------------------------------

    virtual std::vector<std::string> get_unique_index_values(skeleton_instance& skel,
                                                             const std::string& name) const;
    virtual std::set<std::string> get_referenced_blob_keys(skeleton_instance& skel,
                                                           const std::string& name) const;
    virtual std::set<std::string> get_search_tags(skeleton_instance& skel, const std::string& name) const;

    virtual void refresh(skeleton_instance& /*skel*/, const std::string& /*name*/) const {}
    virtual void pre_save(skeleton_instance& /*skel*/, const std::string& /*name*/, bool /*is_add*/) const {}
    virtual void delete_hook(skeleton_instance& /*skel*/, const std::string& /*name*/) const {}
    virtual void post_saved(skeleton_instance& /*skel*/, const std::string& /*name*/, const db_key& /*key*/) const {}
    virtual void post_deleted(skeleton_instance& /*skel*/, const std::string& /*name*/, const db_key& /*key*/) const {}

    /// Strip every reference to `key` from the value. Returns true if the
    /// value changed.
    virtual bool remove_reference(skeleton_instance& /*skel*/, const std::string& /*name*/,
                                  const db_key& /*key*/) const {
        return false;
    }

    // -- queries -------------------------------------------------------------

    /// Apply the client filters addressing this bone ("name", "name$lt", ...).
    virtual void build_db_filter(const std::string& name, const skeleton_definition& def, query& q,
                                 const client_params& params, const std::string& prefix = "") const;

    /// Apply "orderby"/"orderdir" if they address this bone.
    virtual void build_db_sort(const std::string& name, const skeleton_definition& def, query& q,
                               const client_params& params, const std::string& prefix = "") const;

    /// Second startup phase, called once when the registry is sealed.
    virtual void seal(const std::string& /*name*/, const skeleton_definition& /*owner*/,
                      const schema_registry& /*registry*/) {}

protected:
    /// Parse one value of this bone. Returns the parsed value and any errors.
    virtual std::pair<json, std::vector<read_from_client_error>> single_value_from_client(
        const json& value, skeleton_instance& skel, const std::string& name, const client_data& data) const;

    virtual json single_value_serialize(const json& value, skeleton_instance& /*skel*/,
                                        const std::string& /*name*/) const {
        return value;
    }
    virtual json single_value_unserialize(const json& stored) const { return stored; }

    /// Convert a client filter value into the stored representation.
    virtual json filter_value_from_client(const json& value) const { return value; }

    /// Whether client data for this bone is spread over "name.<sub>" keys.
    virtual bool parse_subfields_from_client() const { return false; }

    /// Gather this bone's raw input. The flag is false if nothing was submitted.
    std::pair<json, bool> collect_raw_client_data(const std::string& name, const client_data& data) const;

    /// Hash of a single value for the unique-value lock protocol.
    virtual std::string hash_single_value(const json& value) const;

    /// Property the query layer filters/sorts on for this bone.
    std::string query_property(const std::string& name) const;

    bone_options options_;
};

read_from_client_error make_error(error_severity severity, std::string message,
                                  std::vector<std::string> field_path = {});

/// Marker carried by the stored form of localized values.
inline constexpr const char* language_wrapper_marker = "_language_wrapper";

} // namespace marrow
