#pragma once

#include "bone.hpp"
#include "types.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace marrow {

class marrow_db;
class skeleton_instance;

// ============================================================================
// database_adapter - per-kind hooks around the stored entity
// ============================================================================

struct database_adapter {
    virtual ~database_adapter() = default;

    /// Inside the write transaction, right before the entity is stored.
    virtual void preprocess_entry(entity& /*e*/, skeleton_instance& /*skel*/, bool /*is_add*/,
                                  const std::vector<std::string>& /*change_list*/) {}

    /// After the write committed.
    virtual void update_entry(const entity& /*e*/, skeleton_instance& /*skel*/, bool /*is_add*/,
                              const std::vector<std::string>& /*change_list*/) {}

    /// After the delete committed.
    virtual void delete_entry(const entity& /*e*/, skeleton_instance& /*skel*/) {}
};

// ============================================================================
// skeleton_definition - immutable record schema
// ============================================================================

class skeleton_definition {
public:
    using bone_list = std::vector<std::pair<std::string, std::shared_ptr<bone>>>;
    using validation_t = std::function<std::vector<read_from_client_error>(skeleton_instance&)>;
    /// language -> text the SEO key of that language is derived from
    using seo_keys_t = std::function<std::map<std::string, std::string>(skeleton_instance&)>;
    using hook_t = std::function<void(skeleton_instance&, const db_key&)>;

    /// Every definition starts with a readonly "key" bone.
    explicit skeleton_definition(std::string kind_name);

    const std::string& kind_name() const { return kind_name_; }

    template <typename T, typename... Args>
    std::shared_ptr<T> add(const std::string& name, Args&&... args) {
        auto b = std::make_shared<T>(std::forward<Args>(args)...);
        add_bone(name, b);
        return b;
    }
    skeleton_definition& add_bone(const std::string& name, std::shared_ptr<bone> b);

    const bone_list& bones() const { return bones_; }
    const bone* find_bone(const std::string& name) const;
    bool has_bone(const std::string& name) const { return find_bone(name) != nullptr; }

    skeleton_definition& add_adapter(std::shared_ptr<database_adapter> adapter);
    const std::vector<std::shared_ptr<database_adapter>>& adapters() const { return adapters_; }

    skeleton_definition& add_validation(validation_t validation);
    const std::vector<validation_t>& validations() const { return validations_; }

    skeleton_definition& set_seo_keys(seo_keys_t provider);
    const seo_keys_t& seo_keys() const { return seo_keys_; }

    skeleton_definition& set_post_saved_hook(hook_t hook);
    skeleton_definition& set_post_deleted_hook(hook_t hook);
    const hook_t& post_saved_hook() const { return post_saved_hook_; }
    const hook_t& post_deleted_hook() const { return post_deleted_hook_; }

    /// Definition with the same kind name and only the named bones (plus
    /// "key"). Throws schema_error for an unknown name.
    std::shared_ptr<skeleton_definition> subset(const std::vector<std::string>& names) const;

    bool is_sealed() const { return sealed_; }
    void seal(const schema_registry& registry);

private:
    void check_mutable() const;

    std::string kind_name_;
    bone_list bones_;
    std::vector<std::shared_ptr<database_adapter>> adapters_;
    std::vector<validation_t> validations_;
    seo_keys_t seo_keys_;
    hook_t post_saved_hook_;
    hook_t post_deleted_hook_;
    bool sealed_ = false;
};

// ============================================================================
// schema_registry - two-phase kind registry
// ============================================================================

/// Kinds are registered first; seal() then resolves cross-kind references
/// (relational targets, reference snapshots). Nothing may be registered or
/// altered after sealing.
class schema_registry {
public:
    schema_registry() = default;

    schema_registry(const schema_registry&) = delete;
    schema_registry& operator=(const schema_registry&) = delete;

    /// Create and register an empty definition for `kind_name`.
    std::shared_ptr<skeleton_definition> register_skeleton(const std::string& kind_name);
    void register_skeleton(std::shared_ptr<skeleton_definition> definition);

    void seal();
    bool is_sealed() const { return sealed_; }

    /// Throws schema_error for an unknown kind.
    std::shared_ptr<const skeleton_definition> get(const std::string& kind_name) const;
    std::shared_ptr<const skeleton_definition> find(const std::string& kind_name) const;

    std::vector<std::string> kinds() const;

private:
    std::map<std::string, std::shared_ptr<skeleton_definition>> definitions_;
    bool sealed_ = false;
};

// ============================================================================
// skeleton_instance - mutable record bound to a definition
// ============================================================================

class skeleton_instance {
public:
    skeleton_instance(marrow_db& db, std::shared_ptr<const skeleton_definition> definition);

    marrow_db& db() const { return *db_; }
    const skeleton_definition& definition() const { return *definition_; }
    const std::shared_ptr<const skeleton_definition>& definition_ptr() const { return definition_; }
    const std::string& kind_name() const { return definition_->kind_name(); }

    /// Current value of a bone. Loads it from the entity (or the bone's
    /// default) on first access. Throws schema_error for an unknown bone.
    json& get(const std::string& name);
    void set(const std::string& name, json value);

    bool is_accessed(const std::string& name) const { return values_.count(name) != 0; }
    const std::map<std::string, json>& accessed_values() const { return values_; }

    std::optional<entity>& db_entity() { return entity_; }
    const std::optional<entity>& db_entity() const { return entity_; }

    /// Bind to a stored entity, dropping every accessed value.
    void set_entity(entity e);

    std::optional<db_key> key() const;

    std::vector<read_from_client_error>& errors() { return errors_; }
    const std::vector<read_from_client_error>& errors() const { return errors_; }

    /// Read client input into every writable bone. True if no bone reported
    /// an invalid value (or, unless `amend`, left a required bone empty).
    bool from_client(const client_data& data, bool amend = false);

    /// Load the record stored under `key`. False if there is none.
    bool read(const db_key& key);

    /// Store the record. Returns its key, or nullopt if a unique value is
    /// already taken (reported in errors()). `clear_update_tag` marks the
    /// record fresh and suppresses relation propagation.
    std::optional<db_key> write(bool clear_update_tag = false);

    /// Delete the stored record. Throws not_found_error or locked_error.
    void remove();

    /// Re-derive every bone's cached data from its sources.
    void refresh();

    bool set_bone_value(const std::string& name, const json& value, bool append = false,
                        const std::optional<std::string>& language = std::nullopt);

    /// Copy of this instance restricted to the named bones.
    skeleton_instance subset(const std::vector<std::string>& names) const;

    /// Set by refresh() when a CascadeDeletion reference has vanished.
    void mark_for_cascade_deletion() { cascade_deletion_ = true; }
    bool pending_cascade_deletion() const { return cascade_deletion_; }

private:
    struct write_outcome;

    void update_seo_keys(skeleton_instance& work, const db_key& key);
    static void finish_write(marrow_db& db, const write_outcome& outcome, const db_key& key,
                             bool clear_update_tag);

    marrow_db* db_;
    std::shared_ptr<const skeleton_definition> definition_;
    std::optional<entity> entity_;
    std::map<std::string, json> values_;
    std::vector<read_from_client_error> errors_;
    bool cascade_deletion_ = false;
};

} // namespace marrow
