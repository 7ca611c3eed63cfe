#pragma once

#include "bone.hpp"

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace marrow {

class marrow_db;

/// What happens to a reference when its target is deleted.
enum class relational_consistency : int {
    ignore = 1,            ///< keep the stale cached copy
    prevent_deletion = 2,  ///< refuse to delete the target while referenced
    set_null = 3,          ///< strip the reference from the owner
    cascade_deletion = 4   ///< delete the owner too
};

/// When cached copies of the target are refreshed.
enum class relational_update_level : int {
    always = 0,      ///< whenever the target changes
    on_rebuild = 1,  ///< only by an explicit refresh / rebuild
    never = 2        ///< never after the value was assigned
};

struct relational_options {
    std::string kind;
    /// Target fields copied into "dest" ("key" is always included).
    std::vector<std::string> ref_keys = {"name"};
    /// Owner fields copied into each relation edge as "src.<field>".
    std::vector<std::string> parent_keys = {"name"};
    /// Schema of the per-reference edge data ("rel"), if any.
    std::shared_ptr<skeleton_definition> using_skel;
    relational_consistency consistency = relational_consistency::ignore;
    relational_update_level update_level = relational_update_level::always;
};

/// A reference to another record with a cached snapshot of some of its
/// fields. Values have the shape {"dest": {"key": ..., <ref_keys>}, "rel": {...}|null}.
class relational_bone : public bone {
public:
    explicit relational_bone(relational_options relation, bone_options options = {});

    std::string type() const override { return "relational." + relation_.kind; }

    const std::string& target_kind() const { return relation_.kind; }
    const std::vector<std::string>& ref_keys() const { return ref_keys_; }
    const std::vector<std::string>& parent_keys() const { return relation_.parent_keys; }
    const std::shared_ptr<skeleton_definition>& using_skel() const { return relation_.using_skel; }
    relational_consistency consistency() const { return relation_.consistency; }
    relational_update_level update_level() const { return relation_.update_level; }

    /// Snapshot schema of the target, built when the registry is sealed.
    const std::shared_ptr<skeleton_definition>& ref_skel() const { return ref_skel_; }

    bool is_empty_single(const json& value) const override;

    bool serialize(skeleton_instance& skel, const std::string& name) const override;

    std::set<std::string> get_referenced_blob_keys(skeleton_instance& skel,
                                                   const std::string& name) const override;
    std::set<std::string> get_search_tags(skeleton_instance& skel, const std::string& name) const override;

    void refresh(skeleton_instance& skel, const std::string& name) const override;
    void delete_hook(skeleton_instance& skel, const std::string& name) const override;
    void post_saved(skeleton_instance& skel, const std::string& name, const db_key& key) const override;
    void post_deleted(skeleton_instance& skel, const std::string& name, const db_key& key) const override;
    bool remove_reference(skeleton_instance& skel, const std::string& name, const db_key& key) const override;

    void build_db_filter(const std::string& name, const skeleton_definition& def, query& q,
                         const client_params& params, const std::string& prefix = "") const override;
    void build_db_sort(const std::string& name, const skeleton_definition& def, query& q,
                       const client_params& params, const std::string& prefix = "") const override;

    void seal(const std::string& name, const skeleton_definition& owner,
              const schema_registry& registry) override;

    /// Build a value for `key` from the current state of the target.
    /// nullopt if the target does not exist.
    std::optional<json> make_value(marrow_db& db, const db_key& key, json rel = nullptr) const;

    /// Keys of every target referenced by `value`.
    std::vector<db_key> referenced_keys(const json& value) const;

protected:
    std::pair<json, std::vector<read_from_client_error>> single_value_from_client(
        const json& value, skeleton_instance& skel, const std::string& name, const client_data& data) const override;
    json single_value_unserialize(const json& stored) const override;
    bool parse_subfields_from_client() const override { return relation_.using_skel != nullptr; }
    std::string hash_single_value(const json& value) const override;

private:
    /// Copy the cached fields of `target` into a dest record.
    json make_dest(const entity& target) const;

    /// Move `q` onto the relation edges of this bone.
    void rewrite_query(const std::string& name, const skeleton_definition& def, query& q) const;

    relational_options relation_;
    std::vector<std::string> ref_keys_;
    std::shared_ptr<skeleton_definition> ref_skel_;
};

} // namespace marrow
