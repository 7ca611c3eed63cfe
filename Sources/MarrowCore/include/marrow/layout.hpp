#pragma once

#include <string>

// Reserved kind and property names of the persisted layout.
namespace marrow::layout {

/// Shared kind holding the relation edges of every relational bone.
inline constexpr const char* relations_kind = "_relations";

/// Kind of the per-record blob reference bookkeeping.
inline constexpr const char* blob_locks_kind = "_blob_locks";

/// Owner property holding internal bookkeeping (update tag, unique values, SEO keys).
inline constexpr const char* meta_property = "_meta";
inline constexpr const char* delayed_update_tag = "delayed_update_tag";
inline constexpr const char* seo_keys = "seo_keys";
inline constexpr const char* active_seo_keys = "active_seo_keys";
inline constexpr const char* search_tags = "search_tags";

/// Keys of the entities holding PreventDeletion locks on an entity.
inline constexpr const char* incoming_locks_property = "incoming_relational_locks";

inline std::string outgoing_locks_property(const std::string& bone_name) {
    return bone_name + "_outgoing_relational_locks";
}

inline std::string unique_values_property(const std::string& bone_name) {
    return bone_name + "_unique_values";
}

inline std::string unique_lock_kind(const std::string& kind, const std::string& bone_name) {
    return kind + "_" + bone_name + "_uniquePropertyIndex";
}

} // namespace marrow::layout
