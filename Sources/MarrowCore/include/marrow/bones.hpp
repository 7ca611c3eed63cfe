#pragma once

#include "bone.hpp"

#include <limits>
#include <optional>
#include <string>

namespace marrow {

/// The record's own key, read from the entity. Never written.
class key_bone : public bone {
public:
    key_bone();

    std::string type() const override { return "key"; }

    std::optional<std::vector<read_from_client_error>> from_client(
        skeleton_instance& skel, const std::string& name, const client_data& data) const override;
    bool serialize(skeleton_instance& skel, const std::string& name) const override;
    bool unserialize(skeleton_instance& skel, const std::string& name) const override;

    void build_db_filter(const std::string& name, const skeleton_definition& def, query& q,
                         const client_params& params, const std::string& prefix = "") const override;
    void build_db_sort(const std::string& name, const skeleton_definition& def, query& q,
                       const client_params& params, const std::string& prefix = "") const override;
};

class string_bone : public bone {
public:
    explicit string_bone(bone_options options = {}, size_t max_length = 254, bool case_sensitive = true);

    std::string type() const override { return "str"; }

    size_t max_length() const { return max_length_; }

protected:
    std::pair<json, std::vector<read_from_client_error>> single_value_from_client(
        const json& value, skeleton_instance& skel, const std::string& name, const client_data& data) const override;
    std::string hash_single_value(const json& value) const override;

private:
    size_t max_length_;
    bool case_sensitive_;
};

class numeric_bone : public bone {
public:
    /// `precision` 0 stores integers, anything else doubles rounded to that many digits.
    explicit numeric_bone(bone_options options = {}, int precision = 0,
                          double min = std::numeric_limits<double>::lowest(),
                          double max = std::numeric_limits<double>::max());

    std::string type() const override { return "numeric"; }

protected:
    std::pair<json, std::vector<read_from_client_error>> single_value_from_client(
        const json& value, skeleton_instance& skel, const std::string& name, const client_data& data) const override;
    json filter_value_from_client(const json& value) const override;

private:
    std::optional<json> parse(const json& value) const;

    int precision_;
    double min_;
    double max_;
};

class boolean_bone : public bone {
public:
    explicit boolean_bone(bone_options options = {});

    std::string type() const override { return "bool"; }

    json get_empty_value() const override { return false; }
    bool is_empty_single(const json& value) const override { return value.is_null(); }

protected:
    std::pair<json, std::vector<read_from_client_error>> single_value_from_client(
        const json& value, skeleton_instance& skel, const std::string& name, const client_data& data) const override;
    json filter_value_from_client(const json& value) const override;

private:
    static bool parse(const json& value);
};

} // namespace marrow
