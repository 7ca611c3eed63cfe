#pragma once

#include "types.hpp"
#include <string>
#include <string_view>

namespace marrow {

/// Lowercase hex SHA-256 digest.
std::string sha256_hex(std::string_view data);

/// Hash of a scalar for unique-value locks: "I-<digest>" for numbers,
/// "S-<digest>" for everything else.
std::string unique_value_hash(const json& value);

/// Hash of a key for unique-value locks: "K-" followed by a recursive
/// "<kind>-<id or name>-<parent>" hash chain.
std::string unique_key_hash(const db_key& key);

} // namespace marrow
