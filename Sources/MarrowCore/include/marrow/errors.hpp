#pragma once

#include <stdexcept>
#include <string>

namespace marrow {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// A transaction lost an optimistic-concurrency race. Retryable.
class transaction_conflict : public db_error {
public:
    explicit transaction_conflict(const std::string& msg) : db_error(msg) {}
};

/// A transaction touched more entity groups than allowed. Never retried.
class transaction_too_large : public transaction_conflict {
public:
    explicit transaction_too_large(const std::string& msg) : transaction_conflict(msg) {}
};

/// Deletion refused because other records hold relational locks on the target.
class locked_error : public db_error {
public:
    explicit locked_error(const std::string& msg) : db_error(msg) {}
};

class not_found_error : public db_error {
public:
    explicit not_found_error(const std::string& msg) : db_error(msg) {}
};

/// Invalid schema declaration or use of an unknown kind/field.
class schema_error : public std::logic_error {
public:
    explicit schema_error(const std::string& msg) : std::logic_error(msg) {}
};

/// Query filter or ordering that cannot be expressed against the store.
class invalid_query : public std::invalid_argument {
public:
    explicit invalid_query(const std::string& msg) : std::invalid_argument(msg) {}
};

} // namespace marrow
