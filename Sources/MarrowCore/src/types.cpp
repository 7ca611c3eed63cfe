#include "marrow/types.hpp"
#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace marrow {

timestamp_t now_seconds() {
    using namespace std::chrono;
    auto us = duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
    return static_cast<double>(us) / 1e6;
}

namespace {

std::string escape_segment(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '%' || c == '/' || c == ':') {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", static_cast<unsigned char>(c));
            out += buf;
        } else {
            out += c;
        }
    }
    return out;
}

std::string unescape_segment(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%') {
            if (i + 2 >= s.size()) throw std::invalid_argument("Truncated escape in key: " + s);
            out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

} // namespace

db_key::db_key(std::string kind, int64_t id, std::optional<db_key> parent)
    : kind_(std::move(kind)), id_(id) {
    if (parent) parent_ = std::make_shared<const db_key>(std::move(*parent));
}

db_key::db_key(std::string kind, std::string name, std::optional<db_key> parent)
    : kind_(std::move(kind)), name_(std::move(name)) {
    if (parent) parent_ = std::make_shared<const db_key>(std::move(*parent));
}

db_key db_key::root() const {
    const db_key* k = this;
    while (k->parent_) k = k->parent_.get();
    return *k;
}

std::string db_key::id_or_name() const {
    return has_name() ? name_ : std::to_string(id_);
}

std::string db_key::to_string() const {
    std::string segment = escape_segment(kind_) + ":" +
        (has_name() ? "s" + escape_segment(name_) : "i" + std::to_string(id_));
    if (parent_) return parent_->to_string() + "/" + segment;
    return segment;
}

db_key db_key::from_string(const std::string& encoded) {
    if (encoded.empty()) throw std::invalid_argument("Empty key");

    std::optional<db_key> current;
    size_t start = 0;
    while (start <= encoded.size()) {
        size_t end = encoded.find('/', start);
        std::string segment = encoded.substr(start, end == std::string::npos ? std::string::npos : end - start);
        size_t colon = segment.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 >= segment.size()) {
            throw std::invalid_argument("Malformed key segment: " + segment);
        }
        std::string kind = unescape_segment(segment.substr(0, colon));
        char tag = segment[colon + 1];
        std::string rest = segment.substr(colon + 2);
        if (tag == 'i') {
            size_t used = 0;
            int64_t id = std::stoll(rest, &used);
            if (used != rest.size()) throw std::invalid_argument("Malformed key id: " + rest);
            current = db_key(std::move(kind), id, current);
        } else if (tag == 's') {
            current = db_key(std::move(kind), unescape_segment(rest), current);
        } else {
            throw std::invalid_argument("Malformed key segment: " + segment);
        }
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return *current;
}

std::optional<db_key> db_key::try_parse(const std::string& encoded) {
    try {
        return from_string(encoded);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

bool db_key::is_descendant_of(const db_key& ancestor) const {
    for (const db_key* k = parent_.get(); k; k = k->parent_.get()) {
        if (*k == ancestor) return true;
    }
    return false;
}

} // namespace marrow
