#include "marrow/hashing.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstdio>
#include <stdexcept>

namespace marrow {

std::string sha256_hex(std::string_view data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx, data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx, digest.data(), &digest_len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("OpenSSL: SHA-256 digest failed");
    }
    EVP_MD_CTX_free(ctx);

    std::string out;
    out.reserve(digest_len * 2);
    char buf[3];
    for (unsigned int i = 0; i < digest_len; ++i) {
        std::snprintf(buf, sizeof(buf), "%02x", digest[i]);
        out += buf;
    }
    return out;
}

std::string unique_value_hash(const json& value) {
    if (value.is_number_integer() || value.is_number_unsigned()) {
        return "I-" + sha256_hex(std::to_string(value.get<int64_t>()));
    }
    if (value.is_number_float()) {
        return "I-" + sha256_hex(value.dump());
    }
    if (value.is_string()) {
        return "S-" + sha256_hex(value.get<std::string>());
    }
    return "S-" + sha256_hex(value.dump());
}

namespace {

std::string key_chain_hash(const db_key* key) {
    if (!key) return "-";
    json id_or_name = key->has_name() ? json(key->name()) : json(key->id());
    return unique_value_hash(key->kind()) + "-" + unique_value_hash(id_or_name) + "-<" +
           key_chain_hash(key->parent()) + ">";
}

} // namespace

std::string unique_key_hash(const db_key& key) {
    return "K-" + key_chain_hash(&key);
}

} // namespace marrow
