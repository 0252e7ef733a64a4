#include "keel/rule_key.hpp"

#include "keel/rule.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace keel {

namespace {

std::array<char, 8> encode_size(std::uint64_t n) {
    std::array<char, 8> out{};
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<char>((n >> (8 * i)) & 0xff);
    }
    return out;
}

} // namespace

void RuleKeyBuilder::frame(char tag, std::string_view name, std::string_view value) {
    hasher_.update(&tag, 1);
    auto name_len = encode_size(name.size());
    hasher_.update(name_len.data(), name_len.size());
    hasher_.update(name);
    auto value_len = encode_size(value.size());
    hasher_.update(value_len.data(), value_len.size());
    hasher_.update(value);
}

void RuleKeyBuilder::record_error(Error err) {
    if (!error_)
        error_ = std::move(err);
}

RuleKeyBuilder &RuleKeyBuilder::set(std::string_view name, std::string_view value) {
    frame('s', name, value);
    return *this;
}

RuleKeyBuilder &RuleKeyBuilder::set(std::string_view name, bool value) {
    frame('b', name, value ? "1" : "0");
    return *this;
}

RuleKeyBuilder &RuleKeyBuilder::set(std::string_view name, std::int64_t value) {
    frame('i', name, std::to_string(value));
    return *this;
}

RuleKeyBuilder &RuleKeyBuilder::set(std::string_view name, const std::optional<std::string> &value) {
    // An absent value must differ from an empty string.
    if (value)
        frame('o', name, *value);
    else
        frame('n', name, {});
    return *this;
}

RuleKeyBuilder &RuleKeyBuilder::set(std::string_view name, const std::vector<std::string> &values) {
    frame('l', name, std::to_string(values.size()));
    for (const auto &value : values) {
        frame('e', name, value);
    }
    return *this;
}

RuleKeyBuilder &RuleKeyBuilder::set(std::string_view name, const BuildRule &rule) {
    const auto &key = rule.rule_key(hashes_);
    if (!key) {
        record_error(key.error());
        return *this;
    }
    const auto &bytes = key->hash().bytes();
    frame('r', name, std::string_view(reinterpret_cast<const char *>(bytes.data()), bytes.size()));
    return *this;
}

RuleKeyBuilder &RuleKeyBuilder::set_path(std::string_view name, const std::filesystem::path &path) {
    auto hash = hashes_.get_or_hash(path);
    if (!hash) {
        record_error(hash.error());
        return *this;
    }
    frame('p', name, path.generic_string());
    const auto &bytes = hash->bytes();
    frame('c', name, std::string_view(reinterpret_cast<const char *>(bytes.data()), bytes.size()));
    return *this;
}

RuleKeyBuilder &RuleKeyBuilder::add_dependency_rule_keys(const std::vector<const BuildRule *> &deps) {
    frame('D', "deps", std::to_string(deps.size()));
    for (const BuildRule *dep : deps) {
        const auto &key = dep->rule_key(hashes_);
        if (!key) {
            record_error(Error{key.error().kind, "dependency " + dep->full_name() + ": " + key.error().message});
            continue;
        }
        const auto &bytes = key->hash().bytes();
        frame('d', {}, std::string_view(reinterpret_cast<const char *>(bytes.data()), bytes.size()));
    }
    return *this;
}

Result<RuleKey> RuleKeyBuilder::build() const {
    if (error_)
        return std::unexpected(*error_);
    return RuleKey(hasher_.digest());
}

} // namespace keel
