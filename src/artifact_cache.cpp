#include "keel/artifact_cache.hpp"

#include "keel/hash.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <system_error>
#include <unistd.h>

namespace keel {

using json = nlohmann::json;

namespace {

constexpr int RECORD_VERSION = 1;
constexpr const char *RECORD_FILE_NAME = "record.json";
constexpr const char *OUTPUTS_DIR_NAME = "outputs";

// nlohmann::json refuses to serialize strings that are not valid UTF-8.
Result<void> check_encodable(const std::string &what, const std::string &value) {
    try {
        (void)json(value).dump();
    } catch (const json::type_error &) {
        return fail(ErrorKind::IO, "Cannot record " + what + " in a cache record: not valid UTF-8");
    }
    return {};
}

json record_to_json(const ArtifactRecord &record) {
    json outputs = json::array();
    for (const auto &out : record.outputs) {
        outputs.push_back({
            {"path", out.path.generic_string()},
            {"sha1", out.hash.to_hex()},
            {"size", out.size},
        });
    }
    return {
        {"version", RECORD_VERSION},
        {"rule_key", record.rule_key.to_string()},
        {"target", record.target},
        {"type", record.rule_type},
        {"outputs", outputs},
        {"output_key", record.output_key.to_hex()},
        {"timestamp", record.timestamp},
    };
}

Result<ArtifactRecord> record_from_json(const json &j) {
    try {
        if (j.at("version").get<int>() != RECORD_VERSION) {
            return fail(ErrorKind::IO, "Unsupported record version: " + j.at("version").dump());
        }

        ArtifactRecord record;
        auto key = RuleKey::from_string(j.at("rule_key").get<std::string>());
        if (!key)
            return std::unexpected(key.error());
        record.rule_key = *key;
        record.target = j.at("target").get<std::string>();
        record.rule_type = j.at("type").get<std::string>();

        for (const auto &entry : j.at("outputs")) {
            auto hash = Sha1HashCode::from_hex(entry.at("sha1").get<std::string>());
            if (!hash)
                return std::unexpected(hash.error());
            record.outputs.push_back({entry.at("path").get<std::string>(), *hash, entry.at("size").get<std::uintmax_t>()});
        }

        auto output_key = Sha1HashCode::from_hex(j.at("output_key").get<std::string>());
        if (!output_key)
            return std::unexpected(output_key.error());
        record.output_key = *output_key;
        record.timestamp = j.at("timestamp").get<std::int64_t>();
        return record;
    } catch (const json::exception &err) {
        return fail(ErrorKind::IO, std::string("Malformed artifact record: ") + err.what());
    }
}

Sha1HashCode output_key_of(const std::vector<OutputEntry> &outputs) {
    Sha1Hasher hasher;
    for (const auto &out : outputs) {
        hasher.update(out.path.generic_string());
        hasher.update(std::string_view("\0", 1));
        hasher.update(out.hash.bytes().data(), out.hash.bytes().size());
    }
    return hasher.digest();
}

std::filesystem::path unique_temp_dir(const std::filesystem::path &root, const RuleKey &key) {
    static std::atomic<std::uint64_t> counter = 0;
    std::ostringstream name;
    name << key.to_string() << '.' << getpid() << '.' << counter.fetch_add(1);
    return root / "tmp" / name.str();
}

} // namespace

std::filesystem::path DirArtifactCache::entry_dir(const RuleKey &key) const {
    std::string hex = key.to_string();
    return root_ / hex.substr(0, 2) / hex;
}

bool DirArtifactCache::contains(const RuleKey &key) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(entry_dir(key) / RECORD_FILE_NAME, ec);
}

Result<std::optional<ArtifactRecord>> DirArtifactCache::get(const RuleKey &key) const {
    auto record_path = entry_dir(key) / RECORD_FILE_NAME;
    std::ifstream f(record_path);
    if (!f) {
        return std::optional<ArtifactRecord>{};
    }

    json j = json::parse(f, nullptr, false);
    if (j.is_discarded()) {
        return fail(ErrorKind::IO, "Malformed artifact record: " + record_path.string());
    }

    auto record = record_from_json(j);
    if (!record)
        return std::unexpected(record.error());
    if (record->rule_key != key) {
        return fail(ErrorKind::IO, "Artifact record " + record_path.string() + " is filed under the wrong key");
    }
    return std::optional<ArtifactRecord>(std::move(*record));
}

Result<ArtifactRecord> DirArtifactCache::put(const RuleKey &key, const std::string &target,
                                             const std::string &rule_type,
                                             const std::vector<std::filesystem::path> &outputs) {
    if (auto existing = get(key); existing && *existing) {
        return std::move(**existing);
    }

    if (auto ok = check_encodable("target " + target, target); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = check_encodable("rule type " + rule_type, rule_type); !ok) {
        return std::unexpected(ok.error());
    }
    for (const auto &out : outputs) {
        if (auto ok = check_encodable("output " + out.string(), out.generic_string()); !ok) {
            return std::unexpected(ok.error());
        }
    }

    std::error_code ec;
    const auto tmp = unique_temp_dir(root_, key);
    std::filesystem::create_directories(tmp / OUTPUTS_DIR_NAME, ec);
    if (ec) {
        return fail(ErrorKind::IO, "Failed to create " + tmp.string() + ": " + ec.message());
    }

    auto discard = [&] {
        std::error_code ignored;
        std::filesystem::remove_all(tmp, ignored);
    };

    ArtifactRecord record;
    record.rule_key = key;
    record.target = target;
    record.rule_type = rule_type;

    for (size_t i = 0; i < outputs.size(); ++i) {
        const auto &out = outputs[i];
        auto hash = hash_file(out);
        if (!hash) {
            discard();
            return std::unexpected(hash.error());
        }
        auto size = std::filesystem::file_size(out, ec);
        if (!ec) {
            std::filesystem::copy_file(out, tmp / OUTPUTS_DIR_NAME / std::to_string(i), ec);
        }
        if (ec) {
            discard();
            return fail(ErrorKind::IO, "Failed to cache " + out.string() + ": " + ec.message());
        }
        record.outputs.push_back({out, *hash, size});
    }

    record.output_key = output_key_of(record.outputs);
    record.timestamp =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();

    {
        std::ofstream f(tmp / RECORD_FILE_NAME, std::ios::trunc);
        f << record_to_json(record).dump(2) << '\n';
        f.close();
        if (!f) {
            discard();
            return fail(ErrorKind::IO, "Failed to write artifact record for " + target);
        }
    }

    const auto final_dir = entry_dir(key);
    std::filesystem::create_directories(final_dir.parent_path(), ec);
    if (!ec) {
        std::filesystem::rename(tmp, final_dir, ec);
    }
    if (ec) {
        discard();
        // Another writer may have published the same key first.
        if (contains(key)) {
            auto existing = get(key);
            if (existing && *existing)
                return std::move(**existing);
        }
        return fail(ErrorKind::IO, "Failed to publish artifact for " + target + ": " + ec.message());
    }
    return record;
}

Result<bool> DirArtifactCache::materialize(const ArtifactRecord &record) const {
    const auto dir = entry_dir(record.rule_key) / OUTPUTS_DIR_NAME;

    for (size_t i = 0; i < record.outputs.size(); ++i) {
        const auto &out = record.outputs[i];

        std::error_code ec;
        if (std::filesystem::is_regular_file(out.path, ec)) {
            if (auto current = hash_file(out.path); current && *current == out.hash) {
                continue;
            }
        }

        const auto stored = dir / std::to_string(i);
        auto stored_hash = hash_file(stored);
        if (!stored_hash || *stored_hash != out.hash) {
            return false;
        }

        if (out.path.has_parent_path()) {
            std::filesystem::create_directories(out.path.parent_path(), ec);
        }
        if (!ec) {
            std::filesystem::copy_file(stored, out.path, std::filesystem::copy_options::overwrite_existing, ec);
        }
        if (ec) {
            return fail(ErrorKind::IO, "Failed to restore " + out.path.string() + " from cache: " + ec.message());
        }
    }
    return true;
}

} // namespace keel
