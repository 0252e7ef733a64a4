#pragma once

#include "keel/hash.hpp"
#include "keel/rule_key.hpp"
#include "keel/utility.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace keel {

struct OutputEntry {
    std::filesystem::path path;
    Sha1HashCode hash;
    std::uintmax_t size = 0;
};

/** @brief What a successful build of one rule key produced. */
struct ArtifactRecord {
    RuleKey rule_key;
    std::string target;
    std::string rule_type;
    std::vector<OutputEntry> outputs;
    Sha1HashCode output_key; ///< Derived from the outputs, not the inputs.
    std::int64_t timestamp = 0;
};

/**
 * @brief Rule key -> artifact record store.
 *
 * Records are immutable once published; `put` of a key that is already
 * present keeps the existing record. The core never deletes records.
 */
class ArtifactCache {
public:
    virtual ~ArtifactCache() = default;

    virtual bool contains(const RuleKey &key) const = 0;

    /** @brief The record for `key`, nullopt on a miss, IO error if it is unreadable. */
    virtual Result<std::optional<ArtifactRecord>> get(const RuleKey &key) const = 0;

    /** @brief Hashes and stores `outputs` under `key`, then publishes the record. */
    virtual Result<ArtifactRecord> put(const RuleKey &key, const std::string &target, const std::string &rule_type,
                                       const std::vector<std::filesystem::path> &outputs) = 0;

    /**
     * @brief Makes the workspace outputs of `record` match it.
     *
     * Intact outputs are left alone; missing or modified ones are restored
     * from the cached copies. Returns false when that is not possible.
     */
    virtual Result<bool> materialize(const ArtifactRecord &record) const = 0;
};

/**
 * @brief Artifact cache on the local filesystem.
 *
 * Layout: `<root>/<first two hex digits>/<key>/record.json` next to an
 * `outputs/` directory holding a copy of every output. Entries are written to
 * a temporary directory and renamed into place, so a reader sees either no
 * entry or a complete one.
 */
class DirArtifactCache : public ArtifactCache {
public:
    explicit DirArtifactCache(std::filesystem::path root) : root_(std::move(root)) {
    }

    bool contains(const RuleKey &key) const override;
    Result<std::optional<ArtifactRecord>> get(const RuleKey &key) const override;
    Result<ArtifactRecord> put(const RuleKey &key, const std::string &target, const std::string &rule_type,
                               const std::vector<std::filesystem::path> &outputs) override;
    Result<bool> materialize(const ArtifactRecord &record) const override;

    std::filesystem::path entry_dir(const RuleKey &key) const;
    const std::filesystem::path &root() const {
        return root_;
    }

private:
    std::filesystem::path root_;
};

} // namespace keel
