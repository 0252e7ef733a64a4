#include "keel/rule.hpp"

#include "mmap.hpp"

#include <string>

namespace keel {

const Result<RuleKey> &BuildRule::rule_key(FileHashCache &hashes) const {
    std::call_once(key_once_, [&] {
        RuleKeyBuilder builder(hashes);
        builder.set("type", type());
        append_to_rule_key(builder);
        for (const auto &output : outputs()) {
            builder.set("output", output.generic_string());
        }
        for (const auto &input : inputs()) {
            builder.set_path("input", input);
        }
        builder.add_dependency_rule_keys(deps());

        auto key = builder.build();
        if (!key) {
            key = std::unexpected(Error{key.error().kind, full_name() + ": " + key.error().message});
        }
        key_.emplace(std::move(key));
    });
    return *key_;
}

Result<std::string> read_manifest(const InstallableArtifact &artifact) {
    auto file = MappedFile::open(artifact.manifest_path);
    if (!file)
        return std::unexpected(file.error());
    return std::string((*file)->content());
}

} // namespace keel
