#include "keel/rules/prebuilt.hpp"

#include <algorithm>

namespace keel {

void PrebuiltRule::append_to_rule_key(RuleKeyBuilder &builder) const {
    builder.set("binary", options_.binary.generic_string())
        .set("source", options_.source)
        .set("docs_url", options_.docs_url);
}

const std::set<std::filesystem::path> &PrebuiltRule::transitive_library_outputs() const {
    std::call_once(transitive_once_, [this] {
        transitive_.insert(options_.binary);
        for (const BuildRule *dep : deps()) {
            if (!dep->is_library())
                continue;
            if (auto prebuilt = dynamic_cast<const PrebuiltRule *>(dep)) {
                const auto &below = prebuilt->transitive_library_outputs();
                transitive_.insert(below.begin(), below.end());
            } else {
                for (auto &out : dep->outputs()) {
                    transitive_.insert(std::move(out));
                }
            }
        }
    });
    return transitive_;
}

Result<std::unique_ptr<BuildRule>> PrebuiltBuilder::build(const BuildRuleResolver &resolver) const {
    const RuleSpec &s = spec();

    const std::string *binary = s.field("binary");
    if (!binary || binary->empty()) {
        return fail(ErrorKind::Parse, "prebuilt " + target().full_name() + " is missing required field 'binary'");
    }

    PrebuiltRule::Options options;
    options.binary = *binary;
    if (const std::string *source = s.field("source"))
        options.source = *source;
    if (const std::string *docs_url = s.field("docs_url"))
        options.docs_url = *docs_url;

    auto params = resolver.make_params(*this);
    if (!params)
        return std::unexpected(params.error());

    // The binary is the rule's only real input; its content drives the key.
    if (std::find(params->inputs.begin(), params->inputs.end(), options.binary) == params->inputs.end()) {
        params->inputs.push_back(options.binary);
    }
    return std::make_unique<PrebuiltRule>(std::move(*params), std::move(options));
}

} // namespace keel
