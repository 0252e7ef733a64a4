#include "keel/resolver.hpp"
#include "keel/rules/genrule.hpp"
#include "keel/rules/prebuilt.hpp"

namespace keel {

namespace {

template <typename Builder> BuilderFactory factory_for() {
    return [](RuleSpec spec) -> Result<std::unique_ptr<RuleBuilder>> {
        return std::make_unique<Builder>(std::move(spec));
    };
}

} // namespace

RuleKindRegistry RuleKindRegistry::with_builtin_kinds() {
    RuleKindRegistry registry;
    registry.add("genrule", factory_for<GenruleBuilder>());
    registry.add("package", factory_for<GenruleBuilder>());
    registry.add("package_genrule", factory_for<GenruleBuilder>());
    registry.add("prebuilt", factory_for<PrebuiltBuilder>());
    return registry;
}

} // namespace keel
