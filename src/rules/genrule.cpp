#include "keel/rules/genrule.hpp"

#include <algorithm>
#include <string>

namespace keel {

Genrule::Genrule(BuildRuleParams params, Options options)
    : BuildRule(std::move(params)), options_(std::move(options)) {
    output_path_ = options_.out_dir / "gen" / target().base_path() / options_.out;
}

void Genrule::append_to_rule_key(RuleKeyBuilder &builder) const {
    builder.set("cmd", options_.cmd).set("out", output_path_.generic_string());
    if (options_.manifest) {
        builder.set_path("manifest", *options_.manifest);
    } else {
        builder.set("manifest", std::optional<std::string>{});
    }
    if (options_.package) {
        builder.set("package", *options_.package);
    }
}

Result<std::vector<std::unique_ptr<Step>>> Genrule::build_steps(const BuildContext &) const {
    std::string srcs;
    for (const auto &input : inputs()) {
        if (!srcs.empty())
            srcs += ' ';
        srcs += input.string();
    }

    std::vector<std::pair<std::string, std::string>> env = {
        {"SRCS", srcs},
        {"OUT", output_path_.string()},
        {"SRCDIR", target().base_path().empty() ? std::string(".") : target().base_path()},
    };
    if (options_.package) {
        auto artifact = options_.package->installable();
        if (!artifact) {
            return fail(ErrorKind::TypeConstraint, options_.package->full_name() + " is no longer installable");
        }
        env.emplace_back("PACKAGE", artifact->package_path.string());
    }

    std::vector<std::unique_ptr<Step>> steps;
    steps.push_back(std::make_unique<MkdirStep>(output_path_.parent_path()));
    steps.push_back(std::make_unique<ShellStep>(options_.cmd, std::move(env)));
    return steps;
}

std::optional<InstallableArtifact> Genrule::installable() const {
    if (options_.manifest) {
        return InstallableArtifact{output_path_, *options_.manifest};
    }
    if (options_.package) {
        auto wrapped = options_.package->installable();
        if (wrapped) {
            return InstallableArtifact{output_path_, wrapped->manifest_path};
        }
    }
    return std::nullopt;
}

Result<std::unique_ptr<BuildRule>> GenruleBuilder::build(const BuildRuleResolver &resolver) const {
    const RuleSpec &s = spec();
    const std::string name = target().full_name();

    Genrule::Options options;
    options.type = s.type;
    options.out_dir = resolver.out_dir();

    const std::string *cmd = s.field("cmd");
    if (!cmd || cmd->empty()) {
        return fail(ErrorKind::Parse, s.type + " " + name + " is missing required field 'cmd'");
    }
    options.cmd = *cmd;

    if (const std::string *out = s.field("out"); out && !out->empty()) {
        options.out = *out;
    } else if (s.type == "genrule") {
        return fail(ErrorKind::Parse, "genrule " + name + " is missing required field 'out'");
    } else {
        options.out = target().short_name() + ".pkg";
    }

    if (s.type == "package") {
        const std::string *manifest = s.field("manifest");
        if (!manifest || manifest->empty()) {
            return fail(ErrorKind::Parse, "package " + name + " is missing required field 'manifest'");
        }
        options.manifest = *manifest;
    }

    if (s.type == "package_genrule") {
        const std::string *package = s.field("package");
        if (!package) {
            return fail(ErrorKind::Parse, "package_genrule " + name + " is missing required field 'package'");
        }
        auto package_target = BuildTarget::parse(*package);
        if (!package_target)
            return std::unexpected(package_target.error());

        const auto &deps = declared_deps();
        if (std::find(deps.begin(), deps.end(), *package_target) == deps.end()) {
            return fail(ErrorKind::UnresolvedDependency, "The 'package' argument of " + name + ", " +
                                                             package_target->full_name() +
                                                             ", must also be listed in its deps");
        }

        const BuildRule *package_rule = resolver.get(*package_target);
        if (!package_rule) {
            return fail(ErrorKind::UnresolvedDependency, name + " depends on " + package_target->full_name() +
                                                             ", which was not resolved");
        }
        if (!package_rule->installable()) {
            return fail(ErrorKind::TypeConstraint,
                        "The 'package' argument of " + name + ", " + package_rule->full_name() +
                            ", must correspond to an installable rule, such as package() or package_genrule().");
        }
        options.package = package_rule;
    }

    auto params = resolver.make_params(*this);
    if (!params)
        return std::unexpected(params.error());
    return std::make_unique<Genrule>(std::move(*params), std::move(options));
}

} // namespace keel
