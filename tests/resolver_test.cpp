#include "tests/test_suite.hpp"
#include "tests/testing_utils.hpp"

#include "keel/resolver.hpp"
#include "keel/rules/genrule.hpp"
#include "keel/rules/prebuilt.hpp"

using namespace keel;
using namespace keel::testing;

namespace {

RuleSpec spec_of(const std::string &type, const std::string &name, const std::vector<std::string> &deps,
                 std::vector<std::pair<std::string, std::string>> fields) {
    RuleSpec spec = fake_spec(name, deps);
    spec.type = type;
    spec.fields = std::move(fields);
    return spec;
}

void add_spec(const RuleKindRegistry &registry, BuildRuleResolver &resolver, RuleSpec spec) {
    auto builder = registry.create(std::move(spec));
    if (!builder)
        throw std::runtime_error(builder.error().message);
    if (auto res = resolver.add(std::move(*builder)); !res)
        throw std::runtime_error(res.error().message);
}

void test_resolves_in_dependency_order() {
    BuildRuleResolver resolver;
    // Declared before its dependency.
    ASSERT_OK(resolver.add(fake_builder("//:top", {"//:leaf", "//:leaf"})));
    ASSERT_OK(resolver.add(fake_builder("//:leaf")));

    auto graph = resolver.resolve();
    ASSERT_OK(graph);
    ASSERT_EQ(graph->size(), 2u);

    auto top = graph->find(target("//:top"));
    ASSERT_OK(top);
    ASSERT_EQ((*top)->deps().size(), 1u);
    ASSERT_EQ((*top)->deps()[0]->full_name(), "//:leaf");
}

void test_duplicate_target() {
    BuildRuleResolver resolver;
    ASSERT_OK(resolver.add(fake_builder("//:a")));
    auto res = resolver.add(fake_builder("//:a"));
    ASSERT(!res);
    ASSERT(res.error().kind == ErrorKind::DuplicateTarget);
}

void test_unresolved_dependency() {
    BuildRuleResolver resolver;
    ASSERT_OK(resolver.add(fake_builder("//:a", {"//:missing"})));
    auto graph = resolver.resolve();
    ASSERT(!graph);
    ASSERT(graph.error().kind == ErrorKind::UnresolvedDependency);
    ASSERT_EQ(graph.error().message, "//:a depends on //:missing, which is not defined");
}

void test_cycle_adds_no_rules() {
    BuildRuleResolver resolver;
    ASSERT_OK(resolver.add(fake_builder("//:a", {"//:b"})));
    ASSERT_OK(resolver.add(fake_builder("//:b", {"//:a"})));
    ASSERT_OK(resolver.add(fake_builder("//:c")));

    auto graph = resolver.resolve();
    ASSERT(!graph);
    ASSERT(graph.error().kind == ErrorKind::Cycle);
    ASSERT_EQ(graph.error().message, "Cycle detected in the build graph: //:a -> //:b -> //:a");
    ASSERT(resolver.get(target("//:c")) == nullptr);
}

void test_three_rule_cycle() {
    BuildRuleResolver resolver;
    ASSERT_OK(resolver.add(fake_builder("//:a", {"//:b"})));
    ASSERT_OK(resolver.add(fake_builder("//:b", {"//:c"})));
    ASSERT_OK(resolver.add(fake_builder("//:c", {"//:a"})));

    auto graph = resolver.resolve();
    ASSERT(!graph);
    ASSERT(graph.error().kind == ErrorKind::Cycle);
    ASSERT_EQ(graph.error().message, "Cycle detected in the build graph: //:a -> //:b -> //:c -> //:a");
    for (const char *name : {"//:a", "//:b", "//:c"})
        ASSERT(resolver.get(target(name)) == nullptr);
}

void test_self_cycle() {
    BuildRuleResolver resolver;
    ASSERT_OK(resolver.add(fake_builder("//:a", {"//:a"})));
    auto graph = resolver.resolve();
    ASSERT(!graph);
    ASSERT(graph.error().kind == ErrorKind::Cycle);
}

void test_resolution_is_one_shot() {
    BuildRuleResolver resolver;
    ASSERT_OK(resolver.add(fake_builder("//:a")));
    ASSERT_OK(resolver.resolve());

    auto again = resolver.resolve();
    ASSERT(!again);
    ASSERT(again.error().kind == ErrorKind::InvalidState);

    auto late = resolver.add(fake_builder("//:b"));
    ASSERT(!late);
    ASSERT(late.error().kind == ErrorKind::InvalidState);
    ASSERT(late.error().message.find("//:b") != std::string::npos);
}

void test_null_builder_is_rejected() {
    BuildRuleResolver resolver;
    auto res = resolver.add(nullptr);
    ASSERT(!res);
    ASSERT(res.error().kind == ErrorKind::InvalidState);

    BuildRuleResolver resolved;
    ASSERT_OK(resolved.resolve());
    ASSERT(resolved.add(nullptr).error().kind == ErrorKind::InvalidState);
}

void test_registry_rejects_unknown_type() {
    auto registry = RuleKindRegistry::with_builtin_kinds();
    ASSERT(registry.contains("genrule"));
    ASSERT(registry.contains("prebuilt"));
    auto builder = registry.create(spec_of("java_library", "//:lib", {}, {}));
    ASSERT(!builder);
    ASSERT(builder.error().kind == ErrorKind::Parse);
}

void test_genrule_requires_cmd_and_out() {
    auto registry = RuleKindRegistry::with_builtin_kinds();
    {
        BuildRuleResolver resolver;
        add_spec(registry, resolver, spec_of("genrule", "//:g", {}, {{"out", "g.txt"}}));
        auto graph = resolver.resolve();
        ASSERT(!graph);
        ASSERT(graph.error().kind == ErrorKind::Parse);
    }
    {
        BuildRuleResolver resolver;
        add_spec(registry, resolver, spec_of("genrule", "//:g", {}, {{"cmd", "true"}}));
        ASSERT(!resolver.resolve());
    }
}

void test_package_genrule_requires_installable_package() {
    auto registry = RuleKindRegistry::with_builtin_kinds();
    BuildRuleResolver resolver("out");
    add_spec(registry, resolver, spec_of("genrule", "//app:plain", {}, {{"out", "plain.txt"}, {"cmd", "true"}}));
    add_spec(registry, resolver,
             spec_of("package_genrule", "//app:signed", {"//app:plain"}, {{"package", "//app:plain"}, {"cmd", "true"}}));

    auto graph = resolver.resolve();
    ASSERT(!graph);
    ASSERT(graph.error().kind == ErrorKind::TypeConstraint);
    ASSERT_EQ(graph.error().message,
              "The 'package' argument of //app:signed, //app:plain, must correspond to an installable rule, such as "
              "package() or package_genrule().");
}

void test_package_genrule_wraps_package() {
    auto registry = RuleKindRegistry::with_builtin_kinds();
    BuildRuleResolver resolver("out");
    add_spec(registry, resolver,
             spec_of("package", "//app:app", {}, {{"manifest", "app/Manifest.xml"}, {"cmd", "true"}}));
    add_spec(registry, resolver,
             spec_of("package_genrule", "//app:signed", {"//app:app"}, {{"package", "//app:app"}, {"cmd", "true"}}));

    auto graph = resolver.resolve();
    ASSERT_OK(graph);
    const BuildRule *signed_rule = *graph->find(target("//app:signed"));
    auto artifact = signed_rule->installable();
    ASSERT(artifact.has_value());
    ASSERT_EQ(artifact->package_path, std::filesystem::path("out/gen/app/signed.pkg"));
    ASSERT_EQ(artifact->manifest_path, std::filesystem::path("app/Manifest.xml"));
}

void test_package_genrule_package_must_be_a_dep() {
    auto registry = RuleKindRegistry::with_builtin_kinds();
    BuildRuleResolver resolver;
    add_spec(registry, resolver,
             spec_of("package", "//app:app", {}, {{"manifest", "app/Manifest.xml"}, {"cmd", "true"}}));
    add_spec(registry, resolver,
             spec_of("package_genrule", "//app:signed", {}, {{"package", "//app:app"}, {"cmd", "true"}}));
    auto graph = resolver.resolve();
    ASSERT(!graph);
    ASSERT(graph.error().kind == ErrorKind::UnresolvedDependency);
}

void test_prebuilt_library_outputs() {
    auto registry = RuleKindRegistry::with_builtin_kinds();
    BuildRuleResolver resolver;
    add_spec(registry, resolver, spec_of("prebuilt", "//third_party:guava", {}, {{"binary", "guava.jar"}}));
    add_spec(registry, resolver,
             spec_of("prebuilt", "//third_party:truth", {"//third_party:guava"},
                     {{"binary", "truth.jar"}, {"source", "truth-src.jar"}}));

    auto graph = resolver.resolve();
    ASSERT_OK(graph);
    auto truth = dynamic_cast<const PrebuiltRule *>(*graph->find(target("//third_party:truth")));
    ASSERT(truth != nullptr);
    ASSERT(truth->is_library());
    ASSERT_EQ(truth->source(), std::optional<std::string>("truth-src.jar"));
    ASSERT(!truth->docs_url());
    ASSERT_EQ(truth->inputs(), (std::vector<std::filesystem::path>{"truth.jar"}));
    ASSERT_EQ(truth->transitive_library_outputs(),
              (std::set<std::filesystem::path>{"guava.jar", "truth.jar"}));
}

} // namespace

void resolver_tests() {
    std::cout << "BuildRuleResolver\n";
    TEST(resolves_in_dependency_order);
    TEST(duplicate_target);
    TEST(unresolved_dependency);
    TEST(cycle_adds_no_rules);
    TEST(three_rule_cycle);
    TEST(self_cycle);
    TEST(resolution_is_one_shot);
    TEST(null_builder_is_rejected);
    TEST(registry_rejects_unknown_type);
    TEST(genrule_requires_cmd_and_out);
    TEST(package_genrule_requires_installable_package);
    TEST(package_genrule_wraps_package);
    TEST(package_genrule_package_must_be_a_dep);
    TEST(prebuilt_library_outputs);
}
