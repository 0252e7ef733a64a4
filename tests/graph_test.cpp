#include "tests/test_suite.hpp"
#include "tests/testing_utils.hpp"

#include "keel/graph.hpp"

#include <sstream>

using namespace keel;
using namespace keel::testing;

namespace {

std::vector<std::string> names(const std::vector<const BuildRule *> &rules) {
    std::vector<std::string> out;
    for (const BuildRule *rule : rules)
        out.push_back(rule->full_name());
    return out;
}

// //:top -> //:mid -> //:leaf, plus //:lone on its own.
DependencyGraph chain() {
    DependencyGraph graph;
    add_fake(graph, "//:leaf");
    add_fake(graph, "//:lone");
    add_fake(graph, "//:mid", {"//:leaf"});
    add_fake(graph, "//:top", {"//:mid", "//:leaf"});
    return graph;
}

void test_add_rule_rejects_duplicates() {
    DependencyGraph graph = chain();
    BuildRuleParams params{target("//:leaf"), {}, {}};
    auto res = graph.add_rule(std::make_unique<FakeRule>(std::move(params), FakeRule::Options{}));
    ASSERT(!res);
    ASSERT(res.error().kind == ErrorKind::DuplicateTarget);
    ASSERT_EQ(graph.size(), 4u);
}

void test_add_rule_rejects_foreign_dependency() {
    DependencyGraph other;
    const BuildRule *stranger = add_fake(other, "//:stranger");

    DependencyGraph graph;
    BuildRuleParams params{target("//:a"), {stranger}, {}};
    auto res = graph.add_rule(std::make_unique<FakeRule>(std::move(params), FakeRule::Options{}));
    ASSERT(!res);
    ASSERT(res.error().kind == ErrorKind::NotFound);
    ASSERT_EQ(graph.size(), 0u);
}

void test_find_and_dependents() {
    DependencyGraph graph = chain();
    auto leaf = graph.find(target("//:leaf"));
    ASSERT_OK(leaf);
    ASSERT_EQ(names(graph.dependents(**leaf)), (std::vector<std::string>{"//:mid", "//:top"}));

    auto missing = graph.find(target("//:nope"));
    ASSERT(!missing);
    ASSERT(missing.error().kind == ErrorKind::NotFound);
    ASSERT(!graph.contains(target("//:nope")));
}

void test_topological_order_is_deterministic() {
    DependencyGraph graph = chain();
    ASSERT_EQ(names(graph.topological_order()), (std::vector<std::string>{"//:leaf", "//:lone", "//:mid", "//:top"}));
}

void test_transitive_closure() {
    DependencyGraph graph = chain();
    auto closure = graph.transitive_closure({target("//:mid")});
    ASSERT_OK(closure);
    ASSERT_EQ(names(*closure), (std::vector<std::string>{"//:leaf", "//:mid"}));

    auto stopped = graph.transitive_closure({target("//:top")},
                                            [](const BuildRule &rule) { return rule.full_name() == "//:mid"; });
    ASSERT_OK(stopped);
    // //:leaf is still reached through the direct edge from //:top.
    ASSERT_EQ(names(*stopped), (std::vector<std::string>{"//:leaf", "//:mid", "//:top"}));

    DependencyGraph boundary;
    add_fake(boundary, "//sub:lib");
    add_fake(boundary, "//sub:app", {"//sub:lib"});
    add_fake(boundary, "//main:app", {"//sub:app"});
    auto bounded = boundary.transitive_closure({target("//main:app")},
                                               [](const BuildRule &rule) { return rule.full_name() == "//sub:app"; });
    ASSERT_OK(bounded);
    ASSERT_EQ(names(*bounded), (std::vector<std::string>{"//main:app", "//sub:app"}));

    auto unknown = graph.transitive_closure({target("//:ghost")});
    ASSERT(!unknown);
    ASSERT(unknown.error().kind == ErrorKind::NotFound);
}

void test_collect_library_outputs() {
    TempDir dir;
    DependencyGraph graph;
    add_fake(graph, "//lib:a", {}, {.output = dir / "a.jar", .library = true});
    add_fake(graph, "//lib:b", {"//lib:a"}, {.output = dir / "b.jar", .library = true});
    add_fake(graph, "//lib:tool", {}, {.output = dir / "tool"});
    add_fake(graph, "//app:app", {"//lib:b", "//lib:tool"}, {.output = dir / "app.pkg"});

    auto outputs = collect_library_outputs(graph, {target("//app:app")});
    ASSERT_OK(outputs);
    ASSERT_EQ(*outputs, (std::set<std::filesystem::path>{dir / "a.jar", dir / "b.jar"}));

    auto excluded = collect_library_outputs(graph, {target("//app:app")}, {target("//lib:b")});
    ASSERT_OK(excluded);
    ASSERT_EQ(*excluded, (std::set<std::filesystem::path>{dir / "a.jar"}));
}

void test_write_dot() {
    DependencyGraph graph = chain();
    std::ostringstream out;
    graph.write_dot(out, [](const BuildRule &) { return std::string("green"); });
    const std::string dot = out.str();
    ASSERT(dot.starts_with("digraph keel_build {"));
    ASSERT(dot.find("//:top") != std::string::npos);
    ASSERT(dot.find("fillcolor=\"green\"") != std::string::npos);
    ASSERT(dot.find(" -> ") != std::string::npos);
}

} // namespace

void graph_tests() {
    std::cout << "DependencyGraph\n";
    TEST(add_rule_rejects_duplicates);
    TEST(add_rule_rejects_foreign_dependency);
    TEST(find_and_dependents);
    TEST(topological_order_is_deterministic);
    TEST(transitive_closure);
    TEST(collect_library_outputs);
    TEST(write_dot);
}
